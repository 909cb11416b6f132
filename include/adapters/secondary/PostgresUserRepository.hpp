#pragma once

#include "ports/output/IUserRepository.hpp"
#include "DbSettings.hpp"
#include "PgTime.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace clinic::adapters::secondary {

/**
 * @brief PostgreSQL репозиторий пользователей
 *
 * Счётчики попыток и backup-коды меняются одним UPDATE,
 * без чтения-изменения-записи.
 */
class PostgresUserRepository : public ports::output::IUserRepository {
public:
    explicit PostgresUserRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresUserRepository] Connecting to " << settings_->describe() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresUserRepository] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresUserRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    domain::User save(const domain::User& user) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(
                    INSERT INTO users (
                        user_id, email, first_name, last_name, password_hash, is_active,
                        mfa_enabled, mfa_secret, backup_codes,
                        pending_mfa_secret, pending_backup_codes,
                        failed_login_attempts, locked_until,
                        failed_mfa_attempts, mfa_locked_until,
                        last_login_at, department_id, employee_id, created_at, updated_at)
                    VALUES ($1, lower($2), $3, $4, $5, $6,
                            $7, $8, string_to_array($9, ','),
                            $10, string_to_array($11, ','),
                            $12, to_timestamp($13),
                            $14, to_timestamp($15),
                            to_timestamp($16), $17, $18, NOW(), NOW())
                    ON CONFLICT (user_id) DO UPDATE SET
                        email = EXCLUDED.email,
                        first_name = EXCLUDED.first_name,
                        last_name = EXCLUDED.last_name,
                        password_hash = EXCLUDED.password_hash,
                        is_active = EXCLUDED.is_active,
                        mfa_enabled = EXCLUDED.mfa_enabled,
                        mfa_secret = EXCLUDED.mfa_secret,
                        backup_codes = EXCLUDED.backup_codes,
                        pending_mfa_secret = EXCLUDED.pending_mfa_secret,
                        pending_backup_codes = EXCLUDED.pending_backup_codes,
                        failed_login_attempts = EXCLUDED.failed_login_attempts,
                        locked_until = EXCLUDED.locked_until,
                        failed_mfa_attempts = EXCLUDED.failed_mfa_attempts,
                        mfa_locked_until = EXCLUDED.mfa_locked_until,
                        last_login_at = EXCLUDED.last_login_at,
                        department_id = EXCLUDED.department_id,
                        employee_id = EXCLUDED.employee_id,
                        updated_at = NOW()
                )",
                user.userId,
                user.email,
                user.firstName,
                user.lastName,
                user.passwordHash,
                user.isActive,
                user.mfaEnabled,
                user.mfaSecret,
                pg::joinList(user.backupCodeHashes),
                user.pendingMfaSecret,
                pg::joinList(user.pendingBackupCodeHashes),
                user.failedLoginAttempts,
                pg::toEpoch(user.lockedUntil),
                user.failedMfaAttempts,
                pg::toEpoch(user.mfaLockedUntil),
                pg::toEpoch(user.lastLoginAt),
                user.departmentId,
                user.employeeId
            );

            txn.commit();
            return user;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::User> findById(const std::string& userId) override {
        return findOne("user_id = $1", userId, "findById");
    }

    std::optional<domain::User> findByEmail(const std::string& email) override {
        return findOne("email = lower($1)", email, "findByEmail");
    }

    int incrementFailedLoginAttempts(
        const std::string& userId,
        int threshold,
        std::chrono::seconds lockout
    ) override {
        return incrementCounter("failed_login_attempts", "locked_until", userId, threshold, lockout);
    }

    void resetFailedLoginAttempts(const std::string& userId) override {
        execUpdate(
            "UPDATE users SET failed_login_attempts = 0, locked_until = NULL, updated_at = NOW() "
            "WHERE user_id = $1 AND (failed_login_attempts <> 0 OR locked_until IS NOT NULL)",
            "resetFailedLoginAttempts", userId);
    }

    int incrementFailedMfaAttempts(
        const std::string& userId,
        int threshold,
        std::chrono::seconds lockout
    ) override {
        return incrementCounter("failed_mfa_attempts", "mfa_locked_until", userId, threshold, lockout);
    }

    void resetFailedMfaAttempts(const std::string& userId) override {
        execUpdate(
            "UPDATE users SET failed_mfa_attempts = 0, mfa_locked_until = NULL, updated_at = NOW() "
            "WHERE user_id = $1 AND (failed_mfa_attempts <> 0 OR mfa_locked_until IS NOT NULL)",
            "resetFailedMfaAttempts", userId);
    }

    void updateLastLogin(const std::string& userId, std::chrono::system_clock::time_point at) override {
        execUpdate(
            "UPDATE users SET last_login_at = to_timestamp($2), updated_at = NOW() WHERE user_id = $1",
            "updateLastLogin", userId, pg::toEpoch(at));
    }

    void updatePasswordHash(const std::string& userId, const std::string& passwordHash) override {
        execUpdate(
            "UPDATE users SET password_hash = $2, password_changed_at = NOW(), updated_at = NOW() "
            "WHERE user_id = $1",
            "updatePasswordHash", userId, passwordHash);
    }

    void storePendingMfa(
        const std::string& userId,
        const std::string& secret,
        const std::vector<std::string>& backupCodeHashes
    ) override {
        execUpdate(
            R"(UPDATE users SET pending_mfa_secret = $2,
                                pending_backup_codes = string_to_array($3, ','),
                                updated_at = NOW()
               WHERE user_id = $1)",
            "storePendingMfa", userId, secret, pg::joinList(backupCodeHashes));
    }

    bool enableMfa(const std::string& userId, const std::string& expectedSecret) override {
        return execUpdate(
            R"(UPDATE users SET mfa_enabled = TRUE,
                                mfa_secret = pending_mfa_secret,
                                backup_codes = pending_backup_codes,
                                pending_mfa_secret = NULL,
                                pending_backup_codes = '{}',
                                updated_at = NOW()
               WHERE user_id = $1 AND mfa_enabled = FALSE AND pending_mfa_secret = $2)",
            "enableMfa", userId, expectedSecret) == 1;
    }

    void disableMfa(const std::string& userId) override {
        execUpdate(
            R"(UPDATE users SET mfa_enabled = FALSE,
                                mfa_secret = NULL,
                                backup_codes = '{}',
                                pending_mfa_secret = NULL,
                                pending_backup_codes = '{}',
                                updated_at = NOW()
               WHERE user_id = $1)",
            "disableMfa", userId);
    }

    bool consumeBackupCode(const std::string& userId, const std::string& codeHash) override {
        return execUpdate(
            R"(UPDATE users SET backup_codes = array_remove(backup_codes, $2), updated_at = NOW()
               WHERE user_id = $1 AND $2 = ANY(backup_codes))",
            "consumeBackupCode", userId, codeHash) == 1;
    }

private:
    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    static constexpr const char* kSelectColumns = R"(
        SELECT user_id, email, first_name, last_name, password_hash, is_active,
               mfa_enabled, mfa_secret,
               array_to_string(backup_codes, ',') AS backup_codes,
               pending_mfa_secret,
               array_to_string(pending_backup_codes, ',') AS pending_backup_codes,
               failed_login_attempts,
               EXTRACT(EPOCH FROM locked_until)::bigint AS locked_until_epoch,
               failed_mfa_attempts,
               EXTRACT(EPOCH FROM mfa_locked_until)::bigint AS mfa_locked_until_epoch,
               EXTRACT(EPOCH FROM last_login_at)::bigint AS last_login_epoch,
               department_id, employee_id
        FROM users
    )";

    std::optional<domain::User> findOne(
        const std::string& where,
        const std::string& value,
        const char* operation
    ) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(std::string(kSelectColumns) + " WHERE " + where, value);
            txn.commit();

            if (result.empty()) return std::nullopt;

            return rowToUser(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] " << operation << "() failed: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    /**
     * @brief Атомарный инкремент счётчика с выставлением блокировки
     *
     * Если блокировка уже истекла, счётчик начинается с 1.
     */
    int incrementCounter(
        const std::string& counterColumn,
        const std::string& lockColumn,
        const std::string& userId,
        int threshold,
        std::chrono::seconds lockout
    ) {
        const std::string expired = lockColumn + " IS NOT NULL AND " + lockColumn + " <= NOW()";
        const std::string next = "(CASE WHEN " + expired + " THEN 1 ELSE " + counterColumn + " + 1 END)";
        const std::string sql =
            "UPDATE users SET " +
            counterColumn + " = " + next + ", " +
            lockColumn + " = CASE "
                "WHEN " + next + " >= $2 THEN NOW() + make_interval(secs => $3) "
                "WHEN " + expired + " THEN NULL "
                "ELSE " + lockColumn + " END, "
            "updated_at = NOW() "
            "WHERE user_id = $1 RETURNING " + counterColumn;

        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(sql, userId, threshold, static_cast<int64_t>(lockout.count()));
            txn.commit();

            if (result.empty()) return 0;
            return result[0][0].as<int>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] increment " << counterColumn
                      << " failed: " << e.what() << std::endl;
            throw;
        }
    }

    template <typename... Args>
    int execUpdate(const std::string& sql, const char* operation, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(sql, std::forward<Args>(args)...);
            txn.commit();
            return static_cast<int>(result.affected_rows());

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] " << operation << "() failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::User rowToUser(const pqxx::row& row) const {
        domain::User user;
        user.userId = row["user_id"].as<std::string>();
        user.email = row["email"].as<std::string>();
        user.firstName = row["first_name"].as<std::string>();
        user.lastName = row["last_name"].as<std::string>();
        user.passwordHash = row["password_hash"].as<std::string>();
        user.isActive = row["is_active"].as<bool>();
        user.mfaEnabled = row["mfa_enabled"].as<bool>();
        user.mfaSecret = pg::optionalText(row["mfa_secret"]);
        user.backupCodeHashes = pg::splitList(row["backup_codes"]);
        user.pendingMfaSecret = pg::optionalText(row["pending_mfa_secret"]);
        user.pendingBackupCodeHashes = pg::splitList(row["pending_backup_codes"]);
        user.failedLoginAttempts = row["failed_login_attempts"].as<int>();
        user.lockedUntil = pg::optionalEpochField(row["locked_until_epoch"]);
        user.failedMfaAttempts = row["failed_mfa_attempts"].as<int>();
        user.mfaLockedUntil = pg::optionalEpochField(row["mfa_locked_until_epoch"]);
        user.lastLoginAt = pg::optionalEpochField(row["last_login_epoch"]);
        user.departmentId = pg::optionalText(row["department_id"]);
        user.employeeId = pg::optionalText(row["employee_id"]);
        return user;
    }
};

} // namespace clinic::adapters::secondary
