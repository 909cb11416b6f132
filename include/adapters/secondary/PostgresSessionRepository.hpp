#pragma once

#include "ports/output/ISessionRepository.hpp"
#include "DbSettings.hpp"
#include "PgTime.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace clinic::adapters::secondary {

class PostgresSessionRepository : public ports::output::ISessionRepository {
public:
    explicit PostgresSessionRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresSessionRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresSessionRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresSessionRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    domain::Session create(const domain::Session& session) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(
                    INSERT INTO sessions (
                        session_id, user_id, access_token_hash, refresh_token_hash,
                        ip_address, user_agent, mfa_verified,
                        created_at, expires_at, last_activity_at)
                    VALUES ($1, $2, $3, $4, $5, $6, $7,
                            to_timestamp($8), to_timestamp($9), to_timestamp($10))
                )",
                session.sessionId,
                session.userId,
                session.accessTokenHash,
                session.refreshTokenHash,
                session.ipAddress,
                session.userAgent,
                session.mfaVerified,
                pg::toEpoch(session.createdAt),
                pg::toEpoch(session.expiresAt),
                pg::toEpoch(session.lastActivityAt)
            );

            txn.commit();
            return session;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] create() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Session> findById(const std::string& sessionId) override {
        return findOne("session_id = $1", sessionId, "findById");
    }

    std::optional<domain::Session> findByRefreshFingerprint(const std::string& refreshTokenHash) override {
        return findOne("refresh_token_hash = $1", refreshTokenHash, "findByRefreshFingerprint");
    }

    std::vector<domain::Session> findActiveByUserId(const std::string& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                std::string(kSelectColumns) +
                " WHERE user_id = $1 AND revoked_at IS NULL AND expires_at > NOW()"
                " ORDER BY last_activity_at DESC",
                userId
            );

            txn.commit();

            std::vector<domain::Session> sessions;
            for (const auto& row : result) {
                sessions.push_back(rowToSession(row));
            }
            return sessions;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] findActiveByUserId() failed: " << e.what() << std::endl;
            return {};
        }
    }

    void updateLastActivity(const std::string& sessionId) override {
        execUpdate(
            "UPDATE sessions SET last_activity_at = NOW() WHERE session_id = $1",
            "updateLastActivity", sessionId);
    }

    bool revoke(
        const std::string& sessionId,
        const std::string& revokedBy,
        const std::string& reason
    ) override {
        return execUpdate(
            R"(UPDATE sessions SET revoked_at = NOW(), revoked_by = $2, revoke_reason = $3
               WHERE session_id = $1 AND revoked_at IS NULL)",
            "revoke", sessionId, revokedBy, reason) > 0;
    }

    int revokeAll(
        const std::string& userId,
        const std::string& revokedBy,
        const std::string& reason
    ) override {
        return execUpdate(
            R"(UPDATE sessions SET revoked_at = NOW(), revoked_by = $2, revoke_reason = $3
               WHERE user_id = $1 AND revoked_at IS NULL)",
            "revokeAll", userId, revokedBy, reason);
    }

    int deleteExpired() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec("DELETE FROM sessions WHERE expires_at < NOW()");
            txn.commit();
            return static_cast<int>(result.affected_rows());
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] deleteExpired() failed: " << e.what() << std::endl;
            return 0;
        }
    }

private:
    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    static constexpr const char* kSelectColumns = R"(
        SELECT session_id, user_id, access_token_hash, refresh_token_hash,
               ip_address, user_agent, mfa_verified,
               EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch,
               EXTRACT(EPOCH FROM expires_at)::bigint AS exp_epoch,
               EXTRACT(EPOCH FROM last_activity_at)::bigint AS activity_epoch,
               EXTRACT(EPOCH FROM revoked_at)::bigint AS revoked_epoch,
               revoked_by, revoke_reason
        FROM sessions
    )";

    std::optional<domain::Session> findOne(
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

            return rowToSession(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] " << operation << "() failed: " << e.what() << std::endl;
            return std::nullopt;
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
            std::cerr << "[PostgresSessionRepository] " << operation << "() failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::Session rowToSession(const pqxx::row& row) const {
        domain::Session session;
        session.sessionId = row["session_id"].as<std::string>();
        session.userId = row["user_id"].as<std::string>();
        session.accessTokenHash = row["access_token_hash"].as<std::string>();
        session.refreshTokenHash = row["refresh_token_hash"].as<std::string>();
        session.ipAddress = row["ip_address"].as<std::string>("");
        session.userAgent = row["user_agent"].as<std::string>("");
        session.mfaVerified = row["mfa_verified"].as<bool>();
        session.createdAt = pg::epochField(row["created_epoch"]);
        session.expiresAt = pg::epochField(row["exp_epoch"]);
        session.lastActivityAt = pg::epochField(row["activity_epoch"]);
        session.revokedAt = pg::optionalEpochField(row["revoked_epoch"]);
        session.revokedBy = pg::optionalText(row["revoked_by"]);
        session.revokeReason = pg::optionalText(row["revoke_reason"]);
        return session;
    }
};

} // namespace clinic::adapters::secondary
