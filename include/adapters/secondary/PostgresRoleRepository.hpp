#pragma once

#include "ports/output/IRoleRepository.hpp"
#include "DbSettings.hpp"
#include "PgTime.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace clinic::adapters::secondary {

/**
 * @brief PostgreSQL чтение ролей, прав и назначений
 */
class PostgresRoleRepository : public ports::output::IRoleRepository {
public:
    explicit PostgresRoleRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresRoleRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresRoleRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresRoleRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresRoleRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::vector<domain::RoleAssignment> findAssignmentsByUserId(const std::string& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(SELECT assignment_id, user_id, role_id, is_active,
                          EXTRACT(EPOCH FROM valid_from)::bigint AS valid_from_epoch,
                          EXTRACT(EPOCH FROM valid_until)::bigint AS valid_until_epoch,
                          EXTRACT(EPOCH FROM revoked_at)::bigint AS revoked_at_epoch
                   FROM user_roles WHERE user_id = $1)",
                userId
            );

            txn.commit();

            std::vector<domain::RoleAssignment> assignments;
            for (const auto& row : result) {
                assignments.push_back(rowToAssignment(row));
            }
            return assignments;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresRoleRepository] findAssignmentsByUserId() failed: " << e.what() << std::endl;
            return {};
        }
    }

    std::optional<domain::Role> findRoleById(const std::string& roleId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto roleRows = txn.exec_params(
                "SELECT role_id, code, is_active FROM roles WHERE role_id = $1",
                roleId
            );
            if (roleRows.empty()) {
                txn.commit();
                return std::nullopt;
            }

            auto permissionRows = txn.exec_params(
                R"(SELECT p.permission_id, p.code
                   FROM role_permissions rp
                   JOIN permissions p ON p.permission_id = rp.permission_id
                   WHERE rp.role_id = $1)",
                roleId
            );

            txn.commit();

            domain::Role role;
            role.roleId = roleRows[0]["role_id"].as<std::string>();
            role.code = roleRows[0]["code"].as<std::string>();
            role.isActive = roleRows[0]["is_active"].as<bool>();
            for (const auto& row : permissionRows) {
                role.permissions.push_back({
                    row["permission_id"].as<std::string>(),
                    row["code"].as<std::string>()
                });
            }
            return role;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresRoleRepository] findRoleById() failed: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

private:
    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    domain::RoleAssignment rowToAssignment(const pqxx::row& row) const {
        domain::RoleAssignment assignment;
        assignment.assignmentId = row["assignment_id"].as<std::string>();
        assignment.userId = row["user_id"].as<std::string>();
        assignment.roleId = row["role_id"].as<std::string>();
        assignment.isActive = row["is_active"].as<bool>();
        assignment.validFrom = pg::epochField(row["valid_from_epoch"]);
        assignment.validUntil = pg::optionalEpochField(row["valid_until_epoch"]);
        assignment.revokedAt = pg::optionalEpochField(row["revoked_at_epoch"]);
        return assignment;
    }
};

} // namespace clinic::adapters::secondary
