#pragma once

#include "ports/output/IAuditLog.hpp"
#include "DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <optional>
#include <iostream>

namespace clinic::adapters::secondary {

/**
 * @brief Журнал аудита в таблице data_access_logs
 *
 * Ошибка записи не прерывает запрос, а уходит в stderr.
 */
class PostgresAuditLog : public ports::output::IAuditLog {
public:
    explicit PostgresAuditLog(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresAuditLog] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresAuditLog] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAuditLog] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresAuditLog() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    void record(const domain::AuditRecord& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(INSERT INTO data_access_logs
                       (user_id, resource_type, resource_id, action, ip_address, user_agent,
                        session_id, access_reason, success, error_message, created_at)
                   VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, NOW()))",
                nullIfEmpty(entry.userId),
                entry.resourceType,
                nullIfEmpty(entry.resourceId),
                entry.action,
                nullIfEmpty(entry.ipAddress),
                nullIfEmpty(entry.userAgent),
                nullIfEmpty(entry.sessionId),
                nullIfEmpty(entry.reason),
                entry.success,
                nullIfEmpty(entry.errorMessage)
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAuditLog] record(" << entry.action << ") failed: " << e.what() << std::endl;
        }
    }

private:
    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    static std::optional<std::string> nullIfEmpty(const std::string& value) {
        if (value.empty()) return std::nullopt;
        return value;
    }
};

} // namespace clinic::adapters::secondary
