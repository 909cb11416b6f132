#pragma once

#include "ports/output/IPasswordHistoryRepository.hpp"
#include "DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace clinic::adapters::secondary {

class PostgresPasswordHistoryRepository : public ports::output::IPasswordHistoryRepository {
public:
    explicit PostgresPasswordHistoryRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresPasswordHistoryRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresPasswordHistoryRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresPasswordHistoryRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresPasswordHistoryRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    void record(const ports::output::PasswordHistoryEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(INSERT INTO password_history
                       (user_id, password_hash, changed_by, ip_address, user_agent, change_reason, created_at)
                   VALUES ($1, $2, $3, $4, $5, $6, NOW()))",
                entry.userId,
                entry.passwordHash,
                entry.changedBy,
                entry.ipAddress,
                entry.userAgent,
                entry.reason
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPasswordHistoryRepository] record() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<std::string> recentHashes(const std::string& userId, int depth) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(SELECT password_hash FROM password_history
                   WHERE user_id = $1 ORDER BY created_at DESC LIMIT $2)",
                userId,
                depth
            );

            txn.commit();

            std::vector<std::string> hashes;
            for (const auto& row : result) {
                hashes.push_back(row["password_hash"].as<std::string>());
            }
            return hashes;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPasswordHistoryRepository] recentHashes() failed: " << e.what() << std::endl;
            return {};
        }
    }

private:
    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

} // namespace clinic::adapters::secondary
