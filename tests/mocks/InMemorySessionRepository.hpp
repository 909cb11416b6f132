#pragma once

#include "ports/output/ISessionRepository.hpp"
#include <unordered_map>
#include <mutex>

namespace clinic::tests::mocks {

/**
 * @brief In-Memory реализация репозитория сессий для unit-тестов
 */
class InMemorySessionRepository : public ports::output::ISessionRepository {
public:
    domain::Session create(const domain::Session& session) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[session.sessionId] = session;
        return session;
    }

    std::optional<domain::Session> findById(const std::string& sessionId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<domain::Session> findByRefreshFingerprint(const std::string& refreshTokenHash) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            if (session.refreshTokenHash == refreshTokenHash) {
                return session;
            }
        }
        return std::nullopt;
    }

    std::vector<domain::Session> findActiveByUserId(const std::string& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::system_clock::now();
        std::vector<domain::Session> result;
        for (const auto& [id, session] : sessions_) {
            if (session.userId == userId && session.isUsable(now)) {
                result.push_back(session);
            }
        }
        return result;
    }

    void updateLastActivity(const std::string& sessionId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it != sessions_.end()) {
            it->second.lastActivityAt = std::chrono::system_clock::now();
        }
    }

    bool revoke(
        const std::string& sessionId,
        const std::string& revokedBy,
        const std::string& reason
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end() || it->second.isRevoked()) return false;
        markRevoked(it->second, revokedBy, reason);
        return true;
    }

    int revokeAll(
        const std::string& userId,
        const std::string& revokedBy,
        const std::string& reason
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        int revoked = 0;
        for (auto& [id, session] : sessions_) {
            if (session.userId == userId && !session.isRevoked()) {
                markRevoked(session, revokedBy, reason);
                ++revoked;
            }
        }
        return revoked;
    }

    int deleteExpired() override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::system_clock::now();
        int removed = 0;
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second.isExpired(now)) {
                it = sessions_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    // Test helpers
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    void expire(const std::string& sessionId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it != sessions_.end()) {
            it->second.expiresAt = std::chrono::system_clock::now() - std::chrono::seconds(1);
        }
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::Session> sessions_;

    static void markRevoked(domain::Session& session, const std::string& revokedBy, const std::string& reason) {
        session.revokedAt = std::chrono::system_clock::now();
        session.revokedBy = revokedBy;
        session.revokeReason = reason;
    }
};

} // namespace clinic::tests::mocks
