#pragma once

#include "domain/Session.hpp"
#include <string>
#include <vector>
#include <optional>

namespace clinic::ports::output {

/**
 * @brief Интерфейс хранилища сессий
 *
 * Каждый вызов: отдельное чтение из хранилища; состояние отзыва
 * не кэшируется между запросами.
 */
class ISessionRepository {
public:
    virtual ~ISessionRepository() = default;

    virtual domain::Session create(const domain::Session& session) = 0;
    virtual std::optional<domain::Session> findById(const std::string& sessionId) = 0;
    virtual std::optional<domain::Session> findByRefreshFingerprint(const std::string& refreshTokenHash) = 0;
    virtual std::vector<domain::Session> findActiveByUserId(const std::string& userId) = 0;
    virtual void updateLastActivity(const std::string& sessionId) = 0;

    /**
     * @return false, если сессия не найдена или уже отозвана
     */
    virtual bool revoke(
        const std::string& sessionId,
        const std::string& revokedBy,
        const std::string& reason
    ) = 0;

    /**
     * @return Количество отозванных сессий
     */
    virtual int revokeAll(
        const std::string& userId,
        const std::string& revokedBy,
        const std::string& reason
    ) = 0;

    /**
     * @return Количество удалённых просроченных сессий
     */
    virtual int deleteExpired() = 0;
};

} // namespace clinic::ports::output
