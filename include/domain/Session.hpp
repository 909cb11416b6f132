#pragma once

#include <string>
#include <chrono>
#include <optional>

namespace clinic::domain {

/**
 * @brief Сессия пользователя
 *
 * Одна запись на каждый завершённый вход (пароль + MFA, если требуется).
 * Токены хранятся только в виде SHA-256 отпечатков.
 * Запись сессии, а не подпись токена, решает, отозван ли доступ.
 */
struct Session {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string sessionId;
    std::string userId;
    std::string accessTokenHash;
    std::string refreshTokenHash;
    std::string ipAddress;
    std::string userAgent;
    bool mfaVerified = false;
    TimePoint createdAt{};
    TimePoint expiresAt{};
    TimePoint lastActivityAt{};
    std::optional<TimePoint> revokedAt;
    std::optional<std::string> revokedBy;
    std::optional<std::string> revokeReason;

    bool isRevoked() const { return revokedAt.has_value(); }

    bool isExpired(TimePoint now) const { return expiresAt <= now; }

    /**
     * @brief Может ли сессия авторизовать запрос на момент now
     */
    bool isUsable(TimePoint now) const {
        return !isRevoked() && !isExpired(now);
    }
};

} // namespace clinic::domain
