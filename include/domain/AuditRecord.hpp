#pragma once

#include <string>

namespace clinic::domain {

/**
 * @brief Запись аудита безопасности
 *
 * Пишется в журнал через IAuditLog; журнал только на запись.
 */
struct AuditRecord {
    std::string userId;         ///< Пусто, если пользователь не определён
    std::string resourceType = "Authentication";
    std::string resourceId;
    std::string action;         ///< LOGIN, LOGIN_FAILED, MFA_ENABLED, ...
    std::string ipAddress;
    std::string userAgent;
    std::string sessionId;
    std::string reason;
    bool success = true;
    std::string errorMessage;
};

} // namespace clinic::domain
