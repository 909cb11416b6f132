#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <variant>

namespace clinic::domain {

/**
 * @brief Сводка о пользователе для ответов API (без секретов)
 */
struct UserSummary {
    std::string id;
    std::string email;
    std::string firstName;
    std::string lastName;
    std::vector<std::string> roles;
    std::vector<std::string> permissions;
    std::optional<std::string> departmentId;
    std::optional<std::string> employeeId;
};

/**
 * @brief Полный результат входа: сессия создана, токены выпущены
 */
struct AuthResult {
    UserSummary user;
    std::string sessionId;
    std::string accessToken;
    std::string refreshToken;
    std::chrono::seconds expiresIn{0};          ///< TTL access токена
    std::chrono::seconds refreshExpiresIn{0};   ///< TTL refresh токена
};

/// Требуется ввод MFA кода; сессии ещё нет
struct MfaRequired {
    std::string tempToken;
};

/// Роль пользователя требует MFA, но она не настроена; сессии ещё нет
struct MfaSetupRequired {
    std::string tempToken;
};

using LoginOutcome = std::variant<AuthResult, MfaRequired, MfaSetupRequired>;

/**
 * @brief Результат refresh: новый access токен в той же сессии
 */
struct RefreshResult {
    UserSummary user;
    std::string sessionId;
    std::string accessToken;
    std::chrono::seconds expiresIn{0};
};

/**
 * @brief Данные для настройки MFA в приложении-аутентификаторе
 */
struct MfaEnrollment {
    std::string secret;
    std::string otpauthUri;
    std::string qrCodeDataUrl;
    std::vector<std::string> backupCodes;   ///< Показываются один раз
};

} // namespace clinic::domain
