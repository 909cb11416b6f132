#pragma once

#include <stdexcept>
#include <string>

namespace clinic::domain {

/**
 * @brief Классы ошибок аутентификации
 *
 * Клиент видит только стабильный код и общее сообщение,
 * конкретная причина уходит в аудит.
 */
enum class AuthErrorCode {
    InvalidCredentials,
    AccountLocked,
    InvalidToken,
    InvalidMfaCode,
    MfaAlreadyEnabled,
    MfaNotEnabled,
    MfaSetupNotInitiated,
    SessionRevokedOrExpired,
    PasswordReuse,
    WeakPassword
};

inline std::string toString(AuthErrorCode code) {
    switch (code) {
        case AuthErrorCode::InvalidCredentials:      return "INVALID_CREDENTIALS";
        case AuthErrorCode::AccountLocked:           return "ACCOUNT_LOCKED";
        case AuthErrorCode::InvalidToken:            return "INVALID_TOKEN";
        case AuthErrorCode::InvalidMfaCode:          return "INVALID_MFA_CODE";
        case AuthErrorCode::MfaAlreadyEnabled:       return "MFA_ALREADY_ENABLED";
        case AuthErrorCode::MfaNotEnabled:           return "MFA_NOT_ENABLED";
        case AuthErrorCode::MfaSetupNotInitiated:    return "MFA_SETUP_NOT_INITIATED";
        case AuthErrorCode::SessionRevokedOrExpired: return "SESSION_REVOKED_OR_EXPIRED";
        case AuthErrorCode::PasswordReuse:           return "PASSWORD_REUSE";
        case AuthErrorCode::WeakPassword:            return "WEAK_PASSWORD";
    }
    return "UNKNOWN";
}

/**
 * @brief Общее сообщение для клиента (без деталей)
 */
inline std::string publicMessage(AuthErrorCode code) {
    switch (code) {
        case AuthErrorCode::InvalidCredentials:      return "Invalid credentials";
        case AuthErrorCode::AccountLocked:           return "Account temporarily locked";
        case AuthErrorCode::InvalidToken:            return "Invalid or expired token";
        case AuthErrorCode::InvalidMfaCode:          return "Invalid MFA code";
        case AuthErrorCode::MfaAlreadyEnabled:       return "MFA is already enabled";
        case AuthErrorCode::MfaNotEnabled:           return "MFA is not enabled";
        case AuthErrorCode::MfaSetupNotInitiated:    return "MFA setup has not been initiated";
        case AuthErrorCode::SessionRevokedOrExpired: return "Session revoked or expired";
        case AuthErrorCode::PasswordReuse:           return "Password was used recently";
        case AuthErrorCode::WeakPassword:            return "Password does not meet requirements";
    }
    return "Authentication error";
}

/**
 * @brief HTTP статус для кода ошибки
 */
inline int httpStatus(AuthErrorCode code) {
    switch (code) {
        case AuthErrorCode::MfaAlreadyEnabled:
        case AuthErrorCode::MfaNotEnabled:
        case AuthErrorCode::MfaSetupNotInitiated:
        case AuthErrorCode::PasswordReuse:
        case AuthErrorCode::WeakPassword:
            return 400;
        default:
            return 401;
    }
}

/**
 * @brief Исключение подсистемы аутентификации
 *
 * what() содержит внутреннюю причину (для аудита и логов),
 * наружу отдаётся только code().
 */
class AuthException : public std::runtime_error {
public:
    AuthException(AuthErrorCode code, const std::string& reason)
        : std::runtime_error(reason)
        , code_(code) {}

    AuthErrorCode code() const { return code_; }

private:
    AuthErrorCode code_;
};

} // namespace clinic::domain
