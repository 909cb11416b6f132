#pragma once

#include <string>
#include <stdexcept>

namespace clinic::domain {

/**
 * @brief Тип подписанного токена
 *
 * - ACCESS: доступ к ресурсам, содержит снимок ролей и прав
 * - REFRESH: выпуск нового access токена в рамках сессии
 * - MFA_CHALLENGE: временный токен для ввода MFA кода при входе
 * - MFA_SETUP: временный токен для обязательной настройки MFA
 */
enum class TokenType {
    ACCESS,
    REFRESH,
    MFA_CHALLENGE,
    MFA_SETUP
};

inline std::string toString(TokenType type) {
    switch (type) {
        case TokenType::ACCESS:        return "access";
        case TokenType::REFRESH:       return "refresh";
        case TokenType::MFA_CHALLENGE: return "mfa_challenge";
        case TokenType::MFA_SETUP:     return "mfa_setup";
    }
    return "unknown";
}

/**
 * @brief Создать TokenType из строки claim "type"
 *
 * @throws std::invalid_argument если строка не распознана
 */
inline TokenType tokenTypeFromString(const std::string& str) {
    if (str == "access")        return TokenType::ACCESS;
    if (str == "refresh")       return TokenType::REFRESH;
    if (str == "mfa_challenge") return TokenType::MFA_CHALLENGE;
    if (str == "mfa_setup")     return TokenType::MFA_SETUP;
    throw std::invalid_argument("Unknown TokenType: " + str);
}

} // namespace clinic::domain
