#pragma once

#include "domain/TokenClaims.hpp"
#include <string>
#include <set>
#include <optional>

namespace clinic::ports::output {

/**
 * @brief Причина отклонения токена
 *
 * Неверный тип: отдельный класс отказа, не путать с истечением срока.
 */
enum class TokenRejection {
    None,
    Malformed,
    BadSignature,
    Expired,
    WrongType
};

inline std::string toString(TokenRejection rejection) {
    switch (rejection) {
        case TokenRejection::None:         return "none";
        case TokenRejection::Malformed:    return "malformed token";
        case TokenRejection::BadSignature: return "signature mismatch";
        case TokenRejection::Expired:      return "token expired";
        case TokenRejection::WrongType:    return "wrong token type";
    }
    return "unknown";
}

/**
 * @brief Результат проверки токена
 */
struct TokenVerification {
    std::optional<domain::TokenClaims> claims;
    TokenRejection rejection = TokenRejection::None;

    bool valid() const { return claims.has_value(); }
};

/**
 * @brief Выпуск и проверка подписанных токенов
 */
class ITokenProvider {
public:
    virtual ~ITokenProvider() = default;

    /**
     * @brief Подписать claims; срок жизни определяется типом токена
     */
    virtual std::string issue(const domain::TokenClaims& claims) = 0;

    /**
     * @brief Проверить подпись, срок и тип токена
     *
     * @param accepted Типы, которые принимает вызывающая сторона
     */
    virtual TokenVerification verify(
        const std::string& token,
        const std::set<domain::TokenType>& accepted
    ) = 0;

    /**
     * @brief Отпечаток токена для хранения в сессии (SHA-256, hex)
     */
    virtual std::string fingerprint(const std::string& token) = 0;
};

} // namespace clinic::ports::output
