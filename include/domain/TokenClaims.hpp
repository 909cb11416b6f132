#pragma once

#include "domain/enums/TokenType.hpp"
#include "domain/ClientContext.hpp"
#include <string>
#include <vector>
#include <variant>

namespace clinic::domain {

/**
 * @brief Claims access токена
 *
 * Роли и права здесь только снимок на момент выпуска;
 * авторизация запроса всё равно перечитывает их из БД.
 */
struct AccessTokenClaims {
    std::string subject;
    std::string sessionId;
    std::string email;
    std::string firstName;
    std::string lastName;
    std::vector<std::string> roles;
    std::vector<std::string> permissions;
    bool mfaVerified = false;
};

/// Claims refresh токена: только sub и sid
struct RefreshTokenClaims {
    std::string subject;
    std::string sessionId;
};

struct MfaChallengeClaims {
    std::string subject;
    std::string email;
    ClientContext client;
};

struct MfaSetupClaims {
    std::string subject;
    std::string email;
    ClientContext client;
};

/**
 * @brief Закрытый набор вариантов claims
 *
 * Неизвестный тип токена не может быть представлен этим типом,
 * поэтому верификатор не может его молча принять.
 */
using TokenClaims = std::variant<
    AccessTokenClaims,
    RefreshTokenClaims,
    MfaChallengeClaims,
    MfaSetupClaims
>;

inline TokenType tokenTypeOf(const TokenClaims& claims) {
    struct Visitor {
        TokenType operator()(const AccessTokenClaims&) const { return TokenType::ACCESS; }
        TokenType operator()(const RefreshTokenClaims&) const { return TokenType::REFRESH; }
        TokenType operator()(const MfaChallengeClaims&) const { return TokenType::MFA_CHALLENGE; }
        TokenType operator()(const MfaSetupClaims&) const { return TokenType::MFA_SETUP; }
    };
    return std::visit(Visitor{}, claims);
}

inline const std::string& subjectOf(const TokenClaims& claims) {
    return std::visit([](const auto& c) -> const std::string& { return c.subject; }, claims);
}

} // namespace clinic::domain
