#pragma once

#include "domain/enums/TokenType.hpp"
#include "domain/ClientContext.hpp"
#include "domain/ResolvedPermissions.hpp"
#include <string>

namespace clinic::domain {

/**
 * @brief Аутентифицированный субъект запроса
 *
 * Для access токена роли и права загружены из БД в момент запроса,
 * а sessionId указывает на действующую сессию.
 * Для временных MFA токенов sessionId пуст.
 */
struct Identity {
    std::string userId;
    std::string email;
    TokenType tokenType = TokenType::ACCESS;
    std::string sessionId;
    bool mfaVerified = false;
    ResolvedPermissions access;
    ClientContext tokenClient;  ///< Клиент, для которого выпущен MFA токен

    bool hasSession() const { return !sessionId.empty(); }
};

} // namespace clinic::domain
