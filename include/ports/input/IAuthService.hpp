#pragma once

#include "domain/LoginOutcome.hpp"
#include "domain/Identity.hpp"
#include "domain/ClientContext.hpp"
#include <string>
#include <set>

namespace clinic::ports::input {

/**
 * @brief Оркестратор входа: login / refresh / logout / смена пароля
 *
 * Ошибки сообщаются через domain::AuthException.
 */
class IAuthService {
public:
    virtual ~IAuthService() = default;

    /**
     * @brief Вход по email и паролю
     *
     * @return Полный результат, либо требование MFA кода, либо требование настройки MFA
     */
    virtual domain::LoginOutcome login(
        const std::string& email,
        const std::string& password,
        const domain::ClientContext& client
    ) = 0;

    /**
     * @brief Новый access токен по refresh токену (refresh токен не ротируется)
     */
    virtual domain::RefreshResult refresh(
        const std::string& refreshToken,
        const domain::ClientContext& client
    ) = 0;

    /**
     * @brief Проверить bearer токен и построить субъект запроса
     *
     * @param accepted Типы токенов, допустимые для конкретного эндпоинта
     */
    virtual domain::Identity authenticate(
        const std::string& token,
        const std::set<domain::TokenType>& accepted
    ) = 0;

    virtual void logout(
        const domain::Identity& identity,
        const std::string& reason,
        const domain::ClientContext& client
    ) = 0;

    /**
     * @brief Смена пароля; отзывает все сессии пользователя
     */
    virtual void changePassword(
        const domain::Identity& identity,
        const std::string& currentPassword,
        const std::string& newPassword,
        const domain::ClientContext& client
    ) = 0;

    virtual domain::UserSummary me(const domain::Identity& identity) = 0;
};

} // namespace clinic::ports::input
