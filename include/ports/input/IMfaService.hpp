#pragma once

#include "domain/LoginOutcome.hpp"
#include "domain/Identity.hpp"
#include "domain/ClientContext.hpp"
#include <string>

namespace clinic::ports::input {

/**
 * @brief Управление MFA (TOTP + backup-коды)
 */
class IMfaService {
public:
    virtual ~IMfaService() = default;

    /**
     * @brief Выдать новый секрет и backup-коды. MFA ещё не включается.
     */
    virtual domain::MfaEnrollment enroll(
        const std::string& userId,
        const domain::ClientContext& client
    ) = 0;

    /**
     * @brief Подтвердить настройку кодом и включить MFA
     */
    virtual void verifySetup(
        const std::string& userId,
        const std::string& code,
        const domain::ClientContext& client
    ) = 0;

    /**
     * @brief verifySetup и создание полной сессии
     *
     * Используется, когда настройку подтверждают по mfa_setup или access токену.
     */
    virtual domain::AuthResult completeSetup(
        const domain::Identity& identity,
        const std::string& code,
        const domain::ClientContext& client
    ) = 0;

    /**
     * @brief Завершить вход по mfa_challenge токену и коду (TOTP или backup)
     */
    virtual domain::AuthResult verifyLogin(
        const std::string& tempToken,
        const std::string& code,
        const domain::ClientContext& client
    ) = 0;

    virtual void disable(
        const std::string& userId,
        const std::string& code,
        const std::string& reason,
        const domain::ClientContext& client
    ) = 0;
};

} // namespace clinic::ports::input
