#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include "ports/input/IMfaService.hpp"
#include "adapters/secondary/AuthSettings.hpp"
#include "adapters/primary/HttpSupport.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace clinic::adapters::primary {

/**
 * @brief Проверка MFA кода
 *
 * POST /api/v1/auth/mfa/verify
 * Authorization: Bearer <access, mfa_setup или mfa_challenge токен>
 * { "code": "123456", "tempToken": "..." }   // tempToken вместо заголовка допустим
 *
 * mfa_challenge -> завершение входа (TOTP или backup-код)
 * access / mfa_setup -> подтверждение настройки и новая сессия
 *
 * Response: { "user": {...}, "sessionId": "...", "expiresIn": 900, "accessToken": "...", "refreshToken": "..." }
 */
class VerifyMfaHandler : public IHttpHandler {
public:
    VerifyMfaHandler(
        std::shared_ptr<ports::input::IAuthService> authService,
        std::shared_ptr<ports::input::IMfaService> mfaService,
        std::shared_ptr<secondary::AuthSettings> settings
    ) : authService_(std::move(authService))
      , mfaService_(std::move(mfaService))
      , settings_(std::move(settings)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());
            std::string code = body.value("code", "");
            if (code.empty()) {
                http::sendError(res, 400, "code is required");
                return;
            }

            std::optional<std::string> token = http::bearerToken(req);
            if (!token) {
                std::string tempToken = body.value("tempToken", "");
                if (!tempToken.empty()) token = tempToken;
            }
            if (!token) {
                token = http::getCookie(req, http::kAccessTokenCookie);
            }
            if (!token) {
                throw domain::AuthException(domain::AuthErrorCode::InvalidToken, "missing token");
            }

            auto client = http::clientContext(req);
            auto identity = authService_->authenticate(*token, {
                domain::TokenType::ACCESS,
                domain::TokenType::MFA_SETUP,
                domain::TokenType::MFA_CHALLENGE
            });

            domain::AuthResult result = identity.tokenType == domain::TokenType::MFA_CHALLENGE
                ? mfaService_->verifyLogin(*token, code, client)
                : mfaService_->completeSetup(identity, code, client);

            http::sendAuthResult(res, result, settings_->isCookieSecure());

        } catch (const domain::AuthException& e) {
            http::sendAuthError(res, e);
        } catch (const nlohmann::json::exception& e) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            http::sendInternalError(res, "VerifyMfaHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;
    std::shared_ptr<ports::input::IMfaService> mfaService_;
    std::shared_ptr<secondary::AuthSettings> settings_;
};

} // namespace clinic::adapters::primary
