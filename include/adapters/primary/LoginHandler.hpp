#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include "adapters/secondary/AuthSettings.hpp"
#include "adapters/primary/HttpSupport.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace clinic::adapters::primary {

/**
 * @brief Вход по email и паролю
 *
 * POST /api/v1/auth/login
 * {
 *   "email": "a@x.com",
 *   "password": "P@ssw0rd123!"
 * }
 *
 * Response (один из вариантов):
 * { "user": {...}, "sessionId": "...", "expiresIn": 900, "accessToken": "...", "refreshToken": "..." }
 * { "mfaRequired": true, "tempToken": "..." }
 * { "mfaSetupRequired": true, "tempToken": "..." }
 */
class LoginHandler : public IHttpHandler {
public:
    LoginHandler(
        std::shared_ptr<ports::input::IAuthService> authService,
        std::shared_ptr<secondary::AuthSettings> settings
    ) : authService_(std::move(authService))
      , settings_(std::move(settings)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string email = body.value("email", "");
            std::string password = body.value("password", "");

            if (email.empty() || password.empty()) {
                http::sendError(res, 400, "email and password are required");
                return;
            }

            auto outcome = authService_->login(email, password, http::clientContext(req));

            if (auto* result = std::get_if<domain::AuthResult>(&outcome)) {
                http::sendAuthResult(res, *result, settings_->isCookieSecure());
            } else if (auto* challenge = std::get_if<domain::MfaRequired>(&outcome)) {
                http::sendJson(res, 200, {{"mfaRequired", true}, {"tempToken", challenge->tempToken}});
            } else if (auto* setup = std::get_if<domain::MfaSetupRequired>(&outcome)) {
                http::sendJson(res, 200, {{"mfaSetupRequired", true}, {"tempToken", setup->tempToken}});
            }

        } catch (const domain::AuthException& e) {
            http::sendAuthError(res, e);
        } catch (const nlohmann::json::exception& e) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            http::sendInternalError(res, "LoginHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;
    std::shared_ptr<secondary::AuthSettings> settings_;
};

} // namespace clinic::adapters::primary
