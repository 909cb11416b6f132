#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include "adapters/secondary/AuthSettings.hpp"
#include "adapters/primary/HttpSupport.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace clinic::adapters::primary {

/**
 * @brief Смена пароля; все сессии пользователя отзываются
 *
 * POST /api/v1/auth/change-password
 * Authorization: Bearer <access токен>
 * { "currentPassword": "...", "newPassword": "..." }
 *
 * Response: 204 No Content
 */
class ChangePasswordHandler : public IHttpHandler {
public:
    ChangePasswordHandler(
        std::shared_ptr<ports::input::IAuthService> authService,
        std::shared_ptr<secondary::AuthSettings> settings
    ) : authService_(std::move(authService))
      , settings_(std::move(settings)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto token = http::extractToken(req);
            if (!token) {
                throw domain::AuthException(domain::AuthErrorCode::InvalidToken, "missing token");
            }
            auto identity = authService_->authenticate(*token, {domain::TokenType::ACCESS});

            auto body = nlohmann::json::parse(req.getBody());
            std::string currentPassword = body.value("currentPassword", "");
            std::string newPassword = body.value("newPassword", "");

            if (currentPassword.empty() || newPassword.empty()) {
                http::sendError(res, 400, "currentPassword and newPassword are required");
                return;
            }

            authService_->changePassword(identity, currentPassword, newPassword, http::clientContext(req));

            res.setHeader("Set-Cookie",
                http::clearSessionCookie(req, settings_->isCookieSecure()));
            res.setStatus(204);

        } catch (const domain::AuthException& e) {
            http::sendAuthError(res, e);
        } catch (const nlohmann::json::exception& e) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            http::sendInternalError(res, "ChangePasswordHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;
    std::shared_ptr<secondary::AuthSettings> settings_;
};

} // namespace clinic::adapters::primary
