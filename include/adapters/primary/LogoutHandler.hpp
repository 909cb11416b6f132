#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include "adapters/secondary/AuthSettings.hpp"
#include "adapters/primary/HttpSupport.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace clinic::adapters::primary {

/**
 * @brief Выход: отзыв сессии
 *
 * POST /api/v1/auth/logout
 * Authorization: Bearer <access или mfa_challenge токен>
 * { "reason": "..." }   // необязательно
 *
 * Response: 204 No Content
 */
class LogoutHandler : public IHttpHandler {
public:
    LogoutHandler(
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

            auto identity = authService_->authenticate(
                *token, {domain::TokenType::ACCESS, domain::TokenType::MFA_CHALLENGE});

            std::string reason;
            if (!req.getBody().empty()) {
                auto body = nlohmann::json::parse(req.getBody());
                reason = body.value("reason", "");
            }

            authService_->logout(identity, reason, http::clientContext(req));

            res.setHeader("Set-Cookie",
                http::clearSessionCookie(req, settings_->isCookieSecure()));
            res.setStatus(204);

        } catch (const domain::AuthException& e) {
            http::sendAuthError(res, e);
        } catch (const nlohmann::json::exception& e) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            http::sendInternalError(res, "LogoutHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;
    std::shared_ptr<secondary::AuthSettings> settings_;
};

} // namespace clinic::adapters::primary
