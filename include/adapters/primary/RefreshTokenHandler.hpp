#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include "adapters/secondary/AuthSettings.hpp"
#include "adapters/primary/HttpSupport.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace clinic::adapters::primary {

/**
 * @brief Новый access токен по refresh токену
 *
 * POST /api/v1/auth/refresh
 * Refresh токен берётся из cookie refresh_token, иначе из тела {"refreshToken": "..."}.
 *
 * Response: { "user": {...}, "sessionId": "...", "expiresIn": 900, "accessToken": "..." }
 * + Set-Cookie: access_token=...
 */
class RefreshTokenHandler : public IHttpHandler {
public:
    RefreshTokenHandler(
        std::shared_ptr<ports::input::IAuthService> authService,
        std::shared_ptr<secondary::AuthSettings> settings
    ) : authService_(std::move(authService))
      , settings_(std::move(settings)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            std::string refreshToken = http::getCookie(req, http::kRefreshTokenCookie).value_or("");
            if (refreshToken.empty() && !req.getBody().empty()) {
                auto body = nlohmann::json::parse(req.getBody());
                refreshToken = body.value("refreshToken", "");
            }

            if (refreshToken.empty()) {
                http::sendError(res, 401, "Refresh token is required");
                return;
            }

            auto result = authService_->refresh(refreshToken, http::clientContext(req));

            nlohmann::json response;
            response["user"] = http::userToJson(result.user);
            response["sessionId"] = result.sessionId;
            response["expiresIn"] = result.expiresIn.count();
            response["accessToken"] = result.accessToken;

            res.setHeader("Set-Cookie", http::buildCookie(
                http::kAccessTokenCookie, result.accessToken, result.expiresIn,
                settings_->isCookieSecure()));
            http::sendJson(res, 200, response);

        } catch (const domain::AuthException& e) {
            http::sendAuthError(res, e);
        } catch (const nlohmann::json::exception& e) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            http::sendInternalError(res, "RefreshTokenHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;
    std::shared_ptr<secondary::AuthSettings> settings_;
};

} // namespace clinic::adapters::primary
