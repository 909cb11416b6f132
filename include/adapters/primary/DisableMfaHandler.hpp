#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include "ports/input/IMfaService.hpp"
#include "adapters/primary/HttpSupport.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace clinic::adapters::primary {

/**
 * @brief Отключение MFA по действующему коду
 *
 * POST /api/v1/auth/mfa/disable
 * Authorization: Bearer <access токен>
 * { "code": "123456", "reason": "..." }
 */
class DisableMfaHandler : public IHttpHandler {
public:
    DisableMfaHandler(
        std::shared_ptr<ports::input::IAuthService> authService,
        std::shared_ptr<ports::input::IMfaService> mfaService
    ) : authService_(std::move(authService))
      , mfaService_(std::move(mfaService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto token = http::extractToken(req);
            if (!token) {
                throw domain::AuthException(domain::AuthErrorCode::InvalidToken, "missing token");
            }
            auto identity = authService_->authenticate(*token, {domain::TokenType::ACCESS});

            auto body = nlohmann::json::parse(req.getBody());
            std::string code = body.value("code", "");
            std::string reason = body.value("reason", "");
            if (code.empty()) {
                http::sendError(res, 400, "code is required");
                return;
            }

            mfaService_->disable(identity.userId, code, reason, http::clientContext(req));

            http::sendJson(res, 200, {{"message", "MFA disabled"}});

        } catch (const domain::AuthException& e) {
            http::sendAuthError(res, e);
        } catch (const nlohmann::json::exception& e) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            http::sendInternalError(res, "DisableMfaHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;
    std::shared_ptr<ports::input::IMfaService> mfaService_;
};

} // namespace clinic::adapters::primary
