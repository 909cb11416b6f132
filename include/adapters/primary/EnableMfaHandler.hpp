#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include "ports/input/IMfaService.hpp"
#include "adapters/primary/HttpSupport.hpp"
#include <memory>

namespace clinic::adapters::primary {

/**
 * @brief Начать настройку MFA
 *
 * POST /api/v1/auth/mfa/enable
 * Authorization: Bearer <access или mfa_setup токен>
 *
 * Response:
 * { "secret": "...", "qrCodeDataUrl": "data:...", "otpauthUrl": "otpauth://...", "backupCodes": [...] }
 */
class EnableMfaHandler : public IHttpHandler {
public:
    EnableMfaHandler(
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

            auto identity = authService_->authenticate(
                *token, {domain::TokenType::ACCESS, domain::TokenType::MFA_SETUP});

            auto enrollment = mfaService_->enroll(identity.userId, http::clientContext(req));

            nlohmann::json response;
            response["secret"] = enrollment.secret;
            response["qrCodeDataUrl"] = enrollment.qrCodeDataUrl;
            response["otpauthUrl"] = enrollment.otpauthUri;
            response["backupCodes"] = enrollment.backupCodes;
            http::sendJson(res, 200, response);

        } catch (const domain::AuthException& e) {
            http::sendAuthError(res, e);
        } catch (const std::exception& e) {
            http::sendInternalError(res, "EnableMfaHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;
    std::shared_ptr<ports::input::IMfaService> mfaService_;
};

} // namespace clinic::adapters::primary
