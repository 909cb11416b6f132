#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include "adapters/primary/HttpSupport.hpp"
#include <memory>

namespace clinic::adapters::primary {

/**
 * @brief Текущий пользователь
 *
 * GET /api/v1/auth/me
 * Authorization: Bearer <access токен>
 *
 * Response:
 * { "id": "...", "email": "...", "firstName": "...", "lastName": "...",
 *   "roles": [...], "permissions": [...], "departmentId": "...", "employeeId": "..." }
 */
class MeHandler : public IHttpHandler {
public:
    explicit MeHandler(
        std::shared_ptr<ports::input::IAuthService> authService
    ) : authService_(std::move(authService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto token = http::extractToken(req);
            if (!token) {
                throw domain::AuthException(domain::AuthErrorCode::InvalidToken, "missing token");
            }

            auto identity = authService_->authenticate(*token, {domain::TokenType::ACCESS});
            http::sendJson(res, 200, http::userToJson(authService_->me(identity)));

        } catch (const domain::AuthException& e) {
            http::sendAuthError(res, e);
        } catch (const std::exception& e) {
            http::sendInternalError(res, "MeHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;
};

} // namespace clinic::adapters::primary
