#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Ports
#include "ports/input/IAuthService.hpp"
#include "ports/input/IMfaService.hpp"
#include "ports/input/IPermissionService.hpp"
#include "ports/output/IUserRepository.hpp"
#include "ports/output/IRoleRepository.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "ports/output/IPasswordHistoryRepository.hpp"
#include "ports/output/ITokenProvider.hpp"
#include "ports/output/IPasswordHasher.hpp"
#include "ports/output/IOtpProvider.hpp"
#include "ports/output/IQrCodeRenderer.hpp"
#include "ports/output/IAuditLog.hpp"
#include "ports/output/IEventPublisher.hpp"

// Application
#include "application/AuthService.hpp"
#include "application/MfaService.hpp"
#include "application/PermissionService.hpp"

// Secondary Adapters
#include "adapters/secondary/DbSettings.hpp"
#include "adapters/secondary/AuthSettings.hpp"
#include "adapters/secondary/RabbitMQSettings.hpp"
#include "adapters/secondary/PostgresUserRepository.hpp"
#include "adapters/secondary/PostgresRoleRepository.hpp"
#include "adapters/secondary/PostgresSessionRepository.hpp"
#include "adapters/secondary/PostgresPasswordHistoryRepository.hpp"
#include "adapters/secondary/PostgresAuditLog.hpp"
#include "adapters/secondary/HmacJwtProvider.hpp"
#include "adapters/secondary/Pbkdf2PasswordHasher.hpp"
#include "adapters/secondary/OpenSslTotpProvider.hpp"
#include "adapters/secondary/OtpAuthQrRenderer.hpp"
#include "adapters/secondary/RabbitMQEventPublisher.hpp"

// Primary Adapters
#include "HealthHandler.hpp"
#include "adapters/primary/LoginHandler.hpp"
#include "adapters/primary/RefreshTokenHandler.hpp"
#include "adapters/primary/LogoutHandler.hpp"
#include "adapters/primary/MeHandler.hpp"
#include "adapters/primary/ChangePasswordHandler.hpp"
#include "adapters/primary/EnableMfaHandler.hpp"
#include "adapters/primary/VerifyMfaHandler.hpp"
#include "adapters/primary/DisableMfaHandler.hpp"

#include <memory>
#include <iostream>

namespace di = boost::di;

namespace clinic {

/**
 * @brief Clinic Auth Service Application
 *
 * Настраивает Boost.DI контейнер и регистрирует HTTP handlers.
 */
class ClinicAuthApp : public BoostBeastApplication {
public:
    ClinicAuthApp() {
        std::cout << "[ClinicAuthApp] Initializing..." << std::endl;
    }

    ~ClinicAuthApp() override = default;

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[ClinicAuthApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[ClinicAuthApp] Configuring Boost.DI injection..." << std::endl;

        auto injector = di::make_injector(

            // ================================================================
            // Layer 1: Settings
            // ================================================================
            di::bind<adapters::secondary::DbSettings>()
                .to(std::make_shared<adapters::secondary::DbSettings>()),

            di::bind<adapters::secondary::AuthSettings>()
                .to(std::make_shared<adapters::secondary::AuthSettings>()),

            di::bind<adapters::secondary::RabbitMQSettings>()
                .to(std::make_shared<adapters::secondary::RabbitMQSettings>()),

            // ================================================================
            // Layer 2: Secondary Adapters (Output Ports implementations)
            // ================================================================
            di::bind<ports::output::IUserRepository>()
                .to<adapters::secondary::PostgresUserRepository>()
                .in(di::singleton),

            di::bind<ports::output::IRoleRepository>()
                .to<adapters::secondary::PostgresRoleRepository>()
                .in(di::singleton),

            di::bind<ports::output::ISessionRepository>()
                .to<adapters::secondary::PostgresSessionRepository>()
                .in(di::singleton),

            di::bind<ports::output::IPasswordHistoryRepository>()
                .to<adapters::secondary::PostgresPasswordHistoryRepository>()
                .in(di::singleton),

            di::bind<ports::output::IAuditLog>()
                .to<adapters::secondary::PostgresAuditLog>()
                .in(di::singleton),

            di::bind<ports::output::ITokenProvider>()
                .to<adapters::secondary::HmacJwtProvider>()
                .in(di::singleton),

            di::bind<ports::output::IPasswordHasher>()
                .to<adapters::secondary::Pbkdf2PasswordHasher>()
                .in(di::singleton),

            di::bind<ports::output::IOtpProvider>()
                .to<adapters::secondary::OpenSslTotpProvider>()
                .in(di::singleton),

            di::bind<ports::output::IQrCodeRenderer>()
                .to<adapters::secondary::OtpAuthQrRenderer>()
                .in(di::singleton),

            di::bind<ports::output::IEventPublisher>()
                .to<adapters::secondary::RabbitMQEventPublisher>()
                .in(di::singleton),

            // ================================================================
            // Layer 3: Application Services (Input Ports implementations)
            // ================================================================
            di::bind<ports::input::IPermissionService>()
                .to<application::PermissionService>()
                .in(di::singleton),

            di::bind<application::AccountLockoutGuard>()
                .in(di::singleton),

            di::bind<application::SessionIssuer>()
                .in(di::singleton),

            di::bind<ports::input::IAuthService>()
                .to<application::AuthService>()
                .in(di::singleton),

            di::bind<ports::input::IMfaService>()
                .to<application::MfaService>()
                .in(di::singleton)
        );

        std::cout << "[ClinicAuthApp] DI Injector configured:" << std::endl;
        std::cout << "  ✓ Secondary Adapters (10 bindings)" << std::endl;
        std::cout << "  ✓ Application Services (5 bindings)" << std::endl;

        // Просроченные сессии удаляются один раз при старте
        {
            auto sessions = injector.create<std::shared_ptr<ports::output::ISessionRepository>>();
            int removed = sessions->deleteExpired();
            std::cout << "[ClinicAuthApp] Expired sessions removed: " << removed << std::endl;
        }

        // ====================================================================
        // Layer 4: Primary Adapters (HTTP Handlers)
        // ====================================================================
        std::cout << "[ClinicAuthApp] Registering HTTP Handlers via DI..." << std::endl;

        {
            auto handler = injector.create<std::shared_ptr<HealthHandler>>();
            registerEndpoint("GET", "/health", handler);
            std::cout << "  ✓ HealthHandler: GET /health" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::LoginHandler>>();
            registerEndpoint("POST", "/api/v1/auth/login", handler);
            std::cout << "  ✓ LoginHandler: POST /api/v1/auth/login" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::RefreshTokenHandler>>();
            registerEndpoint("POST", "/api/v1/auth/refresh", handler);
            std::cout << "  ✓ RefreshTokenHandler: POST /api/v1/auth/refresh" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::LogoutHandler>>();
            registerEndpoint("POST", "/api/v1/auth/logout", handler);
            std::cout << "  ✓ LogoutHandler: POST /api/v1/auth/logout" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::MeHandler>>();
            registerEndpoint("GET", "/api/v1/auth/me", handler);
            std::cout << "  ✓ MeHandler: GET /api/v1/auth/me" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::ChangePasswordHandler>>();
            registerEndpoint("POST", "/api/v1/auth/change-password", handler);
            std::cout << "  ✓ ChangePasswordHandler: POST /api/v1/auth/change-password" << std::endl;
        }

        // MFA Handlers
        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::EnableMfaHandler>>();
            registerEndpoint("POST", "/api/v1/auth/mfa/enable", handler);
            std::cout << "  ✓ EnableMfaHandler: POST /api/v1/auth/mfa/enable" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::VerifyMfaHandler>>();
            registerEndpoint("POST", "/api/v1/auth/mfa/verify", handler);
            std::cout << "  ✓ VerifyMfaHandler: POST /api/v1/auth/mfa/verify" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::DisableMfaHandler>>();
            registerEndpoint("POST", "/api/v1/auth/mfa/disable", handler);
            std::cout << "  ✓ DisableMfaHandler: POST /api/v1/auth/mfa/disable" << std::endl;
        }

        std::cout << "[ClinicAuthApp] Configuration complete! 9 handlers registered." << std::endl;
    }
};

} // namespace clinic
