#pragma once

#include "domain/User.hpp"
#include "domain/LoginOutcome.hpp"
#include "domain/ResolvedPermissions.hpp"
#include "domain/ClientContext.hpp"
#include "domain/TokenClaims.hpp"
#include "ports/output/IUserRepository.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "ports/output/ITokenProvider.hpp"
#include "ports/output/IAuditLog.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "adapters/secondary/AuthSettings.hpp"
#include "application/AuditActions.hpp"
#include "application/DomainEvents.hpp"
#include "utils/UuidGenerator.hpp"
#include <memory>
#include <chrono>
#include <iostream>

namespace clinic::application {

/**
 * @brief Каким путём завершён вход
 */
enum class LoginCompletion {
    Password,   ///< пароль, MFA не требуется
    MfaLogin,   ///< пароль + код MFA
    MfaSetup    ///< пароль + первая настройка MFA
};

inline domain::UserSummary summarize(
    const domain::User& user,
    const domain::ResolvedPermissions& access
) {
    domain::UserSummary summary;
    summary.id = user.userId;
    summary.email = user.email;
    summary.firstName = user.firstName;
    summary.lastName = user.lastName;
    summary.roles.assign(access.roles.begin(), access.roles.end());
    summary.permissions.assign(access.permissions.begin(), access.permissions.end());
    summary.departmentId = user.departmentId;
    summary.employeeId = user.employeeId;
    return summary;
}

/**
 * @brief Завершение входа: токены, запись сессии, lastLoginAt, аудит
 *
 * Общий шаг для входа по паролю и для завершения MFA.
 */
class SessionIssuer {
public:
    SessionIssuer(
        std::shared_ptr<adapters::secondary::AuthSettings> settings,
        std::shared_ptr<ports::output::IUserRepository> userRepo,
        std::shared_ptr<ports::output::ISessionRepository> sessionRepo,
        std::shared_ptr<ports::output::ITokenProvider> tokenProvider,
        std::shared_ptr<ports::output::IAuditLog> auditLog,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher
    ) : settings_(std::move(settings))
      , userRepo_(std::move(userRepo))
      , sessionRepo_(std::move(sessionRepo))
      , tokenProvider_(std::move(tokenProvider))
      , auditLog_(std::move(auditLog))
      , eventPublisher_(std::move(eventPublisher))
    {}

    domain::AuthResult complete(
        const domain::User& user,
        const domain::ResolvedPermissions& access,
        LoginCompletion completion,
        const domain::ClientContext& client
    ) {
        bool mfaVerified = completion != LoginCompletion::Password;
        auto now = std::chrono::system_clock::now();
        std::string sessionId = utils::UuidGenerator::generate();

        domain::UserSummary summary = summarize(user, access);

        domain::AccessTokenClaims accessClaims;
        accessClaims.subject = user.userId;
        accessClaims.sessionId = sessionId;
        accessClaims.email = user.email;
        accessClaims.firstName = user.firstName;
        accessClaims.lastName = user.lastName;
        accessClaims.roles = summary.roles;
        accessClaims.permissions = summary.permissions;
        accessClaims.mfaVerified = mfaVerified;

        std::string accessToken = tokenProvider_->issue(accessClaims);
        std::string refreshToken = tokenProvider_->issue(domain::RefreshTokenClaims{user.userId, sessionId});

        domain::Session session;
        session.sessionId = sessionId;
        session.userId = user.userId;
        session.accessTokenHash = tokenProvider_->fingerprint(accessToken);
        session.refreshTokenHash = tokenProvider_->fingerprint(refreshToken);
        session.ipAddress = client.ipAddress;
        session.userAgent = client.userAgent;
        session.mfaVerified = mfaVerified;
        session.createdAt = now;
        session.expiresAt = now + settings_->getRefreshTokenTtl();
        session.lastActivityAt = now;
        sessionRepo_->create(session);

        userRepo_->updateLastLogin(user.userId, now);

        const char* action = audit::kLogin;
        if (completion == LoginCompletion::MfaLogin) action = audit::kLoginMfaSuccess;
        if (completion == LoginCompletion::MfaSetup) action = audit::kMfaSetupCompleted;
        auditLog_->record(audit::success(action, user.userId, client, sessionId));

        eventPublisher_->publish(
            mfaVerified ? events::kUserLoggedInWithMfa : events::kUserLoggedIn,
            events::make(
                mfaVerified ? events::kUserLoggedInWithMfa : events::kUserLoggedIn,
                user.userId, sessionId,
                {{"email", user.email}, {"ipAddress", client.ipAddress}}));

        std::cout << "[SessionIssuer] Session " << sessionId << " created for user " << user.userId
                  << (mfaVerified ? " (mfa)" : "") << std::endl;

        domain::AuthResult result;
        result.user = std::move(summary);
        result.sessionId = sessionId;
        result.accessToken = std::move(accessToken);
        result.refreshToken = std::move(refreshToken);
        result.expiresIn = settings_->getAccessTokenTtl();
        result.refreshExpiresIn = settings_->getRefreshTokenTtl();
        return result;
    }

private:
    std::shared_ptr<adapters::secondary::AuthSettings> settings_;
    std::shared_ptr<ports::output::IUserRepository> userRepo_;
    std::shared_ptr<ports::output::ISessionRepository> sessionRepo_;
    std::shared_ptr<ports::output::ITokenProvider> tokenProvider_;
    std::shared_ptr<ports::output::IAuditLog> auditLog_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
};

} // namespace clinic::application
