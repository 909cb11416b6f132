#pragma once

#include "ports/input/IAuthService.hpp"
#include "ports/input/IPermissionService.hpp"
#include "ports/output/IUserRepository.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "ports/output/IPasswordHistoryRepository.hpp"
#include "ports/output/ITokenProvider.hpp"
#include "ports/output/IPasswordHasher.hpp"
#include "ports/output/IAuditLog.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "adapters/secondary/AuthSettings.hpp"
#include "application/AccountLockoutGuard.hpp"
#include "application/PasswordPolicy.hpp"
#include "application/SessionIssuer.hpp"
#include "application/AuditActions.hpp"
#include "application/DomainEvents.hpp"
#include "domain/AuthError.hpp"
#include <memory>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace clinic::application {

/**
 * @brief Оркестратор входа
 *
 * Состояния login:
 * CREDENTIAL_CHECK → LOCKOUT_CHECK → PASSWORD_CHECK → ROLE_LOAD → MFA_BRANCH →
 * {MfaSetupRequired | MfaRequired | AuthResult}
 *
 * Сессия создаётся только когда вход полностью завершён.
 * Повторный вход создаёт новую независимую сессию.
 */
class AuthService : public ports::input::IAuthService {
public:
    AuthService(
        std::shared_ptr<adapters::secondary::AuthSettings> settings,
        std::shared_ptr<ports::output::IUserRepository> userRepo,
        std::shared_ptr<ports::output::ISessionRepository> sessionRepo,
        std::shared_ptr<ports::output::IPasswordHistoryRepository> passwordHistoryRepo,
        std::shared_ptr<ports::output::ITokenProvider> tokenProvider,
        std::shared_ptr<ports::output::IPasswordHasher> passwordHasher,
        std::shared_ptr<ports::input::IPermissionService> permissionService,
        std::shared_ptr<AccountLockoutGuard> lockoutGuard,
        std::shared_ptr<SessionIssuer> sessionIssuer,
        std::shared_ptr<ports::output::IAuditLog> auditLog,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher
    ) : settings_(std::move(settings))
      , userRepo_(std::move(userRepo))
      , sessionRepo_(std::move(sessionRepo))
      , passwordHistoryRepo_(std::move(passwordHistoryRepo))
      , tokenProvider_(std::move(tokenProvider))
      , passwordHasher_(std::move(passwordHasher))
      , permissionService_(std::move(permissionService))
      , lockoutGuard_(std::move(lockoutGuard))
      , sessionIssuer_(std::move(sessionIssuer))
      , auditLog_(std::move(auditLog))
      , eventPublisher_(std::move(eventPublisher))
    {
        std::cout << "[AuthService] Created" << std::endl;
    }

    domain::LoginOutcome login(
        const std::string& email,
        const std::string& password,
        const domain::ClientContext& client
    ) override {
        // CREDENTIAL_CHECK
        auto userOpt = userRepo_->findByEmail(normalizeEmail(email));
        if (!userOpt || !userOpt->isActive) {
            std::string userId = userOpt ? userOpt->userId : "";
            std::string reason = userOpt ? "account inactive" : "unknown email";
            auditLog_->record(audit::failure(audit::kLoginFailed, userId, client, reason));
            throw domain::AuthException(domain::AuthErrorCode::InvalidCredentials, reason);
        }
        const domain::User& user = *userOpt;

        // LOCKOUT_CHECK
        if (lockoutGuard_->isLocked(user, LockoutScope::Password)) {
            auditLog_->record(audit::failure(audit::kLoginFailed, user.userId, client, "account locked"));
            throw domain::AuthException(domain::AuthErrorCode::AccountLocked, "account locked");
        }

        // PASSWORD_CHECK
        if (!passwordHasher_->verify(password, user.passwordHash)) {
            bool locked = lockoutGuard_->recordFailure(user.userId, LockoutScope::Password);
            std::string reason = locked ? "invalid password, account locked" : "invalid password";
            auditLog_->record(audit::failure(audit::kLoginFailed, user.userId, client, reason));
            throw domain::AuthException(domain::AuthErrorCode::InvalidCredentials, reason);
        }
        lockoutGuard_->recordSuccess(user.userId, LockoutScope::Password);

        if (passwordHasher_->needsRehash(user.passwordHash)) {
            userRepo_->updatePasswordHash(user.userId, passwordHasher_->hash(password));
        }

        // ROLE_LOAD
        domain::ResolvedPermissions access = permissionService_->resolve(user.userId);

        // MFA_BRANCH
        if (!user.mfaEnabled && requiresMfa(access)) {
            std::string tempToken = tokenProvider_->issue(
                domain::MfaSetupClaims{user.userId, user.email, client});
            auditLog_->record(audit::success(audit::kMfaSetupRequiredInitiated, user.userId, client));
            std::cout << "[AuthService] MFA setup required for user " << user.userId << std::endl;
            return domain::MfaSetupRequired{tempToken};
        }

        if (user.mfaEnabled) {
            std::string tempToken = tokenProvider_->issue(
                domain::MfaChallengeClaims{user.userId, user.email, client});
            auditLog_->record(audit::success(audit::kMfaChallengeIssued, user.userId, client));
            return domain::MfaRequired{tempToken};
        }

        return sessionIssuer_->complete(user, access, LoginCompletion::Password, client);
    }

    domain::RefreshResult refresh(
        const std::string& refreshToken,
        const domain::ClientContext& client
    ) override {
        auto verification = tokenProvider_->verify(refreshToken, {domain::TokenType::REFRESH});
        if (!verification.valid()) {
            std::string reason = ports::output::toString(verification.rejection);
            auditLog_->record(audit::failure(audit::kTokenRefreshFailed, "", client, reason));
            throw domain::AuthException(domain::AuthErrorCode::InvalidToken, reason);
        }
        const auto& claims = std::get<domain::RefreshTokenClaims>(*verification.claims);

        auto session = sessionRepo_->findByRefreshFingerprint(tokenProvider_->fingerprint(refreshToken));
        if (!session || !session->isUsable(std::chrono::system_clock::now())) {
            auditLog_->record(audit::failure(
                audit::kTokenRefreshFailed, claims.subject, client, "session revoked or expired"));
            throw domain::AuthException(
                domain::AuthErrorCode::SessionRevokedOrExpired, "session revoked or expired");
        }

        if (session->userId != claims.subject || session->sessionId != claims.sessionId) {
            auditLog_->record(audit::failure(
                audit::kTokenRefreshFailed, claims.subject, client, "session does not belong to token subject"));
            throw domain::AuthException(
                domain::AuthErrorCode::InvalidToken, "session does not belong to token subject");
        }

        auto user = userRepo_->findById(claims.subject);
        if (!user || !user->isActive) {
            auditLog_->record(audit::failure(
                audit::kTokenRefreshFailed, claims.subject, client, "user missing or inactive"));
            throw domain::AuthException(
                domain::AuthErrorCode::SessionRevokedOrExpired, "user missing or inactive");
        }

        domain::ResolvedPermissions access = permissionService_->resolve(user->userId);
        domain::UserSummary summary = summarize(*user, access);

        domain::AccessTokenClaims accessClaims;
        accessClaims.subject = user->userId;
        accessClaims.sessionId = session->sessionId;
        accessClaims.email = user->email;
        accessClaims.firstName = user->firstName;
        accessClaims.lastName = user->lastName;
        accessClaims.roles = summary.roles;
        accessClaims.permissions = summary.permissions;
        accessClaims.mfaVerified = session->mfaVerified;

        std::string accessToken = tokenProvider_->issue(accessClaims);
        sessionRepo_->updateLastActivity(session->sessionId);

        auditLog_->record(audit::success(audit::kTokenRefresh, user->userId, client, session->sessionId));

        return {std::move(summary), session->sessionId, accessToken, settings_->getAccessTokenTtl()};
    }

    domain::Identity authenticate(
        const std::string& token,
        const std::set<domain::TokenType>& accepted
    ) override {
        auto verification = tokenProvider_->verify(token, accepted);
        if (!verification.valid()) {
            throw domain::AuthException(
                domain::AuthErrorCode::InvalidToken, ports::output::toString(verification.rejection));
        }
        const domain::TokenClaims& claims = *verification.claims;

        domain::Identity identity;
        identity.userId = domain::subjectOf(claims);
        identity.tokenType = domain::tokenTypeOf(claims);

        if (auto* access = std::get_if<domain::AccessTokenClaims>(&claims)) {
            // Запись сессии читается на каждый запрос
            auto session = sessionRepo_->findById(access->sessionId);
            if (!session || !session->isUsable(std::chrono::system_clock::now()) ||
                session->userId != access->subject) {
                throw domain::AuthException(
                    domain::AuthErrorCode::SessionRevokedOrExpired, "session revoked or expired");
            }

            auto user = userRepo_->findById(access->subject);
            if (!user || !user->isActive) {
                throw domain::AuthException(
                    domain::AuthErrorCode::SessionRevokedOrExpired, "user missing or inactive");
            }

            identity.email = user->email;
            identity.sessionId = session->sessionId;
            identity.mfaVerified = session->mfaVerified;
            identity.access = permissionService_->resolve(user->userId);
            return identity;
        }

        if (std::holds_alternative<domain::RefreshTokenClaims>(claims)) {
            throw domain::AuthException(
                domain::AuthErrorCode::InvalidToken, "refresh token cannot authenticate requests");
        }

        auto user = userRepo_->findById(identity.userId);
        if (!user || !user->isActive) {
            throw domain::AuthException(domain::AuthErrorCode::InvalidToken, "user missing or inactive");
        }
        identity.email = user->email;

        if (auto* challenge = std::get_if<domain::MfaChallengeClaims>(&claims)) {
            identity.tokenClient = challenge->client;
        } else if (auto* setup = std::get_if<domain::MfaSetupClaims>(&claims)) {
            identity.tokenClient = setup->client;
        }
        return identity;
    }

    void logout(
        const domain::Identity& identity,
        const std::string& reason,
        const domain::ClientContext& client
    ) override {
        std::string revokeReason = reason.empty() ? "logout" : reason;
        if (identity.hasSession()) {
            sessionRepo_->revoke(identity.sessionId, identity.userId, revokeReason);
        }

        eventPublisher_->publish(
            events::kUserLoggedOut,
            events::make(events::kUserLoggedOut, identity.userId, identity.sessionId,
                         {{"reason", revokeReason}}));
        auditLog_->record(audit::success(
            audit::kLogout, identity.userId, client, identity.sessionId, revokeReason));

        std::cout << "[AuthService] User " << identity.userId << " logged out" << std::endl;
    }

    void changePassword(
        const domain::Identity& identity,
        const std::string& currentPassword,
        const std::string& newPassword,
        const domain::ClientContext& client
    ) override {
        auto user = userRepo_->findById(identity.userId);
        if (!user || !user->isActive) {
            throw domain::AuthException(domain::AuthErrorCode::InvalidCredentials, "user missing or inactive");
        }

        if (!passwordHasher_->verify(currentPassword, user->passwordHash)) {
            rejectPasswordChange(*user, client, domain::AuthErrorCode::InvalidCredentials,
                                 "current password mismatch");
        }

        if (newPassword == currentPassword) {
            rejectPasswordChange(*user, client, domain::AuthErrorCode::PasswordReuse,
                                 "new password equals current password");
        }

        auto violations = passwordPolicy_.validate(newPassword, *user);
        if (!violations.empty()) {
            rejectPasswordChange(*user, client, domain::AuthErrorCode::WeakPassword,
                                 "password " + violations.front());
        }

        for (const auto& previous : passwordHistoryRepo_->recentHashes(
                 user->userId, settings_->getPasswordHistoryDepth())) {
            if (passwordHasher_->verify(newPassword, previous)) {
                rejectPasswordChange(*user, client, domain::AuthErrorCode::PasswordReuse,
                                     "password found in history");
            }
        }

        userRepo_->updatePasswordHash(user->userId, passwordHasher_->hash(newPassword));
        passwordHistoryRepo_->record({
            user->userId,
            user->passwordHash,
            identity.userId,
            client.ipAddress,
            client.userAgent,
            "password_change"
        });

        int revoked = sessionRepo_->revokeAll(user->userId, identity.userId, "password_change");

        eventPublisher_->publish(
            events::kUserPasswordChanged,
            events::make(events::kUserPasswordChanged, user->userId, identity.sessionId,
                         {{"revokedSessions", revoked}}));
        auditLog_->record(audit::success(
            audit::kPasswordChange, user->userId, client, identity.sessionId,
            "revoked " + std::to_string(revoked) + " sessions"));

        std::cout << "[AuthService] Password changed for user " << user->userId
                  << ", revoked " << revoked << " sessions" << std::endl;
    }

    domain::UserSummary me(const domain::Identity& identity) override {
        auto user = userRepo_->findById(identity.userId);
        if (!user || !user->isActive) {
            throw domain::AuthException(
                domain::AuthErrorCode::SessionRevokedOrExpired, "user missing or inactive");
        }
        return summarize(*user, identity.access);
    }

private:
    std::shared_ptr<adapters::secondary::AuthSettings> settings_;
    std::shared_ptr<ports::output::IUserRepository> userRepo_;
    std::shared_ptr<ports::output::ISessionRepository> sessionRepo_;
    std::shared_ptr<ports::output::IPasswordHistoryRepository> passwordHistoryRepo_;
    std::shared_ptr<ports::output::ITokenProvider> tokenProvider_;
    std::shared_ptr<ports::output::IPasswordHasher> passwordHasher_;
    std::shared_ptr<ports::input::IPermissionService> permissionService_;
    std::shared_ptr<AccountLockoutGuard> lockoutGuard_;
    std::shared_ptr<SessionIssuer> sessionIssuer_;
    std::shared_ptr<ports::output::IAuditLog> auditLog_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    PasswordPolicy passwordPolicy_;

    bool requiresMfa(const domain::ResolvedPermissions& access) const {
        const auto& required = settings_->getMfaRequiredRoles();
        return std::any_of(access.roles.begin(), access.roles.end(),
            [&required](const std::string& role) { return required.count(role) > 0; });
    }

    [[noreturn]] void rejectPasswordChange(
        const domain::User& user,
        const domain::ClientContext& client,
        domain::AuthErrorCode code,
        const std::string& reason
    ) {
        auditLog_->record(audit::failure(audit::kPasswordChangeFailed, user.userId, client, reason));
        throw domain::AuthException(code, reason);
    }

    static std::string normalizeEmail(const std::string& email) {
        auto begin = std::find_if_not(email.begin(), email.end(),
            [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(email.rbegin(), email.rend(),
            [](unsigned char c) { return std::isspace(c); }).base();
        std::string normalized = begin < end ? std::string(begin, end) : std::string();
        std::transform(normalized.begin(), normalized.end(), normalized.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return normalized;
    }
};

} // namespace clinic::application
