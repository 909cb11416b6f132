#pragma once

#include "ports/input/IMfaService.hpp"
#include "ports/input/IPermissionService.hpp"
#include "ports/output/IUserRepository.hpp"
#include "ports/output/ITokenProvider.hpp"
#include "ports/output/IOtpProvider.hpp"
#include "ports/output/IQrCodeRenderer.hpp"
#include "ports/output/IAuditLog.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "adapters/secondary/AuthSettings.hpp"
#include "adapters/secondary/crypto/Encoding.hpp"
#include "application/AccountLockoutGuard.hpp"
#include "application/SessionIssuer.hpp"
#include "application/AuditActions.hpp"
#include "application/DomainEvents.hpp"
#include "domain/AuthError.hpp"
#include <memory>
#include <chrono>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace clinic::application {

/**
 * @brief Какой код MFA совпал
 */
enum class MfaCodeMatch {
    None,
    Totp,
    BackupCode
};

/**
 * @brief MFA Manager
 *
 * enroll выдаёт pending-секрет; MFA включается только после первого
 * верного кода (verifySetup). Backup-коды хранятся как SHA-256 и
 * удаляются атомарно при использовании.
 *
 * Все проверки кода проходят через отдельный счётчик неудач MFA
 * (LockoutScope::Mfa), не связанный со счётчиком пароля.
 */
class MfaService : public ports::input::IMfaService {
public:
    static constexpr size_t kBackupCodeBytes = 4;

    MfaService(
        std::shared_ptr<adapters::secondary::AuthSettings> settings,
        std::shared_ptr<ports::output::IUserRepository> userRepo,
        std::shared_ptr<ports::output::ITokenProvider> tokenProvider,
        std::shared_ptr<ports::output::IOtpProvider> otpProvider,
        std::shared_ptr<ports::output::IQrCodeRenderer> qrRenderer,
        std::shared_ptr<ports::input::IPermissionService> permissionService,
        std::shared_ptr<AccountLockoutGuard> lockoutGuard,
        std::shared_ptr<SessionIssuer> sessionIssuer,
        std::shared_ptr<ports::output::IAuditLog> auditLog,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher
    ) : settings_(std::move(settings))
      , userRepo_(std::move(userRepo))
      , tokenProvider_(std::move(tokenProvider))
      , otpProvider_(std::move(otpProvider))
      , qrRenderer_(std::move(qrRenderer))
      , permissionService_(std::move(permissionService))
      , lockoutGuard_(std::move(lockoutGuard))
      , sessionIssuer_(std::move(sessionIssuer))
      , auditLog_(std::move(auditLog))
      , eventPublisher_(std::move(eventPublisher))
    {
        std::cout << "[MfaService] Created" << std::endl;
    }

    domain::MfaEnrollment enroll(
        const std::string& userId,
        const domain::ClientContext& client
    ) override {
        domain::User user = loadActiveUser(userId);
        if (user.mfaEnabled) {
            throw domain::AuthException(domain::AuthErrorCode::MfaAlreadyEnabled, "mfa already enabled");
        }

        domain::MfaEnrollment enrollment;
        enrollment.secret = otpProvider_->generateSecret();

        std::vector<std::string> hashes;
        for (int i = 0; i < settings_->getBackupCodeCount(); ++i) {
            std::string code = adapters::secondary::crypto::toHex(
                adapters::secondary::crypto::randomBytes(kBackupCodeBytes), true);
            hashes.push_back(hashBackupCode(code));
            enrollment.backupCodes.push_back(code);
        }

        userRepo_->storePendingMfa(user.userId, enrollment.secret, hashes);

        enrollment.otpauthUri = otpProvider_->buildUri(
            enrollment.secret, user.email, settings_->getMfaIssuer());
        enrollment.qrCodeDataUrl = qrRenderer_->toDataUrl(enrollment.otpauthUri);

        eventPublisher_->publish(
            events::kUserMfaInitiated,
            events::make(events::kUserMfaInitiated, user.userId, ""));
        auditLog_->record(audit::success(audit::kMfaInitiated, user.userId, client));

        return enrollment;
    }

    void verifySetup(
        const std::string& userId,
        const std::string& code,
        const domain::ClientContext& client
    ) override {
        domain::User user = loadActiveUser(userId);
        if (user.mfaEnabled) {
            throw domain::AuthException(domain::AuthErrorCode::MfaAlreadyEnabled, "mfa already enabled");
        }
        if (!user.pendingMfaSecret) {
            throw domain::AuthException(domain::AuthErrorCode::MfaSetupNotInitiated, "no pending mfa secret");
        }
        ensureNotRateLimited(user, client);

        const std::string secret = *user.pendingMfaSecret;
        if (!otpProvider_->verify(secret, normalizeCode(code),
                                  std::chrono::system_clock::now(), settings_->getTotpWindow())) {
            registerFailure(user, audit::kMfaVerificationFailed, client, "invalid setup code");
        }

        // Секрет мог смениться повторным enroll; тогда enableMfa вернёт false
        if (!userRepo_->enableMfa(user.userId, secret)) {
            auditLog_->record(audit::failure(
                audit::kMfaVerificationFailed, user.userId, client, "pending secret replaced"));
            throw domain::AuthException(domain::AuthErrorCode::InvalidMfaCode, "pending secret replaced");
        }
        lockoutGuard_->recordSuccess(user.userId, LockoutScope::Mfa);

        eventPublisher_->publish(
            events::kUserMfaEnabled,
            events::make(events::kUserMfaEnabled, user.userId, ""));
        auditLog_->record(audit::success(audit::kMfaEnabled, user.userId, client));

        std::cout << "[MfaService] MFA enabled for user " << user.userId << std::endl;
    }

    domain::AuthResult completeSetup(
        const domain::Identity& identity,
        const std::string& code,
        const domain::ClientContext& client
    ) override {
        if (identity.tokenType == domain::TokenType::MFA_SETUP) {
            checkClient(identity.userId, identity.tokenClient, client);
        }

        verifySetup(identity.userId, code, client);

        domain::User user = loadActiveUser(identity.userId);
        return sessionIssuer_->complete(
            user, permissionService_->resolve(user.userId), LoginCompletion::MfaSetup, client);
    }

    domain::AuthResult verifyLogin(
        const std::string& tempToken,
        const std::string& code,
        const domain::ClientContext& client
    ) override {
        auto verification = tokenProvider_->verify(tempToken, {domain::TokenType::MFA_CHALLENGE});
        if (!verification.valid()) {
            std::string reason = ports::output::toString(verification.rejection);
            auditLog_->record(audit::failure(audit::kMfaLoginInvalidTempToken, "", client, reason));
            throw domain::AuthException(domain::AuthErrorCode::InvalidToken, reason);
        }
        const auto& claims = std::get<domain::MfaChallengeClaims>(*verification.claims);
        checkClient(claims.subject, claims.client, client);

        auto userOpt = userRepo_->findById(claims.subject);
        if (!userOpt || !userOpt->isActive) {
            auditLog_->record(audit::failure(
                audit::kMfaLoginFailed, claims.subject, client, "user missing or inactive"));
            throw domain::AuthException(domain::AuthErrorCode::InvalidToken, "user missing or inactive");
        }
        const domain::User& user = *userOpt;
        if (!user.mfaEnabled || !user.mfaSecret) {
            throw domain::AuthException(domain::AuthErrorCode::MfaNotEnabled, "mfa not enabled");
        }
        ensureNotRateLimited(user, client);

        MfaCodeMatch match = matchCode(user, code);
        if (match == MfaCodeMatch::None) {
            registerFailure(user, audit::kMfaLoginFailed, client, "invalid mfa code");
        }
        lockoutGuard_->recordSuccess(user.userId, LockoutScope::Mfa);

        if (match == MfaCodeMatch::BackupCode) {
            auditLog_->record(audit::success(
                audit::kMfaBackupCodeUsed, user.userId, client, "",
                std::to_string(user.backupCodeHashes.size() - 1) + " backup codes remaining"));
        }

        return sessionIssuer_->complete(
            user, permissionService_->resolve(user.userId), LoginCompletion::MfaLogin, client);
    }

    void disable(
        const std::string& userId,
        const std::string& code,
        const std::string& reason,
        const domain::ClientContext& client
    ) override {
        domain::User user = loadActiveUser(userId);
        if (!user.mfaEnabled) {
            throw domain::AuthException(domain::AuthErrorCode::MfaNotEnabled, "mfa not enabled");
        }
        ensureNotRateLimited(user, client);

        if (matchCode(user, code) == MfaCodeMatch::None) {
            registerFailure(user, audit::kMfaDisableFailed, client, "invalid mfa code");
        }
        lockoutGuard_->recordSuccess(user.userId, LockoutScope::Mfa);

        userRepo_->disableMfa(user.userId);

        eventPublisher_->publish(
            events::kUserMfaDisabled,
            events::make(events::kUserMfaDisabled, user.userId, "", {{"reason", reason}}));
        auditLog_->record(audit::success(audit::kMfaDisabled, user.userId, client, "", reason));

        std::cout << "[MfaService] MFA disabled for user " << user.userId << std::endl;
    }

    /**
     * @brief Нормализация backup-кода и его отпечаток для хранения
     */
    static std::string hashBackupCode(const std::string& code) {
        return adapters::secondary::crypto::sha256Hex(normalizeCode(code));
    }

private:
    std::shared_ptr<adapters::secondary::AuthSettings> settings_;
    std::shared_ptr<ports::output::IUserRepository> userRepo_;
    std::shared_ptr<ports::output::ITokenProvider> tokenProvider_;
    std::shared_ptr<ports::output::IOtpProvider> otpProvider_;
    std::shared_ptr<ports::output::IQrCodeRenderer> qrRenderer_;
    std::shared_ptr<ports::input::IPermissionService> permissionService_;
    std::shared_ptr<AccountLockoutGuard> lockoutGuard_;
    std::shared_ptr<SessionIssuer> sessionIssuer_;
    std::shared_ptr<ports::output::IAuditLog> auditLog_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;

    domain::User loadActiveUser(const std::string& userId) {
        auto user = userRepo_->findById(userId);
        if (!user || !user->isActive) {
            throw domain::AuthException(domain::AuthErrorCode::InvalidCredentials, "user missing or inactive");
        }
        return *user;
    }

    /**
     * @brief TOTP, затем backup-код (backup-код удаляется при совпадении)
     */
    MfaCodeMatch matchCode(const domain::User& user, const std::string& code) {
        std::string normalized = normalizeCode(code);

        if (user.mfaSecret && normalized.size() == 6 &&
            otpProvider_->verify(*user.mfaSecret, normalized,
                                 std::chrono::system_clock::now(), settings_->getTotpWindow())) {
            return MfaCodeMatch::Totp;
        }

        if (normalized.size() == kBackupCodeBytes * 2 &&
            userRepo_->consumeBackupCode(user.userId, hashBackupCode(normalized))) {
            return MfaCodeMatch::BackupCode;
        }

        return MfaCodeMatch::None;
    }

    void ensureNotRateLimited(const domain::User& user, const domain::ClientContext& client) {
        if (lockoutGuard_->isLocked(user, LockoutScope::Mfa)) {
            auditLog_->record(audit::failure(
                audit::kMfaRateLimited, user.userId, client, "too many invalid mfa codes"));
            throw domain::AuthException(domain::AuthErrorCode::AccountLocked, "mfa attempts locked");
        }
    }

    [[noreturn]] void registerFailure(
        const domain::User& user,
        const char* action,
        const domain::ClientContext& client,
        const std::string& reason
    ) {
        bool locked = lockoutGuard_->recordFailure(user.userId, LockoutScope::Mfa);
        std::string detail = locked ? reason + ", mfa attempts locked" : reason;
        auditLog_->record(audit::failure(action, user.userId, client, detail));
        throw domain::AuthException(domain::AuthErrorCode::InvalidMfaCode, detail);
    }

    /// Смена IP/User-Agent между выдачей временного токена и вводом кода только фиксируется в аудите
    void checkClient(
        const std::string& userId,
        const domain::ClientContext& issuedFor,
        const domain::ClientContext& client
    ) {
        if (issuedFor != client) {
            auditLog_->record(audit::success(
                audit::kMfaClientMismatch, userId, client, "",
                "temp token issued for " + issuedFor.ipAddress));
        }
    }

    static std::string normalizeCode(const std::string& code) {
        std::string normalized;
        for (unsigned char c : code) {
            if (std::isspace(c) || c == '-') continue;
            normalized.push_back(static_cast<char>(std::toupper(c)));
        }
        return normalized;
    }
};

} // namespace clinic::application
