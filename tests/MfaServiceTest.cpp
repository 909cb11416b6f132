#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "AuthTestEnvironment.hpp"
#include "application/AuditActions.hpp"
#include "application/DomainEvents.hpp"

using namespace clinic;
using namespace clinic::tests;
using clinic::domain::AuthErrorCode;
using clinic::domain::AuthException;
using clinic::domain::TokenType;

class MfaServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        env_.addUser("user-1", "a@x.com");
    }

    void TearDown() override {
        env_.userRepo->clear();
        env_.sessionRepo->clear();
    }

    std::string challengeToken() {
        auto outcome = env_.authService->login("a@x.com", kTestPassword, env_.client);
        return std::get<domain::MfaRequired>(outcome).tempToken;
    }

    /// 6 цифр, не совпадающие с кодом ни в одном шаге окна
    std::string wrongCode(const std::string& secret) {
        auto now = std::chrono::system_clock::now();
        std::set<std::string> valid;
        for (int step = -2; step <= 2; ++step) {
            valid.insert(env_.otp->generateCode(secret, now + std::chrono::seconds(30 * step)));
        }
        for (int candidate = 0;; ++candidate) {
            std::string code = std::to_string(100000 + candidate);
            if (valid.count(code) == 0) return code;
        }
    }

    template <typename Fn>
    AuthErrorCode errorOf(Fn&& fn) {
        try {
            fn();
        } catch (const AuthException& e) {
            return e.code();
        }
        ADD_FAILURE() << "call did not fail";
        return AuthErrorCode::InvalidToken;
    }

    AuthTestEnvironment env_;
};

// ============================================
// ENROLL / SETUP TESTS
// ============================================

TEST_F(MfaServiceTest, Enroll_ReturnsSecretAndBackupCodes_NotYetEnabled) {
    auto enrollment = env_.mfaService->enroll("user-1", env_.client);

    EXPECT_FALSE(enrollment.secret.empty());
    EXPECT_THAT(enrollment.otpauthUri, ::testing::StartsWith("otpauth://totp/"));
    EXPECT_THAT(enrollment.otpauthUri, ::testing::HasSubstr("secret=" + enrollment.secret));
    EXPECT_THAT(enrollment.qrCodeDataUrl, ::testing::StartsWith("data:"));
    EXPECT_EQ(enrollment.backupCodes.size(), 4);
    for (const auto& code : enrollment.backupCodes) {
        EXPECT_EQ(code.size(), 8);
    }

    auto user = env_.userRepo->findById("user-1");
    EXPECT_FALSE(user->mfaEnabled);
    EXPECT_EQ(user->pendingMfaSecret, std::optional<std::string>(enrollment.secret));
    EXPECT_EQ(env_.events->count(application::events::kUserMfaInitiated), 1);
}

TEST_F(MfaServiceTest, Enroll_AlreadyEnabled_MfaAlreadyEnabled) {
    env_.enableMfa("user-1");

    EXPECT_EQ(errorOf([&] { env_.mfaService->enroll("user-1", env_.client); }),
              AuthErrorCode::MfaAlreadyEnabled);
}

TEST_F(MfaServiceTest, VerifySetup_CorrectCode_EnablesMfaAndLoginRequiresChallenge) {
    auto enrollment = env_.mfaService->enroll("user-1", env_.client);

    env_.mfaService->verifySetup("user-1", env_.currentCode(enrollment.secret), env_.client);

    auto user = env_.userRepo->findById("user-1");
    EXPECT_TRUE(user->mfaEnabled);
    EXPECT_EQ(user->mfaSecret, std::optional<std::string>(enrollment.secret));
    EXPECT_EQ(user->backupCodeHashes.size(), 4);
    EXPECT_FALSE(user->pendingMfaSecret.has_value());
    EXPECT_EQ(env_.auditLog->count(application::audit::kMfaEnabled), 1);

    for (int i = 0; i < 3; ++i) {
        auto outcome = env_.authService->login("a@x.com", kTestPassword, env_.client);
        EXPECT_TRUE(std::holds_alternative<domain::MfaRequired>(outcome));
    }
}

TEST_F(MfaServiceTest, VerifySetup_WithoutEnroll_MfaSetupNotInitiated) {
    EXPECT_EQ(errorOf([&] { env_.mfaService->verifySetup("user-1", "123456", env_.client); }),
              AuthErrorCode::MfaSetupNotInitiated);
}

TEST_F(MfaServiceTest, VerifySetup_WrongCode_StaysDisabled) {
    auto enrollment = env_.mfaService->enroll("user-1", env_.client);

    EXPECT_EQ(errorOf([&] {
        env_.mfaService->verifySetup("user-1", wrongCode(enrollment.secret), env_.client);
    }), AuthErrorCode::InvalidMfaCode);

    EXPECT_FALSE(env_.userRepo->findById("user-1")->mfaEnabled);
}

TEST_F(MfaServiceTest, VerifySetup_AlreadyEnabled_MfaAlreadyEnabled) {
    auto secret = env_.enableMfa("user-1");

    EXPECT_EQ(errorOf([&] {
        env_.mfaService->verifySetup("user-1", env_.currentCode(secret), env_.client);
    }), AuthErrorCode::MfaAlreadyEnabled);
}

TEST_F(MfaServiceTest, VerifySetup_SecretReplacedByNewEnroll_OldCodeFails) {
    auto first = env_.mfaService->enroll("user-1", env_.client);
    auto second = env_.mfaService->enroll("user-1", env_.client);
    ASSERT_NE(first.secret, second.secret);

    std::string staleCode = env_.currentCode(first.secret);
    std::string freshCode = env_.currentCode(second.secret);
    if (staleCode != freshCode) {
        EXPECT_EQ(errorOf([&] { env_.mfaService->verifySetup("user-1", staleCode, env_.client); }),
                  AuthErrorCode::InvalidMfaCode);
    }

    env_.mfaService->verifySetup("user-1", freshCode, env_.client);
    EXPECT_EQ(env_.userRepo->findById("user-1")->mfaSecret, std::optional<std::string>(second.secret));
}

TEST_F(MfaServiceTest, EnableMfa_StaleExpectedSecret_CompareAndSetFails) {
    env_.mfaService->enroll("user-1", env_.client);
    auto pending = *env_.userRepo->findById("user-1")->pendingMfaSecret;
    env_.mfaService->enroll("user-1", env_.client);

    EXPECT_FALSE(env_.userRepo->enableMfa("user-1", pending));
    EXPECT_FALSE(env_.userRepo->findById("user-1")->mfaEnabled);
}

TEST_F(MfaServiceTest, CompleteSetup_FromSetupToken_CreatesMfaVerifiedSession) {
    env_.addUser("doc-1", "doc@x.com", {"DOCTOR"});
    auto outcome = env_.authService->login("doc@x.com", kTestPassword, env_.client);
    auto setupToken = std::get<domain::MfaSetupRequired>(outcome).tempToken;
    auto identity = env_.authService->authenticate(setupToken, {TokenType::MFA_SETUP});

    auto enrollment = env_.mfaService->enroll(identity.userId, env_.client);
    auto result = env_.mfaService->completeSetup(
        identity, env_.currentCode(enrollment.secret), env_.client);

    EXPECT_EQ(result.user.id, "doc-1");
    EXPECT_THAT(result.user.roles, ::testing::Contains("DOCTOR"));

    auto session = env_.sessionRepo->findById(result.sessionId);
    ASSERT_TRUE(session.has_value());
    EXPECT_TRUE(session->mfaVerified);
    EXPECT_EQ(env_.auditLog->count(application::audit::kMfaSetupCompleted), 1);

    auto me = env_.authService->authenticate(result.accessToken, {TokenType::ACCESS});
    EXPECT_TRUE(me.mfaVerified);
}

TEST_F(MfaServiceTest, CompleteSetup_FromDifferentClient_AuditedButAllowed) {
    env_.addUser("doc-1", "doc@x.com", {"DOCTOR"});
    auto outcome = env_.authService->login("doc@x.com", kTestPassword, env_.client);
    auto identity = env_.authService->authenticate(
        std::get<domain::MfaSetupRequired>(outcome).tempToken, {TokenType::MFA_SETUP});
    auto enrollment = env_.mfaService->enroll(identity.userId, env_.client);

    domain::ClientContext otherClient{"192.168.1.50", "other-agent"};
    env_.mfaService->completeSetup(identity, env_.currentCode(enrollment.secret), otherClient);

    EXPECT_EQ(env_.auditLog->count(application::audit::kMfaClientMismatch), 1);
}

// ============================================
// LOGIN VERIFICATION TESTS
// ============================================

TEST_F(MfaServiceTest, VerifyLogin_Totp_CreatesMfaVerifiedSession) {
    auto secret = env_.enableMfa("user-1");
    auto token = challengeToken();

    auto result = env_.mfaService->verifyLogin(token, env_.currentCode(secret), env_.client);

    EXPECT_EQ(result.user.id, "user-1");
    EXPECT_TRUE(env_.sessionRepo->findById(result.sessionId)->mfaVerified);
    EXPECT_EQ(env_.auditLog->count(application::audit::kLoginMfaSuccess), 1);
    EXPECT_EQ(env_.events->count(application::events::kUserLoggedInWithMfa), 1);
}

TEST_F(MfaServiceTest, VerifyLogin_BackupCode_IsSingleUse) {
    env_.enableMfa("user-1", {"A1B2C3D4", "0F0F0F0F"});

    auto result = env_.mfaService->verifyLogin(challengeToken(), "a1b2-c3d4", env_.client);
    EXPECT_FALSE(result.sessionId.empty());
    EXPECT_EQ(env_.auditLog->count(application::audit::kMfaBackupCodeUsed), 1);
    EXPECT_EQ(env_.userRepo->findById("user-1")->backupCodeHashes.size(), 1);

    EXPECT_EQ(errorOf([&] { env_.mfaService->verifyLogin(challengeToken(), "A1B2C3D4", env_.client); }),
              AuthErrorCode::InvalidMfaCode);
}

TEST_F(MfaServiceTest, VerifyLogin_AccessTokenInsteadOfChallenge_InvalidToken) {
    auto login = std::get<domain::AuthResult>(
        env_.authService->login("a@x.com", kTestPassword, env_.client));
    auto secret = env_.enableMfa("user-1");

    EXPECT_EQ(errorOf([&] {
        env_.mfaService->verifyLogin(login.accessToken, env_.currentCode(secret), env_.client);
    }), AuthErrorCode::InvalidToken);
    EXPECT_EQ(env_.auditLog->count(application::audit::kMfaLoginInvalidTempToken), 1);
}

TEST_F(MfaServiceTest, VerifyLogin_MfaDisabledAfterChallenge_MfaNotEnabled) {
    env_.enableMfa("user-1");
    auto token = challengeToken();
    env_.userRepo->disableMfa("user-1");

    EXPECT_EQ(errorOf([&] { env_.mfaService->verifyLogin(token, "123456", env_.client); }),
              AuthErrorCode::MfaNotEnabled);
}

TEST_F(MfaServiceTest, VerifyLogin_RepeatedFailures_RateLimitedIndependentlyOfPassword) {
    auto secret = env_.enableMfa("user-1");
    auto token = challengeToken();

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(errorOf([&] { env_.mfaService->verifyLogin(token, wrongCode(secret), env_.client); }),
                  AuthErrorCode::InvalidMfaCode);
    }

    EXPECT_EQ(errorOf([&] {
        env_.mfaService->verifyLogin(token, env_.currentCode(secret), env_.client);
    }), AuthErrorCode::AccountLocked);
    EXPECT_EQ(env_.auditLog->count(application::audit::kMfaRateLimited), 1);

    auto user = env_.userRepo->findById("user-1");
    EXPECT_EQ(user->failedLoginAttempts, 0);
    EXPECT_FALSE(user->lockedUntil.has_value());
    EXPECT_TRUE(std::holds_alternative<domain::MfaRequired>(
        env_.authService->login("a@x.com", kTestPassword, env_.client)));
}

TEST_F(MfaServiceTest, VerifyLogin_SuccessResetsMfaFailures) {
    auto secret = env_.enableMfa("user-1");
    auto token = challengeToken();

    EXPECT_THROW(env_.mfaService->verifyLogin(token, wrongCode(secret), env_.client), AuthException);
    EXPECT_EQ(env_.userRepo->findById("user-1")->failedMfaAttempts, 1);

    env_.mfaService->verifyLogin(token, env_.currentCode(secret), env_.client);
    EXPECT_EQ(env_.userRepo->findById("user-1")->failedMfaAttempts, 0);
}

// ============================================
// DISABLE TESTS
// ============================================

TEST_F(MfaServiceTest, Disable_ValidCode_ClearsMfa) {
    auto secret = env_.enableMfa("user-1", {"A1B2C3D4"});

    env_.mfaService->disable("user-1", env_.currentCode(secret), "device lost", env_.client);

    auto user = env_.userRepo->findById("user-1");
    EXPECT_FALSE(user->mfaEnabled);
    EXPECT_FALSE(user->mfaSecret.has_value());
    EXPECT_TRUE(user->backupCodeHashes.empty());
    EXPECT_EQ(env_.events->count(application::events::kUserMfaDisabled), 1);
    EXPECT_TRUE(std::holds_alternative<domain::AuthResult>(
        env_.authService->login("a@x.com", kTestPassword, env_.client)));
}

TEST_F(MfaServiceTest, Disable_WithBackupCode_Succeeds) {
    env_.enableMfa("user-1", {"A1B2C3D4"});

    env_.mfaService->disable("user-1", "A1B2C3D4", "", env_.client);

    EXPECT_FALSE(env_.userRepo->findById("user-1")->mfaEnabled);
}

TEST_F(MfaServiceTest, Disable_WrongCode_KeepsMfa) {
    auto secret = env_.enableMfa("user-1");

    EXPECT_EQ(errorOf([&] { env_.mfaService->disable("user-1", wrongCode(secret), "", env_.client); }),
              AuthErrorCode::InvalidMfaCode);
    EXPECT_TRUE(env_.userRepo->findById("user-1")->mfaEnabled);
    EXPECT_EQ(env_.auditLog->count(application::audit::kMfaDisableFailed), 1);
}

TEST_F(MfaServiceTest, Disable_NotEnabled_MfaNotEnabled) {
    EXPECT_EQ(errorOf([&] { env_.mfaService->disable("user-1", "123456", "", env_.client); }),
              AuthErrorCode::MfaNotEnabled);
}
