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

class AuthServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        env_.addUser("user-1", "a@x.com");
    }

    void TearDown() override {
        env_.userRepo->clear();
        env_.sessionRepo->clear();
        env_.roleRepo->clear();
    }

    domain::AuthResult loginComplete(const std::string& email = "a@x.com") {
        auto outcome = env_.authService->login(email, kTestPassword, env_.client);
        return std::get<domain::AuthResult>(outcome);
    }

    AuthErrorCode loginError(const std::string& email, const std::string& password) {
        try {
            env_.authService->login(email, password, env_.client);
        } catch (const AuthException& e) {
            return e.code();
        }
        ADD_FAILURE() << "login did not fail";
        return AuthErrorCode::InvalidToken;
    }

    AuthTestEnvironment env_;
};

// ============================================
// LOGIN TESTS
// ============================================

TEST_F(AuthServiceTest, Login_Success_CreatesSession) {
    auto result = loginComplete();

    EXPECT_EQ(result.user.id, "user-1");
    EXPECT_EQ(result.user.email, "a@x.com");
    EXPECT_FALSE(result.accessToken.empty());
    EXPECT_FALSE(result.refreshToken.empty());
    EXPECT_EQ(result.expiresIn, std::chrono::seconds(900));
    EXPECT_EQ(env_.sessionRepo->size(), 1);

    auto session = env_.sessionRepo->findById(result.sessionId);
    ASSERT_TRUE(session.has_value());
    EXPECT_FALSE(session->mfaVerified);
    EXPECT_EQ(session->ipAddress, "10.0.0.1");
    EXPECT_EQ(session->refreshTokenHash, env_.tokenProvider->fingerprint(result.refreshToken));

    auto user = env_.userRepo->findById("user-1");
    EXPECT_TRUE(user->lastLoginAt.has_value());
    EXPECT_EQ(env_.auditLog->count(application::audit::kLogin), 1);
    EXPECT_EQ(env_.events->count(application::events::kUserLoggedIn), 1);
}

TEST_F(AuthServiceTest, Login_EmailIsCaseInsensitive) {
    auto result = loginComplete("  A@X.COM ");
    EXPECT_EQ(result.user.id, "user-1");
}

TEST_F(AuthServiceTest, Login_UnknownEmail_InvalidCredentials) {
    EXPECT_EQ(loginError("nobody@x.com", kTestPassword), AuthErrorCode::InvalidCredentials);
    EXPECT_EQ(env_.auditLog->count(application::audit::kLoginFailed), 1);
}

TEST_F(AuthServiceTest, Login_InactiveUser_SameErrorAsUnknown) {
    auto user = *env_.userRepo->findById("user-1");
    user.isActive = false;
    env_.userRepo->save(user);

    EXPECT_EQ(loginError("a@x.com", kTestPassword), AuthErrorCode::InvalidCredentials);
    EXPECT_EQ(env_.sessionRepo->size(), 0);
}

TEST_F(AuthServiceTest, Login_WrongPassword_IncrementsCounter) {
    EXPECT_EQ(loginError("a@x.com", "wrong-password"), AuthErrorCode::InvalidCredentials);

    auto user = env_.userRepo->findById("user-1");
    EXPECT_EQ(user->failedLoginAttempts, 1);
    EXPECT_FALSE(user->lockedUntil.has_value());
}

TEST_F(AuthServiceTest, Login_FiveFailures_SixthAttemptLockedEvenWithCorrectPassword) {
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(loginError("a@x.com", "wrong-password"), AuthErrorCode::InvalidCredentials);
    }

    EXPECT_EQ(loginError("a@x.com", kTestPassword), AuthErrorCode::AccountLocked);
    EXPECT_EQ(env_.sessionRepo->size(), 0);
}

TEST_F(AuthServiceTest, Login_LockedAccount_DoesNotCountFurtherAttempts) {
    for (int i = 0; i < 5; ++i) {
        loginError("a@x.com", "wrong-password");
    }
    loginError("a@x.com", "wrong-password");

    EXPECT_EQ(env_.userRepo->findById("user-1")->failedLoginAttempts, 5);
}

TEST_F(AuthServiceTest, Login_AfterLockExpires_SucceedsAndResetsCounter) {
    for (int i = 0; i < 5; ++i) {
        loginError("a@x.com", "wrong-password");
    }
    env_.userRepo->expireLocks("user-1");

    auto result = loginComplete();
    EXPECT_FALSE(result.sessionId.empty());

    auto user = env_.userRepo->findById("user-1");
    EXPECT_EQ(user->failedLoginAttempts, 0);
    EXPECT_FALSE(user->lockedUntil.has_value());
}

TEST_F(AuthServiceTest, Login_SuccessResetsFailedAttempts) {
    loginError("a@x.com", "wrong-password");
    loginError("a@x.com", "wrong-password");

    loginComplete();
    EXPECT_EQ(env_.userRepo->findById("user-1")->failedLoginAttempts, 0);
}

TEST_F(AuthServiceTest, Login_MfaRequiredRoleWithoutMfa_ReturnsSetupRequired) {
    env_.addUser("doc-1", "doc@x.com", {"DOCTOR"});

    auto outcome = env_.authService->login("doc@x.com", kTestPassword, env_.client);

    ASSERT_TRUE(std::holds_alternative<domain::MfaSetupRequired>(outcome));
    EXPECT_EQ(env_.sessionRepo->size(), 0);

    auto token = std::get<domain::MfaSetupRequired>(outcome).tempToken;
    auto verification = env_.tokenProvider->verify(token, {TokenType::MFA_SETUP});
    EXPECT_TRUE(verification.valid());
}

TEST_F(AuthServiceTest, Login_MfaEnabled_ReturnsChallenge) {
    env_.enableMfa("user-1");

    auto outcome = env_.authService->login("a@x.com", kTestPassword, env_.client);

    ASSERT_TRUE(std::holds_alternative<domain::MfaRequired>(outcome));
    EXPECT_EQ(env_.sessionRepo->size(), 0);

    auto token = std::get<domain::MfaRequired>(outcome).tempToken;
    EXPECT_TRUE(env_.tokenProvider->verify(token, {TokenType::MFA_CHALLENGE}).valid());
}

TEST_F(AuthServiceTest, Login_RolesAndPermissionsInSummary) {
    env_.roleRepo->grant("user-1", "RECEPTION", {"appointments:*:write", "patients:*:read"});

    auto result = loginComplete();

    EXPECT_THAT(result.user.roles, ::testing::ElementsAre("RECEPTION"));
    EXPECT_THAT(result.user.permissions,
                ::testing::UnorderedElementsAre("appointments:*:write", "patients:*:read"));
}

TEST_F(AuthServiceTest, Login_TwiceCreatesIndependentSessions) {
    auto first = loginComplete();
    auto second = loginComplete();

    EXPECT_NE(first.sessionId, second.sessionId);
    EXPECT_EQ(env_.sessionRepo->size(), 2);
}

// ============================================
// REFRESH TESTS
// ============================================

TEST_F(AuthServiceTest, Refresh_Success) {
    auto login = loginComplete();

    auto result = env_.authService->refresh(login.refreshToken, env_.client);

    EXPECT_EQ(result.sessionId, login.sessionId);
    EXPECT_FALSE(result.accessToken.empty());
    EXPECT_EQ(result.user.id, "user-1");
    EXPECT_EQ(env_.auditLog->count(application::audit::kTokenRefresh), 1);

    auto identity = env_.authService->authenticate(result.accessToken, {TokenType::ACCESS});
    EXPECT_EQ(identity.sessionId, login.sessionId);
}

TEST_F(AuthServiceTest, Refresh_WithAccessToken_InvalidToken) {
    auto login = loginComplete();

    try {
        env_.authService->refresh(login.accessToken, env_.client);
        FAIL() << "access token accepted as refresh token";
    } catch (const AuthException& e) {
        EXPECT_EQ(e.code(), AuthErrorCode::InvalidToken);
    }
}

TEST_F(AuthServiceTest, Refresh_AfterLogout_SessionRevokedOrExpired) {
    auto login = loginComplete();
    auto identity = env_.authService->authenticate(login.accessToken, {TokenType::ACCESS});
    env_.authService->logout(identity, "", env_.client);

    try {
        env_.authService->refresh(login.refreshToken, env_.client);
        FAIL() << "refresh succeeded after logout";
    } catch (const AuthException& e) {
        EXPECT_EQ(e.code(), AuthErrorCode::SessionRevokedOrExpired);
    }
}

TEST_F(AuthServiceTest, Refresh_ExpiredSession_SessionRevokedOrExpired) {
    auto login = loginComplete();
    env_.sessionRepo->expire(login.sessionId);

    EXPECT_THROW(env_.authService->refresh(login.refreshToken, env_.client), AuthException);
}

TEST_F(AuthServiceTest, Refresh_DeactivatedUser_SessionRevokedOrExpired) {
    auto login = loginComplete();
    auto user = *env_.userRepo->findById("user-1");
    user.isActive = false;
    env_.userRepo->save(user);

    try {
        env_.authService->refresh(login.refreshToken, env_.client);
        FAIL() << "refresh succeeded for inactive user";
    } catch (const AuthException& e) {
        EXPECT_EQ(e.code(), AuthErrorCode::SessionRevokedOrExpired);
    }
}

// ============================================
// AUTHENTICATE TESTS
// ============================================

TEST_F(AuthServiceTest, Authenticate_AccessToken_ResolvesPermissionsFromStore) {
    auto login = loginComplete();

    // Роль выдана после входа: токен её не содержит, идентичность содержит
    env_.roleRepo->grant("user-1", "NURSE", {"vitals:*:write"});

    auto identity = env_.authService->authenticate(login.accessToken, {TokenType::ACCESS});

    EXPECT_EQ(identity.userId, "user-1");
    EXPECT_EQ(identity.tokenType, TokenType::ACCESS);
    EXPECT_TRUE(identity.hasSession());
    EXPECT_EQ(identity.access.roles.count("NURSE"), 1);
    EXPECT_EQ(identity.access.permissions.count("vitals:*:write"), 1);
}

TEST_F(AuthServiceTest, Authenticate_RevokedSession_Rejected) {
    auto login = loginComplete();
    env_.sessionRepo->revoke(login.sessionId, "admin", "test");

    try {
        env_.authService->authenticate(login.accessToken, {TokenType::ACCESS});
        FAIL() << "revoked session authorized a request";
    } catch (const AuthException& e) {
        EXPECT_EQ(e.code(), AuthErrorCode::SessionRevokedOrExpired);
    }
}

TEST_F(AuthServiceTest, Authenticate_SetupTokenWhereAccessRequired_InvalidToken) {
    env_.addUser("doc-1", "doc@x.com", {"DOCTOR"});
    auto outcome = env_.authService->login("doc@x.com", kTestPassword, env_.client);
    auto token = std::get<domain::MfaSetupRequired>(outcome).tempToken;

    try {
        env_.authService->authenticate(token, {TokenType::ACCESS});
        FAIL() << "mfa_setup token accepted as access token";
    } catch (const AuthException& e) {
        EXPECT_EQ(e.code(), AuthErrorCode::InvalidToken);
    }
}

TEST_F(AuthServiceTest, Authenticate_RefreshToken_Rejected) {
    auto login = loginComplete();

    EXPECT_THROW(
        env_.authService->authenticate(login.refreshToken, {TokenType::ACCESS, TokenType::REFRESH}),
        AuthException);
}

TEST_F(AuthServiceTest, Authenticate_ChallengeToken_CarriesIssuingClient) {
    env_.enableMfa("user-1");
    auto outcome = env_.authService->login("a@x.com", kTestPassword, env_.client);
    auto token = std::get<domain::MfaRequired>(outcome).tempToken;

    auto identity = env_.authService->authenticate(token, {TokenType::MFA_CHALLENGE});

    EXPECT_EQ(identity.tokenType, TokenType::MFA_CHALLENGE);
    EXPECT_FALSE(identity.hasSession());
    EXPECT_EQ(identity.tokenClient, env_.client);
}

// ============================================
// LOGOUT TESTS
// ============================================

TEST_F(AuthServiceTest, Logout_RevokesSessionWithReason) {
    auto login = loginComplete();
    auto identity = env_.authService->authenticate(login.accessToken, {TokenType::ACCESS});

    env_.authService->logout(identity, "shift ended", env_.client);

    auto session = env_.sessionRepo->findById(login.sessionId);
    ASSERT_TRUE(session->revokedAt.has_value());
    EXPECT_EQ(session->revokedBy, std::optional<std::string>("user-1"));
    EXPECT_EQ(session->revokeReason, std::optional<std::string>("shift ended"));
    EXPECT_EQ(env_.events->count(application::events::kUserLoggedOut), 1);
}

TEST_F(AuthServiceTest, Logout_ChallengeIdentity_RevokesNothing) {
    auto other = loginComplete();
    env_.enableMfa("user-1");
    auto outcome = env_.authService->login("a@x.com", kTestPassword, env_.client);
    auto identity = env_.authService->authenticate(
        std::get<domain::MfaRequired>(outcome).tempToken, {TokenType::MFA_CHALLENGE});

    env_.authService->logout(identity, "", env_.client);

    EXPECT_FALSE(env_.sessionRepo->findById(other.sessionId)->isRevoked());
    EXPECT_EQ(env_.auditLog->count(application::audit::kLogout), 1);
}

// ============================================
// CHANGE PASSWORD TESTS
// ============================================

TEST_F(AuthServiceTest, ChangePassword_RevokesAllSessions) {
    auto first = loginComplete();
    auto second = loginComplete();
    auto identity = env_.authService->authenticate(first.accessToken, {TokenType::ACCESS});

    env_.authService->changePassword(identity, kTestPassword, "N3w&Secure#Pass", env_.client);

    EXPECT_TRUE(env_.sessionRepo->findById(first.sessionId)->isRevoked());
    EXPECT_TRUE(env_.sessionRepo->findById(second.sessionId)->isRevoked());
    EXPECT_TRUE(env_.sessionRepo->findActiveByUserId("user-1").empty());
    EXPECT_EQ(env_.historyRepo->size(), 1);
    EXPECT_EQ(env_.events->count(application::events::kUserPasswordChanged), 1);

    EXPECT_THROW(env_.authService->refresh(second.refreshToken, env_.client), AuthException);

    auto outcome = env_.authService->login("a@x.com", "N3w&Secure#Pass", env_.client);
    EXPECT_TRUE(std::holds_alternative<domain::AuthResult>(outcome));
}

TEST_F(AuthServiceTest, ChangePassword_WrongCurrent_InvalidCredentials) {
    auto login = loginComplete();
    auto identity = env_.authService->authenticate(login.accessToken, {TokenType::ACCESS});

    try {
        env_.authService->changePassword(identity, "wrong-password", "N3w&Secure#Pass", env_.client);
        FAIL() << "password changed with wrong current password";
    } catch (const AuthException& e) {
        EXPECT_EQ(e.code(), AuthErrorCode::InvalidCredentials);
    }
    EXPECT_FALSE(env_.sessionRepo->findById(login.sessionId)->isRevoked());
}

TEST_F(AuthServiceTest, ChangePassword_SamePassword_PasswordReuse) {
    auto login = loginComplete();
    auto identity = env_.authService->authenticate(login.accessToken, {TokenType::ACCESS});

    try {
        env_.authService->changePassword(identity, kTestPassword, kTestPassword, env_.client);
        FAIL() << "identical password accepted";
    } catch (const AuthException& e) {
        EXPECT_EQ(e.code(), AuthErrorCode::PasswordReuse);
    }
}

TEST_F(AuthServiceTest, ChangePassword_WeakPassword_Rejected) {
    auto login = loginComplete();
    auto identity = env_.authService->authenticate(login.accessToken, {TokenType::ACCESS});

    try {
        env_.authService->changePassword(identity, kTestPassword, "short", env_.client);
        FAIL() << "weak password accepted";
    } catch (const AuthException& e) {
        EXPECT_EQ(e.code(), AuthErrorCode::WeakPassword);
    }
    EXPECT_EQ(env_.auditLog->count(application::audit::kPasswordChangeFailed), 1);
}

TEST_F(AuthServiceTest, ChangePassword_PreviousPassword_PasswordReuse) {
    auto login = loginComplete();
    auto identity = env_.authService->authenticate(login.accessToken, {TokenType::ACCESS});
    env_.authService->changePassword(identity, kTestPassword, "N3w&Secure#Pass", env_.client);

    auto relogin = std::get<domain::AuthResult>(
        env_.authService->login("a@x.com", "N3w&Secure#Pass", env_.client));
    auto newIdentity = env_.authService->authenticate(relogin.accessToken, {TokenType::ACCESS});

    try {
        env_.authService->changePassword(newIdentity, "N3w&Secure#Pass", kTestPassword, env_.client);
        FAIL() << "password from history accepted";
    } catch (const AuthException& e) {
        EXPECT_EQ(e.code(), AuthErrorCode::PasswordReuse);
    }
}

// ============================================
// ME TESTS
// ============================================

TEST_F(AuthServiceTest, Me_ReturnsProfile) {
    auto user = *env_.userRepo->findById("user-1");
    user.departmentId = "cardiology";
    user.employeeId = "E-1001";
    env_.userRepo->save(user);

    auto login = loginComplete();
    auto identity = env_.authService->authenticate(login.accessToken, {TokenType::ACCESS});

    auto summary = env_.authService->me(identity);

    EXPECT_EQ(summary.id, "user-1");
    EXPECT_EQ(summary.firstName, "Anna");
    EXPECT_EQ(summary.lastName, "Smith");
    EXPECT_EQ(summary.departmentId, std::optional<std::string>("cardiology"));
    EXPECT_EQ(summary.employeeId, std::optional<std::string>("E-1001"));
}
