#include <gtest/gtest.h>

#include "application/AccountLockoutGuard.hpp"
#include "adapters/secondary/AuthSettings.hpp"
#include "mocks/InMemoryUserRepository.hpp"

using namespace clinic;
using namespace clinic::tests::mocks;
using clinic::application::LockoutScope;

class AccountLockoutGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        adapters::secondary::AuthSettings::Options options;
        options.jwtSecret = "secret";
        options.maxFailedLogins = 3;
        options.maxFailedMfa = 2;
        settings_ = std::make_shared<adapters::secondary::AuthSettings>(options);
        userRepo_ = std::make_shared<InMemoryUserRepository>();
        guard_ = std::make_shared<application::AccountLockoutGuard>(settings_, userRepo_);

        userRepo_->save(domain::User("user-1", "a@x.com", "Anna", "Smith", "hash"));
    }

    void TearDown() override {
        userRepo_->clear();
    }

    domain::User reload() {
        return *userRepo_->findById("user-1");
    }

    std::shared_ptr<adapters::secondary::AuthSettings> settings_;
    std::shared_ptr<InMemoryUserRepository> userRepo_;
    std::shared_ptr<application::AccountLockoutGuard> guard_;
};

TEST_F(AccountLockoutGuardTest, LocksAtThreshold) {
    EXPECT_FALSE(guard_->recordFailure("user-1", LockoutScope::Password));
    EXPECT_FALSE(guard_->recordFailure("user-1", LockoutScope::Password));
    EXPECT_FALSE(guard_->isLocked(reload(), LockoutScope::Password));

    EXPECT_TRUE(guard_->recordFailure("user-1", LockoutScope::Password));
    EXPECT_TRUE(guard_->isLocked(reload(), LockoutScope::Password));
}

TEST_F(AccountLockoutGuardTest, LockWindowLengthFromSettings) {
    for (int i = 0; i < 3; ++i) {
        guard_->recordFailure("user-1", LockoutScope::Password);
    }

    auto lockedUntil = *reload().lockedUntil;
    auto expected = std::chrono::system_clock::now() + std::chrono::minutes(15);
    EXPECT_LE(lockedUntil, expected);
    EXPECT_GT(lockedUntil, expected - std::chrono::seconds(5));
}

TEST_F(AccountLockoutGuardTest, ExpiredLock_CounterRestartsAtOne) {
    for (int i = 0; i < 3; ++i) {
        guard_->recordFailure("user-1", LockoutScope::Password);
    }
    userRepo_->expireLocks("user-1");
    EXPECT_FALSE(guard_->isLocked(reload(), LockoutScope::Password));

    EXPECT_FALSE(guard_->recordFailure("user-1", LockoutScope::Password));

    auto user = reload();
    EXPECT_EQ(user.failedLoginAttempts, 1);
    EXPECT_FALSE(user.lockedUntil.has_value());
}

TEST_F(AccountLockoutGuardTest, RecordSuccess_ResetsCounter) {
    guard_->recordFailure("user-1", LockoutScope::Password);

    guard_->recordSuccess("user-1", LockoutScope::Password);

    EXPECT_EQ(reload().failedLoginAttempts, 0);
}

TEST_F(AccountLockoutGuardTest, RecordSuccess_ResetsFailuresAfterStaleRead) {
    auto snapshot = reload();
    EXPECT_EQ(snapshot.failedLoginAttempts, 0);

    guard_->recordFailure("user-1", LockoutScope::Password);
    guard_->recordFailure("user-1", LockoutScope::Password);

    guard_->recordSuccess(snapshot.userId, LockoutScope::Password);

    auto user = reload();
    EXPECT_EQ(user.failedLoginAttempts, 0);
    EXPECT_FALSE(user.lockedUntil.has_value());
}

TEST_F(AccountLockoutGuardTest, RecordSuccess_ClearsLockEngagedAfterStaleRead) {
    auto snapshot = reload();
    for (int i = 0; i < 3; ++i) {
        guard_->recordFailure("user-1", LockoutScope::Password);
    }
    ASSERT_TRUE(reload().lockedUntil.has_value());

    guard_->recordSuccess(snapshot.userId, LockoutScope::Password);

    EXPECT_FALSE(guard_->isLocked(reload(), LockoutScope::Password));
}

TEST_F(AccountLockoutGuardTest, MfaScope_IndependentFromPassword) {
    EXPECT_FALSE(guard_->recordFailure("user-1", LockoutScope::Mfa));
    EXPECT_TRUE(guard_->recordFailure("user-1", LockoutScope::Mfa));

    auto user = reload();
    EXPECT_TRUE(guard_->isLocked(user, LockoutScope::Mfa));
    EXPECT_FALSE(guard_->isLocked(user, LockoutScope::Password));
    EXPECT_EQ(user.failedLoginAttempts, 0);

    guard_->recordSuccess("user-1", LockoutScope::Mfa);
    EXPECT_FALSE(guard_->isLocked(reload(), LockoutScope::Mfa));
}
