#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/PasswordPolicy.hpp"

using namespace clinic;
using ::testing::Contains;
using ::testing::HasSubstr;

class PasswordPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        user_ = domain::User("user-1", "anna.smith@clinic.org", "Anna", "Smith", "hash");
        user_.employeeId = "E-1001";
    }

    std::vector<std::string> validate(const std::string& password) {
        return policy_.validate(password, user_);
    }

    application::PasswordPolicy policy_;
    domain::User user_;
};

TEST_F(PasswordPolicyTest, StrongPassword_NoViolations) {
    EXPECT_TRUE(validate("Vx7&kLp2#qRz").empty());
}

TEST_F(PasswordPolicyTest, TooShort) {
    EXPECT_THAT(validate("Vx7&kLp2"), Contains(HasSubstr("at least 12")));
}

TEST_F(PasswordPolicyTest, MissingCharacterClasses) {
    auto errors = validate("abcdefghijkl");

    EXPECT_THAT(errors, Contains(HasSubstr("uppercase")));
    EXPECT_THAT(errors, Contains(HasSubstr("digit")));
    EXPECT_THAT(errors, Contains(HasSubstr("special")));
}

TEST_F(PasswordPolicyTest, RepeatedCharacters) {
    EXPECT_THAT(validate("Vx7&kLppp2#qRz"), Contains(HasSubstr("repeat")));
}

TEST_F(PasswordPolicyTest, ContainsPersonalInformation) {
    EXPECT_THAT(validate("Qw3rty!Smith9"), Contains(HasSubstr("personal")));
    EXPECT_THAT(validate("Qw3rty!ANNA.x"), Contains(HasSubstr("personal")));
    EXPECT_THAT(validate("Qw3rty!e-1001x"), Contains(HasSubstr("personal")));
}

TEST_F(PasswordPolicyTest, ShortNamesIgnored) {
    domain::User user("user-2", "a@x.com", "Li", "Wu", "hash");

    EXPECT_TRUE(policy_.validate("P@ssw0rd123!", user).empty());
}
