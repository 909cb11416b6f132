#pragma once

#include "ports/output/IUserRepository.hpp"
#include "adapters/secondary/AuthSettings.hpp"
#include <memory>
#include <chrono>
#include <iostream>

namespace clinic::application {

/**
 * @brief Область действия счётчика неудачных попыток
 *
 * Неверные MFA коды считаются отдельно и не расходуют
 * лимит попыток пароля.
 */
enum class LockoutScope {
    Password,
    Mfa
};

/**
 * @brief Блокировка учётной записи после серии неудачных попыток
 *
 * После threshold неудач подряд выставляется блокировка на окно
 * из настроек. Пока она действует, проверка не выполняется вовсе.
 * Успешная проверка сбрасывает счётчик и блокировку.
 */
class AccountLockoutGuard {
public:
    AccountLockoutGuard(
        std::shared_ptr<adapters::secondary::AuthSettings> settings,
        std::shared_ptr<ports::output::IUserRepository> userRepo
    ) : settings_(std::move(settings))
      , userRepo_(std::move(userRepo))
    {}

    bool isLocked(const domain::User& user, LockoutScope scope) const {
        auto now = std::chrono::system_clock::now();
        return scope == LockoutScope::Password ? user.isLocked(now) : user.isMfaLocked(now);
    }

    /**
     * @brief Зафиксировать неудачную попытку
     *
     * @return true, если эта попытка привела к блокировке
     */
    bool recordFailure(const std::string& userId, LockoutScope scope) {
        int threshold;
        int attempts;
        if (scope == LockoutScope::Password) {
            threshold = settings_->getMaxFailedLogins();
            attempts = userRepo_->incrementFailedLoginAttempts(
                userId, threshold, settings_->getLockoutWindow());
        } else {
            threshold = settings_->getMaxFailedMfa();
            attempts = userRepo_->incrementFailedMfaAttempts(
                userId, threshold, settings_->getMfaLockoutWindow());
        }

        bool locked = attempts >= threshold;
        if (locked) {
            std::cout << "[AccountLockoutGuard] " << scopeName(scope)
                      << " lock engaged for user " << userId << std::endl;
        }
        return locked;
    }

    /**
     * @brief Сбросить счётчик и блокировку после успешной проверки
     *
     * Сброс выполняется всегда: снимок пользователя мог устареть
     * из-за параллельных неудач.
     */
    void recordSuccess(const std::string& userId, LockoutScope scope) {
        if (scope == LockoutScope::Password) {
            userRepo_->resetFailedLoginAttempts(userId);
        } else {
            userRepo_->resetFailedMfaAttempts(userId);
        }
    }

private:
    std::shared_ptr<adapters::secondary::AuthSettings> settings_;
    std::shared_ptr<ports::output::IUserRepository> userRepo_;

    static const char* scopeName(LockoutScope scope) {
        return scope == LockoutScope::Password ? "password" : "mfa";
    }
};

} // namespace clinic::application
