#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace clinic::domain {

/**
 * @brief Пользователь клиники (сотрудник)
 *
 * Учётная запись, с которой работает подсистема аутентификации.
 * Пользователь не удаляется, а деактивируется (isActive = false).
 *
 * MFA хранится в двух состояниях:
 * - pending: секрет и backup-коды выданы, но ещё не подтверждены кодом
 * - enabled: mfaEnabled = true, секрет перенесён в mfaSecret
 */
struct User {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string userId;         ///< UUID пользователя
    std::string email;          ///< Email в нижнем регистре (логин)
    std::string firstName;
    std::string lastName;
    std::string passwordHash;   ///< Хэш пароля (pbkdf2_sha256$...)
    bool isActive = true;

    bool mfaEnabled = false;
    std::optional<std::string> mfaSecret;           ///< Base32 TOTP секрет (только при mfaEnabled)
    std::vector<std::string> backupCodeHashes;      ///< SHA-256 одноразовых кодов
    std::optional<std::string> pendingMfaSecret;    ///< Секрет, ожидающий подтверждения
    std::vector<std::string> pendingBackupCodeHashes;

    int failedLoginAttempts = 0;
    std::optional<TimePoint> lockedUntil;
    int failedMfaAttempts = 0;
    std::optional<TimePoint> mfaLockedUntil;

    std::optional<TimePoint> lastLoginAt;
    std::optional<std::string> departmentId;
    std::optional<std::string> employeeId;

    User() = default;

    User(const std::string& userId,
         const std::string& email,
         const std::string& firstName,
         const std::string& lastName,
         const std::string& passwordHash)
        : userId(userId)
        , email(email)
        , firstName(firstName)
        , lastName(lastName)
        , passwordHash(passwordHash)
    {}

    /**
     * @brief Заблокирован ли вход по паролю на момент now
     */
    bool isLocked(TimePoint now) const {
        return lockedUntil && *lockedUntil > now;
    }

    bool isMfaLocked(TimePoint now) const {
        return mfaLockedUntil && *mfaLockedUntil > now;
    }
};

} // namespace clinic::domain
