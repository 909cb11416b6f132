#pragma once

#include "domain/User.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace clinic::ports::output {

/**
 * @brief Хранилище учётных данных пользователей
 *
 * Счётчики неудачных попыток меняются атомарно в хранилище,
 * без чтения-изменения-записи на стороне приложения.
 */
class IUserRepository {
public:
    virtual ~IUserRepository() = default;

    virtual domain::User save(const domain::User& user) = 0;
    virtual std::optional<domain::User> findById(const std::string& userId) = 0;

    /**
     * @brief Поиск по email (ожидается уже в нижнем регистре)
     */
    virtual std::optional<domain::User> findByEmail(const std::string& email) = 0;

    /**
     * @brief Атомарно увеличить счётчик неудачных входов
     *
     * Если предыдущая блокировка уже истекла, счёт начинается заново.
     * При достижении threshold выставляется lockedUntil = now + lockout.
     *
     * @return Новое значение счётчика
     */
    virtual int incrementFailedLoginAttempts(
        const std::string& userId,
        int threshold,
        std::chrono::seconds lockout
    ) = 0;

    /// Сбросить счётчик и снять блокировку
    virtual void resetFailedLoginAttempts(const std::string& userId) = 0;

    /// То же, что incrementFailedLoginAttempts, но для MFA кодов
    virtual int incrementFailedMfaAttempts(
        const std::string& userId,
        int threshold,
        std::chrono::seconds lockout
    ) = 0;

    virtual void resetFailedMfaAttempts(const std::string& userId) = 0;

    virtual void updateLastLogin(
        const std::string& userId,
        std::chrono::system_clock::time_point at
    ) = 0;

    virtual void updatePasswordHash(const std::string& userId, const std::string& passwordHash) = 0;

    /**
     * @brief Сохранить новый (ожидающий подтверждения) секрет и backup-коды
     *
     * Перезаписывает предыдущее pending-состояние.
     */
    virtual void storePendingMfa(
        const std::string& userId,
        const std::string& secret,
        const std::vector<std::string>& backupCodeHashes
    ) = 0;

    /**
     * @brief Включить MFA, если pending-секрет всё ещё равен expectedSecret
     *
     * @return false, если секрет успели заменить или MFA уже включена
     */
    virtual bool enableMfa(const std::string& userId, const std::string& expectedSecret) = 0;

    /// Выключить MFA и стереть секрет и backup-коды
    virtual void disableMfa(const std::string& userId) = 0;

    /**
     * @brief Атомарно удалить backup-код из набора
     *
     * @return true, если код был в наборе (и теперь удалён)
     */
    virtual bool consumeBackupCode(const std::string& userId, const std::string& codeHash) = 0;
};

} // namespace clinic::ports::output
