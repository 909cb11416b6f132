#pragma once

#include <string>
#include <chrono>

namespace clinic::ports::output {

/**
 * @brief TOTP (RFC 6238)
 */
class IOtpProvider {
public:
    virtual ~IOtpProvider() = default;

    /// Новый случайный секрет в base32
    virtual std::string generateSecret() = 0;

    virtual std::string generateCode(
        const std::string& secret,
        std::chrono::system_clock::time_point at
    ) = 0;

    /**
     * @brief Проверить код с допуском ±window шагов
     */
    virtual bool verify(
        const std::string& secret,
        const std::string& code,
        std::chrono::system_clock::time_point at,
        int window
    ) = 0;

    /// otpauth:// URI для приложения-аутентификатора
    virtual std::string buildUri(
        const std::string& secret,
        const std::string& accountName,
        const std::string& issuer
    ) = 0;
};

} // namespace clinic::ports::output
