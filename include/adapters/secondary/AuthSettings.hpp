#pragma once

#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace clinic::adapters::secondary {

/**
 * @brief Настройки аутентификации из ENV
 *
 * Длительности задаются как "<n>s|m|h|d" (например, "15m", "7d").
 * Для тестов есть конструктор с явными Options.
 */
class AuthSettings {
public:
    struct Options {
        std::string jwtSecret;
        std::string jwtRefreshSecret;
        std::chrono::seconds accessTokenTtl{15 * 60};
        std::chrono::seconds refreshTokenTtl{7 * 24 * 3600};
        std::chrono::seconds mfaChallengeTtl{10 * 60};
        std::chrono::seconds mfaSetupTtl{15 * 60};
        int maxFailedLogins = 5;
        std::chrono::seconds lockoutWindow{15 * 60};
        int maxFailedMfa = 5;
        std::chrono::seconds mfaLockoutWindow{15 * 60};
        std::set<std::string> mfaRequiredRoles{"ADMIN", "DOCTOR", "NURSE", "SURGEON"};
        int totpWindow = 1;
        int backupCodeCount = 10;
        std::string mfaIssuer = "Clinic EHR";
        int passwordHashIterations = 210000;
        int passwordHistoryDepth = 5;
        bool cookieSecure = true;
    };

    AuthSettings() {
        options_.jwtSecret = getEnvOrThrow("AUTH_JWT_SECRET");
        options_.jwtRefreshSecret = getEnvOrDefault("AUTH_JWT_REFRESH_SECRET", options_.jwtSecret);
        options_.accessTokenTtl = parseDuration(getEnvOrDefault("AUTH_JWT_EXPIRES_IN", "15m"));
        options_.refreshTokenTtl = parseDuration(getEnvOrDefault("AUTH_JWT_REFRESH_EXPIRES_IN", "7d"));
        options_.mfaChallengeTtl = parseDuration(getEnvOrDefault("AUTH_MFA_CHALLENGE_TTL", "10m"));
        options_.mfaSetupTtl = parseDuration(getEnvOrDefault("AUTH_MFA_SETUP_TTL", "15m"));
        options_.maxFailedLogins = std::stoi(getEnvOrDefault("AUTH_MAX_FAILED_LOGINS", "5"));
        options_.lockoutWindow = parseDuration(getEnvOrDefault("AUTH_LOCKOUT_WINDOW", "15m"));
        options_.maxFailedMfa = std::stoi(getEnvOrDefault("AUTH_MAX_FAILED_MFA", "5"));
        options_.mfaLockoutWindow = parseDuration(getEnvOrDefault("AUTH_MFA_LOCKOUT_WINDOW", "15m"));
        options_.mfaRequiredRoles = parseList(
            getEnvOrDefault("AUTH_MFA_REQUIRED_ROLES", "ADMIN,DOCTOR,NURSE,SURGEON"));
        options_.totpWindow = std::stoi(getEnvOrDefault("AUTH_TOTP_WINDOW", "1"));
        options_.backupCodeCount = std::stoi(getEnvOrDefault("AUTH_BACKUP_CODE_COUNT", "10"));
        options_.mfaIssuer = getEnvOrDefault("AUTH_MFA_ISSUER", "Clinic EHR");
        options_.passwordHashIterations = std::stoi(getEnvOrDefault("AUTH_PASSWORD_HASH_ITERATIONS", "210000"));
        options_.passwordHistoryDepth = std::stoi(getEnvOrDefault("AUTH_PASSWORD_HISTORY_DEPTH", "5"));
        options_.cookieSecure = getEnvOrDefault("AUTH_COOKIE_SECURE", "true") != "false";

        if (options_.maxFailedLogins < 1 || options_.maxFailedMfa < 1) {
            throw std::runtime_error("Lockout thresholds must be positive");
        }
    }

    explicit AuthSettings(Options options) : options_(std::move(options)) {
        if (options_.jwtRefreshSecret.empty()) {
            options_.jwtRefreshSecret = options_.jwtSecret;
        }
    }

    const std::string& getJwtSecret() const { return options_.jwtSecret; }
    const std::string& getJwtRefreshSecret() const { return options_.jwtRefreshSecret; }
    std::chrono::seconds getAccessTokenTtl() const { return options_.accessTokenTtl; }
    std::chrono::seconds getRefreshTokenTtl() const { return options_.refreshTokenTtl; }
    std::chrono::seconds getMfaChallengeTtl() const { return options_.mfaChallengeTtl; }
    std::chrono::seconds getMfaSetupTtl() const { return options_.mfaSetupTtl; }
    int getMaxFailedLogins() const { return options_.maxFailedLogins; }
    std::chrono::seconds getLockoutWindow() const { return options_.lockoutWindow; }
    int getMaxFailedMfa() const { return options_.maxFailedMfa; }
    std::chrono::seconds getMfaLockoutWindow() const { return options_.mfaLockoutWindow; }
    const std::set<std::string>& getMfaRequiredRoles() const { return options_.mfaRequiredRoles; }
    int getTotpWindow() const { return options_.totpWindow; }
    int getBackupCodeCount() const { return options_.backupCodeCount; }
    const std::string& getMfaIssuer() const { return options_.mfaIssuer; }
    int getPasswordHashIterations() const { return options_.passwordHashIterations; }
    int getPasswordHistoryDepth() const { return options_.passwordHistoryDepth; }
    bool isCookieSecure() const { return options_.cookieSecure; }

    /**
     * @brief Разобрать длительность вида "900", "30s", "15m", "12h", "7d"
     *
     * @throws std::invalid_argument при неверном формате
     */
    static std::chrono::seconds parseDuration(const std::string& value) {
        if (value.empty()) {
            throw std::invalid_argument("Empty duration");
        }
        size_t pos = 0;
        long long amount = 0;
        try {
            amount = std::stoll(value, &pos);
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid duration: " + value);
        }
        if (amount < 0) {
            throw std::invalid_argument("Negative duration: " + value);
        }

        std::string unit = value.substr(pos);
        if (unit.empty() || unit == "s") return std::chrono::seconds(amount);
        if (unit == "m") return std::chrono::seconds(amount * 60);
        if (unit == "h") return std::chrono::seconds(amount * 3600);
        if (unit == "d") return std::chrono::seconds(amount * 86400);
        throw std::invalid_argument("Invalid duration unit: " + value);
    }

private:
    Options options_;

    static std::set<std::string> parseList(const std::string& value) {
        std::set<std::string> items;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item.erase(std::remove_if(item.begin(), item.end(),
                [](unsigned char c) { return std::isspace(c); }), item.end());
            if (!item.empty()) {
                items.insert(item);
            }
        }
        return items;
    }

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static std::string getEnvOrThrow(const char* name) {
        const char* value = std::getenv(name);
        if (!value) {
            throw std::runtime_error(std::string("Required env variable not set: ") + name);
        }
        return value;
    }
};

} // namespace clinic::adapters::secondary
