#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace clinic::adapters::secondary {

/**
 * @brief Подключение к PostgreSQL
 *
 * AUTH_DATABASE_URL (postgresql://...) имеет приоритет над
 * AUTH_DB_HOST / AUTH_DB_PORT / AUTH_DB_NAME / AUTH_DB_USER / AUTH_DB_PASSWORD.
 */
class DbSettings {
public:
    struct Options {
        std::string url;
        std::string host = "localhost";
        int port = 5432;
        std::string name = "clinic";
        std::string user = "clinic_auth";
        std::string password;
        int connectTimeoutSeconds = 5;
    };

    DbSettings() {
        options_.connectTimeoutSeconds = std::stoi(getEnvOrDefault("AUTH_DB_CONNECT_TIMEOUT", "5"));
        if (const char* url = std::getenv("AUTH_DATABASE_URL")) {
            options_.url = url;
            return;
        }
        options_.host = getEnvOrDefault("AUTH_DB_HOST", options_.host);
        options_.port = std::stoi(getEnvOrDefault("AUTH_DB_PORT", "5432"));
        options_.name = getEnvOrDefault("AUTH_DB_NAME", options_.name);
        options_.user = getEnvOrDefault("AUTH_DB_USER", options_.user);

        const char* password = std::getenv("AUTH_DB_PASSWORD");
        if (!password) {
            throw std::runtime_error("AUTH_DATABASE_URL or AUTH_DB_PASSWORD must be set");
        }
        options_.password = password;
    }

    explicit DbSettings(Options options) : options_(std::move(options)) {}

    /**
     * @brief Строка для pqxx::connection (URI или key=value)
     */
    std::string getConnectionString() const {
        if (!options_.url.empty()) {
            return options_.url;
        }
        return "host=" + options_.host +
               " port=" + std::to_string(options_.port) +
               " dbname=" + options_.name +
               " user=" + options_.user +
               " password=" + options_.password +
               " connect_timeout=" + std::to_string(options_.connectTimeoutSeconds) +
               " application_name=clinic-auth";
    }

    /**
     * @brief Адрес БД для логов, без пароля
     */
    std::string describe() const {
        if (options_.url.empty()) {
            return options_.host + ":" + std::to_string(options_.port) + "/" + options_.name;
        }
        auto scheme = options_.url.find("://");
        auto at = options_.url.rfind('@');
        if (scheme == std::string::npos || at == std::string::npos || at < scheme) {
            return options_.url;
        }
        return options_.url.substr(0, scheme + 3) + options_.url.substr(at + 1);
    }

private:
    Options options_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }
};

} // namespace clinic::adapters::secondary
