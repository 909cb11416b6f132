#pragma once

#include "ports/output/IPasswordHasher.hpp"
#include "AuthSettings.hpp"
#include "crypto/Encoding.hpp"
#include <openssl/evp.h>
#include <memory>
#include <sstream>
#include <vector>
#include <stdexcept>
#include <iostream>

namespace clinic::adapters::secondary {

/**
 * @brief PBKDF2-HMAC-SHA256 хэширование паролей (OpenSSL)
 *
 * Формат: pbkdf2_sha256$<iterations>$<salt base64>$<hash base64>
 */
class Pbkdf2PasswordHasher : public ports::output::IPasswordHasher {
public:
    static constexpr const char* kScheme = "pbkdf2_sha256";
    static constexpr size_t kSaltLength = 16;
    static constexpr size_t kKeyLength = 32;

    explicit Pbkdf2PasswordHasher(std::shared_ptr<AuthSettings> settings)
        : iterations_(settings->getPasswordHashIterations())
    {
        if (iterations_ < 1) {
            throw std::runtime_error("Password hash iterations must be positive");
        }
        std::cout << "[Pbkdf2PasswordHasher] Created (iterations=" << iterations_ << ")" << std::endl;
    }

    std::string hash(const std::string& password) override {
        std::string salt = crypto::randomBytes(kSaltLength);
        std::string key = derive(password, salt, iterations_);
        return std::string(kScheme) + "$" + std::to_string(iterations_) + "$" +
               crypto::base64Encode(salt) + "$" + crypto::base64Encode(key);
    }

    bool verify(const std::string& password, const std::string& passwordHash) override {
        auto parsed = parse(passwordHash);
        if (!parsed) {
            return false;
        }
        std::string key = derive(password, parsed->salt, parsed->iterations);
        return crypto::constantTimeEquals(key, parsed->key);
    }

    bool needsRehash(const std::string& passwordHash) override {
        auto parsed = parse(passwordHash);
        return !parsed || parsed->iterations < iterations_;
    }

private:
    int iterations_;

    struct ParsedHash {
        int iterations;
        std::string salt;
        std::string key;
    };

    static std::optional<ParsedHash> parse(const std::string& encoded) {
        std::vector<std::string> parts;
        std::stringstream ss(encoded);
        std::string part;
        while (std::getline(ss, part, '$')) {
            parts.push_back(part);
        }
        if (parts.size() != 4 || parts[0] != kScheme) {
            return std::nullopt;
        }

        ParsedHash parsed;
        try {
            parsed.iterations = std::stoi(parts[1]);
        } catch (const std::exception&) {
            return std::nullopt;
        }
        auto salt = crypto::base64Decode(parts[2]);
        auto key = crypto::base64Decode(parts[3]);
        if (parsed.iterations < 1 || !salt || !key || key->size() != kKeyLength) {
            return std::nullopt;
        }
        parsed.salt = *salt;
        parsed.key = *key;
        return parsed;
    }

    static std::string derive(const std::string& password, const std::string& salt, int iterations) {
        std::string out(kKeyLength, '\0');
        int ok = PKCS5_PBKDF2_HMAC(
            password.data(), static_cast<int>(password.size()),
            reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
            iterations, EVP_sha256(),
            static_cast<int>(out.size()), reinterpret_cast<unsigned char*>(&out[0]));
        if (ok != 1) {
            throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
        }
        return out;
    }
};

} // namespace clinic::adapters::secondary
