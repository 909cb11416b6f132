#pragma once

#include "ports/output/IOtpProvider.hpp"
#include "crypto/Encoding.hpp"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace clinic::adapters::secondary {

/**
 * @brief TOTP по RFC 6238: HMAC-SHA1, шаг 30 секунд, 6 цифр
 */
class OpenSslTotpProvider : public ports::output::IOtpProvider {
public:
    static constexpr int kStepSeconds = 30;
    static constexpr int kDigits = 6;
    static constexpr size_t kSecretBytes = 20;

    std::string generateSecret() override {
        return crypto::base32Encode(crypto::randomBytes(kSecretBytes));
    }

    std::string generateCode(
        const std::string& secret,
        std::chrono::system_clock::time_point at
    ) override {
        auto key = crypto::base32Decode(secret);
        if (!key || key->empty()) {
            throw std::invalid_argument("Invalid TOTP secret");
        }
        return codeForCounter(*key, counterAt(at));
    }

    bool verify(
        const std::string& secret,
        const std::string& code,
        std::chrono::system_clock::time_point at,
        int window
    ) override {
        if (code.size() != static_cast<size_t>(kDigits) ||
            code.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        auto key = crypto::base32Decode(secret);
        if (!key || key->empty()) {
            return false;
        }

        int64_t counter = counterAt(at);
        bool matched = false;
        for (int offset = -window; offset <= window; ++offset) {
            if (counter + offset < 0) continue;
            // без раннего выхода
            if (crypto::constantTimeEquals(codeForCounter(*key, counter + offset), code)) {
                matched = true;
            }
        }
        return matched;
    }

    std::string buildUri(
        const std::string& secret,
        const std::string& accountName,
        const std::string& issuer
    ) override {
        return "otpauth://totp/" + urlEncode(issuer) + ":" + urlEncode(accountName) +
               "?secret=" + secret +
               "&issuer=" + urlEncode(issuer) +
               "&algorithm=SHA1&digits=" + std::to_string(kDigits) +
               "&period=" + std::to_string(kStepSeconds);
    }

private:
    static int64_t counterAt(std::chrono::system_clock::time_point at) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(at.time_since_epoch()).count();
        return seconds / kStepSeconds;
    }

    static std::string codeForCounter(const std::string& key, int64_t counter) {
        unsigned char message[8];
        uint64_t value = static_cast<uint64_t>(counter);
        for (int i = 7; i >= 0; --i) {
            message[i] = static_cast<unsigned char>(value & 0xFF);
            value >>= 8;
        }

        unsigned int len = EVP_MAX_MD_SIZE;
        unsigned char digest[EVP_MAX_MD_SIZE];
        HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()),
             message, sizeof(message), digest, &len);

        // dynamic truncation (RFC 4226, 5.3)
        int offset = digest[len - 1] & 0x0F;
        uint32_t binary = (static_cast<uint32_t>(digest[offset] & 0x7F) << 24) |
                          (static_cast<uint32_t>(digest[offset + 1]) << 16) |
                          (static_cast<uint32_t>(digest[offset + 2]) << 8) |
                          static_cast<uint32_t>(digest[offset + 3]);

        std::ostringstream ss;
        ss << std::setw(kDigits) << std::setfill('0') << (binary % 1000000);
        return ss.str();
    }

    static std::string urlEncode(const std::string& value) {
        std::ostringstream ss;
        ss << std::hex << std::uppercase;
        for (unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '@') {
                ss << c;
            } else {
                ss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
            }
        }
        return ss.str();
    }
};

} // namespace clinic::adapters::secondary
