#pragma once

#include "adapters/secondary/crypto/Encoding.hpp"
#include <string>

namespace clinic::utils {

/**
 * @brief Генератор UUID v4 на RAND_bytes
 *
 * Идентификаторы сессий видны клиенту, поэтому берутся
 * из криптостойкого генератора OpenSSL.
 */
class UuidGenerator {
public:
    /**
     * @brief UUID v4: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     */
    static std::string generate() {
        std::string bytes = adapters::secondary::crypto::randomBytes(16);
        bytes[6] = static_cast<char>((static_cast<unsigned char>(bytes[6]) & 0x0F) | 0x40);  // version 4
        bytes[8] = static_cast<char>((static_cast<unsigned char>(bytes[8]) & 0x3F) | 0x80);  // variant

        std::string hex = adapters::secondary::crypto::toHex(bytes);
        return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
               hex.substr(16, 4) + "-" + hex.substr(20, 12);
    }
};

} // namespace clinic::utils
