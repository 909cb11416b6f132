#pragma once

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <openssl/sha.h>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <cctype>

namespace clinic::adapters::secondary::crypto {

/**
 * @brief Криптостойкие случайные байты (RAND_bytes)
 *
 * @throws std::runtime_error если генератор OpenSSL недоступен
 */
inline std::string randomBytes(size_t count) {
    std::string out(count, '\0');
    if (count > 0 &&
        RAND_bytes(reinterpret_cast<unsigned char*>(&out[0]), static_cast<int>(count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

inline std::string toHex(const std::string& bytes, bool upper = false) {
    static const char* lower = "0123456789abcdef";
    static const char* upperDigits = "0123456789ABCDEF";
    const char* digits = upper ? upperDigits : lower;

    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out.push_back(digits[c >> 4]);
        out.push_back(digits[c & 0x0F]);
    }
    return out;
}

inline std::string sha256Hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return toHex(std::string(reinterpret_cast<char*>(digest), sizeof(digest)));
}

/**
 * @brief Сравнение за постоянное время (для подписей и хэшей)
 */
inline bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

inline std::string base64Encode(const std::string& bytes) {
    if (bytes.empty()) return "";
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int len = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(&out[0]),
        reinterpret_cast<const unsigned char*>(bytes.data()),
        static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(len));
    return out;
}

/**
 * @brief Декодирование стандартного base64 с паддингом
 *
 * @return nullopt при неверной длине или символах
 */
inline std::optional<std::string> base64Decode(const std::string& text) {
    if (text.empty()) return std::string();
    if (text.size() % 4 != 0) return std::nullopt;

    std::string out(3 * text.size() / 4, '\0');
    int len = EVP_DecodeBlock(
        reinterpret_cast<unsigned char*>(&out[0]),
        reinterpret_cast<const unsigned char*>(text.data()),
        static_cast<int>(text.size()));
    if (len < 0) return std::nullopt;

    // EVP_DecodeBlock не учитывает паддинг
    size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(len) - padding);
    return out;
}

inline std::string base64UrlEncode(const std::string& bytes) {
    std::string out = base64Encode(bytes);
    for (auto& ch : out) {
        if (ch == '+') ch = '-';
        else if (ch == '/') ch = '_';
    }
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    return out;
}

inline std::optional<std::string> base64UrlDecode(const std::string& text) {
    std::string b64;
    b64.reserve(text.size() + 3);
    for (char ch : text) {
        if (ch == '-') b64.push_back('+');
        else if (ch == '_') b64.push_back('/');
        else if (std::isalnum(static_cast<unsigned char>(ch))) b64.push_back(ch);
        else return std::nullopt;
    }
    if (b64.size() % 4 == 1) return std::nullopt;
    while (b64.size() % 4) {
        b64.push_back('=');
    }
    return base64Decode(b64);
}

/**
 * @brief Base32 (RFC 4648) без паддинга, алфавит A-Z2-7
 */
inline std::string base32Encode(const std::string& bytes) {
    static const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
    std::string out;
    unsigned int buffer = 0;
    int bits = 0;
    for (unsigned char c : bytes) {
        buffer = (buffer << 8) | c;
        bits += 8;
        while (bits >= 5) {
            out.push_back(alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(alphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

/**
 * @brief Декодирование base32; регистр, пробелы и '=' игнорируются
 */
inline std::optional<std::string> base32Decode(const std::string& text) {
    std::string out;
    unsigned int buffer = 0;
    int bits = 0;
    for (char raw : text) {
        if (raw == '=' || raw == ' ') continue;
        char ch = static_cast<char>(std::toupper(static_cast<unsigned char>(raw)));
        int value;
        if (ch >= 'A' && ch <= 'Z') value = ch - 'A';
        else if (ch >= '2' && ch <= '7') value = ch - '2' + 26;
        else return std::nullopt;

        buffer = (buffer << 5) | static_cast<unsigned int>(value);
        bits += 5;
        if (bits >= 8) {
            out.push_back(static_cast<char>((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }
    return out;
}

} // namespace clinic::adapters::secondary::crypto
