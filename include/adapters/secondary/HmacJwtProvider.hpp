#pragma once

#include "ports/output/ITokenProvider.hpp"
#include "AuthSettings.hpp"
#include "crypto/Encoding.hpp"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <chrono>
#include <stdexcept>
#include <iostream>

namespace clinic::adapters::secondary {

/**
 * @brief JWT (HS256) провайдер на OpenSSL
 *
 * Refresh токены подписываются отдельным секретом, остальные основным.
 * Срок жизни выбирается по типу токена из AuthSettings.
 *
 * Проверка:
 * 1. три сегмента, заголовок {"alg":"HS256"}
 * 2. подпись (сравнение за постоянное время)
 * 3. exp
 * 4. тип входит в accepted
 */
class HmacJwtProvider : public ports::output::ITokenProvider {
public:
    explicit HmacJwtProvider(std::shared_ptr<AuthSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[HmacJwtProvider] Created" << std::endl;
    }

    std::string issue(const domain::TokenClaims& claims) override {
        auto type = domain::tokenTypeOf(claims);
        auto now = std::chrono::system_clock::now();
        auto iat = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

        nlohmann::json payload = claimsToJson(claims);
        payload["sub"] = domain::subjectOf(claims);
        payload["type"] = domain::toString(type);
        payload["iat"] = iat;
        payload["exp"] = iat + ttlFor(type).count();
        payload["jti"] = crypto::toHex(crypto::randomBytes(16));

        static const std::string header = crypto::base64UrlEncode(R"({"alg":"HS256","typ":"JWT"})");
        std::string signingInput = header + "." + crypto::base64UrlEncode(payload.dump());
        return signingInput + "." + crypto::base64UrlEncode(sign(signingInput, secretFor(type)));
    }

    ports::output::TokenVerification verify(
        const std::string& token,
        const std::set<domain::TokenType>& accepted
    ) override {
        using ports::output::TokenRejection;

        size_t p1 = token.find('.');
        size_t p2 = p1 == std::string::npos ? std::string::npos : token.find('.', p1 + 1);
        if (p1 == std::string::npos || p2 == std::string::npos ||
            token.find('.', p2 + 1) != std::string::npos) {
            return reject(TokenRejection::Malformed);
        }

        std::string headerEnc = token.substr(0, p1);
        std::string payloadEnc = token.substr(p1 + 1, p2 - p1 - 1);
        std::string signatureEnc = token.substr(p2 + 1);

        nlohmann::json header;
        nlohmann::json payload;
        domain::TokenType type;
        try {
            auto headerJson = crypto::base64UrlDecode(headerEnc);
            auto payloadJson = crypto::base64UrlDecode(payloadEnc);
            if (!headerJson || !payloadJson) {
                return reject(TokenRejection::Malformed);
            }
            header = nlohmann::json::parse(*headerJson);
            payload = nlohmann::json::parse(*payloadJson);
            if (header.value("alg", "") != "HS256") {
                return reject(TokenRejection::Malformed);
            }
            type = domain::tokenTypeFromString(payload.at("type").get<std::string>());
        } catch (const std::exception&) {
            return reject(TokenRejection::Malformed);
        }

        auto signature = crypto::base64UrlDecode(signatureEnc);
        std::string expected = sign(headerEnc + "." + payloadEnc, secretFor(type));
        if (!signature || !crypto::constantTimeEquals(*signature, expected)) {
            return reject(TokenRejection::BadSignature);
        }

        try {
            auto now = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            if (payload.at("exp").get<int64_t>() <= now) {
                return reject(TokenRejection::Expired);
            }

            if (accepted.count(type) == 0) {
                return reject(TokenRejection::WrongType);
            }

            return {jsonToClaims(type, payload), TokenRejection::None};
        } catch (const std::exception&) {
            return reject(TokenRejection::Malformed);
        }
    }

    std::string fingerprint(const std::string& token) override {
        return crypto::sha256Hex(token);
    }

private:
    std::shared_ptr<AuthSettings> settings_;

    static ports::output::TokenVerification reject(ports::output::TokenRejection rejection) {
        return {std::nullopt, rejection};
    }

    static std::string sign(const std::string& input, const std::string& secret) {
        unsigned int len = EVP_MAX_MD_SIZE;
        unsigned char digest[EVP_MAX_MD_SIZE];
        HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()),
             reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest, &len);
        return std::string(reinterpret_cast<char*>(digest), len);
    }

    const std::string& secretFor(domain::TokenType type) const {
        return type == domain::TokenType::REFRESH
            ? settings_->getJwtRefreshSecret()
            : settings_->getJwtSecret();
    }

    std::chrono::seconds ttlFor(domain::TokenType type) const {
        switch (type) {
            case domain::TokenType::ACCESS:        return settings_->getAccessTokenTtl();
            case domain::TokenType::REFRESH:       return settings_->getRefreshTokenTtl();
            case domain::TokenType::MFA_CHALLENGE: return settings_->getMfaChallengeTtl();
            case domain::TokenType::MFA_SETUP:     return settings_->getMfaSetupTtl();
        }
        return settings_->getAccessTokenTtl();
    }

    static nlohmann::json claimsToJson(const domain::TokenClaims& claims) {
        nlohmann::json j;
        if (auto* access = std::get_if<domain::AccessTokenClaims>(&claims)) {
            j["sid"] = access->sessionId;
            j["email"] = access->email;
            j["firstName"] = access->firstName;
            j["lastName"] = access->lastName;
            j["roles"] = access->roles;
            j["permissions"] = access->permissions;
            j["mfaVerified"] = access->mfaVerified;
        } else if (auto* refresh = std::get_if<domain::RefreshTokenClaims>(&claims)) {
            j["sid"] = refresh->sessionId;
        } else if (auto* challenge = std::get_if<domain::MfaChallengeClaims>(&claims)) {
            j["email"] = challenge->email;
            j["ip"] = challenge->client.ipAddress;
            j["ua"] = challenge->client.userAgent;
        } else if (auto* setup = std::get_if<domain::MfaSetupClaims>(&claims)) {
            j["email"] = setup->email;
            j["ip"] = setup->client.ipAddress;
            j["ua"] = setup->client.userAgent;
        }
        return j;
    }

    static domain::TokenClaims jsonToClaims(domain::TokenType type, const nlohmann::json& j) {
        std::string subject = j.at("sub").get<std::string>();
        switch (type) {
            case domain::TokenType::ACCESS: {
                domain::AccessTokenClaims c;
                c.subject = subject;
                c.sessionId = j.at("sid").get<std::string>();
                c.email = j.value("email", "");
                c.firstName = j.value("firstName", "");
                c.lastName = j.value("lastName", "");
                c.roles = j.value("roles", std::vector<std::string>{});
                c.permissions = j.value("permissions", std::vector<std::string>{});
                c.mfaVerified = j.value("mfaVerified", false);
                return c;
            }
            case domain::TokenType::REFRESH:
                return domain::RefreshTokenClaims{subject, j.at("sid").get<std::string>()};
            case domain::TokenType::MFA_CHALLENGE:
                return domain::MfaChallengeClaims{
                    subject, j.value("email", ""), {j.value("ip", ""), j.value("ua", "")}};
            case domain::TokenType::MFA_SETUP:
                return domain::MfaSetupClaims{
                    subject, j.value("email", ""), {j.value("ip", ""), j.value("ua", "")}};
        }
        throw std::invalid_argument("Unsupported token type");
    }
};

} // namespace clinic::adapters::secondary
