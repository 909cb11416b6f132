#pragma once

#include "ports/output/IQrCodeRenderer.hpp"
#include "crypto/Encoding.hpp"

namespace clinic::adapters::secondary {

/**
 * @brief data: URL с otpauth URI
 *
 * Картинку QR рисует клиент из содержимого URL.
 */
class OtpAuthQrRenderer : public ports::output::IQrCodeRenderer {
public:
    std::string toDataUrl(const std::string& otpauthUri) override {
        return "data:text/uri-list;base64," + crypto::base64Encode(otpauthUri);
    }
};

} // namespace clinic::adapters::secondary
