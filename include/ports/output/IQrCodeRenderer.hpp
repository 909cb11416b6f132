#pragma once

#include <string>

namespace clinic::ports::output {

/**
 * @brief Представление otpauth URI в виде data: URL для клиента
 */
class IQrCodeRenderer {
public:
    virtual ~IQrCodeRenderer() = default;

    virtual std::string toDataUrl(const std::string& otpauthUri) = 0;
};

} // namespace clinic::ports::output
