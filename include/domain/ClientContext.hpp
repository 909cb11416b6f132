#pragma once

#include <string>

namespace clinic::domain {

/**
 * @brief Метаданные клиента запроса (IP и User-Agent)
 */
struct ClientContext {
    std::string ipAddress;
    std::string userAgent;

    bool operator==(const ClientContext& other) const {
        return ipAddress == other.ipAddress && userAgent == other.userAgent;
    }

    bool operator!=(const ClientContext& other) const { return !(*this == other); }
};

} // namespace clinic::domain
