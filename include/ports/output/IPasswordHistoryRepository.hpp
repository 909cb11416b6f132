#pragma once

#include <string>
#include <vector>

namespace clinic::ports::output {

/**
 * @brief Запись в истории паролей
 */
struct PasswordHistoryEntry {
    std::string userId;
    std::string passwordHash;
    std::string changedBy;
    std::string ipAddress;
    std::string userAgent;
    std::string reason;
};

/**
 * @brief История паролей (запрет повторного использования)
 */
class IPasswordHistoryRepository {
public:
    virtual ~IPasswordHistoryRepository() = default;

    virtual void record(const PasswordHistoryEntry& entry) = 0;

    /**
     * @brief Последние depth хэшей, от новых к старым
     */
    virtual std::vector<std::string> recentHashes(const std::string& userId, int depth) = 0;
};

} // namespace clinic::ports::output
