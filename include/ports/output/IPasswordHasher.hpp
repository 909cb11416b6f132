#pragma once

#include <string>

namespace clinic::ports::output {

/**
 * @brief Односторонний адаптивный хэш паролей
 */
class IPasswordHasher {
public:
    virtual ~IPasswordHasher() = default;

    virtual std::string hash(const std::string& password) = 0;

    /**
     * @brief Проверка пароля; повреждённый хэш даёт false
     */
    virtual bool verify(const std::string& password, const std::string& passwordHash) = 0;

    /**
     * @brief Хэш создан с устаревшими параметрами
     */
    virtual bool needsRehash(const std::string& passwordHash) = 0;
};

} // namespace clinic::ports::output
