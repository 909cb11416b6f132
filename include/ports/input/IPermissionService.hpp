#pragma once

#include "domain/ResolvedPermissions.hpp"
#include <string>
#include <vector>

namespace clinic::ports::input {

/**
 * @brief Вычисление эффективных прав пользователя
 */
class IPermissionService {
public:
    virtual ~IPermissionService() = default;

    virtual domain::ResolvedPermissions resolve(const std::string& userId) = 0;

    virtual bool hasPermission(const std::string& userId, const std::string& permission) = 0;
    virtual bool hasAnyPermission(const std::string& userId, const std::vector<std::string>& permissions) = 0;
    virtual bool hasAllPermissions(const std::string& userId, const std::vector<std::string>& permissions) = 0;
};

} // namespace clinic::ports::input
