#pragma once

#include <string>
#include <vector>

namespace clinic::domain {

/**
 * @brief Право доступа
 *
 * Код в формате domain:resource:action, например "patients:*:read".
 * После того как на право сослалась роль, код не меняется.
 */
struct Permission {
    std::string permissionId;
    std::string code;
};

/**
 * @brief Роль с набором прав
 */
struct Role {
    std::string roleId;
    std::string code;           ///< ADMIN, DOCTOR, NURSE, ...
    bool isActive = true;
    std::vector<Permission> permissions;
};

} // namespace clinic::domain
