#pragma once

#include <set>
#include <string>

namespace clinic::domain {

/**
 * @brief Эффективные роли и права пользователя на текущий момент
 */
struct ResolvedPermissions {
    std::set<std::string> roles;
    std::set<std::string> permissions;
};

} // namespace clinic::domain
