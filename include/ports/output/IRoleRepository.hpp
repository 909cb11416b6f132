#pragma once

#include "domain/Role.hpp"
#include "domain/RoleAssignment.hpp"
#include <string>
#include <vector>
#include <optional>

namespace clinic::ports::output {

/**
 * @brief Чтение ролей и назначений (только чтение)
 */
class IRoleRepository {
public:
    virtual ~IRoleRepository() = default;

    /**
     * @brief Все назначения пользователя, включая неактивные и истёкшие
     */
    virtual std::vector<domain::RoleAssignment> findAssignmentsByUserId(const std::string& userId) = 0;

    /**
     * @brief Роль вместе с правами
     */
    virtual std::optional<domain::Role> findRoleById(const std::string& roleId) = 0;
};

} // namespace clinic::ports::output
