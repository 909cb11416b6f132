#pragma once

#include "ports/input/IPermissionService.hpp"
#include "ports/output/IRoleRepository.hpp"
#include <memory>
#include <chrono>
#include <algorithm>

namespace clinic::application {

/**
 * @brief Вычисление эффективных прав из всех действующих назначений ролей
 *
 * Учитываются назначения с isActive, без revokedAt и в окне
 * [validFrom, validUntil), и только активные роли. Права объединяются,
 * роль не может отнять право, выданное другой ролью.
 */
class PermissionService : public ports::input::IPermissionService {
public:
    explicit PermissionService(std::shared_ptr<ports::output::IRoleRepository> roleRepo)
        : roleRepo_(std::move(roleRepo)) {}

    domain::ResolvedPermissions resolve(const std::string& userId) override {
        auto now = std::chrono::system_clock::now();
        domain::ResolvedPermissions resolved;

        for (const auto& assignment : roleRepo_->findAssignmentsByUserId(userId)) {
            if (!assignment.isValidAt(now)) continue;

            auto role = roleRepo_->findRoleById(assignment.roleId);
            if (!role || !role->isActive) continue;

            resolved.roles.insert(role->code);
            for (const auto& permission : role->permissions) {
                resolved.permissions.insert(permission.code);
            }
        }
        return resolved;
    }

    bool hasPermission(const std::string& userId, const std::string& permission) override {
        return resolve(userId).permissions.count(permission) > 0;
    }

    bool hasAnyPermission(const std::string& userId, const std::vector<std::string>& permissions) override {
        auto granted = resolve(userId).permissions;
        return std::any_of(permissions.begin(), permissions.end(),
            [&granted](const std::string& p) { return granted.count(p) > 0; });
    }

    bool hasAllPermissions(const std::string& userId, const std::vector<std::string>& permissions) override {
        auto granted = resolve(userId).permissions;
        return std::all_of(permissions.begin(), permissions.end(),
            [&granted](const std::string& p) { return granted.count(p) > 0; });
    }

private:
    std::shared_ptr<ports::output::IRoleRepository> roleRepo_;
};

} // namespace clinic::application
