#pragma once

#include <string>
#include <chrono>
#include <optional>

namespace clinic::domain {

/**
 * @brief Назначение роли пользователю
 *
 * Отзывается через isActive = false / revokedAt, не удаляется.
 * Действует в полуинтервале [validFrom, validUntil).
 */
struct RoleAssignment {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string assignmentId;
    std::string userId;
    std::string roleId;
    bool isActive = true;
    TimePoint validFrom{};
    std::optional<TimePoint> validUntil;    ///< nullopt = бессрочно
    std::optional<TimePoint> revokedAt;

    bool isValidAt(TimePoint now) const {
        if (!isActive || revokedAt) return false;
        if (validFrom > now) return false;
        return !validUntil || *validUntil > now;
    }
};

} // namespace clinic::domain
