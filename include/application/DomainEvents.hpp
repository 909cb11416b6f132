#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <chrono>

namespace clinic::application::events {

constexpr const char* kUserLoggedIn = "user.logged_in";
constexpr const char* kUserLoggedInWithMfa = "user.logged_in_with_mfa";
constexpr const char* kUserLoggedOut = "user.logged_out";
constexpr const char* kUserMfaInitiated = "user.mfa_initiated";
constexpr const char* kUserMfaEnabled = "user.mfa_enabled";
constexpr const char* kUserMfaDisabled = "user.mfa_disabled";
constexpr const char* kUserPasswordChanged = "user.password_changed";

/**
 * @brief JSON конверт события: {eventType, aggregateId, sessionId?, occurredAt, payload}
 */
inline std::string make(
    const std::string& eventType,
    const std::string& userId,
    const std::string& sessionId,
    nlohmann::json payload = nlohmann::json::object()
) {
    nlohmann::json event;
    event["eventType"] = eventType;
    event["aggregateId"] = userId;
    if (!sessionId.empty()) {
        event["sessionId"] = sessionId;
    }
    event["occurredAt"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    event["payload"] = std::move(payload);
    return event.dump();
}

} // namespace clinic::application::events
