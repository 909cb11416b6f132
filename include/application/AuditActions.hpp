#pragma once

#include "domain/AuditRecord.hpp"
#include "domain/ClientContext.hpp"
#include <string>

namespace clinic::application::audit {

constexpr const char* kLogin = "LOGIN";
constexpr const char* kLoginMfaSuccess = "LOGIN_MFA_SUCCESS";
constexpr const char* kLoginFailed = "LOGIN_FAILED";
constexpr const char* kMfaSetupRequiredInitiated = "MFA_SETUP_REQUIRED_INITIATED";
constexpr const char* kMfaChallengeIssued = "MFA_CHALLENGE_ISSUED";
constexpr const char* kMfaBackupCodeUsed = "MFA_BACKUP_CODE_USED";
constexpr const char* kMfaLoginFailed = "MFA_LOGIN_FAILED";
constexpr const char* kMfaLoginInvalidTempToken = "MFA_LOGIN_INVALID_TEMP_TOKEN";
constexpr const char* kMfaClientMismatch = "MFA_CLIENT_MISMATCH";
constexpr const char* kMfaInitiated = "MFA_INITIATED";
constexpr const char* kMfaEnabled = "MFA_ENABLED";
constexpr const char* kMfaSetupCompleted = "MFA_SETUP_COMPLETED";
constexpr const char* kMfaVerificationFailed = "MFA_VERIFICATION_FAILED";
constexpr const char* kMfaDisabled = "MFA_DISABLED";
constexpr const char* kMfaDisableFailed = "MFA_DISABLE_FAILED";
constexpr const char* kMfaRateLimited = "MFA_RATE_LIMITED";
constexpr const char* kTokenRefresh = "TOKEN_REFRESH";
constexpr const char* kTokenRefreshFailed = "TOKEN_REFRESH_FAILED";
constexpr const char* kLogout = "LOGOUT";
constexpr const char* kPasswordChange = "PASSWORD_CHANGE";
constexpr const char* kPasswordChangeFailed = "PASSWORD_CHANGE_FAILED";

inline domain::AuditRecord success(
    const std::string& action,
    const std::string& userId,
    const domain::ClientContext& client,
    const std::string& sessionId = "",
    const std::string& reason = ""
) {
    domain::AuditRecord entry;
    entry.userId = userId;
    entry.resourceId = userId;
    entry.action = action;
    entry.ipAddress = client.ipAddress;
    entry.userAgent = client.userAgent;
    entry.sessionId = sessionId;
    entry.reason = reason;
    entry.success = true;
    return entry;
}

/**
 * @brief Запись о неудаче; reason: внутренняя причина, клиенту не отдаётся
 */
inline domain::AuditRecord failure(
    const std::string& action,
    const std::string& userId,
    const domain::ClientContext& client,
    const std::string& reason
) {
    domain::AuditRecord entry = success(action, userId, client);
    entry.success = false;
    entry.errorMessage = reason;
    return entry;
}

} // namespace clinic::application::audit
