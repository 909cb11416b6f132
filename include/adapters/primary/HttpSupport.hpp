#pragma once

#include <IRequest.hpp>
#include <IResponse.hpp>
#include "domain/AuthError.hpp"
#include "domain/ClientContext.hpp"
#include "domain/LoginOutcome.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <iostream>

namespace clinic::adapters::primary::http {

constexpr const char* kAccessTokenCookie = "access_token";
constexpr const char* kRefreshTokenCookie = "refresh_token";

inline void sendJson(IResponse& res, int status, const nlohmann::json& body) {
    res.setResult(status, "application/json", body.dump());
}

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    sendJson(res, status, error);
}

/**
 * @brief Ответ на AuthException: стабильный код и общее сообщение
 *
 * Внутренняя причина (what()) клиенту не отдаётся.
 */
inline void sendAuthError(IResponse& res, const domain::AuthException& e) {
    nlohmann::json error;
    error["error"] = domain::publicMessage(e.code());
    error["code"] = domain::toString(e.code());
    sendJson(res, domain::httpStatus(e.code()), error);
}

inline void sendInternalError(IResponse& res, const char* handler, const std::exception& e) {
    std::cerr << "[" << handler << "] Unexpected error: " << e.what() << std::endl;
    sendError(res, 500, "Internal server error");
}

/**
 * @brief Значение cookie из заголовка Cookie
 */
inline std::optional<std::string> getCookie(IRequest& req, const std::string& name) {
    auto header = req.getHeader("Cookie");
    if (!header) return std::nullopt;

    const std::string& cookies = *header;
    size_t pos = 0;
    while (pos < cookies.size()) {
        size_t end = cookies.find(';', pos);
        if (end == std::string::npos) end = cookies.size();

        std::string pair = cookies.substr(pos, end - pos);
        size_t start = pair.find_first_not_of(' ');
        size_t eq = pair.find('=');
        if (start != std::string::npos && eq != std::string::npos &&
            pair.substr(start, eq - start) == name) {
            std::string value = pair.substr(eq + 1);
            if (value.empty()) return std::nullopt;
            return value;
        }
        pos = end + 1;
    }
    return std::nullopt;
}

inline domain::ClientContext clientContext(IRequest& req) {
    return {req.getIp(), req.getHeader("User-Agent").value_or("")};
}

/**
 * @brief Set-Cookie: httpOnly, sameSite=strict, path=/
 */
inline std::string buildCookie(
    const std::string& name,
    const std::string& value,
    std::chrono::seconds maxAge,
    bool secure
) {
    std::string cookie = name + "=" + value +
        "; Path=/; Max-Age=" + std::to_string(maxAge.count()) +
        "; HttpOnly; SameSite=Strict";
    if (secure) {
        cookie += "; Secure";
    }
    return cookie;
}

inline std::string clearCookie(const std::string& name, bool secure) {
    return buildCookie(name, "", std::chrono::seconds(0), secure);
}

inline std::optional<std::string> bearerToken(IRequest& req) {
    auto bearer = req.getBearerToken();
    if (bearer && !bearer->empty()) {
        return bearer;
    }
    return std::nullopt;
}

/**
 * @brief Токен запроса: Authorization: Bearer, затем cookie access_token
 *
 * Явно переданный токен важнее cookie.
 */
inline std::optional<std::string> extractToken(IRequest& req) {
    if (auto bearer = bearerToken(req)) {
        return bearer;
    }
    return getCookie(req, kAccessTokenCookie);
}

/**
 * @brief Какую cookie стереть при завершении сессии
 *
 * Ответ несёт один Set-Cookie. Стирается refresh_token, а если
 * клиент прислал только access_token, стирается он.
 */
inline std::string clearSessionCookie(IRequest& req, bool secure) {
    bool onlyAccess = getCookie(req, kAccessTokenCookie) && !getCookie(req, kRefreshTokenCookie);
    return clearCookie(onlyAccess ? kAccessTokenCookie : kRefreshTokenCookie, secure);
}

inline nlohmann::json userToJson(const domain::UserSummary& user) {
    nlohmann::json j;
    j["id"] = user.id;
    j["email"] = user.email;
    j["firstName"] = user.firstName;
    j["lastName"] = user.lastName;
    j["roles"] = user.roles;
    j["permissions"] = user.permissions;
    if (user.departmentId) j["departmentId"] = *user.departmentId;
    if (user.employeeId) j["employeeId"] = *user.employeeId;
    return j;
}

/**
 * @brief Полный результат входа; refresh токен дополнительно уходит в cookie
 */
inline void sendAuthResult(IResponse& res, const domain::AuthResult& result, bool secureCookie) {
    nlohmann::json body;
    body["user"] = userToJson(result.user);
    body["sessionId"] = result.sessionId;
    body["expiresIn"] = result.expiresIn.count();
    body["accessToken"] = result.accessToken;
    body["refreshToken"] = result.refreshToken;

    res.setHeader("Set-Cookie",
        buildCookie(kRefreshTokenCookie, result.refreshToken, result.refreshExpiresIn, secureCookie));
    sendJson(res, 200, body);
}

} // namespace clinic::adapters::primary::http
