// ============================================================================
// nepse_error.h - API client error taxonomy
// ============================================================================

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace Nepse {

enum class ApiErrc : uint8_t {
    OK = 0,
    NETWORK,        // transport failure (DNS, connect, TLS, timeout)
    UNAUTHORIZED,   // 401 after the forced token refresh
    FORBIDDEN,      // 403
    NOT_FOUND,      // 404, or a lookup that matched nothing
    RATE_LIMIT,     // 429
    SERVER,         // 5xx
    HTTP,           // any other non-200 status
    DECODE,         // body is not the JSON shape expected
    AUTH,           // token manager could not produce a token
    CANCELLED       // caller context cancelled or past its deadline
};

[[nodiscard]] inline auto apiErrcName(ApiErrc code) noexcept -> const char* {
    switch (code) {
        case ApiErrc::OK:           return "OK";
        case ApiErrc::NETWORK:      return "NETWORK";
        case ApiErrc::UNAUTHORIZED: return "UNAUTHORIZED";
        case ApiErrc::FORBIDDEN:    return "FORBIDDEN";
        case ApiErrc::NOT_FOUND:    return "NOT_FOUND";
        case ApiErrc::RATE_LIMIT:   return "RATE_LIMIT";
        case ApiErrc::SERVER:       return "SERVER";
        case ApiErrc::HTTP:         return "HTTP";
        case ApiErrc::DECODE:       return "DECODE";
        case ApiErrc::AUTH:         return "AUTH";
        case ApiErrc::CANCELLED:    return "CANCELLED";
    }
    return "UNKNOWN";
}

struct ApiError {
    ApiErrc code{ApiErrc::OK};
    long http_status{0};
    std::string message{};

    [[nodiscard]] bool ok() const noexcept { return code == ApiErrc::OK; }
    explicit operator bool() const noexcept { return ok(); }

    // Transient failures worth another attempt
    [[nodiscard]] bool isRetryable() const noexcept {
        return code == ApiErrc::NETWORK || code == ApiErrc::RATE_LIMIT || code == ApiErrc::SERVER;
    }

    static auto success() -> ApiError { return ApiError{}; }

    static auto make(ApiErrc code, std::string message) -> ApiError {
        return ApiError{code, 0, std::move(message)};
    }

    static auto fromHttpStatus(long status, const std::string& context) -> ApiError {
        ApiErrc code = ApiErrc::HTTP;
        if (status == 401) {
            code = ApiErrc::UNAUTHORIZED;
        } else if (status == 403) {
            code = ApiErrc::FORBIDDEN;
        } else if (status == 404) {
            code = ApiErrc::NOT_FOUND;
        } else if (status == 429) {
            code = ApiErrc::RATE_LIMIT;
        } else if (status >= 500 && status <= 599) {
            code = ApiErrc::SERVER;
        }
        return ApiError{code, status, context + ": HTTP " + std::to_string(status)};
    }

    [[nodiscard]] auto toString() const -> std::string {
        return std::string(apiErrcName(code)) + (message.empty() ? "" : ": " + message);
    }
};

} // namespace Nepse
