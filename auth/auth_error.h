// ============================================================================
// auth_error.h - Status codes for token acquisition and derivation
// ============================================================================

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace Nepse::Auth {

enum class AuthErrc : uint8_t {
    OK = 0,
    MODULE_LOAD,      // bytecode module failed to parse or instantiate
    EXPORT_MISSING,   // a derivation function is absent or has the wrong signature
    CALL,             // a derivation call trapped, or the environment is closed
    DERIVATION,       // index derivation failed (cause = CALL)
    FETCH,            // token source failed (cause = CANCELLED when the context ended)
    EMPTY_TOKEN,      // reconstruction produced an empty token
    CANCELLED         // caller context ended while waiting on an update
};

[[nodiscard]] auto authErrcName(AuthErrc code) noexcept -> const char*;

// Returned by value from every fallible operation. `cause` keeps the wrapped
// code when one failure is reported as another.
struct AuthStatus {
    AuthErrc code{AuthErrc::OK};
    AuthErrc cause{AuthErrc::OK};
    std::string message{};

    [[nodiscard]] bool ok() const noexcept { return code == AuthErrc::OK; }
    explicit operator bool() const noexcept { return ok(); }

    static auto success() -> AuthStatus { return AuthStatus{}; }

    static auto error(AuthErrc code, std::string message) -> AuthStatus {
        return AuthStatus{code, AuthErrc::OK, std::move(message)};
    }

    // Wraps `inner` as `code`, prefixing `context` to the inner message.
    static auto wrap(AuthErrc code, const AuthStatus& inner, const std::string& context) -> AuthStatus {
        return AuthStatus{code, inner.code, context + ": " + inner.message};
    }

    // "DERIVATION(CALL): wasm call rdx failed: ..."
    [[nodiscard]] auto toString() const -> std::string;
};

} // namespace Nepse::Auth
