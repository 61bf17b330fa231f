// ============================================================================
// bytecode_env.h - Execution boundary for the derivation functions
// ============================================================================

#pragma once

#include <array>
#include <cstdint>

#include "auth/auth_error.h"

namespace Nepse::Auth {

// Exported names, in derivation order F1..F5
inline constexpr std::array<const char*, 5> DERIVATION_EXPORTS = {"cdx", "rdx", "bdx", "ndx", "mdx"};

/**
 * Runs the five opaque (i32 x5) -> i32 derivation functions.
 *
 * Implementations serialize calls internally when the underlying runtime is
 * not safe for concurrent use. close() is idempotent; call() after close()
 * fails with CALL.
 */
class BytecodeEnv {
public:
    virtual ~BytecodeEnv() = default;

    [[nodiscard]] virtual auto call(const char* function,
                                    int32_t a, int32_t b, int32_t c, int32_t d, int32_t e,
                                    int32_t& result) noexcept -> AuthStatus = 0;

    virtual auto close() noexcept -> AuthStatus = 0;

    [[nodiscard]] virtual bool isClosed() const noexcept = 0;
};

} // namespace Nepse::Auth
