// ============================================================================
// index_derivation.h - Salts to access/refresh removal indices
// ============================================================================

#pragma once

#include "auth/auth_error.h"
#include "auth/bytecode_env.h"
#include "auth/token_types.h"

namespace Nepse::Auth {

/**
 * Runs the ten derivation calls:
 *
 *   access[0]  = cdx(s1,s2,s3,s4,s5)    refresh[0] = cdx(s2,s1,s3,s5,s4)
 *   access[1]  = rdx(s1,s2,s4,s3,s5)    refresh[1] = rdx(s2,s1,s3,s4,s5)
 *   access[2]  = bdx(s1,s2,s4,s3,s5)    refresh[2] = bdx(s2,s1,s4,s3,s5)
 *   access[3]  = ndx(s1,s2,s4,s3,s5)    refresh[3] = ndx(s2,s1,s4,s3,s5)
 *   access[4]  = mdx(s1,s2,s4,s3,s5)    refresh[4] = mdx(s2,s1,s4,s3,s5)
 *
 * The argument orders are fixed by the server and must not change.
 * Any failed call fails the whole derivation with DERIVATION (cause CALL);
 * `out` is only written on success.
 */
[[nodiscard]] auto deriveIndices(BytecodeEnv& env, const Salts& salts,
                                 DerivedIndices& out) noexcept -> AuthStatus;

} // namespace Nepse::Auth
