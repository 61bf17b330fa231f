// ============================================================================
// token_types.h - Token bundle, derived indices and credential snapshot
// ============================================================================

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>

#include "common/context.h"

namespace Nepse::Auth {

constexpr std::size_t SALT_COUNT = 5;
constexpr std::size_t INDEX_COUNT = 5;

using Salts = std::array<int32_t, SALT_COUNT>;
using IndexSet = std::array<int32_t, INDEX_COUNT>;

// Body of /api/authenticate/prove and /api/authenticate/refresh-token
struct TokenBundle {
    Salts salts{};
    std::string access_token{};
    std::string refresh_token{};
    int64_t server_time_ms{0};
};

// Positions to remove from each raw token. Unsorted; may be out of range.
struct DerivedIndices {
    IndexSet access{};
    IndexSet refresh{};
};

// Usable tokens plus the salts they were derived from
struct CredentialState {
    std::string access_token{};
    std::string refresh_token{};
    Salts salts{};
    std::chrono::system_clock::time_point obtained_at{};
};

// ============================================================================
// Network collaborator that issues token bundles
// ============================================================================
class TokenSource {
public:
    virtual ~TokenSource() = default;

    // Unauthenticated prove request
    [[nodiscard]] virtual bool fetchInitialBundle(const Common::Context& ctx,
                                                  TokenBundle& out,
                                                  std::string& error) noexcept = 0;

    // Refresh request authenticated with the current usable refresh token
    [[nodiscard]] virtual bool fetchRefreshedBundle(const Common::Context& ctx,
                                                    const std::string& refresh_token,
                                                    TokenBundle& out,
                                                    std::string& error) noexcept = 0;
};

} // namespace Nepse::Auth
