// ============================================================================
// token_manager.h - Cached, single-flight credential lifecycle
// ============================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>

#include "auth/auth_error.h"
#include "auth/bytecode_env.h"
#include "auth/token_types.h"
#include "common/context.h"

namespace Nepse::Auth {

struct ManagerOptions {
    using WallClock = std::function<std::chrono::system_clock::time_point()>;

    std::chrono::seconds validity_window{45};

    // Use the refresh-token endpoint for unforced updates while a refresh
    // token is held. Off: every update goes through prove.
    bool prefer_refresh_endpoint{false};

    // Module file to load instead of the embedded one (create() only)
    std::string wasm_module{};

    // Hex SHA-256 the module must match; empty = not pinned (create() only)
    std::string module_sha256{};

    // Defaults to system_clock::now
    WallClock clock{};
};

struct ManagerStats {
    uint64_t updates_completed{0};
    uint64_t updates_failed{0};
    uint64_t waiters_joined{0};
};

/**
 * Holds the usable access/refresh tokens and keeps them inside the validity
 * window.
 *
 * Fresh reads take only the shared lock. A stale read (or forceUpdate)
 * enters a single-flight section: the first caller starts a flight whose
 * worker thread fetches, derives and publishes a new CredentialState, and
 * every caller (the starter included) waits on the flight's shared future.
 *
 * The fetch runs under a context owned by the flight. A participant whose
 * own context ends returns CANCELLED; the flight context is cancelled only
 * once every participant has left. A forced caller never joins an unforced
 * flight: it waits for that flight to settle and then starts its own.
 */
class TokenManager {
public:
    // Loads the derivation module (embedded, or options.wasm_module)
    [[nodiscard]] static auto create(TokenSource& source, ManagerOptions options,
                                     std::unique_ptr<TokenManager>& out) noexcept -> AuthStatus;

    TokenManager(TokenSource& source, std::unique_ptr<BytecodeEnv> env, ManagerOptions options) noexcept;
    ~TokenManager();

    TokenManager(const TokenManager&) = delete;
    TokenManager& operator=(const TokenManager&) = delete;

    [[nodiscard]] auto accessToken(const Common::Context& ctx, std::string& out) noexcept -> AuthStatus;
    [[nodiscard]] auto refreshToken(const Common::Context& ctx, std::string& out) noexcept -> AuthStatus;

    // Fetches regardless of freshness; shares only a flight that is itself forced
    [[nodiscard]] auto forceUpdate(const Common::Context& ctx) noexcept -> AuthStatus;

    // Cancels any flight, waits for its worker and releases the derivation
    // environment. Idempotent.
    auto close(const Common::Context& ctx) noexcept -> AuthStatus;

    [[nodiscard]] bool isFresh() const noexcept;
    [[nodiscard]] auto snapshot() const -> CredentialState;
    [[nodiscard]] auto stats() const noexcept -> ManagerStats;

    [[nodiscard]] auto validityWindow() const noexcept -> std::chrono::seconds { return options_.validity_window; }

private:
    enum class TokenKind : uint8_t { ACCESS, REFRESH };

    // One update cycle. participants and abandoned are guarded by flight_mutex_.
    struct Flight {
        explicit Flight(bool force) : forced(force), result(promise.get_future().share()) {}

        const bool forced;
        Common::Context ctx{Common::Context::background()};
        std::promise<AuthStatus> promise;
        std::shared_future<AuthStatus> result;
        uint32_t participants{1};
        bool abandoned{false};
    };

    auto getToken(const Common::Context& ctx, TokenKind kind, std::string& out) noexcept -> AuthStatus;
    auto update(const Common::Context& ctx, bool forced) noexcept -> AuthStatus;
    void launchFlight(const std::shared_ptr<Flight>& flight) noexcept;
    void runFlight(const std::shared_ptr<Flight>& flight) noexcept;
    auto awaitFlight(const Common::Context& ctx, const std::shared_ptr<Flight>& flight) noexcept -> AuthStatus;
    auto awaitSettled(const Common::Context& ctx, const std::shared_ptr<Flight>& flight) noexcept -> AuthStatus;
    void leaveFlight(Flight& flight) noexcept;
    void stopWorker() noexcept;
    auto performUpdate(const Common::Context& ctx, bool forced) noexcept -> AuthStatus;

    [[nodiscard]] auto now() const -> std::chrono::system_clock::time_point;
    [[nodiscard]] bool isFreshLocked(std::chrono::system_clock::time_point at) const noexcept;

    TokenSource& source_;
    std::unique_ptr<BytecodeEnv> env_;
    ManagerOptions options_;

    mutable std::shared_mutex state_mutex_;
    CredentialState state_;

    std::mutex flight_mutex_;
    std::shared_ptr<Flight> in_flight_;
    std::thread worker_;

    std::atomic<uint64_t> updates_completed_{0};
    std::atomic<uint64_t> updates_failed_{0};
    std::atomic<uint64_t> waiters_joined_{0};
};

} // namespace Nepse::Auth
