// ============================================================================
// token_manager.cpp - Cached, single-flight credential lifecycle
// ============================================================================

#include "auth/token_manager.h"
#include "auth/index_derivation.h"
#include "auth/token_reconstruct.h"
#include "auth/wasm_env.h"
#include "common/logging.h"
#include "common/macros.h"
#include "common/time_utils.h"

#include <system_error>
#include <utility>

namespace Nepse::Auth {

namespace {

constexpr auto WAITER_POLL_INTERVAL = std::chrono::milliseconds(10);

auto cancelledStatus(const Common::Context& ctx) -> AuthStatus {
    return AuthStatus::error(AuthErrc::CANCELLED,
                             ctx.isCancelled() ? "cancelled while waiting for token update"
                                               : "deadline exceeded while waiting for token update");
}

// Enough of a token to correlate log lines without leaking it
auto tokenPrefix(const std::string& token) -> std::string {
    return token.size() <= 6 ? std::string("***") : token.substr(0, 6) + "...";
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

auto TokenManager::create(TokenSource& source, ManagerOptions options,
                          std::unique_ptr<TokenManager>& out) noexcept -> AuthStatus {
    std::unique_ptr<WasmEnv> env;
    const char* pinned = options.module_sha256.empty() ? nullptr : options.module_sha256.c_str();
    AuthStatus st = options.wasm_module.empty()
                        ? WasmEnv::createEmbedded(env, pinned)
                        : WasmEnv::createFromFile(options.wasm_module.c_str(), env, pinned);
    if (!st.ok()) {
        LOG_ERROR("Derivation module unavailable: %s", st.toString().c_str());
        return st;
    }

    out = std::make_unique<TokenManager>(source, std::move(env), std::move(options));
    return AuthStatus::success();
}

TokenManager::TokenManager(TokenSource& source, std::unique_ptr<BytecodeEnv> env, ManagerOptions options) noexcept
    : source_(source), env_(std::move(env)), options_(std::move(options)) {
    LOG_INFO("TokenManager ready (window=%llds, prefer_refresh=%s)",
             static_cast<long long>(options_.validity_window.count()),
             options_.prefer_refresh_endpoint ? "yes" : "no");
}

TokenManager::~TokenManager() {
    close(Common::Context::background());
    stopWorker();
}

// ============================================================================
// Accessors
// ============================================================================

auto TokenManager::accessToken(const Common::Context& ctx, std::string& out) noexcept -> AuthStatus {
    return getToken(ctx, TokenKind::ACCESS, out);
}

auto TokenManager::refreshToken(const Common::Context& ctx, std::string& out) noexcept -> AuthStatus {
    return getToken(ctx, TokenKind::REFRESH, out);
}

auto TokenManager::forceUpdate(const Common::Context& ctx) noexcept -> AuthStatus {
    return update(ctx, true);
}

auto TokenManager::close(const Common::Context& /*ctx*/) noexcept -> AuthStatus {
    stopWorker();
    if (!env_) {
        return AuthStatus::success();
    }
    return env_->close();
}

bool TokenManager::isFresh() const noexcept {
    const auto at = now();
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return isFreshLocked(at);
}

auto TokenManager::snapshot() const -> CredentialState {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return state_;
}

auto TokenManager::stats() const noexcept -> ManagerStats {
    ManagerStats s;
    s.updates_completed = updates_completed_.load(std::memory_order_relaxed);
    s.updates_failed = updates_failed_.load(std::memory_order_relaxed);
    s.waiters_joined = waiters_joined_.load(std::memory_order_relaxed);
    return s;
}

auto TokenManager::getToken(const Common::Context& ctx, TokenKind kind, std::string& out) noexcept -> AuthStatus {
    {
        const auto at = now();
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        if (LIKELY(isFreshLocked(at))) {
            out = kind == TokenKind::ACCESS ? state_.access_token : state_.refresh_token;
            return AuthStatus::success();
        }
    }

    AuthStatus st = update(ctx, false);
    if (!st.ok()) {
        return st;
    }

    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    const std::string& token = kind == TokenKind::ACCESS ? state_.access_token : state_.refresh_token;
    if (token.empty()) {
        return AuthStatus::error(AuthErrc::EMPTY_TOKEN,
                                 kind == TokenKind::ACCESS ? "empty access token after update"
                                                           : "empty refresh token after update");
    }
    out = token;
    return AuthStatus::success();
}

// ============================================================================
// Single-flight update
// ============================================================================

auto TokenManager::update(const Common::Context& ctx, bool forced) noexcept -> AuthStatus {
    for (;;) {
        if (ctx.isDone()) {
            return cancelledStatus(ctx);
        }

        std::shared_ptr<Flight> flight;
        std::thread previous;
        bool leader = false;
        bool joined = false;
        {
            std::lock_guard<std::mutex> lock(flight_mutex_);
            if (!in_flight_) {
                flight = std::make_shared<Flight>(forced);
                in_flight_ = flight;
                previous = std::move(worker_);
                leader = true;
            } else if (!in_flight_->abandoned && (in_flight_->forced || !forced)) {
                flight = in_flight_;
                ++flight->participants;
                joined = true;
            } else {
                flight = in_flight_;
            }
        }

        if (leader) {
            // Already past its in_flight_ reset, so it never needs flight_mutex_ again
            if (previous.joinable()) {
                previous.join();
            }
            launchFlight(flight);
            return awaitFlight(ctx, flight);
        }
        if (joined) {
            waiters_joined_.fetch_add(1, std::memory_order_relaxed);
            return awaitFlight(ctx, flight);
        }

        // Unforced or abandoned flight: let it settle, then go again
        AuthStatus st = awaitSettled(ctx, flight);
        if (!st.ok()) {
            return st;
        }
    }
}

void TokenManager::launchFlight(const std::shared_ptr<Flight>& flight) noexcept {
    try {
        // Held until worker_ is set: the worker clears in_flight_ under this lock
        std::lock_guard<std::mutex> lock(flight_mutex_);
        worker_ = std::thread([this, flight] { runFlight(flight); });
    } catch (const std::system_error& e) {
        LOG_WARN("Token update worker unavailable (%s), updating inline", e.what());
        runFlight(flight);
    }
}

void TokenManager::runFlight(const std::shared_ptr<Flight>& flight) noexcept {
    AuthStatus result = performUpdate(flight->ctx, flight->forced);

    if (result.ok()) {
        updates_completed_.fetch_add(1, std::memory_order_relaxed);
    } else {
        updates_failed_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Token update failed: %s", result.toString().c_str());
    }

    {
        std::lock_guard<std::mutex> lock(flight_mutex_);
        if (in_flight_ == flight) {
            in_flight_.reset();
        }
    }
    flight->promise.set_value(result);
}

auto TokenManager::awaitFlight(const Common::Context& ctx,
                               const std::shared_ptr<Flight>& flight) noexcept -> AuthStatus {
    while (flight->result.wait_for(WAITER_POLL_INTERVAL) != std::future_status::ready) {
        if (ctx.isDone()) {
            leaveFlight(*flight);
            return cancelledStatus(ctx);
        }
    }
    return flight->result.get();
}

auto TokenManager::awaitSettled(const Common::Context& ctx,
                                const std::shared_ptr<Flight>& flight) noexcept -> AuthStatus {
    while (flight->result.wait_for(WAITER_POLL_INTERVAL) != std::future_status::ready) {
        if (ctx.isDone()) {
            return cancelledStatus(ctx);
        }
    }
    return AuthStatus::success();
}

void TokenManager::leaveFlight(Flight& flight) noexcept {
    std::lock_guard<std::mutex> lock(flight_mutex_);
    if (flight.participants > 0 && --flight.participants == 0) {
        flight.abandoned = true;
        flight.ctx.cancel();
        LOG_DEBUG("Token update abandoned by every caller, cancelling fetch");
    }
}

void TokenManager::stopWorker() noexcept {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(flight_mutex_);
        if (in_flight_) {
            in_flight_->abandoned = true;
            in_flight_->ctx.cancel();
        }
        worker = std::move(worker_);
    }
    if (worker.joinable()) {
        worker.join();
    }
}

auto TokenManager::performUpdate(const Common::Context& ctx, bool forced) noexcept -> AuthStatus {
    std::string held_refresh;
    {
        const auto at = now();
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        // Another leader may have published while this caller was queued
        if (!forced && isFreshLocked(at)) {
            return AuthStatus::success();
        }
        held_refresh = state_.refresh_token;
    }

    if (!env_ || env_->isClosed()) {
        return AuthStatus::wrap(AuthErrc::DERIVATION,
                                AuthStatus::error(AuthErrc::CALL, "derivation environment is closed"),
                                "token update");
    }

    // Fetch
    TokenBundle bundle;
    std::string fetch_error;
    const bool use_refresh = !forced && options_.prefer_refresh_endpoint && !held_refresh.empty();
    const bool fetched = use_refresh
                             ? source_.fetchRefreshedBundle(ctx, held_refresh, bundle, fetch_error)
                             : source_.fetchInitialBundle(ctx, bundle, fetch_error);
    if (!fetched) {
        AuthStatus st = AuthStatus::error(AuthErrc::FETCH,
                                          std::string(use_refresh ? "refresh-token" : "prove") +
                                          " request failed: " + fetch_error);
        if (ctx.isDone()) {
            st.cause = AuthErrc::CANCELLED;
        }
        return st;
    }

    // Derive and reconstruct
    DerivedIndices indices;
    AuthStatus st = deriveIndices(*env_, bundle.salts, indices);
    if (!st.ok()) {
        return st;
    }

    std::string access = reconstruct(bundle.access_token, indices.access);
    std::string refresh = reconstruct(bundle.refresh_token, indices.refresh);
    if (access.empty()) {
        return AuthStatus::error(AuthErrc::EMPTY_TOKEN, "reconstructed access token is empty");
    }
    if (refresh.empty()) {
        return AuthStatus::error(AuthErrc::EMPTY_TOKEN, "reconstructed refresh token is empty");
    }

    // Freshness is tracked in whole server seconds
    const int64_t server_seconds = bundle.server_time_ms / 1000;
    const auto obtained_at = server_seconds > 0 ? Common::fromUnixSeconds(server_seconds) : now();

    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        state_.access_token = std::move(access);
        state_.refresh_token = std::move(refresh);
        state_.salts = bundle.salts;
        state_.obtained_at = obtained_at;

        LOG_INFO("Tokens updated via %s (access=%s, obtained_at=%lld)",
                 use_refresh ? "refresh-token" : "prove",
                 tokenPrefix(state_.access_token).c_str(),
                 static_cast<long long>(Common::toUnixSeconds(obtained_at)));
    }

    return AuthStatus::success();
}

// ============================================================================
// Freshness
// ============================================================================

auto TokenManager::now() const -> std::chrono::system_clock::time_point {
    return options_.clock ? options_.clock() : std::chrono::system_clock::now();
}

bool TokenManager::isFreshLocked(std::chrono::system_clock::time_point at) const noexcept {
    if (state_.access_token.empty()) {
        return false;
    }
    return at - state_.obtained_at < options_.validity_window;
}

} // namespace Nepse::Auth
