// ============================================================================
// http_client.h - NEPSE HTTP transport and authenticated API access
// ============================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "auth/token_manager.h"
#include "auth/token_types.h"
#include "common/context.h"
#include "config/config.h"
#include "nepse/nepse_error.h"

#include <rapidjson/document.h>

namespace Nepse {

struct ClientOptions {
    std::string base_url{"https://www.nepalstock.com.np"};
    bool tls_verification{true};
    std::chrono::milliseconds timeout{30000};
    uint32_t max_retries{3};
    std::chrono::milliseconds retry_delay{1000};
    std::string user_agent{"Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
                           "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36"};

    [[nodiscard]] static auto fromConfig(const NepseConfig& cfg) -> ClientOptions;
};

struct HttpResponse {
    long status{0};
    std::string body{};
};

// Backoff before retry `attempt` (1-based): delay * 2^(attempt-1), capped at 30s
[[nodiscard]] auto retryBackoff(std::chrono::milliseconds base, uint32_t attempt) noexcept -> std::chrono::milliseconds;

// Decodes the prove / refresh-token body
[[nodiscard]] bool parseTokenBundle(const char* json, std::size_t len,
                                    Auth::TokenBundle& out, std::string& error) noexcept;

// Manager settings from the [auth] section
[[nodiscard]] auto managerOptionsFromConfig(const NepseConfig& cfg) -> Auth::ManagerOptions;

/**
 * libcurl transport for the NEPSE web API.
 *
 * Acts as the TokenSource for its own TokenManager, so authenticated calls
 * go through apiGet(), which retries once after a 401 by forcing a token
 * update. Every request gets a fresh easy handle; the client is safe to use
 * from several threads.
 */
class HttpClient : public Auth::TokenSource {
public:
    static constexpr const char* PROVE_ENDPOINT = "/api/authenticate/prove";
    static constexpr const char* REFRESH_ENDPOINT = "/api/authenticate/refresh-token";
    static constexpr std::size_t MAX_RESPONSE_BYTES = 32 * 1024 * 1024;

    explicit HttpClient(ClientOptions options);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Creates the token manager with the embedded (or configured) module
    [[nodiscard]] auto init(Auth::ManagerOptions options) noexcept -> ApiError;

    // Creates the token manager around an existing environment
    [[nodiscard]] auto init(std::unique_ptr<Auth::BytecodeEnv> env, Auth::ManagerOptions options) noexcept -> ApiError;

    // Auth::TokenSource
    [[nodiscard]] bool fetchInitialBundle(const Common::Context& ctx,
                                          Auth::TokenBundle& out,
                                          std::string& error) noexcept override;
    [[nodiscard]] bool fetchRefreshedBundle(const Common::Context& ctx,
                                            const std::string& refresh_token,
                                            Auth::TokenBundle& out,
                                            std::string& error) noexcept override;

    // Authenticated GET of `endpoint` (path + query); body of the 200 response
    [[nodiscard]] auto apiGet(const Common::Context& ctx, const std::string& endpoint,
                              std::string& body) noexcept -> ApiError;

    // apiGet() plus JSON parse into `doc`
    [[nodiscard]] auto apiGetJson(const Common::Context& ctx, const std::string& endpoint,
                                  rapidjson::Document& doc) noexcept -> ApiError;

    // Releases the token manager's derivation environment. Idempotent.
    auto close(const Common::Context& ctx) noexcept -> ApiError;

    void setTlsVerification(bool enabled) noexcept;

    [[nodiscard]] auto options() const noexcept -> const ClientOptions& { return options_; }
    [[nodiscard]] auto tokenManager() noexcept -> Auth::TokenManager* { return manager_.get(); }

protected:
    // One HTTP GET with no retry. Returns false on transport failure.
    [[nodiscard]] virtual bool performGet(const Common::Context& ctx, const std::string& url,
                                          const std::vector<std::string>& headers,
                                          HttpResponse& response, std::string& error) noexcept;

private:
    [[nodiscard]] auto commonHeaders() const -> std::vector<std::string>;

    // performGet() with backoff on network errors, 5xx and 429
    [[nodiscard]] auto doRequest(const Common::Context& ctx, const std::string& url,
                                 const std::vector<std::string>& headers,
                                 HttpResponse& response) noexcept -> ApiError;

    [[nodiscard]] bool fetchBundle(const Common::Context& ctx, const char* endpoint,
                                   const std::string* refresh_token,
                                   Auth::TokenBundle& out, std::string& error) noexcept;

    ClientOptions options_;
    std::atomic<bool> tls_verification_;
    std::unique_ptr<Auth::TokenManager> manager_;   // destroyed first; it refers back to *this
};

} // namespace Nepse
