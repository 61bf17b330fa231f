// ============================================================================
// http_client.cpp - NEPSE HTTP transport and authenticated API access
// ============================================================================

#include "nepse/http_client.h"
#include "common/logging.h"

#include <algorithm>
#include <cstring>
#include <mutex>
#include <thread>
#include <utility>

#include <curl/curl.h>
#include <rapidjson/error/en.h>

namespace Nepse {

namespace {

constexpr auto MAX_BACKOFF = std::chrono::milliseconds(30000);
constexpr auto SLEEP_SLICE = std::chrono::milliseconds(10);

std::once_flag g_curl_init_once;

// Response accumulator handed to the write callback
struct BufferContext {
    std::string* data;
    std::size_t max_size;
    bool truncated;
};

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total_size = size * nmemb;
    auto* ctx = static_cast<BufferContext*>(userp);

    size_t to_copy = total_size;
    if (ctx->data->size() + to_copy > ctx->max_size) {
        to_copy = ctx->max_size - ctx->data->size();
        ctx->truncated = true;
    }
    if (to_copy > 0) {
        ctx->data->append(static_cast<const char*>(contents), to_copy);
    }
    return total_size;  // keep curl going; truncation is reported after perform
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* ctx = static_cast<const Common::Context*>(clientp);
    return ctx->isDone() ? 1 : 0;
}

// Sleeps in small slices so a cancelled context cuts the wait short
bool sleepFor(const Common::Context& ctx, std::chrono::milliseconds duration) {
    const auto until = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < until) {
        if (ctx.isDone()) {
            return false;
        }
        std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(
            SLEEP_SLICE, std::chrono::duration_cast<std::chrono::milliseconds>(until - std::chrono::steady_clock::now())));
    }
    return !ctx.isDone();
}

bool readSalt(const rapidjson::Value& doc, const char* key, int32_t& out) {
    if (!doc.HasMember(key) || !doc[key].IsInt()) {
        return false;
    }
    out = doc[key].GetInt();
    return true;
}

} // namespace

// ============================================================================
// Helpers
// ============================================================================

auto ClientOptions::fromConfig(const NepseConfig& cfg) -> ClientOptions {
    ClientOptions opts;
    opts.base_url = cfg.client.base_url;
    opts.tls_verification = cfg.client.tls_verification;
    opts.timeout = std::chrono::milliseconds(cfg.client.http_timeout_ms);
    opts.max_retries = cfg.client.max_retries;
    opts.retry_delay = std::chrono::milliseconds(cfg.client.retry_delay_ms);
    if (cfg.client.user_agent[0]) {
        opts.user_agent = cfg.client.user_agent;
    }
    return opts;
}

auto managerOptionsFromConfig(const NepseConfig& cfg) -> Auth::ManagerOptions {
    Auth::ManagerOptions opts;
    opts.validity_window = std::chrono::seconds(cfg.auth.validity_window_s);
    opts.prefer_refresh_endpoint = cfg.auth.prefer_refresh_endpoint;
    opts.wasm_module = cfg.auth.wasm_module;
    opts.module_sha256 = cfg.auth.wasm_sha256;
    return opts;
}

auto retryBackoff(std::chrono::milliseconds base, uint32_t attempt) noexcept -> std::chrono::milliseconds {
    if (attempt == 0) {
        return std::chrono::milliseconds(0);
    }
    // Shift capped well below overflow; the 30s ceiling applies long before
    const uint32_t shift = std::min<uint32_t>(attempt - 1, 20);
    const auto delay = base * (int64_t{1} << shift);
    return std::min(delay, MAX_BACKOFF);
}

bool parseTokenBundle(const char* json, std::size_t len, Auth::TokenBundle& out, std::string& error) noexcept {
    rapidjson::Document doc;
    doc.Parse(json, len);
    if (doc.HasParseError()) {
        error = std::string("token response is not JSON: ") + rapidjson::GetParseError_En(doc.GetParseError());
        return false;
    }
    if (!doc.IsObject()) {
        error = "token response is not a JSON object";
        return false;
    }

    Auth::TokenBundle bundle;
    static constexpr const char* SALT_KEYS[Auth::SALT_COUNT] = {"salt1", "salt2", "salt3", "salt4", "salt5"};
    for (std::size_t i = 0; i < Auth::SALT_COUNT; ++i) {
        if (!readSalt(doc, SALT_KEYS[i], bundle.salts[i])) {
            error = std::string("token response missing integer ") + SALT_KEYS[i];
            return false;
        }
    }

    if (!doc.HasMember("accessToken") || !doc["accessToken"].IsString()) {
        error = "token response missing accessToken";
        return false;
    }
    if (!doc.HasMember("refreshToken") || !doc["refreshToken"].IsString()) {
        error = "token response missing refreshToken";
        return false;
    }
    bundle.access_token.assign(doc["accessToken"].GetString(), doc["accessToken"].GetStringLength());
    bundle.refresh_token.assign(doc["refreshToken"].GetString(), doc["refreshToken"].GetStringLength());

    // serverTime is optional; absent means "use the local clock"
    if (doc.HasMember("serverTime") && doc["serverTime"].IsInt64()) {
        bundle.server_time_ms = doc["serverTime"].GetInt64();
    }

    out = std::move(bundle);
    return true;
}

// ============================================================================
// HttpClient
// ============================================================================

HttpClient::HttpClient(ClientOptions options)
    : options_(std::move(options)), tls_verification_(options_.tls_verification) {
    std::call_once(g_curl_init_once, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });

    while (!options_.base_url.empty() && options_.base_url.back() == '/') {
        options_.base_url.pop_back();
    }

    if (!options_.tls_verification) {
        LOG_WARN("TLS verification disabled for %s", options_.base_url.c_str());
    }
}

HttpClient::~HttpClient() {
    manager_.reset();
}

auto HttpClient::init(Auth::ManagerOptions options) noexcept -> ApiError {
    std::unique_ptr<Auth::TokenManager> manager;
    const Auth::AuthStatus st = Auth::TokenManager::create(*this, std::move(options), manager);
    if (!st.ok()) {
        return ApiError::make(ApiErrc::AUTH, "failed to create token manager: " + st.toString());
    }
    manager_ = std::move(manager);
    return ApiError::success();
}

auto HttpClient::init(std::unique_ptr<Auth::BytecodeEnv> env, Auth::ManagerOptions options) noexcept -> ApiError {
    if (!env) {
        return ApiError::make(ApiErrc::AUTH, "no derivation environment");
    }
    manager_ = std::make_unique<Auth::TokenManager>(*this, std::move(env), std::move(options));
    return ApiError::success();
}

void HttpClient::setTlsVerification(bool enabled) noexcept {
    tls_verification_.store(enabled, std::memory_order_relaxed);
    if (!enabled) {
        LOG_WARN("TLS verification disabled for %s", options_.base_url.c_str());
    }
}

auto HttpClient::commonHeaders() const -> std::vector<std::string> {
    std::vector<std::string> headers;
    headers.reserve(12);
    headers.emplace_back("User-Agent: " + options_.user_agent);
    headers.emplace_back("Accept: application/json, text/plain, */*");
    headers.emplace_back("Accept-Language: en-US,en;q=0.9");
    headers.emplace_back("Origin: " + options_.base_url);
    headers.emplace_back("Referer: " + options_.base_url + "/");
    headers.emplace_back("Sec-Ch-Ua: \"Not_A Brand\";v=\"8\", \"Chromium\";v=\"120\", \"Google Chrome\";v=\"120\"");
    headers.emplace_back("Sec-Ch-Ua-Mobile: ?0");
    headers.emplace_back("Sec-Ch-Ua-Platform: \"Linux\"");
    headers.emplace_back("Sec-Fetch-Dest: empty");
    headers.emplace_back("Sec-Fetch-Mode: cors");
    headers.emplace_back("Sec-Fetch-Site: same-origin");
    return headers;
}

bool HttpClient::performGet(const Common::Context& ctx, const std::string& url,
                            const std::vector<std::string>& headers,
                            HttpResponse& response, std::string& error) noexcept {
    CURL* curl = curl_easy_init();
    if (!curl) {
        error = "curl_easy_init failed";
        return false;
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& h : headers) {
        header_list = curl_slist_append(header_list, h.c_str());
    }

    response.body.clear();
    BufferContext buffer{&response.body, MAX_RESPONSE_BYTES, false};

    // Request timeout is the tighter of the client timeout and the context deadline
    auto timeout = options_.timeout;
    if (ctx.hasDeadline()) {
        timeout = std::min(timeout, std::max(ctx.remaining(), std::chrono::milliseconds(1)));
    }

    const bool verify = tls_verification_.load(std::memory_order_relaxed);
    auto* ctx_ptr = const_cast<Common::Context*>(&ctx);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");  // gzip/deflate/br, decoded by curl
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, ctx_ptr);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);

    const CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        error = curl_easy_strerror(res);
        return false;
    }
    if (buffer.truncated) {
        LOG_WARN("Response from %s truncated at %zu bytes", url.c_str(), MAX_RESPONSE_BYTES);
    }

    response.status = http_code;
    return true;
}

auto HttpClient::doRequest(const Common::Context& ctx, const std::string& url,
                           const std::vector<std::string>& headers,
                           HttpResponse& response) noexcept -> ApiError {
    ApiError last_error = ApiError::make(ApiErrc::NETWORK, "no attempt made");

    for (uint32_t attempt = 0; attempt <= options_.max_retries; ++attempt) {
        if (attempt > 0) {
            const auto delay = retryBackoff(options_.retry_delay, attempt);
            LOG_DEBUG("Retry %u/%u for %s in %lld ms (%s)", attempt, options_.max_retries, url.c_str(),
                      static_cast<long long>(delay.count()), last_error.toString().c_str());
            if (!sleepFor(ctx, delay)) {
                return ApiError::make(ApiErrc::CANCELLED, "cancelled during retry backoff for " + url);
            }
        }

        if (ctx.isDone()) {
            return ApiError::make(ApiErrc::CANCELLED, "request to " + url + " cancelled");
        }

        std::string error;
        if (!performGet(ctx, url, headers, response, error)) {
            if (ctx.isDone()) {
                return ApiError::make(ApiErrc::CANCELLED, "request to " + url + " cancelled: " + error);
            }
            last_error = ApiError::make(ApiErrc::NETWORK, url + ": " + error);
            LOG_WARN("Network error on %s: %s", url.c_str(), error.c_str());
            continue;
        }

        if (response.status >= 500 || response.status == 429) {
            last_error = ApiError::fromHttpStatus(response.status, url);
            LOG_WARN("Retryable status %ld from %s", response.status, url.c_str());
            continue;
        }

        return ApiError::success();
    }

    LOG_ERROR("Giving up on %s: %s", url.c_str(), last_error.toString().c_str());
    return last_error;
}

// ============================================================================
// TokenSource
// ============================================================================

bool HttpClient::fetchBundle(const Common::Context& ctx, const char* endpoint,
                             const std::string* refresh_token,
                             Auth::TokenBundle& out, std::string& error) noexcept {
    const std::string url = options_.base_url + endpoint;
    std::vector<std::string> headers = commonHeaders();
    if (refresh_token) {
        headers.emplace_back("Authorization: Salter " + *refresh_token);
    }

    HttpResponse response;
    const ApiError err = doRequest(ctx, url, headers, response);
    if (!err.ok()) {
        error = err.toString();
        return false;
    }
    if (response.status != 200) {
        error = ApiError::fromHttpStatus(response.status, url).toString();
        return false;
    }
    return parseTokenBundle(response.body.data(), response.body.size(), out, error);
}

bool HttpClient::fetchInitialBundle(const Common::Context& ctx, Auth::TokenBundle& out,
                                    std::string& error) noexcept {
    return fetchBundle(ctx, PROVE_ENDPOINT, nullptr, out, error);
}

bool HttpClient::fetchRefreshedBundle(const Common::Context& ctx, const std::string& refresh_token,
                                      Auth::TokenBundle& out, std::string& error) noexcept {
    return fetchBundle(ctx, REFRESH_ENDPOINT, &refresh_token, out, error);
}

// ============================================================================
// Authenticated API
// ============================================================================

auto HttpClient::apiGet(const Common::Context& ctx, const std::string& endpoint,
                        std::string& body) noexcept -> ApiError {
    if (!manager_) {
        return ApiError::make(ApiErrc::AUTH, "client not initialised");
    }

    const std::string url = options_.base_url + endpoint;

    for (int attempt = 0; attempt < 2; ++attempt) {
        std::string token;
        const Auth::AuthStatus st = manager_->accessToken(ctx, token);
        if (!st.ok()) {
            return ApiError::make(st.code == Auth::AuthErrc::CANCELLED ? ApiErrc::CANCELLED : ApiErrc::AUTH,
                                  "failed to get access token: " + st.toString());
        }

        std::vector<std::string> headers = commonHeaders();
        headers.emplace_back("Authorization: Salter " + token);
        headers.emplace_back("Content-Type: application/json");

        HttpResponse response;
        const ApiError err = doRequest(ctx, url, headers, response);
        if (!err.ok()) {
            return err;
        }

        // The cached token was rejected: refresh once and retry once
        if (response.status == 401 && attempt == 0) {
            LOG_INFO("401 from %s, forcing token update", endpoint.c_str());
            const Auth::AuthStatus forced = manager_->forceUpdate(ctx);
            if (!forced.ok()) {
                return ApiError::make(forced.code == Auth::AuthErrc::CANCELLED ? ApiErrc::CANCELLED : ApiErrc::AUTH,
                                      "failed to refresh token: " + forced.toString());
            }
            continue;
        }

        if (response.status != 200) {
            return ApiError::fromHttpStatus(response.status, endpoint);
        }

        body = std::move(response.body);
        return ApiError::success();
    }

    return ApiError{ApiErrc::UNAUTHORIZED, 401, endpoint + ": rejected after token refresh"};
}

auto HttpClient::apiGetJson(const Common::Context& ctx, const std::string& endpoint,
                            rapidjson::Document& doc) noexcept -> ApiError {
    std::string body;
    ApiError err = apiGet(ctx, endpoint, body);
    if (!err.ok()) {
        return err;
    }

    doc.Parse(body.data(), body.size());
    if (doc.HasParseError()) {
        return ApiError::make(ApiErrc::DECODE,
                              endpoint + ": " + rapidjson::GetParseError_En(doc.GetParseError()) +
                              " at offset " + std::to_string(doc.GetErrorOffset()));
    }
    return ApiError::success();
}

auto HttpClient::close(const Common::Context& ctx) noexcept -> ApiError {
    if (!manager_) {
        return ApiError::success();
    }
    const Auth::AuthStatus st = manager_->close(ctx);
    if (!st.ok()) {
        return ApiError::make(ApiErrc::AUTH, st.toString());
    }
    return ApiError::success();
}

} // namespace Nepse
