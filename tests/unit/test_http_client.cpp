#include <gtest/gtest.h>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <string>

#include "common/logging.h"
#include "config/config.h"
#include "fake_http_client.h"
#include "nepse/http_client.h"

using namespace Nepse;
using NepseTest::FakeHttpClient;
using Reply = FakeHttpClient::Reply;

namespace {

constexpr const char* MARKET_OPEN = "/api/nots/nepse-data/market-open";

} // namespace

class HttpClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::filesystem::create_directories("logs");
        Common::initLogging("logs/test_http_client.log");
        Common::setLogLevel(Common::LogLevel::DEBUG);
        LOG_INFO("=== Starting HttpClient Test ===");
    }

    void TearDown() override {
        LOG_INFO("=== HttpClient Test Completed ===");
        Common::shutdownLogging();
    }

    Common::Context ctx_ = Common::Context::background();
};

// ============================================================================
// Token bundle decoding
// ============================================================================

TEST(TokenBundleParseContract, DecodesCompleteBody) {
    const std::string body = FakeHttpClient::PROVE_BODY;
    Auth::TokenBundle bundle;
    std::string error;
    ASSERT_TRUE(parseTokenBundle(body.data(), body.size(), bundle, error)) << error;
    EXPECT_EQ(bundle.salts, (Auth::Salts{1, 2, 3, 4, 5}));
    EXPECT_EQ(bundle.access_token, "12345access-one");
    EXPECT_EQ(bundle.refresh_token, "12345refresh-one");
    EXPECT_EQ(bundle.server_time_ms, 0);
}

TEST(TokenBundleParseContract, ServerTimeIsOptional) {
    const std::string body =
        R"({"salt1":-1,"salt2":2,"salt3":3,"salt4":4,"salt5":5,"accessToken":"a","refreshToken":"r",)"
        R"("serverTime":1700000000123})";
    Auth::TokenBundle bundle;
    std::string error;
    ASSERT_TRUE(parseTokenBundle(body.data(), body.size(), bundle, error)) << error;
    EXPECT_EQ(bundle.salts[0], -1);
    EXPECT_EQ(bundle.server_time_ms, 1700000000123LL);
}

TEST(TokenBundleParseContract, RejectsMissingOrMistypedFields) {
    Auth::TokenBundle bundle;
    std::string error;

    const std::string no_salt = R"({"salt1":1,"salt2":2,"salt3":3,"salt4":4,"accessToken":"a","refreshToken":"r"})";
    EXPECT_FALSE(parseTokenBundle(no_salt.data(), no_salt.size(), bundle, error));
    EXPECT_NE(error.find("salt5"), std::string::npos);

    const std::string string_salt =
        R"({"salt1":"1","salt2":2,"salt3":3,"salt4":4,"salt5":5,"accessToken":"a","refreshToken":"r"})";
    EXPECT_FALSE(parseTokenBundle(string_salt.data(), string_salt.size(), bundle, error));

    const std::string no_refresh = R"({"salt1":1,"salt2":2,"salt3":3,"salt4":4,"salt5":5,"accessToken":"a"})";
    EXPECT_FALSE(parseTokenBundle(no_refresh.data(), no_refresh.size(), bundle, error));
    EXPECT_NE(error.find("refreshToken"), std::string::npos);

    const std::string not_json = "<html>blocked</html>";
    EXPECT_FALSE(parseTokenBundle(not_json.data(), not_json.size(), bundle, error));

    const std::string array = "[1,2,3]";
    EXPECT_FALSE(parseTokenBundle(array.data(), array.size(), bundle, error));
}

// ============================================================================
// Error mapping and backoff
// ============================================================================

TEST(ApiErrorContract, MapsHttpStatus) {
    EXPECT_EQ(ApiError::fromHttpStatus(401, "x").code, ApiErrc::UNAUTHORIZED);
    EXPECT_EQ(ApiError::fromHttpStatus(403, "x").code, ApiErrc::FORBIDDEN);
    EXPECT_EQ(ApiError::fromHttpStatus(404, "x").code, ApiErrc::NOT_FOUND);
    EXPECT_EQ(ApiError::fromHttpStatus(429, "x").code, ApiErrc::RATE_LIMIT);
    EXPECT_EQ(ApiError::fromHttpStatus(502, "x").code, ApiErrc::SERVER);
    EXPECT_EQ(ApiError::fromHttpStatus(418, "x").code, ApiErrc::HTTP);

    const ApiError err = ApiError::fromHttpStatus(503, "/api/x");
    EXPECT_EQ(err.http_status, 503);
    EXPECT_EQ(err.toString(), "SERVER: /api/x: HTTP 503");
}

TEST(ApiErrorContract, OnlyTransientErrorsAreRetryable) {
    EXPECT_TRUE(ApiError::make(ApiErrc::NETWORK, "").isRetryable());
    EXPECT_TRUE(ApiError::fromHttpStatus(429, "").isRetryable());
    EXPECT_TRUE(ApiError::fromHttpStatus(500, "").isRetryable());
    EXPECT_FALSE(ApiError::fromHttpStatus(400, "").isRetryable());
    EXPECT_FALSE(ApiError::fromHttpStatus(401, "").isRetryable());
    EXPECT_FALSE(ApiError::make(ApiErrc::DECODE, "").isRetryable());
}

TEST(RetryBackoffContract, DoublesUpToThirtySeconds) {
    using std::chrono::milliseconds;
    EXPECT_EQ(retryBackoff(milliseconds(1000), 0), milliseconds(0));
    EXPECT_EQ(retryBackoff(milliseconds(1000), 1), milliseconds(1000));
    EXPECT_EQ(retryBackoff(milliseconds(1000), 2), milliseconds(2000));
    EXPECT_EQ(retryBackoff(milliseconds(1000), 3), milliseconds(4000));
    EXPECT_EQ(retryBackoff(milliseconds(1000), 6), milliseconds(30000));
    EXPECT_EQ(retryBackoff(milliseconds(1000), 200), milliseconds(30000));
}

TEST(ClientOptionsContract, BuiltFromConfig) {
    Nepse::NepseConfig cfg = ConfigManager::defaults();
    cfg.client.http_timeout_ms = 1234;
    cfg.client.tls_verification = false;
    cfg.auth.validity_window_s = 20;
    cfg.auth.prefer_refresh_endpoint = true;
    COPY_FIXED(cfg.auth.wasm_sha256, "ab12");

    const ClientOptions opts = ClientOptions::fromConfig(cfg);
    EXPECT_EQ(opts.base_url, "https://www.nepalstock.com.np");
    EXPECT_EQ(opts.timeout, std::chrono::milliseconds(1234));
    EXPECT_FALSE(opts.tls_verification);

    const Auth::ManagerOptions mopts = managerOptionsFromConfig(cfg);
    EXPECT_EQ(mopts.validity_window, std::chrono::seconds(20));
    EXPECT_TRUE(mopts.prefer_refresh_endpoint);
    EXPECT_TRUE(mopts.wasm_module.empty());
    EXPECT_EQ(mopts.module_sha256, "ab12");
}

// ============================================================================
// Transport behaviour through the scripted client
// ============================================================================

TEST_F(HttpClientTest, AuthenticatedGetSendsSalterToken) {
    FakeHttpClient client;
    ASSERT_TRUE(client.initWithScriptedEnv().ok());
    client.script(MARKET_OPEN, {Reply{true, 200, R"({"isOpen":"CLOSE"})"}});

    std::string body;
    const ApiError err = client.apiGet(ctx_, MARKET_OPEN, body);
    ASSERT_TRUE(err.ok()) << err.toString();
    EXPECT_EQ(body, R"({"isOpen":"CLOSE"})");

    const auto calls = client.requestsTo(MARKET_OPEN);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_TRUE(FakeHttpClient::hasHeader(calls[0], "Authorization: Salter access-one"));
    EXPECT_TRUE(FakeHttpClient::hasHeader(calls[0], "Origin: https://nepse.test"));
    EXPECT_TRUE(FakeHttpClient::hasHeader(calls[0], "Referer: https://nepse.test/"));

    const auto proves = client.requestsTo(HttpClient::PROVE_ENDPOINT);
    ASSERT_EQ(proves.size(), 1u);
    for (const auto& h : proves[0].headers) {
        EXPECT_EQ(h.rfind("Authorization:", 0), std::string::npos) << h;
    }
}

TEST_F(HttpClientTest, UnauthorizedForcesOneUpdateAndOneRetry) {
    FakeHttpClient client;
    ASSERT_TRUE(client.initWithScriptedEnv().ok());
    client.script(MARKET_OPEN, {Reply{true, 401, ""}, Reply{true, 200, "{}"}});

    std::string body;
    const ApiError err = client.apiGet(ctx_, MARKET_OPEN, body);
    ASSERT_TRUE(err.ok()) << err.toString();
    EXPECT_EQ(body, "{}");
    EXPECT_EQ(client.requestsTo(MARKET_OPEN).size(), 2u);
    EXPECT_EQ(client.requestsTo(HttpClient::PROVE_ENDPOINT).size(), 2u);
}

TEST_F(HttpClientTest, SecondUnauthorizedIsReturned) {
    FakeHttpClient client;
    ASSERT_TRUE(client.initWithScriptedEnv().ok());
    client.script(MARKET_OPEN, {Reply{true, 401, ""}});

    std::string body;
    const ApiError err = client.apiGet(ctx_, MARKET_OPEN, body);
    EXPECT_EQ(err.code, ApiErrc::UNAUTHORIZED);
    EXPECT_EQ(err.http_status, 401);
    EXPECT_EQ(client.requestsTo(MARKET_OPEN).size(), 2u);
    EXPECT_EQ(client.requestsTo(HttpClient::PROVE_ENDPOINT).size(), 2u);
}

TEST_F(HttpClientTest, RetriesServerErrorsThenSucceeds) {
    FakeHttpClient client;
    ASSERT_TRUE(client.initWithScriptedEnv().ok());
    client.script(MARKET_OPEN, {Reply{true, 503, ""}, Reply{false, 0, ""}, Reply{true, 200, "[]"}});

    std::string body;
    const ApiError err = client.apiGet(ctx_, MARKET_OPEN, body);
    ASSERT_TRUE(err.ok()) << err.toString();
    EXPECT_EQ(body, "[]");
    EXPECT_EQ(client.requestsTo(MARKET_OPEN).size(), 3u);
}

TEST_F(HttpClientTest, GivesUpAfterMaxRetries) {
    FakeHttpClient client;
    ASSERT_TRUE(client.initWithScriptedEnv().ok());
    client.script(MARKET_OPEN, {Reply{true, 500, ""}});

    std::string body;
    const ApiError err = client.apiGet(ctx_, MARKET_OPEN, body);
    EXPECT_EQ(err.code, ApiErrc::SERVER);
    EXPECT_EQ(client.requestsTo(MARKET_OPEN).size(), 3u);   // first try + max_retries
}

TEST_F(HttpClientTest, ClientErrorsAreNotRetried) {
    FakeHttpClient client;
    ASSERT_TRUE(client.initWithScriptedEnv().ok());
    client.script(MARKET_OPEN, {Reply{true, 403, ""}});

    std::string body;
    EXPECT_EQ(client.apiGet(ctx_, MARKET_OPEN, body).code, ApiErrc::FORBIDDEN);
    EXPECT_EQ(client.requestsTo(MARKET_OPEN).size(), 1u);
}

TEST_F(HttpClientTest, NetworkFailureAfterRetries) {
    FakeHttpClient client;
    ASSERT_TRUE(client.initWithScriptedEnv().ok());
    client.script(MARKET_OPEN, {Reply{false, 0, ""}});

    std::string body;
    const ApiError err = client.apiGet(ctx_, MARKET_OPEN, body);
    EXPECT_EQ(err.code, ApiErrc::NETWORK);
    EXPECT_NE(err.message.find("Couldn't connect"), std::string::npos);
}

TEST_F(HttpClientTest, ProveFailureSurfacesAsAuth) {
    FakeHttpClient client;
    ASSERT_TRUE(client.initWithScriptedEnv().ok());
    client.script(HttpClient::PROVE_ENDPOINT, {Reply{true, 403, ""}});

    std::string body;
    const ApiError err = client.apiGet(ctx_, MARKET_OPEN, body);
    EXPECT_EQ(err.code, ApiErrc::AUTH);
    EXPECT_NE(err.message.find("FETCH"), std::string::npos);
    EXPECT_TRUE(client.requestsTo(MARKET_OPEN).empty());
}

TEST_F(HttpClientTest, CancelledContextStopsRequest) {
    FakeHttpClient client;
    ASSERT_TRUE(client.initWithScriptedEnv().ok());

    std::string token;
    ASSERT_TRUE(client.tokenManager()->accessToken(ctx_, token).ok());

    std::string body;
    const auto ctx = Common::Context::background();
    ctx.cancel();
    const ApiError err = client.apiGet(ctx, MARKET_OPEN, body);
    EXPECT_EQ(err.code, ApiErrc::CANCELLED);
    EXPECT_TRUE(client.requestsTo(MARKET_OPEN).empty());
}

TEST_F(HttpClientTest, RefreshRequestCarriesRefreshToken) {
    FakeHttpClient client;
    client.script(HttpClient::REFRESH_ENDPOINT, {Reply{true, 200, FakeHttpClient::PROVE_BODY}});

    Auth::TokenBundle bundle;
    std::string error;
    ASSERT_TRUE(client.fetchRefreshedBundle(ctx_, "refresh-one", bundle, error)) << error;
    EXPECT_EQ(bundle.access_token, "12345access-one");

    const auto calls = client.requestsTo(HttpClient::REFRESH_ENDPOINT);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_TRUE(FakeHttpClient::hasHeader(calls[0], "Authorization: Salter refresh-one"));
}

TEST_F(HttpClientTest, MalformedJsonIsDecodeError) {
    FakeHttpClient client;
    ASSERT_TRUE(client.initWithScriptedEnv().ok());
    client.script(MARKET_OPEN, {Reply{true, 200, "{\"isOpen\": "}});

    rapidjson::Document doc;
    const ApiError err = client.apiGetJson(ctx_, MARKET_OPEN, doc);
    EXPECT_EQ(err.code, ApiErrc::DECODE);
}

TEST_F(HttpClientTest, UninitialisedClientReportsAuth) {
    FakeHttpClient client;
    std::string body;
    EXPECT_EQ(client.apiGet(ctx_, MARKET_OPEN, body).code, ApiErrc::AUTH);
    EXPECT_TRUE(client.close(ctx_).ok());
}

TEST_F(HttpClientTest, CloseIsIdempotent) {
    FakeHttpClient client;
    ASSERT_TRUE(client.initWithScriptedEnv().ok());
    EXPECT_TRUE(client.close(ctx_).ok());
    EXPECT_TRUE(client.close(ctx_).ok());

    std::string body;
    const ApiError err = client.apiGet(ctx_, MARKET_OPEN, body);
    EXPECT_EQ(err.code, ApiErrc::AUTH);
    EXPECT_NE(err.message.find("DERIVATION(CALL)"), std::string::npos);
}
