// ============================================================================
// market_data.h - Typed NEPSE market endpoints
// ============================================================================

#pragma once

#include <cstdint>
#include <vector>

#include "common/context.h"
#include "nepse/http_client.h"
#include "nepse/nepse_error.h"

#include <rapidjson/document.h>

namespace Nepse {

// ============================================================================
// Response types
// ============================================================================
struct MarketStatus {
    bool is_open{false};
    char status[16]{};          // "OPEN" / "CLOSE" as reported
    char as_of[32]{};
    int32_t id{0};
};

struct MarketSummary {
    double total_turnover{0.0};
    double total_traded_shares{0.0};
    double total_transactions{0.0};
    double total_scrips_traded{0.0};
    double total_market_cap{0.0};
    double total_float_market_cap{0.0};
};

struct IndexEntry {
    int32_t id{0};
    char name[64]{};
    double close{0.0};
    double high{0.0};
    double low{0.0};
    double previous_close{0.0};
    double change{0.0};
    double percent_change{0.0};
    double fifty_two_week_high{0.0};
    double fifty_two_week_low{0.0};
    double current_value{0.0};
    char generated_time[32]{};
};

struct Security {
    int32_t id{0};
    char symbol[32]{};
    char security_name[128]{};
    char active_status[8]{};
};

struct TopListEntry {
    int32_t security_id{0};
    char symbol[32]{};
    char security_name[128]{};
    double ltp{0.0};
    double point_change{0.0};
    double percentage_change{0.0};
};

// ============================================================================
// Endpoint wrappers
// ============================================================================
class MarketDataClient {
public:
    static constexpr const char* MARKET_OPEN = "/api/nots/nepse-data/market-open";
    static constexpr const char* MARKET_SUMMARY = "/api/nots/market-summary/";
    static constexpr const char* NEPSE_INDEX = "/api/nots/nepse-index";
    static constexpr const char* SECURITY_LIST = "/api/nots/security?nonDelisted=true";
    static constexpr const char* TOP_GAINERS = "/api/nots/top-ten/top-gainer";
    static constexpr const char* TOP_LOSERS = "/api/nots/top-ten/top-loser";

    // Main index ids in the nepse-index payload
    static constexpr int32_t NEPSE_INDEX_ID = 58;
    static constexpr int32_t SENSITIVE_INDEX_ID = 57;
    static constexpr int32_t FLOAT_INDEX_ID = 62;
    static constexpr int32_t SENSITIVE_FLOAT_INDEX_ID = 63;

    explicit MarketDataClient(HttpClient& client) noexcept : client_(client) {}

    [[nodiscard]] auto getMarketStatus(const Common::Context& ctx, MarketStatus& out) noexcept -> ApiError;
    [[nodiscard]] auto getMarketSummary(const Common::Context& ctx, MarketSummary& out) noexcept -> ApiError;
    [[nodiscard]] auto getNepseIndex(const Common::Context& ctx, IndexEntry& out) noexcept -> ApiError;
    [[nodiscard]] auto getSubIndices(const Common::Context& ctx, std::vector<IndexEntry>& out) noexcept -> ApiError;
    [[nodiscard]] auto getSecurityList(const Common::Context& ctx, std::vector<Security>& out) noexcept -> ApiError;

    // Case-insensitive symbol match; NOT_FOUND when absent
    [[nodiscard]] auto findSecurity(const Common::Context& ctx, const char* symbol, Security& out) noexcept -> ApiError;

    [[nodiscard]] auto getTopGainers(const Common::Context& ctx, std::vector<TopListEntry>& out) noexcept -> ApiError;
    [[nodiscard]] auto getTopLosers(const Common::Context& ctx, std::vector<TopListEntry>& out) noexcept -> ApiError;

    // Parsers, usable on literal JSON
    [[nodiscard]] static bool parseMarketStatus(const rapidjson::Value& v, MarketStatus& out) noexcept;
    [[nodiscard]] static bool parseMarketSummary(const rapidjson::Value& v, MarketSummary& out) noexcept;
    [[nodiscard]] static bool parseIndexList(const rapidjson::Value& v, std::vector<IndexEntry>& out) noexcept;
    [[nodiscard]] static bool parseSecurityList(const rapidjson::Value& v, std::vector<Security>& out) noexcept;
    [[nodiscard]] static bool parseTopList(const rapidjson::Value& v, std::vector<TopListEntry>& out) noexcept;

    [[nodiscard]] static bool isMainIndex(int32_t id) noexcept {
        return id == NEPSE_INDEX_ID || id == SENSITIVE_INDEX_ID ||
               id == FLOAT_INDEX_ID || id == SENSITIVE_FLOAT_INDEX_ID;
    }

private:
    [[nodiscard]] auto getIndexList(const Common::Context& ctx, std::vector<IndexEntry>& out) noexcept -> ApiError;
    [[nodiscard]] auto getTopList(const Common::Context& ctx, const char* endpoint,
                                  std::vector<TopListEntry>& out) noexcept -> ApiError;

    HttpClient& client_;
};

} // namespace Nepse
