#include "nepse/market_data.h"
#include "common/logging.h"
#include "common/macros.h"

#include <cstdlib>
#include <cstring>
#include <strings.h>

namespace Nepse {

namespace {

// Numbers arrive either as JSON numbers or as numeric strings
double getDouble(const rapidjson::Value& obj, const char* key, double fallback = 0.0) {
    if (!obj.HasMember(key)) {
        return fallback;
    }
    const rapidjson::Value& v = obj[key];
    if (v.IsNumber()) {
        return v.GetDouble();
    }
    if (v.IsString()) {
        char* end = nullptr;
        const double parsed = std::strtod(v.GetString(), &end);
        return end != v.GetString() ? parsed : fallback;
    }
    return fallback;
}

int32_t getInt(const rapidjson::Value& obj, const char* key, int32_t fallback = 0) {
    if (!obj.HasMember(key)) {
        return fallback;
    }
    const rapidjson::Value& v = obj[key];
    if (v.IsInt()) {
        return v.GetInt();
    }
    if (v.IsNumber()) {
        return static_cast<int32_t>(v.GetDouble());
    }
    return fallback;
}

template <std::size_t N>
void getString(const rapidjson::Value& obj, const char* key, char (&dst)[N]) {
    if (obj.HasMember(key) && obj[key].IsString()) {
        COPY_FIXED(dst, obj[key].GetString());
    } else {
        dst[0] = '\0';
    }
}

} // namespace

// ============================================================================
// Parsers
// ============================================================================

bool MarketDataClient::parseMarketStatus(const rapidjson::Value& v, MarketStatus& out) noexcept {
    if (!v.IsObject() || !v.HasMember("isOpen")) {
        return false;
    }

    MarketStatus status;
    const rapidjson::Value& open = v["isOpen"];
    if (open.IsBool()) {
        status.is_open = open.GetBool();
        COPY_FIXED(status.status, status.is_open ? "OPEN" : "CLOSE");
    } else if (open.IsString()) {
        COPY_FIXED(status.status, open.GetString());
        status.is_open = strcasecmp(status.status, "OPEN") == 0;
    } else {
        return false;
    }
    getString(v, "asOf", status.as_of);
    status.id = getInt(v, "id");

    out = status;
    return true;
}

bool MarketDataClient::parseMarketSummary(const rapidjson::Value& v, MarketSummary& out) noexcept {
    if (!v.IsArray()) {
        return false;
    }

    // Array of {"detail": label, "value": number}
    MarketSummary summary;
    for (const auto& item : v.GetArray()) {
        if (!item.IsObject() || !item.HasMember("detail") || !item["detail"].IsString()) {
            continue;
        }
        const char* detail = item["detail"].GetString();
        const double value = getDouble(item, "value");

        if (std::strcmp(detail, "Total Turnover Rs:") == 0) {
            summary.total_turnover = value;
        } else if (std::strcmp(detail, "Total Traded Shares") == 0) {
            summary.total_traded_shares = value;
        } else if (std::strcmp(detail, "Total Transactions") == 0) {
            summary.total_transactions = value;
        } else if (std::strcmp(detail, "Total Scrips Traded") == 0) {
            summary.total_scrips_traded = value;
        } else if (std::strcmp(detail, "Total Market Capitalization Rs:") == 0) {
            summary.total_market_cap = value;
        } else if (std::strcmp(detail, "Total Float Market Capitalization Rs:") == 0) {
            summary.total_float_market_cap = value;
        }
    }

    out = summary;
    return true;
}

bool MarketDataClient::parseIndexList(const rapidjson::Value& v, std::vector<IndexEntry>& out) noexcept {
    if (!v.IsArray()) {
        return false;
    }

    std::vector<IndexEntry> entries;
    entries.reserve(v.Size());
    for (const auto& item : v.GetArray()) {
        if (!item.IsObject()) {
            continue;
        }
        IndexEntry e;
        e.id = getInt(item, "id");
        getString(item, "index", e.name);
        e.close = getDouble(item, "close");
        e.high = getDouble(item, "high");
        e.low = getDouble(item, "low");
        e.previous_close = getDouble(item, "previousClose");
        e.change = getDouble(item, "change");
        e.percent_change = getDouble(item, "perChange");
        e.fifty_two_week_high = getDouble(item, "fiftyTwoWeekHigh");
        e.fifty_two_week_low = getDouble(item, "fiftyTwoWeekLow");
        e.current_value = getDouble(item, "currentValue");
        getString(item, "generatedTime", e.generated_time);
        entries.push_back(e);
    }

    out = std::move(entries);
    return true;
}

bool MarketDataClient::parseSecurityList(const rapidjson::Value& v, std::vector<Security>& out) noexcept {
    if (!v.IsArray()) {
        return false;
    }

    std::vector<Security> securities;
    securities.reserve(v.Size());
    for (const auto& item : v.GetArray()) {
        if (!item.IsObject() || !item.HasMember("symbol")) {
            continue;
        }
        Security s;
        s.id = getInt(item, "id");
        getString(item, "symbol", s.symbol);
        getString(item, "securityName", s.security_name);
        getString(item, "activeStatus", s.active_status);
        securities.push_back(s);
    }

    out = std::move(securities);
    return true;
}

bool MarketDataClient::parseTopList(const rapidjson::Value& v, std::vector<TopListEntry>& out) noexcept {
    if (!v.IsArray()) {
        return false;
    }

    std::vector<TopListEntry> entries;
    entries.reserve(v.Size());
    for (const auto& item : v.GetArray()) {
        if (!item.IsObject()) {
            continue;
        }
        TopListEntry e;
        e.security_id = getInt(item, "securityId");
        getString(item, "symbol", e.symbol);
        getString(item, "securityName", e.security_name);
        e.ltp = getDouble(item, "ltp");
        e.point_change = getDouble(item, "pointChange");
        e.percentage_change = getDouble(item, "percentageChange");
        entries.push_back(e);
    }

    out = std::move(entries);
    return true;
}

// ============================================================================
// Endpoints
// ============================================================================

auto MarketDataClient::getMarketStatus(const Common::Context& ctx, MarketStatus& out) noexcept -> ApiError {
    rapidjson::Document doc;
    ApiError err = client_.apiGetJson(ctx, MARKET_OPEN, doc);
    if (!err.ok()) {
        return err;
    }
    if (!parseMarketStatus(doc, out)) {
        return ApiError::make(ApiErrc::DECODE, "unexpected market status payload");
    }
    return ApiError::success();
}

auto MarketDataClient::getMarketSummary(const Common::Context& ctx, MarketSummary& out) noexcept -> ApiError {
    rapidjson::Document doc;
    ApiError err = client_.apiGetJson(ctx, MARKET_SUMMARY, doc);
    if (!err.ok()) {
        return err;
    }
    if (!parseMarketSummary(doc, out)) {
        return ApiError::make(ApiErrc::DECODE, "unexpected market summary payload");
    }
    return ApiError::success();
}

auto MarketDataClient::getIndexList(const Common::Context& ctx, std::vector<IndexEntry>& out) noexcept -> ApiError {
    rapidjson::Document doc;
    ApiError err = client_.apiGetJson(ctx, NEPSE_INDEX, doc);
    if (!err.ok()) {
        return err;
    }
    if (!parseIndexList(doc, out)) {
        return ApiError::make(ApiErrc::DECODE, "unexpected index payload");
    }
    return ApiError::success();
}

auto MarketDataClient::getNepseIndex(const Common::Context& ctx, IndexEntry& out) noexcept -> ApiError {
    std::vector<IndexEntry> entries;
    ApiError err = getIndexList(ctx, entries);
    if (!err.ok()) {
        return err;
    }
    for (const auto& e : entries) {
        if (e.id == NEPSE_INDEX_ID && std::strcmp(e.name, "NEPSE Index") == 0) {
            out = e;
            return ApiError::success();
        }
    }
    return ApiError::make(ApiErrc::NOT_FOUND, "NEPSE Index not present in index list");
}

auto MarketDataClient::getSubIndices(const Common::Context& ctx, std::vector<IndexEntry>& out) noexcept -> ApiError {
    std::vector<IndexEntry> entries;
    ApiError err = getIndexList(ctx, entries);
    if (!err.ok()) {
        return err;
    }
    out.clear();
    for (const auto& e : entries) {
        if (!isMainIndex(e.id)) {
            out.push_back(e);
        }
    }
    return ApiError::success();
}

auto MarketDataClient::getSecurityList(const Common::Context& ctx, std::vector<Security>& out) noexcept -> ApiError {
    rapidjson::Document doc;
    ApiError err = client_.apiGetJson(ctx, SECURITY_LIST, doc);
    if (!err.ok()) {
        return err;
    }
    if (!parseSecurityList(doc, out)) {
        return ApiError::make(ApiErrc::DECODE, "unexpected security list payload");
    }
    LOG_DEBUG("Security list: %zu entries", out.size());
    return ApiError::success();
}

auto MarketDataClient::findSecurity(const Common::Context& ctx, const char* symbol, Security& out) noexcept -> ApiError {
    if (!symbol || !symbol[0]) {
        return ApiError::make(ApiErrc::NOT_FOUND, "empty symbol");
    }

    std::vector<Security> securities;
    ApiError err = getSecurityList(ctx, securities);
    if (!err.ok()) {
        return err;
    }
    for (const auto& s : securities) {
        if (strcasecmp(s.symbol, symbol) == 0) {
            out = s;
            return ApiError::success();
        }
    }
    return ApiError::make(ApiErrc::NOT_FOUND, std::string("security ") + symbol);
}

auto MarketDataClient::getTopList(const Common::Context& ctx, const char* endpoint,
                                  std::vector<TopListEntry>& out) noexcept -> ApiError {
    rapidjson::Document doc;
    ApiError err = client_.apiGetJson(ctx, endpoint, doc);
    if (!err.ok()) {
        return err;
    }
    if (!parseTopList(doc, out)) {
        return ApiError::make(ApiErrc::DECODE, std::string("unexpected payload from ") + endpoint);
    }
    return ApiError::success();
}

auto MarketDataClient::getTopGainers(const Common::Context& ctx, std::vector<TopListEntry>& out) noexcept -> ApiError {
    return getTopList(ctx, TOP_GAINERS, out);
}

auto MarketDataClient::getTopLosers(const Common::Context& ctx, std::vector<TopListEntry>& out) noexcept -> ApiError {
    return getTopList(ctx, TOP_LOSERS, out);
}

} // namespace Nepse
