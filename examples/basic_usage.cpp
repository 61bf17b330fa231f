#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "common/context.h"
#include "common/logging.h"
#include "config/config.h"
#include "nepse/http_client.h"
#include "nepse/market_data.h"

static void showUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [config.toml] [SYMBOL]\n\n";
    std::cout << "Prints market status, the NEPSE index and one security lookup.\n";
    std::cout << "Example: " << prog << " config/nepse_config.toml NABIL\n";
}

int main(int argc, char* argv[]) {
    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        showUsage(argv[0]);
        return 0;
    }

    const char* config_file = argc > 1 ? argv[1] : nullptr;
    const char* symbol = argc > 2 ? argv[2] : "NABIL";

    if (!Nepse::ConfigManager::init(config_file)) {
        std::cerr << "Failed to load configuration" << (config_file ? std::string(" from ") + config_file : "") << "\n";
        return 1;
    }
    const auto& cfg = Nepse::getNepseConfig();

    char log_file[512];
    if (!Nepse::ConfigManager::getLogFilePath(log_file, sizeof(log_file), "nepse")) {
        std::cerr << "Failed to build log file path\n";
        return 1;
    }
    Common::initLogging(log_file);
    Common::setLogLevel(Common::parseLogLevel(cfg.logging.level, Common::LogLevel::INFO));
    Nepse::ConfigManager::printConfig();

    Nepse::HttpClient client(Nepse::ClientOptions::fromConfig(cfg));
    Nepse::ApiError err = client.init(Nepse::managerOptionsFromConfig(cfg));
    if (!err.ok()) {
        std::cerr << "Client init failed: " << err.toString() << "\n";
        Common::shutdownLogging();
        return 1;
    }

    Nepse::MarketDataClient market(client);
    const auto ctx = Common::Context::timeoutFromNow(std::chrono::seconds(60));
    int rc = 0;

    Nepse::MarketStatus status;
    err = market.getMarketStatus(ctx, status);
    if (err.ok()) {
        std::printf("Market: %s (as of %s)\n", status.status, status.as_of);
    } else {
        std::fprintf(stderr, "Market status failed: %s\n", err.toString().c_str());
        rc = 1;
    }

    Nepse::IndexEntry index;
    err = market.getNepseIndex(ctx, index);
    if (err.ok()) {
        std::printf("%s: %.2f (%+.2f, %+.2f%%)\n", index.name, index.current_value, index.change, index.percent_change);
    } else {
        std::fprintf(stderr, "NEPSE index failed: %s\n", err.toString().c_str());
        rc = 1;
    }

    Nepse::Security security;
    err = market.findSecurity(ctx, symbol, security);
    if (err.ok()) {
        std::printf("%s [%d]: %s (%s)\n", security.symbol, security.id, security.security_name, security.active_status);
    } else {
        std::fprintf(stderr, "Lookup of %s failed: %s\n", symbol, err.toString().c_str());
        rc = 1;
    }

    const Nepse::ApiError closed = client.close(ctx);
    if (!closed.ok()) {
        LOG_WARN("Close failed: %s", closed.toString().c_str());
    }

    Common::shutdownLogging();
    return rc;
}
