#pragma once

#include "common/macros.h"
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace Nepse {

// Complete client configuration - fixed size, no dynamic allocation
struct NepseConfig {
    // HTTP client
    struct Client {
        char base_url[256];
        bool tls_verification;
        uint32_t http_timeout_ms;
        uint32_t max_retries;
        uint32_t retry_delay_ms;
        char user_agent[256];
    } client;

    // Token lifecycle
    struct Auth {
        uint32_t validity_window_s;
        bool prefer_refresh_endpoint;
        char wasm_module[256];      // empty = use the embedded module
        char wasm_sha256[72];       // empty = digest not pinned
    } auth;

    // Logging config
    struct Logging {
        char level[16];
        char file[256];             // empty = <logs_dir>/nepse_<timestamp>.log
    } logging;

    // File paths
    struct Paths {
        char logs_dir[256];
        char env_file[256];
    } paths;

    // Validation
    bool is_valid{false};
};

// Configuration manager for the client
class ConfigManager {
private:
    static NepseConfig config_;
    static bool initialized_;

    static auto parseTomlFile(const char* filepath) noexcept -> bool;
    static auto parseLine(const char* section, const char* line) noexcept -> void;
    static auto applyEnvOverrides() noexcept -> void;

public:
    // Helpers to extract value from key = value line
    static auto extractStringValue(const char* line, const char* key, char* value, size_t max_len) noexcept -> bool;
    static auto extractIntValue(const char* line, const char* key, int64_t* value) noexcept -> bool;
    static auto extractUintValue(const char* line, const char* key, uint64_t* value) noexcept -> bool;
    static auto extractBoolValue(const char* line, const char* key, bool* value) noexcept -> bool;

    // Built-in defaults, usable without any config file
    [[nodiscard]] static auto defaults() noexcept -> NepseConfig;

    // Initialize from TOML config file. nullptr = defaults plus environment.
    [[nodiscard]] static auto init(const char* config_file = nullptr) noexcept -> bool;

    // Drop the loaded configuration so init() can run again
    static auto reset() noexcept -> void;

    [[nodiscard]] static auto getConfig() noexcept -> const NepseConfig& {
        return config_;
    }

    [[nodiscard]] static auto getBaseUrl() noexcept -> const char* {
        return config_.client.base_url;
    }

    [[nodiscard]] static auto isTlsVerificationEnabled() noexcept -> bool {
        return config_.client.tls_verification;
    }

    [[nodiscard]] static auto getValidityWindowSeconds() noexcept -> uint32_t {
        return config_.auth.validity_window_s;
    }

    [[nodiscard]] static auto getLogsDir() noexcept -> const char* {
        return config_.paths.logs_dir;
    }

    [[nodiscard]] static auto isInitialized() noexcept -> bool {
        return initialized_ && config_.is_valid;
    }

    [[nodiscard]] static auto validateConfig() noexcept -> bool;

    // Formats the log file path: [logging] file, else <logs_dir>/<component>_YYYYMMDD_HHMMSS.log
    static auto getLogFilePath(char* buffer, size_t len, const char* component) noexcept -> bool;

    static auto printConfig() noexcept -> void;
};

// Helper class to load .env file
class EnvLoader {
public:
    // Load KEY=VALUE lines into the process environment (existing variables win)
    [[nodiscard]] static auto loadFromFile(const char* filepath) noexcept -> bool;

    // Get environment variable with fallback
    [[nodiscard]] static auto getEnv(const char* key, const char* default_val = nullptr) noexcept -> const char*;

private:
    static auto setEnvVar(const char* line) noexcept -> bool;
};

// Global accessor function
[[nodiscard]] inline auto getNepseConfig() noexcept -> const NepseConfig& {
    return ConfigManager::getConfig();
}

} // namespace Nepse
