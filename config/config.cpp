#include "config/config.h"
#include "common/logging.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <strings.h>
#include <sys/stat.h>

namespace Nepse {

// Static member definitions
NepseConfig ConfigManager::config_{};
bool ConfigManager::initialized_ = false;

auto ConfigManager::defaults() noexcept -> NepseConfig {
    NepseConfig cfg{};
    COPY_FIXED(cfg.client.base_url, "https://www.nepalstock.com.np");
    cfg.client.tls_verification = true;
    cfg.client.http_timeout_ms = 30000;
    cfg.client.max_retries = 3;
    cfg.client.retry_delay_ms = 1000;
    COPY_FIXED(cfg.client.user_agent,
               "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
               "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36");

    cfg.auth.validity_window_s = 45;
    cfg.auth.prefer_refresh_endpoint = false;

    COPY_FIXED(cfg.logging.level, "INFO");

    COPY_FIXED(cfg.paths.logs_dir, "logs");
    COPY_FIXED(cfg.paths.env_file, ".env");
    return cfg;
}

auto ConfigManager::init(const char* config_file) noexcept -> bool {
    if (initialized_) {
        LOG_WARN("ConfigManager already initialized");
        return true;
    }

    config_ = defaults();

    if (config_file && !parseTomlFile(config_file)) {
        LOG_ERROR("Failed to parse TOML config file: %s", config_file);
        return false;
    }

    // .env first so its values feed the overrides below
    if (config_.paths.env_file[0] && !EnvLoader::loadFromFile(config_.paths.env_file)) {
        LOG_DEBUG("No .env file at %s", config_.paths.env_file);
    }
    applyEnvOverrides();

    if (!validateConfig()) {
        LOG_ERROR("Configuration validation failed");
        return false;
    }

    config_.is_valid = true;
    initialized_ = true;

    LOG_INFO("ConfigManager initialized from %s", config_file ? config_file : "<defaults>");
    printConfig();

    return true;
}

auto ConfigManager::reset() noexcept -> void {
    config_ = NepseConfig{};
    initialized_ = false;
}

auto ConfigManager::parseTomlFile(const char* filepath) noexcept -> bool {
    FILE* file = std::fopen(filepath, "r");
    if (!file) {
        LOG_ERROR("Cannot open config file: %s", filepath);
        return false;
    }

    char line[1024];
    char current_section[64] = "";

    while (std::fgets(line, sizeof(line), file)) {
        // Skip comments and empty lines
        if (line[0] == '#' || line[0] == '\n' || line[0] == '\r') {
            continue;
        }

        size_t len = std::strlen(line);
        while (len > 0 && (line[len - 1] == '\n' || line[len - 1] == '\r')) {
            line[--len] = '\0';
        }

        if (line[0] == '[') {
            char* end = std::strchr(line, ']');
            if (end) {
                *end = '\0';
                COPY_FIXED(current_section, line + 1);
            }
            continue;
        }

        parseLine(current_section, line);
    }

    std::fclose(file);
    return true;
}

auto ConfigManager::parseLine(const char* section, const char* line) noexcept -> void {
    uint64_t temp;
    if (std::strcmp(section, "client") == 0) {
        extractStringValue(line, "base_url", config_.client.base_url, sizeof(config_.client.base_url));
        extractBoolValue(line, "tls_verification", &config_.client.tls_verification);
        if (extractUintValue(line, "http_timeout_ms", &temp)) config_.client.http_timeout_ms = static_cast<uint32_t>(temp);
        if (extractUintValue(line, "max_retries", &temp)) config_.client.max_retries = static_cast<uint32_t>(temp);
        if (extractUintValue(line, "retry_delay_ms", &temp)) config_.client.retry_delay_ms = static_cast<uint32_t>(temp);
        extractStringValue(line, "user_agent", config_.client.user_agent, sizeof(config_.client.user_agent));
    }
    else if (std::strcmp(section, "auth") == 0) {
        if (extractUintValue(line, "validity_window_s", &temp)) config_.auth.validity_window_s = static_cast<uint32_t>(temp);
        extractBoolValue(line, "prefer_refresh_endpoint", &config_.auth.prefer_refresh_endpoint);
        extractStringValue(line, "wasm_module", config_.auth.wasm_module, sizeof(config_.auth.wasm_module));
        extractStringValue(line, "wasm_sha256", config_.auth.wasm_sha256, sizeof(config_.auth.wasm_sha256));
    }
    else if (std::strcmp(section, "logging") == 0) {
        extractStringValue(line, "level", config_.logging.level, sizeof(config_.logging.level));
        extractStringValue(line, "file", config_.logging.file, sizeof(config_.logging.file));
    }
    else if (std::strcmp(section, "paths") == 0) {
        extractStringValue(line, "logs_dir", config_.paths.logs_dir, sizeof(config_.paths.logs_dir));
        extractStringValue(line, "env_file", config_.paths.env_file, sizeof(config_.paths.env_file));
    }
}

auto ConfigManager::applyEnvOverrides() noexcept -> void {
    if (const char* url = EnvLoader::getEnv("NEPSE_BASE_URL")) {
        COPY_FIXED(config_.client.base_url, url);
    }
    if (const char* verify = EnvLoader::getEnv("NEPSE_TLS_VERIFY")) {
        config_.client.tls_verification = !(std::strcmp(verify, "0") == 0 ||
                                            strcasecmp(verify, "false") == 0 ||
                                            strcasecmp(verify, "no") == 0);
    }
}

// Key must match at the start of the line so "file" does not hit "env_file"
static auto findValueStart(const char* line, const char* key) noexcept -> const char* {
    while (*line == ' ' || *line == '\t') {
        ++line;
    }
    const size_t key_len = std::strlen(key);
    if (std::strncmp(line, key, key_len) != 0) {
        return nullptr;
    }
    const char* p = line + key_len;
    while (*p == ' ' || *p == '\t') {
        ++p;
    }
    if (*p != '=') {
        return nullptr;
    }
    ++p;
    while (*p == ' ' || *p == '\t') {
        ++p;
    }
    return p;
}

auto ConfigManager::extractStringValue(const char* line, const char* key, char* value, size_t max_len) noexcept -> bool {
    const char* start = findValueStart(line, key);
    if (!start || *start != '"') {
        return false;
    }

    ++start;
    const char* end = std::strchr(start, '"');
    if (!end) {
        return false;
    }

    size_t len = static_cast<size_t>(end - start);
    if (len >= max_len) {
        len = max_len - 1;
    }

    std::memcpy(value, start, len);
    value[len] = '\0';

    return true;
}

auto ConfigManager::extractIntValue(const char* line, const char* key, int64_t* value) noexcept -> bool {
    const char* start = findValueStart(line, key);
    if (!start) {
        return false;
    }

    char* end = nullptr;
    const long long parsed = std::strtoll(start, &end, 10);
    if (end == start) {
        return false;
    }
    *value = parsed;
    return true;
}

auto ConfigManager::extractUintValue(const char* line, const char* key, uint64_t* value) noexcept -> bool {
    const char* start = findValueStart(line, key);
    if (!start || *start == '-') {
        return false;
    }

    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(start, &end, 10);
    if (end == start) {
        return false;
    }
    *value = parsed;
    return true;
}

auto ConfigManager::extractBoolValue(const char* line, const char* key, bool* value) noexcept -> bool {
    const char* start = findValueStart(line, key);
    if (!start) {
        return false;
    }

    if (std::strncmp(start, "true", 4) == 0) {
        *value = true;
        return true;
    }
    if (std::strncmp(start, "false", 5) == 0) {
        *value = false;
        return true;
    }
    return false;
}

auto ConfigManager::validateConfig() noexcept -> bool {
    if (std::strncmp(config_.client.base_url, "http://", 7) != 0 &&
        std::strncmp(config_.client.base_url, "https://", 8) != 0) {
        LOG_ERROR("base_url must start with http:// or https://: %s", config_.client.base_url);
        return false;
    }

    if (config_.client.http_timeout_ms == 0) {
        LOG_ERROR("http_timeout_ms must be positive");
        return false;
    }

    if (config_.auth.validity_window_s == 0) {
        LOG_ERROR("validity_window_s must be positive");
        return false;
    }

    if (std::strlen(config_.paths.logs_dir) == 0) {
        LOG_ERROR("logs_dir not configured");
        return false;
    }

    // Strip one trailing slash so endpoint concatenation stays clean
    const size_t url_len = std::strlen(config_.client.base_url);
    if (url_len > 0 && config_.client.base_url[url_len - 1] == '/') {
        config_.client.base_url[url_len - 1] = '\0';
    }

    struct stat st{};
    if (stat(config_.paths.logs_dir, &st) != 0) {
        LOG_INFO("Creating logs directory: %s", config_.paths.logs_dir);
        if (mkdir(config_.paths.logs_dir, 0755) != 0 && errno != EEXIST) {
            LOG_WARN("Could not create logs directory %s: %s", config_.paths.logs_dir, std::strerror(errno));
        }
    }

    return true;
}

auto ConfigManager::getLogFilePath(char* buffer, size_t len, const char* component) noexcept -> bool {
    if (!buffer || len == 0 || !component) {
        return false;
    }

    if (config_.logging.file[0]) {
        const int written = std::snprintf(buffer, len, "%s", config_.logging.file);
        return written > 0 && static_cast<size_t>(written) < len;
    }

    const time_t now = std::time(nullptr);
    struct tm tm_info{};
    localtime_r(&now, &tm_info);
    char timestamp[32];
    std::strftime(timestamp, sizeof(timestamp), "%Y%m%d_%H%M%S", &tm_info);

    const char* dir = config_.paths.logs_dir[0] ? config_.paths.logs_dir : "logs";
    const int written = std::snprintf(buffer, len, "%s/%s_%s.log", dir, component, timestamp);

    return written > 0 && static_cast<size_t>(written) < len;
}

auto ConfigManager::printConfig() noexcept -> void {
    LOG_INFO("=== NEPSE Client Configuration ===");
    LOG_INFO("Client:");
    LOG_INFO("  Base URL: %s", config_.client.base_url);
    LOG_INFO("  TLS verification: %s", config_.client.tls_verification ? "on" : "off");
    LOG_INFO("  Timeout: %u ms, retries: %u, retry delay: %u ms",
             config_.client.http_timeout_ms, config_.client.max_retries, config_.client.retry_delay_ms);
    LOG_INFO("Auth:");
    LOG_INFO("  Validity window: %u s", config_.auth.validity_window_s);
    LOG_INFO("  Prefer refresh endpoint: %s", config_.auth.prefer_refresh_endpoint ? "yes" : "no");
    LOG_INFO("  Module: %s", config_.auth.wasm_module[0] ? config_.auth.wasm_module : "<embedded>");
    LOG_INFO("Paths:");
    LOG_INFO("  Logs: %s", config_.paths.logs_dir);
    LOG_INFO("==================================");
}

// ---------- EnvLoader ----------

auto EnvLoader::loadFromFile(const char* filepath) noexcept -> bool {
    FILE* fp = std::fopen(filepath, "r");
    if (!fp) {
        return false;
    }

    char line[1024];
    while (std::fgets(line, sizeof(line), fp)) {
        if (line[0] == '#' || line[0] == '\n' || line[0] == '\r') {
            continue;
        }
        setEnvVar(line);
    }

    std::fclose(fp);
    return true;
}

auto EnvLoader::getEnv(const char* key, const char* default_val) noexcept -> const char* {
    const char* value = std::getenv(key);
    return (value && value[0]) ? value : default_val;
}

auto EnvLoader::setEnvVar(const char* line) noexcept -> bool {
    char buf[1024];
    COPY_FIXED(buf, line);

    size_t len = std::strlen(buf);
    while (len > 0 && (buf[len - 1] == '\n' || buf[len - 1] == '\r' || buf[len - 1] == ' ')) {
        buf[--len] = '\0';
    }

    char* eq = std::strchr(buf, '=');
    if (!eq || eq == buf) {
        return false;
    }
    *eq = '\0';

    char* key = buf;
    while (*key == ' ') ++key;
    char* key_end = eq - 1;
    while (key_end > key && *key_end == ' ') *key_end-- = '\0';

    char* value = eq + 1;
    while (*value == ' ') ++value;
    const size_t vlen = std::strlen(value);
    if (vlen >= 2 && (value[0] == '"' || value[0] == '\'') && value[vlen - 1] == value[0]) {
        value[vlen - 1] = '\0';
        ++value;
    }

    return setenv(key, value, 0) == 0;
}

} // namespace Nepse
