#include <vigil/config/config_helpers.h>
#include <vigil/config/engine_config.h>

#include <spdlog/spdlog.h>

#include <array>
#include <charconv>

namespace vigil::config {

namespace {

Result<std::chrono::milliseconds> parseTimeoutMs(const std::string& raw) {
    long long value = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (raw.empty() || ec != std::errc() || ptr != raw.data() + raw.size() || value <= 0) {
        return Error{ErrorCode::ValidationError, "refresh.timeout_ms must be a positive integer, got '" +
                                                     raw + "'"};
    }
    return std::chrono::milliseconds(value);
}

Result<std::string> parseLogLevel(std::string raw) {
    static constexpr std::array<const char*, 9> kLevels = {
        "trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
    std::transform(raw.begin(), raw.end(), raw.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* level : kLevels) {
        if (raw == level) {
            return raw == "warning" ? std::string("warn") : raw;
        }
    }
    return Error{ErrorCode::ValidationError, "Unknown logging.level '" + raw + "'"};
}

} // namespace

EngineConfig EngineConfig::defaults() {
    EngineConfig config;
    config.dismissalsPath = get_data_dir() / "dismissals.json";
    config.sourcesConfigPath = get_config_dir() / "sources.json";
    config.spoolDir = get_data_dir() / "spool";
    return config;
}

Result<EngineConfig> EngineConfig::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("[EngineConfig] No config at '{}', using defaults", path.string());
        return defaults();
    }
    return fromFlatMap(parse_simple_toml_flat(path));
}

Result<EngineConfig> EngineConfig::fromFlatMap(const std::map<std::string, std::string>& kv) {
    EngineConfig config = defaults();

    if (auto it = kv.find("engine.enabled"); it != kv.end()) {
        config.enabled = is_truthy(it->second);
    }
    if (auto it = kv.find("refresh.timeout_ms"); it != kv.end()) {
        auto timeout = parseTimeoutMs(it->second);
        if (!timeout)
            return timeout.error();
        config.refreshTimeout = timeout.value();
    }
    if (auto it = kv.find("refresh.untracked_sources"); it != kv.end()) {
        for (auto& id : parse_string_list(it->second)) {
            config.untrackedSources.insert(std::move(id));
        }
    }
    if (auto it = kv.find("logging.level"); it != kv.end()) {
        auto level = parseLogLevel(it->second);
        if (!level)
            return level.error();
        config.logLevel = level.value();
    }
    if (auto it = kv.find("logging.allow_telemetry"); it != kv.end()) {
        config.allowTelemetry = is_truthy(it->second);
    }
    if (auto it = kv.find("storage.dismissals_path"); it != kv.end() && !it->second.empty()) {
        config.dismissalsPath = expand_tilde(it->second);
    }
    if (auto it = kv.find("storage.spool_dir"); it != kv.end() && !it->second.empty()) {
        config.spoolDir = expand_tilde(it->second);
    }
    if (auto it = kv.find("sources.config_path"); it != kv.end() && !it->second.empty()) {
        config.sourcesConfigPath = expand_tilde(it->second);
    }
    return config;
}

Result<void> EngineConfig::applyEnvironmentOverrides() {
    if (const char* env = std::getenv("VIGIL_ENABLED"); env && *env) {
        enabled = is_truthy(env);
    }
    if (const char* env = std::getenv("VIGIL_LOG_LEVEL"); env && *env) {
        auto level = parseLogLevel(env);
        if (!level)
            return level.error();
        logLevel = level.value();
    }
    if (const char* env = std::getenv("VIGIL_REFRESH_TIMEOUT_MS"); env && *env) {
        auto timeout = parseTimeoutMs(env);
        if (!timeout)
            return timeout.error();
        refreshTimeout = timeout.value();
    }
    if (const char* env = std::getenv("VIGIL_DISMISSALS_PATH"); env && *env) {
        dismissalsPath = expand_tilde(env);
    }
    if (const char* env = std::getenv("VIGIL_SOURCES_CONFIG"); env && *env) {
        sourcesConfigPath = expand_tilde(env);
    }
    if (const char* env = std::getenv("VIGIL_SPOOL_DIR"); env && *env) {
        spoolDir = expand_tilde(env);
    }
    return {};
}

} // namespace vigil::config
