#pragma once

#include <vigil/core/types.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <unordered_set>

namespace vigil::config {

/**
 * Process-level engine settings, read from a flat TOML file:
 *
 *   [engine]   enabled = true
 *   [refresh]  timeout_ms = 10000, untracked_sources = ["a", "b"]
 *   [logging]  level = "info", allow_telemetry = true
 *   [storage]  dismissals_path = "~/.local/share/vigil/dismissals.json", spool_dir = "..."
 *   [sources]  config_path = "~/.config/vigil/sources.json"
 *
 * Environment variables (VIGIL_ENABLED, VIGIL_LOG_LEVEL, VIGIL_REFRESH_TIMEOUT_MS,
 * VIGIL_DISMISSALS_PATH, VIGIL_SOURCES_CONFIG, VIGIL_SPOOL_DIR) override file values.
 */
struct EngineConfig {
    bool enabled{true};
    std::chrono::milliseconds refreshTimeout{std::chrono::seconds(10)};
    std::unordered_set<std::string> untrackedSources;
    std::string logLevel{"info"};
    bool allowTelemetry{true};
    std::filesystem::path dismissalsPath;
    std::filesystem::path sourcesConfigPath;
    std::filesystem::path spoolDir;

    static EngineConfig defaults();

    // Missing file yields defaults; a malformed value is a ValidationError.
    static Result<EngineConfig> load(const std::filesystem::path& path);
    static Result<EngineConfig> fromFlatMap(const std::map<std::string, std::string>& kv);

    Result<void> applyEnvironmentOverrides();
};

} // namespace vigil::config
