#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// "1", "true", "yes", "on" (any case)
inline bool is_truthy(std::string_view value) {
    std::string lower(value);
    trim(lower);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

/**
 * Parse a flat TOML file into "section.key" -> value. Only scalar values, quoted strings and
 * single-line arrays (kept verbatim) are understood; a missing file yields an empty map.
 */
std::map<std::string, std::string> parse_simple_toml_flat(const std::filesystem::path& path);

// Parse a comma- or TOML-array-separated list: "a,b" or ["a", "b"].
std::vector<std::string> parse_string_list(const std::string& raw);

/// Returns the user config directory: $XDG_CONFIG_HOME/vigil or ~/.config/vigil
std::filesystem::path get_config_dir();

/// Returns the user data directory: $XDG_DATA_HOME/vigil or ~/.local/share/vigil
std::filesystem::path get_data_dir();

// Standard config path; VIGIL_CONFIG_PATH wins over the XDG default.
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace vigil::config
