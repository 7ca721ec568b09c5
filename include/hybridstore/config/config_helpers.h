#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace hybridstore::config {

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

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
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

// Typed value parsing; nullopt for malformed input
std::optional<bool> parse_bool(std::string_view s);
std::optional<long long> parse_integer(std::string_view s);

// Read every key of a TOML file as "section.key" -> unquoted value.
// Both "[store] dimensions = 3" and top-level "store.dimensions = 3" are accepted.
// Returns nullopt when the file cannot be opened.
std::optional<std::map<std::string, std::string>>
parse_config_file(const std::filesystem::path& config_path);

// Parse a single value from a TOML config file, empty when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path
// HYBRIDSTORE_CONFIG, then $XDG_CONFIG_HOME/hybridstore/config.toml,
// then ~/.config/hybridstore/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory for database files
/// $XDG_DATA_HOME/hybridstore or ~/.local/share/hybridstore
std::filesystem::path get_data_dir();

} // namespace hybridstore::config
