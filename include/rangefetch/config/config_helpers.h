#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rangefetch::config {

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

// Tilde expansion ("~" and "~/...")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

/**
 * Whole TOML-style config file: `[section]` headers followed by `key = value` lines.
 * Values are unquoted and stripped of trailing `#` comments. Section order is kept.
 */
struct ConfigFile {
    std::vector<std::string> order; // section names in order of first appearance
    std::map<std::string, std::map<std::string, std::string>> sections;

    std::optional<std::string> get(const std::string& section, const std::string& key) const;
    bool hasSection(const std::string& section) const { return sections.count(section) > 0; }
};

// Parse a whole config file; a missing or unreadable file yields an empty ConfigFile.
ConfigFile parse_config_file(const std::filesystem::path& config_path);

// Strict scalar parsing for config values; nullopt on malformed input.
std::optional<std::uint64_t> parse_u64(std::string_view s);
std::optional<double> parse_double(std::string_view s);
std::optional<bool> parse_bool(std::string_view s);

/// Returns the user config directory
/// Unix: $XDG_CONFIG_HOME/rangefetch or ~/.config/rangefetch
std::filesystem::path get_config_dir();

// Get standard config path
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace rangefetch::config
