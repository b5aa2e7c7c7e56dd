#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace mlget::config {

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
    if (path == "~" || path.rfind("~/", 0) == 0) {
        if (const char* home = std::getenv("HOME")) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse a value from a TOML config file. Returns "" when the file, section or key
// is missing. Keys may also be written as "section.key" outside any section.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory: $XDG_CONFIG_HOME/mlget or ~/.config/mlget
std::filesystem::path get_config_dir();

// Config file location: override, then MLGET_CONFIG, then get_config_dir()/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace mlget::config
