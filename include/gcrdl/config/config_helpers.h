#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>

namespace gcrdl::config {

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
    if (path == "~" || (path.size() >= 2 && path[0] == '~' && path[1] == '/')) {
        if (const char* home = std::getenv("HOME")) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// section -> key -> unquoted value. Keys before any [section] land under "".
using ConfigSections = std::map<std::string, std::map<std::string, std::string>>;

// Parse a whole TOML-style config file. Missing file yields an empty map.
ConfigSections parse_config_file(const std::filesystem::path& config_path);

// Parse a single value from TOML config file ("" when absent)
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// $GCRDL_CONFIG, else $XDG_CONFIG_HOME/gcrdl/config.toml, else ~/.config/gcrdl/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $GCRDL_DATA_DIR, else $XDG_DATA_HOME/gcrdl, else ~/.local/share/gcrdl
std::filesystem::path get_data_dir();

} // namespace gcrdl::config
