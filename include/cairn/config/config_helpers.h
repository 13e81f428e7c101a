#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace cairn::config {

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

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// "~/x" -> "$HOME/x"; anything else unchanged
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        if (const char* home = std::getenv("HOME")) {
            return path.size() > 2 ? std::filesystem::path(home) / path.substr(2)
                                   : std::filesystem::path(home);
        }
    }
    return path;
}

// section -> key -> unquoted value. Keys before any header land in section "".
using ConfigTable = std::map<std::string, std::map<std::string, std::string>>;

// Minimal TOML subset: [section], key = value, # comments. Missing file -> empty table.
ConfigTable parse_config_file(const std::filesystem::path& config_path);

// Single lookup; empty string when the file, section or key is absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// $CAIRN_CONFIG, else $XDG_CONFIG_HOME/cairn/config.toml or ~/.config/cairn/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_CONFIG_HOME/cairn or ~/.config/cairn
std::filesystem::path get_config_dir();

/// $CAIRN_DATA_DIR, else $XDG_DATA_HOME/cairn or ~/.local/share/cairn
std::filesystem::path get_data_dir();

} // namespace cairn::config
