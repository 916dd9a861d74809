#pragma once

#include <cloak/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace cloak::config {

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
            return std::filesystem::path(home) / (path.size() > 2 ? path.substr(2) : "");
        }
    }
    return path;
}

// section -> key -> raw (unquoted) value; keys before any header live in section ""
using ConfigSections = std::map<std::string, std::map<std::string, std::string>>;

// Parse the flat subset of TOML the config file uses: [section] headers,
// key = value lines, # comments, quoted strings and single-line arrays
ConfigSections parse_config_text(std::string_view text);
Result<ConfigSections> parse_config_file(const std::filesystem::path& config_path);

// Accepts "a,b" or ["a", "b"]; empty items are dropped
std::vector<std::string> parse_string_list(const std::string& raw);

Result<bool> parse_bool(const std::string& raw);
Result<std::size_t> parse_size(const std::string& raw);
Result<float> parse_float(const std::string& raw);

// Get standard config path
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// $XDG_CONFIG_HOME/cloak or ~/.config/cloak
std::filesystem::path get_config_dir();

} // namespace cloak::config
