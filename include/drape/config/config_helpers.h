#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace drape::config {

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

// Read every key of a TOML file as "section.key" -> unquoted value.
// Returns std::nullopt if the file cannot be opened.
std::optional<std::map<std::string, std::string>>
parse_config_file(const std::filesystem::path& config_path);

// Numeric parsing; std::nullopt on trailing garbage or out-of-range input
std::optional<size_t> parse_size(std::string_view raw);
std::optional<double> parse_double(std::string_view raw);

// Get standard config path ($XDG_CONFIG_HOME/drape/config.toml or ~/.config/drape/config.toml)
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace drape::config
