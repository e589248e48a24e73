#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pincer::config {

// section -> key -> raw (unquoted) value
using ConfigTable = std::map<std::string, std::map<std::string, std::string>>;

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

inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Strict parsers: nullopt on anything that is not a well-formed value.
std::optional<uint64_t> parse_uint(std::string_view s);
// "250" or "250ms"; values above `max` are rejected.
inline constexpr std::chrono::milliseconds kMaxMillisSetting{std::chrono::hours(24)};
std::optional<std::chrono::milliseconds>
parse_ms(std::string_view s, std::chrono::milliseconds max = kMaxMillisSetting);
std::optional<bool> parse_bool(std::string_view s);
std::optional<uint16_t> parse_port(std::string_view s);

// Comma list or TOML array: "a,b" or ["a", "b"].
std::vector<std::string> parse_list(const std::string& raw);

// Reads a TOML-subset file ([section] headers, key = value, # comments). Dotted keys outside a
// section ("server.port = 1") are filed under their prefix. Missing file yields an empty table.
ConfigTable parse_config_file(const std::filesystem::path& config_path);

// Resolution order: override, $PINCER_CONFIG, $XDG_CONFIG_HOME/pincer/config.toml,
// ~/.config/pincer/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace pincer::config
