// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace findex::config {

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
    if (path == "~" || path.rfind("~/", 0) == 0) {
        if (const char* home = std::getenv("HOME"); home && *home) {
            if (path.size() <= 2)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

/**
 * Raw value of `key` in `[section]` (or written as `section.key` at top level).
 * Returns nullopt when the file or the key is missing. Values are unquoted; inline
 * `#` comments outside quotes are dropped. Only single-line values are supported.
 */
std::optional<std::string> find_config_value(const std::filesystem::path& config_path,
                                             const std::string& section, const std::string& key);

// Same as find_config_value() but "" when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse a comma- or TOML-array-separated list of strings.
// Accepts forms like "a,b" or ["a", "b"]; an empty array yields an empty list.
std::vector<std::string> parse_string_list(const std::string& raw);

// Same as parse_string_list() with tilde expansion applied to every item
std::vector<std::filesystem::path> parse_path_list(const std::string& raw);

// Config file location: override, else $FINDEX_CONFIG, else XDG config home
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory (catalog database)
/// $XDG_DATA_HOME/findex or ~/.local/share/findex
std::filesystem::path get_data_dir();

} // namespace findex::config
