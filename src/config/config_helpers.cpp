// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fstream>
#include <findex/config/config_helpers.h>

namespace findex::config {

namespace {

// Cut a trailing "# comment" that is not inside quotes
std::string stripInlineComment(const std::string& v) {
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return v.substr(0, i);
        }
    }
    return v;
}

} // namespace

std::optional<std::string> find_config_value(const std::filesystem::path& config_path,
                                             const std::string& section, const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return std::nullopt;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = stripInlineComment(line.substr(eq + 1));
        trim(k);
        trim(v);

        // Support both "index.roots" and "[index] roots"
        const bool dotted = !section.empty() && currentSection.empty() && k == section + "." + key;
        if (dotted || (currentSection == section && k == key)) {
            return unquote(v);
        }
    }

    return std::nullopt;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    return find_config_value(config_path, section, key).value_or("");
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string body = raw;
    trim(body);
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> items;
    std::string current;
    char quote = 0;
    auto flush = [&]() {
        std::string item = unquote(current);
        if (!item.empty())
            items.push_back(std::move(item));
        current.clear();
    };

    for (char c : body) {
        if (quote) {
            if (c == quote)
                quote = 0;
            current.push_back(c);
        } else if (c == '"' || c == '\'') {
            quote = c;
            current.push_back(c);
        } else if (c == ',') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return items;
}

std::vector<std::filesystem::path> parse_path_list(const std::string& raw) {
    std::vector<std::filesystem::path> paths;
    for (const auto& item : parse_string_list(raw)) {
        paths.push_back(expand_tilde(item));
    }
    return paths;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("FINDEX_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "findex" / "config.toml";
    }

    return configHome / "findex" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "findex";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "findex";
    }
    return std::filesystem::current_path() / "findex_data";
}

} // namespace findex::config
