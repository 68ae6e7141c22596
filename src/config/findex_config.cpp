// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>
#include <findex/config/config_helpers.h>
#include <findex/config/findex_config.h>

namespace findex::config {

namespace {

Result<std::size_t> parseCount(const std::string& raw, const char* key) {
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(raw, &consumed);
        if (consumed != raw.size() || value <= 0) {
            return Error{ErrorCode::InvalidArgument,
                         std::string("Config value '") + key + "' must be a positive integer"};
        }
        return static_cast<std::size_t>(value);
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Config value '") + key + "' is not a number: " + raw};
    }
}

Result<double> parseScore(const std::string& raw, const char* key) {
    try {
        std::size_t consumed = 0;
        const double value = std::stod(raw, &consumed);
        if (consumed != raw.size()) {
            return Error{ErrorCode::InvalidArgument,
                         std::string("Config value '") + key + "' is not a number: " + raw};
        }
        return value;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Config value '") + key + "' is not a number: " + raw};
    }
}

} // namespace

Result<FindexConfig> FindexConfig::load(const std::filesystem::path& path) {
    FindexConfig cfg;
    cfg.configPath = path;

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("[Config] No config file at '{}', using defaults", path.string());
        return cfg;
    }

    if (auto v = find_config_value(path, "core", "data_dir"); v && !v->empty()) {
        cfg.dataDir = expand_tilde(*v);
    }

    if (auto v = find_config_value(path, "index", "roots")) {
        cfg.roots = parse_path_list(*v);
    }
    if (auto v = find_config_value(path, "index", "excluded_dirs")) {
        cfg.excludedDirs = parse_string_list(*v);
    }
    if (auto v = find_config_value(path, "index", "include_extensions")) {
        cfg.includeExtensions = parse_string_list(*v);
    }
    if (auto v = find_config_value(path, "index", "exclude_extensions")) {
        cfg.excludeExtensions = parse_string_list(*v);
    }
    if (auto v = find_config_value(path, "index", "batch_size"); v && !v->empty()) {
        auto n = parseCount(*v, "index.batch_size");
        if (!n)
            return n.error();
        cfg.batchSize = n.value();
    }

    if (auto v = find_config_value(path, "search", "limit"); v && !v->empty()) {
        auto n = parseCount(*v, "search.limit");
        if (!n)
            return n.error();
        cfg.searchLimit = n.value();
    }
    if (auto v = find_config_value(path, "search", "min_score"); v && !v->empty()) {
        auto s = parseScore(*v, "search.min_score");
        if (!s)
            return s.error();
        cfg.minScore = s.value();
    }
    if (auto v = find_config_value(path, "search", "candidate_cap"); v && !v->empty()) {
        auto n = parseCount(*v, "search.candidate_cap");
        if (!n)
            return n.error();
        cfg.candidateCap = n.value();
    }

    if (auto v = find_config_value(path, "logging", "level")) {
        cfg.logLevel = *v;
    }

    spdlog::debug("[Config] Loaded '{}'", path.string());
    return cfg;
}

indexing::IndexingConfig FindexConfig::indexingConfig() const {
    indexing::IndexingConfig out;
    out.policy = indexing::ExclusionPolicy(
        excludedDirs.value_or(indexing::ExclusionPolicy::defaultExcludedDirs()),
        includeExtensions.value_or(indexing::ExclusionPolicy::defaultIncludeExtensions()),
        excludeExtensions.value_or(indexing::ExclusionPolicy::defaultExcludeExtensions()));
    out.batchSize = batchSize;
    return out;
}

search::RankingConfig FindexConfig::rankingConfig() const {
    search::RankingConfig out;
    out.minScore = minScore;
    out.candidateCap = candidateCap;
    return out;
}

std::filesystem::path resolveDataDir(const FindexConfig& config, const std::string& cliOverride) {
    if (!cliOverride.empty()) {
        return expand_tilde(cliOverride);
    }
    if (const char* env = std::getenv("FINDEX_DATA_DIR"); env && *env) {
        return std::filesystem::path(env);
    }
    if (config.dataDir) {
        return *config.dataDir;
    }
    return get_data_dir();
}

} // namespace findex::config
