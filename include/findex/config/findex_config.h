// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <findex/core/types.h>
#include <findex/indexing/catalog_indexer.h>
#include <findex/search/ranking.h>

namespace findex::config {

inline constexpr const char* kCatalogFileName = "catalog.db";

/**
 * @brief Settings read from config.toml. Unset keys keep their defaults.
 */
struct FindexConfig {
    std::filesystem::path configPath;

    std::optional<std::filesystem::path> dataDir; // [core] data_dir

    std::vector<std::filesystem::path> roots;                // [index] roots
    std::optional<std::vector<std::string>> excludedDirs;    // [index] excluded_dirs
    std::optional<std::vector<std::string>> includeExtensions; // [index] include_extensions
    std::optional<std::vector<std::string>> excludeExtensions; // [index] exclude_extensions
    std::size_t batchSize = indexing::kDefaultBatchSize;     // [index] batch_size

    std::size_t searchLimit = search::kDefaultSearchLimit;   // [search] limit
    double minScore = search::kDefaultMinScore;               // [search] min_score
    std::size_t candidateCap = metadata::kDefaultCandidateCap; // [search] candidate_cap

    std::string logLevel; // [logging] level

    /**
     * @brief Read `path`. A missing file yields the defaults; malformed numbers are errors.
     */
    static Result<FindexConfig> load(const std::filesystem::path& path);

    indexing::IndexingConfig indexingConfig() const;
    search::RankingConfig rankingConfig() const;
};

/**
 * @brief Data directory: `cliOverride`, else $FINDEX_DATA_DIR, else [core] data_dir,
 * else the XDG data home.
 */
std::filesystem::path resolveDataDir(const FindexConfig& config, const std::string& cliOverride);

inline std::filesystem::path catalogPath(const std::filesystem::path& dataDir) {
    return dataDir / kCatalogFileName;
}

} // namespace findex::config
