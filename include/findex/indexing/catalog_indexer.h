// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include <findex/core/types.h>
#include <findex/indexing/exclusion_policy.h>
#include <findex/metadata/catalog_store.h>

namespace findex::indexing {

inline constexpr std::size_t kDefaultBatchSize = 500;

struct IndexingConfig {
    ExclusionPolicy policy;
    std::size_t batchSize = kDefaultBatchSize;
};

/**
 * @brief Outcome of one indexing pass over a single root
 */
struct IndexingStats {
    std::string root;
    bool fullRebuild = false;
    std::size_t inserted = 0;
    std::size_t updated = 0;
    std::size_t deleted = 0;
    std::size_t unchanged = 0;
    std::size_t skippedByFilter = 0;
    std::size_t errors = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Keeps the catalog in step with one or more filesystem roots.
 *
 * A root seen for the first time gets a full rebuild. Later runs reconcile the
 * catalog with the tree: new paths are inserted, paths whose timestamp moved are
 * refreshed, and catalogued paths that disappeared are deleted. Entries outside
 * the root being processed are never touched.
 */
class CatalogIndexer {
public:
    explicit CatalogIndexer(metadata::CatalogStore& store, IndexingConfig config = {});

    /**
     * @brief Bring every root up to date, choosing rebuild or incremental per root.
     *
     * Roots are made absolute and normalized first. Processing stops at the first root
     * whose pass fails.
     */
    Result<std::vector<IndexingStats>> ensureIndex(const std::vector<std::filesystem::path>& roots);

    /**
     * @brief Walk `root` and insert every admissible entry not yet catalogued.
     *
     * Existing rows are left as they are, so the pass can be re-run safely.
     */
    Result<IndexingStats> fullRebuild(const std::string& root);

    Result<IndexingStats> incrementalUpdate(const std::string& root);

    const IndexingConfig& config() const { return config_; }

private:
    metadata::CatalogStore& store_;
    IndexingConfig config_;

    void recordRootIndexed(const std::string& root);
    void recordIndexTime();
};

} // namespace findex::indexing
