// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_set>
#include <findex/indexing/catalog_indexer.h>
#include <findex/indexing/directory_walker.h>
#include <findex/metadata/path_utils.h>

namespace findex::indexing {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsedSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

CatalogIndexer::CatalogIndexer(metadata::CatalogStore& store, IndexingConfig config)
    : store_(store), config_(std::move(config)) {}

Result<std::vector<IndexingStats>>
CatalogIndexer::ensureIndex(const std::vector<std::filesystem::path>& roots) {
    std::vector<IndexingStats> allStats;
    allStats.reserve(roots.size());

    for (const auto& rawRoot : roots) {
        const std::string root = metadata::normalizeRootPath(rawRoot);

        auto marker = store_.getMeta(metadata::rootMetaKey(root));
        if (!marker) {
            return marker.error();
        }

        const bool firstRun = !marker.value().has_value();
        if (firstRun) {
            spdlog::info("[CatalogIndexer] First index build for '{}'", root);
        } else {
            spdlog::info("[CatalogIndexer] Incrementally updating '{}'", root);
        }

        auto pass = firstRun ? fullRebuild(root) : incrementalUpdate(root);
        if (!pass) {
            spdlog::error("[CatalogIndexer] Indexing '{}' failed: {}", root,
                          pass.error().message);
            return pass.error();
        }

        if (firstRun) {
            recordRootIndexed(root);
        }
        recordIndexTime();
        allStats.push_back(std::move(pass).value());
    }

    return allStats;
}

Result<IndexingStats> CatalogIndexer::fullRebuild(const std::string& root) {
    const auto start = Clock::now();
    IndexingStats stats;
    stats.root = root;
    stats.fullRebuild = true;

    auto batchResult = store_.runBatch(
        [&]() -> Result<void> {
            auto walk = walkTree(root, config_.policy,
                                 [&](const metadata::FileSystemEntry& entry) -> Result<void> {
                                     auto inserted = store_.upsertIfAbsent(entry);
                                     if (!inserted)
                                         return inserted.error();
                                     if (inserted.value())
                                         ++stats.inserted;
                                     else
                                         ++stats.unchanged;
                                     return {};
                                 });
            if (!walk)
                return walk.error();
            stats.skippedByFilter = walk.value().skippedByFilter;
            stats.errors = walk.value().errors;
            return {};
        },
        config_.batchSize);
    if (!batchResult) {
        return batchResult.error();
    }

    stats.duration = elapsedSince(start);
    spdlog::info("[CatalogIndexer] Full rebuild of '{}': {} inserted, {} already present, "
                 "{} filtered, {} errors in {}ms",
                 root, stats.inserted, stats.unchanged, stats.skippedByFilter, stats.errors,
                 stats.duration.count());
    return stats;
}

Result<IndexingStats> CatalogIndexer::incrementalUpdate(const std::string& root) {
    const auto start = Clock::now();
    IndexingStats stats;
    stats.root = root;

    auto existingResult = store_.entriesWithPathPrefix(root);
    if (!existingResult) {
        return existingResult.error();
    }
    const auto existing = std::move(existingResult).value();
    std::unordered_set<std::string> seen;
    seen.reserve(existing.size());

    auto batchResult = store_.runBatch(
        [&]() -> Result<void> {
            auto walk = walkTree(
                root, config_.policy, [&](const metadata::FileSystemEntry& entry) -> Result<void> {
                    seen.insert(entry.path);
                    auto it = existing.find(entry.path);
                    if (it != existing.end() && it->second == entry.lastModified) {
                        ++stats.unchanged;
                        return {};
                    }
                    auto written = store_.upsert(entry);
                    if (!written)
                        return written;
                    if (it == existing.end())
                        ++stats.inserted;
                    else
                        ++stats.updated;
                    return {};
                });
            if (!walk)
                return walk.error();
            stats.skippedByFilter = walk.value().skippedByFilter;
            stats.errors = walk.value().errors;

            // Entries the walk could not read are skipped, not removed
            const auto& unlisted = walk.value().unlistedDirs;
            seen.insert(walk.value().unreadable.begin(), walk.value().unreadable.end());

            for (const auto& stored : existing) {
                const std::string& path = stored.first;
                // The walk never reports the root; it may be catalogued by an enclosing root
                if (path == root || seen.count(path))
                    continue;
                if (std::any_of(unlisted.begin(), unlisted.end(), [&](const std::string& dir) {
                        return metadata::isUnderRoot(path, dir);
                    })) {
                    continue;
                }
                auto removed = store_.deleteByPath(path);
                if (!removed)
                    return removed.error();
                if (removed.value())
                    ++stats.deleted;
            }
            return {};
        },
        config_.batchSize);
    if (!batchResult) {
        return batchResult.error();
    }

    stats.duration = elapsedSince(start);
    spdlog::info("[CatalogIndexer] Incremental update of '{}': {} inserted, {} updated, "
                 "{} deleted, {} unchanged, {} filtered, {} errors in {}ms",
                 root, stats.inserted, stats.updated, stats.deleted, stats.unchanged,
                 stats.skippedByFilter, stats.errors, stats.duration.count());
    return stats;
}

void CatalogIndexer::recordRootIndexed(const std::string& root) {
    auto result = store_.setMeta(metadata::rootMetaKey(root),
                                 std::string(metadata::kRootIndexedValue));
    if (!result) {
        spdlog::warn("[CatalogIndexer] Failed to mark '{}' as indexed: {}", root,
                     result.error().message);
    }
}

void CatalogIndexer::recordIndexTime() {
    const auto now = std::chrono::duration<double>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    auto result =
        store_.setMeta(std::string(metadata::kLastIndexTimeKey), fmt::format("{:.6f}", now));
    if (!result) {
        spdlog::warn("[CatalogIndexer] Failed to record last index time: {}",
                     result.error().message);
    }
}

} // namespace findex::indexing
