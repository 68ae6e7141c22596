// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>
#include <findex/metadata/catalog_types.h>
#include <findex/metadata/database.h>

namespace findex::metadata {

inline constexpr std::size_t kDefaultCandidateCap = 300;

/**
 * @brief Persistent catalog of filesystem entries plus key/value metadata.
 *
 * The SQLite file is opened for each logical operation and closed again
 * afterwards; no connection outlives a call. runBatch() is the exception: it
 * holds one connection for the duration of the callback so an indexing pass can
 * commit its writes in batches.
 */
class CatalogStore {
public:
    explicit CatalogStore(std::filesystem::path dbPath);

    CatalogStore(const CatalogStore&) = delete;
    CatalogStore& operator=(const CatalogStore&) = delete;

    /**
     * @brief Create the database file (and its directory) and apply pending migrations.
     */
    Result<void> initialize();

    /**
     * @brief Insert the entry unless its path is already catalogued.
     * @return true if a row was inserted
     */
    Result<bool> upsertIfAbsent(const FileSystemEntry& entry);

    /**
     * @brief Insert the entry, or refresh size and timestamp of the existing row.
     *
     * Name, kind, extension and parent of an existing row are left as they are.
     */
    Result<void> upsert(const FileSystemEntry& entry);

    /**
     * @brief path -> last_modified for every entry at or below `root`.
     */
    Result<std::unordered_map<std::string, double>> entriesWithPathPrefix(const std::string& root);

    /**
     * @brief Remove the row for `path`.
     * @return true if a row was removed
     */
    Result<bool> deleteByPath(const std::string& path);

    Result<std::optional<std::string>> getMeta(const std::string& key);
    Result<void> setMeta(const std::string& key, const std::string& value);
    Result<std::vector<MetaRecord>> listMeta(const std::string& keyPrefix = "");

    /**
     * @brief Coarse prefilter for ranking.
     *
     * A row matches when every token is a case-insensitive substring of its name
     * or of its path. Rows come back in insertion order, at most `cap` of them.
     * An empty token list matches nothing.
     */
    Result<std::vector<FileSystemEntry>>
    queryCandidates(const std::vector<std::string>& tokens,
                    std::size_t cap = kDefaultCandidateCap);

    Result<std::optional<FileSystemEntry>> findByPath(const std::string& path);

    Result<int64_t> countEntries(std::optional<EntryKind> kind = std::nullopt);

    /**
     * @brief Run `body` against one open connection, committing every `batchSize` writes.
     *
     * Store calls made from inside `body` reuse the batch connection. If `body` fails,
     * the uncommitted tail is rolled back; earlier batches stay committed.
     */
    Result<void> runBatch(const std::function<Result<void>()>& body, std::size_t batchSize);

    [[nodiscard]] const std::filesystem::path& path() const { return dbPath_; }

private:
    std::filesystem::path dbPath_;

    // Non-null only while runBatch() is executing
    Database* batchDb_ = nullptr;
    std::size_t batchSize_ = 0;
    std::size_t pendingWrites_ = 0;

    Result<Database> openConnection(ConnectionMode mode = ConnectionMode::ReadWrite) const;

    // Count a write made through the batch connection, committing when the batch is full
    Result<void> noteWrite();

    template <typename T> Result<T> executeQuery(const std::function<Result<T>(Database&)>& func) {
        if (batchDb_) {
            return func(*batchDb_);
        }
        auto dbResult = openConnection();
        if (!dbResult) {
            return dbResult.error();
        }
        Database db = std::move(dbResult).value();
        return func(db);
    }

    static FileSystemEntry mapEntryRow(const Statement& stmt);
};

} // namespace findex::metadata
