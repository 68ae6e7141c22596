// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <findex/core/types.h>

namespace findex::metadata {

/**
 * @brief Kind of a catalogued filesystem object
 */
enum class EntryKind {
    File,  ///< Regular file (subject to the extension policy)
    Folder ///< Directory (never filtered by extension)
};

/**
 * @brief Conversions between EntryKind and its persisted spelling
 */
class EntryKindUtils {
public:
    static constexpr const char* toString(EntryKind kind) {
        return kind == EntryKind::Folder ? "folder" : "file";
    }

    static std::optional<EntryKind> fromString(std::string_view value) {
        if (value == "file")
            return EntryKind::File;
        if (value == "folder")
            return EntryKind::Folder;
        return std::nullopt;
    }
};

/**
 * @brief One row of the `files` table
 *
 * `path` is absolute and is the unique key. `extension` is lowercase with the
 * leading dot for files and empty for folders. `lastModified` is seconds since
 * the epoch as reported by stat(2), including the sub-second part.
 */
struct FileSystemEntry {
    EntryId id = 0;
    std::string name;
    std::string path;
    EntryKind kind = EntryKind::File;
    std::string extension;
    std::string parentDirName;
    double lastModified = 0.0;
    int64_t sizeBytes = 0;

    bool isFolder() const { return kind == EntryKind::Folder; }
};

/**
 * @brief One row of the `meta` table
 */
struct MetaRecord {
    std::string key;
    std::string value;
};

// Meta keys written by the indexer
inline constexpr std::string_view kRootMetaPrefix = "root::";
inline constexpr std::string_view kLastIndexTimeKey = "last_index_time";
inline constexpr std::string_view kRootIndexedValue = "indexed";

inline std::string rootMetaKey(std::string_view root) {
    return std::string(kRootMetaPrefix) + std::string(root);
}

} // namespace findex::metadata
