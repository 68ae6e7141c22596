// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <findex/app/entry_opener.h>
#include <findex/core/types.h>
#include <findex/metadata/catalog_types.h>
#include <findex/search/ranking.h>

namespace findex::app {

inline constexpr std::size_t kMaxListedChildren = 30;

enum class FileAction { Open, List };

/**
 * @brief Parse "open" or "list" (also "list_folder"), case-insensitive.
 * @throws std::invalid_argument for any other value
 */
FileAction parseFileAction(std::string_view action);

const char* fileActionToString(FileAction action);

struct FileActionResult {
    enum class Status {
        NotFound,   ///< no match of the requested kind
        Opened,     ///< single match handed to the opener successfully
        OpenFailed, ///< single match, but the opener reported failure
        Ambiguous,  ///< several matches; caller should offer a choice
        Listed      ///< folder contents collected
    };

    Status status = Status::NotFound;
    /// Matches of the requested kind, best first
    std::vector<metadata::FileSystemEntry> matches;
    /// Entry that was opened or listed
    std::optional<metadata::FileSystemEntry> target;
    /// Immediate child names of `target` (List only), at most kMaxListedChildren
    std::vector<std::string> children;
};

/**
 * @brief Search-then-act front door used by the dispatcher and the CLI.
 */
class FileActionService {
public:
    FileActionService(search::RankingEngine& ranking, IEntryOpener& opener,
                      std::size_t searchLimit = search::kDefaultSearchLimit);

    /**
     * @brief Look up `targetText` and open or list the entry of `kind` it names.
     *
     * Listing is only defined for folders; asking to list a file is an
     * InvalidArgument error.
     */
    Result<FileActionResult> handleFileAction(FileAction action, metadata::EntryKind kind,
                                              std::string_view targetText);

    /**
     * @brief Names of the immediate children of `folder`, sorted, at most `maxEntries`.
     */
    static Result<std::vector<std::string>> listChildren(const std::string& folder,
                                                         std::size_t maxEntries);

private:
    search::RankingEngine& ranking_;
    IEntryOpener& opener_;
    std::size_t searchLimit_;
};

} // namespace findex::app
