// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <findex/core/types.h>
#include <findex/indexing/exclusion_policy.h>
#include <findex/metadata/catalog_types.h>

namespace findex::indexing {

struct WalkStats {
    std::size_t filesVisited = 0;
    std::size_t foldersVisited = 0;
    std::size_t skippedByFilter = 0;
    std::size_t errors = 0;
    // Listed in their directory but stat(2) failed (EACCES, ELOOP, ...)
    std::vector<std::string> unreadable;
    // Present but could not be listed; their contents are unknown for this walk
    std::vector<std::string> unlistedDirs;
};

using WalkVisitor = std::function<Result<void>(const metadata::FileSystemEntry&)>;

/**
 * @brief Walk `root` top-down and hand every admissible entry to `visitor`.
 *
 * The root itself is not reported. Directories named in the policy are neither
 * reported nor entered. Symlinked directories are reported but not entered.
 * Entries that cannot be listed or stat'ed are logged, counted as errors and
 * collected in the stats so callers can keep what they stored for them; the walk
 * carries on. A failing visitor stops the walk and its error is returned.
 */
Result<WalkStats> walkTree(const std::filesystem::path& root, const ExclusionPolicy& policy,
                           const WalkVisitor& visitor);

/**
 * @brief stat(2) an entry, following symlinks. Returns nullopt if the call fails.
 */
std::optional<metadata::FileSystemEntry> statEntry(const std::filesystem::path& path,
                                                   metadata::EntryKind kind,
                                                   const std::string& parentDirName);

} // namespace findex::indexing
