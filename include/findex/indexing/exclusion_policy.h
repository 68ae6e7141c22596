// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace findex::indexing {

/**
 * @brief Decides which directories are descended into and which files are catalogued.
 *
 * Directory names are matched exactly (case-sensitive). Extensions are compared
 * lowercased, with the leading dot. A file is rejected when its extension is on the
 * exclude list, and otherwise accepted if the include list is empty or contains the
 * extension. Folders are never filtered by extension.
 */
class ExclusionPolicy {
public:
    ExclusionPolicy();
    ExclusionPolicy(std::vector<std::string> excludedDirs,
                    std::vector<std::string> includeExtensions,
                    std::vector<std::string> excludeExtensions);

    static const std::vector<std::string>& defaultExcludedDirs();
    static const std::vector<std::string>& defaultIncludeExtensions();
    static const std::vector<std::string>& defaultExcludeExtensions();

    bool shouldDescend(std::string_view dirName) const;
    bool shouldIndexFile(std::string_view fileName) const;

    const std::unordered_set<std::string>& excludedDirs() const { return excludedDirs_; }
    const std::unordered_set<std::string>& includeExtensions() const { return includeExts_; }
    const std::unordered_set<std::string>& excludeExtensions() const { return excludeExts_; }

private:
    std::unordered_set<std::string> excludedDirs_;
    std::unordered_set<std::string> includeExts_;
    std::unordered_set<std::string> excludeExts_;
};

/**
 * @brief Lowercased extension of `fileName` including the dot, or empty.
 *
 * Leading dots do not start an extension: ".bashrc" has none, "a.tar.gz" yields ".gz".
 */
std::string extensionOf(std::string_view fileName);

/**
 * @brief `fileName` without its extension, using the same rules as extensionOf().
 */
std::string stemOf(std::string_view fileName);

} // namespace findex::indexing
