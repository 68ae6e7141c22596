// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace findex::metadata {

/**
 * @brief Make a root path absolute and lexically normal, without a trailing separator.
 *
 * Symlinks are not resolved so the stored prefix matches the paths produced by walking
 * the root as given.
 */
std::string normalizeRootPath(const std::filesystem::path& root);

/**
 * @brief True when `path` is `root` itself or lies below it (component-wise, case-sensitive).
 */
bool isUnderRoot(std::string_view path, std::string_view root);

/**
 * @brief Number of path separators ('/' or '\\') in `path`.
 */
int countSeparators(std::string_view path);

} // namespace findex::metadata
