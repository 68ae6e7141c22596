// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace findex::search {

std::string toLowerAscii(std::string_view text);

/**
 * @brief Split on runs of ASCII whitespace, dropping empty pieces.
 */
std::vector<std::string> splitWhitespace(std::string_view text);

/**
 * @brief Canonical form used to compare queries with file names.
 *
 * Drops a trailing extension, turns '_' and '-' into spaces, collapses whitespace
 * and lowercases: "Q4_Budget-final.xlsx" -> "q4 budget final".
 */
std::string normalizeFilename(std::string_view name);

} // namespace findex::search
