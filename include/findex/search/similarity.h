// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <string_view>

namespace findex::search {

/**
 * @brief Insertion/deletion edit distance (no substitutions), byte-wise.
 */
std::size_t indelDistance(std::string_view a, std::string_view b);

/**
 * @brief Normalized indel similarity in [0, 100]. Two empty strings score 100.
 */
double ratio(std::string_view a, std::string_view b);

/**
 * @brief Order- and duplicate-insensitive token similarity in [0, 100].
 *
 * Both inputs are split on whitespace into token sets. If one set contains the
 * other (and they share at least one token) the score is 100. Otherwise the
 * shared tokens are compared against each side's leftovers and the best of the
 * three ratios is returned. An input with no tokens scores 0.
 */
double tokenSetRatio(std::string_view a, std::string_view b);

} // namespace findex::search
