// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>
#include <findex/search/similarity.h>
#include <findex/search/text_normalize.h>

namespace findex::search {

namespace {

// Longest common subsequence length, two-row DP
std::size_t lcsLength(std::string_view a, std::string_view b) {
    const std::size_t m = a.size();
    const std::size_t n = b.size();
    if (m == 0 || n == 0)
        return 0;

    std::vector<std::size_t> prevRow(n + 1, 0);
    std::vector<std::size_t> currRow(n + 1, 0);

    for (std::size_t i = 1; i <= m; ++i) {
        currRow[0] = 0;
        for (std::size_t j = 1; j <= n; ++j) {
            if (a[i - 1] == b[j - 1]) {
                currRow[j] = prevRow[j - 1] + 1;
            } else {
                currRow[j] = std::max(prevRow[j], currRow[j - 1]);
            }
        }
        std::swap(prevRow, currRow);
    }
    return prevRow[n];
}

double normalizedSimilarity(std::size_t distance, std::size_t lengthSum) {
    if (lengthSum == 0)
        return 100.0;
    return 100.0 * (1.0 - static_cast<double>(distance) / static_cast<double>(lengthSum));
}

std::vector<std::string> sortedTokenSet(std::string_view text) {
    auto tokens = splitWhitespace(text);
    std::sort(tokens.begin(), tokens.end());
    tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());
    return tokens;
}

std::string joinTokens(const std::vector<std::string>& tokens) {
    std::string out;
    for (const auto& t : tokens) {
        if (!out.empty())
            out.push_back(' ');
        out += t;
    }
    return out;
}

} // namespace

std::size_t indelDistance(std::string_view a, std::string_view b) {
    return a.size() + b.size() - 2 * lcsLength(a, b);
}

double ratio(std::string_view a, std::string_view b) {
    return normalizedSimilarity(indelDistance(a, b), a.size() + b.size());
}

double tokenSetRatio(std::string_view a, std::string_view b) {
    const auto tokensA = sortedTokenSet(a);
    const auto tokensB = sortedTokenSet(b);
    if (tokensA.empty() || tokensB.empty())
        return 0.0;

    std::vector<std::string> intersection;
    std::vector<std::string> diffAB;
    std::vector<std::string> diffBA;
    std::set_intersection(tokensA.begin(), tokensA.end(), tokensB.begin(), tokensB.end(),
                          std::back_inserter(intersection));
    std::set_difference(tokensA.begin(), tokensA.end(), tokensB.begin(), tokensB.end(),
                        std::back_inserter(diffAB));
    std::set_difference(tokensB.begin(), tokensB.end(), tokensA.begin(), tokensA.end(),
                        std::back_inserter(diffBA));

    if (!intersection.empty() && (diffAB.empty() || diffBA.empty()))
        return 100.0;

    const std::string diffABJoined = joinTokens(diffAB);
    const std::string diffBAJoined = joinTokens(diffBA);
    const std::size_t abLen = diffABJoined.size();
    const std::size_t baLen = diffBAJoined.size();
    const std::size_t sectLen = joinTokens(intersection).size();

    // The shared prefix "sect " contributes one separator when non-empty
    const std::size_t sep = sectLen != 0 ? 1 : 0;
    const std::size_t sectABLen = sectLen + sep + abLen;
    const std::size_t sectBALen = sectLen + sep + baLen;

    double best = normalizedSimilarity(indelDistance(diffABJoined, diffBAJoined),
                                       sectABLen + sectBALen);
    if (sectLen == 0)
        return best;

    // "sect" vs "sect diff" differ only by the diff and its separator
    best = std::max(best, normalizedSimilarity(sep + abLen, sectLen + sectABLen));
    best = std::max(best, normalizedSimilarity(sep + baLen, sectLen + sectBALen));
    return best;
}

} // namespace findex::search
