// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <cctype>
#include <findex/indexing/exclusion_policy.h>
#include <findex/search/text_normalize.h>

namespace findex::search {

std::string toLowerAscii(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> splitWhitespace(std::string_view text) {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
            ++i;
        std::size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i])))
            ++i;
        if (i > start)
            tokens.emplace_back(text.substr(start, i - start));
    }
    return tokens;
}

std::string normalizeFilename(std::string_view name) {
    std::string stem = indexing::stemOf(name);
    std::replace(stem.begin(), stem.end(), '_', ' ');
    std::replace(stem.begin(), stem.end(), '-', ' ');

    std::string joined;
    for (const auto& token : splitWhitespace(stem)) {
        if (!joined.empty())
            joined.push_back(' ');
        joined += token;
    }
    return toLowerAscii(joined);
}

} // namespace findex::search
