// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <findex/metadata/path_utils.h>

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace findex::metadata {

std::string normalizeRootPath(const std::filesystem::path& root) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(root, ec);
    if (ec) {
        abs = root;
    }
    auto norm = abs.lexically_normal();
    std::string result = norm.string();
    // "/a/b/" normalizes to "/a/b/" (empty filename); keep "/" itself intact
    while (result.size() > 1 && (result.back() == '/' || result.back() == '\\')) {
        result.pop_back();
    }
    return result;
}

bool isUnderRoot(std::string_view path, std::string_view root) {
    if (root.empty())
        return false;
    if (path.size() < root.size() || path.compare(0, root.size(), root) != 0)
        return false;
    if (path.size() == root.size())
        return true;
    const char last = root.back();
    if (last == '/' || last == '\\')
        return true;
    const char next = path[root.size()];
    return next == '/' || next == '\\';
}

int countSeparators(std::string_view path) {
    return static_cast<int>(
        std::count_if(path.begin(), path.end(), [](char c) { return c == '/' || c == '\\'; }));
}

} // namespace findex::metadata
