// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <cctype>
#include <findex/indexing/exclusion_policy.h>

namespace findex::indexing {

namespace {

std::string lowerExtension(std::string ext) {
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!ext.empty() && ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }
    return ext;
}

std::unordered_set<std::string> toExtensionSet(const std::vector<std::string>& exts) {
    std::unordered_set<std::string> out;
    for (const auto& e : exts) {
        auto lowered = lowerExtension(e);
        if (!lowered.empty())
            out.insert(std::move(lowered));
    }
    return out;
}

// Position of the dot that starts the extension, or npos
std::size_t extensionDot(std::string_view fileName) {
    auto dot = fileName.rfind('.');
    if (dot == std::string_view::npos)
        return dot;
    auto firstNonDot = fileName.find_first_not_of('.');
    if (firstNonDot == std::string_view::npos || dot < firstNonDot)
        return std::string_view::npos;
    return dot;
}

} // namespace

const std::vector<std::string>& ExclusionPolicy::defaultExcludedDirs() {
    static const std::vector<std::string> dirs = {"node_modules",
                                                  ".venv",
                                                  "venv",
                                                  ".cache",
                                                  ".vscode",
                                                  ".next",
                                                  ".git",
                                                  "__pycache__",
                                                  "$RECYCLE.BIN",
                                                  "System Volume Information",
                                                  "AppData",
                                                  "Support Files",
                                                  "Program Files",
                                                  "Program Files (x86)",
                                                  "Windows"};
    return dirs;
}

const std::vector<std::string>& ExclusionPolicy::defaultIncludeExtensions() {
    static const std::vector<std::string> exts = {".txt",  ".md",  ".py",   ".json",
                                                  ".docx", ".pdf", ".xlsx", ".csv",
                                                  ".pptx", ".html", ".js",  ".ts"};
    return exts;
}

const std::vector<std::string>& ExclusionPolicy::defaultExcludeExtensions() {
    static const std::vector<std::string> exts = {".dll", ".exe",   ".sys", ".tmp", ".log",
                                                  ".cache", ".bin", ".dat", ".iso"};
    return exts;
}

ExclusionPolicy::ExclusionPolicy()
    : ExclusionPolicy(defaultExcludedDirs(), defaultIncludeExtensions(),
                      defaultExcludeExtensions()) {}

ExclusionPolicy::ExclusionPolicy(std::vector<std::string> excludedDirs,
                                 std::vector<std::string> includeExtensions,
                                 std::vector<std::string> excludeExtensions)
    : excludedDirs_(excludedDirs.begin(), excludedDirs.end()),
      includeExts_(toExtensionSet(includeExtensions)),
      excludeExts_(toExtensionSet(excludeExtensions)) {}

bool ExclusionPolicy::shouldDescend(std::string_view dirName) const {
    return excludedDirs_.find(std::string(dirName)) == excludedDirs_.end();
}

bool ExclusionPolicy::shouldIndexFile(std::string_view fileName) const {
    const auto ext = extensionOf(fileName);
    if (excludeExts_.count(ext))
        return false;
    // An empty include list admits everything not excluded
    return includeExts_.empty() || includeExts_.count(ext) > 0;
}

std::string extensionOf(std::string_view fileName) {
    auto dot = extensionDot(fileName);
    if (dot == std::string_view::npos)
        return {};
    std::string ext(fileName.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string stemOf(std::string_view fileName) {
    auto dot = extensionDot(fileName);
    if (dot == std::string_view::npos)
        return std::string(fileName);
    return std::string(fileName.substr(0, dot));
}

} // namespace findex::indexing
