// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <vector>
#include <findex/indexing/directory_walker.h>

namespace findex::indexing {

namespace fs = std::filesystem;
using metadata::EntryKind;
using metadata::FileSystemEntry;

std::optional<FileSystemEntry> statEntry(const fs::path& path, EntryKind kind,
                                         const std::string& parentDirName) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        spdlog::warn("[DirectoryWalker] Cannot stat '{}': {}", path.string(),
                     std::strerror(errno));
        return std::nullopt;
    }

    FileSystemEntry entry;
    entry.name = path.filename().string();
    entry.path = path.string();
    entry.kind = kind;
    entry.extension = kind == EntryKind::File ? extensionOf(entry.name) : std::string();
    entry.parentDirName = parentDirName;
#if defined(__APPLE__)
    entry.lastModified = static_cast<double>(st.st_mtimespec.tv_sec) +
                         static_cast<double>(st.st_mtimespec.tv_nsec) / 1e9;
#else
    entry.lastModified =
        static_cast<double>(st.st_mtim.tv_sec) + static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
#endif
    entry.sizeBytes = static_cast<int64_t>(st.st_size);
    return entry;
}

Result<WalkStats> walkTree(const fs::path& root, const ExclusionPolicy& policy,
                           const WalkVisitor& visitor) {
    WalkStats stats;
    std::vector<fs::path> pending;
    pending.push_back(root);

    while (!pending.empty()) {
        fs::path current = std::move(pending.back());
        pending.pop_back();
        const std::string parentName = current.filename().string();

        std::error_code ec;
        fs::directory_iterator it(current, ec);
        if (ec) {
            spdlog::warn("[DirectoryWalker] Failed to open directory '{}': {}", current.string(),
                         ec.message());
            ++stats.errors;
            if (ec != std::errc::no_such_file_or_directory) {
                stats.unlistedDirs.push_back(current.string());
            }
            continue;
        }

        std::vector<fs::path> subdirs;
        for (fs::directory_iterator end; it != end;) {
            std::error_code entry_ec;
            const fs::path entryPath = it->path();
            const std::string name = entryPath.filename().string();

            const bool isDir = it->is_directory(entry_ec);
            if (entry_ec) {
                // Dangling or looping symlinks land here; treat them as files like a listing would
                entry_ec.clear();
            }

            if (isDir) {
                if (policy.shouldDescend(name)) {
                    if (auto entry = statEntry(entryPath, EntryKind::Folder, parentName)) {
                        ++stats.foldersVisited;
                        auto visited = visitor(*entry);
                        if (!visited)
                            return visited.error();
                        if (!it->is_symlink(entry_ec) && !entry_ec) {
                            subdirs.push_back(entryPath);
                        }
                    } else {
                        ++stats.errors;
                        stats.unreadable.push_back(entryPath.string());
                    }
                }
            } else if (!policy.shouldIndexFile(name)) {
                ++stats.skippedByFilter;
            } else if (auto entry = statEntry(entryPath, EntryKind::File, parentName)) {
                ++stats.filesVisited;
                auto visited = visitor(*entry);
                if (!visited)
                    return visited.error();
            } else {
                ++stats.errors;
                stats.unreadable.push_back(entryPath.string());
            }

            it.increment(ec);
            if (ec) {
                spdlog::warn("[DirectoryWalker] Error advancing iterator in '{}': {}",
                             current.string(), ec.message());
                ++stats.errors;
                stats.unlistedDirs.push_back(current.string());
                break;
            }
        }

        // Reverse so the first listed subdirectory is walked first
        for (auto rit = subdirs.rbegin(); rit != subdirs.rend(); ++rit) {
            pending.push_back(std::move(*rit));
        }
    }

    return stats;
}

} // namespace findex::indexing
