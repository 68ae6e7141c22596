// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <findex/app/file_actions.h>
#include <findex/search/text_normalize.h>

namespace findex::app {

namespace {

std::string_view trimView(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

ErrorCode errorCodeFor(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory)
        return ErrorCode::FileNotFound;
    if (ec == std::errc::permission_denied)
        return ErrorCode::PermissionDenied;
    return ErrorCode::InternalError;
}

} // namespace

FileAction parseFileAction(std::string_view action) {
    const auto lowered = search::toLowerAscii(trimView(action));
    if (lowered == "open")
        return FileAction::Open;
    if (lowered == "list" || lowered == "list_folder")
        return FileAction::List;
    throw std::invalid_argument("Unknown file action: '" + std::string(action) + "'");
}

const char* fileActionToString(FileAction action) {
    return action == FileAction::List ? "list" : "open";
}

FileActionService::FileActionService(search::RankingEngine& ranking, IEntryOpener& opener,
                                     std::size_t searchLimit)
    : ranking_(ranking), opener_(opener), searchLimit_(searchLimit) {}

Result<FileActionResult> FileActionService::handleFileAction(FileAction action,
                                                             metadata::EntryKind kind,
                                                             std::string_view targetText) {
    if (action == FileAction::List && kind != metadata::EntryKind::Folder) {
        return Error{ErrorCode::InvalidArgument, "Only folders can be listed"};
    }

    const auto target = trimView(targetText);
    auto searchResult = ranking_.search(target, searchLimit_);
    if (!searchResult) {
        return searchResult.error();
    }

    FileActionResult result;
    for (const auto& entry : searchResult.value()) {
        if (entry.kind == kind)
            result.matches.push_back(entry);
    }

    if (result.matches.empty()) {
        spdlog::info("[FileActionService] No {} found for '{}'",
                     metadata::EntryKindUtils::toString(kind), target);
        result.status = FileActionResult::Status::NotFound;
        return result;
    }

    if (action == FileAction::List) {
        const auto& folder = result.matches.front();
        auto children = listChildren(folder.path, kMaxListedChildren);
        if (!children) {
            return children.error();
        }
        result.target = folder;
        result.children = std::move(children).value();
        result.status = FileActionResult::Status::Listed;
        return result;
    }

    if (result.matches.size() > 1) {
        result.status = FileActionResult::Status::Ambiguous;
        return result;
    }

    result.target = result.matches.front();
    result.status = opener_.openEntry(*result.target) ? FileActionResult::Status::Opened
                                                       : FileActionResult::Status::OpenFailed;
    return result;
}

Result<std::vector<std::string>> FileActionService::listChildren(const std::string& folder,
                                                                  std::size_t maxEntries) {
    std::error_code ec;
    std::filesystem::directory_iterator it(folder, ec);
    if (ec) {
        spdlog::warn("[FileActionService] Cannot list '{}': {}", folder, ec.message());
        return Error{errorCodeFor(ec), "Cannot list '" + folder + "': " + ec.message()};
    }

    std::vector<std::string> names;
    for (std::filesystem::directory_iterator end; it != end;) {
        names.push_back(it->path().filename().string());
        it.increment(ec);
        if (ec) {
            spdlog::warn("[FileActionService] Listing '{}' stopped early: {}", folder,
                         ec.message());
            break;
        }
    }

    std::sort(names.begin(), names.end());
    if (names.size() > maxEntries) {
        names.resize(maxEntries);
    }
    return names;
}

} // namespace findex::app
