// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <findex/app/entry_opener.h>
#include <findex/app/file_actions.h>
#include <findex/core/types.h>
#include <findex/session/selection_session.h>

namespace findex::app {

enum class DispatchKind {
    NotHandled, ///< nothing here claimed the utterance
    Session,    ///< answered by the pending selection
    FileAction  ///< matched one of the file-control phrases
};

struct DispatchResult {
    DispatchKind kind = DispatchKind::NotHandled;
    std::optional<session::SessionResponse> session;
    std::optional<FileActionResult> action;
    /// Text to show or speak back to the user
    std::string message;
};

/**
 * @brief Routes one already-transcribed utterance to the selection session or to
 * a file action.
 *
 * The dispatcher owns the SelectionSession. A pending choice gets the first look at
 * every utterance; then the fixed phrases "open (the) file X", "open (the) folder X",
 * "list the folder X" and "what files are in the folder X" are tried. Ambiguous
 * results become the new pending choice.
 */
class CommandDispatcher {
public:
    CommandDispatcher(FileActionService& actions, IEntryOpener& opener);

    Result<DispatchResult> dispatch(std::string_view utterance);

    const session::SelectionSession& session() const { return session_; }
    session::SelectionSession& session() { return session_; }

    static std::string formatOptions(const std::vector<metadata::FileSystemEntry>& options,
                                     metadata::EntryKind kind);

private:
    FileActionService& actions_;
    IEntryOpener& opener_;
    session::SelectionSession session_;

    DispatchResult fromSession(session::SessionResponse response);
    Result<DispatchResult> runFileAction(FileAction action, metadata::EntryKind kind,
                                         const std::string& target);
};

} // namespace findex::app
