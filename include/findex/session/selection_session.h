// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <findex/app/entry_opener.h>
#include <findex/metadata/catalog_types.h>

namespace findex::session {

enum class SessionState { Idle, AwaitingSelection };

/**
 * @brief Ordered options the user is choosing between, and the kind they asked for
 */
struct PendingSelection {
    std::vector<metadata::FileSystemEntry> matches;
    metadata::EntryKind kind = metadata::EntryKind::File;
};

enum class SessionOutcome {
    NotHandled,      ///< utterance is not about the pending choice (or nothing is pending)
    Cancelled,       ///< pending choice dropped
    Repeated,        ///< options re-emitted unchanged
    Selected,        ///< an option was picked and handed to the opener
    InvalidSelection ///< a number or ordinal outside the option list; choice still pending
};

struct SessionResponse {
    SessionOutcome outcome = SessionOutcome::NotHandled;
    /// Options for Repeated, the list that was pending for everything else
    std::vector<metadata::FileSystemEntry> options;
    std::optional<metadata::FileSystemEntry> selected;
    bool opened = false;
    /// One-based number the user asked for (Selected / InvalidSelection)
    std::int64_t requestedNumber = 0;
};

/**
 * @brief Multi-turn disambiguation between several search matches.
 *
 * Holds at most one PendingSelection. While it is set, utterances are checked in
 * order for a cancel phrase, a request to repeat the options, and finally a
 * number (digits, "one".."ten") or ordinal ("first".."fifth"). Anything else is
 * left to the caller.
 */
class SelectionSession {
public:
    SelectionSession() = default;

    /**
     * @brief Start (or replace) a pending choice. An empty list clears the session.
     */
    void setPending(std::vector<metadata::FileSystemEntry> matches, metadata::EntryKind kind);
    void clear();

    bool hasPending() const { return pending_.has_value(); }
    SessionState state() const {
        return pending_ ? SessionState::AwaitingSelection : SessionState::Idle;
    }
    const std::optional<PendingSelection>& pending() const { return pending_; }

    SessionResponse handleUtterance(std::string_view utterance, app::IEntryOpener& opener);

    static bool isCancelPhrase(std::string_view lowered);
    static bool isRepeatRequest(std::string_view lowered);

    /**
     * @brief Replace whole words "one".."ten" with their digits.
     */
    static std::string normalizeSpokenNumbers(std::string_view lowered);

    /**
     * @brief One-based option number named by the utterance, if any.
     *
     * The first of "first".."fifth" present as a word wins, so the "one" in
     * "the second one" is not read as a number; failing that, the first run of
     * digits after spoken numbers are converted.
     */
    static std::optional<std::int64_t> requestedOption(std::string_view lowered);

private:
    std::optional<PendingSelection> pending_;
};

} // namespace findex::session
