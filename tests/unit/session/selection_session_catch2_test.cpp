// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <limits>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <findex/session/selection_session.h>

#include "../../common/test_helpers_catch2.h"

using namespace findex;
using namespace findex::metadata;
using namespace findex::session;

namespace {

FileSystemEntry namedEntry(const std::string& name, EntryKind kind = EntryKind::File) {
    FileSystemEntry e;
    e.name = name;
    e.path = "/docs/" + name;
    e.kind = kind;
    return e;
}

std::vector<FileSystemEntry> threeOptions() {
    return {namedEntry("A.txt"), namedEntry("B.txt"), namedEntry("C.txt")};
}

} // namespace

TEST_CASE("SelectionSession: starts idle and ignores utterances", "[unit][session]") {
    SelectionSession session;
    test::RecordingOpener opener;

    CHECK(session.state() == SessionState::Idle);
    CHECK_FALSE(session.hasPending());

    auto response = session.handleUtterance("open number one", opener);
    CHECK(response.outcome == SessionOutcome::NotHandled);
    CHECK(opener.opened.empty());
}

TEST_CASE("SelectionSession: choosing an option", "[unit][session]") {
    SelectionSession session;
    test::RecordingOpener opener;
    session.setPending(threeOptions(), EntryKind::File);
    REQUIRE(session.state() == SessionState::AwaitingSelection);

    SECTION("Spoken number") {
        auto response = session.handleUtterance("open number two", opener);
        CHECK(response.outcome == SessionOutcome::Selected);
        REQUIRE(response.selected.has_value());
        CHECK(response.selected->name == "B.txt");
        CHECK(response.requestedNumber == 2);
        CHECK(response.opened);
        REQUIRE(opener.opened.size() == 1);
        CHECK(opener.opened[0].name == "B.txt");
        CHECK(session.state() == SessionState::Idle);
    }

    SECTION("Ordinal") {
        auto response = session.handleUtterance("second", opener);
        CHECK(response.outcome == SessionOutcome::Selected);
        REQUIRE(response.selected.has_value());
        CHECK(response.selected->name == "B.txt");
        CHECK_FALSE(session.hasPending());
    }

    SECTION("Digits and mixed case") {
        auto response = session.handleUtterance("Open Number 3", opener);
        CHECK(response.outcome == SessionOutcome::Selected);
        CHECK(response.selected->name == "C.txt");
    }

    SECTION("Number words only count as whole words") {
        // "someone" and "often" must not be read as one or ten
        auto response = session.handleUtterance("someone said the first one", opener);
        CHECK(response.outcome == SessionOutcome::Selected);
        CHECK(response.selected->name == "A.txt");
    }

    SECTION("An ordinal followed by the word one") {
        auto second = session.handleUtterance("open the second one", opener);
        CHECK(second.outcome == SessionOutcome::Selected);
        REQUIRE(second.selected.has_value());
        CHECK(second.selected->name == "B.txt");
        CHECK(second.requestedNumber == 2);
        REQUIRE(opener.opened.size() == 1);
        CHECK(opener.opened[0].name == "B.txt");

        session.setPending(threeOptions(), EntryKind::File);
        auto third = session.handleUtterance("the third one please", opener);
        CHECK(third.outcome == SessionOutcome::Selected);
        REQUIRE(third.selected.has_value());
        CHECK(third.selected->name == "C.txt");
    }

    SECTION("A failed open still consumes the selection") {
        test::RecordingOpener failing(false);
        auto response = session.handleUtterance("the third", failing);
        CHECK(response.outcome == SessionOutcome::Selected);
        CHECK_FALSE(response.opened);
        CHECK_FALSE(session.hasPending());
    }
}

TEST_CASE("SelectionSession: out-of-range choices keep the selection", "[unit][session]") {
    SelectionSession session;
    test::RecordingOpener opener;
    session.setPending(threeOptions(), EntryKind::File);

    for (const char* utterance : {"open number nine", "number 0", "the fifth please",
                                  "open 99999999999999999999999"}) {
        auto response = session.handleUtterance(utterance, opener);
        CHECK(response.outcome == SessionOutcome::InvalidSelection);
        CHECK(session.state() == SessionState::AwaitingSelection);
        CHECK(session.pending()->matches.size() == 3);
    }
    CHECK(opener.opened.empty());
}

TEST_CASE("SelectionSession: cancel and repeat", "[unit][session]") {
    SelectionSession session;
    test::RecordingOpener opener;
    session.setPending(threeOptions(), EntryKind::Folder);

    SECTION("Cancel empties the selection") {
        for (const char* phrase : {"cancel", "never mind", "Forget it", "please don't open it"}) {
            session.setPending(threeOptions(), EntryKind::Folder);
            auto response = session.handleUtterance(phrase, opener);
            CHECK(response.outcome == SessionOutcome::Cancelled);
            CHECK(session.state() == SessionState::Idle);
        }
        CHECK(opener.opened.empty());
    }

    SECTION("Cancel wins over a number in the same utterance") {
        auto response = session.handleUtterance("cancel number two", opener);
        CHECK(response.outcome == SessionOutcome::Cancelled);
        CHECK(opener.opened.empty());
    }

    SECTION("Repeat re-emits the options unchanged") {
        for (const char* phrase : {"repeat", "what were they", "show me the list",
                                   "show the choices", "say again"}) {
            auto response = session.handleUtterance(phrase, opener);
            CHECK(response.outcome == SessionOutcome::Repeated);
            REQUIRE(response.options.size() == 3);
            CHECK(response.options[0].name == "A.txt");
            CHECK(response.options[2].name == "C.txt");
            CHECK(session.hasPending());
            CHECK(session.pending()->kind == EntryKind::Folder);
        }
    }

    SECTION("Unrelated utterances fall through") {
        auto response = session.handleUtterance("what's the weather like", opener);
        CHECK(response.outcome == SessionOutcome::NotHandled);
        CHECK(session.hasPending());
    }
}

TEST_CASE("SelectionSession: a new ambiguous result replaces the old one", "[unit][session]") {
    SelectionSession session;
    test::RecordingOpener opener;
    session.setPending(threeOptions(), EntryKind::File);
    session.setPending({namedEntry("X", EntryKind::Folder), namedEntry("Y", EntryKind::Folder)},
                       EntryKind::Folder);

    REQUIRE(session.pending()->matches.size() == 2);
    CHECK(session.pending()->kind == EntryKind::Folder);

    auto response = session.handleUtterance("number three", opener);
    CHECK(response.outcome == SessionOutcome::InvalidSelection);

    response = session.handleUtterance("open number two", opener);
    CHECK(response.outcome == SessionOutcome::Selected);
    CHECK(response.selected->name == "Y");

    session.setPending({}, EntryKind::File);
    CHECK_FALSE(session.hasPending());
}

TEST_CASE("SelectionSession: number parsing helpers", "[unit][session]") {
    CHECK(SelectionSession::normalizeSpokenNumbers("open number two") == "open number 2");
    CHECK(SelectionSession::normalizeSpokenNumbers("often someone") == "often someone");
    CHECK(SelectionSession::normalizeSpokenNumbers("ten, one!") == "10, 1!");

    CHECK(SelectionSession::requestedOption("number 12") == 12);
    CHECK(SelectionSession::requestedOption("the fourth") == 4);
    CHECK(SelectionSession::requestedOption("first or second") == 1);
    CHECK(SelectionSession::requestedOption("the second one") == 2);
    CHECK(SelectionSession::requestedOption("the fifth one") == 5);
    CHECK_FALSE(SelectionSession::requestedOption("the sixth").has_value());
    CHECK_FALSE(SelectionSession::requestedOption("open it").has_value());
    CHECK(SelectionSession::requestedOption("99999999999999999999999") ==
          std::numeric_limits<std::int64_t>::max());
}
