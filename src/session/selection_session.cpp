// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <limits>
#include <utility>
#include <findex/search/text_normalize.h>
#include <findex/session/selection_session.h>

namespace findex::session {

namespace {

constexpr std::array<std::string_view, 7> kCancelPhrases = {
    "cancel", "never mind", "forget it", "leave it", "stop that", "don't open", "do not open"};

constexpr std::array<std::string_view, 4> kRepeatPhrases = {"repeat", "what were", "show again",
                                                            "say again"};

constexpr std::array<std::string_view, 3> kListNouns = {"option", "choices", "list"};

constexpr std::array<std::pair<std::string_view, std::string_view>, 10> kNumberWords = {{
    {"one", "1"},
    {"two", "2"},
    {"three", "3"},
    {"four", "4"},
    {"five", "5"},
    {"six", "6"},
    {"seven", "7"},
    {"eight", "8"},
    {"nine", "9"},
    {"ten", "10"},
}};

constexpr std::array<std::string_view, 5> kOrdinals = {"first", "second", "third", "fourth",
                                                       "fifth"};

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

bool isWordChar(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

std::vector<std::string_view> alphaWords(std::string_view text) {
    std::vector<std::string_view> words;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && !isWordChar(text[i]))
            ++i;
        const std::size_t start = i;
        while (i < text.size() && isWordChar(text[i]))
            ++i;
        if (i > start)
            words.push_back(text.substr(start, i - start));
    }
    return words;
}

} // namespace

void SelectionSession::setPending(std::vector<metadata::FileSystemEntry> matches,
                                  metadata::EntryKind kind) {
    if (matches.empty()) {
        clear();
        return;
    }
    if (pending_) {
        spdlog::debug("[SelectionSession] Replacing pending selection of {} option(s)",
                      pending_->matches.size());
    }
    pending_ = PendingSelection{std::move(matches), kind};
}

void SelectionSession::clear() {
    pending_.reset();
}

bool SelectionSession::isCancelPhrase(std::string_view lowered) {
    return std::any_of(kCancelPhrases.begin(), kCancelPhrases.end(),
                       [&](std::string_view phrase) { return contains(lowered, phrase); });
}

bool SelectionSession::isRepeatRequest(std::string_view lowered) {
    if (contains(lowered, "show") &&
        std::any_of(kListNouns.begin(), kListNouns.end(),
                    [&](std::string_view noun) { return contains(lowered, noun); })) {
        return true;
    }
    return std::any_of(kRepeatPhrases.begin(), kRepeatPhrases.end(),
                       [&](std::string_view phrase) { return contains(lowered, phrase); });
}

std::string SelectionSession::normalizeSpokenNumbers(std::string_view lowered) {
    std::string out;
    out.reserve(lowered.size());
    std::size_t i = 0;
    while (i < lowered.size()) {
        if (!isWordChar(lowered[i])) {
            out.push_back(lowered[i++]);
            continue;
        }
        const std::size_t start = i;
        while (i < lowered.size() && isWordChar(lowered[i]))
            ++i;
        const auto word = lowered.substr(start, i - start);
        auto it = std::find_if(kNumberWords.begin(), kNumberWords.end(),
                               [&](const auto& nw) { return nw.first == word; });
        if (it != kNumberWords.end()) {
            out += it->second;
        } else {
            out.append(word.data(), word.size());
        }
    }
    return out;
}

std::optional<std::int64_t> SelectionSession::requestedOption(std::string_view lowered) {
    // An ordinal wins over number words: in "the second one", "one" is a pronoun
    const auto words = alphaWords(lowered);
    for (std::size_t i = 0; i < kOrdinals.size(); ++i) {
        if (std::find(words.begin(), words.end(), kOrdinals[i]) != words.end()) {
            return static_cast<std::int64_t>(i + 1);
        }
    }

    const std::string text = normalizeSpokenNumbers(lowered);
    auto digitIt = std::find_if(text.begin(), text.end(),
                                [](unsigned char c) { return std::isdigit(c) != 0; });
    if (digitIt == text.end()) {
        return std::nullopt;
    }
    auto endIt = std::find_if(digitIt, text.end(),
                              [](unsigned char c) { return std::isdigit(c) == 0; });
    const char* first = text.data() + (digitIt - text.begin());
    const char* last = text.data() + (endIt - text.begin());

    std::int64_t number = 0;
    auto [ptr, ec] = std::from_chars(first, last, number);
    if (ec == std::errc::result_out_of_range) {
        return std::numeric_limits<std::int64_t>::max();
    }
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return number;
}

SessionResponse SelectionSession::handleUtterance(std::string_view utterance,
                                                  app::IEntryOpener& opener) {
    SessionResponse response;
    if (!pending_) {
        return response;
    }

    const std::string lowered = search::toLowerAscii(utterance);
    response.options = pending_->matches;

    if (isCancelPhrase(lowered)) {
        spdlog::info("[SelectionSession] Selection cancelled");
        clear();
        response.outcome = SessionOutcome::Cancelled;
        return response;
    }

    if (isRepeatRequest(lowered)) {
        response.outcome = SessionOutcome::Repeated;
        return response;
    }

    auto number = requestedOption(lowered);
    if (!number) {
        return response;
    }

    response.requestedNumber = *number;
    const auto count = static_cast<std::int64_t>(pending_->matches.size());
    if (*number < 1 || *number > count) {
        spdlog::info("[SelectionSession] Option {} is out of range (1-{})", *number, count);
        response.outcome = SessionOutcome::InvalidSelection;
        return response;
    }

    auto entry = pending_->matches[static_cast<std::size_t>(*number - 1)];
    clear();
    response.opened = opener.openEntry(entry);
    response.selected = std::move(entry);
    response.outcome = SessionOutcome::Selected;
    return response;
}

} // namespace findex::session
