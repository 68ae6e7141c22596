// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <array>
#include <findex/app/command_dispatcher.h>
#include <findex/search/text_normalize.h>

namespace findex::app {

namespace {

struct FastPath {
    std::array<std::string_view, 2> phrases;
    FileAction action;
    metadata::EntryKind kind;
};

const std::array<FastPath, 3> kFastPaths = {{
    {{"open the folder", "open folder"}, FileAction::Open, metadata::EntryKind::Folder},
    {{"open the file", "open file"}, FileAction::Open, metadata::EntryKind::File},
    {{"list the folder", "what files are in the folder"},
     FileAction::List,
     metadata::EntryKind::Folder},
}};

void eraseAll(std::string& text, std::string_view phrase) {
    for (auto pos = text.find(phrase); pos != std::string::npos; pos = text.find(phrase, pos)) {
        text.erase(pos, phrase.size());
    }
}

std::string trimCopy(std::string s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

const char* kindNoun(metadata::EntryKind kind, bool plural) {
    if (kind == metadata::EntryKind::Folder)
        return plural ? "folders" : "folder";
    return plural ? "files" : "file";
}

} // namespace

CommandDispatcher::CommandDispatcher(FileActionService& actions, IEntryOpener& opener)
    : actions_(actions), opener_(opener) {}

std::string CommandDispatcher::formatOptions(const std::vector<metadata::FileSystemEntry>& options,
                                             metadata::EntryKind kind) {
    std::string out = fmt::format("Multiple {} found:\n", kindNoun(kind, true));
    for (std::size_t i = 0; i < options.size(); ++i) {
        out += fmt::format("{}. {}\n", i + 1, options[i].name);
    }
    out += "Say: open number X";
    return out;
}

Result<DispatchResult> CommandDispatcher::dispatch(std::string_view utterance) {
    if (session_.hasPending()) {
        const auto kind = session_.pending()->kind;
        auto response = session_.handleUtterance(utterance, opener_);
        if (response.outcome != session::SessionOutcome::NotHandled) {
            auto result = fromSession(std::move(response));
            if (result.session->outcome == session::SessionOutcome::Repeated) {
                result.message = formatOptions(result.session->options, kind);
            }
            return result;
        }
    }

    const std::string lowered = search::toLowerAscii(utterance);
    for (const auto& path : kFastPaths) {
        const bool matched = lowered.find(path.phrases[0]) != std::string::npos ||
                             lowered.find(path.phrases[1]) != std::string::npos;
        if (!matched)
            continue;

        std::string target = lowered;
        for (auto phrase : path.phrases) {
            eraseAll(target, phrase);
        }
        return runFileAction(path.action, path.kind, trimCopy(std::move(target)));
    }

    spdlog::debug("[CommandDispatcher] Not handled: '{}'", utterance);
    return DispatchResult{};
}

DispatchResult CommandDispatcher::fromSession(session::SessionResponse response) {
    DispatchResult result;
    result.kind = DispatchKind::Session;

    switch (response.outcome) {
        case session::SessionOutcome::Cancelled:
            result.message = "Selection cancelled.";
            break;
        case session::SessionOutcome::InvalidSelection:
            result.message = fmt::format("There is no option {}. Choose 1 to {}.",
                                         response.requestedNumber, response.options.size());
            break;
        case session::SessionOutcome::Selected:
            result.message = response.opened
                                 ? fmt::format("Opened {}", response.selected->name)
                                 : fmt::format("Could not open {}", response.selected->name);
            break;
        case session::SessionOutcome::Repeated:
        case session::SessionOutcome::NotHandled:
            break;
    }

    result.session = std::move(response);
    return result;
}

Result<DispatchResult> CommandDispatcher::runFileAction(FileAction action,
                                                        metadata::EntryKind kind,
                                                        const std::string& target) {
    spdlog::debug("[CommandDispatcher] {} {} '{}'", fileActionToString(action),
                  metadata::EntryKindUtils::toString(kind), target);

    auto actionResult = actions_.handleFileAction(action, kind, target);
    if (!actionResult) {
        return actionResult.error();
    }

    DispatchResult result;
    result.kind = DispatchKind::FileAction;
    const auto& outcome = actionResult.value();

    using Status = FileActionResult::Status;
    switch (outcome.status) {
        case Status::NotFound:
            result.message = fmt::format("I couldn't find that {}.", kindNoun(kind, false));
            break;
        case Status::Opened:
            result.message = fmt::format("Opened {}", outcome.target->name);
            break;
        case Status::OpenFailed:
            result.message = fmt::format("Could not open {}", outcome.target->name);
            break;
        case Status::Ambiguous:
            session_.setPending(outcome.matches, kind);
            result.message = formatOptions(outcome.matches, kind);
            break;
        case Status::Listed: {
            result.message = fmt::format("Contents of {}:", outcome.target->name);
            for (const auto& child : outcome.children) {
                result.message += fmt::format("\n - {}", child);
            }
            break;
        }
    }

    result.action = std::move(actionResult).value();
    return result;
}

} // namespace findex::app
