// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <nlohmann/json.hpp>
#include <findex/app/command_dispatcher.h>
#include <findex/cli/file_action_runner.h>
#include <findex/cli/findex_cli.h>
#include <findex/search/ranking.h>

#include <ostream>

using json = nlohmann::json;

namespace findex::cli {

namespace {

const char* statusName(app::FileActionResult::Status status) {
    using Status = app::FileActionResult::Status;
    switch (status) {
        case Status::NotFound:
            return "not_found";
        case Status::Opened:
            return "opened";
        case Status::OpenFailed:
            return "open_failed";
        case Status::Ambiguous:
            return "ambiguous";
        case Status::Listed:
            return "listed";
    }
    return "unknown";
}

} // namespace

Result<void> runFileAction(FindexCLI* cli, app::FileAction action, metadata::EntryKind kind,
                           const std::vector<std::string>& targetWords) {
    auto init = cli->ensureCatalogInitialized();
    if (!init)
        return init;

    std::string target;
    for (const auto& w : targetWords) {
        if (!target.empty())
            target.push_back(' ');
        target += w;
    }

    search::RankingEngine engine(*cli->getCatalog(), cli->getConfig().rankingConfig());
    app::FileActionService service(engine, cli->getOpener(), cli->getConfig().searchLimit);
    auto result = service.handleFileAction(action, kind, target);
    if (!result)
        return result.error();

    const auto& r = result.value();
    auto& out = cli->out();
    using Status = app::FileActionResult::Status;

    if (cli->getJsonOutput()) {
        json doc = {{"action", app::fileActionToString(action)},
                    {"type", metadata::EntryKindUtils::toString(kind)},
                    {"target", target},
                    {"status", statusName(r.status)}};
        json matches = json::array();
        for (const auto& m : r.matches) {
            matches.push_back({{"name", m.name}, {"path", m.path}});
        }
        doc["matches"] = std::move(matches);
        if (r.target) {
            doc["entry"] = {{"name", r.target->name}, {"path", r.target->path}};
        }
        if (r.status == Status::Listed) {
            doc["children"] = r.children;
        }
        out << doc.dump(2) << std::endl;
    } else {
        switch (r.status) {
            case Status::NotFound:
                // Reported through the returned error
                break;
            case Status::Opened:
                out << "Opened " << r.target->path << std::endl;
                break;
            case Status::OpenFailed:
                out << "Could not open " << r.target->path << std::endl;
                break;
            case Status::Ambiguous:
                out << app::CommandDispatcher::formatOptions(r.matches, kind) << std::endl;
                break;
            case Status::Listed:
                out << "Contents of " << r.target->name << ":" << std::endl;
                for (const auto& child : r.children) {
                    out << " - " << child << "\n";
                }
                out.flush();
                break;
        }
    }

    if (r.status == Status::NotFound) {
        return Error{ErrorCode::NotFound, std::string("No matching ") +
                                              metadata::EntryKindUtils::toString(kind) +
                                              " found for '" + target + "'"};
    }
    if (r.status == Status::OpenFailed) {
        return Error{ErrorCode::InternalError, "Failed to open " + r.target->path};
    }
    return Result<void>();
}

} // namespace findex::cli
