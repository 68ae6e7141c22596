// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <findex/app/command_dispatcher.h>
#include <findex/app/file_actions.h>
#include <findex/cli/command.h>
#include <findex/cli/command_registry.h>
#include <findex/cli/findex_cli.h>
#include <findex/config/config_helpers.h>
#include <findex/search/ranking.h>

#include <istream>
#include <ostream>
#include <string>

using json = nlohmann::json;

namespace findex::cli {

namespace {

const char* kindName(app::DispatchKind kind) {
    switch (kind) {
        case app::DispatchKind::NotHandled:
            return "not_handled";
        case app::DispatchKind::Session:
            return "session";
        case app::DispatchKind::FileAction:
            return "file_action";
    }
    return "unknown";
}

} // namespace

/**
 * Line-oriented stand-in for the voice front end: every stdin line is one utterance.
 */
class SessionCommand : public ICommand {
public:
    std::string getName() const override { return "session"; }

    std::string getDescription() const override {
        return "Read spoken-style commands from stdin, one per line";
    }

    void registerCommand(CLI::App& app, FindexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("session", getDescription());
        cmd->add_flag("--no-prompt", noPrompt_, "Do not print a prompt before each line");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto init = cli_->ensureCatalogInitialized();
        if (!init)
            return init;

        search::RankingEngine engine(*cli_->getCatalog(), cli_->getConfig().rankingConfig());
        app::FileActionService actions(engine, cli_->getOpener(), cli_->getConfig().searchLimit);
        app::CommandDispatcher dispatcher(actions, cli_->getOpener());

        auto& in = cli_->in();
        auto& out = cli_->out();
        const bool jsonOutput = cli_->getJsonOutput();
        const bool prompt = !noPrompt_ && !jsonOutput;

        std::string line;
        while (true) {
            if (prompt) {
                out << "> " << std::flush;
            }
            if (!std::getline(in, line))
                break;
            config::trim(line);
            if (line.empty())
                continue;

            auto result = dispatcher.dispatch(line);
            if (!result) {
                spdlog::warn("[Session] '{}' failed: {}", line, result.error().message);
                if (jsonOutput) {
                    out << json{{"utterance", line}, {"error", result.error().message}}.dump()
                        << std::endl;
                } else {
                    out << "Error: " << result.error().message << std::endl;
                }
                continue;
            }

            const auto& r = result.value();
            if (jsonOutput) {
                out << json{{"utterance", line},
                            {"handled_by", kindName(r.kind)},
                            {"message", r.message},
                            {"pending", dispatcher.session().hasPending()}}
                           .dump()
                    << std::endl;
            } else if (r.kind == app::DispatchKind::NotHandled) {
                out << "not handled: " << line << std::endl;
            } else {
                out << r.message << std::endl;
            }
        }
        return Result<void>();
    }

private:
    FindexCLI* cli_ = nullptr;
    bool noPrompt_ = false;
};

std::unique_ptr<ICommand> createSessionCommand() {
    return std::make_unique<SessionCommand>();
}

} // namespace findex::cli
