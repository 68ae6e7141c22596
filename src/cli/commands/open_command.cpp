// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <CLI/CLI.hpp>
#include <findex/cli/command.h>
#include <findex/cli/command_registry.h>
#include <findex/cli/file_action_runner.h>
#include <findex/cli/findex_cli.h>

#include <string>
#include <vector>

namespace findex::cli {

class OpenCommand : public ICommand {
public:
    std::string getName() const override { return "open"; }

    std::string getDescription() const override {
        return "Find a file or folder by name and open it";
    }

    void registerCommand(CLI::App& app, FindexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("open", getDescription());
        cmd->add_option("type", kind_, "What to open")
            ->required()
            ->check(CLI::IsMember({"file", "folder"}));
        cmd->add_option("target", targetWords_, "Name to search for")->required();

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto kind = metadata::EntryKindUtils::fromString(kind_);
        if (!kind) {
            return Error{ErrorCode::InvalidArgument, "Unknown entry type: " + kind_};
        }
        return runFileAction(cli_, app::FileAction::Open, *kind, targetWords_);
    }

private:
    FindexCLI* cli_ = nullptr;
    std::string kind_;
    std::vector<std::string> targetWords_;
};

std::unique_ptr<ICommand> createOpenCommand() {
    return std::make_unique<OpenCommand>();
}

} // namespace findex::cli
