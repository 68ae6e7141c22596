// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <CLI/CLI.hpp>
#include <findex/app/file_actions.h>
#include <findex/cli/command.h>
#include <findex/cli/command_registry.h>
#include <findex/cli/file_action_runner.h>
#include <findex/cli/findex_cli.h>

#include <string>
#include <vector>

namespace findex::cli {

class ListCommand : public ICommand {
public:
    std::string getName() const override { return "list"; }

    std::string getDescription() const override {
        return "Find a folder by name and show what it contains";
    }

    void registerCommand(CLI::App& app, FindexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("list", getDescription());
        cmd->add_option("target", targetWords_, "Folder name to search for")->required();

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        return runFileAction(cli_, app::FileAction::List, metadata::EntryKind::Folder,
                             targetWords_);
    }

private:
    FindexCLI* cli_ = nullptr;
    std::vector<std::string> targetWords_;
};

std::unique_ptr<ICommand> createListCommand() {
    return std::make_unique<ListCommand>();
}

} // namespace findex::cli
