// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <findex/cli/command_registry.h>
#include <findex/cli/findex_cli.h>

namespace findex::cli {

void CommandRegistry::registerAllCommands(FindexCLI* cli) {
    cli->registerCommand(CommandRegistry::createIndexCommand());
    cli->registerCommand(CommandRegistry::createSearchCommand());
    cli->registerCommand(CommandRegistry::createOpenCommand());
    cli->registerCommand(CommandRegistry::createListCommand());
    cli->registerCommand(CommandRegistry::createStatusCommand());
    cli->registerCommand(CommandRegistry::createSessionCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createIndexCommand() {
    return ::findex::cli::createIndexCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createSearchCommand() {
    return ::findex::cli::createSearchCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createOpenCommand() {
    return ::findex::cli::createOpenCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createListCommand() {
    return ::findex::cli::createListCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createStatusCommand() {
    return ::findex::cli::createStatusCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createSessionCommand() {
    return ::findex::cli::createSessionCommand();
}

} // namespace findex::cli
