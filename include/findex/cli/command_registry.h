// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <memory>
#include <vector>
#include <findex/cli/command.h>

namespace findex::cli {

// Forward declaration
class FindexCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(FindexCLI* cli);

    static std::unique_ptr<ICommand> createIndexCommand();
    static std::unique_ptr<ICommand> createSearchCommand();
    static std::unique_ptr<ICommand> createOpenCommand();
    static std::unique_ptr<ICommand> createListCommand();
    static std::unique_ptr<ICommand> createStatusCommand();
    static std::unique_ptr<ICommand> createSessionCommand();
};

// Factories implemented alongside each command
std::unique_ptr<ICommand> createIndexCommand();
std::unique_ptr<ICommand> createSearchCommand();
std::unique_ptr<ICommand> createOpenCommand();
std::unique_ptr<ICommand> createListCommand();
std::unique_ptr<ICommand> createStatusCommand();
std::unique_ptr<ICommand> createSessionCommand();

} // namespace findex::cli
