// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <CLI/CLI.hpp>
#include <findex/app/entry_opener.h>
#include <findex/cli/command.h>
#include <findex/config/findex_config.h>
#include <findex/metadata/catalog_store.h>

namespace findex::cli {

/**
 * Main CLI application class
 */
class FindexCLI {
public:
    FindexCLI();
    ~FindexCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing and configuration are complete
     */
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

    /**
     * Open (creating if needed) the catalog under the data directory
     */
    Result<void> ensureCatalogInitialized();

    std::shared_ptr<metadata::CatalogStore> getCatalog() const { return catalog_; }

    const config::FindexConfig& getConfig() const { return config_; }

    std::filesystem::path getDataPath() const { return dataPath_; }

    bool getVerbose() const { return verbose_; }
    bool getJsonOutput() const { return jsonOutput_; }

    /**
     * Opener used by open/list/session; defaults to the platform launcher
     */
    app::IEntryOpener& getOpener() { return *opener_; }
    void setOpener(std::shared_ptr<app::IEntryOpener> opener) { opener_ = std::move(opener); }

    /**
     * Streams used by commands for regular output and for the session command's input
     */
    std::ostream& out() { return *out_; }
    std::istream& in() { return *in_; }
    void setStreams(std::istream& in, std::ostream& out) {
        in_ = &in;
        out_ = &out;
    }

private:
    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;

    bool verbose_ = false;
    bool jsonOutput_ = false;
    std::string dataDirOption_;
    std::string configOption_;

    config::FindexConfig config_;
    std::filesystem::path dataPath_;
    std::shared_ptr<metadata::CatalogStore> catalog_;
    std::shared_ptr<app::IEntryOpener> opener_;

    std::istream* in_;
    std::ostream* out_;

    void applyLogLevel();
};

} // namespace findex::cli
