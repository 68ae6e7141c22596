// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <findex/cli/command_registry.h>
#include <findex/cli/findex_cli.h>
#include <findex/config/config_helpers.h>

#ifndef FINDEX_VERSION_STRING
#define FINDEX_VERSION_STRING "0.1.0"
#endif

namespace findex::cli {

namespace {

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

FindexCLI::FindexCLI()
    : opener_(std::make_shared<app::SystemEntryOpener>()), in_(&std::cin), out_(&std::cout) {
    // Set a conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("findex - find and open local files by name", "findex");
    app_->set_version_flag("--version", FINDEX_VERSION_STRING);
    app_->require_subcommand(1);
    app_->fallthrough();

    app_->add_option("--data-dir", dataDirOption_,
                     "Directory holding the catalog (default: $XDG_DATA_HOME/findex)");
    app_->add_option("--config", configOption_,
                     "Config file (default: $XDG_CONFIG_HOME/findex/config.toml)");
    app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");
    app_->add_flag("--json", jsonOutput_, "Output in JSON format");
}

FindexCLI::~FindexCLI() = default;

void FindexCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

int FindexCLI::run(int argc, char* argv[]) {
    try {
        CommandRegistry::registerAllCommands(this);

        app_->parse(argc, argv);

        auto cfgResult = config::FindexConfig::load(config::get_config_path(configOption_));
        if (!cfgResult) {
            std::cerr << "Error: " << cfgResult.error().message << "\n";
            return 1;
        }
        config_ = std::move(cfgResult).value();

        applyLogLevel();

        dataPath_ = config::resolveDataDir(config_, dataDirOption_);
        spdlog::debug("Using data directory '{}'", dataPath_.string());

        if (pendingCommand_) {
            auto result = pendingCommand_->execute();
            if (!result) {
                spdlog::debug("{} failed: {} ({})", pendingCommand_->getName(),
                              result.error().message, errorToString(result.error().code));
                std::cerr << "Error: " << result.error().message << "\n";
                return 1;
            }
        }

        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

void FindexCLI::applyLogLevel() {
    // Precedence: env FINDEX_LOG_LEVEL > --verbose > config [logging] level > warn
    if (const char* envLvl = std::getenv("FINDEX_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown FINDEX_LOG_LEVEL '{}'", envLvl);
    }
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    if (!config_.logLevel.empty()) {
        if (auto lvl = parseLevel(config_.logLevel)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown [logging] level '{}'", config_.logLevel);
    }
    spdlog::set_level(spdlog::level::warn);
}

Result<void> FindexCLI::ensureCatalogInitialized() {
    if (catalog_) {
        return Result<void>();
    }

    auto store = std::make_shared<metadata::CatalogStore>(config::catalogPath(dataPath_));
    auto initResult = store->initialize();
    if (!initResult) {
        return Error{initResult.error().code, "Failed to open catalog at '" +
                                                  store->path().string() +
                                                  "': " + initResult.error().message};
    }
    catalog_ = std::move(store);
    return Result<void>();
}

} // namespace findex::cli
