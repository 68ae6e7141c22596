// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <findex/cli/command.h>
#include <findex/cli/command_registry.h>
#include <findex/cli/findex_cli.h>
#include <findex/config/config_helpers.h>
#include <findex/indexing/catalog_indexer.h>

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace findex::cli {

class IndexCommand : public ICommand {
public:
    std::string getName() const override { return "index"; }

    std::string getDescription() const override {
        return "Build or refresh the catalog for one or more root directories";
    }

    void registerCommand(CLI::App& app, FindexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("index", getDescription());
        cmd->add_option("roots", roots_, "Root directories (default: [index] roots from config)");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto init = cli_->ensureCatalogInitialized();
        if (!init)
            return init;

        std::vector<std::filesystem::path> roots;
        for (const auto& r : roots_) {
            roots.push_back(config::expand_tilde(r));
        }
        if (roots.empty()) {
            roots = cli_->getConfig().roots;
        }
        if (roots.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "No roots given and none configured ([index] roots)"};
        }

        indexing::CatalogIndexer indexer(*cli_->getCatalog(), cli_->getConfig().indexingConfig());
        auto result = indexer.ensureIndex(roots);
        if (!result)
            return result.error();

        auto& out = cli_->out();
        if (cli_->getJsonOutput()) {
            json arr = json::array();
            for (const auto& s : result.value()) {
                arr.push_back({{"root", s.root},
                               {"mode", s.fullRebuild ? "full" : "incremental"},
                               {"inserted", s.inserted},
                               {"updated", s.updated},
                               {"deleted", s.deleted},
                               {"unchanged", s.unchanged},
                               {"skipped_by_filter", s.skippedByFilter},
                               {"errors", s.errors},
                               {"duration_ms", s.duration.count()}});
            }
            out << arr.dump(2) << std::endl;
            return Result<void>();
        }

        for (const auto& s : result.value()) {
            out << (s.fullRebuild ? "Indexed " : "Updated ") << s.root << "\n"
                << "  inserted: " << s.inserted << "  updated: " << s.updated
                << "  deleted: " << s.deleted << "  unchanged: " << s.unchanged << "\n"
                << "  filtered: " << s.skippedByFilter << "  errors: " << s.errors
                << "  time: " << s.duration.count() << "ms" << std::endl;
        }
        return Result<void>();
    }

private:
    FindexCLI* cli_ = nullptr;
    std::vector<std::string> roots_;
};

std::unique_ptr<ICommand> createIndexCommand() {
    return std::make_unique<IndexCommand>();
}

} // namespace findex::cli
