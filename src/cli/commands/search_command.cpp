// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <findex/cli/command.h>
#include <findex/cli/command_registry.h>
#include <findex/cli/findex_cli.h>
#include <findex/search/ranking.h>

#include <iomanip>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace findex::cli {

namespace {

json breakdownToJson(const search::ScoreBreakdown& b) {
    return json{{"fuzzy_base", b.fuzzyBase},
                {"exact_boost", b.exactBoost},
                {"name_vs_path_boost", b.nameVsPathBoost},
                {"recency_boost", b.recencyBoost},
                {"extension_intent_boost", b.extensionIntentBoost},
                {"folder_context_boost", b.folderContextBoost},
                {"depth_penalty", b.depthPenalty}};
}

} // namespace

class SearchCommand : public ICommand {
public:
    std::string getName() const override { return "search"; }

    std::string getDescription() const override {
        return "Fuzzy search the catalog for files and folders by name";
    }

    void registerCommand(CLI::App& app, FindexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("search", getDescription());
        cmd->add_option("query", queryWords_, "Search query")->required();
        cmd->add_option("-l,--limit", limit_, "Maximum number of results")
            ->check(CLI::PositiveNumber);
        cmd->add_flag("--explain", explain_, "Show the score breakdown for each result");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto init = cli_->ensureCatalogInitialized();
        if (!init)
            return init;

        std::string query;
        for (const auto& w : queryWords_) {
            if (!query.empty())
                query.push_back(' ');
            query += w;
        }

        const auto limit = limit_.value_or(cli_->getConfig().searchLimit);
        search::RankingEngine engine(*cli_->getCatalog(), cli_->getConfig().rankingConfig());
        auto result = engine.searchDetailed(query, limit);
        if (!result)
            return result.error();

        const auto& ranked = result.value();
        auto& out = cli_->out();

        if (cli_->getJsonOutput()) {
            json arr = json::array();
            for (const auto& r : ranked) {
                json item = {{"name", r.entry.name},
                             {"path", r.entry.path},
                             {"type", metadata::EntryKindUtils::toString(r.entry.kind)},
                             {"extension", r.entry.extension},
                             {"score", r.score}};
                if (explain_) {
                    item["breakdown"] = breakdownToJson(r.breakdown);
                }
                arr.push_back(std::move(item));
            }
            out << arr.dump(2) << std::endl;
            return Result<void>();
        }

        if (ranked.empty()) {
            out << "No matching file or folder found." << std::endl;
            return Result<void>();
        }

        for (std::size_t i = 0; i < ranked.size(); ++i) {
            const auto& r = ranked[i];
            out << (i + 1) << ". " << r.entry.name << "  ["
                << metadata::EntryKindUtils::toString(r.entry.kind) << "]  " << r.entry.path
                << "\n";
            if (explain_) {
                const auto& b = r.breakdown;
                out << std::fixed << std::setprecision(1) << "     score " << r.score
                    << " = fuzzy " << b.fuzzyBase << " + exact " << b.exactBoost << " + name "
                    << b.nameVsPathBoost << " + recency " << b.recencyBoost << " + type "
                    << b.extensionIntentBoost << " + folder " << b.folderContextBoost
                    << " - depth " << b.depthPenalty << "\n";
                out << std::defaultfloat;
            }
        }
        out.flush();
        return Result<void>();
    }

private:
    FindexCLI* cli_ = nullptr;
    std::vector<std::string> queryWords_;
    std::optional<std::size_t> limit_;
    bool explain_ = false;
};

std::unique_ptr<ICommand> createSearchCommand() {
    return std::make_unique<SearchCommand>();
}

} // namespace findex::cli
