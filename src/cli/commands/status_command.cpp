// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <findex/cli/command.h>
#include <findex/cli/command_registry.h>
#include <findex/cli/findex_cli.h>
#include <findex/metadata/catalog_types.h>

#include <ctime>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace findex::cli {

namespace {

// "last_index_time" holds epoch seconds; render it in local time
std::string formatIndexTime(const std::string& raw) {
    try {
        const auto seconds = static_cast<std::time_t>(std::stod(raw));
        std::tm tm{};
        localtime_r(&seconds, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    } catch (const std::exception&) {
        return raw;
    }
}

} // namespace

class StatusCommand : public ICommand {
public:
    std::string getName() const override { return "status"; }

    std::string getDescription() const override {
        return "Show catalog size, indexed roots and the last index time";
    }

    void registerCommand(CLI::App& app, FindexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("status", getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto init = cli_->ensureCatalogInitialized();
        if (!init)
            return init;

        auto& store = *cli_->getCatalog();

        auto total = store.countEntries();
        if (!total)
            return total.error();
        auto files = store.countEntries(metadata::EntryKind::File);
        if (!files)
            return files.error();
        auto folders = store.countEntries(metadata::EntryKind::Folder);
        if (!folders)
            return folders.error();

        auto rootRecords = store.listMeta(std::string(metadata::kRootMetaPrefix));
        if (!rootRecords)
            return rootRecords.error();
        std::vector<std::string> roots;
        for (const auto& rec : rootRecords.value()) {
            roots.push_back(rec.key.substr(metadata::kRootMetaPrefix.size()));
        }

        auto lastIndex = store.getMeta(std::string(metadata::kLastIndexTimeKey));
        if (!lastIndex)
            return lastIndex.error();

        auto& out = cli_->out();
        if (cli_->getJsonOutput()) {
            json doc = {{"catalog", store.path().string()},
                        {"entries", total.value()},
                        {"files", files.value()},
                        {"folders", folders.value()},
                        {"roots", roots}};
            if (lastIndex.value()) {
                doc["last_index_time"] = *lastIndex.value();
            } else {
                doc["last_index_time"] = nullptr;
            }
            out << doc.dump(2) << std::endl;
            return Result<void>();
        }

        out << "Catalog:    " << store.path().string() << "\n"
            << "Entries:    " << total.value() << " (" << files.value() << " files, "
            << folders.value() << " folders)\n"
            << "Last index: "
            << (lastIndex.value() ? formatIndexTime(*lastIndex.value()) : std::string("never"))
            << "\n"
            << "Roots:" << (roots.empty() ? " none" : "") << "\n";
        for (const auto& r : roots) {
            out << "  " << r << "\n";
        }
        out.flush();
        return Result<void>();
    }

private:
    FindexCLI* cli_ = nullptr;
};

std::unique_ptr<ICommand> createStatusCommand() {
    return std::make_unique<StatusCommand>();
}

} // namespace findex::cli
