// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <findex/cli/findex_cli.h>
#include <findex/metadata/path_utils.h>

#include "../../common/test_helpers_catch2.h"

using namespace findex;
using json = nlohmann::json;

namespace fs = std::filesystem;

namespace {

struct CliFixture {
    CliFixture()
        : tree("findex_cli_tree_"), dataDir(test::make_temp_dir("findex_cli_data_")),
          configEnv("FINDEX_CONFIG", (dataDir / "no-config.toml").string()),
          logEnv("FINDEX_LOG_LEVEL", std::string("off")) {
        tree.file("home/Finance/Q4_Budget.xlsx");
        tree.file("home/Projects/roadmap.md");
        tree.file("home/Projects/notes.txt");
        tree.file("home/node_modules/budget.js");
        root = metadata::normalizeRootPath(tree.root() / "home");
    }

    ~CliFixture() {
        std::error_code ec;
        fs::remove_all(dataDir, ec);
    }

    // Runs one findex invocation; output is captured in `out`
    int run(std::vector<std::string> args, const std::string& stdinText = "") {
        args.insert(args.begin(), {"findex", "--data-dir", dataDir.string()});
        std::vector<char*> argv;
        for (auto& a : args)
            argv.push_back(a.data());

        out.str("");
        out.clear();
        std::istringstream in(stdinText);

        cli::FindexCLI app;
        app.setStreams(in, out);
        app.setOpener(opener);
        return app.run(static_cast<int>(argv.size()), argv.data());
    }

    test::TempTree tree;
    fs::path dataDir;
    test::ScopedEnvVar configEnv;
    test::ScopedEnvVar logEnv;
    std::string root;
    std::shared_ptr<test::RecordingOpener> opener = std::make_shared<test::RecordingOpener>();
    std::ostringstream out;
};

} // namespace

TEST_CASE("findex CLI: index, search and status", "[unit][cli]") {
    CliFixture fix;

    REQUIRE(fix.run({"--json", "index", fix.root}) == 0);
    auto indexed = json::parse(fix.out.str());
    REQUIRE(indexed.is_array());
    REQUIRE(indexed.size() == 1);
    CHECK(indexed[0]["mode"] == "full");
    CHECK(indexed[0]["root"] == fix.root);
    CHECK(fs::exists(fix.dataDir / "catalog.db"));

    REQUIRE(fix.run({"index", fix.root}) == 0);
    CHECK(fix.out.str().rfind("Updated " + fix.root, 0) == 0);

    REQUIRE(fix.run({"--json", "search", "q4", "budget"}) == 0);
    auto results = json::parse(fix.out.str());
    REQUIRE(results.is_array());
    REQUIRE_FALSE(results.empty());
    CHECK(results[0]["name"] == "Q4_Budget.xlsx");
    CHECK(results[0]["type"] == "file");

    REQUIRE(fix.run({"--json", "search", "budget", "--explain", "--limit", "10"}) == 0);
    for (const auto& r : json::parse(fix.out.str())) {
        CHECK(r["path"].get<std::string>().find("node_modules") == std::string::npos);
        CHECK(r.contains("breakdown"));
    }

    REQUIRE(fix.run({"--json", "status"}) == 0);
    auto status = json::parse(fix.out.str());
    CHECK(status["files"] == 3);
    CHECK(status["folders"] == 2);
    REQUIRE(status["roots"].size() == 1);
    CHECK(status["roots"][0] == fix.root);
    CHECK_FALSE(status["last_index_time"].is_null());
}

TEST_CASE("findex CLI: open and list", "[unit][cli]") {
    CliFixture fix;
    REQUIRE(fix.run({"index", fix.root}) == 0);

    SECTION("Open a single match") {
        CHECK(fix.run({"open", "file", "roadmap"}) == 0);
        REQUIRE(fix.opener->opened.size() == 1);
        CHECK(fix.opener->opened[0].path == fix.root + "/Projects/roadmap.md");
        CHECK(fix.out.str() == "Opened " + fix.root + "/Projects/roadmap.md\n");
    }

    SECTION("Nothing found is an error") {
        CHECK(fix.run({"open", "folder", "zebra"}) == 1);
        CHECK(fix.opener->opened.empty());
    }

    SECTION("Unknown entry type is rejected by the parser") {
        CHECK(fix.run({"open", "drive", "roadmap"}) != 0);
    }

    SECTION("List a folder") {
        REQUIRE(fix.run({"--json", "list", "projects"}) == 0);
        auto doc = json::parse(fix.out.str());
        CHECK(doc["status"] == "listed");
        CHECK(doc["children"] == json::array({"notes.txt", "roadmap.md"}));
    }
}

TEST_CASE("findex CLI: a search without matches is not an error", "[unit][cli]") {
    CliFixture fix;
    REQUIRE(fix.run({"index", fix.root}) == 0);

    CHECK(fix.run({"search", "zebra"}) == 0);
    CHECK(fix.out.str() == "No matching file or folder found.\n");

    CHECK(fix.run({"--json", "search", "zebra"}) == 0);
    auto results = json::parse(fix.out.str());
    CHECK(results.is_array());
    CHECK(results.empty());
}

TEST_CASE("findex CLI: session reads utterances from stdin", "[unit][cli]") {
    CliFixture fix;
    REQUIRE(fix.run({"index", fix.root}) == 0);

    REQUIRE(fix.run({"session", "--no-prompt"}, "open the file roadmap\n\nhello there\n") == 0);
    CHECK(fix.out.str() == "Opened roadmap.md\nnot handled: hello there\n");
    REQUIRE(fix.opener->opened.size() == 1);
}

TEST_CASE("findex CLI: a subcommand is required", "[unit][cli]") {
    CliFixture fix;
    CHECK(fix.run({}) != 0);
}
