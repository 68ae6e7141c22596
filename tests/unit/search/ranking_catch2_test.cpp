// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <filesystem>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <findex/indexing/catalog_indexer.h>
#include <findex/metadata/catalog_store.h>
#include <findex/metadata/path_utils.h>
#include <findex/search/ranking.h>

#include "../../common/test_helpers_catch2.h"

using namespace findex;
using namespace findex::metadata;
using namespace findex::search;
using Catch::Approx;

namespace {

constexpr double kNow = 1'700'000'000.0;
constexpr double kDay = 86400.0;

FileSystemEntry fileEntry(const std::string& path, double ageDays, EntryId id = 0) {
    std::filesystem::path p(path);
    FileSystemEntry e;
    e.id = id;
    e.name = p.filename().string();
    e.path = path;
    e.kind = EntryKind::File;
    e.extension = p.extension().string();
    e.parentDirName = p.parent_path().filename().string();
    e.lastModified = kNow - ageDays * kDay;
    return e;
}

Candidate candidateFor(const std::string& path, double ageDays = 100.0) {
    return makeCandidate(fileEntry(path, ageDays), kNow);
}

struct SearchFixture {
    SearchFixture()
        : tree("ranking_tree_"), dbDir(test::make_temp_dir("ranking_db_")),
          store(dbDir / "catalog.db") {
        REQUIRE(store.initialize().has_value());
    }

    ~SearchFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dbDir, ec);
    }

    test::TempTree tree;
    std::filesystem::path dbDir;
    CatalogStore store;
};

} // namespace

TEST_CASE("Scoring terms", "[unit][search][ranking]") {
    const auto query = normalizeQuery("q4 budget");

    SECTION("fuzzyBase takes the better of name and path similarity") {
        CHECK(scoring::fuzzyBase(query, candidateFor("/d/Q4_Budget.xlsx")) == Approx(100.0));
        CHECK(scoring::fuzzyBase(query, candidateFor("/d/unrelated.txt")) < 70.0);
    }

    SECTION("exactBoost") {
        CHECK(scoring::exactBoost(query, candidateFor("/d/Q4_Budget.xlsx")) == Approx(40.0));
        CHECK(scoring::exactBoost(query, candidateFor("/d/old_q4_budget_notes.txt")) ==
              Approx(20.0));
        CHECK(scoring::exactBoost(query, candidateFor("/d/budget_q4.txt")) == Approx(0.0));
    }

    SECTION("nameVsPathBoost only looks at the name") {
        CHECK(scoring::nameVsPathBoost(query, candidateFor("/d/Q4_Budget.xlsx")) ==
              Approx(15.0));
        CHECK(scoring::nameVsPathBoost(query, candidateFor("/q4 budget/plan.txt")) ==
              Approx(0.0));
    }

    SECTION("recencyBoost steps down with age") {
        CHECK(scoring::recencyBoost(candidateFor("/d/a.txt", 0.5)) == Approx(20.0));
        CHECK(scoring::recencyBoost(candidateFor("/d/a.txt", 3.0)) == Approx(10.0));
        CHECK(scoring::recencyBoost(candidateFor("/d/a.txt", 20.0)) == Approx(5.0));
        CHECK(scoring::recencyBoost(candidateFor("/d/a.txt", 30.0)) == Approx(0.0));
        CHECK(scoring::recencyBoost(candidateFor("/d/a.txt", 60.0)) == Approx(0.0));
    }

    SECTION("extensionIntentBoost matches keyword to extension") {
        const auto excel = normalizeQuery("budget excel");
        CHECK(scoring::extensionIntentBoost(excel, candidateFor("/d/budget.xlsx")) ==
              Approx(25.0));
        CHECK(scoring::extensionIntentBoost(excel, candidateFor("/d/budget.pdf")) ==
              Approx(0.0));
        CHECK(scoring::extensionIntentBoost(normalizeQuery("the word file"),
                                            candidateFor("/d/letter.docx")) == Approx(25.0));
        CHECK(scoring::extensionIntentBoost(query, candidateFor("/d/budget.xlsx")) ==
              Approx(0.0));
    }

    SECTION("folderContextBoost adds per token found in the path") {
        CHECK(scoring::folderContextBoost(query, candidateFor("/Finance/Q4/budget.txt")) ==
              Approx(10.0));
        CHECK(scoring::folderContextBoost(query, candidateFor("/Finance/budget.txt")) ==
              Approx(5.0));
        CHECK(scoring::folderContextBoost(query, candidateFor("/misc/plan.txt")) == Approx(0.0));
    }

    SECTION("depthPenalty is half a point per separator") {
        CHECK(scoring::depthPenalty(candidateFor("/a/b/c.txt")) == Approx(1.5));
        CHECK(scoring::depthPenalty(candidateFor("C:\\Users\\me\\c.txt")) == Approx(1.5));
    }

    SECTION("Breakdown total is the sum minus the penalty") {
        const auto c = candidateFor("/home/u/docs/Q4_Budget.xlsx", 0.1);
        const auto b = scoreCandidate(query, c);
        CHECK(b.fuzzyBase == Approx(100.0));
        CHECK(b.exactBoost == Approx(40.0));
        CHECK(b.nameVsPathBoost == Approx(15.0));
        CHECK(b.recencyBoost == Approx(20.0));
        CHECK(b.extensionIntentBoost == Approx(0.0));
        CHECK(b.folderContextBoost == Approx(10.0));
        CHECK(b.depthPenalty == Approx(2.0));
        CHECK(b.total() == Approx(183.0));
    }
}

TEST_CASE("RankingEngine: recent exact match beats old partial match",
          "[unit][search][ranking]") {
    SearchFixture fix;
    RankingEngine engine(fix.store);

    const std::vector<FileSystemEntry> candidates = {
        fileEntry("/home/u/docs/old_q4_budget_notes.txt", 60.0),
        fileEntry("/home/u/docs/Q4_Budget.xlsx", 0.0),
    };
    auto ranked = engine.rank(normalizeQuery("q4 budget"), candidates, kNow, 5);
    REQUIRE(ranked.size() == 2);
    CHECK(ranked[0].entry.name == "Q4_Budget.xlsx");
    CHECK(ranked[1].entry.name == "old_q4_budget_notes.txt");
    CHECK(ranked[0].score > ranked[1].score);
}

TEST_CASE("RankingEngine: monotonic in recency and exactness", "[unit][search][ranking]") {
    SearchFixture fix;
    RankingEngine engine(fix.store);
    const auto query = normalizeQuery("budget");

    SECTION("Newer copy of the same name ranks higher") {
        auto ranked = engine.rank(
            query, {fileEntry("/d/old/budget.txt", 90.0), fileEntry("/d/new/budget.txt", 2.0)},
            kNow, 5);
        REQUIRE(ranked.size() == 2);
        CHECK(ranked[0].entry.path == "/d/new/budget.txt");
    }

    SECTION("Exact name ranks above a name that merely contains the query") {
        auto ranked = engine.rank(
            query, {fileEntry("/d/budget_notes.txt", 5.0), fileEntry("/d/budget.txt", 5.0)},
            kNow, 5);
        REQUIRE(ranked.size() == 2);
        CHECK(ranked[0].entry.name == "budget.txt");
    }

    SECTION("Shallower path wins when everything else is equal") {
        auto ranked = engine.rank(
            query, {fileEntry("/a/b/c/budget.txt", 5.0), fileEntry("/a/budget.txt", 5.0)}, kNow,
            5);
        REQUIRE(ranked.size() == 2);
        CHECK(ranked[0].entry.path == "/a/budget.txt");
    }
}

TEST_CASE("RankingEngine: threshold, ties and limit", "[unit][search][ranking]") {
    SearchFixture fix;
    const auto query = normalizeQuery("budget");

    SECTION("Candidates under the minimum score are dropped") {
        RankingEngine engine(fix.store);
        auto ranked = engine.rank(
            query, {fileEntry("/d/zzz/qqq.txt", 100.0), fileEntry("/d/budget.txt", 100.0)}, kNow,
            5);
        REQUIRE(ranked.size() == 1);
        CHECK(ranked[0].entry.name == "budget.txt");
    }

    SECTION("Raising the minimum filters more") {
        RankingConfig config;
        config.minScore = 1000.0;
        RankingEngine strict(fix.store, config);
        CHECK(strict.rank(query, {fileEntry("/d/budget.txt", 0.0)}, kNow, 5).empty());
    }

    SECTION("Equal scores keep prefilter order") {
        RankingEngine engine(fix.store);
        auto ranked = engine.rank(query,
                                  {fileEntry("/x/budget.txt", 10.0, 1),
                                   fileEntry("/y/budget.txt", 10.0, 2),
                                   fileEntry("/z/budget.txt", 10.0, 3)},
                                  kNow, 5);
        REQUIRE(ranked.size() == 3);
        CHECK(ranked[0].entry.id == 1);
        CHECK(ranked[1].entry.id == 2);
        CHECK(ranked[2].entry.id == 3);
        CHECK(ranked[0].score == Approx(ranked[2].score));
    }

    SECTION("Limit truncates after sorting") {
        RankingEngine engine(fix.store);
        auto ranked = engine.rank(
            query,
            {fileEntry("/a/b/c/budget.txt", 90.0), fileEntry("/budget.txt", 0.0),
             fileEntry("/a/budget.txt", 90.0)},
            kNow, 1);
        REQUIRE(ranked.size() == 1);
        CHECK(ranked[0].entry.path == "/budget.txt");
    }

    SECTION("Ranking is deterministic") {
        RankingEngine engine(fix.store);
        const std::vector<FileSystemEntry> candidates = {
            fileEntry("/d/budget_2023.txt", 3.0), fileEntry("/d/budget.txt", 40.0),
            fileEntry("/d/q4/budget.md", 1.5), fileEntry("/d/budget notes.txt", 3.0)};
        auto first = engine.rank(query, candidates, kNow, 5);
        auto second = engine.rank(query, candidates, kNow, 5);
        REQUIRE(first.size() == second.size());
        for (std::size_t i = 0; i < first.size(); ++i) {
            CHECK(first[i].entry.path == second[i].entry.path);
            CHECK(first[i].score == second[i].score);
        }
    }
}

TEST_CASE("RankingEngine: search over an indexed tree", "[unit][search][ranking]") {
    SearchFixture fix;
    fix.tree.file("home/Finance/Q4_Budget.xlsx");
    fix.tree.file("home/Finance/old_q4_budget_notes.txt");
    fix.tree.file("home/Projects/app/node_modules/budget/budget.js");
    fix.tree.file("home/Projects/app/budget.js");
    fix.tree.file("home/.venv/budget.py");
    const std::string root = normalizeRootPath(fix.tree.root() / "home");
    REQUIRE(test::set_mtime(root + "/Finance/old_q4_budget_notes.txt",
                            test::now_epoch_seconds() - 60 * kDay));

    indexing::CatalogIndexer indexer(fix.store);
    REQUIRE(indexer.ensureIndex({root}).has_value());
    RankingEngine engine(fix.store);

    SECTION("Best match first") {
        auto results = engine.search("q4 budget");
        REQUIRE(results.has_value());
        REQUIRE_FALSE(results.value().empty());
        CHECK(results.value().front().name == "Q4_Budget.xlsx");
    }

    SECTION("Excluded directories never surface") {
        auto results = engine.search("budget", 50);
        REQUIRE(results.has_value());
        REQUIRE_FALSE(results.value().empty());
        for (const auto& entry : results.value()) {
            CHECK(entry.path.find("node_modules") == std::string::npos);
            CHECK(entry.path.find(".venv") == std::string::npos);
        }
    }

    SECTION("Default limit is five") {
        for (int i = 0; i < 8; ++i) {
            fix.tree.file("home/Reports/report_" + std::to_string(i) + ".txt");
        }
        REQUIRE(indexer.ensureIndex({root}).has_value());
        auto results = engine.search("report");
        REQUIRE(results.has_value());
        CHECK(results.value().size() == 5);
    }

    SECTION("Empty and unmatched queries return nothing") {
        CHECK(engine.search("").value().empty());
        CHECK(engine.search("   ").value().empty());
        CHECK(engine.search("zebra giraffe").value().empty());
        CHECK(engine.search("budget", 0).value().empty());
    }

    SECTION("Detailed results carry the breakdown") {
        auto detailed = engine.searchDetailed("q4 budget");
        REQUIRE(detailed.has_value());
        REQUIRE_FALSE(detailed.value().empty());
        const auto& top = detailed.value().front();
        CHECK(top.score == Approx(top.breakdown.total()));
        CHECK(top.breakdown.exactBoost == Approx(40.0));
    }
}
