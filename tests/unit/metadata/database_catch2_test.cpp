// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <chrono>
#include <filesystem>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <findex/metadata/database.h>
#include <findex/metadata/migration.h>

#include "../../common/test_helpers_catch2.h"

using namespace findex;
using namespace findex::metadata;
using Catch::Approx;

namespace {
struct DatabaseFixture {
    DatabaseFixture() {
        dir_ = test::make_temp_dir("database_catch2_test_");
        dbPath_ = dir_ / "test.db";
    }

    ~DatabaseFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
    std::filesystem::path dbPath_;
};
} // namespace

TEST_CASE("Database: open and close", "[unit][metadata][database]") {
    DatabaseFixture fix;
    Database db;

    REQUIRE_FALSE(db.isOpen());

    SECTION("Open creates database file") {
        auto result = db.open(fix.dbPath_.string(), ConnectionMode::Create);
        REQUIRE(result.has_value());
        REQUIRE(db.isOpen());
        CHECK(std::filesystem::exists(fix.dbPath_));

        SECTION("Close marks database as closed") {
            db.close();
            CHECK_FALSE(db.isOpen());
        }
    }

    SECTION("ReadWrite does not create a missing file") {
        auto result = db.open(fix.dbPath_.string(), ConnectionMode::ReadWrite);
        CHECK_FALSE(result.has_value());
        CHECK_FALSE(db.isOpen());
    }
}

TEST_CASE("Database: prepared statements bind and read columns", "[unit][metadata][database]") {
    DatabaseFixture fix;
    Database db;
    REQUIRE(db.open(fix.dbPath_.string(), ConnectionMode::Create).has_value());

    REQUIRE(db.execute("CREATE TABLE t (id INTEGER PRIMARY KEY, name TEXT, value REAL, n INTEGER)")
                .has_value());

    {
        auto stmtResult = db.prepare("INSERT INTO t (name, value, n) VALUES (?, ?, ?)");
        REQUIRE(stmtResult.has_value());
        Statement stmt = std::move(stmtResult).value();
        REQUIRE(stmt.bindAll("alpha", 1.5, int64_t{42}).has_value());
        REQUIRE(stmt.execute().has_value());
        CHECK(db.changes() == 1);

        auto outOfRange = stmt.bind(9, 1);
        REQUIRE_FALSE(outOfRange.has_value());
        CHECK(outOfRange.error().code == ErrorCode::DatabaseError);
        CHECK(outOfRange.error().message.find("parameter 9") != std::string::npos);
    }

    auto stmtResult = db.prepare("SELECT name, value, n, NULL FROM t WHERE id = ?");
    REQUIRE(stmtResult.has_value());
    Statement stmt = std::move(stmtResult).value();
    REQUIRE(stmt.bind(1, int64_t{1}).has_value());

    auto step = stmt.step();
    REQUIRE(step.has_value());
    REQUIRE(step.value());
    CHECK(stmt.getString(0) == "alpha");
    CHECK(stmt.getDouble(1) == Approx(1.5));
    CHECK(stmt.getInt64(2) == 42);
    CHECK_FALSE(stmt.isNull(0));
    CHECK(stmt.isNull(3));

    auto done = stmt.step();
    REQUIRE(done.has_value());
    CHECK_FALSE(done.value());
}

TEST_CASE("Database: transactions", "[unit][metadata][database]") {
    DatabaseFixture fix;
    Database db;
    REQUIRE(db.open(fix.dbPath_.string(), ConnectionMode::Create).has_value());
    REQUIRE(db.execute("CREATE TABLE t (v INTEGER)").has_value());

    auto count = [&db]() {
        auto stmt = db.prepare("SELECT COUNT(*) FROM t");
        REQUIRE(stmt.has_value());
        Statement s = std::move(stmt).value();
        REQUIRE(s.step().value());
        return s.getInt64(0);
    };

    SECTION("Failed body rolls back") {
        auto result = db.transaction([&db]() -> Result<void> {
            auto r = db.execute("INSERT INTO t VALUES (1)");
            if (!r)
                return r;
            return Error{ErrorCode::InvalidState, "abort"};
        });
        CHECK_FALSE(result.has_value());
        CHECK_FALSE(db.inTransaction());
        CHECK(count() == 0);
    }

    SECTION("Successful body commits") {
        auto result =
            db.transaction([&db]() -> Result<void> { return db.execute("INSERT INTO t VALUES (1)"); });
        CHECK(result.has_value());
        CHECK(count() == 1);
    }
}

TEST_CASE("Database: invalid SQL reports a database error", "[unit][metadata][database]") {
    DatabaseFixture fix;
    Database db;
    REQUIRE(db.open(fix.dbPath_.string(), ConnectionMode::Create).has_value());

    auto result = db.prepare("SELEC nothing");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::DatabaseError);
}

TEST_CASE("Migrations: catalog schema is applied once", "[unit][metadata][migration]") {
    DatabaseFixture fix;
    Database db;
    REQUIRE(db.open(fix.dbPath_.string(), ConnectionMode::Create).has_value());

    MigrationManager mm(db);
    REQUIRE(mm.initialize().has_value());
    mm.registerMigrations(CatalogMigrations::getAllMigrations());

    CHECK(mm.getLatestVersion() == 2);
    REQUIRE(mm.needsMigration().value());
    REQUIRE(mm.migrate().has_value());
    CHECK(mm.getCurrentVersion().value() == 2);
    CHECK_FALSE(mm.needsMigration().value());

    CHECK(db.tableExists("files").value());
    CHECK(db.tableExists("meta").value());

    auto idx = db.prepare("SELECT COUNT(*) FROM sqlite_master WHERE type = 'index' AND name IN "
                          "('idx_name', 'idx_path')");
    REQUIRE(idx.has_value());
    Statement s = std::move(idx).value();
    REQUIRE(s.step().value());
    CHECK(s.getInt(0) == 2);

    // Re-running is a no-op
    MigrationManager again(db);
    REQUIRE(again.initialize().has_value());
    again.registerMigrations(CatalogMigrations::getAllMigrations());
    REQUIRE(again.migrate().has_value());
    auto history = again.getHistory();
    REQUIRE(history.has_value());
    CHECK(history.value().size() == 2);
}

TEST_CASE("Migrations: files.type only accepts file or folder", "[unit][metadata][migration]") {
    DatabaseFixture fix;
    Database db;
    REQUIRE(db.open(fix.dbPath_.string(), ConnectionMode::Create).has_value());
    MigrationManager mm(db);
    REQUIRE(mm.initialize().has_value());
    mm.registerMigrations(CatalogMigrations::getAllMigrations());
    REQUIRE(mm.migrate().has_value());

    CHECK(db.execute("INSERT INTO files (name, path, type) VALUES ('a', '/a', 'folder')")
              .has_value());
    CHECK_FALSE(
        db.execute("INSERT INTO files (name, path, type) VALUES ('b', '/b', 'link')").has_value());
    // path is unique
    CHECK_FALSE(
        db.execute("INSERT INTO files (name, path, type) VALUES ('a', '/a', 'file')").has_value());
}
