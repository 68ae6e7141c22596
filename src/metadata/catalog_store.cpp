// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <system_error>
#include <findex/metadata/catalog_store.h>
#include <findex/metadata/migration.h>

namespace findex::metadata {

namespace {

constexpr const char* kEntryColumns =
    "id, name, path, type, extension, parent, last_modified, size";

std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Half-open byte range [lower, upper) covering every path strictly below `root`.
// SQLite compares TEXT with memcmp under the default BINARY collation.
std::pair<std::string, std::string> childPathRange(const std::string& root) {
    std::string lower = root;
    if (lower.empty() || (lower.back() != '/' && lower.back() != '\\')) {
        lower.push_back('/');
    }
    std::string upper = lower;
    upper.back() = static_cast<char>(upper.back() + 1);
    return {lower, upper};
}

} // namespace

CatalogStore::CatalogStore(std::filesystem::path dbPath) : dbPath_(std::move(dbPath)) {}

Result<Database> CatalogStore::openConnection(ConnectionMode mode) const {
    Database db;
    auto openResult = db.open(dbPath_.string(), mode);
    if (!openResult) {
        return openResult.error();
    }
    return db;
}

Result<void> CatalogStore::initialize() {
    std::error_code ec;
    auto parent = dbPath_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Error{ErrorCode::WriteError,
                         "Failed to create catalog directory '" + parent.string() +
                             "': " + ec.message()};
        }
    }

    auto dbResult = openConnection(ConnectionMode::Create);
    if (!dbResult) {
        return dbResult.error();
    }
    Database db = std::move(dbResult).value();

    MigrationManager mm(db);
    auto initResult = mm.initialize();
    if (!initResult) {
        return initResult;
    }
    mm.registerMigrations(CatalogMigrations::getAllMigrations());

    auto migrateResult = mm.migrate();
    if (!migrateResult) {
        spdlog::error("[CatalogStore] migration failed for '{}': {}", dbPath_.string(),
                      migrateResult.error().message);
        return migrateResult;
    }

    spdlog::debug("[CatalogStore] opened catalog '{}' (sqlite {})", dbPath_.string(),
                  Database::version());
    return {};
}

Result<bool> CatalogStore::upsertIfAbsent(const FileSystemEntry& entry) {
    auto result = executeQuery<bool>([&](Database& db) -> Result<bool> {
        auto stmtResult = db.prepare(R"(
            INSERT OR IGNORE INTO files
                (name, path, type, extension, parent, last_modified, size)
            VALUES (?, ?, ?, ?, ?, ?, ?)
        )");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bindAll(entry.name, entry.path, EntryKindUtils::toString(entry.kind),
                                       entry.extension, entry.parentDirName, entry.lastModified,
                                       entry.sizeBytes);
        if (!bindResult)
            return bindResult.error();

        auto execResult = stmt.execute();
        if (!execResult)
            return execResult.error();

        return db.changes() > 0;
    });
    if (!result)
        return result;

    auto noted = noteWrite();
    if (!noted)
        return noted.error();
    return result;
}

Result<void> CatalogStore::upsert(const FileSystemEntry& entry) {
    auto result = executeQuery<void>([&](Database& db) -> Result<void> {
        auto stmtResult = db.prepare(R"(
            INSERT INTO files
                (name, path, type, extension, parent, last_modified, size)
            VALUES (?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT(path) DO UPDATE SET
                last_modified = excluded.last_modified,
                size = excluded.size
        )");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bindAll(entry.name, entry.path, EntryKindUtils::toString(entry.kind),
                                       entry.extension, entry.parentDirName, entry.lastModified,
                                       entry.sizeBytes);
        if (!bindResult)
            return bindResult;

        return stmt.execute();
    });
    if (!result)
        return result;

    return noteWrite();
}

Result<std::unordered_map<std::string, double>>
CatalogStore::entriesWithPathPrefix(const std::string& root) {
    using PathMap = std::unordered_map<std::string, double>;
    return executeQuery<PathMap>([&](Database& db) -> Result<PathMap> {
        auto stmtResult = db.prepare(R"(
            SELECT path, last_modified FROM files
            WHERE path = ? OR (path >= ? AND path < ?)
        )");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto [lower, upper] = childPathRange(root);
        auto bindResult = stmt.bindAll(root, lower, upper);
        if (!bindResult)
            return bindResult.error();

        PathMap entries;
        while (true) {
            auto stepResult = stmt.step();
            if (!stepResult)
                return stepResult.error();
            if (!stepResult.value())
                break;
            entries.emplace(stmt.getString(0), stmt.getDouble(1));
        }
        return entries;
    });
}

Result<bool> CatalogStore::deleteByPath(const std::string& path) {
    auto result = executeQuery<bool>([&](Database& db) -> Result<bool> {
        auto stmtResult = db.prepare("DELETE FROM files WHERE path = ?");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, path);
        if (!bindResult)
            return bindResult.error();

        auto execResult = stmt.execute();
        if (!execResult)
            return execResult.error();

        return db.changes() > 0;
    });
    if (!result)
        return result;

    auto noted = noteWrite();
    if (!noted)
        return noted.error();
    return result;
}

Result<std::optional<std::string>> CatalogStore::getMeta(const std::string& key) {
    using MaybeValue = std::optional<std::string>;
    return executeQuery<MaybeValue>([&](Database& db) -> Result<MaybeValue> {
        auto stmtResult = db.prepare("SELECT value FROM meta WHERE key = ?");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, key);
        if (!bindResult)
            return bindResult.error();

        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();

        if (!stepResult.value()) {
            return MaybeValue{};
        }
        return MaybeValue{stmt.getString(0)};
    });
}

Result<void> CatalogStore::setMeta(const std::string& key, const std::string& value) {
    auto result = executeQuery<void>([&](Database& db) -> Result<void> {
        auto stmtResult = db.prepare("INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bindAll(key, value);
        if (!bindResult)
            return bindResult;

        return stmt.execute();
    });
    if (!result)
        return result;

    return noteWrite();
}

Result<std::vector<MetaRecord>> CatalogStore::listMeta(const std::string& keyPrefix) {
    using Records = std::vector<MetaRecord>;
    return executeQuery<Records>([&](Database& db) -> Result<Records> {
        auto stmtResult = db.prepare(
            "SELECT key, value FROM meta WHERE substr(key, 1, length(?1)) = ?1 ORDER BY key");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, keyPrefix);
        if (!bindResult)
            return bindResult.error();

        Records records;
        while (true) {
            auto stepResult = stmt.step();
            if (!stepResult)
                return stepResult.error();
            if (!stepResult.value())
                break;
            records.push_back(MetaRecord{stmt.getString(0), stmt.getString(1)});
        }
        return records;
    });
}

Result<std::vector<FileSystemEntry>>
CatalogStore::queryCandidates(const std::vector<std::string>& tokens, std::size_t cap) {
    using Entries = std::vector<FileSystemEntry>;
    if (tokens.empty() || cap == 0) {
        return Entries{};
    }

    std::ostringstream sql;
    sql << "SELECT " << kEntryColumns << " FROM files WHERE ";
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0)
            sql << " AND ";
        sql << "(instr(lower(name), ?) > 0 OR instr(lower(path), ?) > 0)";
    }
    sql << " ORDER BY id LIMIT ?";

    return executeQuery<Entries>([&](Database& db) -> Result<Entries> {
        auto stmtResult = db.prepare(sql.str());
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        int index = 1;
        for (const auto& token : tokens) {
            const std::string lowered = toLowerAscii(token);
            auto b1 = stmt.bind(index++, lowered);
            if (!b1)
                return b1.error();
            auto b2 = stmt.bind(index++, lowered);
            if (!b2)
                return b2.error();
        }
        auto limitResult = stmt.bind(index, static_cast<int64_t>(cap));
        if (!limitResult)
            return limitResult.error();

        Entries rows;
        while (true) {
            auto stepResult = stmt.step();
            if (!stepResult)
                return stepResult.error();
            if (!stepResult.value())
                break;
            rows.push_back(mapEntryRow(stmt));
        }
        return rows;
    });
}

Result<std::optional<FileSystemEntry>> CatalogStore::findByPath(const std::string& path) {
    using MaybeEntry = std::optional<FileSystemEntry>;
    return executeQuery<MaybeEntry>([&](Database& db) -> Result<MaybeEntry> {
        auto stmtResult = db.prepare(std::string("SELECT ") + kEntryColumns +
                                     " FROM files WHERE path = ?");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, path);
        if (!bindResult)
            return bindResult.error();

        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();

        if (!stepResult.value()) {
            return MaybeEntry{};
        }
        return MaybeEntry{mapEntryRow(stmt)};
    });
}

Result<int64_t> CatalogStore::countEntries(std::optional<EntryKind> kind) {
    return executeQuery<int64_t>([&](Database& db) -> Result<int64_t> {
        auto stmtResult = kind ? db.prepare("SELECT COUNT(*) FROM files WHERE type = ?")
                               : db.prepare("SELECT COUNT(*) FROM files");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        if (kind) {
            auto bindResult = stmt.bind(1, EntryKindUtils::toString(*kind));
            if (!bindResult)
                return bindResult.error();
        }

        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();

        return stmt.getInt64(0);
    });
}

Result<void> CatalogStore::runBatch(const std::function<Result<void>()>& body,
                                    std::size_t batchSize) {
    if (batchDb_) {
        return Error{ErrorCode::InvalidState, "A batch is already running on this catalog"};
    }

    auto dbResult = openConnection();
    if (!dbResult) {
        return dbResult.error();
    }
    Database db = std::move(dbResult).value();

    auto beginResult = db.beginTransaction();
    if (!beginResult) {
        return beginResult;
    }

    batchDb_ = &db;
    batchSize_ = std::max<std::size_t>(batchSize, 1);
    pendingWrites_ = 0;

    auto finish = [this]() {
        batchDb_ = nullptr;
        batchSize_ = 0;
        pendingWrites_ = 0;
    };

    Result<void> bodyResult;
    try {
        bodyResult = body();
    } catch (...) {
        finish();
        db.rollback();
        throw;
    }
    finish();

    if (!bodyResult) {
        auto rollbackResult = db.rollback();
        if (!rollbackResult) {
            spdlog::warn("[CatalogStore] rollback after failed batch also failed: {}",
                         rollbackResult.error().message);
        }
        return bodyResult;
    }

    return db.commit();
}

Result<void> CatalogStore::noteWrite() {
    if (!batchDb_) {
        return {};
    }
    if (++pendingWrites_ < batchSize_) {
        return {};
    }

    auto commitResult = batchDb_->commit();
    if (!commitResult) {
        return commitResult;
    }
    pendingWrites_ = 0;
    return batchDb_->beginTransaction();
}

FileSystemEntry CatalogStore::mapEntryRow(const Statement& stmt) {
    FileSystemEntry entry;
    entry.id = stmt.getInt64(0);
    entry.name = stmt.getString(1);
    entry.path = stmt.getString(2);
    entry.kind = EntryKindUtils::fromString(stmt.getString(3)).value_or(EntryKind::File);
    entry.extension = stmt.getString(4);
    entry.parentDirName = stmt.getString(5);
    entry.lastModified = stmt.getDouble(6);
    entry.sizeBytes = stmt.getInt64(7);
    return entry;
}

} // namespace findex::metadata
