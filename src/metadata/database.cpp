// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <findex/metadata/database.h>

namespace findex::metadata {

namespace {

// Waiting on a lock held by another connection is left to SQLite
constexpr int kBusyTimeoutMs = 5000;

} // namespace

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Result<void> Statement::check(int rc, std::string_view what, int index) const {
    if (rc == SQLITE_OK) {
        return {};
    }
    return Error{ErrorCode::DatabaseError,
                 fmt::format("Failed to bind {} to parameter {}: {}", what, index,
                             sqlite3_errstr(rc))};
}

Result<void> Statement::bind(int index, int value) {
    return check(sqlite3_bind_int(stmt_, index, value), "int", index);
}

Result<void> Statement::bind(int index, int64_t value) {
    return check(sqlite3_bind_int64(stmt_, index, value), "int64", index);
}

Result<void> Statement::bind(int index, double value) {
    return check(sqlite3_bind_double(stmt_, index, value), "double", index);
}

Result<void> Statement::bind(int index, std::string_view value) {
    return check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                   SQLITE_TRANSIENT),
                 "text", index);
}

Result<void> Statement::execute() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_DONE) {
        return {};
    }
    std::string message = fmt::format("Failed to execute statement: {}", sqlite3_errstr(rc));
    if (rc == SQLITE_CONSTRAINT) {
        if (const char* sql = sqlite3_sql(stmt_)) {
            const std::string_view text(sql);
            message += fmt::format(" [SQL: {}{}]", text.substr(0, 100),
                                   text.size() > 100 ? "..." : "");
        }
    }
    spdlog::error("[Database] {}", message);
    return Error{ErrorCode::DatabaseError, std::move(message)};
}

Result<bool> Statement::step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    spdlog::error("[Database] Failed to step statement: {}", sqlite3_errstr(rc));
    return Error{ErrorCode::DatabaseError,
                 fmt::format("Failed to step statement: {}", sqlite3_errstr(rc))};
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return {};
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)),
      inTransaction_(std::exchange(other.inTransaction_, false)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
        inTransaction_ = std::exchange(other.inTransaction_, false);
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    close();

    int flags = SQLITE_OPEN_READWRITE;
    if (mode == ConnectionMode::Create) {
        flags |= SQLITE_OPEN_CREATE;
    }

    const int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        spdlog::error("[Database] Cannot open '{}': {}", path, error);
        return Error{ErrorCode::DatabaseError, "Failed to open database: " + error};
    }

    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    path_ = path;
    return {};
}

void Database::close() {
    if (!db_) {
        return;
    }
    if (inTransaction_) {
        spdlog::warn("[Database] Closing '{}' with an open transaction", path_);
    }
    sqlite3_close(db_);
    db_ = nullptr;
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        spdlog::error("[Database] Prepare failed ({}): {}", error, sql);
        return Error{ErrorCode::DatabaseError, "Failed to prepare statement: " + error};
    }
    return Statement(stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        spdlog::error("[Database] Exec failed ({}): {}", error, sql);
        return Error{ErrorCode::DatabaseError, "Failed to execute SQL: " + error};
    }
    return {};
}

Result<void> Database::beginTransaction() {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Already in transaction"};
    }
    auto result = execute("BEGIN");
    if (result) {
        inTransaction_ = true;
    }
    return result;
}

Result<void> Database::commit() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }
    auto result = execute("COMMIT");
    if (result) {
        inTransaction_ = false;
    }
    return result;
}

Result<void> Database::rollback() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }
    auto result = execute("ROLLBACK");
    // SQLite ends the transaction even when ROLLBACK reports an error
    inTransaction_ = false;
    return result;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::tableExists(const std::string& table) {
    auto stmtResult = prepare("SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, table);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    return stmt.getInt(0) > 0;
}

std::string Database::version() {
    return sqlite3_libversion();
}

} // namespace findex::metadata
