// Copyright 2025 Findex Project
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <sqlite3.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <findex/core/types.h>

namespace findex::metadata {

/**
 * @brief How a catalog file is opened
 */
enum class ConnectionMode {
    ReadWrite, ///< Existing file only
    Create     ///< Create the file if it does not exist
};

/**
 * @brief Prepared SQLite statement, finalized on destruction
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const std::string& value) {
        return bind(index, std::string_view(value));
    }
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind arguments to parameters 1..N in order
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindFrom(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Run a statement that returns no rows
     */
    Result<void> execute();

    /**
     * @brief Advance to the next row
     * @return true while a row is available
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

private:
    friend class Database;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    Result<void> check(int rc, std::string_view what, int index) const;

    template <typename T, typename... Rest>
    Result<void> bindFrom(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindFrom(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindFrom(int) { return {}; }

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief One connection to a catalog file
 *
 * Move-only. Closing with an open transaction rolls it back.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Run one or more SQL statements that return no rows
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief Run `func` inside BEGIN/COMMIT, rolling back if it fails or throws
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto beginResult = beginTransaction();
        if (!beginResult)
            return beginResult;

        try {
            Result<void> result = func();
            if (!result) {
                rollback();
                return result;
            }
            return commit();
        } catch (...) {
            rollback();
            throw;
        }
    }

    /**
     * @brief Rows changed by the last INSERT, UPDATE or DELETE
     */
    int changes() const;

    Result<bool> tableExists(const std::string& table);

    static std::string version();

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

} // namespace findex::metadata
