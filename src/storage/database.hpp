#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tabsync::storage {

/**
 * Value - One bound statement argument: NULL, INTEGER or TEXT.
 */
using Value = std::variant<std::nullptr_t, int64_t, std::string>;
using Args = std::vector<Value>;

/**
 * Bind an optional string as TEXT, or NULL when absent.
 */
[[nodiscard]] inline Value optional_text(const std::optional<std::string>& text) {
    if (text) {
        return Value{*text};
    }
    return Value{nullptr};
}

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    // Bind helpers (1-based indices)
    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_null(int index);
    Result<void, Error> bind(int index, const Value& value);
    Result<void, Error> bind_all(const Args& args);

    // Column getters (0-based indices)
    [[nodiscard]] int column_type(int index) const;
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    // Execute
    Result<bool, Error> step();  // Returns true if there's a row
    Result<void, Error> reset();

private:
    [[nodiscard]] Error bind_error(const char* what, int rc) const;

    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite connection wrapper.
 *
 * Owns one sqlite3 handle. Not synchronized: callers that share a Database
 * across threads must serialize access (storage::Executor does).
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open a database file, creating it if needed.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Execute one or more SQL statements without arguments or results.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Prepare, bind and run a single statement that returns no rows.
     * changes() and last_insert_rowid() reflect it afterwards.
     */
    [[nodiscard]] Result<void, Error> execute_change(const std::string& sql, const Args& args = {});

    /**
     * Run a query and hand every row to the callback.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, const Args& args, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_all(args);
        if (bind_result.is_err()) {
            return bind_result;
        }

        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }

        return Result<void, Error>::ok();
    }

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Execute a function within a transaction.
     * Commits when f() succeeds; rolls back and returns f()'s error otherwise.
     * If f() throws, the transaction is rolled back and the exception rethrown.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = [&]() {
            try {
                return f();
            } catch (...) {
                abandon_transaction(Error{"Transaction body threw an exception"});
                throw;
            }
        }();

        if (result.is_err()) {
            abandon_transaction(result.unwrap_err());
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            abandon_transaction(commit_result.unwrap_err());
            return ResultType::err(commit_result.unwrap_err());
        }

        return result;
    }

    // Shared by every table on this connection.
    [[nodiscard]] int64_t last_insert_rowid() const;

    /**
     * Number of rows changed by the most recent INSERT, UPDATE or DELETE.
     */
    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    // Roll back after `cause`; a failing rollback is logged, cause is kept.
    void abandon_transaction(const Error& cause);

    sqlite3* db_ = nullptr;
};

} // namespace tabsync::storage
