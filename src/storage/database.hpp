#pragma once

#include "core/result.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace pagetree::storage {

/**
 * Prepared statement, finalized when the last copy goes away.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Parameter indices are 1-based, as in sqlite3_bind_*.
    [[nodiscard]] Result<void, Error> bind_text(int index, std::string_view text);
    [[nodiscard]] Result<void, Error> bind_int(int index, int value);
    [[nodiscard]] Result<void, Error> bind_int64(int index, int64_t value);
    [[nodiscard]] Result<void, Error> bind_null(int index);

    // Column indices are 0-based.
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    /** True while a row is available. */
    [[nodiscard]] Result<bool, Error> step();
    [[nodiscard]] Result<void, Error> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * First failure among a batch of bind calls, or ok.
 *
 *   auto bound = all_bound({stmt.bind_int(1, id), stmt.bind_text(2, title)});
 */
[[nodiscard]] Result<void, Error> all_bound(std::initializer_list<Result<void, Error>> binds);

/**
 * Database - owning handle to one SQLite connection.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /** Open (or create) the database file at `path` with foreign keys on. */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /** Run one or more statements that produce no rows. */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /** Run `sql` and call `callback(Statement&)` once per row. */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
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
     * Run `f` inside a transaction. Commits when `f` returns ok, rolls back
     * otherwise. `f` returns a Result<T, Error>.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begun = begin_transaction();
        if (begun.is_err()) {
            return ResultType::err(begun.unwrap_err());
        }

        auto result = f();
        if (result.is_err()) {
            auto rolled_back = rollback();
            if (rolled_back.is_err()) {
                return ResultType::err(Error{
                    result.unwrap_err().message + " (rollback failed: " + rolled_back.unwrap_err().message + ")",
                    result.unwrap_err().code});
            }
            return result;
        }

        auto committed = commit();
        if (committed.is_err()) {
            return ResultType::err(committed.unwrap_err());
        }
        return result;
    }

    [[nodiscard]] int64_t last_insert_rowid() const;
    [[nodiscard]] int changes() const;
    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

} // namespace pagetree::storage
