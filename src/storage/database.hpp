#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <memory>
#include <optional>

namespace quire::storage {

/**
 * SQLite statement wrapper with RAII.
 *
 * Bind calls never fail on their own: the first bind error is kept and
 * reported by the next step(), so call sites bind unconditionally and
 * check once.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Statement& bind_text(int index, std::string_view text);
    Statement& bind_int(int index, int value);
    Statement& bind_int64(int index, int64_t value);
    Statement& bind_null(int index);

    template<typename Tag>
    Statement& bind_id(int index, Id<Tag> id) {
        return bind_int64(index, id.value());
    }

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    /**
     * Returns true if a row is available.
     */
    [[nodiscard]] Result<bool, Error> step();

    /**
     * Step a statement that produces no rows.
     */
    [[nodiscard]] Result<void, Error> run();

    [[nodiscard]] Result<void, Error> reset();

private:
    void record_bind(int rc, const char* what);

    std::shared_ptr<sqlite3_stmt> stmt_;
    std::optional<Error> bind_error_;
};

/**
 * Database - SQLite connection wrapper.
 *
 * Move-only; the connection is closed on destruction. All operations
 * report failures as ErrorKind::Storage carrying the SQLite result code.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an existing database file without write access.
     */
    [[nodiscard]] static Result<Database, Error> open_read_only(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] Result<Statement, Error> prepare(std::string_view sql);

    /**
     * Execute one or more SQL statements without results.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Run `sql` and call `callback(stmt)` for every row.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(std::string_view sql, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        return for_each_row(stmt_result.unwrap(), std::forward<F>(callback));
    }

    /**
     * Step an already bound statement and call `callback(stmt)` per row.
     */
    template<typename F>
    [[nodiscard]] static Result<void, Error> for_each_row(Statement& stmt, F&& callback) {
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
     * Commits on success; rolls back and returns the original error on failure.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            // The caller needs the original failure, not a rollback error.
            auto rollback_result = rollback();
            (void)rollback_result;
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            return ResultType::err(commit_result.unwrap_err());
        }

        return result;
    }

    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

/**
 * Transaction RAII guard.
 * Rolls back on destruction unless commit() succeeded.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    [[nodiscard]] Result<void, Error> begin();
    [[nodiscard]] Result<void, Error> commit();
    void rollback();

    [[nodiscard]] bool is_active() const { return active_; }

private:
    Database& db_;
    bool active_ = false;
};

} // namespace quire::storage
