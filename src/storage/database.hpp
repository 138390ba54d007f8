#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace offgrid::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    [[nodiscard]] Result<void> bind_text(int index, std::string_view text);
    [[nodiscard]] Result<void> bind_int(int index, int value);
    [[nodiscard]] Result<void> bind_int64(int index, int64_t value);
    [[nodiscard]] Result<void> bind_null(int index);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    Result<bool> step();  // true if a row is available
    Result<void> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite connection owning the persisted queue.
 *
 * Opened in WAL mode with synchronous=FULL so a committed enqueue survives
 * a crash or power loss.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement> prepare(const std::string& sql);

    [[nodiscard]] Result<void> execute(const std::string& sql);

    [[nodiscard]] Result<void> begin_transaction();
    [[nodiscard]] Result<void> commit();
    [[nodiscard]] Result<void> rollback();

    /**
     * Run `f` inside a transaction. Commits when f() succeeds, rolls back
     * otherwise. A failed rollback is reported in place of f's error.
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
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                return ResultType::err(Error::storage(
                    "Rollback failed after: " + result.unwrap_err().message + " (" +
                    rollback_result.unwrap_err().message + ")",
                    rollback_result.unwrap_err().code));
            }
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            // COMMIT can fail and leave the transaction open (SQLITE_BUSY).
            if (sqlite3_get_autocommit(db_) == 0) {
                auto ignored = rollback();
                (void)ignored;
            }
            return ResultType::err(commit_result.unwrap_err());
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

} // namespace offgrid::storage
