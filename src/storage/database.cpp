#include "storage/database.hpp"

namespace offgrid::storage {

// ============================================================================
// Statement implementation
// ============================================================================

namespace {

Result<void> check_bind(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        return Result<void>::err(Error::storage(std::string("Failed to bind ") + what, rc));
    }
    return Result<void>::ok();
}

} // namespace

Result<void> Statement::bind_text(int index, std::string_view text) {
    return check_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                        static_cast<int>(text.size()), SQLITE_TRANSIENT),
                      "text");
}

Result<void> Statement::bind_int(int index, int value) {
    return check_bind(sqlite3_bind_int(stmt_.get(), index, value), "int");
}

Result<void> Statement::bind_int64(int index, int64_t value) {
    return check_bind(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
}

Result<void> Statement::bind_null(int index) {
    return check_bind(sqlite3_bind_null(stmt_.get(), index), "null");
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return reinterpret_cast<const char*>(text);
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool>::err(Error::storage(
        std::string("Step failed: ") + (db ? sqlite3_errmsg(db) : "unknown"), rc));
}

Result<void> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void>::err(Error::storage("Reset failed", rc));
    }
    return Result<void>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open(path.c_str(), &raw);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database>::err(Error::storage(error, rc));
    }

    Database db(raw);
    for (const char* pragma : {"PRAGMA journal_mode = WAL;",
                               "PRAGMA synchronous = FULL;",
                               "PRAGMA busy_timeout = 5000;"}) {
        auto pragma_result = db.execute(pragma);
        if (pragma_result.is_err()) {
            return Result<Database>::err(pragma_result.unwrap_err());
        }
    }

    return Result<Database>::ok(std::move(db));
}

Result<Database> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement>::err(Error::storage("Database not open", SQLITE_MISUSE));
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement>::err(Error::storage(last_error(), rc));
    }
    return Result<Statement>::ok(Statement(stmt));
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void>::err(Error::storage("Database not open", SQLITE_MISUSE));
    }
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void>::err(Error::storage(error, rc));
    }
    return Result<void>::ok();
}

Result<void> Database::begin_transaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

Result<void> Database::commit() {
    return execute("COMMIT;");
}

Result<void> Database::rollback() {
    return execute("ROLLBACK;");
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace offgrid::storage
