#include "storage/database.hpp"

namespace quire::storage {

// ============================================================================
// Statement implementation
// ============================================================================

void Statement::record_bind(int rc, const char* what) {
    if (rc != SQLITE_OK && !bind_error_) {
        bind_error_ = Error::storage(std::string("Failed to bind ") + what, rc);
    }
}

Statement& Statement::bind_text(int index, std::string_view text) {
    record_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                  static_cast<int>(text.size()), SQLITE_TRANSIENT),
                "text");
    return *this;
}

Statement& Statement::bind_int(int index, int value) {
    record_bind(sqlite3_bind_int(stmt_.get(), index, value), "int");
    return *this;
}

Statement& Statement::bind_int64(int index, int64_t value) {
    record_bind(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
    return *this;
}

Statement& Statement::bind_null(int index) {
    record_bind(sqlite3_bind_null(stmt_.get(), index), "null");
    return *this;
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    const int size = sqlite3_column_bytes(stmt_.get(), index);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
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

Result<bool, Error> Statement::step() {
    if (bind_error_) {
        return Result<bool, Error>::err(*bind_error_);
    }
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    const char* msg = sqlite3_errmsg(sqlite3_db_handle(stmt_.get()));
    return Result<bool, Error>::err(Error::storage(
        std::string("Step failed: ") + (msg ? msg : "unknown error"), rc));
}

Result<void, Error> Statement::run() {
    auto step_result = step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error::storage("Reset failed", rc));
    }
    bind_error_.reset();
    return Result<void, Error>::ok();
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

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* handle = nullptr;
    int rc = sqlite3_open(path.c_str(), &handle);
    if (rc != SQLITE_OK) {
        std::string error = handle ? sqlite3_errmsg(handle) : "Unknown error";
        if (handle) sqlite3_close(handle);
        return Result<Database, Error>::err(Error::storage(error, rc));
    }

    Database db(handle);
    auto pragma_result = db.execute("PRAGMA foreign_keys = ON;");
    if (pragma_result.is_err()) {
        return Result<Database, Error>::err(pragma_result.unwrap_err());
    }
    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_read_only(const std::string& path) {
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = handle ? sqlite3_errmsg(handle) : "Unknown error";
        if (handle) sqlite3_close(handle);
        return Result<Database, Error>::err(Error::storage(error, rc));
    }
    return Result<Database, Error>::ok(Database(handle));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(std::string_view sql) {
    if (!db_) {
        return Result<Statement, Error>::err(Error::storage("Database not open", SQLITE_MISUSE));
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error::storage(last_error(), rc));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void, Error>::err(Error::storage("Database not open", SQLITE_MISUSE));
    }
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error::storage(error, rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN TRANSACTION;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

// ============================================================================
// TransactionGuard implementation
// ============================================================================

TransactionGuard::TransactionGuard(Database& db) : db_(db) {}

TransactionGuard::~TransactionGuard() {
    rollback();
}

Result<void, Error> TransactionGuard::begin() {
    if (active_) {
        return Result<void, Error>::err(Error{"Transaction already active"});
    }
    auto result = db_.begin_transaction();
    active_ = result.is_ok();
    return result;
}

Result<void, Error> TransactionGuard::commit() {
    if (!active_) {
        return Result<void, Error>::err(Error{"No active transaction"});
    }
    auto result = db_.commit();
    if (result.is_ok()) {
        active_ = false;
    }
    return result;
}

void TransactionGuard::rollback() {
    if (active_) {
        active_ = false;
        auto result = db_.rollback();
        (void)result;
    }
}

} // namespace quire::storage
