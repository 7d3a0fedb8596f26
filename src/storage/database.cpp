#include "storage/database.hpp"

namespace pagetree::storage {
namespace {

Result<void, Error> bind_result(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error{std::string("Failed to bind ") + what, rc});
    }
    return Result<void, Error>::ok();
}

} // namespace

// ============================================================================
// Statement
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    return bind_result(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                         static_cast<int>(text.size()), SQLITE_TRANSIENT),
                       "text");
}

Result<void, Error> Statement::bind_int(int index, int value) {
    return bind_result(sqlite3_bind_int(stmt_.get(), index, value), "int");
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    return bind_result(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
}

Result<void, Error> Statement::bind_null(int index) {
    return bind_result(sqlite3_bind_null(stmt_.get(), index), "null");
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
    const int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) return Result<bool, Error>::ok(true);
    if (rc == SQLITE_DONE) return Result<bool, Error>::ok(false);
    return Result<bool, Error>::err(Error{"Step failed", rc});
}

Result<void, Error> Statement::reset() {
    const int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error{"Reset failed", rc});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> all_bound(std::initializer_list<Result<void, Error>> binds) {
    for (const auto& bound : binds) {
        if (bound.is_err()) return bound;
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database
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
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open(path.c_str(), &raw);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(Error{error, rc});
    }

    Database db(raw);
    auto pragmas = db.execute("PRAGMA foreign_keys = ON;");
    if (pragmas.is_err()) {
        return Result<Database, Error>::err(pragmas.unwrap_err());
    }
    return Result<Database, Error>::ok(std::move(db));
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

Result<Statement, Error> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error{last_error(), rc});
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error{error, rc});
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

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace pagetree::storage
