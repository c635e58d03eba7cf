#include "bloomstock/database.hpp"
#include "bloomstock/errors.hpp"
#include "bloomstock/logging.hpp"
#include <sqlite3.h>

namespace bloomstock {

namespace {

[[noreturn]] void throw_sqlite(sqlite3* db, int rc, const std::string& context) {
    std::string message = context + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    throw StorageError(message, rc);
}

}  // anonymous namespace

bool StorageError::is_retryable() const {
    int primary = sqlite_code_ & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

// =============================================================================
// Statement
// =============================================================================

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db), stmt_(nullptr), sql_(sql) {
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        throw_sqlite(db_, rc, "prepare failed");
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_), sql_(std::move(other.sql_)) {
    other.stmt_ = nullptr;
}

Statement& Statement::bind(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, value);
    if (rc != SQLITE_OK) throw_sqlite(db_, rc, "bind failed");
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) throw_sqlite(db_, rc, "bind failed");
    return *this;
}

Statement& Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) throw_sqlite(db_, rc, "bind failed");
    return *this;
}

Statement& Statement::bind_all(int first_index, const std::vector<int64_t>& values) {
    int index = first_index;
    for (auto value : values) {
        bind(index++, value);
    }
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite(db_, rc, "step failed");
}

void Statement::execute() {
    while (step()) {
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int64_t Statement::column_int64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::string Statement::column_text(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

bool Statement::column_is_null(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

// =============================================================================
// Database
// =============================================================================

Database::Database(const std::string& path, int busy_timeout_ms) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = "cannot open database " + path + ": " +
                              (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError(message, rc);
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);
    try {
        exec("PRAGMA foreign_keys = ON");
        if (path != ":memory:") {
            exec("PRAGMA journal_mode = WAL");
        }
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

Database::~Database() {
    if (db_) sqlite3_close(db_);
}

void Database::exec(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        throw StorageError("exec failed: " + message, rc);
    }
}

Statement Database::prepare(const std::string& sql) {
    return Statement(db_, sql);
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

// =============================================================================
// Transaction
// =============================================================================

Transaction::Transaction(Database& db, TransactionMode mode) : db_(db) {
    db_.exec(mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN DEFERRED");
}

Transaction::~Transaction() {
    if (done_) return;
    try {
        db_.exec("ROLLBACK");
    } catch (const StorageError& e) {
        log_error("storage", "rollback_failed", {{"error", e.what()}});
    }
}

void Transaction::commit() {
    db_.exec("COMMIT");
    done_ = true;
}

std::string placeholders(size_t count) {
    std::string result;
    result.reserve(count * 2);
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) result += ',';
        result += '?';
    }
    return result;
}

}  // namespace bloomstock
