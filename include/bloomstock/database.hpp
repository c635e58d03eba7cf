#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace bloomstock {

class Database;

/**
 * A prepared SQLite statement. Finalized on destruction.
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&&) = delete;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /// Bind by 1-based index.
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, const std::string& value);
    Statement& bind_null(int index);

    /// Bind a list of ids starting at the given index.
    Statement& bind_all(int first_index, const std::vector<int64_t>& values);

    /**
     * Advance the statement.
     * @return true if a row is available, false when done.
     */
    bool step();

    /// Run a statement that produces no rows.
    void execute();

    void reset();

    int64_t column_int64(int column) const;
    std::string column_text(int column) const;
    bool column_is_null(int column) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
    std::string sql_;
};

/**
 * One SQLite connection. Not shared across threads: each worker opens its own.
 */
class Database {
public:
    Database(const std::string& path, int busy_timeout_ms);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void exec(const std::string& sql);
    Statement prepare(const std::string& sql);

    int64_t last_insert_rowid() const;
    int changes() const;

    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

enum class TransactionMode { Deferred, Immediate };

/**
 * RAII transaction. Rolls back on destruction unless commit() was called.
 *
 * Immediate transactions take the database write lock before the first read,
 * which is what makes check-then-write sequences atomic across connections.
 */
class Transaction {
public:
    Transaction(Database& db, TransactionMode mode);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool done_ = false;
};

/// "?,?,?" with count placeholders.
std::string placeholders(size_t count);

}  // namespace bloomstock
