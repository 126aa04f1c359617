#pragma once
#include <string>

struct sqlite3;      // forward declare
struct sqlite3_stmt; // forward declare

namespace vigil {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    StmtGuard() = default;
    ~StmtGuard();
    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;
};

// One connection per unit of work. Opened on construction with WAL and a busy
// timeout, closed on destruction; never shared between threads.
class SqliteConnection {
public:
    explicit SqliteConnection(const std::string& path);
    ~SqliteConnection();

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    explicit operator bool() const { return db_ != nullptr; }
    sqlite3* get() const { return db_; }
    const std::string& error() const { return error_; }

    // Execute one or more statements without results.
    bool exec(const char* sql);

    // Prepare into the guard. Returns false (and logs) on failure.
    bool prepare(const char* sql, StmtGuard& g);

private:
    sqlite3* db_ = nullptr;
    std::string error_;
};

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
class Transaction {
public:
    explicit Transaction(SqliteConnection& conn);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    bool active() const { return active_; }
    bool commit();

private:
    SqliteConnection& conn_;
    bool active_ = false;
};

// Create the parent directory of a database path and open it once to check
// it is usable. Throws std::runtime_error with `owner` in the message.
void ensure_database(const std::string& path, const std::string& owner);

} // namespace vigil
