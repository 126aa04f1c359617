#include "sqlite_db.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace vigil {

static constexpr int kBusyTimeoutMs = 5000;

StmtGuard::~StmtGuard() {
    if (stmt) sqlite3_finalize(stmt);
}

SqliteConnection::SqliteConnection(const std::string& path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        error_ = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return;
    }
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
}

SqliteConnection::~SqliteConnection() {
    if (db_) sqlite3_close(db_);
}

bool SqliteConnection::exec(const char* sql) {
    if (!db_) return false;
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        error_ = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        std::cerr << "[sqlite] " << error_ << "\n";
        return false;
    }
    return true;
}

bool SqliteConnection::prepare(const char* sql, StmtGuard& g) {
    if (!db_) return false;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        error_ = sqlite3_errmsg(db_);
        std::cerr << "[sqlite] prepare failed: " << error_ << "\n";
        return false;
    }
    return true;
}

Transaction::Transaction(SqliteConnection& conn) : conn_(conn) {
    active_ = conn_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (active_) conn_.exec("ROLLBACK;");
}

bool Transaction::commit() {
    if (!active_) return false;
    active_ = false;
    return conn_.exec("COMMIT;");
}

void ensure_database(const std::string& path, const std::string& owner) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error(owner + ": cannot create " + parent.string() +
                                     ": " + ec.message());
        }
    }
    SqliteConnection conn(path);
    if (!conn) {
        throw std::runtime_error(owner + ": failed to open database: " + conn.error());
    }
}

} // namespace vigil
