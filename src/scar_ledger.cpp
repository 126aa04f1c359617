#include "scar_ledger.hpp"
#include "memory/sqlite_db.hpp"
#include "util.hpp"
#include <sqlite3.h>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace vigil {

std::string scar_pattern_key(const std::string& content) {
    return sha256_hex(to_lower(trim(content)));
}

ScarLedger::ScarLedger(const std::string& path) : path_(path) {
    ensure_database(path_, "ScarLedger");
    SqliteConnection conn(path_);
    const char* schema =
        "CREATE TABLE IF NOT EXISTS scars ("
        "  pattern_key TEXT NOT NULL,"
        "  severity    REAL NOT NULL,"
        "  lesson      TEXT NOT NULL,"
        "  created_at  INTEGER NOT NULL,"
        "  UNIQUE (pattern_key, lesson)"
        ");";
    if (!conn.exec(schema)) {
        throw std::runtime_error("ScarLedger: failed to create schema: " + conn.error());
    }
}

bool ScarLedger::register_scar(const std::string& content, double severity,
                               const std::string& lesson) {
    if (!std::isfinite(severity) || severity < 0.0 || severity > 1.0) return false;
    std::string l = trim(lesson);
    if (l.empty()) return false;

    std::string key = scar_pattern_key(content);

    SqliteConnection conn(path_);
    StmtGuard g;
    const char* sql =
        "INSERT OR IGNORE INTO scars (pattern_key, severity, lesson, created_at)"
        " VALUES (?, ?, ?, ?);";
    if (!conn.prepare(sql, g)) return false;
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_double(g.stmt, 2, severity);
    sqlite3_bind_text(g.stmt, 3, l.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 4, static_cast<sqlite3_int64>(epoch_seconds()));
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[scars] Insert failed: " << sqlite3_errmsg(conn.get()) << "\n";
        return false;
    }
    return sqlite3_changes(conn.get()) > 0;
}

std::vector<ScarRecord> ScarLedger::all() {
    SqliteConnection conn(path_);
    StmtGuard g;
    const char* sql =
        "SELECT pattern_key, severity, lesson, created_at FROM scars ORDER BY rowid ASC;";
    if (!conn.prepare(sql, g)) return {};

    std::vector<ScarRecord> scars;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        ScarRecord s;
        if (auto* v = sqlite3_column_text(g.stmt, 0)) s.pattern_key = reinterpret_cast<const char*>(v);
        s.severity = sqlite3_column_double(g.stmt, 1);
        if (auto* v = sqlite3_column_text(g.stmt, 2)) s.lesson = reinterpret_cast<const char*>(v);
        s.created_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 3));
        scars.push_back(std::move(s));
    }
    return scars;
}

std::optional<Trauma> ScarLedger::check_trauma(const std::string& input) {
    auto words = tokenize_words(input);
    if (words.empty()) return std::nullopt;
    std::unordered_set<std::string> input_words(words.begin(), words.end());

    for (auto& scar : all()) {
        for (const auto& w : tokenize_words(scar.lesson)) {
            if (input_words.count(w)) {
                return Trauma{scar.severity, std::move(scar.lesson)};
            }
        }
    }
    return std::nullopt;
}

uint32_t ScarLedger::count_matching(const std::string& name) {
    std::string n = trim(name);
    if (n.empty()) return 0;

    SqliteConnection conn(path_);
    StmtGuard g;
    if (!conn.prepare("SELECT COUNT(*) FROM scars WHERE instr(lower(lesson), lower(?)) > 0;", g))
        return 0;
    sqlite3_bind_text(g.stmt, 1, n.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
}

uint32_t ScarLedger::count() {
    SqliteConnection conn(path_);
    StmtGuard g;
    if (!conn.prepare("SELECT COUNT(*) FROM scars;", g)) return 0;
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
}

} // namespace vigil
