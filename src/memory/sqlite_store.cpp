#include "sqlite_store.hpp"
#include "sqlite_db.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace vigil {

SqliteRecordStore::SqliteRecordStore(const std::string& path) : path_(path) {
    ensure_database(path_, "SqliteRecordStore");
    init_schema();
}

void SqliteRecordStore::init_schema() {
    SqliteConnection conn(path_);
    const char* schema =
        "CREATE TABLE IF NOT EXISTS memories ("
        "  id         TEXT PRIMARY KEY,"
        "  content    TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  source     TEXT NOT NULL,"
        "  outcome    TEXT NOT NULL,"
        "  confidence REAL NOT NULL,"
        "  tier       TEXT NOT NULL,"
        "  embedding  BLOB"
        ");"
        "CREATE TABLE IF NOT EXISTS processed_files ("
        "  path         TEXT PRIMARY KEY,"
        "  content_hash TEXT NOT NULL,"
        "  processed_at INTEGER NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS store_meta ("
        "  key   TEXT PRIMARY KEY,"
        "  value TEXT NOT NULL"
        ");";
    if (!conn.exec(schema)) {
        throw std::runtime_error("SqliteRecordStore: failed to create schema: " +
                                 conn.error());
    }
}

// Helper: read embedding BLOB from a column into a vector<float>
static Embedding read_embedding_blob(sqlite3_stmt* stmt, int col) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int bytes = sqlite3_column_bytes(stmt, col);
    if (!blob || bytes <= 0) return {};

    size_t count = static_cast<size_t>(bytes) / sizeof(float);
    Embedding emb(count);
    std::memcpy(emb.data(), blob, count * sizeof(float));
    return emb;
}

// Columns: id, content, created_at, source, outcome, confidence, tier, embedding
static MemoryRecord record_from_stmt(sqlite3_stmt* stmt) {
    MemoryRecord rec;
    if (auto* v = sqlite3_column_text(stmt, 0)) rec.id      = reinterpret_cast<const char*>(v);
    if (auto* v = sqlite3_column_text(stmt, 1)) rec.content = reinterpret_cast<const char*>(v);
    rec.created_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
    if (auto* v = sqlite3_column_text(stmt, 3)) rec.source  = reinterpret_cast<const char*>(v);
    if (auto* v = sqlite3_column_text(stmt, 4)) rec.outcome = outcome_from_string(reinterpret_cast<const char*>(v));
    rec.confidence = sqlite3_column_double(stmt, 5);
    if (auto* v = sqlite3_column_text(stmt, 6)) rec.tier    = tier_from_string(reinterpret_cast<const char*>(v));
    rec.embedding = read_embedding_blob(stmt, 7);
    return rec;
}

static uint32_t read_dims(SqliteConnection& conn) {
    StmtGuard g;
    if (!conn.prepare("SELECT value FROM store_meta WHERE key = 'embedding_dims';", g))
        return 0;
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    auto* v = sqlite3_column_text(g.stmt, 0);
    if (!v) return 0;
    return static_cast<uint32_t>(std::strtoul(reinterpret_cast<const char*>(v), nullptr, 10));
}

std::string SqliteRecordStore::append(const MemoryRecord& record) {
    if (!record_is_valid(record)) {
        std::cerr << "[store] Rejected malformed record from '" << record.source << "'\n";
        return {};
    }

    MemoryRecord rec = record;
    if (rec.id.empty()) rec.id = generate_id();
    if (rec.created_at == 0) rec.created_at = epoch_seconds();

    SqliteConnection conn(path_);
    if (!conn) {
        std::cerr << "[store] Cannot open " << path_ << ": " << conn.error() << "\n";
        return {};
    }
    Transaction tx(conn);
    if (!tx.active()) return {};

    if (!rec.embedding.empty()) {
        uint32_t dims = read_dims(conn);
        auto got = static_cast<uint32_t>(rec.embedding.size());
        if (dims == 0) {
            StmtGuard g;
            if (!conn.prepare("INSERT INTO store_meta (key, value) VALUES ('embedding_dims', ?);", g))
                return {};
            std::string v = std::to_string(got);
            sqlite3_bind_text(g.stmt, 1, v.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(g.stmt) != SQLITE_DONE) return {};
        } else if (dims != got) {
            std::cerr << "[store] Embedding has " << got << " dims, store expects "
                      << dims << "; storing record without embedding\n";
            rec.embedding.clear();
        }
    }

    std::string outcome = outcome_to_string(rec.outcome);
    std::string tier = tier_to_string(rec.tier);

    StmtGuard g;
    const char* sql =
        "INSERT INTO memories (id, content, created_at, source, outcome, confidence, tier, embedding)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?);";
    if (!conn.prepare(sql, g)) return {};
    sqlite3_bind_text(g.stmt, 1, rec.id.c_str(),      -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, rec.content.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 3, static_cast<sqlite3_int64>(rec.created_at));
    sqlite3_bind_text(g.stmt, 4, rec.source.c_str(),  -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 5, outcome.c_str(),     -1, SQLITE_STATIC);
    sqlite3_bind_double(g.stmt, 6, rec.confidence);
    sqlite3_bind_text(g.stmt, 7, tier.c_str(),        -1, SQLITE_STATIC);
    if (rec.embedding.empty()) {
        sqlite3_bind_null(g.stmt, 8);
    } else {
        sqlite3_bind_blob(g.stmt, 8, rec.embedding.data(),
                          static_cast<int>(rec.embedding.size() * sizeof(float)),
                          SQLITE_STATIC);
    }
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[store] Insert failed: " << sqlite3_errmsg(conn.get()) << "\n";
        return {};
    }

    if (!tx.commit()) return {};
    return rec.id;
}

std::vector<MemoryRecord> SqliteRecordStore::all() {
    SqliteConnection conn(path_);
    StmtGuard g;
    const char* sql =
        "SELECT id, content, created_at, source, outcome, confidence, tier, embedding"
        " FROM memories ORDER BY rowid ASC;";
    if (!conn.prepare(sql, g)) return {};

    std::vector<MemoryRecord> results;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        results.push_back(record_from_stmt(g.stmt));
    }
    return results;
}

uint32_t SqliteRecordStore::delete_matching(const std::string& keyword) {
    std::string kw = trim(keyword);
    if (kw.empty()) return 0;

    SqliteConnection conn(path_);
    Transaction tx(conn);
    if (!tx.active()) return 0;

    StmtGuard g;
    const char* sql = "DELETE FROM memories WHERE instr(lower(content), lower(?)) > 0;";
    if (!conn.prepare(sql, g)) return 0;
    sqlite3_bind_text(g.stmt, 1, kw.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return 0;
    auto removed = static_cast<uint32_t>(sqlite3_changes(conn.get()));
    if (!tx.commit()) return 0;
    return removed;
}

bool SqliteRecordStore::set_outcome(const std::string& id, Outcome outcome) {
    if (outcome == Outcome::Unknown) return false;

    SqliteConnection conn(path_);
    StmtGuard g;
    const char* sql = "UPDATE memories SET outcome = ? WHERE id = ? AND outcome = 'unknown';";
    if (!conn.prepare(sql, g)) return false;
    std::string o = outcome_to_string(outcome);
    sqlite3_bind_text(g.stmt, 1, o.c_str(),  -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return false;
    return sqlite3_changes(conn.get()) > 0;
}

uint32_t SqliteRecordStore::count() {
    SqliteConnection conn(path_);
    StmtGuard g;
    if (!conn.prepare("SELECT COUNT(*) FROM memories;", g)) return 0;
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
}

double SqliteRecordStore::average_confidence() {
    SqliteConnection conn(path_);
    StmtGuard g;
    if (!conn.prepare("SELECT COALESCE(AVG(confidence), 0) FROM memories;", g)) return 0.0;
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0.0;
    return sqlite3_column_double(g.stmt, 0);
}

std::optional<std::string> SqliteRecordStore::processed_hash(const std::string& file_path) {
    SqliteConnection conn(path_);
    StmtGuard g;
    if (!conn.prepare("SELECT content_hash FROM processed_files WHERE path = ?;", g))
        return std::nullopt;
    sqlite3_bind_text(g.stmt, 1, file_path.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;
    auto* v = sqlite3_column_text(g.stmt, 0);
    if (!v) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(v));
}

bool SqliteRecordStore::upsert_processed(const std::string& file_path,
                                         const std::string& content_hash) {
    if (file_path.empty() || content_hash.empty()) return false;

    SqliteConnection conn(path_);
    StmtGuard g;
    const char* sql =
        "INSERT INTO processed_files (path, content_hash, processed_at) VALUES (?, ?, ?)"
        " ON CONFLICT(path) DO UPDATE SET content_hash = excluded.content_hash,"
        " processed_at = excluded.processed_at;";
    if (!conn.prepare(sql, g)) return false;
    sqlite3_bind_text(g.stmt, 1, file_path.c_str(),    -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, content_hash.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 3, static_cast<sqlite3_int64>(epoch_seconds()));
    return sqlite3_step(g.stmt) == SQLITE_DONE;
}

uint32_t SqliteRecordStore::processed_count() {
    SqliteConnection conn(path_);
    StmtGuard g;
    if (!conn.prepare("SELECT COUNT(*) FROM processed_files;", g)) return 0;
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
}

uint32_t SqliteRecordStore::embedding_dims() {
    SqliteConnection conn(path_);
    return read_dims(conn);
}

} // namespace vigil
