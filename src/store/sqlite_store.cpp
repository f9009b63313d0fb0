#include "sqlite_store.hpp"
#include "../errors.hpp"
#include "../model/codec.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <system_error>

namespace engram {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

[[noreturn]] static void fail(sqlite3* db, const std::string& what) {
    std::string detail = db ? sqlite3_errmsg(db) : "database is not open";
    throw EngramError(ErrorCode::StorageFailure, "sqlite " + what + " failed: " + detail);
}

static void prepare(sqlite3* db, const std::string& sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        fail(db, "prepare");
    }
}

static void bind_text(sqlite3* db, sqlite3_stmt* stmt, int idx, const std::string& value) {
    if (sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        fail(db, "bind");
    }
}

static void bind_int64(sqlite3* db, sqlite3_stmt* stmt, int idx, int64_t value) {
    if (sqlite3_bind_int64(stmt, idx, value) != SQLITE_OK) {
        fail(db, "bind");
    }
}

static void step_done(sqlite3* db, sqlite3_stmt* stmt, const char* what) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        fail(db, what);
    }
}

// Step through every row, handing each to fn.
template <typename F>
static void each_row(sqlite3* db, sqlite3_stmt* stmt, F&& fn) {
    int rc = sqlite3_step(stmt);
    while (rc == SQLITE_ROW) {
        fn(stmt);
        rc = sqlite3_step(stmt);
    }
    if (rc != SQLITE_DONE) {
        fail(db, "query");
    }
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

static nlohmann::json parse_body(const std::string& body) {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw EngramError(ErrorCode::StorageFailure, std::string("corrupt record body: ") + e.what());
    }
}

SqliteStore::SqliteStore(const std::string& path) : path_(path) {}

SqliteStore::~SqliteStore() {
    close();
}

void SqliteStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) return;

    if (path_ != ":memory:") {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw EngramError(ErrorCode::StorageFailure,
                                  "cannot create directory " + parent.string() + ": " + ec.message());
            }
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw EngramError(ErrorCode::StorageFailure, "failed to open database: " + err);
    }

    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        exec("PRAGMA foreign_keys=ON;");
        sqlite3_busy_timeout(db_, 5000);
        init_schema();
    } catch (const EngramError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

void SqliteStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

bool SqliteStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

void SqliteStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw EngramError(ErrorCode::StorageFailure, "sqlite exec failed: " + msg);
    }
}

void SqliteStore::require_open() const {
    if (!db_) {
        throw EngramError(ErrorCode::StorageFailure, "store is not open");
    }
}

void SqliteStore::init_schema() {
    exec("CREATE TABLE IF NOT EXISTS memories ("
         "  id         TEXT PRIMARY KEY,"
         "  type       TEXT NOT NULL,"
         "  importance TEXT NOT NULL,"
         "  archived   INTEGER NOT NULL DEFAULT 0,"
         "  created_at INTEGER NOT NULL,"
         "  body       TEXT NOT NULL"
         ");");
    exec("CREATE INDEX IF NOT EXISTS memories_created ON memories(created_at);");

    // Append-only audit log. seq preserves append order.
    exec("CREATE TABLE IF NOT EXISTS memory_provenance ("
         "  seq        INTEGER PRIMARY KEY AUTOINCREMENT,"
         "  id         TEXT UNIQUE NOT NULL,"
         "  memory_id  TEXT NOT NULL,"
         "  event_type TEXT NOT NULL,"
         "  created_at INTEGER NOT NULL,"
         "  body       TEXT NOT NULL"
         ");");
    exec("CREATE INDEX IF NOT EXISTS provenance_memory ON memory_provenance(memory_id, seq);");
    exec("CREATE TRIGGER IF NOT EXISTS memory_provenance_no_update"
         " BEFORE UPDATE ON memory_provenance BEGIN"
         "  SELECT RAISE(ABORT, 'provenance entries are immutable');"
         " END;");
    exec("CREATE TRIGGER IF NOT EXISTS memory_provenance_no_delete"
         " BEFORE DELETE ON memory_provenance BEGIN"
         "  SELECT RAISE(ABORT, 'provenance entries are immutable');"
         " END;");

    exec("CREATE TABLE IF NOT EXISTS reconsolidation_events ("
         "  id           TEXT PRIMARY KEY,"
         "  memory_id    TEXT NOT NULL,"
         "  window_start INTEGER NOT NULL,"
         "  window_end   INTEGER,"
         "  body         TEXT NOT NULL"
         ");");
    exec("CREATE INDEX IF NOT EXISTS recon_memory ON reconsolidation_events(memory_id, window_start);");

    exec("CREATE TABLE IF NOT EXISTS memory_links ("
         "  from_id    TEXT NOT NULL,"
         "  to_id      TEXT NOT NULL,"
         "  type       TEXT NOT NULL,"
         "  created_at INTEGER NOT NULL,"
         "  PRIMARY KEY (from_id, to_id, type)"
         ");");

    exec("CREATE TABLE IF NOT EXISTS self_schema ("
         "  agent_id TEXT PRIMARY KEY,"
         "  body     TEXT NOT NULL"
         ");");

    exec("CREATE TABLE IF NOT EXISTS snapshots ("
         "  id         TEXT PRIMARY KEY,"
         "  created_at INTEGER NOT NULL,"
         "  body       TEXT NOT NULL"
         ");");
}

// ── Memories ─────────────────────────────────────────────────

void SqliteStore::create_memory(const Memory& memory) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "INSERT INTO memories (id, type, importance, archived, created_at, body)"
                 " VALUES (?, ?, ?, ?, ?, ?);", g);
    bind_text(db_, g.stmt, 1, memory.id);
    bind_text(db_, g.stmt, 2, memory_type_to_string(memory.type()));
    bind_text(db_, g.stmt, 3, importance_to_string(memory.importance));
    bind_int64(db_, g.stmt, 4, memory.is_archived ? 1 : 0);
    bind_int64(db_, g.stmt, 5, static_cast<int64_t>(memory.created_at));
    bind_text(db_, g.stmt, 6, memory_to_json(memory).dump());
    step_done(db_, g.stmt, "insert memory");
}

std::optional<Memory> SqliteStore::get_memory(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "SELECT body FROM memories WHERE id = ?;", g);
    bind_text(db_, g.stmt, 1, id);
    std::optional<Memory> result;
    each_row(db_, g.stmt, [&result](sqlite3_stmt* s) {
        result = memory_from_json(parse_body(column_text(s, 0)));
    });
    return result;
}

void SqliteStore::update_memory(const Memory& memory) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "UPDATE memories SET type = ?, importance = ?, archived = ?, body = ?"
                 " WHERE id = ?;", g);
    bind_text(db_, g.stmt, 1, memory_type_to_string(memory.type()));
    bind_text(db_, g.stmt, 2, importance_to_string(memory.importance));
    bind_int64(db_, g.stmt, 3, memory.is_archived ? 1 : 0);
    bind_text(db_, g.stmt, 4, memory_to_json(memory).dump());
    bind_text(db_, g.stmt, 5, memory.id);
    step_done(db_, g.stmt, "update memory");
    if (sqlite3_changes(db_) == 0) {
        throw EngramError(ErrorCode::NotFound, "memory '" + memory.id + "' does not exist");
    }
}

std::vector<Memory> SqliteStore::query_memories(const MemoryFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    std::string sql = "SELECT body FROM memories WHERE 1 = 1";
    std::vector<std::string> text_params;
    if (!filter.include_archived) sql += " AND archived = 0";
    if (!filter.types.empty()) {
        sql += " AND type IN (";
        for (size_t i = 0; i < filter.types.size(); ++i) {
            if (i > 0) sql += ',';
            sql += '?';
            text_params.push_back(memory_type_to_string(filter.types[i]));
        }
        sql += ')';
    }
    if (!filter.importances.empty()) {
        sql += " AND importance IN (";
        for (size_t i = 0; i < filter.importances.size(); ++i) {
            if (i > 0) sql += ',';
            sql += '?';
            text_params.push_back(importance_to_string(filter.importances[i]));
        }
        sql += ')';
    }
    if (filter.created_after) sql += " AND created_at >= ?";
    if (filter.created_before) sql += " AND created_at <= ?";
    sql += " ORDER BY created_at DESC, id ASC;";

    StmtGuard g;
    prepare(db_, sql, g);
    int col = 1;
    for (const auto& p : text_params) {
        bind_text(db_, g.stmt, col++, p);
    }
    if (filter.created_after) bind_int64(db_, g.stmt, col++, static_cast<int64_t>(*filter.created_after));
    if (filter.created_before) bind_int64(db_, g.stmt, col++, static_cast<int64_t>(*filter.created_before));

    std::vector<Memory> results;
    each_row(db_, g.stmt, [&results](sqlite3_stmt* s) {
        results.push_back(memory_from_json(parse_body(column_text(s, 0))));
    });
    return results;
}

uint32_t SqliteStore::count_memories() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "SELECT COUNT(*) FROM memories;", g);
    uint32_t count = 0;
    each_row(db_, g.stmt, [&count](sqlite3_stmt* s) {
        count = static_cast<uint32_t>(sqlite3_column_int(s, 0));
    });
    return count;
}

// ── Provenance ───────────────────────────────────────────────

void SqliteStore::append_provenance(const ProvenanceEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "INSERT INTO memory_provenance (id, memory_id, event_type, created_at, body)"
                 " VALUES (?, ?, ?, ?, ?);", g);
    bind_text(db_, g.stmt, 1, entry.id);
    bind_text(db_, g.stmt, 2, entry.memory_id);
    bind_text(db_, g.stmt, 3, provenance_event_type_to_string(entry.event_type()));
    bind_int64(db_, g.stmt, 4, static_cast<int64_t>(entry.created_at));
    bind_text(db_, g.stmt, 5, provenance_entry_to_json(entry).dump());
    step_done(db_, g.stmt, "append provenance");
}

std::vector<ProvenanceEntry> SqliteStore::provenance_for(const std::string& memory_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "SELECT body FROM memory_provenance WHERE memory_id = ? ORDER BY seq;", g);
    bind_text(db_, g.stmt, 1, memory_id);
    std::vector<ProvenanceEntry> results;
    each_row(db_, g.stmt, [&results](sqlite3_stmt* s) {
        results.push_back(provenance_entry_from_json(parse_body(column_text(s, 0))));
    });
    return results;
}

std::vector<ProvenanceEntry> SqliteStore::all_provenance() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "SELECT body FROM memory_provenance ORDER BY seq;", g);
    std::vector<ProvenanceEntry> results;
    each_row(db_, g.stmt, [&results](sqlite3_stmt* s) {
        results.push_back(provenance_entry_from_json(parse_body(column_text(s, 0))));
    });
    return results;
}

// ── Reconsolidation events ───────────────────────────────────

void SqliteStore::put_reconsolidation_event(const ReconsolidationEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "INSERT OR REPLACE INTO reconsolidation_events"
                 " (id, memory_id, window_start, window_end, body) VALUES (?, ?, ?, ?, ?);", g);
    bind_text(db_, g.stmt, 1, event.id);
    bind_text(db_, g.stmt, 2, event.memory_id);
    bind_int64(db_, g.stmt, 3, static_cast<int64_t>(event.lability_window_start));
    if (event.lability_window_end) {
        bind_int64(db_, g.stmt, 4, static_cast<int64_t>(*event.lability_window_end));
    } else if (sqlite3_bind_null(g.stmt, 4) != SQLITE_OK) {
        fail(db_, "bind");
    }
    bind_text(db_, g.stmt, 5, reconsolidation_event_to_json(event).dump());
    step_done(db_, g.stmt, "store reconsolidation event");
}

std::vector<ReconsolidationEvent> SqliteStore::reconsolidation_events_for(
    const std::string& memory_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "SELECT body FROM reconsolidation_events WHERE memory_id = ?"
                 " ORDER BY window_start, id;", g);
    bind_text(db_, g.stmt, 1, memory_id);
    std::vector<ReconsolidationEvent> results;
    each_row(db_, g.stmt, [&results](sqlite3_stmt* s) {
        results.push_back(reconsolidation_event_from_json(parse_body(column_text(s, 0))));
    });
    return results;
}

std::vector<ReconsolidationEvent> SqliteStore::all_reconsolidation_events() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "SELECT body FROM reconsolidation_events ORDER BY window_start, id;", g);
    std::vector<ReconsolidationEvent> results;
    each_row(db_, g.stmt, [&results](sqlite3_stmt* s) {
        results.push_back(reconsolidation_event_from_json(parse_body(column_text(s, 0))));
    });
    return results;
}

// ── Links ────────────────────────────────────────────────────

static MemoryLink link_from_stmt(sqlite3_stmt* stmt) {
    MemoryLink link;
    link.from_id = column_text(stmt, 0);
    link.to_id = column_text(stmt, 1);
    link.type = link_type_from_string(column_text(stmt, 2)).value_or(LinkType::RelatedTo);
    link.created_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
    return link;
}

bool SqliteStore::add_link(const MemoryLink& link) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "INSERT OR IGNORE INTO memory_links (from_id, to_id, type, created_at)"
                 " VALUES (?, ?, ?, ?);", g);
    bind_text(db_, g.stmt, 1, link.from_id);
    bind_text(db_, g.stmt, 2, link.to_id);
    bind_text(db_, g.stmt, 3, link_type_to_string(link.type));
    bind_int64(db_, g.stmt, 4, static_cast<int64_t>(link.created_at));
    step_done(db_, g.stmt, "insert link");
    return sqlite3_changes(db_) > 0;
}

bool SqliteStore::remove_link(const std::string& from_id, const std::string& to_id,
                              LinkType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "DELETE FROM memory_links WHERE from_id = ? AND to_id = ? AND type = ?;", g);
    bind_text(db_, g.stmt, 1, from_id);
    bind_text(db_, g.stmt, 2, to_id);
    bind_text(db_, g.stmt, 3, link_type_to_string(type));
    step_done(db_, g.stmt, "delete link");
    return sqlite3_changes(db_) > 0;
}

std::vector<MemoryLink> SqliteStore::links_from(const std::string& memory_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "SELECT from_id, to_id, type, created_at FROM memory_links"
                 " WHERE from_id = ? ORDER BY created_at, to_id;", g);
    bind_text(db_, g.stmt, 1, memory_id);
    std::vector<MemoryLink> results;
    each_row(db_, g.stmt, [&results](sqlite3_stmt* s) { results.push_back(link_from_stmt(s)); });
    return results;
}

std::vector<MemoryLink> SqliteStore::all_links() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "SELECT from_id, to_id, type, created_at FROM memory_links"
                 " ORDER BY created_at, from_id, to_id;", g);
    std::vector<MemoryLink> results;
    each_row(db_, g.stmt, [&results](sqlite3_stmt* s) { results.push_back(link_from_stmt(s)); });
    return results;
}

// ── Self-schema ──────────────────────────────────────────────

std::optional<SelfSchema> SqliteStore::get_self_schema(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "SELECT body FROM self_schema WHERE agent_id = ?;", g);
    bind_text(db_, g.stmt, 1, agent_id);
    std::optional<SelfSchema> result;
    each_row(db_, g.stmt, [&result](sqlite3_stmt* s) {
        result = self_schema_from_json(parse_body(column_text(s, 0)));
    });
    return result;
}

void SqliteStore::put_self_schema(const SelfSchema& schema) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "INSERT OR REPLACE INTO self_schema (agent_id, body) VALUES (?, ?);", g);
    bind_text(db_, g.stmt, 1, schema.agent_id);
    bind_text(db_, g.stmt, 2, self_schema_to_json(schema).dump());
    step_done(db_, g.stmt, "store self-schema");
}

// ── Session snapshots ────────────────────────────────────────

void SqliteStore::save_snapshot(const SessionSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "INSERT OR REPLACE INTO snapshots (id, created_at, body) VALUES (?, ?, ?);", g);
    bind_text(db_, g.stmt, 1, snapshot.id);
    bind_int64(db_, g.stmt, 2, static_cast<int64_t>(snapshot.created_at));
    bind_text(db_, g.stmt, 3, session_snapshot_to_json(snapshot).dump());
    step_done(db_, g.stmt, "store snapshot");
}

std::vector<SessionSnapshot> SqliteStore::list_snapshots(uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "SELECT body FROM snapshots ORDER BY created_at DESC, id DESC LIMIT ?;", g);
    bind_int64(db_, g.stmt, 1, limit == 0 ? -1 : static_cast<int64_t>(limit));
    std::vector<SessionSnapshot> results;
    each_row(db_, g.stmt, [&results](sqlite3_stmt* s) {
        results.push_back(session_snapshot_from_json(parse_body(column_text(s, 0))));
    });
    return results;
}

} // namespace engram
