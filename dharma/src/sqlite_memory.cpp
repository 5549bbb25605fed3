#include <dharma/sqlite_memory.hpp>
#include <dharma/log.hpp>
#include <sqlite3.h>
#include <stdexcept>

namespace dharma {

namespace {

const char* SCHEMA_SQL =
    "CREATE TABLE IF NOT EXISTS memory_events ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  entity_id TEXT NOT NULL,"
    "  slot_key TEXT NOT NULL,"
    "  event_type TEXT NOT NULL,"
    "  content TEXT NOT NULL,"
    "  source TEXT NOT NULL,"
    "  privacy TEXT NOT NULL,"
    "  layer TEXT NOT NULL,"
    "  confidence REAL NOT NULL,"
    "  importance REAL NOT NULL,"
    "  source_kind TEXT,"
    "  source_ref TEXT,"
    "  provenance_source TEXT,"
    "  provenance_ref TEXT,"
    "  occurred_at TEXT NOT NULL,"
    "  recorded_at INTEGER NOT NULL"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_memory_events_slot"
    "  ON memory_events(entity_id, slot_key, id);";

const char* INSERT_SQL =
    "INSERT INTO memory_events (entity_id, slot_key, event_type, content, source,"
    " privacy, layer, confidence, importance, source_kind, source_ref,"
    " provenance_source, provenance_ref, occurred_at, recorded_at)"
    " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

const char* COUNT_SQL =
    "SELECT COUNT(*) FROM memory_events WHERE entity_id = ?";

const char* RESOLVE_SQL =
    "SELECT entity_id, slot_key, event_type, content, source, privacy, layer,"
    " confidence, importance, source_kind, source_ref, provenance_source,"
    " provenance_ref, occurred_at, recorded_at"
    " FROM memory_events WHERE entity_id = ? AND slot_key = ?"
    " ORDER BY id DESC LIMIT 1";

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_optional(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) bind_text(stmt, index, *value);
    else sqlite3_bind_null(stmt, index);
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

std::optional<std::string> column_optional(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_text(stmt, col);
}

// RAII reset so a throwing path never leaves a statement mid-step
struct StmtReset {
    sqlite3_stmt* stmt;
    ~StmtReset() {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
};

} // namespace

SqliteMemory::SqliteMemory(const std::string& path) : path_(path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("cannot open memory database " + path + ": " + msg);
    }

    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        exec(SCHEMA_SQL);
        insert_stmt_ = prepare(INSERT_SQL);
        count_stmt_ = prepare(COUNT_SQL);
        resolve_stmt_ = prepare(RESOLVE_SQL);
    } catch (const std::exception&) {
        sqlite3_finalize(insert_stmt_);
        sqlite3_finalize(count_stmt_);
        sqlite3_finalize(resolve_stmt_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    log_debug("sqlite_memory", "opened " + path);
}

SqliteMemory::~SqliteMemory() {
    sqlite3_finalize(insert_stmt_);
    sqlite3_finalize(count_stmt_);
    sqlite3_finalize(resolve_stmt_);
    if (db_) sqlite3_close(db_);
}

void SqliteMemory::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("memory database error: " + msg);
    }
}

sqlite3_stmt* SqliteMemory::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail("prepare");
    }
    return stmt;
}

void SqliteMemory::fail(const std::string& what) {
    throw std::runtime_error("memory database " + what + " failed: " + sqlite3_errmsg(db_));
}

void SqliteMemory::append_event(const MemoryEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtReset reset{insert_stmt_};

    const Timestamp recorded = now();
    bind_text(insert_stmt_, 1, event.entity_id);
    bind_text(insert_stmt_, 2, event.slot_key);
    bind_text(insert_stmt_, 3, event_type_name(event.event_type));
    bind_text(insert_stmt_, 4, event.content);
    bind_text(insert_stmt_, 5, memory_source_name(event.source));
    bind_text(insert_stmt_, 6, privacy_level_name(event.privacy));
    bind_text(insert_stmt_, 7, memory_layer_name(event.layer));
    sqlite3_bind_double(insert_stmt_, 8, event.confidence);
    sqlite3_bind_double(insert_stmt_, 9, event.importance);
    if (event.source_kind) bind_text(insert_stmt_, 10, source_kind_name(*event.source_kind));
    else sqlite3_bind_null(insert_stmt_, 10);
    bind_optional(insert_stmt_, 11, event.source_ref);
    if (event.provenance) {
        bind_text(insert_stmt_, 12, memory_source_name(event.provenance->source_class));
        bind_text(insert_stmt_, 13, event.provenance->reference);
    } else {
        sqlite3_bind_null(insert_stmt_, 12);
        sqlite3_bind_null(insert_stmt_, 13);
    }
    bind_text(insert_stmt_, 14, event.occurred_at.empty() ? format_rfc3339(recorded) : event.occurred_at);
    sqlite3_bind_int64(insert_stmt_, 15, recorded);

    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
        fail("insert");
    }
}

size_t SqliteMemory::count_events(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtReset reset{count_stmt_};

    bind_text(count_stmt_, 1, entity_id);
    if (sqlite3_step(count_stmt_) != SQLITE_ROW) {
        fail("count");
    }
    return static_cast<size_t>(sqlite3_column_int64(count_stmt_, 0));
}

std::optional<MemoryEvent> SqliteMemory::resolve_slot(const std::string& entity_id,
                                                      const std::string& slot_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtReset reset{resolve_stmt_};

    bind_text(resolve_stmt_, 1, entity_id);
    bind_text(resolve_stmt_, 2, slot_key);
    int rc = sqlite3_step(resolve_stmt_);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) fail("resolve");

    MemoryEvent e;
    e.entity_id = column_text(resolve_stmt_, 0);
    e.slot_key = column_text(resolve_stmt_, 1);
    bool ok = parse_event_type(column_text(resolve_stmt_, 2), e.event_type);
    e.content = column_text(resolve_stmt_, 3);
    ok = ok && parse_memory_source(column_text(resolve_stmt_, 4), e.source);
    ok = ok && parse_privacy_level(column_text(resolve_stmt_, 5), e.privacy);
    ok = ok && parse_memory_layer(column_text(resolve_stmt_, 6), e.layer);
    e.confidence = sqlite3_column_double(resolve_stmt_, 7);
    e.importance = sqlite3_column_double(resolve_stmt_, 8);
    if (auto kind = column_optional(resolve_stmt_, 9)) {
        SourceKind k = SourceKind::Conversation;
        ok = ok && parse_source_kind(*kind, k);
        e.source_kind = k;
    }
    e.source_ref = column_optional(resolve_stmt_, 10);
    auto prov_source = column_optional(resolve_stmt_, 11);
    auto prov_ref = column_optional(resolve_stmt_, 12);
    if (prov_source && prov_ref) {
        MemoryProvenance prov;
        ok = ok && parse_memory_source(*prov_source, prov.source_class);
        prov.reference = *prov_ref;
        e.provenance = prov;
    }
    e.occurred_at = column_text(resolve_stmt_, 13);
    e.recorded_at = sqlite3_column_int64(resolve_stmt_, 14);

    if (!ok) {
        throw std::runtime_error("memory database holds unknown enum value for slot " + slot_key);
    }
    return e;
}

} // namespace dharma
