#pragma once
// SqliteMemory: Memory backend on a single SQLite file
//
// Schema (created on open):
//   memory_events(id INTEGER PRIMARY KEY, entity_id, slot_key, event_type,
//                 content, source, privacy, layer, confidence, importance,
//                 source_kind, source_ref, provenance_source,
//                 provenance_ref, occurred_at, recorded_at)
//
// WAL mode, one connection guarded by a mutex. Storage errors throw
// std::runtime_error carrying sqlite3_errmsg().

#include "memory.hpp"
#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace dharma {

class SqliteMemory : public Memory {
public:
    // Opens (creating if needed) the database at path; throws on failure
    explicit SqliteMemory(const std::string& path);
    ~SqliteMemory() override;

    SqliteMemory(const SqliteMemory&) = delete;
    SqliteMemory& operator=(const SqliteMemory&) = delete;

    void append_event(const MemoryEvent& event) override;
    size_t count_events(const std::string& entity_id) override;
    std::optional<MemoryEvent> resolve_slot(const std::string& entity_id,
                                            const std::string& slot_key) override;

    const std::string& path() const { return path_; }

private:
    void exec(const char* sql);
    sqlite3_stmt* prepare(const char* sql);
    [[noreturn]] void fail(const std::string& what);

    std::string path_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* count_stmt_ = nullptr;
    sqlite3_stmt* resolve_stmt_ = nullptr;
    std::mutex mutex_;
};

} // namespace dharma
