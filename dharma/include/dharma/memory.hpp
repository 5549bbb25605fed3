#pragma once
// Memory: durable event log the control plane writes audit and autosave
// records into
//
// Every record is an append-only MemoryEvent addressed by (entity, slot).
// The latest event for a slot is its current value. Backends:
// - InMemoryEventLog: process-local, for tests and ephemeral agents
// - SqliteMemory (sqlite_memory.hpp): on-disk store

#include "types.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dharma {

enum class MemoryEventType : uint8_t {
    FactAdded = 0,
    FactUpdated = 1,
    SummaryCompacted = 2,
    InferredClaim = 3,
    ContradictionMarked = 4,
};

enum class MemorySource : uint8_t {
    ExplicitUser = 0,
    System = 1,
    Inferred = 2,
    ExternalPrimary = 3,
    ExternalSecondary = 4,
};

enum class PrivacyLevel : uint8_t {
    Public = 0,
    Private = 1,
    Secret = 2,
};

enum class MemoryLayer : uint8_t {
    Working = 0,
    Episodic = 1,
    Semantic = 2,
};

enum class SourceKind : uint8_t {
    Conversation = 0,
    Manual = 1,
    Api = 2,
    Discord = 3,
    Telegram = 4,
    Slack = 5,
    News = 6,
    Document = 7,
};

const char* event_type_name(MemoryEventType t);
const char* memory_source_name(MemorySource s);
const char* privacy_level_name(PrivacyLevel p);
const char* memory_layer_name(MemoryLayer l);
const char* source_kind_name(SourceKind k);

bool parse_event_type(const std::string& name, MemoryEventType& out);
bool parse_memory_source(const std::string& name, MemorySource& out);
bool parse_privacy_level(const std::string& name, PrivacyLevel& out);
bool parse_memory_layer(const std::string& name, MemoryLayer& out);
bool parse_source_kind(const std::string& name, SourceKind& out);

// Where a record came from; checked by the write policies
struct MemoryProvenance {
    MemorySource source_class = MemorySource::System;
    std::string reference;
};

struct MemoryEvent {
    std::string entity_id;
    std::string slot_key;
    MemoryEventType event_type = MemoryEventType::FactAdded;
    std::string content;
    MemorySource source = MemorySource::System;
    PrivacyLevel privacy = PrivacyLevel::Private;
    MemoryLayer layer = MemoryLayer::Working;
    double confidence = 1.0;
    double importance = 0.5;
    std::optional<SourceKind> source_kind;
    std::optional<std::string> source_ref;
    std::optional<MemoryProvenance> provenance;
    std::string occurred_at;                // RFC3339
    Timestamp recorded_at = 0;              // Set by the backend

    // Sets source_kind, source_ref and a provenance pointing at the same ref
    MemoryEvent& with_source_ref(SourceKind kind, const std::string& ref) {
        source_kind = kind;
        source_ref = ref;
        provenance = MemoryProvenance{source, ref};
        return *this;
    }
};

// Backend interface. append_event throws std::runtime_error on storage failure.
class Memory {
public:
    virtual ~Memory() = default;

    virtual void append_event(const MemoryEvent& event) = 0;
    virtual size_t count_events(const std::string& entity_id) = 0;
    virtual std::optional<MemoryEvent> resolve_slot(const std::string& entity_id,
                                                    const std::string& slot_key) = 0;
};

// Thread-safe in-process event log
class InMemoryEventLog : public Memory {
public:
    void append_event(const MemoryEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        MemoryEvent stored = event;
        stored.recorded_at = now();
        if (stored.occurred_at.empty()) stored.occurred_at = format_rfc3339(stored.recorded_at);
        events_.push_back(std::move(stored));
    }

    size_t count_events(const std::string& entity_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (e.entity_id == entity_id) ++n;
        }
        return n;
    }

    std::optional<MemoryEvent> resolve_slot(const std::string& entity_id,
                                            const std::string& slot_key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            if (it->entity_id == entity_id && it->slot_key == slot_key) return *it;
        }
        return std::nullopt;
    }

    // All events, oldest first
    std::vector<MemoryEvent> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<MemoryEvent> events_;
};

} // namespace dharma
