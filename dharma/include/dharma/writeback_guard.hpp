#pragma once
// Writeback Guard: validates self-state updates proposed by the model
//
// Model output is untrusted. A payload is accepted only when:
// - it has exactly the allowed shape (no unknown keys anywhere)
// - the immutable header fields match the canonical snapshot exactly
// - every mutable string is non-empty, within its character cap, and free
//   of known instruction-injection phrases
//
// Accepted payloads are rebuilt from trimmed, validated values only.
// Rejection reasons name the field and limit, never the offending text.
// The guard is stateless, deterministic and never throws.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace dharma {

using json = nlohmann::json;

constexpr size_t MAX_CURRENT_OBJECTIVE_CHARS = 280;
constexpr size_t MAX_RECENT_CONTEXT_SUMMARY_CHARS = 1200;
constexpr size_t MAX_LAST_UPDATED_AT_CHARS = 64;
constexpr size_t MAX_LIST_ITEM_CHARS = 240;
constexpr size_t MAX_OPEN_LOOPS = 7;
constexpr size_t MAX_NEXT_ACTIONS = 3;
constexpr size_t MAX_COMMITMENTS = 5;
constexpr size_t MAX_MEMORY_APPEND_ITEMS = 8;
constexpr size_t MAX_MEMORY_APPEND_ITEM_CHARS = 240;

// Case-insensitive substrings refused in any mutable value
const std::vector<std::string>& poison_patterns();
bool contains_poison_pattern(const std::string& text);

// Fields the model may never change
struct ImmutableStateHeader {
    uint32_t schema_version = 1;
    std::string identity_principles_hash;
    std::string safety_posture;
};

// Mutable half of the state header, as accepted by the guard
struct StateHeaderWriteback {
    std::string current_objective;
    std::vector<std::string> open_loops;
    std::vector<std::string> next_actions;
    std::vector<std::string> commitments;
    std::string recent_context_summary;
    std::string last_updated_at;            // RFC3339
};

struct WritebackPayload {
    StateHeaderWriteback state_header;
    std::vector<std::string> memory_append;

    // Wire form, immutable fields taken from the snapshot
    json to_json(const ImmutableStateHeader& immutable) const;
};

struct GuardRejection {
    std::string reason;
};

class WritebackGuardVerdict {
public:
    static WritebackGuardVerdict accept(WritebackPayload payload) {
        return WritebackGuardVerdict(std::move(payload));
    }
    static WritebackGuardVerdict reject(std::string reason) {
        return WritebackGuardVerdict(GuardRejection{std::move(reason)});
    }

    bool accepted() const { return std::holds_alternative<WritebackPayload>(value_); }
    const WritebackPayload& payload() const { return std::get<WritebackPayload>(value_); }
    const std::string& reason() const { return std::get<GuardRejection>(value_).reason; }

private:
    explicit WritebackGuardVerdict(std::variant<WritebackPayload, GuardRejection> value)
        : value_(std::move(value)) {}

    std::variant<WritebackPayload, GuardRejection> value_;
};

WritebackGuardVerdict validate_writeback_payload(const json& payload,
                                                 const ImmutableStateHeader& immutable);

} // namespace dharma
