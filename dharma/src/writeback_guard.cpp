#include <dharma/writeback_guard.hpp>
#include <dharma/scrub.hpp>
#include <dharma/types.hpp>
#include <algorithm>
#include <limits>

namespace dharma {

const std::vector<std::string>& poison_patterns() {
    static const std::vector<std::string> patterns = {
        "ignore previous instructions",
        "ignore all previous instructions",
        "system prompt",
        "developer message",
        "override safety",
        "bypass safety",
        "disable guard",
        "exfiltrate",
        "reveal secrets",
        "tool jailbreak",
    };
    return patterns;
}

bool contains_poison_pattern(const std::string& text) {
    const std::string normalized = to_lower(text);
    for (const auto& pattern : poison_patterns()) {
        if (contains(normalized, pattern)) return true;
    }
    return false;
}

json WritebackPayload::to_json(const ImmutableStateHeader& immutable) const {
    json j = {
        {"state_header", {
            {"schema_version", immutable.schema_version},
            {"identity_principles_hash", immutable.identity_principles_hash},
            {"safety_posture", immutable.safety_posture},
            {"current_objective", state_header.current_objective},
            {"open_loops", state_header.open_loops},
            {"next_actions", state_header.next_actions},
            {"commitments", state_header.commitments},
            {"recent_context_summary", state_header.recent_context_summary},
            {"last_updated_at", state_header.last_updated_at}
        }}
    };
    if (!memory_append.empty()) {
        j["memory_append"] = memory_append;
    }
    return j;
}

namespace {

const std::vector<std::string> ALLOWED_TOP_LEVEL_FIELDS = {
    "state_header",
    "memory_append",
};

const std::vector<std::string> ALLOWED_STATE_HEADER_FIELDS = {
    "schema_version",
    "identity_principles_hash",
    "safety_posture",
    "current_objective",
    "open_loops",
    "next_actions",
    "commitments",
    "recent_context_summary",
    "last_updated_at",
};

const char* STATE_HEADER_CONTEXT = "payload.state_header";

bool no_unknown_fields(const json& object, const std::vector<std::string>& allowed,
                       const std::string& context, std::string& error) {
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (std::find(allowed.begin(), allowed.end(), it.key()) == allowed.end()) {
            // Injection-shaped keys are not echoed into logs or reports
            error = contains_poison_pattern(it.key())
                ? context + " contains unknown field"
                : context + " contains unknown field: " + it.key();
            return false;
        }
    }
    return true;
}

// Trimmed value checks shared by scalar fields and list items
bool check_text(const std::string& raw, size_t max_chars, const std::string& label,
                std::string& out, std::string& error) {
    out = trim(raw);
    if (out.empty()) {
        error = label + " cannot be empty";
        return false;
    }
    if (char_count(out) > max_chars) {
        error = label + " exceeds max length (" + std::to_string(max_chars) + ")";
        return false;
    }
    if (contains_poison_pattern(out)) {
        error = label + " contains unsafe content pattern";
        return false;
    }
    return true;
}

bool string_field(const json& object, const char* field, size_t max_chars,
                  std::string& out, std::string& error) {
    const std::string label = std::string(STATE_HEADER_CONTEXT) + "." + field;
    auto it = object.find(field);
    if (it == object.end()) {
        error = label + " is required";
        return false;
    }
    if (!it->is_string()) {
        error = label + " must be a string";
        return false;
    }
    return check_text(it->get<std::string>(), max_chars, label, out, error);
}

bool string_list(const json& list, const std::string& label, size_t max_items,
                 size_t max_item_chars, std::vector<std::string>& out, std::string& error) {
    if (!list.is_array()) {
        error = label + " must be an array";
        return false;
    }
    if (list.size() > max_items) {
        error = label + " exceeds max items (" + std::to_string(max_items) + ")";
        return false;
    }
    out.clear();
    out.reserve(list.size());
    for (size_t i = 0; i < list.size(); ++i) {
        const std::string item_label = label + "[" + std::to_string(i) + "]";
        if (!list[i].is_string()) {
            error = item_label + " must be a string";
            return false;
        }
        std::string value;
        if (!check_text(list[i].get<std::string>(), max_item_chars, item_label, value, error)) {
            return false;
        }
        out.push_back(std::move(value));
    }
    return true;
}

bool list_field(const json& object, const char* field, size_t max_items,
                std::vector<std::string>& out, std::string& error) {
    const std::string label = std::string(STATE_HEADER_CONTEXT) + "." + field;
    auto it = object.find(field);
    if (it == object.end()) {
        error = label + " is required";
        return false;
    }
    return string_list(*it, label, max_items, MAX_LIST_ITEM_CHARS, out, error);
}

// Non-negative integer that fits in 32 bits (signed or unsigned JSON number)
bool read_u32(const json& value, uint64_t& out) {
    if (value.is_number_unsigned()) {
        out = value.get<uint64_t>();
    } else if (value.is_number_integer()) {
        int64_t v = value.get<int64_t>();
        if (v < 0) return false;
        out = static_cast<uint64_t>(v);
    } else {
        return false;
    }
    return out <= std::numeric_limits<uint32_t>::max();
}

bool check_immutable(const json& header, const ImmutableStateHeader& immutable,
                     std::string& error) {
    auto version = header.find("schema_version");
    uint64_t schema_version = 0;
    if (version == header.end() || !read_u32(*version, schema_version)) {
        error = "payload.state_header.schema_version must be an integer";
        return false;
    }
    if (schema_version != immutable.schema_version) {
        error = "immutable field mismatch: payload.state_header.schema_version";
        return false;
    }

    auto identity = header.find("identity_principles_hash");
    if (identity == header.end() || !identity->is_string()) {
        error = "payload.state_header.identity_principles_hash must be a string";
        return false;
    }
    if (identity->get<std::string>() != immutable.identity_principles_hash) {
        error = "immutable field mismatch: payload.state_header.identity_principles_hash";
        return false;
    }

    auto posture = header.find("safety_posture");
    if (posture == header.end() || !posture->is_string()) {
        error = "payload.state_header.safety_posture must be a string";
        return false;
    }
    if (posture->get<std::string>() != immutable.safety_posture) {
        error = "immutable field mismatch: payload.state_header.safety_posture";
        return false;
    }
    return true;
}

bool check_state_header(const json& header, const ImmutableStateHeader& immutable,
                        StateHeaderWriteback& out, std::string& error) {
    if (!no_unknown_fields(header, ALLOWED_STATE_HEADER_FIELDS, STATE_HEADER_CONTEXT, error))
        return false;
    if (!check_immutable(header, immutable, error)) return false;

    if (!string_field(header, "current_objective", MAX_CURRENT_OBJECTIVE_CHARS,
                      out.current_objective, error)) return false;
    if (!list_field(header, "open_loops", MAX_OPEN_LOOPS, out.open_loops, error)) return false;
    if (!list_field(header, "next_actions", MAX_NEXT_ACTIONS, out.next_actions, error)) return false;
    if (!list_field(header, "commitments", MAX_COMMITMENTS, out.commitments, error)) return false;
    if (!string_field(header, "recent_context_summary", MAX_RECENT_CONTEXT_SUMMARY_CHARS,
                      out.recent_context_summary, error)) return false;
    if (!string_field(header, "last_updated_at", MAX_LAST_UPDATED_AT_CHARS,
                      out.last_updated_at, error)) return false;
    if (!parse_rfc3339(out.last_updated_at)) {
        error = "payload.state_header.last_updated_at must be RFC3339";
        return false;
    }
    return true;
}

WritebackGuardVerdict rejected(const std::string& reason) {
    return WritebackGuardVerdict::reject(sanitize_error(reason));
}

} // namespace

WritebackGuardVerdict validate_writeback_payload(const json& payload,
                                                 const ImmutableStateHeader& immutable) {
    std::string error;
    if (!payload.is_object()) {
        return rejected("payload must be a JSON object");
    }
    if (!no_unknown_fields(payload, ALLOWED_TOP_LEVEL_FIELDS, "payload", error)) {
        return rejected(error);
    }

    auto header = payload.find("state_header");
    if (header == payload.end()) {
        return rejected("payload.state_header is required");
    }
    if (!header->is_object()) {
        return rejected("payload.state_header must be an object");
    }

    WritebackPayload accepted;
    if (!check_state_header(*header, immutable, accepted.state_header, error)) {
        return rejected(error);
    }

    auto append = payload.find("memory_append");
    if (append != payload.end()) {
        if (!string_list(*append, "payload.memory_append", MAX_MEMORY_APPEND_ITEMS,
                         MAX_MEMORY_APPEND_ITEM_CHARS, accepted.memory_append, error)) {
            return rejected(error);
        }
    }

    return WritebackGuardVerdict::accept(std::move(accepted));
}

} // namespace dharma
