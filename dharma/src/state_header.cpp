#include <dharma/state_header.hpp>
#include <dharma/types.hpp>
#include <algorithm>

namespace dharma {

namespace {

const std::vector<std::string> STATE_HEADER_FIELDS = {
    "schema_version", "identity_principles_hash", "safety_posture",
    "current_objective", "open_loops", "next_actions", "commitments",
    "recent_context_summary", "last_updated_at",
};

bool get_string(const json& j, const char* field, std::string& out, std::string& error) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_string()) {
        error = std::string(field) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool get_list(const json& j, const char* field, std::vector<std::string>& out, std::string& error) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_array()) {
        error = std::string(field) + " must be an array of strings";
        return false;
    }
    out.clear();
    for (const auto& item : *it) {
        if (!item.is_string()) {
            error = std::string(field) + " must be an array of strings";
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

bool check_non_empty(const char* field, const std::string& value, std::string& error) {
    if (trim(value).empty()) {
        error = std::string(field) + " must not be empty";
        return false;
    }
    return true;
}

bool check_text(const char* field, const std::string& value, size_t max_chars, std::string& error) {
    if (!check_non_empty(field, value, error)) return false;
    if (char_count(value) > max_chars) {
        error = std::string(field) + " exceeds max length of " + std::to_string(max_chars);
        return false;
    }
    return true;
}

bool check_items(const char* field, const std::vector<std::string>& items, size_t max_items,
                 size_t max_item_chars, std::string& error) {
    if (items.size() > max_items) {
        error = std::string(field) + " exceeds max items of " + std::to_string(max_items);
        return false;
    }
    for (const auto& item : items) {
        if (trim(item).empty()) {
            error = std::string(field) + " contains empty item";
            return false;
        }
        if (char_count(item) > max_item_chars) {
            error = std::string(field) + " item exceeds max length of " + std::to_string(max_item_chars);
            return false;
        }
    }
    return true;
}

} // namespace

StateHeader StateHeader::from_writeback(const ImmutableStateHeader& immutable,
                                        const StateHeaderWriteback& writeback) {
    StateHeader header;
    header.schema_version = immutable.schema_version;
    header.identity_principles_hash = immutable.identity_principles_hash;
    header.safety_posture = immutable.safety_posture;
    header.current_objective = writeback.current_objective;
    header.open_loops = writeback.open_loops;
    header.next_actions = writeback.next_actions;
    header.commitments = writeback.commitments;
    header.recent_context_summary = writeback.recent_context_summary;
    header.last_updated_at = writeback.last_updated_at;
    return header;
}

json StateHeader::to_json() const {
    return {
        {"schema_version", schema_version},
        {"identity_principles_hash", identity_principles_hash},
        {"safety_posture", safety_posture},
        {"current_objective", current_objective},
        {"open_loops", open_loops},
        {"next_actions", next_actions},
        {"commitments", commitments},
        {"recent_context_summary", recent_context_summary},
        {"last_updated_at", last_updated_at}
    };
}

bool StateHeader::from_json(const json& j, StateHeader& out, std::string& error) {
    if (!j.is_object()) {
        error = "state header must be a JSON object";
        return false;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (std::find(STATE_HEADER_FIELDS.begin(), STATE_HEADER_FIELDS.end(), it.key()) ==
            STATE_HEADER_FIELDS.end()) {
            error = "state header contains unknown field: " + it.key();
            return false;
        }
    }

    auto version = j.find("schema_version");
    if (version == j.end() || !version->is_number_integer() ||
        (!version->is_number_unsigned() && version->get<int64_t>() < 0) ||
        version->get<uint64_t>() > 0xFFFFFFFFull) {
        error = "schema_version must be an unsigned integer";
        return false;
    }

    StateHeader header;
    header.schema_version = static_cast<uint32_t>(version->get<uint64_t>());
    if (!get_string(j, "identity_principles_hash", header.identity_principles_hash, error) ||
        !get_string(j, "safety_posture", header.safety_posture, error) ||
        !get_string(j, "current_objective", header.current_objective, error) ||
        !get_list(j, "open_loops", header.open_loops, error) ||
        !get_list(j, "next_actions", header.next_actions, error) ||
        !get_list(j, "commitments", header.commitments, error) ||
        !get_string(j, "recent_context_summary", header.recent_context_summary, error) ||
        !get_string(j, "last_updated_at", header.last_updated_at, error)) {
        return false;
    }
    out = std::move(header);
    return true;
}

bool StateHeader::validate(const PersonaConfig& persona, std::string& error) const {
    if (!version::state_schema_supported(schema_version)) {
        error = "invalid schema_version: expected " + std::to_string(DHARMA_STATE_SCHEMA_VERSION) +
                ", got " + std::to_string(schema_version);
        return false;
    }
    if (!check_non_empty("identity_principles_hash", identity_principles_hash, error)) return false;
    if (!check_non_empty("safety_posture", safety_posture, error)) return false;
    if (!check_text("current_objective", current_objective,
                    persona.max_current_objective_chars, error)) return false;
    if (!check_text("recent_context_summary", recent_context_summary,
                    persona.max_recent_context_summary_chars, error)) return false;
    if (!check_items("open_loops", open_loops, persona.max_open_loops,
                     persona.max_list_item_chars, error)) return false;
    if (!check_items("next_actions", next_actions, persona.max_next_actions,
                     persona.max_list_item_chars, error)) return false;
    if (!check_items("commitments", commitments, persona.max_commitments,
                     persona.max_list_item_chars, error)) return false;
    if (!parse_rfc3339(last_updated_at)) {
        error = "last_updated_at must be RFC3339";
        return false;
    }
    return true;
}

bool StateHeader::validate_writeback_candidate(const StateHeader& previous,
                                               const StateHeader& candidate,
                                               const PersonaConfig& persona,
                                               std::string& error) {
    if (!candidate.validate(persona, error)) return false;
    if (candidate.schema_version != previous.schema_version) {
        error = "immutable field changed: schema_version";
        return false;
    }
    if (candidate.identity_principles_hash != previous.identity_principles_hash) {
        error = "immutable field changed: identity_principles_hash";
        return false;
    }
    if (candidate.safety_posture != previous.safety_posture) {
        error = "immutable field changed: safety_posture";
        return false;
    }
    return true;
}

} // namespace dharma
