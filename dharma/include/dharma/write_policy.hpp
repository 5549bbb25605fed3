#pragma once
// Write Policy: fail-closed gates in front of Memory::append_event
//
// Each writer in the control plane has its own gate. A gate checks the
// record's source, privacy, kind, slot and type, then the common metadata
// (non-empty source_ref, provenance matching the source). Anything not
// explicitly allowed is refused.

#include "memory.hpp"
#include <functional>
#include <string>

namespace dharma {

constexpr const char* SLOT_USER_MESSAGE = "conversation.user_msg";
constexpr const char* SLOT_ASSISTANT_RESPONSE = "conversation.assistant_resp";
constexpr const char* SLOT_VERIFY_REPAIR_ESCALATION = "autonomy.verify_repair.escalation";
constexpr const char* SLOT_PERSONA_WRITEBACK_PREFIX = "persona.writeback.";

// Gate signature: true when allowed, otherwise error names the violated rule
using WritePolicy = std::function<bool(const MemoryEvent&, std::string&)>;

inline bool check_common_write_metadata(const MemoryEvent& event, std::string& error) {
    if (!event.source_ref) {
        error = "write policy requires source_ref";
        return false;
    }
    if (trim(*event.source_ref).empty()) {
        error = "write policy source_ref must not be empty";
        return false;
    }
    if (!event.provenance) {
        error = "write policy requires provenance";
        return false;
    }
    if (event.provenance->source_class != event.source) {
        error = "write policy requires provenance.source_class to match source";
        return false;
    }
    if (trim(event.provenance->reference).empty()) {
        error = "write policy requires provenance.reference";
        return false;
    }
    return true;
}

inline bool check_agent_autosave_write_policy(const MemoryEvent& event, std::string& error) {
    if (event.privacy != PrivacyLevel::Private) {
        error = "agent autosave policy requires privacy_level=private";
        return false;
    }
    if (event.source_kind != SourceKind::Conversation) {
        error = "agent autosave policy requires source_kind=conversation";
        return false;
    }
    if (event.event_type != MemoryEventType::FactAdded) {
        error = "agent autosave policy requires event_type=fact_added";
        return false;
    }
    if (event.slot_key != SLOT_USER_MESSAGE && event.slot_key != SLOT_ASSISTANT_RESPONSE) {
        error = "agent autosave policy rejected slot_key";
        return false;
    }
    if (event.source != MemorySource::ExplicitUser && event.source != MemorySource::System) {
        error = "agent autosave policy rejected source";
        return false;
    }
    return check_common_write_metadata(event, error);
}

inline bool check_verify_repair_write_policy(const MemoryEvent& event, std::string& error) {
    if (event.source != MemorySource::System) {
        error = "verify-repair write policy requires source=system";
        return false;
    }
    if (event.privacy != PrivacyLevel::Private) {
        error = "verify-repair write policy requires privacy_level=private";
        return false;
    }
    if (event.source_kind != SourceKind::Manual) {
        error = "verify-repair write policy requires source_kind=manual";
        return false;
    }
    if (event.slot_key != SLOT_VERIFY_REPAIR_ESCALATION) {
        error = "verify-repair write policy rejected slot_key";
        return false;
    }
    if (event.event_type != MemoryEventType::SummaryCompacted) {
        error = "verify-repair write policy requires event_type=summary_compacted";
        return false;
    }
    return check_common_write_metadata(event, error);
}

inline bool check_inference_write_policy(const MemoryEvent& event, std::string& error) {
    if (event.privacy != PrivacyLevel::Private) {
        error = "inference write policy requires privacy_level=private";
        return false;
    }
    if (event.source_kind != SourceKind::Conversation) {
        error = "inference write policy requires source_kind=conversation";
        return false;
    }
    if (event.source != MemorySource::Inferred && event.source != MemorySource::System) {
        error = "inference write policy rejected source";
        return false;
    }
    if (event.event_type != MemoryEventType::InferredClaim &&
        event.event_type != MemoryEventType::ContradictionMarked) {
        error = "inference write policy rejected event_type";
        return false;
    }
    return check_common_write_metadata(event, error);
}

inline std::string person_entity(const std::string& person_id) {
    return "person:" + person_id;
}

inline std::string persona_state_slot_prefix(const std::string& person_id) {
    return "persona/" + person_id + "/state_header/";
}

inline bool check_persona_write_policy(const MemoryEvent& event, const std::string& person_id,
                                       std::string& error) {
    if (event.source != MemorySource::System) {
        error = "persona writeback policy requires source=system";
        return false;
    }
    if (event.privacy != PrivacyLevel::Private) {
        error = "persona writeback policy requires privacy_level=private";
        return false;
    }
    if (event.source_kind != SourceKind::Manual) {
        error = "persona writeback policy requires source_kind=manual";
        return false;
    }
    if (!check_common_write_metadata(event, error)) return false;
    if (event.entity_id != person_entity(person_id)) {
        error = "persona writeback policy entity_id mismatch";
        return false;
    }

    if (starts_with(event.slot_key, SLOT_PERSONA_WRITEBACK_PREFIX)) {
        if (event.event_type != MemoryEventType::SummaryCompacted) {
            error = "persona writeback entries must use event_type=summary_compacted";
            return false;
        }
        return true;
    }
    if (starts_with(event.slot_key, persona_state_slot_prefix(person_id))) {
        if (event.event_type != MemoryEventType::FactUpdated) {
            error = "persona canonical state writes must use event_type=fact_updated";
            return false;
        }
        return true;
    }
    error = "persona writeback policy rejected slot_key";
    return false;
}

// Gate then append. Policy refusal is reported through error; storage
// failures propagate as exceptions from the backend.
inline bool append_gated(Memory& memory, const MemoryEvent& event, const WritePolicy& policy,
                         std::string& error) {
    if (!policy(event, error)) return false;
    memory.append_event(event);
    return true;
}

} // namespace dharma
