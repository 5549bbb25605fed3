#include <dharma/reflect.hpp>
#include <dharma/log.hpp>
#include <dharma/scrub.hpp>
#include <dharma/writeback_guard.hpp>
#include <dharma/write_policy.hpp>
#include <stdexcept>

namespace dharma {

namespace {

const char* REFLECT_SYSTEM_PROMPT = R"(You are a deterministic reflection/writeback stage.
Output must be a single strict JSON object, with no markdown and no extra text.

Required top-level shape:
{
  "state_header": {
    "identity_principles_hash": string,
    "safety_posture": string,
    "current_objective": string,
    "open_loops": string[],
    "next_actions": string[],
    "commitments": string[],
    "recent_context_summary": string,
    "last_updated_at": string (RFC3339)
  },
  "memory_append": string[]
}

Do not include unknown keys.
Do not change immutable fields.
If uncertain, keep mutable values close to current state.)";

const char* MEMORY_APPEND_PROVENANCE = "persona.reflect.memory_append";

json parse_reflect_payload(const std::string& raw) {
    json payload;
    try {
        payload = json::parse(trim(raw));
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("parse reflect payload JSON: ") + e.what());
    }
    if (!payload.is_object()) {
        throw std::runtime_error("reflect output must be a JSON object");
    }
    return payload;
}

MemoryEvent memory_append_event(const std::string& person_id, size_t idx,
                                const std::string& entry, const std::string& occurred_at) {
    MemoryEvent event;
    event.entity_id = person_entity(person_id);
    event.slot_key = SLOT_PERSONA_WRITEBACK_PREFIX + std::to_string(idx);
    event.event_type = MemoryEventType::SummaryCompacted;
    event.content = entry;
    event.source = MemorySource::System;
    event.privacy = PrivacyLevel::Private;
    event.layer = MemoryLayer::Episodic;
    event.confidence = 0.9;
    event.importance = 0.8;
    event.source_kind = SourceKind::Manual;
    event.source_ref = "persona-reflect-memory-append:" + std::to_string(idx);
    event.provenance = MemoryProvenance{MemorySource::System, MEMORY_APPEND_PROVENANCE};
    event.occurred_at = occurred_at;
    return event;
}

ReflectReport reflect_once(const ReflectRequest& req) {
    auto canonical = req.persistence->load_canonical();
    std::string message = build_reflect_message(canonical, req.user_message, req.answer);

    std::string raw = req.provider->chat_with_system(std::string(REFLECT_SYSTEM_PROMPT),
                                                     message, req.model, 0.0);
    json payload = parse_reflect_payload(raw);

    if (!canonical) {
        log_warn("reflect", "persona reflect produced payload but canonical state header is missing");
        return ReflectReport::skipped("canonical state header missing");
    }

    auto verdict = validate_writeback_payload(payload, canonical->immutable_header());
    if (!verdict.accepted()) {
        log_warn("reflect", LogLine("persona writeback rejected by guard")
                                .kv("reason", verdict.reason()).str());
        return ReflectReport{ReflectStatus::Rejected, verdict.reason(), 0};
    }
    const WritebackPayload& accepted = verdict.payload();

    StateHeader candidate = StateHeader::from_writeback(canonical->immutable_header(),
                                                        accepted.state_header);
    std::string error;
    if (!StateHeader::validate_writeback_candidate(*canonical, candidate, *req.persona, error)) {
        throw std::runtime_error("validate persona writeback candidate: " + error);
    }
    req.persistence->persist_and_sync(candidate);

    const std::string person_id = req.persona->person_id;
    auto gate = [&person_id](const MemoryEvent& e, std::string& err) {
        return check_persona_write_policy(e, person_id, err);
    };
    size_t appended = 0;
    for (size_t i = 0; i < accepted.memory_append.size(); ++i) {
        MemoryEvent event = memory_append_event(person_id, i, accepted.memory_append[i],
                                                candidate.last_updated_at);
        if (!append_gated(*req.memory, event, gate, error)) {
            throw std::runtime_error("enforce persona writeback policy: " + error);
        }
        ++appended;
    }

    log_debug("reflect", LogLine("persona state persisted").kv("memory_append", appended).str());
    return ReflectReport{ReflectStatus::Persisted, "", appended};
}

} // namespace

const char* reflect_system_prompt() {
    return REFLECT_SYSTEM_PROMPT;
}

std::string build_reflect_message(const std::optional<StateHeader>& canonical,
                                  const std::string& user_message,
                                  const std::string& answer) {
    std::string canonical_json = canonical ? canonical->to_json().dump(2) : "null";
    return "Current canonical state header (JSON):\n" + canonical_json +
           "\n\nLatest user message:\n" + user_message +
           "\n\nLatest assistant answer:\n" + answer +
           "\n\nReturn only the strict JSON payload.";
}

ReflectReport run_reflect_writeback(const ReflectRequest& request) {
    if (!request.provider || !request.persistence || !request.memory || !request.persona) {
        return ReflectReport::skipped("reflect collaborators not configured");
    }
    try {
        return reflect_once(request);
    } catch (const std::exception& e) {
        std::string detail = sanitize_error(e.what());
        log_warn("reflect", LogLine("persona reflect/writeback failed; answer path preserved")
                                .kv("error", detail).str());
        return ReflectReport{ReflectStatus::Failed, detail, 0};
    }
}

} // namespace dharma
