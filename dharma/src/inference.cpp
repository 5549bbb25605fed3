#include <dharma/inference.hpp>
#include <dharma/write_policy.hpp>
#include <sstream>
#include <stdexcept>

namespace dharma {

namespace {

const std::string INFERRED_PREFIX = "INFERRED_CLAIM ";
const std::string CONTRADICTION_PREFIX = "CONTRADICTION_EVENT ";

// "<slot> => <value>" with both sides non-empty
bool split_claim(const std::string& payload, std::string& slot, std::string& value) {
    size_t arrow = payload.find("=>");
    if (arrow == std::string::npos) return false;
    slot = trim(payload.substr(0, arrow));
    value = trim(payload.substr(arrow + 2));
    return !slot.empty() && !value.empty();
}

MemoryEvent inference_event(const std::string& entity_id, const std::string& slot,
                            const std::string& value, bool contradiction) {
    MemoryEvent event;
    event.entity_id = entity_id;
    event.slot_key = slot;
    event.content = value;
    event.privacy = PrivacyLevel::Private;
    event.occurred_at = format_rfc3339(now());
    if (contradiction) {
        event.event_type = MemoryEventType::ContradictionMarked;
        event.source = MemorySource::System;
        event.layer = MemoryLayer::Episodic;
        event.confidence = 0.85;
        event.importance = 0.8;
        event.with_source_ref(SourceKind::Conversation, "inference.post_turn.contradiction_event");
    } else {
        event.event_type = MemoryEventType::InferredClaim;
        event.source = MemorySource::Inferred;
        event.layer = MemoryLayer::Semantic;
        event.confidence = 0.7;
        event.importance = 0.5;
        event.with_source_ref(SourceKind::Conversation, "inference.post_turn.inferred_claim");
    }
    return event;
}

} // namespace

std::vector<MemoryEvent> build_inference_events(const std::string& entity_id,
                                                const std::string& response) {
    std::vector<MemoryEvent> events;
    std::istringstream lines(response);
    std::string line;
    while (std::getline(lines, line)) {
        std::string t = trim(line);
        std::string slot, value;
        if (starts_with(t, INFERRED_PREFIX)) {
            if (split_claim(t.substr(INFERRED_PREFIX.size()), slot, value)) {
                events.push_back(inference_event(entity_id, slot, value, false));
            }
        } else if (starts_with(t, CONTRADICTION_PREFIX)) {
            if (split_claim(t.substr(CONTRADICTION_PREFIX.size()), slot, value)) {
                events.push_back(inference_event(entity_id, slot, value, true));
            }
        }
    }
    return events;
}

size_t run_post_turn_inference(Memory& memory, const std::string& entity_id,
                               const std::string& response, const SignalCallback& on_signal) {
    auto events = build_inference_events(entity_id, response);
    if (events.empty()) return 0;

    if (on_signal) {
        for (const auto& e : events) {
            if (e.event_type == MemoryEventType::ContradictionMarked) {
                on_signal(TurnSignal::ContradictionDetected);
            }
        }
    }

    for (const auto& e : events) {
        std::string error;
        if (!append_gated(memory, e, check_inference_write_policy, error)) {
            throw std::runtime_error("inference write rejected: " + error);
        }
    }
    return events.size();
}

} // namespace dharma
