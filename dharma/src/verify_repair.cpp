#include <dharma/verify_repair.hpp>
#include <dharma/write_policy.hpp>
#include <sstream>

namespace dharma {

const char* failure_class_name(FailureClass c) {
    switch (c) {
        case FailureClass::TransientFailure:          return "transient_failure";
        case FailureClass::PolicyLimit:               return "policy_limit";
        case FailureClass::QuotaExhausted:            return "quota_exhausted";
        case FailureClass::NonRetryableProviderError: return "non_retryable_provider_error";
    }
    return "transient_failure";
}

const char* escalation_reason_name(EscalationReason r) {
    switch (r) {
        case EscalationReason::MaxAttemptsReached:    return "max_attempts_reached";
        case EscalationReason::MaxRepairDepthReached: return "max_repair_depth_reached";
        case EscalationReason::NonRetryableFailure:   return "non_retryable_failure";
    }
    return "max_attempts_reached";
}

namespace {

// 4xx client errors are permanent, except request timeout and rate limiting
bool has_non_retryable_status(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] < '0' || text[i] > '9') {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size() && text[i] >= '0' && text[i] <= '9') ++i;
        if (i - start > 5) continue;
        unsigned long code = std::stoul(text.substr(start, i - start));
        if (code > 65535) continue;
        if (code >= 400 && code < 500 && code != 408 && code != 429) return true;
    }
    return false;
}

} // namespace

VerifyFailureAnalysis analyze_verify_failure(const std::string& message) {
    const std::string lower = to_lower(message);

    if (contains(lower, "action limit exceeded") || contains(lower, "daily cost limit exceeded")) {
        return {FailureClass::PolicyLimit, false};
    }
    if (contains(lower, "insufficient_quota") || contains(lower, "exceeded your current quota") ||
        (contains(lower, "429") && contains(lower, "billing"))) {
        return {FailureClass::QuotaExhausted, false};
    }
    if (has_non_retryable_status(lower)) {
        return {FailureClass::NonRetryableProviderError, false};
    }
    return {FailureClass::TransientFailure, true};
}

std::optional<EscalationReason> decide_escalation(uint32_t attempts, uint32_t repair_depth,
                                                  const VerifyRepairCaps& caps,
                                                  const VerifyFailureAnalysis& analysis) {
    if (attempts >= caps.max_attempts) return EscalationReason::MaxAttemptsReached;
    if (repair_depth >= caps.max_repair_depth) return EscalationReason::MaxRepairDepthReached;
    if (!analysis.retryable) return EscalationReason::NonRetryableFailure;
    return std::nullopt;
}

std::string VerifyRepairEscalation::contract_message() const {
    std::ostringstream out;
    out << "verify/repair escalated:"
        << " reason=" << escalation_reason_name(reason)
        << " attempts=" << attempts
        << " repair_depth=" << repair_depth
        << " max_attempts=" << max_attempts
        << " max_repair_depth=" << max_repair_depth
        << " failure_class=" << failure_class_name(failure_class)
        << " last_error=" << last_error;
    return out.str();
}

json VerifyRepairEscalation::to_json() const {
    return {
        {"reason", escalation_reason_name(reason)},
        {"attempts", attempts},
        {"repair_depth", repair_depth},
        {"max_attempts", max_attempts},
        {"max_repair_depth", max_repair_depth},
        {"failure_class", failure_class_name(failure_class)},
        {"last_error", last_error}
    };
}

MemoryEvent make_escalation_event(const VerifyRepairEscalation& escalation,
                                  const std::string& entity_id) {
    MemoryEvent event;
    event.entity_id = entity_id;
    event.slot_key = SLOT_VERIFY_REPAIR_ESCALATION;
    event.event_type = MemoryEventType::SummaryCompacted;
    event.content = escalation.to_json().dump();
    event.source = MemorySource::System;
    event.privacy = PrivacyLevel::Private;
    event.layer = MemoryLayer::Episodic;
    event.confidence = 1.0;
    event.importance = 0.9;
    event.occurred_at = format_rfc3339(now());
    event.with_source_ref(SourceKind::Manual, "verify-repair.escalation");
    return event;
}

void record_escalation(Memory* memory, const std::string& entity_id,
                       const VerifyRepairEscalation& escalation) {
    if (!memory) return;
    MemoryEvent event = make_escalation_event(escalation, entity_id);
    std::string error;
    try {
        if (!append_gated(*memory, event, check_verify_repair_write_policy, error)) {
            log_warn("verify_repair", "verify/repair escalation event rejected by write policy: " + error);
        }
    } catch (const std::exception& e) {
        log_warn("verify_repair", LogLine("verify/repair escalation event write failed")
            .kv("error", sanitize_error(e.what())).str());
    }
}

void VerifyRepairController::on_failure(const std::string& error) {
    const VerifyFailureAnalysis analysis = analyze_verify_failure(error);
    auto reason = decide_escalation(attempts_, repair_depth_, caps_, analysis);

    if (!reason) {
        ++repair_depth_;
        log_warn("verify_repair", LogLine("verify/repair retrying turn")
            .kv("attempt", attempts_)
            .kv("repair_depth", repair_depth_)
            .kv("max_attempts", caps_.max_attempts)
            .kv("max_repair_depth", caps_.max_repair_depth)
            .kv("failure_class", failure_class_name(analysis.failure_class))
            .kv("error", sanitize_error(error))
            .str());
        return;
    }

    VerifyRepairEscalation escalation;
    escalation.reason = *reason;
    escalation.attempts = attempts_;
    escalation.repair_depth = repair_depth_;
    escalation.max_attempts = caps_.max_attempts;
    escalation.max_repair_depth = caps_.max_repair_depth;
    escalation.failure_class = analysis.failure_class;
    escalation.last_error = sanitize_error(error);

    log_error("verify_repair", escalation.contract_message());
    record_escalation(memory_, entity_id_, escalation);
    throw EscalationError(std::move(escalation));
}

} // namespace dharma
