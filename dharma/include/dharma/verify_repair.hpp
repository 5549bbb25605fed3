#pragma once
// Verify/Repair: bounded retry of a failed turn, then auditable escalation
//
// Each failed attempt is classified by analyze_verify_failure(). The
// controller retries transient failures until a cap is hit, then records
// an escalation audit event and throws EscalationError. Policy denials and
// budget exhaustion bypass the loop entirely.
//
// Attempts run strictly one after another. There is no backoff here; the
// caller's providers own their own rate limiting.

#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "memory.hpp"
#include "scrub.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace dharma {

using json = nlohmann::json;

enum class FailureClass : uint8_t {
    TransientFailure = 0,
    PolicyLimit = 1,
    QuotaExhausted = 2,
    NonRetryableProviderError = 3,
};

const char* failure_class_name(FailureClass c);

struct VerifyFailureAnalysis {
    FailureClass failure_class = FailureClass::TransientFailure;
    bool retryable = true;
};

// Classify an attempt failure from its (untrusted) error text
VerifyFailureAnalysis analyze_verify_failure(const std::string& message);

struct VerifyRepairCaps {
    uint32_t max_attempts = 3;
    uint32_t max_repair_depth = 2;

    static VerifyRepairCaps from_config(const AutonomyConfig& autonomy) {
        return VerifyRepairCaps{autonomy.verify_repair_max_attempts,
                                autonomy.verify_repair_max_repair_depth};
    }
};

enum class EscalationReason : uint8_t {
    MaxAttemptsReached = 0,
    MaxRepairDepthReached = 1,
    NonRetryableFailure = 2,
};

const char* escalation_reason_name(EscalationReason r);

// Checked in order: attempts, repair depth, retryability
std::optional<EscalationReason> decide_escalation(uint32_t attempts, uint32_t repair_depth,
                                                  const VerifyRepairCaps& caps,
                                                  const VerifyFailureAnalysis& analysis);

struct VerifyRepairEscalation {
    EscalationReason reason = EscalationReason::MaxAttemptsReached;
    uint32_t attempts = 0;
    uint32_t repair_depth = 0;
    uint32_t max_attempts = 0;
    uint32_t max_repair_depth = 0;
    FailureClass failure_class = FailureClass::TransientFailure;
    std::string last_error;                 // Already sanitized

    // "verify/repair escalated: reason=... attempts=... ..."
    std::string contract_message() const;
    json to_json() const;
};

class EscalationError : public TurnError {
public:
    explicit EscalationError(VerifyRepairEscalation escalation)
        : TurnError(TurnErrorKind::Escalated, escalation.contract_message()),
          escalation_(std::move(escalation)) {}

    const VerifyRepairEscalation& escalation() const { return escalation_; }

private:
    VerifyRepairEscalation escalation_;
};

// Audit record for an escalation, shaped for the verify-repair write gate
MemoryEvent make_escalation_event(const VerifyRepairEscalation& escalation,
                                  const std::string& entity_id);

// Best effort: gate and append the audit record; failures are only logged
void record_escalation(Memory* memory, const std::string& entity_id,
                       const VerifyRepairEscalation& escalation);

class VerifyRepairController {
public:
    VerifyRepairController(VerifyRepairCaps caps, Memory* memory, std::string entity_id)
        : caps_(caps), memory_(memory), entity_id_(std::move(entity_id)) {}

    // Runs attempt() until it returns, a fatal TurnError escapes, or an
    // escalation is thrown. attempt() is invoked with no arguments.
    template<typename Fn>
    auto run(Fn&& attempt) -> decltype(attempt()) {
        attempts_ = 0;
        repair_depth_ = 0;
        while (true) {
            ++attempts_;
            std::string error;
            try {
                return attempt();
            } catch (const TurnError& e) {
                if (e.fatal() || e.kind() == TurnErrorKind::Escalated) throw;
                error = e.what();
            } catch (const std::exception& e) {
                error = e.what();
            }
            on_failure(error);
        }
    }

    uint32_t attempts() const { return attempts_; }
    uint32_t repair_depth() const { return repair_depth_; }
    const VerifyRepairCaps& caps() const { return caps_; }

private:
    // Retry (returns) or escalate (throws EscalationError)
    void on_failure(const std::string& error);

    VerifyRepairCaps caps_;
    Memory* memory_;
    std::string entity_id_;
    uint32_t attempts_ = 0;
    uint32_t repair_depth_ = 0;
};

} // namespace dharma
