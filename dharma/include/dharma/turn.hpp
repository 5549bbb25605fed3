#pragma once
// Turn Orchestrator: one user turn, end to end
//
// Per attempt:
//   1. fresh call accounting, IntentCreated
//   2. tenant write scope (fatal on denial)
//   3. autosave user message (best effort)
//   4. context + user message
//   5. intent rate/cost policy (fatal on denial)
//   6. answer-call budget
//   7. temperature clamp
//   8. planner path for multi-step requests, else the tool loop
//   9. reflect/writeback when persona reflection is on
//  10. autosave answer, post-turn inference, consolidation (best effort)
//
// run_turn() wraps the attempt in a VerifyRepairController. Policy denials
// and budget overruns escape immediately; anything else is retried up to
// the configured caps and then escalated.

#include "call_budget.hpp"
#include "config.hpp"
#include "context.hpp"
#include "memory.hpp"
#include "observer.hpp"
#include "planner.hpp"
#include "provider.hpp"
#include "reflect.hpp"
#include "security.hpp"
#include "state_persistence.hpp"
#include "tool_loop.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace dharma {

struct TurnParams {
    std::string entity_id = "default";
    std::string user_message;
    std::optional<std::string> system_prompt;
    std::string model;
    double temperature = 0.7;               // Requested, clamped per turn
};

struct TurnOutcome {
    std::string response;
    std::optional<uint64_t> tokens_used;
    uint32_t iterations = 0;                // Tool loop iterations (0 on planner path)
    bool planner_used = false;
    TurnCallAccounting accounting;
    ReflectReport reflect;
    uint32_t attempts = 1;                  // Verify/repair attempts, set by run_turn
};

// Collaborators. Raw pointers are non-owning and must outlive the
// orchestrator; shared handles may be shared with other turns.
struct TurnDependencies {
    std::shared_ptr<SecurityPolicy> security;       // Required
    std::shared_ptr<Memory> memory;                 // Required
    Provider* answer_provider = nullptr;            // Required
    Provider* reflect_provider = nullptr;           // Falls back to answer_provider
    ToolLoop* tool_loop = nullptr;                  // Required
    PlanExecutor* plan_executor = nullptr;          // No planner path when null
    ContextBuilder* context_builder = nullptr;      // No context when null
    StatePersistence* persistence = nullptr;        // Reflect skips when null
    std::shared_ptr<Consolidator> consolidator;     // No consolidation when null
    SignalCallback on_signal;
};

class TurnOrchestrator {
public:
    // Throws std::invalid_argument when a required collaborator is missing
    TurnOrchestrator(Config config, TurnDependencies deps);

    TurnOrchestrator(const TurnOrchestrator&) = delete;
    TurnOrchestrator& operator=(const TurnOrchestrator&) = delete;

    // Full turn with verify/repair. Throws TurnError (PolicyDenied,
    // BudgetExhausted) or EscalationError.
    TurnOutcome run_turn(const TurnParams& params);

    // A single attempt, no retries
    TurnOutcome run_attempt(const TurnParams& params);

    // Run the consolidator on a detached thread. Fire and forget: there is
    // no handle, failures are only logged.
    void dispatch_consolidation(ConsolidationInput input);

    const Config& config() const { return config_; }

private:
    void signal(TurnSignal s) const;

    void enforce_write_scope(const std::string& entity_id) const;
    void enforce_intent_policy(const std::string& entity_id);
    void autosave(const MemoryEvent& event, const char* what);
    std::string build_enriched_message(const TurnParams& params);

    void answer(const TurnParams& params, const std::string& enriched,
                double temperature, TurnOutcome& outcome);
    std::optional<std::string> try_planner(const TurnParams& params, const std::string& enriched,
                                           double temperature);

    void reflect_if_enabled(const TurnParams& params, TurnOutcome& outcome);
    void save_response_and_consolidate(const TurnParams& params, const std::string& response);

    Config config_;
    TurnDependencies deps_;
    TenantPolicyContext tenant_;
};

} // namespace dharma
