#pragma once
// Tool Loop: iterative model/tool execution for one answer
//
// The loop itself (tool registry, approvals, hooks) lives outside the
// control plane. The orchestrator hands it the enriched prompt and the
// clamped temperature and interprets how it stopped.

#include "provider.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dharma {

enum class LoopStopKind : uint8_t {
    Completed = 0,
    MaxIterations = 1,
    RateLimited = 2,
    ApprovalDenied = 3,
    HookBlocked = 4,
    Error = 5,
};

inline const char* loop_stop_kind_name(LoopStopKind kind) {
    switch (kind) {
        case LoopStopKind::Completed:      return "completed";
        case LoopStopKind::MaxIterations:  return "max_iterations";
        case LoopStopKind::RateLimited:    return "rate_limited";
        case LoopStopKind::ApprovalDenied: return "approval_denied";
        case LoopStopKind::HookBlocked:    return "hook_blocked";
        case LoopStopKind::Error:          return "error";
    }
    return "error";
}

struct LoopStopReason {
    LoopStopKind kind = LoopStopKind::Completed;
    std::string detail;                 // HookBlocked / Error text

    static LoopStopReason completed() { return {LoopStopKind::Completed, ""}; }
    static LoopStopReason max_iterations() { return {LoopStopKind::MaxIterations, ""}; }
    static LoopStopReason rate_limited() { return {LoopStopKind::RateLimited, ""}; }
    static LoopStopReason approval_denied() { return {LoopStopKind::ApprovalDenied, ""}; }
    static LoopStopReason hook_blocked(std::string why) { return {LoopStopKind::HookBlocked, std::move(why)}; }
    static LoopStopReason error(std::string why) { return {LoopStopKind::Error, std::move(why)}; }
};

struct ToolLoopResult {
    std::string final_text;
    std::vector<std::string> tool_calls;    // Tool names in call order
    uint32_t iterations = 0;
    std::optional<uint64_t> tokens_used;
    LoopStopReason stop_reason;
};

struct ToolLoopRequest {
    Provider* provider = nullptr;           // Answer provider
    std::optional<std::string> system_prompt;
    std::string user_message;               // Enriched prompt
    std::string model;
    double temperature = 0.0;               // Already clamped
    std::string entity_id;
    uint32_t max_iterations = 10;
};

class ToolLoop {
public:
    virtual ~ToolLoop() = default;

    // Names of tools the loop can call for this entity (shown to the planner)
    virtual std::vector<std::string> tool_names(const std::string& entity_id) = 0;

    // Throws on infrastructure failure; soft stops are reported in stop_reason
    virtual ToolLoopResult run(const ToolLoopRequest& request) = 0;
};

} // namespace dharma
