#pragma once
// Planner: DAG plans for multi-step requests
//
// The orchestrator asks the answer model for a plan in the JSON shape
// described by PlanParser::schema_prompt(), parses it here, and hands it
// to a PlanExecutor. Parsing enforces unique step ids, known dependencies
// and an acyclic graph.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dharma {

using json = nlohmann::json;

enum class StepStatus : uint8_t {
    Pending = 0,
    Running = 1,
    Completed = 2,
    Failed = 3,
    Skipped = 4,
};

enum class StepActionKind : uint8_t {
    ToolCall = 0,
    Prompt = 1,
    Checkpoint = 2,
};

struct StepAction {
    StepActionKind kind = StepActionKind::Checkpoint;
    std::string tool_name;      // ToolCall
    json args = json::object(); // ToolCall
    std::string text;           // Prompt
    std::string label;          // Checkpoint
};

struct PlanStep {
    std::string id;
    std::string description;
    StepAction action;
    std::vector<std::string> depends_on;
    StepStatus status = StepStatus::Pending;
    std::optional<std::string> output;
    std::optional<std::string> error;
};

struct Plan {
    std::string id;
    std::string description;
    std::vector<PlanStep> steps;
};

struct ExecutionReport {
    bool success = false;
    std::vector<std::string> completed_steps;
    std::vector<std::string> failed_steps;
    std::vector<std::string> skipped_steps;
};

// Runs a parsed plan, updating step status/output/error in place.
// Throws when execution cannot proceed at all.
class PlanExecutor {
public:
    virtual ~PlanExecutor() = default;
    virtual ExecutionReport execute(Plan& plan) = 0;
};

class PlanParser {
public:
    static const char* schema_prompt();

    // Plan JSON from model output: ```json fence, bare ``` fence, or the
    // outermost {...} span
    static std::optional<std::string> extract_json(const std::string& text);

    static bool parse(const std::string& json_text, Plan& out, std::string& error);
};

// Output of the last completed step, if any
std::optional<std::string> final_step_output(const Plan& plan);

// "Plan execution incomplete (completed=N, failed=N, skipped=N)." plus one
// "Failed step <id>: <error>" line per failed step
std::string render_plan_failure(const Plan& plan, const ExecutionReport& report);

// Heuristic for multi-step requests: numbered markers, bullet lines, or
// sequencing words
bool should_attempt_planner(const std::string& user_message);

std::string build_planner_request(const std::string& task, const std::vector<std::string>& tool_names);

} // namespace dharma
