#include <dharma/planner.hpp>
#include <dharma/types.hpp>
#include <map>
#include <set>
#include <sstream>

namespace dharma {

namespace {

bool read_plan_string(const json& j, const char* key, std::string& out, std::string& error) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        error = std::string("plan field '") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool parse_action(const json& j, StepAction& out, std::string& error) {
    if (!j.is_object()) {
        error = "step action must be an object";
        return false;
    }
    std::string kind;
    if (!read_plan_string(j, "kind", kind, error)) return false;

    if (kind == "tool_call") {
        out.kind = StepActionKind::ToolCall;
        if (!read_plan_string(j, "tool_name", out.tool_name, error)) return false;
        auto args = j.find("args");
        out.args = (args != j.end() && !args->is_null()) ? *args : json::object();
        return true;
    }
    if (kind == "prompt") {
        out.kind = StepActionKind::Prompt;
        return read_plan_string(j, "text", out.text, error);
    }
    if (kind == "checkpoint") {
        out.kind = StepActionKind::Checkpoint;
        return read_plan_string(j, "label", out.label, error);
    }
    error = "unknown step action kind: " + kind;
    return false;
}

bool parse_step(const json& j, PlanStep& out, std::string& error) {
    if (!j.is_object()) {
        error = "plan step must be an object";
        return false;
    }
    if (!read_plan_string(j, "id", out.id, error)) return false;
    if (!read_plan_string(j, "description", out.description, error)) return false;

    auto action = j.find("action");
    if (action == j.end()) {
        error = "step " + out.id + " is missing an action";
        return false;
    }
    if (!parse_action(*action, out.action, error)) return false;

    auto deps = j.find("depends_on");
    if (deps != j.end() && !deps->is_null()) {
        if (!deps->is_array()) {
            error = "step " + out.id + " depends_on must be an array";
            return false;
        }
        for (const auto& d : *deps) {
            if (!d.is_string()) {
                error = "step " + out.id + " depends_on entries must be strings";
                return false;
            }
            out.depends_on.push_back(d.get<std::string>());
        }
    }
    return true;
}

// Kahn's algorithm; any step left unvisited sits on a cycle
bool check_acyclic(const Plan& plan, std::string& error) {
    std::map<std::string, size_t> indegree;
    std::map<std::string, std::vector<std::string>> dependents;
    for (const auto& step : plan.steps) {
        indegree[step.id] += 0;
        for (const auto& dep : step.depends_on) {
            indegree[step.id]++;
            dependents[dep].push_back(step.id);
        }
    }

    std::vector<std::string> ready;
    for (const auto& [id, deg] : indegree) {
        if (deg == 0) ready.push_back(id);
    }

    size_t visited = 0;
    while (!ready.empty()) {
        std::string id = ready.back();
        ready.pop_back();
        ++visited;
        for (const auto& next : dependents[id]) {
            if (--indegree[next] == 0) ready.push_back(next);
        }
    }

    if (visited != plan.steps.size()) {
        error = "plan contains a dependency cycle";
        return false;
    }
    return true;
}

} // namespace

const char* PlanParser::schema_prompt() {
    return "When creating a plan, respond with a JSON object in this exact format:\n"
           "{\n"
           "  \"id\": \"<unique-id>\",\n"
           "  \"description\": \"<plan description>\",\n"
           "  \"steps\": [\n"
           "    {\n"
           "      \"id\": \"<step-id>\",\n"
           "      \"description\": \"<what this step does>\",\n"
           "      \"action\": <action>,\n"
           "      \"depends_on\": [\"<step-ids this depends on>\"]\n"
           "    }\n"
           "  ]\n"
           "}\n"
           "\n"
           "Action types:\n"
           "- Tool call: { \"kind\": \"tool_call\", \"tool_name\": \"<name>\", \"args\": { ... } }\n"
           "- Prompt: { \"kind\": \"prompt\", \"text\": \"<instruction>\" }\n"
           "- Checkpoint: { \"kind\": \"checkpoint\", \"label\": \"<label>\" }\n"
           "\n"
           "Steps with no dependencies use \"depends_on\": [].\n"
           "Wrap the JSON in a ```json code fence.";
}

std::optional<std::string> PlanParser::extract_json(const std::string& text) {
    const std::string json_fence = "```json";
    size_t start = text.find(json_fence);
    if (start != std::string::npos) {
        size_t body = start + json_fence.size();
        size_t end = text.find("```", body);
        if (end != std::string::npos) {
            std::string inner = trim(text.substr(body, end - body));
            if (!inner.empty()) return inner;
        }
    }

    const std::string bare_fence = "```\n{";
    start = text.find(bare_fence);
    if (start != std::string::npos) {
        size_t body = start + 4;
        size_t end = text.find("```", body);
        if (end != std::string::npos) {
            std::string inner = trim(text.substr(body, end - body));
            if (!inner.empty()) return inner;
        }
    }

    size_t open = text.find('{');
    size_t close = text.rfind('}');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        return text.substr(open, close - open + 1);
    }
    return std::nullopt;
}

bool PlanParser::parse(const std::string& json_text, Plan& out, std::string& error) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        error = std::string("invalid plan JSON: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        error = "plan must be a JSON object";
        return false;
    }

    Plan plan;
    if (!read_plan_string(j, "id", plan.id, error)) return false;
    if (!read_plan_string(j, "description", plan.description, error)) return false;

    auto steps = j.find("steps");
    if (steps == j.end() || !steps->is_array()) {
        error = "plan field 'steps' must be an array";
        return false;
    }
    if (steps->empty()) {
        error = "plan must have at least one step";
        return false;
    }

    std::set<std::string> ids;
    for (const auto& s : *steps) {
        PlanStep step;
        if (!parse_step(s, step, error)) return false;
        if (step.id.empty()) {
            error = "plan step ids must not be empty";
            return false;
        }
        if (!ids.insert(step.id).second) {
            error = "duplicate plan step id: " + step.id;
            return false;
        }
        plan.steps.push_back(std::move(step));
    }

    for (const auto& step : plan.steps) {
        for (const auto& dep : step.depends_on) {
            if (!ids.count(dep)) {
                error = "step " + step.id + " depends on unknown step: " + dep;
                return false;
            }
        }
    }

    if (!check_acyclic(plan, error)) return false;

    out = std::move(plan);
    return true;
}

std::optional<std::string> final_step_output(const Plan& plan) {
    for (auto it = plan.steps.rbegin(); it != plan.steps.rend(); ++it) {
        if (it->status == StepStatus::Completed && it->output) return it->output;
    }
    return std::nullopt;
}

std::string render_plan_failure(const Plan& plan, const ExecutionReport& report) {
    std::ostringstream ss;
    ss << "Plan execution incomplete (completed=" << report.completed_steps.size()
       << ", failed=" << report.failed_steps.size()
       << ", skipped=" << report.skipped_steps.size() << ").";
    for (const auto& id : report.failed_steps) {
        std::string why = "unknown failure";
        for (const auto& step : plan.steps) {
            if (step.id == id && step.error) {
                why = *step.error;
                break;
            }
        }
        ss << "\nFailed step " << id << ": " << why;
    }
    return ss.str();
}

bool should_attempt_planner(const std::string& user_message) {
    const std::string lower = to_lower(user_message);

    size_t numbered = 0;
    for (const char* marker : {"1.", "2.", "3.", "1)", "2)", "3)"}) {
        if (contains(lower, marker)) ++numbered;
    }
    if (numbered >= 3) return true;

    size_t bullets = 0;
    std::istringstream lines(user_message);
    std::string line;
    while (std::getline(lines, line)) {
        std::string t = trim_start(line);
        if (starts_with(t, "- ") || starts_with(t, "* ")) ++bullets;
    }
    if (bullets >= 3) return true;

    size_t sequencing = 0;
    for (const char* word : {" then ", " next ", " after ", " finally "}) {
        if (contains(lower, word)) ++sequencing;
    }
    return sequencing >= 2;
}

std::string build_planner_request(const std::string& task, const std::vector<std::string>& tool_names) {
    std::string tools;
    for (size_t i = 0; i < tool_names.size(); ++i) {
        if (i) tools += ", ";
        tools += tool_names[i];
    }
    if (tools.empty()) tools = "(no tools available)";

    return "You are the planning controller for an autonomous agent. "
           "Build a DAG plan with at least 3 steps for this task.\n\n"
           "Available tools: " + tools + "\n\n" +
           PlanParser::schema_prompt() + "\n\nTask:\n" + task;
}

} // namespace dharma
