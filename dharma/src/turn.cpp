#include <dharma/turn.hpp>
#include <dharma/inference.hpp>
#include <dharma/log.hpp>
#include <dharma/scrub.hpp>
#include <dharma/temperature.hpp>
#include <dharma/verify_repair.hpp>
#include <dharma/write_policy.hpp>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace dharma {

namespace {

const char* USER_MSG_SOURCE_REF = "agent.autosave.user_msg";
const char* ASSISTANT_RESP_SOURCE_REF = "agent.autosave.assistant_resp";
const size_t RESPONSE_SUMMARY_CHARS = 100;

MemoryEvent user_message_event(const std::string& entity_id, const std::string& message) {
    MemoryEvent event;
    event.entity_id = entity_id;
    event.slot_key = SLOT_USER_MESSAGE;
    event.event_type = MemoryEventType::FactAdded;
    event.content = message;
    event.source = MemorySource::ExplicitUser;
    event.privacy = PrivacyLevel::Private;
    event.layer = MemoryLayer::Working;
    event.confidence = 0.95;
    event.importance = 0.6;
    event.with_source_ref(SourceKind::Conversation, USER_MSG_SOURCE_REF);
    return event;
}

MemoryEvent response_event(const std::string& entity_id, const std::string& response) {
    MemoryEvent event;
    event.entity_id = entity_id;
    event.slot_key = SLOT_ASSISTANT_RESPONSE;
    event.event_type = MemoryEventType::FactAdded;
    event.content = truncate_with_ellipsis(response, RESPONSE_SUMMARY_CHARS);
    event.source = MemorySource::System;
    event.privacy = PrivacyLevel::Private;
    event.layer = MemoryLayer::Working;
    event.confidence = 0.9;
    event.importance = 0.4;
    event.with_source_ref(SourceKind::Conversation, ASSISTANT_RESP_SOURCE_REF);
    return event;
}

// Soft stops are warnings; only Error fails the attempt
void handle_stop_reason(const ToolLoopResult& result) {
    const LoopStopReason& stop = result.stop_reason;
    switch (stop.kind) {
        case LoopStopKind::Completed:
            return;
        case LoopStopKind::MaxIterations:
            log_warn("turn", LogLine("tool loop hit max iterations").kv("iterations", result.iterations).str());
            return;
        case LoopStopKind::RateLimited:
            log_warn("turn", "tool loop halted by rate limiter");
            return;
        case LoopStopKind::ApprovalDenied:
            log_warn("turn", "tool loop halted by approval requirement");
            return;
        case LoopStopKind::HookBlocked:
            log_warn("turn", LogLine("tool loop halted by hook").kv("reason", stop.detail).str());
            return;
        case LoopStopKind::Error:
            throw TurnError::execution_failed("tool loop failed: " + stop.detail);
    }
}

} // namespace

TurnOrchestrator::TurnOrchestrator(Config config, TurnDependencies deps)
    : config_(std::move(config)),
      deps_(std::move(deps)),
      tenant_(TenantPolicyContext::from_config(config_.tenant)) {
    if (!deps_.security) throw std::invalid_argument("turn orchestrator requires a security policy");
    if (!deps_.memory) throw std::invalid_argument("turn orchestrator requires a memory backend");
    if (!deps_.answer_provider) throw std::invalid_argument("turn orchestrator requires an answer provider");
    if (!deps_.tool_loop) throw std::invalid_argument("turn orchestrator requires a tool loop");
    std::string error;
    if (!config_.autonomy.validate(error)) {
        throw std::invalid_argument("turn orchestrator config invalid: " + error);
    }
    if (!deps_.reflect_provider) deps_.reflect_provider = deps_.answer_provider;
}

TurnOutcome TurnOrchestrator::run_turn(const TurnParams& params) {
    VerifyRepairController controller(VerifyRepairCaps::from_config(config_.autonomy),
                                      deps_.memory.get(), params.entity_id);
    TurnOutcome outcome = controller.run([&]() { return run_attempt(params); });
    outcome.attempts = controller.attempts();
    return outcome;
}

TurnOutcome TurnOrchestrator::run_attempt(const TurnParams& params) {
    TurnOutcome outcome;
    outcome.accounting = TurnCallAccounting::for_persona_mode(config_.persona.enabled_main_session);
    signal(TurnSignal::IntentCreated);

    enforce_write_scope(params.entity_id);

    if (config_.memory.auto_save) {
        autosave(user_message_event(params.entity_id, params.user_message), "user message");
    }

    std::string enriched = build_enriched_message(params);

    enforce_intent_policy(params.entity_id);
    outcome.accounting.consume_answer_call();

    TemperatureClamp clamp = deps_.security->clamp_temperature(params.temperature);
    if (clamp.clamped) {
        log_info("temperature", clamp_notice(clamp));
        signal(TurnSignal::TemperatureClamped);
    }

    answer(params, enriched, clamp.value, outcome);

    reflect_if_enabled(params, outcome);

    if (config_.memory.auto_save) {
        save_response_and_consolidate(params, outcome.response);
    }
    return outcome;
}

void TurnOrchestrator::signal(TurnSignal s) const {
    if (deps_.on_signal) deps_.on_signal(s);
}

void TurnOrchestrator::enforce_write_scope(const std::string& entity_id) const {
    std::string error;
    if (!tenant_.enforce_recall_scope(entity_id, error)) {
        throw TurnError::policy_denied(error);
    }
}

void TurnOrchestrator::enforce_intent_policy(const std::string& entity_id) {
    std::string error;
    if (!deps_.security->consume_action_and_cost(0, error) ||
        !deps_.security->consume_entity_action(entity_id, error)) {
        signal(TurnSignal::IntentPolicyDenied);
        throw TurnError::policy_denied(error);
    }
    signal(TurnSignal::IntentPolicyAllowed);
}

void TurnOrchestrator::autosave(const MemoryEvent& event, const char* what) {
    std::string error;
    try {
        if (!append_gated(*deps_.memory, event, check_agent_autosave_write_policy, error)) {
            log_warn("turn", std::string("agent autosave ") + what + " rejected by write policy: " + error);
        }
    } catch (const std::exception& e) {
        log_warn("turn", std::string("agent autosave ") + what + " write failed: " +
                         sanitize_error(e.what()));
    }
}

std::string TurnOrchestrator::build_enriched_message(const TurnParams& params) {
    if (!deps_.context_builder) return params.user_message;

    std::string context;
    try {
        context = deps_.context_builder->build_context(params.entity_id, params.user_message);
    } catch (const TurnError&) {
        throw;
    } catch (const std::exception& e) {
        throw TurnError::execution_failed(std::string("build context: ") + e.what());
    }
    return context + params.user_message;
}

void TurnOrchestrator::answer(const TurnParams& params, const std::string& enriched,
                              double temperature, TurnOutcome& outcome) {
    if (deps_.plan_executor && should_attempt_planner(params.user_message)) {
        auto planned = try_planner(params, enriched, temperature);
        if (planned) {
            log_info("turn", LogLine("planner path selected").kv("entity_id", params.entity_id).str());
            outcome.response = std::move(*planned);
            outcome.planner_used = true;
            outcome.iterations = 0;
            return;
        }
    }

    ToolLoopRequest request;
    request.provider = deps_.answer_provider;
    request.system_prompt = params.system_prompt;
    request.user_message = enriched;
    request.model = params.model;
    request.temperature = temperature;
    request.entity_id = params.entity_id;
    request.max_iterations = config_.autonomy.max_tool_loop_iterations;

    ToolLoopResult result = deps_.tool_loop->run(request);
    log_debug("turn", LogLine("tool loop completed")
                          .kv("entity_id", params.entity_id)
                          .kv("iterations", result.iterations)
                          .kv("stop_reason", loop_stop_kind_name(result.stop_reason.kind))
                          .str());
    handle_stop_reason(result);

    outcome.response = std::move(result.final_text);
    outcome.tokens_used = result.tokens_used;
    outcome.iterations = result.iterations;
}

std::optional<std::string> TurnOrchestrator::try_planner(const TurnParams& params,
                                                         const std::string& enriched,
                                                         double temperature) {
    std::string raw;
    try {
        std::string request = build_planner_request(enriched, deps_.tool_loop->tool_names(params.entity_id));
        raw = deps_.answer_provider->chat_with_system(params.system_prompt, request, params.model,
                                                      temperature);
    } catch (const std::exception& e) {
        log_warn("planner", LogLine("planner generation failed; falling back to direct tool loop")
                                .kv("error", sanitize_error(e.what())).str());
        return std::nullopt;
    }

    auto plan_json = PlanParser::extract_json(raw);
    if (!plan_json) {
        log_warn("planner", "planner returned no JSON; falling back to direct tool loop");
        return std::nullopt;
    }

    Plan plan;
    std::string error;
    if (!PlanParser::parse(*plan_json, plan, error)) {
        log_warn("planner", LogLine("planner JSON parse failed; falling back to direct tool loop")
                                .kv("error", sanitize_error(error)).str());
        return std::nullopt;
    }

    if (plan.steps.size() < 3) {
        log_info("planner", LogLine("planner produced short plan; using direct tool loop")
                                .kv("steps", plan.steps.size()).str());
        return std::nullopt;
    }

    ExecutionReport report;
    try {
        report = deps_.plan_executor->execute(plan);
    } catch (const std::exception& e) {
        log_warn("planner", LogLine("plan execution failed; falling back to direct tool loop")
                                .kv("error", sanitize_error(e.what())).str());
        return std::nullopt;
    }

    if (!report.success) return render_plan_failure(plan, report);
    auto output = final_step_output(plan);
    return output ? *output : std::string("Plan completed.");
}

void TurnOrchestrator::reflect_if_enabled(const TurnParams& params, TurnOutcome& outcome) {
    if (!config_.persona.enabled_main_session) return;

    std::string error;
    if (!deps_.security->consume_action_and_cost(0, error)) {
        log_warn("reflect", LogLine("persona reflect skipped by rate limit").kv("error", error).str());
        outcome.reflect = ReflectReport::skipped(error);
        return;
    }
    outcome.accounting.consume_reflect_call();

    ReflectRequest request;
    request.provider = deps_.reflect_provider;
    request.persistence = deps_.persistence;
    request.memory = deps_.memory.get();
    request.persona = &config_.persona;
    request.model = params.model;
    request.user_message = params.user_message;
    request.answer = outcome.response;
    outcome.reflect = run_reflect_writeback(request);
}

void TurnOrchestrator::save_response_and_consolidate(const TurnParams& params,
                                                     const std::string& response) {
    autosave(response_event(params.entity_id, response), "assistant response");

    try {
        run_post_turn_inference(*deps_.memory, params.entity_id, response, deps_.on_signal);
    } catch (const std::exception& e) {
        log_warn("turn", LogLine("post-turn memory inference pass failed")
                             .kv("error", sanitize_error(e.what())).str());
    }

    if (!deps_.consolidator) return;

    size_t checkpoint = 0;
    try {
        checkpoint = deps_.memory->count_events(params.entity_id);
    } catch (const std::exception& e) {
        log_warn("turn", LogLine("post-turn consolidation checkpoint skipped")
                             .kv("error", sanitize_error(e.what())).str());
        return;
    }
    dispatch_consolidation(ConsolidationInput{params.entity_id, checkpoint, params.user_message, response});
}

void TurnOrchestrator::dispatch_consolidation(ConsolidationInput input) {
    if (!deps_.consolidator) return;

    std::shared_ptr<Consolidator> consolidator = deps_.consolidator;
    std::shared_ptr<Memory> keep_alive = deps_.memory;
    try {
        std::thread([consolidator, keep_alive, input = std::move(input)]() {
            try {
                consolidator->consolidate(input);
            } catch (const std::exception& e) {
                log_warn("consolidation", LogLine("background consolidation failed")
                                              .kv("entity_id", input.entity_id)
                                              .kv("error", sanitize_error(e.what())).str());
            }
        }).detach();
    } catch (const std::system_error& e) {
        log_warn("consolidation", LogLine("background consolidation not started")
                                      .kv("error", e.what()).str());
    }
}

} // namespace dharma
