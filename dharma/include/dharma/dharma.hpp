#pragma once
// Dharma: turn control plane for an autonomous LLM agent
//
// Everything between "user message in" and "answer out":
// - Guard: strict validation of model-proposed persona state writebacks
// - Budget: per-turn model call accounting
// - Temperature: autonomy-band clamping
// - Verify/Repair: failure classification, bounded retry, escalation
// - Turn: the orchestrator tying the above to providers and memory

#include "version.hpp"
#include "types.hpp"
#include "log.hpp"
#include "scrub.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "memory.hpp"
#include "sqlite_memory.hpp"
#include "write_policy.hpp"
#include "writeback_guard.hpp"
#include "state_header.hpp"
#include "state_persistence.hpp"
#include "call_budget.hpp"
#include "temperature.hpp"
#include "security.hpp"
#include "verify_repair.hpp"
#include "observer.hpp"
#include "provider.hpp"
#include "tool_loop.hpp"
#include "planner.hpp"
#include "context.hpp"
#include "inference.hpp"
#include "reflect.hpp"
#include "turn.hpp"
