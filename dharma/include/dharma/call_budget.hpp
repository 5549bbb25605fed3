#pragma once
// Call Budget: per-turn cap on model calls
//
// One answer call always; one more for reflect/writeback when persona
// reflection is on. Counters are bumped before the check, so the call
// that overruns the budget is the one that fails.

#include "errors.hpp"
#include <cstdint>
#include <string>

namespace dharma {

struct TurnCallAccounting {
    uint32_t budget_limit = 1;
    uint32_t answer_calls = 0;
    uint32_t reflect_calls = 0;

    static TurnCallAccounting for_persona_mode(bool reflect_enabled) {
        TurnCallAccounting accounting;
        accounting.budget_limit = reflect_enabled ? 2 : 1;
        return accounting;
    }

    uint32_t consumed() const { return answer_calls + reflect_calls; }

    // Throws TurnError(BudgetExhausted) when the call overruns the budget
    void consume_answer_call() {
        ++answer_calls;
        enforce_budget();
    }

    void consume_reflect_call() {
        ++reflect_calls;
        enforce_budget();
    }

private:
    void enforce_budget() const {
        if (consumed() > budget_limit) {
            throw TurnError::budget_exhausted(
                "persona per-turn call budget exceeded: consumed=" +
                std::to_string(consumed()) + " budget=" + std::to_string(budget_limit));
        }
    }
};

} // namespace dharma
