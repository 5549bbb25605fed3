#pragma once
// Post-turn inference: structured claims embedded in an answer
//
// Lines of the form
//   INFERRED_CLAIM <slot> => <value>
//   CONTRADICTION_EVENT <slot> => <value>
// become inferred_claim / contradiction_marked events for the turn entity.
// Other lines are ignored.

#include "memory.hpp"
#include "observer.hpp"
#include <string>
#include <vector>

namespace dharma {

std::vector<MemoryEvent> build_inference_events(const std::string& entity_id,
                                                const std::string& response);

// Gate and append every event; returns the number written. Emits
// ContradictionDetected once per contradiction line. Throws on storage
// failure or a policy refusal.
size_t run_post_turn_inference(Memory& memory, const std::string& entity_id,
                               const std::string& response,
                               const SignalCallback& on_signal = nullptr);

} // namespace dharma
