#pragma once
// Context and consolidation collaborators
//
// ContextBuilder turns recalled memory into a prefix for the user message.
// Consolidator runs after a turn on a detached thread; see
// TurnOrchestrator::dispatch_consolidation().

#include <cstddef>
#include <string>

namespace dharma {

class ContextBuilder {
public:
    virtual ~ContextBuilder() = default;

    // Context block to prepend to the user message (may be empty).
    // Throws on recall failure.
    virtual std::string build_context(const std::string& entity_id,
                                      const std::string& user_message) = 0;
};

struct ConsolidationInput {
    std::string entity_id;
    size_t checkpoint_event_count = 0;  // Events for the entity at dispatch time
    std::string user_message;
    std::string response;
};

class Consolidator {
public:
    virtual ~Consolidator() = default;
    virtual void consolidate(const ConsolidationInput& input) = 0;
};

} // namespace dharma
