#pragma once
// State Header: the agent's canonical persona state (schema v1)
//
// The immutable half (schema version, identity hash, safety posture) is
// fixed at provisioning. The mutable half is what reflect/writeback may
// replace after each turn, subject to the writeback guard.

#include "config.hpp"
#include "version.hpp"
#include "writeback_guard.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dharma {

using json = nlohmann::json;

struct StateHeader {
    uint32_t schema_version = DHARMA_STATE_SCHEMA_VERSION;
    std::string identity_principles_hash;
    std::string safety_posture;
    std::string current_objective;
    std::vector<std::string> open_loops;
    std::vector<std::string> next_actions;
    std::vector<std::string> commitments;
    std::string recent_context_summary;
    std::string last_updated_at;            // RFC3339

    ImmutableStateHeader immutable_header() const {
        return ImmutableStateHeader{schema_version, identity_principles_hash, safety_posture};
    }

    // Immutable fields from the snapshot, mutable fields from the writeback
    static StateHeader from_writeback(const ImmutableStateHeader& immutable,
                                      const StateHeaderWriteback& writeback);

    json to_json() const;

    // Strict parse: unknown or missing fields and wrong types fail
    static bool from_json(const json& j, StateHeader& out, std::string& error);

    // Schema version, non-empty immutable strings, persona caps, RFC3339
    bool validate(const PersonaConfig& persona, std::string& error) const;

    // candidate.validate() plus "immutable field changed: <field>" checks
    static bool validate_writeback_candidate(const StateHeader& previous,
                                             const StateHeader& candidate,
                                             const PersonaConfig& persona,
                                             std::string& error);
};

} // namespace dharma
