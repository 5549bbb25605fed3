#pragma once
// Config: autonomy, persona and memory settings for the turn control plane
//
// Loaded from a JSON file (missing keys keep their defaults), then
// overridden by DHARMA_* environment variables, then validated.
//
// {
//   "workspace_dir": "/srv/agent",
//   "autonomy": {"level": "supervised", "verify_repair_max_attempts": 3, ...},
//   "persona": {"enabled_main_session": true, "person_id": "main"},
//   "memory": {"auto_save": true, "backend": "sqlite", "path": "agent.db"},
//   "tenant": {"enabled": true, "tenant_id": "tenant-alpha"}
// }

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace dharma {

using json = nlohmann::json;

enum class AutonomyLevel : uint8_t {
    ReadOnly = 0,
    Supervised = 1,
    Full = 2,
};

const char* autonomy_level_name(AutonomyLevel level);
bool parse_autonomy_level(const std::string& name, AutonomyLevel& out);

// Lower of two levels; rollout can cap autonomy but never raise it
inline AutonomyLevel min_autonomy(AutonomyLevel a, AutonomyLevel b) {
    return static_cast<uint8_t>(a) < static_cast<uint8_t>(b) ? a : b;
}

struct TemperatureBand {
    double min = 0.0;
    double max = 0.0;

    bool validate(const std::string& label, std::string& error) const;
};

struct TemperatureBands {
    TemperatureBand read_only{0.0, 0.2};
    TemperatureBand supervised{0.2, 0.7};
    TemperatureBand full{0.2, 1.0};

    const TemperatureBand& for_level(AutonomyLevel level) const {
        switch (level) {
            case AutonomyLevel::ReadOnly:   return read_only;
            case AutonomyLevel::Supervised: return supervised;
            case AutonomyLevel::Full:       return full;
        }
        return supervised;
    }
};

struct RolloutConfig {
    bool enabled = false;
    std::optional<AutonomyLevel> stage;     // Unset: rollout does not cap
};

struct AutonomyConfig {
    AutonomyLevel level = AutonomyLevel::Supervised;
    RolloutConfig rollout;
    uint32_t max_actions_per_hour = 20;
    uint32_t max_actions_per_entity_per_hour = 20;
    uint32_t max_cost_per_day_cents = 500;
    uint32_t verify_repair_max_attempts = 3;
    uint32_t verify_repair_max_repair_depth = 2;
    uint32_t max_tool_loop_iterations = 10;
    TemperatureBands temperature_bands;

    AutonomyLevel effective_autonomy_level() const {
        if (!rollout.enabled || !rollout.stage) return level;
        return min_autonomy(level, *rollout.stage);
    }

    const TemperatureBand& selected_temperature_band() const {
        return temperature_bands.for_level(effective_autonomy_level());
    }

    bool validate(std::string& error) const;
};

struct PersonaConfig {
    bool enabled_main_session = false;          // Reflect/writeback after each answer
    std::string person_id = "main";
    std::string state_mirror_filename = "STATE.md";
    size_t max_open_loops = 7;
    size_t max_next_actions = 3;
    size_t max_commitments = 5;
    size_t max_current_objective_chars = 280;
    size_t max_recent_context_summary_chars = 1200;
    size_t max_list_item_chars = 240;

    bool validate(std::string& error) const;
};

struct MemoryConfig {
    bool auto_save = true;                      // Autosave user/assistant messages
    std::string backend = "memory";             // memory | sqlite
    std::string path = "dharma.db";             // sqlite file, relative to workspace
};

struct TenantConfig {
    bool enabled = false;
    std::string tenant_id;
};

struct Config {
    std::string workspace_dir = ".";
    double default_temperature = 0.7;
    AutonomyConfig autonomy;
    PersonaConfig persona;
    MemoryConfig memory;
    TenantConfig tenant;

    // Overlay values present in j onto this config
    bool merge_json(const json& j, std::string& error);
    json to_json() const;

    // DHARMA_WORKSPACE, DHARMA_AUTONOMY_LEVEL, DHARMA_AUTO_SAVE,
    // DHARMA_MEMORY_BACKEND, DHARMA_MEMORY_PATH, DHARMA_PERSONA_ENABLED,
    // DHARMA_TENANT
    bool apply_env_overrides(std::string& error);

    bool validate(std::string& error) const;

    // Resolved sqlite path (absolute paths kept as-is)
    std::string memory_path() const;
};

// Defaults <- file (if path non-empty) <- environment, then validate
bool load_config(const std::string& path, Config& config, std::string& error);

} // namespace dharma
