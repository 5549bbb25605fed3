#include <dharma/config.hpp>
#include <dharma/log.hpp>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace dharma {

const char* autonomy_level_name(AutonomyLevel level) {
    switch (level) {
        case AutonomyLevel::ReadOnly:   return "read_only";
        case AutonomyLevel::Supervised: return "supervised";
        case AutonomyLevel::Full:       return "full";
    }
    return "supervised";
}

bool parse_autonomy_level(const std::string& name, AutonomyLevel& out) {
    if (name == "read_only" || name == "readonly") out = AutonomyLevel::ReadOnly;
    else if (name == "supervised") out = AutonomyLevel::Supervised;
    else if (name == "full") out = AutonomyLevel::Full;
    else return false;
    return true;
}

bool TemperatureBand::validate(const std::string& label, std::string& error) const {
    const std::string prefix = "autonomy.temperature_bands." + label;
    if (std::isnan(min) || std::isnan(max)) {
        error = prefix + " min/max must not be NaN";
        return false;
    }
    if (min < 0.0 || min > 2.0) {
        error = prefix + " min must be in [0.0, 2.0]";
        return false;
    }
    if (max < 0.0 || max > 2.0) {
        error = prefix + " max must be in [0.0, 2.0]";
        return false;
    }
    if (min > max) {
        error = prefix + " min must be <= max";
        return false;
    }
    return true;
}

bool AutonomyConfig::validate(std::string& error) const {
    if (verify_repair_max_attempts == 0) {
        error = "autonomy.verify_repair_max_attempts must be >= 1";
        return false;
    }
    if (verify_repair_max_repair_depth >= verify_repair_max_attempts) {
        error = "autonomy.verify_repair_max_repair_depth must be < autonomy.verify_repair_max_attempts";
        return false;
    }
    if (max_tool_loop_iterations == 0) {
        error = "autonomy.max_tool_loop_iterations must be >= 1";
        return false;
    }
    return temperature_bands.read_only.validate("read_only", error) &&
           temperature_bands.supervised.validate("supervised", error) &&
           temperature_bands.full.validate("full", error);
}

bool PersonaConfig::validate(std::string& error) const {
    if (person_id.empty()) {
        error = "persona.person_id cannot be empty";
        return false;
    }
    if (state_mirror_filename.empty() ||
        state_mirror_filename.find('/') != std::string::npos) {
        error = "persona.state_mirror_filename must be a plain file name";
        return false;
    }
    if (max_open_loops == 0 || max_next_actions == 0 || max_commitments == 0 ||
        max_current_objective_chars == 0 || max_recent_context_summary_chars == 0 ||
        max_list_item_chars == 0) {
        error = "persona limits must be > 0";
        return false;
    }
    return true;
}

namespace {

// Typed readers: absent keys leave the target untouched

bool read_bool(const json& obj, const char* key, bool& out,
               const std::string& context, std::string& error) {
    if (!obj.contains(key)) return true;
    const json& v = obj.at(key);
    if (!v.is_boolean()) {
        error = context + "." + key + " must be a boolean";
        return false;
    }
    out = v.get<bool>();
    return true;
}

bool read_string(const json& obj, const char* key, std::string& out,
                 const std::string& context, std::string& error) {
    if (!obj.contains(key)) return true;
    const json& v = obj.at(key);
    if (!v.is_string()) {
        error = context + "." + key + " must be a string";
        return false;
    }
    out = v.get<std::string>();
    return true;
}

template<typename T>
bool read_unsigned(const json& obj, const char* key, T& out,
                   const std::string& context, std::string& error) {
    if (!obj.contains(key)) return true;
    const json& v = obj.at(key);
    if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<int64_t>() < 0)) {
        error = context + "." + key + " must be a non-negative integer";
        return false;
    }
    const uint64_t value = v.get<uint64_t>();
    if (value > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        error = context + "." + key + " is out of range";
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

bool read_double(const json& obj, const char* key, double& out,
                 const std::string& context, std::string& error) {
    if (!obj.contains(key)) return true;
    const json& v = obj.at(key);
    if (!v.is_number()) {
        error = context + "." + key + " must be a number";
        return false;
    }
    out = v.get<double>();
    return true;
}

bool read_level(const json& obj, const char* key, AutonomyLevel& out,
                const std::string& context, std::string& error) {
    std::string name;
    if (!obj.contains(key)) return true;
    if (!read_string(obj, key, name, context, error)) return false;
    if (!parse_autonomy_level(name, out)) {
        error = context + "." + key + " must be one of read_only, supervised, full";
        return false;
    }
    return true;
}

bool read_object(const json& obj, const char* key, const json*& out,
                 const std::string& context, std::string& error) {
    out = nullptr;
    if (!obj.contains(key)) return true;
    const json& v = obj.at(key);
    if (!v.is_object()) {
        error = (context.empty() ? std::string(key) : context + "." + key) + " must be an object";
        return false;
    }
    out = &v;
    return true;
}

bool read_band(const json& bands, const char* key, TemperatureBand& band, std::string& error) {
    const json* obj = nullptr;
    const std::string context = "autonomy.temperature_bands";
    if (!read_object(bands, key, obj, context, error)) return false;
    if (!obj) return true;
    const std::string band_context = context + "." + key;
    return read_double(*obj, "min", band.min, band_context, error) &&
           read_double(*obj, "max", band.max, band_context, error);
}

json band_json(const TemperatureBand& band) {
    return {{"min", band.min}, {"max", band.max}};
}

bool env_flag(const char* value, bool& out) {
    std::string v = value;
    if (v == "1" || v == "true" || v == "yes" || v == "on") out = true;
    else if (v == "0" || v == "false" || v == "no" || v == "off") out = false;
    else return false;
    return true;
}

} // namespace

bool Config::merge_json(const json& j, std::string& error) {
    if (!j.is_object()) {
        error = "config root must be a JSON object";
        return false;
    }

    if (!read_string(j, "workspace_dir", workspace_dir, "config", error)) return false;
    if (!read_double(j, "default_temperature", default_temperature, "config", error)) return false;

    const json* a = nullptr;
    if (!read_object(j, "autonomy", a, "", error)) return false;
    if (a) {
        const std::string ctx = "autonomy";
        if (!read_level(*a, "level", autonomy.level, ctx, error)) return false;
        if (!read_unsigned(*a, "max_actions_per_hour", autonomy.max_actions_per_hour, ctx, error)) return false;
        if (!read_unsigned(*a, "max_actions_per_entity_per_hour",
                           autonomy.max_actions_per_entity_per_hour, ctx, error)) return false;
        if (!read_unsigned(*a, "max_cost_per_day_cents", autonomy.max_cost_per_day_cents, ctx, error)) return false;
        if (!read_unsigned(*a, "verify_repair_max_attempts",
                           autonomy.verify_repair_max_attempts, ctx, error)) return false;
        if (!read_unsigned(*a, "verify_repair_max_repair_depth",
                           autonomy.verify_repair_max_repair_depth, ctx, error)) return false;
        if (!read_unsigned(*a, "max_tool_loop_iterations",
                           autonomy.max_tool_loop_iterations, ctx, error)) return false;

        const json* rollout = nullptr;
        if (!read_object(*a, "rollout", rollout, ctx, error)) return false;
        if (rollout) {
            if (!read_bool(*rollout, "enabled", autonomy.rollout.enabled, "autonomy.rollout", error)) return false;
            if (rollout->contains("stage") && !rollout->at("stage").is_null()) {
                AutonomyLevel stage = AutonomyLevel::ReadOnly;
                if (!read_level(*rollout, "stage", stage, "autonomy.rollout", error)) return false;
                autonomy.rollout.stage = stage;
            }
        }

        const json* bands = nullptr;
        if (!read_object(*a, "temperature_bands", bands, ctx, error)) return false;
        if (bands) {
            if (!read_band(*bands, "read_only", autonomy.temperature_bands.read_only, error)) return false;
            if (!read_band(*bands, "supervised", autonomy.temperature_bands.supervised, error)) return false;
            if (!read_band(*bands, "full", autonomy.temperature_bands.full, error)) return false;
        }
    }

    const json* p = nullptr;
    if (!read_object(j, "persona", p, "", error)) return false;
    if (p) {
        const std::string ctx = "persona";
        if (!read_bool(*p, "enabled_main_session", persona.enabled_main_session, ctx, error)) return false;
        if (!read_string(*p, "person_id", persona.person_id, ctx, error)) return false;
        if (!read_string(*p, "state_mirror_filename", persona.state_mirror_filename, ctx, error)) return false;
        if (!read_unsigned(*p, "max_open_loops", persona.max_open_loops, ctx, error)) return false;
        if (!read_unsigned(*p, "max_next_actions", persona.max_next_actions, ctx, error)) return false;
        if (!read_unsigned(*p, "max_commitments", persona.max_commitments, ctx, error)) return false;
        if (!read_unsigned(*p, "max_current_objective_chars",
                           persona.max_current_objective_chars, ctx, error)) return false;
        if (!read_unsigned(*p, "max_recent_context_summary_chars",
                           persona.max_recent_context_summary_chars, ctx, error)) return false;
        if (!read_unsigned(*p, "max_list_item_chars", persona.max_list_item_chars, ctx, error)) return false;
    }

    const json* m = nullptr;
    if (!read_object(j, "memory", m, "", error)) return false;
    if (m) {
        if (!read_bool(*m, "auto_save", memory.auto_save, "memory", error)) return false;
        if (!read_string(*m, "backend", memory.backend, "memory", error)) return false;
        if (!read_string(*m, "path", memory.path, "memory", error)) return false;
    }

    const json* t = nullptr;
    if (!read_object(j, "tenant", t, "", error)) return false;
    if (t) {
        if (!read_bool(*t, "enabled", tenant.enabled, "tenant", error)) return false;
        if (!read_string(*t, "tenant_id", tenant.tenant_id, "tenant", error)) return false;
    }

    return true;
}

json Config::to_json() const {
    json rollout = {{"enabled", autonomy.rollout.enabled}, {"stage", nullptr}};
    if (autonomy.rollout.stage) {
        rollout["stage"] = autonomy_level_name(*autonomy.rollout.stage);
    }

    return {
        {"workspace_dir", workspace_dir},
        {"default_temperature", default_temperature},
        {"autonomy", {
            {"level", autonomy_level_name(autonomy.level)},
            {"effective_level", autonomy_level_name(autonomy.effective_autonomy_level())},
            {"rollout", rollout},
            {"max_actions_per_hour", autonomy.max_actions_per_hour},
            {"max_actions_per_entity_per_hour", autonomy.max_actions_per_entity_per_hour},
            {"max_cost_per_day_cents", autonomy.max_cost_per_day_cents},
            {"verify_repair_max_attempts", autonomy.verify_repair_max_attempts},
            {"verify_repair_max_repair_depth", autonomy.verify_repair_max_repair_depth},
            {"max_tool_loop_iterations", autonomy.max_tool_loop_iterations},
            {"temperature_bands", {
                {"read_only", band_json(autonomy.temperature_bands.read_only)},
                {"supervised", band_json(autonomy.temperature_bands.supervised)},
                {"full", band_json(autonomy.temperature_bands.full)}
            }}
        }},
        {"persona", {
            {"enabled_main_session", persona.enabled_main_session},
            {"person_id", persona.person_id},
            {"state_mirror_filename", persona.state_mirror_filename},
            {"max_open_loops", persona.max_open_loops},
            {"max_next_actions", persona.max_next_actions},
            {"max_commitments", persona.max_commitments},
            {"max_current_objective_chars", persona.max_current_objective_chars},
            {"max_recent_context_summary_chars", persona.max_recent_context_summary_chars},
            {"max_list_item_chars", persona.max_list_item_chars}
        }},
        {"memory", {
            {"auto_save", memory.auto_save},
            {"backend", memory.backend},
            {"path", memory.path}
        }},
        {"tenant", {
            {"enabled", tenant.enabled},
            {"tenant_id", tenant.tenant_id}
        }}
    };
}

bool Config::apply_env_overrides(std::string& error) {
    if (const char* v = std::getenv("DHARMA_WORKSPACE")) {
        workspace_dir = v;
    }
    if (const char* v = std::getenv("DHARMA_AUTONOMY_LEVEL")) {
        if (!parse_autonomy_level(v, autonomy.level)) {
            error = std::string("DHARMA_AUTONOMY_LEVEL has invalid value: ") + v;
            return false;
        }
    }
    if (const char* v = std::getenv("DHARMA_AUTO_SAVE")) {
        if (!env_flag(v, memory.auto_save)) {
            error = std::string("DHARMA_AUTO_SAVE has invalid value: ") + v;
            return false;
        }
    }
    if (const char* v = std::getenv("DHARMA_MEMORY_BACKEND")) {
        memory.backend = v;
    }
    if (const char* v = std::getenv("DHARMA_MEMORY_PATH")) {
        memory.path = v;
    }
    if (const char* v = std::getenv("DHARMA_PERSONA_ENABLED")) {
        if (!env_flag(v, persona.enabled_main_session)) {
            error = std::string("DHARMA_PERSONA_ENABLED has invalid value: ") + v;
            return false;
        }
    }
    if (const char* v = std::getenv("DHARMA_TENANT")) {
        tenant.tenant_id = v;
        tenant.enabled = !tenant.tenant_id.empty();
    }
    return true;
}

bool Config::validate(std::string& error) const {
    if (std::isnan(default_temperature) || default_temperature < 0.0 || default_temperature > 2.0) {
        error = "default_temperature must be in [0.0, 2.0]";
        return false;
    }
    if (memory.backend != "memory" && memory.backend != "sqlite") {
        error = "memory.backend must be one of memory, sqlite";
        return false;
    }
    if (tenant.enabled && tenant.tenant_id.empty()) {
        error = "tenant.tenant_id is required when tenant.enabled is true";
        return false;
    }
    return autonomy.validate(error) && persona.validate(error);
}

std::string Config::memory_path() const {
    if (memory.path.empty() || memory.path[0] == '/') return memory.path;
    std::string dir = workspace_dir.empty() ? "." : workspace_dir;
    if (dir.back() != '/') dir += '/';
    return dir + memory.path;
}

bool load_config(const std::string& path, Config& config, std::string& error) {
    if (!path.empty()) {
        std::ifstream in(path);
        if (!in) {
            error = "cannot open config file: " + path;
            return false;
        }
        json j;
        try {
            j = json::parse(in);
        } catch (const json::parse_error& e) {
            error = std::string("config parse error: ") + e.what();
            return false;
        }
        if (!config.merge_json(j, error)) return false;
        log_debug("config", "loaded " + path);
    }
    if (!config.apply_env_overrides(error)) return false;
    return config.validate(error);
}

} // namespace dharma
