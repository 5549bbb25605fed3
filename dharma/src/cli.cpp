// dharma: Command-line interface for the turn control plane
//
// Usage: dharma <command> [options]
//
// Commands:
//   guard      Validate a reflect writeback payload against a state header
//   classify   Classify a failure message for verify/repair
//   clamp      Clamp a temperature to an autonomy band
//   config     Print the effective configuration
//   state      Reconcile and print the canonical persona state
//   version    Show version

#include <dharma/dharma.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <memory>
#include <stdexcept>

using namespace dharma;

const char* prog_name(const char* prog) {
    const char* slash = strrchr(prog, '/');
    return slash ? slash + 1 : prog;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "dharma " << DHARMA_VERSION << " - Agent turn control plane\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  guard <payload.json>   Validate a writeback payload (needs --state)\n"
              << "  classify <message>     Classify a turn failure message\n"
              << "  clamp <temperature>    Clamp to the band of --level (or the configured level)\n"
              << "  config                 Print the effective configuration as JSON\n"
              << "  state                  Reconcile the state mirror from memory and print it\n"
              << "  version                Show version\n"
              << "  help                   Show this help\n\n"
              << "Options:\n"
              << "  --config PATH          Configuration file (JSON)\n"
              << "  --state PATH           Canonical state header JSON (for guard)\n"
              << "  --level LEVEL          Autonomy level: read_only|supervised|full\n"
              << "  -v, --version          Show version\n\n"
              << "Environment:\n"
              << "  DHARMA_LOG_LEVEL, DHARMA_WORKSPACE, DHARMA_AUTONOMY_LEVEL,\n"
              << "  DHARMA_AUTO_SAVE, DHARMA_MEMORY_BACKEND, DHARMA_MEMORY_PATH,\n"
              << "  DHARMA_PERSONA_ENABLED, DHARMA_TENANT\n";
}

bool read_json_file(const std::string& path, json& out, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }
    try {
        out = json::parse(in);
    } catch (const json::parse_error& e) {
        error = "invalid JSON in " + path + ": " + e.what();
        return false;
    }
    return true;
}

int cmd_guard(const std::string& payload_path, const std::string& state_path) {
    if (payload_path.empty() || state_path.empty()) {
        std::cerr << "Usage: dharma guard <payload.json> --state <state.json>\n";
        return 1;
    }

    std::string error;
    json state_json;
    if (!read_json_file(state_path, state_json, error)) {
        std::cerr << "[guard] " << error << "\n";
        return 1;
    }
    StateHeader state;
    if (!StateHeader::from_json(state_json, state, error)) {
        std::cerr << "[guard] invalid state header: " << error << "\n";
        return 1;
    }

    json payload;
    if (!read_json_file(payload_path, payload, error)) {
        std::cerr << "[guard] " << error << "\n";
        return 1;
    }

    const ImmutableStateHeader immutable = state.immutable_header();
    auto verdict = validate_writeback_payload(payload, immutable);
    json out;
    out["accepted"] = verdict.accepted();
    if (verdict.accepted()) {
        out["payload"] = verdict.payload().to_json(immutable);
    } else {
        out["reason"] = verdict.reason();
    }
    std::cout << out.dump(2) << "\n";
    return verdict.accepted() ? 0 : 2;
}

int cmd_classify(const std::string& message) {
    auto analysis = analyze_verify_failure(message);
    json out;
    out["failure_class"] = failure_class_name(analysis.failure_class);
    out["retryable"] = analysis.retryable;
    std::cout << out.dump(2) << "\n";
    return 0;
}

int cmd_clamp(const Config& config, const std::string& value, const std::string& level_name) {
    double requested = 0.0;
    try {
        size_t used = 0;
        requested = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
    } catch (const std::exception&) {
        std::cerr << "[clamp] invalid temperature: " << value << "\n";
        return 1;
    }

    AutonomyLevel level = config.autonomy.effective_autonomy_level();
    if (!level_name.empty() && !parse_autonomy_level(level_name, level)) {
        std::cerr << "[clamp] unknown autonomy level: " << level_name << "\n";
        return 1;
    }

    auto clamp = clamp_temperature(requested, level, config.autonomy.temperature_bands);
    if (clamp.clamped) log_info("temperature", clamp_notice(clamp));

    json out;
    out["autonomy_level"] = autonomy_level_name(clamp.level);
    out["requested"] = clamp.requested;
    out["temperature"] = clamp.value;
    out["band"] = {{"min", clamp.band.min}, {"max", clamp.band.max}};
    out["clamped"] = clamp.clamped;
    std::cout << out.dump(2) << "\n";
    return 0;
}

std::shared_ptr<Memory> open_memory(const Config& config) {
    if (config.memory.backend == "sqlite") {
        return std::make_shared<SqliteMemory>(config.memory_path());
    }
    return std::make_shared<InMemoryEventLog>();
}

int cmd_state(const Config& config) {
    try {
        MemoryStatePersistence persistence(open_memory(config), config.workspace_dir, config.persona);
        auto state = persistence.reconcile_mirror_on_startup();
        if (!state) {
            std::cerr << "[state] no canonical state header for person "
                      << config.persona.person_id << "\n";
            return 1;
        }
        std::cout << state->to_json().dump(2) << "\n";
        log_info("state", "mirror reconciled at " + persistence.mirror_path());
    } catch (const std::exception& e) {
        std::cerr << "[state] " << sanitize_error(e.what()) << "\n";
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::string command;
    std::string argument;       // guard payload / classify message / clamp value
    std::string config_path;
    std::string state_path;
    std::string level_name;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--state") == 0 && i + 1 < argc) {
            state_path = argv[++i];
        } else if (strcmp(argv[i], "--level") == 0 && i + 1 < argc) {
            level_name = argv[++i];
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "dharma " << DHARMA_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-' || command == "clamp") {
            // Negative temperatures are values, not options
            if (command.empty()) {
                command = argv[i];
            } else if (argument.empty()) {
                argument = argv[i];
            } else {
                std::cerr << "Unexpected argument: " << argv[i] << "\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "version") {
        std::cout << "dharma " << DHARMA_VERSION << " (state schema v"
                  << DHARMA_STATE_SCHEMA_VERSION << ")\n";
        return 0;
    }
    if (command == "guard") {
        return cmd_guard(argument, state_path);
    }
    if (command == "classify") {
        if (argument.empty()) {
            std::cerr << "Usage: dharma classify <message>\n";
            return 1;
        }
        return cmd_classify(argument);
    }

    Config config;
    std::string error;
    if (!load_config(config_path, config, error)) {
        std::cerr << "[config] " << error << "\n";
        return 1;
    }

    if (command == "config") {
        std::cout << config.to_json().dump(2) << "\n";
        return 0;
    }
    if (command == "clamp") {
        if (argument.empty()) {
            std::cerr << "Usage: dharma clamp <temperature> [--level LEVEL]\n";
            return 1;
        }
        return cmd_clamp(config, argument, level_name);
    }
    if (command == "state") {
        return cmd_state(config);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
