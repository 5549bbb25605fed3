#include <dharma/state_persistence.hpp>
#include <dharma/log.hpp>
#include <dharma/write_policy.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>

namespace dharma {

namespace {

const char* MIRROR_HEADER = "# Persona State Header\n\nbackend_canonical: true\n\n";
const char* CANONICAL_SOURCE_REF = "persona.state_header.canonical";

bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

} // namespace

std::string render_state_mirror(const StateHeader& state) {
    return std::string(MIRROR_HEADER) + "```json\n" + state.to_json().dump(2) + "\n```\n";
}

bool parse_state_mirror(const std::string& raw, StateHeader& out, std::string& error) {
    std::string block = trim(raw);
    const std::string fence = "```json";
    size_t start = raw.find(fence);
    if (start != std::string::npos) {
        size_t body = start + fence.size();
        size_t end = raw.find("```", body);
        if (end != std::string::npos) {
            block = trim(raw.substr(body, end - body));
        }
    }

    json j;
    try {
        j = json::parse(block);
    } catch (const json::parse_error& e) {
        error = std::string("failed parsing state mirror: ") + e.what();
        return false;
    }
    return StateHeader::from_json(j, out, error);
}

bool write_file_atomic(const std::string& path, const std::string& content) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = ::fwrite(content.data(), 1, content.size(), f) == content.size() &&
              ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0;
    ::fclose(f);
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

MemoryStatePersistence::MemoryStatePersistence(std::shared_ptr<Memory> memory,
                                               std::string workspace_dir,
                                               PersonaConfig persona)
    : memory_(std::move(memory)),
      workspace_dir_(std::move(workspace_dir)),
      persona_(std::move(persona)) {
    if (!memory_) {
        throw std::invalid_argument("state persistence requires a memory backend");
    }
}

std::string MemoryStatePersistence::canonical_slot() const {
    return persona_state_slot_prefix(persona_.person_id) + "v1";
}

std::string MemoryStatePersistence::mirror_path() const {
    std::string dir = workspace_dir_.empty() ? "." : workspace_dir_;
    if (dir.back() != '/') dir += '/';
    return dir + persona_.state_mirror_filename;
}

std::optional<StateHeader> MemoryStatePersistence::load_canonical() {
    auto entry = memory_->resolve_slot(canonical_entity(), canonical_slot());
    if (!entry) return std::nullopt;

    StateHeader state;
    std::string error;
    json j;
    try {
        j = json::parse(entry->content);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("failed to parse canonical state header " + canonical_slot() +
                                 ": " + e.what());
    }
    if (!StateHeader::from_json(j, state, error) || !state.validate(persona_, error)) {
        throw std::runtime_error("invalid canonical state header: " + error);
    }
    return state;
}

void MemoryStatePersistence::persist_and_sync(const StateHeader& state) {
    std::string error;
    if (!state.validate(persona_, error)) {
        throw std::runtime_error("refusing to persist invalid state header: " + error);
    }

    MemoryEvent event;
    event.entity_id = canonical_entity();
    event.slot_key = canonical_slot();
    event.event_type = MemoryEventType::FactUpdated;
    event.content = state.to_json().dump();
    event.source = MemorySource::System;
    event.privacy = PrivacyLevel::Private;
    event.layer = MemoryLayer::Semantic;
    event.confidence = 0.95;
    event.importance = 1.0;
    event.occurred_at = state.last_updated_at;
    event.with_source_ref(SourceKind::Manual, CANONICAL_SOURCE_REF);

    const std::string person_id = persona_.person_id;
    auto gate = [&person_id](const MemoryEvent& e, std::string& err) {
        return check_persona_write_policy(e, person_id, err);
    };
    if (!append_gated(*memory_, event, gate, error)) {
        throw std::runtime_error("canonical state write rejected: " + error);
    }

    sync_mirror(state);
}

std::optional<StateHeader> MemoryStatePersistence::read_mirror() {
    const std::string path = mirror_path();
    std::ifstream in(path);
    if (!in) return std::nullopt;

    std::stringstream buffer;
    buffer << in.rdbuf();
    StateHeader state;
    std::string error;
    if (!parse_state_mirror(buffer.str(), state, error) || !state.validate(persona_, error)) {
        throw std::runtime_error("invalid state mirror " + path + ": " + error);
    }
    return state;
}

std::optional<StateHeader> MemoryStatePersistence::reconcile_mirror_on_startup() {
    auto canonical = load_canonical();
    if (canonical) sync_mirror(*canonical);
    return canonical;
}

void MemoryStatePersistence::sync_mirror(const StateHeader& state) {
    const std::string path = mirror_path();
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    if (ec) {
        throw std::runtime_error("failed creating mirror directory for " + path + ": " + ec.message());
    }
    if (!write_file_atomic(path, render_state_mirror(state))) {
        throw std::runtime_error("failed replacing state mirror atomically: " + path);
    }
    log_debug("state", "mirror synced to " + path);
}

} // namespace dharma
