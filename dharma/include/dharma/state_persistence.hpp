#pragma once
// State Persistence: canonical persona state in Memory, mirrored to disk
//
// The backend is the source of truth. Every persist writes a fact_updated
// event on persona/<person_id>/state_header/v1 (entity person:<person_id>)
// through the persona write gate, then rewrites the markdown mirror
// <workspace>/<state_mirror_filename> atomically:
//
//   # Persona State Header
//
//   backend_canonical: true
//
//   ```json
//   { ...state header... }
//   ```

#include "config.hpp"
#include "memory.hpp"
#include "state_header.hpp"
#include "write_policy.hpp"
#include <memory>
#include <optional>
#include <string>

namespace dharma {

// Interface consumed by reflect/writeback. Both methods throw
// std::runtime_error on storage or validation failure.
class StatePersistence {
public:
    virtual ~StatePersistence() = default;

    virtual std::optional<StateHeader> load_canonical() = 0;
    virtual void persist_and_sync(const StateHeader& state) = 0;
};

std::string render_state_mirror(const StateHeader& state);

// Fenced ```json block, or the whole text when no fence is present
bool parse_state_mirror(const std::string& raw, StateHeader& out, std::string& error);

// Write temp, fsync, rename over path, fsync dir
bool write_file_atomic(const std::string& path, const std::string& content);

class MemoryStatePersistence : public StatePersistence {
public:
    MemoryStatePersistence(std::shared_ptr<Memory> memory, std::string workspace_dir,
                           PersonaConfig persona);

    std::optional<StateHeader> load_canonical() override;
    void persist_and_sync(const StateHeader& state) override;

    // Mirror contents, if the file exists (may diverge from the backend)
    std::optional<StateHeader> read_mirror();

    // Rewrite the mirror from the backend; returns the canonical state
    std::optional<StateHeader> reconcile_mirror_on_startup();

    std::string canonical_entity() const { return person_entity(persona_.person_id); }
    std::string canonical_slot() const;
    std::string mirror_path() const;

private:
    void sync_mirror(const StateHeader& state);

    std::shared_ptr<Memory> memory_;
    std::string workspace_dir_;
    PersonaConfig persona_;
};

} // namespace dharma
