#pragma once
// Reflect/Writeback: second model call that updates persona state
//
// After an answer exists, the reflect provider sees the canonical state
// header, the user message and the answer, and returns a strict JSON
// writeback payload. The payload goes through the writeback guard against
// the canonical immutable fields, then is persisted as the new canonical
// state. Accepted memory_append entries become persona.writeback.<i>
// events.
//
// Nothing in here can change or fail the answer: every problem ends up in
// the returned report and a warning.

#include "config.hpp"
#include "memory.hpp"
#include "provider.hpp"
#include "state_persistence.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace dharma {

enum class ReflectStatus : uint8_t {
    Skipped = 0,    // Disabled, rate limited, or no canonical state yet
    Persisted = 1,
    Rejected = 2,   // Guard said no
    Failed = 3,     // Provider, parse, validation or storage error
};

inline const char* reflect_status_name(ReflectStatus status) {
    switch (status) {
        case ReflectStatus::Skipped:   return "skipped";
        case ReflectStatus::Persisted: return "persisted";
        case ReflectStatus::Rejected:  return "rejected";
        case ReflectStatus::Failed:    return "failed";
    }
    return "failed";
}

struct ReflectReport {
    ReflectStatus status = ReflectStatus::Skipped;
    std::string detail;
    size_t memory_appended = 0;

    static ReflectReport skipped(std::string why) { return {ReflectStatus::Skipped, std::move(why), 0}; }
};

const char* reflect_system_prompt();

std::string build_reflect_message(const std::optional<StateHeader>& canonical,
                                  const std::string& user_message,
                                  const std::string& answer);

struct ReflectRequest {
    Provider* provider = nullptr;
    StatePersistence* persistence = nullptr;
    Memory* memory = nullptr;
    const PersonaConfig* persona = nullptr;
    std::string model;
    std::string user_message;
    std::string answer;
};

// Never throws; failures come back as ReflectStatus::Failed
ReflectReport run_reflect_writeback(const ReflectRequest& request);

} // namespace dharma
