#pragma once
// Observer: lifecycle signals emitted while a turn runs
//
// Callers register a callback to count or export these; the control plane
// itself only emits.

#include <cstdint>
#include <functional>

namespace dharma {

enum class TurnSignal : uint8_t {
    IntentCreated = 0,
    IntentPolicyAllowed = 1,
    IntentPolicyDenied = 2,
    TemperatureClamped = 3,
    ContradictionDetected = 4,
};

inline const char* turn_signal_name(TurnSignal signal) {
    switch (signal) {
        case TurnSignal::IntentCreated:         return "intent_created";
        case TurnSignal::IntentPolicyAllowed:   return "intent_policy_allowed";
        case TurnSignal::IntentPolicyDenied:    return "intent_policy_denied";
        case TurnSignal::TemperatureClamped:    return "temperature_clamped";
        case TurnSignal::ContradictionDetected: return "contradiction_detected";
    }
    return "unknown";
}

using SignalCallback = std::function<void(TurnSignal)>;

} // namespace dharma
