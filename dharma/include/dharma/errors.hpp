#pragma once
// Turn errors: what a turn caller can see go wrong
//
// - PolicyDenied / BudgetExhausted: fatal, never retried
// - ExecutionFailed: routed through verify/repair
// - Escalated: terminal, produced by verify/repair itself
//
// Guard rejections and best-effort side effects never surface here.

#include <cstdint>
#include <stdexcept>
#include <string>

namespace dharma {

enum class TurnErrorKind : uint8_t {
    PolicyDenied = 0,
    BudgetExhausted = 1,
    ExecutionFailed = 2,
    Escalated = 3,
};

inline const char* turn_error_kind_name(TurnErrorKind kind) {
    switch (kind) {
        case TurnErrorKind::PolicyDenied:    return "policy_denied";
        case TurnErrorKind::BudgetExhausted: return "budget_exhausted";
        case TurnErrorKind::ExecutionFailed: return "execution_failed";
        case TurnErrorKind::Escalated:       return "escalated";
    }
    return "execution_failed";
}

class TurnError : public std::runtime_error {
public:
    TurnError(TurnErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    TurnErrorKind kind() const { return kind_; }

    // Fatal errors skip the verify/repair loop entirely
    bool fatal() const {
        return kind_ == TurnErrorKind::PolicyDenied ||
               kind_ == TurnErrorKind::BudgetExhausted;
    }

    static TurnError policy_denied(const std::string& message) {
        return TurnError(TurnErrorKind::PolicyDenied, message);
    }
    static TurnError budget_exhausted(const std::string& message) {
        return TurnError(TurnErrorKind::BudgetExhausted, message);
    }
    static TurnError execution_failed(const std::string& message) {
        return TurnError(TurnErrorKind::ExecutionFailed, message);
    }

private:
    TurnErrorKind kind_;
};

} // namespace dharma
