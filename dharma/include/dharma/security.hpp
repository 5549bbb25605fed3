#pragma once
// Security: shared rate and cost limits, tenant scoping
//
// SecurityPolicy is shared across concurrent turns through a
// std::shared_ptr; every counter inside it is mutex guarded. Nothing here
// is a process global, so tests and tenants get independent policies.

#include "config.hpp"
#include "temperature.hpp"
#include "types.hpp"
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace dharma {

constexpr const char* ACTION_LIMIT_EXCEEDED_ERROR = "blocked by security policy: action limit exceeded";
constexpr const char* COST_LIMIT_EXCEEDED_ERROR = "blocked by security policy: daily cost limit exceeded";
constexpr const char* GLOBAL_ACTION_LIMIT_EXCEEDED_ERROR = "blocked by security policy: global action limit exceeded";
constexpr const char* ENTITY_ACTION_LIMIT_EXCEEDED_PREFIX = "blocked by security policy: entity action limit exceeded for ";
constexpr const char* TENANT_CROSS_SCOPE_DENIED_ERROR = "tenant policy denied cross-scope access";
constexpr const char* TENANT_DEFAULT_SCOPE_DENIED_ERROR = "tenant policy denied default scope fallback";

// Sliding one-hour window of action timestamps
class ActionTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit ActionTracker(Clock::duration window = std::chrono::hours(1))
        : window_(window) {}

    // Record one action; returns the count inside the window including it
    size_t record() {
        std::lock_guard<std::mutex> lock(mutex_);
        prune(Clock::now());
        actions_.push_back(Clock::now());
        return actions_.size();
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex_);
        prune(Clock::now());
        return actions_.size();
    }

private:
    void prune(Clock::time_point now) {
        while (!actions_.empty() && now - actions_.front() >= window_) {
            actions_.pop_front();
        }
    }

    Clock::duration window_;
    std::deque<Clock::time_point> actions_;
    std::mutex mutex_;
};

// Spend per UTC day; resets when the day changes
class CostTracker {
public:
    CostTracker() : day_(current_day()) {}

    // Zero-cost records only check that today's spend is within budget
    bool record(uint32_t cents, uint32_t max_cents_per_day) {
        std::lock_guard<std::mutex> lock(mutex_);
        rollover();
        if (cents == 0) return spent_ <= max_cents_per_day;
        if (static_cast<uint64_t>(spent_) + cents > max_cents_per_day) return false;
        spent_ += cents;
        return true;
    }

    uint32_t spent_today() {
        std::lock_guard<std::mutex> lock(mutex_);
        rollover();
        return spent_;
    }

private:
    static int64_t current_day() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count() / 86400;
    }

    void rollover() {
        int64_t today = current_day();
        if (today != day_) {
            day_ = today;
            spent_ = 0;
        }
    }

    int64_t day_;
    uint32_t spent_ = 0;
    std::mutex mutex_;
};

enum class RateLimitResult : uint8_t {
    Allowed = 0,
    GlobalExhausted = 1,
    EntityExhausted = 2,
};

// Global backstop plus one bucket per entity
class EntityRateLimiter {
public:
    EntityRateLimiter(uint32_t global_max, uint32_t per_entity_max)
        : global_max_(global_max), per_entity_max_(per_entity_max) {}

    RateLimitResult check_and_record(const std::string& entity_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (global_.count() >= global_max_) return RateLimitResult::GlobalExhausted;
        auto& bucket = per_entity_[entity_id];
        if (!bucket) bucket = std::make_unique<ActionTracker>();
        if (bucket->count() >= per_entity_max_) return RateLimitResult::EntityExhausted;
        global_.record();
        bucket->record();
        return RateLimitResult::Allowed;
    }

private:
    uint32_t global_max_;
    uint32_t per_entity_max_;
    ActionTracker global_;
    std::unordered_map<std::string, std::unique_ptr<ActionTracker>> per_entity_;
    std::mutex mutex_;
};

class SecurityPolicy {
public:
    explicit SecurityPolicy(const AutonomyConfig& autonomy = AutonomyConfig())
        : autonomy_(autonomy),
          entity_limiter_(autonomy.max_actions_per_hour, autonomy.max_actions_per_entity_per_hour) {}

    SecurityPolicy(const SecurityPolicy&) = delete;
    SecurityPolicy& operator=(const SecurityPolicy&) = delete;

    static std::shared_ptr<SecurityPolicy> from_config(const AutonomyConfig& autonomy) {
        return std::make_shared<SecurityPolicy>(autonomy);
    }

    AutonomyLevel effective_autonomy_level() const { return autonomy_.effective_autonomy_level(); }
    const TemperatureBand& selected_temperature_band() const { return autonomy_.selected_temperature_band(); }
    const AutonomyConfig& autonomy() const { return autonomy_; }

    bool can_act() const { return effective_autonomy_level() != AutonomyLevel::ReadOnly; }

    TemperatureClamp clamp_temperature(double requested) const {
        return dharma::clamp_temperature(requested, effective_autonomy_level(),
                                         autonomy_.temperature_bands);
    }

    // True when the action fits the hourly window
    bool record_action() {
        return tracker_.record() <= autonomy_.max_actions_per_hour;
    }

    bool is_rate_limited() {
        return tracker_.count() >= autonomy_.max_actions_per_hour;
    }

    // One action plus estimated spend; error receives the denial text
    bool consume_action_and_cost(uint32_t estimated_cost_cents, std::string& error) {
        if (!record_action()) {
            error = ACTION_LIMIT_EXCEEDED_ERROR;
            return false;
        }
        if (!cost_tracker_.record(estimated_cost_cents, autonomy_.max_cost_per_day_cents)) {
            error = COST_LIMIT_EXCEEDED_ERROR;
            return false;
        }
        return true;
    }

    // One action against the global and per-entity buckets
    bool consume_entity_action(const std::string& entity_id, std::string& error) {
        switch (entity_limiter_.check_and_record(entity_id)) {
            case RateLimitResult::Allowed:
                return true;
            case RateLimitResult::GlobalExhausted:
                error = GLOBAL_ACTION_LIMIT_EXCEEDED_ERROR;
                return false;
            case RateLimitResult::EntityExhausted:
                error = std::string(ENTITY_ACTION_LIMIT_EXCEEDED_PREFIX) + "'" + entity_id + "'";
                return false;
        }
        return false;
    }

    EntityRateLimiter& entity_limiter() { return entity_limiter_; }
    CostTracker& cost_tracker() { return cost_tracker_; }

private:
    AutonomyConfig autonomy_;
    ActionTracker tracker_;
    CostTracker cost_tracker_;
    EntityRateLimiter entity_limiter_;
};

// Which entity scopes a turn may read and write
class TenantPolicyContext {
public:
    static TenantPolicyContext disabled() { return TenantPolicyContext(); }
    static TenantPolicyContext enabled(const std::string& tenant_id) {
        TenantPolicyContext ctx;
        ctx.enabled_ = true;
        ctx.tenant_id_ = tenant_id;
        return ctx;
    }
    static TenantPolicyContext from_config(const TenantConfig& config) {
        return config.enabled ? enabled(config.tenant_id) : disabled();
    }

    bool tenant_mode_enabled() const { return enabled_; }
    const std::string& tenant_id() const { return tenant_id_; }

    // Allowed: "<tenant>", "<tenant>:..." and "<tenant>/..." when enabled,
    // anything when disabled
    bool enforce_recall_scope(const std::string& entity_id, std::string& error) const {
        if (!enabled_) return true;
        if (entity_id == "default") {
            error = TENANT_DEFAULT_SCOPE_DENIED_ERROR;
            return false;
        }
        if (entity_id == tenant_id_ ||
            starts_with(entity_id, tenant_id_ + ":") ||
            starts_with(entity_id, tenant_id_ + "/")) {
            return true;
        }
        error = TENANT_CROSS_SCOPE_DENIED_ERROR;
        return false;
    }

private:
    bool enabled_ = false;
    std::string tenant_id_;
};

} // namespace dharma
