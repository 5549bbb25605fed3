#pragma once
// Temperature Clamp: keep sampling temperature inside the autonomy band

#include "config.hpp"
#include "log.hpp"
#include <algorithm>

namespace dharma {

struct TemperatureClamp {
    double value = 0.0;         // Temperature to send to the provider
    double requested = 0.0;
    TemperatureBand band;
    AutonomyLevel level = AutonomyLevel::Supervised;
    bool clamped = false;       // value != requested
};

inline TemperatureClamp clamp_temperature(double requested, AutonomyLevel level,
                                          const TemperatureBands& bands) {
    TemperatureClamp result;
    result.requested = requested;
    result.level = level;
    result.band = bands.for_level(level);
    result.value = std::clamp(requested, result.band.min, result.band.max);
    result.clamped = result.value != requested;
    return result;
}

inline std::string clamp_notice(const TemperatureClamp& c) {
    return LogLine("temperature clamped to autonomy band")
        .kv("autonomy_level", autonomy_level_name(c.level))
        .kv("requested", c.requested)
        .kv("clamped", c.value)
        .kv("band_min", c.band.min)
        .kv("band_max", c.band.max)
        .str();
}

// Clamp and log the notice when the value moved
inline TemperatureClamp clamp_temperature_logged(double requested, AutonomyLevel level,
                                                 const TemperatureBands& bands) {
    TemperatureClamp result = clamp_temperature(requested, level, bands);
    if (result.clamped) {
        log_info("temperature", clamp_notice(result));
    }
    return result;
}

} // namespace dharma
