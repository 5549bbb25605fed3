#pragma once

#define DHARMA_VERSION "0.4.1"
#define DHARMA_STATE_SCHEMA_VERSION 1

namespace dharma {
namespace version {

inline bool state_schema_supported(unsigned int schema_version) {
    // Only the current canonical state layout is readable
    return schema_version == DHARMA_STATE_SCHEMA_VERSION;
}

} // namespace version
} // namespace dharma
