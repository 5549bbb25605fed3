#include <dharma/memory.hpp>

namespace dharma {

namespace {

// Parse by scanning the closed value range through its name function
template<typename Enum>
bool parse_by_name(const std::string& name, Enum& out, const char* (*namer)(Enum), uint8_t count) {
    for (uint8_t i = 0; i < count; ++i) {
        Enum candidate = static_cast<Enum>(i);
        if (name == namer(candidate)) {
            out = candidate;
            return true;
        }
    }
    return false;
}

} // namespace

const char* event_type_name(MemoryEventType t) {
    switch (t) {
        case MemoryEventType::FactAdded:           return "fact_added";
        case MemoryEventType::FactUpdated:         return "fact_updated";
        case MemoryEventType::SummaryCompacted:    return "summary_compacted";
        case MemoryEventType::InferredClaim:       return "inferred_claim";
        case MemoryEventType::ContradictionMarked: return "contradiction_marked";
    }
    return "unknown";
}

const char* memory_source_name(MemorySource s) {
    switch (s) {
        case MemorySource::ExplicitUser:      return "explicit_user";
        case MemorySource::System:            return "system";
        case MemorySource::Inferred:          return "inferred";
        case MemorySource::ExternalPrimary:   return "external_primary";
        case MemorySource::ExternalSecondary: return "external_secondary";
    }
    return "unknown";
}

const char* privacy_level_name(PrivacyLevel p) {
    switch (p) {
        case PrivacyLevel::Public:  return "public";
        case PrivacyLevel::Private: return "private";
        case PrivacyLevel::Secret:  return "secret";
    }
    return "unknown";
}

const char* memory_layer_name(MemoryLayer l) {
    switch (l) {
        case MemoryLayer::Working:  return "working";
        case MemoryLayer::Episodic: return "episodic";
        case MemoryLayer::Semantic: return "semantic";
    }
    return "unknown";
}

const char* source_kind_name(SourceKind k) {
    switch (k) {
        case SourceKind::Conversation: return "conversation";
        case SourceKind::Manual:       return "manual";
        case SourceKind::Api:          return "api";
        case SourceKind::Discord:      return "discord";
        case SourceKind::Telegram:     return "telegram";
        case SourceKind::Slack:        return "slack";
        case SourceKind::News:         return "news";
        case SourceKind::Document:     return "document";
    }
    return "unknown";
}

bool parse_event_type(const std::string& name, MemoryEventType& out) {
    return parse_by_name(name, out, event_type_name, 5);
}

bool parse_memory_source(const std::string& name, MemorySource& out) {
    return parse_by_name(name, out, memory_source_name, 5);
}

bool parse_privacy_level(const std::string& name, PrivacyLevel& out) {
    return parse_by_name(name, out, privacy_level_name, 3);
}

bool parse_memory_layer(const std::string& name, MemoryLayer& out) {
    return parse_by_name(name, out, memory_layer_name, 3);
}

bool parse_source_kind(const std::string& name, SourceKind& out) {
    return parse_by_name(name, out, source_kind_name, 8);
}

} // namespace dharma
