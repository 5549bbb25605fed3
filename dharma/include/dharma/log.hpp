#pragma once
// Log: tagged diagnostics on stderr
//
// Lines look like "[verify_repair] verify/repair retrying turn attempt=1".
// The sink can be replaced with a callback (tests capture warnings that way)
// and the threshold comes from DHARMA_LOG_LEVEL (debug|info|warn|error).

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace dharma {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

inline bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug") out = LogLevel::Debug;
    else if (name == "info") out = LogLevel::Info;
    else if (name == "warn" || name == "warning") out = LogLevel::Warn;
    else if (name == "error") out = LogLevel::Error;
    else return false;
    return true;
}

// Callback for log lines: level, component tag, message
using LogSink = std::function<void(LogLevel, const std::string&, const std::string&)>;

namespace detail {

struct LogState {
    std::mutex mutex;
    LogSink sink;
    LogLevel threshold = LogLevel::Info;

    LogState() {
        if (const char* env = std::getenv("DHARMA_LOG_LEVEL")) {
            parse_log_level(env, threshold);
        }
    }
};

// Never destroyed: detached threads may log during static teardown
inline LogState& log_state() {
    static LogState* state = new LogState();
    return *state;
}

} // namespace detail

inline void set_log_sink(LogSink sink) {
    auto& state = detail::log_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.sink = std::move(sink);
}

// Back to stderr
inline void reset_log_sink() {
    set_log_sink(nullptr);
}

inline void set_log_level(LogLevel level) {
    auto& state = detail::log_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.threshold = level;
}

// The sink runs outside the lock so it may log itself
inline void log(LogLevel level, const std::string& tag, const std::string& message) {
    auto& state = detail::log_state();
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (level < state.threshold) return;
        sink = state.sink;
    }
    if (sink) {
        sink(level, tag, message);
        return;
    }
    std::ostringstream line;
    line << "[" << tag << "] ";
    if (level >= LogLevel::Warn) line << log_level_name(level) << ": ";
    line << message << "\n";
    std::cerr << line.str();
}

inline void log_debug(const std::string& tag, const std::string& message) { log(LogLevel::Debug, tag, message); }
inline void log_info(const std::string& tag, const std::string& message) { log(LogLevel::Info, tag, message); }
inline void log_warn(const std::string& tag, const std::string& message) { log(LogLevel::Warn, tag, message); }
inline void log_error(const std::string& tag, const std::string& message) { log(LogLevel::Error, tag, message); }

// Builds "message key=value key=value" lines
class LogLine {
public:
    explicit LogLine(std::string message) { out_ << message; }

    template<typename T>
    LogLine& kv(const char* key, const T& value) {
        out_ << " " << key << "=" << value;
        return *this;
    }

    std::string str() const { return out_.str(); }

private:
    std::ostringstream out_;
};

} // namespace dharma
