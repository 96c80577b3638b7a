#pragma once

#include <sstream>
#include <string>

namespace volley {

enum class LogLevel {
    Quiet = 0,
    Info = 1,
    Debug = 2
};

// Process-wide threshold, Quiet by default.
void set_log_level(LogLevel level);
LogLevel log_level();

inline bool log_enabled(LogLevel level) {
    return level != LogLevel::Quiet && static_cast<int>(level) <= static_cast<int>(log_level());
}

// Writes "* message" to stderr. Lines from different threads never interleave.
void log(LogLevel level, const std::string& message);

// Collects one line and hands it to log() when destroyed. Values streamed
// into a filtered-out line are not formatted.
class LogLine {
public:
    explicit LogLine(LogLevel level) : level_(level), enabled_(log_enabled(level)) {}
    ~LogLine() {
        if (enabled_) {
            log(level_, os_.str());
        }
    }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) {
            os_ << value;
        }
        return *this;
    }

private:
    LogLevel level_;
    bool enabled_;
    std::ostringstream os_;
};

inline LogLine log_info() { return LogLine(LogLevel::Info); }
inline LogLine log_debug() { return LogLine(LogLevel::Debug); }

} // namespace volley
