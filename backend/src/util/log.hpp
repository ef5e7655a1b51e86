#pragma once
#include <sstream>
#include <string>
#include <string_view>

// Tagged console logging: "[ingest] dropped frame ...".
// Debug/Info go to stdout, Warn/Error to stderr. Lines are written whole
// under a process-wide mutex so concurrent threads never interleave.
enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;

// Parses "debug" | "info" | "warn" | "error" (case-insensitive).
// Returns false and leaves `out` untouched on anything else.
bool parse_log_level(std::string_view s, LogLevel& out) noexcept;

class LogLine {
public:
    LogLine(LogLevel level, std::string_view tag);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& v) {
        if (enabled_) os_ << v;
        return *this;
    }

private:
    LogLevel level_;
    bool enabled_;
    std::ostringstream os_;
};

inline LogLine log_debug(std::string_view tag) { return LogLine(LogLevel::Debug, tag); }
inline LogLine log_info(std::string_view tag)  { return LogLine(LogLevel::Info, tag); }
inline LogLine log_warn(std::string_view tag)  { return LogLine(LogLevel::Warn, tag); }
inline LogLine log_error(std::string_view tag) { return LogLine(LogLevel::Error, tag); }
