#include "util/log.hpp"

#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace
{
    std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

    std::mutex& io_mutex()
    {
        static std::mutex m;
        return m;
    }

    bool iequals(std::string_view a, std::string_view b)
    {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i])))
                return false;
        }
        return true;
    }
}

void set_log_level(LogLevel level) noexcept
{
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() noexcept
{
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool parse_log_level(std::string_view s, LogLevel& out) noexcept
{
    if (iequals(s, "debug")) { out = LogLevel::Debug; return true; }
    if (iequals(s, "info"))  { out = LogLevel::Info;  return true; }
    if (iequals(s, "warn") || iequals(s, "warning")) { out = LogLevel::Warn; return true; }
    if (iequals(s, "error")) { out = LogLevel::Error; return true; }
    return false;
}

LogLine::LogLine(LogLevel level, std::string_view tag)
: level_(level)
, enabled_(static_cast<int>(level) >= g_level.load(std::memory_order_relaxed))
{
    if (enabled_) os_ << "[" << tag << "] ";
}

LogLine::~LogLine()
{
    if (!enabled_) return;
    os_ << '\n';
    const std::string line = os_.str();
    std::lock_guard<std::mutex> lk(io_mutex());
    if (level_ >= LogLevel::Warn) {
        std::cerr << line << std::flush;
    } else {
        std::cout << line << std::flush;
    }
}
