#pragma once

#include "config/LogLevel.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string_view>

namespace logging {

enum class LogCategory { NET, DATA, CACHE, INDICATOR, API };

// Admits one message per interval for a repetitive log site and counts the
// ones held back in between.
class Throttle {
public:
    explicit Throttle(std::chrono::milliseconds interval);

    // True when the site may log now. suppressedOut receives the number of
    // messages rejected since the previous admitted one.
    bool admit(std::uint64_t& suppressedOut);

private:
    const std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::chrono::steady_clock::time_point lastAdmitted_{};
    bool admittedOnce_{false};
    std::uint64_t suppressed_{0};
};

class Log {
public:
    static void set_log_level(config::LogLevel level);
    static config::LogLevel get_log_level();

    static bool try_parse_log_level(std::string_view value, config::LogLevel& levelOut);
    static const char* level_to_string(config::LogLevel level);
    static const char* category_to_string(LogCategory category);

    static void log(config::LogLevel level, LogCategory category, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

    // Like log(), but gated by `throttle`. The admitted line carries the
    // number of messages suppressed since the previous one.
    static void throttled(Throttle& throttle, config::LogLevel level, LogCategory category, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 4, 5)))
#endif
        ;

    // Drains the background writer. Called once at process teardown.
    static void flush();

private:
    static bool enabled(config::LogLevel level);
    static void vlog(config::LogLevel level, LogCategory category, const char* suffix, const char* fmt, std::va_list args);

    static std::atomic<config::LogLevel> currentLevel;
};

}  // namespace logging

#define LOG_ERROR(cat, ...) ::logging::Log::log(::config::LogLevel::Error, (cat), __VA_ARGS__)
#define LOG_WARN(cat, ...)  ::logging::Log::log(::config::LogLevel::Warn,  (cat), __VA_ARGS__)
#define LOG_INFO(cat, ...)  ::logging::Log::log(::config::LogLevel::Info,  (cat), __VA_ARGS__)
#define LOG_DEBUG(cat, ...) ::logging::Log::log(::config::LogLevel::Debug, (cat), __VA_ARGS__)
#define LOG_TRACE(cat, ...) ::logging::Log::log(::config::LogLevel::Trace, (cat), __VA_ARGS__)

#define LOG_WARN_THROTTLED(throttle, cat, ...) \
    ::logging::Log::throttled((throttle), ::config::LogLevel::Warn, (cat), __VA_ARGS__)
