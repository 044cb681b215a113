#pragma once

// Category logger shared by all modules.
//
// Usage:
//   LOG_SYNC(DEBUG, "attempt %llu returned %zu bytes", n, len);
//
// Lines are written as "[sss.mmm][LEVEL][CAT  ] message", with the time
// measured from program start.

#include <chrono>
#include <cstdio>
#include <optional>
#include <string>

// Windows headers define ERROR, which breaks LogLevel::ERROR
#if defined(_WIN32) && defined(ERROR)
#undef ERROR
#endif

namespace axio {

enum class LogLevel : int {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Per-category enable switches
struct LogCategories {
    bool serial = true;
    bool sync = true;
    bool decode = true;
    bool app = true;
};

extern LogLevel g_log_level;
extern LogCategories g_log_categories;
extern std::chrono::steady_clock::time_point g_log_start_time;

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Redirect log output (nullptr restores stderr). The caller owns the file.
void setLogFile(FILE* file);

void log(LogLevel level, const char* category, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

const char* logLevelToString(LogLevel level);
std::optional<LogLevel> stringToLogLevel(const std::string& str);

} // namespace axio

#define AXIO_LOG_IMPL(flag, tag, level, ...)                                  \
    do {                                                                      \
        if (::axio::g_log_level >= ::axio::LogLevel::level &&                 \
            ::axio::g_log_categories.flag) {                                  \
            ::axio::log(::axio::LogLevel::level, tag, __VA_ARGS__);           \
        }                                                                     \
    } while (0)

#define LOG_SERIAL(level, ...) AXIO_LOG_IMPL(serial, "SER", level, __VA_ARGS__)
#define LOG_SYNC(level, ...)   AXIO_LOG_IMPL(sync, "SYNC", level, __VA_ARGS__)
#define LOG_DECODE(level, ...) AXIO_LOG_IMPL(decode, "DEC", level, __VA_ARGS__)
#define LOG_APP(level, ...)    AXIO_LOG_IMPL(app, "APP", level, __VA_ARGS__)
