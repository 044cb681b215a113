#include "axio/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdarg>

namespace axio {

LogLevel g_log_level = LogLevel::INFO;
LogCategories g_log_categories;
std::chrono::steady_clock::time_point g_log_start_time = std::chrono::steady_clock::now();

namespace {

FILE* g_log_file = nullptr;

} // namespace

void setLogLevel(LogLevel level) {
    g_log_level = level;
}

LogLevel getLogLevel() {
    return g_log_level;
}

void setLogFile(FILE* file) {
    g_log_file = file;
}

void log(LogLevel level, const char* category, const char* fmt, ...) {
    if (level > g_log_level) {
        return;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - g_log_start_time).count();
    int secs = static_cast<int>(elapsed / 1000);
    int ms = static_cast<int>(elapsed % 1000);

    char buf[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    FILE* out = g_log_file ? g_log_file : stderr;
    fprintf(out, "[%3d.%03d][%-5s][%-5s] %s\n", secs, ms,
            logLevelToString(level), category ? category : "", buf);
    fflush(out);
}

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "?";
    }
}

std::optional<LogLevel> stringToLogLevel(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "error") return LogLevel::ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "trace") return LogLevel::TRACE;
    return std::nullopt;
}

} // namespace axio
