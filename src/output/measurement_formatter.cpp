#include "measurement_formatter.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace axio {
namespace output {

const char* timestampStyleToString(TimestampStyle style) {
    switch (style) {
        case TimestampStyle::None: return "none";
        case TimestampStyle::Unix: return "unix";
        case TimestampStyle::Iso:  return "iso";
        default: return "unknown";
    }
}

std::optional<TimestampStyle> stringToTimestampStyle(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "none" || lower.empty()) return TimestampStyle::None;
    if (lower == "unix" || lower == "epoch") return TimestampStyle::Unix;
    if (lower == "iso") return TimestampStyle::Iso;
    return std::nullopt;
}

MeasurementFormatter::MeasurementFormatter(const OutputConfig& config)
    : config_(config) {}

std::string MeasurementFormatter::formatValue(double value) {
    // Positional between 1e-4 and 1e16, exponent form outside
    double magnitude = std::fabs(value);
    bool positional = magnitude == 0.0 || (magnitude >= 1e-4 && magnitude < 1e16);

    char buf[64];
    auto [end, ec] = positional
        ? std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed)
        : std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        std::snprintf(buf, sizeof(buf), "%.17g", value);
        return buf;
    }

    std::string out(buf, end);
    bool integral = std::all_of(out.begin(), out.end(), [](char c) {
        return c == '-' || std::isdigit(static_cast<unsigned char>(c));
    });
    if (integral) {
        out += ".0";
    }
    return out;
}

std::string MeasurementFormatter::formatTimestamp(TimePoint timestamp) const {
    using namespace std::chrono;

    auto since_epoch = duration_cast<microseconds>(timestamp.time_since_epoch()).count();
    long long secs = since_epoch / 1000000;
    long long usecs = since_epoch % 1000000;
    if (usecs < 0) {
        secs -= 1;
        usecs += 1000000;
    }

    char buf[64];
    if (config_.timestamp == TimestampStyle::Unix) {
        std::snprintf(buf, sizeof(buf), "%lld.%06lld", secs, usecs);
        return buf;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm local{};
    localtime_r(&t, &local);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &local);
    std::snprintf(buf, sizeof(buf), "%s.%06lld", date, usecs);
    return buf;
}

std::string MeasurementFormatter::formatMeasurement(const meter::Measurement& m,
                                                    std::optional<TimePoint> timestamp) const {
    std::string line;
    if (timestamp && config_.timestamp != TimestampStyle::None) {
        line += formatTimestamp(*timestamp);
        line += separator();
    }

    line += m.isOverflow() ? std::string("OVERFLOW") : formatValue(*m.value);
    line += separator();
    line += m.unit;
    return line;
}

std::string MeasurementFormatter::formatRaw(const meter::RawFrame& raw) const {
    return raw.bits + " " + raw.mode_bits + " " + (raw.negative ? "1" : "0") + " " + raw.digits;
}

std::string MeasurementFormatter::formatDiagnostic(const meter::DecodeResult& result) const {
    char buf[128];
    switch (result.status) {
        case meter::DecodeStatus::UnknownMode:
            std::snprintf(buf, sizeof(buf), "Unknown measurement mode %s (v=%u)",
                          meter::modeKeyToPattern(result.mode_key).c_str(), result.magnitude);
            return buf;
        case meter::DecodeStatus::InvalidDigits:
            std::snprintf(buf, sizeof(buf), "Invalid digit bytes %02x %02x %02x %02x %02x",
                          result.digits[0], result.digits[1], result.digits[2],
                          result.digits[3], result.digits[4]);
            return buf;
        case meter::DecodeStatus::Ok:
        default:
            return std::string();
    }
}

} // namespace output
} // namespace axio
