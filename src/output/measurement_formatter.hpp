#pragma once

// Text rendering of meter output: one line per measurement or raw frame,
// plus diagnostic lines for frames that could not be decoded.

#include "axio/types.hpp"
#include "meter/frame_decoder.hpp"

#include <optional>
#include <string>

namespace axio {
namespace output {

enum class TimestampStyle {
    None,
    Unix,   // Seconds since the epoch, microsecond resolution
    Iso     // Local ISO-8601 time, microsecond resolution
};

const char* timestampStyleToString(TimestampStyle style);
std::optional<TimestampStyle> stringToTimestampStyle(const std::string& str);

struct OutputConfig {
    bool csv = false;   // Comma separator instead of tab
    TimestampStyle timestamp = TimestampStyle::None;
};

class MeasurementFormatter {
public:
    MeasurementFormatter() = default;
    explicit MeasurementFormatter(const OutputConfig& config);

    const char* separator() const { return config_.csv ? "," : "\t"; }

    // "[timestamp<sep>]value<sep>unit"; timestamp omitted when the style
    // is None or no time is given
    std::string formatMeasurement(const meter::Measurement& m,
                                  std::optional<TimePoint> timestamp) const;

    // "bits mode_bits sign digits"
    std::string formatRaw(const meter::RawFrame& raw) const;

    // Line for the error channel; empty for a successful result
    std::string formatDiagnostic(const meter::DecodeResult& result) const;

    std::string formatTimestamp(TimePoint timestamp) const;

    // Shortest round-trip digits, always with a decimal point or exponent.
    // Magnitudes below 1e-4 or from 1e16 up use the exponent form.
    static std::string formatValue(double value);

private:
    OutputConfig config_;
};

} // namespace output
} // namespace axio
