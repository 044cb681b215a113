#pragma once

#include "axio/logging.hpp"
#include "axio/types.hpp"
#include "meter/driver_loop.hpp"
#include "output/measurement_formatter.hpp"
#include "serial/serial_port.hpp"

#include <string>

namespace axio {
namespace config {

// Settings that persist across runs. Command-line options override them.
struct LoggerSettings {
    // Save/load to file
    bool save(const std::string& path = "") const;
    bool load(const std::string& path = "");

    // $AXIO_CONFIG, else ~/.config/axio-logger/settings.ini
    static std::string getDefaultPath();

    // Serial line
    std::string port;                       // e.g. /dev/ttyUSB0
    int baud_rate = DEFAULT_BAUD_RATE;

    // Output
    bool csv = false;
    bool raw = false;
    output::TimestampStyle timestamp = output::TimestampStyle::None;

    // Logging
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;                   // empty = stderr

    // Frame timing
    int sync_timeout_ms = SYNC_TIMEOUT_MS;
    int steady_timeout_ms = STEADY_TIMEOUT_MS;

    serial::SerialConfig serialConfig() const;
    meter::DriverConfig driverConfig() const;
    output::OutputConfig outputConfig() const;
};

} // namespace config
} // namespace axio
