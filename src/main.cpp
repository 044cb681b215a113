/**
 * axio-logger - AXIO MET AX-178 multimeter logger
 *
 * Reads the meter's serial output and prints one measurement per line.
 */

#include "axio/logging.hpp"
#include "axio/types.hpp"
#include "config/settings.hpp"
#include "meter/driver_loop.hpp"
#include "output/measurement_formatter.hpp"
#include "serial/serial_port.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using namespace axio;

// Signal handling for clean shutdown
static std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* prog) {
    std::cerr << "AXIO MET AX-178 logger\n\n";
    std::cerr << "Usage: " << prog << " [options] <port>\n\n";
    std::cerr << "  <port>            Serial port to read (e.g. /dev/ttyUSB0)\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -c, --csv         Output comma-separated values\n";
    std::cerr << "  -i, --iso-time    Prefix values with ISO timestamp\n";
    std::cerr << "  -u, --unix-time   Prefix values with Unix epoch timestamp\n";
    std::cerr << "  -r, --raw         Print raw frame fields\n";
    std::cerr << "  -b <baud>         Serial baud rate (default: 2400)\n";
    std::cerr << "  -f <file>         Settings file (default: $AXIO_CONFIG or\n";
    std::cerr << "                    ~/.config/axio-logger/settings.ini)\n";
    std::cerr << "  -v                Debug logging\n";
    std::cerr << "  -l <file>         Append log output to file (default: stderr)\n";
    std::cerr << "  -h, --help        Show this help\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " /dev/ttyUSB0\n";
    std::cerr << "  " << prog << " -c -i /dev/ttyUSB0 > readings.csv\n";
}

int main(int argc, char* argv[]) {
    // Settings file first so command-line options win
    std::string settings_path;
    for (int i = 1; i < argc - 1; ++i) {
        if (std::strcmp(argv[i], "-f") == 0) {
            settings_path = argv[i + 1];
        }
    }

    config::LoggerSettings settings;
    if (settings.load(settings_path)) {
        LOG_APP(DEBUG, "Loaded settings from %s",
                settings_path.empty() ? config::LoggerSettings::getDefaultPath().c_str()
                                      : settings_path.c_str());
    } else if (!settings_path.empty()) {
        std::cerr << "Error: Cannot read settings file " << settings_path << "\n";
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--csv") {
            settings.csv = true;
        } else if (arg == "-i" || arg == "--iso-time") {
            settings.timestamp = output::TimestampStyle::Iso;
        } else if (arg == "-u" || arg == "--unix-time") {
            settings.timestamp = output::TimestampStyle::Unix;
        } else if (arg == "-r" || arg == "--raw") {
            settings.raw = true;
        } else if (arg == "-v") {
            settings.log_level = LogLevel::DEBUG;
        } else if (arg == "-b" && i + 1 < argc) {
            settings.baud_rate = std::atoi(argv[++i]);
        } else if (arg == "-l" && i + 1 < argc) {
            settings.log_file = argv[++i];
        } else if (arg == "-f" && i + 1 < argc) {
            ++i;  // Already loaded
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n\n";
            printUsage(argv[0]);
            return 1;
        } else {
            settings.port = arg;
        }
    }

    if (settings.port.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    setLogLevel(settings.log_level);

    FILE* log_file = nullptr;
    if (!settings.log_file.empty()) {
        log_file = std::fopen(settings.log_file.c_str(), "a");
        if (!log_file) {
            std::cerr << "Error: Cannot open log file " << settings.log_file << ": "
                      << std::strerror(errno) << "\n";
            return 1;
        }
        setLogFile(log_file);
    }
    LOG_APP(DEBUG, "Logging at %s", logLevelToString(getLogLevel()));

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    output::MeasurementFormatter formatter(settings.outputConfig());
    serial::SerialPort port;
    int exit_code = 0;

    try {
        port.open(settings.port, settings.serialConfig());

        meter::DriverLoop loop(port, settings.driverConfig());
        if (settings.timestamp != output::TimestampStyle::None) {
            loop.setClock([]() { return std::chrono::system_clock::now(); });
        }
        loop.setMeasurementCallback([&formatter](const meter::Measurement& m,
                                                 std::optional<TimePoint> ts) {
            std::cout << formatter.formatMeasurement(m, ts) << "\n" << std::flush;
        });
        loop.setRawFrameCallback([&formatter](const meter::RawFrame& raw,
                                              std::optional<TimePoint>) {
            std::cout << formatter.formatRaw(raw) << "\n" << std::flush;
        });
        loop.setDiagnosticCallback([&formatter](const meter::DecodeResult& result) {
            std::cerr << formatter.formatDiagnostic(result) << "\n";
        });
        loop.setSyncLostCallback([](size_t) {
            std::cerr << "Synchronization lost; retrying\n";
        });

        loop.run(g_running);

        const auto& stats = loop.getStats();
        LOG_APP(DEBUG, "Sync attempts: %llu",
                static_cast<unsigned long long>(stats.sync_attempts));
    } catch (const serial::StreamError& e) {
        LOG_APP(ERROR, "%s", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = 1;
    }

    if (log_file) {
        setLogFile(nullptr);
        std::fclose(log_file);
    }
    return exit_code;
}
