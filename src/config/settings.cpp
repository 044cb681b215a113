#include "settings.hpp"

#include <cstdlib>
#include <fstream>

#include <sys/stat.h>
#define MKDIR(path) mkdir(path, 0755)

namespace axio {
namespace config {

namespace {

bool parseBool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes";
}

// Create every parent directory of a file path
void ensureParentDirectory(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) {
        return;
    }

    std::string dir = path.substr(0, pos);
    for (size_t i = 1; i < dir.size(); i++) {
        if (dir[i] == '/') {
            MKDIR(dir.substr(0, i).c_str());
        }
    }
    MKDIR(dir.c_str());
}

} // namespace

std::string LoggerSettings::getDefaultPath() {
    const char* config_override = std::getenv("AXIO_CONFIG");
    if (config_override && config_override[0] != '\0') {
        return std::string(config_override);
    }

    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/axio-logger/settings.ini";
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.config/axio-logger/settings.ini";
    }
    return "axio-logger.ini";
}

bool LoggerSettings::save(const std::string& path) const {
    std::string filepath = path.empty() ? getDefaultPath() : path;
    ensureParentDirectory(filepath);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    file << "# AXIO MET AX-178 logger settings\n";
    file << "\n[Serial]\n";
    file << "port=" << port << "\n";
    file << "baud=" << baud_rate << "\n";

    file << "\n[Output]\n";
    file << "csv=" << (csv ? "1" : "0") << "\n";
    file << "raw=" << (raw ? "1" : "0") << "\n";
    file << "timestamp=" << output::timestampStyleToString(timestamp) << "\n";

    file << "\n[Logging]\n";
    file << "log_level=" << logLevelToString(log_level) << "\n";
    file << "log_file=" << log_file << "\n";

    file << "\n[Timing]\n";
    file << "sync_timeout_ms=" << sync_timeout_ms << "\n";
    file << "steady_timeout_ms=" << steady_timeout_ms << "\n";

    return file.good();
}

bool LoggerSettings::load(const std::string& path) {
    std::string filepath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // Skip empty lines, comments and section headers
        if (line.empty() || line[0] == '#' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);

        if (key == "port") {
            port = value;
        } else if (key == "baud") {
            int baud = std::atoi(value.c_str());
            if (baud > 0) {
                baud_rate = baud;
            } else {
                LOG_APP(WARN, "Settings: ignoring baud '%s'", value.c_str());
            }
        } else if (key == "csv") {
            csv = parseBool(value);
        } else if (key == "raw") {
            raw = parseBool(value);
        } else if (key == "timestamp") {
            if (auto style = output::stringToTimestampStyle(value)) {
                timestamp = *style;
            } else {
                LOG_APP(WARN, "Settings: unknown timestamp style '%s'", value.c_str());
            }
        } else if (key == "log_level") {
            if (auto level = stringToLogLevel(value)) {
                log_level = *level;
            } else {
                LOG_APP(WARN, "Settings: unknown log level '%s'", value.c_str());
            }
        } else if (key == "log_file") {
            log_file = value;
        } else if (key == "sync_timeout_ms") {
            int ms = std::atoi(value.c_str());
            if (ms > 0) sync_timeout_ms = ms;
        } else if (key == "steady_timeout_ms") {
            int ms = std::atoi(value.c_str());
            if (ms > 0) steady_timeout_ms = ms;
        }
    }

    return true;
}

serial::SerialConfig LoggerSettings::serialConfig() const {
    serial::SerialConfig config;
    config.baud_rate = baud_rate;
    return config;
}

meter::DriverConfig LoggerSettings::driverConfig() const {
    meter::DriverConfig config;
    config.output_mode = raw ? meter::OutputMode::Raw : meter::OutputMode::Decoded;
    config.timeouts.sync = std::chrono::milliseconds(sync_timeout_ms);
    config.timeouts.steady = std::chrono::milliseconds(steady_timeout_ms);
    return config;
}

output::OutputConfig LoggerSettings::outputConfig() const {
    output::OutputConfig config;
    config.csv = csv;
    config.timestamp = timestamp;
    return config;
}

} // namespace config
} // namespace axio
