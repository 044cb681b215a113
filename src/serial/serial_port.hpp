#pragma once

#include "byte_stream.hpp"

#include <string>

namespace axio {
namespace serial {

enum class Parity {
    None = 0,
    Even = 1,
    Odd = 2
};

// Line settings; defaults match the AX-178 (2400 8N1)
struct SerialConfig {
    int baud_rate = DEFAULT_BAUD_RATE;
    int data_bits = 8;      // 5-8
    Parity parity = Parity::None;
    int stop_bits = 1;      // 1 or 2
};

const char* parityToString(Parity parity);

class SerialPort : public ByteStream {
public:
    SerialPort() = default;
    ~SerialPort() override;

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    // Open and configure the device. Throws StreamError on failure.
    void open(const std::string& port_name, const SerialConfig& config = {});

    // ByteStream interface
    Bytes read(size_t count, std::chrono::milliseconds timeout) override;
    void close() override;
    bool isOpen() const override;
    std::string name() const override { return port_name_; }

private:
    int fd_ = -1;
    std::string port_name_;
    SerialConfig config_;
};

} // namespace serial
} // namespace axio
