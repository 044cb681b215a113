#include "serial_port.hpp"
#include "axio/logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace axio {
namespace serial {

namespace {

speed_t baudToSpeed(int baud_rate) {
    switch (baud_rate) {
        case 1200: return B1200;
        case 2400: return B2400;
        case 4800: return B4800;
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        default: return 0;
    }
}

tcflag_t dataBitsToFlag(int data_bits) {
    switch (data_bits) {
        case 5: return CS5;
        case 6: return CS6;
        case 7: return CS7;
        default: return CS8;
    }
}

std::string errnoMessage(const std::string& what, const std::string& port) {
    return what + " '" + port + "' (" + std::strerror(errno) + ")";
}

} // namespace

const char* parityToString(Parity parity) {
    switch (parity) {
        case Parity::None: return "N";
        case Parity::Even: return "E";
        case Parity::Odd:  return "O";
        default: return "?";
    }
}

SerialPort::~SerialPort() {
    close();
}

bool SerialPort::isOpen() const {
    return fd_ >= 0;
}

void SerialPort::open(const std::string& port_name, const SerialConfig& config) {
    if (port_name.empty()) {
        throw StreamError("serial port name is empty");
    }

    speed_t speed = baudToSpeed(config.baud_rate);
    if (speed == 0) {
        throw StreamError("unsupported baud rate " + std::to_string(config.baud_rate));
    }

    close();

    fd_ = ::open(port_name.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        std::string msg = errnoMessage("failed to open", port_name);
        LOG_SERIAL(ERROR, "%s", msg.c_str());
        throw StreamError(msg);
    }

    termios tio{};
    if (tcgetattr(fd_, &tio) != 0) {
        std::string msg = errnoMessage("tcgetattr failed on", port_name);
        close();
        throw StreamError(msg);
    }

    cfmakeraw(&tio);
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);

    tio.c_cflag &= ~(CSIZE | PARENB | PARODD | CSTOPB | CRTSCTS);
    tio.c_cflag |= dataBitsToFlag(config.data_bits);
    if (config.parity != Parity::None) {
        tio.c_cflag |= PARENB;
        if (config.parity == Parity::Odd) {
            tio.c_cflag |= PARODD;
        }
    }
    if (config.stop_bits == 2) {
        tio.c_cflag |= CSTOPB;
    }
    tio.c_cflag |= (CLOCAL | CREAD);

    // Reads are bounded by poll(), not by the driver
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd_, TCSANOW, &tio) != 0) {
        std::string msg = errnoMessage("tcsetattr failed on", port_name);
        close();
        throw StreamError(msg);
    }

    tcflush(fd_, TCIFLUSH);

    port_name_ = port_name;
    config_ = config;
    LOG_SERIAL(INFO, "Opened serial port '%s' @ %d %d%s%d",
               port_name_.c_str(), config_.baud_rate, config_.data_bits,
               parityToString(config_.parity), config_.stop_bits);
}

void SerialPort::close() {
    if (!isOpen()) {
        return;
    }

    ::close(fd_);
    fd_ = -1;
    LOG_SERIAL(INFO, "Closed serial port '%s'", port_name_.c_str());
    port_name_.clear();
}

Bytes SerialPort::read(size_t count, std::chrono::milliseconds timeout) {
    if (!isOpen()) {
        throw StreamError("serial port is not open");
    }

    Bytes data;
    data.reserve(count);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    uint8_t buf[64];

    while (data.size() < count) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) {
                // Signal delivered; hand back what has arrived
                break;
            }
            throw StreamError(errnoMessage("poll failed on", port_name_));
        }
        if (ret == 0) {
            break;
        }

        if (!(pfd.revents & POLLIN)) {
            if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                throw StreamError("serial device '" + port_name_ + "' disconnected");
            }
            continue;
        }

        size_t want = std::min(sizeof(buf), count - data.size());
        ssize_t n = ::read(fd_, buf, want);
        if (n < 0) {
            if (errno == EINTR) {
                break;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            throw StreamError(errnoMessage("read failed on", port_name_));
        }
        if (n == 0) {
            throw StreamError("serial device '" + port_name_ + "' returned end of file");
        }
        data.insert(data.end(), buf, buf + n);
    }

    LOG_SERIAL(TRACE, "read(%zu, %lldms) -> %zu bytes", count,
               static_cast<long long>(timeout.count()), data.size());
    return data;
}

} // namespace serial
} // namespace axio
