#pragma once

#include "axio/types.hpp"

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace axio {
namespace serial {

// Unrecoverable I/O failure on the underlying channel (disconnect,
// permission, hardware error). Never retried by the reader.
class StreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Abstract byte source the frame reader consumes
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Read up to `count` bytes, waiting at most `timeout` in total.
    // Returns fewer than `count` bytes only when the timeout expires or
    // the wait is interrupted by a signal. Throws StreamError on failure.
    virtual Bytes read(size_t count, std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual std::string name() const = 0;
};

} // namespace serial
} // namespace axio
