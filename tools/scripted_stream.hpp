// Test helpers: a ByteStream that replays a fixed script of reads, and
// builders for AX-178 frames.

#pragma once

#include "axio/types.hpp"
#include "meter/mode_table.hpp"
#include "serial/byte_stream.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <initializer_list>
#include <string>
#include <vector>

namespace axio {
namespace test {

// Each read() returns the next scripted chunk (split if larger than the
// requested count). When the script runs out the stop flag is cleared,
// or StreamError is thrown if no flag was given.
class ScriptedStream : public serial::ByteStream {
public:
    struct ReadCall {
        size_t count;
        std::chrono::milliseconds timeout;
    };

    explicit ScriptedStream(std::atomic<bool>* running = nullptr)
        : running_(running) {}

    void push(const Bytes& chunk) { chunks_.push_back(chunk); }
    void push(const Frame& frame) { chunks_.emplace_back(frame.begin(), frame.end()); }
    void pushJunk(size_t count) { chunks_.emplace_back(count, 0xA5); }

    // Clear the stop flag while serving read number `index` (0-based)
    void cancelOnRead(size_t index) { cancel_on_read_ = index; }

    Bytes read(size_t count, std::chrono::milliseconds timeout) override {
        size_t index = calls_.size();
        calls_.push_back({count, timeout});

        if (running_ && index == cancel_on_read_) {
            *running_ = false;
        }

        if (chunks_.empty()) {
            if (!running_) {
                throw serial::StreamError("scripted stream exhausted");
            }
            *running_ = false;
            return {};
        }

        Bytes chunk = chunks_.front();
        chunks_.pop_front();
        if (chunk.size() > count) {
            chunks_.emplace_front(chunk.begin() + count, chunk.end());
            chunk.resize(count);
        }
        return chunk;
    }

    void close() override { closed_ = true; }
    bool isOpen() const override { return !closed_; }
    std::string name() const override { return "scripted"; }

    const std::vector<ReadCall>& calls() const { return calls_; }
    size_t remaining() const { return chunks_.size(); }
    bool closed() const { return closed_; }

private:
    std::atomic<bool>* running_;
    std::deque<Bytes> chunks_;
    std::vector<ReadCall> calls_;
    size_t cancel_on_read_ = static_cast<size_t>(-1);
    bool closed_ = false;
};

// Build a frame for `key` with the 5-digit `magnitude` and extra flag bits
inline Frame makeFrame(meter::ModeKey key, uint32_t magnitude,
                       std::initializer_list<unsigned> bits = {}) {
    uint32_t flags = static_cast<uint32_t>(key & meter::MODE_KEY_MASK) << 3;
    for (unsigned bit : bits) {
        flags |= (1u << bit);
    }

    Frame frame{};
    frame[0] = static_cast<uint8_t>(flags & 0xFF);
    frame[1] = static_cast<uint8_t>((flags >> 8) & 0xFF);
    frame[2] = static_cast<uint8_t>((flags >> 16) & 0xFF);

    for (int i = static_cast<int>(FRAME_SIZE) - 1; i >= static_cast<int>(FLAG_BYTES); --i) {
        frame[i] = static_cast<uint8_t>(magnitude % 10);
        magnitude /= 10;
    }
    return frame;
}

inline Frame makeFrame(const std::string& unit, uint32_t magnitude,
                       std::initializer_list<unsigned> bits = {}) {
    auto key = meter::ModeTable::instance().keyForUnit(unit);
    return makeFrame(key ? *key : meter::ModeKey{0}, magnitude, bits);
}

} // namespace test
} // namespace axio
