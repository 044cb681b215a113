#pragma once

// DriverLoop - reads frames from a serial stream and dispatches them
//
// Synchronizes once, then reads one frame per steady-state timeout.
// A short read means the reader lost frame alignment: it is dropped and
// the stream is synchronized again. Runs until `running` is cleared.

#include "axio/types.hpp"
#include "frame_decoder.hpp"
#include "frame_synchronizer.hpp"
#include "serial/byte_stream.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>

namespace axio {
namespace meter {

enum class OutputMode {
    Decoded,  // Scaled measurements
    Raw       // Frame fields without interpretation
};

const char* outputModeToString(OutputMode mode);

struct DriverConfig {
    OutputMode output_mode = OutputMode::Decoded;
    ReadTimeouts timeouts;
};

struct DriverStats {
    uint64_t frames_read = 0;
    uint64_t measurements = 0;
    uint64_t unknown_modes = 0;
    uint64_t invalid_frames = 0;
    uint64_t sync_losses = 0;
    uint64_t sync_attempts = 0;   // 8-byte alignment reads, all synchronizations
};

class DriverLoop {
public:
    DriverLoop(serial::ByteStream& stream, const DriverConfig& config);

    using MeasurementCallback = std::function<void(const Measurement&, std::optional<TimePoint>)>;
    void setMeasurementCallback(MeasurementCallback callback) { measurement_callback_ = callback; }

    // Unknown mode / invalid digits; the frame is dropped
    using DiagnosticCallback = std::function<void(const DecodeResult&)>;
    void setDiagnosticCallback(DiagnosticCallback callback) { diagnostic_callback_ = callback; }

    using RawFrameCallback = std::function<void(const RawFrame&, std::optional<TimePoint>)>;
    void setRawFrameCallback(RawFrameCallback callback) { raw_frame_callback_ = callback; }

    // Called with the size of the short read before resynchronizing
    using SyncLostCallback = std::function<void(size_t bytes_read)>;
    void setSyncLostCallback(SyncLostCallback callback) { sync_lost_callback_ = callback; }

    // Timestamps are attached only when a clock is set
    using Clock = std::function<TimePoint()>;
    void setClock(Clock clock) { clock_ = clock; }

    // Blocks until `running` is cleared, then closes the stream.
    // StreamError from the stream propagates to the caller.
    void run(const std::atomic<bool>& running);

    const DriverStats& getStats() const { return stats_; }

private:
    bool synchronize(const std::atomic<bool>& running);
    void processFrame(const Frame& frame);

    serial::ByteStream& stream_;
    DriverConfig config_;
    FrameSynchronizer synchronizer_;
    FrameDecoder decoder_;
    std::chrono::milliseconds read_timeout_;
    DriverStats stats_;

    MeasurementCallback measurement_callback_;
    DiagnosticCallback diagnostic_callback_;
    RawFrameCallback raw_frame_callback_;
    SyncLostCallback sync_lost_callback_;
    Clock clock_;
};

} // namespace meter
} // namespace axio
