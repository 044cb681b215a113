#include "driver_loop.hpp"
#include "axio/logging.hpp"

#include <algorithm>

namespace axio {
namespace meter {

const char* outputModeToString(OutputMode mode) {
    switch (mode) {
        case OutputMode::Decoded: return "decoded";
        case OutputMode::Raw:     return "raw";
        default: return "unknown";
    }
}

DriverLoop::DriverLoop(serial::ByteStream& stream, const DriverConfig& config)
    : stream_(stream),
      config_(config),
      synchronizer_(config.timeouts),
      read_timeout_(config.timeouts.sync) {}

bool DriverLoop::synchronize(const std::atomic<bool>& running) {
    SyncResult sync = synchronizer_.synchronize(stream_, &running);
    stats_.sync_attempts += sync.attempts;
    read_timeout_ = sync.read_timeout;
    return sync.aligned;
}

void DriverLoop::run(const std::atomic<bool>& running) {
    LOG_APP(INFO, "Reading %s (%s output)", stream_.name().c_str(),
            outputModeToString(config_.output_mode));

    bool aligned = synchronize(running);

    while (aligned && running.load()) {
        Bytes data = stream_.read(FRAME_SIZE, read_timeout_);

        // Anything read after cancellation is discarded
        if (!running.load()) {
            break;
        }

        if (data.size() != FRAME_SIZE) {
            stats_.sync_losses++;
            LOG_SYNC(WARN, "Synchronization lost (%zu of %zu bytes); retrying",
                     data.size(), FRAME_SIZE);
            if (sync_lost_callback_) {
                sync_lost_callback_(data.size());
            }
            aligned = synchronize(running);
            continue;
        }

        stats_.frames_read++;
        Frame frame{};
        std::copy(data.begin(), data.end(), frame.begin());
        processFrame(frame);
    }

    LOG_APP(INFO, "Stopping: %llu frames, %llu measurements, %llu sync losses",
            static_cast<unsigned long long>(stats_.frames_read),
            static_cast<unsigned long long>(stats_.measurements),
            static_cast<unsigned long long>(stats_.sync_losses));
    stream_.close();
}

void DriverLoop::processFrame(const Frame& frame) {
    std::optional<TimePoint> timestamp;
    if (clock_) {
        timestamp = clock_();
    }

    if (config_.output_mode == OutputMode::Raw) {
        if (raw_frame_callback_) {
            raw_frame_callback_(decoder_.decodeRaw(frame), timestamp);
        }
        return;
    }

    DecodeResult result = decoder_.decode(frame);
    if (!result.ok()) {
        LOG_DECODE(DEBUG, "Dropping frame %llu: %s",
                   static_cast<unsigned long long>(stats_.frames_read),
                   decodeStatusToString(result.status));
        if (result.status == DecodeStatus::UnknownMode) {
            stats_.unknown_modes++;
        } else {
            stats_.invalid_frames++;
        }
        if (diagnostic_callback_) {
            diagnostic_callback_(result);
        }
        return;
    }

    stats_.measurements++;
    if (measurement_callback_) {
        measurement_callback_(result.measurement, timestamp);
    }
}

} // namespace meter
} // namespace axio
