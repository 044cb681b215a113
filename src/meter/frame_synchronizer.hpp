#pragma once

// Frame alignment for the AX-178 stream.
//
// The meter sends one 8-byte frame about every 380ms and a frame takes
// ~33ms on the wire. With a read timeout that is longer than one frame
// but much shorter than the gap between frames, an 8-byte read can only
// come back complete when it started on a frame boundary.

#include "axio/types.hpp"
#include "serial/byte_stream.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace axio {
namespace meter {

// Read timeouts threaded through synchronization and the read loop
struct ReadTimeouts {
    std::chrono::milliseconds sync{SYNC_TIMEOUT_MS};
    std::chrono::milliseconds steady{STEADY_TIMEOUT_MS};
};

struct SyncResult {
    bool aligned = false;                    // False only when cancelled
    std::chrono::milliseconds read_timeout{SYNC_TIMEOUT_MS};  // For subsequent frame reads
    uint64_t attempts = 0;                   // 8-byte reads issued
};

class FrameSynchronizer {
public:
    static constexpr size_t JUNK_READ_SIZE = 16;

    FrameSynchronizer() = default;
    explicit FrameSynchronizer(const ReadTimeouts& timeouts);

    // Block until a full frame is read in one call, then return the
    // steady-state timeout. Retries without bound; returns early with
    // aligned == false only if `running` is cleared.
    SyncResult synchronize(serial::ByteStream& stream,
                           const std::atomic<bool>* running = nullptr) const;

private:
    ReadTimeouts timeouts_;
};

} // namespace meter
} // namespace axio
