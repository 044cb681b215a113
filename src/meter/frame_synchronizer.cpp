#include "frame_synchronizer.hpp"
#include "axio/logging.hpp"

namespace axio {
namespace meter {

FrameSynchronizer::FrameSynchronizer(const ReadTimeouts& timeouts)
    : timeouts_(timeouts) {}

SyncResult FrameSynchronizer::synchronize(serial::ByteStream& stream,
                                          const std::atomic<bool>* running) const {
    SyncResult result;
    result.read_timeout = timeouts_.sync;

    LOG_SYNC(INFO, "Synchronizing to frame boundary on %s", stream.name().c_str());

    Bytes junk = stream.read(JUNK_READ_SIZE, timeouts_.sync);
    LOG_SYNC(DEBUG, "Discarded %zu bytes", junk.size());

    while (!running || running->load()) {
        Bytes data = stream.read(FRAME_SIZE, timeouts_.sync);
        result.attempts++;
        LOG_SYNC(DEBUG, "Attempt %llu: %zu bytes",
                 static_cast<unsigned long long>(result.attempts), data.size());

        if (data.size() == FRAME_SIZE) {
            result.aligned = true;
            result.read_timeout = timeouts_.steady;
            LOG_SYNC(INFO, "Synchronized after %llu attempts",
                     static_cast<unsigned long long>(result.attempts));
            return result;
        }
    }

    LOG_SYNC(INFO, "Synchronization cancelled after %llu attempts",
             static_cast<unsigned long long>(result.attempts));
    return result;
}

} // namespace meter
} // namespace axio
