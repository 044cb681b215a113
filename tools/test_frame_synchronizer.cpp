// test_frame_synchronizer.cpp - Unit test for frame alignment
//
// Tests:
// 1. Short reads are retried until a full frame arrives in one read
// 2. Read timeouts: short while aligning, steady-state afterwards
// 3. Cancellation ends an alignment that never succeeds

#include "meter/frame_synchronizer.hpp"
#include "scripted_stream.hpp"
#include <iostream>
#include <string>

using namespace axio;
using namespace axio::meter;
using axio::test::ScriptedStream;
using axio::test::makeFrame;
using std::chrono::milliseconds;

int main() {
    std::cout << "=== Frame Synchronizer Unit Test ===\n\n";

    int pass = 0, fail = 0;
    auto check = [&](bool ok, const std::string& name) {
        std::cout << (ok ? "  [PASS] " : "  [FAIL] ") << name << "\n";
        (ok ? pass : fail)++;
    };

    // ========================================================================
    // TEST 1: Retry until aligned
    // ========================================================================
    std::cout << "TEST 1: Retry until aligned\n";
    {
        ScriptedStream stream;
        stream.pushJunk(16);
        stream.push(Bytes(3, 0x11));
        stream.push(Bytes(5, 0x22));
        stream.push(makeFrame("V DC", 1));
        stream.push(makeFrame("V DC", 2));
        stream.push(makeFrame("V DC", 3));

        FrameSynchronizer sync;
        SyncResult result = sync.synchronize(stream);

        check(result.aligned, "aligned");
        check(result.attempts == 3, "three 8-byte attempts (3, 5, 8 bytes)");
        check(stream.calls().size() == 4, "junk read plus three attempts");
        check(stream.remaining() == 2, "returns on the first full read");
    }

    // ========================================================================
    // TEST 2: Read timeouts
    // ========================================================================
    std::cout << "\nTEST 2: Read timeouts\n";
    {
        ScriptedStream stream;
        stream.pushJunk(10);
        stream.push(Bytes(7, 0x00));
        stream.push(makeFrame("Hz", 1));

        FrameSynchronizer sync;
        SyncResult result = sync.synchronize(stream);
        const auto& calls = stream.calls();

        check(calls.size() == 3 && calls[0].count == FrameSynchronizer::JUNK_READ_SIZE,
              "first read discards 16 bytes");
        bool short_timeouts = true;
        for (const auto& call : calls) {
            short_timeouts = short_timeouts && call.timeout == milliseconds(SYNC_TIMEOUT_MS);
        }
        check(short_timeouts, "all alignment reads use 50ms");
        check(calls.size() == 3 && calls[1].count == FRAME_SIZE && calls[2].count == FRAME_SIZE,
              "attempts read 8 bytes");
        check(result.read_timeout == milliseconds(STEADY_TIMEOUT_MS),
              "steady-state timeout is 400ms after alignment");

        ReadTimeouts custom;
        custom.sync = milliseconds(20);
        custom.steady = milliseconds(900);
        ScriptedStream stream2;
        stream2.pushJunk(16);
        stream2.push(makeFrame("Hz", 1));
        SyncResult r2 = FrameSynchronizer(custom).synchronize(stream2);
        check(stream2.calls()[1].timeout == milliseconds(20) &&
              r2.read_timeout == milliseconds(900),
              "configured timeouts are used");
    }

    // ========================================================================
    // TEST 3: Cancellation
    // ========================================================================
    std::cout << "\nTEST 3: Cancellation\n";
    {
        std::atomic<bool> running{true};
        ScriptedStream stream(&running);
        stream.pushJunk(16);
        for (int i = 0; i < 5; ++i) {
            stream.push(Bytes(4, 0x00));
        }

        FrameSynchronizer sync;
        SyncResult result = sync.synchronize(stream, &running);

        check(!result.aligned, "not aligned when cancelled");
        check(result.attempts == 6, "retried until the stream stopped");
        check(result.read_timeout == milliseconds(SYNC_TIMEOUT_MS),
              "timeout stays short when not aligned");
    }

    std::cout << "\n=== Results: " << pass << " passed, " << fail << " failed ===\n";
    return fail > 0 ? 1 : 0;
}
