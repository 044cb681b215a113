#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace axio {

// Core types
using Bytes = std::vector<uint8_t>;                       // Raw serial data
using TimePoint = std::chrono::system_clock::time_point;  // Wall-clock timestamp

// AX-178 frame layout: 3 flag bytes followed by 5 digit bytes
constexpr size_t FRAME_SIZE = 8;
constexpr size_t FLAG_BYTES = 3;
constexpr size_t DIGIT_COUNT = FRAME_SIZE - FLAG_BYTES;

using Frame = std::array<uint8_t, FRAME_SIZE>;
using DigitBytes = std::array<uint8_t, DIGIT_COUNT>;

// Serial line defaults used by the meter
constexpr int DEFAULT_BAUD_RATE = 2400;

// A frame takes 8 * (8 + 1 + 1) / 2400 = 33ms on the wire and one
// arrives every ~380ms.
constexpr int SYNC_TIMEOUT_MS = 50;     // Admits one frame, never two
constexpr int STEADY_TIMEOUT_MS = 400;  // Covers the full inter-frame period

} // namespace axio
