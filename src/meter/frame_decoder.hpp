#pragma once

// AX-178 frame decoding
//
// Frame layout (8 bytes):
//   bytes 0-2  flag bits, little-endian, bit i = bit (i % 8) of byte (i / 8)
//   bytes 3-7  reading digits, most significant first, one numeral per byte
//
// Flag bits:
//   0       reading x10
//   1, 2    range bits (k/M Ohm, uF, V AC x100)
//   3-11    mode key (see mode_table.hpp)
//   12      alternate function (current ranges on the voltage positions)
//   13      overload ("OL" on the display)
//   14      capacitance on the % position
//   21      negative reading

#include "axio/types.hpp"
#include "mode_table.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace axio {
namespace meter {

namespace FrameBits {
    constexpr unsigned TIMES_TEN = 0;
    constexpr unsigned RANGE_LOW = 1;
    constexpr unsigned RANGE_HIGH = 2;
    constexpr unsigned MODE_FIRST = 3;
    constexpr unsigned ALT_FUNCTION = 12;
    constexpr unsigned OVER_RANGE = 13;
    constexpr unsigned CAPACITANCE = 14;
    constexpr unsigned NEGATIVE = 21;
}

// 24-bit view of the flag bytes
class BitField {
public:
    static constexpr unsigned WIDTH = 24;

    BitField() = default;
    explicit BitField(uint32_t bits) : bits_(bits & 0xFFFFFFu) {}

    static BitField fromFrame(const Frame& frame);

    bool test(unsigned index) const {
        return index < WIDTH && ((bits_ >> index) & 1u) != 0;
    }

    uint32_t value() const { return bits_; }
    ModeKey modeKey() const {
        return static_cast<ModeKey>((bits_ >> FrameBits::MODE_FIRST) & MODE_KEY_MASK);
    }

    // Bits as '0'/'1' characters in index order
    std::string toString() const;

private:
    uint32_t bits_ = 0;
};

struct Measurement {
    std::optional<double> value;  // nullopt when the meter reports overload
    std::string unit;

    bool isOverflow() const { return !value.has_value(); }
};

enum class DecodeStatus {
    Ok,
    UnknownMode,    // Mode key not in the table; frame dropped
    InvalidDigits   // A digit byte is not a numeral; frame dropped
};

const char* decodeStatusToString(DecodeStatus status);

struct DecodeResult {
    DecodeStatus status = DecodeStatus::Ok;
    Measurement measurement;    // Valid only when status == Ok
    ModeKey mode_key = 0;
    uint32_t magnitude = 0;     // Unscaled 5-digit reading
    DigitBytes digits{};        // Digit bytes as received

    bool ok() const { return status == DecodeStatus::Ok; }
};

// Frame fields exposed without interpretation (raw output mode)
struct RawFrame {
    std::string bits;       // 24 flag bits in index order
    std::string mode_bits;  // 9 mode key bits in index order
    bool negative = false;
    std::string digits;     // Digit byte values concatenated in decimal
};

// Measurement under construction while the scaling rules run
struct PendingMeasurement {
    double value = 0.0;
    std::string unit;
    bool negative = false;
};

// One unit-conditional rewrite. Rules run in table order and each one
// tests the unit left by the rules before it.
struct ScalingRule {
    const char* name;
    bool (*applies)(const PendingMeasurement& m, const BitField& bits);
    void (*apply)(PendingMeasurement& m, const BitField& bits);
};

class FrameDecoder {
public:
    FrameDecoder();
    explicit FrameDecoder(const ModeTable& table);

    // Decode one frame into a scaled measurement
    DecodeResult decode(const Frame& frame) const;

    // Split one frame into its raw fields
    RawFrame decodeRaw(const Frame& frame) const;

    // Parse the digit bytes; nullopt if any byte is outside 0-9.
    // ASCII numerals are rejected, matching the decimal text decodeRaw prints.
    static std::optional<uint32_t> parseMagnitude(const DigitBytes& digits);

    static DigitBytes digitBytes(const Frame& frame);

    // Ordered rule chain applied after the mode divisor
    static const std::vector<ScalingRule>& scalingRules();

private:
    const ModeTable& table_;
};

} // namespace meter
} // namespace axio
