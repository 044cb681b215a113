#include "frame_decoder.hpp"
#include "axio/logging.hpp"

#include <algorithm>

namespace axio {
namespace meter {

namespace {

bool unitIs(const PendingMeasurement& m, const char* unit) {
    return m.unit == unit;
}

const std::vector<ScalingRule> kScalingRules = {
    {"ohm-range",
     [](const PendingMeasurement& m, const BitField&) { return unitIs(m, "Ohm"); },
     [](PendingMeasurement& m, const BitField& bits) {
         if (bits.test(FrameBits::RANGE_HIGH)) {
             m.unit = "M Ohm";
             m.value /= 100;
         } else if (bits.test(FrameBits::RANGE_LOW)) {
             m.unit = "k Ohm";
             m.value /= 10;
         }
     }},
    {"percent-capacitance",
     [](const PendingMeasurement& m, const BitField& bits) {
         return unitIs(m, "%") && bits.test(FrameBits::CAPACITANCE);
     },
     [](PendingMeasurement& m, const BitField&) {
         m.unit = "nF";
         m.value /= 1000;
     }},
    {"capacitance-range",
     [](const PendingMeasurement& m, const BitField& bits) {
         return unitIs(m, "nF") && bits.test(FrameBits::RANGE_HIGH);
     },
     [](PendingMeasurement& m, const BitField&) {
         m.unit = "uF";
         m.value *= 10;
     }},
    {"vac-range",
     [](const PendingMeasurement& m, const BitField&) { return unitIs(m, "V AC"); },
     [](PendingMeasurement& m, const BitField& bits) {
         m.negative = false;
         if (bits.test(FrameBits::RANGE_LOW)) {
             m.value *= 100;
         }
     }},
    {"mvdc-to-aac",
     [](const PendingMeasurement& m, const BitField& bits) {
         return unitIs(m, "mV DC") && bits.test(FrameBits::ALT_FUNCTION);
     },
     [](PendingMeasurement& m, const BitField&) {
         m.unit = "A AC";
         m.negative = false;
         m.value /= 10;
     }},
    {"vdc-to-maacdc",
     [](const PendingMeasurement& m, const BitField& bits) {
         return unitIs(m, "V DC") && bits.test(FrameBits::ALT_FUNCTION);
     },
     [](PendingMeasurement& m, const BitField&) {
         m.unit = "mA AC DC";
         m.value *= 10;
     }},
    {"mvac-to-aacdc",
     [](const PendingMeasurement& m, const BitField& bits) {
         return unitIs(m, "mV AC") && bits.test(FrameBits::ALT_FUNCTION);
     },
     [](PendingMeasurement& m, const BitField&) {
         m.unit = "A AC DC";
         m.value /= 10;
     }},
    // Relabel only. The reading is already in mA on this position as far
    // as observed; no rescale is applied.
    {"vac-to-madc",
     [](const PendingMeasurement& m, const BitField& bits) {
         return unitIs(m, "V AC") && bits.test(FrameBits::ALT_FUNCTION);
     },
     [](PendingMeasurement& m, const BitField&) {
         m.unit = "mA DC";
     }},
    {"dbm-to-maac",
     [](const PendingMeasurement& m, const BitField&) {
         return unitIs(m, "dBm") && m.negative;
     },
     [](PendingMeasurement& m, const BitField&) {
         m.unit = "ma AC";
         m.value /= 10;
         m.negative = false;
     }},
    {"uaac-unsigned",
     [](const PendingMeasurement& m, const BitField&) { return unitIs(m, "uA AC"); },
     [](PendingMeasurement& m, const BitField&) {
         m.negative = false;
     }},
};

} // namespace

BitField BitField::fromFrame(const Frame& frame) {
    uint32_t bits = static_cast<uint32_t>(frame[0]) |
                    (static_cast<uint32_t>(frame[1]) << 8) |
                    (static_cast<uint32_t>(frame[2]) << 16);
    return BitField(bits);
}

std::string BitField::toString() const {
    std::string out(WIDTH, '0');
    for (unsigned i = 0; i < WIDTH; ++i) {
        if (test(i)) {
            out[i] = '1';
        }
    }
    return out;
}

const char* decodeStatusToString(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::Ok:            return "OK";
        case DecodeStatus::UnknownMode:   return "UNKNOWN_MODE";
        case DecodeStatus::InvalidDigits: return "INVALID_DIGITS";
        default: return "UNKNOWN";
    }
}

FrameDecoder::FrameDecoder()
    : table_(ModeTable::instance()) {}

FrameDecoder::FrameDecoder(const ModeTable& table)
    : table_(table) {}

DigitBytes FrameDecoder::digitBytes(const Frame& frame) {
    DigitBytes digits{};
    std::copy(frame.begin() + FLAG_BYTES, frame.end(), digits.begin());
    return digits;
}

std::optional<uint32_t> FrameDecoder::parseMagnitude(const DigitBytes& digits) {
    uint32_t magnitude = 0;
    for (uint8_t byte : digits) {
        if (byte > 9) {
            return std::nullopt;
        }
        magnitude = magnitude * 10 + byte;
    }
    return magnitude;
}

const std::vector<ScalingRule>& FrameDecoder::scalingRules() {
    return kScalingRules;
}

DecodeResult FrameDecoder::decode(const Frame& frame) const {
    DecodeResult result;
    BitField bits = BitField::fromFrame(frame);
    result.digits = digitBytes(frame);
    result.mode_key = bits.modeKey();

    auto magnitude = parseMagnitude(result.digits);
    if (!magnitude) {
        result.status = DecodeStatus::InvalidDigits;
        LOG_DECODE(DEBUG, "Invalid digit bytes %02x %02x %02x %02x %02x",
                   result.digits[0], result.digits[1], result.digits[2],
                   result.digits[3], result.digits[4]);
        return result;
    }
    result.magnitude = *magnitude;

    const Mode* mode = table_.find(result.mode_key);
    if (!mode) {
        result.status = DecodeStatus::UnknownMode;
        LOG_DECODE(DEBUG, "Unknown mode %s (v=%u)",
                   modeKeyToPattern(result.mode_key).c_str(), result.magnitude);
        return result;
    }

    PendingMeasurement pending;
    pending.value = static_cast<double>(result.magnitude) / mode->divisor;
    pending.unit = mode->unit;
    pending.negative = bits.test(FrameBits::NEGATIVE);

    for (const auto& rule : kScalingRules) {
        if (rule.applies(pending, bits)) {
            rule.apply(pending, bits);
            LOG_DECODE(TRACE, "Rule %s -> %s", rule.name, pending.unit.c_str());
        }
    }

    if (bits.test(FrameBits::TIMES_TEN)) {
        pending.value *= 10;
    }

    if (pending.negative) {
        pending.value = -pending.value;
    }

    result.measurement.unit = pending.unit;
    if (!bits.test(FrameBits::OVER_RANGE)) {
        result.measurement.value = pending.value;
    }
    return result;
}

RawFrame FrameDecoder::decodeRaw(const Frame& frame) const {
    BitField bits = BitField::fromFrame(frame);

    RawFrame raw;
    raw.bits = bits.toString();
    raw.mode_bits = modeKeyToPattern(bits.modeKey());
    raw.negative = bits.test(FrameBits::NEGATIVE);
    for (uint8_t byte : digitBytes(frame)) {
        raw.digits += std::to_string(byte);
    }
    return raw;
}

} // namespace meter
} // namespace axio
