#pragma once

// AX-178 measurement modes
//
// Frame bits 3..11 select the function the rotary switch is in. Each mode
// names the unit and the divisor that turns the 5-digit reading into that
// unit, before any range/function bits are applied.

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace axio {
namespace meter {

// 9-bit mode selector. Bit i holds frame bit 3 + i.
using ModeKey = uint16_t;

constexpr unsigned MODE_KEY_BITS = 9;
constexpr ModeKey MODE_KEY_MASK = (1u << MODE_KEY_BITS) - 1;

struct Mode {
    std::string unit;
    int divisor = 1;
};

// Pattern strings list key bits in index order, e.g. "001010100" has
// bits 2, 4 and 6 set. Returns nullopt unless the pattern is 9 chars of 0/1.
std::optional<ModeKey> modeKeyFromPattern(const std::string& pattern);
std::string modeKeyToPattern(ModeKey key);

class ModeTable {
public:
    ModeTable();

    // Shared immutable table
    static const ModeTable& instance();

    // nullptr when the key is not a known mode
    const Mode* find(ModeKey key) const;

    std::optional<ModeKey> keyForUnit(const std::string& unit) const;

    const std::map<ModeKey, Mode>& entries() const { return modes_; }
    size_t size() const { return modes_.size(); }

private:
    std::map<ModeKey, Mode> modes_;
};

} // namespace meter
} // namespace axio
