#include "mode_table.hpp"

namespace axio {
namespace meter {

namespace {

struct ModeEntry {
    const char* pattern;
    const char* unit;
    int divisor;
};

const ModeEntry kModeEntries[] = {
    {"001010000", "V AC",     10000},
    {"001010001", "%",        100},
    {"001010010", "mV DC",    1000},
    {"001010011", "nF",       100},
    {"001010100", "V DC",     10000},
    {"001010101", "Ohm",      100},
    {"001010110", "mV AC DC", 100},
    {"001010111", "uA AC",    100},
    {"001011000", "dBm",      100},
    {"001011001", "VF",       10000},
    {"001011010", "mV AC",    1000},
    {"001011011", "uA DC",    100},
    {"001011100", "A DC",     10000},
    {"001011110", "Hz",       1000},
    {"001011111", "uA AC DC", 100},
};

} // namespace

std::optional<ModeKey> modeKeyFromPattern(const std::string& pattern) {
    if (pattern.size() != MODE_KEY_BITS) {
        return std::nullopt;
    }

    ModeKey key = 0;
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '1') {
            key |= static_cast<ModeKey>(1u << i);
        } else if (pattern[i] != '0') {
            return std::nullopt;
        }
    }
    return key;
}

std::string modeKeyToPattern(ModeKey key) {
    std::string pattern(MODE_KEY_BITS, '0');
    for (unsigned i = 0; i < MODE_KEY_BITS; ++i) {
        if ((key >> i) & 1u) {
            pattern[i] = '1';
        }
    }
    return pattern;
}

ModeTable::ModeTable() {
    for (const auto& entry : kModeEntries) {
        // Patterns are compile-time literals; all of them parse
        auto key = modeKeyFromPattern(entry.pattern);
        if (key) {
            modes_.emplace(*key, Mode{entry.unit, entry.divisor});
        }
    }
}

const ModeTable& ModeTable::instance() {
    static const ModeTable table;
    return table;
}

const Mode* ModeTable::find(ModeKey key) const {
    auto it = modes_.find(key);
    if (it == modes_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<ModeKey> ModeTable::keyForUnit(const std::string& unit) const {
    for (const auto& [key, mode] : modes_) {
        if (mode.unit == unit) {
            return key;
        }
    }
    return std::nullopt;
}

} // namespace meter
} // namespace axio
