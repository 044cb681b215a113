// test_mode_table.cpp - Unit test for the AX-178 mode table
//
// Tests:
// 1. Table holds the 15 known modes with their divisors
// 2. Pattern strings map to key bits in index order
// 3. Keys outside the table are not found

#include "meter/mode_table.hpp"
#include <iostream>
#include <string>

using namespace axio;
using namespace axio::meter;

int main() {
    std::cout << "=== Mode Table Unit Test ===\n\n";

    int pass = 0, fail = 0;
    auto check = [&](bool ok, const std::string& name) {
        std::cout << (ok ? "  [PASS] " : "  [FAIL] ") << name << "\n";
        (ok ? pass : fail)++;
    };

    const ModeTable& table = ModeTable::instance();

    // ========================================================================
    // TEST 1: Known modes
    // ========================================================================
    std::cout << "TEST 1: Known modes\n";
    {
        struct Expected {
            const char* pattern;
            const char* unit;
            int divisor;
        };
        const Expected expected[] = {
            {"001010000", "V AC", 10000},   {"001010001", "%", 100},
            {"001010010", "mV DC", 1000},   {"001010011", "nF", 100},
            {"001010100", "V DC", 10000},   {"001010101", "Ohm", 100},
            {"001010110", "mV AC DC", 100}, {"001010111", "uA AC", 100},
            {"001011000", "dBm", 100},      {"001011001", "VF", 10000},
            {"001011010", "mV AC", 1000},   {"001011011", "uA DC", 100},
            {"001011100", "A DC", 10000},   {"001011110", "Hz", 1000},
            {"001011111", "uA AC DC", 100},
        };

        check(table.size() == 15, "table has 15 entries");

        for (const auto& e : expected) {
            auto key = modeKeyFromPattern(e.pattern);
            const Mode* mode = key ? table.find(*key) : nullptr;
            check(mode && mode->unit == e.unit && mode->divisor == e.divisor,
                  std::string(e.pattern) + " -> " + e.unit);
        }
    }

    // ========================================================================
    // TEST 2: Pattern conversion
    // ========================================================================
    std::cout << "\nTEST 2: Pattern conversion\n";
    {
        auto key = modeKeyFromPattern("001010100");
        check(key && *key == ((1u << 2) | (1u << 4) | (1u << 6)),
              "\"001010100\" sets key bits 2, 4, 6");
        check(key && modeKeyToPattern(*key) == "001010100", "pattern survives key conversion");
        check(!modeKeyFromPattern("00101010"), "8-char pattern rejected");
        check(!modeKeyFromPattern("00101010x"), "non-binary pattern rejected");

        auto vdc = table.keyForUnit("V DC");
        check(vdc && key && *vdc == *key, "keyForUnit(\"V DC\") matches pattern");
        check(!table.keyForUnit("M Ohm"), "derived unit has no key");
    }

    // ========================================================================
    // TEST 3: Unknown keys
    // ========================================================================
    std::cout << "\nTEST 3: Unknown keys\n";
    {
        auto gap = modeKeyFromPattern("001011101");
        check(gap && table.find(*gap) == nullptr, "001011101 is not a mode");
        check(table.find(0) == nullptr, "all-zero key is not a mode");
        check(table.find(MODE_KEY_MASK) == nullptr, "all-ones key is not a mode");
    }

    std::cout << "\n=== Results: " << pass << " passed, " << fail << " failed ===\n";
    return fail > 0 ? 1 : 0;
}
