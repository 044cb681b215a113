// test_measurement_formatter.cpp - Unit test for output lines
//
// Tests:
// 1. Value formatting
// 2. Measurement lines (tab, CSV, overload)
// 3. Timestamp prefixes
// 4. Raw and diagnostic lines
// 5. Lowest readings from decoded frames

#include "meter/frame_decoder.hpp"
#include "output/measurement_formatter.hpp"
#include "scripted_stream.hpp"
#include <iostream>
#include <string>

using namespace axio;
using namespace axio::output;

int main() {
    std::cout << "=== Measurement Formatter Unit Test ===\n\n";

    int pass = 0, fail = 0;
    auto check = [&](bool ok, const std::string& name) {
        std::cout << (ok ? "  [PASS] " : "  [FAIL] ") << name << "\n";
        (ok ? pass : fail)++;
    };

    // ========================================================================
    // TEST 1: Values
    // ========================================================================
    std::cout << "TEST 1: Values\n";
    {
        check(MeasurementFormatter::formatValue(0.1234) == "0.1234", "0.1234");
        check(MeasurementFormatter::formatValue(1234.0) == "1234.0", "integral value keeps .0");
        check(MeasurementFormatter::formatValue(-2.5) == "-2.5", "negative value");
        check(MeasurementFormatter::formatValue(0.0) == "0.0", "zero");
        check(MeasurementFormatter::formatValue(0.0001) == "0.0001", "0.0001 stays positional");
        check(MeasurementFormatter::formatValue(0.0005) == "0.0005", "0.0005 stays positional");
        check(MeasurementFormatter::formatValue(1e-05) == "1e-05", "below 1e-4 uses exponent");
        check(MeasurementFormatter::formatValue(-0.0001) == "-0.0001", "negative small value");
        check(MeasurementFormatter::formatValue(99999.0) == "99999.0", "full-scale reading");
    }

    // ========================================================================
    // TEST 2: Measurement lines
    // ========================================================================
    std::cout << "\nTEST 2: Measurement lines\n";
    {
        meter::Measurement m;
        m.value = 0.1234;
        m.unit = "V DC";

        MeasurementFormatter tab;
        check(tab.formatMeasurement(m, std::nullopt) == "0.1234\tV DC", "tab separated");

        OutputConfig csv_config;
        csv_config.csv = true;
        MeasurementFormatter csv(csv_config);
        check(csv.formatMeasurement(m, std::nullopt) == "0.1234,V DC", "comma separated");

        meter::Measurement over;
        over.unit = "M Ohm";
        check(tab.formatMeasurement(over, std::nullopt) == "OVERFLOW\tM Ohm", "overload");

        TimePoint ts{std::chrono::seconds(1700000000)};
        check(tab.formatMeasurement(m, ts) == "0.1234\tV DC",
              "timestamp ignored when style is none");
    }

    // ========================================================================
    // TEST 3: Timestamps
    // ========================================================================
    std::cout << "\nTEST 3: Timestamps\n";
    {
        meter::Measurement m;
        m.value = 1.5;
        m.unit = "Hz";
        TimePoint ts{std::chrono::milliseconds(1700000000500LL)};

        OutputConfig unix_config;
        unix_config.csv = true;
        unix_config.timestamp = TimestampStyle::Unix;
        MeasurementFormatter unix_fmt(unix_config);
        check(unix_fmt.formatMeasurement(m, ts) == "1700000000.500000,1.5,Hz", "unix timestamp");

        OutputConfig iso_config;
        iso_config.timestamp = TimestampStyle::Iso;
        MeasurementFormatter iso_fmt(iso_config);
        std::string iso = iso_fmt.formatTimestamp(ts);
        check(iso.size() == 26 && iso[4] == '-' && iso[10] == 'T' && iso[19] == '.' &&
              iso.substr(20) == "500000",
              "ISO timestamp " + iso);
        check(iso_fmt.formatMeasurement(m, ts) == iso + "\t1.5\tHz", "ISO prefix");

        check(stringToTimestampStyle("ISO") == TimestampStyle::Iso, "parse iso");
        check(stringToTimestampStyle("unix") == TimestampStyle::Unix, "parse unix");
        check(!stringToTimestampStyle("rfc"), "reject unknown style");
    }

    // ========================================================================
    // TEST 4: Raw and diagnostics
    // ========================================================================
    std::cout << "\nTEST 4: Raw and diagnostics\n";
    {
        MeasurementFormatter fmt;

        meter::RawFrame raw;
        raw.bits = "000001010100000000000100";
        raw.mode_bits = "001010100";
        raw.negative = true;
        raw.digits = "01234";
        check(fmt.formatRaw(raw) == "000001010100000000000100 001010100 1 01234", "raw line");

        meter::DecodeResult unknown;
        unknown.status = meter::DecodeStatus::UnknownMode;
        unknown.mode_key = *meter::modeKeyFromPattern("001011101");
        unknown.magnitude = 42;
        check(fmt.formatDiagnostic(unknown) == "Unknown measurement mode 001011101 (v=42)",
              "unknown mode line");

        meter::DecodeResult bad;
        bad.status = meter::DecodeStatus::InvalidDigits;
        bad.digits = {0, 1, 0xFF, 3, 4};
        check(fmt.formatDiagnostic(bad) == "Invalid digit bytes 00 01 ff 03 04", "invalid digits line");

        check(fmt.formatDiagnostic(meter::DecodeResult{}).empty(), "no diagnostic for success");
    }

    // ========================================================================
    // TEST 5: Lowest readings
    // ========================================================================
    std::cout << "\nTEST 5: Lowest readings\n";
    {
        using test::makeFrame;
        meter::FrameDecoder decoder;
        MeasurementFormatter fmt;

        auto line = [&](const Frame& frame) {
            auto r = decoder.decode(frame);
            return r.ok() ? fmt.formatMeasurement(r.measurement, std::nullopt) : std::string();
        };

        check(line(makeFrame("V AC", 1)) == "0.0001\tV AC", "V AC one count");
        check(line(makeFrame("V AC", 5)) == "0.0005\tV AC", "V AC five counts");
        check(line(makeFrame("%", 1, {meter::FrameBits::CAPACITANCE})) == "1e-05\tnF",
              "capacitance one count");
    }

    std::cout << "\n=== Results: " << pass << " passed, " << fail << " failed ===\n";
    return fail > 0 ? 1 : 0;
}
