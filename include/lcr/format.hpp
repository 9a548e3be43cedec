#pragma once

#include <string>
#include <format>
#include <cstdint>
#include <algorithm>

#include "lcr/time_unit.hpp"


namespace lcr {

// Format a duration given in nanoseconds into a human-readable string
// Examples:
//   42        -> "42.0 ns"
//   1'234     -> "1.23 us"
//   12'345'678 -> "12.3 ms"
//   3'456'000'000 -> "3.46 s"
inline std::string format_duration(std::uint64_t ns) {
    double value = static_cast<double>(ns);
    const char* unit = "ns";

    if (value >= 1'000.0) {
        value /= 1'000.0;
        unit = "us";
    }
    if (value >= 1'000.0) {
        value /= 1'000.0;
        unit = "ms";
    }
    if (value >= 1'000.0) {
        value /= 1'000.0;
        unit = "s";
    }

    int precision =
        (value < 10.0)  ? 2 :
        (value < 100.0) ? 1 : 0;

    return std::format("{:.{}f} {}", value, precision, unit);
}


// Format an integer with thousands separators
// Example: 6436311 -> "6,436,311"
inline std::string format_number_exact(uint64_t value) {
    std::string raw = std::to_string(value);
    std::string formatted;
    formatted.reserve(raw.size() + raw.size() / 3);

    int count = 0;
    for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
        if (count == 3) {
            formatted.push_back(',');
            count = 0;
        }
        formatted.push_back(*it);
        ++count;
    }
    std::reverse(formatted.begin(), formatted.end());
    return formatted;
}


// Exact decimal rendering of `value / 10^shift` without going through floating
// point. Trailing fractional zeros are dropped, so output is stable and
// round-trips exactly.
// Examples (shift = 9):
//   0            -> "0"
//   1            -> "0.000000001"
//   450          -> "0.00000045"
//   1073741824   -> "1.073741824"
//   2000000000   -> "2"
inline std::string format_decimal_shifted(std::uint64_t value, int shift) {
    std::string digits = std::to_string(value);
    if (shift <= 0) {
        return digits;
    }
    const std::size_t s = static_cast<std::size_t>(shift);
    if (digits.size() <= s) {
        digits.insert(0, s - digits.size() + 1, '0');
    }
    std::string out = digits.substr(0, digits.size() - s);
    std::string frac = digits.substr(digits.size() - s);
    while (!frac.empty() && frac.back() == '0') {
        frac.pop_back();
    }
    if (!frac.empty()) {
        out.push_back('.');
        out += frac;
    }
    return out;
}

// Nanosecond integer expressed exactly in `unit`
inline std::string format_ns_as(std::uint64_t ns, time_unit unit) {
    return format_decimal_shifted(ns, decimal_shift(unit));
}

} // namespace lcr
