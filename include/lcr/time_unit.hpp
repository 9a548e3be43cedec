#pragma once

#include <cstdint>
#include <string_view>

namespace lcr {

enum class time_unit {
    nanoseconds,
    microseconds,
    milliseconds,
    seconds
};

constexpr const char* to_string(time_unit unit) noexcept {
    switch (unit) {
        case time_unit::nanoseconds:  return "ns";
        case time_unit::microseconds: return "us";
        case time_unit::milliseconds: return "ms";
        case time_unit::seconds:      return "s";
        default:                      return "unknown";
    }
}

// Long form, as used in metric names and configuration files
constexpr std::string_view to_name(time_unit unit) noexcept {
    switch (unit) {
        case time_unit::nanoseconds:  return "nanoseconds";
        case time_unit::microseconds: return "microseconds";
        case time_unit::milliseconds: return "milliseconds";
        case time_unit::seconds:      return "seconds";
        default:                      return "unknown";
    }
}

[[nodiscard]]
constexpr bool parse_time_unit(std::string_view text, time_unit& out) noexcept {
    if (text == "nanoseconds"  || text == "ns") { out = time_unit::nanoseconds;  return true; }
    if (text == "microseconds" || text == "us") { out = time_unit::microseconds; return true; }
    if (text == "milliseconds" || text == "ms") { out = time_unit::milliseconds; return true; }
    if (text == "seconds"      || text == "s")  { out = time_unit::seconds;      return true; }
    return false;
}

// Number of decimal digits to shift a nanosecond integer to express it in `unit`
constexpr int decimal_shift(time_unit unit) noexcept {
    switch (unit) {
        case time_unit::seconds:      return 9;
        case time_unit::milliseconds: return 6;
        case time_unit::microseconds: return 3;
        default:                      return 0;
    }
}

constexpr double convert_ns(uint64_t ns, time_unit unit) noexcept {
    switch (unit) {
        case time_unit::seconds:      return ns * 1e-9;
        case time_unit::milliseconds: return ns * 1e-6;
        case time_unit::microseconds: return ns * 1e-3;
        default:                      return static_cast<double>(ns);
    }
}

} // namespace lcr
