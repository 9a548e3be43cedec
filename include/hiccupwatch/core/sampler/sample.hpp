#pragma once

#include <cstdint>
#include <ostream>


namespace hiccupwatch::core::sampler {

// One sleep/wake observation, all values in ns
struct Sample {
    std::uint64_t expected{0};
    std::uint64_t elapsed{0};
    std::uint64_t hiccup{0};
};

// Builds a Sample from the two clock reads around a sleep.
// Early wakes (elapsed < expected) and a clock reading that went backwards
// both yield hiccup == 0.
[[nodiscard]]
inline constexpr Sample make_sample(std::uint64_t expected, std::uint64_t t0, std::uint64_t t1) noexcept {
    Sample s;
    s.expected = expected;
    s.elapsed  = (t1 > t0) ? (t1 - t0) : 0;
    s.hiccup   = (s.elapsed > expected) ? (s.elapsed - expected) : 0;
    return s;
}

inline std::ostream& operator<<(std::ostream& os, const Sample& s) {
    return os << "Sample{expected=" << s.expected << "ns elapsed=" << s.elapsed << "ns hiccup=" << s.hiccup << "ns}";
}

} // namespace hiccupwatch::core::sampler
