#pragma once

#include <cstdint>


namespace hiccupwatch::core::sampler {

// Runtime parameters of one Sampler instance
struct Config {
    // Target sleep interval (ns). Must be > 0.
    std::uint64_t resolution_ns = 1'000'000;

    // Sleep failures in a row before the sampler stops itself as degraded
    std::uint32_t max_consecutive_failures = 3;

    // Back-fill the samples a long stall prevented from being taken
    bool correct_coordinated_omission = false;
};

} // namespace hiccupwatch::core::sampler
