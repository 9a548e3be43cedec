#pragma once

#include <cstdint>
#include <cstring>

#include "hiccupwatch/core/error.hpp"
#include "lcr/system/monotonic_clock.hpp"
#include "lcr/log/logger.hpp"


namespace hiccupwatch::core::clock {

// Production clock: CLOCK_MONOTONIC through lcr::system::monotonic_clock
class MonotonicClock {
public:
    // Must succeed before any sampler is started
    [[nodiscard]]
    static Error probe() noexcept {
        int err = 0;
        const bool readable = lcr::system::monotonic_clock::probe(err);
        return evaluate_probe(readable, err, readable ? lcr::system::monotonic_clock::resolution_ns() : 0);
    }

    // Startup verdict for a probe outcome. Only an unreadable clock is fatal;
    // a coarse one is logged and accepted.
    [[nodiscard]]
    static Error evaluate_probe(bool readable, int error, std::uint64_t resolution_ns) noexcept {
        if (!readable) {
            HCW_FATAL("[clock] CLOCK_MONOTONIC unusable: " << std::strerror(error) << " (errno=" << error << ")");
            return Error::ClockUnavailable;
        }
        if (!lcr::system::monotonic_clock::is_fine(resolution_ns)) {
            HCW_WARN("[clock] CLOCK_MONOTONIC resolution is " << resolution_ns
                     << " ns, hiccups will be inflated by up to one clock tick");
        }
        else {
            HCW_DEBUG("[clock] CLOCK_MONOTONIC resolution = " << resolution_ns << " ns");
        }
        return Error::None;
    }

    [[nodiscard]]
    inline std::uint64_t now_ns() noexcept {
        return lcr::system::monotonic_clock::now_ns();
    }
};

} // namespace hiccupwatch::core::clock
