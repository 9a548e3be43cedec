#pragma once

#include <cstdint>
#include <cerrno>
#include <ctime>


namespace lcr {
namespace system {

// =====================================================================================
//  monotonic_clock: Kernel-backed monotonic nanosecond timestamps
// =====================================================================================
//
//  Thin wrapper over clock_gettime(CLOCK_MONOTONIC).
//
//  • Immune to wall-clock steps (NTP, settimeofday): CLOCK_MONOTONIC only slews.
//  • vDSO fast path on Linux, no syscall on the hot path in practice.
//  • Non-decreasing across threads (kernel guarantee), unlike a raw TSC read.
//
//  probe() is meant to be called once before any sampling starts. It fails
//  only when the kernel refuses to read the clock; a coarse clock (1/HZ on
//  kernels without high-resolution timers) still probes fine and is reported
//  through is_fine(). Never fall back to CLOCK_REALTIME.
//
//      int err = 0;
//      if (!monotonic_clock::probe(err)) { /* refuse to start */ }
//      uint64_t t = monotonic_clock::now_ns();
//
// =====================================================================================

class monotonic_clock {
public:
    monotonic_clock() = delete;

    // Granularity at or below which the clock counts as high resolution (ns)
    static constexpr uint64_t kFineResolutionNs = 1'000;

    // Verifies the clock resolution can be queried and the clock can be read.
    // On failure returns false and stores errno.
    [[nodiscard]]
    static bool probe(int& error) noexcept {
        timespec res{};
        if (::clock_getres(CLOCK_MONOTONIC, &res) != 0) {
            error = errno;
            return false;
        }
        timespec ts{};
        if (::clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
            error = errno;
            return false;
        }
        error = 0;
        return true;
    }

    [[nodiscard]]
    static constexpr bool is_fine(uint64_t resolution_ns) noexcept {
        return resolution_ns != 0 && resolution_ns <= kFineResolutionNs;
    }

    // Current monotonic time in ns. Only valid after a successful probe().
    [[nodiscard]]
    static uint64_t now_ns() noexcept {
        timespec ts{};
        ::clock_gettime(CLOCK_MONOTONIC, &ts);
        return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
    }

    // Kernel-reported resolution in ns (0 when unavailable)
    [[nodiscard]]
    static uint64_t resolution_ns() noexcept {
        timespec res{};
        if (::clock_getres(CLOCK_MONOTONIC, &res) != 0) {
            return 0;
        }
        return static_cast<uint64_t>(res.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(res.tv_nsec);
    }
};

} // namespace system
} // namespace lcr
