#pragma once

#include <cstdint>
#include <cerrno>
#include <cstring>
#include <ctime>

#include "hiccupwatch/core/error.hpp"
#include "lcr/log/logger.hpp"


namespace hiccupwatch::core::clock {

// Production sleeper: relative clock_nanosleep() on CLOCK_MONOTONIC.
//
// A signal interrupting the sleep (EINTR) is not a failure; the remaining time
// is slept so the iteration still requests the full resolution. Any other
// error is reported as SleepFailed.
class ThreadSleeper {
public:
    [[nodiscard]]
    inline Error sleep_for_ns(std::uint64_t ns) noexcept {
        timespec req{};
        req.tv_sec  = static_cast<time_t>(ns / 1'000'000'000ULL);
        req.tv_nsec = static_cast<long>(ns % 1'000'000'000ULL);
        timespec rem{};
        for (;;) {
            // clock_nanosleep returns the error number, it does not set errno
            const int rc = ::clock_nanosleep(CLOCK_MONOTONIC, 0, &req, &rem);
            if (rc == 0) {
                return Error::None;
            }
            if (rc == EINTR) {
                req = rem;
                continue;
            }
            HCW_WARN("[sleeper] clock_nanosleep failed: " << std::strerror(rc) << " (rc=" << rc << ")");
            return Error::SleepFailed;
        }
    }
};

} // namespace hiccupwatch::core::clock
