#pragma once

#include <cstdint>

namespace lcr::control {

/*
================================================================================
ConsecutiveFailureCounter
================================================================================

Tracks how many times in a row an operation has failed inside a control loop
and decides when the failure run has become persistent enough to escalate.

  - record_failure() -> extends the current run
  - record_success() -> ends the run (count back to zero)
  - escalated()      -> true once the run reached the threshold

Single-threaded: owned by the loop that performs the operation.
No logging, no allocation, no policy beyond the threshold comparison.
================================================================================
*/

class ConsecutiveFailureCounter {
public:
    explicit ConsecutiveFailureCounter(std::uint32_t threshold) noexcept
        : threshold_(threshold == 0 ? 1 : threshold)
    {}

    // Extends the failure run. Returns the new run length.
    inline std::uint32_t record_failure() noexcept {
        if (consecutive_ < threshold_) {
            ++consecutive_;
        }
        return consecutive_;
    }

    inline void record_success() noexcept {
        consecutive_ = 0;
    }

    [[nodiscard]]
    inline bool escalated() const noexcept {
        return consecutive_ >= threshold_;
    }

    [[nodiscard]]
    inline std::uint32_t count() const noexcept {
        return consecutive_;
    }

    [[nodiscard]]
    inline std::uint32_t threshold() const noexcept {
        return threshold_;
    }

private:
    std::uint32_t threshold_;
    std::uint32_t consecutive_{0};
};

} // namespace lcr::control
