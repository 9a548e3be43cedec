#pragma once

#include <cstdint>
#include <concepts>

#include "hiccupwatch/core/error.hpp"


namespace hiccupwatch::core::clock {

// -----------------------------------------------------------------------------
// ClockConcept
// -----------------------------------------------------------------------------
//
// Time source used by the sampler.
//
//   • now_ns() returns a monotonically non-decreasing timestamp in ns
//   • It cannot fail once the clock has been probed at startup
//
// -----------------------------------------------------------------------------
template<class C>
concept ClockConcept =
    requires(C c)
{
    { c.now_ns() } noexcept -> std::same_as<std::uint64_t>;
};

// -----------------------------------------------------------------------------
// SleeperConcept
// -----------------------------------------------------------------------------
//
// Suspend primitive used by the sampler.
//
//   • sleep_for_ns() must release the calling thread (no busy-wait), since the
//     delay in getting it back is exactly what is being measured
//   • Returns Error::None on success, Error::SleepFailed on an OS-level error
//
// -----------------------------------------------------------------------------
template<class S>
concept SleeperConcept =
    requires(S s, std::uint64_t ns)
{
    { s.sleep_for_ns(ns) } noexcept -> std::same_as<Error>;
};

} // namespace hiccupwatch::core::clock
