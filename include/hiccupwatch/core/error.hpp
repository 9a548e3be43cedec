#pragma once

#include <string_view>

namespace hiccupwatch::core {

/*
===============================================================================
 core::Error
===============================================================================

Error classification shared by the monitor, the exporter and the agent.

Startup errors (ConfigInvalid, ClockUnavailable) disable the hiccup monitor
and nothing else. SleepFailed is per-iteration and recoverable; a run of them
escalates to SamplerDegraded, after which the sampler stays stopped until the
process restarts.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Startup (fatal to the monitor) -------------------------------------
    ConfigInvalid,     // Resolution <= 0 or any other invalid setting
    ClockUnavailable,  // Monotonic clock cannot be read or is too coarse

    // --- Sampling -----------------------------------------------------------
    SleepFailed,       // The suspend primitive reported an OS-level error
    SamplerDegraded,   // Too many consecutive sleep failures, sampler stopped

    // --- Control / contract errors ------------------------------------------
    InvalidState,      // Operation not allowed in the current lifecycle state
    Timeout,           // Bounded wait elapsed (e.g. stop() drain)

    // --- Exporter / IO ------------------------------------------------------
    IoError,           // File or socket IO failure
    BindFailed         // Could not bind/listen on the scrape address
};

[[nodiscard]]
std::string_view to_string(Error err) noexcept;

} // namespace hiccupwatch::core
