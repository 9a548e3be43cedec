#pragma once

#include <cstdint>
#include <string_view>


namespace hiccupwatch::core::sampler {

// ===============================================================
// SAMPLER STATE
// ===============================================================
//
//   Stopped ──start()──▶ Running ──stop requested──▶ Draining ──▶ Terminated
//                           │                                        ▲
//                           └──── consecutive sleep failures ────────┘
//                                       (degraded)
//
// Terminated is final. A new Sampler must be constructed to sample again.
// ===============================================================
enum class State : uint8_t {
    Stopped    = 0,
    Running    = 1,
    Draining   = 2,
    Terminated = 3
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Stopped:    return "Stopped";
        case State::Running:    return "Running";
        case State::Draining:   return "Draining";
        case State::Terminated: return "Terminated";
    }
    return "Unknown";
}

} // namespace hiccupwatch::core::sampler
