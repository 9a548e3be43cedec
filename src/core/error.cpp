#include "hiccupwatch/core/error.hpp"


namespace hiccupwatch::core {

std::string_view to_string(Error err) noexcept {
    switch (err) {
        case Error::None:             return "None";
        case Error::ConfigInvalid:    return "ConfigInvalid";
        case Error::ClockUnavailable: return "ClockUnavailable";
        case Error::SleepFailed:      return "SleepFailed";
        case Error::SamplerDegraded:  return "SamplerDegraded";
        case Error::InvalidState:     return "InvalidState";
        case Error::Timeout:          return "Timeout";
        case Error::IoError:          return "IoError";
        case Error::BindFailed:       return "BindFailed";
    }
    return "Unknown";
}

} // namespace hiccupwatch::core
