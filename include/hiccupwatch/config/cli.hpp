#pragma once

#include <string>
#include <string_view>

#include "hiccupwatch/config/settings.hpp"


namespace hiccupwatch::config {

// Everything the agent needs from its command line
struct Options {
    Settings settings{};
    std::string config_file;           // empty when no file was given
    bool allow_degraded_start = false; // keep serving when the monitor cannot start
    bool exit_requested = false;       // --help / --version was handled
};

/*
================================================================================
 configure()
================================================================================

Builds the merged Settings for the agent:

    built-in defaults
      < JSON file      (--config, HICCUPWATCH_CONFIG_FILE)
      < environment    (HICCUPWATCH_<KEY>, dots as underscores)
      < command line

Every setting is a CLI11 option bound to its environment variable, so the
last two layers are resolved by CLI11 itself. Options that neither layer set
are then taken from the file. The result is validated before returning.

Usage errors are printed by CLI11 and reported as ConfigInvalid; --help sets
`exit_requested` and returns success.
================================================================================
*/
[[nodiscard]]
Status configure(int argc, const char* const* argv, std::string_view description, Options& out);

} // namespace hiccupwatch::config
