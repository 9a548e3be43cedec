#pragma once

#include <string>
#include <string_view>

#include "hiccupwatch/config/settings.hpp"

/*
================================================================================
Configuration File Loader
================================================================================

Overlays a JSON document on top of an existing Settings value. Only the keys
present in the document are changed, so the caller controls the layering:

    Settings s;                       // built-in defaults
    load_json_file(path, s);          // file
    ...                               // environment / flags on top

Document shape (every key optional):

    {
      "debug": false,
      "log_level": "info",
      "hiccups_monitor": {
        "enabled": true,
        "name": "hiccups_duration_seconds",
        "description": "...",
        "resolution_nanos": 1000000,
        "unit": "seconds",
        "histogram": { "min_nanos": 1, "max_nanos": 17179869184 },
        "correct_coordinated_omission": false,
        "max_consecutive_sleep_failures": 3,
        "stop_timeout_millis": 2000
      },
      "prometheus_exporter": {
        "enabled": true, "host": "0.0.0.0", "port": 9096, "path": "/metrics"
      }
    }

Rules:
  • A wrongly typed value is ConfigInvalid (negative numbers included)
  • Unknown keys are ignored and logged at debug level
  • An unreadable file is IoError, a malformed document ConfigInvalid
  • On error `out` may be partially updated; callers discard it

================================================================================
*/

namespace hiccupwatch::config {

[[nodiscard]]
Status load_json(std::string_view json, Settings& out);

[[nodiscard]]
Status load_json_file(const std::string& path, Settings& out);

} // namespace hiccupwatch::config
