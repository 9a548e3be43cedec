#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "hiccupwatch/core/error.hpp"
#include "hiccupwatch/core/monitor.hpp"
#include "hiccupwatch/exporter/http_server.hpp"


namespace hiccupwatch::config {

// -----------------------------------------------------------------------------
// Status
// -----------------------------------------------------------------------------
// Result of a configuration step. `message` names the offending key.
struct Status {
    core::Error code{core::Error::None};
    std::string message;

    [[nodiscard]]
    inline bool ok() const noexcept {
        return code == core::Error::None;
    }

    [[nodiscard]]
    static inline Status invalid(std::string msg) {
        return Status{core::Error::ConfigInvalid, std::move(msg)};
    }

    [[nodiscard]]
    static inline Status io_error(std::string msg) {
        return Status{core::Error::IoError, std::move(msg)};
    }
};

inline std::ostream& operator<<(std::ostream& os, const Status& st) {
    os << to_string(st.code);
    if (!st.message.empty()) {
        os << ": " << st.message;
    }
    return os;
}


// -----------------------------------------------------------------------------
// Settings
// -----------------------------------------------------------------------------
// Fully merged agent configuration (defaults < file < environment < flags).
// Field names follow the dotted configuration keys.

struct HistogramSettings {
    std::uint64_t min_nanos = lcr::metrics::latency_histogram::kDefaultMinNs;
    std::uint64_t max_nanos = lcr::metrics::latency_histogram::kDefaultMaxNs;
};

struct HiccupsMonitorSettings {
    bool enabled                                = true;
    std::string name                            = "hiccups_duration_seconds";
    std::string description                     = "Hiccups detected in the process scheduling, by duration.";
    std::uint64_t resolution_nanos              = 1'000'000;
    std::string unit                            = "seconds";
    HistogramSettings histogram{};
    bool correct_coordinated_omission           = false;
    std::uint64_t max_consecutive_sleep_failures = 3;
    std::uint64_t stop_timeout_millis           = 2000;
};

// Label attached to every exported sample, e.g. component="advisor"
struct ConstantLabel {
    std::string name;
    std::string value;
};

struct PrometheusExporterSettings {
    bool enabled       = true;
    std::string host   = "0.0.0.0";
    std::uint64_t port = 9096;
    std::string path   = "/metrics";
    std::vector<ConstantLabel> labels{};
};

struct Settings {
    bool debug = false;
    std::string log_level = "info";
    HiccupsMonitorSettings hiccups_monitor{};
    PrometheusExporterSettings prometheus_exporter{};

    void dump(const std::string& header, std::ostream& os) const;
};


// Parses "name=value" (value may be empty)
[[nodiscard]]
Status parse_constant_label(std::string_view text, ConstantLabel& out);

// Checks every constraint; returns the first violation
[[nodiscard]]
Status validate(const Settings& settings);

// Applies log_level / debug to the global logger
[[nodiscard]]
Status apply_logging(const Settings& settings);

// Projections consumed by the core and the exporter. Settings must be valid.
[[nodiscard]]
core::MonitorConfig to_monitor_config(const Settings& settings);

[[nodiscard]]
exporter::HttpServerConfig to_http_server_config(const Settings& settings);

} // namespace hiccupwatch::config
