#pragma once

#include <string>
#include <ostream>

#include "hiccupwatch/core/sampler/state.hpp"
#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"


namespace hiccupwatch::core::sampler {

// ============================================================================
// Sampler Telemetry
//
// Written by the sampler thread, read by scrape handlers. Mechanical facts
// only; the distribution itself lives in the latency histogram.
// ============================================================================

struct Telemetry final {
    // Sleep/wake cycles completed and recorded
    lcr::metrics::atomic::counter64 samples_total;

    // Extra values recorded by coordinated-omission correction
    lcr::metrics::atomic::counter64 backfilled_samples_total;

    // Iterations lost to a failed sleep
    lcr::metrics::atomic::counter64 dropped_samples_total;

    // 1 once the sampler stopped itself after consecutive sleep failures
    lcr::metrics::atomic::gauge32 degraded;

    // Current sampler::State as an integer
    lcr::metrics::atomic::gauge32 state;

    // Configured target interval (ns)
    lcr::metrics::atomic::gauge64 resolution_ns;

    // ---------------------------------------------------------------------
    // Metrics collector
    // ---------------------------------------------------------------------
    template <typename Collector>
    void collect(const std::string& prefix, Collector& collector) const {
        samples_total.collect(prefix + "_samples_total", "Sleep/wake cycles recorded by the hiccup sampler", collector);
        backfilled_samples_total.collect(prefix + "_backfilled_samples_total", "Values added by coordinated-omission correction", collector);
        dropped_samples_total.collect(prefix + "_dropped_samples_total", "Sampler iterations lost to a failed sleep", collector);
        degraded.collect(prefix + "_degraded", "1 when the hiccup sampler stopped itself after repeated sleep failures", collector);
        state.collect(prefix + "_state", "Sampler state (0 Stopped, 1 Running, 2 Draining, 3 Terminated)", collector);
        resolution_ns.collect(prefix + "_resolution_nanos", "Configured sampler target interval in nanoseconds", collector);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Hiccup Sampler Telemetry ===\n"
           << "  State           : " << to_string(static_cast<State>(state.load())) << '\n'
           << "  Resolution      : " << lcr::format_duration(resolution_ns.load()) << '\n'
           << "  Samples         : " << lcr::format_number_exact(samples_total.load()) << '\n'
           << "  Backfilled      : " << lcr::format_number_exact(backfilled_samples_total.load()) << '\n'
           << "  Dropped         : " << lcr::format_number_exact(dropped_samples_total.load()) << '\n'
           << "  Degraded        : " << (degraded.load() != 0 ? "yes" : "no") << '\n';
    }
};

} // namespace hiccupwatch::core::sampler
