#pragma once

#include <ostream>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/metrics/latency_histogram.hpp"
#include "lcr/time_unit.hpp"
#include "lcr/format.hpp"


namespace hiccupwatch::exporter {

// ============================================================================
// HTTP scrape endpoint telemetry
//
// Updated by the server thread after each response is written, so a scrape
// reports the requests that completed before it.
// ============================================================================

struct HttpTelemetry final {
    // Requests answered (any status)
    lcr::metrics::atomic::counter64 requests_total;

    // Body bytes of the last metrics response
    lcr::metrics::atomic::gauge64 response_size_bytes;

    // Requests rejected with 4xx
    lcr::metrics::atomic::counter64 rejected_requests_total;

    // Time from accept to the end of the response write (ns)
    lcr::metrics::latency_histogram request_duration{1'024, 1ULL << 34};

    // ---------------------------------------------------------------------
    // Metrics collector
    // ---------------------------------------------------------------------
    template <typename Collector>
    void collect(Collector& collector) const {
        requests_total.collect("prometheus_http_requests_total", "Number of HTTP requests served by the scrape endpoint", collector);
        rejected_requests_total.collect("prometheus_http_rejected_requests_total", "Number of HTTP requests answered with a 4xx status", collector);
        response_size_bytes.collect("prometheus_http_response_size_bytes", "Size of the last metrics response body in bytes", collector);
        request_duration.collect("prometheus_http_request_duration_seconds",
                                 "Time spent serving HTTP requests to the scrape endpoint",
                                 lcr::time_unit::seconds, collector);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Scrape Endpoint Telemetry ===\n"
           << "  Requests        : " << lcr::format_number_exact(requests_total.load()) << '\n'
           << "  Rejected        : " << lcr::format_number_exact(rejected_requests_total.load()) << '\n'
           << "  Last body size  : " << lcr::format_number_exact(response_size_bytes.load()) << " bytes\n"
           << "  Duration        : " << request_duration.snapshot().str() << '\n';
    }
};

} // namespace hiccupwatch::exporter
