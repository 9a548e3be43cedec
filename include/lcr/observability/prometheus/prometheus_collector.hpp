#pragma once

#include <string>
#include <string_view>
#include <cstdint>

#include "lcr/observability/prometheus/label_stack.hpp"
#include "lcr/metrics/latency_histogram.hpp"
#include "lcr/time_unit.hpp"
#include "lcr/format.hpp"


namespace lcr {
namespace observability {

// ---------------------------------------------------------------------------
// prometheus_collector
// ---------------------------------------------------------------------------
// Appends metric families in the Prometheus text exposition format (0.0.4)
// to a caller-owned string. Output depends only on the values passed in: no
// timestamps, no ordering from hash maps. Rendering the same values twice
// produces the same bytes.
// ---------------------------------------------------------------------------
class prometheus_collector {
public:
    explicit prometheus_collector(std::string& out) noexcept
        : out_(out)
    {}

    inline void add_gauge(uint64_t value, const std::string& name, const std::string& help) {
        header_(name, help, "gauge");
        sample_(name, labels_.str(), std::to_string(value));
    }

    inline void add_counter(uint64_t value, const std::string& name, const std::string& help) {
        header_(name, help, "counter");
        sample_(name, labels_.str(), std::to_string(value));
    }

    // Cumulative histogram. Bounds and sum are nanosecond integers scaled
    // exactly into `unit`.
    inline void add_histogram(const metrics::histogram_snapshot& snap, const std::string& name,
                              const std::string& help, time_unit unit) {
        header_(name, help, "histogram");
        const std::string bucket = name + "_bucket";
        for (int i = 0; i < snap.bound_count; ++i) {
            sample_(bucket, labels_.str_with("le", format_ns_as(snap.bounds[i], unit)), std::to_string(snap.cumulative[i]));
        }
        sample_(bucket, labels_.str_with("le", "+Inf"), std::to_string(snap.count));
        sample_(name + "_sum", labels_.str(), format_ns_as(snap.sum, unit));
        sample_(name + "_count", labels_.str(), std::to_string(snap.count));
    }

    inline void push_label(std::string_view key, std::string_view value) {
        labels_.push(key, value);
    }

    inline void pop_label() {
        labels_.pop();
    }

    [[nodiscard]]
    inline const std::string& str() const noexcept {
        return out_;
    }

private:
    inline void header_(const std::string& name, const std::string& help, std::string_view type) {
        if (!help.empty()) {
            out_ += "# HELP ";
            out_ += name;
            out_.push_back(' ');
            out_ += escape_help(help);
            out_.push_back('\n');
        }
        out_ += "# TYPE ";
        out_ += name;
        out_.push_back(' ');
        out_.append(type);
        out_.push_back('\n');
    }

    inline void sample_(const std::string& name, const std::string& labels, const std::string& value) {
        out_ += name;
        out_ += labels;
        out_.push_back(' ');
        out_ += value;
        out_.push_back('\n');
    }

    std::string& out_;
    label_stack labels_{};
};

} // namespace observability
} // namespace lcr
