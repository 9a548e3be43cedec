#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "lcr/observability/prometheus/prometheus_collector.hpp"


namespace hiccupwatch::exporter {

/*
===============================================================================
 hiccupwatch::exporter::Exporter
===============================================================================

Pull-side adapter between the in-process metric owners and a scraper.

Sources register a callback that appends their families to a collector.
render() walks the sources in registration order on a fresh buffer, so:

  - the output only depends on the current metric values
  - two render() calls with no intervening record() are byte-identical
  - rendering never mutates any metric (scrape accounting is done by the
    HTTP server, outside render())

A source that has nothing to export (e.g. a disabled monitor) simply appends
nothing. Constant labels are applied to every sample of every source.
===============================================================================
*/

class Exporter {
public:
    using Collector = lcr::observability::prometheus_collector;
    using Source = std::function<void(Collector&)>;

    Exporter() = default;

    Exporter(const Exporter&) = delete;
    Exporter& operator=(const Exporter&) = delete;

    // Adds a metric source. Typically `[&m](auto& c) { m.collect(c); }`.
    void register_source(Source source) {
        std::lock_guard<std::mutex> lock(mutex_);
        sources_.push_back(std::move(source));
    }

    // Label added to every exported sample (e.g. host="db-01")
    void add_constant_label(std::string key, std::string value) {
        std::lock_guard<std::mutex> lock(mutex_);
        labels_.emplace_back(std::move(key), std::move(value));
    }

    [[nodiscard]]
    std::size_t source_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sources_.size();
    }

    // Prometheus text exposition (0.0.4) of every registered source
    [[nodiscard]]
    std::string render() const {
        std::string out;
        out.reserve(4096);
        Collector collector(out);

        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [k, v] : labels_) {
            collector.push_label(k, v);
        }
        for (const auto& source : sources_) {
            source(collector);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Source> sources_;
    std::vector<std::pair<std::string, std::string>> labels_;
};

} // namespace hiccupwatch::exporter
