#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <pthread.h>

#include "hiccupwatch/core/error.hpp"
#include "hiccupwatch/core/sampler.hpp"
#include "hiccupwatch/core/clock/monotonic_clock.hpp"
#include "hiccupwatch/core/clock/thread_sleeper.hpp"
#include "lcr/metrics/latency_histogram.hpp"
#include "lcr/time_unit.hpp"
#include "lcr/format.hpp"
#include "lcr/log/logger.hpp"


namespace hiccupwatch::core {

// Static description of the monitor and of the metric it exports
struct MonitorConfig {
    std::string name        = "hiccups_duration_seconds";
    std::string description = "Hiccups detected in the process scheduling, by duration.";
    lcr::time_unit unit     = lcr::time_unit::seconds;

    std::uint64_t histogram_min_ns = lcr::metrics::latency_histogram::kDefaultMinNs;
    std::uint64_t histogram_max_ns = lcr::metrics::latency_histogram::kDefaultMaxNs;

    sampler::Config sampler{};

    std::chrono::milliseconds stop_timeout{2000};
};


/*
===============================================================================
 hiccupwatch::core::HiccupMonitor
===============================================================================

Lifecycle controller of the hiccup sampler.

- start(resolution) validates the resolution and the clock, builds the
  histogram and the Sampler, and runs the Sampler on a dedicated thread named
  "hiccup-monitor". It returns as soon as the Sampler is Running.
- stop() asks the Sampler to drain and waits for Terminated, bounded by
  `stop_timeout`. On timeout it logs a warning, detaches the thread and
  returns Error::Timeout; the Sampler and its histogram stay alive until the
  thread exits because the thread co-owns them. A Sampler that had stopped
  itself after repeated sleep failures yields Error::SamplerDegraded. Once
  the thread is gone further calls return Error::None.

The histogram and telemetry are shared: the Sampler holds the writer side, the
exporter reads through collect(). Until start() succeeds nothing is exported,
which is how a disabled monitor shows up in scrapes.

Not thread-safe itself: start()/stop() are called from one control thread.
===============================================================================
*/

template <
    clock::ClockConcept Clock = clock::MonotonicClock,
    clock::SleeperConcept Sleeper = clock::ThreadSleeper
>
class HiccupMonitor {
public:
    using SamplerType = Sampler<Clock, Sleeper>;

    explicit HiccupMonitor(MonitorConfig config = {}) noexcept
        : config_(std::move(config))
    {}

    ~HiccupMonitor() {
        if (thread_.joinable()) {
            (void)stop();
        }
    }

    HiccupMonitor(const HiccupMonitor&) = delete;
    HiccupMonitor& operator=(const HiccupMonitor&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    [[nodiscard]]
    Error start(std::uint64_t resolution_ns, Clock clock = Clock{}, Sleeper sleeper = Sleeper{}) {
        if (sampler_) {
            HCW_WARN("[monitor] start() called twice, a fresh monitor is required to restart");
            return Error::InvalidState;
        }
        if (resolution_ns == 0) {
            HCW_ERROR("[monitor] invalid resolution: must be > 0 ns, hiccup monitor disabled");
            return Error::ConfigInvalid;
        }
        if constexpr (requires { { Clock::probe() } -> std::same_as<Error>; }) {
            const Error err = Clock::probe();
            if (err != Error::None) {
                HCW_ERROR("[monitor] monotonic clock unavailable, hiccup monitor disabled");
                return err;
            }
        }

        sampler::Config sampler_config = config_.sampler;
        sampler_config.resolution_ns = resolution_ns;

        auto histogram = std::make_shared<lcr::metrics::latency_histogram>(config_.histogram_min_ns, config_.histogram_max_ns);
        auto telemetry = std::make_shared<sampler::Telemetry>();
        auto sampler = std::make_shared<SamplerType>(sampler_config, histogram, telemetry, std::move(clock), std::move(sleeper));

        const Error err = sampler->start();
        if (err != Error::None) {
            return err;
        }

        HCW_INFO("[monitor] starting hiccup monitor [resolution = " << resolution_ns << " ns ("
                 << lcr::format_duration(resolution_ns) << "), ladder = "
                 << histogram->lowest_bound() << ".." << histogram->highest_bound() << " ns in "
                 << histogram->bound_count() << " buckets]");

        histogram_ = std::move(histogram);
        telemetry_ = std::move(telemetry);
        sampler_   = std::move(sampler);

        thread_ = std::thread([sampler = sampler_]() {
            ::pthread_setname_np(::pthread_self(), "hiccup-monitor");
            sampler->run();
        });
        return Error::None;
    }

    [[nodiscard]]
    Error stop() {
        if (!sampler_) {
            return Error::None;
        }
        if (!thread_.joinable()) {
            return Error::None; // already stopped
        }
        HCW_INFO("[monitor] hiccup monitor stopping...");
        sampler_->request_stop();

        if (!sampler_->wait_terminated(config_.stop_timeout)) {
            HCW_WARN("[monitor] sampler did not terminate within "
                     << config_.stop_timeout.count() << " ms, detaching sampler thread");
            thread_.detach();
            return Error::Timeout;
        }
        thread_.join();

        HCW_INFO("[monitor] hiccup monitor stopped" << (sampler_->degraded() ? " (degraded)" : "")
                 << ": " << histogram_->snapshot().str());
        if (lcr::log::Logger::instance().enabled(lcr::log::Level::Debug)) {
            std::ostringstream os;
            telemetry_->debug_dump(os);
            HCW_DEBUG(os.str());
        }
        return sampler_->degraded() ? Error::SamplerDegraded : Error::None;
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    // True once start() succeeded (the metric is exported from then on)
    [[nodiscard]]
    bool enabled() const noexcept {
        return sampler_ != nullptr;
    }

    [[nodiscard]]
    sampler::State state() const noexcept {
        return sampler_ ? sampler_->state() : sampler::State::Stopped;
    }

    [[nodiscard]]
    bool degraded() const noexcept {
        return sampler_ && sampler_->degraded();
    }

    // Read-only handle for exporters; null until started
    [[nodiscard]]
    std::shared_ptr<const lcr::metrics::latency_histogram> histogram() const noexcept {
        return histogram_;
    }

    [[nodiscard]]
    std::shared_ptr<const sampler::Telemetry> telemetry() const noexcept {
        return telemetry_;
    }

    [[nodiscard]]
    const MonitorConfig& config() const noexcept {
        return config_;
    }

    // Test access to the running sampler (clock/sleeper scripts)
    [[nodiscard]]
    std::shared_ptr<SamplerType> sampler() const noexcept {
        return sampler_;
    }

    // -------------------------------------------------------------------------
    // Metrics collector
    // -------------------------------------------------------------------------
    // Emits nothing while disabled. After a degradation the frozen histogram is
    // still exported together with the degraded gauge.
    template <typename Collector>
    void collect(Collector& collector) const {
        if (!histogram_) {
            return;
        }
        histogram_->collect(config_.name, config_.description, config_.unit, collector);
        telemetry_->collect("hiccups_monitor", collector);
    }

private:
    MonitorConfig config_;

    std::shared_ptr<lcr::metrics::latency_histogram> histogram_;
    std::shared_ptr<sampler::Telemetry> telemetry_;
    std::shared_ptr<SamplerType> sampler_;
    std::thread thread_;
};

} // namespace hiccupwatch::core
