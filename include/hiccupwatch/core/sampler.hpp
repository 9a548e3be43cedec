#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

#include "hiccupwatch/core/error.hpp"
#include "hiccupwatch/core/clock/concepts.hpp"
#include "hiccupwatch/core/sampler/config.hpp"
#include "hiccupwatch/core/sampler/sample.hpp"
#include "hiccupwatch/core/sampler/state.hpp"
#include "hiccupwatch/core/sampler/telemetry.hpp"
#include "lcr/control/consecutive_failures.hpp"
#include "lcr/metrics/latency_histogram.hpp"
#include "lcr/log/logger.hpp"


namespace hiccupwatch::core {

/*
===============================================================================
 hiccupwatch::core::Sampler
===============================================================================

Self-referential timing probe. Each iteration asks the OS to suspend the
thread for `resolution` and measures how long it actually took to get the
thread back. The overshoot is the hiccup:

    t0 = now()
    sleep(resolution)
    t1 = now()
    hiccup = max(0, (t1 - t0) - resolution)
    histogram.record(hiccup)

-------------------------------------------------------------------------------
 Timing rules
-------------------------------------------------------------------------------
- Every iteration sleeps `resolution` from *now*. There is no catch-up towards
  t0 + k * resolution: drift is part of what is measured.
- Early wakes count as zero, never as a negative value.
- Sub-microsecond resolutions are honoured as a request only; the kernel
  timer slack shows up as systematic hiccups.

-------------------------------------------------------------------------------
 Failure policy
-------------------------------------------------------------------------------
- A failed sleep drops that iteration's sample (counted, logged) and the loop
  continues.
- `max_consecutive_failures` failures in a row stop the sampler: it drains,
  terminates and reports itself as degraded. The histogram keeps its last
  values and is never touched again by this sampler.

-------------------------------------------------------------------------------
 Threading
-------------------------------------------------------------------------------
- run()/step() execute on exactly one thread (the sampler thread).
- request_stop(), state(), wait_terminated() may be called from any thread.
- The stop flag is checked once per iteration, after the sample is recorded,
  so stopping takes at most one resolution plus the record cost.

Clock and Sleeper are injected so tests can script time deterministically.
===============================================================================
*/

template <
    clock::ClockConcept Clock,
    clock::SleeperConcept Sleeper
>
class Sampler {
public:
    Sampler(const sampler::Config& config,
            std::shared_ptr<lcr::metrics::latency_histogram> histogram,
            std::shared_ptr<sampler::Telemetry> telemetry,
            Clock clock = Clock{},
            Sleeper sleeper = Sleeper{}) noexcept
        : config_(config)
        , histogram_(std::move(histogram))
        , telemetry_(std::move(telemetry))
        , clock_(std::move(clock))
        , sleeper_(std::move(sleeper))
        , failures_(config.max_consecutive_failures)
    {
        telemetry_->resolution_ns.store(config_.resolution_ns);
        telemetry_->state.store(static_cast<std::uint32_t>(sampler::State::Stopped));
    }

    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Stopped -> Running. Does not spawn anything; the owner calls run().
    [[nodiscard]]
    inline Error start() noexcept {
        if (config_.resolution_ns == 0) {
            HCW_ERROR("[sampler] refusing to start: resolution must be > 0");
            return Error::ConfigInvalid;
        }
        if (state() != sampler::State::Stopped) {
            HCW_WARN("[sampler] start() ignored in state " << sampler::to_string(state()));
            return Error::InvalidState;
        }
        set_state_(sampler::State::Running);
        return Error::None;
    }

    // Runs iterations until the sampler terminates
    inline void run() noexcept {
        HCW_DEBUG("[sampler] loop entered (resolution=" << config_.resolution_ns << "ns)");
        while (step()) {
        }
        HCW_DEBUG("[sampler] loop exited in state " << sampler::to_string(state()));
    }

    // One loop iteration. Returns false once the sampler reached Terminated.
    [[nodiscard]]
    inline bool step() noexcept {
        if (state() != sampler::State::Running) {
            return false;
        }

        const std::uint64_t t0 = clock_.now_ns();
        const Error err = sleeper_.sleep_for_ns(config_.resolution_ns);
        if (err == Error::None) {
            const std::uint64_t t1 = clock_.now_ns();
            failures_.record_success();
            record_(sampler::make_sample(config_.resolution_ns, t0, t1));
        }
        else {
            on_sleep_failure_(err);
            if (failures_.escalated()) {
                HCW_ERROR("[sampler] " << to_string(Error::SamplerDegraded) << ": " << failures_.count()
                          << " consecutive sleep failures, histogram frozen");
                telemetry_->degraded.store(1);
                drain_();
                return false;
            }
        }

        if (stop_requested_.load(std::memory_order_acquire)) {
            drain_();
            return false;
        }
        return true;
    }

    // Cooperative, non-blocking. Honoured at the end of the current iteration.
    inline void request_stop() noexcept {
        stop_requested_.store(true, std::memory_order_release);
        // A sampler that never ran has nothing to drain
        std::lock_guard<std::mutex> lock(state_mtx_);
        if (state_.load(std::memory_order_acquire) == sampler::State::Stopped) {
            set_state_locked_(sampler::State::Terminated);
        }
    }

    // Blocks until Terminated or the timeout elapses. Returns true if terminated.
    [[nodiscard]]
    inline bool wait_terminated(std::chrono::nanoseconds timeout) {
        std::unique_lock<std::mutex> lock(state_mtx_);
        return state_cv_.wait_for(lock, timeout, [this] {
            return state_.load(std::memory_order_acquire) == sampler::State::Terminated;
        });
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline sampler::State state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline bool degraded() const noexcept {
        return telemetry_->degraded.load() != 0;
    }

    [[nodiscard]]
    inline std::uint32_t consecutive_failures() const noexcept {
        return failures_.count();
    }

    [[nodiscard]]
    inline const sampler::Config& config() const noexcept {
        return config_;
    }

    [[nodiscard]]
    inline Clock& clock() noexcept { return clock_; }

    [[nodiscard]]
    inline Sleeper& sleeper() noexcept { return sleeper_; }

private:
    sampler::Config config_;
    std::shared_ptr<lcr::metrics::latency_histogram> histogram_;
    std::shared_ptr<sampler::Telemetry> telemetry_;
    Clock clock_;
    Sleeper sleeper_;

    lcr::control::ConsecutiveFailureCounter failures_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<sampler::State> state_{sampler::State::Stopped};
    std::mutex state_mtx_;
    std::condition_variable state_cv_;

private:
    inline void record_(const sampler::Sample& sample) noexcept {
        HCW_TRACE("[sampler] " << sample);
        histogram_->record(sample.hiccup);
        telemetry_->samples_total.inc();

        if (!config_.correct_coordinated_omission || sample.hiccup < config_.resolution_ns) {
            return;
        }
        // The stall also hid the samples that should have been taken during it
        std::uint64_t missing = sample.hiccup - config_.resolution_ns;
        while (missing >= config_.resolution_ns) {
            histogram_->record(missing);
            telemetry_->backfilled_samples_total.inc();
            missing -= config_.resolution_ns;
        }
    }

    inline void on_sleep_failure_(Error err) noexcept {
        const std::uint32_t run = failures_.record_failure();
        telemetry_->dropped_samples_total.inc();
        HCW_WARN("[sampler] sample dropped: " << to_string(err)
                 << " (" << run << "/" << failures_.threshold() << " consecutive)");
    }

    // Running -> Draining -> Terminated. The histogram is written eagerly, so
    // there is nothing buffered to flush yet; this is the single exit point.
    inline void drain_() noexcept {
        set_state_(sampler::State::Draining);
        HCW_DEBUG("[sampler] draining");
        set_state_(sampler::State::Terminated);
    }

    inline void set_state_(sampler::State s) noexcept {
        std::lock_guard<std::mutex> lock(state_mtx_);
        set_state_locked_(s);
    }

    inline void set_state_locked_(sampler::State s) noexcept {
        state_.store(s, std::memory_order_release);
        telemetry_->state.store(static_cast<std::uint32_t>(s));
        state_cv_.notify_all();
    }
};

} // namespace hiccupwatch::core
