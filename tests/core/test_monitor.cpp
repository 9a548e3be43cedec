#include <cerrno>
#include <chrono>
#include <iostream>
#include <sstream>
#include <memory>
#include <string>
#include <thread>

#include "hiccupwatch/core/monitor.hpp"
#include "lcr/observability/prometheus/prometheus_collector.hpp"
#include "lcr/system/monotonic_clock.hpp"
#include "common/scripted_time.hpp"
#include "common/test_check.hpp"


using namespace hiccupwatch::core;
using namespace hiccupwatch::test;
using namespace std::chrono_literals;

template <typename Monitor>
std::string render(const Monitor& monitor) {
    std::string out;
    lcr::observability::prometheus_collector collector(out);
    monitor.collect(collector);
    return out;
}

// Real-time clock whose startup check reports a fixed outcome
template <bool Readable, int Errno, std::uint64_t ResolutionNs>
struct StartupClock {
    [[nodiscard]]
    static Error probe() noexcept {
        return clock::MonotonicClock::evaluate_probe(Readable, Errno, ResolutionNs);
    }

    [[nodiscard]]
    std::uint64_t now_ns() noexcept {
        return lcr::system::monotonic_clock::now_ns();
    }
};

using UnreadableClock = StartupClock<false, ENODEV, 0>;
using CoarseClock     = StartupClock<true, 0, 4'000'000>;   // 1/HZ with HZ=250

// -----------------------------------------------------------------------------
// Test: invalid resolution disables the monitor
// -----------------------------------------------------------------------------
void test_start_invalid_resolution() {
    std::cout << "[TEST] HiccupMonitor start(0) is ConfigInvalid\n";

    HiccupMonitor<> monitor;
    TEST_CHECK(monitor.start(0) == Error::ConfigInvalid);
    TEST_CHECK(!monitor.enabled());
    TEST_CHECK(monitor.histogram() == nullptr);
    TEST_CHECK(render(monitor).empty());
    TEST_CHECK(monitor.stop() == Error::None);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: an unreadable clock disables the monitor
// -----------------------------------------------------------------------------
void test_start_clock_unavailable() {
    std::cout << "[TEST] HiccupMonitor start with an unreadable clock\n";

    auto script = std::make_shared<TimeScript>();
    HiccupMonitor<UnreadableClock, ScriptedSleeper> monitor;
    TEST_CHECK(monitor.start(1'000, UnreadableClock{}, ScriptedSleeper{script}) == Error::ClockUnavailable);
    TEST_CHECK(!monitor.enabled());
    TEST_CHECK(monitor.histogram() == nullptr);
    TEST_CHECK(monitor.sampler() == nullptr);
    TEST_CHECK(render(monitor).empty());
    TEST_CHECK(script->sleeps == 0);
    TEST_CHECK(monitor.stop() == Error::None);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a coarse but readable clock only warns
// -----------------------------------------------------------------------------
void test_start_coarse_clock() {
    std::cout << "[TEST] HiccupMonitor start with a coarse clock\n";

    std::ostringstream sink;
    auto& logger = lcr::log::Logger::instance();
    logger.set_output(&sink);
    logger.enable_color(false);
    logger.set_level(lcr::log::Level::Warn);

    auto script = std::make_shared<TimeScript>();
    HiccupMonitor<CoarseClock, ScriptedSleeper> monitor;
    TEST_CHECK(monitor.start(100, CoarseClock{}, ScriptedSleeper{script}) == Error::None);
    TEST_CHECK(monitor.enabled());
    TEST_CHECK(monitor.stop() == Error::None);
    TEST_CHECK(monitor.histogram()->snapshot().count > 0);
    TEST_CHECK(!render(monitor).empty());

    logger.set_output(nullptr);
    logger.set_level(lcr::log::Level::Error);

    const std::string out = sink.str();
    TEST_CHECK(out.find("[WARN] [clock] CLOCK_MONOTONIC resolution is 4000000 ns") != std::string::npos);
    TEST_CHECK(out.find("unusable") == std::string::npos);
    TEST_CHECK(out.find("[ERROR]") == std::string::npos);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: real clock and sleeper, stop latency is about one resolution
// -----------------------------------------------------------------------------
void test_start_stop_real_time() {
    std::cout << "[TEST] HiccupMonitor start/stop with the real clock\n";

    HiccupMonitor<> monitor;
    const auto t0 = std::chrono::steady_clock::now();
    TEST_CHECK(monitor.start(1'000'000) == Error::None);   // 1 ms
    TEST_CHECK(std::chrono::steady_clock::now() - t0 < 500ms);
    TEST_CHECK(monitor.enabled());
    TEST_CHECK(monitor.state() == sampler::State::Running);
    TEST_CHECK(monitor.start(1'000'000) == Error::InvalidState);

    std::this_thread::sleep_for(50ms);
    TEST_CHECK(monitor.histogram()->snapshot().count > 0);

    const auto t1 = std::chrono::steady_clock::now();
    TEST_CHECK(monitor.stop() == Error::None);
    TEST_CHECK(std::chrono::steady_clock::now() - t1 < 500ms);
    TEST_CHECK(monitor.state() == sampler::State::Terminated);
    TEST_CHECK(!monitor.degraded());

    // Nothing is recorded after stop() returned
    const auto count = monitor.histogram()->snapshot().count;
    std::this_thread::sleep_for(20ms);
    TEST_CHECK(monitor.histogram()->snapshot().count == count);
    TEST_CHECK(monitor.telemetry()->samples_total.load() == count);

    // stop() is idempotent
    TEST_CHECK(monitor.stop() == Error::None);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: exported families once started
// -----------------------------------------------------------------------------
void test_collect_after_start() {
    std::cout << "[TEST] HiccupMonitor collect\n";

    MonitorConfig cfg;
    cfg.name = "test_hiccups_seconds";
    cfg.description = "Test hiccups.";
    HiccupMonitor<> monitor(cfg);
    TEST_CHECK(monitor.start(500'000) == Error::None);
    std::this_thread::sleep_for(10ms);
    TEST_CHECK(monitor.stop() == Error::None);

    const std::string out = render(monitor);
    TEST_CHECK(out.find("# HELP test_hiccups_seconds Test hiccups.\n") != std::string::npos);
    TEST_CHECK(out.find("# TYPE test_hiccups_seconds histogram\n") != std::string::npos);
    TEST_CHECK(out.find("test_hiccups_seconds_bucket{le=\"+Inf\"} ") != std::string::npos);
    TEST_CHECK(out.find("test_hiccups_seconds_sum ") != std::string::npos);
    TEST_CHECK(out.find("test_hiccups_seconds_count ") != std::string::npos);
    TEST_CHECK(out.find("hiccups_monitor_resolution_nanos 500000\n") != std::string::npos);
    TEST_CHECK(out.find("hiccups_monitor_state 3\n") != std::string::npos);
    TEST_CHECK(out == render(monitor));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: stop() gives up after the timeout and detaches the sampler
// -----------------------------------------------------------------------------
void test_stop_timeout() {
    std::cout << "[TEST] HiccupMonitor stop timeout\n";

    auto gate = std::make_shared<Gate>();
    MonitorConfig cfg;
    cfg.stop_timeout = 50ms;

    HiccupMonitor<clock::MonotonicClock, GatedSleeper> monitor(cfg);
    TEST_CHECK(monitor.start(1'000, clock::MonotonicClock{}, GatedSleeper{gate}) == Error::None);
    TEST_CHECK(gate->wait_entered(1s));

    const auto t0 = std::chrono::steady_clock::now();
    TEST_CHECK(monitor.stop() == Error::Timeout);
    const auto waited = std::chrono::steady_clock::now() - t0;
    TEST_CHECK(waited >= 50ms);
    TEST_CHECK(waited < 1s);
    TEST_CHECK(monitor.state() == sampler::State::Running);

    // The detached sampler still owns its state and finishes on its own
    auto sampler = monitor.sampler();
    gate->release();
    TEST_CHECK(sampler->wait_terminated(1s));
    TEST_CHECK(monitor.state() == sampler::State::Terminated);
    TEST_CHECK(monitor.histogram()->snapshot().count == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: degraded sampler keeps the last histogram exported
// -----------------------------------------------------------------------------
void test_degraded_export() {
    std::cout << "[TEST] HiccupMonitor degraded export\n";

    auto script = std::make_shared<TimeScript>();
    script->push_elapsed({100, 250});
    script->push_failures(3);

    HiccupMonitor<ManualClock, ScriptedSleeper> monitor;
    TEST_CHECK(monitor.start(100, ManualClock{script}, ScriptedSleeper{script}) == Error::None);
    TEST_CHECK(monitor.sampler()->wait_terminated(1s));
    TEST_CHECK(monitor.degraded());
    TEST_CHECK(monitor.stop() == Error::SamplerDegraded);
    TEST_CHECK(monitor.stop() == Error::None);

    const std::string out = render(monitor);
    TEST_CHECK(out.find("hiccups_duration_seconds_count 2\n") != std::string::npos);
    TEST_CHECK(out.find("hiccups_duration_seconds_sum 0.00000015\n") != std::string::npos);
    TEST_CHECK(out.find("hiccups_monitor_degraded 1\n") != std::string::npos);
    TEST_CHECK(out.find("hiccups_monitor_dropped_samples_total 3\n") != std::string::npos);
    TEST_CHECK(out == render(monitor));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: export unit scales bounds and sum
// -----------------------------------------------------------------------------
void test_export_unit() {
    std::cout << "[TEST] HiccupMonitor export unit\n";

    auto script = std::make_shared<TimeScript>();
    script->push_elapsed({2'100});
    script->push_failures(1);

    MonitorConfig cfg;
    cfg.name = "hiccups_duration_microseconds";
    cfg.unit = lcr::time_unit::microseconds;
    cfg.histogram_min_ns = 1'024;
    cfg.histogram_max_ns = 4'096;
    cfg.sampler.max_consecutive_failures = 1;

    HiccupMonitor<ManualClock, ScriptedSleeper> monitor(cfg);
    TEST_CHECK(monitor.start(100, ManualClock{script}, ScriptedSleeper{script}) == Error::None);
    TEST_CHECK(monitor.sampler()->wait_terminated(1s));
    TEST_CHECK(monitor.stop() == Error::SamplerDegraded);

    const std::string out = render(monitor);
    TEST_CHECK(out.find("hiccups_duration_microseconds_bucket{le=\"1.024\"} 0\n") != std::string::npos);
    TEST_CHECK(out.find("hiccups_duration_microseconds_bucket{le=\"2.048\"} 1\n") != std::string::npos);
    TEST_CHECK(out.find("hiccups_duration_microseconds_bucket{le=\"4.096\"} 1\n") != std::string::npos);
    TEST_CHECK(out.find("hiccups_duration_microseconds_sum 2\n") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Error);

    test_start_invalid_resolution();
    test_start_clock_unavailable();
    test_start_coarse_clock();
    test_start_stop_real_time();
    test_collect_after_start();
    test_stop_timeout();
    test_degraded_export();
    test_export_unit();

    std::cout << "\n[hiccupwatch::core::HiccupMonitor] ALL TESTS PASSED\n";
    return 0;
}
