#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "hiccupwatch/core/sampler.hpp"
#include "lcr/observability/prometheus/prometheus_collector.hpp"
#include "common/scripted_time.hpp"
#include "common/test_check.hpp"


using namespace hiccupwatch::core;
using namespace hiccupwatch::test;

using TestSampler = Sampler<ManualClock, ScriptedSleeper>;

// -----------------------------------------------------------------------------
// Fixture
// -----------------------------------------------------------------------------
struct Rig {
    std::shared_ptr<TimeScript> script = std::make_shared<TimeScript>();
    std::shared_ptr<lcr::metrics::latency_histogram> histogram = std::make_shared<lcr::metrics::latency_histogram>();
    std::shared_ptr<sampler::Telemetry> telemetry = std::make_shared<sampler::Telemetry>();
    std::unique_ptr<TestSampler> sampler;

    explicit Rig(sampler::Config config = {}) {
        sampler = std::make_unique<TestSampler>(config, histogram, telemetry, ManualClock{script}, ScriptedSleeper{script});
    }

    std::string render() const {
        std::string out;
        lcr::observability::prometheus_collector collector(out);
        histogram->collect("hiccups_duration_seconds", "help", lcr::time_unit::seconds, collector);
        telemetry->collect("hiccups_monitor", collector);
        return out;
    }
};

sampler::Config with_resolution(std::uint64_t ns) {
    sampler::Config cfg;
    cfg.resolution_ns = ns;
    return cfg;
}

// -----------------------------------------------------------------------------
// Test: hiccup = elapsed - resolution, early wakes clamp to zero
// -----------------------------------------------------------------------------
void test_measurement_scenario() {
    std::cout << "[TEST] Sampler measurement scenario\n";

    Rig rig(with_resolution(100));
    rig.script->push_elapsed({100, 150, 90, 500, 100});

    TEST_CHECK(rig.sampler->start() == Error::None);
    TEST_CHECK(rig.sampler->state() == sampler::State::Running);
    for (int i = 0; i < 5; ++i) {
        TEST_CHECK(rig.sampler->step());
    }

    const auto snap = rig.histogram->snapshot();
    TEST_CHECK(snap.count == 5);
    TEST_CHECK(snap.sum == 450);
    TEST_CHECK(snap.max == 400);
    TEST_CHECK(snap.cumulative[0] == 3);  // three zero hiccups
    TEST_CHECK(snap.cumulative[6] == 4);  // 50 -> le 64
    TEST_CHECK(snap.cumulative[9] == 5);  // 400 -> le 512
    TEST_CHECK(rig.telemetry->samples_total.load() == 5);
    TEST_CHECK(rig.telemetry->dropped_samples_total.load() == 0);
    TEST_CHECK(rig.script->sleeps == 5);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: make_sample clamps early wakes and backwards clock reads
// -----------------------------------------------------------------------------
void test_clamp() {
    std::cout << "[TEST] Sampler clamp\n";

    TEST_CHECK(sampler::make_sample(100, 1'000, 1'090).hiccup == 0);
    TEST_CHECK(sampler::make_sample(100, 1'000, 1'100).hiccup == 0);
    TEST_CHECK(sampler::make_sample(100, 1'000, 1'101).hiccup == 1);
    TEST_CHECK(sampler::make_sample(100, 1'000, 900).hiccup == 0);
    TEST_CHECK(sampler::make_sample(100, 1'000, 900).elapsed == 0);

    Rig rig(with_resolution(1'000));
    rig.script->push_elapsed({1, 10, 999});
    TEST_CHECK(rig.sampler->start() == Error::None);
    for (int i = 0; i < 3; ++i) {
        TEST_CHECK(rig.sampler->step());
    }
    TEST_CHECK(rig.histogram->snapshot().count == 3);
    TEST_CHECK(rig.histogram->snapshot().sum == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: start() contract
// -----------------------------------------------------------------------------
void test_start_contract() {
    std::cout << "[TEST] Sampler start contract\n";

    Rig zero(with_resolution(0));
    TEST_CHECK(zero.sampler->start() == Error::ConfigInvalid);
    TEST_CHECK(zero.sampler->state() == sampler::State::Stopped);
    TEST_CHECK(!zero.sampler->step());

    Rig rig(with_resolution(100));
    TEST_CHECK(rig.sampler->start() == Error::None);
    TEST_CHECK(rig.sampler->start() == Error::InvalidState);
    TEST_CHECK(rig.telemetry->resolution_ns.load() == 100);
    TEST_CHECK(rig.telemetry->state.load() == static_cast<std::uint32_t>(sampler::State::Running));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: N consecutive failures -> Terminated + degraded, histogram frozen
// -----------------------------------------------------------------------------
void test_degradation() {
    std::cout << "[TEST] Sampler degrades after consecutive sleep failures\n";

    Rig rig(with_resolution(100));
    rig.script->push_elapsed({100, 300});
    rig.script->push_failures(3);

    TEST_CHECK(rig.sampler->start() == Error::None);
    TEST_CHECK(rig.sampler->step());
    TEST_CHECK(rig.sampler->step());
    const std::string before = rig.render();

    TEST_CHECK(rig.sampler->step());   // failure 1
    TEST_CHECK(rig.sampler->step());   // failure 2
    TEST_CHECK(rig.sampler->consecutive_failures() == 2);
    TEST_CHECK(!rig.sampler->degraded());

    std::ostringstream sink;
    auto& logger = lcr::log::Logger::instance();
    logger.set_output(&sink);
    logger.enable_color(false);
    TEST_CHECK(!rig.sampler->step());  // failure 3 -> degraded
    logger.set_output(nullptr);
    TEST_CHECK(sink.str().find("[ERROR] [sampler] SamplerDegraded: 3 consecutive sleep failures") != std::string::npos);

    TEST_CHECK(rig.sampler->state() == sampler::State::Terminated);
    TEST_CHECK(rig.sampler->degraded());
    TEST_CHECK(rig.telemetry->dropped_samples_total.load() == 3);

    // Further steps are no-ops and the histogram keeps its last values
    TEST_CHECK(!rig.sampler->step());
    const auto snap = rig.histogram->snapshot();
    TEST_CHECK(snap.count == 2);
    TEST_CHECK(snap.sum == 200);

    const std::string after = rig.render();
    TEST_CHECK(after == rig.render());
    TEST_CHECK(after.find("hiccups_duration_seconds_count 2\n") != std::string::npos);
    TEST_CHECK(after.find("hiccups_monitor_degraded 1\n") != std::string::npos);
    TEST_CHECK(before.find("hiccups_monitor_degraded 0\n") != std::string::npos);

    // Histogram section is byte-identical before and after the failures
    const auto hist_end = before.find("# HELP hiccups_monitor_samples_total");
    TEST_CHECK(hist_end != std::string::npos);
    TEST_CHECK(before.substr(0, hist_end) == after.substr(0, hist_end));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a success between failures resets the run
// -----------------------------------------------------------------------------
void test_failure_run_resets() {
    std::cout << "[TEST] Sampler failure run resets on success\n";

    Rig rig(with_resolution(100));
    rig.script->push_failures(2);
    rig.script->push_elapsed({120});
    rig.script->push_failures(2);
    rig.script->push_elapsed({100});

    TEST_CHECK(rig.sampler->start() == Error::None);
    for (int i = 0; i < 6; ++i) {
        TEST_CHECK(rig.sampler->step());
    }
    TEST_CHECK(rig.sampler->state() == sampler::State::Running);
    TEST_CHECK(!rig.sampler->degraded());
    TEST_CHECK(rig.sampler->consecutive_failures() == 0);
    TEST_CHECK(rig.telemetry->dropped_samples_total.load() == 4);
    TEST_CHECK(rig.histogram->snapshot().count == 2);
    TEST_CHECK(rig.histogram->snapshot().sum == 20);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: configurable failure threshold
// -----------------------------------------------------------------------------
void test_failure_threshold() {
    std::cout << "[TEST] Sampler failure threshold of one\n";

    sampler::Config cfg = with_resolution(100);
    cfg.max_consecutive_failures = 1;
    Rig rig(cfg);
    rig.script->push_failures(1);

    TEST_CHECK(rig.sampler->start() == Error::None);
    TEST_CHECK(!rig.sampler->step());
    TEST_CHECK(rig.sampler->degraded());
    TEST_CHECK(rig.histogram->snapshot().count == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: coordinated-omission back-fill
// -----------------------------------------------------------------------------
void test_coordinated_omission() {
    std::cout << "[TEST] Sampler coordinated-omission correction\n";

    sampler::Config cfg = with_resolution(100);
    cfg.correct_coordinated_omission = true;
    Rig rig(cfg);
    rig.script->push_elapsed({450, 150});   // hiccups 350 and 50

    TEST_CHECK(rig.sampler->start() == Error::None);
    TEST_CHECK(rig.sampler->step());
    TEST_CHECK(rig.sampler->step());

    // 350 -> 350, 250, 150 ; 50 -> 50 (below resolution, no back-fill)
    const auto snap = rig.histogram->snapshot();
    TEST_CHECK(snap.count == 4);
    TEST_CHECK(snap.sum == 350 + 250 + 150 + 50);
    TEST_CHECK(rig.telemetry->samples_total.load() == 2);
    TEST_CHECK(rig.telemetry->backfilled_samples_total.load() == 2);

    Rig plain(with_resolution(100));
    plain.script->push_elapsed({450});
    TEST_CHECK(plain.sampler->start() == Error::None);
    TEST_CHECK(plain.sampler->step());
    TEST_CHECK(plain.histogram->snapshot().count == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: stop is honoured at the end of the current iteration
// -----------------------------------------------------------------------------
void test_stop_mid_loop() {
    std::cout << "[TEST] Sampler stop mid-loop\n";

    Rig rig(with_resolution(100));
    TEST_CHECK(rig.sampler->start() == Error::None);
    TEST_CHECK(rig.sampler->step());
    TEST_CHECK(rig.sampler->step());

    rig.sampler->request_stop();
    TEST_CHECK(rig.sampler->state() == sampler::State::Running);
    TEST_CHECK(!rig.sampler->step());   // records the in-flight sample, then drains
    TEST_CHECK(rig.sampler->state() == sampler::State::Terminated);
    TEST_CHECK(!rig.sampler->degraded());
    TEST_CHECK(rig.sampler->wait_terminated(std::chrono::nanoseconds(0)));

    const auto count = rig.histogram->snapshot().count;
    TEST_CHECK(count == 3);
    TEST_CHECK(!rig.sampler->step());
    TEST_CHECK(rig.histogram->snapshot().count == count);
    TEST_CHECK(rig.script->sleeps == 3);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: stopping a sampler that never started
// -----------------------------------------------------------------------------
void test_stop_before_start() {
    std::cout << "[TEST] Sampler stop before start\n";

    Rig rig(with_resolution(100));
    rig.sampler->request_stop();
    TEST_CHECK(rig.sampler->state() == sampler::State::Terminated);
    TEST_CHECK(rig.sampler->start() == Error::InvalidState);
    TEST_CHECK(!rig.sampler->step());
    TEST_CHECK(rig.script->sleeps == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Error);

    test_measurement_scenario();
    test_clamp();
    test_start_contract();
    test_degradation();
    test_failure_run_resets();
    test_failure_threshold();
    test_coordinated_omission();
    test_stop_mid_loop();
    test_stop_before_start();

    std::cout << "\n[hiccupwatch::core::Sampler] ALL TESTS PASSED\n";
    return 0;
}
