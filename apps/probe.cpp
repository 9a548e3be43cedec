#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <unistd.h>

#include "hiccupwatch/core/monitor.hpp"
#include "hiccupwatch/exporter/exporter.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/format.hpp"
#include "lcr/time_unit.hpp"

#include "common/cli/probe_params.hpp"

using namespace hiccupwatch;


// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    lcr::log::Logger::instance().enable_color(::isatty(STDOUT_FILENO) != 0);

    const auto params = cli::probe::configure(argc, argv, "hiccupwatch_probe - measure scheduling hiccups for a bounded time");
    params.dump("=== hiccupwatch probe ===", std::cout);

    core::MonitorConfig cfg;
    cfg.sampler.correct_coordinated_omission = params.correct_co;
    if (!lcr::parse_time_unit(params.unit, cfg.unit)) {
        cfg.unit = lcr::time_unit::milliseconds;
    }

    core::HiccupMonitor<> monitor(cfg);
    const core::Error err = monitor.start(params.resolution_nanos);
    if (err != core::Error::None) {
        std::cerr << "Failed to start hiccup monitor: " << core::to_string(err) << std::endl;
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, on_signal);
    std::cout << "Sampling for " << params.duration_secs << " s. Press Ctrl+C to stop early\n\n";

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(params.duration_secs);
    while (running.load() && std::chrono::steady_clock::now() < deadline && !monitor.degraded()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    const core::Error stop_err = monitor.stop();
    if (stop_err == core::Error::Timeout) {
        std::cerr << "Sampler did not stop in time, results may be incomplete" << std::endl;
    }
    else if (stop_err == core::Error::SamplerDegraded) {
        std::cerr << "Sampler degraded after repeated sleep failures, results are partial" << std::endl;
    }

    const auto snap = monitor.histogram()->snapshot();
    std::cout << "\n=== Summary ===\n"
              << "  Samples : " << lcr::format_number_exact(snap.count) << '\n'
              << "  Mean    : " << lcr::format_duration(static_cast<std::uint64_t>(snap.mean())) << '\n'
              << "  Max     : " << lcr::format_duration(snap.max) << '\n'
              << "  " << snap.percentiles().str(cfg.unit) << '\n';
    monitor.telemetry()->debug_dump(std::cout);

    exporter::Exporter registry;
    registry.register_source([&monitor](exporter::Exporter::Collector& c) { monitor.collect(c); });
    std::cout << "\n=== Exposition ===\n" << registry.render() << std::flush;

    return monitor.degraded() ? EXIT_FAILURE : EXIT_SUCCESS;
}
