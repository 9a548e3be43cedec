#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>
#include <unistd.h>

#include "hiccupwatch.hpp"
#include "lcr/log/logger.hpp"

using namespace hiccupwatch;


// -----------------------------------------------------------------------------
// Ctrl+C / SIGTERM handling
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

    // -------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------
    config::Options options;
    config::Status status = config::configure(argc, argv, "hiccupwatch - scheduling hiccup monitor agent", options);
    if (options.exit_requested) {
        return EXIT_SUCCESS;
    }
    if (!status.ok()) {
        HCW_FATAL("[agent] invalid configuration: " << status);
        return EXIT_FAILURE;
    }
    const config::Settings& settings = options.settings;
    status = config::apply_logging(settings);
    if (!status.ok()) {
        HCW_FATAL("[agent] invalid configuration: " << status);
        return EXIT_FAILURE;
    }
    if (lcr::log::Logger::instance().enabled(lcr::log::Level::Debug)) {
        std::ostringstream os;
        settings.dump("Effective settings", os);
        HCW_DEBUG(os.str());
    }
    HCW_INFO("[agent] hiccupwatch " << version_string << " starting");

    // -------------------------------------------------------------
    // Hiccups monitor
    // -------------------------------------------------------------
    exporter::Exporter registry;
    for (const auto& label : settings.prometheus_exporter.labels) {
        registry.add_constant_label(label.name, label.value);
    }
    core::HiccupMonitor<> monitor(config::to_monitor_config(settings));

    if (settings.hiccups_monitor.enabled) {
        const core::Error err = monitor.start(settings.hiccups_monitor.resolution_nanos);
        if (err != core::Error::None) {
            if (!options.allow_degraded_start) {
                HCW_FATAL("[agent] hiccup monitor failed to start (" << to_string(err) << "), exiting");
                return EXIT_FAILURE;
            }
            HCW_ERROR("[agent] hiccup monitor disabled (" << to_string(err) << "), continuing without it");
        }
    }
    else {
        HCW_INFO("[agent] hiccup monitor disabled by configuration");
    }
    registry.register_source([&monitor](exporter::Exporter::Collector& c) { monitor.collect(c); });

    // -------------------------------------------------------------
    // Scrape endpoint
    // -------------------------------------------------------------
    std::unique_ptr<exporter::HttpServer> server;
    if (settings.prometheus_exporter.enabled) {
        server = std::make_unique<exporter::HttpServer>(config::to_http_server_config(settings), registry);
        registry.register_source([srv = server.get()](exporter::Exporter::Collector& c) { srv->collect(c); });
        const core::Error err = server->start();
        if (err != core::Error::None) {
            HCW_FATAL("[agent] scrape endpoint failed to start (" << to_string(err) << "), exiting");
            (void)monitor.stop();
            return EXIT_FAILURE;
        }
    }
    else {
        HCW_INFO("[agent] prometheus exporter disabled by configuration");
    }

    // -------------------------------------------------------------
    // Run until signalled
    // -------------------------------------------------------------
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    bool degraded_reported = false;
    while (running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (!degraded_reported && monitor.degraded()) {
            HCW_ERROR("[agent] hiccup sampler degraded, last histogram stays exported");
            degraded_reported = true;
        }
    }

    // -------------------------------------------------------------
    // Shutdown
    // -------------------------------------------------------------
    HCW_INFO("[agent] shutdown requested");
    if (server) {
        server->stop();
    }
    const core::Error err = monitor.stop();
    if (err == core::Error::Timeout) {
        HCW_WARN("[agent] hiccup monitor did not drain in time");
    }
    else if (err == core::Error::SamplerDegraded) {
        HCW_WARN("[agent] hiccup monitor stopped as " << to_string(err));
    }
    HCW_INFO("[agent] bye");
    return EXIT_SUCCESS;
}
