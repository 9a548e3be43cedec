#pragma once

/*
===============================================================================
hiccupwatch: Public API Entry Point
===============================================================================

Scheduling-latency ("hiccup") monitor exported as a Prometheus histogram.

  core::HiccupMonitor      lifecycle of the sampling thread
  exporter::Exporter       render() of every registered metric source
  exporter::HttpServer     pull endpoint serving render()
  config::configure()      layered settings (file < env < flags)

Typical embedding:

    hiccupwatch::core::HiccupMonitor<> monitor(config::to_monitor_config(s));
    if (monitor.start(s.hiccups_monitor.resolution_nanos) == core::Error::None) {
        exporter.register_source([&](auto& c) { monitor.collect(c); });
    }
===============================================================================
*/

#include <hiccupwatch/version.hpp>
#include <hiccupwatch/core/error.hpp>
#include <hiccupwatch/core/monitor.hpp>
#include <hiccupwatch/exporter/exporter.hpp>
#include <hiccupwatch/exporter/http_server.hpp>
#include <hiccupwatch/config/settings.hpp>
#include <hiccupwatch/config/loader.hpp>
#include <hiccupwatch/config/cli.hpp>
