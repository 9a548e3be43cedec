#pragma once

#include <string>
#include <ostream>
#include <cstdint>
#include <cstdlib>
#include <iostream>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"
#include "lcr/time_unit.hpp"


namespace hiccupwatch::cli::probe {

struct Params {
    std::uint64_t resolution_nanos = 1'000'000;
    std::uint64_t duration_secs    = 10;
    std::string unit               = "milliseconds";
    bool correct_co                = false;
    std::string log_level          = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Resolution : " << resolution_nanos << " ns\n"
           << "  Duration   : " << duration_secs << " s\n"
           << "  Unit       : " << unit << "\n"
           << "  CO correct : " << (correct_co ? "true" : "false") << "\n"
           << "  Log Level  : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-r,--resolution-nanos", params.resolution_nanos, "Sampler target interval in nanoseconds")
        ->check(CLI::PositiveNumber)->default_val(params.resolution_nanos);
    app.add_option("-d,--duration", params.duration_secs, "How long to sample, in seconds")
        ->check(CLI::PositiveNumber)->default_val(params.duration_secs);
    app.add_option("-u,--unit", params.unit, "Export unit: seconds | milliseconds | microseconds | nanoseconds")
        ->check(CLI::IsMember({"seconds", "milliseconds", "microseconds", "nanoseconds", "s", "ms", "us", "ns"}))
        ->default_val(params.unit);
    app.add_flag("--correct-coordinated-omission", params.correct_co, "Back-fill samples hidden by long stalls");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal"}))
        ->default_val(params.log_level);

    app.footer(
        "Runs the hiccup sampler on this machine for a bounded time and prints\n"
        "the latency summary and the exposition a scraper would receive.\n"
        "Useful to pick a resolution before deploying the agent."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    lcr::log::Level level{};
    if (lcr::log::parse_level(params.log_level, level)) {
        lcr::log::Logger::instance().set_level(level);
    }
    return params;
}

} // namespace hiccupwatch::cli::probe
