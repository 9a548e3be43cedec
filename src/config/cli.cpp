#include "hiccupwatch/config/cli.hpp"

#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "hiccupwatch/config/loader.hpp"
#include "hiccupwatch/version.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/time_unit.hpp"


namespace hiccupwatch::config {

namespace {

// -------------------------------------------------------------
// Validators
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level lvl{};
        if (lcr::log::parse_level(value, lvl)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal";
    },
    "LEVEL"
);

inline auto unit_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::time_unit unit{};
        if (lcr::parse_time_unit(value, unit)) {
            return {};
        }
        return "Unit must be one of: seconds, milliseconds, microseconds, nanoseconds";
    },
    "UNIT"
);

inline auto path_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (!value.empty() && value.front() == '/') {
            return {};
        }
        return "Path must start with '/'";
    },
    "PATH"
);


// Copies a setting from `src` to `dst` when its option was given
// on the command line or through the environment.
using Overlay = std::function<void(Settings& dst, Settings& src)>;

class Binder {
public:
    Binder(CLI::App& app, Settings& target)
        : app_(app)
        , target_(target)
    {}

    template <typename Access>
    CLI::Option* option(const std::string& flag, const std::string& env, Access access, const std::string& help) {
        CLI::Option* opt = app_.add_option(flag, access(target_), help)
            ->envname(env)
            ->capture_default_str();
        track_(opt, access);
        return opt;
    }

    template <typename Access>
    CLI::Option* flag(const std::string& flag, const std::string& env, Access access, const std::string& help) {
        CLI::Option* opt = app_.add_flag(flag, access(target_), help)->envname(env);
        track_(opt, access);
        return opt;
    }

    void apply(Settings& dst) {
        for (auto& overlay : overlays_) {
            overlay(dst, target_);
        }
    }

private:
    template <typename Access>
    void track_(CLI::Option* opt, Access access) {
        overlays_.push_back([opt, access](Settings& dst, Settings& src) {
            if (opt->count() > 0) {
                access(dst) = access(src);
            }
        });
    }

    CLI::App& app_;
    Settings& target_;
    std::vector<Overlay> overlays_;
};

} // namespace


Status configure(int argc, const char* const* argv, std::string_view description, Options& out) {
    CLI::App app{std::string(description)};
    app.set_version_flag("--version", std::string(version_string));

    Settings cli{};
    Binder bind(app, cli);

    app.add_option("-c,--config", out.config_file, "JSON configuration file")
        ->envname("HICCUPWATCH_CONFIG_FILE");
    app.add_flag("--allow-degraded-start", out.allow_degraded_start,
                 "Keep serving the other metrics when the hiccup monitor cannot start")
        ->envname("HICCUPWATCH_ALLOW_DEGRADED_START");

    // General
    bind.flag("--debug", "HICCUPWATCH_DEBUG",
              [](Settings& s) -> auto& { return s.debug; }, "Force at least debug log level");
    bind.option("-l,--log-level", "HICCUPWATCH_LOG_LEVEL",
                [](Settings& s) -> auto& { return s.log_level; }, "Log level: trace | debug | info | warn | error | fatal")
        ->check(log_level_validator);

    // Hiccups monitor
    bind.option("--monitor-enabled", "HICCUPWATCH_HICCUPS_MONITOR_ENABLED",
                [](Settings& s) -> auto& { return s.hiccups_monitor.enabled; }, "Enable the hiccups monitor");
    bind.option("--name", "HICCUPWATCH_HICCUPS_MONITOR_NAME",
                [](Settings& s) -> auto& { return s.hiccups_monitor.name; }, "Exported histogram name");
    bind.option("--description", "HICCUPWATCH_HICCUPS_MONITOR_DESCRIPTION",
                [](Settings& s) -> auto& { return s.hiccups_monitor.description; }, "Exported histogram help text");
    bind.option("-r,--resolution-nanos", "HICCUPWATCH_HICCUPS_MONITOR_RESOLUTION_NANOS",
                [](Settings& s) -> auto& { return s.hiccups_monitor.resolution_nanos; }, "Sampler target interval in nanoseconds");
    bind.option("--unit", "HICCUPWATCH_HICCUPS_MONITOR_UNIT",
                [](Settings& s) -> auto& { return s.hiccups_monitor.unit; }, "Export unit: seconds | milliseconds | microseconds | nanoseconds")
        ->check(unit_validator);
    bind.option("--histogram-min-nanos", "HICCUPWATCH_HICCUPS_MONITOR_HISTOGRAM_MIN_NANOS",
                [](Settings& s) -> auto& { return s.hiccups_monitor.histogram.min_nanos; }, "Lowest histogram bound (rounded down to a power of two)");
    bind.option("--histogram-max-nanos", "HICCUPWATCH_HICCUPS_MONITOR_HISTOGRAM_MAX_NANOS",
                [](Settings& s) -> auto& { return s.hiccups_monitor.histogram.max_nanos; }, "Highest histogram bound (rounded up to a power of two)");
    bind.option("--correct-coordinated-omission", "HICCUPWATCH_HICCUPS_MONITOR_CORRECT_COORDINATED_OMISSION",
                [](Settings& s) -> auto& { return s.hiccups_monitor.correct_coordinated_omission; }, "Back-fill samples hidden by long stalls");
    bind.option("--max-consecutive-sleep-failures", "HICCUPWATCH_HICCUPS_MONITOR_MAX_CONSECUTIVE_SLEEP_FAILURES",
                [](Settings& s) -> auto& { return s.hiccups_monitor.max_consecutive_sleep_failures; }, "Sleep failures in a row before the sampler degrades");
    bind.option("--stop-timeout-millis", "HICCUPWATCH_HICCUPS_MONITOR_STOP_TIMEOUT_MILLIS",
                [](Settings& s) -> auto& { return s.hiccups_monitor.stop_timeout_millis; }, "Bound on the sampler drain at shutdown");

    // Prometheus exporter
    bind.option("--exporter-enabled", "HICCUPWATCH_PROMETHEUS_EXPORTER_ENABLED",
                [](Settings& s) -> auto& { return s.prometheus_exporter.enabled; }, "Serve the scrape endpoint");
    bind.option("--host", "HICCUPWATCH_PROMETHEUS_EXPORTER_HOST",
                [](Settings& s) -> auto& { return s.prometheus_exporter.host; }, "Scrape endpoint bind address");
    bind.option("-p,--port", "HICCUPWATCH_PROMETHEUS_EXPORTER_PORT",
                [](Settings& s) -> auto& { return s.prometheus_exporter.port; }, "Scrape endpoint port (0 = ephemeral)")
        ->check(CLI::Range(0, 65535));
    bind.option("--path", "HICCUPWATCH_PROMETHEUS_EXPORTER_PATH",
                [](Settings& s) -> auto& { return s.prometheus_exporter.path; }, "Scrape endpoint path")
        ->check(path_validator);
    std::vector<std::string> label_args;
    CLI::Option* labels_opt = app.add_option("--label", label_args,
                                             "Constant label added to every sample, name=value (repeatable)")
        ->envname("HICCUPWATCH_PROMETHEUS_EXPORTER_LABELS")
        ->delimiter(',');

    app.footer(
        "Settings are layered: defaults < --config file < HICCUPWATCH_* environment < flags.\n"
        "Metrics are served in the Prometheus text format on GET <host>:<port><path>."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int code = app.exit(e, std::cout, std::cerr);
        if (code == 0) {
            out.exit_requested = true;
            return Status{};
        }
        return Status::invalid(e.what());
    }

    // Defaults, then the file, then whatever the environment or the flags set
    Settings merged{};
    if (!out.config_file.empty()) {
        Status st = load_json_file(out.config_file, merged);
        if (!st.ok()) {
            return st;
        }
    }
    bind.apply(merged);
    if (labels_opt->count() > 0) {
        merged.prometheus_exporter.labels.clear();
        for (const auto& arg : label_args) {
            ConstantLabel label;
            Status st = parse_constant_label(arg, label);
            if (!st.ok()) {
                return st;
            }
            merged.prometheus_exporter.labels.push_back(std::move(label));
        }
    }

    Status st = validate(merged);
    if (!st.ok()) {
        return st;
    }
    out.settings = std::move(merged);
    return Status{};
}

} // namespace hiccupwatch::config
