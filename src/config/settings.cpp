#include "hiccupwatch/config/settings.hpp"

#include <chrono>
#include <cctype>
#include <string>

#include "lcr/log/logger.hpp"
#include "lcr/time_unit.hpp"


namespace hiccupwatch::config {

namespace {

// Prometheus metric name: [a-zA-Z_:][a-zA-Z0-9_:]*
[[nodiscard]]
bool is_valid_metric_name(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    for (std::size_t i = 0; i < name.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(name[i]);
        const bool ok = std::isalpha(c) || c == '_' || c == ':' || (i > 0 && std::isdigit(c));
        if (!ok) {
            return false;
        }
    }
    return true;
}

// Prometheus label name: [a-zA-Z_][a-zA-Z0-9_]*, "__" prefix reserved
[[nodiscard]]
bool is_valid_label_name(std::string_view name) noexcept {
    if (name.empty() || name.rfind("__", 0) == 0) {
        return false;
    }
    for (std::size_t i = 0; i < name.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(name[i]);
        const bool ok = std::isalpha(c) || c == '_' || (i > 0 && std::isdigit(c));
        if (!ok) {
            return false;
        }
    }
    return true;
}

} // namespace


Status parse_constant_label(std::string_view text, ConstantLabel& out) {
    const std::size_t eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return Status::invalid("prometheus_exporter.labels: expected name=value, got '" + std::string(text) + "'");
    }
    out.name.assign(text.data(), eq);
    out.value.assign(text.data() + eq + 1, text.size() - eq - 1);
    return Status{};
}


void Settings::dump(const std::string& header, std::ostream& os) const {
    const auto& m = hiccups_monitor;
    const auto& e = prometheus_exporter;
    os << header << ":\n"
       << "  debug                         : " << (debug ? "true" : "false") << '\n'
       << "  log_level                     : " << log_level << '\n'
       << "  hiccups_monitor.enabled       : " << (m.enabled ? "true" : "false") << '\n'
       << "  hiccups_monitor.name          : " << m.name << '\n'
       << "  hiccups_monitor.resolution    : " << m.resolution_nanos << " ns\n"
       << "  hiccups_monitor.unit          : " << m.unit << '\n'
       << "  hiccups_monitor.histogram     : [" << m.histogram.min_nanos << ", " << m.histogram.max_nanos << "] ns\n"
       << "  hiccups_monitor.co_correction : " << (m.correct_coordinated_omission ? "true" : "false") << '\n'
       << "  hiccups_monitor.max_failures  : " << m.max_consecutive_sleep_failures << '\n'
       << "  hiccups_monitor.stop_timeout  : " << m.stop_timeout_millis << " ms\n"
       << "  prometheus_exporter.enabled   : " << (e.enabled ? "true" : "false") << '\n'
       << "  prometheus_exporter.endpoint  : " << e.host << ':' << e.port << e.path << '\n'
       << "  prometheus_exporter.labels    : {";
    for (std::size_t i = 0; i < e.labels.size(); ++i) {
        os << (i ? ", " : "") << e.labels[i].name << "=\"" << e.labels[i].value << '"';
    }
    os << "}\n";
}


Status validate(const Settings& settings) {
    lcr::log::Level level{};
    if (!lcr::log::parse_level(settings.log_level, level)) {
        return Status::invalid("log_level: unknown level '" + settings.log_level + "' (trace | debug | info | warn | error | fatal)");
    }

    const auto& m = settings.hiccups_monitor;
    if (!is_valid_metric_name(m.name)) {
        return Status::invalid("hiccups_monitor.name: '" + m.name + "' is not a valid metric name");
    }
    if (m.resolution_nanos == 0) {
        return Status::invalid("hiccups_monitor.resolution_nanos: must be > 0");
    }
    lcr::time_unit unit{};
    if (!lcr::parse_time_unit(m.unit, unit)) {
        return Status::invalid("hiccups_monitor.unit: unknown unit '" + m.unit + "' (seconds | milliseconds | microseconds | nanoseconds)");
    }
    if (m.histogram.min_nanos == 0) {
        return Status::invalid("hiccups_monitor.histogram.min_nanos: must be >= 1");
    }
    if (m.histogram.max_nanos < m.histogram.min_nanos) {
        return Status::invalid("hiccups_monitor.histogram.max_nanos: must be >= min_nanos");
    }
    if (m.max_consecutive_sleep_failures == 0 || m.max_consecutive_sleep_failures > UINT32_MAX) {
        return Status::invalid("hiccups_monitor.max_consecutive_sleep_failures: must be in [1, 4294967295]");
    }
    if (m.stop_timeout_millis == 0) {
        return Status::invalid("hiccups_monitor.stop_timeout_millis: must be > 0");
    }
    // The sampler checks its stop flag once per interval
    if (m.stop_timeout_millis <= m.resolution_nanos / 1'000'000) {
        return Status::invalid("hiccups_monitor.stop_timeout_millis: must exceed one sampling interval ("
                               + std::to_string(m.resolution_nanos) + " ns)");
    }

    const auto& e = settings.prometheus_exporter;
    if (e.port > 65535) {
        return Status::invalid("prometheus_exporter.port: must be in [0, 65535]");
    }
    if (e.path.empty() || e.path.front() != '/') {
        return Status::invalid("prometheus_exporter.path: must start with '/'");
    }
    for (std::size_t i = 0; i < e.labels.size(); ++i) {
        const auto& name = e.labels[i].name;
        if (!is_valid_label_name(name) || name == "le") {
            return Status::invalid("prometheus_exporter.labels: '" + name + "' is not a usable label name");
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (e.labels[j].name == name) {
                return Status::invalid("prometheus_exporter.labels: duplicate label '" + name + "'");
            }
        }
    }
    return Status{};
}


Status apply_logging(const Settings& settings) {
    lcr::log::Level level{};
    if (!lcr::log::parse_level(settings.log_level, level)) {
        return Status::invalid("log_level: unknown level '" + settings.log_level + "'");
    }
    if (settings.debug && level > lcr::log::Level::Debug) {
        level = lcr::log::Level::Debug;
    }
    lcr::log::Logger::instance().set_level(level);
    return Status{};
}


core::MonitorConfig to_monitor_config(const Settings& settings) {
    const auto& m = settings.hiccups_monitor;
    core::MonitorConfig cfg;
    cfg.name = m.name;
    cfg.description = m.description;
    if (!lcr::parse_time_unit(m.unit, cfg.unit)) {
        cfg.unit = lcr::time_unit::seconds;
    }
    cfg.histogram_min_ns = m.histogram.min_nanos;
    cfg.histogram_max_ns = m.histogram.max_nanos;
    cfg.sampler.resolution_ns = m.resolution_nanos;
    cfg.sampler.max_consecutive_failures = static_cast<std::uint32_t>(m.max_consecutive_sleep_failures);
    cfg.sampler.correct_coordinated_omission = m.correct_coordinated_omission;
    cfg.stop_timeout = std::chrono::milliseconds(m.stop_timeout_millis);
    return cfg;
}

exporter::HttpServerConfig to_http_server_config(const Settings& settings) {
    const auto& e = settings.prometheus_exporter;
    exporter::HttpServerConfig cfg;
    cfg.host = e.host;
    cfg.port = static_cast<std::uint16_t>(e.port);
    cfg.path = e.path;
    return cfg;
}

} // namespace hiccupwatch::config
