#include "hiccupwatch/config/loader.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace hiccupwatch::config {

namespace {

// ============================================================================
// FIELD PRIMITIVES
// ============================================================================
// Each helper leaves `out` untouched when the key is absent and fails with a
// message naming the dotted key when the value has the wrong type.

[[nodiscard]]
Status require_object(const simdjson::dom::element& elem, const std::string& path) {
    if (elem.type() != simdjson::dom::element_type::OBJECT) {
        return Status::invalid((path.empty() ? std::string("document root") : path) + ": expected an object");
    }
    return Status{};
}

[[nodiscard]]
Status parse_bool_optional(const simdjson::dom::element& obj, const std::string& prefix, const char* key, bool& out) {
    auto field = obj[key];
    if (field.error()) {
        return Status{}; // optional, not present
    }
    bool tmp{};
    if (field.get(tmp)) {
        return Status::invalid(prefix + key + ": expected a boolean");
    }
    out = tmp;
    return Status{};
}

[[nodiscard]]
Status parse_uint64_optional(const simdjson::dom::element& obj, const std::string& prefix, const char* key, std::uint64_t& out) {
    auto field = obj[key];
    if (field.error()) {
        return Status{}; // optional, not present
    }
    std::uint64_t tmp{};
    if (field.get(tmp)) {
        return Status::invalid(prefix + key + ": expected a non-negative integer");
    }
    out = tmp;
    return Status{};
}

[[nodiscard]]
Status parse_string_optional(const simdjson::dom::element& obj, const std::string& prefix, const char* key, std::string& out) {
    auto field = obj[key];
    if (field.error()) {
        return Status{}; // optional, not present
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Status::invalid(prefix + key + ": expected a string");
    }
    out.assign(sv.data(), sv.size());
    return Status{};
}

// Fetches a nested object; `present` is false when the key is absent
[[nodiscard]]
Status parse_object_optional(const simdjson::dom::element& obj, const std::string& prefix, const char* key,
                             simdjson::dom::element& out, bool& present) {
    present = false;
    auto field = obj[key];
    if (field.error()) {
        return Status{};
    }
    if (field.get(out)) {
        return Status::invalid(prefix + key + ": unreadable value");
    }
    Status st = require_object(out, prefix + key);
    if (!st.ok()) {
        return st;
    }
    present = true;
    return Status{};
}

template <std::size_t N>
void log_unknown_keys(const simdjson::dom::element& obj, const std::string& prefix,
                      const std::array<std::string_view, N>& known) {
    simdjson::dom::object object;
    if (obj.get(object)) {
        return;
    }
    for (auto field : object) {
        bool found = false;
        for (auto k : known) {
            if (field.key == k) {
                found = true;
                break;
            }
        }
        if (!found) {
            HCW_DEBUG("[config] ignoring unknown key '" << prefix << field.key << "'");
        }
    }
}

#define HCW_CONFIG_TRY(expr)            \
    do {                                \
        Status st_ = (expr);            \
        if (!st_.ok()) return st_;      \
    } while (0)


// ============================================================================
// SECTIONS
// ============================================================================

[[nodiscard]]
Status parse_histogram(const simdjson::dom::element& obj, HistogramSettings& out) {
    static constexpr std::array<std::string_view, 2> known = {"min_nanos", "max_nanos"};
    const std::string prefix = "hiccups_monitor.histogram.";
    HCW_CONFIG_TRY(parse_uint64_optional(obj, prefix, "min_nanos", out.min_nanos));
    HCW_CONFIG_TRY(parse_uint64_optional(obj, prefix, "max_nanos", out.max_nanos));
    log_unknown_keys(obj, prefix, known);
    return Status{};
}

[[nodiscard]]
Status parse_hiccups_monitor(const simdjson::dom::element& obj, HiccupsMonitorSettings& out) {
    static constexpr std::array<std::string_view, 9> known = {
        "enabled", "name", "description", "resolution_nanos", "unit", "histogram",
        "correct_coordinated_omission", "max_consecutive_sleep_failures", "stop_timeout_millis"
    };
    const std::string prefix = "hiccups_monitor.";
    HCW_CONFIG_TRY(parse_bool_optional(obj, prefix, "enabled", out.enabled));
    HCW_CONFIG_TRY(parse_string_optional(obj, prefix, "name", out.name));
    HCW_CONFIG_TRY(parse_string_optional(obj, prefix, "description", out.description));
    HCW_CONFIG_TRY(parse_uint64_optional(obj, prefix, "resolution_nanos", out.resolution_nanos));
    HCW_CONFIG_TRY(parse_string_optional(obj, prefix, "unit", out.unit));
    HCW_CONFIG_TRY(parse_bool_optional(obj, prefix, "correct_coordinated_omission", out.correct_coordinated_omission));
    HCW_CONFIG_TRY(parse_uint64_optional(obj, prefix, "max_consecutive_sleep_failures", out.max_consecutive_sleep_failures));
    HCW_CONFIG_TRY(parse_uint64_optional(obj, prefix, "stop_timeout_millis", out.stop_timeout_millis));

    simdjson::dom::element histogram;
    bool present = false;
    HCW_CONFIG_TRY(parse_object_optional(obj, prefix, "histogram", histogram, present));
    if (present) {
        HCW_CONFIG_TRY(parse_histogram(histogram, out.histogram));
    }
    log_unknown_keys(obj, prefix, known);
    return Status{};
}

// Object of string values, kept in document order
[[nodiscard]]
Status parse_labels(const simdjson::dom::element& obj, std::vector<ConstantLabel>& out) {
    simdjson::dom::object object;
    if (obj.get(object)) {
        return Status::invalid("prometheus_exporter.labels: expected an object");
    }
    std::vector<ConstantLabel> labels;
    for (auto field : object) {
        std::string_view value;
        if (field.value.get(value)) {
            return Status::invalid("prometheus_exporter.labels." + std::string(field.key) + ": expected a string");
        }
        labels.push_back(ConstantLabel{std::string(field.key), std::string(value)});
    }
    out = std::move(labels);
    return Status{};
}

[[nodiscard]]
Status parse_prometheus_exporter(const simdjson::dom::element& obj, PrometheusExporterSettings& out) {
    static constexpr std::array<std::string_view, 5> known = {"enabled", "host", "port", "path", "labels"};
    const std::string prefix = "prometheus_exporter.";
    HCW_CONFIG_TRY(parse_bool_optional(obj, prefix, "enabled", out.enabled));
    HCW_CONFIG_TRY(parse_string_optional(obj, prefix, "host", out.host));
    HCW_CONFIG_TRY(parse_uint64_optional(obj, prefix, "port", out.port));
    HCW_CONFIG_TRY(parse_string_optional(obj, prefix, "path", out.path));

    simdjson::dom::element labels;
    bool present = false;
    HCW_CONFIG_TRY(parse_object_optional(obj, prefix, "labels", labels, present));
    if (present) {
        HCW_CONFIG_TRY(parse_labels(labels, out.labels));
    }
    log_unknown_keys(obj, prefix, known);
    return Status{};
}

[[nodiscard]]
Status parse_root(const simdjson::dom::element& root, Settings& out) {
    static constexpr std::array<std::string_view, 4> known = {
        "debug", "log_level", "hiccups_monitor", "prometheus_exporter"
    };
    HCW_CONFIG_TRY(require_object(root, ""));
    HCW_CONFIG_TRY(parse_bool_optional(root, "", "debug", out.debug));
    HCW_CONFIG_TRY(parse_string_optional(root, "", "log_level", out.log_level));

    simdjson::dom::element section;
    bool present = false;
    HCW_CONFIG_TRY(parse_object_optional(root, "", "hiccups_monitor", section, present));
    if (present) {
        HCW_CONFIG_TRY(parse_hiccups_monitor(section, out.hiccups_monitor));
    }
    HCW_CONFIG_TRY(parse_object_optional(root, "", "prometheus_exporter", section, present));
    if (present) {
        HCW_CONFIG_TRY(parse_prometheus_exporter(section, out.prometheus_exporter));
    }
    log_unknown_keys(root, "", known);
    return Status{};
}

#undef HCW_CONFIG_TRY

} // namespace


Status load_json(std::string_view json, Settings& out) {
    simdjson::dom::parser parser;
    simdjson::padded_string padded(json);
    simdjson::dom::element root;
    const auto err = parser.parse(padded).get(root);
    if (err) {
        return Status::invalid(std::string("malformed configuration document: ") + simdjson::error_message(err));
    }
    return parse_root(root, out);
}

Status load_json_file(const std::string& path, Settings& out) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    const auto err = parser.load(path).get(root);
    if (err == simdjson::IO_ERROR) {
        return Status::io_error("cannot read configuration file '" + path + "'");
    }
    if (err) {
        return Status::invalid("configuration file '" + path + "': " + simdjson::error_message(err));
    }
    HCW_INFO("[config] loaded configuration file '" << path << "'");
    return parse_root(root, out);
}

} // namespace hiccupwatch::config
