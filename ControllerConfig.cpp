#include "ControllerConfig.h"

#include "Errors.h"
#include "Quantity.h"

#include "fmt/core.h"

#include <algorithm>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace wpa {

namespace {

std::string trim(const std::string & s)
{
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

double parse_double(const std::string & value, const std::string & key, size_t line_no)
{
    size_t parsed = 0;
    double result = 0;
    try {
        result = std::stod(value, &parsed);
    } catch (const std::logic_error &) {
        parsed = 0;
    }
    if (parsed == 0 || parsed != value.size()) {
        throw ConfigError(fmt::format("line {}: \"{}\" is not a number for {}", line_no, value, key));
    }
    return result;
}

int32_t parse_int32(const std::string & value, const std::string & key, size_t line_no)
{
    size_t parsed = 0;
    long long result = 0;
    try {
        result = std::stoll(value, &parsed);
    } catch (const std::logic_error &) {
        parsed = 0;
    }
    if (parsed == 0 || parsed != value.size()
            || result < std::numeric_limits<int32_t>::min()
            || result > std::numeric_limits<int32_t>::max()) {
        throw ConfigError(fmt::format("line {}: \"{}\" is not a 32-bit integer for {}", line_no, value, key));
    }
    return static_cast<int32_t>(result);
}

int64_t parse_watermark(const std::string & value, const std::string & key, size_t line_no)
{
    try {
        return parse_quantity_milli(value);
    } catch (const QuantityError & e) {
        throw ConfigError(fmt::format("line {}: {} for {}", line_no, e.what(), key));
    }
}

} // unnamed namespace

ControllerConfig::ControllerConfig(std::istream & input)
{
    std::string line;
    size_t line_no = 0;
    while (std::getline(input, line)) {
        ++line_no;
        if (auto comment = line.find('#'); comment != std::string::npos) {
            line.erase(comment);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError(fmt::format("line {}: expected \"key = value\"", line_no));
        }
        apply(trim(line.substr(0, eq)), trim(line.substr(eq + 1)), line_no);
    }

    for (auto & entry : m_metric_entries) {
        m_spec.metrics.push_back(entry.spec);
    }
    validate();
}

ControllerConfig::~ControllerConfig() = default;

ControllerConfig ControllerConfig::from_file(const std::string & path)
{
    std::ifstream input{path};
    if (!input) {
        throw ConfigError(fmt::format("cannot open config file \"{}\"", path));
    }
    return ControllerConfig{input};
}

const AutoscalerSpec & ControllerConfig::get_autoscaler_spec() const
{
    return m_spec;
}

LogLevel ControllerConfig::get_log_level() const
{
    return m_log_level;
}

void ControllerConfig::apply(const std::string & key, const std::string & value, size_t line_no)
{
    if (key == "name") {
        m_spec.name = value;
    } else if (key == "namespace") {
        m_spec.workload_namespace = value;
    } else if (key == "algorithm") {
        if (value != "average" && value != "absolute") {
            log(LogLevel::Warning, fmt::format("line {}: unknown algorithm \"{}\", using absolute", line_no, value));
        }
        m_spec.algorithm = parse_algorithm(value);
    } else if (key == "tolerance") {
        m_spec.tolerance = parse_double(value, key, line_no);
    } else if (key == "min_replicas") {
        m_spec.min_replicas = parse_int32(value, key, line_no);
    } else if (key == "max_replicas") {
        m_spec.max_replicas = parse_int32(value, key, line_no);
    } else if (key == "log_level") {
        auto level = parse_log_level(value);
        if (!level) {
            throw ConfigError(fmt::format("line {}: unknown log level \"{}\"", line_no, value));
        }
        m_log_level = *level;
    } else if (key.rfind("metric.", 0) == 0) {
        auto field_dot = key.rfind('.');
        auto metric_name = key.substr(7, field_dot > 7 ? field_dot - 7 : 0);
        auto field = key.substr(field_dot + 1);
        if (metric_name.empty()) {
            throw ConfigError(fmt::format("line {}: missing metric name in \"{}\"", line_no, key));
        }

        auto & entry = metric_entry(metric_name);
        if (field == "high_watermark") {
            entry.spec.high_watermark = parse_watermark(value, key, line_no);
            entry.has_high_watermark = true;
        } else if (field == "low_watermark") {
            entry.spec.low_watermark = parse_watermark(value, key, line_no);
            entry.has_low_watermark = true;
        } else if (field == "selector") {
            try {
                entry.spec.metric_selector = parse_label_selector(value);
            } catch (const SelectorError & e) {
                throw ConfigError(fmt::format("line {}: {}", line_no, e.what()));
            }
        } else {
            throw ConfigError(fmt::format("line {}: unknown metric field \"{}\"", line_no, field));
        }
    } else {
        throw ConfigError(fmt::format("line {}: unknown key \"{}\"", line_no, key));
    }
}

ControllerConfig::MetricEntry & ControllerConfig::metric_entry(const std::string & metric_name)
{
    auto it = std::find_if(m_metric_entries.begin(), m_metric_entries.end(),
            [&] (const MetricEntry & entry) { return entry.spec.metric_name == metric_name; });
    if (it != m_metric_entries.end()) {
        return *it;
    }
    auto & entry = m_metric_entries.emplace_back();
    entry.spec.metric_name = metric_name;
    return entry;
}

void ControllerConfig::validate()
{
    if (m_spec.name.empty()) {
        throw ConfigError("autoscaler name is not set");
    }
    if (m_spec.workload_namespace.empty()) {
        m_spec.workload_namespace = "default";
    }
    if (!(m_spec.tolerance >= 0)) {
        throw ConfigError(fmt::format("tolerance {} must be a non-negative fraction", m_spec.tolerance));
    }
    if (m_spec.min_replicas < 0 || m_spec.min_replicas > m_spec.max_replicas) {
        throw ConfigError(fmt::format("invalid replica range [{}; {}]", m_spec.min_replicas, m_spec.max_replicas));
    }
    if (m_metric_entries.empty()) {
        throw ConfigError("no metric configured");
    }
    for (const auto & entry : m_metric_entries) {
        const auto & metric = entry.spec;
        if (!entry.has_high_watermark || !entry.has_low_watermark) {
            throw ConfigError(fmt::format("metric \"{}\" needs both watermarks", metric.metric_name));
        }
        if (metric.high_watermark < metric.low_watermark) {
            throw ConfigError(fmt::format("metric \"{}\": high watermark {} is below low watermark {}",
                    metric.metric_name,
                    format_quantity_milli(metric.high_watermark),
                    format_quantity_milli(metric.low_watermark)));
        }
    }
}

} // namespace wpa
