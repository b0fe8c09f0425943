#pragma once

#include "AutoscalerSpec.h"
#include "Log.h"

#include <istream>
#include <string>

namespace wpa {

/**
 * Autoscaler definition read from "key = value" lines, '#' starts a comment.
 *
 *   name = web
 *   namespace = default
 *   algorithm = average
 *   tolerance = 0.1
 *   min_replicas = 1
 *   max_replicas = 20
 *   log_level = debug
 *   metric.requests.high_watermark = 2k
 *   metric.requests.low_watermark = 500
 *   metric.requests.selector = app=web,env in (prod)
 *
 * Watermarks are resource quantities. Throws ConfigError on any problem.
 */
class ControllerConfig {
public:
    explicit ControllerConfig(std::istream & input);
    ~ControllerConfig();

    static ControllerConfig from_file(const std::string & path);

    const AutoscalerSpec & get_autoscaler_spec() const;
    LogLevel get_log_level() const;

private:
    struct MetricEntry {
        MetricSpec spec;
        bool has_high_watermark = false;
        bool has_low_watermark = false;
    };

    void apply(const std::string & key, const std::string & value, size_t line_no);
    MetricEntry & metric_entry(const std::string & metric_name);
    void validate();

private:
    AutoscalerSpec m_spec;
    LogLevel m_log_level = LogLevel::Info;
    std::vector<MetricEntry> m_metric_entries;
};

} // namespace wpa
