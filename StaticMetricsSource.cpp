#include "StaticMetricsSource.h"

#include "fmt/core.h"

#include <stdexcept>

namespace wpa {

StaticMetricsSource::StaticMetricsSource(std::chrono::system_clock::time_point timestamp) :
    m_timestamp(timestamp)
{}

void StaticMetricsSource::add_series(
        std::string metric_name,
        std::string workload_namespace,
        Labels labels,
        int64_t milli_value)
{
    m_series.push_back(Series{ std::move(metric_name), std::move(workload_namespace), std::move(labels), milli_value });
}

MetricSamples StaticMetricsSource::fetch(
        std::string_view metric_name,
        std::string_view workload_namespace,
        const SelectorFilter & filter) const
{
    MetricSamples samples;
    samples.timestamp = m_timestamp;
    for (const auto & series : m_series) {
        if (series.metric_name == metric_name
                && series.workload_namespace == workload_namespace
                && filter.matches(series.labels)) {
            samples.values.push_back(series.milli_value);
        }
    }
    if (samples.values.empty()) {
        throw std::runtime_error(fmt::format("no series matched \"{}\"", filter.to_string()));
    }
    return samples;
}

} // namespace wpa
