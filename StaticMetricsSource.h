#pragma once

#include "IMetricsSource.h"

#include <string>
#include <vector>

namespace wpa {

// Fixed set of labelled series, every fetch answers with the same sample time.
class StaticMetricsSource : public IMetricsSource {
public:
    explicit StaticMetricsSource(std::chrono::system_clock::time_point timestamp);

    void add_series(std::string metric_name, std::string workload_namespace, Labels labels, int64_t milli_value);

    MetricSamples fetch(
            std::string_view metric_name,
            std::string_view workload_namespace,
            const SelectorFilter & filter) const override;

private:
    struct Series {
        std::string metric_name;
        std::string workload_namespace;
        Labels labels;
        int64_t milli_value;
    };

    std::chrono::system_clock::time_point m_timestamp;
    std::vector<Series> m_series;
};

} // namespace wpa
