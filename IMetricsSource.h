#pragma once

#include "LabelSelector.h"

#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

namespace wpa {

// Milli-scaled values of every series that matched, plus the time they were sampled at.
struct MetricSamples {
    std::vector<int64_t> values;
    std::chrono::system_clock::time_point timestamp;
};

class IMetricsSource {
public:
    // Throws on any backend failure, including timeouts
    virtual MetricSamples fetch(
            std::string_view metric_name,
            std::string_view workload_namespace,
            const SelectorFilter & filter) const = 0;

    virtual ~IMetricsSource() = default;
};

} // namespace wpa
