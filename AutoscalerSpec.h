#pragma once

#include "LabelSelector.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wpa {

enum class Algorithm {
    Absolute,
    Average
};

// "average" selects Average, any other value falls back to Absolute
inline Algorithm parse_algorithm(std::string_view name)
{
    return name == "average" ? Algorithm::Average : Algorithm::Absolute;
}

inline std::string_view to_string(Algorithm algorithm)
{
    return algorithm == Algorithm::Average ? "average" : "absolute";
}

// One external metric and its watermarks, expressed as milli-values.
struct MetricSpec {
    std::string metric_name;
    LabelSelector metric_selector;
    int64_t high_watermark = 0;
    int64_t low_watermark = 0;
};

struct AutoscalerSpec {
    std::string name;
    std::string workload_namespace;
    Algorithm algorithm = Algorithm::Absolute;
    // Fraction of each watermark added to the band on both sides, 0.1 is 10%
    double tolerance = 0.0;

    int32_t min_replicas = 1;
    int32_t max_replicas = 1;
    std::vector<MetricSpec> metrics;
};

} // namespace wpa
