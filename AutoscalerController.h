#pragma once

#include "AutoscalerSpec.h"
#include "IScaleTarget.h"
#include "ReplicaCalculator.h"

#include <optional>

namespace wpa {

struct Recommendation {
    int32_t replicas = 0;
    // Metric whose proposal won, empty when the clamp alone decided
    std::string metric_name;
    std::chrono::system_clock::time_point timestamp;
};

class AutoscalerController {
public:
    AutoscalerController(
            IScaleTarget & target,
            const ReplicaCalculator & calculator,
            AutoscalerSpec spec);

    // Evaluates every metric once and applies the highest proposal, clamped to
    // [min_replicas, max_replicas]. Returns nullopt when no metric could be evaluated.
    std::optional<Recommendation> reconcile();

private:
    IScaleTarget & m_target;
    const ReplicaCalculator & m_calculator;
    AutoscalerSpec m_spec;
};

} // namespace wpa
