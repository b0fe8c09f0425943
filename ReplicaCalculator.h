#pragma once

#include "AutoscalerSpec.h"
#include "IMetricsSource.h"
#include "ISelectorResolver.h"
#include "ITelemetrySink.h"

#include <chrono>
#include <cstdint>

namespace wpa {

struct CalculationResult {
    int32_t replica_count = 0;
    // Aggregated metric value, milli-scaled and truncated
    int64_t utilization = 0;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * Computes a replica recommendation for a single metric.
 *
 * Usage above the tolerance-widened high watermark scales up with
 * ceil(current * usage / high), usage below the widened low watermark scales
 * down with floor(current * usage / low), anything in between (boundaries
 * included) keeps the current count and marks scaling as restricted.
 *
 * The calculator keeps no state between calls. Calls for the same
 * (workload, metric) pair must be serialized by the caller since they share
 * gauges in the telemetry sink.
 */
class ReplicaCalculator {
public:
    ReplicaCalculator(
            const IMetricsSource & metrics_source,
            const ISelectorResolver & selector_resolver,
            ITelemetrySink & telemetry);

    // Throws SelectorError, MetricsFetchError, DegenerateArithmeticError,
    // std::invalid_argument on negative current_replicas
    CalculationResult compute_replicas(
            int32_t current_replicas,
            const MetricSpec & metric,
            const AutoscalerSpec & autoscaler) const;

private:
    void publish(const GaugeLabels & labels, bool restricted, double milli_adjusted_usage) const;
    void clear(const GaugeLabels & labels) const;

private:
    const IMetricsSource & m_metrics_source;
    const ISelectorResolver & m_selector_resolver;
    ITelemetrySink & m_telemetry;
};

} // namespace wpa
