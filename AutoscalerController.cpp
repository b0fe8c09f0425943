#include "AutoscalerController.h"

#include "Errors.h"
#include "Log.h"

#include "fmt/core.h"

#include <algorithm>

namespace wpa {

AutoscalerController::AutoscalerController(
        IScaleTarget & target,
        const ReplicaCalculator & calculator,
        AutoscalerSpec spec) :
    m_target(target),
    m_calculator(calculator),
    m_spec(std::move(spec))
{
    log(LogLevel::Debug, fmt::format("Autoscaler controller for {}/{} initialized with {} metric(s)",
            m_spec.workload_namespace, m_spec.name, m_spec.metrics.size()));
}

std::optional<Recommendation> AutoscalerController::reconcile()
{
    const int32_t current_replicas = m_target.get_replicas();

    std::optional<Recommendation> best;
    for (const auto & metric : m_spec.metrics) {
        CalculationResult result;
        try {
            result = m_calculator.compute_replicas(current_replicas, metric, m_spec);
        } catch (const CalculatorError & e) {
            log(LogLevel::Warning, fmt::format("Skipping metric \"{}\": {}", metric.metric_name, e.what()));
            continue;
        }
        log(LogLevel::Debug, fmt::format("Metric \"{}\" proposes {} replicas (utilization {})",
                metric.metric_name, result.replica_count, result.utilization));

        if (!best || result.replica_count > best->replicas) {
            best = Recommendation{ result.replica_count, metric.metric_name, result.timestamp };
        }
    }

    if (!best) {
        log(LogLevel::Warning, fmt::format("No metric of {}/{} could be evaluated, replicas left at {}",
                m_spec.workload_namespace, m_spec.name, current_replicas));
        return std::nullopt;
    }

    int32_t clamped = std::clamp(best->replicas, m_spec.min_replicas, m_spec.max_replicas);
    if (clamped != best->replicas) {
        log(LogLevel::Info, fmt::format("Proposal {} clamped to {} by [{}; {}]",
                best->replicas, clamped, m_spec.min_replicas, m_spec.max_replicas));
        best->replicas = clamped;
        best->metric_name.clear();
    }

    if (best->replicas != current_replicas) {
        m_target.set_replicas(best->replicas);
        log(LogLevel::Info, fmt::format("Scaled {}/{} from {} to {} replicas",
                m_spec.workload_namespace, m_spec.name, current_replicas, best->replicas));
    } else {
        log(LogLevel::Debug, fmt::format("Replica count of {}/{} unchanged at {}",
                m_spec.workload_namespace, m_spec.name, current_replicas));
    }
    return best;
}

} // namespace wpa
