#include "ReplicaCalculator.h"

#include "Errors.h"
#include "Log.h"

#include "fmt/core.h"
#include "fmt/format.h"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace wpa {

ReplicaCalculator::ReplicaCalculator(
        const IMetricsSource & metrics_source,
        const ISelectorResolver & selector_resolver,
        ITelemetrySink & telemetry) :
    m_metrics_source(metrics_source),
    m_selector_resolver(selector_resolver),
    m_telemetry(telemetry)
{}

CalculationResult ReplicaCalculator::compute_replicas(
        int32_t current_replicas,
        const MetricSpec & metric,
        const AutoscalerSpec & autoscaler) const
{
    if (current_replicas < 0) {
        throw std::invalid_argument(fmt::format("negative current replica count {}", current_replicas));
    }

    const GaugeLabels labels{ autoscaler.name, metric.metric_name };

    SelectorFilter filter;
    try {
        filter = m_selector_resolver.resolve(metric.metric_selector);
    } catch (const SelectorError & e) {
        throw SelectorError(fmt::format("invalid selector {} for metric {}: {}",
                to_string(metric.metric_selector), metric.metric_name, e.what()));
    }
    log(LogLevel::Debug, fmt::format("Using label selector: \"{}\"", filter.to_string()));

    MetricSamples samples;
    try {
        samples = m_metrics_source.fetch(metric.metric_name, autoscaler.workload_namespace, filter);
    } catch (const std::exception & e) {
        clear(labels);
        throw MetricsFetchError(fmt::format("unable to get external metric {}/{}/{}: {}",
                autoscaler.workload_namespace, metric.metric_name, to_string(metric.metric_selector), e.what()));
    }
    log(LogLevel::Debug, fmt::format("Metrics from the external metrics source: [{}]", fmt::join(samples.values, ", ")));

    int64_t sum = 0;
    for (int64_t value : samples.values) {
        if ((value > 0 && sum > std::numeric_limits<int64_t>::max() - value)
                || (value < 0 && sum < std::numeric_limits<int64_t>::min() - value)) {
            clear(labels);
            throw DegenerateArithmeticError(fmt::format("sum of samples for metric {} overflows", metric.metric_name));
        }
        sum += value;
    }

    double averaged = 1.0;
    if (autoscaler.algorithm == Algorithm::Average) {
        if (current_replicas == 0) {
            clear(labels);
            throw DegenerateArithmeticError(fmt::format(
                    "cannot average metric {} over zero replicas", metric.metric_name));
        }
        averaged = static_cast<double>(current_replicas);
    }
    log(LogLevel::Debug, fmt::format("Algorithm is {}", to_string(autoscaler.algorithm)));

    const double adjusted_usage = static_cast<double>(sum) / averaged;
    // A sum close to the int64 limits can round to 2^63, which has no int64 value
    if (!(adjusted_usage < 0x1p63 && adjusted_usage >= -0x1p63)) {
        clear(labels);
        throw DegenerateArithmeticError(fmt::format(
                "utilization {} of metric {} is out of range", adjusted_usage, metric.metric_name));
    }
    const double milli_adjusted_usage = adjusted_usage / 1000;
    const int64_t utilization = static_cast<int64_t>(adjusted_usage);

    const int64_t high_mark = metric.high_watermark;
    const int64_t low_mark = metric.low_watermark;
    const double adjusted_high_mark = high_mark + autoscaler.tolerance * high_mark;
    const double adjusted_low_mark = low_mark - autoscaler.tolerance * low_mark;

    log(LogLevel::Debug, fmt::format("About to compare utilization {} vs LWM {} and HWM {}",
            adjusted_usage, low_mark, high_mark));

    CalculationResult result{ current_replicas, utilization, samples.timestamp };

    // Signed comparisons, we need to know which side of the band we are on
    double proposal;
    if (adjusted_usage > adjusted_high_mark) {
        if (high_mark == 0) {
            clear(labels);
            throw DegenerateArithmeticError(fmt::format("high watermark of metric {} is zero", metric.metric_name));
        }
        proposal = std::ceil(current_replicas * adjusted_usage / static_cast<double>(high_mark));
        log(LogLevel::Info, fmt::format("Value is above high watermark. Usage: {}. Proposal: {}",
                milli_adjusted_usage, proposal));
    } else if (adjusted_usage < adjusted_low_mark) {
        if (low_mark == 0) {
            clear(labels);
            throw DegenerateArithmeticError(fmt::format("low watermark of metric {} is zero", metric.metric_name));
        }
        proposal = std::floor(current_replicas * adjusted_usage / static_cast<double>(low_mark));
        log(LogLevel::Info, fmt::format("Value is below low watermark. Usage: {}. Proposal: {}",
                milli_adjusted_usage, proposal));
    } else {
        publish(labels, true, milli_adjusted_usage);
        log(LogLevel::Info, fmt::format("Within bounds of the watermarks. Value: {} is [{}; {}] Tol: +/- {}%",
                adjusted_usage, low_mark, high_mark, autoscaler.tolerance * 100));
        return result;
    }

    if (!std::isfinite(proposal) || proposal > std::numeric_limits<int32_t>::max()) {
        clear(labels);
        throw DegenerateArithmeticError(fmt::format(
                "replica proposal {} for metric {} is out of range", proposal, metric.metric_name));
    }
    if (proposal < 0) {
        log(LogLevel::Warning, fmt::format("Negative replica proposal {} for metric {} clamped to 0",
                proposal, metric.metric_name));
        proposal = 0;
    }

    publish(labels, false, milli_adjusted_usage);
    result.replica_count = static_cast<int32_t>(proposal);
    return result;
}

void ReplicaCalculator::publish(const GaugeLabels & labels, bool restricted, double milli_adjusted_usage) const
{
    m_telemetry.set_gauge(RestrictedScalingGauge, labels, restricted ? 1 : 0);
    m_telemetry.set_gauge(MetricValueGauge, labels, milli_adjusted_usage);
}

void ReplicaCalculator::clear(const GaugeLabels & labels) const
{
    m_telemetry.delete_gauge(RestrictedScalingGauge, labels);
    m_telemetry.delete_gauge(MetricValueGauge, labels);
}

} // namespace wpa
