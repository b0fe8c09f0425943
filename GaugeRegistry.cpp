#include "GaugeRegistry.h"

#include "fmt/core.h"

#include <prometheus/text_serializer.h>

namespace wpa {

namespace {

prometheus::Labels to_prometheus_labels(const GaugeLabels & labels)
{
    return { { "wpa_name", labels.workload_name }, { "metric_name", labels.metric_name } };
}

std::string help_for(std::string_view gauge)
{
    if (gauge == RestrictedScalingGauge) {
        return "1 when the metric is within the watermark band and scaling is held back";
    } else if (gauge == MetricValueGauge) {
        return "Aggregated metric value compared against the watermarks";
    }
    return fmt::format("Watermark autoscaler gauge {}", gauge);
}

} // unnamed namespace

GaugeRegistry::GaugeRegistry(std::string metric_prefix) :
    m_metric_prefix(std::move(metric_prefix)),
    m_registry(std::make_shared<prometheus::Registry>())
{
    family(RestrictedScalingGauge);
    family(MetricValueGauge);
}

void GaugeRegistry::set_gauge(std::string_view gauge, const GaugeLabels & labels, double value)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    family(gauge).Add(to_prometheus_labels(labels)).Set(value);
}

void GaugeRegistry::delete_gauge(std::string_view gauge, const GaugeLabels & labels)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto * gauge_family = find_family(gauge);
    auto prometheus_labels = to_prometheus_labels(labels);
    if (gauge_family && gauge_family->Has(prometheus_labels)) {
        gauge_family->Remove(&gauge_family->Add(prometheus_labels));
    }
}

std::optional<double> GaugeRegistry::get(std::string_view gauge, const GaugeLabels & labels) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto * gauge_family = find_family(gauge);
    auto prometheus_labels = to_prometheus_labels(labels);
    if (!gauge_family || !gauge_family->Has(prometheus_labels)) {
        return std::nullopt;
    }
    return gauge_family->Add(prometheus_labels).Value();
}

size_t GaugeRegistry::size() const
{
    size_t series = 0;
    for (const auto & metric_family : m_registry->Collect()) {
        series += metric_family.metric.size();
    }
    return series;
}

std::string GaugeRegistry::render() const
{
    prometheus::TextSerializer serializer;
    return serializer.Serialize(m_registry->Collect());
}

// Callers hold m_mutex
prometheus::Family<prometheus::Gauge> & GaugeRegistry::family(std::string_view gauge)
{
    if (auto * existing = find_family(gauge)) {
        return *existing;
    }
    auto & gauge_family = prometheus::BuildGauge()
            .Name(m_metric_prefix.empty() ? std::string(gauge) : fmt::format("{}_{}", m_metric_prefix, gauge))
            .Help(help_for(gauge))
            .Register(*m_registry);
    m_families.emplace(std::string(gauge), &gauge_family);
    return gauge_family;
}

prometheus::Family<prometheus::Gauge> * GaugeRegistry::find_family(std::string_view gauge) const
{
    auto it = m_families.find(gauge);
    return it == m_families.end() ? nullptr : it->second;
}

} // namespace wpa
