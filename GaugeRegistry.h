#pragma once

#include "ITelemetrySink.h"

#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace wpa {

// Gauge families in a prometheus-cpp registry, one family per gauge name,
// series labelled by wpa_name and metric_name.
class GaugeRegistry : public ITelemetrySink {
public:
    explicit GaugeRegistry(std::string metric_prefix = "wpa");

    void set_gauge(std::string_view gauge, const GaugeLabels & labels, double value) override;
    void delete_gauge(std::string_view gauge, const GaugeLabels & labels) override;

    std::optional<double> get(std::string_view gauge, const GaugeLabels & labels) const;
    size_t size() const;

    // Prometheus text exposition of every live series
    std::string render() const;

private:
    prometheus::Family<prometheus::Gauge> & family(std::string_view gauge);
    prometheus::Family<prometheus::Gauge> * find_family(std::string_view gauge) const;

private:
    std::string m_metric_prefix;
    std::shared_ptr<prometheus::Registry> m_registry;

    mutable std::mutex m_mutex;
    std::map<std::string, prometheus::Family<prometheus::Gauge> *, std::less<>> m_families;
};

} // namespace wpa
