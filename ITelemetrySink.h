#pragma once

#include <string>
#include <string_view>
#include <tuple>

namespace wpa {

inline constexpr std::string_view RestrictedScalingGauge = "restricted_scaling";
inline constexpr std::string_view MetricValueGauge = "metric_value";

struct GaugeLabels {
    std::string workload_name;
    std::string metric_name;

    bool operator<(const GaugeLabels & other) const
    {
        return std::tie(workload_name, metric_name) < std::tie(other.workload_name, other.metric_name);
    }
    bool operator==(const GaugeLabels & other) const
    {
        return workload_name == other.workload_name && metric_name == other.metric_name;
    }
};

class ITelemetrySink {
public:
    virtual void set_gauge(std::string_view gauge, const GaugeLabels & labels, double value) = 0;
    virtual void delete_gauge(std::string_view gauge, const GaugeLabels & labels) = 0;

    virtual ~ITelemetrySink() = default;
};

} // namespace wpa
