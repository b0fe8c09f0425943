#include "AutoscalerController.h"
#include "ControllerConfig.h"
#include "Errors.h"
#include "GaugeRegistry.h"
#include "LabelSelectorResolver.h"
#include "Log.h"
#include "Quantity.h"
#include "ReplicaCalculator.h"
#include "StaticMetricsSource.h"

#include "fmt/core.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

class FixedScaleTarget : public wpa::IScaleTarget {
public:
    explicit FixedScaleTarget(int32_t replicas) :
        m_replicas(replicas)
    {}

    int32_t get_replicas() const override { return m_replicas; }
    void set_replicas(int32_t replicas) override { m_replicas = replicas; }

private:
    int32_t m_replicas;
};

void usage(const char * argv0)
{
    fmt::print(stderr,
            "usage: {} <config> <current_replicas> <sample>...\n"
            "  sample: metric=quantity or metric{{label=value,...}}=quantity, e.g. requests{{pod=web-1}}=1500m\n",
            argv0);
}

wpa::Labels parse_labels(std::string_view text)
{
    wpa::Labels labels;
    size_t start = 0;
    while (start < text.size()) {
        auto comma = text.find(',', start);
        auto pair = text.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
        auto eq = pair.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            throw std::invalid_argument(fmt::format("malformed label \"{}\"", pair));
        }
        labels.emplace(std::string(pair.substr(0, eq)), std::string(pair.substr(eq + 1)));
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return labels;
}

void add_sample(wpa::StaticMetricsSource & source, const std::string & workload_namespace, std::string_view arg)
{
    wpa::Labels labels;
    std::string_view metric_name;
    std::string_view value;
    if (auto brace = arg.find('{'); brace != std::string_view::npos) {
        auto close = arg.find("}=", brace);
        if (close == std::string_view::npos) {
            throw std::invalid_argument(fmt::format("malformed sample \"{}\"", arg));
        }
        metric_name = arg.substr(0, brace);
        labels = parse_labels(arg.substr(brace + 1, close - brace - 1));
        value = arg.substr(close + 2);
    } else {
        auto eq = arg.find('=');
        if (eq == std::string_view::npos) {
            throw std::invalid_argument(fmt::format("malformed sample \"{}\"", arg));
        }
        metric_name = arg.substr(0, eq);
        value = arg.substr(eq + 1);
    }
    source.add_series(std::string(metric_name), workload_namespace, std::move(labels), wpa::parse_quantity_milli(value));
}

} // unnamed namespace

int main(int argc, char ** argv) {
    if (argc < 3) {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        auto config = wpa::ControllerConfig::from_file(argv[1]);
        wpa::set_log_level(config.get_log_level());
        const auto & spec = config.get_autoscaler_spec();

        size_t parsed = 0;
        int current_replicas = std::stoi(argv[2], &parsed);
        if (parsed != std::string_view(argv[2]).size()) {
            throw std::invalid_argument(fmt::format("\"{}\" is not a replica count", argv[2]));
        }

        wpa::StaticMetricsSource metrics_source{std::chrono::system_clock::now()};
        for (int i = 3; i < argc; ++i) {
            add_sample(metrics_source, spec.workload_namespace, argv[i]);
        }

        wpa::LabelSelectorResolver selector_resolver;
        wpa::GaugeRegistry gauges;
        wpa::ReplicaCalculator calculator{metrics_source, selector_resolver, gauges};

        FixedScaleTarget target{current_replicas};
        wpa::AutoscalerController controller{target, calculator, spec};

        auto recommendation = controller.reconcile();
        if (!recommendation) {
            fmt::print("{}/{}: no recommendation, replicas stay at {}\n",
                    spec.workload_namespace, spec.name, current_replicas);
            fmt::print("{}", gauges.render());
            return 2;
        }

        fmt::print("{}/{}: {} -> {} replicas{}\n",
                spec.workload_namespace, spec.name, current_replicas, recommendation->replicas,
                recommendation->metric_name.empty() ? std::string(" (clamped)") : fmt::format(" (metric {})", recommendation->metric_name));
        fmt::print("{}", gauges.render());
    } catch (const wpa::ConfigError & e) {
        wpa::log(wpa::LogLevel::Error, fmt::format("Configuration error: {}", e.what()));
        return EXIT_FAILURE;
    } catch (const std::exception & e) {
        wpa::log(wpa::LogLevel::Error, fmt::format("Error: {}", e.what()));
        return EXIT_FAILURE;
    }

    return 0;
}
