/**
 * @file test_autoscaler_controller.cpp
 * @brief Unit tests for multi-metric reconciliation
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "AutoscalerController.h"
#include "GaugeRegistry.h"
#include "LabelSelectorResolver.h"
#include "StaticMetricsSource.h"

using namespace wpa;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

class MockScaleTarget : public IScaleTarget {
public:
    MOCK_METHOD(int32_t, get_replicas, (), (const, override));
    MOCK_METHOD(void, set_replicas, (int32_t replicas), (override));
};

class AutoscalerControllerTest : public ::testing::Test {
protected:
    AutoscalerControllerTest() :
        source(std::chrono::system_clock::time_point(std::chrono::seconds(42))),
        calculator(source, resolver, gauges)
    {
        spec.name = "web";
        spec.workload_namespace = "prod";
        spec.tolerance = 0.1;
        spec.min_replicas = 1;
        spec.max_replicas = 10;

        MetricSpec requests;
        requests.metric_name = "requests";
        requests.metric_selector = parse_label_selector("app=web");
        requests.high_watermark = 2000;
        requests.low_watermark = 1000;
        spec.metrics.push_back(requests);

        MetricSpec latency;
        latency.metric_name = "latency";
        latency.high_watermark = 300;
        latency.low_watermark = 100;
        spec.metrics.push_back(latency);

        ON_CALL(target, get_replicas()).WillByDefault(Return(4));
    }

    StaticMetricsSource source;
    LabelSelectorResolver resolver;
    GaugeRegistry gauges;
    ReplicaCalculator calculator;
    NiceMock<MockScaleTarget> target;
    AutoscalerSpec spec;
};

} // unnamed namespace

TEST_F(AutoscalerControllerTest, HighestProposalWins) {
    source.add_series("requests", "prod", { { "app", "web" }, { "pod", "1" } }, 1000);
    source.add_series("requests", "prod", { { "app", "web" }, { "pod", "2" } }, 1500);
    source.add_series("requests", "prod", { { "app", "api" } }, 100000);
    source.add_series("latency", "prod", {}, 50);

    EXPECT_CALL(target, set_replicas(5)).Times(1);

    AutoscalerController controller{target, calculator, spec};
    auto recommendation = controller.reconcile();

    ASSERT_TRUE(recommendation.has_value());
    EXPECT_EQ(recommendation->replicas, 5);
    EXPECT_EQ(recommendation->metric_name, "requests");
    EXPECT_EQ(recommendation->timestamp, std::chrono::system_clock::time_point(std::chrono::seconds(42)));
    EXPECT_EQ(gauges.get(RestrictedScalingGauge, { "web", "latency" }), 0.0);
}

TEST_F(AutoscalerControllerTest, ProposalIsClampedToMaxReplicas) {
    source.add_series("requests", "prod", { { "app", "web" } }, 10000);
    source.add_series("latency", "prod", {}, 200);

    EXPECT_CALL(target, set_replicas(10)).Times(1);

    AutoscalerController controller{target, calculator, spec};
    auto recommendation = controller.reconcile();

    ASSERT_TRUE(recommendation.has_value());
    EXPECT_EQ(recommendation->replicas, 10);
    EXPECT_TRUE(recommendation->metric_name.empty());
}

TEST_F(AutoscalerControllerTest, ProposalIsClampedToMinReplicas) {
    source.add_series("requests", "prod", { { "app", "web" } }, 100);
    source.add_series("latency", "prod", {}, 10);

    EXPECT_CALL(target, set_replicas(1)).Times(1);

    AutoscalerController controller{target, calculator, spec};
    EXPECT_EQ(controller.reconcile()->replicas, 1);
}

TEST_F(AutoscalerControllerTest, WithinBandLeavesTargetAlone) {
    source.add_series("requests", "prod", { { "app", "web" } }, 1500);
    source.add_series("latency", "prod", {}, 200);

    EXPECT_CALL(target, set_replicas(_)).Times(0);

    AutoscalerController controller{target, calculator, spec};
    auto recommendation = controller.reconcile();

    ASSERT_TRUE(recommendation.has_value());
    EXPECT_EQ(recommendation->replicas, 4);
    EXPECT_EQ(gauges.get(RestrictedScalingGauge, { "web", "requests" }), 1.0);
    EXPECT_EQ(gauges.get(RestrictedScalingGauge, { "web", "latency" }), 1.0);
}

TEST_F(AutoscalerControllerTest, FailingMetricIsSkipped) {
    source.add_series("requests", "prod", { { "app", "web" } }, 3000);
    gauges.set_gauge(MetricValueGauge, { "web", "latency" }, 0.2);

    EXPECT_CALL(target, set_replicas(6)).Times(1);

    AutoscalerController controller{target, calculator, spec};
    auto recommendation = controller.reconcile();

    ASSERT_TRUE(recommendation.has_value());
    EXPECT_EQ(recommendation->metric_name, "requests");
    EXPECT_FALSE(gauges.get(MetricValueGauge, { "web", "latency" }).has_value());
}

TEST_F(AutoscalerControllerTest, NoEvaluableMetricGivesNoRecommendation) {
    EXPECT_CALL(target, set_replicas(_)).Times(0);

    AutoscalerController controller{target, calculator, spec};
    EXPECT_FALSE(controller.reconcile().has_value());
    EXPECT_EQ(gauges.size(), 0u);
}
