/**
 * @file test_static_metrics_source.cpp
 * @brief Unit tests for the in-memory metrics source
 */

#include <gtest/gtest.h>

#include "LabelSelectorResolver.h"
#include "StaticMetricsSource.h"

#include <stdexcept>

using namespace wpa;

namespace {

const auto SampleTime = std::chrono::system_clock::time_point(std::chrono::seconds(1234));

StaticMetricsSource make_source()
{
    StaticMetricsSource source{SampleTime};
    source.add_series("requests", "prod", { { "app", "web" }, { "pod", "web-1" } }, 1000);
    source.add_series("requests", "prod", { { "app", "web" }, { "pod", "web-2" } }, 1500);
    source.add_series("requests", "prod", { { "app", "api" } }, 9000);
    source.add_series("requests", "staging", { { "app", "web" } }, 7000);
    source.add_series("latency", "prod", { { "app", "web" } }, 30);
    return source;
}

} // unnamed namespace

TEST(StaticMetricsSourceTest, ReturnsMatchingSeriesOnly) {
    auto source = make_source();
    LabelSelectorResolver resolver;

    auto samples = source.fetch("requests", "prod", resolver.resolve(parse_label_selector("app=web")));

    EXPECT_EQ(samples.values, (std::vector<int64_t>{ 1000, 1500 }));
    EXPECT_EQ(samples.timestamp, SampleTime);
}

TEST(StaticMetricsSourceTest, EmptyFilterSelectsWholeNamespace) {
    auto source = make_source();

    auto samples = source.fetch("requests", "prod", SelectorFilter{});

    EXPECT_EQ(samples.values.size(), 3u);
}

TEST(StaticMetricsSourceTest, NoMatchIsAnError) {
    auto source = make_source();
    LabelSelectorResolver resolver;

    EXPECT_THROW(source.fetch("requests", "prod", resolver.resolve(parse_label_selector("app=db"))), std::runtime_error);
    EXPECT_THROW(source.fetch("cpu", "prod", SelectorFilter{}), std::runtime_error);
    EXPECT_THROW(source.fetch("latency", "staging", SelectorFilter{}), std::runtime_error);
}
