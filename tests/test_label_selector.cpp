/**
 * @file test_label_selector.cpp
 * @brief Unit tests for label selector parsing, resolution and matching
 */

#include <gtest/gtest.h>

#include "Errors.h"
#include "LabelSelector.h"
#include "LabelSelectorResolver.h"

using namespace wpa;

// ============================================================================
// Parsing
// ============================================================================

TEST(LabelSelectorParseTest, EmptyTextSelectsEverything) {
    auto selector = parse_label_selector("   ");
    EXPECT_TRUE(selector.empty());
}

TEST(LabelSelectorParseTest, EqualityTermsBecomeMatchLabels) {
    auto selector = parse_label_selector("app=web, env==prod");
    EXPECT_EQ(selector.match_labels.size(), 2u);
    EXPECT_EQ(selector.match_labels.at("app"), "web");
    EXPECT_EQ(selector.match_labels.at("env"), "prod");
    EXPECT_TRUE(selector.match_expressions.empty());
}

TEST(LabelSelectorParseTest, SetBasedTerms) {
    auto selector = parse_label_selector("tier in (front, back),zone notin (a),canary,!debug,team!=ops");
    ASSERT_EQ(selector.match_expressions.size(), 5u);

    EXPECT_EQ(selector.match_expressions[0].key, "tier");
    EXPECT_EQ(selector.match_expressions[0].op, LabelSelectorRequirement::Operator::In);
    EXPECT_EQ(selector.match_expressions[0].values, (std::vector<std::string>{ "front", "back" }));

    EXPECT_EQ(selector.match_expressions[1].op, LabelSelectorRequirement::Operator::NotIn);
    EXPECT_EQ(selector.match_expressions[2].op, LabelSelectorRequirement::Operator::Exists);
    EXPECT_EQ(selector.match_expressions[3].key, "debug");
    EXPECT_EQ(selector.match_expressions[3].op, LabelSelectorRequirement::Operator::DoesNotExist);
    EXPECT_EQ(selector.match_expressions[4].op, LabelSelectorRequirement::Operator::NotIn);
    EXPECT_EQ(selector.match_expressions[4].values, (std::vector<std::string>{ "ops" }));
}

TEST(LabelSelectorParseTest, MalformedTextThrows) {
    EXPECT_THROW(parse_label_selector("app=web,,env=prod"), SelectorError);
    EXPECT_THROW(parse_label_selector("tier in (a,b"), SelectorError);
    EXPECT_THROW(parse_label_selector("tier in a,b)"), SelectorError);
    EXPECT_THROW(parse_label_selector("tier within (a)"), SelectorError);
    EXPECT_THROW(parse_label_selector("app=web,app=api"), SelectorError);
}

// ============================================================================
// Resolution
// ============================================================================

TEST(LabelSelectorResolverTest, ResolvesToCanonicalFilter) {
    LabelSelectorResolver resolver;
    auto filter = resolver.resolve(parse_label_selector("zone notin (b,a),app=web,!debug"));
    EXPECT_EQ(filter.to_string(), "app=web,!debug,zone notin (a,b)");
}

TEST(LabelSelectorResolverTest, AcceptsPrefixedKeys) {
    LabelSelectorResolver resolver;
    EXPECT_NO_THROW(resolver.resolve(parse_label_selector("app.kubernetes.io/name=web")));
    EXPECT_NO_THROW(resolver.resolve(parse_label_selector("app=")));
}

TEST(LabelSelectorResolverTest, RejectsInvalidKeysAndValues) {
    LabelSelectorResolver resolver;

    LabelSelector bad_key;
    bad_key.match_labels = { { "-app", "web" } };
    EXPECT_THROW(resolver.resolve(bad_key), SelectorError);

    LabelSelector bad_prefix;
    bad_prefix.match_labels = { { "Example.COM/app", "web" } };
    EXPECT_THROW(resolver.resolve(bad_prefix), SelectorError);

    LabelSelector bad_value;
    bad_value.match_labels = { { "app", "web server" } };
    EXPECT_THROW(resolver.resolve(bad_value), SelectorError);

    LabelSelector long_key;
    long_key.match_labels = { { std::string(64, 'a'), "web" } };
    EXPECT_THROW(resolver.resolve(long_key), SelectorError);
}

TEST(LabelSelectorResolverTest, ChecksOperatorArity) {
    LabelSelectorResolver resolver;

    LabelSelector in_without_values;
    in_without_values.match_expressions.push_back({ "tier", LabelSelectorRequirement::Operator::In, {} });
    EXPECT_THROW(resolver.resolve(in_without_values), SelectorError);

    LabelSelector exists_with_values;
    exists_with_values.match_expressions.push_back({ "tier", LabelSelectorRequirement::Operator::Exists, { "x" } });
    EXPECT_THROW(resolver.resolve(exists_with_values), SelectorError);
}

// ============================================================================
// Matching
// ============================================================================

TEST(SelectorFilterTest, EmptyFilterMatchesAnything) {
    SelectorFilter filter;
    EXPECT_TRUE(filter.matches({}));
    EXPECT_TRUE(filter.matches({ { "app", "web" } }));
}

TEST(SelectorFilterTest, MatchesAllRequirements) {
    LabelSelectorResolver resolver;
    auto filter = resolver.resolve(parse_label_selector("app=web,tier in (front,back),zone notin (a),!debug"));

    EXPECT_TRUE(filter.matches({ { "app", "web" }, { "tier", "front" } }));
    EXPECT_TRUE(filter.matches({ { "app", "web" }, { "tier", "back" }, { "zone", "b" } }));

    EXPECT_FALSE(filter.matches({ { "app", "api" }, { "tier", "front" } }));
    EXPECT_FALSE(filter.matches({ { "app", "web" } }));
    EXPECT_FALSE(filter.matches({ { "app", "web" }, { "tier", "front" }, { "zone", "a" } }));
    EXPECT_FALSE(filter.matches({ { "app", "web" }, { "tier", "front" }, { "debug", "" } }));
}

TEST(SelectorFilterTest, ExistsIgnoresValue) {
    LabelSelectorResolver resolver;
    auto filter = resolver.resolve(parse_label_selector("canary"));

    EXPECT_TRUE(filter.matches({ { "canary", "" } }));
    EXPECT_TRUE(filter.matches({ { "canary", "true" } }));
    EXPECT_FALSE(filter.matches({ { "app", "web" } }));
}
