/// @file tests/spec/test_column_spec.cpp
/// @brief Unit tests for column identity (slugs, packed ids, display text).
///
/// Test categories:
///   - Distinct tuples give distinct identifiers
///   - Packed id bit layout and the smoothing limit
///   - Slug format per scaling, frequency and smoothing
///   - Display name / unit text
///   - Days-since slugs
///   - ColumnSpecRegistry: reuse, collisions, registration order

#include <gtest/gtest.h>
#include "covex/column_spec.hpp"
#include "covex/constants.hpp"
#include "covex/errors.hpp"

#include <limits>
#include <set>
#include <stdexcept>
#include <vector>

using namespace covex;

// ─── Identity ────────────────────────────────────────────────────────────────

TEST(ColumnSpec, DistinctTuplesGetDistinctIds) {
    const std::vector<ColumnSpec> specs = {
        build_column_spec(MetricKind::Tests, 1000, true, 3),
        build_column_spec(MetricKind::Cases, 1000, true, 3),
        build_column_spec(MetricKind::Tests, 100, true, 3),
        build_column_spec(MetricKind::Tests, 1000, true, 0),
        build_column_spec(MetricKind::Tests, 1000, false, 3),
    };
    std::set<std::int64_t> ids;
    std::set<std::string> slugs;
    for (const auto& s : specs) {
        ids.insert(s.variable_id);
        slugs.insert(s.slug);
    }
    EXPECT_EQ(ids.size(), specs.size());
    EXPECT_EQ(slugs.size(), specs.size());
}

TEST(ColumnSpec, SameTupleSameSpec) {
    const auto a = build_column_spec(MetricKind::Deaths, 1'000'000, false, 7);
    const auto b = build_column_spec(ColumnParams{
        .metric = MetricKind::Deaths, .per_capita = 1'000'000, .daily = false, .smoothing = 7});
    EXPECT_EQ(a.slug, b.slug);
    EXPECT_EQ(a.variable_id, b.variable_id);
    EXPECT_EQ(a.name, b.name);
    EXPECT_EQ(a.params, b.params);
}

TEST(ColumnSpec, PackedIdLayout) {
    const ColumnParams p{.metric = MetricKind::Tests, .per_capita = 1000, .daily = true, .smoothing = 3};
    const std::int64_t expected =
        (std::int64_t{2} << 49) | (std::int64_t{1} << 48) | (std::int64_t{3} << 32) | 1000;
    EXPECT_EQ(column_variable_id(p), expected);
    EXPECT_GT(column_variable_id(p), 0);
}

TEST(ColumnSpec, SmoothingAboveLimitThrows) {
    const ColumnParams ok{.metric = MetricKind::Cases, .per_capita = 0, .daily = true,
                          .smoothing = constants::MAX_SMOOTHING_WINDOW};
    EXPECT_NO_THROW((void)column_variable_id(ok));

    ColumnParams bad = ok;
    bad.smoothing = constants::MAX_SMOOTHING_WINDOW + 1;
    EXPECT_THROW((void)column_variable_id(bad), std::invalid_argument);
    EXPECT_THROW((void)build_column_spec(bad), std::invalid_argument);
}

TEST(ColumnSpec, LargePerCapitaFactorsStayDistinct) {
    const ColumnParams a{.metric = MetricKind::Cases, .per_capita = 0xFFFFFFFFu, .daily = false, .smoothing = 0};
    ColumnParams b = a;
    b.smoothing = 1;
    EXPECT_NE(column_variable_id(a), column_variable_id(b));
}

// ─── Slugs ───────────────────────────────────────────────────────────────────

TEST(ColumnSlug, Format) {
    EXPECT_EQ(build_column_spec(MetricKind::Tests, 0, true, 0).slug, "tests-daily");
    EXPECT_EQ(build_column_spec(MetricKind::Tests, 1000, true, 0).slug, "tests-perThousand-daily");
    EXPECT_EQ(build_column_spec(MetricKind::Deaths, 1'000'000, false, 0).slug,
              "deaths-perMil-cumulative");
    EXPECT_EQ(build_column_spec(MetricKind::Cases, 1, true, 7).slug, "cases-perCapita-daily-7day");
    EXPECT_EQ(build_column_spec(MetricKind::Cases, 100, false, 3).slug, "cases-per100-cumulative-3day");
    EXPECT_EQ(build_column_spec(MetricKind::Cfr, 0, false, 0).slug, "cfr-cumulative");
}

TEST(ColumnSlug, PerCapitaLabels) {
    EXPECT_EQ(per_capita_label(0), "");
    EXPECT_EQ(per_capita_label(1), "perCapita");
    EXPECT_EQ(per_capita_label(1000), "perThousand");
    EXPECT_EQ(per_capita_label(1'000'000), "perMil");
    EXPECT_EQ(per_capita_label(250), "per250");
}

TEST(ColumnSlug, DaysSince) {
    EXPECT_EQ(days_since_slug("deaths-cumulative", 5.0, 0), "days-since-deaths-cumulative-5-0");
    EXPECT_EQ(days_since_slug("deaths-perMil-cumulative", 0.1, 0),
              "days-since-deaths-perMil-cumulative-0.1-0");
    EXPECT_EQ(days_since_slug("totalCasesSmoothed", 5.0, 5), "days-since-totalCasesSmoothed-5-5");
}

TEST(ColumnSlug, DaysSinceSignsNeverLookLikeSeparators) {
    EXPECT_EQ(days_since_slug("x", -5.0, 0), "days-since-x-m5-0");
    EXPECT_EQ(days_since_slug("x", 1e-100, 0), "days-since-x-1em100-0");
    EXPECT_EQ(days_since_slug("x", -0.0, 0), days_since_slug("x", 0.0, 0));

    EXPECT_NE(days_since_slug("x-", 5.0, 0), days_since_slug("x", -5.0, 0));
    EXPECT_NE(days_since_slug("s-1e", 100.0, 0), days_since_slug("s", 1e-100, 0));
    EXPECT_NE(days_since_slug("s-5", 1.0, 0), days_since_slug("s", 5.0, 1));
}

TEST(ColumnSlug, DaysSinceRejectsNonFiniteThreshold) {
    EXPECT_THROW((void)days_since_slug("x", std::numeric_limits<double>::quiet_NaN(), 0),
                 std::invalid_argument);
    EXPECT_THROW((void)days_since_slug("x", std::numeric_limits<double>::infinity(), 0),
                 std::invalid_argument);
}

// ─── Display text ────────────────────────────────────────────────────────────

TEST(ColumnDisplay, NamesAndUnits) {
    const auto daily = build_column_spec(MetricKind::Tests, 1000, true, 3);
    EXPECT_EQ(daily.name, "Daily new tests per 1,000 people (3-day rolling average)");
    EXPECT_EQ(daily.unit, "tests per 1,000 people");

    const auto total = build_column_spec(MetricKind::Deaths, 1'000'000, false, 0);
    EXPECT_EQ(total.name, "Total confirmed deaths per 1,000,000 people");

    const auto cases = build_column_spec(MetricKind::Cases, 0, true, 0);
    EXPECT_EQ(cases.name, "Daily new confirmed cases");
    EXPECT_EQ(cases.unit, "confirmed cases");

    const auto cfr = build_column_spec(MetricKind::Cfr, 0, false, 0);
    EXPECT_EQ(cfr.name, "Case fatality rate");
    EXPECT_EQ(cfr.unit, "%");
}

TEST(ColumnDisplay, ToStringSummary) {
    const auto spec = build_column_spec(MetricKind::Cases, 0, false, 0);
    EXPECT_EQ(spec.to_string(),
              "cases-cumulative #0: Total confirmed cases [confirmed cases]");
}

// ─── ColumnSpecRegistry ──────────────────────────────────────────────────────

TEST(ColumnSpecRegistry, ReAddingSameTupleReturnsStoredSpec) {
    ColumnSpecRegistry registry;
    const auto& first = registry.add(build_column_spec(MetricKind::Tests, 1000, true, 0));
    const auto& again = registry.add(build_column_spec(MetricKind::Tests, 1000, true, 0));
    EXPECT_EQ(&first, &again);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ColumnSpecRegistry, SlugCollisionThrows) {
    ColumnSpecRegistry registry;
    registry.add(build_column_spec(MetricKind::Tests, 1000, true, 0));
    ColumnSpec clash = build_column_spec(MetricKind::Cases, 0, true, 0);
    clash.slug = "tests-perThousand-daily";
    EXPECT_THROW(registry.add(clash), IdentifierCollisionError);
}

TEST(ColumnSpecRegistry, IdCollisionThrows) {
    ColumnSpecRegistry registry;
    registry.add(build_column_spec(MetricKind::Tests, 1000, true, 0));
    ColumnSpec clash = build_column_spec(MetricKind::Cases, 0, true, 0);
    clash.variable_id = column_variable_id(ColumnParams{
        .metric = MetricKind::Tests, .per_capita = 1000, .daily = true, .smoothing = 0});
    EXPECT_THROW(registry.add(clash), IdentifierCollisionError);
    EXPECT_EQ(registry.find("cases-daily"), nullptr);
}

TEST(ColumnSpecRegistry, FindAndOrder) {
    ColumnSpecRegistry registry;
    registry.add(build_column_spec(MetricKind::Tests, 0, true, 0));
    registry.add(build_column_spec(MetricKind::Cases, 0, true, 0));
    registry.add(build_column_spec(MetricKind::Deaths, 0, true, 0));

    ASSERT_NE(registry.find("cases-daily"), nullptr);
    EXPECT_EQ(registry.find("cases-daily")->params.metric, MetricKind::Cases);
    EXPECT_EQ(registry.find("nope"), nullptr);

    const auto specs = registry.specs();
    ASSERT_EQ(specs.size(), 3u);
    EXPECT_EQ(specs[0].slug, "tests-daily");
    EXPECT_EQ(specs[1].slug, "cases-daily");
    EXPECT_EQ(specs[2].slug, "deaths-daily");
}
