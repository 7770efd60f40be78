/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end tests for the full explorer pipeline.
///
/// These tests exercise the complete data path:
///   CSV text → RowParser → ExplorerTable (continent + World rows) →
///   QueryParams → derived columns → ColumnSpec / DaysSinceSpec →
///   SeriesColorScheme for the selected entities

#include "covex/color.hpp"
#include "covex/column_spec.hpp"
#include "covex/explorer.hpp"
#include "covex/row_parser.hpp"
#include "covex/types.hpp"
#include "../fixtures/covid_test_data.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>
#include <string>
#include <vector>

using namespace covex;

// ─── Synthetic data helpers ───────────────────────────────────────────────────

namespace {

/// CSV of `countries` × `days` rows with linearly growing totals.
std::string make_growing_csv(std::size_t countries, std::size_t days) {
    static const char* CONTINENTS[] = {"Africa", "Asia", "Europe",
                                       "North America", "Oceania", "South America"};
    std::string csv = "iso_code,continent,location,date,total_cases,new_cases,"
                      "total_deaths,new_deaths,total_tests,new_tests,population\n";
    const Date start = std::chrono::sys_days{std::chrono::year{2020} / 3 / 1};
    for (std::size_t c = 0; c < countries; ++c) {
        const double pop = 1e6 * static_cast<double>(c + 1);
        double cases = 0.0, deaths = 0.0, tests = 0.0;
        for (std::size_t d = 0; d < days; ++d) {
            const double new_cases  = static_cast<double>((c + 1) * (d + 1));
            const double new_deaths = static_cast<double>(d / 3);
            const double new_tests  = 10.0 * new_cases;
            cases += new_cases;
            deaths += new_deaths;
            tests += new_tests;
            csv += "C" + std::to_string(c) + ',' + CONTINENTS[c % 6] +
                   ",Country " + std::to_string(c) + ',' +
                   format_date(start + std::chrono::days{static_cast<int>(d)}) + ',' +
                   std::to_string(cases) + ',' + std::to_string(new_cases) + ',' +
                   std::to_string(deaths) + ',' + std::to_string(new_deaths) + ',' +
                   std::to_string(tests) + ',' + std::to_string(new_tests) + ',' +
                   std::to_string(pop) + '\n';
        }
    }
    return csv;
}

}  // namespace

// ─── Fixture pipeline ────────────────────────────────────────────────────────

TEST(FullPipeline, FixtureRequestEndToEnd) {
    const auto report = RowParser::parse_csv_string(fixtures::TIME_SERIES_CSV);
    ASSERT_TRUE(report.rejected.empty());

    ExplorerTable explorer(report.rows);
    const auto cols = explorer.init_requested_columns(
        parse_query_params("?metric=tests&frequency=daily&perCapita=true&smoothing=3&aligned=true"));

    EXPECT_EQ(cols.value_slug, "tests-perThousand-daily-3day");
    ASSERT_TRUE(cols.aligned_slug.has_value());

    const Table& t = explorer.table();
    for (const auto& slug : {cols.value_slug, *cols.aligned_slug}) {
        ASSERT_TRUE(t.has_column(slug)) << slug;
        EXPECT_EQ(t.column(slug).size(), t.row_count());
    }

    // Every value column has a spec with a unique identifier.
    std::set<std::int64_t> ids;
    for (const auto& spec : explorer.column_specs()) {
        EXPECT_TRUE(t.has_column(spec.slug)) << spec.slug;
        EXPECT_TRUE(ids.insert(spec.variable_id).second) << spec.slug;
    }
    EXPECT_EQ(ids.size(), 3u);  // tests-perThousand-daily, its 3-day mean, deaths-perMil
}

TEST(FullPipeline, AggregateRowsFollowCountryRows) {
    const auto report = RowParser::parse_csv_string(fixtures::TIME_SERIES_CSV);
    ExplorerTable explorer(report.rows);
    const auto slug = explorer.init_cases_column(parse_query_params("metric=cases&frequency=daily"));

    const Table& t = explorer.table();
    // World on 2020-03-03: AFG 4 + ALB 1 new cases.
    const GroupKey by_name[] = {GroupKey::EntityName};
    for (const auto& group : t.group_by(by_name)) {
        if (t.key(group.front()).entity_code != "OWID_WRL") {
            continue;
        }
        ASSERT_EQ(group.size(), 10u);
        EXPECT_DOUBLE_EQ(*t.value(group[2], slug), 5.0);
    }
}

TEST(FullPipeline, ColorsForSelectedEntities) {
    const auto report = RowParser::parse_csv_string(fixtures::TIME_SERIES_CSV);
    ExplorerTable explorer(report.rows);

    SeriesColorScheme scheme;
    std::vector<std::string> colors;
    for (std::size_t i = 0; i < explorer.options().size(); ++i) {
        colors.push_back(scheme.assign());
    }
    ASSERT_EQ(colors.size(), 5u);
    EXPECT_EQ(std::set<std::string>(colors.begin(), colors.end()).size(), 5u);
}

// ─── Larger synthetic dataset ─────────────────────────────────────────────────

TEST(FullPipeline, SyntheticDatasetAllColumnsFinite) {
    const auto report = RowParser::parse_csv_string(make_growing_csv(12, 60));
    ASSERT_TRUE(report.rejected.empty());
    ASSERT_EQ(report.rows.size(), 12u * 60u);

    ExplorerTable explorer(report.rows);
    // 12 countries + 6 continents × 60 days + 60 World rows.
    EXPECT_EQ(explorer.table().row_count(), 720u + 360u + 60u);
    EXPECT_EQ(explorer.options().size(), 12u + 1u + 6u);

    std::vector<std::string> slugs;
    for (const char* metric : {"cases", "deaths", "tests", "cfr"}) {
        for (const char* extra : {"", "&perCapita", "&perMillion", "&smoothing=7",
                                  "&frequency=daily&smoothing=14&aligned"}) {
            const auto cols = explorer.init_requested_columns(
                parse_query_params(std::string("metric=") + metric + extra));
            slugs.push_back(cols.value_slug);
            if (cols.aligned_slug) {
                slugs.push_back(*cols.aligned_slug);
            }
        }
    }

    const Table& t = explorer.table();
    for (const auto& slug : slugs) {
        for (const Cell& c : t.column(slug)) {
            if (c) {
                EXPECT_TRUE(std::isfinite(*c)) << slug;
            }
        }
    }
}

TEST(FullPipeline, RollingMeanOfLinearSeries) {
    const auto report = RowParser::parse_csv_string(make_growing_csv(1, 30));
    ExplorerTable explorer(report.rows, ExplorerConfig{.include_world = false,
                                                       .include_continents = false});
    const auto slug = explorer.init_cases_column(
        parse_query_params("metric=cases&frequency=daily&smoothing=7"));

    // new_cases = d + 1, so the 7-day mean at day d ≥ 6 is d - 2.
    const Table& t = explorer.table();
    for (std::size_t d = 6; d < 30; ++d) {
        EXPECT_NEAR(*t.value(d, slug), static_cast<double>(d) - 2.0, 1e-9) << "day " << d;
    }
}
