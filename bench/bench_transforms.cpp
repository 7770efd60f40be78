/**
 * @file  bench/bench_transforms.cpp
 * @brief Google Benchmark suite for series transforms and column building.
 *
 * Benchmarks
 * ----------
 *   BM_RollingAverage            — one series, 7-day window
 *   BM_DaysSince                 — one series, threshold alignment
 *   BM_ParseCsv                  — RowParser over a synthetic document
 *   BM_ContinentRows             — continent aggregation
 *   BM_ExplorerRequest           — full aligned, smoothed, per-capita request
 *
 * Build (CMake):
 *   cmake -DCOVEX_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_transforms
 *   ./build/bench_transforms --benchmark_format=json
 *
 * Throughput units: items/second (cells or rows processed).
 */

#include "benchmark/benchmark.h"

#include "covex/aggregates.hpp"
#include "covex/explorer.hpp"
#include "covex/row_parser.hpp"
#include "covex/transforms.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

using namespace covex;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N cells of a growing series with every tenth cell absent.
static std::vector<Cell> make_series(std::size_t n) {
    std::vector<Cell> s(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (i % 10 != 9) {
            s[i] = static_cast<double>(i) * 1.5;
        }
    }
    return s;
}

static std::vector<Date> make_dates(std::size_t n) {
    const Date start = std::chrono::sys_days{std::chrono::year{2020} / 1 / 22};
    std::vector<Date> d(n);
    for (std::size_t i = 0; i < n; ++i) {
        d[i] = start + std::chrono::days{static_cast<int>(i)};
    }
    return d;
}

/// CSV text of `countries` × `days` rows spread over the six continents.
static std::string make_csv(std::size_t countries, std::size_t days) {
    static const char* CONTINENTS[] = {"Africa", "Asia", "Europe",
                                       "North America", "Oceania", "South America"};
    const auto dates = make_dates(days);
    std::string csv = "iso_code,continent,location,date,total_cases,new_cases,"
                      "total_deaths,new_deaths,total_tests,new_tests,population\n";
    for (std::size_t c = 0; c < countries; ++c) {
        for (std::size_t d = 0; d < days; ++d) {
            const auto n = (c + 1) * (d + 1);
            csv += "C" + std::to_string(c) + ',' + CONTINENTS[c % 6] + ",Country " +
                   std::to_string(c) + ',' + format_date(dates[d]) + ',' +
                   std::to_string(n * 10) + ',' + std::to_string(n) + ',' +
                   std::to_string(n / 10) + ',' + std::to_string(d % 3) + ',' +
                   std::to_string(n * 100) + ',' + std::to_string(n * 5) + ',' +
                   std::to_string(1'000'000 * (c + 1)) + '\n';
        }
    }
    return csv;
}

// ── Transform benchmarks ───────────────────────────────────────────────────────

static void BM_RollingAverage(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto series = make_series(n);
    for (auto _ : state) {
        auto out = transforms::rolling_average(series, 7);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_RollingAverage)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_DaysSince(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto series = make_series(n);
    const auto dates  = make_dates(n);
    for (auto _ : state) {
        auto out = transforms::days_since(series, dates, static_cast<double>(n) * 0.25, 0);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_DaysSince)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── Ingestion / aggregation benchmarks ─────────────────────────────────────────

static void BM_ParseCsv(benchmark::State& state) {
    const auto countries = static_cast<std::size_t>(state.range(0));
    const auto csv = make_csv(countries, 365);
    for (auto _ : state) {
        auto report = RowParser::parse_csv_string(csv);
        benchmark::DoNotOptimize(report.rows.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(countries * 365));
}
BENCHMARK(BM_ParseCsv)->Arg(12)->Arg(60)->Arg(200)->Unit(benchmark::kMillisecond);

static void BM_ContinentRows(benchmark::State& state) {
    const auto countries = static_cast<std::size_t>(state.range(0));
    const auto rows   = RowParser::parse_csv_string(make_csv(countries, 365)).rows;
    const auto lookup = ContinentLookup::from_rows(rows);
    for (auto _ : state) {
        auto out = generate_continent_rows(rows, lookup);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(rows.size()));
}
BENCHMARK(BM_ContinentRows)->Arg(12)->Arg(60)->Arg(200)->Unit(benchmark::kMillisecond);

// ── End-to-end request ─────────────────────────────────────────────────────────

static void BM_ExplorerRequest(benchmark::State& state) {
    const auto countries = static_cast<std::size_t>(state.range(0));
    const auto rows  = RowParser::parse_csv_string(make_csv(countries, 365)).rows;
    const auto query = parse_query_params("metric=tests&frequency=daily&perCapita&smoothing=7&aligned");
    for (auto _ : state) {
        ExplorerTable explorer(rows);
        auto cols = explorer.init_requested_columns(query);
        benchmark::DoNotOptimize(cols.value_slug.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(rows.size()));
}
BENCHMARK(BM_ExplorerRequest)->Arg(12)->Arg(60)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
