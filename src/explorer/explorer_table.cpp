/// @file src/explorer/explorer_table.cpp
/// @brief ExplorerTable — table assembly and query-driven column building.

#include "covex/explorer.hpp"
#include "covex/errors.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace covex {

namespace {

/// Raw field holding a metric at a frequency.
std::string_view raw_field(MetricKind metric, bool daily) {
    switch (metric) {
        case MetricKind::Cases:
            return daily ? constants::FIELD_NEW_CASES : constants::FIELD_TOTAL_CASES;
        case MetricKind::Deaths:
            return daily ? constants::FIELD_NEW_DEATHS : constants::FIELD_TOTAL_DEATHS;
        case MetricKind::Tests:
            return daily ? constants::FIELD_NEW_TESTS : constants::FIELD_TOTAL_TESTS;
        case MetricKind::Cfr:
            break;
    }
    throw std::invalid_argument("case fatality rate has no raw field");
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

ExplorerTable::ExplorerTable(std::span<const ParsedRow> rows, ExplorerConfig config)
    : ExplorerTable(rows, ContinentLookup::from_rows(rows), std::move(config)) {}

ExplorerTable::ExplorerTable(std::span<const ParsedRow> rows,
                             ContinentLookup lookup,
                             ExplorerConfig config)
    : config_(std::move(config))
    , lookup_(std::move(lookup))
    , options_(make_country_options(rows, lookup_))
    , table_(combine_rows(rows, lookup_, config_))
{}

std::vector<ParsedRow>
ExplorerTable::combine_rows(std::span<const ParsedRow> rows,
                            const ContinentLookup& lookup,
                            const ExplorerConfig& config) {
    std::vector<ParsedRow> combined;
    combined.reserve(rows.size());

    std::size_t skipped = 0;
    for (const auto& r : rows) {
        if (is_aggregate_code(r.iso_code)) {
            ++skipped;
            continue;
        }
        combined.push_back(r);
    }
    if (config.verbose && skipped > 0) {
        fmt::print(stderr, "covex: ignored {} pre-aggregated rows\n", skipped);
    }

    if (config.include_continents) {
        auto continent_rows = generate_continent_rows(rows, lookup);
        if (config.verbose) {
            fmt::print(stderr, "covex: added {} continent rows\n", continent_rows.size());
        }
        std::move(continent_rows.begin(), continent_rows.end(), std::back_inserter(combined));
    }
    if (config.include_world) {
        auto world_rows = generate_world_rows(rows);
        std::move(world_rows.begin(), world_rows.end(), std::back_inserter(combined));
    }
    return combined;
}

// ─── Column specs ─────────────────────────────────────────────────────────────

ColumnSpec ExplorerTable::build_column_spec(MetricKind metric,
                                            std::uint32_t per_capita,
                                            bool daily,
                                            std::uint32_t smoothing) const {
    return covex::build_column_spec(metric, per_capita, daily, smoothing);
}

const ColumnSpec* ExplorerTable::column_spec(std::string_view slug) const {
    return specs_.find(slug);
}

const DaysSinceSpec* ExplorerTable::days_since_spec(std::string_view slug) const {
    const auto it = days_since_.find(slug);
    return it == days_since_.end() ? nullptr : &it->second;
}

ColumnParams ExplorerTable::params_for(MetricKind metric, const QueryParams& query) {
    if (query.smoothing_window > constants::MAX_SMOOTHING_WINDOW) {
        throw std::invalid_argument(
            fmt::format("smoothing window {} exceeds the maximum of {} days",
                        query.smoothing_window, constants::MAX_SMOOTHING_WINDOW));
    }
    std::uint32_t per_capita = constants::ABSOLUTE;
    if (metric != MetricKind::Cfr) {
        if (query.per_million) {
            per_capita = constants::PER_MILLION;
        } else if (query.per_capita) {
            per_capita = metric == MetricKind::Tests ? constants::PER_THOUSAND
                                                     : constants::PER_MILLION;
        }
    }
    return ColumnParams{
        .metric     = metric,
        .per_capita = per_capita,
        .daily      = query.daily(),
        .smoothing  = query.smoothing_window > 1
                          ? static_cast<std::uint32_t>(query.smoothing_window)
                          : 0u,
    };
}

// ─── init_column ──────────────────────────────────────────────────────────────

std::string ExplorerTable::init_column(const ColumnParams& params) {
    if (params.metric == MetricKind::Cfr && params.per_capita != constants::ABSOLUTE) {
        throw std::invalid_argument("case fatality rate cannot be scaled per capita");
    }

    ColumnSpec spec = covex::build_column_spec(params);
    if (table_.has_column(spec.slug)) {
        return specs_.add(std::move(spec)).slug;
    }

    Derivation derivation;
    if (params.smoothing > 0) {
        // Smooth the unsmoothed column of the same tuple.
        ColumnParams base = params;
        base.smoothing = 0;
        derivation = Rolling{.source = init_column(base), .window = params.smoothing};
    } else if (params.metric == MetricKind::Cfr) {
        derivation = Ratio{
            .numerator   = std::string(raw_field(MetricKind::Deaths, params.daily)),
            .denominator = std::string(raw_field(MetricKind::Cases, params.daily)),
            .factor      = 100.0,
        };
    } else if (params.per_capita == constants::ABSOLUTE) {
        derivation = Scale{
            .source     = std::string(raw_field(params.metric, params.daily)),
            .factor     = 1.0,
            .population = std::nullopt,
        };
    } else {
        derivation = Scale{
            .source     = std::string(raw_field(params.metric, params.daily)),
            .factor     = static_cast<double>(params.per_capita),
            .population = std::string(constants::FIELD_POPULATION),
        };
    }

    const bool added = table_.add_column(spec.slug, derivation);
    if (added && config_.verbose) {
        fmt::print(stderr, "covex: materialised {}\n", spec.to_string());
    }
    return specs_.add(std::move(spec)).slug;
}

std::string ExplorerTable::init_testing_column(const QueryParams& params) {
    return init_column(params_for(MetricKind::Tests, params));
}

std::string ExplorerTable::init_cases_column(const QueryParams& params) {
    return init_column(params_for(MetricKind::Cases, params));
}

std::string ExplorerTable::init_deaths_column(const QueryParams& params) {
    return init_column(params_for(MetricKind::Deaths, params));
}

std::string ExplorerTable::init_cfr_column(const QueryParams& params) {
    return init_column(params_for(MetricKind::Cfr, params));
}

// ─── Alignment ────────────────────────────────────────────────────────────────

std::string ExplorerTable::add_days_since_column(const std::string& source,
                                                 double threshold,
                                                 std::size_t min_days,
                                                 std::string title) {
    std::string slug = days_since_slug(source, threshold, min_days);
    if (const auto it = days_since_.find(slug); it != days_since_.end()) {
        const DaysSinceSpec& held = it->second;
        if (held.source != source || held.threshold != threshold || held.min_days != min_days) {
            throw IdentifierCollisionError(
                fmt::format("slug '{}' already names a different days-since column", slug));
        }
        return slug;
    }

    const bool added = table_.add_column(slug, DaysSince{
        .source    = source,
        .threshold = threshold,
        .min_days  = min_days,
    });
    if (added && config_.verbose) {
        fmt::print(stderr, "covex: materialised {}: {}\n", slug, title);
    }

    days_since_.emplace(slug, DaysSinceSpec{
        .slug      = slug,
        .title     = std::move(title),
        .source    = source,
        .threshold = threshold,
        .min_days  = min_days,
    });
    return slug;
}

RequestedColumns ExplorerTable::init_requested_columns(const QueryParams& params) {
    RequestedColumns out;
    switch (params.metric) {
        case MetricKind::Cases:  out.value_slug = init_cases_column(params);   break;
        case MetricKind::Deaths: out.value_slug = init_deaths_column(params);  break;
        case MetricKind::Tests:  out.value_slug = init_testing_column(params); break;
        case MetricKind::Cfr:    out.value_slug = init_cfr_column(params);     break;
    }

    if (!params.aligned) {
        return out;
    }

    // Alignment is always on cumulative deaths.
    const bool scaled = params.per_capita || params.per_million;
    const auto source = init_column(ColumnParams{
        .metric     = MetricKind::Deaths,
        .per_capita = scaled ? constants::PER_MILLION : constants::ABSOLUTE,
        .daily      = false,
        .smoothing  = 0,
    });
    const double threshold = params.threshold.value_or(
        scaled ? config_.align_threshold_per_million : config_.align_threshold_absolute);
    const std::size_t min_days = params.min_days.value_or(config_.align_min_days);

    auto title = fmt::format("Days since the total confirmed deaths{} reached {}",
                             scaled ? " per million people" : "", threshold);
    out.aligned_slug = add_days_since_column(source, threshold, min_days, std::move(title));
    return out;
}

}  // namespace covex
