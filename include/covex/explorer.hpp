#pragma once

/// @file include/covex/explorer.hpp
/// @brief ExplorerTable — query-driven orchestration of derived columns.
///
/// # Module: Explorer
///
/// ## Responsibility
/// Own the analysis table for one dataset and materialise the columns a
/// request asks for:
///
///   parsed rows → country rows + continent rows + World rows → Table
///   QueryParams → ColumnParams → (Scale | Ratio) → Rolling → ColumnSpec
///   aligned     → cumulative deaths column → DaysSince
///
/// ## Usage
/// ```cpp
/// auto report = RowParser::parse_csv_string(csv);
/// ExplorerTable explorer(report.rows);
/// auto cols = explorer.init_requested_columns(
///     parse_query_params("metric=tests&frequency=daily&perCapita=true"));
/// // explorer.table().column(cols.value_slug) is now populated
/// ```
///
/// ## Guarantees
/// - One slug per (metric, frequency, per-capita scaling, smoothing)
/// - Re-requesting a combination never duplicates or recomputes a column
/// - A failed request (missing source field) leaves no partial column
///
/// ## NOT Responsible For
/// - Reading files or URLs (callers hand in parsed rows / query text)
/// - Chart colors (see covex/color.hpp)

#include "covex/aggregates.hpp"
#include "covex/column_spec.hpp"
#include "covex/constants.hpp"
#include "covex/query_params.hpp"
#include "covex/table.hpp"
#include "covex/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace covex {

// ─── ExplorerConfig ───────────────────────────────────────────────────────────

struct ExplorerConfig {
    /// Days-since threshold on absolute cumulative deaths.
    double align_threshold_absolute = constants::ALIGN_THRESHOLD_ABSOLUTE;

    /// Days-since threshold on cumulative deaths per million.
    double align_threshold_per_million = constants::ALIGN_THRESHOLD_PER_MILLION;

    /// Samples required after the threshold day.
    std::size_t align_min_days = constants::ALIGN_MIN_DAYS;

    /// Append synthetic World rows to the table.
    bool include_world = true;

    /// Append synthetic continent rows to the table.
    bool include_continents = true;

    /// If true, log skipped rows and materialised columns to stderr.
    bool verbose = false;
};

// ─── Results ──────────────────────────────────────────────────────────────────

/// Metadata of a threshold-aligned column.
struct DaysSinceSpec {
    std::string slug;
    std::string title;
    std::string source;
    double      threshold;
    std::size_t min_days;
};

/// Slugs materialised for one request.
struct RequestedColumns {
    std::string                value_slug;    ///< The requested metric column
    std::optional<std::string> aligned_slug;  ///< Days-since column, if aligned
};

// ─── ExplorerTable ────────────────────────────────────────────────────────────

class ExplorerTable {
public:
    /// Build with a continent lookup taken from the rows' `continent` column.
    explicit ExplorerTable(std::span<const ParsedRow> rows,
                           ExplorerConfig config = ExplorerConfig{});

    ExplorerTable(std::span<const ParsedRow> rows,
                  ContinentLookup lookup,
                  ExplorerConfig config = ExplorerConfig{});

    [[nodiscard]] Table&       table() noexcept { return table_; }
    [[nodiscard]] const Table& table() const noexcept { return table_; }

    /// Countries, then World, then continents (see covex/aggregates.hpp).
    [[nodiscard]] const std::vector<EntityOption>& options() const noexcept { return options_; }

    [[nodiscard]] const ContinentLookup& continents() const noexcept { return lookup_; }

    [[nodiscard]] const ExplorerConfig& config() const noexcept { return config_; }

    /// Spec of a metric column; pure, does not touch the table.
    [[nodiscard]] ColumnSpec build_column_spec(MetricKind metric,
                                               std::uint32_t per_capita,
                                               bool daily,
                                               std::uint32_t smoothing) const;

    /// Add a days-since column over `source` and return its slug.
    ///
    /// # Errors
    /// - `MissingColumnError` if `source` is not a column of the table
    /// - `IdentifierCollisionError` if the slug already names a column with
    ///   a different source, threshold or minimum
    std::string add_days_since_column(const std::string& source,
                                      double threshold,
                                      std::size_t min_days,
                                      std::string title);

    /// Materialise the column of a parameter tuple (and the columns it is
    /// derived from) and return its slug.
    ///
    /// # Errors
    /// - `MissingColumnError` if the dataset lacks the raw field
    /// - `std::invalid_argument` for a per-capita case fatality rate
    std::string init_column(const ColumnParams& params);

    std::string init_testing_column(const QueryParams& params);
    std::string init_cases_column(const QueryParams& params);
    std::string init_deaths_column(const QueryParams& params);
    std::string init_cfr_column(const QueryParams& params);

    /// Materialise the requested metric column and, when `aligned`, the
    /// cumulative deaths column and the days-since column over it.
    RequestedColumns init_requested_columns(const QueryParams& params);

    /// Spec of a materialised metric column, or nullptr.
    [[nodiscard]] const ColumnSpec* column_spec(std::string_view slug) const;

    /// Spec of a materialised days-since column, or nullptr.
    [[nodiscard]] const DaysSinceSpec* days_since_spec(std::string_view slug) const;

    /// Every materialised metric column spec, in materialisation order.
    [[nodiscard]] std::vector<ColumnSpec> column_specs() const { return specs_.specs(); }

    /// Column parameters a query selects for `metric`.
    ///
    /// # Errors
    /// `std::invalid_argument` if the smoothing window exceeds
    /// `constants::MAX_SMOOTHING_WINDOW`.
    [[nodiscard]] static ColumnParams params_for(MetricKind metric, const QueryParams& query);

private:
    /// Country rows plus the configured synthetic rows.
    [[nodiscard]] static std::vector<ParsedRow>
    combine_rows(std::span<const ParsedRow> rows,
                 const ContinentLookup& lookup,
                 const ExplorerConfig& config);

    ExplorerConfig                                      config_;
    ContinentLookup                                     lookup_;
    std::vector<EntityOption>                           options_;
    Table                                               table_;
    ColumnSpecRegistry                                  specs_;
    std::map<std::string, DaysSinceSpec, std::less<>>   days_since_;
};

}  // namespace covex
