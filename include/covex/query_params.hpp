#pragma once

/// @file include/covex/query_params.hpp
/// @brief Explorer query parameters and their query-string form.
///
/// ## Query String
/// ```
/// metric=tests&frequency=daily&perCapita=true&smoothing=7&aligned=true
/// ```
/// Recognised keys: `metric` (cases|deaths|tests|cfr), `frequency`
/// (daily|cumulative), `perCapita`, `perMillion`, `aligned` (true|false|1|0),
/// `smoothing` (integer ≥ 1), `threshold` (finite number), `minDays`
/// (integer ≥ 0). The legacy flag keys `casesMetric`, `deathsMetric`,
/// `testsMetric`, `cfrMetric`, `dailyFreq` and `totalFreq` are accepted too.
/// Unknown keys are ignored.

#include "covex/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace covex {

enum class Frequency {
    Daily,
    Cumulative,
};

/// Which derived columns a request wants. Read-only to the core.
struct QueryParams {
    MetricKind  metric           = MetricKind::Cases;
    Frequency   frequency        = Frequency::Cumulative;
    bool        per_capita       = false;  ///< Metric's natural per-capita scale
    bool        per_million      = false;  ///< Per million, whatever the metric
    bool        aligned          = false;  ///< Add a days-since alignment column
    std::size_t smoothing_window = 1;      ///< 1 = unsmoothed
    std::optional<double>      threshold;  ///< Alignment threshold override
    std::optional<std::size_t> min_days;   ///< Alignment min-days override

    [[nodiscard]] bool daily() const noexcept { return frequency == Frequency::Daily; }

    /// Canonical query-string form (keys in a fixed order).
    [[nodiscard]] std::string to_query_string() const;
};

/// Parse a query string. A leading '?' is allowed.
///
/// # Errors
/// `std::invalid_argument` naming the key whose value cannot be parsed.
///
/// # Arguments
/// * `verbose` — report ignored keys on stderr
[[nodiscard]] QueryParams parse_query_params(std::string_view query, bool verbose = false);

}  // namespace covex
