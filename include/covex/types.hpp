#pragma once

/// @file include/covex/types.hpp
/// @brief Shared value types for the covex data-transformation core.
///
/// Every module includes this file. It defines the cell representation, the
/// calendar type used for row dates, the parsed record produced at ingestion
/// and the entity descriptors handed to chart consumers.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace covex {

// ─── Cells ────────────────────────────────────────────────────────────────────

/// One numeric cell. An empty optional is the explicit "absent" marker; it is
/// never conflated with zero and never carries NaN.
using Cell = std::optional<double>;

/// Calendar day of a row (midnight UTC, day precision).
using Date = std::chrono::sys_days;

// ─── Raw Input ────────────────────────────────────────────────────────────────

/// Field name → raw text, exactly as read from a CSV record.
using RawRow = std::map<std::string, std::string, std::less<>>;

// ─── Parsed Row ───────────────────────────────────────────────────────────────

/// One entity on one day, with every numeric field the source carried.
struct ParsedRow {
    std::string iso_code;   ///< Entity code, e.g. "AFG" or "OWID_WRL"
    std::string location;   ///< Display name, e.g. "Afghanistan"
    std::string continent;  ///< May be empty for aggregates / unmapped rows
    Date        date;       ///< Calendar day of the observation
    std::map<std::string, Cell, std::less<>> metrics;  ///< Numeric fields

    /// Value of a numeric field; absent when the field is missing or unparsed.
    [[nodiscard]] Cell metric(std::string_view field) const;
};

// ─── Metrics ──────────────────────────────────────────────────────────────────

/// The measures a derived column can be built from.
enum class MetricKind : std::uint8_t {
    Cases  = 0,
    Deaths = 1,
    Tests  = 2,
    Cfr    = 3,  ///< Case fatality rate, 100 · deaths / cases
};

/// Lower-case metric name used in slugs ("cases", "deaths", "tests", "cfr").
[[nodiscard]] std::string_view to_string(MetricKind metric) noexcept;

/// Inverse of `to_string`; nullopt for unknown names.
[[nodiscard]] std::optional<MetricKind> metric_from_string(std::string_view name) noexcept;

// ─── Entities ─────────────────────────────────────────────────────────────────

/// A selectable entity: a country or a synthetic aggregate.
struct EntityOption {
    std::string code;        ///< Stable code ("AFG", "OWID_WRL", "OWID_EUR")
    std::string name;        ///< Display name
    std::string continent;   ///< Owning continent; empty for aggregates
    Cell        population;  ///< Latest known population, if any
    bool        synthetic;   ///< True for World and continent aggregates
};

/// Format a date as ISO `YYYY-MM-DD`.
[[nodiscard]] std::string format_date(Date date);

}  // namespace covex
