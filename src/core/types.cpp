/// @file src/core/types.cpp
/// @brief Helpers for the shared covex value types.

#include "covex/types.hpp"
#include "covex/errors.hpp"

#include <fmt/core.h>

#include <utility>

namespace covex {

// ─── ParsedRow ────────────────────────────────────────────────────────────────

Cell ParsedRow::metric(std::string_view field) const {
    const auto it = metrics.find(field);
    return it == metrics.end() ? Cell{} : it->second;
}

// ─── MetricKind ───────────────────────────────────────────────────────────────

std::string_view to_string(MetricKind metric) noexcept {
    switch (metric) {
        case MetricKind::Cases:  return "cases";
        case MetricKind::Deaths: return "deaths";
        case MetricKind::Tests:  return "tests";
        case MetricKind::Cfr:    return "cfr";
    }
    return "unknown";
}

std::optional<MetricKind> metric_from_string(std::string_view name) noexcept {
    if (name == "cases")  return MetricKind::Cases;
    if (name == "deaths") return MetricKind::Deaths;
    if (name == "tests")  return MetricKind::Tests;
    if (name == "cfr")    return MetricKind::Cfr;
    return std::nullopt;
}

// ─── Dates ────────────────────────────────────────────────────────────────────

std::string format_date(Date date) {
    const std::chrono::year_month_day ymd{date};
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

// ─── Errors ───────────────────────────────────────────────────────────────────

MalformedRowError::MalformedRowError(std::string field, const std::string& reason)
    : std::runtime_error(fmt::format("malformed row: field '{}': {}", field, reason))
    , field_(std::move(field)) {}

MissingColumnError::MissingColumnError(std::string slug)
    : std::runtime_error(fmt::format("missing column '{}'", slug))
    , slug_(std::move(slug)) {}

}  // namespace covex
