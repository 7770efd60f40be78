#pragma once

#include <array>
#include <cstddef>
#include <string_view>

/// @file include/covex/constants.hpp
/// @brief Field names, aggregate codes and defaults for the covex core.

namespace covex::constants {

// ─── Identity Fields ──────────────────────────────────────────────────────────

static constexpr std::string_view FIELD_ISO_CODE    = "iso_code";
static constexpr std::string_view FIELD_LOCATION    = "location";
static constexpr std::string_view FIELD_DATE        = "date";
static constexpr std::string_view FIELD_CONTINENT   = "continent";
static constexpr std::string_view FIELD_TESTS_UNITS = "tests_units";

// ─── Metric Fields ────────────────────────────────────────────────────────────

static constexpr std::string_view FIELD_TOTAL_CASES  = "total_cases";
static constexpr std::string_view FIELD_NEW_CASES    = "new_cases";
static constexpr std::string_view FIELD_TOTAL_DEATHS = "total_deaths";
static constexpr std::string_view FIELD_NEW_DEATHS   = "new_deaths";
static constexpr std::string_view FIELD_TOTAL_TESTS  = "total_tests";
static constexpr std::string_view FIELD_NEW_TESTS    = "new_tests";
static constexpr std::string_view FIELD_POPULATION   = "population";

// ─── Aggregate Entities ───────────────────────────────────────────────────────

/// Codes with this prefix denote pre-aggregated or synthetic entities.
static constexpr std::string_view AGGREGATE_CODE_PREFIX = "OWID_";

static constexpr std::string_view WORLD_CODE = "OWID_WRL";
static constexpr std::string_view WORLD_NAME = "World";

/// A continent and the code of its synthetic entity.
struct ContinentCode {
    std::string_view name;
    std::string_view code;
};

/// Canonical continent order. Synthetic continent rows and options are
/// emitted in this order; unknown continent names sort after it.
static constexpr std::array<ContinentCode, 6> CANONICAL_CONTINENTS = {{
    {"Africa",        "OWID_AFR"},
    {"Asia",          "OWID_ASI"},
    {"Europe",        "OWID_EUR"},
    {"North America", "OWID_NAM"},
    {"Oceania",       "OWID_OCE"},
    {"South America", "OWID_SAM"},
}};

// ─── Per-Capita Multipliers ───────────────────────────────────────────────────

/// Multiplier value meaning "absolute count, no population scaling".
static constexpr unsigned ABSOLUTE = 0;

static constexpr unsigned PER_THOUSAND = 1'000;
static constexpr unsigned PER_MILLION  = 1'000'000;

// ─── Alignment Defaults ───────────────────────────────────────────────────────

/// Days-since threshold on cumulative deaths for absolute counts.
static constexpr double ALIGN_THRESHOLD_ABSOLUTE = 5.0;

/// Days-since threshold on cumulative deaths per million people.
static constexpr double ALIGN_THRESHOLD_PER_MILLION = 0.1;

/// Default number of samples required after the threshold day.
static constexpr std::size_t ALIGN_MIN_DAYS = 0;

// ─── Column Identity Limits ───────────────────────────────────────────────────

/// Largest smoothing window representable in a column identifier.
static constexpr unsigned MAX_SMOOTHING_WINDOW = 0xFFFF;

// ─── Palette ──────────────────────────────────────────────────────────────────

/// Default series palette. Entries are opaque identifiers for the renderer.
static constexpr std::array<std::string_view, 10> DEFAULT_PALETTE = {
    "#3360a9", "#ca2628", "#34983f", "#ed6c2d", "#df3c6a",
    "#a652ba", "#2a939b", "#996d39", "#818282", "#6d3e91",
};

}  // namespace covex::constants
