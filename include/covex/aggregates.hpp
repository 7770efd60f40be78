#pragma once

/// @file include/covex/aggregates.hpp
/// @brief Synthetic aggregate entities: continents, World, entity options.
///
/// # Module: Aggregates
///
/// ## Responsibility
/// Derive rows and options for entities that are not present in the raw
/// input: one synthetic row per (continent, date) pair, one World row per
/// date, and the ordered list of selectable entities.
///
/// ## Summation
/// Every numeric field of a synthetic row is the sum of that field over the
/// member rows, absent values counting as zero. A member with no known value
/// still belongs to the group. Rows already carrying an aggregate code
/// (`OWID_` prefix) are never summed again.
///
/// ## Ordering
/// - Continent rows: canonical continent order
///   (Africa, Asia, Europe, North America, Oceania, South America, then any
///   other continent name in lexical order), then ascending date.
/// - World rows: ascending date.
/// - Entity options: countries in first-seen order, then World, then the
///   continents present in canonical order.

#include "covex/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace covex {

// ─── ContinentLookup ──────────────────────────────────────────────────────────

/// Country code → continent name. Owned by the caller; the aggregators only
/// read it.
class ContinentLookup {
public:
    ContinentLookup() = default;

    /// Build from explicit (country code, continent) pairs. Later pairs
    /// override earlier ones.
    explicit ContinentLookup(
        std::span<const std::pair<std::string, std::string>> entries);

    /// Build from the `continent` column of parsed rows. Rows with an empty
    /// continent or an aggregate code are ignored; the first non-empty
    /// continent seen for a country wins.
    [[nodiscard]] static ContinentLookup from_rows(std::span<const ParsedRow> rows);

    void insert(std::string code, std::string continent);

    /// Continent of a country, if mapped.
    [[nodiscard]] std::optional<std::string_view> find(std::string_view code) const;

    [[nodiscard]] std::size_t size() const noexcept { return map_.size(); }

private:
    std::map<std::string, std::string, std::less<>> map_;
};

// ─── Helpers ──────────────────────────────────────────────────────────────────

/// True for codes denoting aggregates (`OWID_` prefix).
[[nodiscard]] bool is_aggregate_code(std::string_view code) noexcept;

/// Synthetic code of a continent: the canonical code when known, otherwise
/// `OWID_` + the upper-cased name without spaces.
[[nodiscard]] std::string continent_code(std::string_view continent);

/// Sort rank of a continent: canonical index, or 6 for unknown names.
[[nodiscard]] std::size_t continent_rank(std::string_view continent) noexcept;

// ─── Aggregators ──────────────────────────────────────────────────────────────

/// One synthetic row per (continent, date) present in `rows`.
[[nodiscard]] std::vector<ParsedRow>
generate_continent_rows(std::span<const ParsedRow> rows, const ContinentLookup& lookup);

/// One synthetic World row per date present in `rows`.
[[nodiscard]] std::vector<ParsedRow>
generate_world_rows(std::span<const ParsedRow> rows);

/// Selectable entities, in the order documented above.
[[nodiscard]] std::vector<EntityOption>
make_country_options(std::span<const ParsedRow> rows, const ContinentLookup& lookup);

}  // namespace covex
