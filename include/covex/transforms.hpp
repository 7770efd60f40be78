#pragma once

/// @file include/covex/transforms.hpp
/// @brief Series transforms applied to one entity's date-ordered values.
///
/// # Module: Transforms
///
/// ## Responsibility
/// The numeric core behind every derivation. Each function receives the
/// cells of a single entity, already ordered by date, and returns one output
/// cell per input cell. The table is responsible for grouping, ordering and
/// scattering results back to row positions.
///
/// ## Absent Semantics
/// Absent inputs are skipped, never read as zero. A computation with no
/// usable input yields absent, never NaN.

#include "covex/types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace covex::transforms {

/// Trailing rolling mean.
///
/// Position i is the mean of the available values in
/// `[max(0, i - window + 1), i]`. Absent values are excluded from both the
/// sum and the count; a window without any value yields absent. A `window`
/// of 0 is treated as 1.
[[nodiscard]] std::vector<Cell>
rolling_average(std::span<const Cell> series, std::size_t window);

/// Days since the series first reached `threshold`.
///
/// The first position whose value is ≥ `threshold` gets 0; later positions
/// get the number of calendar days elapsed since that date; earlier
/// positions are absent. If the threshold is never reached, or fewer than
/// `min_days` positions follow the threshold position, every output is
/// absent. `dates` must be the same length as `series`.
[[nodiscard]] std::vector<Cell>
days_since(std::span<const Cell> series,
           std::span<const Date> dates,
           double threshold,
           std::size_t min_days);

/// Per-entity population constant used by `scale_per_capita`: the most recent
/// known, positive population of the series. Absent if there is none.
[[nodiscard]] Cell entity_population(std::span<const Cell> population);

/// `value · factor / population` for every position, with a single
/// per-entity population constant. Everything is absent if the entity has no
/// usable population.
[[nodiscard]] std::vector<Cell>
scale_per_capita(std::span<const Cell> series,
                 std::span<const Cell> population,
                 double factor);

/// `value · factor` for every position.
[[nodiscard]] std::vector<Cell>
scale(std::span<const Cell> series, double factor);

/// `factor · numerator / denominator` for every position; absent when either
/// side is absent or the denominator is zero.
[[nodiscard]] std::vector<Cell>
ratio(std::span<const Cell> numerator,
      std::span<const Cell> denominator,
      double factor);

}  // namespace covex::transforms
