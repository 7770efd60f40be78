#pragma once

/// @file include/covex/derivation.hpp
/// @brief Derivation descriptors consumed by `Table::add_column`.
///
/// A derived column is described by data, not by a callback: the table
/// dispatches on the descriptor, gathers each entity's date-ordered source
/// series and hands it to the matching routine in `covex/transforms.hpp`.

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace covex {

/// Trailing rolling mean of `source` over `window` rows of the same entity.
struct Rolling {
    std::string source;
    std::size_t window;
};

/// Days since `source` first reached `threshold`, per entity.
struct DaysSince {
    std::string source;
    double      threshold;
    std::size_t min_days;
};

/// `source` × `factor`, divided by the entity's population when
/// `population` names a column.
struct Scale {
    std::string                source;
    double                     factor;
    std::optional<std::string> population;
};

/// `factor` × `numerator` / `denominator`, row by row.
struct Ratio {
    std::string numerator;
    std::string denominator;
    double      factor;
};

using Derivation = std::variant<Rolling, DaysSince, Scale, Ratio>;

/// Column slugs a derivation reads from.
[[nodiscard]] std::vector<std::string> source_columns(const Derivation& derivation);

}  // namespace covex
