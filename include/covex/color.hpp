#pragma once

/// @file include/covex/color.hpp
/// @brief Series color assignment from a fixed palette.
///
/// Colors are opaque identifiers; the renderer decides what they look like.

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace covex {

/// Palette color with the fewest occurrences in `used`. Ties go to the color
/// declared first in `palette`. Colors in `used` that are not in the palette
/// are ignored. Returns nullopt for an empty palette.
[[nodiscard]] std::optional<std::string>
get_least_used_color(std::span<const std::string> palette,
                     std::span<const std::string> used);

// ─── SeriesColorScheme ────────────────────────────────────────────────────────

/// Palette plus the multiset of colors currently held by chart series.
///
/// Not thread-safe; one scheme belongs to one chart.
class SeriesColorScheme {
public:
    /// Scheme over `constants::DEFAULT_PALETTE`.
    SeriesColorScheme();

    /// Scheme over a caller palette. An empty palette is replaced by the
    /// default one.
    explicit SeriesColorScheme(std::vector<std::string> palette);

    /// Take the least-used color and record it as in use.
    [[nodiscard]] std::string assign();

    /// Return one occurrence of `color`. Returns false if it was not in use.
    bool release(std::string_view color);

    [[nodiscard]] std::span<const std::string> palette() const noexcept { return palette_; }
    [[nodiscard]] std::span<const std::string> in_use() const noexcept { return used_; }

private:
    std::vector<std::string> palette_;
    std::vector<std::string> used_;
};

}  // namespace covex
