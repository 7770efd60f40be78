/// @file src/color/color_assignment.cpp
/// @brief Least-used palette color selection.

#include "covex/color.hpp"
#include "covex/constants.hpp"

#include <algorithm>
#include <utility>

namespace covex {

std::optional<std::string>
get_least_used_color(std::span<const std::string> palette,
                     std::span<const std::string> used) {
    if (palette.empty()) {
        return std::nullopt;
    }

    std::size_t best       = 0;
    std::size_t best_count = static_cast<std::size_t>(
        std::count(used.begin(), used.end(), palette[0]));

    for (std::size_t i = 1; i < palette.size() && best_count > 0; ++i) {
        const auto n = static_cast<std::size_t>(
            std::count(used.begin(), used.end(), palette[i]));
        // Strict: an equal count keeps the earlier color.
        if (n < best_count) {
            best       = i;
            best_count = n;
        }
    }
    return palette[best];
}

// ─── SeriesColorScheme ────────────────────────────────────────────────────────

SeriesColorScheme::SeriesColorScheme()
    : SeriesColorScheme(std::vector<std::string>{}) {}

SeriesColorScheme::SeriesColorScheme(std::vector<std::string> palette)
    : palette_(std::move(palette)) {
    if (palette_.empty()) {
        palette_.assign(constants::DEFAULT_PALETTE.begin(),
                        constants::DEFAULT_PALETTE.end());
    }
}

std::string SeriesColorScheme::assign() {
    // The palette is never empty, so a color is always available.
    std::string color = *get_least_used_color(palette_, used_);
    used_.push_back(color);
    return color;
}

bool SeriesColorScheme::release(std::string_view color) {
    const auto it = std::find(used_.begin(), used_.end(), color);
    if (it == used_.end()) {
        return false;
    }
    used_.erase(it);
    return true;
}

}  // namespace covex
