/// @file src/table/transforms.cpp
/// @brief Rolling mean, threshold alignment and scaling of entity series.
///
/// The rolling mean keeps two parallel Eigen arrays per series: the values
/// (absent read as 0) and a presence mask (1 for a known value). The window
/// sum and the window count are segment sums over the two arrays, so absent
/// cells contribute to neither.

#include "covex/transforms.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <stdexcept>

namespace covex::transforms {

// ─── rolling_average ──────────────────────────────────────────────────────────

std::vector<Cell> rolling_average(std::span<const Cell> series, std::size_t window) {
    const std::size_t w = window < 1 ? 1 : window;
    const auto n = static_cast<Eigen::Index>(series.size());

    Eigen::ArrayXd values  = Eigen::ArrayXd::Zero(n);
    Eigen::ArrayXd present = Eigen::ArrayXd::Zero(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Cell& c = series[static_cast<std::size_t>(i)];
        if (c) {
            values[i]  = *c;
            present[i] = 1.0;
        }
    }

    std::vector<Cell> out(series.size());
    for (std::size_t i = 0; i < series.size(); ++i) {
        // Window [lo, i], clipped to the start of the series.
        const std::size_t lo  = (i + 1 >= w) ? i + 1 - w : 0;
        const auto        len = static_cast<Eigen::Index>(i - lo + 1);
        const auto        off = static_cast<Eigen::Index>(lo);

        const double count = present.segment(off, len).sum();
        if (count < 0.5) {
            continue;  // no known value in the window
        }
        out[i] = values.segment(off, len).sum() / count;
    }
    return out;
}

// ─── days_since ───────────────────────────────────────────────────────────────

std::vector<Cell> days_since(std::span<const Cell> series,
                             std::span<const Date> dates,
                             double threshold,
                             std::size_t min_days) {
    if (series.size() != dates.size()) {
        throw std::invalid_argument("days_since: series and dates differ in length");
    }

    std::vector<Cell> out(series.size());

    std::size_t start = series.size();
    for (std::size_t i = 0; i < series.size(); ++i) {
        if (series[i] && *series[i] >= threshold) {
            start = i;
            break;
        }
    }
    if (start == series.size()) {
        return out;  // never reached
    }

    const std::size_t following = series.size() - 1 - start;
    if (following < min_days) {
        return out;  // not enough history after the threshold day
    }

    const Date origin = dates[start];
    for (std::size_t i = start; i < series.size(); ++i) {
        out[i] = static_cast<double>((dates[i] - origin).count());
    }
    return out;
}

// ─── entity_population ────────────────────────────────────────────────────────

Cell entity_population(std::span<const Cell> population) {
    for (auto it = population.rbegin(); it != population.rend(); ++it) {
        if (*it && **it > 0.0) {
            return *it;
        }
    }
    return std::nullopt;
}

// ─── scale_per_capita ─────────────────────────────────────────────────────────

std::vector<Cell> scale_per_capita(std::span<const Cell> series,
                                   std::span<const Cell> population,
                                   double factor) {
    const Cell pop = entity_population(population);
    if (!pop) {
        return std::vector<Cell>(series.size());
    }
    return scale(series, factor / *pop);
}

// ─── scale ────────────────────────────────────────────────────────────────────

std::vector<Cell> scale(std::span<const Cell> series, double factor) {
    std::vector<Cell> out(series.size());
    for (std::size_t i = 0; i < series.size(); ++i) {
        if (!series[i]) {
            continue;
        }
        const double v = *series[i] * factor;
        if (std::isfinite(v)) {
            out[i] = v;
        }
    }
    return out;
}

// ─── ratio ────────────────────────────────────────────────────────────────────

std::vector<Cell> ratio(std::span<const Cell> numerator,
                        std::span<const Cell> denominator,
                        double factor) {
    if (numerator.size() != denominator.size()) {
        throw std::invalid_argument("ratio: numerator and denominator differ in length");
    }
    std::vector<Cell> out(numerator.size());
    for (std::size_t i = 0; i < numerator.size(); ++i) {
        if (!numerator[i] || !denominator[i] || *denominator[i] == 0.0) {
            continue;
        }
        const double v = factor * *numerator[i] / *denominator[i];
        if (std::isfinite(v)) {
            out[i] = v;
        }
    }
    return out;
}

}  // namespace covex::transforms
