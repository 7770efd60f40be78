/**
 * @file  prop_rolling_window.cpp
 * @brief Property: the trailing rolling mean stays inside its window.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_rolling_window
 *
 * Series are generated as integers; negative integers stand for absent
 * cells so that every series mixes known and missing values.
 *
 * For window w and output index i the window is [max(0, i−w+1), i]:
 *   • out[i] is absent  ⇔  no known value in the window
 *   • min(window) ≤ out[i] ≤ max(window) otherwise
 *   • w = 1 reproduces the series
 *   • a constant series stays constant
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>
#include <vector>

#include "covex/transforms.hpp"

using namespace covex;
using namespace covex::transforms;

namespace {

std::vector<Cell> to_cells(const std::vector<int>& raw) {
    std::vector<Cell> out;
    out.reserve(raw.size());
    for (int v : raw) {
        out.push_back(v < 0 ? Cell{} : Cell{static_cast<double>(v)});
    }
    return out;
}

}  // namespace

int main() {
    // ── Property 1: mean bounded by the window ─────────────────────────────────
    rc::check(
        "rolling_window: output within [min, max] of known window values",
        []() {
            const auto raw = *rc::gen::container<std::vector<int>>(rc::gen::inRange(-20, 1000));
            const auto w   = static_cast<std::size_t>(*rc::gen::inRange(1, 40));
            const auto s   = to_cells(raw);
            const auto out = rolling_average(s, w);
            RC_ASSERT(out.size() == s.size());

            for (std::size_t i = 0; i < s.size(); ++i) {
                const std::size_t lo = (i + 1 >= w) ? i + 1 - w : 0;
                double lo_v = INFINITY, hi_v = -INFINITY;
                bool any = false;
                for (std::size_t j = lo; j <= i; ++j) {
                    if (s[j]) {
                        any  = true;
                        lo_v = std::min(lo_v, *s[j]);
                        hi_v = std::max(hi_v, *s[j]);
                    }
                }
                RC_ASSERT(out[i].has_value() == any);
                if (any) {
                    RC_ASSERT(*out[i] >= lo_v - 1e-9);
                    RC_ASSERT(*out[i] <= hi_v + 1e-9);
                }
            }
        }
    );

    // ── Property 2: window 1 is the identity ──────────────────────────────────
    rc::check(
        "rolling_window: window 1 reproduces the series",
        [](const std::vector<int>& raw) {
            const auto s   = to_cells(raw);
            const auto out = rolling_average(s, 1);
            RC_ASSERT(out == s);
        }
    );

    // ── Property 3: constant series ───────────────────────────────────────────
    rc::check(
        "rolling_window: constant series stays constant",
        []() {
            const auto n = static_cast<std::size_t>(*rc::gen::inRange(0, 200));
            const auto c = static_cast<double>(*rc::gen::inRange(0, 100000));
            const auto w = static_cast<std::size_t>(*rc::gen::inRange(0, 30));
            const std::vector<Cell> s(n, Cell{c});
            for (const Cell& v : rolling_average(s, w)) {
                RC_ASSERT(v.has_value());
                RC_ASSERT(std::abs(*v - c) < 1e-9);
            }
        }
    );

    return 0;
}
