/**
 * @file  fuzz_query_params.cpp
 * @brief libFuzzer target for query-string parsing
 *
 * Build:
 *   cmake -DCOVEX_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_query_params
 *
 * Safety invariants verified on every input:
 *   1. parse_query_params either returns or throws std::invalid_argument.
 *   2. A parsed query has 1 ≤ smoothing_window ≤ MAX_SMOOTHING_WINDOW and a
 *      finite threshold.
 *   3. The canonical query string of a parsed query parses back to the
 *      same parameters.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>

#include "covex/constants.hpp"
#include "covex/query_params.hpp"

using namespace covex;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    QueryParams params;
    try {
        params = parse_query_params(input);
    } catch (const std::invalid_argument&) {
        return 0;  // Invariant 1
    }

    // Invariant 2
    assert(params.smoothing_window >= 1);
    assert(params.smoothing_window <= constants::MAX_SMOOTHING_WINDOW);
    assert(!params.threshold || std::isfinite(*params.threshold));

    // Invariant 3
    const QueryParams again = parse_query_params(params.to_query_string());
    assert(again.metric == params.metric);
    assert(again.frequency == params.frequency);
    assert(again.per_capita == params.per_capita);
    assert(again.per_million == params.per_million);
    assert(again.aligned == params.aligned);
    assert(again.smoothing_window == params.smoothing_window);
    assert(again.threshold == params.threshold);
    assert(again.min_days == params.min_days);
    return 0;
}
