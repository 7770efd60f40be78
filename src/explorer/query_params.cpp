/// @file src/explorer/query_params.cpp
/// @brief Query-string parsing for explorer parameters.

#include "covex/query_params.hpp"
#include "covex/constants.hpp"
#include "covex/row_parser.hpp"

#include <fmt/core.h>

#include <charconv>
#include <stdexcept>
#include <system_error>

namespace covex {

namespace {

[[noreturn]] void bad_value(std::string_view key, std::string_view value) {
    throw std::invalid_argument(
        fmt::format("query parameter '{}': invalid value '{}'", key, value));
}

bool parse_flag(std::string_view key, std::string_view value) {
    // A bare key ("aligned") counts as set.
    if (value.empty() || value == "true" || value == "1") return true;
    if (value == "false" || value == "0")                 return false;
    bad_value(key, value);
}

std::size_t parse_count(std::string_view key, std::string_view value) {
    std::size_t n = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, n);
    if (value.empty() || ec != std::errc{} || ptr != end) {
        bad_value(key, value);
    }
    return n;
}

}  // namespace

// ─── parse_query_params ───────────────────────────────────────────────────────

QueryParams parse_query_params(std::string_view query, bool verbose) {
    if (!query.empty() && query.front() == '?') {
        query.remove_prefix(1);
    }

    QueryParams params;
    while (!query.empty()) {
        const auto amp  = query.find('&');
        const auto pair = query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty()) {
            continue;
        }

        const auto eq    = pair.find('=');
        const auto key   = pair.substr(0, eq);
        const auto value = (eq == std::string_view::npos) ? std::string_view{} : pair.substr(eq + 1);

        if (key == "metric") {
            const auto m = metric_from_string(value);
            if (!m) bad_value(key, value);
            params.metric = *m;
        } else if (key == "frequency") {
            if (value == "daily")           params.frequency = Frequency::Daily;
            else if (value == "cumulative") params.frequency = Frequency::Cumulative;
            else                            bad_value(key, value);
        } else if (key == "perCapita") {
            params.per_capita = parse_flag(key, value);
        } else if (key == "perMillion") {
            params.per_million = parse_flag(key, value);
        } else if (key == "aligned") {
            params.aligned = parse_flag(key, value);
        } else if (key == "smoothing") {
            const auto window = parse_count(key, value);
            if (window < 1 || window > constants::MAX_SMOOTHING_WINDOW) bad_value(key, value);
            params.smoothing_window = window;
        } else if (key == "threshold") {
            const auto t = RowParser::parse_number(value);
            if (!t) bad_value(key, value);
            params.threshold = *t;
        } else if (key == "minDays") {
            params.min_days = parse_count(key, value);
        } else if (key == "casesMetric" || key == "deathsMetric" ||
                   key == "testsMetric" || key == "cfrMetric") {
            if (parse_flag(key, value)) {
                params.metric = *metric_from_string(key.substr(0, key.size() - 6));
            }
        } else if (key == "dailyFreq") {
            if (parse_flag(key, value)) params.frequency = Frequency::Daily;
        } else if (key == "totalFreq") {
            if (parse_flag(key, value)) params.frequency = Frequency::Cumulative;
        } else if (verbose) {
            fmt::print(stderr, "covex: ignoring query parameter '{}'\n", key);
        }
    }
    return params;
}

// ─── QueryParams::to_query_string ─────────────────────────────────────────────

std::string QueryParams::to_query_string() const {
    std::string out = fmt::format("metric={}&frequency={}",
                                  to_string(metric),
                                  daily() ? "daily" : "cumulative");
    if (per_capita)  out += "&perCapita=true";
    if (per_million) out += "&perMillion=true";
    if (aligned)     out += "&aligned=true";
    if (smoothing_window > 1) out += fmt::format("&smoothing={}", smoothing_window);
    if (threshold)   out += fmt::format("&threshold={}", *threshold);
    if (min_days)    out += fmt::format("&minDays={}", *min_days);
    return out;
}

}  // namespace covex
