/// @file src/aggregate/continent_lookup.cpp
/// @brief Country → continent mapping and continent naming helpers.

#include "covex/aggregates.hpp"
#include "covex/constants.hpp"

#include <cctype>

namespace covex {

// ─── ContinentLookup ──────────────────────────────────────────────────────────

ContinentLookup::ContinentLookup(
        std::span<const std::pair<std::string, std::string>> entries) {
    for (const auto& [code, continent] : entries) {
        insert(code, continent);
    }
}

ContinentLookup ContinentLookup::from_rows(std::span<const ParsedRow> rows) {
    ContinentLookup lookup;
    for (const auto& r : rows) {
        if (r.continent.empty() || is_aggregate_code(r.iso_code)) {
            continue;
        }
        lookup.map_.try_emplace(r.iso_code, r.continent);
    }
    return lookup;
}

void ContinentLookup::insert(std::string code, std::string continent) {
    map_.insert_or_assign(std::move(code), std::move(continent));
}

std::optional<std::string_view> ContinentLookup::find(std::string_view code) const {
    const auto it = map_.find(code);
    if (it == map_.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

// ─── Helpers ──────────────────────────────────────────────────────────────────

bool is_aggregate_code(std::string_view code) noexcept {
    return code.starts_with(constants::AGGREGATE_CODE_PREFIX);
}

std::size_t continent_rank(std::string_view continent) noexcept {
    for (std::size_t i = 0; i < constants::CANONICAL_CONTINENTS.size(); ++i) {
        if (constants::CANONICAL_CONTINENTS[i].name == continent) {
            return i;
        }
    }
    return constants::CANONICAL_CONTINENTS.size();
}

std::string continent_code(std::string_view continent) {
    const std::size_t rank = continent_rank(continent);
    if (rank < constants::CANONICAL_CONTINENTS.size()) {
        return std::string(constants::CANONICAL_CONTINENTS[rank].code);
    }
    std::string code(constants::AGGREGATE_CODE_PREFIX);
    for (char c : continent) {
        if (c == ' ') {
            continue;
        }
        code.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return code;
}

}  // namespace covex
