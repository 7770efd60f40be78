/// @file src/aggregate/entity_options.cpp
/// @brief Ordered list of selectable entities.

#include "covex/aggregates.hpp"
#include "covex/constants.hpp"

#include <map>
#include <tuple>

namespace covex {

namespace {

/// Latest known population of a country while scanning its rows.
struct PopulationMark {
    Cell value;
    Date as_of;
};

/// Sum of known populations; absent when none is known.
Cell add_population(Cell total, Cell population) {
    if (!population) {
        return total;
    }
    return total.value_or(0.0) + *population;
}

}  // namespace

std::vector<EntityOption>
make_country_options(std::span<const ParsedRow> rows, const ContinentLookup& lookup) {
    std::vector<EntityOption> countries;
    std::map<std::string, std::size_t, std::less<>> position;
    std::vector<PopulationMark> marks;

    for (const auto& r : rows) {
        if (is_aggregate_code(r.iso_code)) {
            continue;
        }

        auto [it, inserted] = position.try_emplace(r.iso_code, countries.size());
        if (inserted) {
            const auto mapped = lookup.find(r.iso_code);
            countries.push_back(EntityOption{
                .code       = r.iso_code,
                .name       = r.location,
                .continent  = mapped ? std::string(*mapped) : std::string{},
                .population = std::nullopt,
                .synthetic  = false,
            });
            marks.push_back(PopulationMark{.value = std::nullopt, .as_of = r.date});
        }

        const Cell pop = r.metric(constants::FIELD_POPULATION);
        auto& mark = marks[it->second];
        if (pop && (!mark.value || r.date >= mark.as_of)) {
            mark = PopulationMark{.value = pop, .as_of = r.date};
        }
    }

    std::vector<EntityOption> options;
    options.reserve(countries.size() + 1 + constants::CANONICAL_CONTINENTS.size());

    Cell world_population;
    using ContinentId = std::tuple<std::size_t, std::string>;
    std::map<ContinentId, Cell> continents;

    for (std::size_t i = 0; i < countries.size(); ++i) {
        countries[i].population = marks[i].value;
        world_population = add_population(world_population, marks[i].value);
        if (!countries[i].continent.empty()) {
            auto& total = continents[ContinentId{continent_rank(countries[i].continent),
                                                 countries[i].continent}];
            total = add_population(total, marks[i].value);
        }
        options.push_back(std::move(countries[i]));
    }

    if (options.empty()) {
        return options;
    }

    options.push_back(EntityOption{
        .code       = std::string(constants::WORLD_CODE),
        .name       = std::string(constants::WORLD_NAME),
        .continent  = {},
        .population = world_population,
        .synthetic  = true,
    });

    for (const auto& [id, population] : continents) {
        const auto& name = std::get<1>(id);
        options.push_back(EntityOption{
            .code       = continent_code(name),
            .name       = name,
            .continent  = {},
            .population = population,
            .synthetic  = true,
        });
    }
    return options;
}

}  // namespace covex
