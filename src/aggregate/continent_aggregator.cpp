/// @file src/aggregate/continent_aggregator.cpp
/// @brief Continent and World row synthesis.
///
/// Both aggregators share one accumulator: the union of numeric field names
/// across the input is indexed once, and each group sums its members into an
/// Eigen array of that width together with a mask of the fields any member
/// carried. Only carried fields appear on the synthetic row.

#include "covex/aggregates.hpp"
#include "covex/constants.hpp"

#include <Eigen/Dense>

#include <map>
#include <tuple>

namespace covex {

namespace {

/// Field name → accumulator slot, over every non-aggregate row.
class FieldIndex {
public:
    explicit FieldIndex(std::span<const ParsedRow> rows) {
        for (const auto& r : rows) {
            if (is_aggregate_code(r.iso_code)) {
                continue;
            }
            for (const auto& [field, cell] : r.metrics) {
                slots_.try_emplace(field, static_cast<Eigen::Index>(slots_.size()));
            }
        }
    }

    [[nodiscard]] Eigen::Index width() const noexcept {
        return static_cast<Eigen::Index>(slots_.size());
    }

    /// Sum `members` field by field; absent counts as zero.
    [[nodiscard]] std::map<std::string, Cell, std::less<>>
    sum(const std::vector<const ParsedRow*>& members) const {
        Eigen::ArrayXd totals  = Eigen::ArrayXd::Zero(width());
        Eigen::ArrayXd carried = Eigen::ArrayXd::Zero(width());

        for (const ParsedRow* m : members) {
            for (const auto& [field, cell] : m->metrics) {
                const Eigen::Index slot = slots_.find(field)->second;
                carried[slot] = 1.0;
                if (cell) {
                    totals[slot] += *cell;
                }
            }
        }

        std::map<std::string, Cell, std::less<>> metrics;
        for (const auto& [field, slot] : slots_) {
            if (carried[slot] > 0.0) {
                metrics.emplace(field, totals[slot]);
            }
        }
        return metrics;
    }

private:
    std::map<std::string, Eigen::Index, std::less<>> slots_;
};

}  // namespace

// ─── generate_continent_rows ──────────────────────────────────────────────────

std::vector<ParsedRow>
generate_continent_rows(std::span<const ParsedRow> rows, const ContinentLookup& lookup) {
    // (rank, continent, date) orders canonical continents first, unknown
    // names lexically after them, and dates ascending within a continent.
    using GroupId = std::tuple<std::size_t, std::string, Date>;
    std::map<GroupId, std::vector<const ParsedRow*>> groups;

    for (const auto& r : rows) {
        if (is_aggregate_code(r.iso_code)) {
            continue;
        }
        const auto continent = lookup.find(r.iso_code);
        if (!continent || continent->empty()) {
            continue;
        }
        groups[GroupId{continent_rank(*continent), std::string(*continent), r.date}]
            .push_back(&r);
    }

    const FieldIndex fields(rows);
    std::vector<ParsedRow> out;
    out.reserve(groups.size());
    for (const auto& [id, members] : groups) {
        const auto& name = std::get<1>(id);
        out.push_back(ParsedRow{
            .iso_code  = continent_code(name),
            .location  = name,
            .continent = {},
            .date      = std::get<2>(id),
            .metrics   = fields.sum(members),
        });
    }
    return out;
}

// ─── generate_world_rows ──────────────────────────────────────────────────────

std::vector<ParsedRow> generate_world_rows(std::span<const ParsedRow> rows) {
    std::map<Date, std::vector<const ParsedRow*>> groups;
    for (const auto& r : rows) {
        if (is_aggregate_code(r.iso_code)) {
            continue;
        }
        groups[r.date].push_back(&r);
    }

    const FieldIndex fields(rows);
    std::vector<ParsedRow> out;
    out.reserve(groups.size());
    for (const auto& [date, members] : groups) {
        out.push_back(ParsedRow{
            .iso_code  = std::string(constants::WORLD_CODE),
            .location  = std::string(constants::WORLD_NAME),
            .continent = {},
            .date      = date,
            .metrics   = fields.sum(members),
        });
    }
    return out;
}

}  // namespace covex
