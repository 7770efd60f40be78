/// @file src/table/table.cpp
/// @brief Table storage, grouping and the derivation dispatcher.

#include "covex/table.hpp"
#include "covex/errors.hpp"
#include "covex/transforms.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <utility>

namespace covex {

// ─── source_columns ───────────────────────────────────────────────────────────

std::vector<std::string> source_columns(const Derivation& derivation) {
    if (const auto* r = std::get_if<Rolling>(&derivation)) {
        return {r->source};
    }
    if (const auto* d = std::get_if<DaysSince>(&derivation)) {
        return {d->source};
    }
    if (const auto* s = std::get_if<Scale>(&derivation)) {
        if (s->population) {
            return {s->source, *s->population};
        }
        return {s->source};
    }
    const auto& q = std::get<Ratio>(derivation);
    return {q.numerator, q.denominator};
}

// ─── RowView ──────────────────────────────────────────────────────────────────

Cell RowView::operator[](std::string_view slug) const {
    return table_->value(index_, slug);
}

const RowKey& RowView::key() const {
    return table_->key(index_);
}

// ─── Table constructor ────────────────────────────────────────────────────────

Table::Table(std::span<const ParsedRow> rows) {
    keys_.reserve(rows.size());
    for (const auto& r : rows) {
        keys_.push_back(RowKey{
            .entity_code = r.iso_code,
            .entity_name = r.location,
            .continent   = r.continent,
            .date        = r.date,
        });
        for (const auto& [field, cell] : r.metrics) {
            if (!columns_.contains(field)) {
                columns_.emplace(field, std::make_unique<Column>(rows.size()));
                order_.push_back(field);
            }
        }
    }

    for (std::size_t i = 0; i < rows.size(); ++i) {
        for (const auto& [field, cell] : rows[i].metrics) {
            (*columns_.find(field)->second)[i] = cell;
        }
    }
}

// ─── Column access ────────────────────────────────────────────────────────────

const Table::Column* Table::find_column(std::string_view slug) const {
    const auto it = columns_.find(slug);
    return it == columns_.end() ? nullptr : it->second.get();
}

Cell Table::value(std::size_t row, std::string_view slug) const {
    std::shared_lock lock(registry_mutex_);
    const Column* col = find_column(slug);
    if (col == nullptr) {
        throw MissingColumnError(std::string(slug));
    }
    return col->at(row);
}

std::span<const Cell> Table::column(std::string_view slug) const {
    std::shared_lock lock(registry_mutex_);
    const Column* col = find_column(slug);
    if (col == nullptr) {
        throw MissingColumnError(std::string(slug));
    }
    return *col;
}

bool Table::has_column(std::string_view slug) const {
    std::shared_lock lock(registry_mutex_);
    return find_column(slug) != nullptr;
}

std::vector<std::string> Table::column_slugs() const {
    std::shared_lock lock(registry_mutex_);
    return order_;
}

// ─── Grouping ─────────────────────────────────────────────────────────────────

std::vector<std::vector<std::size_t>>
Table::group_by(std::span<const GroupKey> keys) const {
    std::map<std::vector<std::string>, std::size_t> index;
    std::vector<std::vector<std::size_t>> groups;

    for (std::size_t row = 0; row < keys_.size(); ++row) {
        const RowKey& k = keys_[row];
        std::vector<std::string> composite;
        composite.reserve(keys.size());
        for (GroupKey g : keys) {
            switch (g) {
                case GroupKey::EntityName: composite.push_back(k.entity_name); break;
                case GroupKey::EntityCode: composite.push_back(k.entity_code); break;
                case GroupKey::Continent:  composite.push_back(k.continent);   break;
                case GroupKey::Date:
                    composite.push_back(std::to_string(k.date.time_since_epoch().count()));
                    break;
            }
        }

        auto [it, inserted] = index.try_emplace(std::move(composite), groups.size());
        if (inserted) {
            groups.emplace_back();
        }
        groups[it->second].push_back(row);
    }

    // Date order inside every group; ties keep insertion order.
    for (auto& g : groups) {
        std::stable_sort(g.begin(), g.end(), [this](std::size_t a, std::size_t b) {
            return keys_[a].date < keys_[b].date;
        });
    }
    return groups;
}

std::vector<std::vector<std::size_t>> Table::entity_groups() const {
    const GroupKey by_entity[] = {GroupKey::EntityName};
    return group_by(by_entity);
}

// ─── Derivation dispatch ──────────────────────────────────────────────────────

namespace {

/// Gather the cells of `col` at `rows`.
std::vector<Cell> gather(const std::vector<Cell>& col, const std::vector<std::size_t>& rows) {
    std::vector<Cell> out;
    out.reserve(rows.size());
    for (std::size_t r : rows) {
        out.push_back(col[r]);
    }
    return out;
}

/// Write `values` back to positions `rows` of `out`.
void scatter(std::vector<Cell>& out,
             const std::vector<std::size_t>& rows,
             const std::vector<Cell>& values) {
    for (std::size_t i = 0; i < rows.size(); ++i) {
        out[rows[i]] = values[i];
    }
}

}  // namespace

Table::Column Table::compute(const Derivation& derivation) const {
    // Resolve every source first so a missing one writes nothing.
    std::vector<const Column*> sources;
    for (const auto& slug : source_columns(derivation)) {
        const Column* col = find_column(slug);
        if (col == nullptr) {
            throw MissingColumnError(slug);
        }
        sources.push_back(col);
    }

    Column out(keys_.size());

    if (const auto* r = std::get_if<Rolling>(&derivation)) {
        for (const auto& rows : entity_groups()) {
            scatter(out, rows, transforms::rolling_average(gather(*sources[0], rows), r->window));
        }
        return out;
    }

    if (const auto* d = std::get_if<DaysSince>(&derivation)) {
        for (const auto& rows : entity_groups()) {
            std::vector<Date> dates;
            dates.reserve(rows.size());
            for (std::size_t row : rows) {
                dates.push_back(keys_[row].date);
            }
            scatter(out, rows,
                    transforms::days_since(gather(*sources[0], rows), dates,
                                           d->threshold, d->min_days));
        }
        return out;
    }

    if (const auto* s = std::get_if<Scale>(&derivation)) {
        if (!s->population) {
            return transforms::scale(*sources[0], s->factor);
        }
        for (const auto& rows : entity_groups()) {
            scatter(out, rows,
                    transforms::scale_per_capita(gather(*sources[0], rows),
                                                 gather(*sources[1], rows),
                                                 s->factor));
        }
        return out;
    }

    const auto& q = std::get<Ratio>(derivation);
    return transforms::ratio(*sources[0], *sources[1], q.factor);
}

// ─── add_column ───────────────────────────────────────────────────────────────

bool Table::add_column(const std::string& slug, const Derivation& derivation) {
    Column cells;
    {
        std::shared_lock lock(registry_mutex_);
        if (find_column(slug) != nullptr) {
            return false;
        }
        cells = compute(derivation);
    }
    return publish(slug, std::move(cells));
}

bool Table::publish(const std::string& slug, Column cells) {
    std::unique_lock lock(registry_mutex_);
    // Another writer may have published the same slug since the check.
    if (find_column(slug) != nullptr) {
        return false;
    }
    columns_.emplace(slug, std::make_unique<Column>(std::move(cells)));
    order_.push_back(slug);
    return true;
}

bool Table::add_rolling_average(const std::string& slug,
                                std::size_t window,
                                const std::string& source) {
    return add_column(slug, Rolling{.source = source, .window = window});
}

}  // namespace covex
