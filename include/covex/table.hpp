#pragma once

/// @file include/covex/table.hpp
/// @brief Table — columnar store of per-entity, per-day rows.
///
/// # Module: Table
///
/// ## Responsibility
/// Own the ingested rows (identity keys + numeric columns) and grow them by
/// derived columns. Each numeric column holds exactly one `Cell` per row;
/// missing values are explicit absent cells.
///
/// ## Column Lifecycle
/// Columns are appended, never removed. `add_column` computes the whole
/// column first and publishes it afterwards, so readers never observe a
/// partially written column. Adding an existing slug is a no-op.
///
/// ## Grouping
/// `group_by` rebuilds its groups on every call: groups appear in
/// first-appearance order and the rows inside a group are stably ordered by
/// date. Time-series derivations always group by entity name.
///
/// ## Thread Safety
/// Column publication takes an exclusive lock on the column registry and
/// re-checks slug membership under it; readers take a shared lock. Cell
/// vectors are never reallocated after publication.

#include "covex/derivation.hpp"
#include "covex/types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace covex {

// ─── Row Keys ─────────────────────────────────────────────────────────────────

/// Identity part of a row.
struct RowKey {
    std::string entity_code;
    std::string entity_name;
    std::string continent;
    Date        date;
};

/// Key columns a table can be grouped by.
enum class GroupKey {
    EntityName,
    EntityCode,
    Continent,
    Date,
};

class Table;

/// Read-only row-major view of one table row.
class RowView {
public:
    RowView(const Table& table, std::size_t index) noexcept
        : table_(&table), index_(index) {}

    /// Cell of column `slug`; throws `MissingColumnError` for unknown slugs.
    [[nodiscard]] Cell operator[](std::string_view slug) const;

    /// Identity of the row; throws `std::out_of_range` past the last row.
    [[nodiscard]] const RowKey& key() const;
    [[nodiscard]] std::size_t index() const noexcept { return index_; }

private:
    const Table* table_;
    std::size_t  index_;
};

// ─── Table ────────────────────────────────────────────────────────────────────

class Table {
public:
    Table() = default;

    /// Build a table from parsed rows. Every numeric field seen on any row
    /// becomes a column (named after the field); rows lacking the field get
    /// an absent cell.
    explicit Table(std::span<const ParsedRow> rows);

    Table(const Table&)            = delete;
    Table& operator=(const Table&) = delete;

    [[nodiscard]] std::size_t row_count() const noexcept { return keys_.size(); }

    [[nodiscard]] const RowKey& key(std::size_t row) const { return keys_.at(row); }

    [[nodiscard]] RowView row(std::size_t index) const { return RowView(*this, index); }

    /// Cell at (`row`, `slug`). Throws `MissingColumnError` for unknown slugs
    /// and `std::out_of_range` for a bad row index.
    [[nodiscard]] Cell value(std::size_t row, std::string_view slug) const;

    /// Whole column; throws `MissingColumnError` for unknown slugs.
    [[nodiscard]] std::span<const Cell> column(std::string_view slug) const;

    [[nodiscard]] bool has_column(std::string_view slug) const;

    /// Populated column slugs, in insertion order.
    [[nodiscard]] std::vector<std::string> column_slugs() const;

    /// Row-index groups for the given key columns.
    [[nodiscard]] std::vector<std::vector<std::size_t>>
    group_by(std::span<const GroupKey> keys) const;

    /// Compute and append the column `slug` described by `derivation`.
    ///
    /// # Returns
    /// `true` if the column was added, `false` if `slug` already existed (the
    /// existing column is left untouched and nothing is recomputed).
    ///
    /// # Errors
    /// `MissingColumnError` if a source column is absent; nothing is written.
    bool add_column(const std::string& slug, const Derivation& derivation);

    /// Trailing rolling mean of `source` over `window` rows of each entity.
    /// Shorthand for `add_column(slug, Rolling{source, window})`.
    bool add_rolling_average(const std::string& slug,
                             std::size_t window,
                             const std::string& source);

private:
    using Column = std::vector<Cell>;

    /// Entity groups (by name), each sorted by date.
    [[nodiscard]] std::vector<std::vector<std::size_t>> entity_groups() const;

    /// Compute the cells of a derivation. Caller holds no lock; sources are
    /// published columns and therefore immutable.
    [[nodiscard]] Column compute(const Derivation& derivation) const;

    /// Publish a computed column. Returns false if the slug appeared
    /// meanwhile.
    bool publish(const std::string& slug, Column cells);

    /// Column lookup without locking; nullptr if missing.
    [[nodiscard]] const Column* find_column(std::string_view slug) const;

    std::vector<RowKey>                                     keys_;
    std::vector<std::string>                                order_;
    std::map<std::string, std::unique_ptr<Column>, std::less<>> columns_;
    mutable std::shared_mutex                               registry_mutex_;
};

}  // namespace covex
