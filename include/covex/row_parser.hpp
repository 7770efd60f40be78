#pragma once

/// @file include/covex/row_parser.hpp
/// @brief CSV row parser for per-entity, per-day epidemiological records.
///
/// # Module: RowParser
///
/// ## Responsibility
/// Turn raw CSV text (or an already-split record) into `ParsedRow` values.
/// Identity fields must parse; numeric fields that do not parse become
/// absent cells.
///
/// ## Expected CSV Format
/// ```
/// iso_code,continent,location,date,total_cases,new_cases,population
/// AFG,Asia,Afghanistan,2020-03-01,2,2,38928341
/// AFG,Asia,Afghanistan,2020-03-02,,3,38928341
/// ```
/// The first non-empty line is the header. Column order is free; any column
/// other than the identity and text fields is treated as numeric.
///
/// ## Guarantees
/// - `parse_covid_row` throws `MalformedRowError` only for identity fields
/// - Numeric cells are finite or absent, never NaN or ±Inf
/// - `parse_csv_string` never throws on bad rows; it reports them
/// - No file or network I/O

#include "covex/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace covex {

// ─── Ingestion Report ─────────────────────────────────────────────────────────

/// A data row that was rejected during batch ingestion.
struct RowRejection {
    std::size_t position;  ///< 1-based data-row position (header excluded)
    std::string field;     ///< Offending identity field
    std::string reason;    ///< Human-readable message
};

/// Result of ingesting a whole CSV document.
struct IngestReport {
    std::vector<ParsedRow>    rows;
    std::vector<RowRejection> rejected;
};

/// Options for batch ingestion.
struct IngestOptions {
    /// If true, report every rejected row on stderr.
    bool verbose = false;
};

// ─── RowParser ────────────────────────────────────────────────────────────────

/// Parses raw CSV records into typed rows. Stateless.
class RowParser {
public:
    RowParser() = delete;

    /// Parse one raw record.
    ///
    /// # Errors
    /// Throws `MalformedRowError` naming `iso_code`, `location` or `date` when
    /// that field is missing, blank, or (for the date) not a valid
    /// `YYYY-MM-DD` calendar day.
    [[nodiscard]] static ParsedRow parse_covid_row(const RawRow& raw);

    /// Parse a whole CSV document. Malformed rows are collected in
    /// `IngestReport::rejected` and ingestion continues.
    [[nodiscard]] static IngestReport
    parse_csv_string(std::string_view csv_content,
                     const IngestOptions& options = IngestOptions{});

    /// Split CSV text into raw records keyed by the header names. Rows with
    /// fewer cells than the header leave the trailing fields out; extra cells
    /// are ignored. A newline inside a quoted field stays in the cell.
    [[nodiscard]] static std::vector<RawRow> split_records(std::string_view csv_content);

    /// Parse a numeric cell. Returns nullopt for empty text, trailing garbage,
    /// NaN and infinities.
    [[nodiscard]] static Cell parse_number(std::string_view text) noexcept;

    /// Parse an ISO `YYYY-MM-DD` date. Returns nullopt for anything else,
    /// including impossible days such as 2020-02-30.
    [[nodiscard]] static std::optional<Date> parse_date(std::string_view text) noexcept;

private:
    /// Split one CSV record into cells, honouring double-quoted fields.
    [[nodiscard]] static std::vector<std::string> split_line(std::string_view line);
};

}  // namespace covex
