/// @file src/core/row_parser.cpp
/// @brief CSV RowParser for epidemiological records.

#include "covex/row_parser.hpp"
#include "covex/constants.hpp"
#include "covex/errors.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <string>
#include <system_error>

namespace covex {

namespace {

/// Trim leading/trailing blanks.
std::string_view trim(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

/// Identity text field: present and non-blank, else MalformedRowError.
std::string require_text(const RawRow& raw, std::string_view field) {
    const auto it = raw.find(field);
    if (it == raw.end()) {
        throw MalformedRowError(std::string(field), "field is missing");
    }
    const auto value = trim(it->second);
    if (value.empty()) {
        throw MalformedRowError(std::string(field), "field is blank");
    }
    return std::string(value);
}

/// Optional text field, copied verbatim (trimmed).
std::string optional_text(const RawRow& raw, std::string_view field) {
    const auto it = raw.find(field);
    return it == raw.end() ? std::string{} : std::string(trim(it->second));
}

bool is_text_field(std::string_view name) noexcept {
    return name == constants::FIELD_ISO_CODE
        || name == constants::FIELD_LOCATION
        || name == constants::FIELD_DATE
        || name == constants::FIELD_CONTINENT
        || name == constants::FIELD_TESTS_UNITS;
}

}  // namespace

// ─── RowParser::parse_number ──────────────────────────────────────────────────

Cell RowParser::parse_number(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    // from_chars rejects a leading '+'; accept it like stod does.
    if (text.front() == '+') {
        text.remove_prefix(1);
        if (text.empty() || text.front() == '-') {
            return std::nullopt;
        }
    }

    double value = 0.0;
    const char* begin = text.data();
    const char* end   = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;  // not a number, or trailing garbage
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// ─── RowParser::parse_date ────────────────────────────────────────────────────

std::optional<Date> RowParser::parse_date(std::string_view text) noexcept {
    text = trim(text);
    // Strictly YYYY-MM-DD.
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    auto read = [&](std::size_t pos, std::size_t len, int& out) {
        const char* b = text.data() + pos;
        const char* e = b + len;
        if (*b < '0' || *b > '9') {
            return false;  // from_chars would take a sign
        }
        auto [ptr, ec] = std::from_chars(b, e, out);
        return ec == std::errc{} && ptr == e;
    };

    int y = 0, m = 0, d = 0;
    if (!read(0, 4, y) || !read(5, 2, m) || !read(8, 2, d)) {
        return std::nullopt;
    }
    if (m <= 0 || d <= 0) {
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{
        std::chrono::year{y},
        std::chrono::month{static_cast<unsigned>(m)},
        std::chrono::day{static_cast<unsigned>(d)},
    };
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return Date{ymd};
}

// ─── RowParser::parse_covid_row ───────────────────────────────────────────────

ParsedRow RowParser::parse_covid_row(const RawRow& raw) {
    ParsedRow row;
    row.iso_code  = require_text(raw, constants::FIELD_ISO_CODE);
    row.location  = require_text(raw, constants::FIELD_LOCATION);
    row.continent = optional_text(raw, constants::FIELD_CONTINENT);

    const auto date_text = require_text(raw, constants::FIELD_DATE);
    const auto date = parse_date(date_text);
    if (!date) {
        throw MalformedRowError(std::string(constants::FIELD_DATE),
                                fmt::format("'{}' is not a YYYY-MM-DD day", date_text));
    }
    row.date = *date;

    for (const auto& [name, text] : raw) {
        if (is_text_field(name)) {
            continue;
        }
        row.metrics.emplace(name, parse_number(text));
    }
    return row;
}

// ─── RowParser::split_line ────────────────────────────────────────────────────

std::vector<std::string> RowParser::split_line(std::string_view line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell.push_back('"');  // escaped quote
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cell.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cells.push_back(std::move(cell));
            cell.clear();
        } else {
            cell.push_back(c);
        }
    }
    cells.push_back(std::move(cell));
    return cells;
}

// ─── RowParser::split_records ─────────────────────────────────────────────────

std::vector<RawRow> RowParser::split_records(std::string_view csv_content) {
    std::vector<RawRow> records;
    std::vector<std::string> header;

    std::size_t start = 0;
    while (start <= csv_content.size()) {
        // A record ends at the first newline outside a quoted field.
        std::size_t stop = start;
        bool quoted = false;
        for (; stop < csv_content.size(); ++stop) {
            const char c = csv_content[stop];
            if (c == '"') {
                quoted = !quoted;
            } else if (c == '\n' && !quoted) {
                break;
            }
        }
        auto line = csv_content.substr(start, stop - start);
        start = stop + 1;

        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (trim(line).empty()) {
            continue;
        }

        auto cells = split_line(line);
        if (header.empty()) {
            for (auto& name : cells) {
                header.emplace_back(trim(name));
            }
            continue;
        }

        RawRow record;
        const std::size_t n = std::min(cells.size(), header.size());
        for (std::size_t i = 0; i < n; ++i) {
            record.insert_or_assign(header[i], std::move(cells[i]));
        }
        records.push_back(std::move(record));
    }
    return records;
}

// ─── RowParser::parse_csv_string ──────────────────────────────────────────────

IngestReport RowParser::parse_csv_string(std::string_view csv_content,
                                         const IngestOptions& options) {
    IngestReport report;
    auto records = split_records(csv_content);
    report.rows.reserve(records.size());

    for (std::size_t i = 0; i < records.size(); ++i) {
        try {
            report.rows.push_back(parse_covid_row(records[i]));
        } catch (const MalformedRowError& err) {
            if (options.verbose) {
                fmt::print(stderr, "covex: skipping row {}: {}\n", i + 1, err.what());
            }
            report.rejected.push_back(RowRejection{
                .position = i + 1,
                .field    = err.field(),
                .reason   = err.what(),
            });
        }
    }
    return report;
}

}  // namespace covex
