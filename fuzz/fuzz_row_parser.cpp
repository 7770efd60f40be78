/**
 * @file  fuzz_row_parser.cpp
 * @brief libFuzzer target for CSV ingestion and table assembly
 *
 * Build:
 *   cmake -DCOVEX_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_row_parser
 *
 * Run for 60 seconds:
 *   ./fuzz_row_parser -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed row has non-empty iso_code and location.
 *   3. Every numeric cell is finite or absent.
 *   4. rows + rejected = number of data records.
 *   5. An ExplorerTable built from the rows has one cell per row in every
 *      column, including the derived ones.
 *
 * Fuzzer strategy:
 *   Input is passed directly as CSV text. The parser must handle:
 *     • Binary garbage (null bytes, high bytes)
 *     • Unbalanced quotes, embedded CR/LF
 *     • Headers without identity columns
 *     • "NaN", "inf", "1e999" numeric tokens
 *     • Impossible dates (2021-02-29, 0000-00-00)
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "covex/errors.hpp"
#include "covex/explorer.hpp"
#include "covex/row_parser.hpp"

using namespace covex;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto records = RowParser::split_records(input);
    const auto report  = RowParser::parse_csv_string(input);

    // Invariant 4
    assert(report.rows.size() + report.rejected.size() == records.size());

    for (const auto& row : report.rows) {
        // Invariant 2
        assert(!row.iso_code.empty());
        assert(!row.location.empty());
        // Invariant 3
        for (const auto& [field, cell] : row.metrics) {
            assert(!cell || std::isfinite(*cell));
        }
    }

    ExplorerTable explorer(report.rows);
    try {
        (void)explorer.init_requested_columns(
            parse_query_params("metric=cases&frequency=daily&smoothing=7&aligned"));
    } catch (const MissingColumnError&) {
        // Inputs without the case or death fields cannot derive columns.
    }

    // Invariant 5
    const Table& t = explorer.table();
    for (const auto& slug : t.column_slugs()) {
        assert(t.column(slug).size() == t.row_count());
    }
    return 0;
}
