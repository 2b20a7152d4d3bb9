#pragma once

#include <reshape/core/error.hpp>
#include <reshape/core/table.hpp>

#include <expected>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_set>

namespace reshape::io {

struct CsvReadOptions {
    /// Exact cell texts read as missing, e.g. "NA".
    std::unordered_set<std::string> null_tokens = {"NA"};
    /// Read empty cells as missing.
    bool null_if_empty = true;
    /// Columns read as categoricals, levels in first-appearance order.
    std::unordered_set<std::string> categorical_columns;
};

/// Parse "<empty>,NA,null" into null controls.
[[nodiscard]] auto parse_null_spec(std::string_view spec) -> CsvReadOptions;

/// Read a CSV file with a header row.  Each column becomes int64 when every
/// present cell parses as an integer, else double, else text.
[[nodiscard]] auto read_csv(std::string_view path, const CsvReadOptions& options = {})
    -> std::expected<Table, Error>;

/// Write a header row and one line per row.  Missing cells are written as NA.
[[nodiscard]] auto write_csv(const Table& table, std::ostream& out) -> std::expected<void, Error>;

}  // namespace reshape::io
