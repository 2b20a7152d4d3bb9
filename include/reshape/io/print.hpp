#pragma once

#include <reshape/core/table.hpp>

#include <cstddef>
#include <ostream>
#include <string>

namespace reshape::io {

/// Render one cell: NA for missing, `[a, b]` for a one-column list cell.
[[nodiscard]] auto format_cell(const ColumnEntry& entry, std::size_t row) -> std::string;

/// Print a boxed table, at most `max_rows` rows.
void print_table(const Table& table, std::ostream& out, std::size_t max_rows = 10);

}  // namespace reshape::io
