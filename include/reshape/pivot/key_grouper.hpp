#pragma once

#include <reshape/core/error.hpp>
#include <reshape/core/table.hpp>

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace reshape::pivot {

/// Input rows feeding each output cell of one spec row, in CSR layout.
///
/// The rows of output row `r` are `rows[offsets[r] .. offsets[r + 1])`, in
/// input order.
struct SpecCells {
    std::vector<std::size_t> offsets;
    std::vector<std::size_t> rows;
    /// Position of the `.value` source column in the input table.
    std::size_t source = 0;
    /// True when some output row collects more than one input row.
    bool duplicated = false;

    [[nodiscard]] auto count(std::size_t out_row) const -> std::size_t {
        return offsets[out_row + 1] - offsets[out_row];
    }
    [[nodiscard]] auto cell(std::size_t out_row) const -> std::span<const std::size_t> {
        return std::span<const std::size_t>(rows).subspan(offsets[out_row], count(out_row));
    }
};

struct CellGroups {
    std::size_t n_rows = 0;
    /// First input row of each output row; the id columns are gathered from it.
    std::vector<std::size_t> representative;
    /// One entry per spec row.
    std::vector<SpecCells> cells;
};

/// Assign input rows to (output row, spec row) cells.
///
/// `id_cols` are positions in `data`; the first `n_group_cols` of them are
/// group-key columns and make the output row order group-major.  `spec` must
/// already be checked.
[[nodiscard]] auto group_cells(const Table& data, std::span<const std::size_t> id_cols,
                               std::size_t n_group_cols, const Table& spec)
    -> std::expected<CellGroups, Error>;

}  // namespace reshape::pivot
