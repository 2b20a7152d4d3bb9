#pragma once

#include <reshape/core/error.hpp>
#include <reshape/core/table.hpp>
#include <reshape/pivot/aggregate.hpp>

#include <expected>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace reshape::pivot {

/// No fill, one fill for every values column, or one per column name.
using ValuesFill = std::variant<std::monostate, ScalarValue, std::map<std::string, ScalarValue>>;

/// Per-values-column fill; std::monostate means "leave absent cells missing".
///
/// Columns without a values_fn are checked against their source kind here,
/// before any grouping.  Aggregated columns are checked in densify().
[[nodiscard]] auto resolve_fill(const ValuesFill& fill, const Table& data,
                                std::span<const std::string> values_cols,
                                std::span<const AggregateFn> values_fns)
    -> std::expected<std::vector<ScalarValue>, Error>;

/// Whether `fill` can be stored in a column of `kind` (possibly after widening).
[[nodiscard]] auto fill_compatible(ColumnKind kind, const ScalarValue& fill) -> bool;

/// Materialize every output cell of one spec row.
///
/// Absent cells take `fill`, or stay missing when `fill` is std::monostate.
/// Cells that received an input row are never touched, even when that row
/// held a missing value.
[[nodiscard]] auto densify(std::size_t n_rows, ReducedCells reduced, const ScalarValue& fill)
    -> std::expected<ColumnEntry, Error>;

}  // namespace reshape::pivot
