#pragma once

#include <reshape/core/error.hpp>
#include <reshape/core/table.hpp>
#include <reshape/pivot/key_grouper.hpp>

#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace reshape::pivot {

/// Reduce the values of one output cell to a single scalar.
using AggregateFn = std::function<std::expected<ScalarValue, std::string>(const ColumnEntry& group)>;

/// No function, one function for every values column, or one per column name.
using ValuesFn = std::variant<std::monostate, AggregateFn, std::map<std::string, AggregateFn>>;

/// Per-values-column function; an empty std::function means "no function".
[[nodiscard]] auto resolve_values_fn(const ValuesFn& values_fn,
                                     std::span<const std::string> values_cols)
    -> std::expected<std::vector<AggregateFn>, Error>;

/// Output cells of one spec row before densification.
///
/// `column` has one cell per output row; cells with `present[r] == false`
/// received no input row and hold a null placeholder.
struct ReducedCells {
    ColumnEntry column;
    std::vector<bool> present;
};

/// Reduce the cells of one spec row.
///
/// Without `fn`, values pass through unchanged unless some cell holds more
/// than one row, in which case the whole column becomes a list column and a
/// DuplicateKeys diagnostic is appended.
[[nodiscard]] auto reduce(const Table& data, const SpecCells& cells, std::size_t n_rows,
                          const AggregateFn& fn, std::string_view output_name,
                          Diagnostics& diagnostics) -> std::expected<ReducedCells, Error>;

}  // namespace reshape::pivot

namespace reshape::agg {

using Result = std::expected<ScalarValue, std::string>;

// ─── Built-in aggregations ────────────────────────────────────────────────────
// sum/mean/min/max return NA when the group holds a missing value.

[[nodiscard]] auto sum(const ColumnEntry& group) -> Result;
[[nodiscard]] auto mean(const ColumnEntry& group) -> Result;
[[nodiscard]] auto min(const ColumnEntry& group) -> Result;
[[nodiscard]] auto max(const ColumnEntry& group) -> Result;
/// Number of rows, missing ones included.
[[nodiscard]] auto count(const ColumnEntry& group) -> Result;
[[nodiscard]] auto first(const ColumnEntry& group) -> Result;
[[nodiscard]] auto last(const ColumnEntry& group) -> Result;
/// The group itself as a one-column nested table.
[[nodiscard]] auto list(const ColumnEntry& group) -> Result;

/// Look up a built-in by name ("sum", "mean", ...).
[[nodiscard]] auto by_name(std::string_view name) -> std::optional<pivot::AggregateFn>;

}  // namespace reshape::agg
