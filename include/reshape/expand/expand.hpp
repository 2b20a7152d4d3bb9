#pragma once

#include <reshape/core/error.hpp>
#include <reshape/core/table.hpp>
#include <reshape/names/repair.hpp>
#include <reshape/select/selector.hpp>

#include <expected>
#include <span>
#include <variant>

namespace reshape::expand {

/// A named vector, or a table whose columns are spliced into the result.
using GridInput = std::variant<ColumnEntry, Table>;

/// Only the combinations of these columns that occur in the data.
struct Nesting {
    select::Selector cols;
};

/// Argument to expand(): every selected column crossed on its own, the
/// observed combinations of a column set, or a literal vector.
using ExpandArg = std::variant<select::Selector, Nesting, ColumnEntry>;

/// Cartesian product; the first input varies slowest.
///
/// No inputs gives one row and no columns.  A zero-length input gives zero
/// rows that keep every column's type.
[[nodiscard]] auto expand_grid(std::span<const GridInput> inputs,
                               const names::NameRepair& repair = names::NameRepair::check_unique())
    -> std::expected<Table, Error>;

/// expand_grid() over the sorted distinct values of each input.  A
/// categorical vector contributes all of its levels.
[[nodiscard]] auto crossing(std::span<const GridInput> inputs,
                            const names::NameRepair& repair = names::NameRepair::check_unique())
    -> std::expected<Table, Error>;

/// Sorted distinct rows of the inputs bound side by side.
[[nodiscard]] auto nesting(std::span<const GridInput> inputs,
                           const names::NameRepair& repair = names::NameRepair::check_unique())
    -> std::expected<Table, Error>;

/// Every combination of the arguments, per group when `data` is grouped.
[[nodiscard]] auto expand(const Table& data, std::span<const ExpandArg> args,
                          const names::NameRepair& repair = names::NameRepair::check_unique())
    -> std::expected<Table, Error>;

}  // namespace reshape::expand
