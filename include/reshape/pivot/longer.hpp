#pragma once

#include <reshape/core/error.hpp>
#include <reshape/core/table.hpp>
#include <reshape/names/repair.hpp>
#include <reshape/pivot/wider.hpp>
#include <reshape/select/selector.hpp>

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace reshape::pivot {

struct LongerSpecOptions {
    /// Columns to stack.
    select::Selector cols = select::everything();
    /// Key columns built from the stacked column names.  An entry ".value"
    /// routes that piece of the name into `.value` instead.
    std::vector<std::string> names_to = {"name"};
    /// Column receiving the cell values when names_to has no ".value".
    std::string values_to = "value";
    /// Stripped from the front of each column name before splitting.
    std::string names_prefix;
    /// Separator splitting a column name into names_to pieces.
    std::optional<std::string> names_sep;
};

struct ReshapeLongOptions {
    /// Drop output rows whose value cells are all missing.
    bool values_drop_na = false;
    names::NameRepair names_repair = names::NameRepair::check_unique();
};

struct PivotLongerOptions {
    select::Selector cols = select::everything();
    std::vector<std::string> names_to = {"name"};
    std::string values_to = "value";
    std::string names_prefix;
    std::optional<std::string> names_sep;
    bool values_drop_na = false;
    names::NameRepair names_repair = names::NameRepair::check_unique();
};

/// One spec row per selected column; key columns are text.
[[nodiscard]] auto build_longer_spec(const Table& data, const LongerSpecOptions& options)
    -> std::expected<Table, Error>;

/// Reshape wide to long following an explicit spec.
///
/// Every column not named in `.name` is an id column.  The output has one
/// row per input row and distinct key tuple.
[[nodiscard]] auto reshape_long(const Table& data, const Table& spec,
                                const ReshapeLongOptions& options = {})
    -> std::expected<PivotResult, Error>;

/// Build the spec with build_longer_spec(), then reshape_long().
[[nodiscard]] auto pivot_longer(const Table& data, const PivotLongerOptions& options = {})
    -> std::expected<PivotResult, Error>;

}  // namespace reshape::pivot
