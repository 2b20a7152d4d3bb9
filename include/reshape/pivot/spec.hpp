#pragma once

#include <reshape/core/error.hpp>
#include <reshape/core/table.hpp>
#include <reshape/names/repair.hpp>
#include <reshape/select/selector.hpp>

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace reshape::pivot {

/// Destination column name of each spec row.
inline constexpr std::string_view kNameColumn = ".name";
/// Source values-column of each spec row.
inline constexpr std::string_view kValueColumn = ".value";

struct WiderSpecOptions {
    /// Columns whose values become output column names; defaults to `name`.
    std::optional<select::Selector> names_from;
    /// Columns whose values fill the output cells; defaults to `value`.
    std::optional<select::Selector> values_from;
    std::string names_prefix;
    std::string names_sep = "_";
    /// Template such as "{.value}_{key}"; replaces the synthesized name.
    std::optional<std::string> names_glue;
    /// Order combinations ascending instead of by first appearance.
    bool names_sort = false;
    names::NameRepair names_repair = names::NameRepair::check_unique();
};

/// Build a pivot spec from the distinct combinations of the names columns.
[[nodiscard]] auto build_wider_spec(const Table& data, const WiderSpecOptions& options = {})
    -> std::expected<Table, Error>;

/// Build a pivot spec from already-resolved column positions.
///
/// `names_cols` may be empty, in which case every values column maps to an
/// output column of the same name.  The selectors in `options` are ignored.
[[nodiscard]] auto build_wider_spec_at(const Table& data, std::span<const std::size_t> names_cols,
                                       std::span<const std::size_t> values_cols,
                                       const WiderSpecOptions& options)
    -> std::expected<Table, Error>;

/// Validate a spec and return it with `.name` and `.value` leading.
[[nodiscard]] auto check_spec(const Table& spec) -> std::expected<Table, Error>;

/// Names of the key columns of a checked spec (everything after `.name`, `.value`).
[[nodiscard]] auto spec_key_names(const Table& spec) -> std::vector<std::string>;

/// Text column of a checked spec as plain strings (`.name` or `.value`).
[[nodiscard]] auto spec_strings(const Table& spec, std::string_view column)
    -> std::vector<std::string>;

/// Expand a glue template against one spec row.
[[nodiscard]] auto render_glue(std::string_view glue, const Table& spec, std::size_t row)
    -> std::expected<std::string, Error>;

}  // namespace reshape::pivot
