#pragma once

#include <reshape/core/error.hpp>
#include <reshape/core/table.hpp>
#include <reshape/names/repair.hpp>
#include <reshape/pivot/aggregate.hpp>
#include <reshape/pivot/densify.hpp>
#include <reshape/select/selector.hpp>

#include <expected>
#include <optional>
#include <string>

namespace reshape::pivot {

/// A reshaped table and the warnings raised while building it.
struct PivotResult {
    Table table;
    Diagnostics diagnostics;
};

struct ReshapeWideOptions {
    /// Identifier columns; defaults to every column the spec does not use.
    std::optional<select::Selector> id_cols;
    names::NameRepair names_repair = names::NameRepair::check_unique();
    ValuesFill values_fill;
    ValuesFn values_fn;
};

struct PivotWiderOptions {
    /// Identifier columns; defaults to everything but names_from and values_from.
    std::optional<select::Selector> id_cols;
    std::optional<select::Selector> names_from;
    std::optional<select::Selector> values_from;
    std::string names_prefix;
    std::string names_sep = "_";
    std::optional<std::string> names_glue;
    bool names_sort = false;
    names::NameRepair names_repair = names::NameRepair::check_unique();
    ValuesFill values_fill;
    ValuesFn values_fn;
};

/// Reshape long to wide following an explicit spec.
///
/// Every error is detected before rows are grouped, so a failed call never
/// yields a partial table.
[[nodiscard]] auto reshape_wide(const Table& data, const Table& spec,
                                const ReshapeWideOptions& options = {})
    -> std::expected<PivotResult, Error>;

/// Build the spec from column selectors, then reshape_wide().
[[nodiscard]] auto pivot_wider(const Table& data, const PivotWiderOptions& options = {})
    -> std::expected<PivotResult, Error>;

}  // namespace reshape::pivot
