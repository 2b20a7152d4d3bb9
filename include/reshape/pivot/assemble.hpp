#pragma once

#include <reshape/core/error.hpp>
#include <reshape/core/table.hpp>
#include <reshape/names/repair.hpp>

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace reshape::pivot {

struct Assembled {
    Table table;
    Diagnostics diagnostics;
};

/// Build the wide output: id columns gathered at `representative`, then
/// `value_columns` in spec order under `spec_names`.
///
/// Name repair runs over the whole final name sequence.  `groups` is copied
/// onto the output, following any rename of a group column.
[[nodiscard]] auto assemble(const Table& data, std::span<const std::size_t> id_cols,
                            std::span<const std::size_t> representative,
                            std::span<const std::string> spec_names,
                            std::vector<ColumnEntry> value_columns,
                            const names::NameRepair& repair,
                            const std::optional<std::vector<std::string>>& groups)
    -> std::expected<Assembled, Error>;

}  // namespace reshape::pivot
