#include <reshape/expand/expand.hpp>

#include <fmt/format.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>

namespace reshape::expand {

namespace {

using KeyIndex = robin_hood::unordered_flat_map<RowKey, std::size_t, RowKeyHash, RowKeyEq>;

auto as_table(const GridInput& input) -> Table {
    if (const auto* table = std::get_if<Table>(&input)) {
        Table out = *table;
        out.groups.reset();
        return out;
    }
    Table out;
    const auto& entry = std::get<ColumnEntry>(input);
    out.push_column(entry);
    out.bare_rows = column_size(entry.column);
    return out;
}

auto pointers(const Table& table) -> std::vector<const ColumnEntry*> {
    std::vector<const ColumnEntry*> out;
    out.reserve(table.columns.size());
    for (const auto& entry : table.columns) {
        out.push_back(&entry);
    }
    return out;
}

/// Distinct rows in ascending order, nulls last.
auto distinct_sorted(const Table& table) -> Table {
    const auto columns = pointers(table);
    KeyIndex seen;
    std::vector<std::size_t> rows;
    for (std::size_t row = 0; row < table.rows(); ++row) {
        if (seen.try_emplace(row_key(columns, row), row).second) {
            rows.push_back(row);
        }
    }
    std::stable_sort(rows.begin(), rows.end(), [&](std::size_t lhs, std::size_t rhs) {
        return compare_rows(columns, lhs, rhs) < 0;
    });
    auto out = take_rows(table, rows);
    out.groups.reset();
    return out;
}

/// Every level of a factor in level order, then a missing cell if one occurs.
auto all_levels(const ColumnEntry& entry) -> ColumnEntry {
    const auto& factor = std::get<Column<Categorical>>(entry.column);
    std::vector<Column<Categorical>::code_type> codes(factor.levels().size());
    std::iota(codes.begin(), codes.end(), 0);
    ColumnEntry out{.name = entry.name,
                    .column = Column<Categorical>{factor.levels(), std::move(codes),
                                                  factor.is_ordered()}};
    const bool any_null = entry.validity.has_value() &&
                          std::find(entry.validity->begin(), entry.validity->end(), false) !=
                              entry.validity->end();
    if (any_null) {
        append_null(out);
    }
    return out;
}

auto repair_names(Table& table, const names::NameRepair& repair) -> std::expected<void, Error> {
    auto after = names::repair(table.names(), repair);
    if (!after) {
        return std::unexpected(after.error());
    }
    for (std::size_t c = 0; c < table.columns.size(); ++c) {
        table.columns[c].name = (*after)[c];
    }
    table.reindex();
    return {};
}

auto crossing_inputs(const Table& data, std::span<const ExpandArg> args,
                     std::span<const std::size_t> skip) -> std::expected<std::vector<GridInput>, Error> {
    std::vector<GridInput> inputs;
    for (const auto& arg : args) {
        if (const auto* selector = std::get_if<select::Selector>(&arg)) {
            auto positions = select::resolve(data, *selector);
            if (!positions) {
                return std::unexpected(positions.error());
            }
            for (auto pos : *positions) {
                if (std::find(skip.begin(), skip.end(), pos) == skip.end()) {
                    inputs.emplace_back(data.columns[pos]);
                }
            }
        } else if (const auto* nested = std::get_if<Nesting>(&arg)) {
            auto positions = select::resolve(data, nested->cols);
            if (!positions) {
                return std::unexpected(positions.error());
            }
            Table combos;
            for (auto pos : *positions) {
                if (std::find(skip.begin(), skip.end(), pos) == skip.end()) {
                    combos.push_column(data.columns[pos]);
                }
            }
            combos.bare_rows = data.rows();
            if (!combos.columns.empty()) {
                inputs.emplace_back(std::move(combos));
            }
        } else {
            inputs.emplace_back(std::get<ColumnEntry>(arg));
        }
    }
    return inputs;
}

}  // namespace

auto expand_grid(std::span<const GridInput> inputs, const names::NameRepair& repair)
    -> std::expected<Table, Error> {
    std::vector<Table> parts;
    parts.reserve(inputs.size());
    std::size_t total = 1;
    for (const auto& input : inputs) {
        parts.push_back(as_table(input));
        total *= parts.back().rows();
    }

    Table out;
    std::size_t inner = total;
    for (const auto& part : parts) {
        const std::size_t n = part.rows();
        inner = n == 0 ? 0 : inner / n;
        std::vector<std::size_t> rows(total);
        for (std::size_t r = 0; r < total; ++r) {
            rows[r] = (r / inner) % n;
        }
        for (const auto& entry : part.columns) {
            out.push_column(take(entry, rows));
        }
    }
    out.bare_rows = total;

    auto repaired = repair_names(out, repair);
    if (!repaired) {
        return std::unexpected(repaired.error());
    }
    spdlog::debug("expand_grid: {} inputs -> {} rows", inputs.size(), total);
    return out;
}

auto crossing(std::span<const GridInput> inputs, const names::NameRepair& repair)
    -> std::expected<Table, Error> {
    std::vector<GridInput> distinct;
    distinct.reserve(inputs.size());
    for (const auto& input : inputs) {
        if (const auto* entry = std::get_if<ColumnEntry>(&input);
            entry != nullptr && std::holds_alternative<Column<Categorical>>(entry->column)) {
            distinct.emplace_back(all_levels(*entry));
        } else {
            distinct.emplace_back(distinct_sorted(as_table(input)));
        }
    }
    return expand_grid(distinct, repair);
}

auto nesting(std::span<const GridInput> inputs, const names::NameRepair& repair)
    -> std::expected<Table, Error> {
    Table bound;
    std::optional<std::size_t> n_rows;
    for (const auto& input : inputs) {
        auto part = as_table(input);
        if (n_rows.has_value() && *n_rows != part.rows()) {
            return std::unexpected(
                Error{.code = ErrorCode::LengthMismatch,
                      .message = fmt::format("nesting() inputs must have the same length; got {} "
                                             "and {} rows",
                                             *n_rows, part.rows())});
        }
        n_rows = part.rows();
        for (auto& entry : part.columns) {
            bound.push_column(std::move(entry));
        }
    }
    bound.bare_rows = n_rows.value_or(0);

    auto out = distinct_sorted(bound);
    auto repaired = repair_names(out, repair);
    if (!repaired) {
        return std::unexpected(repaired.error());
    }
    return out;
}

auto expand(const Table& data, std::span<const ExpandArg> args, const names::NameRepair& repair)
    -> std::expected<Table, Error> {
    if (!data.groups.has_value() || data.groups->empty()) {
        auto inputs = crossing_inputs(data, args, {});
        if (!inputs) {
            return std::unexpected(inputs.error());
        }
        return crossing(*inputs, repair);
    }

    std::vector<std::size_t> group_cols;
    for (const auto& group : *data.groups) {
        auto pos = data.position(group);
        if (!pos.has_value()) {
            return std::unexpected(
                Error{.code = ErrorCode::ColumnNotFound,
                      .message = fmt::format("group column `{}` not found in data", group)});
        }
        group_cols.push_back(*pos);
    }

    // Rows of each group, groups in ascending key order.
    std::vector<const ColumnEntry*> keys;
    for (auto pos : group_cols) {
        keys.push_back(&data.columns[pos]);
    }
    KeyIndex group_index;
    std::vector<std::vector<std::size_t>> members;
    for (std::size_t row = 0; row < data.rows(); ++row) {
        auto [it, inserted] = group_index.try_emplace(row_key(keys, row), members.size());
        if (inserted) {
            members.emplace_back();
        }
        members[it->second].push_back(row);
    }
    std::sort(members.begin(), members.end(), [&](const auto& lhs, const auto& rhs) {
        return compare_rows(keys, lhs.front(), rhs.front()) < 0;
    });

    auto assemble_group = [&](const Table& slice, std::size_t key_row,
                              bool empty) -> std::expected<Table, Error> {
        auto inputs = crossing_inputs(slice, args, group_cols);
        if (!inputs) {
            return std::unexpected(inputs.error());
        }
        auto grid = crossing(*inputs, names::NameRepair::minimal());
        if (!grid) {
            return std::unexpected(grid.error());
        }
        const std::size_t n = empty ? 0 : grid->rows();
        std::vector<std::size_t> repeat(n, key_row);
        Table out;
        for (auto pos : group_cols) {
            out.push_column(take(data.columns[pos], repeat));
        }
        std::vector<std::size_t> all(n);
        std::iota(all.begin(), all.end(), std::size_t{0});
        for (const auto& entry : grid->columns) {
            out.push_column(take(entry, all));
        }
        out.bare_rows = n;
        return out;
    };

    std::vector<Table> parts;
    if (members.empty()) {
        auto part = assemble_group(data, 0, true);
        if (!part) {
            return std::unexpected(part.error());
        }
        parts.push_back(std::move(*part));
    }
    for (const auto& rows : members) {
        auto slice = take_rows(data, rows);
        auto part = assemble_group(slice, rows.front(), false);
        if (!part) {
            return std::unexpected(part.error());
        }
        parts.push_back(std::move(*part));
    }

    auto out = concat_rows(parts);
    auto repaired = repair_names(out, repair);
    if (!repaired) {
        return std::unexpected(repaired.error());
    }
    out.groups = data.groups;
    spdlog::debug("expand: {} groups -> {} rows", members.size(), out.rows());
    return out;
}

}  // namespace reshape::expand
