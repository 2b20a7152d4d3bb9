#include <reshape/pivot/key_grouper.hpp>
#include <reshape/pivot/spec.hpp>
#include <reshape/select/selector.hpp>

#include <fmt/format.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>
#include <utility>

namespace reshape::pivot {

namespace {

using KeyIndex = robin_hood::unordered_flat_map<RowKey, std::size_t, RowKeyHash, RowKeyEq>;

auto is_numeric(ColumnKind kind) -> bool {
    return kind == ColumnKind::Int || kind == ColumnKind::Double;
}

auto is_textual(ColumnKind kind) -> bool {
    return kind == ColumnKind::String || kind == ColumnKind::Categorical;
}

/// Whether key cells of the two kinds can be compared, and if so whether
/// both sides must be read as double.
auto key_compatible(ColumnKind spec_kind, ColumnKind data_kind, bool& as_double) -> bool {
    as_double = false;
    if (spec_kind == data_kind) {
        return true;
    }
    if (is_numeric(spec_kind) && is_numeric(data_kind)) {
        as_double = true;
        return true;
    }
    return is_textual(spec_kind) && is_textual(data_kind);
}

void promote(RowKey& key, const std::vector<bool>& as_double) {
    for (std::size_t i = 0; i < key.values.size(); ++i) {
        if (!as_double[i]) {
            continue;
        }
        if (const auto* v = std::get_if<std::int64_t>(&key.values[i])) {
            key.values[i] = static_cast<double>(*v);
        }
    }
}

/// Output row of every input row, plus the representative input row of each
/// output row, in first-appearance order (group-major when grouped).
void assign_output_rows(const Table& data, std::span<const std::size_t> id_cols,
                        std::size_t n_group_cols, std::vector<std::size_t>& out_row_of,
                        std::vector<std::size_t>& representative) {
    const std::size_t n = data.rows();
    out_row_of.assign(n, 0);
    representative.clear();
    if (id_cols.empty()) {
        if (n > 0) {
            representative.push_back(0);
        }
        return;
    }

    std::vector<const ColumnEntry*> id_columns;
    id_columns.reserve(id_cols.size());
    for (auto pos : id_cols) {
        id_columns.push_back(&data.columns[pos]);
    }
    KeyIndex ids;
    ids.reserve(n);
    for (std::size_t row = 0; row < n; ++row) {
        auto [it, inserted] = ids.try_emplace(row_key(id_columns, row), representative.size());
        if (inserted) {
            representative.push_back(row);
        }
        out_row_of[row] = it->second;
    }
    if (n_group_cols == 0) {
        return;
    }

    // Reorder first-appearance ids so that every group is contiguous.
    std::span<const ColumnEntry* const> group_columns(id_columns.data(), n_group_cols);
    KeyIndex groups;
    std::vector<std::size_t> group_of(representative.size());
    for (std::size_t i = 0; i < representative.size(); ++i) {
        auto [it, inserted] =
            groups.try_emplace(row_key(group_columns, representative[i]), groups.size());
        group_of[i] = it->second;
    }
    std::vector<std::size_t> order(representative.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) {
        return group_of[lhs] < group_of[rhs];
    });
    std::vector<std::size_t> rank(order.size());
    std::vector<std::size_t> reordered(order.size());
    for (std::size_t i = 0; i < order.size(); ++i) {
        rank[order[i]] = i;
        reordered[i] = representative[order[i]];
    }
    representative = std::move(reordered);
    for (auto& out_row : out_row_of) {
        out_row = rank[out_row];
    }
}

}  // namespace

auto group_cells(const Table& data, std::span<const std::size_t> id_cols, std::size_t n_group_cols,
                 const Table& spec) -> std::expected<CellGroups, Error> {
    const auto key_names = spec_key_names(spec);
    const auto value_names = spec_strings(spec, kValueColumn);

    // Resolve the spec key columns against the data.
    std::vector<const ColumnEntry*> data_keys;
    std::vector<const ColumnEntry*> spec_keys;
    std::vector<bool> as_double;
    for (std::size_t k = 0; k < key_names.size(); ++k) {
        const auto* data_entry = data.find_entry(key_names[k]);
        if (data_entry == nullptr) {
            return std::unexpected(
                Error{.code = ErrorCode::ColumnNotFound,
                      .message = fmt::format("spec key column `{}` not found in data (available: {})",
                                             key_names[k], select::format_columns(data))});
        }
        const auto& spec_entry = spec.columns[k + 2];
        const auto spec_kind = column_kind(spec_entry.column);
        const auto data_kind = column_kind(data_entry->column);
        bool widen = false;
        if (!key_compatible(spec_kind, data_kind, widen)) {
            return std::unexpected(Error{
                .code = ErrorCode::TypeMismatch,
                .message = fmt::format("spec key column `{}` is {} but the data column is {}",
                                       key_names[k], kind_name(spec_kind), kind_name(data_kind))});
        }
        data_keys.push_back(data_entry);
        spec_keys.push_back(&spec_entry);
        as_double.push_back(widen);
    }

    CellGroups groups;
    groups.cells.resize(spec.rows());

    // Distinct key tuples of the spec, each mapping to its spec rows.
    KeyIndex key_slots;
    std::vector<std::vector<std::size_t>> slot_rows;
    for (std::size_t s = 0; s < spec.rows(); ++s) {
        auto pos = data.position(value_names[s]);
        if (!pos.has_value()) {
            return std::unexpected(
                Error{.code = ErrorCode::ColumnNotFound,
                      .message = fmt::format("spec `.value` column `{}` not found in data "
                                             "(available: {})",
                                             value_names[s], select::format_columns(data))});
        }
        groups.cells[s].source = *pos;
        auto key = row_key(spec_keys, s);
        promote(key, as_double);
        auto [it, inserted] = key_slots.try_emplace(std::move(key), slot_rows.size());
        if (inserted) {
            slot_rows.emplace_back();
        }
        slot_rows[it->second].push_back(s);
    }

    std::vector<std::size_t> out_row_of;
    assign_output_rows(data, id_cols, n_group_cols, out_row_of, groups.representative);
    groups.n_rows = groups.representative.size();

    // Bucket (output row, input row) pairs per spec row, then lay them out
    // as CSR with a stable counting pass.
    std::vector<std::vector<std::pair<std::size_t, std::size_t>>> placed(spec.rows());
    std::size_t unmatched = 0;
    for (std::size_t row = 0; row < data.rows(); ++row) {
        auto key = row_key(data_keys, row);
        promote(key, as_double);
        auto it = key_slots.find(key);
        if (it == key_slots.end()) {
            ++unmatched;
            continue;
        }
        for (auto s : slot_rows[it->second]) {
            placed[s].emplace_back(out_row_of[row], row);
        }
    }

    for (std::size_t s = 0; s < spec.rows(); ++s) {
        auto& cells = groups.cells[s];
        cells.offsets.assign(groups.n_rows + 1, 0);
        for (const auto& [out_row, row] : placed[s]) {
            ++cells.offsets[out_row + 1];
        }
        for (std::size_t r = 0; r < groups.n_rows; ++r) {
            cells.duplicated = cells.duplicated || cells.offsets[r + 1] > 1;
            cells.offsets[r + 1] += cells.offsets[r];
        }
        cells.rows.resize(placed[s].size());
        std::vector<std::size_t> cursor(cells.offsets.begin(), cells.offsets.end() - 1);
        for (const auto& [out_row, row] : placed[s]) {
            cells.rows[cursor[out_row]++] = row;
        }
    }

    spdlog::debug("group_cells: {} input rows -> {} output rows, {} spec rows, {} unmatched",
                  data.rows(), groups.n_rows, spec.rows(), unmatched);
    return groups;
}

}  // namespace reshape::pivot
