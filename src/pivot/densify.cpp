#include <reshape/pivot/densify.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <memory>

namespace reshape::pivot {

namespace {

auto invalid_fill(const ScalarValue& fill, std::string_view column, ColumnKind kind) -> Error {
    return Error{.code = ErrorCode::InvalidFill,
                 .message = fmt::format("values_fill {} can't be stored in `{}` ({})",
                                        format_scalar(fill), column, kind_name(kind))};
}

auto is_fractional(const ScalarValue& value) -> bool {
    const auto* v = std::get_if<double>(&value);
    return v != nullptr && (!std::isfinite(*v) || std::trunc(*v) != *v);
}

/// A list column stores a scalar fill as a one-row nested table.
auto as_list_cell(const ScalarValue& fill, const std::string& name) -> ScalarValue {
    if (std::holds_alternative<List>(fill)) {
        return fill;
    }
    auto kind = scalar_kind(fill);
    ColumnEntry entry{.name = name, .column = make_empty(kind.value_or(ColumnKind::Bool))};
    if (!append_scalar(entry, fill)) {
        append_null(entry);
    }
    auto table = std::make_shared<Table>();
    table->push_column(std::move(entry));
    table->bare_rows = 1;
    return List{std::move(table)};
}

}  // namespace

auto fill_compatible(ColumnKind kind, const ScalarValue& fill) -> bool {
    auto fill_kind = scalar_kind(fill);
    if (!fill_kind.has_value()) {
        return true;
    }
    switch (kind) {
        case ColumnKind::Int:
        case ColumnKind::Double:
            return *fill_kind == ColumnKind::Int || *fill_kind == ColumnKind::Double ||
                   *fill_kind == ColumnKind::Bool;
        case ColumnKind::String:
        case ColumnKind::Categorical:
            return *fill_kind == ColumnKind::String;
        case ColumnKind::Bool:
            return *fill_kind == ColumnKind::Bool;
        case ColumnKind::List:
            return true;
    }
    return false;
}

auto resolve_fill(const ValuesFill& fill, const Table& data,
                  std::span<const std::string> values_cols,
                  std::span<const AggregateFn> values_fns)
    -> std::expected<std::vector<ScalarValue>, Error> {
    std::vector<ScalarValue> out(values_cols.size());
    if (const auto* single = std::get_if<ScalarValue>(&fill)) {
        std::fill(out.begin(), out.end(), *single);
    } else if (const auto* mapping = std::get_if<std::map<std::string, ScalarValue>>(&fill)) {
        for (std::size_t i = 0; i < values_cols.size(); ++i) {
            if (auto it = mapping->find(values_cols[i]); it != mapping->end()) {
                out[i] = it->second;
            }
        }
    }

    for (std::size_t i = 0; i < values_cols.size(); ++i) {
        if (i < values_fns.size() && values_fns[i]) {
            continue;
        }
        const auto* entry = data.find_entry(values_cols[i]);
        if (entry == nullptr) {
            continue;
        }
        const auto kind = column_kind(entry->column);
        if (!fill_compatible(kind, out[i])) {
            return std::unexpected(invalid_fill(out[i], values_cols[i], kind));
        }
    }
    return out;
}

auto densify(std::size_t n_rows, ReducedCells reduced, const ScalarValue& fill)
    -> std::expected<ColumnEntry, Error> {
    auto& column = reduced.column;
    if (std::holds_alternative<std::monostate>(fill) ||
        std::find(reduced.present.begin(), reduced.present.end(), false) ==
            reduced.present.end()) {
        return std::move(column);
    }

    const auto kind = column_kind(column.column);
    if (!fill_compatible(kind, fill)) {
        return std::unexpected(invalid_fill(fill, column.name, kind));
    }
    if (kind == ColumnKind::Int && is_fractional(fill)) {
        widen_to_double(column);
    }
    const ScalarValue cell = kind == ColumnKind::List ? as_list_cell(fill, column.name) : fill;

    ColumnEntry out{.name = column.name, .column = make_empty_like(column.column)};
    std::visit([&](auto& col) { col.reserve(n_rows); }, out.column);
    for (std::size_t r = 0; r < n_rows; ++r) {
        if (reduced.present[r]) {
            append_value(out, column, r);
        } else if (!append_scalar(out, cell)) {
            return std::unexpected(invalid_fill(fill, column.name, kind));
        }
    }
    return out;
}

}  // namespace reshape::pivot
