#include <reshape/core/table.hpp>

#include <fmt/format.h>

#include <cmath>
#include <functional>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace reshape {

namespace {

void push_validity(ColumnEntry& entry, std::size_t before, bool valid) {
    if (!entry.validity.has_value()) {
        if (valid) {
            return;
        }
        entry.validity.emplace(before, true);
    }
    entry.validity->push_back(valid);
}

void push_placeholder(ColumnValue& column) {
    std::visit(
        [](auto& col) {
            using ColType = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColType, Column<Categorical>>) {
                col.push_code(0);
            } else {
                col.push_back(typename ColType::value_type{});
            }
        },
        column);
}

auto integral_double(double value) -> std::optional<std::int64_t> {
    if (!std::isfinite(value) || std::trunc(value) != value) {
        return std::nullopt;
    }
    if (value < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
        value >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
}

auto to_weak(std::strong_ordering order) -> std::weak_ordering {
    if (order < 0) {
        return std::weak_ordering::less;
    }
    if (order > 0) {
        return std::weak_ordering::greater;
    }
    return std::weak_ordering::equivalent;
}

auto hash_scalar(const ScalarValue& value) -> std::size_t {
    return std::visit(
        [](const auto& v) -> std::size_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return 0x6d697373696e67ULL;
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v)) {
                    return 0x7ff8000000000000ULL;
                }
                double normalized = v == 0.0 ? 0.0 : v;
                return std::hash<double>{}(normalized);
            } else if constexpr (std::is_same_v<T, List>) {
                return std::hash<const Table*>{}(v.table.get());
            } else {
                return std::hash<T>{}(v);
            }
        },
        value);
}

auto same_cell(const ScalarValue& a, const ScalarValue& b) -> bool {
    if (const auto* da = std::get_if<double>(&a)) {
        if (const auto* db = std::get_if<double>(&b)) {
            if (std::isnan(*da) && std::isnan(*db)) {
                return true;
            }
        }
    }
    return a == b;
}

}  // namespace

void Table::add_column(std::string name, ColumnValue column) {
    if (auto it = index.find(name); it != index.end()) {
        columns[it->second].column = std::move(column);
        columns[it->second].validity.reset();
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name), .column = std::move(column)});
    index[columns.back().name] = pos;
}

void Table::add_column(std::string name, ColumnValue column, std::vector<bool> validity) {
    add_column(name, std::move(column));
    columns[index.at(name)].validity = std::move(validity);
}

void Table::push_column(ColumnEntry entry) {
    std::size_t pos = columns.size();
    columns.push_back(std::move(entry));
    index.emplace(columns.back().name, pos);
}

void Table::reindex() {
    index.clear();
    for (std::size_t i = 0; i < columns.size(); ++i) {
        index.emplace(columns[i].name, i);
    }
}

auto Table::find(const std::string& name) -> ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second].column;
    }
    return nullptr;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second].column;
    }
    return nullptr;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::position(const std::string& name) const -> std::optional<std::size_t> {
    if (auto it = index.find(name); it != index.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto Table::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(columns.size());
    for (const auto& entry : columns) {
        out.push_back(entry.name);
    }
    return out;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return bare_rows;
    }
    return column_size(columns.front().column);
}

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto column_kind(const ColumnValue& column) -> ColumnKind {
    return std::visit(
        [](const auto& col) -> ColumnKind {
            using ColType = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColType, Column<std::int64_t>>) {
                return ColumnKind::Int;
            } else if constexpr (std::is_same_v<ColType, Column<double>>) {
                return ColumnKind::Double;
            } else if constexpr (std::is_same_v<ColType, Column<std::string>>) {
                return ColumnKind::String;
            } else if constexpr (std::is_same_v<ColType, Column<bool>>) {
                return ColumnKind::Bool;
            } else if constexpr (std::is_same_v<ColType, Column<Categorical>>) {
                return ColumnKind::Categorical;
            } else {
                return ColumnKind::List;
            }
        },
        column);
}

auto kind_name(ColumnKind kind) -> std::string_view {
    switch (kind) {
        case ColumnKind::Int:
            return "int";
        case ColumnKind::Double:
            return "double";
        case ColumnKind::String:
            return "string";
        case ColumnKind::Bool:
            return "bool";
        case ColumnKind::Categorical:
            return "categorical";
        case ColumnKind::List:
            return "list";
    }
    return "unknown";
}

auto scalar_kind(const ScalarValue& value) -> std::optional<ColumnKind> {
    return std::visit(
        [](const auto& v) -> std::optional<ColumnKind> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::int64_t>) {
                return ColumnKind::Int;
            } else if constexpr (std::is_same_v<T, double>) {
                return ColumnKind::Double;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return ColumnKind::String;
            } else if constexpr (std::is_same_v<T, bool>) {
                return ColumnKind::Bool;
            } else if constexpr (std::is_same_v<T, List>) {
                return ColumnKind::List;
            } else {
                return std::nullopt;
            }
        },
        value);
}

auto make_empty_like(const ColumnValue& column) -> ColumnValue {
    return std::visit(
        [](const auto& col) -> ColumnValue {
            using ColType = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColType, Column<Categorical>>) {
                return col.empty_like();
            } else {
                return ColType{};
            }
        },
        column);
}

auto make_empty(ColumnKind kind) -> ColumnValue {
    switch (kind) {
        case ColumnKind::Int:
            return Column<std::int64_t>{};
        case ColumnKind::Double:
            return Column<double>{};
        case ColumnKind::String:
            return Column<std::string>{};
        case ColumnKind::Bool:
            return Column<bool>{};
        case ColumnKind::Categorical:
            return Column<Categorical>{};
        case ColumnKind::List:
            return Column<List>{};
    }
    return Column<std::int64_t>{};
}

auto scalar_at(const ColumnEntry& entry, std::size_t row) -> ScalarValue {
    if (is_null(entry, row)) {
        return std::monostate{};
    }
    return std::visit(
        [row](const auto& col) -> ScalarValue {
            using ColType = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColType, Column<Categorical>>) {
                return std::string(col[row]);
            } else if constexpr (std::is_same_v<ColType, Column<bool>>) {
                return static_cast<bool>(col[row]);
            } else {
                return col[row];
            }
        },
        entry.column);
}

void append_value(ColumnEntry& out, const ColumnEntry& src, std::size_t row) {
    const std::size_t before = column_size(out.column);
    const bool valid = !is_null(src, row);
    std::visit(
        [&](auto& dst_col) {
            using ColType = std::decay_t<decltype(dst_col)>;
            const auto* src_col = std::get_if<ColType>(&src.column);
            if (src_col == nullptr) {
                throw std::logic_error("append_value: column type mismatch");
            }
            if constexpr (std::is_same_v<ColType, Column<Categorical>>) {
                if (valid) {
                    dst_col.push_back((*src_col)[row]);
                } else {
                    dst_col.push_code(0);
                }
            } else {
                dst_col.push_back((*src_col)[row]);
            }
        },
        out.column);
    push_validity(out, before, valid);
}

void append_null(ColumnEntry& out) {
    const std::size_t before = column_size(out.column);
    push_placeholder(out.column);
    push_validity(out, before, false);
}

auto append_scalar(ColumnEntry& out, const ScalarValue& value) -> bool {
    if (std::holds_alternative<std::monostate>(value)) {
        append_null(out);
        return true;
    }
    const std::size_t before = column_size(out.column);
    const bool stored = std::visit(
        [&](auto& col) -> bool {
            using ColType = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColType, Column<std::int64_t>>) {
                if (const auto* v = std::get_if<std::int64_t>(&value)) {
                    col.push_back(*v);
                    return true;
                }
                if (const auto* v = std::get_if<double>(&value)) {
                    if (auto whole = integral_double(*v)) {
                        col.push_back(*whole);
                        return true;
                    }
                    return false;
                }
                if (const auto* v = std::get_if<bool>(&value)) {
                    col.push_back(*v ? 1 : 0);
                    return true;
                }
                return false;
            } else if constexpr (std::is_same_v<ColType, Column<double>>) {
                if (const auto* v = std::get_if<double>(&value)) {
                    col.push_back(*v);
                    return true;
                }
                if (const auto* v = std::get_if<std::int64_t>(&value)) {
                    col.push_back(static_cast<double>(*v));
                    return true;
                }
                if (const auto* v = std::get_if<bool>(&value)) {
                    col.push_back(*v ? 1.0 : 0.0);
                    return true;
                }
                return false;
            } else if constexpr (std::is_same_v<ColType, Column<std::string>>) {
                if (const auto* v = std::get_if<std::string>(&value)) {
                    col.push_back(*v);
                    return true;
                }
                return false;
            } else if constexpr (std::is_same_v<ColType, Column<bool>>) {
                if (const auto* v = std::get_if<bool>(&value)) {
                    col.push_back(*v);
                    return true;
                }
                return false;
            } else if constexpr (std::is_same_v<ColType, Column<Categorical>>) {
                if (const auto* v = std::get_if<std::string>(&value)) {
                    col.push_back(*v);
                    return true;
                }
                return false;
            } else {
                if (const auto* v = std::get_if<List>(&value)) {
                    col.push_back(*v);
                    return true;
                }
                return false;
            }
        },
        out.column);
    if (stored) {
        push_validity(out, before, true);
    }
    return stored;
}

auto take(const ColumnEntry& src, std::span<const std::size_t> rows) -> ColumnEntry {
    ColumnEntry out{.name = src.name,
                    .column = std::visit([&](const auto& col) -> ColumnValue { return col.take(rows); },
                                         src.column)};
    if (src.validity.has_value()) {
        std::vector<bool> validity;
        validity.reserve(rows.size());
        bool any_null = false;
        for (auto row : rows) {
            bool valid = (*src.validity)[row];
            any_null = any_null || !valid;
            validity.push_back(valid);
        }
        if (any_null) {
            out.validity = std::move(validity);
        }
    }
    return out;
}

auto take(const ColumnEntry& src, std::span<const std::optional<std::size_t>> rows)
    -> ColumnEntry {
    ColumnEntry out{.name = src.name, .column = make_empty_like(src.column)};
    std::visit([&](auto& col) { col.reserve(rows.size()); }, out.column);
    for (const auto& row : rows) {
        if (row.has_value()) {
            append_value(out, src, *row);
        } else {
            append_null(out);
        }
    }
    return out;
}

auto take_rows(const Table& table, std::span<const std::size_t> rows) -> Table {
    Table out;
    out.columns.reserve(table.columns.size());
    for (const auto& entry : table.columns) {
        out.push_column(take(entry, rows));
    }
    out.groups = table.groups;
    out.bare_rows = rows.size();
    return out;
}

auto concat_rows(std::span<const Table> parts) -> Table {
    Table out;
    if (parts.empty()) {
        return out;
    }
    const Table& first = parts.front();
    for (const auto& entry : first.columns) {
        out.push_column(ColumnEntry{.name = entry.name, .column = make_empty_like(entry.column)});
    }
    std::size_t total = 0;
    for (const auto& part : parts) {
        if (part.columns.size() != out.columns.size()) {
            throw std::logic_error("concat_rows: column count mismatch");
        }
        for (std::size_t c = 0; c < out.columns.size(); ++c) {
            for (std::size_t r = 0; r < part.rows(); ++r) {
                append_value(out.columns[c], part.columns[c], r);
            }
        }
        total += part.rows();
    }
    out.groups = first.groups;
    out.bare_rows = total;
    return out;
}

void widen_to_double(ColumnEntry& entry) {
    const auto* ints = std::get_if<Column<std::int64_t>>(&entry.column);
    if (ints == nullptr) {
        return;
    }
    Column<double> doubles;
    doubles.reserve(ints->size());
    for (auto v : *ints) {
        doubles.push_back(static_cast<double>(v));
    }
    entry.column = std::move(doubles);
}

auto compare_cells(const ColumnEntry& entry, std::size_t lhs, std::size_t rhs)
    -> std::weak_ordering {
    const bool lhs_null = is_null(entry, lhs);
    const bool rhs_null = is_null(entry, rhs);
    if (lhs_null || rhs_null) {
        if (lhs_null && rhs_null) {
            return std::weak_ordering::equivalent;
        }
        return lhs_null ? std::weak_ordering::greater : std::weak_ordering::less;
    }
    return std::visit(
        [&](const auto& col) -> std::weak_ordering {
            using ColType = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColType, Column<Categorical>>) {
                return col.code_at(lhs) <=> col.code_at(rhs);
            } else if constexpr (std::is_same_v<ColType, Column<double>>) {
                const double a = col[lhs];
                const double b = col[rhs];
                if (std::isnan(a) || std::isnan(b)) {
                    if (std::isnan(a) && std::isnan(b)) {
                        return std::weak_ordering::equivalent;
                    }
                    return std::isnan(a) ? std::weak_ordering::greater : std::weak_ordering::less;
                }
                if (a < b) {
                    return std::weak_ordering::less;
                }
                return b < a ? std::weak_ordering::greater : std::weak_ordering::equivalent;
            } else if constexpr (std::is_same_v<ColType, Column<bool>>) {
                return static_cast<bool>(col[lhs]) <=> static_cast<bool>(col[rhs]);
            } else {
                return to_weak(col[lhs] <=> col[rhs]);
            }
        },
        entry.column);
}

auto compare_rows(std::span<const ColumnEntry* const> columns, std::size_t lhs, std::size_t rhs)
    -> std::weak_ordering {
    for (const auto* entry : columns) {
        auto order = compare_cells(*entry, lhs, rhs);
        if (order != 0) {
            return order;
        }
    }
    return std::weak_ordering::equivalent;
}

auto format_scalar(const ScalarValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "NA";
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v)) {
                    return "NaN";
                }
                if (std::isinf(v)) {
                    return v > 0 ? "Inf" : "-Inf";
                }
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "TRUE" : "FALSE";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, List>) {
                if (v.table == nullptr) {
                    return "NULL";
                }
                return fmt::format("<table[{} x {}]>", v.table->rows(), v.table->columns.size());
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto RowKeyHash::operator()(const RowKey& key) const -> std::size_t {
    std::size_t seed = 0;
    auto hash_combine = [&](std::size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    for (const auto& value : key.values) {
        hash_combine(value.index());
        hash_combine(hash_scalar(value));
    }
    return seed;
}

auto RowKeyEq::operator()(const RowKey& a, const RowKey& b) const -> bool {
    if (a.values.size() != b.values.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.values.size(); ++i) {
        if (!same_cell(a.values[i], b.values[i])) {
            return false;
        }
    }
    return true;
}

auto row_key(std::span<const ColumnEntry* const> columns, std::size_t row) -> RowKey {
    RowKey key;
    key.values.reserve(columns.size());
    for (const auto* entry : columns) {
        key.values.push_back(scalar_at(*entry, row));
    }
    return key;
}

}  // namespace reshape
