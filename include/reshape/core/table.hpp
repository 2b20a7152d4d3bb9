#pragma once

#include <reshape/core/column.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace reshape {

struct Table;

/// One cell of a list column: a nested sub-table.  Compared by identity.
struct List {
    std::shared_ptr<const Table> table;

    auto operator<=>(const List&) const = default;
};

enum class ColumnKind : std::uint8_t {
    Int,
    Double,
    String,
    Bool,
    Categorical,
    List,
};

using ColumnValue = std::variant<Column<std::int64_t>, Column<double>, Column<std::string>,
                                 Column<bool>, Column<Categorical>, Column<List>>;

/// A single cell.  std::monostate is the missing marker.
using ScalarValue = std::variant<std::monostate, std::int64_t, double, std::string, bool, List>;

struct ColumnEntry {
    std::string name;
    ColumnValue column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid, the common case.
    std::optional<std::vector<bool>> validity;
};

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;
    /// Group-key column names; set when the table is grouped.
    std::optional<std::vector<std::string>> groups;
    /// Row count of a table that has no columns.
    std::size_t bare_rows = 0;

    /// Add or replace a column by name.
    void add_column(std::string name, ColumnValue column);
    /// Add or replace a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnValue column, std::vector<bool> validity);
    /// Append a column, even when its name is already taken.
    void push_column(ColumnEntry entry);
    /// Rebuild the name index after renaming columns in place.
    void reindex();

    [[nodiscard]] auto find(const std::string& name) -> ColumnValue*;
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto position(const std::string& name) const -> std::optional<std::size_t>;
    [[nodiscard]] auto names() const -> std::vector<std::string>;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
};

[[nodiscard]] auto column_size(const ColumnValue& column) -> std::size_t;
[[nodiscard]] auto column_kind(const ColumnValue& column) -> ColumnKind;
[[nodiscard]] auto kind_name(ColumnKind kind) -> std::string_view;
[[nodiscard]] auto scalar_kind(const ScalarValue& value) -> std::optional<ColumnKind>;

/// Zero-row column of the same kind; categoricals keep levels and orderedness.
[[nodiscard]] auto make_empty_like(const ColumnValue& column) -> ColumnValue;
/// Zero-row column of the given kind.
[[nodiscard]] auto make_empty(ColumnKind kind) -> ColumnValue;

/// Read one cell; null cells yield std::monostate and categoricals yield their label.
[[nodiscard]] auto scalar_at(const ColumnEntry& entry, std::size_t row) -> ScalarValue;

/// Append row `row` of `src` (same kind) to `out`, carrying nullness.
void append_value(ColumnEntry& out, const ColumnEntry& src, std::size_t row);
/// Append a null cell.
void append_null(ColumnEntry& out);
/// Append a scalar, coercing int64 <-> double and labels into categoricals.
/// Returns false when the scalar cannot be stored in the column.
[[nodiscard]] auto append_scalar(ColumnEntry& out, const ScalarValue& value) -> bool;

/// Gather rows of `src`; std::nullopt positions become null cells.
[[nodiscard]] auto take(const ColumnEntry& src, std::span<const std::size_t> rows) -> ColumnEntry;
[[nodiscard]] auto take(const ColumnEntry& src, std::span<const std::optional<std::size_t>> rows)
    -> ColumnEntry;
/// Gather rows of every column; metadata other than groups is dropped.
[[nodiscard]] auto take_rows(const Table& table, std::span<const std::size_t> rows) -> Table;
/// Stack tables with identical column layouts.
[[nodiscard]] auto concat_rows(std::span<const Table> parts) -> Table;

/// Convert an int64 column to double in place; other kinds are left alone.
void widen_to_double(ColumnEntry& entry);

/// Three-way compare of two cells of one column: ascending, categoricals in
/// level order, nulls last.
[[nodiscard]] auto compare_cells(const ColumnEntry& entry, std::size_t lhs, std::size_t rhs)
    -> std::weak_ordering;
/// Compare two rows over several columns lexicographically.
[[nodiscard]] auto compare_rows(std::span<const ColumnEntry* const> columns, std::size_t lhs,
                                std::size_t rhs) -> std::weak_ordering;

/// Render a cell as text the way synthesized column names spell it.
[[nodiscard]] auto format_scalar(const ScalarValue& value) -> std::string;

/// Key tuple over several columns.  Two missing markers compare equal and so
/// do two NaNs, unlike ternary-logic equality.
struct RowKey {
    std::vector<ScalarValue> values;
};

struct RowKeyHash {
    auto operator()(const RowKey& key) const -> std::size_t;
};

struct RowKeyEq {
    auto operator()(const RowKey& a, const RowKey& b) const -> bool;
};

[[nodiscard]] auto row_key(std::span<const ColumnEntry* const> columns, std::size_t row) -> RowKey;

}  // namespace reshape
