#pragma once

#include <reshape/core/error.hpp>
#include <reshape/core/table.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace reshape::select {

enum class SelectorKind : std::uint8_t {
    Names,
    Positions,
    Range,
    StartsWith,
    EndsWith,
    Contains,
    Everything,
    Where,
    Union,
    Except,
};

using ColumnPredicate = std::function<bool(const ColumnEntry&)>;

/// Column selection expression, evaluated against a table's schema.
///
/// Build selectors with the factories below; `resolve` turns one into an
/// ordered set of column positions.
struct Selector {
    SelectorKind kind = SelectorKind::Names;
    std::vector<std::string> names;
    std::vector<std::size_t> positions;
    std::string pattern;
    ColumnPredicate predicate;
    std::vector<Selector> children;
};

using Positions = std::vector<std::size_t>;

// ─── Selector factories ───────────────────────────────────────────────────────

[[nodiscard]] auto cols(std::vector<std::string> names) -> Selector;
[[nodiscard]] auto positions(std::vector<std::size_t> indices) -> Selector;
/// Inclusive positional range; reversed when `to` comes before `from`.
[[nodiscard]] auto range(std::string from, std::string to) -> Selector;
[[nodiscard]] auto starts_with(std::string prefix) -> Selector;
[[nodiscard]] auto ends_with(std::string suffix) -> Selector;
[[nodiscard]] auto contains(std::string needle) -> Selector;
[[nodiscard]] auto everything() -> Selector;
[[nodiscard]] auto where(ColumnPredicate predicate) -> Selector;
[[nodiscard]] auto any_of(std::vector<Selector> selectors) -> Selector;
[[nodiscard]] auto all_except(Selector excluded) -> Selector;

// ─── Resolution ───────────────────────────────────────────────────────────────

/// Resolve to distinct column positions in first-seen order.
[[nodiscard]] auto resolve(const Table& table, const Selector& selector)
    -> std::expected<Positions, Error>;

/// Like resolve(), but an empty result is an error naming `arg`.
[[nodiscard]] auto resolve_required(const Table& table, const Selector& selector,
                                    std::string_view arg) -> std::expected<Positions, Error>;

/// Comma-separated, backquoted list of the table's column names.
[[nodiscard]] auto format_columns(const Table& table) -> std::string;

}  // namespace reshape::select
