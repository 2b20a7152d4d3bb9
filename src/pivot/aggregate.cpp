#include <reshape/pivot/aggregate.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <limits>
#include <memory>
#include <type_traits>

namespace reshape::pivot {

namespace {

auto group_of(const ColumnEntry& source, std::span<const std::size_t> rows) -> ColumnEntry {
    return take(source, rows);
}

auto nested(const ColumnEntry& group) -> List {
    auto table = std::make_shared<Table>();
    table->push_column(group);
    table->bare_rows = column_size(group.column);
    return List{std::move(table)};
}

/// Kind shared by every non-missing result, or std::nullopt when all are missing.
auto unify_kinds(const std::vector<ScalarValue>& results, std::string_view value_name)
    -> std::expected<std::optional<ColumnKind>, Error> {
    std::optional<ColumnKind> unified;
    for (const auto& result : results) {
        auto kind = scalar_kind(result);
        if (!kind.has_value()) {
            continue;
        }
        if (!unified.has_value() || *unified == *kind) {
            unified = kind;
            continue;
        }
        const bool numeric = (*unified == ColumnKind::Int || *unified == ColumnKind::Double) &&
                             (*kind == ColumnKind::Int || *kind == ColumnKind::Double);
        if (!numeric) {
            return std::unexpected(Error{
                .code = ErrorCode::TypeMismatch,
                .message = fmt::format("values_fn results for `{}` mix {} and {}", value_name,
                                       kind_name(*unified), kind_name(*kind))});
        }
        unified = ColumnKind::Double;
    }
    return unified;
}

auto reduce_with(const ColumnEntry& source, const SpecCells& cells, std::size_t n_rows,
                 const AggregateFn& fn, std::string_view output_name)
    -> std::expected<ReducedCells, Error> {
    std::vector<ScalarValue> results(n_rows);
    std::vector<bool> present(n_rows, false);
    for (std::size_t r = 0; r < n_rows; ++r) {
        if (cells.count(r) == 0) {
            continue;
        }
        present[r] = true;
        auto group = group_of(source, cells.cell(r));
        std::expected<ScalarValue, std::string> result;
        try {
            result = fn(group);
        } catch (const std::exception& e) {
            result = std::unexpected(std::string(e.what()));
        }
        if (!result) {
            return std::unexpected(
                Error{.code = ErrorCode::AggregationFailed,
                      .message = fmt::format("values_fn failed on `{}`: {}", source.name,
                                             result.error())});
        }
        results[r] = std::move(*result);
    }

    auto kind = unify_kinds(results, source.name);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    ReducedCells out{.column = ColumnEntry{.name = std::string(output_name),
                                           .column = kind->has_value()
                                                         ? make_empty(**kind)
                                                         : make_empty_like(source.column)},
                     .present = std::move(present)};
    for (const auto& result : results) {
        if (!append_scalar(out.column, result)) {
            return std::unexpected(
                Error{.code = ErrorCode::TypeMismatch,
                      .message = fmt::format("values_fn result {} does not fit column `{}`",
                                             format_scalar(result), output_name)});
        }
    }
    return out;
}

}  // namespace

auto resolve_values_fn(const ValuesFn& values_fn, std::span<const std::string> values_cols)
    -> std::expected<std::vector<AggregateFn>, Error> {
    std::vector<AggregateFn> out(values_cols.size());
    if (const auto* single = std::get_if<AggregateFn>(&values_fn)) {
        if (!*single) {
            return std::unexpected(Error{.code = ErrorCode::InvalidValuesFn,
                                         .message = "`values_fn` must be a callable function"});
        }
        std::fill(out.begin(), out.end(), *single);
    } else if (const auto* mapping = std::get_if<std::map<std::string, AggregateFn>>(&values_fn)) {
        for (const auto& [name, fn] : *mapping) {
            if (!fn) {
                return std::unexpected(
                    Error{.code = ErrorCode::InvalidValuesFn,
                          .message = fmt::format("`values_fn` entry for `{}` must be a callable "
                                                 "function",
                                                 name)});
            }
        }
        for (std::size_t i = 0; i < values_cols.size(); ++i) {
            if (auto it = mapping->find(values_cols[i]); it != mapping->end()) {
                out[i] = it->second;
            }
        }
    }
    return out;
}

auto reduce(const Table& data, const SpecCells& cells, std::size_t n_rows, const AggregateFn& fn,
            std::string_view output_name, Diagnostics& diagnostics)
    -> std::expected<ReducedCells, Error> {
    const auto& source = data.columns.at(cells.source);
    if (fn) {
        return reduce_with(source, cells, n_rows, fn, output_name);
    }

    std::vector<bool> present(n_rows, false);
    if (!cells.duplicated) {
        std::vector<std::optional<std::size_t>> picks(n_rows);
        for (std::size_t r = 0; r < n_rows; ++r) {
            if (cells.count(r) == 1) {
                picks[r] = cells.rows[cells.offsets[r]];
                present[r] = true;
            }
        }
        auto column = take(source, std::span<const std::optional<std::size_t>>(picks));
        column.name = std::string(output_name);
        return ReducedCells{.column = std::move(column), .present = std::move(present)};
    }

    ColumnEntry column{.name = std::string(output_name), .column = Column<List>{}};
    for (std::size_t r = 0; r < n_rows; ++r) {
        if (cells.count(r) == 0) {
            append_null(column);
            continue;
        }
        present[r] = true;
        if (!append_scalar(column, nested(group_of(source, cells.cell(r))))) {
            return std::unexpected(Error{.code = ErrorCode::TypeMismatch,
                                         .message = "could not store a list cell"});
        }
    }
    auto message = fmt::format(
        "Values from `{}` are not uniquely identified; output column `{}` will contain list-cols.",
        source.name, output_name);
    spdlog::debug("reduce: {}", message);
    diagnostics.push_back(Diagnostic{.kind = DiagnosticKind::DuplicateKeys,
                                     .column = std::string(output_name),
                                     .message = std::move(message)});
    return ReducedCells{.column = std::move(column), .present = std::move(present)};
}

}  // namespace reshape::pivot

namespace reshape::agg {

namespace {

auto has_null(const ColumnEntry& group) -> bool {
    return group.validity.has_value() &&
           std::find(group.validity->begin(), group.validity->end(), false) !=
               group.validity->end();
}

auto not_numeric(std::string_view fn, const ColumnEntry& group) -> Result {
    return std::unexpected(fmt::format("{}() needs a numeric column, not {}", fn,
                                       kind_name(column_kind(group.column))));
}

auto extreme(const ColumnEntry& group, bool want_max, std::string_view fn) -> Result {
    if (has_null(group) || column_size(group.column) == 0) {
        return ScalarValue{};
    }
    return std::visit(
        [&](const auto& col) -> Result {
            using ColType = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColType, Column<List>>) {
                return std::unexpected(fmt::format("{}() is not defined for list columns", fn));
            } else if constexpr (std::is_same_v<ColType, Column<Categorical>>) {
                const auto& codes = col.codes();
                auto it = want_max ? std::max_element(codes.begin(), codes.end())
                                   : std::min_element(codes.begin(), codes.end());
                return ScalarValue{std::string(col.levels()[static_cast<std::size_t>(*it)])};
            } else {
                const auto& values = col.values();
                auto it = want_max ? std::max_element(values.begin(), values.end())
                                   : std::min_element(values.begin(), values.end());
                return ScalarValue{static_cast<typename ColType::value_type>(*it)};
            }
        },
        group.column);
}

}  // namespace

auto sum(const ColumnEntry& group) -> Result {
    if (has_null(group)) {
        return ScalarValue{};
    }
    return std::visit(
        [&](const auto& col) -> Result {
            using ColType = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColType, Column<std::int64_t>>) {
                std::int64_t total = 0;
                for (auto v : col) {
                    total += v;
                }
                return ScalarValue{total};
            } else if constexpr (std::is_same_v<ColType, Column<double>>) {
                double total = 0.0;
                for (auto v : col) {
                    total += v;
                }
                return ScalarValue{total};
            } else if constexpr (std::is_same_v<ColType, Column<bool>>) {
                std::int64_t total = 0;
                for (bool v : col) {
                    total += v ? 1 : 0;
                }
                return ScalarValue{total};
            } else {
                return not_numeric("sum", group);
            }
        },
        group.column);
}

auto mean(const ColumnEntry& group) -> Result {
    if (has_null(group)) {
        return ScalarValue{};
    }
    return std::visit(
        [&](const auto& col) -> Result {
            using ColType = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColType, Column<std::int64_t>> ||
                          std::is_same_v<ColType, Column<double>> ||
                          std::is_same_v<ColType, Column<bool>>) {
                if (col.empty()) {
                    return ScalarValue{std::numeric_limits<double>::quiet_NaN()};
                }
                double total = 0.0;
                for (auto v : col) {
                    total += static_cast<double>(v);
                }
                return ScalarValue{total / static_cast<double>(col.size())};
            } else {
                return not_numeric("mean", group);
            }
        },
        group.column);
}

auto min(const ColumnEntry& group) -> Result { return extreme(group, false, "min"); }

auto max(const ColumnEntry& group) -> Result { return extreme(group, true, "max"); }

auto count(const ColumnEntry& group) -> Result {
    return ScalarValue{static_cast<std::int64_t>(column_size(group.column))};
}

auto first(const ColumnEntry& group) -> Result {
    if (column_size(group.column) == 0) {
        return ScalarValue{};
    }
    return scalar_at(group, 0);
}

auto last(const ColumnEntry& group) -> Result {
    const auto n = column_size(group.column);
    if (n == 0) {
        return ScalarValue{};
    }
    return scalar_at(group, n - 1);
}

auto list(const ColumnEntry& group) -> Result {
    auto table = std::make_shared<Table>();
    table->push_column(group);
    table->bare_rows = column_size(group.column);
    return ScalarValue{List{std::move(table)}};
}

auto by_name(std::string_view name) -> std::optional<pivot::AggregateFn> {
    if (name == "sum") {
        return pivot::AggregateFn{sum};
    }
    if (name == "mean") {
        return pivot::AggregateFn{mean};
    }
    if (name == "min") {
        return pivot::AggregateFn{min};
    }
    if (name == "max") {
        return pivot::AggregateFn{max};
    }
    if (name == "count") {
        return pivot::AggregateFn{count};
    }
    if (name == "first") {
        return pivot::AggregateFn{first};
    }
    if (name == "last") {
        return pivot::AggregateFn{last};
    }
    if (name == "list") {
        return pivot::AggregateFn{list};
    }
    return std::nullopt;
}

}  // namespace reshape::agg
