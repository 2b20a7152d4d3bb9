#include <reshape/pivot/longer.hpp>
#include <reshape/pivot/spec.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace reshape::pivot {

namespace {

auto split(std::string_view text, std::string_view sep) -> std::vector<std::string> {
    std::vector<std::string> out;
    if (sep.empty()) {
        out.emplace_back(text);
        return out;
    }
    std::size_t start = 0;
    while (true) {
        auto pos = text.find(sep, start);
        if (pos == std::string_view::npos) {
            out.emplace_back(text.substr(start));
            return out;
        }
        out.emplace_back(text.substr(start, pos - start));
        start = pos + sep.size();
    }
}

auto is_numeric(ColumnKind kind) -> bool {
    return kind == ColumnKind::Int || kind == ColumnKind::Double;
}

auto is_textual(ColumnKind kind) -> bool {
    return kind == ColumnKind::String || kind == ColumnKind::Categorical;
}

/// Common kind of the stacked source columns of one `.value`.
auto unify_sources(const Table& data, const std::vector<std::size_t>& sources,
                   std::string_view value) -> std::expected<ColumnValue, Error> {
    const auto& first = data.columns[sources.front()].column;
    ColumnKind unified = column_kind(first);
    for (std::size_t i = 1; i < sources.size(); ++i) {
        const auto kind = column_kind(data.columns[sources[i]].column);
        if (kind == unified && kind != ColumnKind::Categorical) {
            continue;
        }
        if (is_numeric(kind) && is_numeric(unified)) {
            unified = ColumnKind::Double;
        } else if (is_textual(kind) && is_textual(unified)) {
            unified = ColumnKind::String;
        } else {
            return std::unexpected(Error{
                .code = ErrorCode::TypeMismatch,
                .message = fmt::format("can't combine `{}` <{}> and `{}` <{}> into `{}`",
                                       data.columns[sources.front()].name,
                                       kind_name(column_kind(first)),
                                       data.columns[sources[i]].name, kind_name(kind), value)});
        }
    }
    if (sources.size() == 1) {
        return make_empty_like(first);
    }
    return make_empty(unified);
}

}  // namespace

auto build_longer_spec(const Table& data, const LongerSpecOptions& options)
    -> std::expected<Table, Error> {
    auto positions = select::resolve_required(data, options.cols, "cols");
    if (!positions) {
        return std::unexpected(positions.error());
    }
    if (options.names_to.empty()) {
        return std::unexpected(Error{.code = ErrorCode::InvalidNames,
                                     .message = "`names_to` must name at least one column"});
    }
    if (options.names_to.size() > 1 && !options.names_sep.has_value()) {
        return std::unexpected(
            Error{.code = ErrorCode::InvalidNames,
                  .message = "`names_sep` must be supplied when `names_to` has several entries"});
    }

    const auto value_piece = std::find(options.names_to.begin(), options.names_to.end(),
                                       std::string(kValueColumn));
    const bool has_value_piece = value_piece != options.names_to.end();

    std::vector<std::string> names;
    std::vector<std::string> values;
    std::vector<std::vector<std::string>> keys(options.names_to.size());
    for (auto pos : *positions) {
        const auto& name = data.columns[pos].name;
        std::string_view stripped = name;
        if (!options.names_prefix.empty() && stripped.starts_with(options.names_prefix)) {
            stripped.remove_prefix(options.names_prefix.size());
        }
        std::vector<std::string> pieces;
        if (options.names_to.size() > 1) {
            pieces = split(stripped, *options.names_sep);
        } else {
            pieces.emplace_back(stripped);
        }
        if (pieces.size() != options.names_to.size()) {
            return std::unexpected(Error{
                .code = ErrorCode::InvalidNames,
                .message = fmt::format("column `{}` splits into {} pieces but `names_to` has {} "
                                       "({})",
                                       name, pieces.size(), options.names_to.size(),
                                       fmt::join(options.names_to, ", "))});
        }
        names.push_back(name);
        values.push_back(options.values_to);
        for (std::size_t k = 0; k < pieces.size(); ++k) {
            if (options.names_to[k] == kValueColumn) {
                values.back() = pieces[k];
            } else {
                keys[k].push_back(std::move(pieces[k]));
            }
        }
    }

    Table spec;
    spec.add_column(std::string(kNameColumn), Column<std::string>{std::move(names)});
    spec.add_column(std::string(kValueColumn), Column<std::string>{std::move(values)});
    for (std::size_t k = 0; k < options.names_to.size(); ++k) {
        if (has_value_piece && options.names_to[k] == kValueColumn) {
            continue;
        }
        spec.push_column(ColumnEntry{.name = options.names_to[k],
                                     .column = Column<std::string>{std::move(keys[k])}});
    }
    return spec;
}

auto reshape_long(const Table& data, const Table& spec, const ReshapeLongOptions& options)
    -> std::expected<PivotResult, Error> {
    auto checked = check_spec(spec);
    if (!checked) {
        return std::unexpected(checked.error());
    }
    const auto spec_names = spec_strings(*checked, kNameColumn);
    const auto spec_values = spec_strings(*checked, kValueColumn);

    std::vector<std::size_t> sources;
    sources.reserve(spec_names.size());
    for (const auto& name : spec_names) {
        auto pos = data.position(name);
        if (!pos.has_value()) {
            return std::unexpected(
                Error{.code = ErrorCode::ColumnNotFound,
                      .message = fmt::format("spec `.name` column `{}` not found in data "
                                             "(available: {})",
                                             name, select::format_columns(data))});
        }
        sources.push_back(*pos);
    }
    std::unordered_set<std::string> stacked(spec_names.begin(), spec_names.end());

    // Distinct key tuples and distinct `.value` entries, first appearance.
    std::vector<const ColumnEntry*> key_columns;
    for (std::size_t c = 2; c < checked->columns.size(); ++c) {
        key_columns.push_back(&checked->columns[c]);
    }
    robin_hood::unordered_flat_map<RowKey, std::size_t, RowKeyHash, RowKeyEq> key_index;
    std::vector<std::size_t> key_rows;
    std::vector<std::string> value_names;
    std::vector<std::size_t> key_of(spec_names.size());
    std::vector<std::size_t> value_of(spec_names.size());
    for (std::size_t s = 0; s < spec_names.size(); ++s) {
        auto [it, inserted] = key_index.try_emplace(row_key(key_columns, s), key_rows.size());
        if (inserted) {
            key_rows.push_back(s);
        }
        key_of[s] = it->second;
        auto v = std::find(value_names.begin(), value_names.end(), spec_values[s]);
        value_of[s] = static_cast<std::size_t>(v - value_names.begin());
        if (v == value_names.end()) {
            value_names.push_back(spec_values[s]);
        }
    }

    // source[key][value] = stacked data column, if any.
    const std::size_t n_keys = key_rows.size();
    std::vector<std::vector<std::optional<std::size_t>>> cell_source(
        n_keys, std::vector<std::optional<std::size_t>>(value_names.size()));
    std::vector<ColumnEntry> value_columns;
    for (std::size_t v = 0; v < value_names.size(); ++v) {
        std::vector<std::size_t> value_sources;
        for (std::size_t s = 0; s < spec_names.size(); ++s) {
            if (value_of[s] == v) {
                cell_source[key_of[s]][v] = sources[s];
                value_sources.push_back(sources[s]);
            }
        }
        auto empty = unify_sources(data, value_sources, value_names[v]);
        if (!empty) {
            return std::unexpected(empty.error());
        }
        value_columns.push_back(ColumnEntry{.name = value_names[v], .column = std::move(*empty)});
    }

    const std::size_t n_in = data.rows();
    std::vector<std::size_t> id_rows;
    std::vector<std::size_t> key_take;
    id_rows.reserve(n_in * n_keys);
    key_take.reserve(n_in * n_keys);
    for (std::size_t row = 0; row < n_in; ++row) {
        for (std::size_t k = 0; k < n_keys; ++k) {
            bool all_missing = true;
            for (std::size_t v = 0; v < value_names.size(); ++v) {
                const auto& src = cell_source[k][v];
                if (src.has_value() && !is_null(data.columns[*src], row)) {
                    all_missing = false;
                }
            }
            if (options.values_drop_na && all_missing) {
                continue;
            }
            id_rows.push_back(row);
            key_take.push_back(key_rows[k]);
            for (std::size_t v = 0; v < value_names.size(); ++v) {
                auto& out = value_columns[v];
                const auto& src = cell_source[k][v];
                if (!src.has_value()) {
                    append_null(out);
                    continue;
                }
                const auto& entry = data.columns[*src];
                if (column_kind(entry.column) == column_kind(out.column) &&
                    column_kind(out.column) != ColumnKind::Categorical) {
                    append_value(out, entry, row);
                } else if (!append_scalar(out, scalar_at(entry, row))) {
                    return std::unexpected(
                        Error{.code = ErrorCode::TypeMismatch,
                              .message = fmt::format("can't store `{}` in `{}`", entry.name,
                                                     out.name)});
                }
            }
        }
    }

    Table out;
    std::vector<std::string> before;
    for (const auto& entry : data.columns) {
        if (stacked.contains(entry.name)) {
            continue;
        }
        out.push_column(take(entry, id_rows));
        before.push_back(entry.name);
    }
    for (const auto* key : key_columns) {
        out.push_column(take(*key, key_take));
        before.push_back(key->name);
    }
    for (auto& column : value_columns) {
        before.push_back(column.name);
        out.push_column(std::move(column));
    }
    out.bare_rows = id_rows.size();

    auto after = names::repair(before, options.names_repair);
    if (!after) {
        return std::unexpected(after.error());
    }
    for (std::size_t c = 0; c < out.columns.size(); ++c) {
        out.columns[c].name = (*after)[c];
    }
    out.reindex();
    out.groups = data.groups;

    Diagnostics diagnostics;
    auto changes = names::renamed(before, *after);
    if (!changes.empty()) {
        std::vector<std::string> pairs;
        for (const auto& [old_name, new_name] : changes) {
            pairs.push_back(fmt::format("`{}` -> `{}`", old_name, new_name));
        }
        diagnostics.push_back(
            Diagnostic{.kind = DiagnosticKind::NamesRepaired,
                       .column = changes.front().second,
                       .message = fmt::format("New names: {}", fmt::join(pairs, ", "))});
    }

    spdlog::debug("reshape_long: {} input rows x {} keys -> {} rows", n_in, n_keys,
                  id_rows.size());
    return PivotResult{.table = std::move(out), .diagnostics = std::move(diagnostics)};
}

auto pivot_longer(const Table& data, const PivotLongerOptions& options)
    -> std::expected<PivotResult, Error> {
    auto spec = build_longer_spec(data, LongerSpecOptions{.cols = options.cols,
                                                          .names_to = options.names_to,
                                                          .values_to = options.values_to,
                                                          .names_prefix = options.names_prefix,
                                                          .names_sep = options.names_sep});
    if (!spec) {
        return std::unexpected(spec.error());
    }
    return reshape_long(data, *spec,
                        ReshapeLongOptions{.values_drop_na = options.values_drop_na,
                                           .names_repair = options.names_repair});
}

}  // namespace reshape::pivot
