#include <reshape/pivot/wider.hpp>

#include <reshape/pivot/assemble.hpp>
#include <reshape/pivot/key_grouper.hpp>
#include <reshape/pivot/spec.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace reshape::pivot {

namespace {

/// Distinct `.value` entries in first-appearance order.
auto distinct_values(const std::vector<std::string>& spec_values) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& value : spec_values) {
        if (seen.insert(value).second) {
            out.push_back(value);
        }
    }
    return out;
}

/// Id columns with group columns leading.  Returns the number of group columns.
auto resolve_id_cols(const Table& data, const std::optional<select::Selector>& id_cols,
                     const std::unordered_set<std::string>& used, select::Positions& out)
    -> std::expected<std::size_t, Error> {
    select::Positions candidates;
    if (id_cols.has_value()) {
        auto resolved = select::resolve(data, *id_cols);
        if (!resolved) {
            return std::unexpected(resolved.error());
        }
        candidates = std::move(*resolved);
    } else {
        for (std::size_t i = 0; i < data.columns.size(); ++i) {
            candidates.push_back(i);
        }
    }

    out.clear();
    std::size_t n_group = 0;
    if (data.groups.has_value()) {
        for (const auto& group : *data.groups) {
            auto pos = data.position(group);
            if (!pos.has_value()) {
                return std::unexpected(
                    Error{.code = ErrorCode::ColumnNotFound,
                          .message = fmt::format("group column `{}` not found in data", group)});
            }
            if (std::find(out.begin(), out.end(), *pos) == out.end()) {
                out.push_back(*pos);
                ++n_group;
            }
        }
    }
    for (auto pos : candidates) {
        if (used.contains(data.columns[pos].name)) {
            continue;
        }
        if (std::find(out.begin(), out.end(), pos) == out.end()) {
            out.push_back(pos);
        }
    }
    return n_group;
}

}  // namespace

auto reshape_wide(const Table& data, const Table& spec, const ReshapeWideOptions& options)
    -> std::expected<PivotResult, Error> {
    auto checked = check_spec(spec);
    if (!checked) {
        return std::unexpected(checked.error());
    }
    const auto spec_names = spec_strings(*checked, kNameColumn);
    const auto spec_values = spec_strings(*checked, kValueColumn);
    const auto values_names = distinct_values(spec_values);

    std::unordered_set<std::string> used(values_names.begin(), values_names.end());
    for (const auto& key : spec_key_names(*checked)) {
        used.insert(key);
    }
    for (const auto& value : values_names) {
        if (!data.position(value).has_value()) {
            return std::unexpected(
                Error{.code = ErrorCode::ColumnNotFound,
                      .message = fmt::format("spec `.value` column `{}` not found in data "
                                             "(available: {})",
                                             value, select::format_columns(data))});
        }
    }

    auto fns = resolve_values_fn(options.values_fn, values_names);
    if (!fns) {
        return std::unexpected(fns.error());
    }
    auto fills = resolve_fill(options.values_fill, data, values_names, *fns);
    if (!fills) {
        return std::unexpected(fills.error());
    }

    select::Positions id_cols;
    auto n_group = resolve_id_cols(data, options.id_cols, used, id_cols);
    if (!n_group) {
        return std::unexpected(n_group.error());
    }

    auto groups = group_cells(data, id_cols, *n_group, *checked);
    if (!groups) {
        return std::unexpected(groups.error());
    }

    Diagnostics diagnostics;
    std::vector<ColumnEntry> value_columns;
    value_columns.reserve(spec_names.size());
    for (std::size_t s = 0; s < spec_names.size(); ++s) {
        const auto slot = static_cast<std::size_t>(
            std::find(values_names.begin(), values_names.end(), spec_values[s]) -
            values_names.begin());
        auto reduced = reduce(data, groups->cells[s], groups->n_rows, (*fns)[slot], spec_names[s],
                              diagnostics);
        if (!reduced) {
            return std::unexpected(reduced.error());
        }
        auto dense = densify(groups->n_rows, std::move(*reduced), (*fills)[slot]);
        if (!dense) {
            return std::unexpected(dense.error());
        }
        value_columns.push_back(std::move(*dense));
    }

    auto assembled = assemble(data, id_cols, groups->representative, spec_names,
                              std::move(value_columns), options.names_repair, data.groups);
    if (!assembled) {
        return std::unexpected(assembled.error());
    }
    diagnostics.insert(diagnostics.end(), assembled->diagnostics.begin(),
                       assembled->diagnostics.end());

    spdlog::debug("reshape_wide: {} spec rows, {} id rows, {} diagnostics", spec_names.size(),
                  groups->n_rows, diagnostics.size());
    return PivotResult{.table = std::move(assembled->table), .diagnostics = std::move(diagnostics)};
}

auto pivot_wider(const Table& data, const PivotWiderOptions& options)
    -> std::expected<PivotResult, Error> {
    WiderSpecOptions spec_options{.names_from = options.names_from,
                                  .values_from = options.values_from,
                                  .names_prefix = options.names_prefix,
                                  .names_sep = options.names_sep,
                                  .names_glue = options.names_glue,
                                  .names_sort = options.names_sort,
                                  .names_repair = names::NameRepair::minimal()};

    // Resolve names/values first so the default id columns exclude them even
    // when the data has no rows and the spec ends up empty.
    auto names_cols = options.names_from.has_value()
                          ? select::resolve_required(data, *options.names_from, "names_from")
                          : select::resolve_required(data, select::cols({"name"}), "names_from");
    if (!names_cols) {
        if (!options.names_from.has_value()) {
            return std::unexpected(
                Error{.code = ErrorCode::ColumnNotFound,
                      .message = "`names_from` must be supplied if `name` isn't in `data`."});
        }
        return std::unexpected(names_cols.error());
    }
    auto values_cols = options.values_from.has_value()
                           ? select::resolve_required(data, *options.values_from, "values_from")
                           : select::resolve_required(data, select::cols({"value"}), "values_from");
    if (!values_cols) {
        if (!options.values_from.has_value()) {
            return std::unexpected(
                Error{.code = ErrorCode::ColumnNotFound,
                      .message = "`values_from` must be supplied if `value` isn't in `data`."});
        }
        return std::unexpected(values_cols.error());
    }

    auto spec = build_wider_spec_at(data, *names_cols, *values_cols, spec_options);
    if (!spec) {
        return std::unexpected(spec.error());
    }

    select::Positions id_cols;
    if (options.id_cols.has_value()) {
        auto resolved = select::resolve(data, *options.id_cols);
        if (!resolved) {
            return std::unexpected(resolved.error());
        }
        id_cols = std::move(*resolved);
    } else {
        for (std::size_t i = 0; i < data.columns.size(); ++i) {
            id_cols.push_back(i);
        }
    }
    std::erase_if(id_cols, [&](std::size_t pos) {
        return std::find(names_cols->begin(), names_cols->end(), pos) != names_cols->end() ||
               std::find(values_cols->begin(), values_cols->end(), pos) != values_cols->end();
    });

    spdlog::debug("pivot_wider: {} names columns, {} values columns, {} id columns",
                  names_cols->size(), values_cols->size(), id_cols.size());
    return reshape_wide(data, *spec,
                        ReshapeWideOptions{.id_cols = select::positions(std::move(id_cols)),
                                           .names_repair = options.names_repair,
                                           .values_fill = options.values_fill,
                                           .values_fn = options.values_fn});
}

}  // namespace reshape::pivot
