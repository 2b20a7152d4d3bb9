#include <reshape/pivot/spec.hpp>

#include <fmt/format.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>
#include <unordered_set>

namespace reshape::pivot {

namespace {

auto default_column(const Table& data, const std::optional<select::Selector>& supplied,
                    std::string_view arg, const char* fallback)
    -> std::expected<select::Positions, Error> {
    if (supplied.has_value()) {
        return select::resolve_required(data, *supplied, arg);
    }
    if (!data.position(fallback).has_value()) {
        return std::unexpected(Error{
            .code = ErrorCode::ColumnNotFound,
            .message = fmt::format("`{}` must be supplied if `{}` isn't in `data`.", arg, fallback)});
    }
    return select::resolve_required(data, select::cols({fallback}), arg);
}

/// Row positions of the first appearance of each distinct names-key tuple.
auto distinct_rows(const Table& data, std::span<const ColumnEntry* const> columns, bool sort)
    -> std::vector<std::size_t> {
    robin_hood::unordered_flat_map<RowKey, std::size_t, RowKeyHash, RowKeyEq> seen;
    std::vector<std::size_t> rows;
    for (std::size_t row = 0; row < data.rows(); ++row) {
        if (seen.try_emplace(row_key(columns, row), row).second) {
            rows.push_back(row);
        }
    }
    if (sort) {
        std::stable_sort(rows.begin(), rows.end(), [&](std::size_t lhs, std::size_t rhs) {
            return compare_rows(columns, lhs, rhs) < 0;
        });
    }
    return rows;
}

auto string_column(std::vector<std::string> values) -> ColumnValue {
    return Column<std::string>{std::move(values)};
}

}  // namespace

auto build_wider_spec(const Table& data, const WiderSpecOptions& options)
    -> std::expected<Table, Error> {
    auto names_cols = default_column(data, options.names_from, "names_from", "name");
    if (!names_cols) {
        return std::unexpected(names_cols.error());
    }
    auto values_cols = default_column(data, options.values_from, "values_from", "value");
    if (!values_cols) {
        return std::unexpected(values_cols.error());
    }
    return build_wider_spec_at(data, *names_cols, *values_cols, options);
}

auto build_wider_spec_at(const Table& data, std::span<const std::size_t> names_cols,
                         std::span<const std::size_t> values_cols,
                         const WiderSpecOptions& options) -> std::expected<Table, Error> {
    std::vector<std::string> value_names;
    value_names.reserve(values_cols.size());
    for (auto pos : values_cols) {
        value_names.push_back(data.columns.at(pos).name);
    }

    Table spec;
    if (names_cols.empty()) {
        auto repaired = names::repair(value_names, options.names_repair);
        if (!repaired) {
            return std::unexpected(repaired.error());
        }
        spec.add_column(std::string(kNameColumn), string_column(std::move(*repaired)));
        spec.add_column(std::string(kValueColumn), string_column(std::move(value_names)));
        return spec;
    }

    std::vector<const ColumnEntry*> keys;
    keys.reserve(names_cols.size());
    for (auto pos : names_cols) {
        keys.push_back(&data.columns.at(pos));
    }
    const auto combos = distinct_rows(data, keys, options.names_sort);

    std::vector<std::string> base_names;
    base_names.reserve(combos.size());
    for (auto row : combos) {
        std::string name = options.names_prefix;
        for (std::size_t k = 0; k < keys.size(); ++k) {
            if (k > 0) {
                name.append(options.names_sep);
            }
            name.append(format_scalar(scalar_at(*keys[k], row)));
        }
        base_names.push_back(std::move(name));
    }

    const bool prefix_value = value_names.size() > 1;
    std::vector<std::string> out_names;
    std::vector<std::string> out_values;
    std::vector<std::size_t> key_rows;
    out_names.reserve(combos.size() * value_names.size());
    out_values.reserve(combos.size() * value_names.size());
    key_rows.reserve(combos.size() * value_names.size());
    for (const auto& value : value_names) {
        for (std::size_t i = 0; i < combos.size(); ++i) {
            out_names.push_back(prefix_value
                                    ? fmt::format("{}{}{}", value, options.names_sep, base_names[i])
                                    : base_names[i]);
            out_values.push_back(value);
            key_rows.push_back(combos[i]);
        }
    }

    spec.add_column(std::string(kNameColumn), string_column(std::move(out_names)));
    spec.add_column(std::string(kValueColumn), string_column(std::move(out_values)));
    for (const auto* key : keys) {
        spec.push_column(take(*key, key_rows));
    }

    auto& name_column = std::get<Column<std::string>>(spec.columns[0].column);
    if (options.names_glue.has_value()) {
        for (std::size_t row = 0; row < spec.rows(); ++row) {
            auto glued = render_glue(*options.names_glue, spec, row);
            if (!glued) {
                return std::unexpected(glued.error());
            }
            name_column[row] = std::move(*glued);
        }
    }

    auto repaired = names::repair(name_column.values(), options.names_repair);
    if (!repaired) {
        return std::unexpected(repaired.error());
    }
    name_column = Column<std::string>{std::move(*repaired)};

    spdlog::debug("build_wider_spec: {} combinations x {} values columns", combos.size(),
                  value_names.size());
    return spec;
}

auto check_spec(const Table& spec) -> std::expected<Table, Error> {
    const auto* name_entry = spec.find_entry(std::string(kNameColumn));
    const auto* value_entry = spec.find_entry(std::string(kValueColumn));
    if (name_entry == nullptr || value_entry == nullptr) {
        return std::unexpected(Error{.code = ErrorCode::SpecMissingColumns,
                                     .message = "`spec` must have `.name` and `.value` columns"});
    }

    const auto* names = std::get_if<Column<std::string>>(&name_entry->column);
    if (names == nullptr) {
        return std::unexpected(
            Error{.code = ErrorCode::SpecNameNotText,
                  .message = fmt::format("The `.name` column must be a character vector, not {}.",
                                         kind_name(column_kind(name_entry->column)))});
    }
    for (std::size_t row = 0; row < names->size(); ++row) {
        if (is_null(*name_entry, row)) {
            return std::unexpected(
                Error{.code = ErrorCode::SpecNameMissing,
                      .message = fmt::format("The `.name` column can't be missing (row {}).",
                                             row + 1)});
        }
    }
    std::unordered_set<std::string_view> seen_names;
    for (const auto& name : *names) {
        if (!seen_names.insert(name).second) {
            return std::unexpected(
                Error{.code = ErrorCode::SpecNameNotUnique,
                      .message = fmt::format("The `.name` column must be unique; `{}` repeats.",
                                             name)});
        }
    }

    if (!std::holds_alternative<Column<std::string>>(value_entry->column)) {
        return std::unexpected(
            Error{.code = ErrorCode::SpecValueNotText,
                  .message = fmt::format("The `.value` column must be a character vector, not {}.",
                                         kind_name(column_kind(value_entry->column)))});
    }
    if (value_entry->validity.has_value() &&
        std::find(value_entry->validity->begin(), value_entry->validity->end(), false) !=
            value_entry->validity->end()) {
        return std::unexpected(Error{.code = ErrorCode::SpecValueNotText,
                                     .message = "The `.value` column can't contain missing values."});
    }

    Table out;
    out.push_column(*name_entry);
    out.push_column(*value_entry);
    for (const auto& entry : spec.columns) {
        if (entry.name == kNameColumn || entry.name == kValueColumn) {
            continue;
        }
        out.push_column(entry);
    }

    std::vector<const ColumnEntry*> key_columns;
    for (std::size_t c = 1; c < out.columns.size(); ++c) {
        key_columns.push_back(&out.columns[c]);
    }
    robin_hood::unordered_flat_map<RowKey, std::size_t, RowKeyHash, RowKeyEq> seen_keys;
    for (std::size_t row = 0; row < out.rows(); ++row) {
        if (!seen_keys.try_emplace(row_key(key_columns, row), row).second) {
            return std::unexpected(Error{
                .code = ErrorCode::SpecKeyNotUnique,
                .message = fmt::format("Spec rows must have unique `.value` and key combinations; "
                                       "row {} repeats row {}.",
                                       row + 1, seen_keys[row_key(key_columns, row)] + 1)});
        }
    }
    return out;
}

auto spec_key_names(const Table& spec) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (std::size_t c = 2; c < spec.columns.size(); ++c) {
        out.push_back(spec.columns[c].name);
    }
    return out;
}

auto spec_strings(const Table& spec, std::string_view column) -> std::vector<std::string> {
    const auto* entry = spec.find_entry(std::string(column));
    if (entry == nullptr) {
        return {};
    }
    const auto* values = std::get_if<Column<std::string>>(&entry->column);
    if (values == nullptr) {
        return {};
    }
    return values->values();
}

auto render_glue(std::string_view glue, const Table& spec, std::size_t row)
    -> std::expected<std::string, Error> {
    std::string out;
    std::size_t pos = 0;
    while (pos < glue.size()) {
        char ch = glue[pos];
        if (ch == '{' && pos + 1 < glue.size() && glue[pos + 1] == '{') {
            out.push_back('{');
            pos += 2;
            continue;
        }
        if (ch == '}' && pos + 1 < glue.size() && glue[pos + 1] == '}') {
            out.push_back('}');
            pos += 2;
            continue;
        }
        if (ch != '{') {
            out.push_back(ch);
            ++pos;
            continue;
        }
        auto close = glue.find('}', pos + 1);
        if (close == std::string_view::npos) {
            return std::unexpected(
                Error{.code = ErrorCode::InvalidGlue,
                      .message = fmt::format("unterminated `{{` in names_glue \"{}\"", glue)});
        }
        auto field = glue.substr(pos + 1, close - pos - 1);
        while (!field.empty() && field.front() == ' ') {
            field.remove_prefix(1);
        }
        while (!field.empty() && field.back() == ' ') {
            field.remove_suffix(1);
        }
        if (field == kNameColumn) {
            return std::unexpected(Error{.code = ErrorCode::InvalidGlue,
                                         .message = "names_glue can't refer to `.name`"});
        }
        const auto* entry = spec.find_entry(std::string(field));
        if (entry == nullptr) {
            return std::unexpected(Error{
                .code = ErrorCode::InvalidGlue,
                .message = fmt::format("names_glue refers to unknown column `{}` (available: {})",
                                       field, select::format_columns(spec))});
        }
        out.append(format_scalar(scalar_at(*entry, row)));
        pos = close + 1;
    }
    return out;
}

}  // namespace reshape::pivot
