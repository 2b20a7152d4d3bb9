#include <reshape/pivot/assemble.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace reshape::pivot {

auto assemble(const Table& data, std::span<const std::size_t> id_cols,
              std::span<const std::size_t> representative, std::span<const std::string> spec_names,
              std::vector<ColumnEntry> value_columns, const names::NameRepair& repair,
              const std::optional<std::vector<std::string>>& groups)
    -> std::expected<Assembled, Error> {
    if (spec_names.size() != value_columns.size()) {
        return std::unexpected(
            Error{.code = ErrorCode::LengthMismatch,
                  .message = fmt::format("{} spec names for {} value columns", spec_names.size(),
                                         value_columns.size())});
    }

    std::vector<std::string> before;
    before.reserve(id_cols.size() + spec_names.size());
    for (auto pos : id_cols) {
        before.push_back(data.columns.at(pos).name);
    }
    before.insert(before.end(), spec_names.begin(), spec_names.end());

    auto after = names::repair(before, repair);
    if (!after) {
        return std::unexpected(after.error());
    }

    Assembled out;
    out.table.columns.reserve(before.size());
    std::size_t c = 0;
    for (auto pos : id_cols) {
        auto column = take(data.columns[pos], representative);
        column.name = (*after)[c++];
        out.table.push_column(std::move(column));
    }
    for (auto& column : value_columns) {
        column.name = (*after)[c++];
        out.table.push_column(std::move(column));
    }
    out.table.bare_rows = representative.size();

    if (groups.has_value()) {
        std::vector<std::string> renamed_groups;
        renamed_groups.reserve(groups->size());
        for (const auto& group : *groups) {
            auto it = std::find(before.begin(), before.end(), group);
            if (it == before.end()) {
                renamed_groups.push_back(group);
            } else {
                renamed_groups.push_back((*after)[static_cast<std::size_t>(it - before.begin())]);
            }
        }
        out.table.groups = std::move(renamed_groups);
    }

    auto changes = names::renamed(before, *after);
    if (!changes.empty()) {
        std::vector<std::string> pairs;
        pairs.reserve(changes.size());
        for (const auto& [old_name, new_name] : changes) {
            pairs.push_back(fmt::format("`{}` -> `{}`", old_name, new_name));
        }
        out.diagnostics.push_back(
            Diagnostic{.kind = DiagnosticKind::NamesRepaired,
                       .column = changes.front().second,
                       .message = fmt::format("New names: {}", fmt::join(pairs, ", "))});
    }
    return out;
}

}  // namespace reshape::pivot
