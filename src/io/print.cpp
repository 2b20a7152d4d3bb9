#include <reshape/io/print.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <vector>

namespace reshape::io {

auto format_cell(const ColumnEntry& entry, std::size_t row) -> std::string {
    auto value = scalar_at(entry, row);
    const auto* list = std::get_if<List>(&value);
    if (list == nullptr || list->table == nullptr || list->table->columns.size() != 1) {
        return format_scalar(value);
    }
    const auto& inner = list->table->columns.front();
    std::vector<std::string> items;
    items.reserve(list->table->rows());
    for (std::size_t r = 0; r < list->table->rows(); ++r) {
        items.push_back(format_cell(inner, r));
    }
    return fmt::format("[{}]", fmt::join(items, ", "));
}

void print_table(const Table& table, std::ostream& out, std::size_t max_rows) {
    if (table.columns.empty()) {
        out << fmt::format("<empty> rows: {}\n", table.rows());
        return;
    }
    out << fmt::format("rows: {}\n", table.rows());
    if (table.groups.has_value()) {
        out << fmt::format("groups: {}\n", fmt::join(*table.groups, ", "));
    }

    const std::size_t col_count = table.columns.size();
    const std::size_t shown_rows = std::min(table.rows(), max_rows);

    std::vector<std::size_t> widths(col_count);
    std::vector<std::vector<std::string>> cells(col_count);
    for (std::size_t c = 0; c < col_count; ++c) {
        widths[c] = table.columns[c].name.size();
        cells[c].reserve(shown_rows);
        for (std::size_t r = 0; r < shown_rows; ++r) {
            auto cell = format_cell(table.columns[c], r);
            widths[c] = std::max(widths[c], cell.size());
            cells[c].push_back(std::move(cell));
        }
    }

    auto print_sep = [&]() {
        out << '+';
        for (std::size_t c = 0; c < col_count; ++c) {
            out << fmt::format("{:-<{}}+", "", widths[c] + 2);
        }
        out << '\n';
    };

    print_sep();
    out << '|';
    for (std::size_t c = 0; c < col_count; ++c) {
        out << fmt::format(" {:<{}} |", table.columns[c].name, widths[c]);
    }
    out << '\n';
    print_sep();

    for (std::size_t r = 0; r < shown_rows; ++r) {
        out << '|';
        for (std::size_t c = 0; c < col_count; ++c) {
            out << fmt::format(" {:<{}} |", cells[c][r], widths[c]);
        }
        out << '\n';
    }
    print_sep();

    if (table.rows() > shown_rows) {
        out << fmt::format("... ({} more rows)\n", table.rows() - shown_rows);
    }
}

}  // namespace reshape::io
