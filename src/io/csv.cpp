#include <reshape/io/csv.hpp>
#include <reshape/io/print.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <optional>
#include <vector>

namespace reshape::io {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto try_int(const std::string& text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto try_double(const std::string& text, double& out) -> bool {
    char* end_ptr = nullptr;
    out = std::strtod(text.c_str(), &end_ptr);
    return end_ptr != text.c_str() && *end_ptr == '\0';
}

template <typename T, typename Parse>
auto parse_all(const std::vector<std::string>& vals, const std::vector<bool>& validity,
               Parse parse) -> std::optional<Column<T>> {
    Column<T> col;
    col.reserve(vals.size());
    bool any_valid = false;
    for (std::size_t i = 0; i < vals.size(); ++i) {
        if (!validity[i]) {
            col.push_back(T{});
            continue;
        }
        T value{};
        if (!parse(vals[i], value)) {
            return std::nullopt;
        }
        any_valid = true;
        col.push_back(value);
    }
    if (!any_valid) {
        return std::nullopt;
    }
    return col;
}

void add(Table& table, const std::string& name, ColumnValue column, std::vector<bool> validity,
         bool has_nulls) {
    if (has_nulls) {
        table.add_column(name, std::move(column), std::move(validity));
    } else {
        table.add_column(name, std::move(column));
    }
}

auto needs_quotes(std::string_view text) -> bool {
    return text.find_first_of(",\"\r\n") != std::string_view::npos;
}

auto quote(std::string_view text) -> std::string {
    std::string out = "\"";
    for (char ch : text) {
        if (ch == '"') {
            out.push_back('"');
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

auto csv_field(std::string text) -> std::string {
    return needs_quotes(text) ? quote(text) : text;
}

}  // namespace

auto parse_null_spec(std::string_view spec) -> CsvReadOptions {
    CsvReadOptions options{.null_tokens = {}, .null_if_empty = false};
    std::size_t pos = 0;
    while (pos <= spec.size()) {
        std::size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto token = trim(spec.substr(pos, comma - pos));
        if (!token.empty()) {
            if (token == "<empty>") {
                options.null_if_empty = true;
            } else {
                options.null_tokens.emplace(token);
            }
        }
        if (comma == spec.size()) {
            break;
        }
        pos = comma + 1;
    }
    return options;
}

auto read_csv(std::string_view path, const CsvReadOptions& options) -> std::expected<Table, Error> {
    Table table;
    try {
        rapidcsv::Document doc(std::string(path),
                               rapidcsv::LabelParams(0, -1),   // row 0 = header, no row-index column
                               rapidcsv::SeparatorParams(',')  // handles RFC 4180 quoting
        );

        for (const auto& name : doc.GetColumnNames()) {
            std::vector<std::string> vals = doc.GetColumn<std::string>(name);
            std::vector<bool> validity(vals.size(), true);
            bool has_nulls = false;
            for (std::size_t i = 0; i < vals.size(); ++i) {
                const bool is_null = (options.null_if_empty && vals[i].empty()) ||
                                     options.null_tokens.contains(vals[i]);
                validity[i] = !is_null;
                has_nulls = has_nulls || is_null;
            }

            if (options.categorical_columns.contains(name)) {
                Column<Categorical> col;
                col.reserve(vals.size());
                for (std::size_t i = 0; i < vals.size(); ++i) {
                    if (validity[i]) {
                        col.push_back(vals[i]);
                    } else {
                        col.push_code(0);
                    }
                }
                add(table, name, std::move(col), std::move(validity), has_nulls);
                continue;
            }
            if (auto ints = parse_all<std::int64_t>(vals, validity, try_int)) {
                add(table, name, std::move(*ints), std::move(validity), has_nulls);
                continue;
            }
            if (auto doubles = parse_all<double>(vals, validity, try_double)) {
                add(table, name, std::move(*doubles), std::move(validity), has_nulls);
                continue;
            }
            for (std::size_t i = 0; i < vals.size(); ++i) {
                if (!validity[i]) {
                    vals[i].clear();
                }
            }
            add(table, name, Column<std::string>{std::move(vals)}, std::move(validity), has_nulls);
        }
    } catch (const std::exception& e) {
        return std::unexpected(Error{.code = ErrorCode::Io,
                                     .message = fmt::format("failed to read csv {}: {}", path,
                                                            e.what())});
    }
    spdlog::debug("read_csv: {} rows x {} columns from {}", table.rows(), table.columns.size(),
                  path);
    return table;
}

auto write_csv(const Table& table, std::ostream& out) -> std::expected<void, Error> {
    for (std::size_t c = 0; c < table.columns.size(); ++c) {
        if (c > 0) {
            out << ',';
        }
        out << csv_field(table.columns[c].name);
    }
    out << '\n';
    for (std::size_t r = 0; r < table.rows(); ++r) {
        for (std::size_t c = 0; c < table.columns.size(); ++c) {
            if (c > 0) {
                out << ',';
            }
            out << csv_field(format_cell(table.columns[c], r));
        }
        out << '\n';
    }
    if (!out) {
        return std::unexpected(Error{.code = ErrorCode::Io, .message = "failed to write csv"});
    }
    return {};
}

}  // namespace reshape::io
