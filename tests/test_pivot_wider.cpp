#include <reshape/pivot/wider.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace reshape;
using Names = std::vector<std::string>;

namespace {

auto ints(const Table& table, const std::string& name) -> const Column<std::int64_t>& {
    const auto* col = std::get_if<Column<std::int64_t>>(table.find(name));
    REQUIRE(col != nullptr);
    return *col;
}

auto null_at(const Table& table, std::size_t column, std::size_t row) -> bool {
    return is_null(table.columns.at(column), row);
}

auto list_cell(const Table& table, const std::string& name, std::size_t row) -> const Table& {
    const auto* col = std::get_if<Column<List>>(table.find(name));
    REQUIRE(col != nullptr);
    REQUIRE((*col)[row].table != nullptr);
    return *(*col)[row].table;
}

/// id, k, v with the given rows.
auto long_table(std::vector<std::int64_t> id, std::vector<std::string> k,
                std::vector<std::int64_t> v) -> Table {
    Table table;
    table.add_column("id", Column<std::int64_t>{std::move(id)});
    table.add_column("k", Column<std::string>{std::move(k)});
    table.add_column("v", Column<std::int64_t>{std::move(v)});
    return table;
}

auto by_k_v() -> pivot::PivotWiderOptions {
    return pivot::PivotWiderOptions{.names_from = select::cols({"k"}),
                                    .values_from = select::cols({"v"})};
}

}  // namespace

TEST_CASE("pivot_wider spreads one value per cell", "[pivot][wider]") {
    auto data = long_table({1, 2}, {"x", "y"}, {1, 2});

    auto result = pivot::pivot_wider(data, by_k_v());
    REQUIRE(result.has_value());
    const auto& out = result->table;

    REQUIRE(out.names() == Names{"id", "x", "y"});
    REQUIRE(out.rows() == 2);
    REQUIRE(ints(out, "id")[0] == 1);
    REQUIRE(ints(out, "x")[0] == 1);
    REQUIRE(null_at(out, 1, 1));
    REQUIRE(null_at(out, 2, 0));
    REQUIRE(ints(out, "y")[1] == 2);
    REQUIRE(result->diagnostics.empty());
}

TEST_CASE("pivot_wider turns duplicated cells into list cells with one warning",
          "[pivot][wider]") {
    auto data = long_table({1, 1}, {"x", "x"}, {1, 2});

    auto result = pivot::pivot_wider(data, by_k_v());
    REQUIRE(result.has_value());
    const auto& out = result->table;

    REQUIRE(out.rows() == 1);
    const auto& cell = list_cell(out, "x", 0);
    REQUIRE(cell.rows() == 2);
    REQUIRE(ints(cell, "v")[0] == 1);
    REQUIRE(ints(cell, "v")[1] == 2);

    REQUIRE(result->diagnostics.size() == 1);
    REQUIRE(result->diagnostics[0].kind == DiagnosticKind::DuplicateKeys);
    REQUIRE(result->diagnostics[0].column == "x");
    REQUIRE(result->diagnostics[0].message.find("`v`") != std::string::npos);
}

TEST_CASE("pivot_wider only converts the duplicated output column", "[pivot][wider]") {
    auto data = long_table({1, 1, 1, 2}, {"x", "x", "y", "y"}, {1, 2, 3, 4});

    auto result = pivot::pivot_wider(data, by_k_v());
    REQUIRE(result.has_value());
    const auto& out = result->table;

    REQUIRE(column_kind(out.find_entry("x")->column) == ColumnKind::List);
    REQUIRE(column_kind(out.find_entry("y")->column) == ColumnKind::Int);
    REQUIRE(ints(out, "y")[0] == 3);
    REQUIRE(ints(out, "y")[1] == 4);
    // id 2 never had an x: the list cell is missing, not an empty table.
    REQUIRE(null_at(out, 1, 1));
    REQUIRE(result->diagnostics.size() == 1);
}

TEST_CASE("pivot_wider with sum aggregates silently", "[pivot][wider]") {
    auto data = long_table({1, 1}, {"x", "x"}, {1, 2});
    auto options = by_k_v();
    options.values_fn = pivot::AggregateFn{agg::sum};

    auto result = pivot::pivot_wider(data, options);
    REQUIRE(result.has_value());
    REQUIRE(ints(result->table, "x")[0] == 3);
    REQUIRE(result->diagnostics.empty());
}

TEST_CASE("values_fn runs on singleton cells too", "[pivot][wider]") {
    auto data = long_table({1, 2}, {"x", "x"}, {5, 6});
    auto options = by_k_v();
    options.values_fn = pivot::AggregateFn{agg::count};

    auto result = pivot::pivot_wider(data, options);
    REQUIRE(result.has_value());
    REQUIRE(ints(result->table, "x")[0] == 1);
    REQUIRE(ints(result->table, "x")[1] == 1);
}

TEST_CASE("values_fn results are unified per column", "[pivot][wider]") {
    auto data = long_table({1, 2}, {"x", "x"}, {1, 2});

    SECTION("int and double widen to double") {
        auto options = by_k_v();
        options.values_fn = pivot::AggregateFn([](const ColumnEntry& group) -> agg::Result {
            auto v = std::get<Column<std::int64_t>>(group.column)[0];
            if (v == 1) {
                return ScalarValue{std::int64_t{1}};
            }
            return ScalarValue{2.5};
        });
        auto result = pivot::pivot_wider(data, options);
        REQUIRE(result.has_value());
        const auto* col = std::get_if<Column<double>>(result->table.find("x"));
        REQUIRE(col != nullptr);
        REQUIRE((*col)[0] == Catch::Approx(1.0));
        REQUIRE((*col)[1] == Catch::Approx(2.5));
    }

    SECTION("text and numbers do not mix") {
        auto options = by_k_v();
        options.values_fn = pivot::AggregateFn([](const ColumnEntry& group) -> agg::Result {
            auto v = std::get<Column<std::int64_t>>(group.column)[0];
            if (v == 1) {
                return ScalarValue{std::int64_t{1}};
            }
            return ScalarValue{std::string("two")};
        });
        auto result = pivot::pivot_wider(data, options);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::TypeMismatch);
    }

    SECTION("all-missing results keep the source kind") {
        auto options = by_k_v();
        options.values_fn =
            pivot::AggregateFn([](const ColumnEntry&) -> agg::Result { return ScalarValue{}; });
        auto result = pivot::pivot_wider(data, options);
        REQUIRE(result.has_value());
        REQUIRE(column_kind(result->table.find_entry("x")->column) == ColumnKind::Int);
        REQUIRE(null_at(result->table, 1, 0));
    }
}

TEST_CASE("values_fn failures surface as AggregationFailed", "[pivot][wider]") {
    auto data = long_table({1}, {"x"}, {1});

    SECTION("an error result") {
        auto options = by_k_v();
        options.values_fn = pivot::AggregateFn([](const ColumnEntry&) -> agg::Result {
            return std::unexpected(std::string("boom"));
        });
        auto result = pivot::pivot_wider(data, options);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::AggregationFailed);
        REQUIRE(result.error().message.find("boom") != std::string::npos);
    }

    SECTION("a thrown exception") {
        auto options = by_k_v();
        options.values_fn = pivot::AggregateFn(
            [](const ColumnEntry&) -> agg::Result { throw std::runtime_error("thrown"); });
        auto result = pivot::pivot_wider(data, options);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::AggregationFailed);
    }

    SECTION("a text column handed to sum") {
        Table text;
        text.add_column("id", Column<std::int64_t>{1});
        text.add_column("k", Column<std::string>{"x"});
        text.add_column("v", Column<std::string>{"a"});
        auto options = by_k_v();
        options.values_fn = pivot::AggregateFn{agg::sum};
        auto result = pivot::pivot_wider(text, options);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::AggregationFailed);
    }
}

TEST_CASE("values_fn must be callable", "[pivot][wider]") {
    auto data = long_table({1}, {"x"}, {1});

    auto options = by_k_v();
    options.values_fn = pivot::AggregateFn{};
    auto result = pivot::pivot_wider(data, options);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::InvalidValuesFn);

    options.values_fn = std::map<std::string, pivot::AggregateFn>{{"v", pivot::AggregateFn{}}};
    result = pivot::pivot_wider(data, options);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::InvalidValuesFn);
}

TEST_CASE("values_fn mapping applies per values column", "[pivot][wider]") {
    Table data;
    data.add_column("id", Column<std::int64_t>{1, 1});
    data.add_column("k", Column<std::string>{"x", "x"});
    data.add_column("a", Column<std::int64_t>{1, 2});
    data.add_column("b", Column<std::int64_t>{3, 4});

    pivot::PivotWiderOptions options{.names_from = select::cols({"k"}),
                                     .values_from = select::cols({"a", "b"})};
    options.values_fn = std::map<std::string, pivot::AggregateFn>{
        {"a", pivot::AggregateFn{agg::sum}}, {"unrelated", pivot::AggregateFn{agg::mean}}};

    auto result = pivot::pivot_wider(data, options);
    REQUIRE(result.has_value());
    REQUIRE(result->table.names() == Names{"id", "a_x", "b_x"});
    REQUIRE(ints(result->table, "a_x")[0] == 3);
    REQUIRE(column_kind(result->table.find_entry("b_x")->column) == ColumnKind::List);
    REQUIRE(result->diagnostics.size() == 1);
    REQUIRE(result->diagnostics[0].column == "b_x");
}

TEST_CASE("values_fill only fills absent cells", "[pivot][wider]") {
    Table data;
    data.add_column("id", Column<std::int64_t>{1, 2});
    data.add_column("k", Column<std::string>{"x", "y"});
    data.add_column("v", Column<std::int64_t>{0, 2}, {false, true});

    auto options = by_k_v();
    options.values_fill = ScalarValue{std::int64_t{0}};
    auto result = pivot::pivot_wider(data, options);
    REQUIRE(result.has_value());
    const auto& out = result->table;

    // id 1 has an authentic missing x; id 2 has no x at all.
    REQUIRE(null_at(out, 1, 0));
    REQUIRE_FALSE(null_at(out, 1, 1));
    REQUIRE(ints(out, "x")[1] == 0);
    REQUIRE(ints(out, "y")[0] == 0);
    REQUIRE(ints(out, "y")[1] == 2);
}

TEST_CASE("values_fill keeps or widens the column type", "[pivot][wider]") {
    auto data = long_table({1, 2}, {"x", "y"}, {1, 2});

    SECTION("an integral double stays int") {
        auto options = by_k_v();
        options.values_fill = ScalarValue{0.0};
        auto result = pivot::pivot_wider(data, options);
        REQUIRE(column_kind(result->table.find_entry("x")->column) == ColumnKind::Int);
    }

    SECTION("a fractional double widens to double") {
        auto options = by_k_v();
        options.values_fill = ScalarValue{0.5};
        auto result = pivot::pivot_wider(data, options);
        REQUIRE(result.has_value());
        const auto* x = std::get_if<Column<double>>(result->table.find("x"));
        REQUIRE(x != nullptr);
        REQUIRE((*x)[0] == Catch::Approx(1.0));
        REQUIRE((*x)[1] == Catch::Approx(0.5));
    }

    SECTION("text into a number column is rejected before grouping") {
        auto options = by_k_v();
        options.values_fill = ScalarValue{std::string("none")};
        auto result = pivot::pivot_wider(data, options);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InvalidFill);
    }

    SECTION("per-column fills") {
        auto options = by_k_v();
        options.values_fill = std::map<std::string, ScalarValue>{{"v", ScalarValue{std::int64_t{-1}}}};
        auto result = pivot::pivot_wider(data, options);
        REQUIRE(ints(result->table, "x")[1] == -1);
    }
}

TEST_CASE("values_fill into a list column becomes a one-row table", "[pivot][wider]") {
    auto data = long_table({1, 1, 2}, {"x", "x", "y"}, {1, 2, 3});
    auto options = by_k_v();
    options.values_fill = ScalarValue{std::int64_t{0}};

    auto result = pivot::pivot_wider(data, options);
    REQUIRE(result.has_value());
    const auto& filled = list_cell(result->table, "x", 1);
    REQUIRE(filled.rows() == 1);
    REQUIRE(ints(filled, "x")[0] == 0);
}

TEST_CASE("every id appears exactly once", "[pivot][wider]") {
    auto data = long_table({3, 1, 3, 2, 1}, {"a", "b", "b", "c", "a"}, {1, 2, 3, 4, 5});

    auto result = pivot::pivot_wider(data, by_k_v());
    REQUIRE(result.has_value());
    const auto& ids = ints(result->table, "id");
    REQUIRE(ids.size() == 3);
    REQUIRE(ids[0] == 3);
    REQUIRE(ids[1] == 1);
    REQUIRE(ids[2] == 2);
    REQUIRE(result->table.names() == Names{"id", "a", "b", "c"});
}

TEST_CASE("pivot_wider on zero rows keeps the column set", "[pivot][wider]") {
    auto data = long_table({}, {}, {});
    Table spec;
    spec.add_column(".name", Column<std::string>{"x", "y"});
    spec.add_column(".value", Column<std::string>{"v", "v"});
    spec.add_column("k", Column<std::string>{"x", "y"});

    auto result = pivot::reshape_wide(data, spec);
    REQUIRE(result.has_value());
    REQUIRE(result->table.rows() == 0);
    REQUIRE(result->table.names() == Names{"id", "x", "y"});
    REQUIRE(column_kind(result->table.find_entry("x")->column) == ColumnKind::Int);

    auto built = pivot::pivot_wider(data, by_k_v());
    REQUIRE(built.has_value());
    REQUIRE(built->table.rows() == 0);
    REQUIRE(built->table.names() == Names{"id"});
}

TEST_CASE("without id columns all rows collapse into one", "[pivot][wider]") {
    Table data;
    data.add_column("k", Column<std::string>{"x", "y"});
    data.add_column("v", Column<std::int64_t>{1, 2});

    auto result = pivot::pivot_wider(data, by_k_v());
    REQUIRE(result.has_value());
    REQUIRE(result->table.rows() == 1);
    REQUIRE(result->table.names() == Names{"x", "y"});
}

TEST_CASE("explicit id_cols drop other columns", "[pivot][wider]") {
    auto data = long_table({1, 1}, {"x", "y"}, {1, 2});
    data.add_column("noise", Column<std::int64_t>{10, 20});

    auto options = by_k_v();
    options.id_cols = select::cols({"id"});
    auto result = pivot::pivot_wider(data, options);
    REQUIRE(result.has_value());
    REQUIRE(result->table.names() == Names{"id", "x", "y"});
    REQUIRE(result->table.rows() == 1);
}

TEST_CASE("name collisions follow the repair policy", "[pivot][wider]") {
    Table data;
    data.add_column("x", Column<std::int64_t>{1});
    data.add_column("lower", Column<std::string>{"x"});
    data.add_column("upper", Column<std::string>{"X"});
    pivot::PivotWiderOptions options{.names_from = select::cols({"lower"}),
                                     .values_from = select::cols({"upper"})};

    SECTION("check_unique fails") {
        auto result = pivot::pivot_wider(data, options);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::NameCollision);
        REQUIRE(result.error().message.find("`x`") != std::string::npos);
    }

    SECTION("unique renames and reports") {
        options.names_repair = names::NameRepair::unique();
        auto result = pivot::pivot_wider(data, options);
        REQUIRE(result.has_value());
        REQUIRE(result->table.names() == Names{"x...1", "x...2"});
        REQUIRE(result->diagnostics.size() == 1);
        REQUIRE(result->diagnostics[0].kind == DiagnosticKind::NamesRepaired);
    }

    SECTION("minimal keeps both columns") {
        options.names_repair = names::NameRepair::minimal();
        auto result = pivot::pivot_wider(data, options);
        REQUIRE(result.has_value());
        REQUIRE(result->table.names() == Names{"x", "x"});
        REQUIRE(ints(result->table, "x")[0] == 1);
        const auto* upper = std::get_if<Column<std::string>>(&result->table.columns[1].column);
        REQUIRE(upper != nullptr);
        REQUIRE((*upper)[0] == "X");
    }

    SECTION("custom repair sees id and spec names together") {
        std::vector<Names> seen;
        options.names_repair = names::NameRepair::custom([&](const Names& in) {
            seen.push_back(in);
            Names out;
            for (std::size_t i = 0; i < in.size(); ++i) {
                out.push_back(in[i] + "." + std::to_string(i + 1));
            }
            return out;
        });
        auto result = pivot::pivot_wider(data, options);
        REQUIRE(result.has_value());
        REQUIRE(seen.size() == 1);
        REQUIRE(seen[0] == Names{"x", "x"});
        REQUIRE(result->table.names() == Names{"x.1", "x.2"});
    }
}

TEST_CASE("grouped input keeps groups and orders rows group-major", "[pivot][wider]") {
    Table data;
    data.add_column("g", Column<std::string>{"b", "a", "b", "a"});
    data.add_column("id", Column<std::int64_t>{1, 2, 3, 2});
    data.add_column("k", Column<std::string>{"x", "x", "x", "y"});
    data.add_column("v", Column<std::int64_t>{10, 20, 30, 40});
    data.groups = std::vector<std::string>{"g"};

    auto options = by_k_v();
    options.id_cols = select::cols({"id"});
    auto result = pivot::pivot_wider(data, options);
    REQUIRE(result.has_value());
    const auto& out = result->table;

    REQUIRE(out.names() == Names{"g", "id", "x", "y"});
    REQUIRE(out.groups == std::vector<std::string>{"g"});
    REQUIRE(ints(out, "id")[0] == 1);
    REQUIRE(ints(out, "id")[1] == 3);
    REQUIRE(ints(out, "id")[2] == 2);
    REQUIRE(ints(out, "x")[2] == 20);
    REQUIRE(ints(out, "y")[2] == 40);
}

TEST_CASE("categorical values keep their levels", "[pivot][wider]") {
    Table data;
    data.add_column("id", Column<std::int64_t>{1, 2});
    data.add_column("k", Column<std::string>{"x", "x"});
    data.add_column("v", Column<Categorical>{{"lo", "mid", "hi"}, {2, 0}, true});

    auto result = pivot::pivot_wider(data, by_k_v());
    REQUIRE(result.has_value());
    const auto* x = std::get_if<Column<Categorical>>(result->table.find("x"));
    REQUIRE(x != nullptr);
    REQUIRE(x->is_ordered());
    REQUIRE(x->levels() == Names{"lo", "mid", "hi"});
    REQUIRE((*x)[0] == "hi");
}

TEST_CASE("reshape_wide follows a hand-built spec", "[pivot][wider]") {
    auto data = long_table({1, 1, 2}, {"x", "y", "x"}, {1, 2, 3});

    SECTION("spec order and names drive the output") {
        Table spec;
        spec.add_column(".name", Column<std::string>{"why", "ex"});
        spec.add_column(".value", Column<std::string>{"v", "v"});
        spec.add_column("k", Column<std::string>{"y", "x"});
        auto result = pivot::reshape_wide(data, spec);
        REQUIRE(result.has_value());
        REQUIRE(result->table.names() == Names{"id", "why", "ex"});
        REQUIRE(ints(result->table, "ex")[1] == 3);
    }

    SECTION("unmatched keys give typed missing columns") {
        Table spec;
        spec.add_column(".name", Column<std::string>{"zed"});
        spec.add_column(".value", Column<std::string>{"v"});
        spec.add_column("k", Column<std::string>{"z"});
        auto result = pivot::reshape_wide(data, spec);
        REQUIRE(result.has_value());
        REQUIRE(result->table.rows() == 2);
        REQUIRE(column_kind(result->table.find_entry("zed")->column) == ColumnKind::Int);
        REQUIRE(null_at(result->table, 1, 0));
        REQUIRE(null_at(result->table, 1, 1));
    }

    SECTION("numeric keys match across int and double") {
        Table numeric;
        numeric.add_column("id", Column<std::int64_t>{1, 1});
        numeric.add_column("year", Column<std::int64_t>{2000, 2001});
        numeric.add_column("v", Column<std::int64_t>{5, 6});
        Table spec;
        spec.add_column(".name", Column<std::string>{"y2001"});
        spec.add_column(".value", Column<std::string>{"v"});
        spec.add_column("year", Column<double>{2001.0});
        auto result = pivot::reshape_wide(numeric, spec);
        REQUIRE(result.has_value());
        REQUIRE(ints(result->table, "y2001")[0] == 6);
    }

    SECTION("a key column absent from the data fails") {
        Table spec;
        spec.add_column(".name", Column<std::string>{"x"});
        spec.add_column(".value", Column<std::string>{"v"});
        spec.add_column("nope", Column<std::string>{"x"});
        auto result = pivot::reshape_wide(data, spec);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::ColumnNotFound);
    }

    SECTION("incomparable key kinds fail") {
        Table spec;
        spec.add_column(".name", Column<std::string>{"x"});
        spec.add_column(".value", Column<std::string>{"v"});
        spec.add_column("k", Column<bool>{true});
        auto result = pivot::reshape_wide(data, spec);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::TypeMismatch);
    }

    SECTION("a missing values column fails") {
        Table spec;
        spec.add_column(".name", Column<std::string>{"x"});
        spec.add_column(".value", Column<std::string>{"w"});
        spec.add_column("k", Column<std::string>{"x"});
        auto result = pivot::reshape_wide(data, spec);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::ColumnNotFound);
    }

    SECTION("a malformed spec fails before anything else") {
        Table spec;
        spec.add_column(".name", Column<std::string>{"x"});
        auto result = pivot::reshape_wide(data, spec);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::SpecMissingColumns);
    }
}

TEST_CASE("multiple values columns produce values-major columns", "[pivot][wider]") {
    Table data;
    data.add_column("id", Column<std::int64_t>{1, 1});
    data.add_column("k", Column<std::string>{"x", "y"});
    data.add_column("a", Column<std::int64_t>{1, 2});
    data.add_column("b", Column<std::string>{"p", "q"});

    pivot::PivotWiderOptions options{.names_from = select::cols({"k"}),
                                     .values_from = select::cols({"a", "b"})};
    auto result = pivot::pivot_wider(data, options);
    REQUIRE(result.has_value());
    REQUIRE(result->table.names() == Names{"id", "a_x", "a_y", "b_x", "b_y"});
    REQUIRE(ints(result->table, "a_y")[0] == 2);
    REQUIRE(column_kind(result->table.find_entry("b_x")->column) == ColumnKind::String);
}
