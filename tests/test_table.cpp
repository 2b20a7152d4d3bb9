#include <reshape/core/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <memory>
#include <vector>

using namespace reshape;

TEST_CASE("Table add_column replaces by name, push_column appends", "[core][table]") {
    Table table;
    table.add_column("a", Column<std::int64_t>{1, 2});
    table.add_column("b", Column<std::string>{"x", "y"});
    table.add_column("a", Column<std::int64_t>{3, 4});

    REQUIRE(table.columns.size() == 2);
    REQUIRE(table.rows() == 2);
    REQUIRE(std::get<Column<std::int64_t>>(*table.find("a"))[0] == 3);

    table.push_column(ColumnEntry{.name = "a", .column = Column<std::int64_t>{5, 6}});
    REQUIRE(table.columns.size() == 3);
    REQUIRE(table.position("a") == 0);
    REQUIRE(table.names() == std::vector<std::string>{"a", "b", "a"});
}

TEST_CASE("Zero-column tables keep an explicit row count", "[core][table]") {
    Table table;
    table.bare_rows = 4;
    REQUIRE(table.rows() == 4);
    REQUIRE(table.columns.empty());
}

TEST_CASE("scalar_at reads nulls, labels and booleans", "[core][table]") {
    ColumnEntry ints{.name = "i", .column = Column<std::int64_t>{1, 0}, .validity = {{true, false}}};
    ColumnEntry factor{.name = "f",
                       .column = Column<Categorical>{{"lo", "hi"}, {1, 0}}};

    REQUIRE(std::get<std::int64_t>(scalar_at(ints, 0)) == 1);
    REQUIRE(std::holds_alternative<std::monostate>(scalar_at(ints, 1)));
    REQUIRE(std::get<std::string>(scalar_at(factor, 0)) == "hi");
}

TEST_CASE("append_scalar coerces numbers and rejects foreign kinds", "[core][table]") {
    ColumnEntry ints{.name = "i", .column = Column<std::int64_t>{}};

    REQUIRE(append_scalar(ints, ScalarValue{std::int64_t{7}}));
    REQUIRE(append_scalar(ints, ScalarValue{2.0}));
    REQUIRE_FALSE(append_scalar(ints, ScalarValue{2.5}));
    REQUIRE_FALSE(append_scalar(ints, ScalarValue{std::string("x")}));
    REQUIRE(append_scalar(ints, ScalarValue{}));

    const auto& col = std::get<Column<std::int64_t>>(ints.column);
    REQUIRE(col.size() == 3);
    REQUIRE(col[1] == 2);
    REQUIRE(is_null(ints, 2));
    REQUIRE_FALSE(is_null(ints, 0));
}

TEST_CASE("take with absent positions produces null cells", "[core][table]") {
    ColumnEntry src{.name = "v", .column = Column<double>{1.5, 2.5}};
    std::vector<std::optional<std::size_t>> rows{1, std::nullopt, 0};

    auto out = take(src, std::span<const std::optional<std::size_t>>(rows));

    REQUIRE(column_size(out.column) == 3);
    REQUIRE(std::get<Column<double>>(out.column)[0] == 2.5);
    REQUIRE(is_null(out, 1));
    REQUIRE_FALSE(is_null(out, 2));
}

TEST_CASE("make_empty_like keeps categorical levels", "[core][table]") {
    ColumnValue factor = Column<Categorical>{{"b", "a"}, {0, 1}, true};
    auto empty = make_empty_like(factor);
    const auto& col = std::get<Column<Categorical>>(empty);
    REQUIRE(col.empty());
    REQUIRE(col.is_ordered());
    REQUIRE(col.levels() == std::vector<std::string>{"b", "a"});
}

TEST_CASE("compare_cells orders nulls last and factors by level", "[core][table]") {
    ColumnEntry ints{.name = "i",
                     .column = Column<std::int64_t>{3, 0, 1},
                     .validity = {{true, false, true}}};
    REQUIRE(compare_cells(ints, 2, 0) < 0);
    REQUIRE(compare_cells(ints, 1, 0) > 0);

    ColumnEntry factor{.name = "f", .column = Column<Categorical>{{"z", "a"}, {1, 0}}};
    // "z" is the first level, so it sorts before "a".
    REQUIRE(compare_cells(factor, 1, 0) < 0);
}

TEST_CASE("format_scalar renders synthesized-name text", "[core][table]") {
    REQUIRE(format_scalar(ScalarValue{}) == "NA");
    REQUIRE(format_scalar(ScalarValue{true}) == "TRUE");
    REQUIRE(format_scalar(ScalarValue{std::int64_t{42}}) == "42");
    REQUIRE(format_scalar(ScalarValue{1.5}) == "1.5");
    REQUIRE(format_scalar(ScalarValue{std::string("x")}) == "x");
}

TEST_CASE("RowKey treats two nulls and two NaNs as equal", "[core][table]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    ColumnEntry v{.name = "v",
                  .column = Column<double>{nan, nan, 0.0, 0.0},
                  .validity = {{true, true, false, false}}};
    std::vector<const ColumnEntry*> cols{&v};

    RowKeyEq eq;
    RowKeyHash hash;
    auto a = row_key(cols, 0);
    auto b = row_key(cols, 1);
    auto c = row_key(cols, 2);
    auto d = row_key(cols, 3);
    REQUIRE(eq(a, b));
    REQUIRE(hash(a) == hash(b));
    REQUIRE(eq(c, d));
    REQUIRE_FALSE(eq(a, c));
}

TEST_CASE("concat_rows stacks tables with the same layout", "[core][table]") {
    Table first;
    first.add_column("x", Column<std::int64_t>{1});
    Table second;
    second.add_column("x", Column<std::int64_t>{2, 3});
    std::vector<Table> parts{first, second};

    auto out = concat_rows(parts);

    REQUIRE(out.rows() == 3);
    REQUIRE(std::get<Column<std::int64_t>>(*out.find("x"))[2] == 3);
}

TEST_CASE("widen_to_double converts int columns in place", "[core][table]") {
    ColumnEntry v{.name = "v", .column = Column<std::int64_t>{1, 2}};
    widen_to_double(v);
    REQUIRE(column_kind(v.column) == ColumnKind::Double);
    REQUIRE(std::get<Column<double>>(v.column)[1] == 2.0);
}
