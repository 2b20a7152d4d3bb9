#include <reshape/select/selector.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace reshape;

namespace {

auto make_table() -> Table {
    Table table;
    table.add_column("id", Column<std::int64_t>{1, 2});
    table.add_column("x_1", Column<double>{1.0, 2.0});
    table.add_column("x_2", Column<double>{3.0, 4.0});
    table.add_column("label", Column<std::string>{"a", "b"});
    table.add_column("y_1", Column<double>{5.0, 6.0});
    return table;
}

}  // namespace

TEST_CASE("cols resolves names in the given order", "[select]") {
    auto table = make_table();
    auto result = select::resolve(table, select::cols({"label", "id"}));
    REQUIRE(result.has_value());
    REQUIRE(*result == select::Positions{3, 0});
}

TEST_CASE("cols reports an unknown column with the available names", "[select]") {
    auto table = make_table();
    auto result = select::resolve(table, select::cols({"nope"}));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::ColumnNotFound);
    REQUIRE(result.error().message.find("nope") != std::string::npos);
    REQUIRE(result.error().message.find("x_1") != std::string::npos);
}

TEST_CASE("range is inclusive and may run backwards", "[select]") {
    auto table = make_table();
    auto forward = select::resolve(table, select::range("x_1", "label"));
    REQUIRE(forward.has_value());
    REQUIRE(*forward == select::Positions{1, 2, 3});

    auto backward = select::resolve(table, select::range("label", "x_1"));
    REQUIRE(backward.has_value());
    REQUIRE(*backward == select::Positions{3, 2, 1});
}

TEST_CASE("name pattern selectors", "[select]") {
    auto table = make_table();
    REQUIRE(*select::resolve(table, select::starts_with("x_")) == select::Positions{1, 2});
    REQUIRE(*select::resolve(table, select::ends_with("_1")) == select::Positions{1, 4});
    REQUIRE(*select::resolve(table, select::contains("abe")) == select::Positions{3});
    REQUIRE(select::resolve(table, select::everything())->size() == 5);
}

TEST_CASE("where selects by column content", "[select]") {
    auto table = make_table();
    auto doubles = select::where([](const ColumnEntry& entry) {
        return column_kind(entry.column) == ColumnKind::Double;
    });
    REQUIRE(*select::resolve(table, doubles) == select::Positions{1, 2, 4});
}

TEST_CASE("union de-duplicates in first-seen order", "[select]") {
    auto table = make_table();
    auto sel = select::any_of({select::cols({"x_2"}), select::starts_with("x_"), select::cols({"id"})});
    REQUIRE(*select::resolve(table, sel) == select::Positions{2, 1, 0});
}

TEST_CASE("all_except removes a selection", "[select]") {
    auto table = make_table();
    auto sel = select::all_except(select::any_of({select::cols({"id"}), select::starts_with("x_")}));
    REQUIRE(*select::resolve(table, sel) == select::Positions{3, 4});
}

TEST_CASE("positions are range-checked", "[select]") {
    auto table = make_table();
    REQUIRE(*select::resolve(table, select::positions({4, 0})) == select::Positions{4, 0});
    auto bad = select::resolve(table, select::positions({9}));
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == ErrorCode::ColumnNotFound);
}

TEST_CASE("resolve_required rejects an empty selection", "[select]") {
    auto table = make_table();
    auto result = select::resolve_required(table, select::starts_with("zzz"), "values_from");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::EmptySelection);
    REQUIRE(result.error().message == "`values_from` must select at least one column.");
}
