#include <reshape/core/column.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

TEST_CASE("Column<int64_t> basic operations", "[core][column]") {
    reshape::Column<std::int64_t> col{1, 2, 3, 4, 5};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE_FALSE(col.empty());
        REQUIRE(col.at(0) == 1);
        REQUIRE(col[4] == 5);
    }

    SECTION("push_back grows the column") {
        col.push_back(6);
        REQUIRE(col.size() == 6);
        REQUIRE(col.at(5) == 6);
    }

    SECTION("at() throws on out-of-bounds") {
        REQUIRE_THROWS_AS(col.at(100), std::out_of_range);
    }
}

TEST_CASE("Column take gathers rows in index order", "[core][column]") {
    reshape::Column<std::string> col{"a", "b", "c"};
    std::vector<std::size_t> rows{2, 0, 0};

    auto taken = col.take(rows);

    REQUIRE(taken.size() == 3);
    REQUIRE(taken[0] == "c");
    REQUIRE(taken[1] == "a");
    REQUIRE(taken[2] == "a");
}

TEST_CASE("Column<bool> supports element access and mutation", "[core][column]") {
    reshape::Column<bool> col{true, false};

    col[1] = true;
    col.push_back(false);

    REQUIRE(col.size() == 3);
    REQUIRE(col[0]);
    REQUIRE(col[1]);
    REQUIRE_FALSE(col[2]);
}

TEST_CASE("Column copies do not alias", "[core][column]") {
    reshape::Column<double> original{1.5, 2.5};
    auto copy = original;

    copy[0] = 9.0;

    REQUIRE(original[0] == 1.5);
    REQUIRE(copy[0] == 9.0);
}

TEST_CASE("Column<Categorical> levels and codes", "[core][column][categorical]") {
    std::vector<std::string> labels{"low", "high", "low", "mid"};
    auto col = reshape::Column<reshape::Categorical>::from_labels(labels);

    SECTION("levels follow first appearance") {
        REQUIRE(col.levels() == std::vector<std::string>{"low", "high", "mid"});
        REQUIRE(col.size() == 4);
        REQUIRE(col[0] == "low");
        REQUIRE(col[3] == "mid");
        REQUIRE(col.code_at(2) == 0);
    }

    SECTION("pushing an unseen label appends a level") {
        col.push_back("extreme");
        REQUIRE(col.levels().size() == 4);
        REQUIRE(col.code_at(4) == 3);
        REQUIRE(col.find_code("extreme") == 3);
        REQUIRE_FALSE(col.find_code("absent").has_value());
    }

    SECTION("take keeps unused levels") {
        std::vector<std::size_t> rows{1};
        auto taken = col.take(rows);
        REQUIRE(taken.size() == 1);
        REQUIRE(taken[0] == "high");
        REQUIRE(taken.levels().size() == 3);
    }
}

TEST_CASE("Column<Categorical> declared order and orderedness", "[core][column][categorical]") {
    reshape::Column<reshape::Categorical> col({"c", "b", "a"}, {2, 0}, true);

    REQUIRE(col.is_ordered());
    REQUIRE(col[0] == "a");
    REQUIRE(col[1] == "c");

    auto empty = col.empty_like();
    REQUIRE(empty.empty());
    REQUIRE(empty.is_ordered());
    REQUIRE(empty.levels() == std::vector<std::string>{"c", "b", "a"});
}
