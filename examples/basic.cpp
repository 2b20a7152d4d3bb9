#include <reshape/reshape.hpp>

#include <fmt/core.h>

#include <iostream>

auto main() -> int {
    using namespace reshape;

    // A long table: one row per (id, key) observation
    Table scores;
    scores.add_column("id", Column<std::int64_t>{1, 1, 2, 2, 3});
    scores.add_column("key", Column<std::string>{"math", "art", "math", "art", "math"});
    scores.add_column("score", Column<std::int64_t>{90, 75, 60, 88, 70});

    fmt::print("=== long ===\n");
    io::print_table(scores, std::cout);

    auto wide = pivot::pivot_wider(scores, {.names_from = select::cols({"key"}),
                                            .values_from = select::cols({"score"}),
                                            .values_fill = ScalarValue{std::int64_t{0}}});
    if (!wide) {
        fmt::print("pivot_wider failed: {}\n", wide.error().message);
        return 1;
    }
    fmt::print("\n=== wide ===\n");
    io::print_table(wide->table, std::cout);

    auto back = pivot::pivot_longer(wide->table, {.cols = select::all_except(select::cols({"id"})),
                                                  .names_to = {"key"},
                                                  .values_to = "score"});
    if (!back) {
        fmt::print("pivot_longer failed: {}\n", back.error().message);
        return 1;
    }
    fmt::print("\n=== long again ===\n");
    io::print_table(back->table, std::cout);

    std::vector<expand::GridInput> inputs = {
        ColumnEntry{.name = "x", .column = Column<std::int64_t>{1, 2}},
        ColumnEntry{.name = "y", .column = Column<std::string>{"a", "b", "c"}},
    };
    auto grid = expand::expand_grid(inputs);
    if (!grid) {
        fmt::print("expand_grid failed: {}\n", grid.error().message);
        return 1;
    }
    fmt::print("\n=== grid ===\n");
    io::print_table(*grid, std::cout);

    return 0;
}
