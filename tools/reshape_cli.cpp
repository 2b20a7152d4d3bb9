#include <reshape/reshape.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct InputArgs {
    std::string path;
    std::string nulls = "<empty>,NA";
    std::vector<std::string> factors;
};

struct WiderArgs {
    std::vector<std::string> id_cols;
    std::vector<std::string> names_from;
    std::vector<std::string> values_from;
    std::string names_prefix;
    std::string names_sep = "_";
    std::string names_glue;
    bool names_sort = false;
    std::string values_fill;
    std::string values_fn;
    std::string names_repair = "check_unique";
};

struct LongerArgs {
    std::vector<std::string> cols;
    std::vector<std::string> names_to = {"name"};
    std::string values_to = "value";
    std::string names_prefix;
    std::string names_sep;
    bool drop_na = false;
    std::string names_repair = "check_unique";
};

struct ExpandArgs {
    std::vector<std::string> cols;
    bool nesting = false;
    std::string names_repair = "check_unique";
};

auto fail(const reshape::Error& error) -> int {
    spdlog::debug("error code: {}", reshape::error_code_name(error.code));
    std::cerr << "reshape: " << error.message << '\n';
    return 1;
}

/// Interpret a command-line fill value as int, double, TRUE/FALSE or text.
auto parse_fill(const std::string& text) -> reshape::ScalarValue {
    if (text == "NA") {
        return reshape::ScalarValue{};
    }
    if (text == "TRUE" || text == "FALSE") {
        return reshape::ScalarValue{text == "TRUE"};
    }
    std::int64_t as_int = 0;
    auto int_result = std::from_chars(text.data(), text.data() + text.size(), as_int);
    if (int_result.ec == std::errc() && int_result.ptr == text.data() + text.size()) {
        return reshape::ScalarValue{as_int};
    }
    char* end = nullptr;
    double as_double = std::strtod(text.c_str(), &end);
    if (end != text.c_str() && *end == '\0') {
        return reshape::ScalarValue{as_double};
    }
    return reshape::ScalarValue{text};
}

void add_input_options(CLI::App* command, InputArgs& input, std::string& output) {
    command->add_option("csv", input.path, "Input CSV file")->required()->check(CLI::ExistingFile);
    command->add_option("--nulls", input.nulls,
                        "Comma-separated cell texts read as missing; <empty> for empty cells");
    command->add_option("--factor", input.factors, "Read this column as a categorical")
        ->delimiter(',');
    command->add_option("-o,--output", output, "Write the result as CSV instead of printing it");
}

auto load(const InputArgs& input) -> std::expected<reshape::Table, reshape::Error> {
    auto options = reshape::io::parse_null_spec(input.nulls);
    options.categorical_columns.insert(input.factors.begin(), input.factors.end());
    return reshape::io::read_csv(input.path, options);
}

auto emit(const reshape::pivot::PivotResult& result, const std::string& output) -> int {
    for (const auto& diagnostic : result.diagnostics) {
        spdlog::warn("{}", diagnostic.message);
    }
    if (output.empty()) {
        reshape::io::print_table(result.table, std::cout, 50);
        return 0;
    }
    std::ofstream file(output);
    if (!file) {
        return fail(reshape::Error{.code = reshape::ErrorCode::Io,
                                   .message = fmt::format("cannot open {} for writing", output)});
    }
    auto written = reshape::io::write_csv(result.table, file);
    if (!written) {
        return fail(written.error());
    }
    spdlog::info("wrote {} rows to {}", result.table.rows(), output);
    return 0;
}

auto run_wider(const InputArgs& input, const WiderArgs& args, const std::string& output) -> int {
    auto data = load(input);
    if (!data) {
        return fail(data.error());
    }
    auto repair = reshape::names::parse_policy(args.names_repair);
    if (!repair) {
        return fail(repair.error());
    }

    reshape::pivot::PivotWiderOptions options;
    if (!args.id_cols.empty()) {
        options.id_cols = reshape::select::cols(args.id_cols);
    }
    if (!args.names_from.empty()) {
        options.names_from = reshape::select::cols(args.names_from);
    }
    if (!args.values_from.empty()) {
        options.values_from = reshape::select::cols(args.values_from);
    }
    options.names_prefix = args.names_prefix;
    options.names_sep = args.names_sep;
    if (!args.names_glue.empty()) {
        options.names_glue = args.names_glue;
    }
    options.names_sort = args.names_sort;
    options.names_repair = *repair;
    if (!args.values_fill.empty()) {
        options.values_fill = parse_fill(args.values_fill);
    }
    if (!args.values_fn.empty()) {
        auto fn = reshape::agg::by_name(args.values_fn);
        if (!fn.has_value()) {
            return fail(reshape::Error{
                .code = reshape::ErrorCode::InvalidValuesFn,
                .message = fmt::format("unknown --values-fn: {}", args.values_fn)});
        }
        options.values_fn = *fn;
    }

    auto result = reshape::pivot::pivot_wider(*data, options);
    if (!result) {
        return fail(result.error());
    }
    return emit(*result, output);
}

auto run_longer(const InputArgs& input, const LongerArgs& args, const std::string& output)
    -> int {
    auto data = load(input);
    if (!data) {
        return fail(data.error());
    }
    auto repair = reshape::names::parse_policy(args.names_repair);
    if (!repair) {
        return fail(repair.error());
    }

    reshape::pivot::PivotLongerOptions options;
    options.cols = reshape::select::cols(args.cols);
    options.names_to = args.names_to;
    options.values_to = args.values_to;
    options.names_prefix = args.names_prefix;
    if (!args.names_sep.empty()) {
        options.names_sep = args.names_sep;
    }
    options.values_drop_na = args.drop_na;
    options.names_repair = *repair;

    auto result = reshape::pivot::pivot_longer(*data, options);
    if (!result) {
        return fail(result.error());
    }
    return emit(*result, output);
}

auto run_expand(const InputArgs& input, const ExpandArgs& args, const std::string& output)
    -> int {
    auto data = load(input);
    if (!data) {
        return fail(data.error());
    }
    auto repair = reshape::names::parse_policy(args.names_repair);
    if (!repair) {
        return fail(repair.error());
    }

    std::vector<reshape::expand::ExpandArg> expand_args;
    if (args.nesting) {
        expand_args.emplace_back(reshape::expand::Nesting{.cols = reshape::select::cols(args.cols)});
    } else {
        for (const auto& col : args.cols) {
            expand_args.emplace_back(reshape::select::cols({col}));
        }
    }
    auto table = reshape::expand::expand(*data, expand_args, *repair);
    if (!table) {
        return fail(table.error());
    }
    return emit(reshape::pivot::PivotResult{.table = std::move(*table), .diagnostics = {}},
                output);
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"reshape: pivot tables between long and wide layouts"};
    app.require_subcommand(1);

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    InputArgs input;
    std::string output;

    WiderArgs wider;
    auto* wider_cmd = app.add_subcommand("wider", "Spread names/values columns into new columns");
    add_input_options(wider_cmd, input, output);
    wider_cmd->add_option("--id-cols", wider.id_cols, "Identifier columns")->delimiter(',');
    wider_cmd->add_option("--names-from", wider.names_from, "Columns supplying new column names")
        ->delimiter(',');
    wider_cmd->add_option("--values-from", wider.values_from, "Columns supplying cell values")
        ->delimiter(',');
    wider_cmd->add_option("--names-prefix", wider.names_prefix, "Prefix for new column names");
    wider_cmd->add_option("--names-sep", wider.names_sep, "Separator between name pieces");
    wider_cmd->add_option("--names-glue", wider.names_glue, "Name template, e.g. {.value}_{key}");
    wider_cmd->add_flag("--names-sort", wider.names_sort, "Sort new columns by their keys");
    wider_cmd->add_option("--values-fill", wider.values_fill, "Value for absent cells");
    wider_cmd->add_option("--values-fn", wider.values_fn, "Aggregation for duplicate keys")
        ->check(CLI::IsMember({"sum", "mean", "min", "max", "count", "first", "last", "list"}));
    wider_cmd->add_option("--names-repair", wider.names_repair, "minimal, unique or check_unique");

    LongerArgs longer;
    auto* longer_cmd = app.add_subcommand("longer", "Stack columns into name/value pairs");
    add_input_options(longer_cmd, input, output);
    longer_cmd->add_option("--cols", longer.cols, "Columns to stack")->required()->delimiter(',');
    longer_cmd->add_option("--names-to", longer.names_to, "Key columns to create")
        ->delimiter(',');
    longer_cmd->add_option("--values-to", longer.values_to, "Column receiving the values");
    longer_cmd->add_option("--names-prefix", longer.names_prefix, "Prefix stripped from names");
    longer_cmd->add_option("--names-sep", longer.names_sep, "Separator splitting names");
    longer_cmd->add_flag("--drop-na", longer.drop_na, "Drop rows whose values are all missing");
    longer_cmd->add_option("--names-repair", longer.names_repair,
                           "minimal, unique or check_unique");

    ExpandArgs expand;
    auto* expand_cmd = app.add_subcommand("expand", "All combinations of the given columns");
    add_input_options(expand_cmd, input, output);
    expand_cmd->add_option("--cols", expand.cols, "Columns to combine")->required()->delimiter(',');
    expand_cmd->add_flag("--nesting", expand.nesting, "Only combinations present in the data");
    expand_cmd->add_option("--names-repair", expand.names_repair,
                           "minimal, unique or check_unique");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (wider_cmd->parsed()) {
        return run_wider(input, wider, output);
    }
    if (longer_cmd->parsed()) {
        return run_longer(input, longer, output);
    }
    return run_expand(input, expand, output);
}
