#include <oryx/ir/builder.hpp>
#include <oryx/runtime/csv.hpp>
#include <oryx/runtime/interpreter.hpp>
#include <oryx/runtime/ops.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace oryx;

namespace {

struct OutputConfig {
    bool csv = false;
};

auto load(const std::string& path) -> std::optional<Table> {
    auto table = runtime::read_csv(path);
    if (!table) {
        spdlog::error("{}", format_error(table.error()));
        return std::nullopt;
    }
    spdlog::debug("loaded {}: {} rows, {} columns", path, table->num_rows(),
                  table->num_columns());
    return std::move(*table);
}

auto emit(const Result<Table>& result, const OutputConfig& output) -> int {
    if (!result) {
        spdlog::error("{}", format_error(result.error()));
        return 1;
    }
    if (output.csv) {
        runtime::write_csv(*result, std::cout);
    } else {
        ops::print(*result, std::cout);
    }
    return 0;
}

auto parse_join_kind(const std::string& text) -> ir::JoinKind {
    if (text == "cross") {
        return ir::JoinKind::Cross;
    }
    if (text == "left") {
        return ir::JoinKind::Left;
    }
    if (text == "right") {
        return ir::JoinKind::Right;
    }
    if (text == "full") {
        return ir::JoinKind::Full;
    }
    if (text == "semi") {
        return ir::JoinKind::LeftSemi;
    }
    if (text == "anti") {
        return ir::JoinKind::LeftAnti;
    }
    return ir::JoinKind::Inner;
}

auto parse_set_op(const std::string& text) -> ir::SetOpKind {
    if (text == "intersect") {
        return ir::SetOpKind::Intersect;
    }
    if (text == "except") {
        return ir::SetOpKind::Except;
    }
    return ir::SetOpKind::Union;
}

auto parse_matching(const std::string& text) -> ir::ColumnMatch {
    if (text == "name") {
        return ir::ColumnMatch::ByName;
    }
    if (text == "inner-name") {
        return ir::ColumnMatch::InnerByName;
    }
    if (text == "full-name") {
        return ir::ColumnMatch::FullByName;
    }
    if (text == "left-name") {
        return ir::ColumnMatch::LeftByName;
    }
    return ir::ColumnMatch::Positional;
}

/// "count", "sum:price", "avg:qty" -> aggregate spec.
auto parse_aggregate(const std::string& text) -> std::optional<ir::AggSpec> {
    auto colon = text.find(':');
    std::string func = text.substr(0, colon);
    std::string column = colon == std::string::npos ? std::string{} : text.substr(colon + 1);
    std::string alias = column.empty() ? func : fmt::format("{}_{}", func, column);
    if (func == "count" && column.empty()) {
        return ops::make_agg(ir::AggFunc::CountStar, nullptr, alias);
    }
    if (column.empty()) {
        return std::nullopt;
    }
    auto arg = ops::col(column);
    if (func == "count") {
        return ops::make_agg(ir::AggFunc::Count, arg, alias);
    }
    if (func == "sum") {
        return ops::make_agg(ir::AggFunc::Sum, arg, alias);
    }
    if (func == "avg") {
        return ops::make_agg(ir::AggFunc::Avg, arg, alias);
    }
    if (func == "min") {
        return ops::make_agg(ir::AggFunc::Min, arg, alias);
    }
    if (func == "max") {
        return ops::make_agg(ir::AggFunc::Max, arg, alias);
    }
    if (func == "array_agg") {
        return ops::make_agg(ir::AggFunc::ArrayAgg, arg, alias);
    }
    return std::nullopt;
}

/// WITH RECURSIVE reach(src, dst) AS (
///   SELECT from, to FROM edges
///   UNION [ALL | DISTINCT]
///   SELECT r.src, e.to FROM reach r JOIN edges e ON r.dst = e.from)
/// SELECT * FROM reach
auto closure_plan(const std::string& from, const std::string& to, bool all) -> ir::NodePtr {
    ir::Builder b;

    ir::SelectSpec base;
    base.items = {ops::make_item(ops::col(from)), ops::make_item(ops::col(to))};

    ir::JoinSpec step_join;
    step_join.kind = ir::JoinKind::Inner;
    step_join.condition = ops::eq(ops::col("r.dst"), ops::col("e." + from));
    ir::SelectSpec step;
    step.items = {ops::make_item(ops::col("r.src"), "src"),
                  ops::make_item(ops::col("e." + to), "dst")};

    ir::SetOpSpec union_spec;
    union_spec.op = ir::SetOpKind::Union;
    union_spec.quantifier = all ? ir::SetQuantifier::All : ir::SetQuantifier::Distinct;

    auto query = b.set_op(
        union_spec, b.select(b.scan("edges"), std::move(base)),
        b.select(b.join(b.scan("reach", "r"), b.scan("edges", "e"), std::move(step_join)),
                 std::move(step)));

    std::vector<std::pair<ir::CteBinding, ir::NodePtr>> bindings;
    bindings.emplace_back(ir::CteBinding{.name = "reach", .column_names = {"src", "dst"}},
                          std::move(query));
    return b.with(true, std::move(bindings), b.scan("reach"));
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"oryx_run: evaluate relational operators over CSV tables"};
    app.set_version_flag("--version", "oryx_run 0.1.0");
    app.require_subcommand(1);

    bool verbose = false;
    OutputConfig output;
    std::size_t max_iterations = 500;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("--csv", output.csv, "Write results as CSV instead of an aligned table");
    app.add_option("--max-iterations", max_iterations,
                   "WITH RECURSIVE iterations allowed to add rows (default: 500)");

    // join
    auto* join_cmd = app.add_subcommand("join", "Join two CSV tables");
    std::string join_left;
    std::string join_right;
    std::string join_kind = "inner";
    std::vector<std::string> join_using;
    bool join_natural = false;
    join_cmd->add_option("left", join_left, "Left input CSV")->required();
    join_cmd->add_option("right", join_right, "Right input CSV")->required();
    join_cmd->add_option("-k,--kind", join_kind, "Join kind")
        ->check(CLI::IsMember({"inner", "cross", "left", "right", "full", "semi", "anti"}));
    join_cmd->add_option("-u,--using", join_using, "USING columns")->delimiter(',');
    join_cmd->add_flag("--natural", join_natural, "Join on all common column names");

    // setop
    auto* setop_cmd = app.add_subcommand("setop", "Combine two CSV tables");
    std::string setop_left;
    std::string setop_right;
    std::string setop_op = "union";
    std::string setop_match = "position";
    bool setop_distinct = false;
    setop_cmd->add_option("left", setop_left, "Left input CSV")->required();
    setop_cmd->add_option("right", setop_right, "Right input CSV")->required();
    setop_cmd->add_option("-o,--op", setop_op, "Set operation")
        ->check(CLI::IsMember({"union", "intersect", "except"}));
    setop_cmd->add_option("-m,--match", setop_match, "Column matching")
        ->check(CLI::IsMember({"position", "name", "inner-name", "full-name", "left-name"}));
    setop_cmd->add_flag("-d,--distinct", setop_distinct, "DISTINCT instead of ALL");

    // group
    auto* group_cmd = app.add_subcommand("group", "Aggregate a CSV table");
    std::string group_input;
    std::vector<std::string> group_keys;
    std::vector<std::string> group_aggs;
    std::string group_mode = "simple";
    group_cmd->add_option("input", group_input, "Input CSV")->required();
    group_cmd->add_option("-k,--keys", group_keys, "Grouping columns")->delimiter(',');
    group_cmd->add_option("-a,--agg", group_aggs, "Aggregates: count, sum:col, avg:col, ...")
        ->delimiter(',');
    group_cmd->add_option("--mode", group_mode, "Grouping mode")
        ->check(CLI::IsMember({"simple", "rollup", "cube"}));

    // distinct
    auto* distinct_cmd = app.add_subcommand("distinct", "Drop duplicate rows of a CSV table");
    std::string distinct_input;
    distinct_cmd->add_option("input", distinct_input, "Input CSV")->required();

    // closure
    auto* closure_cmd =
        app.add_subcommand("closure", "Transitive closure of an edge list via WITH RECURSIVE");
    std::string closure_input;
    std::string closure_from = "src";
    std::string closure_to = "dst";
    bool closure_all = false;
    closure_cmd->add_option("edges", closure_input, "Edge list CSV")->required();
    closure_cmd->add_option("--from", closure_from, "Source column (default: src)");
    closure_cmd->add_option("--to", closure_to, "Target column (default: dst)");
    closure_cmd->add_flag("--all", closure_all,
                          "UNION ALL instead of UNION DISTINCT (cycles do not terminate)");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    runtime::EvalOptions options;
    options.max_recursion_iterations = max_iterations;

    if (*join_cmd) {
        auto left = load(join_left);
        auto right = load(join_right);
        if (!left || !right) {
            return 1;
        }
        ir::JoinSpec spec;
        spec.kind = parse_join_kind(join_kind);
        spec.using_columns = join_using;
        spec.natural = join_natural;
        return emit(ops::join(*left, *right, std::move(spec), options), output);
    }
    if (*setop_cmd) {
        auto left = load(setop_left);
        auto right = load(setop_right);
        if (!left || !right) {
            return 1;
        }
        ir::SetOpSpec spec;
        spec.op = parse_set_op(setop_op);
        spec.quantifier = setop_distinct ? ir::SetQuantifier::Distinct : ir::SetQuantifier::All;
        spec.matching = parse_matching(setop_match);
        return emit(ops::set_op(*left, *right, std::move(spec), options), output);
    }
    if (*group_cmd) {
        auto input = load(group_input);
        if (!input) {
            return 1;
        }
        std::vector<ir::AggSpec> aggs;
        for (const auto& text : group_aggs) {
            auto agg = parse_aggregate(text);
            if (!agg) {
                spdlog::error("unknown aggregate: {}", text);
                return 1;
            }
            aggs.push_back(std::move(*agg));
        }
        ir::GroupingSpec grouping = ops::group_by_columns(group_keys);
        if (group_mode != "simple" && !group_keys.empty()) {
            ir::GroupByItem item;
            item.kind = group_mode == "rollup" ? ir::GroupByKind::Rollup : ir::GroupByKind::Cube;
            for (const auto& key : group_keys) {
                item.elements.push_back(ir::GroupingElement{{ops::col(key)}});
            }
            grouping.items = {std::move(item)};
        }
        return emit(ops::aggregate(*input, std::move(grouping), std::move(aggs), options), output);
    }
    if (*distinct_cmd) {
        auto input = load(distinct_input);
        if (!input) {
            return 1;
        }
        return emit(ops::distinct(*input, options), output);
    }
    if (*closure_cmd) {
        auto input = load(closure_input);
        if (!input) {
            return 1;
        }
        TableRegistry registry;
        registry.emplace("edges", std::move(*input));
        auto plan = closure_plan(closure_from, closure_to, closure_all);
        return emit(runtime::interpret(*plan, registry, options), output);
    }
    return EXIT_FAILURE;
}
