#include <oryx/ir/builder.hpp>
#include <oryx/runtime/interpreter.hpp>
#include <oryx/runtime/ops.hpp>

#include <fmt/core.h>

#include <iostream>

using namespace oryx;

auto main() -> int {
    // Two small tables
    TableRegistry tables;
    tables.emplace("trades", make_table({"symbol", "price"},
                                        {
                                            {Value::string("A"), Value::int64(10)},
                                            {Value::string("B"), Value::int64(20)},
                                            {Value::string("A"), Value::int64(30)},
                                            {Value::string("C"), Value::null()},
                                        }));
    tables.emplace("names", make_table({"symbol", "name"},
                                       {
                                           {Value::string("A"), Value::string("Alpha")},
                                           {Value::string("B"), Value::string("Beta")},
                                       }));

    fmt::print("=== LEFT JOIN USING (symbol) ===\n");
    ir::Builder builder;
    ir::JoinSpec using_symbol;
    using_symbol.kind = ir::JoinKind::Left;
    using_symbol.using_columns = {"symbol"};
    auto join = builder.join(builder.scan("trades"), builder.scan("names"), using_symbol);
    auto joined = runtime::interpret(*join, tables);
    if (!joined) {
        fmt::print("error: {}\n", format_error(joined.error()));
        return 1;
    }
    ops::print(*joined, std::cout);

    fmt::print("\n=== GROUP BY ROLLUP (symbol) ===\n");
    ir::GroupingSpec rollup;
    rollup.items.push_back(ir::GroupByItem{.kind = ir::GroupByKind::Rollup,
                                           .elements = {ir::GroupingElement{{ops::col("symbol")}}},
                                           .sets = {}});
    auto totals = ops::aggregate(tables.at("trades"), std::move(rollup),
                                 {ops::make_agg(ir::AggFunc::Sum, ops::col("price"), "total"),
                                  ops::make_agg(ir::AggFunc::CountStar, nullptr, "n")});
    if (!totals) {
        fmt::print("error: {}\n", format_error(totals.error()));
        return 1;
    }
    ops::print(*totals, std::cout);

    fmt::print("\n=== WITH RECURSIVE r(n) counting to 5 ===\n");
    ir::SelectSpec base;
    base.items = {ops::make_item(ops::int_lit(1), "n")};
    ir::SelectSpec step;
    step.where = ops::cmp(CompareOp::Lt, ops::col("n"), ops::int_lit(5));
    step.items = {ops::make_item(
        ops::binop(ir::ArithmeticOp::Add, ops::col("n"), ops::int_lit(1)), "n")};
    ir::SetOpSpec union_all;
    union_all.op = ir::SetOpKind::Union;
    union_all.quantifier = ir::SetQuantifier::All;

    std::vector<std::pair<ir::CteBinding, ir::NodePtr>> bindings;
    bindings.emplace_back(ir::CteBinding{.name = "r", .column_names = {"n"}},
                          builder.set_op(union_all, builder.select(nullptr, std::move(base)),
                                         builder.select(builder.scan("r"), std::move(step))));
    auto with = builder.with(true, std::move(bindings), builder.scan("r"));
    auto counted = runtime::interpret(*with, tables);
    if (!counted) {
        fmt::print("error: {}\n", format_error(counted.error()));
        return 1;
    }
    ops::print(*counted, std::cout);

    return 0;
}
