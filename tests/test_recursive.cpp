#include <oryx/ir/builder.hpp>
#include <oryx/ir/validate.hpp>
#include <oryx/runtime/interpreter.hpp>
#include <oryx/runtime/ops.hpp>
#include <oryx/runtime/recursive.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace oryx;

namespace {

using Strings = std::vector<std::string>;
using Bindings = std::vector<std::pair<ir::CteBinding, ir::NodePtr>>;

auto values(const Table& t, std::string_view name) -> Strings {
    auto column = t.column(name);
    REQUIRE(column.has_value());
    Strings out;
    for (const auto& v : *column) {
        out.push_back(v.to_string());
    }
    return out;
}

auto union_of(ir::SetQuantifier quantifier) -> ir::SetOpSpec {
    ir::SetOpSpec spec;
    spec.op = ir::SetOpKind::Union;
    spec.quantifier = quantifier;
    return spec;
}

auto binding(std::string name, std::vector<std::string> columns = {}) -> ir::CteBinding {
    return ir::CteBinding{.name = std::move(name), .column_names = std::move(columns)};
}

/// SELECT 1 AS n
auto select_one(ir::Builder& b) -> ir::NodePtr {
    ir::SelectSpec spec;
    spec.items = {ops::make_item(ops::int_lit(1), "n")};
    return b.select(nullptr, std::move(spec));
}

/// WITH RECURSIVE r(n) AS (SELECT 1 UNION ALL SELECT n + 1 FROM r WHERE n < limit) SELECT * FROM r
auto counter(std::int64_t limit) -> ir::NodePtr {
    ir::Builder b;
    ir::SelectSpec step;
    step.where = ops::cmp(CompareOp::Lt, ops::col("n"), ops::int_lit(limit));
    step.items = {
        ops::make_item(ops::binop(ir::ArithmeticOp::Add, ops::col("n"), ops::int_lit(1)), "n")};
    Bindings bindings;
    bindings.emplace_back(binding("r", {"n"}),
                          b.set_op(union_of(ir::SetQuantifier::All), select_one(b),
                                   b.select(b.scan("r"), std::move(step))));
    return b.with(true, std::move(bindings), b.scan("r"));
}

auto edges() -> TableRegistry {
    TableRegistry tables;
    tables.emplace("edges", make_table({"src", "dst"}, {
                                                           {Value::int64(1), Value::int64(2)},
                                                           {Value::int64(2), Value::int64(3)},
                                                           {Value::int64(3), Value::int64(1)},
                                                       }));
    return tables;
}

/// Nodes reachable from 1 over a three-node cycle.
auto reach(ir::SetQuantifier quantifier) -> ir::NodePtr {
    ir::Builder b;
    ir::JoinSpec on;
    on.kind = ir::JoinKind::Inner;
    on.condition = ops::eq(ops::col("reach.n"), ops::col("e.src"));
    ir::SelectSpec step;
    step.items = {ops::make_item(ops::col("e.dst"), "n")};
    Bindings bindings;
    bindings.emplace_back(
        binding("reach"),
        b.set_op(union_of(quantifier), select_one(b),
                 b.select(b.join(b.scan("reach"), b.scan("edges", "e"), std::move(on)),
                          std::move(step))));
    return b.with(true, std::move(bindings), b.scan("reach"));
}

auto error_kind(const ir::Node& plan, const TableRegistry& tables = {},
                const runtime::EvalOptions& options = {}) -> ErrorKind {
    auto result = runtime::interpret(plan, tables, options);
    REQUIRE_FALSE(result.has_value());
    return result.error().kind;
}

/// WITH RECURSIVE r AS (SELECT 1 AS n UNION ALL <term>) SELECT * FROM r
auto with_term(ir::Builder& b, ir::NodePtr term,
               ir::SetQuantifier quantifier = ir::SetQuantifier::All) -> ir::NodePtr {
    Bindings bindings;
    bindings.emplace_back(binding("r"),
                          b.set_op(union_of(quantifier), select_one(b), std::move(term)));
    return b.with(true, std::move(bindings), b.scan("r"));
}

}  // namespace

TEST_CASE("recursive: counter terminates", "[recursive]") {
    auto t = runtime::interpret(*counter(3), {});
    REQUIRE(t.has_value());
    CHECK(values(*t, "n") == Strings{"1", "2", "3"});
}

TEST_CASE("recursive: iteration cap counts iterations that add rows", "[recursive]") {
    runtime::EvalOptions options;
    options.max_recursion_iterations = 2;
    auto ok = runtime::interpret(*counter(3), {}, options);
    REQUIRE(ok.has_value());
    CHECK(ok->num_rows() == 3);

    options.max_recursion_iterations = 1;
    CHECK(error_kind(*counter(3), {}, options) == ErrorKind::NonTerminatingRecursion);
}

TEST_CASE("recursive: UNION DISTINCT terminates on a cycle", "[recursive]") {
    auto t = runtime::interpret(*reach(ir::SetQuantifier::Distinct), edges());
    REQUIRE(t.has_value());
    CHECK(values(*t, "n") == Strings{"1", "2", "3"});
}

TEST_CASE("recursive: UNION ALL on a cycle hits the iteration cap", "[recursive]") {
    runtime::EvalOptions options;
    options.max_recursion_iterations = 10;
    auto result = runtime::interpret(*reach(ir::SetQuantifier::All), edges(), options);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == ErrorKind::NonTerminatingRecursion);
    CHECK(result.error().op == "WITH RECURSIVE");
}

TEST_CASE("recursive: evaluate_recursive iterates a step function", "[recursive]") {
    auto base = make_table({"n"}, {{Value::int64(1)}});
    runtime::RecursiveStep doubling = [](const Table& working, std::size_t) -> Result<Table> {
        Table out;
        out.schema = working.schema;
        for (const auto& row : working.rows) {
            if (row[0].as_int64() < 16) {
                out.rows.push_back({Value::int64(row[0].as_int64() * 2)});
            }
        }
        return out;
    };
    runtime::EvalContext ctx;
    auto t = runtime::evaluate_recursive(base, doubling, ir::SetQuantifier::All, 500, ctx);
    REQUIRE(t.has_value());
    CHECK(values(*t, "n") == Strings{"1", "2", "4", "8", "16"});
}

TEST_CASE("recursive: DISTINCT re-keys earlier rows when a collation appears", "[recursive]") {
    auto base = make_table({"s"}, {{Value::string("A")}});
    runtime::RecursiveStep step = [](const Table& working, std::size_t iteration) -> Result<Table> {
        Table out;
        out.schema = working.schema;
        if (iteration == 1) {
            out.rows.push_back({Value::string("a", "und:ci")});
            out.rows.push_back({Value::string("B")});
        } else if (iteration == 2) {
            out.rows.push_back({Value::string("b")});
        }
        return out;
    };
    runtime::EvalContext ctx;
    auto t = runtime::evaluate_recursive(base, step, ir::SetQuantifier::Distinct, 500, ctx);
    REQUIRE(t.has_value());
    CHECK(values(*t, "s") == Strings{"A", "B"});

    runtime::RecursiveStep conflicting = [](const Table& working,
                                            std::size_t iteration) -> Result<Table> {
        Table out;
        out.schema = working.schema;
        if (iteration == 1) {
            out.rows.push_back({Value::string("x", "und:ci")});
        } else if (iteration == 2) {
            out.rows.push_back({Value::string("y", "en:ai")});
        }
        return out;
    };
    auto conflict =
        runtime::evaluate_recursive(base, conflicting, ir::SetQuantifier::Distinct, 500, ctx);
    REQUIRE_FALSE(conflict.has_value());
    CHECK(conflict.error().kind == ErrorKind::CollationConflict);
}

TEST_CASE("recursive: step rows are cast to the base column types", "[recursive]") {
    auto base = make_table({"x"}, {{Value::float64(0.5)}});
    runtime::RecursiveStep once = [](const Table& working, std::size_t iteration) -> Result<Table> {
        Table out;
        out.schema = working.schema;
        if (iteration == 1) {
            out.rows.push_back({Value::int64(2)});
        }
        return out;
    };
    runtime::EvalContext ctx;
    auto t = runtime::evaluate_recursive(base, once, ir::SetQuantifier::All, 500, ctx);
    REQUIRE(t.has_value());
    REQUIRE(t->num_rows() == 2);
    CHECK(t->rows[1][0].kind() == TypeKind::Double);

    auto wrong = make_table({"x"}, {{Value::int64(1)}});
    runtime::RecursiveStep text = [](const Table& working, std::size_t iteration) -> Result<Table> {
        Table out;
        out.schema = working.schema;
        if (iteration == 1) {
            out.rows.push_back({Value::string("two")});
        }
        return out;
    };
    auto mismatch = runtime::evaluate_recursive(wrong, text, ir::SetQuantifier::All, 500, ctx);
    REQUIRE_FALSE(mismatch.has_value());
    CHECK(mismatch.error().kind == ErrorKind::TypeMismatch);
}

TEST_CASE("recursive: bindings evaluate in dependency order", "[recursive]") {
    ir::Builder b;
    ir::SelectSpec doubled;
    doubled.items = {
        ops::make_item(ops::binop(ir::ArithmeticOp::Mul, ops::col("n"), ops::int_lit(2)), "m")};
    Bindings bindings;
    bindings.emplace_back(binding("later"), b.select(b.scan("first"), std::move(doubled)));
    bindings.emplace_back(binding("first"), select_one(b));
    auto plan = b.with(true, std::move(bindings), b.scan("later"));
    auto t = runtime::interpret(*plan, {});
    REQUIRE(t.has_value());
    CHECK(values(*t, "m") == Strings{"2"});
}

TEST_CASE("recursive: bindings may not reference each other cyclically", "[recursive][shape]") {
    ir::Builder b;
    Bindings bindings;
    bindings.emplace_back(binding("a"), b.select(b.scan("b"), ir::SelectSpec{}));
    bindings.emplace_back(binding("b"), b.select(b.scan("a"), ir::SelectSpec{}));
    auto plan = b.with(true, std::move(bindings), b.scan("a"));
    CHECK(error_kind(*plan) == ErrorKind::InvalidRecursiveShape);
}

TEST_CASE("recursive: duplicate binding names are rejected", "[recursive][shape]") {
    ir::Builder b;
    Bindings bindings;
    bindings.emplace_back(binding("x"), select_one(b));
    bindings.emplace_back(binding("X"), select_one(b));
    auto plan = b.with(false, std::move(bindings), b.scan("x"));
    CHECK(error_kind(*plan) == ErrorKind::InvalidPlan);
}

TEST_CASE("recursive: binding column list must match the query width", "[recursive]") {
    ir::Builder b;
    Bindings bindings;
    bindings.emplace_back(binding("x", {"a", "b"}), select_one(b));
    auto plan = b.with(false, std::move(bindings), b.scan("x"));
    CHECK(error_kind(*plan) == ErrorKind::InvalidPlan);
}

TEST_CASE("recursive: self reference requires a UNION", "[recursive][shape]") {
    ir::Builder b;
    ir::SetOpSpec intersect;
    intersect.op = ir::SetOpKind::Intersect;
    Bindings bindings;
    bindings.emplace_back(binding("r"),
                          b.set_op(intersect, select_one(b), b.select(b.scan("r"), {})));
    auto plan = b.with(true, std::move(bindings), b.scan("r"));
    CHECK(error_kind(*plan) == ErrorKind::InvalidRecursiveShape);
}

TEST_CASE("recursive: self reference only in the last operand", "[recursive][shape]") {
    ir::Builder b;
    Bindings bindings;
    bindings.emplace_back(binding("r"),
                          b.set_op(union_of(ir::SetQuantifier::All), b.select(b.scan("r"), {}),
                                   select_one(b)));
    auto plan = b.with(true, std::move(bindings), b.scan("r"));
    CHECK(error_kind(*plan) == ErrorKind::InvalidRecursiveShape);
}

TEST_CASE("recursive: self reference at most once", "[recursive][shape]") {
    ir::Builder b;
    ir::JoinSpec cross;
    cross.kind = ir::JoinKind::Cross;
    ir::SelectSpec pick;
    pick.items = {ops::make_item(ops::col("r.n"), "n")};
    auto term = b.select(b.join(b.scan("r"), b.scan("r", "r2"), std::move(cross)), std::move(pick));
    auto plan = with_term(b, std::move(term));
    CHECK(error_kind(*plan) == ErrorKind::InvalidRecursiveShape);
}

TEST_CASE("recursive: self reference inside forbidden contexts", "[recursive][shape]") {
    SECTION("aggregation") {
        ir::Builder b;
        ir::SelectSpec agg;
        agg.aggregates = {ops::make_agg(ir::AggFunc::CountStar, nullptr, "n")};
        agg.items = {ops::make_item(ir::make_expr(ir::AggregateRef{.index = 0}), "n")};
        auto plan = with_term(b, b.select(b.scan("r"), std::move(agg)));
        CHECK(error_kind(*plan) == ErrorKind::InvalidRecursiveShape);
    }
    SECTION("DISTINCT") {
        ir::Builder b;
        auto plan = with_term(b, b.distinct(b.scan("r")));
        CHECK(error_kind(*plan) == ErrorKind::InvalidRecursiveShape);
    }
    SECTION("LIMIT") {
        ir::Builder b;
        ir::SelectSpec limited;
        limited.limit = 1;
        auto plan = with_term(b, b.select(b.scan("r"), std::move(limited)));
        CHECK(error_kind(*plan) == ErrorKind::InvalidRecursiveShape);
    }
    SECTION("right operand of LEFT JOIN") {
        ir::Builder b;
        ir::JoinSpec left;
        left.kind = ir::JoinKind::Left;
        left.condition = ops::eq(ops::col("e.src"), ops::col("r.n"));
        ir::SelectSpec pick;
        pick.items = {ops::make_item(ops::col("e.dst"), "n")};
        auto plan = with_term(
            b, b.select(b.join(b.scan("edges", "e"), b.scan("r"), std::move(left)),
                        std::move(pick)));
        CHECK(error_kind(*plan, edges()) == ErrorKind::InvalidRecursiveShape);
    }
    SECTION("right operand of EXCEPT") {
        ir::Builder b;
        ir::SetOpSpec except;
        except.op = ir::SetOpKind::Except;
        ir::SelectSpec ids;
        ids.items = {ops::make_item(ops::col("src"), "n")};
        auto term = b.set_op(except, b.select(b.scan("edges"), std::move(ids)), b.scan("r"));
        auto plan = with_term(b, std::move(term));
        CHECK(error_kind(*plan, edges()) == ErrorKind::InvalidRecursiveShape);
    }
}

TEST_CASE("recursive: validation runs before evaluation", "[recursive][shape]") {
    ir::Builder b;
    auto plan = with_term(b, b.distinct(b.scan("r")));
    auto valid = ir::validate(*plan);
    REQUIRE_FALSE(valid.has_value());
    CHECK(valid.error().kind == ErrorKind::InvalidRecursiveShape);
    CHECK(valid.error().op == "r");
}
