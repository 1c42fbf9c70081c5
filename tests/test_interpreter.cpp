#include <oryx/ir/builder.hpp>
#include <oryx/runtime/interpreter.hpp>
#include <oryx/runtime/ops.hpp>
#include <oryx/runtime/window.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <vector>

using namespace oryx;

namespace {

using Strings = std::vector<std::string>;

auto emp() -> Table {
    auto row = [](const char* name, const char* dept, std::optional<std::int64_t> salary) {
        return Row{Value::string(name), Value::string(dept),
                   salary ? Value::int64(*salary) : Value::null()};
    };
    return make_table({"name", "dept", "salary"},
                      {row("ann", "eng", 100), row("bob", "eng", 80), row("cat", "ops", 80),
                       row("dan", "eng", 100), row("eve", "ops", std::nullopt)});
}

auto tables() -> TableRegistry {
    TableRegistry registry;
    registry.emplace("emp", emp());
    return registry;
}

auto values(const Table& t, std::string_view name) -> Strings {
    auto column = t.column(name);
    REQUIRE(column.has_value());
    Strings out;
    for (const auto& v : *column) {
        out.push_back(v.to_string());
    }
    return out;
}

auto over_emp(ir::SelectSpec spec, const runtime::EvalOptions& options = {}) -> Result<Table> {
    ir::Builder b;
    auto plan = b.select(b.scan("emp"), std::move(spec));
    return runtime::interpret(*plan, tables(), options);
}

auto select_emp(ir::SelectSpec spec) -> Table {
    auto out = over_emp(std::move(spec));
    REQUIRE(out.has_value());
    return std::move(*out);
}

auto without_from(std::vector<ir::SelectItem> items) -> Result<Table> {
    ir::SelectSpec spec;
    spec.items = std::move(items);
    ir::Builder b;
    auto plan = b.select(nullptr, std::move(spec));
    return runtime::interpret(*plan, TableRegistry{});
}

auto single_value(ir::ExprPtr expr) -> Result<Value> {
    std::vector<ir::SelectItem> items;
    items.push_back(ops::make_item(std::move(expr), "v"));
    auto out = without_from(std::move(items));
    if (!out) {
        return std::unexpected(out.error());
    }
    REQUIRE(out->num_rows() == 1);
    return out->rows[0][0];
}

auto window(ir::WindowFunc func, std::vector<std::string> partition, ir::SortKey order,
            std::string alias) -> ir::WindowSpec {
    ir::WindowSpec w;
    w.func = func;
    for (auto& name : partition) {
        w.partition_by.push_back(ops::col(std::move(name)));
    }
    w.order_by.push_back(std::move(order));
    w.alias = std::move(alias);
    return w;
}

auto key(std::string name, bool ascending = true) -> ir::SortKey {
    return ir::SortKey{.expr = ops::col(std::move(name)), .ascending = ascending};
}

auto window_ref(std::size_t index) -> ir::ExprPtr {
    return ir::make_expr(ir::WindowRef{.index = index});
}

class ProductAccumulator final : public runtime::Accumulator {
   public:
    void init() override { product_ = 1; }
    auto accumulate(const Value& value) -> Result<void> override {
        if (!value.is_null()) {
            product_ *= value.as_int64();
        }
        return {};
    }
    auto finalize() const -> Result<Value> override { return Value::int64(product_); }

   private:
    std::int64_t product_ = 1;
};

}  // namespace

// ─── Select clauses ───────────────────────────────────────────────────────────

TEST_CASE("select: where, order by and limit/offset", "[interpreter]") {
    ir::SelectSpec spec;
    spec.where = ops::cmp(CompareOp::Ge, ops::col("salary"), ops::int_lit(80));
    spec.items.push_back(ops::make_item(ops::col("name")));
    spec.order_by = {key("salary", false), key("name")};
    spec.limit = 2;
    spec.offset = 1;
    auto t = select_emp(std::move(spec));
    CHECK(t.schema.names() == Strings{"name"});
    CHECK(values(t, "name") == Strings{"dan", "bob"});
}

TEST_CASE("select: NULLs sort first ascending and last descending", "[interpreter]") {
    ir::SelectSpec asc;
    asc.items.push_back(ops::make_item(ops::col("name")));
    asc.order_by = {key("salary")};
    CHECK(values(select_emp(asc), "name") == Strings{"eve", "bob", "cat", "ann", "dan"});

    ir::SelectSpec desc;
    desc.items.push_back(ops::make_item(ops::col("name")));
    desc.order_by = {key("salary", false)};
    CHECK(values(select_emp(desc), "name") == Strings{"ann", "dan", "bob", "cat", "eve"});

    desc.order_by[0].nulls_first = true;
    CHECK(values(select_emp(desc), "name").front() == "eve");
}

TEST_CASE("select: order by output position records the ordering", "[interpreter]") {
    ir::SelectSpec spec;
    spec.items.push_back(ops::make_item(ops::col("name")));
    spec.items.push_back(ops::make_item(ops::col("salary"), "pay"));
    spec.order_by.push_back(ir::SortKey{.expr = nullptr, .ascending = false, .output_index = 0});
    auto t = select_emp(std::move(spec));
    CHECK(values(t, "name") == Strings{"eve", "dan", "cat", "bob", "ann"});
    REQUIRE(t.ordering.has_value());
    REQUIRE(t.ordering->size() == 1);
    CHECK(t.ordering->front().column == 0);
    CHECK_FALSE(t.ordering->front().ascending);
}

TEST_CASE("select: star with an out-of-range order position", "[interpreter]") {
    ir::SelectSpec spec;
    spec.order_by.push_back(ir::SortKey{.expr = nullptr, .ascending = true, .output_index = 4});
    auto out = over_emp(std::move(spec));
    REQUIRE_FALSE(out.has_value());
    CHECK(out.error().kind == ErrorKind::InvalidPlan);
    CHECK(out.error().op == "order by");

    ir::SelectSpec last;
    last.order_by.push_back(ir::SortKey{.expr = nullptr, .ascending = false, .output_index = 2});
    auto t = over_emp(std::move(last));
    REQUIRE(t.has_value());
    CHECK(values(*t, "name").front() == "ann");
}

TEST_CASE("select: where drops unknown rows", "[interpreter]") {
    ir::SelectSpec lower;
    lower.where = ops::cmp(CompareOp::Lt, ops::col("salary"), ops::int_lit(90));
    lower.items.push_back(ops::make_item(ops::col("name")));
    CHECK(values(select_emp(lower), "name") == Strings{"bob", "cat"});

    ir::SelectSpec negated;
    negated.where = ops::not_(ops::cmp(CompareOp::Lt, ops::col("salary"), ops::int_lit(90)));
    negated.items.push_back(ops::make_item(ops::col("name")));
    CHECK(values(select_emp(negated), "name") == Strings{"ann", "dan"});
}

TEST_CASE("select: non-boolean where is a type mismatch", "[interpreter]") {
    ir::SelectSpec spec;
    spec.where = ops::col("salary");
    auto out = over_emp(std::move(spec));
    REQUIRE_FALSE(out.has_value());
    CHECK(out.error().kind == ErrorKind::TypeMismatch);
    CHECK(out.error().op == "where");
}

TEST_CASE("select: star keeps qualified input columns", "[interpreter]") {
    ir::Builder b;
    auto plan = b.select(b.scan("emp", "e"), ir::SelectSpec{});
    auto t = runtime::interpret(*plan, tables());
    REQUIRE(t.has_value());
    CHECK(t->schema.names() == Strings{"name", "dept", "salary"});
    CHECK(t->schema[0].qualifier == "e");
    CHECK(t->num_rows() == 5);
}

TEST_CASE("select: unaliased items are named after their column", "[interpreter]") {
    ir::SelectSpec spec;
    spec.items.push_back(ops::make_item(ops::col("emp.name")));
    spec.items.push_back(ops::make_item(
        ops::binop(ir::ArithmeticOp::Add, ops::col("salary"), ops::int_lit(1))));
    spec.limit = 1;
    auto t = select_emp(std::move(spec));
    CHECK(t.schema.names() == Strings{"name", "$col2"});
    CHECK(values(t, "$col2") == Strings{"101"});
}

TEST_CASE("select: DISTINCT runs before ORDER BY", "[interpreter]") {
    ir::SelectSpec spec;
    spec.items.push_back(ops::make_item(ops::col("dept")));
    spec.distinct = true;
    spec.order_by = {key("dept", false)};
    CHECK(values(select_emp(std::move(spec)), "dept") == Strings{"ops", "eng"});
}

TEST_CASE("select: without FROM evaluates once", "[interpreter]") {
    std::vector<ir::SelectItem> items;
    items.push_back(ops::make_item(
        ops::binop(ir::ArithmeticOp::Add, ops::int_lit(1), ops::int_lit(2)), "x"));
    items.push_back(
        ops::make_item(ops::binop(ir::ArithmeticOp::Div, ops::int_lit(7), ops::int_lit(2))));
    auto t = without_from(std::move(items));
    REQUIRE(t.has_value());
    CHECK(t->schema.names() == Strings{"x", "$col2"});
    CHECK(t->rows[0][0].to_string() == "3");
    CHECK(t->rows[0][1].kind() == TypeKind::Double);
    CHECK(t->rows[0][1].to_string() == "3.5");
}

TEST_CASE("select: unknown tables list the registered ones", "[interpreter]") {
    ir::Builder b;
    auto plan = b.select(b.scan("nope"), ir::SelectSpec{});
    auto t = runtime::interpret(*plan, tables());
    REQUIRE_FALSE(t.has_value());
    CHECK(t.error().kind == ErrorKind::InvalidPlan);
    CHECK(t.error().message.find("emp") != std::string::npos);
}

// ─── Windows ──────────────────────────────────────────────────────────────────

TEST_CASE("windows: numbering, ranking and lag per partition", "[interpreter][window]") {
    ir::SelectSpec spec;
    spec.windows.push_back(
        window(ir::WindowFunc::RowNumber, {"dept"}, key("salary", false), "rn"));
    spec.windows.push_back(window(ir::WindowFunc::Rank, {"dept"}, key("salary", false), "rk"));
    spec.windows.push_back(
        window(ir::WindowFunc::DenseRank, {"dept"}, key("salary", false), "drk"));
    auto lag = window(ir::WindowFunc::Lag, {"dept"}, key("name"), "prev");
    lag.argument = ops::col("name");
    spec.windows.push_back(std::move(lag));

    spec.items.push_back(ops::make_item(ops::col("name")));
    const Strings aliases{"rn", "rk", "drk", "prev"};
    for (std::size_t i = 0; i < aliases.size(); ++i) {
        spec.items.push_back(ops::make_item(window_ref(i), aliases[i]));
    }
    auto t = select_emp(std::move(spec));
    CHECK(t.schema.names() == Strings{"name", "rn", "rk", "drk", "prev"});
    CHECK(values(t, "name") == Strings{"ann", "bob", "cat", "dan", "eve"});
    CHECK(values(t, "rn") == Strings{"1", "3", "1", "2", "2"});
    CHECK(values(t, "rk") == Strings{"1", "3", "1", "1", "2"});
    CHECK(values(t, "drk") == Strings{"1", "2", "1", "1", "2"});
    CHECK(values(t, "prev") == Strings{"NULL", "ann", "NULL", "bob", "cat"});
}

TEST_CASE("windows: lead with an offset and default", "[interpreter][window]") {
    ir::SelectSpec spec;
    auto lead = window(ir::WindowFunc::Lead, {}, key("name"), "next2");
    lead.argument = ops::col("name");
    lead.offset = 2;
    lead.default_value = ops::str_lit("-");
    spec.windows.push_back(std::move(lead));
    spec.items.push_back(ops::make_item(window_ref(0), "next2"));
    CHECK(values(select_emp(std::move(spec)), "next2") ==
          Strings{"cat", "dan", "eve", "-", "-"});
}

TEST_CASE("windows: aggregate frames end at the last peer", "[interpreter][window]") {
    ir::SelectSpec spec;
    auto running = window(ir::WindowFunc::Aggregate, {}, key("salary"), "running");
    running.aggregate = ops::make_agg(ir::AggFunc::Sum, ops::col("salary"), "");
    spec.windows.push_back(std::move(running));

    ir::WindowSpec whole;
    whole.func = ir::WindowFunc::Aggregate;
    whole.aggregate = ops::make_agg(ir::AggFunc::CountStar, nullptr, "");
    whole.partition_by.push_back(ops::col("dept"));
    whole.alias = "n";
    spec.windows.push_back(std::move(whole));

    spec.items.push_back(ops::make_item(ops::col("name")));
    spec.items.push_back(ops::make_item(window_ref(0), "running"));
    spec.items.push_back(ops::make_item(window_ref(1), "n"));
    auto t = select_emp(std::move(spec));
    // eve (NULL) sorts first; bob and cat are peers at 80, ann and dan at 100.
    CHECK(values(t, "running") == Strings{"360", "160", "160", "360", "NULL"});
    CHECK(values(t, "n") == Strings{"3", "3", "2", "3", "2"});
}

TEST_CASE("windows: unaliased windows get positional names", "[interpreter][window]") {
    TableRegistry registry = tables();
    runtime::EvalContext ctx;
    std::vector<ir::WindowSpec> windows{
        window(ir::WindowFunc::RowNumber, {}, key("name"), "")};
    auto bound = runtime::bind(windows[0].order_by[0].expr, registry.at("emp").schema);
    REQUIRE(bound.has_value());
    windows[0].order_by[0].expr = *bound;
    auto t = runtime::apply_windows(registry.at("emp"), windows, ctx);
    REQUIRE(t.has_value());
    CHECK(t->schema.names().back() == "$win1");
}

TEST_CASE("windows: order keys must be expressions", "[interpreter][window]") {
    ir::SelectSpec spec;
    spec.windows.push_back(window(ir::WindowFunc::RowNumber, {},
                                  ir::SortKey{.expr = nullptr, .ascending = true, .output_index = 0},
                                  "rn"));
    spec.items.push_back(ops::make_item(window_ref(0), "rn"));
    auto out = over_emp(std::move(spec));
    REQUIRE_FALSE(out.has_value());
    CHECK(out.error().kind == ErrorKind::InvalidPlan);

    runtime::EvalContext ctx;
    std::vector<ir::WindowSpec> windows{window(
        ir::WindowFunc::RowNumber, {}, ir::SortKey{.expr = nullptr, .output_index = 0}, "rn")};
    auto direct = runtime::apply_windows(emp(), windows, ctx);
    REQUIRE_FALSE(direct.has_value());
    CHECK(direct.error().kind == ErrorKind::InvalidPlan);
}

TEST_CASE("windows: QUALIFY filters on window results", "[interpreter][window]") {
    ir::SelectSpec spec;
    spec.windows.push_back(
        window(ir::WindowFunc::RowNumber, {"dept"}, key("salary", false), "rn"));
    spec.qualify = ops::eq(window_ref(0), ops::int_lit(1));
    spec.items.push_back(ops::make_item(ops::col("name")));
    CHECK(values(select_emp(std::move(spec)), "name") == Strings{"ann", "cat"});
}

TEST_CASE("windows: ranking over grouped results", "[interpreter][window]") {
    ir::SelectSpec spec;
    spec.group_by = ops::group_by_columns({"dept"});
    spec.aggregates.push_back(ops::make_agg(ir::AggFunc::Sum, ops::col("salary"), "total"));
    spec.aggregates.push_back(ops::make_agg(ir::AggFunc::CountStar, nullptr, "n"));
    spec.having = ops::cmp(CompareOp::Ge, ir::make_expr(ir::AggregateRef{.index = 1}),
                           ops::int_lit(2));

    ir::WindowSpec rank;
    rank.func = ir::WindowFunc::Rank;
    rank.order_by.push_back(ir::SortKey{.expr = ir::make_expr(ir::AggregateRef{.index = 0}),
                                        .ascending = false});
    rank.alias = "r";
    spec.windows.push_back(std::move(rank));

    spec.items.push_back(ops::make_item(ops::col("dept")));
    spec.items.push_back(ops::make_item(ir::make_expr(ir::AggregateRef{.index = 0}), "total"));
    spec.items.push_back(ops::make_item(window_ref(0), "r"));
    spec.order_by.push_back(ir::SortKey{.expr = window_ref(0), .ascending = false});

    auto all = select_emp(spec);
    CHECK(values(all, "dept") == Strings{"ops", "eng"});
    CHECK(values(all, "total") == Strings{"80", "280"});
    CHECK(values(all, "r") == Strings{"2", "1"});

    spec.limit = 1;
    CHECK(values(select_emp(std::move(spec)), "dept") == Strings{"ops"});
}

// ─── Expressions ──────────────────────────────────────────────────────────────

TEST_CASE("expressions: predicates", "[interpreter][expr]") {
    auto like = single_value(ir::make_expr(ir::LikeExpr{
        .negated = false, .text = ops::str_lit("hello"), .pattern = ops::str_lit("h%o")}));
    REQUIRE(like.has_value());
    CHECK(like->to_string() == "true");

    auto in_list = single_value(ir::make_expr(ir::InListExpr{
        .negated = false, .operand = ops::int_lit(2), .list = {ops::int_lit(1), ops::null_lit()}}));
    REQUIRE(in_list.has_value());
    CHECK(in_list->is_null());

    auto found = single_value(ir::make_expr(ir::InListExpr{
        .negated = true, .operand = ops::int_lit(1), .list = {ops::int_lit(1), ops::null_lit()}}));
    REQUIRE(found.has_value());
    CHECK(found->to_string() == "false");

    auto is_null =
        single_value(ir::make_expr(ir::IsExpr{.test = ir::IsTest::Null, .operand = ops::null_lit()}));
    REQUIRE(is_null.has_value());
    CHECK(is_null->to_string() == "true");

    auto unknown = single_value(ir::make_expr(
        ir::IsExpr{.test = ir::IsTest::Unknown,
                   .operand = ops::eq(ops::null_lit(), ops::int_lit(1))}));
    REQUIRE(unknown.has_value());
    CHECK(unknown->to_string() == "true");
}

TEST_CASE("expressions: built-in scalar functions", "[interpreter][expr]") {
    auto check = [](ir::ExprPtr expr, const char* expected) {
        auto v = single_value(std::move(expr));
        REQUIRE(v.has_value());
        CHECK(v->to_string() == expected);
    };
    check(ops::fn_call("upper", {ops::str_lit("abc")}), "ABC");
    check(ops::fn_call("LOWER", {ops::str_lit("AbC")}), "abc");
    check(ops::fn_call("coalesce", {ops::null_lit(), ops::str_lit("x")}), "x");
    check(ops::fn_call("concat", {ops::str_lit("a"), ops::null_lit()}), "NULL");
    check(ops::fn_call("length", {ops::str_lit("h\xC3\xA9llo")}), "5");
    check(ops::fn_call("abs", {ops::int_lit(-4)}), "4");
    check(ops::fn_call("array_length",
                       {ops::fn_call("generate_array", {ops::int_lit(1), ops::int_lit(4)})}),
          "4");

    auto unknown = single_value(ops::fn_call("frobnicate", {}));
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().kind == ErrorKind::InvalidPlan);
}

TEST_CASE("expressions: array subscripts", "[interpreter][expr]") {
    auto array = ops::fn_call("generate_array", {ops::int_lit(1), ops::int_lit(3)});
    auto at = [&](std::int64_t i, bool safe) {
        return single_value(ir::make_expr(
            ir::SubscriptExpr{.array = array, .index = ops::int_lit(i), .safe = safe}));
    };
    auto second = at(1, false);
    REQUIRE(second.has_value());
    CHECK(second->to_string() == "2");

    auto safe = at(5, true);
    REQUIRE(safe.has_value());
    CHECK(safe->is_null());

    auto out_of_range = at(5, false);
    REQUIRE_FALSE(out_of_range.has_value());
    CHECK(out_of_range.error().kind == ErrorKind::IndexOutOfRange);
}

TEST_CASE("expressions: struct fields and collations", "[interpreter][expr]") {
    auto point = ops::lit(Value::structure({{"x", Value::int64(1)}, {"y", Value::int64(2)}}));
    auto y = single_value(ops::field(point, "y"));
    REQUIRE(y.has_value());
    CHECK(y->to_string() == "2");

    auto folded = single_value(
        ops::eq(ir::make_expr(ir::CollateExpr{.operand = ops::str_lit("ABC"), .collation = "und:ci"}),
                ops::str_lit("abc")));
    REQUIRE(folded.has_value());
    CHECK(folded->to_string() == "true");

    auto bad = single_value(
        ir::make_expr(ir::CollateExpr{.operand = ops::int_lit(1), .collation = "und:ci"}));
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().kind == ErrorKind::TypeMismatch);
}

// ─── Plans and registries ─────────────────────────────────────────────────────

TEST_CASE("values: generated column names and width checks", "[interpreter]") {
    ir::Builder b;
    auto plan = b.values({}, {{Value::int64(1), Value::string("a")},
                              {Value::int64(2), Value::string("b")}});
    auto t = runtime::interpret(*plan, TableRegistry{});
    REQUIRE(t.has_value());
    CHECK(t->schema.names() == Strings{"$col1", "$col2"});
    CHECK(t->num_rows() == 2);

    auto ragged = b.values({"a", "b"}, {{Value::int64(1)}});
    auto bad = runtime::interpret(*ragged, TableRegistry{});
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().kind == ErrorKind::InvalidPlan);
}

TEST_CASE("plans: filter, project, distinct, order and limit nodes", "[interpreter]") {
    ir::Builder b;
    auto filtered =
        b.filter(b.scan("emp"), ops::eq(ops::col("dept"), ops::str_lit("eng")));
    std::vector<ir::SelectItem> items;
    items.push_back(ops::make_item(ops::col("salary"), "s"));
    auto projected = b.project(std::move(filtered), std::move(items));
    auto unique = b.distinct(std::move(projected));
    auto ordered = b.order(b.limit(std::move(unique), 5), {key("s")});
    auto t = runtime::interpret(*ordered, tables());
    REQUIRE(t.has_value());
    CHECK(values(*t, "s") == Strings{"80", "100"});
}

TEST_CASE("plans: custom functions come from the options registry", "[interpreter]") {
    runtime::FunctionRegistry functions;
    runtime::register_builtins(functions);
    functions.register_scalar(
        "twice", [](std::span<const Value> args, const CollationContext&) -> Result<Value> {
            if (args.size() != 1 || args[0].is_null()) {
                return Value::null();
            }
            return Value::int64(args[0].as_int64() * 2);
        });
    functions.register_aggregate("product",
                                 [] { return std::make_unique<ProductAccumulator>(); });
    functions.register_table(
        "series", [](std::span<const Table>, std::span<const Value> args) -> Result<Table> {
            std::vector<Row> rows;
            for (std::int64_t i = 1; i <= args[0].as_int64(); ++i) {
                rows.push_back({Value::int64(i)});
            }
            return make_table({"n"}, std::move(rows));
        });
    runtime::EvalOptions options;
    options.functions = &functions;

    ir::SelectSpec spec;
    spec.items.push_back(ops::make_item(ops::fn_call("twice", {ops::col("n")}), "d"));
    ir::Builder b;
    auto plan = b.select(b.table_function("series", {ops::int_lit(3)}), spec);
    auto t = runtime::interpret(*plan, TableRegistry{}, options);
    REQUIRE(t.has_value());
    CHECK(values(*t, "d") == Strings{"2", "4", "6"});

    ir::SelectSpec agg;
    ir::AggSpec product;
    product.func = ir::AggFunc::Extern;
    product.callee = "product";
    product.argument = ops::col("n");
    agg.aggregates.push_back(product);
    agg.items.push_back(ops::make_item(ir::make_expr(ir::AggregateRef{.index = 0}), "p"));
    auto grouped = b.select(b.table_function("series", {ops::int_lit(4)}), agg);
    auto p = runtime::interpret(*grouped, TableRegistry{}, options);
    REQUIRE(p.has_value());
    CHECK(values(*p, "p") == Strings{"24"});

    auto missing = runtime::interpret(*b.table_function("nope", {}), TableRegistry{}, options);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().kind == ErrorKind::InvalidPlan);
}

// ─── ops helpers ──────────────────────────────────────────────────────────────

TEST_CASE("ops: filter in parallel keeps input order", "[ops]") {
    std::vector<Row> rows;
    for (std::int64_t i = 0; i < 1000; ++i) {
        rows.push_back({Value::int64(i)});
    }
    auto t = make_table({"n"}, std::move(rows));
    runtime::EvalOptions options;
    options.parallel_threshold = 1;
    options.max_workers = 4;
    auto out = ops::filter(
        t,
        ops::eq(ops::binop(ir::ArithmeticOp::Mod, ops::col("n"), ops::int_lit(3)), ops::int_lit(0)),
        options);
    REQUIRE(out.has_value());
    REQUIRE(out->num_rows() == 334);
    CHECK(out->rows.front()[0].to_string() == "0");
    CHECK(out->rows[1][0].to_string() == "3");
    CHECK(out->rows.back()[0].to_string() == "999");
}

TEST_CASE("ops: distinct and order", "[ops]") {
    auto t = make_table({"v"}, {{Value::int64(3)}, {Value::null()}, {Value::int64(3)},
                                {Value::int64(1)}});
    auto unique = ops::distinct(t);
    REQUIRE(unique.has_value());
    CHECK(values(*unique, "v") == Strings{"3", "NULL", "1"});

    auto sorted = ops::order(t, {ir::SortKey{.expr = ops::col("v"), .ascending = false}});
    REQUIRE(sorted.has_value());
    CHECK(values(*sorted, "v") == Strings{"3", "3", "1", "NULL"});
}

TEST_CASE("ops: print aligns columns", "[ops]") {
    auto t = make_table({"name", "n"}, {{Value::string("a"), Value::int64(1)},
                                        {Value::string("bcd"), Value::null()}});
    std::ostringstream out;
    ops::print(t, out);
    CHECK(out.str() ==
          "name  n   \n"
          "----  ----\n"
          "a     1   \n"
          "bcd   NULL\n");

    std::ostringstream empty;
    ops::print(Table{}, empty);
    CHECK(empty.str() == "(empty table)\n");
}
