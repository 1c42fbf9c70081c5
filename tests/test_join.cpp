#include <oryx/ir/builder.hpp>
#include <oryx/runtime/interpreter.hpp>
#include <oryx/runtime/join.hpp>
#include <oryx/runtime/ops.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace oryx;

namespace {

using Strings = std::vector<std::string>;

auto render(const std::vector<Value>& values) -> Strings {
    Strings out;
    out.reserve(values.size());
    for (const auto& v : values) {
        out.push_back(v.to_string());
    }
    return out;
}

auto col_named(const Table& t, std::string_view name) -> Strings {
    auto values = t.column(name);
    REQUIRE(values.has_value());
    return render(*values);
}

auto col_at(const Table& t, std::size_t index) -> Strings {
    REQUIRE(index < t.num_columns());
    Strings out;
    for (const auto& row : t.rows) {
        out.push_back(row[index].to_string());
    }
    return out;
}

auto registry() -> TableRegistry {
    TableRegistry tables;
    tables.emplace("l", make_table({"id", "name"}, {
                                                       {Value::int64(1), Value::string("a")},
                                                       {Value::int64(2), Value::string("b")},
                                                       {Value::int64(3), Value::string("c")},
                                                       {Value::null(), Value::string("n")},
                                                   }));
    tables.emplace("r", make_table({"id", "score"}, {
                                                        {Value::int64(1), Value::int64(10)},
                                                        {Value::int64(1), Value::int64(11)},
                                                        {Value::int64(3), Value::int64(30)},
                                                        {Value::int64(4), Value::int64(40)},
                                                        {Value::null(), Value::int64(99)},
                                                    }));
    return tables;
}

auto on_ids(ir::JoinKind kind) -> ir::JoinSpec {
    ir::JoinSpec spec;
    spec.kind = kind;
    spec.condition = ops::eq(ops::col("l.id"), ops::col("r.id"));
    return spec;
}

auto run_join(ir::JoinSpec spec) -> Result<Table> {
    auto tables = registry();
    ir::Builder b;
    auto plan = b.join(b.scan("l"), b.scan("r"), std::move(spec));
    return runtime::interpret(*plan, tables);
}

auto joined(ir::JoinSpec spec) -> Table {
    auto result = run_join(std::move(spec));
    REQUIRE(result.has_value());
    return std::move(*result);
}

auto error_kind(const Result<Table>& result) -> ErrorKind {
    REQUIRE_FALSE(result.has_value());
    return result.error().kind;
}

}  // namespace

TEST_CASE("join: inner join on equality keeps left order", "[join]") {
    auto t = joined(on_ids(ir::JoinKind::Inner));
    REQUIRE(t.num_columns() == 4);
    CHECK(col_named(t, "name") == Strings{"a", "a", "c"});
    CHECK(col_named(t, "score") == Strings{"10", "11", "30"});
    CHECK(col_named(t, "r.id") == Strings{"1", "1", "3"});
}

TEST_CASE("join: unqualified shared column is ambiguous", "[join]") {
    auto t = joined(on_ids(ir::JoinKind::Inner));
    auto ids = t.column("id");
    REQUIRE_FALSE(ids.has_value());
    CHECK(ids.error().kind == ErrorKind::TypeMismatch);
}

TEST_CASE("join: left join pads unmatched left rows", "[join]") {
    auto t = joined(on_ids(ir::JoinKind::Left));
    CHECK(col_named(t, "name") == Strings{"a", "a", "b", "c", "n"});
    CHECK(col_named(t, "score") == Strings{"10", "11", "NULL", "30", "NULL"});
}

TEST_CASE("join: right join appends unmatched right rows", "[join]") {
    auto t = joined(on_ids(ir::JoinKind::Right));
    CHECK(col_named(t, "name") == Strings{"a", "a", "c", "NULL", "NULL"});
    CHECK(col_named(t, "score") == Strings{"10", "11", "30", "40", "99"});
}

TEST_CASE("join: full join pads both sides", "[join]") {
    auto t = joined(on_ids(ir::JoinKind::Full));
    CHECK(col_named(t, "name") == Strings{"a", "a", "b", "c", "n", "NULL", "NULL"});
    CHECK(col_named(t, "score") == Strings{"10", "11", "NULL", "30", "NULL", "40", "99"});
}

TEST_CASE("join: semi and anti joins keep only the preserved side", "[join]") {
    auto semi = joined(on_ids(ir::JoinKind::LeftSemi));
    REQUIRE(semi.num_columns() == 2);
    CHECK(col_named(semi, "name") == Strings{"a", "c"});

    auto anti = joined(on_ids(ir::JoinKind::LeftAnti));
    CHECK(col_named(anti, "name") == Strings{"b", "n"});

    auto right_semi = joined(on_ids(ir::JoinKind::RightSemi));
    REQUIRE(right_semi.num_columns() == 2);
    CHECK(col_named(right_semi, "score") == Strings{"10", "11", "30"});

    auto right_anti = joined(on_ids(ir::JoinKind::RightAnti));
    CHECK(col_named(right_anti, "score") == Strings{"40", "99"});
}

TEST_CASE("join: cross join is the full product", "[join]") {
    ir::JoinSpec spec;
    spec.kind = ir::JoinKind::Cross;
    auto t = joined(std::move(spec));
    CHECK(t.num_rows() == 20);
    CHECK(t.num_columns() == 4);
}

TEST_CASE("join: non-equality condition uses the nested loop", "[join]") {
    ir::JoinSpec spec;
    spec.kind = ir::JoinKind::Inner;
    spec.condition = ops::and_(ops::cmp(CompareOp::Lt, ops::col("l.id"), ops::col("r.id")),
                               ops::cmp(CompareOp::Gt, ops::col("score"), ops::int_lit(35)));
    auto t = joined(std::move(spec));
    CHECK(col_named(t, "name") == Strings{"a", "b", "c"});
    CHECK(col_named(t, "score") == Strings{"40", "40", "40"});
}

TEST_CASE("join: USING merges the key column first", "[join]") {
    ir::JoinSpec spec;
    spec.kind = ir::JoinKind::Full;
    spec.using_columns = {"id"};
    auto t = joined(std::move(spec));
    REQUIRE(t.num_columns() == 3);
    CHECK(t.schema.names() == std::vector<std::string>{"id", "name", "score"});
    CHECK(col_named(t, "id") == Strings{"1", "1", "2", "3", "NULL", "4", "NULL"});
    CHECK(col_named(t, "name") == Strings{"a", "a", "b", "c", "n", "NULL", "NULL"});
}

TEST_CASE("join: NATURAL joins on every common column", "[join]") {
    ir::JoinSpec spec;
    spec.kind = ir::JoinKind::Inner;
    spec.natural = true;
    auto t = joined(std::move(spec));
    CHECK(t.schema.names() == std::vector<std::string>{"id", "name", "score"});
    CHECK(col_named(t, "id") == Strings{"1", "1", "3"});
}

TEST_CASE("join: right join USING takes the right key", "[join]") {
    ir::JoinSpec spec;
    spec.kind = ir::JoinKind::Right;
    spec.using_columns = {"id"};
    auto t = joined(std::move(spec));
    CHECK(col_named(t, "id") == Strings{"1", "1", "3", "4", "NULL"});
}

TEST_CASE("join: NULL keys never match", "[join]") {
    auto left = make_table({"k"}, {{Value::null()}, {Value::null()}});
    auto right = make_table({"k"}, {{Value::null()}});

    ir::JoinSpec spec;
    spec.kind = ir::JoinKind::Inner;
    spec.using_columns = {"k"};
    auto inner = ops::join(left, right, spec);
    REQUIRE(inner.has_value());
    CHECK(inner->num_rows() == 0);

    ir::JoinSpec full;
    full.kind = ir::JoinKind::Full;
    full.using_columns = {"k"};
    auto outer = ops::join(left, right, std::move(full));
    REQUIRE(outer.has_value());
    CHECK(outer->num_rows() == 3);
}

TEST_CASE("join: string keys match under a shared collation", "[join]") {
    auto left = make_table({"code", "x"}, {{Value::string("ABC", "und:ci"), Value::int64(1)},
                                           {Value::string("Abd", "und:ci"), Value::int64(2)}});
    auto right = make_table({"code", "y"}, {{Value::string("xyz"), Value::int64(5)},
                                            {Value::string("abc"), Value::int64(10)},
                                            {Value::string("ABD"), Value::int64(20)}});
    ir::JoinSpec spec;
    spec.kind = ir::JoinKind::Inner;
    spec.using_columns = {"code"};
    auto t = ops::join(left, right, std::move(spec));
    REQUIRE(t.has_value());
    CHECK(col_named(*t, "y") == Strings{"10", "20"});
}

TEST_CASE("join: conflicting key collations are rejected", "[join]") {
    auto left = make_table({"code"}, {{Value::string("a", "und:ci")}});
    auto right = make_table({"code"}, {{Value::string("A", "und:ai")}});
    ir::JoinSpec spec;
    spec.kind = ir::JoinKind::Inner;
    spec.using_columns = {"code"};
    CHECK(error_kind(ops::join(left, right, std::move(spec))) == ErrorKind::CollationConflict);
}

TEST_CASE("join: runtime join over materialized tables", "[join]") {
    auto left = make_table({"a"}, {{Value::int64(1)}, {Value::int64(2)}});
    auto right = make_table({"b"}, {{Value::int64(2)}, {Value::int64(3)}});
    ir::JoinSpec spec;
    spec.kind = ir::JoinKind::Full;
    spec.condition = ops::eq(ops::col("a"), ops::col("b"));
    runtime::EvalContext ctx;
    auto t = runtime::join(left, right, spec, ctx);
    REQUIRE(t.has_value());
    CHECK(col_at(*t, 0) == Strings{"1", "2", "NULL"});
    CHECK(col_at(*t, 1) == Strings{"NULL", "2", "3"});
}

TEST_CASE("join: lateral input errors without left rows leave an empty result", "[join][lateral]") {
    auto left = make_table({"n"}, {});
    left.schema.fields[0].type = TypeKind::Int64;
    runtime::FunctionProducer strict(
        [](const runtime::LateralParams* params) -> Result<Table> {
            if (params == nullptr || params->row[0].is_null()) {
                return make_error(ErrorKind::TypeMismatch, "n must not be NULL");
            }
            return make_table({"m"}, {{params->row[0]}});
        },
        true);
    ir::JoinSpec spec;
    spec.kind = ir::JoinKind::Cross;
    spec.lateral = true;
    runtime::EvalContext ctx;
    auto t = runtime::join(left, strict, spec, ctx);
    REQUIRE(t.has_value());
    CHECK(t->num_rows() == 0);
    CHECK(t->schema.names() == Strings{"n"});

    auto one = make_table({"n"}, {{Value::int64(4)}});
    auto joined_one = runtime::join(one, strict, spec, ctx);
    REQUIRE(joined_one.has_value());
    CHECK(joined_one->schema.names() == Strings{"n", "m"});
    CHECK(col_named(*joined_one, "m") == Strings{"4"});
}

// ─── Unnest and lateral joins ─────────────────────────────────────────────────

namespace {

auto docs() -> TableRegistry {
    TableRegistry tables;
    tables.emplace(
        "docs",
        make_table({"id", "tags"},
                   {
                       {Value::int64(1), Value::array({Value::string("x"), Value::string("y")})},
                       {Value::int64(2), Value::array({})},
                       {Value::int64(3), Value::null()},
                   }));
    return tables;
}

auto lateral_unnest(ir::JoinKind kind, std::optional<std::string> offset = std::nullopt)
    -> Result<Table> {
    auto tables = docs();
    ir::Builder b;
    ir::JoinSpec spec;
    spec.kind = kind;
    spec.lateral = true;
    auto plan =
        b.join(b.scan("docs"), b.unnest(ops::outer_col("tags"), "tag", std::move(offset)), spec);
    return runtime::interpret(*plan, tables);
}

}  // namespace

TEST_CASE("unnest: one row per element with offsets", "[join][unnest]") {
    auto t = runtime::unnest(Value::array({Value::int64(5), Value::null(), Value::int64(7)}), "v",
                             std::string("pos"));
    REQUIRE(t.has_value());
    CHECK(col_named(*t, "v") == Strings{"5", "NULL", "7"});
    CHECK(col_named(*t, "pos") == Strings{"0", "1", "2"});
    CHECK(t->schema[1].type == TypeKind::Int64);
}

TEST_CASE("unnest: NULL and empty arrays produce no rows", "[join][unnest]") {
    auto empty = runtime::unnest(Value::array({}), "v", std::nullopt);
    REQUIRE(empty.has_value());
    CHECK(empty->num_rows() == 0);

    auto null = runtime::unnest(Value::null(), "", std::nullopt);
    REQUIRE(null.has_value());
    CHECK(null->num_rows() == 0);
    CHECK(null->schema[0].name == "$element");
}

TEST_CASE("unnest: non-array operand is a type mismatch", "[join][unnest]") {
    auto t = runtime::unnest(Value::int64(1), "v", std::nullopt);
    REQUIRE_FALSE(t.has_value());
    CHECK(t.error().kind == ErrorKind::TypeMismatch);
}

TEST_CASE("join: lateral unnest reads the left row", "[join][lateral]") {
    auto t = lateral_unnest(ir::JoinKind::Inner, "pos");
    REQUIRE(t.has_value());
    CHECK(col_named(*t, "id") == Strings{"1", "1"});
    CHECK(col_named(*t, "tag") == Strings{"x", "y"});
    CHECK(col_named(*t, "pos") == Strings{"0", "1"});
}

TEST_CASE("join: left lateral keeps rows with empty arrays", "[join][lateral]") {
    auto t = lateral_unnest(ir::JoinKind::Left);
    REQUIRE(t.has_value());
    CHECK(col_named(*t, "id") == Strings{"1", "1", "2", "3"});
    CHECK(col_named(*t, "tag") == Strings{"x", "y", "NULL", "NULL"});
}

TEST_CASE("join: correlated right input is detected without the LATERAL flag",
          "[join][lateral]") {
    auto tables = docs();
    ir::Builder b;
    ir::JoinSpec spec;
    spec.kind = ir::JoinKind::Cross;
    auto plan = b.join(b.scan("docs"), b.unnest(ops::outer_col("tags"), "tag"), spec);
    auto t = runtime::interpret(*plan, tables);
    REQUIRE(t.has_value());
    CHECK(t->num_rows() == 2);
}

// ─── Join shape validation ────────────────────────────────────────────────────

TEST_CASE("join: LATERAL is rejected for RIGHT and FULL joins", "[join][shape]") {
    CHECK(error_kind(lateral_unnest(ir::JoinKind::Right)) == ErrorKind::InvalidJoinShape);
    CHECK(error_kind(lateral_unnest(ir::JoinKind::Full)) == ErrorKind::InvalidJoinShape);
}

TEST_CASE("join: outer reference outside a lateral join is an invalid plan", "[join][shape]") {
    auto tables = docs();
    ir::Builder b;
    auto plan = b.unnest(ops::outer_col("tags"), "tag");
    CHECK(error_kind(runtime::interpret(*plan, tables)) == ErrorKind::InvalidPlan);
}

TEST_CASE("join: comma join followed by RIGHT JOIN needs parentheses", "[join][shape]") {
    auto tables = registry();
    auto build = [](bool parenthesized) {
        ir::Builder b;
        ir::JoinSpec comma;
        comma.kind = ir::JoinKind::Cross;
        comma.comma = true;
        comma.parenthesized = parenthesized;
        ir::JoinSpec right;
        right.kind = ir::JoinKind::Right;
        right.condition = ops::eq(ops::col("l.id"), ops::col("x.id"));
        return b.join(b.join(b.scan("l"), b.scan("r"), std::move(comma)), b.scan("r", "x"),
                      std::move(right));
    };
    CHECK(error_kind(runtime::interpret(*build(false), tables)) == ErrorKind::InvalidJoinShape);
    CHECK(runtime::interpret(*build(true), tables).has_value());
}

TEST_CASE("join: ON, USING and NATURAL are mutually exclusive", "[join][shape]") {
    auto both = on_ids(ir::JoinKind::Inner);
    both.using_columns = {"id"};
    CHECK(error_kind(run_join(std::move(both))) == ErrorKind::InvalidJoinShape);

    ir::JoinSpec natural;
    natural.kind = ir::JoinKind::Inner;
    natural.natural = true;
    natural.using_columns = {"id"};
    CHECK(error_kind(run_join(std::move(natural))) == ErrorKind::InvalidJoinShape);

    auto comma = on_ids(ir::JoinKind::Inner);
    comma.comma = true;
    CHECK(error_kind(run_join(std::move(comma))) == ErrorKind::InvalidJoinShape);
}

TEST_CASE("join: unknown USING column names the available columns", "[join][shape]") {
    ir::JoinSpec spec;
    spec.kind = ir::JoinKind::Inner;
    spec.using_columns = {"missing"};
    auto result = run_join(std::move(spec));
    CHECK(error_kind(result) == ErrorKind::InvalidPlan);
    CHECK(result.error().message.find("id, name") != std::string::npos);
}
