#include <oryx/core/compare.hpp>
#include <oryx/core/hash.hpp>
#include <oryx/runtime/eval.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <vector>

using namespace oryx;

namespace {

const CollationContext kCtx;

auto eq(const Value& a, const Value& b) -> TriBool {
    auto r = equals3vl(a, b, kCtx);
    REQUIRE(r.has_value());
    return *r;
}

auto cmp(CompareOp op, const Value& a, const Value& b) -> TriBool {
    auto r = compare3vl(op, a, b, kCtx);
    REQUIRE(r.has_value());
    return *r;
}

auto like_str(std::string text, std::string pattern, std::string collation = {}) -> TriBool {
    auto r = like(Value::string(std::move(text), collation), Value::string(std::move(pattern)),
                  kCtx);
    REQUIRE(r.has_value());
    return *r;
}

auto nan() -> Value {
    return Value::float64(std::numeric_limits<double>::quiet_NaN());
}

}  // namespace

TEST_CASE("three-valued AND / OR / NOT", "[core][compare]") {
    CHECK(tri_and(TriBool::True, TriBool::Null) == TriBool::Null);
    CHECK(tri_and(TriBool::False, TriBool::Null) == TriBool::False);
    CHECK(tri_or(TriBool::True, TriBool::Null) == TriBool::True);
    CHECK(tri_or(TriBool::False, TriBool::Null) == TriBool::Null);
    CHECK(tri_not(TriBool::Null) == TriBool::Null);
    CHECK(tri_not(TriBool::True) == TriBool::False);
    CHECK(tri_to_value(TriBool::Null).is_null());
}

TEST_CASE("comparisons with NULL are unknown", "[core][compare]") {
    CHECK(eq(Value::null(), Value::null()) == TriBool::Null);
    CHECK(eq(Value::int64(1), Value::null()) == TriBool::Null);
    CHECK(cmp(CompareOp::Lt, Value::null(), Value::int64(1)) == TriBool::Null);
    CHECK(cmp(CompareOp::Ne, Value::int64(1), Value::null()) == TriBool::Null);
}

TEST_CASE("numeric types compare by value", "[core][compare]") {
    CHECK(eq(Value::int64(1), Value::float64(1.0)) == TriBool::True);
    CHECK(eq(Value::numeric(*Numeric::parse("2.5")), Value::float64(2.5)) == TriBool::True);
    CHECK(cmp(CompareOp::Lt, Value::int64(2), Value::numeric(*Numeric::parse("2.000000001"))) ==
          TriBool::True);
    CHECK(cmp(CompareOp::Ge, Value::float64(-1.5), Value::int64(-2)) == TriBool::True);
}

TEST_CASE("NaN compares false except for !=", "[core][compare]") {
    CHECK(cmp(CompareOp::Eq, nan(), nan()) == TriBool::False);
    CHECK(cmp(CompareOp::Ne, nan(), nan()) == TriBool::True);
    CHECK(cmp(CompareOp::Lt, nan(), Value::float64(1.0)) == TriBool::False);
    CHECK(cmp(CompareOp::Ge, Value::float64(1.0), nan()) == TriBool::False);
    CHECK(cmp(CompareOp::Ne, nan(), Value::float64(1.0)) == TriBool::True);
}

TEST_CASE("IS DISTINCT FROM treats NULLs and NaNs as equal", "[core][compare]") {
    auto distinct = [](const Value& a, const Value& b) {
        auto r = is_distinct_from(a, b, kCtx);
        REQUIRE(r.has_value());
        return *r;
    };
    CHECK_FALSE(distinct(Value::null(), Value::null()));
    CHECK(distinct(Value::null(), Value::int64(0)));
    CHECK_FALSE(distinct(nan(), nan()));
    CHECK(distinct(nan(), Value::float64(0.0)));
    CHECK_FALSE(distinct(Value::int64(3), Value::float64(3.0)));
}

TEST_CASE("struct equality is positional with NULL propagation", "[core][compare]") {
    auto s = [](Value a, Value b) {
        return Value::structure({{"x", std::move(a)}, {"y", std::move(b)}});
    };
    CHECK(eq(s(Value::int64(1), Value::int64(2)), s(Value::int64(1), Value::int64(2))) ==
          TriBool::True);
    CHECK(eq(s(Value::int64(1), Value::null()), s(Value::int64(1), Value::int64(2))) ==
          TriBool::Null);
    CHECK(eq(s(Value::int64(1), Value::null()), s(Value::int64(9), Value::int64(2))) ==
          TriBool::False);

    // Field names do not matter, positions do.
    auto renamed = Value::structure({{"a", Value::int64(1)}, {"b", Value::int64(2)}});
    CHECK(eq(s(Value::int64(1), Value::int64(2)), renamed) == TriBool::True);

    auto wider = Value::structure(
        {{"x", Value::int64(1)}, {"y", Value::int64(2)}, {"z", Value::int64(3)}});
    auto r = equals3vl(s(Value::int64(1), Value::int64(2)), wider, kCtx);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().kind == ErrorKind::TypeMismatch);
}

TEST_CASE("arrays compare element-wise", "[core][compare]") {
    auto a = Value::array({Value::int64(1), Value::int64(2)});
    CHECK(eq(a, Value::array({Value::int64(1), Value::int64(2)})) == TriBool::True);
    CHECK(eq(a, Value::array({Value::int64(1)})) == TriBool::False);
    CHECK(eq(a, Value::array({Value::int64(1), Value::null()})) == TriBool::Null);

    auto r = compare3vl(CompareOp::Lt, a, a, kCtx);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().kind == ErrorKind::TypeMismatch);
}

TEST_CASE("unrelated types are a type mismatch", "[core][compare]") {
    auto r = equals3vl(Value::int64(1), Value::string("1"), kCtx);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().kind == ErrorKind::TypeMismatch);
}

TEST_CASE("collation-aware string comparison", "[core][collation]") {
    SECTION("binary by default") {
        CHECK(eq(Value::string("a"), Value::string("A")) == TriBool::False);
        CHECK(cmp(CompareOp::Lt, Value::string("B"), Value::string("a")) == TriBool::True);
    }
    SECTION("one explicit collation applies to both sides") {
        CHECK(eq(Value::string("a", "und:ci"), Value::string("A")) == TriBool::True);
        CHECK(eq(Value::string("Strasse"), Value::string("STRASSE", "und:ci")) == TriBool::True);
    }
    SECTION("accent-insensitive folding") {
        CHECK(eq(Value::string("caf\xC3\xA9", "und:ai"), Value::string("CAFE")) == TriBool::True);
    }
    SECTION("unicode:cs is the default collation") {
        CHECK(eq(Value::string("a", "unicode:cs"), Value::string("A", "binary")) ==
              TriBool::False);
    }
    SECTION("two different explicit collations conflict") {
        auto r = equals3vl(Value::string("a", "und:ci"), Value::string("a", "en:ai"), kCtx);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().kind == ErrorKind::CollationConflict);
    }
}

TEST_CASE("sort order places NULL before NaN before -inf", "[core][compare]") {
    auto order = [](const Value& a, const Value& b) {
        auto r = order_compare(a, b, kCtx);
        REQUIRE(r.has_value());
        return *r;
    };
    const auto inf = std::numeric_limits<double>::infinity();
    CHECK(order(Value::null(), nan()) == std::weak_ordering::less);
    CHECK(order(nan(), Value::float64(-inf)) == std::weak_ordering::less);
    CHECK(order(Value::float64(-inf), Value::int64(-5)) == std::weak_ordering::less);
    CHECK(order(Value::int64(5), Value::float64(inf)) == std::weak_ordering::less);
    CHECK(order(Value::boolean(false), Value::boolean(true)) == std::weak_ordering::less);
    CHECK(order(Value::null(), Value::null()) == std::weak_ordering::equivalent);
}

TEST_CASE("IN list under three-valued logic", "[core][compare]") {
    auto in = [](const Value& v, std::vector<Value> list) {
        auto r = in_list(v, list, kCtx);
        REQUIRE(r.has_value());
        return *r;
    };
    CHECK(in(Value::int64(1), {Value::int64(2), Value::int64(1)}) == TriBool::True);
    CHECK(in(Value::int64(1), {Value::int64(2), Value::null()}) == TriBool::Null);
    CHECK(in(Value::int64(1), {Value::int64(2), Value::int64(3)}) == TriBool::False);
    CHECK(in(Value::null(), {Value::int64(1)}) == TriBool::Null);
}

TEST_CASE("LIKE wildcards and escapes", "[core][like]") {
    CHECK(like_str("abc", "a%") == TriBool::True);
    CHECK(like_str("abc", "a_c") == TriBool::True);
    CHECK(like_str("abc", "a_") == TriBool::False);
    CHECK(like_str("", "%") == TriBool::True);
    CHECK(like_str("100%", "100\\%") == TriBool::True);
    CHECK(like_str("1000", "100\\%") == TriBool::False);
    CHECK(like_str("a_b", "a\\_b") == TriBool::True);
    CHECK(like_str("axb", "a\\_b") == TriBool::False);
    CHECK(like_str("ABC", "a%", "und:ci") == TriBool::True);

    auto null_text = like(Value::null(), Value::string("%"), kCtx);
    REQUIRE(null_text.has_value());
    CHECK(*null_text == TriBool::Null);

    auto dangling = like(Value::string("a"), Value::string("a\\"), kCtx);
    REQUIRE_FALSE(dangling.has_value());
}

TEST_CASE("LIKE matches whole grapheme clusters under a named collation", "[core][like]") {
    // "e" followed by a combining acute accent is one character under und:ci.
    CHECK(like_str("e\xCC\x81", "_", "und:ci") == TriBool::True);
    CHECK(like_str("e\xCC\x81", "_") == TriBool::False);
}

TEST_CASE("arithmetic errors and division result type", "[core][arithmetic]") {
    auto div = runtime::arithmetic(ir::ArithmeticOp::Div, Value::int64(7), Value::int64(2));
    REQUIRE(div.has_value());
    REQUIRE(div->kind() == TypeKind::Double);
    CHECK(div->as_double() == 3.5);

    auto zero = runtime::arithmetic(ir::ArithmeticOp::Div, Value::int64(1), Value::int64(0));
    REQUIRE_FALSE(zero.has_value());
    CHECK(zero.error().kind == ErrorKind::DivisionByZero);

    auto overflow = runtime::arithmetic(ir::ArithmeticOp::Add,
                                        Value::int64(std::numeric_limits<std::int64_t>::max()),
                                        Value::int64(1));
    REQUIRE_FALSE(overflow.has_value());
    CHECK(overflow.error().kind == ErrorKind::Overflow);

    auto with_null = runtime::arithmetic(ir::ArithmeticOp::Mul, Value::null(), Value::int64(3));
    REQUIRE(with_null.has_value());
    CHECK(with_null->is_null());
}

TEST_CASE("NUMERIC parsing and rendering", "[core][value]") {
    auto n = Numeric::parse("-12.340");
    REQUIRE(n.has_value());
    CHECK(n->to_string() == "-12.34");
    CHECK_FALSE(Numeric::parse("1.0000000001").has_value());
    CHECK_FALSE(Numeric::parse("abc").has_value());

    auto sum = runtime::arithmetic(ir::ArithmeticOp::Add, Value::numeric(*Numeric::parse("0.1")),
                                   Value::numeric(*Numeric::parse("0.2")));
    REQUIRE(sum.has_value());
    CHECK(sum->as_numeric().to_string() == "0.3");
}

TEST_CASE("row keys follow IS NOT DISTINCT FROM", "[core][hash]") {
    std::vector<CollationSpec> specs{CollationSpec{}, CollationSpec::parse("und:ci")};
    auto key = [&](Row row) {
        auto k = make_row_key(row, {}, specs, kCtx);
        REQUIRE(k.has_value());
        return std::move(*k);
    };
    RowKeyEq equal;
    RowKeyHash hash;
    auto a = key({Value::null(), Value::string("abc")});
    auto b = key({Value::null(), Value::string("ABC")});
    CHECK(equal(a, b));
    CHECK(hash(a) == hash(b));

    auto c = key({Value::int64(1), Value::string("abc")});
    auto d = key({Value::float64(1.0), Value::string("abc")});
    CHECK(equal(c, d));
    CHECK(hash(c) == hash(d));
    CHECK_FALSE(equal(a, c));
}
