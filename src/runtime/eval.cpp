#include <oryx/runtime/eval.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cmath>
#include <limits>

namespace oryx::runtime {

namespace {

// 10^38 - 1 units: the largest NUMERIC magnitude.
constexpr int128_t kMaxNumericUnits =
    static_cast<int128_t>(10'000'000'000'000'000'000ULL) * 10'000'000'000'000'000'000ULL - 1;

auto overflow(std::string_view type, ir::ArithmeticOp op) -> std::unexpected<Error> {
    constexpr std::string_view kNames[] = {"addition", "subtraction", "multiplication", "division",
                                           "modulo"};
    return make_error(ErrorKind::Overflow,
                      fmt::format("{} overflow in {}", type, kNames[static_cast<int>(op)]));
}

auto division_by_zero(const Value& lhs) -> std::unexpected<Error> {
    return make_error(ErrorKind::DivisionByZero,
                      fmt::format("division by zero: {} / 0", lhs.to_string()));
}

auto int_arithmetic(ir::ArithmeticOp op, std::int64_t a, std::int64_t b) -> Result<Value> {
    std::int64_t out = 0;
    switch (op) {
        case ir::ArithmeticOp::Add:
            if (__builtin_add_overflow(a, b, &out)) {
                return overflow("INT64", op);
            }
            return Value::int64(out);
        case ir::ArithmeticOp::Sub:
            if (__builtin_sub_overflow(a, b, &out)) {
                return overflow("INT64", op);
            }
            return Value::int64(out);
        case ir::ArithmeticOp::Mul:
            if (__builtin_mul_overflow(a, b, &out)) {
                return overflow("INT64", op);
            }
            return Value::int64(out);
        case ir::ArithmeticOp::Div:
            if (b == 0) {
                return division_by_zero(Value::int64(a));
            }
            return Value::float64(static_cast<double>(a) / static_cast<double>(b));
        case ir::ArithmeticOp::Mod:
            if (b == 0) {
                return division_by_zero(Value::int64(a));
            }
            if (b == -1) {
                return Value::int64(0);
            }
            return Value::int64(a % b);
    }
    return make_error(ErrorKind::InvalidPlan, "unknown arithmetic operator");
}

auto double_arithmetic(ir::ArithmeticOp op, double a, double b) -> Result<Value> {
    switch (op) {
        case ir::ArithmeticOp::Add:
            return Value::float64(a + b);
        case ir::ArithmeticOp::Sub:
            return Value::float64(a - b);
        case ir::ArithmeticOp::Mul:
            return Value::float64(a * b);
        case ir::ArithmeticOp::Div:
            if (b == 0.0) {
                return division_by_zero(Value::float64(a));
            }
            return Value::float64(a / b);
        case ir::ArithmeticOp::Mod:
            if (b == 0.0) {
                return division_by_zero(Value::float64(a));
            }
            return Value::float64(std::fmod(a, b));
    }
    return make_error(ErrorKind::InvalidPlan, "unknown arithmetic operator");
}

auto checked_numeric(int128_t units, ir::ArithmeticOp op) -> Result<Value> {
    if (units > kMaxNumericUnits || units < -kMaxNumericUnits) {
        return overflow("NUMERIC", op);
    }
    return Value::numeric(Numeric{units});
}

auto numeric_arithmetic(ir::ArithmeticOp op, Numeric a, Numeric b) -> Result<Value> {
    int128_t out = 0;
    switch (op) {
        case ir::ArithmeticOp::Add:
            return checked_numeric(a.units + b.units, op);
        case ir::ArithmeticOp::Sub:
            return checked_numeric(a.units - b.units, op);
        case ir::ArithmeticOp::Mul:
            if (__builtin_mul_overflow(a.units, b.units, &out)) {
                return overflow("NUMERIC", op);
            }
            return checked_numeric(out / Numeric::kUnit, op);
        case ir::ArithmeticOp::Div:
            if (b.units == 0) {
                return division_by_zero(Value::numeric(a));
            }
            if (__builtin_mul_overflow(a.units, static_cast<int128_t>(Numeric::kUnit), &out)) {
                return overflow("NUMERIC", op);
            }
            return checked_numeric(out / b.units, op);
        case ir::ArithmeticOp::Mod:
            if (b.units == 0) {
                return division_by_zero(Value::numeric(a));
            }
            return Value::numeric(Numeric{a.units % b.units});
    }
    return make_error(ErrorKind::InvalidPlan, "unknown arithmetic operator");
}

auto as_numeric(const Value& v) -> Numeric {
    return v.kind() == TypeKind::Numeric ? v.as_numeric() : Numeric::from_int(v.as_int64());
}

auto column_value(const ir::ColumnRef& ref, const Schema& schema, const Row& row)
    -> Result<Value> {
    std::size_t index = 0;
    if (ref.index.has_value()) {
        index = *ref.index;
    } else {
        auto resolved = schema.resolve(ref.name);
        if (!resolved) {
            return std::unexpected(resolved.error());
        }
        index = *resolved;
    }
    if (index >= row.size()) {
        return make_error(ErrorKind::InvalidPlan,
                          fmt::format("column index {} out of range for a row of {} values", index,
                                      row.size()));
    }
    return row[index];
}

auto eval_list(const std::vector<ir::ExprPtr>& exprs, const Schema& schema, const Row& row,
               const EvalContext& ctx) -> Result<std::vector<Value>> {
    std::vector<Value> out;
    out.reserve(exprs.size());
    for (const auto& e : exprs) {
        auto v = evaluate(*e, schema, row, ctx);
        if (!v) {
            return std::unexpected(v.error());
        }
        out.push_back(std::move(*v));
    }
    return out;
}

auto eval_is(ir::IsTest test, const Value& v) -> Result<TriBool> {
    if (test == ir::IsTest::Null || test == ir::IsTest::NotNull) {
        return to_tri(v.is_null() == (test == ir::IsTest::Null));
    }
    auto truth = to_truth(v);
    if (!truth) {
        return truth;
    }
    switch (test) {
        case ir::IsTest::True:
            return to_tri(*truth == TriBool::True);
        case ir::IsTest::NotTrue:
            return to_tri(*truth != TriBool::True);
        case ir::IsTest::False:
            return to_tri(*truth == TriBool::False);
        case ir::IsTest::NotFalse:
            return to_tri(*truth != TriBool::False);
        case ir::IsTest::Unknown:
            return to_tri(*truth == TriBool::Null);
        case ir::IsTest::NotUnknown:
            return to_tri(*truth != TriBool::Null);
        default:
            break;
    }
    return TriBool::Null;
}

auto subscript(const Value& array, const Value& index, bool safe) -> Result<Value> {
    if (array.is_null() || index.is_null()) {
        return Value::null();
    }
    if (array.kind() != TypeKind::Array) {
        return make_error(ErrorKind::TypeMismatch,
                          fmt::format("cannot subscript a value of type {}",
                                      type_name(array.kind())));
    }
    if (index.kind() != TypeKind::Int64) {
        return make_error(ErrorKind::TypeMismatch, "array subscript must be INT64");
    }
    const auto& elements = array.elements();
    auto i = index.as_int64();
    if (i < 0 || static_cast<std::size_t>(i) >= elements.size()) {
        if (safe) {
            return Value::null();
        }
        return make_error(ErrorKind::IndexOutOfRange,
                          fmt::format("array index {} is out of bounds (array length {})", i,
                                      elements.size()));
    }
    return elements[static_cast<std::size_t>(i)];
}

auto field_value(const Value& operand, const std::string& field) -> Result<Value> {
    if (operand.is_null()) {
        return Value::null();
    }
    if (operand.kind() != TypeKind::Struct) {
        return make_error(ErrorKind::TypeMismatch,
                          fmt::format("cannot access field {} of a value of type {}", field,
                                      type_name(operand.kind())));
    }
    const auto& names = operand.field_names();
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (iequals(names[i], field)) {
            return operand.field_values()[i];
        }
    }
    return make_error(ErrorKind::TypeMismatch,
                      fmt::format("field {} not found in struct (available: {})", field,
                                  names.empty() ? std::string("<none>")
                                                : fmt::format("{}", fmt::join(names, ", "))));
}

}  // namespace

auto rewrite_expr(const ir::ExprPtr& expr, const ExprRewriter& fn) -> Result<ir::ExprPtr> {
    auto replaced = fn(*expr);
    if (!replaced) {
        return std::unexpected(replaced.error());
    }
    if (replaced->has_value()) {
        return std::move(**replaced);
    }
    auto sub = [&](ir::ExprPtr& child) -> Result<void> {
        auto r = rewrite_expr(child, fn);
        if (!r) {
            return std::unexpected(r.error());
        }
        child = std::move(*r);
        return {};
    };
    return std::visit(
        [&](const auto& node) -> Result<ir::ExprPtr> {
            using T = std::decay_t<decltype(node)>;
            T copy = node;
            if constexpr (std::is_same_v<T, ir::CompareExpr> || std::is_same_v<T, ir::LogicalExpr> ||
                          std::is_same_v<T, ir::DistinctFromExpr> ||
                          std::is_same_v<T, ir::BinaryExpr>) {
                if (auto r = sub(copy.left); !r) {
                    return std::unexpected(r.error());
                }
                if (auto r = sub(copy.right); !r) {
                    return std::unexpected(r.error());
                }
            } else if constexpr (std::is_same_v<T, ir::NotExpr> || std::is_same_v<T, ir::IsExpr> ||
                                 std::is_same_v<T, ir::FieldAccess> ||
                                 std::is_same_v<T, ir::CollateExpr>) {
                if (auto r = sub(copy.operand); !r) {
                    return std::unexpected(r.error());
                }
            } else if constexpr (std::is_same_v<T, ir::LikeExpr>) {
                if (auto r = sub(copy.text); !r) {
                    return std::unexpected(r.error());
                }
                if (auto r = sub(copy.pattern); !r) {
                    return std::unexpected(r.error());
                }
            } else if constexpr (std::is_same_v<T, ir::InListExpr>) {
                if (auto r = sub(copy.operand); !r) {
                    return std::unexpected(r.error());
                }
                for (auto& item : copy.list) {
                    if (auto r = sub(item); !r) {
                        return std::unexpected(r.error());
                    }
                }
            } else if constexpr (std::is_same_v<T, ir::CallExpr>) {
                for (auto& arg : copy.args) {
                    if (auto r = sub(arg); !r) {
                        return std::unexpected(r.error());
                    }
                }
            } else if constexpr (std::is_same_v<T, ir::SubscriptExpr>) {
                if (auto r = sub(copy.array); !r) {
                    return std::unexpected(r.error());
                }
                if (auto r = sub(copy.index); !r) {
                    return std::unexpected(r.error());
                }
            } else {
                return expr;
            }
            return ir::make_expr(std::move(copy));
        },
        expr->node);
}

auto bind(const ir::ExprPtr& expr, const Schema& schema) -> Result<ir::ExprPtr> {
    return rewrite_expr(expr, [&](const ir::Expr& e) -> Result<std::optional<ir::ExprPtr>> {
        const auto* col = std::get_if<ir::ColumnRef>(&e.node);
        if (col == nullptr) {
            return std::nullopt;
        }
        if (col->index.has_value()) {
            if (*col->index >= schema.size()) {
                return make_error(ErrorKind::InvalidPlan,
                                  fmt::format("column index {} out of range (available: {})",
                                              *col->index, format_columns(schema)));
            }
            return std::nullopt;
        }
        auto index = schema.resolve(col->name);
        if (!index) {
            return std::unexpected(index.error());
        }
        return ir::make_expr(ir::ColumnRef{.name = col->name, .index = *index});
    });
}

auto to_truth(const Value& value) -> Result<TriBool> {
    if (value.is_null()) {
        return TriBool::Null;
    }
    if (value.kind() != TypeKind::Bool) {
        return make_error(ErrorKind::TypeMismatch,
                          fmt::format("expected BOOL, got {}", type_name(value.kind())));
    }
    return to_tri(value.as_bool());
}

auto arithmetic(ir::ArithmeticOp op, const Value& lhs, const Value& rhs) -> Result<Value> {
    if (lhs.is_null() || rhs.is_null()) {
        return Value::null();
    }
    auto lk = lhs.kind();
    auto rk = rhs.kind();
    if (!is_numeric_kind(lk) || !is_numeric_kind(rk)) {
        return make_error(ErrorKind::TypeMismatch,
                          fmt::format("arithmetic is not defined for {} and {}", type_name(lk),
                                      type_name(rk)));
    }
    if (lk == TypeKind::Double || rk == TypeKind::Double) {
        return double_arithmetic(op, static_cast<double>(numeric_as_long_double(lhs)),
                                 static_cast<double>(numeric_as_long_double(rhs)));
    }
    if (lk == TypeKind::Numeric || rk == TypeKind::Numeric) {
        return numeric_arithmetic(op, as_numeric(lhs), as_numeric(rhs));
    }
    return int_arithmetic(op, lhs.as_int64(), rhs.as_int64());
}

auto evaluate_predicate(const ir::Expr& expr, const Schema& schema, const Row& row,
                        const EvalContext& ctx) -> Result<TriBool> {
    if (const auto* logical = std::get_if<ir::LogicalExpr>(&expr.node)) {
        auto left = evaluate_predicate(*logical->left, schema, row, ctx);
        if (!left) {
            return left;
        }
        bool is_and = logical->op == ir::LogicalOp::And;
        if ((is_and && *left == TriBool::False) || (!is_and && *left == TriBool::True)) {
            return *left;
        }
        auto right = evaluate_predicate(*logical->right, schema, row, ctx);
        if (!right) {
            return right;
        }
        return is_and ? tri_and(*left, *right) : tri_or(*left, *right);
    }
    if (const auto* negation = std::get_if<ir::NotExpr>(&expr.node)) {
        auto inner = evaluate_predicate(*negation->operand, schema, row, ctx);
        if (!inner) {
            return inner;
        }
        return tri_not(*inner);
    }
    if (const auto* cmp = std::get_if<ir::CompareExpr>(&expr.node)) {
        auto left = evaluate(*cmp->left, schema, row, ctx);
        if (!left) {
            return std::unexpected(left.error());
        }
        auto right = evaluate(*cmp->right, schema, row, ctx);
        if (!right) {
            return std::unexpected(right.error());
        }
        return compare3vl(cmp->op, *left, *right, ctx.collation);
    }
    auto value = evaluate(expr, schema, row, ctx);
    if (!value) {
        return std::unexpected(value.error());
    }
    return to_truth(*value);
}

auto evaluate(const ir::Expr& expr, const Schema& schema, const Row& row, const EvalContext& ctx)
    -> Result<Value> {
    if (const auto* col = std::get_if<ir::ColumnRef>(&expr.node)) {
        return column_value(*col, schema, row);
    }
    if (const auto* outer = std::get_if<ir::OuterRef>(&expr.node)) {
        if (outer->depth >= ctx.outer.size()) {
            return make_error(ErrorKind::InvalidPlan,
                              fmt::format("outer reference {} has no enclosing lateral row",
                                          ir::to_string(expr)));
        }
        const auto* frame = ctx.outer[ctx.outer.size() - 1 - outer->depth];
        return column_value(outer->column, *frame->schema, frame->row);
    }
    if (const auto* lit = std::get_if<ir::Literal>(&expr.node)) {
        return lit->value;
    }
    if (std::holds_alternative<ir::LogicalExpr>(expr.node) ||
        std::holds_alternative<ir::NotExpr>(expr.node) ||
        std::holds_alternative<ir::CompareExpr>(expr.node)) {
        auto truth = evaluate_predicate(expr, schema, row, ctx);
        if (!truth) {
            return std::unexpected(truth.error());
        }
        return tri_to_value(*truth);
    }
    if (const auto* is = std::get_if<ir::IsExpr>(&expr.node)) {
        auto operand = evaluate(*is->operand, schema, row, ctx);
        if (!operand) {
            return operand;
        }
        auto truth = eval_is(is->test, *operand);
        if (!truth) {
            return std::unexpected(truth.error());
        }
        return tri_to_value(*truth);
    }
    if (const auto* distinct = std::get_if<ir::DistinctFromExpr>(&expr.node)) {
        auto left = evaluate(*distinct->left, schema, row, ctx);
        if (!left) {
            return left;
        }
        auto right = evaluate(*distinct->right, schema, row, ctx);
        if (!right) {
            return right;
        }
        auto result = is_distinct_from(*left, *right, ctx.collation);
        if (!result) {
            return std::unexpected(result.error());
        }
        return Value::boolean(*result != distinct->negated);
    }
    if (const auto* pattern = std::get_if<ir::LikeExpr>(&expr.node)) {
        auto text = evaluate(*pattern->text, schema, row, ctx);
        if (!text) {
            return text;
        }
        auto pat = evaluate(*pattern->pattern, schema, row, ctx);
        if (!pat) {
            return pat;
        }
        auto result = like(*text, *pat, ctx.collation);
        if (!result) {
            return std::unexpected(result.error());
        }
        return tri_to_value(pattern->negated ? tri_not(*result) : *result);
    }
    if (const auto* in = std::get_if<ir::InListExpr>(&expr.node)) {
        auto operand = evaluate(*in->operand, schema, row, ctx);
        if (!operand) {
            return operand;
        }
        auto list = eval_list(in->list, schema, row, ctx);
        if (!list) {
            return std::unexpected(list.error());
        }
        auto result = in_list(*operand, *list, ctx.collation);
        if (!result) {
            return std::unexpected(result.error());
        }
        return tri_to_value(in->negated ? tri_not(*result) : *result);
    }
    if (const auto* bin = std::get_if<ir::BinaryExpr>(&expr.node)) {
        auto left = evaluate(*bin->left, schema, row, ctx);
        if (!left) {
            return left;
        }
        auto right = evaluate(*bin->right, schema, row, ctx);
        if (!right) {
            return right;
        }
        return arithmetic(bin->op, *left, *right);
    }
    if (const auto* call = std::get_if<ir::CallExpr>(&expr.node)) {
        const auto* fn = ctx.registry().find_scalar(call->callee);
        if (fn == nullptr) {
            return make_error(ErrorKind::InvalidPlan,
                              fmt::format("unknown function: {} (available: {})", call->callee,
                                          ctx.registry().describe()));
        }
        auto args = eval_list(call->args, schema, row, ctx);
        if (!args) {
            return std::unexpected(args.error());
        }
        auto result = (*fn)(*args, ctx.collation);
        if (!result) {
            return std::unexpected(std::move(result.error()).at(call->callee));
        }
        return result;
    }
    if (const auto* access = std::get_if<ir::FieldAccess>(&expr.node)) {
        auto operand = evaluate(*access->operand, schema, row, ctx);
        if (!operand) {
            return operand;
        }
        return field_value(*operand, access->field);
    }
    if (const auto* sub = std::get_if<ir::SubscriptExpr>(&expr.node)) {
        auto array = evaluate(*sub->array, schema, row, ctx);
        if (!array) {
            return array;
        }
        auto index = evaluate(*sub->index, schema, row, ctx);
        if (!index) {
            return index;
        }
        return subscript(*array, *index, sub->safe);
    }
    if (const auto* collate = std::get_if<ir::CollateExpr>(&expr.node)) {
        auto operand = evaluate(*collate->operand, schema, row, ctx);
        if (!operand || operand->is_null()) {
            return operand;
        }
        if (operand->kind() != TypeKind::String) {
            return make_error(ErrorKind::TypeMismatch,
                              fmt::format("COLLATE requires STRING, got {}",
                                          type_name(operand->kind())));
        }
        return Value::string(operand->as_text().text, collate->collation);
    }
    return make_error(ErrorKind::InvalidPlan,
                      fmt::format("{} is only valid after aggregation or windowing",
                                  ir::to_string(expr)));
}

auto output_name(const ir::Expr& expr, std::size_t position) -> std::string {
    if (auto path = ir::field_path(expr); path.has_value() && !path->empty()) {
        const auto& last = path->back();
        if (auto dot = last.rfind('.'); dot != std::string::npos && path->size() == 1) {
            return last.substr(dot + 1);
        }
        return last;
    }
    return fmt::format("$col{}", position + 1);
}

}  // namespace oryx::runtime
