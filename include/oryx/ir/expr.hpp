#pragma once

#include <oryx/core/compare.hpp>
#include <oryx/core/value.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace oryx::ir {

/// Scalar expression trees are immutable and shared between plan nodes.
struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

/// Column of the current input row, by position when `index` is set and
/// otherwise by (optionally qualified) name.
struct ColumnRef {
    std::string name;
    std::optional<std::size_t> index;
};

/// Column of an enclosing lateral row. Depth 0 is the innermost left row.
struct OuterRef {
    std::size_t depth = 0;
    ColumnRef column;
};

struct Literal {
    Value value;
};

struct CompareExpr {
    CompareOp op = CompareOp::Eq;
    ExprPtr left;
    ExprPtr right;
};

enum class LogicalOp : std::uint8_t {
    And,
    Or,
};

struct LogicalExpr {
    LogicalOp op = LogicalOp::And;
    ExprPtr left;
    ExprPtr right;
};

struct NotExpr {
    ExprPtr operand;
};

/// `IS [NOT] {NULL, TRUE, FALSE, UNKNOWN}`; never yields NULL.
enum class IsTest : std::uint8_t {
    Null,
    NotNull,
    True,
    NotTrue,
    False,
    NotFalse,
    Unknown,
    NotUnknown,
};

struct IsExpr {
    IsTest test = IsTest::Null;
    ExprPtr operand;
};

/// `IS [NOT] DISTINCT FROM`.
struct DistinctFromExpr {
    bool negated = false;
    ExprPtr left;
    ExprPtr right;
};

struct LikeExpr {
    bool negated = false;
    ExprPtr text;
    ExprPtr pattern;
};

struct InListExpr {
    bool negated = false;
    ExprPtr operand;
    std::vector<ExprPtr> list;
};

enum class ArithmeticOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    Mod,
};

struct BinaryExpr {
    ArithmeticOp op = ArithmeticOp::Add;
    ExprPtr left;
    ExprPtr right;
};

/// Scalar function call, dispatched through the FunctionRegistry.
struct CallExpr {
    std::string callee;
    std::vector<ExprPtr> args;
};

struct FieldAccess {
    ExprPtr operand;
    std::string field;
};

/// `array[OFFSET(i)]` (zero-based); `safe` yields NULL instead of
/// IndexOutOfRange.
struct SubscriptExpr {
    ExprPtr array;
    ExprPtr index;
    bool safe = false;
};

struct CollateExpr {
    ExprPtr operand;
    std::string collation;
};

/// Result of the select block's aggregate at `index`.
struct AggregateRef {
    std::size_t index = 0;
};

/// Result of the select block's window function at `index`.
struct WindowRef {
    std::size_t index = 0;
};

/// GROUPING() bitmask of the current grouping set: bit i is set when grouping
/// key i was aggregated away.
struct GroupingIdRef {};

struct Expr {
    std::variant<ColumnRef, OuterRef, Literal, CompareExpr, LogicalExpr, NotExpr, IsExpr,
                 DistinctFromExpr, LikeExpr, InListExpr, BinaryExpr, CallExpr, FieldAccess,
                 SubscriptExpr, CollateExpr, AggregateRef, WindowRef, GroupingIdRef>
        node;
};

template <typename T>
[[nodiscard]] auto make_expr(T node) -> ExprPtr {
    return std::make_shared<const Expr>(Expr{std::move(node)});
}

/// Structural equality (column names compare case-insensitively).
[[nodiscard]] auto same_expr(const Expr& a, const Expr& b) -> bool;

[[nodiscard]] auto contains_aggregate_or_window(const Expr& expr) -> bool;

/// True when the expression reads at least one column of the current input.
[[nodiscard]] auto references_input(const Expr& expr) -> bool;

/// Outer references that escape `depth` enclosing lateral levels.
[[nodiscard]] auto references_outer(const Expr& expr, std::size_t depth) -> bool;

/// Dotted path for `col.field.field` chains; nullopt for anything else.
[[nodiscard]] auto field_path(const Expr& expr) -> std::optional<std::vector<std::string>>;

/// Calls `fn` for every direct child expression.
template <typename Fn>
void for_each_child(const Expr& expr, Fn&& fn) {
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, CompareExpr> || std::is_same_v<T, LogicalExpr> ||
                          std::is_same_v<T, DistinctFromExpr> || std::is_same_v<T, BinaryExpr>) {
                fn(*node.left);
                fn(*node.right);
            } else if constexpr (std::is_same_v<T, NotExpr> || std::is_same_v<T, IsExpr> ||
                                 std::is_same_v<T, FieldAccess> || std::is_same_v<T, CollateExpr>) {
                fn(*node.operand);
            } else if constexpr (std::is_same_v<T, LikeExpr>) {
                fn(*node.text);
                fn(*node.pattern);
            } else if constexpr (std::is_same_v<T, InListExpr>) {
                fn(*node.operand);
                for (const auto& item : node.list) {
                    fn(*item);
                }
            } else if constexpr (std::is_same_v<T, CallExpr>) {
                for (const auto& arg : node.args) {
                    fn(*arg);
                }
            } else if constexpr (std::is_same_v<T, SubscriptExpr>) {
                fn(*node.array);
                fn(*node.index);
            }
        },
        expr.node);
}

/// Debug rendering used in logs and error messages.
[[nodiscard]] auto to_string(const Expr& expr) -> std::string;

}  // namespace oryx::ir
