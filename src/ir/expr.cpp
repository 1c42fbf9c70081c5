#include <oryx/core/hash.hpp>
#include <oryx/core/table.hpp>
#include <oryx/ir/expr.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace oryx::ir {

namespace {

auto same_ptr(const ExprPtr& a, const ExprPtr& b) -> bool {
    if (!a || !b) {
        return !a && !b;
    }
    return same_expr(*a, *b);
}

auto same_list(const std::vector<ExprPtr>& a, const std::vector<ExprPtr>& b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!same_ptr(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

auto same_column(const ColumnRef& a, const ColumnRef& b) -> bool {
    if (a.index.has_value() && b.index.has_value()) {
        return *a.index == *b.index;
    }
    return iequals(a.name, b.name);
}

auto any_node(const Expr& expr, const auto& pred) -> bool {
    if (pred(expr)) {
        return true;
    }
    bool found = false;
    for_each_child(expr, [&](const Expr& child) {
        if (!found && any_node(child, pred)) {
            found = true;
        }
    });
    return found;
}

auto compare_symbol(CompareOp op) -> std::string_view {
    switch (op) {
        case CompareOp::Eq:
            return "=";
        case CompareOp::Ne:
            return "!=";
        case CompareOp::Lt:
            return "<";
        case CompareOp::Le:
            return "<=";
        case CompareOp::Gt:
            return ">";
        case CompareOp::Ge:
            return ">=";
    }
    return "?";
}

auto arithmetic_symbol(ArithmeticOp op) -> std::string_view {
    switch (op) {
        case ArithmeticOp::Add:
            return "+";
        case ArithmeticOp::Sub:
            return "-";
        case ArithmeticOp::Mul:
            return "*";
        case ArithmeticOp::Div:
            return "/";
        case ArithmeticOp::Mod:
            return "%";
    }
    return "?";
}

auto is_test_text(IsTest test) -> std::string_view {
    switch (test) {
        case IsTest::Null:
            return "IS NULL";
        case IsTest::NotNull:
            return "IS NOT NULL";
        case IsTest::True:
            return "IS TRUE";
        case IsTest::NotTrue:
            return "IS NOT TRUE";
        case IsTest::False:
            return "IS FALSE";
        case IsTest::NotFalse:
            return "IS NOT FALSE";
        case IsTest::Unknown:
            return "IS UNKNOWN";
        case IsTest::NotUnknown:
            return "IS NOT UNKNOWN";
    }
    return "IS ?";
}

auto column_text(const ColumnRef& ref) -> std::string {
    if (!ref.name.empty()) {
        return ref.name;
    }
    return fmt::format("${}", ref.index.value_or(0));
}

}  // namespace

auto same_expr(const Expr& a, const Expr& b) -> bool {
    if (a.node.index() != b.node.index()) {
        return false;
    }
    return std::visit(
        [&](const auto& lhs) -> bool {
            using T = std::decay_t<decltype(lhs)>;
            const auto& rhs = std::get<T>(b.node);
            if constexpr (std::is_same_v<T, ColumnRef>) {
                return same_column(lhs, rhs);
            } else if constexpr (std::is_same_v<T, OuterRef>) {
                return lhs.depth == rhs.depth && same_column(lhs.column, rhs.column);
            } else if constexpr (std::is_same_v<T, Literal>) {
                return lhs.value.kind() == rhs.value.kind() && same_value(lhs.value, rhs.value) &&
                       (lhs.value.kind() != TypeKind::String ||
                        lhs.value.as_text().collation == rhs.value.as_text().collation);
            } else if constexpr (std::is_same_v<T, CompareExpr>) {
                return lhs.op == rhs.op && same_ptr(lhs.left, rhs.left) &&
                       same_ptr(lhs.right, rhs.right);
            } else if constexpr (std::is_same_v<T, LogicalExpr> || std::is_same_v<T, BinaryExpr>) {
                return lhs.op == rhs.op && same_ptr(lhs.left, rhs.left) &&
                       same_ptr(lhs.right, rhs.right);
            } else if constexpr (std::is_same_v<T, NotExpr>) {
                return same_ptr(lhs.operand, rhs.operand);
            } else if constexpr (std::is_same_v<T, IsExpr>) {
                return lhs.test == rhs.test && same_ptr(lhs.operand, rhs.operand);
            } else if constexpr (std::is_same_v<T, DistinctFromExpr>) {
                return lhs.negated == rhs.negated && same_ptr(lhs.left, rhs.left) &&
                       same_ptr(lhs.right, rhs.right);
            } else if constexpr (std::is_same_v<T, LikeExpr>) {
                return lhs.negated == rhs.negated && same_ptr(lhs.text, rhs.text) &&
                       same_ptr(lhs.pattern, rhs.pattern);
            } else if constexpr (std::is_same_v<T, InListExpr>) {
                return lhs.negated == rhs.negated && same_ptr(lhs.operand, rhs.operand) &&
                       same_list(lhs.list, rhs.list);
            } else if constexpr (std::is_same_v<T, CallExpr>) {
                return iequals(lhs.callee, rhs.callee) && same_list(lhs.args, rhs.args);
            } else if constexpr (std::is_same_v<T, FieldAccess>) {
                return iequals(lhs.field, rhs.field) && same_ptr(lhs.operand, rhs.operand);
            } else if constexpr (std::is_same_v<T, SubscriptExpr>) {
                return lhs.safe == rhs.safe && same_ptr(lhs.array, rhs.array) &&
                       same_ptr(lhs.index, rhs.index);
            } else if constexpr (std::is_same_v<T, CollateExpr>) {
                return lhs.collation == rhs.collation && same_ptr(lhs.operand, rhs.operand);
            } else if constexpr (std::is_same_v<T, AggregateRef> || std::is_same_v<T, WindowRef>) {
                return lhs.index == rhs.index;
            } else {
                return true;
            }
        },
        a.node);
}

auto contains_aggregate_or_window(const Expr& expr) -> bool {
    return any_node(expr, [](const Expr& e) {
        return std::holds_alternative<AggregateRef>(e.node) ||
               std::holds_alternative<WindowRef>(e.node) ||
               std::holds_alternative<GroupingIdRef>(e.node);
    });
}

auto references_input(const Expr& expr) -> bool {
    return any_node(expr, [](const Expr& e) { return std::holds_alternative<ColumnRef>(e.node); });
}

auto references_outer(const Expr& expr, std::size_t depth) -> bool {
    return any_node(expr, [depth](const Expr& e) {
        const auto* outer = std::get_if<OuterRef>(&e.node);
        return outer != nullptr && outer->depth >= depth;
    });
}

auto field_path(const Expr& expr) -> std::optional<std::vector<std::string>> {
    if (const auto* col = std::get_if<ColumnRef>(&expr.node)) {
        if (col->name.empty()) {
            return std::nullopt;
        }
        return std::vector<std::string>{col->name};
    }
    if (const auto* access = std::get_if<FieldAccess>(&expr.node)) {
        auto base = field_path(*access->operand);
        if (!base) {
            return std::nullopt;
        }
        base->push_back(access->field);
        return base;
    }
    return std::nullopt;
}

auto to_string(const Expr& expr) -> std::string {
    return std::visit(
        [](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ColumnRef>) {
                return column_text(node);
            } else if constexpr (std::is_same_v<T, OuterRef>) {
                return fmt::format("outer[{}].{}", node.depth, column_text(node.column));
            } else if constexpr (std::is_same_v<T, Literal>) {
                return node.value.to_string();
            } else if constexpr (std::is_same_v<T, CompareExpr>) {
                return fmt::format("({} {} {})", to_string(*node.left), compare_symbol(node.op),
                                   to_string(*node.right));
            } else if constexpr (std::is_same_v<T, LogicalExpr>) {
                return fmt::format("({} {} {})", to_string(*node.left),
                                   node.op == LogicalOp::And ? "AND" : "OR",
                                   to_string(*node.right));
            } else if constexpr (std::is_same_v<T, NotExpr>) {
                return fmt::format("(NOT {})", to_string(*node.operand));
            } else if constexpr (std::is_same_v<T, IsExpr>) {
                return fmt::format("({} {})", to_string(*node.operand), is_test_text(node.test));
            } else if constexpr (std::is_same_v<T, DistinctFromExpr>) {
                return fmt::format("({} IS {}DISTINCT FROM {})", to_string(*node.left),
                                   node.negated ? "NOT " : "", to_string(*node.right));
            } else if constexpr (std::is_same_v<T, LikeExpr>) {
                return fmt::format("({} {}LIKE {})", to_string(*node.text),
                                   node.negated ? "NOT " : "", to_string(*node.pattern));
            } else if constexpr (std::is_same_v<T, InListExpr>) {
                std::vector<std::string> items;
                items.reserve(node.list.size());
                for (const auto& item : node.list) {
                    items.push_back(to_string(*item));
                }
                return fmt::format("({} {}IN ({}))", to_string(*node.operand),
                                   node.negated ? "NOT " : "", fmt::join(items, ", "));
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                return fmt::format("({} {} {})", to_string(*node.left),
                                   arithmetic_symbol(node.op), to_string(*node.right));
            } else if constexpr (std::is_same_v<T, CallExpr>) {
                std::vector<std::string> args;
                args.reserve(node.args.size());
                for (const auto& arg : node.args) {
                    args.push_back(to_string(*arg));
                }
                return fmt::format("{}({})", node.callee, fmt::join(args, ", "));
            } else if constexpr (std::is_same_v<T, FieldAccess>) {
                return fmt::format("{}.{}", to_string(*node.operand), node.field);
            } else if constexpr (std::is_same_v<T, SubscriptExpr>) {
                return fmt::format("{}[{}OFFSET({})]", to_string(*node.array),
                                   node.safe ? "SAFE_" : "", to_string(*node.index));
            } else if constexpr (std::is_same_v<T, CollateExpr>) {
                return fmt::format("COLLATE({}, '{}')", to_string(*node.operand), node.collation);
            } else if constexpr (std::is_same_v<T, AggregateRef>) {
                return fmt::format("$agg{}", node.index);
            } else if constexpr (std::is_same_v<T, WindowRef>) {
                return fmt::format("$window{}", node.index);
            } else {
                return "GROUPING()";
            }
        },
        expr.node);
}

}  // namespace oryx::ir
