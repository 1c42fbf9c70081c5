#pragma once

#include <oryx/core/collation.hpp>
#include <oryx/core/compare.hpp>
#include <oryx/core/error.hpp>
#include <oryx/core/table.hpp>
#include <oryx/ir/expr.hpp>
#include <oryx/runtime/functions.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace oryx::runtime {

/// Bound values of a left row handed to a lateral right input. The row is
/// copied so the producer never aliases the join's input.
struct LateralParams {
    const Schema* schema = nullptr;
    Row row;
};

/// Everything an expression may consult besides its own row.
struct EvalContext {
    CollationContext collation;
    const FunctionRegistry* functions = nullptr;
    /// Enclosing lateral rows, innermost last.
    std::vector<const LateralParams*> outer;

    [[nodiscard]] auto registry() const -> const FunctionRegistry& {
        return functions != nullptr ? *functions : builtin_functions();
    }
};

/// Replacement hook for rewrite_expr: a value replaces the node, nullopt
/// descends into its children.
using ExprRewriter = std::function<Result<std::optional<ir::ExprPtr>>(const ir::Expr&)>;

[[nodiscard]] auto rewrite_expr(const ir::ExprPtr& expr, const ExprRewriter& fn)
    -> Result<ir::ExprPtr>;

/// Resolves every named ColumnRef against `schema` to a position.
[[nodiscard]] auto bind(const ir::ExprPtr& expr, const Schema& schema) -> Result<ir::ExprPtr>;

/// Evaluates `expr` over `row`. Unbound column references are resolved by
/// name against `schema`.
[[nodiscard]] auto evaluate(const ir::Expr& expr, const Schema& schema, const Row& row,
                            const EvalContext& ctx) -> Result<Value>;

/// Evaluates a boolean expression under three-valued logic.
[[nodiscard]] auto evaluate_predicate(const ir::Expr& expr, const Schema& schema, const Row& row,
                                      const EvalContext& ctx) -> Result<TriBool>;

/// BOOL or NULL as a truth value; anything else is a TypeMismatch.
[[nodiscard]] auto to_truth(const Value& value) -> Result<TriBool>;

/// `lhs op rhs` over INT64, NUMERIC and DOUBLE with NULL propagation.
/// `/` always yields DOUBLE or NUMERIC; division by zero and INT64 or
/// NUMERIC overflow are errors.
[[nodiscard]] auto arithmetic(ir::ArithmeticOp op, const Value& lhs, const Value& rhs)
    -> Result<Value>;

/// Output column name for a select item without an alias.
[[nodiscard]] auto output_name(const ir::Expr& expr, std::size_t position) -> std::string;

}  // namespace oryx::runtime
