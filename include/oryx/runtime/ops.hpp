#pragma once

#include <oryx/core/error.hpp>
#include <oryx/core/table.hpp>
#include <oryx/ir/expr.hpp>
#include <oryx/ir/node.hpp>
#include <oryx/runtime/interpreter.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace oryx::ops {

// ─── Core table operations ────────────────────────────────────────────────────
//  One-operator plans over in-memory tables, routed through interpret() so
//  they share validation and semantics with full plans.

[[nodiscard]] auto filter(const Table& t, ir::ExprPtr predicate,
                          const runtime::EvalOptions& options = {}) -> Result<Table>;

[[nodiscard]] auto distinct(const Table& t, const runtime::EvalOptions& options = {})
    -> Result<Table>;

[[nodiscard]] auto order(const Table& t, std::vector<ir::SortKey> keys,
                         const runtime::EvalOptions& options = {}) -> Result<Table>;

[[nodiscard]] auto join(const Table& left, const Table& right, ir::JoinSpec spec,
                        const runtime::EvalOptions& options = {}) -> Result<Table>;

[[nodiscard]] auto set_op(const Table& left, const Table& right, ir::SetOpSpec spec,
                          const runtime::EvalOptions& options = {}) -> Result<Table>;

/// SELECT keys..., aggs... FROM t GROUP BY <group_by>.
[[nodiscard]] auto aggregate(const Table& t, ir::GroupingSpec group_by,
                             std::vector<ir::AggSpec> aggs,
                             const runtime::EvalOptions& options = {}) -> Result<Table>;

/// Aligned text rendering: header, dashes, one line per row.
void print(const Table& t, std::ostream& out = std::cout);

// ─── Expression builders ──────────────────────────────────────────────────────

[[nodiscard]] auto col(std::string name) -> ir::ExprPtr;
[[nodiscard]] auto outer_col(std::string name, std::size_t depth = 0) -> ir::ExprPtr;
[[nodiscard]] auto lit(Value v) -> ir::ExprPtr;
[[nodiscard]] auto int_lit(std::int64_t v) -> ir::ExprPtr;
[[nodiscard]] auto dbl_lit(double v) -> ir::ExprPtr;
[[nodiscard]] auto str_lit(std::string v, std::string collation = {}) -> ir::ExprPtr;
[[nodiscard]] auto null_lit() -> ir::ExprPtr;
[[nodiscard]] auto cmp(CompareOp op, ir::ExprPtr l, ir::ExprPtr r) -> ir::ExprPtr;
[[nodiscard]] auto eq(ir::ExprPtr l, ir::ExprPtr r) -> ir::ExprPtr;
[[nodiscard]] auto and_(ir::ExprPtr l, ir::ExprPtr r) -> ir::ExprPtr;
[[nodiscard]] auto or_(ir::ExprPtr l, ir::ExprPtr r) -> ir::ExprPtr;
[[nodiscard]] auto not_(ir::ExprPtr operand) -> ir::ExprPtr;
[[nodiscard]] auto binop(ir::ArithmeticOp op, ir::ExprPtr l, ir::ExprPtr r) -> ir::ExprPtr;
[[nodiscard]] auto fn_call(std::string callee, std::vector<ir::ExprPtr> args) -> ir::ExprPtr;
[[nodiscard]] auto field(ir::ExprPtr operand, std::string name) -> ir::ExprPtr;

// ─── Compound builders ────────────────────────────────────────────────────────

[[nodiscard]] auto make_item(ir::ExprPtr expr, std::string alias = {}) -> ir::SelectItem;
[[nodiscard]] auto make_agg(ir::AggFunc func, ir::ExprPtr argument, std::string alias)
    -> ir::AggSpec;
/// GROUP BY a, b as simple items.
[[nodiscard]] auto group_by_columns(const std::vector<std::string>& names) -> ir::GroupingSpec;

}  // namespace oryx::ops
