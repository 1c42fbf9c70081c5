#pragma once

#include <oryx/core/error.hpp>
#include <oryx/core/table.hpp>
#include <oryx/ir/node.hpp>
#include <oryx/runtime/coercion.hpp>
#include <oryx/runtime/eval.hpp>

#include <span>
#include <string>
#include <utility>

namespace oryx::runtime {

/// Reconciles the columns of two set operation inputs. Both returned tables
/// share the output layout and column types.
[[nodiscard]] auto align_columns(const Table& left, const Table& right, const ir::SetOpSpec& spec,
                                 const CoercionService& coercion)
    -> Result<std::pair<Table, Table>>;

/// `left op right` with bag semantics. Row identity is IS NOT DISTINCT FROM
/// under each column's collation.
[[nodiscard]] auto combine(const Table& left, const Table& right, const ir::SetOpSpec& spec,
                           const EvalContext& ctx,
                           const CoercionService& coercion = default_coercion()) -> Result<Table>;

/// Folds two or more inputs left to right.
[[nodiscard]] auto combine_all(std::span<const Table> inputs, const ir::SetOpSpec& spec,
                               const EvalContext& ctx,
                               const CoercionService& coercion = default_coercion())
    -> Result<Table>;

/// "UNION ALL", "INTERSECT DISTINCT", ...
[[nodiscard]] auto set_op_name(const ir::SetOpSpec& spec) -> std::string;

}  // namespace oryx::runtime
