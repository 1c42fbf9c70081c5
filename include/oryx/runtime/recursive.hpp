#pragma once

#include <oryx/core/collation.hpp>
#include <oryx/core/error.hpp>
#include <oryx/core/hash.hpp>
#include <oryx/core/table.hpp>
#include <oryx/ir/node.hpp>
#include <oryx/runtime/coercion.hpp>
#include <oryx/runtime/eval.hpp>

#include <cstddef>
#include <functional>
#include <vector>

namespace oryx::runtime {

/// Fixpoint state of one recursive binding.
struct RecursiveState {
    /// Rows accumulated so far, in production order.
    Table result;
    /// Rows added by the previous iteration; the recursive term reads these.
    Table working;
    /// Row keys already produced (UNION DISTINCT only).
    RowKeySet seen;
    /// Per-column collation the keys in `seen` were built under.
    std::vector<CollationSpec> collations;
    std::size_t iteration = 0;
};

/// Evaluates the recursive term once against the previous working set.
using RecursiveStep = std::function<Result<Table>(const Table& working, std::size_t iteration)>;

/// Iterates `step` from `base` until an iteration adds no rows. With
/// SetQuantifier::Distinct only rows not produced before are added. An
/// iteration beyond `max_iterations` that still adds rows fails with
/// NonTerminatingRecursion.
[[nodiscard]] auto evaluate_recursive(Table base, const RecursiveStep& step,
                                      ir::SetQuantifier quantifier, std::size_t max_iterations,
                                      const EvalContext& ctx,
                                      const CoercionService& coercion = default_coercion())
    -> Result<Table>;

}  // namespace oryx::runtime
