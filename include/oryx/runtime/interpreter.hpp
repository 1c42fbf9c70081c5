#pragma once

#include <oryx/core/collation.hpp>
#include <oryx/core/error.hpp>
#include <oryx/core/table.hpp>
#include <oryx/ir/node.hpp>
#include <oryx/runtime/coercion.hpp>
#include <oryx/runtime/eval.hpp>
#include <oryx/runtime/functions.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace oryx::runtime {

/// Evaluation knobs. Null collaborators fall back to the built-in ones.
struct EvalOptions {
    /// WITH RECURSIVE iterations allowed to add rows.
    std::size_t max_recursion_iterations = 500;
    /// WHERE inputs with at least this many rows are filtered in parallel.
    std::size_t parallel_threshold = 100'000;
    /// Worker threads for parallel filtering; 0 uses the hardware count.
    std::size_t max_workers = 0;
    const Collator* collator = nullptr;
    const FunctionRegistry* functions = nullptr;
    const CoercionService* coercion = nullptr;
};

/// Validates and evaluates a plan against a table registry.
[[nodiscard]] auto interpret(const ir::Node& node, const TableRegistry& registry,
                             const EvalOptions& options = {}) -> Result<Table>;

/// Rows of `input` for which `predicate` is TRUE, in input order.
[[nodiscard]] auto filter_rows(const Table& input, const ir::Expr& predicate,
                               const EvalContext& ctx, const EvalOptions& options = {})
    -> Result<Table>;

/// Drops duplicate rows (IS NOT DISTINCT FROM), keeping first occurrences.
[[nodiscard]] auto distinct_rows(const Table& input, const CollationContext& ctx)
    -> Result<Table>;

/// Stable sort by `keys`; keys with an output index read that column.
[[nodiscard]] auto order_rows(const Table& input, const std::vector<ir::SortKey>& keys,
                              const EvalContext& ctx) -> Result<Table>;

/// Skips `offset` rows, then keeps at most `limit`.
[[nodiscard]] auto limit_rows(Table input, std::optional<std::int64_t> limit, std::int64_t offset)
    -> Table;

}  // namespace oryx::runtime
