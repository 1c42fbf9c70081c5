#pragma once

#include <oryx/core/error.hpp>
#include <oryx/core/table.hpp>
#include <oryx/ir/node.hpp>
#include <oryx/runtime/eval.hpp>

#include <vector>

namespace oryx::runtime {

/// Appends one column per window function to `input`, keeping row order.
///
/// Rows are partitioned by PARTITION BY (NULLs together, strings under their
/// collation) and stably sorted by ORDER BY within each partition.
[[nodiscard]] auto apply_windows(const Table& input, const std::vector<ir::WindowSpec>& windows,
                                 const EvalContext& ctx) -> Result<Table>;

}  // namespace oryx::runtime
