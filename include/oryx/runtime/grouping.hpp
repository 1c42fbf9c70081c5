#pragma once

#include <oryx/core/error.hpp>
#include <oryx/core/table.hpp>
#include <oryx/ir/node.hpp>
#include <oryx/runtime/eval.hpp>

#include <bitset>
#include <cstddef>
#include <vector>

namespace oryx::runtime {

inline constexpr std::size_t kMaxGroupingSets = 4096;
inline constexpr std::size_t kMaxGroupingKeys = 64;

/// Flattened GROUP BY: distinct key expressions and the grouping sets over
/// them. Bit i of a set is on when key i is grouped in that set.
struct GroupingPlan {
    std::vector<ir::ExprPtr> keys;
    std::vector<std::bitset<kMaxGroupingKeys>> sets;
};

/// Expands ROLLUP, CUBE, GROUPING SETS and tuples, combining the items of the
/// clause by cross product. Keys are deduplicated structurally.
[[nodiscard]] auto expand_grouping(const ir::GroupingSpec& spec) -> Result<GroupingPlan>;

/// GROUP BY ALL keys: select items without aggregate or window calls that read
/// at least one input column. A key whose field path extends another key's
/// path is dropped.
[[nodiscard]] auto infer_group_by_all(const std::vector<ir::SelectItem>& items)
    -> std::vector<ir::ExprPtr>;

/// Groups `input` once per grouping set and concatenates the results in set
/// order. Output columns: one per key (NULL where the set excludes it), one
/// per aggregate, then `$grouping_id` with bit i set when key i was
/// aggregated away. An empty grouping set yields exactly one row.
[[nodiscard]] auto group(const Table& input, const GroupingPlan& plan,
                         const std::vector<ir::AggSpec>& aggregates, const EvalContext& ctx)
    -> Result<Table>;

inline constexpr const char* kGroupingIdColumn = "$grouping_id";

}  // namespace oryx::runtime
