#pragma once

#include <oryx/core/collation.hpp>
#include <oryx/core/error.hpp>
#include <oryx/core/value.hpp>

#include <compare>
#include <cstddef>
#include <span>
#include <vector>

namespace oryx::runtime {

struct SortDirection {
    bool ascending = true;
    bool nulls_first = true;
};

/// Lexicographic comparison of two key tuples. NULL placement follows
/// `nulls_first` independently of the direction.
[[nodiscard]] auto compare_keys(const Row& a, const Row& b, std::span<const SortDirection> dirs,
                                const CollationContext& ctx) -> Result<std::weak_ordering>;

/// Stable permutation sorting `keys`; ties keep input order.
[[nodiscard]] auto stable_order(const std::vector<Row>& keys, std::span<const SortDirection> dirs,
                                const CollationContext& ctx) -> Result<std::vector<std::size_t>>;

}  // namespace oryx::runtime
