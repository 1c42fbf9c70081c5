#pragma once

#include <oryx/core/collation.hpp>
#include <oryx/core/error.hpp>
#include <oryx/core/table.hpp>
#include <oryx/core/value.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <span>
#include <vector>

namespace oryx {

/// Row identity key built from canonical values. Two rows have equal keys iff
/// they are not distinct under IS NOT DISTINCT FROM and their column collations.
struct RowKey {
    std::vector<Value> values;
};

struct RowKeyHash {
    auto operator()(const RowKey& key) const -> std::size_t;
};

struct RowKeyEq {
    auto operator()(const RowKey& a, const RowKey& b) const -> bool;
};

template <typename V>
using RowKeyMap = robin_hood::unordered_flat_map<RowKey, V, RowKeyHash, RowKeyEq>;
using RowKeySet = robin_hood::unordered_flat_set<RowKey, RowKeyHash, RowKeyEq>;

/// Hash-stable form of a value: strings folded under `spec` (or their own
/// collation), integral numerics as Int64, -0.0 as 0.0, one NaN, struct field
/// names dropped, intervals by length. JSON has no identity (TypeMismatch).
[[nodiscard]] auto canonical_value(const Value& value, const CollationSpec& spec,
                                   const CollationContext& ctx) -> Result<Value>;

[[nodiscard]] auto hash_value(const Value& value) -> std::size_t;

/// Exact structural equality of two canonical values.
[[nodiscard]] auto same_value(const Value& a, const Value& b) -> bool;

/// Effective collation of each column across every given table: the single
/// explicit non-default specification found, or binary. Two different ones
/// raise CollationConflict.
[[nodiscard]] auto column_collations(std::span<const Table* const> tables,
                                     const CollationContext& ctx)
    -> Result<std::vector<CollationSpec>>;

/// Key over `columns` of `row` (all columns when `columns` is empty).
[[nodiscard]] auto make_row_key(const Row& row, std::span<const std::size_t> columns,
                                std::span<const CollationSpec> collations,
                                const CollationContext& ctx) -> Result<RowKey>;

}  // namespace oryx
