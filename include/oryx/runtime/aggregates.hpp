#pragma once

#include <oryx/core/collation.hpp>
#include <oryx/core/error.hpp>
#include <oryx/ir/node.hpp>
#include <oryx/runtime/functions.hpp>

#include <memory>
#include <string_view>

namespace oryx::runtime {

/// Fresh accumulator for `spec`. Built-ins skip NULL arguments (except
/// COUNT(*)); DISTINCT wraps any accumulator so repeated argument values are
/// fed once. Extern aggregates are looked up in `functions`.
[[nodiscard]] auto make_accumulator(const ir::AggSpec& spec, const FunctionRegistry& functions,
                                    const CollationContext& ctx)
    -> Result<std::unique_ptr<Accumulator>>;

/// Display name of an aggregate, e.g. "sum" or the extern callee.
[[nodiscard]] auto aggregate_name(const ir::AggSpec& spec) -> std::string_view;

}  // namespace oryx::runtime
