#pragma once

#include <oryx/core/error.hpp>
#include <oryx/ir/node.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace oryx::ir {

/// Construction-time plan checks, run before any row flows: join shapes,
/// recursive WITH shapes, outer reference scoping and node arity.
[[nodiscard]] auto validate(const Node& root) -> Result<void>;

/// Join shape rules: LATERAL / correlated right inputs only with CROSS, INNER
/// and LEFT; a comma join may not be followed by an unparenthesized RIGHT or
/// FULL join; USING, NATURAL and ON are mutually exclusive.
[[nodiscard]] auto validate_join(const JoinNode& join) -> Result<void>;

/// Recursive binding rules for one WITH RECURSIVE clause.
[[nodiscard]] auto validate_recursive_with(const WithNode& with) -> Result<void>;

/// Evaluation order of a WITH clause's bindings: declaration order for plain
/// WITH, dependency order for WITH RECURSIVE (cycles are rejected).
[[nodiscard]] auto binding_order(const WithNode& with) -> Result<std::vector<std::size_t>>;

/// Number of scans of `name` anywhere below `node`.
[[nodiscard]] auto count_table_refs(const Node& node, std::string_view name) -> std::size_t;

/// True when the subtree reads the row of an enclosing lateral join it does
/// not itself introduce.
[[nodiscard]] auto is_correlated(const Node& node) -> bool;

/// True when the join evaluates its right input once per left row.
[[nodiscard]] auto is_lateral(const JoinNode& join) -> bool;

/// Expressions evaluated directly by `node` (not its children).
[[nodiscard]] auto node_exprs(const Node& node) -> std::vector<const Expr*>;

}  // namespace oryx::ir
