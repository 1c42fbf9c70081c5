#include <oryx/core/table.hpp>
#include <oryx/ir/validate.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <string>

// NOLINTBEGIN cppcoreguidelines-pro-type-static-cast-downcast
namespace oryx::ir {

namespace {

auto any_expr(const Expr& expr, const auto& pred) -> bool {
    if (pred(expr)) {
        return true;
    }
    bool found = false;
    for_each_child(expr, [&](const Expr& child) {
        if (!found && any_expr(child, pred)) {
            found = true;
        }
    });
    return found;
}

auto expr_error(const Expr& expr, std::string_view what) -> std::unexpected<Error> {
    return make_error(ErrorKind::InvalidPlan, fmt::format("{}: {}", what, to_string(expr)));
}

/// Aggregate and window references must be in range and appear only in the
/// clauses evaluated after the stage that produces them.
auto validate_select(const SelectNode& select) -> Result<void> {
    const auto& spec = select.spec();
    auto is_post_group = [](const Expr& e) {
        return std::holds_alternative<AggregateRef>(e.node) ||
               std::holds_alternative<WindowRef>(e.node) ||
               std::holds_alternative<GroupingIdRef>(e.node);
    };
    auto is_window = [](const Expr& e) { return std::holds_alternative<WindowRef>(e.node); };
    auto out_of_range = [&](const Expr& e) {
        if (const auto* agg = std::get_if<AggregateRef>(&e.node)) {
            return agg->index >= spec.aggregates.size();
        }
        if (const auto* win = std::get_if<WindowRef>(&e.node)) {
            return win->index >= spec.windows.size();
        }
        return false;
    };

    if (spec.where && any_expr(*spec.where, is_post_group)) {
        return expr_error(*spec.where, "aggregate or window reference in WHERE");
    }
    if (spec.group_by.has_value()) {
        for (const auto& item : spec.group_by->items) {
            std::vector<const GroupByItem*> stack{&item};
            while (!stack.empty()) {
                const auto* current = stack.back();
                stack.pop_back();
                for (const auto& element : current->elements) {
                    for (const auto& e : element.exprs) {
                        if (any_expr(*e, is_post_group)) {
                            return expr_error(*e, "aggregate or window reference in GROUP BY");
                        }
                    }
                }
                for (const auto& nested : current->sets) {
                    stack.push_back(&nested);
                }
            }
        }
    }
    for (const auto& agg : spec.aggregates) {
        if (agg.argument && any_expr(*agg.argument, is_post_group)) {
            return expr_error(*agg.argument, "nested aggregate");
        }
        if (agg.func == AggFunc::Extern && agg.callee.empty()) {
            return make_error(ErrorKind::InvalidPlan, "extern aggregate without a callee");
        }
        if (agg.func != AggFunc::CountStar && !agg.argument) {
            return make_error(ErrorKind::InvalidPlan, "aggregate requires an argument");
        }
    }
    if (spec.having && any_expr(*spec.having, is_window)) {
        return expr_error(*spec.having, "window reference in HAVING");
    }
    for (const auto& win : spec.windows) {
        std::vector<const Expr*> exprs;
        for (const auto& p : win.partition_by) {
            exprs.push_back(p.get());
        }
        for (const auto& k : win.order_by) {
            if (k.output_index.has_value() || !k.expr) {
                return make_error(ErrorKind::InvalidPlan,
                                  "window ORDER BY keys must be expressions, not output positions");
            }
            exprs.push_back(k.expr.get());
        }
        if (win.argument) {
            exprs.push_back(win.argument.get());
        }
        if (win.aggregate.argument) {
            exprs.push_back(win.aggregate.argument.get());
        }
        for (const auto* e : exprs) {
            if (any_expr(*e, is_window)) {
                return expr_error(*e, "nested window function");
            }
        }
        if ((win.func == WindowFunc::Lag || win.func == WindowFunc::Lead) && !win.argument) {
            return make_error(ErrorKind::InvalidPlan, "LAG/LEAD require an argument");
        }
        if (win.offset < 0) {
            return make_error(ErrorKind::InvalidPlan, "LAG/LEAD offset must be non-negative");
        }
    }
    for (const auto* e : node_exprs(select)) {
        if (any_expr(*e, out_of_range)) {
            return expr_error(*e, "aggregate or window reference out of range");
        }
    }
    for (const auto& key : spec.order_by) {
        if (key.output_index.has_value() && !spec.items.empty() &&
            *key.output_index >= spec.items.size()) {
            return make_error(ErrorKind::InvalidPlan,
                              fmt::format("ORDER BY output column {} out of range",
                                          *key.output_index));
        }
    }
    if (spec.limit.has_value() && *spec.limit < 0) {
        return make_error(ErrorKind::InvalidPlan, "LIMIT must be non-negative");
    }
    if (spec.offset < 0) {
        return make_error(ErrorKind::InvalidPlan, "OFFSET must be non-negative");
    }
    return {};
}

auto check_arity(const Node& node) -> Result<void> {
    std::size_t n = node.children().size();
    bool ok = true;
    switch (node.kind()) {
        case NodeKind::Scan:
        case NodeKind::Values:
        case NodeKind::Unnest:
            ok = n == 0;
            break;
        case NodeKind::Filter:
        case NodeKind::Project:
        case NodeKind::Distinct:
        case NodeKind::Order:
        case NodeKind::Limit:
            ok = n == 1;
            break;
        case NodeKind::Select:
            ok = n <= 1;
            break;
        case NodeKind::Join:
            ok = n == 2;
            break;
        case NodeKind::SetOp:
            ok = n >= 2;
            break;
        case NodeKind::With:
            ok = n == static_cast<const WithNode&>(node).bindings().size() + 1;
            break;
        case NodeKind::TableFunction:
            break;
    }
    if (!ok) {
        return make_error(ErrorKind::InvalidPlan,
                          fmt::format("{} node has {} children", node_kind_name(node.kind()), n));
    }
    return {};
}

auto correlated_at(const Node& node, std::size_t depth) -> bool {
    for (const auto* e : node_exprs(node)) {
        if (e != nullptr && references_outer(*e, depth)) {
            return true;
        }
    }
    if (node.kind() == NodeKind::Join && node.children().size() == 2) {
        const auto& join = static_cast<const JoinNode&>(node);
        return correlated_at(*node.children()[0], depth) ||
               correlated_at(*node.children()[1], depth + (is_lateral(join) ? 1 : 0));
    }
    return std::any_of(node.children().begin(), node.children().end(),
                       [depth](const NodePtr& child) { return correlated_at(*child, depth); });
}

/// Walks the recursive term of `name`, rejecting self-references inside any
/// context that would make the fixpoint ill-defined. `context` names the
/// outermost such context entered so far.
auto check_recursive_term(const Node& node, std::string_view name, std::string_view context,
                          std::size_t& refs) -> Result<void> {
    auto recurse = [&](const Node& child, std::string_view ctx) -> Result<void> {
        return check_recursive_term(child, name, context.empty() ? ctx : context, refs);
    };

    switch (node.kind()) {
        case NodeKind::Scan: {
            const auto& scan = static_cast<const ScanNode&>(node);
            if (!iequals(scan.source_name(), name)) {
                return {};
            }
            if (++refs > 1) {
                return make_error(ErrorKind::InvalidRecursiveShape,
                                  fmt::format("recursive WITH binding '{}' references itself "
                                              "more than once",
                                              name));
            }
            if (!context.empty()) {
                return make_error(ErrorKind::InvalidRecursiveShape,
                                  fmt::format("recursive reference to '{}' is not allowed inside {}",
                                              name, context));
            }
            return {};
        }
        case NodeKind::With:
            if (count_table_refs(node, name) > 0) {
                return make_error(ErrorKind::InvalidRecursiveShape,
                                  fmt::format("recursive reference to '{}' is not allowed inside "
                                              "a nested WITH",
                                              name));
            }
            return {};
        case NodeKind::Select: {
            const auto& spec = static_cast<const SelectNode&>(node).spec();
            std::string_view ctx;
            if (spec.group_by.has_value() || !spec.aggregates.empty()) {
                ctx = "an aggregation";
            } else if (spec.distinct) {
                ctx = "SELECT DISTINCT";
            } else if (!spec.windows.empty()) {
                ctx = "a window function";
            } else if (!spec.order_by.empty()) {
                ctx = "ORDER BY";
            } else if (spec.limit.has_value() || spec.offset > 0) {
                ctx = "LIMIT";
            }
            for (const auto& child : node.children()) {
                if (auto r = recurse(*child, ctx); !r) {
                    return r;
                }
            }
            return {};
        }
        case NodeKind::Distinct:
        case NodeKind::Order:
        case NodeKind::Limit: {
            std::string_view ctx = node.kind() == NodeKind::Distinct ? "SELECT DISTINCT"
                                   : node.kind() == NodeKind::Order  ? "ORDER BY"
                                                                     : "LIMIT";
            for (const auto& child : node.children()) {
                if (auto r = recurse(*child, ctx); !r) {
                    return r;
                }
            }
            return {};
        }
        case NodeKind::SetOp: {
            const auto& spec = static_cast<const SetOpNode&>(node).spec();
            for (std::size_t i = 0; i < node.children().size(); ++i) {
                std::string_view ctx;
                if (spec.quantifier == SetQuantifier::Distinct) {
                    ctx = "a DISTINCT set operation";
                } else if (spec.op == SetOpKind::Except && i > 0) {
                    ctx = "the right operand of EXCEPT";
                }
                if (auto r = recurse(*node.children()[i], ctx); !r) {
                    return r;
                }
            }
            return {};
        }
        case NodeKind::Join: {
            if (node.children().size() != 2) {
                return check_arity(node);
            }
            const auto kind = static_cast<const JoinNode&>(node).spec().kind;
            std::string_view left_ctx;
            std::string_view right_ctx;
            switch (kind) {
                case JoinKind::Full:
                    left_ctx = right_ctx = "an operand of FULL JOIN";
                    break;
                case JoinKind::Left:
                    right_ctx = "the right operand of LEFT JOIN";
                    break;
                case JoinKind::LeftAnti:
                    right_ctx = "the right operand of an anti join";
                    break;
                case JoinKind::Right:
                    left_ctx = "the left operand of RIGHT JOIN";
                    break;
                case JoinKind::RightAnti:
                    left_ctx = "the left operand of an anti join";
                    break;
                default:
                    break;
            }
            if (auto r = recurse(*node.children()[0], left_ctx); !r) {
                return r;
            }
            return recurse(*node.children()[1], right_ctx);
        }
        case NodeKind::TableFunction:
            for (const auto& child : node.children()) {
                if (auto r = recurse(*child, "a table-valued function argument"); !r) {
                    return r;
                }
            }
            return {};
        default:
            for (const auto& child : node.children()) {
                if (auto r = recurse(*child, {}); !r) {
                    return r;
                }
            }
            return {};
    }
}

auto validate_node(const Node& node, std::size_t frames) -> Result<void> {
    if (auto r = check_arity(node); !r) {
        return r;
    }
    for (const auto* e : node_exprs(node)) {
        if (e == nullptr) {
            return make_error(ErrorKind::InvalidPlan,
                              fmt::format("{} node has an empty expression",
                                          node_kind_name(node.kind())));
        }
        if (references_outer(*e, frames)) {
            return expr_error(*e, "outer reference outside of a lateral join");
        }
    }
    switch (node.kind()) {
        case NodeKind::Select:
            if (auto r = validate_select(static_cast<const SelectNode&>(node)); !r) {
                return r;
            }
            break;
        case NodeKind::SetOp: {
            const auto& spec = static_cast<const SetOpNode&>(node).spec();
            if (!spec.on_columns.empty() && spec.matching == ColumnMatch::Positional) {
                return make_error(ErrorKind::InvalidPlan,
                                  "ON/BY column lists require name-based matching");
            }
            break;
        }
        case NodeKind::Join: {
            const auto& join = static_cast<const JoinNode&>(node);
            if (auto r = validate_join(join); !r) {
                return r;
            }
            if (auto r = validate_node(*node.children()[0], frames); !r) {
                return r;
            }
            return validate_node(*node.children()[1], frames + (is_lateral(join) ? 1 : 0));
        }
        case NodeKind::With: {
            const auto& with = static_cast<const WithNode&>(node);
            if (with.recursive()) {
                if (auto r = validate_recursive_with(with); !r) {
                    return r;
                }
            }
            if (auto order = binding_order(with); !order) {
                return std::unexpected(order.error());
            }
            break;
        }
        default:
            break;
    }
    for (const auto& child : node.children()) {
        if (auto r = validate_node(*child, frames); !r) {
            return r;
        }
    }
    return {};
}

}  // namespace

auto join_kind_name(JoinKind kind) noexcept -> std::string_view {
    switch (kind) {
        case JoinKind::Cross:
            return "CROSS JOIN";
        case JoinKind::Inner:
            return "INNER JOIN";
        case JoinKind::Left:
            return "LEFT JOIN";
        case JoinKind::Right:
            return "RIGHT JOIN";
        case JoinKind::Full:
            return "FULL JOIN";
        case JoinKind::LeftSemi:
            return "LEFT SEMI JOIN";
        case JoinKind::LeftAnti:
            return "LEFT ANTI JOIN";
        case JoinKind::RightSemi:
            return "RIGHT SEMI JOIN";
        case JoinKind::RightAnti:
            return "RIGHT ANTI JOIN";
    }
    return "JOIN";
}

auto node_kind_name(NodeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case NodeKind::Scan:
            return "scan";
        case NodeKind::Values:
            return "values";
        case NodeKind::Filter:
            return "filter";
        case NodeKind::Project:
            return "project";
        case NodeKind::Join:
            return "join";
        case NodeKind::Unnest:
            return "unnest";
        case NodeKind::Select:
            return "select";
        case NodeKind::SetOp:
            return "set operation";
        case NodeKind::Distinct:
            return "distinct";
        case NodeKind::Order:
            return "order";
        case NodeKind::Limit:
            return "limit";
        case NodeKind::With:
            return "with";
        case NodeKind::TableFunction:
            return "table function";
    }
    return "unknown";
}

auto node_exprs(const Node& node) -> std::vector<const Expr*> {
    std::vector<const Expr*> out;
    auto add = [&](const ExprPtr& e) {
        if (e) {
            out.push_back(e.get());
        }
    };
    switch (node.kind()) {
        case NodeKind::Filter:
            out.push_back(&static_cast<const FilterNode&>(node).predicate());
            break;
        case NodeKind::Project:
            for (const auto& item : static_cast<const ProjectNode&>(node).items()) {
                out.push_back(item.expr.get());
            }
            break;
        case NodeKind::Join:
            add(static_cast<const JoinNode&>(node).spec().condition);
            break;
        case NodeKind::Unnest:
            out.push_back(&static_cast<const UnnestNode&>(node).array());
            break;
        case NodeKind::Order:
            for (const auto& key : static_cast<const OrderNode&>(node).keys()) {
                out.push_back(key.expr.get());
            }
            break;
        case NodeKind::TableFunction:
            for (const auto& arg : static_cast<const TableFunctionNode&>(node).args()) {
                out.push_back(arg.get());
            }
            break;
        case NodeKind::Select: {
            const auto& spec = static_cast<const SelectNode&>(node).spec();
            add(spec.where);
            if (spec.group_by.has_value()) {
                std::vector<const GroupByItem*> stack;
                for (const auto& item : spec.group_by->items) {
                    stack.push_back(&item);
                }
                while (!stack.empty()) {
                    const auto* item = stack.back();
                    stack.pop_back();
                    for (const auto& element : item->elements) {
                        for (const auto& e : element.exprs) {
                            add(e);
                        }
                    }
                    for (const auto& nested : item->sets) {
                        stack.push_back(&nested);
                    }
                }
            }
            for (const auto& agg : spec.aggregates) {
                add(agg.argument);
            }
            add(spec.having);
            for (const auto& win : spec.windows) {
                add(win.aggregate.argument);
                add(win.argument);
                add(win.default_value);
                for (const auto& p : win.partition_by) {
                    add(p);
                }
                for (const auto& k : win.order_by) {
                    add(k.expr);
                }
            }
            add(spec.qualify);
            for (const auto& item : spec.items) {
                out.push_back(item.expr.get());
            }
            for (const auto& key : spec.order_by) {
                if (!key.output_index.has_value()) {
                    out.push_back(key.expr.get());
                }
            }
            break;
        }
        default:
            break;
    }
    return out;
}

auto count_table_refs(const Node& node, std::string_view name) -> std::size_t {
    std::size_t count = 0;
    if (node.kind() == NodeKind::Scan &&
        iequals(static_cast<const ScanNode&>(node).source_name(), name)) {
        ++count;
    }
    for (const auto& child : node.children()) {
        count += count_table_refs(*child, name);
    }
    return count;
}

auto is_correlated(const Node& node) -> bool { return correlated_at(node, 0); }

auto is_lateral(const JoinNode& join) -> bool {
    if (join.spec().lateral) {
        return true;
    }
    return join.children().size() == 2 && is_correlated(*join.children()[1]);
}

auto validate_join(const JoinNode& join) -> Result<void> {
    const auto& spec = join.spec();
    auto shape_error = [&](std::string message) {
        return make_error(ErrorKind::InvalidJoinShape, std::move(message),
                          std::string(join_kind_name(spec.kind)));
    };
    if (spec.comma && spec.kind != JoinKind::Cross) {
        return shape_error("comma join must be a cross join");
    }
    if (spec.kind == JoinKind::Cross &&
        (spec.condition || !spec.using_columns.empty() || spec.natural)) {
        return shape_error("CROSS JOIN cannot have a join condition");
    }
    if (spec.condition && !spec.using_columns.empty()) {
        return shape_error("join cannot have both ON and USING");
    }
    if (spec.natural && (spec.condition || !spec.using_columns.empty())) {
        return shape_error("NATURAL join cannot have ON or USING");
    }
    if (is_lateral(join) && spec.kind != JoinKind::Cross && spec.kind != JoinKind::Inner &&
        spec.kind != JoinKind::Left) {
        return shape_error(fmt::format("{} cannot have a LATERAL or correlated right input",
                                       join_kind_name(spec.kind)));
    }
    if (spec.kind == JoinKind::Right || spec.kind == JoinKind::Full) {
        const auto& left = *join.children().front();
        if (left.kind() == NodeKind::Join) {
            const auto& inner = static_cast<const JoinNode&>(left).spec();
            if (inner.comma && !inner.parenthesized) {
                return shape_error(fmt::format("comma join cannot be followed by {} without "
                                               "parentheses",
                                               join_kind_name(spec.kind)));
            }
        }
    }
    return {};
}

auto validate_recursive_with(const WithNode& with) -> Result<void> {
    const auto& bindings = with.bindings();
    for (std::size_t i = 0; i < bindings.size(); ++i) {
        const auto& name = bindings[i].name;
        const Node& query = *with.children()[i];
        if (count_table_refs(query, name) == 0) {
            continue;
        }
        auto shape_error = [&](std::string message) {
            return make_error(ErrorKind::InvalidRecursiveShape, std::move(message), name);
        };
        if (query.kind() != NodeKind::SetOp ||
            static_cast<const SetOpNode&>(query).spec().op != SetOpKind::Union) {
            return shape_error(fmt::format("recursive WITH binding '{}' must be a UNION of a "
                                           "base term and a recursive term",
                                           name));
        }
        auto matching = static_cast<const SetOpNode&>(query).spec().matching;
        if (matching == ColumnMatch::InnerByName || matching == ColumnMatch::FullByName) {
            return shape_error(fmt::format("recursive UNION of '{}' must keep the base term's "
                                           "columns",
                                           name));
        }
        const auto& terms = query.children();
        for (std::size_t t = 0; t + 1 < terms.size(); ++t) {
            if (count_table_refs(*terms[t], name) > 0) {
                return shape_error(fmt::format("recursive reference to '{}' is only allowed in "
                                               "the last operand of the UNION",
                                               name));
            }
        }
        std::size_t refs = 0;
        if (auto r = check_recursive_term(*terms.back(), name, {}, refs); !r) {
            return std::unexpected(std::move(r.error()).at(name));
        }
    }
    return {};
}

auto binding_order(const WithNode& with) -> Result<std::vector<std::size_t>> {
    const auto& bindings = with.bindings();
    std::vector<std::size_t> order;
    order.reserve(bindings.size());
    for (std::size_t i = 0; i < bindings.size(); ++i) {
        for (std::size_t j = 0; j < i; ++j) {
            if (iequals(bindings[i].name, bindings[j].name)) {
                return make_error(ErrorKind::InvalidPlan,
                                  fmt::format("duplicate WITH binding name: {}", bindings[i].name));
            }
        }
    }
    if (!with.recursive()) {
        for (std::size_t i = 0; i < bindings.size(); ++i) {
            order.push_back(i);
        }
        return order;
    }

    // deps[i] holds the bindings i reads, self references excluded.
    std::vector<std::vector<std::size_t>> deps(bindings.size());
    for (std::size_t i = 0; i < bindings.size(); ++i) {
        for (std::size_t j = 0; j < bindings.size(); ++j) {
            if (i != j && count_table_refs(*with.children()[i], bindings[j].name) > 0) {
                deps[i].push_back(j);
            }
        }
    }
    std::vector<bool> done(bindings.size(), false);
    while (order.size() < bindings.size()) {
        bool progressed = false;
        for (std::size_t i = 0; i < bindings.size(); ++i) {
            if (done[i]) {
                continue;
            }
            bool ready = std::all_of(deps[i].begin(), deps[i].end(),
                                     [&](std::size_t j) { return done[j]; });
            if (ready) {
                done[i] = true;
                order.push_back(i);
                progressed = true;
                break;
            }
        }
        if (!progressed) {
            std::vector<std::string_view> cycle;
            for (std::size_t i = 0; i < bindings.size(); ++i) {
                if (!done[i]) {
                    cycle.push_back(bindings[i].name);
                }
            }
            return make_error(ErrorKind::InvalidRecursiveShape,
                              fmt::format("cyclic references between WITH RECURSIVE bindings: {}",
                                          fmt::join(cycle, ", ")));
        }
    }
    return order;
}

auto validate(const Node& root) -> Result<void> { return validate_node(root, 0); }

}  // namespace oryx::ir
// NOLINTEND cppcoreguidelines-pro-type-static-cast-downcast
