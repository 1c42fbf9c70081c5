#include <oryx/runtime/ops.hpp>

#include <oryx/ir/builder.hpp>
#include <oryx/runtime/grouping.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <string>

namespace oryx::ops {

namespace {

// Scratch table names used when we wrap in-memory tables in a small IR plan.
constexpr const char* kLeftKey = "__oryx_left__";
constexpr const char* kRightKey = "__oryx_right__";

auto delegate(const ir::Node& node, TableRegistry registry, const runtime::EvalOptions& options)
    -> Result<Table> {
    // Route convenience ops through the interpreter entry point so behavior
    // stays aligned with full plans.
    return runtime::interpret(node, registry, options);
}

auto one_table(const Table& t) -> TableRegistry {
    TableRegistry reg;
    reg.emplace(kLeftKey, t);
    return reg;
}

auto two_tables(const Table& left, const Table& right) -> TableRegistry {
    TableRegistry reg;
    reg.emplace(kLeftKey, left);
    reg.emplace(kRightKey, right);
    return reg;
}

}  // namespace

auto filter(const Table& t, ir::ExprPtr predicate, const runtime::EvalOptions& options)
    -> Result<Table> {
    ir::Builder b;
    auto plan = b.filter(b.scan(kLeftKey), std::move(predicate));
    return delegate(*plan, one_table(t), options);
}

auto distinct(const Table& t, const runtime::EvalOptions& options) -> Result<Table> {
    ir::Builder b;
    auto plan = b.distinct(b.scan(kLeftKey));
    return delegate(*plan, one_table(t), options);
}

auto order(const Table& t, std::vector<ir::SortKey> keys, const runtime::EvalOptions& options)
    -> Result<Table> {
    ir::Builder b;
    auto plan = b.order(b.scan(kLeftKey), std::move(keys));
    return delegate(*plan, one_table(t), options);
}

auto join(const Table& left, const Table& right, ir::JoinSpec spec,
          const runtime::EvalOptions& options) -> Result<Table> {
    ir::Builder b;
    auto plan = b.join(b.scan(kLeftKey), b.scan(kRightKey), std::move(spec));
    return delegate(*plan, two_tables(left, right), options);
}

auto set_op(const Table& left, const Table& right, ir::SetOpSpec spec,
            const runtime::EvalOptions& options) -> Result<Table> {
    ir::Builder b;
    auto plan = b.set_op(std::move(spec), b.scan(kLeftKey), b.scan(kRightKey));
    return delegate(*plan, two_tables(left, right), options);
}

auto aggregate(const Table& t, ir::GroupingSpec group_by, std::vector<ir::AggSpec> aggs,
               const runtime::EvalOptions& options) -> Result<Table> {
    auto plan = runtime::expand_grouping(group_by);
    if (!plan) {
        return std::unexpected(plan.error());
    }
    ir::SelectSpec spec;
    for (const auto& key : plan->keys) {
        spec.items.push_back(make_item(key));
    }
    for (std::size_t i = 0; i < aggs.size(); ++i) {
        spec.items.push_back(make_item(ir::make_expr(ir::AggregateRef{.index = i}),
                                       aggs[i].alias.empty() ? fmt::format("agg{}", i + 1)
                                                             : aggs[i].alias));
    }
    if (plan->sets.size() > 1) {
        spec.items.push_back(make_item(ir::make_expr(ir::GroupingIdRef{}), "grouping_id"));
    }
    spec.group_by = std::move(group_by);
    spec.aggregates = std::move(aggs);

    ir::Builder b;
    auto node = b.select(b.scan(kLeftKey), std::move(spec));
    return delegate(*node, one_table(t), options);
}

void print(const Table& t, std::ostream& out) {
    if (t.schema.empty()) {
        out << "(empty table)\n";
        return;
    }

    const std::size_t cols = t.num_columns();

    // Collect all cell strings and compute column widths.
    std::vector<std::vector<std::string>> cells(cols);
    std::vector<std::size_t> widths(cols);

    for (std::size_t c = 0; c < cols; ++c) {
        widths[c] = t.schema[c].name.size();
        cells[c].reserve(t.num_rows());
        for (const auto& row : t.rows) {
            auto s = row[c].to_string();
            widths[c] = std::max(widths[c], s.size());
            cells[c].push_back(std::move(s));
        }
    }

    // Header row.
    for (std::size_t c = 0; c < cols; ++c) {
        if (c > 0)
            out << "  ";
        out << fmt::format("{:<{}}", t.schema[c].name, widths[c]);
    }
    out << "\n";

    // Separator.
    for (std::size_t c = 0; c < cols; ++c) {
        if (c > 0)
            out << "  ";
        out << std::string(widths[c], '-');
    }
    out << "\n";

    // Data rows.
    for (std::size_t r = 0; r < t.num_rows(); ++r) {
        for (std::size_t c = 0; c < cols; ++c) {
            if (c > 0)
                out << "  ";
            out << fmt::format("{:<{}}", cells[c][r], widths[c]);
        }
        out << "\n";
    }
}

// ─── Expression builders ──────────────────────────────────────────────────────

auto col(std::string name) -> ir::ExprPtr {
    return ir::make_expr(ir::ColumnRef{.name = std::move(name), .index = std::nullopt});
}

auto outer_col(std::string name, std::size_t depth) -> ir::ExprPtr {
    return ir::make_expr(ir::OuterRef{
        .depth = depth, .column = ir::ColumnRef{.name = std::move(name), .index = std::nullopt}});
}

auto lit(Value v) -> ir::ExprPtr {
    return ir::make_expr(ir::Literal{std::move(v)});
}

auto int_lit(std::int64_t v) -> ir::ExprPtr {
    return lit(Value::int64(v));
}

auto dbl_lit(double v) -> ir::ExprPtr {
    return lit(Value::float64(v));
}

auto str_lit(std::string v, std::string collation) -> ir::ExprPtr {
    return lit(Value::string(std::move(v), std::move(collation)));
}

auto null_lit() -> ir::ExprPtr {
    return lit(Value::null());
}

auto cmp(CompareOp op, ir::ExprPtr l, ir::ExprPtr r) -> ir::ExprPtr {
    return ir::make_expr(ir::CompareExpr{.op = op, .left = std::move(l), .right = std::move(r)});
}

auto eq(ir::ExprPtr l, ir::ExprPtr r) -> ir::ExprPtr {
    return cmp(CompareOp::Eq, std::move(l), std::move(r));
}

auto and_(ir::ExprPtr l, ir::ExprPtr r) -> ir::ExprPtr {
    return ir::make_expr(
        ir::LogicalExpr{.op = ir::LogicalOp::And, .left = std::move(l), .right = std::move(r)});
}

auto or_(ir::ExprPtr l, ir::ExprPtr r) -> ir::ExprPtr {
    return ir::make_expr(
        ir::LogicalExpr{.op = ir::LogicalOp::Or, .left = std::move(l), .right = std::move(r)});
}

auto not_(ir::ExprPtr operand) -> ir::ExprPtr {
    return ir::make_expr(ir::NotExpr{.operand = std::move(operand)});
}

auto binop(ir::ArithmeticOp op, ir::ExprPtr l, ir::ExprPtr r) -> ir::ExprPtr {
    return ir::make_expr(ir::BinaryExpr{.op = op, .left = std::move(l), .right = std::move(r)});
}

auto fn_call(std::string callee, std::vector<ir::ExprPtr> args) -> ir::ExprPtr {
    return ir::make_expr(ir::CallExpr{.callee = std::move(callee), .args = std::move(args)});
}

auto field(ir::ExprPtr operand, std::string name) -> ir::ExprPtr {
    return ir::make_expr(ir::FieldAccess{.operand = std::move(operand), .field = std::move(name)});
}

// ─── Compound builders ────────────────────────────────────────────────────────

auto make_item(ir::ExprPtr expr, std::string alias) -> ir::SelectItem {
    return ir::SelectItem{.expr = std::move(expr), .alias = std::move(alias)};
}

auto make_agg(ir::AggFunc func, ir::ExprPtr argument, std::string alias) -> ir::AggSpec {
    return ir::AggSpec{.func = func,
                       .argument = std::move(argument),
                       .distinct = false,
                       .callee = {},
                       .alias = std::move(alias)};
}

auto group_by_columns(const std::vector<std::string>& names) -> ir::GroupingSpec {
    ir::GroupingSpec spec;
    for (const auto& name : names) {
        spec.items.push_back(ir::GroupByItem{.kind = ir::GroupByKind::Simple,
                                             .elements = {ir::GroupingElement{{col(name)}}},
                                             .sets = {}});
    }
    return spec;
}

}  // namespace oryx::ops
