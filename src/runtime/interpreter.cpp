#include <oryx/runtime/interpreter.hpp>

#include <oryx/core/hash.hpp>
#include <oryx/ir/validate.hpp>
#include <oryx/runtime/grouping.hpp>
#include <oryx/runtime/join.hpp>
#include <oryx/runtime/recursive.hpp>
#include <oryx/runtime/set_ops.hpp>
#include <oryx/runtime/sort.hpp>
#include <oryx/runtime/window.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>
#include <utility>

namespace oryx::runtime {

namespace {

void infer_missing_types(Table& table) {
    for (std::size_t c = 0; c < table.num_columns(); ++c) {
        if (table.schema.fields[c].type == TypeKind::Null) {
            table.schema.fields[c].type = infer_column_type(table.rows, c);
        }
    }
}

/// Input of a SELECT without FROM: one row, no columns.
auto single_empty_row() -> Table {
    Table table;
    table.rows.emplace_back();
    return table;
}

auto star_items(const Schema& schema) -> std::vector<ir::SelectItem> {
    std::vector<ir::SelectItem> items;
    items.reserve(schema.size());
    for (std::size_t i = 0; i < schema.size(); ++i) {
        items.push_back(ir::SelectItem{
            .expr = ir::make_expr(ir::ColumnRef{.name = schema[i].name, .index = i}),
            .alias = {}});
    }
    return items;
}

auto rename_columns(Table& table, const ir::CteBinding& binding) -> Result<void> {
    if (binding.column_names.empty()) {
        return {};
    }
    if (binding.column_names.size() != table.num_columns()) {
        return make_error(ErrorKind::InvalidPlan,
                          fmt::format("WITH binding {} names {} columns but its query produces {}",
                                      binding.name, binding.column_names.size(),
                                      table.num_columns()));
    }
    for (std::size_t i = 0; i < table.num_columns(); ++i) {
        table.schema.fields[i].name = binding.column_names[i];
        table.schema.fields[i].qualifier.clear();
    }
    return {};
}

// ─── Filtering ────────────────────────────────────────────────────────────────

auto filter_mask(const Table& input, const ir::Expr& predicate, const EvalContext& ctx,
                 std::size_t begin, std::size_t end, std::vector<char>& mask) -> Result<void> {
    for (std::size_t i = begin; i < end; ++i) {
        auto truth = evaluate_predicate(predicate, input.schema, input.rows[i], ctx);
        if (!truth) {
            return std::unexpected(truth.error());
        }
        mask[i] = *truth == TriBool::True ? 1 : 0;
    }
    return {};
}

// ─── Post-grouping binding ───────────────────────────────────────────────────

/// Column layout of a select block after grouping: key columns, aggregate
/// columns and the grouping id, then window columns from `window_base`.
struct StageShape {
    bool grouped = false;
    std::vector<ir::ExprPtr> keys;
    std::size_t aggregates = 0;
    std::size_t window_base = 0;
};

/// Rewrites an expression written against the FROM columns so it reads the
/// stage row: grouping keys match structurally, aggregate, grouping and
/// window references become column reads.
auto to_stage(const ir::ExprPtr& expr, const Schema& input, const StageShape& shape)
    -> Result<ir::ExprPtr> {
    auto bound = bind(expr, input);
    if (!bound) {
        return bound;
    }
    return rewrite_expr(*bound, [&](const ir::Expr& e) -> Result<std::optional<ir::ExprPtr>> {
        if (shape.grouped) {
            for (std::size_t k = 0; k < shape.keys.size(); ++k) {
                if (ir::same_expr(e, *shape.keys[k])) {
                    return ir::make_expr(ir::ColumnRef{.name = output_name(e, k), .index = k});
                }
            }
        }
        if (const auto* agg = std::get_if<ir::AggregateRef>(&e.node)) {
            if (!shape.grouped) {
                return make_error(ErrorKind::InvalidPlan,
                                  "aggregate reference outside of an aggregating select");
            }
            return ir::make_expr(ir::ColumnRef{.name = fmt::format("$agg{}", agg->index + 1),
                                               .index = shape.keys.size() + agg->index});
        }
        if (std::holds_alternative<ir::GroupingIdRef>(e.node)) {
            if (!shape.grouped) {
                return make_error(ErrorKind::InvalidPlan, "GROUPING() requires GROUP BY");
            }
            return ir::make_expr(ir::ColumnRef{.name = kGroupingIdColumn,
                                               .index = shape.keys.size() + shape.aggregates});
        }
        if (const auto* win = std::get_if<ir::WindowRef>(&e.node)) {
            return ir::make_expr(ir::ColumnRef{.name = fmt::format("$win{}", win->index + 1),
                                               .index = shape.window_base + win->index});
        }
        if (const auto* col = std::get_if<ir::ColumnRef>(&e.node); col != nullptr && shape.grouped) {
            return make_error(ErrorKind::TypeMismatch,
                              fmt::format("column {} is neither grouped nor aggregated",
                                          col->name));
        }
        return std::nullopt;
    });
}

// ─── Session ─────────────────────────────────────────────────────────────────

/// One WITH clause worth of bindings, in the order they became visible.
using Scope = std::vector<std::pair<std::string, Table>>;

class ScopeGuard {
   public:
    explicit ScopeGuard(std::vector<Scope>& scopes) : scopes_(scopes) { scopes_.emplace_back(); }
    ~ScopeGuard() { scopes_.pop_back(); }
    ScopeGuard(const ScopeGuard&) = delete;
    auto operator=(const ScopeGuard&) -> ScopeGuard& = delete;

    void add(std::string name, Table table) {
        scopes_.back().emplace_back(std::move(name), std::move(table));
    }

   private:
    std::vector<Scope>& scopes_;
};

// NOLINTBEGIN cppcoreguidelines-pro-type-static-cast-downcast
class Session {
   public:
    Session(const TableRegistry& registry, const EvalOptions& options)
        : registry_(registry),
          options_(options),
          coercion_(options.coercion != nullptr ? *options.coercion : default_coercion()) {
        if (options.collator != nullptr) {
            ctx_.collation = CollationContext(*options.collator);
        }
        ctx_.functions = options.functions;
    }

    auto eval(const ir::Node& node) -> Result<Table> {
        auto result = dispatch(node);
        if (!result) {
            return std::unexpected(std::move(result.error()).at(ir::node_kind_name(node.kind())));
        }
        return result;
    }

   private:
    auto dispatch(const ir::Node& node) -> Result<Table> {
        switch (node.kind()) {
            case ir::NodeKind::Scan:
                return eval_scan(static_cast<const ir::ScanNode&>(node));
            case ir::NodeKind::Values:
                return eval_values(static_cast<const ir::ValuesNode&>(node));
            case ir::NodeKind::Filter: {
                const auto& filter = static_cast<const ir::FilterNode&>(node);
                auto child = eval(*filter.children().front());
                if (!child) {
                    return child;
                }
                return filter_rows(*child, filter.predicate(), ctx_, options_);
            }
            case ir::NodeKind::Project:
                return eval_project(static_cast<const ir::ProjectNode&>(node));
            case ir::NodeKind::Join:
                return eval_join(static_cast<const ir::JoinNode&>(node));
            case ir::NodeKind::Unnest: {
                const auto& unnest_node = static_cast<const ir::UnnestNode&>(node);
                auto array = evaluate(unnest_node.array(), Schema{}, Row{}, ctx_);
                if (!array) {
                    return std::unexpected(array.error());
                }
                return unnest(*array, unnest_node.alias(), unnest_node.offset_alias());
            }
            case ir::NodeKind::Select:
                return eval_select(static_cast<const ir::SelectNode&>(node));
            case ir::NodeKind::SetOp:
                return eval_set_op(static_cast<const ir::SetOpNode&>(node));
            case ir::NodeKind::Distinct: {
                auto child = eval(*node.children().front());
                if (!child) {
                    return child;
                }
                return distinct_rows(*child, ctx_.collation);
            }
            case ir::NodeKind::Order: {
                const auto& order = static_cast<const ir::OrderNode&>(node);
                auto child = eval(*order.children().front());
                if (!child) {
                    return child;
                }
                return order_rows(*child, order.keys(), ctx_);
            }
            case ir::NodeKind::Limit: {
                const auto& limit = static_cast<const ir::LimitNode&>(node);
                auto child = eval(*limit.children().front());
                if (!child) {
                    return child;
                }
                return limit_rows(std::move(*child), limit.limit(), limit.offset());
            }
            case ir::NodeKind::With:
                return eval_with(static_cast<const ir::WithNode&>(node));
            case ir::NodeKind::TableFunction:
                return eval_table_function(static_cast<const ir::TableFunctionNode&>(node));
        }
        return make_error(ErrorKind::InvalidPlan, "unknown node kind");
    }

    auto lookup_binding(std::string_view name) const -> const Table* {
        for (auto scope = scopes_.rbegin(); scope != scopes_.rend(); ++scope) {
            for (auto entry = scope->rbegin(); entry != scope->rend(); ++entry) {
                if (iequals(entry->first, name)) {
                    return &entry->second;
                }
            }
        }
        return nullptr;
    }

    auto eval_scan(const ir::ScanNode& scan) -> Result<Table> {
        const Table* source = lookup_binding(scan.source_name());
        if (source == nullptr) {
            if (auto it = registry_.find(scan.source_name()); it != registry_.end()) {
                source = &it->second;
            } else {
                for (const auto& [name, table] : registry_) {
                    if (iequals(name, scan.source_name())) {
                        source = &table;
                        break;
                    }
                }
            }
        }
        if (source == nullptr) {
            return make_error(ErrorKind::InvalidPlan,
                              fmt::format("unknown table: {} (available: {})", scan.source_name(),
                                          format_tables(registry_)));
        }
        Table output = *source;
        for (auto& field : output.schema.fields) {
            field.qualifier = scan.alias();
        }
        return output;
    }

    auto eval_values(const ir::ValuesNode& values) -> Result<Table> {
        auto names = values.column_names();
        for (const auto& row : values.rows()) {
            if (names.empty() && !row.empty()) {
                for (std::size_t i = 0; i < row.size(); ++i) {
                    names.push_back(fmt::format("$col{}", i + 1));
                }
            }
            if (row.size() != names.size()) {
                return make_error(ErrorKind::InvalidPlan,
                                  fmt::format("VALUES row has {} values for {} columns", row.size(),
                                              names.size()));
            }
        }
        return make_table(names, values.rows());
    }

    auto eval_project(const ir::ProjectNode& project) -> Result<Table> {
        auto child = eval(*project.children().front());
        if (!child) {
            return child;
        }
        if (project.items().empty()) {
            return child;
        }
        Table out;
        std::vector<ir::ExprPtr> exprs;
        for (std::size_t i = 0; i < project.items().size(); ++i) {
            const auto& item = project.items()[i];
            auto bound = bind(item.expr, child->schema);
            if (!bound) {
                return std::unexpected(bound.error());
            }
            exprs.push_back(std::move(*bound));
            out.schema.fields.push_back(Field{
                .name = item.alias.empty() ? output_name(*item.expr, i) : item.alias,
                .type = TypeKind::Null});
        }
        out.rows.reserve(child->num_rows());
        for (const auto& row : child->rows) {
            Row projected;
            projected.reserve(exprs.size());
            for (const auto& expr : exprs) {
                auto v = evaluate(*expr, child->schema, row, ctx_);
                if (!v) {
                    return std::unexpected(v.error());
                }
                projected.push_back(std::move(*v));
            }
            out.rows.push_back(std::move(projected));
        }
        infer_missing_types(out);
        return out;
    }

    auto eval_join(const ir::JoinNode& node) -> Result<Table> {
        auto left = eval(*node.children()[0]);
        if (!left) {
            return left;
        }
        const auto& right_node = *node.children()[1];
        if (ir::is_lateral(node)) {
            FunctionProducer producer(
                [&](const LateralParams* params) -> Result<Table> {
                    ctx_.outer.push_back(params);
                    auto rows = eval(right_node);
                    ctx_.outer.pop_back();
                    return rows;
                },
                true);
            return runtime::join(*left, producer, node.spec(), ctx_);
        }
        auto right = eval(right_node);
        if (!right) {
            return right;
        }
        TableProducer producer(std::move(*right));
        return runtime::join(*left, producer, node.spec(), ctx_);
    }

    auto eval_set_op(const ir::SetOpNode& node) -> Result<Table> {
        std::vector<Table> inputs;
        inputs.reserve(node.children().size());
        for (const auto& child : node.children()) {
            auto table = eval(*child);
            if (!table) {
                return table;
            }
            inputs.push_back(std::move(*table));
        }
        return combine_all(inputs, node.spec(), ctx_, coercion_);
    }

    auto eval_table_function(const ir::TableFunctionNode& node) -> Result<Table> {
        const auto* fn = ctx_.registry().find_table(node.callee());
        if (fn == nullptr) {
            return make_error(ErrorKind::InvalidPlan,
                              fmt::format("unknown table function: {} (available: {})",
                                          node.callee(), ctx_.registry().describe()));
        }
        std::vector<Table> tables;
        for (const auto& child : node.children()) {
            auto table = eval(*child);
            if (!table) {
                return table;
            }
            tables.push_back(std::move(*table));
        }
        std::vector<Value> args;
        for (const auto& arg : node.args()) {
            auto v = evaluate(*arg, Schema{}, Row{}, ctx_);
            if (!v) {
                return std::unexpected(v.error());
            }
            args.push_back(std::move(*v));
        }
        auto result = (*fn)(tables, args);
        if (!result) {
            return std::unexpected(std::move(result.error()).at(node.callee()));
        }
        infer_missing_types(*result);
        return result;
    }

    auto eval_with(const ir::WithNode& with) -> Result<Table> {
        auto order = ir::binding_order(with);
        if (!order) {
            return std::unexpected(order.error());
        }
        ScopeGuard scope(scopes_);
        for (auto index : *order) {
            const auto& binding = with.bindings()[index];
            const auto& query = *with.children()[index];
            bool self_referencing =
                with.recursive() && ir::count_table_refs(query, binding.name) > 0;
            auto table = self_referencing ? eval_recursive_binding(binding, query) : eval(query);
            if (!table) {
                return std::unexpected(std::move(table.error()).at(binding.name));
            }
            if (auto r = rename_columns(*table, binding); !r) {
                return std::unexpected(r.error());
            }
            spdlog::debug("with: binding {} produced {} rows", binding.name, table->num_rows());
            scope.add(binding.name, std::move(*table));
        }
        return eval(with.body());
    }

    auto eval_recursive_binding(const ir::CteBinding& binding, const ir::Node& query)
        -> Result<Table> {
        const auto& set_op = static_cast<const ir::SetOpNode&>(query);
        const auto& spec = set_op.spec();
        const auto& operands = set_op.children();

        std::vector<Table> base_inputs;
        for (std::size_t i = 0; i + 1 < operands.size(); ++i) {
            auto table = eval(*operands[i]);
            if (!table) {
                return table;
            }
            base_inputs.push_back(std::move(*table));
        }
        Result<Table> base = base_inputs.size() == 1
                                 ? Result<Table>(std::move(base_inputs.front()))
                                 : combine_all(base_inputs, spec, ctx_, coercion_);
        if (!base) {
            return base;
        }
        if (auto r = rename_columns(*base, binding); !r) {
            return std::unexpected(r.error());
        }
        infer_missing_types(*base);

        const auto& term = *operands.back();
        RecursiveStep step = [&](const Table& working, std::size_t /*iteration*/) -> Result<Table> {
            ScopeGuard scope(scopes_);
            scope.add(binding.name, working);
            auto produced = eval(term);
            if (!produced || spec.matching == ir::ColumnMatch::Positional) {
                return produced;
            }
            Table shape;
            shape.schema = working.schema;
            auto aligned = align_columns(shape, *produced, spec, coercion_);
            if (!aligned) {
                return std::unexpected(aligned.error());
            }
            return std::move(aligned->second);
        };
        return evaluate_recursive(std::move(*base), step, spec.quantifier,
                                  options_.max_recursion_iterations, ctx_, coercion_);
    }

    auto grouping_plan(const ir::SelectSpec& spec, const Schema& input) -> Result<GroupingPlan> {
        if (!spec.group_by.has_value()) {
            return GroupingPlan{.keys = {}, .sets = {std::bitset<kMaxGroupingKeys>{}}};
        }
        if (!spec.group_by->all) {
            return expand_grouping(*spec.group_by);
        }
        GroupingPlan plan;
        plan.keys = infer_group_by_all(spec.items.empty() ? star_items(input) : spec.items);
        if (plan.keys.size() > kMaxGroupingKeys) {
            return make_error(ErrorKind::InvalidPlan,
                              fmt::format("GROUP BY ALL infers {} keys (limit {})",
                                          plan.keys.size(), kMaxGroupingKeys));
        }
        std::bitset<kMaxGroupingKeys> all;
        for (std::size_t k = 0; k < plan.keys.size(); ++k) {
            all.set(k);
        }
        plan.sets.push_back(all);
        return plan;
    }

    auto filter_stage(Table& stage, const ir::ExprPtr& predicate, const Schema& input,
                      const StageShape& shape, std::string_view clause) -> Result<void> {
        auto bound = to_stage(predicate, input, shape);
        if (!bound) {
            return std::unexpected(std::move(bound.error()).at(clause));
        }
        auto filtered = filter_rows(stage, **bound, ctx_, options_);
        if (!filtered) {
            return std::unexpected(std::move(filtered.error()).at(clause));
        }
        spdlog::debug("select: {} kept {} of {} rows", clause, filtered->num_rows(),
                      stage.num_rows());
        stage = std::move(*filtered);
        return {};
    }

    auto eval_select(const ir::SelectNode& node) -> Result<Table> {
        const auto& spec = node.spec();
        auto from = node.children().empty() ? Result<Table>(single_empty_row())
                                            : eval(*node.children().front());
        if (!from) {
            return from;
        }
        Table input = std::move(*from);
        const Schema input_schema = input.schema;

        if (spec.where) {
            auto bound = bind(spec.where, input_schema);
            if (!bound) {
                return std::unexpected(std::move(bound.error()).at("where"));
            }
            auto filtered = filter_rows(input, **bound, ctx_, options_);
            if (!filtered) {
                return std::unexpected(std::move(filtered.error()).at("where"));
            }
            spdlog::debug("select: where kept {} of {} rows", filtered->num_rows(),
                          input.num_rows());
            input = std::move(*filtered);
        }

        StageShape shape;
        shape.grouped = spec.group_by.has_value() || !spec.aggregates.empty();
        Table stage;
        if (shape.grouped) {
            auto plan = grouping_plan(spec, input_schema);
            if (!plan) {
                return std::unexpected(plan.error());
            }
            for (auto& key : plan->keys) {
                auto bound = bind(key, input_schema);
                if (!bound) {
                    return std::unexpected(std::move(bound.error()).at("group by"));
                }
                key = std::move(*bound);
            }
            auto aggregates = spec.aggregates;
            for (auto& agg : aggregates) {
                if (!agg.argument) {
                    continue;
                }
                auto bound = bind(agg.argument, input_schema);
                if (!bound) {
                    return std::unexpected(bound.error());
                }
                agg.argument = std::move(*bound);
            }
            auto grouped = group(input, *plan, aggregates, ctx_);
            if (!grouped) {
                return std::unexpected(grouped.error());
            }
            stage = std::move(*grouped);
            shape.keys = std::move(plan->keys);
            shape.aggregates = aggregates.size();
        } else {
            stage = std::move(input);
        }
        shape.window_base = stage.num_columns();

        if (spec.having) {
            if (auto r = filter_stage(stage, spec.having, input_schema, shape, "having"); !r) {
                return std::unexpected(r.error());
            }
        }
        if (!spec.windows.empty()) {
            auto windows = spec.windows;
            auto stage_expr = [&](ir::ExprPtr& expr) -> Result<void> {
                if (!expr) {
                    return {};
                }
                auto bound = to_stage(expr, input_schema, shape);
                if (!bound) {
                    return std::unexpected(bound.error());
                }
                expr = std::move(*bound);
                return {};
            };
            for (auto& window : windows) {
                std::vector<ir::ExprPtr*> exprs{&window.argument, &window.default_value,
                                                &window.aggregate.argument};
                for (auto& expr : window.partition_by) {
                    exprs.push_back(&expr);
                }
                for (auto& key : window.order_by) {
                    exprs.push_back(&key.expr);
                }
                for (auto* expr : exprs) {
                    if (auto r = stage_expr(*expr); !r) {
                        return std::unexpected(r.error());
                    }
                }
            }
            auto windowed = apply_windows(stage, windows, ctx_);
            if (!windowed) {
                return std::unexpected(windowed.error());
            }
            stage = std::move(*windowed);
        }
        if (spec.qualify) {
            if (auto r = filter_stage(stage, spec.qualify, input_schema, shape, "qualify"); !r) {
                return std::unexpected(r.error());
            }
        }
        return project_select(spec, stage, input_schema, shape);
    }

    /// Projection, DISTINCT, ORDER BY and LIMIT of a select block. Sort keys
    /// are computed before DISTINCT so ORDER BY may read unprojected columns.
    auto project_select(const ir::SelectSpec& spec, const Table& stage, const Schema& input,
                        const StageShape& shape) -> Result<Table> {
        const bool star = spec.items.empty();
        auto items = star ? star_items(input) : spec.items;
        Table out;
        std::vector<ir::ExprPtr> exprs;
        exprs.reserve(items.size());
        for (std::size_t i = 0; i < items.size(); ++i) {
            auto bound = to_stage(items[i].expr, input, shape);
            if (!bound) {
                return std::unexpected(bound.error());
            }
            exprs.push_back(std::move(*bound));
            if (star) {
                out.schema.fields.push_back(input[i]);
            } else {
                out.schema.fields.push_back(Field{
                    .name = items[i].alias.empty() ? output_name(*items[i].expr, i)
                                                   : items[i].alias,
                    .type = TypeKind::Null});
            }
        }
        std::vector<ir::ExprPtr> sort_exprs(spec.order_by.size());
        std::vector<SortDirection> dirs;
        for (std::size_t k = 0; k < spec.order_by.size(); ++k) {
            const auto& key = spec.order_by[k];
            dirs.push_back(SortDirection{.ascending = key.ascending,
                                         .nulls_first = key.effective_nulls_first()});
            if (key.output_index.has_value()) {
                if (*key.output_index >= items.size()) {
                    return make_error(ErrorKind::InvalidPlan,
                                      fmt::format("ORDER BY column {} out of range (available: {})",
                                                  *key.output_index + 1,
                                                  format_columns(out.schema)),
                                      "order by");
                }
                continue;
            }
            auto bound = to_stage(key.expr, input, shape);
            if (!bound) {
                return std::unexpected(std::move(bound.error()).at("order by"));
            }
            sort_exprs[k] = std::move(*bound);
        }

        std::vector<Row> sort_keys;
        out.rows.reserve(stage.num_rows());
        for (const auto& row : stage.rows) {
            Row projected;
            projected.reserve(exprs.size());
            for (const auto& expr : exprs) {
                auto v = evaluate(*expr, stage.schema, row, ctx_);
                if (!v) {
                    return std::unexpected(v.error());
                }
                projected.push_back(std::move(*v));
            }
            Row keys;
            keys.reserve(spec.order_by.size());
            for (std::size_t k = 0; k < spec.order_by.size(); ++k) {
                if (const auto& index = spec.order_by[k].output_index) {
                    keys.push_back(projected[*index]);
                    continue;
                }
                auto v = evaluate(*sort_exprs[k], stage.schema, row, ctx_);
                if (!v) {
                    return std::unexpected(std::move(v.error()).at("order by"));
                }
                keys.push_back(std::move(*v));
            }
            out.rows.push_back(std::move(projected));
            sort_keys.push_back(std::move(keys));
        }

        if (spec.distinct) {
            const Table* tables[] = {&out};
            auto collations = column_collations(tables, ctx_.collation);
            if (!collations) {
                return std::unexpected(std::move(collations.error()).at("distinct"));
            }
            RowKeySet seen;
            std::vector<Row> rows;
            std::vector<Row> keys;
            for (std::size_t r = 0; r < out.rows.size(); ++r) {
                auto key = make_row_key(out.rows[r], {}, *collations, ctx_.collation);
                if (!key) {
                    return std::unexpected(std::move(key.error()).at("distinct"));
                }
                if (seen.insert(std::move(*key)).second) {
                    rows.push_back(std::move(out.rows[r]));
                    keys.push_back(std::move(sort_keys[r]));
                }
            }
            out.rows = std::move(rows);
            sort_keys = std::move(keys);
        }

        if (!spec.order_by.empty()) {
            auto order = stable_order(sort_keys, dirs, ctx_.collation);
            if (!order) {
                return std::unexpected(std::move(order.error()).at("order by"));
            }
            std::vector<Row> sorted;
            sorted.reserve(out.rows.size());
            for (auto i : *order) {
                sorted.push_back(std::move(out.rows[i]));
            }
            out.rows = std::move(sorted);
            std::vector<ColumnOrder> ordering;
            for (const auto& key : spec.order_by) {
                if (!key.output_index.has_value()) {
                    ordering.clear();
                    break;
                }
                ordering.push_back(ColumnOrder{.column = *key.output_index,
                                               .ascending = key.ascending,
                                               .nulls_first = key.effective_nulls_first()});
            }
            if (!ordering.empty()) {
                out.ordering = std::move(ordering);
            }
        }
        infer_missing_types(out);
        return limit_rows(std::move(out), spec.limit, spec.offset);
    }

    const TableRegistry& registry_;
    const EvalOptions& options_;
    const CoercionService& coercion_;
    EvalContext ctx_;
    std::vector<Scope> scopes_;
};
// NOLINTEND cppcoreguidelines-pro-type-static-cast-downcast

}  // namespace

auto filter_rows(const Table& input, const ir::Expr& predicate, const EvalContext& ctx,
                 const EvalOptions& options) -> Result<Table> {
    const std::size_t n = input.num_rows();
    std::vector<char> mask(n, 0);

    const std::size_t hw = std::max<unsigned>(1, std::thread::hardware_concurrency());
    const std::size_t workers = options.max_workers != 0 ? options.max_workers : hw;
    const bool use_parallel = n >= options.parallel_threshold && workers > 1;

    if (use_parallel) {
        const std::size_t threads = std::min(workers, n);
        const std::size_t chunk = (n + threads - 1) / threads;
        std::vector<Result<void>> results(threads);
        std::vector<std::thread> pool;
        pool.reserve(threads);
        for (std::size_t t = 0; t < threads; ++t) {
            std::size_t start = t * chunk;
            if (start >= n) {
                break;
            }
            std::size_t end = std::min(n, start + chunk);
            pool.emplace_back([&, t, start, end] {
                results[t] = filter_mask(input, predicate, ctx, start, end, mask);
            });
        }
        for (auto& th : pool) {
            th.join();
        }
        spdlog::debug("filter: {} rows across {} workers", n, pool.size());
        for (const auto& result : results) {
            if (!result) {
                return std::unexpected(result.error());
            }
        }
    } else if (auto r = filter_mask(input, predicate, ctx, 0, n, mask); !r) {
        return std::unexpected(r.error());
    }

    Table output;
    output.schema = input.schema;
    output.ordering = input.ordering;
    for (std::size_t i = 0; i < n; ++i) {
        if (mask[i] != 0) {
            output.rows.push_back(input.rows[i]);
        }
    }
    return output;
}

auto distinct_rows(const Table& input, const CollationContext& ctx) -> Result<Table> {
    const Table* tables[] = {&input};
    auto collations = column_collations(tables, ctx);
    if (!collations) {
        return std::unexpected(collations.error());
    }
    Table output;
    output.schema = input.schema;
    output.ordering = input.ordering;
    RowKeySet seen;
    seen.reserve(input.num_rows());
    for (const auto& row : input.rows) {
        auto key = make_row_key(row, {}, *collations, ctx);
        if (!key) {
            return std::unexpected(key.error());
        }
        if (seen.insert(std::move(*key)).second) {
            output.rows.push_back(row);
        }
    }
    return output;
}

auto order_rows(const Table& input, const std::vector<ir::SortKey>& keys, const EvalContext& ctx)
    -> Result<Table> {
    std::vector<SortDirection> dirs;
    std::vector<ir::ExprPtr> exprs;
    for (const auto& key : keys) {
        dirs.push_back(
            SortDirection{.ascending = key.ascending, .nulls_first = key.effective_nulls_first()});
        if (key.output_index.has_value()) {
            if (*key.output_index >= input.num_columns()) {
                return make_error(ErrorKind::InvalidPlan,
                                  fmt::format("ORDER BY column {} out of range (available: {})",
                                              *key.output_index + 1, format_columns(input.schema)));
            }
            exprs.emplace_back();
            continue;
        }
        auto bound = bind(key.expr, input.schema);
        if (!bound) {
            return std::unexpected(bound.error());
        }
        exprs.push_back(std::move(*bound));
    }
    std::vector<Row> values;
    values.reserve(input.num_rows());
    for (const auto& row : input.rows) {
        Row k;
        k.reserve(keys.size());
        for (std::size_t i = 0; i < keys.size(); ++i) {
            if (keys[i].output_index.has_value()) {
                k.push_back(row[*keys[i].output_index]);
                continue;
            }
            auto v = evaluate(*exprs[i], input.schema, row, ctx);
            if (!v) {
                return std::unexpected(v.error());
            }
            k.push_back(std::move(*v));
        }
        values.push_back(std::move(k));
    }
    auto order = stable_order(values, dirs, ctx.collation);
    if (!order) {
        return std::unexpected(order.error());
    }
    Table output;
    output.schema = input.schema;
    output.rows.reserve(input.num_rows());
    for (auto i : *order) {
        output.rows.push_back(input.rows[i]);
    }
    std::vector<ColumnOrder> ordering;
    for (std::size_t i = 0; i < keys.size(); ++i) {
        std::optional<std::size_t> column = keys[i].output_index;
        if (!column) {
            if (const auto* col = std::get_if<ir::ColumnRef>(&exprs[i]->node)) {
                column = col->index;
            }
        }
        if (!column) {
            ordering.clear();
            break;
        }
        ordering.push_back(ColumnOrder{.column = *column,
                                       .ascending = keys[i].ascending,
                                       .nulls_first = keys[i].effective_nulls_first()});
    }
    if (!ordering.empty()) {
        output.ordering = std::move(ordering);
    }
    return output;
}

auto limit_rows(Table input, std::optional<std::int64_t> limit, std::int64_t offset) -> Table {
    const auto n = input.rows.size();
    const auto skip = std::min<std::size_t>(n, static_cast<std::size_t>(std::max<std::int64_t>(0, offset)));
    auto keep = n - skip;
    if (limit.has_value()) {
        keep = std::min<std::size_t>(keep, static_cast<std::size_t>(std::max<std::int64_t>(0, *limit)));
    }
    if (skip == 0 && keep == n) {
        return input;
    }
    Table output;
    output.schema = std::move(input.schema);
    output.ordering = std::move(input.ordering);
    output.rows.assign(std::make_move_iterator(input.rows.begin() + static_cast<std::ptrdiff_t>(skip)),
                       std::make_move_iterator(input.rows.begin() +
                                               static_cast<std::ptrdiff_t>(skip + keep)));
    return output;
}

auto interpret(const ir::Node& node, const TableRegistry& registry, const EvalOptions& options)
    -> Result<Table> {
    if (auto valid = ir::validate(node); !valid) {
        spdlog::debug("interpret: plan rejected: {}", format_error(valid.error()));
        return std::unexpected(valid.error());
    }
    Session session(registry, options);
    auto result = session.eval(node);
    if (result) {
        spdlog::debug("interpret: {} rows, {} columns", result->num_rows(), result->num_columns());
    }
    return result;
}

}  // namespace oryx::runtime
