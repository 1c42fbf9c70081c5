#include <oryx/runtime/grouping.hpp>

#include <oryx/core/hash.hpp>
#include <oryx/runtime/aggregates.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>

namespace oryx::runtime {

namespace {

using KeySet = std::bitset<kMaxGroupingKeys>;

auto too_many_sets(std::size_t count) -> std::unexpected<Error> {
    return make_error(ErrorKind::InvalidPlan,
                      fmt::format("too many grouping sets: {} (limit {})", count,
                                  kMaxGroupingSets),
                      "group by");
}

class SetExpander {
   public:
    auto key_index(const ir::ExprPtr& expr) -> Result<std::size_t> {
        for (std::size_t i = 0; i < plan_.keys.size(); ++i) {
            if (ir::same_expr(*plan_.keys[i], *expr)) {
                return i;
            }
        }
        if (plan_.keys.size() >= kMaxGroupingKeys) {
            return make_error(ErrorKind::InvalidPlan,
                              fmt::format("too many grouping expressions (limit {})",
                                          kMaxGroupingKeys),
                              "group by");
        }
        plan_.keys.push_back(expr);
        return plan_.keys.size() - 1;
    }

    auto element_set(const ir::GroupingElement& element) -> Result<KeySet> {
        KeySet set;
        for (const auto& expr : element.exprs) {
            auto index = key_index(expr);
            if (!index) {
                return std::unexpected(index.error());
            }
            set.set(*index);
        }
        return set;
    }

    auto item_sets(const ir::GroupByItem& item) -> Result<std::vector<KeySet>> {
        std::vector<KeySet> elements;
        elements.reserve(item.elements.size());
        for (const auto& element : item.elements) {
            auto set = element_set(element);
            if (!set) {
                return std::unexpected(set.error());
            }
            elements.push_back(*set);
        }
        std::vector<KeySet> out;
        switch (item.kind) {
            case ir::GroupByKind::Simple: {
                KeySet all;
                for (const auto& set : elements) {
                    all |= set;
                }
                out.push_back(all);
                break;
            }
            case ir::GroupByKind::Rollup: {
                // (a, b, c) -> (a, b, c), (a, b), (a), ()
                for (std::size_t n = elements.size() + 1; n-- > 0;) {
                    KeySet prefix;
                    for (std::size_t i = 0; i < n; ++i) {
                        prefix |= elements[i];
                    }
                    out.push_back(prefix);
                }
                break;
            }
            case ir::GroupByKind::Cube: {
                auto n = elements.size();
                if (n >= 63 || (std::size_t{1} << n) > kMaxGroupingSets) {
                    return too_many_sets(n >= 63 ? kMaxGroupingSets + 1 : std::size_t{1} << n);
                }
                for (std::size_t mask = (std::size_t{1} << n); mask-- > 0;) {
                    KeySet subset;
                    for (std::size_t i = 0; i < n; ++i) {
                        if ((mask >> (n - 1 - i)) & 1U) {
                            subset |= elements[i];
                        }
                    }
                    out.push_back(subset);
                }
                break;
            }
            case ir::GroupByKind::GroupingSets: {
                for (const auto& set : elements) {
                    out.push_back(set);
                }
                for (const auto& nested : item.sets) {
                    auto sets = item_sets(nested);
                    if (!sets) {
                        return sets;
                    }
                    out.insert(out.end(), sets->begin(), sets->end());
                    if (out.size() > kMaxGroupingSets) {
                        return too_many_sets(out.size());
                    }
                }
                break;
            }
        }
        return out;
    }

    auto take() -> GroupingPlan { return std::move(plan_); }

   private:
    GroupingPlan plan_;
};

auto starts_with_path(const std::vector<std::string>& longer, const std::vector<std::string>& shorter)
    -> bool {
    if (longer.size() <= shorter.size()) {
        return false;
    }
    for (std::size_t i = 0; i < shorter.size(); ++i) {
        if (!iequals(longer[i], shorter[i])) {
            return false;
        }
    }
    return true;
}

struct GroupState {
    Row keys;
    std::vector<std::unique_ptr<Accumulator>> accumulators;
};

}  // namespace

auto expand_grouping(const ir::GroupingSpec& spec) -> Result<GroupingPlan> {
    SetExpander expander;
    std::vector<KeySet> sets{KeySet{}};
    for (const auto& item : spec.items) {
        auto item_sets = expander.item_sets(item);
        if (!item_sets) {
            return std::unexpected(item_sets.error());
        }
        if (sets.size() * item_sets->size() > kMaxGroupingSets) {
            return too_many_sets(sets.size() * item_sets->size());
        }
        std::vector<KeySet> next;
        next.reserve(sets.size() * item_sets->size());
        for (const auto& a : sets) {
            for (const auto& b : *item_sets) {
                next.push_back(a | b);
            }
        }
        sets = std::move(next);
    }
    auto plan = expander.take();
    plan.sets = std::move(sets);
    return plan;
}

auto infer_group_by_all(const std::vector<ir::SelectItem>& items) -> std::vector<ir::ExprPtr> {
    std::vector<ir::ExprPtr> candidates;
    for (const auto& item : items) {
        const auto& expr = *item.expr;
        if (ir::contains_aggregate_or_window(expr) || !ir::references_input(expr)) {
            continue;
        }
        bool duplicate = false;
        for (const auto& seen : candidates) {
            duplicate = duplicate || ir::same_expr(*seen, expr);
        }
        if (!duplicate) {
            candidates.push_back(item.expr);
        }
    }
    std::vector<ir::ExprPtr> keys;
    for (const auto& candidate : candidates) {
        auto path = ir::field_path(*candidate);
        bool covered = false;
        if (path.has_value()) {
            for (const auto& other : candidates) {
                auto other_path = ir::field_path(*other);
                covered = covered || (other_path.has_value() && starts_with_path(*path, *other_path));
            }
        }
        if (!covered) {
            keys.push_back(candidate);
        }
    }
    return keys;
}

auto group(const Table& input, const GroupingPlan& plan, const std::vector<ir::AggSpec>& aggregates,
           const EvalContext& ctx) -> Result<Table> {
    const auto nkeys = plan.keys.size();
    const auto naggs = aggregates.size();

    // Key and argument values are computed once per input row.
    Table key_table;
    std::vector<Row> arguments;
    key_table.rows.reserve(input.num_rows());
    arguments.reserve(input.num_rows());
    for (std::size_t k = 0; k < nkeys; ++k) {
        key_table.schema.fields.push_back(
            Field{.name = output_name(*plan.keys[k], k), .type = TypeKind::Null});
    }
    for (const auto& row : input.rows) {
        Row keys;
        keys.reserve(nkeys);
        for (const auto& expr : plan.keys) {
            auto v = evaluate(*expr, input.schema, row, ctx);
            if (!v) {
                return std::unexpected(std::move(v.error()).at("group by"));
            }
            keys.push_back(std::move(*v));
        }
        key_table.rows.push_back(std::move(keys));
        Row args;
        args.reserve(naggs);
        for (const auto& agg : aggregates) {
            if (!agg.argument) {
                args.push_back(Value::null());
                continue;
            }
            auto v = evaluate(*agg.argument, input.schema, row, ctx);
            if (!v) {
                return std::unexpected(std::move(v.error()).at(aggregate_name(agg)));
            }
            args.push_back(std::move(*v));
        }
        arguments.push_back(std::move(args));
    }
    const Table* key_tables[] = {&key_table};
    auto collations = column_collations(key_tables, ctx.collation);
    if (!collations) {
        return std::unexpected(collations.error());
    }

    Table out;
    for (std::size_t k = 0; k < nkeys; ++k) {
        Field field = key_table.schema[k];
        field.type = infer_column_type(key_table.rows, k);
        out.schema.fields.push_back(std::move(field));
    }
    for (std::size_t a = 0; a < naggs; ++a) {
        const auto& agg = aggregates[a];
        out.schema.fields.push_back(Field{
            .name = agg.alias.empty() ? fmt::format("$agg{}", a + 1) : agg.alias,
            .type = TypeKind::Null});
    }
    out.schema.fields.push_back(
        Field{.name = kGroupingIdColumn, .type = TypeKind::Int64, .nullable = false});

    auto fresh_state = [&](const Row* keys) -> Result<GroupState> {
        GroupState state;
        if (keys != nullptr) {
            state.keys = *keys;
        }
        state.accumulators.reserve(naggs);
        for (const auto& agg : aggregates) {
            auto acc = make_accumulator(agg, ctx.registry(), ctx.collation);
            if (!acc) {
                return std::unexpected(acc.error());
            }
            state.accumulators.push_back(std::move(*acc));
        }
        return state;
    };

    for (const auto& set : plan.sets) {
        std::vector<std::size_t> grouped;
        std::vector<CollationSpec> grouped_specs;
        for (std::size_t k = 0; k < nkeys; ++k) {
            if (set.test(k)) {
                grouped.push_back(k);
                grouped_specs.push_back((*collations)[k]);
            }
        }
        std::vector<GroupState> groups;
        RowKeyMap<std::size_t> index;
        if (grouped.empty()) {
            auto state = fresh_state(nullptr);
            if (!state) {
                return std::unexpected(state.error());
            }
            groups.push_back(std::move(*state));
        }
        for (std::size_t r = 0; r < input.num_rows(); ++r) {
            std::size_t g = 0;
            if (!grouped.empty()) {
                auto key = make_row_key(key_table.rows[r], grouped, grouped_specs, ctx.collation);
                if (!key) {
                    return std::unexpected(std::move(key.error()).at("group by"));
                }
                auto it = index.find(*key);
                if (it == index.end()) {
                    auto state = fresh_state(&key_table.rows[r]);
                    if (!state) {
                        return std::unexpected(state.error());
                    }
                    g = groups.size();
                    groups.push_back(std::move(*state));
                    index.emplace(std::move(*key), g);
                } else {
                    g = it->second;
                }
            }
            for (std::size_t a = 0; a < naggs; ++a) {
                if (auto ok = groups[g].accumulators[a]->accumulate(arguments[r][a]); !ok) {
                    return std::unexpected(std::move(ok.error()).at(aggregate_name(aggregates[a])));
                }
            }
        }
        std::int64_t grouping_id = 0;
        for (std::size_t k = 0; k < nkeys; ++k) {
            if (!set.test(k)) {
                grouping_id |= std::int64_t{1} << k;
            }
        }
        for (auto& state : groups) {
            Row row;
            row.reserve(nkeys + naggs + 1);
            for (std::size_t k = 0; k < nkeys; ++k) {
                row.push_back(set.test(k) && !state.keys.empty() ? state.keys[k] : Value::null());
            }
            for (std::size_t a = 0; a < naggs; ++a) {
                auto v = state.accumulators[a]->finalize();
                if (!v) {
                    return std::unexpected(std::move(v.error()).at(aggregate_name(aggregates[a])));
                }
                row.push_back(std::move(*v));
            }
            row.push_back(Value::int64(grouping_id));
            out.rows.push_back(std::move(row));
        }
    }
    for (std::size_t a = 0; a < naggs; ++a) {
        out.schema.fields[nkeys + a].type = infer_column_type(out.rows, nkeys + a);
    }
    spdlog::debug("group: {} keys, {} grouping sets, {} input rows, {} output rows", nkeys,
                  plan.sets.size(), input.num_rows(), out.num_rows());
    return out;
}

}  // namespace oryx::runtime
