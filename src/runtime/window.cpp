#include <oryx/runtime/window.hpp>

#include <oryx/core/hash.hpp>
#include <oryx/runtime/aggregates.hpp>
#include <oryx/runtime/sort.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace oryx::runtime {

namespace {

auto window_name(const ir::WindowSpec& spec) -> std::string_view {
    switch (spec.func) {
        case ir::WindowFunc::RowNumber:
            return "row_number";
        case ir::WindowFunc::Rank:
            return "rank";
        case ir::WindowFunc::DenseRank:
            return "dense_rank";
        case ir::WindowFunc::Lag:
            return "lag";
        case ir::WindowFunc::Lead:
            return "lead";
        case ir::WindowFunc::Aggregate:
            return aggregate_name(spec.aggregate);
    }
    return "window";
}

auto eval_rows(const std::vector<ir::ExprPtr>& exprs, const Table& input, const EvalContext& ctx)
    -> Result<std::vector<Row>> {
    std::vector<Row> out;
    out.reserve(input.num_rows());
    for (const auto& row : input.rows) {
        Row values;
        values.reserve(exprs.size());
        for (const auto& expr : exprs) {
            auto v = evaluate(*expr, input.schema, row, ctx);
            if (!v) {
                return std::unexpected(v.error());
            }
            values.push_back(std::move(*v));
        }
        out.push_back(std::move(values));
    }
    return out;
}

/// Row indexes of each partition, partitions in first appearance order.
auto partition_rows(const std::vector<Row>& keys, const EvalContext& ctx)
    -> Result<std::vector<std::vector<std::size_t>>> {
    std::vector<std::vector<std::size_t>> partitions;
    if (keys.empty()) {
        return partitions;
    }
    if (keys.front().empty()) {
        std::vector<std::size_t> all(keys.size());
        for (std::size_t i = 0; i < all.size(); ++i) {
            all[i] = i;
        }
        partitions.push_back(std::move(all));
        return partitions;
    }
    Table key_table;
    key_table.schema.fields.resize(keys.front().size());
    key_table.rows = keys;
    const Table* tables[] = {&key_table};
    auto collations = column_collations(tables, ctx.collation);
    if (!collations) {
        return std::unexpected(collations.error());
    }
    RowKeyMap<std::size_t> index;
    for (std::size_t r = 0; r < keys.size(); ++r) {
        auto key = make_row_key(keys[r], {}, *collations, ctx.collation);
        if (!key) {
            return std::unexpected(key.error());
        }
        auto [it, inserted] = index.try_emplace(std::move(*key), partitions.size());
        if (inserted) {
            partitions.emplace_back();
        }
        partitions[it->second].push_back(r);
    }
    return partitions;
}

class WindowEvaluator {
   public:
    WindowEvaluator(const Table& input, const ir::WindowSpec& spec, const EvalContext& ctx)
        : input_(input), spec_(spec), ctx_(ctx), results_(input.num_rows()) {}

    auto run() -> Result<std::vector<Value>> {
        auto partition_keys = eval_rows(spec_.partition_by, input_, ctx_);
        if (!partition_keys) {
            return std::unexpected(partition_keys.error());
        }
        std::vector<ir::ExprPtr> order_exprs;
        for (const auto& key : spec_.order_by) {
            if (!key.expr) {
                return make_error(ErrorKind::InvalidPlan,
                                  "window ORDER BY keys must be expressions, not output positions",
                                  "window");
            }
            order_exprs.push_back(key.expr);
            dirs_.push_back(SortDirection{.ascending = key.ascending,
                                          .nulls_first = key.effective_nulls_first()});
        }
        auto order_keys = eval_rows(order_exprs, input_, ctx_);
        if (!order_keys) {
            return std::unexpected(order_keys.error());
        }
        order_keys_ = std::move(*order_keys);
        if (spec_.argument) {
            auto args = eval_rows({spec_.argument}, input_, ctx_);
            if (!args) {
                return std::unexpected(args.error());
            }
            arguments_ = std::move(*args);
        } else if (spec_.func == ir::WindowFunc::Aggregate && spec_.aggregate.argument) {
            auto args = eval_rows({spec_.aggregate.argument}, input_, ctx_);
            if (!args) {
                return std::unexpected(args.error());
            }
            arguments_ = std::move(*args);
        }

        auto partitions = partition_rows(*partition_keys, ctx_);
        if (!partitions) {
            return std::unexpected(partitions.error());
        }
        for (auto& rows : *partitions) {
            if (auto r = sort_partition(rows); !r) {
                return std::unexpected(r.error());
            }
            if (auto r = compute(rows); !r) {
                return std::unexpected(r.error());
            }
        }
        return std::move(results_);
    }

   private:
    auto sort_partition(std::vector<std::size_t>& rows) -> Result<void> {
        if (dirs_.empty()) {
            return {};
        }
        std::vector<Row> keys;
        keys.reserve(rows.size());
        for (auto r : rows) {
            keys.push_back(order_keys_[r]);
        }
        auto order = stable_order(keys, dirs_, ctx_.collation);
        if (!order) {
            return std::unexpected(order.error());
        }
        std::vector<std::size_t> sorted;
        sorted.reserve(rows.size());
        for (auto i : *order) {
            sorted.push_back(rows[i]);
        }
        rows = std::move(sorted);
        return {};
    }

    /// End (exclusive) of the peer group starting at `begin`.
    auto peer_end(const std::vector<std::size_t>& rows, std::size_t begin) const
        -> Result<std::size_t> {
        if (dirs_.empty()) {
            return rows.size();
        }
        std::size_t end = begin + 1;
        while (end < rows.size()) {
            auto c = compare_keys(order_keys_[rows[begin]], order_keys_[rows[end]], dirs_,
                                  ctx_.collation);
            if (!c) {
                return std::unexpected(c.error());
            }
            if (*c != 0) {
                break;
            }
            ++end;
        }
        return end;
    }

    auto compute(const std::vector<std::size_t>& rows) -> Result<void> {
        switch (spec_.func) {
            case ir::WindowFunc::RowNumber:
                for (std::size_t i = 0; i < rows.size(); ++i) {
                    results_[rows[i]] = Value::int64(static_cast<std::int64_t>(i + 1));
                }
                return {};
            case ir::WindowFunc::Rank:
            case ir::WindowFunc::DenseRank: {
                std::int64_t dense = 0;
                for (std::size_t begin = 0; begin < rows.size();) {
                    auto end = peer_end(rows, begin);
                    if (!end) {
                        return std::unexpected(end.error());
                    }
                    ++dense;
                    auto rank = spec_.func == ir::WindowFunc::Rank
                                    ? static_cast<std::int64_t>(begin + 1)
                                    : dense;
                    for (auto i = begin; i < *end; ++i) {
                        results_[rows[i]] = Value::int64(rank);
                    }
                    begin = *end;
                }
                return {};
            }
            case ir::WindowFunc::Lag:
            case ir::WindowFunc::Lead:
                return shift(rows);
            case ir::WindowFunc::Aggregate:
                return aggregate(rows);
        }
        return {};
    }

    auto shift(const std::vector<std::size_t>& rows) -> Result<void> {
        auto offset = static_cast<std::size_t>(spec_.offset);
        bool lag = spec_.func == ir::WindowFunc::Lag;
        for (std::size_t i = 0; i < rows.size(); ++i) {
            bool inside = lag ? i >= offset : i + offset < rows.size();
            if (inside) {
                results_[rows[i]] = arguments_[lag ? rows[i - offset] : rows[i + offset]][0];
                continue;
            }
            if (!spec_.default_value) {
                results_[rows[i]] = Value::null();
                continue;
            }
            auto v = evaluate(*spec_.default_value, input_.schema, input_.rows[rows[i]], ctx_);
            if (!v) {
                return std::unexpected(v.error());
            }
            results_[rows[i]] = std::move(*v);
        }
        return {};
    }

    auto aggregate(const std::vector<std::size_t>& rows) -> Result<void> {
        auto acc = make_accumulator(spec_.aggregate, ctx_.registry(), ctx_.collation);
        if (!acc) {
            return std::unexpected(acc.error());
        }
        auto& accumulator = **acc;
        for (std::size_t begin = 0; begin < rows.size();) {
            auto end = peer_end(rows, begin);
            if (!end) {
                return std::unexpected(end.error());
            }
            for (auto i = begin; i < *end; ++i) {
                const auto& arg = arguments_.empty() ? Value::null() : arguments_[rows[i]][0];
                if (auto ok = accumulator.accumulate(arg); !ok) {
                    return ok;
                }
            }
            auto value = accumulator.finalize();
            if (!value) {
                return std::unexpected(value.error());
            }
            for (auto i = begin; i < *end; ++i) {
                results_[rows[i]] = *value;
            }
            begin = *end;
        }
        return {};
    }

    const Table& input_;
    const ir::WindowSpec& spec_;
    const EvalContext& ctx_;
    std::vector<SortDirection> dirs_;
    std::vector<Row> order_keys_;
    std::vector<Row> arguments_;
    std::vector<Value> results_;
};

}  // namespace

auto apply_windows(const Table& input, const std::vector<ir::WindowSpec>& windows,
                   const EvalContext& ctx) -> Result<Table> {
    Table out = input;
    out.ordering.reset();
    for (std::size_t w = 0; w < windows.size(); ++w) {
        const auto& spec = windows[w];
        WindowEvaluator evaluator(input, spec, ctx);
        auto values = evaluator.run();
        if (!values) {
            return std::unexpected(std::move(values.error()).at(window_name(spec)));
        }
        for (std::size_t r = 0; r < out.num_rows(); ++r) {
            out.rows[r].push_back(std::move((*values)[r]));
        }
        out.schema.fields.push_back(
            Field{.name = spec.alias.empty() ? fmt::format("$win{}", w + 1) : spec.alias,
                  .type = TypeKind::Null});
        out.schema.fields.back().type = infer_column_type(out.rows, out.num_columns() - 1);
    }
    spdlog::debug("window: {} functions over {} rows", windows.size(), input.num_rows());
    return out;
}

}  // namespace oryx::runtime
