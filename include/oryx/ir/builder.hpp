#pragma once

#include <oryx/ir/node.hpp>

#include <atomic>

namespace oryx::ir {

/// Factory for constructing IR nodes with unique IDs.
///
/// Thread-safe ID generation via atomic counter. Factories that take inputs
/// attach them as children.
class Builder {
   public:
    Builder() = default;

    [[nodiscard]] auto scan(std::string source_name, std::string alias = {}) -> NodePtr {
        return std::make_unique<ScanNode>(next_id(), std::move(source_name), std::move(alias));
    }

    [[nodiscard]] auto values(std::vector<std::string> column_names, std::vector<Row> rows)
        -> NodePtr {
        return std::make_unique<ValuesNode>(next_id(), std::move(column_names), std::move(rows));
    }

    [[nodiscard]] auto filter(NodePtr input, ExprPtr predicate) -> NodePtr {
        auto node = std::make_unique<FilterNode>(next_id(), std::move(predicate));
        node->add_child(std::move(input));
        return node;
    }

    [[nodiscard]] auto project(NodePtr input, std::vector<SelectItem> items) -> NodePtr {
        auto node = std::make_unique<ProjectNode>(next_id(), std::move(items));
        node->add_child(std::move(input));
        return node;
    }

    [[nodiscard]] auto join(NodePtr left, NodePtr right, JoinSpec spec) -> NodePtr {
        auto node = std::make_unique<JoinNode>(next_id(), std::move(spec));
        node->add_child(std::move(left));
        node->add_child(std::move(right));
        return node;
    }

    /// Left-deep chain: ((first ⋈ r1) ⋈ r2) ...
    [[nodiscard]] auto join_chain(NodePtr first, std::vector<std::pair<JoinSpec, NodePtr>> rest)
        -> NodePtr {
        NodePtr current = std::move(first);
        for (auto& [spec, right] : rest) {
            current = join(std::move(current), std::move(right), std::move(spec));
        }
        return current;
    }

    [[nodiscard]] auto unnest(ExprPtr array, std::string alias,
                              std::optional<std::string> offset_alias = std::nullopt) -> NodePtr {
        return std::make_unique<UnnestNode>(next_id(), std::move(array), std::move(alias),
                                            std::move(offset_alias));
    }

    /// Select block; `from` may be null for SELECT without FROM.
    [[nodiscard]] auto select(NodePtr from, SelectSpec spec) -> NodePtr {
        auto node = std::make_unique<SelectNode>(next_id(), std::move(spec));
        if (from) {
            node->add_child(std::move(from));
        }
        return node;
    }

    [[nodiscard]] auto set_op(SetOpSpec spec, std::vector<NodePtr> inputs) -> NodePtr {
        auto node = std::make_unique<SetOpNode>(next_id(), std::move(spec));
        for (auto& input : inputs) {
            node->add_child(std::move(input));
        }
        return node;
    }

    [[nodiscard]] auto set_op(SetOpSpec spec, NodePtr left, NodePtr right) -> NodePtr {
        std::vector<NodePtr> inputs;
        inputs.push_back(std::move(left));
        inputs.push_back(std::move(right));
        return set_op(std::move(spec), std::move(inputs));
    }

    [[nodiscard]] auto distinct(NodePtr input) -> NodePtr {
        auto node = std::make_unique<DistinctNode>(next_id());
        node->add_child(std::move(input));
        return node;
    }

    [[nodiscard]] auto order(NodePtr input, std::vector<SortKey> keys) -> NodePtr {
        auto node = std::make_unique<OrderNode>(next_id(), std::move(keys));
        node->add_child(std::move(input));
        return node;
    }

    [[nodiscard]] auto limit(NodePtr input, std::optional<std::int64_t> limit,
                             std::int64_t offset = 0) -> NodePtr {
        auto node = std::make_unique<LimitNode>(next_id(), limit, offset);
        node->add_child(std::move(input));
        return node;
    }

    /// WITH: one query per binding, then the body.
    [[nodiscard]] auto with(bool recursive, std::vector<std::pair<CteBinding, NodePtr>> bindings,
                            NodePtr body) -> NodePtr {
        std::vector<CteBinding> specs;
        specs.reserve(bindings.size());
        for (auto& binding : bindings) {
            specs.push_back(binding.first);
        }
        auto node = std::make_unique<WithNode>(next_id(), recursive, std::move(specs));
        for (auto& binding : bindings) {
            node->add_child(std::move(binding.second));
        }
        node->add_child(std::move(body));
        return node;
    }

    [[nodiscard]] auto table_function(std::string callee, std::vector<ExprPtr> args,
                                      std::vector<NodePtr> tables = {}) -> NodePtr {
        auto node =
            std::make_unique<TableFunctionNode>(next_id(), std::move(callee), std::move(args));
        for (auto& table : tables) {
            node->add_child(std::move(table));
        }
        return node;
    }

   private:
    [[nodiscard]] auto next_id() -> NodeId {
        return next_id_.fetch_add(1, std::memory_order_relaxed);
    }

    std::atomic<NodeId> next_id_{1};
};

}  // namespace oryx::ir
