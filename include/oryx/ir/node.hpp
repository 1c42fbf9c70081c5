#pragma once

#include <oryx/core/value.hpp>
#include <oryx/ir/expr.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace oryx::ir {

/// Unique identifier for IR nodes.
using NodeId = std::uint64_t;

class Node;
using NodePtr = std::unique_ptr<Node>;

/// Output column of a projection. An empty alias derives the name from the
/// expression (column or field name).
struct SelectItem {
    ExprPtr expr;
    std::string alias;
};

/// ORDER BY key. `output_index` sorts by a projected column instead of
/// evaluating `expr`; NULLs default to first when ascending, last otherwise.
struct SortKey {
    ExprPtr expr;
    bool ascending = true;
    std::optional<bool> nulls_first;
    std::optional<std::size_t> output_index;

    [[nodiscard]] auto effective_nulls_first() const noexcept -> bool {
        return nulls_first.value_or(ascending);
    }
};

/// Built-in aggregate functions; Extern dispatches to the registry by callee.
enum class AggFunc : std::uint8_t {
    CountStar,
    Count,
    Sum,
    Avg,
    Min,
    Max,
    AnyValue,
    Last,
    ArrayAgg,
    Extern,
};

/// Aggregation: apply `func` to `argument` (unset for COUNT(*)), store as alias.
struct AggSpec {
    AggFunc func = AggFunc::CountStar;
    ExprPtr argument;
    bool distinct = false;
    std::string callee;
    std::string alias;
};

enum class WindowFunc : std::uint8_t {
    RowNumber,
    Rank,
    DenseRank,
    Lag,
    Lead,
    Aggregate,
};

/// Window function over PARTITION BY / ORDER BY. Without ORDER BY the frame
/// is the whole partition; with it, partition start to the current row's
/// last peer.
struct WindowSpec {
    WindowFunc func = WindowFunc::RowNumber;
    AggSpec aggregate;
    ExprPtr argument;
    std::int64_t offset = 1;
    ExprPtr default_value;
    std::vector<ExprPtr> partition_by;
    std::vector<SortKey> order_by;
    std::string alias;
};

/// One grouping column or parenthesized column tuple; empty means `()`.
struct GroupingElement {
    std::vector<ExprPtr> exprs;
};

enum class GroupByKind : std::uint8_t {
    Simple,
    Rollup,
    Cube,
    GroupingSets,
};

/// One item of a GROUP BY list. Items in one list combine by cross product.
struct GroupByItem {
    GroupByKind kind = GroupByKind::Simple;
    std::vector<GroupingElement> elements;
    std::vector<GroupByItem> sets;
};

/// GROUP BY clause. `all` infers the keys from the select list.
struct GroupingSpec {
    bool all = false;
    std::vector<GroupByItem> items;
};

/// A full select block, evaluated FROM → WHERE → GROUP BY → HAVING →
/// WINDOW → QUALIFY → projection → DISTINCT → ORDER BY → LIMIT.
struct SelectSpec {
    ExprPtr where;
    std::optional<GroupingSpec> group_by;
    std::vector<AggSpec> aggregates;
    ExprPtr having;
    std::vector<WindowSpec> windows;
    ExprPtr qualify;
    /// Empty selects every input column (`SELECT *`).
    std::vector<SelectItem> items;
    bool distinct = false;
    std::vector<SortKey> order_by;
    std::optional<std::int64_t> limit;
    std::int64_t offset = 0;
};

enum class SetOpKind : std::uint8_t {
    Union,
    Intersect,
    Except,
};

enum class SetQuantifier : std::uint8_t {
    All,
    Distinct,
};

/// Column reconciliation between set operation inputs.
enum class ColumnMatch : std::uint8_t {
    Positional,
    /// BY NAME / STRICT CORRESPONDING: identical name sets.
    ByName,
    /// INNER BY NAME / CORRESPONDING: common names only.
    InnerByName,
    /// FULL [OUTER] BY NAME: union of names.
    FullByName,
    /// LEFT [OUTER] BY NAME: the left input's names.
    LeftByName,
};

struct SetOpSpec {
    SetOpKind op = SetOpKind::Union;
    SetQuantifier quantifier = SetQuantifier::All;
    ColumnMatch matching = ColumnMatch::Positional;
    /// ON (cols) / BY (cols): restrict the name-matched output to these.
    std::vector<std::string> on_columns;
};

enum class JoinKind : std::uint8_t {
    Cross,
    Inner,
    Left,
    Right,
    Full,
    LeftSemi,
    LeftAnti,
    RightSemi,
    RightAnti,
};

struct JoinSpec {
    JoinKind kind = JoinKind::Inner;
    ExprPtr condition;
    std::vector<std::string> using_columns;
    bool natural = false;
    bool lateral = false;
    /// Written as a comma cross join.
    bool comma = false;
    /// Written inside parentheses.
    bool parenthesized = false;
};

/// A WITH binding; `column_names` renames the query's output when non-empty.
struct CteBinding {
    std::string name;
    std::vector<std::string> column_names;
};

/// IR node types.
enum class NodeKind : std::uint8_t {
    Scan,
    Values,
    Filter,
    Project,
    Join,
    Unnest,
    Select,
    SetOp,
    Distinct,
    Order,
    Limit,
    With,
    TableFunction,
};

[[nodiscard]] auto node_kind_name(NodeKind kind) noexcept -> std::string_view;
[[nodiscard]] auto join_kind_name(JoinKind kind) noexcept -> std::string_view;

/// Base IR node for the query plan.
///
/// Represents a single relational operation in the query DAG.
/// Children are owned via unique_ptr for clear ownership semantics.
class Node {
   public:
    explicit Node(NodeKind kind, NodeId id) : kind_(kind), id_(id) {}
    virtual ~Node() = default;

    Node(const Node&) = delete;
    auto operator=(const Node&) -> Node& = delete;
    Node(Node&&) = default;
    auto operator=(Node&&) -> Node& = default;

    [[nodiscard]] auto kind() const noexcept -> NodeKind { return kind_; }
    [[nodiscard]] auto id() const noexcept -> NodeId { return id_; }
    [[nodiscard]] auto children() const noexcept -> const std::vector<NodePtr>& {
        return children_;
    }

    void add_child(NodePtr child) { children_.push_back(std::move(child)); }

   private:
    NodeKind kind_;
    NodeId id_;
    std::vector<NodePtr> children_;
};

/// Scan node: reads a WITH binding or a registered table.
class ScanNode final : public Node {
   public:
    ScanNode(NodeId id, std::string source_name, std::string alias)
        : Node(NodeKind::Scan, id), source_name_(std::move(source_name)), alias_(std::move(alias)) {}

    [[nodiscard]] auto source_name() const noexcept -> const std::string& { return source_name_; }
    /// Range variable used to qualify columns; the source name when empty.
    [[nodiscard]] auto alias() const noexcept -> const std::string& {
        return alias_.empty() ? source_name_ : alias_;
    }

   private:
    std::string source_name_;
    std::string alias_;
};

/// Inline literal rows.
class ValuesNode final : public Node {
   public:
    ValuesNode(NodeId id, std::vector<std::string> column_names, std::vector<Row> rows)
        : Node(NodeKind::Values, id), column_names_(std::move(column_names)), rows_(std::move(rows)) {}

    [[nodiscard]] auto column_names() const noexcept -> const std::vector<std::string>& {
        return column_names_;
    }
    [[nodiscard]] auto rows() const noexcept -> const std::vector<Row>& { return rows_; }

   private:
    std::vector<std::string> column_names_;
    std::vector<Row> rows_;
};

/// Filter node: keeps rows whose predicate is TRUE.
class FilterNode final : public Node {
   public:
    FilterNode(NodeId id, ExprPtr predicate)
        : Node(NodeKind::Filter, id), predicate_(std::move(predicate)) {}

    [[nodiscard]] auto predicate() const noexcept -> const Expr& { return *predicate_; }

   private:
    ExprPtr predicate_;
};

/// Project node: computes an output column per item.
class ProjectNode final : public Node {
   public:
    ProjectNode(NodeId id, std::vector<SelectItem> items)
        : Node(NodeKind::Project, id), items_(std::move(items)) {}

    [[nodiscard]] auto items() const noexcept -> const std::vector<SelectItem>& { return items_; }

   private:
    std::vector<SelectItem> items_;
};

/// Join node: children are the left and right inputs.
class JoinNode final : public Node {
   public:
    JoinNode(NodeId id, JoinSpec spec) : Node(NodeKind::Join, id), spec_(std::move(spec)) {}

    [[nodiscard]] auto spec() const noexcept -> const JoinSpec& { return spec_; }

   private:
    JoinSpec spec_;
};

/// Unnest node: one row per array element, optionally WITH OFFSET. Inside a
/// join's right input the array may reference the left row through OuterRef.
class UnnestNode final : public Node {
   public:
    UnnestNode(NodeId id, ExprPtr array, std::string alias,
               std::optional<std::string> offset_alias)
        : Node(NodeKind::Unnest, id),
          array_(std::move(array)),
          alias_(std::move(alias)),
          offset_alias_(std::move(offset_alias)) {}

    [[nodiscard]] auto array() const noexcept -> const Expr& { return *array_; }
    [[nodiscard]] auto alias() const noexcept -> const std::string& { return alias_; }
    [[nodiscard]] auto offset_alias() const noexcept -> const std::optional<std::string>& {
        return offset_alias_;
    }

   private:
    ExprPtr array_;
    std::string alias_;
    std::optional<std::string> offset_alias_;
};

/// Select node: a full select block over its optional FROM child.
class SelectNode final : public Node {
   public:
    SelectNode(NodeId id, SelectSpec spec) : Node(NodeKind::Select, id), spec_(std::move(spec)) {}

    [[nodiscard]] auto spec() const noexcept -> const SelectSpec& { return spec_; }

   private:
    SelectSpec spec_;
};

/// Set operation node: two or more inputs combined left to right.
class SetOpNode final : public Node {
   public:
    SetOpNode(NodeId id, SetOpSpec spec) : Node(NodeKind::SetOp, id), spec_(std::move(spec)) {}

    [[nodiscard]] auto spec() const noexcept -> const SetOpSpec& { return spec_; }

   private:
    SetOpSpec spec_;
};

/// Distinct node: drops duplicate rows.
class DistinctNode final : public Node {
   public:
    explicit DistinctNode(NodeId id) : Node(NodeKind::Distinct, id) {}
};

/// Order node: stable sort by keys evaluated over the child's columns.
class OrderNode final : public Node {
   public:
    OrderNode(NodeId id, std::vector<SortKey> keys)
        : Node(NodeKind::Order, id), keys_(std::move(keys)) {}

    [[nodiscard]] auto keys() const noexcept -> const std::vector<SortKey>& { return keys_; }

   private:
    std::vector<SortKey> keys_;
};

/// Limit node: LIMIT / OFFSET.
class LimitNode final : public Node {
   public:
    LimitNode(NodeId id, std::optional<std::int64_t> limit, std::int64_t offset)
        : Node(NodeKind::Limit, id), limit_(limit), offset_(offset) {}

    [[nodiscard]] auto limit() const noexcept -> std::optional<std::int64_t> { return limit_; }
    [[nodiscard]] auto offset() const noexcept -> std::int64_t { return offset_; }

   private:
    std::optional<std::int64_t> limit_;
    std::int64_t offset_;
};

/// WITH node: children are the binding queries in declaration order followed
/// by the body.
class WithNode final : public Node {
   public:
    WithNode(NodeId id, bool recursive, std::vector<CteBinding> bindings)
        : Node(NodeKind::With, id), recursive_(recursive), bindings_(std::move(bindings)) {}

    [[nodiscard]] auto recursive() const noexcept -> bool { return recursive_; }
    [[nodiscard]] auto bindings() const noexcept -> const std::vector<CteBinding>& {
        return bindings_;
    }
    [[nodiscard]] auto body() const -> const Node& { return *children().back(); }

   private:
    bool recursive_;
    std::vector<CteBinding> bindings_;
};

/// Table-valued function call: children are the table arguments.
class TableFunctionNode final : public Node {
   public:
    TableFunctionNode(NodeId id, std::string callee, std::vector<ExprPtr> args)
        : Node(NodeKind::TableFunction, id), callee_(std::move(callee)), args_(std::move(args)) {}

    [[nodiscard]] auto callee() const noexcept -> const std::string& { return callee_; }
    [[nodiscard]] auto args() const noexcept -> const std::vector<ExprPtr>& { return args_; }

   private:
    std::string callee_;
    std::vector<ExprPtr> args_;
};

}  // namespace oryx::ir
