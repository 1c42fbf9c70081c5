#include <oryx/runtime/join.hpp>

#include <oryx/core/compare.hpp>
#include <oryx/core/hash.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <numeric>
#include <vector>

namespace oryx::runtime {

namespace {

using ir::JoinKind;

struct KeyPair {
    std::size_t left = 0;
    std::size_t right = 0;
};

/// Output shape: merged USING columns, then the remaining left and right
/// columns by position.
struct JoinLayout {
    Schema schema;
    std::vector<KeyPair> merged;
    std::vector<std::size_t> left_rest;
    std::vector<std::size_t> right_rest;
    std::size_t left_width = 0;
    std::size_t right_width = 0;
};

auto is_left_filter(JoinKind kind) noexcept -> bool {
    return kind == JoinKind::LeftSemi || kind == JoinKind::LeftAnti;
}

auto is_right_filter(JoinKind kind) noexcept -> bool {
    return kind == JoinKind::RightSemi || kind == JoinKind::RightAnti;
}

auto pads_right(JoinKind kind) noexcept -> bool {
    return kind == JoinKind::Left || kind == JoinKind::Full;
}

auto pads_left(JoinKind kind) noexcept -> bool {
    return kind == JoinKind::Right || kind == JoinKind::Full;
}

auto unique_column(const Schema& schema, const std::string& name, std::string_view side)
    -> Result<std::size_t> {
    auto found = schema.find_all(name);
    if (found.empty()) {
        return make_error(ErrorKind::InvalidPlan,
                          fmt::format("USING column {} not found in {} input (available: {})",
                                      name, side, format_columns(schema)));
    }
    if (found.size() > 1) {
        return make_error(ErrorKind::TypeMismatch,
                          fmt::format("USING column {} is ambiguous in {} input", name, side));
    }
    return found.front();
}

auto merge_pairs(const Schema& left, const Schema& right, const ir::JoinSpec& spec)
    -> Result<std::vector<KeyPair>> {
    std::vector<std::string> names;
    if (spec.natural) {
        for (const auto& field : left.fields) {
            if (right.find_all(field.name).empty()) {
                continue;
            }
            bool seen = false;
            for (const auto& name : names) {
                seen = seen || iequals(name, field.name);
            }
            if (!seen) {
                names.push_back(field.name);
            }
        }
    } else {
        for (std::size_t i = 0; i < spec.using_columns.size(); ++i) {
            for (std::size_t j = 0; j < i; ++j) {
                if (iequals(spec.using_columns[i], spec.using_columns[j])) {
                    return make_error(ErrorKind::InvalidJoinShape,
                                      fmt::format("duplicate USING column: {}",
                                                  spec.using_columns[i]));
                }
            }
        }
        names = spec.using_columns;
    }
    std::vector<KeyPair> pairs;
    pairs.reserve(names.size());
    for (const auto& name : names) {
        auto l = unique_column(left, name, "left");
        if (!l) {
            return std::unexpected(l.error());
        }
        auto r = unique_column(right, name, "right");
        if (!r) {
            return std::unexpected(r.error());
        }
        pairs.push_back(KeyPair{.left = *l, .right = *r});
    }
    return pairs;
}

auto make_layout(const Schema& left, const Schema& right, const ir::JoinSpec& spec,
                 std::vector<KeyPair> merged) -> JoinLayout {
    JoinLayout layout;
    layout.left_width = left.size();
    layout.right_width = right.size();
    if (is_left_filter(spec.kind)) {
        layout.schema = left;
        std::vector<std::size_t> all(left.size());
        std::iota(all.begin(), all.end(), std::size_t{0});
        layout.left_rest = std::move(all);
        return layout;
    }
    if (is_right_filter(spec.kind)) {
        layout.schema = right;
        std::vector<std::size_t> all(right.size());
        std::iota(all.begin(), all.end(), std::size_t{0});
        layout.right_rest = std::move(all);
        return layout;
    }
    for (const auto& pair : merged) {
        Field field = left[pair.left];
        const auto& other = right[pair.right];
        if (field.type == TypeKind::Null) {
            field.type = other.type;
        }
        if (spec.kind == JoinKind::Right) {
            field.qualifier = other.qualifier;
        } else if (spec.kind == JoinKind::Full) {
            field.qualifier.clear();
        }
        field.nullable = field.nullable || other.nullable;
        layout.schema.fields.push_back(std::move(field));
    }
    auto is_merged = [&](std::size_t index, bool left_side) {
        for (const auto& pair : merged) {
            if ((left_side ? pair.left : pair.right) == index) {
                return true;
            }
        }
        return false;
    };
    for (std::size_t i = 0; i < left.size(); ++i) {
        if (is_merged(i, true)) {
            continue;
        }
        layout.left_rest.push_back(i);
        Field field = left[i];
        field.nullable = field.nullable || pads_left(spec.kind);
        layout.schema.fields.push_back(std::move(field));
    }
    for (std::size_t i = 0; i < right.size(); ++i) {
        if (is_merged(i, false)) {
            continue;
        }
        layout.right_rest.push_back(i);
        Field field = right[i];
        field.nullable = field.nullable || pads_right(spec.kind);
        layout.schema.fields.push_back(std::move(field));
    }
    layout.merged = std::move(merged);
    return layout;
}

auto pair_schema(const Schema& left, const Schema& right) -> Schema {
    Schema out = left;
    out.fields.insert(out.fields.end(), right.fields.begin(), right.fields.end());
    return out;
}

/// Top-level `left_col = right_col` conjuncts of a bound condition.
void collect_equalities(const ir::Expr& expr, std::size_t left_width,
                        std::vector<KeyPair>& out) {
    if (const auto* logical = std::get_if<ir::LogicalExpr>(&expr.node)) {
        if (logical->op == ir::LogicalOp::And) {
            collect_equalities(*logical->left, left_width, out);
            collect_equalities(*logical->right, left_width, out);
        }
        return;
    }
    const auto* cmp = std::get_if<ir::CompareExpr>(&expr.node);
    if (cmp == nullptr || cmp->op != CompareOp::Eq) {
        return;
    }
    const auto* a = std::get_if<ir::ColumnRef>(&cmp->left->node);
    const auto* b = std::get_if<ir::ColumnRef>(&cmp->right->node);
    if (a == nullptr || b == nullptr || !a->index || !b->index) {
        return;
    }
    auto ia = *a->index;
    auto ib = *b->index;
    if (ia < left_width && ib >= left_width) {
        out.push_back(KeyPair{.left = ia, .right = ib - left_width});
    } else if (ib < left_width && ia >= left_width) {
        out.push_back(KeyPair{.left = ib, .right = ia - left_width});
    }
}

/// Kinds present in one column, as a bitmask over TypeKind.
auto column_kinds(const std::vector<Row>& rows, std::size_t column) -> std::uint32_t {
    std::uint32_t mask = 0;
    for (const auto& row : rows) {
        mask |= 1U << static_cast<unsigned>(row[column].kind());
    }
    return mask;
}

/// NUMERIC and DOUBLE keys compare by value but canonicalize differently, and
/// JSON has no identity: such pairs stay on the nested loop path.
auto hashable(const Table& left, const Table& right, const KeyPair& pair) -> bool {
    constexpr auto bit = [](TypeKind k) { return 1U << static_cast<unsigned>(k); };
    auto lk = column_kinds(left.rows, pair.left);
    auto rk = column_kinds(right.rows, pair.right);
    if (((lk | rk) & bit(TypeKind::Json)) != 0) {
        return false;
    }
    bool mixed = ((lk & bit(TypeKind::Numeric)) != 0 && (rk & bit(TypeKind::Double)) != 0) ||
                 ((lk & bit(TypeKind::Double)) != 0 && (rk & bit(TypeKind::Numeric)) != 0);
    return !mixed;
}

/// Collation of each key pair over both inputs.
auto key_collations(const Table& left, const Table& right, const std::vector<KeyPair>& pairs,
                    const CollationContext& ctx) -> Result<std::vector<CollationSpec>> {
    std::vector<CollationSpec> out;
    out.reserve(pairs.size());
    for (const auto& pair : pairs) {
        std::string chosen;
        auto scan = [&](const Table& table, std::size_t column) -> Result<void> {
            for (const auto& row : table.rows) {
                if (row[column].kind() != TypeKind::String) {
                    continue;
                }
                const auto& collation = row[column].as_text().collation;
                if (collation.empty() || collation == chosen) {
                    continue;
                }
                auto resolved = ctx.resolve(chosen, collation);
                if (!resolved) {
                    return std::unexpected(std::move(resolved.error())
                                               .at(fmt::format("column {}",
                                                               table.schema[column].name)));
                }
                if (!resolved->is_default()) {
                    chosen = resolved->to_string();
                }
            }
            return {};
        };
        if (auto r = scan(left, pair.left); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = scan(right, pair.right); !r) {
            return std::unexpected(r.error());
        }
        out.push_back(CollationSpec::parse(chosen));
    }
    return out;
}

class JoinRun {
   public:
    JoinRun(const Table& left, const ir::JoinSpec& spec, const EvalContext& ctx)
        : left_(left), spec_(spec), ctx_(ctx) {}

    /// Layout and bound condition for a right input of `right` shape.
    auto prepare(const Schema& right) -> Result<void> {
        auto merged = merge_pairs(left_.schema, right, spec_);
        if (!merged) {
            return std::unexpected(merged.error());
        }
        match_pairs_ = *merged;
        layout_ = make_layout(left_.schema, right, spec_, std::move(*merged));
        pairs_ = pair_schema(left_.schema, right);
        if (spec_.condition) {
            auto bound = bind(spec_.condition, pairs_);
            if (!bound) {
                return std::unexpected(bound.error());
            }
            condition_ = std::move(*bound);
        }
        output_.schema = layout_.schema;
        return {};
    }

    auto matches(const Row& l, const Row& r) const -> Result<bool> {
        for (const auto& pair : match_pairs_) {
            auto eq = equals3vl(l[pair.left], r[pair.right], ctx_.collation);
            if (!eq) {
                return std::unexpected(eq.error());
            }
            if (*eq != TriBool::True) {
                return false;
            }
        }
        if (!condition_) {
            return true;
        }
        Row row;
        row.reserve(l.size() + r.size());
        row.insert(row.end(), l.begin(), l.end());
        row.insert(row.end(), r.begin(), r.end());
        auto truth = evaluate_predicate(*condition_, pairs_, row, ctx_);
        if (!truth) {
            return std::unexpected(truth.error());
        }
        return *truth == TriBool::True;
    }

    void emit(const Row* l, const Row* r) {
        Row out;
        out.reserve(layout_.schema.size());
        for (const auto& pair : layout_.merged) {
            Value lv = l != nullptr ? (*l)[pair.left] : Value::null();
            Value rv = r != nullptr ? (*r)[pair.right] : Value::null();
            if (spec_.kind == JoinKind::Right) {
                out.push_back(std::move(rv));
            } else if (spec_.kind == JoinKind::Full && lv.is_null()) {
                out.push_back(std::move(rv));
            } else {
                out.push_back(std::move(lv));
            }
        }
        for (auto i : layout_.left_rest) {
            out.push_back(l != nullptr ? (*l)[i] : Value::null());
        }
        for (auto i : layout_.right_rest) {
            out.push_back(r != nullptr ? (*r)[i] : Value::null());
        }
        output_.rows.push_back(std::move(out));
    }

    [[nodiscard]] auto layout() const noexcept -> const JoinLayout& { return layout_; }
    [[nodiscard]] auto match_pairs() const noexcept -> const std::vector<KeyPair>& {
        return match_pairs_;
    }
    [[nodiscard]] auto condition() const noexcept -> const ir::ExprPtr& { return condition_; }
    auto take() -> Table { return std::move(output_); }

   private:
    const Table& left_;
    const ir::JoinSpec& spec_;
    const EvalContext& ctx_;
    JoinLayout layout_;
    std::vector<KeyPair> match_pairs_;
    Schema pairs_;
    ir::ExprPtr condition_;
    Table output_;
};

auto join_correlated(const Table& left, RowProducer& right, const ir::JoinSpec& spec,
                     const EvalContext& ctx) -> Result<Table> {
    JoinRun run(left, spec, ctx);
    bool prepared = false;
    if (left.rows.empty()) {
        // Schema-only call over an all-NULL row; its failure cannot fail a
        // join that has no left rows.
        LateralParams params{.schema = &left.schema, .row = Row(left.num_columns())};
        auto probe = right.produce(&params);
        if (!probe) {
            spdlog::debug("join: lateral input failed without left rows ({}), keeping left columns",
                          probe.error().message);
            Table out;
            out.schema = left.schema;
            return out;
        }
        if (auto r = run.prepare(probe->schema); !r) {
            return std::unexpected(r.error());
        }
        return run.take();
    }
    std::size_t produced = 0;
    for (const auto& l : left.rows) {
        LateralParams params{.schema = &left.schema, .row = l};
        auto rows = right.produce(&params);
        if (!rows) {
            return std::unexpected(rows.error());
        }
        if (!prepared) {
            if (auto r = run.prepare(rows->schema); !r) {
                return std::unexpected(r.error());
            }
            prepared = true;
        } else if (rows->num_columns() != run.layout().right_width) {
            return make_error(ErrorKind::InvalidPlan,
                              fmt::format("lateral input produced {} columns, expected {}",
                                          rows->num_columns(), run.layout().right_width));
        }
        produced += rows->num_rows();
        bool matched = false;
        for (const auto& r : rows->rows) {
            auto ok = run.matches(l, r);
            if (!ok) {
                return std::unexpected(ok.error());
            }
            if (*ok) {
                matched = true;
                run.emit(&l, &r);
            }
        }
        if (!matched && spec.kind == JoinKind::Left) {
            run.emit(&l, nullptr);
        }
    }
    spdlog::debug("{}: lateral, {} left rows, {} right rows produced",
                  ir::join_kind_name(spec.kind), left.num_rows(), produced);
    return run.take();
}

auto join_materialized(const Table& left, const Table& right, const ir::JoinSpec& spec,
                       const EvalContext& ctx) -> Result<Table> {
    JoinRun run(left, spec, ctx);
    if (auto r = run.prepare(right.schema); !r) {
        return std::unexpected(r.error());
    }

    std::vector<KeyPair> keys = run.match_pairs();
    if (keys.empty() && run.condition()) {
        collect_equalities(*run.condition(), left.num_columns(), keys);
    }
    std::vector<std::size_t> left_cols;
    std::vector<std::size_t> right_cols;
    for (const auto& pair : keys) {
        if (hashable(left, right, pair)) {
            left_cols.push_back(pair.left);
            right_cols.push_back(pair.right);
        }
    }
    const bool use_hash = !left_cols.empty();

    std::vector<CollationSpec> collations;
    RowKeyMap<std::vector<std::size_t>> index;
    if (use_hash) {
        std::vector<KeyPair> hashed;
        for (std::size_t i = 0; i < left_cols.size(); ++i) {
            hashed.push_back(KeyPair{.left = left_cols[i], .right = right_cols[i]});
        }
        auto specs = key_collations(left, right, hashed, ctx.collation);
        if (!specs) {
            return std::unexpected(specs.error());
        }
        collations = std::move(*specs);
        index.reserve(right.num_rows());
        for (std::size_t r = 0; r < right.num_rows(); ++r) {
            auto key = make_row_key(right.rows[r], right_cols, collations, ctx.collation);
            if (!key) {
                return std::unexpected(key.error());
            }
            bool has_null = false;
            for (const auto& v : key->values) {
                has_null = has_null || v.is_null();
            }
            if (!has_null) {
                index[std::move(*key)].push_back(r);
            }
        }
    }
    spdlog::debug("{}: {} path, {} left rows, {} right rows", ir::join_kind_name(spec.kind),
                  use_hash ? "hash" : "nested loop", left.num_rows(), right.num_rows());

    std::vector<std::size_t> all_rows(right.num_rows());
    std::iota(all_rows.begin(), all_rows.end(), std::size_t{0});
    static const std::vector<std::size_t> kNoRows;
    std::vector<char> right_matched(right.num_rows(), 0);

    for (const auto& l : left.rows) {
        const std::vector<std::size_t>* candidates = &all_rows;
        if (use_hash) {
            auto key = make_row_key(l, left_cols, collations, ctx.collation);
            if (!key) {
                return std::unexpected(key.error());
            }
            bool has_null = false;
            for (const auto& v : key->values) {
                has_null = has_null || v.is_null();
            }
            auto it = has_null ? index.end() : index.find(*key);
            candidates = it == index.end() ? &kNoRows : &it->second;
        }
        bool matched = false;
        for (auto r : *candidates) {
            auto ok = run.matches(l, right.rows[r]);
            if (!ok) {
                return std::unexpected(ok.error());
            }
            if (!*ok) {
                continue;
            }
            matched = true;
            right_matched[r] = 1;
            if (is_left_filter(spec.kind)) {
                break;
            }
            if (!is_right_filter(spec.kind)) {
                run.emit(&l, &right.rows[r]);
            }
        }
        if ((spec.kind == JoinKind::LeftSemi && matched) ||
            (spec.kind == JoinKind::LeftAnti && !matched)) {
            run.emit(&l, nullptr);
        } else if (!matched && pads_right(spec.kind)) {
            run.emit(&l, nullptr);
        }
    }

    for (std::size_t r = 0; r < right.num_rows(); ++r) {
        bool matched = right_matched[r] != 0;
        if ((pads_left(spec.kind) && !matched) || (spec.kind == JoinKind::RightSemi && matched) ||
            (spec.kind == JoinKind::RightAnti && !matched)) {
            run.emit(nullptr, &right.rows[r]);
        }
    }
    return run.take();
}

}  // namespace

auto join(const Table& left, RowProducer& right, const ir::JoinSpec& spec, const EvalContext& ctx)
    -> Result<Table> {
    auto name = ir::join_kind_name(spec.kind);
    Result<Table> out;
    if (right.correlated()) {
        if (spec.kind != JoinKind::Cross && spec.kind != JoinKind::Inner &&
            spec.kind != JoinKind::Left) {
            return make_error(ErrorKind::InvalidJoinShape,
                              fmt::format("LATERAL is not allowed with {}", name),
                              std::string(name));
        }
        out = join_correlated(left, right, spec, ctx);
    } else {
        auto rows = right.produce(nullptr);
        if (!rows) {
            return std::unexpected(std::move(rows.error()).at(name));
        }
        out = join_materialized(left, *rows, spec, ctx);
    }
    if (!out) {
        return std::unexpected(std::move(out.error()).at(name));
    }
    return out;
}

auto join(const Table& left, const Table& right, const ir::JoinSpec& spec, const EvalContext& ctx)
    -> Result<Table> {
    TableProducer producer(right);
    return join(left, producer, spec, ctx);
}

auto unnest(const Value& array, const std::string& alias,
            const std::optional<std::string>& offset_alias) -> Result<Table> {
    Table out;
    out.schema.fields.push_back(
        Field{.name = alias.empty() ? std::string("$element") : alias, .type = TypeKind::Null});
    if (offset_alias.has_value()) {
        out.schema.fields.push_back(
            Field{.name = *offset_alias, .type = TypeKind::Int64, .nullable = false});
    }
    if (array.is_null()) {
        return out;
    }
    if (array.kind() != TypeKind::Array) {
        return make_error(ErrorKind::TypeMismatch,
                          fmt::format("UNNEST requires an ARRAY, got {}", type_name(array.kind())),
                          "unnest");
    }
    const auto& elements = array.elements();
    out.rows.reserve(elements.size());
    for (std::size_t i = 0; i < elements.size(); ++i) {
        Row row{elements[i]};
        if (offset_alias.has_value()) {
            row.push_back(Value::int64(static_cast<std::int64_t>(i)));
        }
        out.rows.push_back(std::move(row));
    }
    out.schema.fields[0].type = infer_column_type(out.rows, 0);
    return out;
}

}  // namespace oryx::runtime
