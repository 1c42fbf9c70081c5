#include <oryx/runtime/set_ops.hpp>

#include <oryx/core/hash.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <vector>

namespace oryx::runtime {

namespace {

/// Output column: source position in each input (nullopt reads NULL).
struct OutputColumn {
    std::string name;
    std::optional<std::size_t> left;
    std::optional<std::size_t> right;
};

auto mismatch(std::string message) -> std::unexpected<Error> {
    return make_error(ErrorKind::ColumnSetMismatch, std::move(message));
}

auto check_unique_names(const Schema& schema, std::string_view side) -> Result<void> {
    for (std::size_t i = 0; i < schema.size(); ++i) {
        for (std::size_t j = 0; j < i; ++j) {
            if (iequals(schema[i].name, schema[j].name)) {
                return mismatch(fmt::format("duplicate column name {} in {} input", schema[i].name,
                                            side));
            }
        }
    }
    return {};
}

auto find_name(const Schema& schema, std::string_view name) -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < schema.size(); ++i) {
        if (iequals(schema[i].name, name)) {
            return i;
        }
    }
    return std::nullopt;
}

auto column_type(const Table& table, std::size_t column) -> TypeKind {
    auto type = table.schema[column].type;
    return type == TypeKind::Null ? infer_column_type(table.rows, column) : type;
}

auto positional_columns(const Schema& left, const Schema& right)
    -> Result<std::vector<OutputColumn>> {
    if (left.size() != right.size()) {
        return mismatch(fmt::format("inputs have {} and {} columns", left.size(), right.size()));
    }
    std::vector<OutputColumn> out;
    out.reserve(left.size());
    for (std::size_t i = 0; i < left.size(); ++i) {
        out.push_back(OutputColumn{.name = left[i].name, .left = i, .right = i});
    }
    return out;
}

auto named_columns(const Schema& left, const Schema& right, const ir::SetOpSpec& spec)
    -> Result<std::vector<OutputColumn>> {
    if (auto r = check_unique_names(left, "left"); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = check_unique_names(right, "right"); !r) {
        return std::unexpected(r.error());
    }
    if (spec.matching == ir::ColumnMatch::ByName) {
        for (const auto& field : right.fields) {
            if (!find_name(left, field.name)) {
                return mismatch(fmt::format("column {} is missing from the left input (available: {})",
                                            field.name, format_columns(left)));
            }
        }
        for (const auto& field : left.fields) {
            if (!find_name(right, field.name)) {
                return mismatch(fmt::format(
                    "column {} is missing from the right input (available: {})", field.name,
                    format_columns(right)));
            }
        }
    }

    std::vector<OutputColumn> out;
    if (!spec.on_columns.empty()) {
        for (const auto& name : spec.on_columns) {
            OutputColumn column{.name = name, .left = find_name(left, name),
                                .right = find_name(right, name)};
            for (const auto& seen : out) {
                if (iequals(seen.name, name)) {
                    return mismatch(fmt::format("duplicate column {} in the column list", name));
                }
            }
            bool need_left = spec.matching != ir::ColumnMatch::FullByName;
            bool need_right = spec.matching == ir::ColumnMatch::ByName ||
                              spec.matching == ir::ColumnMatch::InnerByName;
            if ((need_left && !column.left) || (need_right && !column.right) ||
                (!column.left && !column.right)) {
                return mismatch(fmt::format("column {} of the column list is not in {} input", name,
                                            !column.left ? "the left" : "the right"));
            }
            if (column.left) {
                column.name = left[*column.left].name;
            }
            out.push_back(std::move(column));
        }
        return out;
    }

    for (std::size_t i = 0; i < left.size(); ++i) {
        auto r = find_name(right, left[i].name);
        if (spec.matching == ir::ColumnMatch::InnerByName && !r) {
            continue;
        }
        out.push_back(OutputColumn{.name = left[i].name, .left = i, .right = r});
    }
    if (spec.matching == ir::ColumnMatch::FullByName) {
        for (std::size_t i = 0; i < right.size(); ++i) {
            if (!find_name(left, right[i].name)) {
                out.push_back(OutputColumn{.name = right[i].name, .left = std::nullopt, .right = i});
            }
        }
    }
    if (out.empty()) {
        return mismatch("inputs have no columns in common");
    }
    return out;
}

auto project_side(const Table& input, const std::vector<OutputColumn>& columns,
                  const std::vector<TypeKind>& types, bool left_side,
                  const CoercionService& coercion) -> Result<Table> {
    Table out;
    for (std::size_t c = 0; c < columns.size(); ++c) {
        out.schema.fields.push_back(Field{.name = columns[c].name, .type = types[c]});
    }
    out.rows.reserve(input.num_rows());
    for (const auto& row : input.rows) {
        Row projected;
        projected.reserve(columns.size());
        for (std::size_t c = 0; c < columns.size(); ++c) {
            const auto& source = left_side ? columns[c].left : columns[c].right;
            if (!source) {
                projected.push_back(Value::null());
                continue;
            }
            auto cast = coercion.cast(row[*source], types[c]);
            if (!cast) {
                return std::unexpected(
                    std::move(cast.error()).at(fmt::format("column {}", columns[c].name)));
            }
            projected.push_back(std::move(*cast));
        }
        out.rows.push_back(std::move(projected));
    }
    return out;
}

}  // namespace

auto set_op_name(const ir::SetOpSpec& spec) -> std::string {
    std::string_view op = spec.op == ir::SetOpKind::Union       ? "UNION"
                          : spec.op == ir::SetOpKind::Intersect ? "INTERSECT"
                                                                : "EXCEPT";
    return fmt::format("{} {}", op, spec.quantifier == ir::SetQuantifier::All ? "ALL" : "DISTINCT");
}

auto align_columns(const Table& left, const Table& right, const ir::SetOpSpec& spec,
                   const CoercionService& coercion) -> Result<std::pair<Table, Table>> {
    auto columns = spec.matching == ir::ColumnMatch::Positional
                       ? positional_columns(left.schema, right.schema)
                       : named_columns(left.schema, right.schema, spec);
    if (!columns) {
        return std::unexpected(columns.error());
    }
    std::vector<TypeKind> types;
    types.reserve(columns->size());
    for (const auto& column : *columns) {
        auto lt = column.left ? column_type(left, *column.left) : TypeKind::Null;
        auto rt = column.right ? column_type(right, *column.right) : TypeKind::Null;
        auto common = coercion.common_supertype(lt, rt);
        if (!common) {
            return std::unexpected(
                std::move(common.error()).at(fmt::format("column {}", column.name)));
        }
        types.push_back(*common);
    }
    auto l = project_side(left, *columns, types, true, coercion);
    if (!l) {
        return std::unexpected(l.error());
    }
    auto r = project_side(right, *columns, types, false, coercion);
    if (!r) {
        return std::unexpected(r.error());
    }
    return std::pair{std::move(*l), std::move(*r)};
}

auto combine(const Table& left, const Table& right, const ir::SetOpSpec& spec,
             const EvalContext& ctx, const CoercionService& coercion) -> Result<Table> {
    auto name = set_op_name(spec);
    auto aligned = align_columns(left, right, spec, coercion);
    if (!aligned) {
        return std::unexpected(std::move(aligned.error()).at(name));
    }
    auto& [lhs, rhs] = *aligned;
    const Table* inputs[] = {&lhs, &rhs};
    auto collations = column_collations(inputs, ctx.collation);
    if (!collations) {
        return std::unexpected(std::move(collations.error()).at(name));
    }
    auto key_of = [&](const Row& row) { return make_row_key(row, {}, *collations, ctx.collation); };

    Table out;
    out.schema = lhs.schema;
    const bool all = spec.quantifier == ir::SetQuantifier::All;

    if (spec.op == ir::SetOpKind::Union) {
        if (all) {
            out.rows = std::move(lhs.rows);
            out.rows.insert(out.rows.end(), std::make_move_iterator(rhs.rows.begin()),
                            std::make_move_iterator(rhs.rows.end()));
        } else {
            RowKeySet seen;
            for (auto* rows : {&lhs.rows, &rhs.rows}) {
                for (auto& row : *rows) {
                    auto key = key_of(row);
                    if (!key) {
                        return std::unexpected(std::move(key.error()).at(name));
                    }
                    if (seen.insert(std::move(*key)).second) {
                        out.rows.push_back(std::move(row));
                    }
                }
            }
        }
    } else {
        RowKeyMap<std::size_t> right_counts;
        right_counts.reserve(rhs.num_rows());
        for (const auto& row : rhs.rows) {
            auto key = key_of(row);
            if (!key) {
                return std::unexpected(std::move(key.error()).at(name));
            }
            ++right_counts[std::move(*key)];
        }
        const bool intersect = spec.op == ir::SetOpKind::Intersect;
        RowKeySet emitted;
        for (auto& row : lhs.rows) {
            auto key = key_of(row);
            if (!key) {
                return std::unexpected(std::move(key.error()).at(name));
            }
            auto it = right_counts.find(*key);
            bool in_right = it != right_counts.end() && it->second > 0;
            bool keep = false;
            if (all) {
                // Each right occurrence cancels (EXCEPT) or pairs with
                // (INTERSECT) one left occurrence.
                keep = intersect == in_right;
                if (in_right) {
                    --it->second;
                }
            } else if (intersect == in_right) {
                keep = emitted.insert(std::move(*key)).second;
            }
            if (keep) {
                out.rows.push_back(std::move(row));
            }
        }
    }
    for (std::size_t c = 0; c < out.num_columns(); ++c) {
        if (out.schema.fields[c].type == TypeKind::Null) {
            out.schema.fields[c].type = infer_column_type(out.rows, c);
        }
    }
    spdlog::debug("{}: {} + {} rows -> {} rows", name, left.num_rows(), right.num_rows(),
                  out.num_rows());
    return out;
}

auto combine_all(std::span<const Table> inputs, const ir::SetOpSpec& spec, const EvalContext& ctx,
                 const CoercionService& coercion) -> Result<Table> {
    if (inputs.size() < 2) {
        return make_error(ErrorKind::InvalidPlan,
                          fmt::format("set operation needs at least two inputs, got {}",
                                      inputs.size()),
                          set_op_name(spec));
    }
    auto acc = combine(inputs[0], inputs[1], spec, ctx, coercion);
    for (std::size_t i = 2; acc && i < inputs.size(); ++i) {
        acc = combine(*acc, inputs[i], spec, ctx, coercion);
    }
    return acc;
}

}  // namespace oryx::runtime
