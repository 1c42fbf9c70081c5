#include <oryx/runtime/recursive.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace oryx::runtime {

namespace {

/// Casts the recursive term's rows to the base term's column types.
auto align_to_base(const Schema& base, Table rows, const CoercionService& coercion)
    -> Result<Table> {
    if (rows.num_columns() != base.size()) {
        return make_error(ErrorKind::ColumnSetMismatch,
                          fmt::format("recursive term has {} columns, base term has {}",
                                      rows.num_columns(), base.size()));
    }
    for (auto& row : rows.rows) {
        for (std::size_t c = 0; c < row.size(); ++c) {
            auto target = base[c].type;
            if (target == TypeKind::Null || row[c].is_null() || row[c].kind() == target) {
                continue;
            }
            auto common = coercion.common_supertype(target, row[c].kind());
            if (!common) {
                return std::unexpected(
                    std::move(common.error()).at(fmt::format("column {}", base[c].name)));
            }
            if (*common != target) {
                return make_error(ErrorKind::TypeMismatch,
                                  fmt::format("recursive term produces {} for column {} of type {}",
                                              type_name(row[c].kind()), base[c].name,
                                              type_name(target)));
            }
            auto cast = coercion.cast(row[c], target);
            if (!cast) {
                return std::unexpected(cast.error());
            }
            row[c] = std::move(*cast);
        }
    }
    rows.schema = base;
    return rows;
}

/// Folds the collations found in `candidates` into the state. Returns true
/// when a column's effective collation changed.
auto merge_collations(RecursiveState& state, const Table& candidates, const CollationContext& ctx)
    -> Result<bool> {
    const Table* inputs[] = {&candidates};
    auto found = column_collations(inputs, ctx);
    if (!found) {
        return std::unexpected(found.error());
    }
    if (state.collations.size() < found->size()) {
        state.collations.resize(found->size());
    }
    bool changed = false;
    for (std::size_t c = 0; c < found->size(); ++c) {
        const auto& current = state.collations[c];
        if ((*found)[c].is_default() || (*found)[c] == current) {
            continue;
        }
        auto resolved = ctx.resolve(current.to_string(), (*found)[c].to_string());
        if (!resolved) {
            return std::unexpected(std::move(resolved.error()).at(
                fmt::format("column {}", candidates.schema[c].name)));
        }
        if (*resolved != current) {
            state.collations[c] = std::move(*resolved);
            changed = true;
        }
    }
    return changed;
}

/// Re-keys every accumulated row under the current collations.
auto rebuild_seen(RecursiveState& state, const CollationContext& ctx) -> Result<void> {
    state.seen.clear();
    for (const auto& row : state.result.rows) {
        auto key = make_row_key(row, {}, state.collations, ctx);
        if (!key) {
            return std::unexpected(key.error());
        }
        state.seen.insert(std::move(*key));
    }
    return {};
}

/// Rows of `candidates` whose key was not seen yet; records the new keys.
auto unseen_rows(RecursiveState& state, Table candidates, const CollationContext& ctx)
    -> Result<Table> {
    auto changed = merge_collations(state, candidates, ctx);
    if (!changed) {
        return std::unexpected(changed.error());
    }
    if (*changed) {
        spdlog::debug("recursive: collations changed, re-keying {} rows",
                      state.result.num_rows());
        if (auto r = rebuild_seen(state, ctx); !r) {
            return std::unexpected(r.error());
        }
    }
    Table out;
    out.schema = std::move(candidates.schema);
    for (auto& row : candidates.rows) {
        auto key = make_row_key(row, {}, state.collations, ctx);
        if (!key) {
            return std::unexpected(key.error());
        }
        if (state.seen.insert(std::move(*key)).second) {
            out.rows.push_back(std::move(row));
        }
    }
    return out;
}

}  // namespace

auto evaluate_recursive(Table base, const RecursiveStep& step, ir::SetQuantifier quantifier,
                        std::size_t max_iterations, const EvalContext& ctx,
                        const CoercionService& coercion) -> Result<Table> {
    const bool distinct = quantifier == ir::SetQuantifier::Distinct;
    RecursiveState state;
    state.result.schema = base.schema;
    state.collations.resize(base.schema.size());
    if (distinct) {
        auto fresh = unseen_rows(state, std::move(base), ctx.collation);
        if (!fresh) {
            return std::unexpected(fresh.error());
        }
        base = std::move(*fresh);
    }
    state.result.rows = base.rows;
    state.working = std::move(base);
    spdlog::debug("recursive: base term produced {} rows", state.working.num_rows());

    while (!state.working.rows.empty()) {
        ++state.iteration;
        auto produced = step(state.working, state.iteration);
        if (!produced) {
            return std::unexpected(produced.error());
        }
        auto aligned = align_to_base(state.result.schema, std::move(*produced), coercion);
        if (!aligned) {
            return std::unexpected(aligned.error());
        }
        Table added = std::move(*aligned);
        if (distinct) {
            auto fresh = unseen_rows(state, std::move(added), ctx.collation);
            if (!fresh) {
                return std::unexpected(fresh.error());
            }
            added = std::move(*fresh);
        }
        spdlog::debug("recursive: iteration {} added {} rows", state.iteration, added.num_rows());
        if (added.rows.empty()) {
            break;
        }
        if (state.iteration > max_iterations) {
            return make_error(ErrorKind::NonTerminatingRecursion,
                              fmt::format("recursion still produced rows after {} iterations",
                                          max_iterations),
                              "WITH RECURSIVE");
        }
        state.result.rows.insert(state.result.rows.end(), added.rows.begin(), added.rows.end());
        state.working = std::move(added);
    }
    for (std::size_t c = 0; c < state.result.num_columns(); ++c) {
        if (state.result.schema.fields[c].type == TypeKind::Null) {
            state.result.schema.fields[c].type = infer_column_type(state.result.rows, c);
        }
    }
    return std::move(state.result);
}

}  // namespace oryx::runtime
