#pragma once

#include <oryx/core/error.hpp>
#include <oryx/core/table.hpp>
#include <oryx/ir/node.hpp>
#include <oryx/runtime/eval.hpp>

#include <functional>
#include <optional>
#include <string>

namespace oryx::runtime {

/// Right-hand input of a join.
///
/// An uncorrelated producer is asked once with null params. A correlated
/// (lateral) producer is asked once per left row with that row bound.
class RowProducer {
   public:
    virtual ~RowProducer() = default;

    [[nodiscard]] virtual auto correlated() const noexcept -> bool = 0;
    [[nodiscard]] virtual auto produce(const LateralParams* params) -> Result<Table> = 0;
};

/// Materialized, uncorrelated right input.
class TableProducer final : public RowProducer {
   public:
    explicit TableProducer(Table table) : table_(std::move(table)) {}

    [[nodiscard]] auto correlated() const noexcept -> bool override { return false; }
    [[nodiscard]] auto produce(const LateralParams* /*params*/) -> Result<Table> override {
        return table_;
    }

   private:
    Table table_;
};

/// Right input computed by a callback, e.g. a plan subtree evaluated with the
/// left row pushed onto the outer reference stack.
class FunctionProducer final : public RowProducer {
   public:
    using Fn = std::function<Result<Table>(const LateralParams*)>;

    FunctionProducer(Fn fn, bool correlated) : fn_(std::move(fn)), correlated_(correlated) {}

    [[nodiscard]] auto correlated() const noexcept -> bool override { return correlated_; }
    [[nodiscard]] auto produce(const LateralParams* params) -> Result<Table> override {
        return fn_(params);
    }

   private:
    Fn fn_;
    bool correlated_;
};

/// Joins `left` with the rows of `right`.
///
/// Output columns are the left columns then the right columns; with USING or
/// NATURAL the merged key columns come first. Semi and anti joins output only
/// the preserved side. Conditions are evaluated over the left columns followed
/// by the right columns, and only TRUE matches.
[[nodiscard]] auto join(const Table& left, RowProducer& right, const ir::JoinSpec& spec,
                        const EvalContext& ctx) -> Result<Table>;

/// Convenience overload for two materialized inputs.
[[nodiscard]] auto join(const Table& left, const Table& right, const ir::JoinSpec& spec,
                        const EvalContext& ctx) -> Result<Table>;

/// One row per element of `array`, in order, with an optional zero-based
/// offset column. NULL and empty arrays yield no rows.
[[nodiscard]] auto unnest(const Value& array, const std::string& alias,
                          const std::optional<std::string>& offset_alias) -> Result<Table>;

}  // namespace oryx::runtime
