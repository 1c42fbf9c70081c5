#pragma once

#include <oryx/core/collation.hpp>
#include <oryx/core/error.hpp>
#include <oryx/core/table.hpp>
#include <oryx/core/value.hpp>

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace oryx::runtime {

/// Scalar function: arguments are already evaluated.
using ScalarFn = std::function<Result<Value>(std::span<const Value>, const CollationContext&)>;

/// Per-group aggregate state. `init` resets, `accumulate` sees each
/// argument value in row order, `finalize` may be called repeatedly.
class Accumulator {
   public:
    virtual ~Accumulator() = default;

    virtual void init() = 0;
    [[nodiscard]] virtual auto accumulate(const Value& value) -> Result<void> = 0;
    [[nodiscard]] virtual auto finalize() const -> Result<Value> = 0;
};

using AccumulatorFactory = std::function<std::unique_ptr<Accumulator>()>;

/// Table-valued function: table arguments, then scalar arguments.
using TableFn = std::function<Result<Table>(std::span<const Table>, std::span<const Value>)>;

/// Function library consulted by the evaluator.
///
/// Functions are registered by name (case-insensitive) and looked up at
/// evaluation time.
class FunctionRegistry {
   public:
    FunctionRegistry() = default;

    void register_scalar(std::string_view name, ScalarFn fn);
    void register_aggregate(std::string_view name, AccumulatorFactory factory);
    void register_table(std::string_view name, TableFn fn);

    [[nodiscard]] auto find_scalar(std::string_view name) const -> const ScalarFn*;
    [[nodiscard]] auto find_aggregate(std::string_view name) const -> const AccumulatorFactory*;
    [[nodiscard]] auto find_table(std::string_view name) const -> const TableFn*;

    /// Check whether any kind of function is registered under `name`.
    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /// Number of registered functions.
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return scalars_.size() + aggregates_.size() + tables_.size();
    }

    /// Sorted names, comma separated, for "available: ..." messages.
    [[nodiscard]] auto describe() const -> std::string;

   private:
    std::unordered_map<std::string, ScalarFn> scalars_;
    std::unordered_map<std::string, AccumulatorFactory> aggregates_;
    std::unordered_map<std::string, TableFn> tables_;
};

/// COALESCE, UPPER, LOWER, LENGTH, CONCAT, ABS, ARRAY_LENGTH, GENERATE_ARRAY.
void register_builtins(FunctionRegistry& registry);

/// Shared registry holding only the built-ins.
[[nodiscard]] auto builtin_functions() -> const FunctionRegistry&;

}  // namespace oryx::runtime
