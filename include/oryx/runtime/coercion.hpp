#pragma once

#include <oryx/core/error.hpp>
#include <oryx/core/value.hpp>

namespace oryx::runtime {

/// Type coercion collaborator used to reconcile set operation inputs.
class CoercionService {
   public:
    virtual ~CoercionService() = default;

    [[nodiscard]] virtual auto common_supertype(TypeKind lhs, TypeKind rhs) const
        -> Result<TypeKind> = 0;

    /// Converts `value` to `target`; NULL stays NULL.
    [[nodiscard]] virtual auto cast(const Value& value, TypeKind target) const -> Result<Value> = 0;
};

/// NULL coerces to anything; INT64 widens to NUMERIC, both widen to DOUBLE.
class DefaultCoercion final : public CoercionService {
   public:
    [[nodiscard]] auto common_supertype(TypeKind lhs, TypeKind rhs) const
        -> Result<TypeKind> override;
    [[nodiscard]] auto cast(const Value& value, TypeKind target) const -> Result<Value> override;
};

[[nodiscard]] auto default_coercion() -> const CoercionService&;

}  // namespace oryx::runtime
