#pragma once

#include <oryx/core/collation.hpp>
#include <oryx/core/error.hpp>
#include <oryx/core/value.hpp>

#include <compare>
#include <cstdint>
#include <span>

namespace oryx {

/// SQL three-valued truth value.
enum class TriBool : std::uint8_t {
    False,
    True,
    Null,
};

/// Result of a value comparison. NULL or NaN operands are Incomparable.
enum class Ordering : std::uint8_t {
    Less,
    Equal,
    Greater,
    Incomparable,
};

/// Supported comparison operators.
enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

[[nodiscard]] constexpr auto to_tri(bool value) noexcept -> TriBool {
    return value ? TriBool::True : TriBool::False;
}

[[nodiscard]] constexpr auto tri_not(TriBool v) noexcept -> TriBool {
    switch (v) {
        case TriBool::True:
            return TriBool::False;
        case TriBool::False:
            return TriBool::True;
        case TriBool::Null:
            return TriBool::Null;
    }
    return TriBool::Null;
}

[[nodiscard]] constexpr auto tri_and(TriBool a, TriBool b) noexcept -> TriBool {
    if (a == TriBool::False || b == TriBool::False) {
        return TriBool::False;
    }
    if (a == TriBool::Null || b == TriBool::Null) {
        return TriBool::Null;
    }
    return TriBool::True;
}

[[nodiscard]] constexpr auto tri_or(TriBool a, TriBool b) noexcept -> TriBool {
    if (a == TriBool::True || b == TriBool::True) {
        return TriBool::True;
    }
    if (a == TriBool::Null || b == TriBool::Null) {
        return TriBool::Null;
    }
    return TriBool::False;
}

/// Boolean SQL value for a truth value (NULL for unknown).
[[nodiscard]] auto tri_to_value(TriBool v) -> Value;

/// Value comparison. Structs, arrays and JSON are not orderable (TypeMismatch);
/// values of unrelated types are a TypeMismatch.
[[nodiscard]] auto compare(const Value& lhs, const Value& rhs, const CollationContext& ctx)
    -> Result<Ordering>;

/// Three-valued equality, including the positional struct/array rule.
[[nodiscard]] auto equals3vl(const Value& lhs, const Value& rhs, const CollationContext& ctx)
    -> Result<TriBool>;

/// `lhs op rhs` under three-valued logic. NaN compares False except for `!=`.
[[nodiscard]] auto compare3vl(CompareOp op, const Value& lhs, const Value& rhs,
                              const CollationContext& ctx) -> Result<TriBool>;

/// `lhs IS DISTINCT FROM rhs`: NULLs are not distinct from each other and NaN
/// is not distinct from NaN. Never NULL.
[[nodiscard]] auto is_distinct_from(const Value& lhs, const Value& rhs,
                                    const CollationContext& ctx) -> Result<bool>;

/// Total order for sorting: NULL < NaN < -Inf < ... < +Inf; FALSE < TRUE.
[[nodiscard]] auto order_compare(const Value& lhs, const Value& rhs, const CollationContext& ctx)
    -> Result<std::weak_ordering>;

/// `operand IN (list)` under three-valued logic.
[[nodiscard]] auto in_list(const Value& operand, std::span<const Value> list,
                           const CollationContext& ctx) -> Result<TriBool>;

/// `text LIKE pattern` with `%`, `_` and backslash escapes.
[[nodiscard]] auto like(const Value& text, const Value& pattern, const CollationContext& ctx)
    -> Result<TriBool>;

}  // namespace oryx
