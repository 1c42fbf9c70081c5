#include <oryx/runtime/coercion.hpp>

#include <fmt/format.h>

namespace oryx::runtime {

namespace {

/// Widening rank within the numeric family.
auto numeric_rank(TypeKind kind) -> int {
    switch (kind) {
        case TypeKind::Int64:
            return 0;
        case TypeKind::Numeric:
            return 1;
        case TypeKind::Double:
            return 2;
        default:
            return -1;
    }
}

}  // namespace

auto DefaultCoercion::common_supertype(TypeKind lhs, TypeKind rhs) const -> Result<TypeKind> {
    if (lhs == rhs) {
        return lhs;
    }
    if (lhs == TypeKind::Null) {
        return rhs;
    }
    if (rhs == TypeKind::Null) {
        return lhs;
    }
    int l = numeric_rank(lhs);
    int r = numeric_rank(rhs);
    if (l >= 0 && r >= 0) {
        return l > r ? lhs : rhs;
    }
    return make_error(ErrorKind::TypeMismatch,
                      fmt::format("no common supertype for {} and {}", type_name(lhs),
                                  type_name(rhs)));
}

auto DefaultCoercion::cast(const Value& value, TypeKind target) const -> Result<Value> {
    if (value.is_null() || value.kind() == target || target == TypeKind::Null) {
        return value;
    }
    switch (target) {
        case TypeKind::Numeric:
            if (value.kind() == TypeKind::Int64) {
                return Value::numeric(Numeric::from_int(value.as_int64()));
            }
            break;
        case TypeKind::Double:
            if (value.kind() == TypeKind::Int64) {
                return Value::float64(static_cast<double>(value.as_int64()));
            }
            if (value.kind() == TypeKind::Numeric) {
                return Value::float64(value.as_numeric().to_double());
            }
            break;
        default:
            break;
    }
    return make_error(ErrorKind::TypeMismatch,
                      fmt::format("cannot coerce {} to {}", type_name(value.kind()),
                                  type_name(target)));
}

auto default_coercion() -> const CoercionService& {
    static const DefaultCoercion coercion;
    return coercion;
}

}  // namespace oryx::runtime
