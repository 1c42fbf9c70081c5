#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace oryx {

/// Error categories surfaced by the evaluation core.
enum class ErrorKind : std::uint8_t {
    TypeMismatch,
    CollationConflict,
    InvalidJoinShape,
    InvalidRecursiveShape,
    ColumnSetMismatch,
    DivisionByZero,
    IndexOutOfRange,
    NonTerminatingRecursion,
    Overflow,
    InvalidPlan,
    Io,
};

/// Structured evaluation error: kind + message + offending operator.
struct Error {
    ErrorKind kind = ErrorKind::InvalidPlan;
    std::string message;
    std::string op;

    /// Attach the operator name if none was recorded yet.
    auto at(std::string_view name) && -> Error {
        if (op.empty()) {
            op = std::string(name);
        }
        return std::move(*this);
    }
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto error_kind_name(ErrorKind kind) noexcept -> std::string_view;

/// "kind: message (in op)" rendering for logs and the CLI.
[[nodiscard]] auto format_error(const Error& error) -> std::string;

[[nodiscard]] inline auto make_error(ErrorKind kind, std::string message, std::string op = {})
    -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message), .op = std::move(op)});
}

}  // namespace oryx
