#pragma once

#include <oryx/core/time.hpp>

#include <compare>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace oryx {

__extension__ using int128_t = __int128;

/// Static type tags. Nested element types are not tracked; arrays and structs
/// carry their shape in the values themselves.
enum class TypeKind : std::uint8_t {
    Null,
    Bool,
    Int64,
    Double,
    Numeric,
    String,
    Bytes,
    Date,
    Time,
    Timestamp,
    Interval,
    Array,
    Struct,
    Json,
};

[[nodiscard]] auto type_name(TypeKind kind) noexcept -> std::string_view;

/// Fixed-point decimal with 38 digits of precision and a scale of 9.
struct Numeric {
    static constexpr int kScale = 9;
    static constexpr std::int64_t kUnit = 1'000'000'000;

    int128_t units = 0;

    [[nodiscard]] static auto from_int(std::int64_t value) noexcept -> Numeric {
        return Numeric{static_cast<int128_t>(value) * kUnit};
    }
    /// Parses "[-]digits[.digits]"; at most nine fractional digits.
    [[nodiscard]] static auto parse(std::string_view text) -> std::optional<Numeric>;

    [[nodiscard]] auto to_double() const noexcept -> double;
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const Numeric& other) const noexcept -> bool { return units == other.units; }
    auto operator<(const Numeric& other) const noexcept -> bool { return units < other.units; }
};

/// Text value with an optional collation specification ("und:ci", "en_US").
struct Text {
    std::string text;
    std::string collation;
};

struct Bytes {
    std::string data;
    auto operator<=>(const Bytes&) const = default;
};

struct Json {
    std::string text;
};

struct Null {
    auto operator==(const Null&) const -> bool = default;
};

class Value;
struct ArrayData;
struct StructData;
using ArrayPtr = std::shared_ptr<const ArrayData>;
using StructPtr = std::shared_ptr<const StructData>;

using ValueVariant = std::variant<Null, bool, std::int64_t, double, Numeric, Text, Bytes, Date, Time,
                                  Timestamp, Interval, ArrayPtr, StructPtr, Json>;

/// Immutable SQL value. The alternative order of ValueVariant matches TypeKind.
class Value {
   public:
    Value() = default;

    [[nodiscard]] static auto null() -> Value { return Value{}; }
    [[nodiscard]] static auto boolean(bool v) -> Value { return Value{ValueVariant{v}}; }
    [[nodiscard]] static auto int64(std::int64_t v) -> Value { return Value{ValueVariant{v}}; }
    [[nodiscard]] static auto float64(double v) -> Value { return Value{ValueVariant{v}}; }
    [[nodiscard]] static auto numeric(Numeric v) -> Value { return Value{ValueVariant{v}}; }
    [[nodiscard]] static auto string(std::string text, std::string collation = {}) -> Value {
        return Value{ValueVariant{Text{std::move(text), std::move(collation)}}};
    }
    [[nodiscard]] static auto bytes(std::string data) -> Value {
        return Value{ValueVariant{Bytes{std::move(data)}}};
    }
    [[nodiscard]] static auto date(Date v) -> Value { return Value{ValueVariant{v}}; }
    [[nodiscard]] static auto time(Time v) -> Value { return Value{ValueVariant{v}}; }
    [[nodiscard]] static auto timestamp(Timestamp v) -> Value { return Value{ValueVariant{v}}; }
    [[nodiscard]] static auto interval(Interval v) -> Value { return Value{ValueVariant{v}}; }
    [[nodiscard]] static auto array(std::vector<Value> elements) -> Value;
    [[nodiscard]] static auto structure(std::vector<std::pair<std::string, Value>> fields) -> Value;
    [[nodiscard]] static auto json(std::string text) -> Value {
        return Value{ValueVariant{Json{std::move(text)}}};
    }

    [[nodiscard]] auto kind() const noexcept -> TypeKind {
        return static_cast<TypeKind>(data_.index());
    }
    [[nodiscard]] auto is_null() const noexcept -> bool {
        return std::holds_alternative<Null>(data_);
    }
    [[nodiscard]] auto variant() const noexcept -> const ValueVariant& { return data_; }

    [[nodiscard]] auto as_bool() const -> bool { return std::get<bool>(data_); }
    [[nodiscard]] auto as_int64() const -> std::int64_t { return std::get<std::int64_t>(data_); }
    [[nodiscard]] auto as_double() const -> double { return std::get<double>(data_); }
    [[nodiscard]] auto as_numeric() const -> const Numeric& { return std::get<Numeric>(data_); }
    [[nodiscard]] auto as_text() const -> const Text& { return std::get<Text>(data_); }
    [[nodiscard]] auto as_bytes() const -> const Bytes& { return std::get<Bytes>(data_); }
    [[nodiscard]] auto as_date() const -> Date { return std::get<Date>(data_); }
    [[nodiscard]] auto as_time() const -> Time { return std::get<Time>(data_); }
    [[nodiscard]] auto as_timestamp() const -> Timestamp { return std::get<Timestamp>(data_); }
    [[nodiscard]] auto as_interval() const -> const Interval& { return std::get<Interval>(data_); }
    [[nodiscard]] auto as_json() const -> const Json& { return std::get<Json>(data_); }

    /// Array elements; empty for a non-array value.
    [[nodiscard]] auto elements() const -> const std::vector<Value>&;
    /// Struct field names and values, positionally aligned.
    [[nodiscard]] auto field_names() const -> const std::vector<std::string>&;
    [[nodiscard]] auto field_values() const -> const std::vector<Value>&;
    /// Struct field by name, or nullptr.
    [[nodiscard]] auto field(std::string_view name) const -> const Value*;

    /// Human readable rendering: NULL, literals, [a, b], {x: 1}.
    [[nodiscard]] auto to_string() const -> std::string;

   private:
    explicit Value(ValueVariant data) : data_(std::move(data)) {}

    ValueVariant data_;
};

using Row = std::vector<Value>;

struct ArrayData {
    std::vector<Value> elements;
};

struct StructData {
    std::vector<std::string> names;
    std::vector<Value> values;
};

/// Numeric view used for cross-type comparison and arithmetic.
[[nodiscard]] auto is_numeric_kind(TypeKind kind) noexcept -> bool;
[[nodiscard]] auto numeric_as_long_double(const Value& value) -> long double;

[[nodiscard]] auto format_date(Date date) -> std::string;
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

}  // namespace oryx
