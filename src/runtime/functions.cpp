#include <oryx/runtime/functions.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace oryx::runtime {

namespace {

auto lower_name(std::string_view name) -> std::string {
    std::string out(name);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

template <typename Map>
auto find_in(const Map& map, std::string_view name) -> const typename Map::mapped_type* {
    if (auto it = map.find(lower_name(name)); it != map.end()) {
        return &it->second;
    }
    return nullptr;
}

auto arity_error(std::string_view name, std::size_t expected, std::size_t got)
    -> std::unexpected<Error> {
    return make_error(ErrorKind::TypeMismatch,
                      fmt::format("{} expects {} argument(s), got {}", name, expected, got), std::string(name));
}

auto expect_string(std::string_view name, const Value& v) -> Result<const Text*> {
    if (v.kind() != TypeKind::String) {
        return make_error(ErrorKind::TypeMismatch,
                          fmt::format("{} expects STRING, got {}", name, type_name(v.kind())),
                          std::string(name));
    }
    return &v.as_text();
}

auto map_ascii(std::string_view text, bool upper) -> std::string {
    std::string out(text);
    for (auto& ch : out) {
        auto uch = static_cast<unsigned char>(ch);
        if (uch < 0x80) {
            ch = static_cast<char>(upper ? std::toupper(uch) : std::tolower(uch));
        }
    }
    return out;
}

auto fn_coalesce(std::span<const Value> args, const CollationContext&) -> Result<Value> {
    for (const auto& arg : args) {
        if (!arg.is_null()) {
            return arg;
        }
    }
    return Value::null();
}

auto fn_upper(std::span<const Value> args, const CollationContext&) -> Result<Value> {
    if (args.size() != 1) {
        return arity_error("UPPER", 1, args.size());
    }
    if (args[0].is_null()) {
        return Value::null();
    }
    auto text = expect_string("UPPER", args[0]);
    if (!text) {
        return std::unexpected(text.error());
    }
    return Value::string(map_ascii((*text)->text, true), (*text)->collation);
}

auto fn_lower(std::span<const Value> args, const CollationContext&) -> Result<Value> {
    if (args.size() != 1) {
        return arity_error("LOWER", 1, args.size());
    }
    if (args[0].is_null()) {
        return Value::null();
    }
    auto text = expect_string("LOWER", args[0]);
    if (!text) {
        return std::unexpected(text.error());
    }
    return Value::string(map_ascii((*text)->text, false), (*text)->collation);
}

auto fn_length(std::span<const Value> args, const CollationContext&) -> Result<Value> {
    if (args.size() != 1) {
        return arity_error("LENGTH", 1, args.size());
    }
    const auto& v = args[0];
    if (v.is_null()) {
        return Value::null();
    }
    if (v.kind() == TypeKind::Bytes) {
        return Value::int64(static_cast<std::int64_t>(v.as_bytes().data.size()));
    }
    auto text = expect_string("LENGTH", v);
    if (!text) {
        return std::unexpected(text.error());
    }
    return Value::int64(static_cast<std::int64_t>(decode_utf8((*text)->text).size()));
}

auto fn_concat(std::span<const Value> args, const CollationContext&) -> Result<Value> {
    std::string out;
    std::string collation;
    for (const auto& arg : args) {
        if (arg.is_null()) {
            return Value::null();
        }
        auto text = expect_string("CONCAT", arg);
        if (!text) {
            return std::unexpected(text.error());
        }
        out += (*text)->text;
        if (collation.empty()) {
            collation = (*text)->collation;
        }
    }
    return Value::string(std::move(out), std::move(collation));
}

auto fn_abs(std::span<const Value> args, const CollationContext&) -> Result<Value> {
    if (args.size() != 1) {
        return arity_error("ABS", 1, args.size());
    }
    const auto& v = args[0];
    switch (v.kind()) {
        case TypeKind::Null:
            return Value::null();
        case TypeKind::Int64:
            if (v.as_int64() == std::numeric_limits<std::int64_t>::min()) {
                return make_error(ErrorKind::Overflow, "ABS overflows INT64", "ABS");
            }
            return Value::int64(v.as_int64() < 0 ? -v.as_int64() : v.as_int64());
        case TypeKind::Double:
            return Value::float64(std::fabs(v.as_double()));
        case TypeKind::Numeric: {
            auto n = v.as_numeric();
            if (n.units < 0) {
                n.units = -n.units;
            }
            return Value::numeric(n);
        }
        default:
            return make_error(ErrorKind::TypeMismatch,
                              fmt::format("ABS expects a numeric argument, got {}",
                                          type_name(v.kind())),
                              "ABS");
    }
}

auto fn_array_length(std::span<const Value> args, const CollationContext&) -> Result<Value> {
    if (args.size() != 1) {
        return arity_error("ARRAY_LENGTH", 1, args.size());
    }
    if (args[0].is_null()) {
        return Value::null();
    }
    if (args[0].kind() != TypeKind::Array) {
        return make_error(ErrorKind::TypeMismatch, "ARRAY_LENGTH expects an ARRAY", "ARRAY_LENGTH");
    }
    return Value::int64(static_cast<std::int64_t>(args[0].elements().size()));
}

auto fn_generate_array(std::span<const Value> args, const CollationContext&) -> Result<Value> {
    constexpr std::int64_t kMaxElements = 1'000'000;
    if (args.size() != 2 && args.size() != 3) {
        return arity_error("GENERATE_ARRAY", 2, args.size());
    }
    for (const auto& arg : args) {
        if (arg.is_null()) {
            return Value::null();
        }
        if (arg.kind() != TypeKind::Int64) {
            return make_error(ErrorKind::TypeMismatch, "GENERATE_ARRAY expects INT64 arguments",
                              "GENERATE_ARRAY");
        }
    }
    std::int64_t start = args[0].as_int64();
    std::int64_t end = args[1].as_int64();
    std::int64_t step = args.size() == 3 ? args[2].as_int64() : 1;
    if (step == 0) {
        return make_error(ErrorKind::TypeMismatch, "GENERATE_ARRAY step cannot be 0",
                          "GENERATE_ARRAY");
    }
    std::vector<Value> out;
    for (std::int64_t v = start; step > 0 ? v <= end : v >= end; v += step) {
        if (static_cast<std::int64_t>(out.size()) >= kMaxElements) {
            return make_error(ErrorKind::Overflow, "GENERATE_ARRAY produces too many elements",
                              "GENERATE_ARRAY");
        }
        out.push_back(Value::int64(v));
        std::int64_t next = 0;
        if (__builtin_add_overflow(v, step, &next)) {
            break;
        }
    }
    return Value::array(std::move(out));
}

}  // namespace

void FunctionRegistry::register_scalar(std::string_view name, ScalarFn fn) {
    scalars_.insert_or_assign(lower_name(name), std::move(fn));
}

void FunctionRegistry::register_aggregate(std::string_view name, AccumulatorFactory factory) {
    aggregates_.insert_or_assign(lower_name(name), std::move(factory));
}

void FunctionRegistry::register_table(std::string_view name, TableFn fn) {
    tables_.insert_or_assign(lower_name(name), std::move(fn));
}

auto FunctionRegistry::find_scalar(std::string_view name) const -> const ScalarFn* {
    return find_in(scalars_, name);
}

auto FunctionRegistry::find_aggregate(std::string_view name) const -> const AccumulatorFactory* {
    return find_in(aggregates_, name);
}

auto FunctionRegistry::find_table(std::string_view name) const -> const TableFn* {
    return find_in(tables_, name);
}

auto FunctionRegistry::contains(std::string_view name) const -> bool {
    return find_scalar(name) != nullptr || find_aggregate(name) != nullptr ||
           find_table(name) != nullptr;
}

auto FunctionRegistry::describe() const -> std::string {
    std::vector<std::string_view> names;
    names.reserve(size());
    for (const auto& entry : scalars_) {
        names.emplace_back(entry.first);
    }
    for (const auto& entry : aggregates_) {
        names.emplace_back(entry.first);
    }
    for (const auto& entry : tables_) {
        names.emplace_back(entry.first);
    }
    if (names.empty()) {
        return "<none>";
    }
    std::sort(names.begin(), names.end());
    return fmt::format("{}", fmt::join(names, ", "));
}

void register_builtins(FunctionRegistry& registry) {
    registry.register_scalar("coalesce", fn_coalesce);
    registry.register_scalar("upper", fn_upper);
    registry.register_scalar("lower", fn_lower);
    registry.register_scalar("length", fn_length);
    registry.register_scalar("concat", fn_concat);
    registry.register_scalar("abs", fn_abs);
    registry.register_scalar("array_length", fn_array_length);
    registry.register_scalar("generate_array", fn_generate_array);
}

auto builtin_functions() -> const FunctionRegistry& {
    static const FunctionRegistry registry = [] {
        FunctionRegistry r;
        register_builtins(r);
        return r;
    }();
    return registry;
}

}  // namespace oryx::runtime
