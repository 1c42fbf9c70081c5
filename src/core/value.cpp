#include <oryx/core/error.hpp>
#include <oryx/core/value.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

namespace oryx {

namespace {

const std::vector<Value> kNoValues;
const std::vector<std::string> kNoNames;

auto format_time(Time t) -> std::string {
    std::int64_t micros = t.micros;
    auto hours = micros / 3'600'000'000LL;
    micros %= 3'600'000'000LL;
    auto minutes = micros / 60'000'000LL;
    micros %= 60'000'000LL;
    auto seconds = micros / 1'000'000LL;
    micros %= 1'000'000LL;
    if (micros == 0) {
        return fmt::format("{:02}:{:02}:{:02}", hours, minutes, seconds);
    }
    return fmt::format("{:02}:{:02}:{:02}.{:06}", hours, minutes, seconds, micros);
}

auto format_double(double v) -> std::string {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v > 0 ? "inf" : "-inf";
    }
    return fmt::format("{:g}", v);
}

auto quote_if_string(const Value& value) -> std::string {
    if (value.kind() == TypeKind::String) {
        return fmt::format("\"{}\"", value.as_text().text);
    }
    return value.to_string();
}

}  // namespace

auto type_name(TypeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case TypeKind::Null:
            return "NULL";
        case TypeKind::Bool:
            return "BOOL";
        case TypeKind::Int64:
            return "INT64";
        case TypeKind::Double:
            return "DOUBLE";
        case TypeKind::Numeric:
            return "NUMERIC";
        case TypeKind::String:
            return "STRING";
        case TypeKind::Bytes:
            return "BYTES";
        case TypeKind::Date:
            return "DATE";
        case TypeKind::Time:
            return "TIME";
        case TypeKind::Timestamp:
            return "TIMESTAMP";
        case TypeKind::Interval:
            return "INTERVAL";
        case TypeKind::Array:
            return "ARRAY";
        case TypeKind::Struct:
            return "STRUCT";
        case TypeKind::Json:
            return "JSON";
    }
    return "UNKNOWN";
}

auto error_kind_name(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::TypeMismatch:
            return "type mismatch";
        case ErrorKind::CollationConflict:
            return "collation conflict";
        case ErrorKind::InvalidJoinShape:
            return "invalid join";
        case ErrorKind::InvalidRecursiveShape:
            return "invalid recursive query";
        case ErrorKind::ColumnSetMismatch:
            return "column set mismatch";
        case ErrorKind::DivisionByZero:
            return "division by zero";
        case ErrorKind::IndexOutOfRange:
            return "index out of range";
        case ErrorKind::NonTerminatingRecursion:
            return "non-terminating recursion";
        case ErrorKind::Overflow:
            return "overflow";
        case ErrorKind::InvalidPlan:
            return "invalid plan";
        case ErrorKind::Io:
            return "i/o error";
    }
    return "error";
}

auto format_error(const Error& error) -> std::string {
    if (error.op.empty()) {
        return fmt::format("{}: {}", error_kind_name(error.kind), error.message);
    }
    return fmt::format("{}: {} (in {})", error_kind_name(error.kind), error.message, error.op);
}

auto Numeric::parse(std::string_view text) -> std::optional<Numeric> {
    if (text.empty()) {
        return std::nullopt;
    }
    bool negative = false;
    std::size_t pos = 0;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = text[pos] == '-';
        ++pos;
    }
    int128_t whole = 0;
    int128_t frac = 0;
    int frac_digits = 0;
    bool any_digit = false;
    bool in_fraction = false;
    constexpr int128_t kMaxWhole = static_cast<int128_t>(1'000'000'000'000'000'000LL) *
                                   static_cast<int128_t>(100'000'000'000LL);  // 10^29
    for (; pos < text.size(); ++pos) {
        char ch = text[pos];
        if (ch == '.') {
            if (in_fraction) {
                return std::nullopt;
            }
            in_fraction = true;
            continue;
        }
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
        any_digit = true;
        if (in_fraction) {
            if (frac_digits == kScale) {
                return std::nullopt;
            }
            frac = frac * 10 + (ch - '0');
            ++frac_digits;
        } else {
            whole = whole * 10 + (ch - '0');
            if (whole >= kMaxWhole) {
                return std::nullopt;
            }
        }
    }
    if (!any_digit) {
        return std::nullopt;
    }
    for (; frac_digits < kScale; ++frac_digits) {
        frac *= 10;
    }
    int128_t units = whole * kUnit + frac;
    return Numeric{negative ? -units : units};
}

auto Numeric::to_double() const noexcept -> double {
    return static_cast<double>(static_cast<long double>(units) / static_cast<long double>(kUnit));
}

auto Numeric::to_string() const -> std::string {
    int128_t v = units;
    bool negative = v < 0;
    if (negative) {
        v = -v;
    }
    int128_t whole = v / kUnit;
    auto frac = static_cast<std::int64_t>(v % kUnit);
    std::string digits;
    do {
        digits.push_back(static_cast<char>('0' + static_cast<int>(whole % 10)));
        whole /= 10;
    } while (whole != 0);
    if (negative) {
        digits.push_back('-');
    }
    std::reverse(digits.begin(), digits.end());
    if (frac == 0) {
        return digits;
    }
    std::string fraction = fmt::format("{:09}", frac);
    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }
    return digits + "." + fraction;
}

auto Value::array(std::vector<Value> elements) -> Value {
    return Value{ValueVariant{
        ArrayPtr{std::make_shared<const ArrayData>(ArrayData{std::move(elements)})}}};
}

auto Value::structure(std::vector<std::pair<std::string, Value>> fields) -> Value {
    StructData data;
    data.names.reserve(fields.size());
    data.values.reserve(fields.size());
    for (auto& [name, value] : fields) {
        data.names.push_back(std::move(name));
        data.values.push_back(std::move(value));
    }
    return Value{ValueVariant{StructPtr{std::make_shared<const StructData>(std::move(data))}}};
}

auto Value::elements() const -> const std::vector<Value>& {
    if (const auto* arr = std::get_if<ArrayPtr>(&data_); arr != nullptr && *arr != nullptr) {
        return (*arr)->elements;
    }
    return kNoValues;
}

auto Value::field_names() const -> const std::vector<std::string>& {
    if (const auto* st = std::get_if<StructPtr>(&data_); st != nullptr && *st != nullptr) {
        return (*st)->names;
    }
    return kNoNames;
}

auto Value::field_values() const -> const std::vector<Value>& {
    if (const auto* st = std::get_if<StructPtr>(&data_); st != nullptr && *st != nullptr) {
        return (*st)->values;
    }
    return kNoValues;
}

auto Value::field(std::string_view name) const -> const Value* {
    const auto& names = field_names();
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) {
            return &field_values()[i];
        }
    }
    return nullptr;
}

auto Value::to_string() const -> std::string {
    return std::visit(
        [this](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return "NULL";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, double>) {
                return format_double(v);
            } else if constexpr (std::is_same_v<T, Numeric>) {
                return v.to_string();
            } else if constexpr (std::is_same_v<T, Text>) {
                return v.text;
            } else if constexpr (std::is_same_v<T, Bytes>) {
                std::string out = "b'";
                for (unsigned char ch : v.data) {
                    if (ch >= 0x20 && ch < 0x7f && ch != '\'' && ch != '\\') {
                        out.push_back(static_cast<char>(ch));
                    } else {
                        out += fmt::format("\\x{:02x}", ch);
                    }
                }
                out.push_back('\'');
                return out;
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else if constexpr (std::is_same_v<T, Time>) {
                return format_time(v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else if constexpr (std::is_same_v<T, Interval>) {
                return fmt::format("{} months {} days {} us", v.months, v.days, v.micros);
            } else if constexpr (std::is_same_v<T, ArrayPtr>) {
                std::string out = "[";
                const auto& elems = elements();
                for (std::size_t i = 0; i < elems.size(); ++i) {
                    if (i > 0) {
                        out.append(", ");
                    }
                    out.append(quote_if_string(elems[i]));
                }
                out.push_back(']');
                return out;
            } else if constexpr (std::is_same_v<T, StructPtr>) {
                std::string out = "{";
                const auto& names = field_names();
                const auto& values = field_values();
                for (std::size_t i = 0; i < values.size(); ++i) {
                    if (i > 0) {
                        out.append(", ");
                    }
                    out.append(names[i].empty() ? fmt::format("_{}", i + 1) : names[i]);
                    out.append(": ");
                    out.append(quote_if_string(values[i]));
                }
                out.push_back('}');
                return out;
            } else {
                return v.text;
            }
        },
        data_);
}

auto is_numeric_kind(TypeKind kind) noexcept -> bool {
    return kind == TypeKind::Int64 || kind == TypeKind::Double || kind == TypeKind::Numeric;
}

auto numeric_as_long_double(const Value& value) -> long double {
    switch (value.kind()) {
        case TypeKind::Int64:
            return static_cast<long double>(value.as_int64());
        case TypeKind::Double:
            return static_cast<long double>(value.as_double());
        case TypeKind::Numeric:
            return static_cast<long double>(value.as_numeric().units) /
                   static_cast<long double>(Numeric::kUnit);
        default:
            return std::numeric_limits<long double>::quiet_NaN();
    }
}

auto format_date(Date date) -> std::string {
    using namespace std::chrono;
    sys_days day = sys_days{days{date.days}};
    year_month_day ymd{day};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto format_timestamp(Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    auto tod = tp - day;
    hh_mm_ss<nanoseconds> hms{tod};
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:09}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count(),
                       hms.subseconds().count());
}

}  // namespace oryx
