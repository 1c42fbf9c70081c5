#include <oryx/core/hash.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <string>

namespace oryx {

namespace {

constexpr std::size_t kNullHash = 0x6e756c6cULL;
constexpr std::size_t kNanHash = 0x7ff8000000000000ULL;

void hash_combine(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

/// Exact Int64 for integral numerics in range.
auto as_exact_int(const Value& value) -> std::optional<std::int64_t> {
    switch (value.kind()) {
        case TypeKind::Int64:
            return value.as_int64();
        case TypeKind::Numeric: {
            auto units = value.as_numeric().units;
            if (units % Numeric::kUnit != 0) {
                return std::nullopt;
            }
            auto whole = units / Numeric::kUnit;
            if (whole < std::numeric_limits<std::int64_t>::min() ||
                whole > std::numeric_limits<std::int64_t>::max()) {
                return std::nullopt;
            }
            return static_cast<std::int64_t>(whole);
        }
        case TypeKind::Double: {
            double d = value.as_double();
            // 2^63 is exactly representable; anything at or above it overflows.
            if (!std::isfinite(d) || d != std::trunc(d) || d < -9223372036854775808.0 ||
                d >= 9223372036854775808.0) {
                return std::nullopt;
            }
            return static_cast<std::int64_t>(d);
        }
        default:
            return std::nullopt;
    }
}

auto effective_spec(const Text& text, const CollationSpec& spec) -> CollationSpec {
    if (!spec.is_default()) {
        return spec;
    }
    return CollationSpec::parse(text.collation);
}

}  // namespace

auto canonical_value(const Value& value, const CollationSpec& spec, const CollationContext& ctx)
    -> Result<Value> {
    switch (value.kind()) {
        case TypeKind::Null:
        case TypeKind::Bool:
        case TypeKind::Bytes:
        case TypeKind::Date:
        case TypeKind::Time:
        case TypeKind::Timestamp:
            return value;
        case TypeKind::Int64:
        case TypeKind::Numeric:
        case TypeKind::Double: {
            if (auto exact = as_exact_int(value)) {
                return Value::int64(*exact);
            }
            if (value.kind() == TypeKind::Double) {
                double d = value.as_double();
                if (std::isnan(d)) {
                    return Value::float64(std::numeric_limits<double>::quiet_NaN());
                }
            }
            return value;
        }
        case TypeKind::String: {
            const auto& text = value.as_text();
            auto effective = effective_spec(text, spec);
            return Value::string(ctx.fold(text.text, effective));
        }
        case TypeKind::Interval: {
            auto micros = value.as_interval().ordering_micros();
            return Value::interval(Interval{.months = 0,
                                            .days = 0,
                                            .micros = static_cast<std::int64_t>(micros)});
        }
        case TypeKind::Array: {
            std::vector<Value> elements;
            elements.reserve(value.elements().size());
            for (const auto& element : value.elements()) {
                auto canon = canonical_value(element, CollationSpec{}, ctx);
                if (!canon) {
                    return canon;
                }
                elements.push_back(std::move(*canon));
            }
            return Value::array(std::move(elements));
        }
        case TypeKind::Struct: {
            std::vector<std::pair<std::string, Value>> fields;
            fields.reserve(value.field_values().size());
            for (const auto& field : value.field_values()) {
                auto canon = canonical_value(field, CollationSpec{}, ctx);
                if (!canon) {
                    return canon;
                }
                fields.emplace_back(std::string{}, std::move(*canon));
            }
            return Value::structure(std::move(fields));
        }
        case TypeKind::Json:
            return make_error(ErrorKind::TypeMismatch,
                              "JSON values cannot be grouped, joined or compared for identity");
    }
    return value;
}

auto hash_value(const Value& value) -> std::size_t {
    std::size_t seed = static_cast<std::size_t>(value.kind());
    switch (value.kind()) {
        case TypeKind::Null:
            return kNullHash;
        case TypeKind::Bool:
            hash_combine(seed, std::hash<bool>{}(value.as_bool()));
            break;
        case TypeKind::Int64:
            hash_combine(seed, std::hash<std::int64_t>{}(value.as_int64()));
            break;
        case TypeKind::Double: {
            double d = value.as_double();
            hash_combine(seed, std::isnan(d) ? kNanHash : std::hash<double>{}(d == 0.0 ? 0.0 : d));
            break;
        }
        case TypeKind::Numeric: {
            auto units = value.as_numeric().units;
            hash_combine(seed, std::hash<std::uint64_t>{}(static_cast<std::uint64_t>(units)));
            hash_combine(seed, std::hash<std::uint64_t>{}(static_cast<std::uint64_t>(units >> 64)));
            break;
        }
        case TypeKind::String:
            hash_combine(seed, std::hash<std::string>{}(value.as_text().text));
            break;
        case TypeKind::Bytes:
            hash_combine(seed, std::hash<std::string>{}(value.as_bytes().data));
            break;
        case TypeKind::Date:
            hash_combine(seed, std::hash<Date>{}(value.as_date()));
            break;
        case TypeKind::Time:
            hash_combine(seed, std::hash<Time>{}(value.as_time()));
            break;
        case TypeKind::Timestamp:
            hash_combine(seed, std::hash<Timestamp>{}(value.as_timestamp()));
            break;
        case TypeKind::Interval: {
            const auto& iv = value.as_interval();
            hash_combine(seed, std::hash<std::int32_t>{}(iv.months));
            hash_combine(seed, std::hash<std::int32_t>{}(iv.days));
            hash_combine(seed, std::hash<std::int64_t>{}(iv.micros));
            break;
        }
        case TypeKind::Array:
            for (const auto& element : value.elements()) {
                hash_combine(seed, hash_value(element));
            }
            break;
        case TypeKind::Struct:
            for (const auto& field : value.field_values()) {
                hash_combine(seed, hash_value(field));
            }
            break;
        case TypeKind::Json:
            hash_combine(seed, std::hash<std::string>{}(value.as_json().text));
            break;
    }
    return seed;
}

auto same_value(const Value& a, const Value& b) -> bool {
    if (a.kind() != b.kind()) {
        return false;
    }
    switch (a.kind()) {
        case TypeKind::Null:
            return true;
        case TypeKind::Bool:
            return a.as_bool() == b.as_bool();
        case TypeKind::Int64:
            return a.as_int64() == b.as_int64();
        case TypeKind::Double: {
            double x = a.as_double();
            double y = b.as_double();
            return (std::isnan(x) && std::isnan(y)) || x == y;
        }
        case TypeKind::Numeric:
            return a.as_numeric() == b.as_numeric();
        case TypeKind::String:
            return a.as_text().text == b.as_text().text;
        case TypeKind::Bytes:
            return a.as_bytes() == b.as_bytes();
        case TypeKind::Date:
            return a.as_date() == b.as_date();
        case TypeKind::Time:
            return a.as_time() == b.as_time();
        case TypeKind::Timestamp:
            return a.as_timestamp() == b.as_timestamp();
        case TypeKind::Interval:
            return a.as_interval() == b.as_interval();
        case TypeKind::Array:
        case TypeKind::Struct: {
            const auto& xs = a.kind() == TypeKind::Array ? a.elements() : a.field_values();
            const auto& ys = b.kind() == TypeKind::Array ? b.elements() : b.field_values();
            if (xs.size() != ys.size()) {
                return false;
            }
            for (std::size_t i = 0; i < xs.size(); ++i) {
                if (!same_value(xs[i], ys[i])) {
                    return false;
                }
            }
            return true;
        }
        case TypeKind::Json:
            return a.as_json().text == b.as_json().text;
    }
    return false;
}

auto RowKeyHash::operator()(const RowKey& key) const -> std::size_t {
    std::size_t seed = 0;
    for (const auto& value : key.values) {
        hash_combine(seed, hash_value(value));
    }
    return seed;
}

auto RowKeyEq::operator()(const RowKey& a, const RowKey& b) const -> bool {
    if (a.values.size() != b.values.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.values.size(); ++i) {
        if (!same_value(a.values[i], b.values[i])) {
            return false;
        }
    }
    return true;
}

auto column_collations(std::span<const Table* const> tables, const CollationContext& ctx)
    -> Result<std::vector<CollationSpec>> {
    std::size_t width = 0;
    for (const auto* table : tables) {
        width = std::max(width, table->num_columns());
    }
    std::vector<std::string> chosen(width);
    for (const auto* table : tables) {
        for (const auto& row : table->rows) {
            for (std::size_t c = 0; c < row.size() && c < width; ++c) {
                if (row[c].kind() != TypeKind::String) {
                    continue;
                }
                const auto& collation = row[c].as_text().collation;
                if (collation.empty() || collation == chosen[c]) {
                    continue;
                }
                auto resolved = ctx.resolve(chosen[c], collation);
                if (!resolved) {
                    return std::unexpected(std::move(resolved.error()).at(
                        fmt::format("column {}", table->schema[c].name)));
                }
                if (!resolved->is_default()) {
                    chosen[c] = resolved->to_string();
                }
            }
        }
    }
    std::vector<CollationSpec> out;
    out.reserve(width);
    for (const auto& spec : chosen) {
        out.push_back(CollationSpec::parse(spec));
    }
    return out;
}

auto make_row_key(const Row& row, std::span<const std::size_t> columns,
                  std::span<const CollationSpec> collations, const CollationContext& ctx)
    -> Result<RowKey> {
    static const CollationSpec kBinary{};
    RowKey key;
    std::size_t count = columns.empty() ? row.size() : columns.size();
    key.values.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto& value = row[columns.empty() ? i : columns[i]];
        const auto& spec = i < collations.size() ? collations[i] : kBinary;
        auto canon = canonical_value(value, spec, ctx);
        if (!canon) {
            return std::unexpected(canon.error());
        }
        key.values.push_back(std::move(*canon));
    }
    return key;
}

}  // namespace oryx
