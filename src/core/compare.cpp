#include <oryx/core/compare.hpp>

#include <fmt/format.h>

#include <cmath>
#include <string>

namespace oryx {

namespace {

auto mismatch(const Value& lhs, const Value& rhs) -> std::unexpected<Error> {
    return make_error(ErrorKind::TypeMismatch,
                      fmt::format("cannot compare {} with {}", type_name(lhs.kind()),
                                  type_name(rhs.kind())));
}

template <typename T>
auto order_of(const T& a, const T& b) -> Ordering {
    if (a < b) {
        return Ordering::Less;
    }
    if (b < a) {
        return Ordering::Greater;
    }
    return Ordering::Equal;
}

auto from_weak(std::weak_ordering ord) -> Ordering {
    if (ord < 0) {
        return Ordering::Less;
    }
    if (ord > 0) {
        return Ordering::Greater;
    }
    return Ordering::Equal;
}

auto is_nan_value(const Value& v) -> bool {
    return v.kind() == TypeKind::Double && std::isnan(v.as_double());
}

auto compare_numeric(const Value& lhs, const Value& rhs) -> Ordering {
    auto lk = lhs.kind();
    auto rk = rhs.kind();
    if (lk == TypeKind::Int64 && rk == TypeKind::Int64) {
        return order_of(lhs.as_int64(), rhs.as_int64());
    }
    if (lk != TypeKind::Double && rk != TypeKind::Double) {
        auto to_units = [](const Value& v) -> int128_t {
            return v.kind() == TypeKind::Numeric ? v.as_numeric().units
                                                 : Numeric::from_int(v.as_int64()).units;
        };
        return order_of(to_units(lhs), to_units(rhs));
    }
    if (is_nan_value(lhs) || is_nan_value(rhs)) {
        return Ordering::Incomparable;
    }
    return order_of(numeric_as_long_double(lhs), numeric_as_long_double(rhs));
}

auto is_container(const Value& v) -> bool {
    return v.kind() == TypeKind::Struct || v.kind() == TypeKind::Array;
}

/// Positional element-wise 3VL equality for structs and arrays.
auto container_equals(const Value& lhs, const Value& rhs, const CollationContext& ctx)
    -> Result<TriBool> {
    if (lhs.kind() != rhs.kind()) {
        return mismatch(lhs, rhs);
    }
    const auto& a = lhs.kind() == TypeKind::Struct ? lhs.field_values() : lhs.elements();
    const auto& b = rhs.kind() == TypeKind::Struct ? rhs.field_values() : rhs.elements();
    if (a.size() != b.size()) {
        if (lhs.kind() == TypeKind::Struct) {
            return make_error(ErrorKind::TypeMismatch,
                              fmt::format("cannot compare STRUCT with {} fields to STRUCT with {} "
                                          "fields",
                                          a.size(), b.size()));
        }
        return TriBool::False;
    }
    bool saw_null = false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        auto eq = equals3vl(a[i], b[i], ctx);
        if (!eq) {
            return std::unexpected(eq.error());
        }
        if (*eq == TriBool::False) {
            return TriBool::False;
        }
        if (*eq == TriBool::Null) {
            saw_null = true;
        }
    }
    return saw_null ? TriBool::Null : TriBool::True;
}

auto grouping_equal(const Value& lhs, const Value& rhs, const CollationContext& ctx)
    -> Result<bool> {
    if (lhs.is_null() || rhs.is_null()) {
        return lhs.is_null() && rhs.is_null();
    }
    if (is_nan_value(lhs) || is_nan_value(rhs)) {
        return is_nan_value(lhs) && is_nan_value(rhs);
    }
    if (is_container(lhs) || is_container(rhs)) {
        if (lhs.kind() != rhs.kind()) {
            return mismatch(lhs, rhs);
        }
        const auto& a = lhs.kind() == TypeKind::Struct ? lhs.field_values() : lhs.elements();
        const auto& b = rhs.kind() == TypeKind::Struct ? rhs.field_values() : rhs.elements();
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            auto eq = grouping_equal(a[i], b[i], ctx);
            if (!eq) {
                return std::unexpected(eq.error());
            }
            if (!*eq) {
                return false;
            }
        }
        return true;
    }
    auto ord = compare(lhs, rhs, ctx);
    if (!ord) {
        return std::unexpected(ord.error());
    }
    return *ord == Ordering::Equal;
}

// ─── LIKE matching ───────────────────────────────────────────────────────────

using Cluster = std::u32string;

struct PatternToken {
    enum class Kind : std::uint8_t { Literal, AnyOne, AnyMany };
    Kind kind = Kind::Literal;
    Cluster cluster;
};

/// Splits code points into clusters: one code point each, or a base code point
/// plus trailing combining marks when `graphemes` is set.
auto clusterize(const std::vector<char32_t>& cps, bool graphemes) -> std::vector<Cluster> {
    std::vector<Cluster> out;
    out.reserve(cps.size());
    for (char32_t cp : cps) {
        if (graphemes && !out.empty() && is_combining_mark(cp)) {
            out.back().push_back(cp);
            continue;
        }
        out.emplace_back(1, cp);
    }
    return out;
}

auto to_units(std::string_view text, bool is_bytes) -> std::vector<char32_t> {
    if (!is_bytes) {
        return decode_utf8(text);
    }
    std::vector<char32_t> out;
    out.reserve(text.size());
    for (unsigned char ch : text) {
        out.push_back(ch);
    }
    return out;
}

auto parse_pattern(std::string_view pattern, bool is_bytes, bool graphemes,
                   const CollationSpec* spec, const CollationContext& ctx)
    -> Result<std::vector<PatternToken>> {
    std::vector<PatternToken> tokens;
    std::string literal_run;

    auto flush = [&]() {
        if (literal_run.empty()) {
            return;
        }
        std::string folded = spec != nullptr ? ctx.fold(literal_run, *spec) : literal_run;
        for (auto& cluster : clusterize(to_units(folded, is_bytes), graphemes)) {
            tokens.push_back(PatternToken{.kind = PatternToken::Kind::Literal,
                                          .cluster = std::move(cluster)});
        }
        literal_run.clear();
    };

    for (std::size_t i = 0; i < pattern.size(); ++i) {
        char ch = pattern[i];
        if (ch == '\\') {
            if (i + 1 >= pattern.size()) {
                return make_error(ErrorKind::TypeMismatch,
                                  "LIKE pattern ends with a dangling escape character");
            }
            char next = pattern[i + 1];
            if (next != '\\' && next != '%' && next != '_') {
                return make_error(ErrorKind::TypeMismatch,
                                  fmt::format("invalid LIKE escape sequence '\\{}'", next));
            }
            literal_run.push_back(next);
            ++i;
            continue;
        }
        if (ch == '%' || ch == '_') {
            flush();
            tokens.push_back(PatternToken{.kind = ch == '%' ? PatternToken::Kind::AnyMany
                                                            : PatternToken::Kind::AnyOne,
                                          .cluster = {}});
            continue;
        }
        literal_run.push_back(ch);
    }
    flush();
    return tokens;
}

auto match_tokens(const std::vector<Cluster>& text, const std::vector<PatternToken>& pat) -> bool {
    constexpr std::size_t kNone = static_cast<std::size_t>(-1);
    std::size_t t = 0;
    std::size_t p = 0;
    std::size_t star = kNone;
    std::size_t mark = 0;
    while (t < text.size()) {
        if (p < pat.size() && (pat[p].kind == PatternToken::Kind::AnyOne ||
                               (pat[p].kind == PatternToken::Kind::Literal &&
                                pat[p].cluster == text[t]))) {
            ++t;
            ++p;
        } else if (p < pat.size() && pat[p].kind == PatternToken::Kind::AnyMany) {
            star = p++;
            mark = t;
        } else if (star != kNone) {
            p = star + 1;
            t = ++mark;
        } else {
            return false;
        }
    }
    while (p < pat.size() && pat[p].kind == PatternToken::Kind::AnyMany) {
        ++p;
    }
    return p == pat.size();
}

}  // namespace

auto tri_to_value(TriBool v) -> Value {
    if (v == TriBool::Null) {
        return Value::null();
    }
    return Value::boolean(v == TriBool::True);
}

auto compare(const Value& lhs, const Value& rhs, const CollationContext& ctx) -> Result<Ordering> {
    if (lhs.is_null() || rhs.is_null()) {
        return Ordering::Incomparable;
    }
    auto lk = lhs.kind();
    auto rk = rhs.kind();
    if (is_numeric_kind(lk) && is_numeric_kind(rk)) {
        return compare_numeric(lhs, rhs);
    }
    if (lk != rk) {
        return mismatch(lhs, rhs);
    }
    switch (lk) {
        case TypeKind::Bool:
            return order_of(lhs.as_bool(), rhs.as_bool());
        case TypeKind::String: {
            auto ord = ctx.compare(lhs.as_text(), rhs.as_text());
            if (!ord) {
                return std::unexpected(ord.error());
            }
            return from_weak(*ord);
        }
        case TypeKind::Bytes:
            return order_of(lhs.as_bytes().data, rhs.as_bytes().data);
        case TypeKind::Date:
            return order_of(lhs.as_date(), rhs.as_date());
        case TypeKind::Time:
            return order_of(lhs.as_time(), rhs.as_time());
        case TypeKind::Timestamp:
            return order_of(lhs.as_timestamp(), rhs.as_timestamp());
        case TypeKind::Interval:
            return order_of(lhs.as_interval().ordering_micros(),
                            rhs.as_interval().ordering_micros());
        case TypeKind::Array:
        case TypeKind::Struct:
        case TypeKind::Json:
            return make_error(ErrorKind::TypeMismatch,
                              fmt::format("{} values are not orderable", type_name(lk)));
        default:
            break;
    }
    return mismatch(lhs, rhs);
}

auto equals3vl(const Value& lhs, const Value& rhs, const CollationContext& ctx)
    -> Result<TriBool> {
    if (lhs.is_null() || rhs.is_null()) {
        return TriBool::Null;
    }
    if (is_container(lhs) || is_container(rhs)) {
        return container_equals(lhs, rhs, ctx);
    }
    if (lhs.kind() == TypeKind::Json || rhs.kind() == TypeKind::Json) {
        return make_error(ErrorKind::TypeMismatch, "JSON values do not support equality");
    }
    auto ord = compare(lhs, rhs, ctx);
    if (!ord) {
        return std::unexpected(ord.error());
    }
    return to_tri(*ord == Ordering::Equal);
}

auto compare3vl(CompareOp op, const Value& lhs, const Value& rhs, const CollationContext& ctx)
    -> Result<TriBool> {
    if (op == CompareOp::Eq) {
        return equals3vl(lhs, rhs, ctx);
    }
    if (op == CompareOp::Ne) {
        auto eq = equals3vl(lhs, rhs, ctx);
        if (!eq) {
            return std::unexpected(eq.error());
        }
        return tri_not(*eq);
    }
    if (is_container(lhs) || is_container(rhs)) {
        return make_error(ErrorKind::TypeMismatch,
                          fmt::format("{} supports only = and != comparisons",
                                      type_name(is_container(lhs) ? lhs.kind() : rhs.kind())));
    }
    if (lhs.is_null() || rhs.is_null()) {
        return TriBool::Null;
    }
    auto ord = compare(lhs, rhs, ctx);
    if (!ord) {
        return std::unexpected(ord.error());
    }
    switch (*ord) {
        case Ordering::Incomparable:
            return TriBool::False;
        case Ordering::Less:
            return to_tri(op == CompareOp::Lt || op == CompareOp::Le);
        case Ordering::Equal:
            return to_tri(op == CompareOp::Le || op == CompareOp::Ge);
        case Ordering::Greater:
            return to_tri(op == CompareOp::Gt || op == CompareOp::Ge);
    }
    return TriBool::Null;
}

auto is_distinct_from(const Value& lhs, const Value& rhs, const CollationContext& ctx)
    -> Result<bool> {
    auto eq = grouping_equal(lhs, rhs, ctx);
    if (!eq) {
        return std::unexpected(eq.error());
    }
    return !*eq;
}

auto order_compare(const Value& lhs, const Value& rhs, const CollationContext& ctx)
    -> Result<std::weak_ordering> {
    if (lhs.is_null() || rhs.is_null()) {
        if (lhs.is_null() && rhs.is_null()) {
            return std::weak_ordering::equivalent;
        }
        return lhs.is_null() ? std::weak_ordering::less : std::weak_ordering::greater;
    }
    bool lnan = is_nan_value(lhs);
    bool rnan = is_nan_value(rhs);
    if (lnan || rnan) {
        if (lnan && rnan) {
            return std::weak_ordering::equivalent;
        }
        if (!is_numeric_kind(lnan ? rhs.kind() : lhs.kind())) {
            return mismatch(lhs, rhs);
        }
        return lnan ? std::weak_ordering::less : std::weak_ordering::greater;
    }
    auto ord = compare(lhs, rhs, ctx);
    if (!ord) {
        return std::unexpected(ord.error());
    }
    switch (*ord) {
        case Ordering::Less:
            return std::weak_ordering::less;
        case Ordering::Greater:
            return std::weak_ordering::greater;
        default:
            return std::weak_ordering::equivalent;
    }
}

auto in_list(const Value& operand, std::span<const Value> list, const CollationContext& ctx)
    -> Result<TriBool> {
    bool saw_null = false;
    for (const auto& candidate : list) {
        auto eq = equals3vl(operand, candidate, ctx);
        if (!eq) {
            return std::unexpected(eq.error());
        }
        if (*eq == TriBool::True) {
            return TriBool::True;
        }
        if (*eq == TriBool::Null) {
            saw_null = true;
        }
    }
    return saw_null ? TriBool::Null : TriBool::False;
}

auto like(const Value& text, const Value& pattern, const CollationContext& ctx)
    -> Result<TriBool> {
    if (text.is_null() || pattern.is_null()) {
        return TriBool::Null;
    }
    if (text.kind() == TypeKind::Bytes && pattern.kind() == TypeKind::Bytes) {
        auto tokens = parse_pattern(pattern.as_bytes().data, true, false, nullptr, ctx);
        if (!tokens) {
            return std::unexpected(tokens.error());
        }
        auto units = clusterize(to_units(text.as_bytes().data, true), false);
        return to_tri(match_tokens(units, *tokens));
    }
    if (text.kind() != TypeKind::String || pattern.kind() != TypeKind::String) {
        return make_error(ErrorKind::TypeMismatch,
                          fmt::format("LIKE expects STRING or BYTES operands, got {} and {}",
                                      type_name(text.kind()), type_name(pattern.kind())));
    }
    auto spec = ctx.resolve(text.as_text().collation, pattern.as_text().collation);
    if (!spec) {
        return std::unexpected(spec.error());
    }
    bool named = !spec->is_default();
    auto tokens = parse_pattern(pattern.as_text().text, false, named, named ? &*spec : nullptr, ctx);
    if (!tokens) {
        return std::unexpected(tokens.error());
    }
    std::string subject = named ? ctx.fold(text.as_text().text, *spec) : text.as_text().text;
    auto clusters = clusterize(decode_utf8(subject), named);
    return to_tri(match_tokens(clusters, *tokens));
}

}  // namespace oryx
