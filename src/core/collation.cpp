#include <oryx/core/collation.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace oryx {

namespace {

auto fold_case(char32_t cp) noexcept -> char32_t {
    if (cp >= U'A' && cp <= U'Z') {
        return cp + 0x20;
    }
    // Latin-1 uppercase block, excluding the multiplication sign.
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) {
        return cp + 0x20;
    }
    return cp;
}

auto strip_accent(char32_t cp) noexcept -> char32_t {
    // Lowercase Latin-1 letters only; callers fold case first.
    if (cp >= 0xE0 && cp <= 0xE5) {
        return U'a';
    }
    if (cp == 0xE7) {
        return U'c';
    }
    if (cp >= 0xE8 && cp <= 0xEB) {
        return U'e';
    }
    if (cp >= 0xEC && cp <= 0xEF) {
        return U'i';
    }
    if (cp == 0xF1) {
        return U'n';
    }
    if ((cp >= 0xF2 && cp <= 0xF6) || cp == 0xF8) {
        return U'o';
    }
    if (cp >= 0xF9 && cp <= 0xFC) {
        return U'u';
    }
    if (cp == 0xFD || cp == 0xFF) {
        return U'y';
    }
    return cp;
}

}  // namespace

auto decode_utf8(std::string_view text) -> std::vector<char32_t> {
    std::vector<char32_t> out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        auto byte = static_cast<unsigned char>(text[i]);
        std::size_t len = 0;
        char32_t cp = 0;
        if (byte < 0x80) {
            len = 1;
            cp = byte;
        } else if ((byte & 0xE0) == 0xC0) {
            len = 2;
            cp = byte & 0x1F;
        } else if ((byte & 0xF0) == 0xE0) {
            len = 3;
            cp = byte & 0x0F;
        } else if ((byte & 0xF8) == 0xF0) {
            len = 4;
            cp = byte & 0x07;
        }
        bool valid = len > 0 && i + len <= text.size();
        for (std::size_t k = 1; valid && k < len; ++k) {
            auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (!valid) {
            out.push_back(byte);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

auto is_combining_mark(char32_t cp) noexcept -> bool {
    return cp >= 0x0300 && cp <= 0x036F;
}

auto CollationSpec::parse(std::string_view spec) -> CollationSpec {
    CollationSpec out;
    auto colon = spec.find(':');
    if (colon == std::string_view::npos) {
        out.language = std::string(spec);
        return out;
    }
    out.language = std::string(spec.substr(0, colon));
    out.attribute = std::string(spec.substr(colon + 1));
    return out;
}

auto CollationSpec::is_default() const noexcept -> bool {
    if (language.empty() && attribute.empty()) {
        return true;
    }
    if (language == "binary" && attribute.empty()) {
        return true;
    }
    return language == "unicode" && (attribute.empty() || attribute == "cs");
}

auto CollationSpec::to_string() const -> std::string {
    if (attribute.empty()) {
        return language;
    }
    return fmt::format("{}:{}", language, attribute);
}

auto FoldingCollator::fold(std::string_view text, const CollationSpec& spec) const -> std::string {
    bool ci = spec.case_insensitive() || spec.accent_insensitive();
    bool ai = spec.accent_insensitive();
    if (!ci) {
        return std::string(text);
    }
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : decode_utf8(text)) {
        if (ai && is_combining_mark(cp)) {
            continue;
        }
        cp = fold_case(cp);
        if (ai) {
            cp = strip_accent(cp);
        }
        append_utf8(out, cp);
    }
    return out;
}

auto FoldingCollator::compare(std::string_view lhs, std::string_view rhs,
                              const CollationSpec& spec) const -> std::weak_ordering {
    auto a = fold(lhs, spec);
    auto b = fold(rhs, spec);
    // UTF-8 byte order equals code point order.
    int cmp = a.compare(b);
    if (cmp < 0) {
        return std::weak_ordering::less;
    }
    if (cmp > 0) {
        return std::weak_ordering::greater;
    }
    return std::weak_ordering::equivalent;
}

auto default_collator() -> const Collator& {
    static const FoldingCollator collator;
    return collator;
}

CollationContext::CollationContext() : collator_(&default_collator()) {}

auto CollationContext::resolve(std::string_view lhs_spec, std::string_view rhs_spec) const
    -> Result<CollationSpec> {
    auto lhs = CollationSpec::parse(lhs_spec);
    auto rhs = CollationSpec::parse(rhs_spec);
    bool lhs_explicit = !lhs.is_default();
    bool rhs_explicit = !rhs.is_default();
    if (lhs_explicit && rhs_explicit) {
        if (lhs != rhs) {
            return make_error(ErrorKind::CollationConflict,
                              fmt::format("collation mismatch: '{}' vs '{}'", lhs.to_string(),
                                          rhs.to_string()));
        }
        return lhs;
    }
    if (lhs_explicit) {
        return lhs;
    }
    if (rhs_explicit) {
        return rhs;
    }
    return CollationSpec{};
}

auto CollationContext::compare(const Text& lhs, const Text& rhs) const
    -> Result<std::weak_ordering> {
    auto spec = resolve(lhs.collation, rhs.collation);
    if (!spec) {
        return std::unexpected(spec.error());
    }
    if (spec->is_default()) {
        int cmp = lhs.text.compare(rhs.text);
        if (cmp < 0) {
            return std::weak_ordering::less;
        }
        if (cmp > 0) {
            return std::weak_ordering::greater;
        }
        return std::weak_ordering::equivalent;
    }
    return collator_->compare(lhs.text, rhs.text, *spec);
}

auto CollationContext::fold(std::string_view text, const CollationSpec& spec) const
    -> std::string {
    if (spec.is_default()) {
        return std::string(text);
    }
    return collator_->fold(text, spec);
}

}  // namespace oryx
