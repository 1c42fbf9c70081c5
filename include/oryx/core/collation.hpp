#pragma once

#include <oryx/core/error.hpp>
#include <oryx/core/value.hpp>

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace oryx {

/// Parsed collation specification: `language_tag[:attribute]`.
struct CollationSpec {
    std::string language;
    std::string attribute;

    [[nodiscard]] static auto parse(std::string_view spec) -> CollationSpec;

    /// "", "binary", "unicode" and "unicode:cs" all mean code point order.
    [[nodiscard]] auto is_default() const noexcept -> bool;
    [[nodiscard]] auto case_insensitive() const noexcept -> bool { return attribute == "ci"; }
    [[nodiscard]] auto accent_insensitive() const noexcept -> bool { return attribute == "ai"; }
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const CollationSpec&) const -> bool = default;
};

/// Pluggable string comparator for named collations.
///
/// Binary (default) comparison never reaches the collator; the collator is
/// only consulted when a non-default specification is in effect.
class Collator {
   public:
    virtual ~Collator() = default;

    /// Ordering of two strings under `spec`.
    [[nodiscard]] virtual auto compare(std::string_view lhs, std::string_view rhs,
                                       const CollationSpec& spec) const -> std::weak_ordering = 0;

    /// Folded form such that fold(a) == fold(b) iff compare(a, b) is equivalent.
    [[nodiscard]] virtual auto fold(std::string_view text, const CollationSpec& spec) const
        -> std::string = 0;
};

/// Case folding (`ci`) and accent folding (`ai`) over ASCII and Latin-1.
/// Any other attribute compares code points exactly.
class FoldingCollator final : public Collator {
   public:
    [[nodiscard]] auto compare(std::string_view lhs, std::string_view rhs,
                               const CollationSpec& spec) const -> std::weak_ordering override;
    [[nodiscard]] auto fold(std::string_view text, const CollationSpec& spec) const
        -> std::string override;
};

/// Explicit collation context threaded through every comparison.
class CollationContext {
   public:
    CollationContext();
    explicit CollationContext(const Collator& collator) : collator_(&collator) {}

    [[nodiscard]] auto collator() const noexcept -> const Collator& { return *collator_; }

    /// Effective collation for a pair of strings. One explicit non-default
    /// specification wins for both sides; two different ones conflict.
    [[nodiscard]] auto resolve(std::string_view lhs_spec, std::string_view rhs_spec) const
        -> Result<CollationSpec>;

    [[nodiscard]] auto compare(const Text& lhs, const Text& rhs) const
        -> Result<std::weak_ordering>;

    /// Fold under `spec`; identity for the default collation.
    [[nodiscard]] auto fold(std::string_view text, const CollationSpec& spec) const -> std::string;

   private:
    const Collator* collator_;
};

/// Shared process-wide default collator.
[[nodiscard]] auto default_collator() -> const Collator&;

// ─── UTF-8 helpers ───────────────────────────────────────────────────────────

/// Decodes UTF-8 into code points; invalid bytes decode as themselves.
[[nodiscard]] auto decode_utf8(std::string_view text) -> std::vector<char32_t>;
void append_utf8(std::string& out, char32_t cp);
[[nodiscard]] auto is_combining_mark(char32_t cp) noexcept -> bool;

}  // namespace oryx
