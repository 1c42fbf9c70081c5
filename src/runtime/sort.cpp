#include <oryx/runtime/sort.hpp>

#include <oryx/core/compare.hpp>

#include <algorithm>
#include <numeric>
#include <optional>

namespace oryx::runtime {

auto compare_keys(const Row& a, const Row& b, std::span<const SortDirection> dirs,
                  const CollationContext& ctx) -> Result<std::weak_ordering> {
    for (std::size_t i = 0; i < dirs.size(); ++i) {
        const auto& dir = dirs[i];
        bool an = a[i].is_null();
        bool bn = b[i].is_null();
        if (an || bn) {
            if (an && bn) {
                continue;
            }
            return an == dir.nulls_first ? std::weak_ordering::less : std::weak_ordering::greater;
        }
        auto c = order_compare(a[i], b[i], ctx);
        if (!c) {
            return c;
        }
        if (*c != 0) {
            return dir.ascending ? *c : 0 <=> *c;
        }
    }
    return std::weak_ordering::equivalent;
}

auto stable_order(const std::vector<Row>& keys, std::span<const SortDirection> dirs,
                  const CollationContext& ctx) -> Result<std::vector<std::size_t>> {
    std::vector<std::size_t> order(keys.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::optional<Error> failure;
    std::stable_sort(order.begin(), order.end(), [&](std::size_t x, std::size_t y) {
        if (failure) {
            return false;
        }
        auto c = compare_keys(keys[x], keys[y], dirs, ctx);
        if (!c) {
            failure = std::move(c.error());
            return false;
        }
        return *c < 0;
    });
    if (failure) {
        return std::unexpected(std::move(*failure));
    }
    return order;
}

}  // namespace oryx::runtime
