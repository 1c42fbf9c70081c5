#pragma once

#include <compare>
#include <cstdint>
#include <functional>

namespace oryx {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Time of day in microseconds since midnight.
struct Time {
    std::int64_t micros = 0;
    auto operator<=>(const Time&) const = default;
};

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// Calendar interval. Months and days are kept apart because their length in
/// micros depends on the anchor date.
struct Interval {
    std::int32_t months = 0;
    std::int32_t days = 0;
    std::int64_t micros = 0;

    auto operator==(const Interval&) const -> bool = default;

    /// Approximate length used for ordering (30-day months, 24-hour days).
    [[nodiscard]] constexpr auto ordering_micros() const noexcept -> long double {
        constexpr long double kDay = 86'400'000'000.0L;
        return static_cast<long double>(months) * 30.0L * kDay +
               static_cast<long double>(days) * kDay + static_cast<long double>(micros);
    }
};

}  // namespace oryx

namespace std {

template <>
struct hash<oryx::Date> {
    auto operator()(const oryx::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<oryx::Time> {
    auto operator()(const oryx::Time& t) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(t.micros);
    }
};

template <>
struct hash<oryx::Timestamp> {
    auto operator()(const oryx::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

}  // namespace std
