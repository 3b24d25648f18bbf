#pragma once

#include <chrono>
#include <compare>
#include <cstdint>

namespace iex {

// ============================================================================
// Price scaling
// ============================================================================

/// TOPS prices are integers in units of 1/10,000 dollar
inline constexpr int64_t PRICE_SCALE = 10'000;

[[nodiscard]] constexpr double scaled_to_double(int64_t raw) noexcept {
    return static_cast<double>(raw) / static_cast<double>(PRICE_SCALE);
}

// ============================================================================
// Timestamp (nanoseconds since Unix epoch, UTC)
// ============================================================================

using UtcNanos = std::chrono::sys_time<std::chrono::nanoseconds>;

struct Timestamp {
    int64_t nanos;  // Nanoseconds since Unix epoch

    constexpr Timestamp() noexcept : nanos{0} {}
    constexpr explicit Timestamp(int64_t ns) noexcept : nanos{ns} {}

    [[nodiscard]] constexpr int64_t as_nanos() const noexcept { return nanos; }
    [[nodiscard]] constexpr int64_t as_millis() const noexcept { return nanos / 1000000; }
    [[nodiscard]] constexpr int64_t as_seconds() const noexcept { return nanos / 1000000000; }

    /// Calendar instant with full nanosecond precision
    [[nodiscard]] constexpr UtcNanos as_time_point() const noexcept {
        return UtcNanos{std::chrono::nanoseconds{nanos}};
    }

    [[nodiscard]] static constexpr Timestamp from_time_point(UtcNanos tp) noexcept {
        return Timestamp{tp.time_since_epoch().count()};
    }

    constexpr auto operator<=>(const Timestamp&) const noexcept = default;
};

} // namespace iex
