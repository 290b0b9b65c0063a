// =============================================================================
// geotime - Timestamp Value Type
// =============================================================================
// A point in time stored as a signed 128-bit count of milliseconds relative
// to the Unix epoch (1970-01-01T00:00:00Z).
//
// This module provides:
// - Timestamp: immutable value type, every 128-bit pattern is valid
// - Conversions to and from integers and std::chrono time points
// - Decimal rendering and parsing of 128-bit integers
//
// Ordering and equality delegate to the underlying integer.
// =============================================================================

#ifndef GEOTIME_CORE_TIMESTAMP_H
#define GEOTIME_CORE_TIMESTAMP_H

#include <chrono>
#include <compare>
#include <concepts>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "geotime/common/error.h"
#include "geotime/common/types.h"

namespace geotime {

/// @brief Millisecond-precision UTC time point used at the calendar seam.
using SysMillis = std::chrono::sys_time<std::chrono::milliseconds>;

// =============================================================================
// Timestamp Class
// =============================================================================

/// @brief Signed 128-bit millisecond offset from the epoch.
/// @note Positive values are after the epoch, negative values before it.
class Timestamp {
public:
    /// @brief The epoch itself (offset 0).
    constexpr Timestamp() noexcept = default;

    /// @brief Construct from any built-in integer offset.
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    constexpr Timestamp(T millis) noexcept : millis_(static_cast<Int128>(millis)) {}

    constexpr Timestamp(Int128 millis) noexcept : millis_(millis) {}

    /// @brief Construct from a millisecond offset.
    [[nodiscard]] static constexpr Timestamp fromMillis(Int128 millis) noexcept {
        return Timestamp{millis};
    }

    /// @brief Construct from a calendar time point.
    [[nodiscard]] static constexpr Timestamp fromTimePoint(SysMillis tp) noexcept {
        return Timestamp{static_cast<std::int64_t>(tp.time_since_epoch().count())};
    }

    [[nodiscard]] static constexpr Timestamp epoch() noexcept { return Timestamp{}; }
    [[nodiscard]] static constexpr Timestamp min() noexcept { return Timestamp{kInt128Min}; }
    [[nodiscard]] static constexpr Timestamp max() noexcept { return Timestamp{kInt128Max}; }

    /// @brief Raw millisecond offset (lossless).
    [[nodiscard]] constexpr Int128 millis() const noexcept { return millis_; }

    /// @brief Millisecond offset narrowed to 64 bits.
    /// @return kOutOfRange if the value does not fit in int64_t.
    [[nodiscard]] Result<std::int64_t> timestampMillis() const;

    /// @brief Convert to a calendar time point.
    /// @return kOutOfRange if the value does not fit in int64_t milliseconds.
    [[nodiscard]] Result<SysMillis> toTimePoint() const;

    /// @brief Debug rendering, e.g. "Geotime(-100)".
    [[nodiscard]] std::string toDebugString() const;

    friend constexpr bool operator==(Timestamp, Timestamp) noexcept = default;
    friend constexpr std::strong_ordering operator<=>(Timestamp, Timestamp) noexcept = default;

private:
    Int128 millis_ = 0;
};

/// @brief Stream the debug rendering (used by gtest and RapidCheck output).
std::ostream& operator<<(std::ostream& os, Timestamp ts);

// =============================================================================
// 128-bit Decimal Helpers
// =============================================================================

/// @brief Render a signed 128-bit integer in decimal.
[[nodiscard]] std::string int128ToString(Int128 value);

/// @brief Parse a decimal 128-bit integer with an optional leading sign.
/// @return kInvalidArgument on empty input or stray characters,
///         kOutOfRange if the value overflows 128 bits.
[[nodiscard]] Result<Int128> parseInt128(std::string_view text);

}  // namespace geotime

#endif  // GEOTIME_CORE_TIMESTAMP_H
