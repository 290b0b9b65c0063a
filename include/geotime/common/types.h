// =============================================================================
// geotime - Common Type Definitions
// =============================================================================
// Core type definitions for the geotime library.
//
// This module defines:
// - Int128, UInt128: 128-bit integer aliases (GCC/Clang builtin)
// - Millisecond and calendar constants shared by the codecs and the display
//   pipeline
// - Bias helpers mapping signed values onto order-equivalent unsigned ones
//
// Naming Conventions:
// - Classes/Structs: PascalCase
// - Constants: kConstant
// =============================================================================

#ifndef GEOTIME_COMMON_TYPES_H
#define GEOTIME_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <limits>

namespace geotime {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Signed 128-bit integer.
__extension__ using Int128 = __int128;

/// @brief Unsigned 128-bit integer.
__extension__ using UInt128 = unsigned __int128;

// =============================================================================
// Constants
// =============================================================================

/// @brief Number of bits in the timestamp representation.
inline constexpr std::size_t kTimestampBits = 128;

/// @brief Smallest representable millisecond offset (-2^127).
inline constexpr Int128 kInt128Min = static_cast<Int128>(static_cast<UInt128>(1) << 127);

/// @brief Largest representable millisecond offset (2^127 - 1).
inline constexpr Int128 kInt128Max = static_cast<Int128>((static_cast<UInt128>(1) << 127) - 1);

/// @brief The bias 2^127 as an unsigned value (sign bit only).
inline constexpr UInt128 kSignBias = static_cast<UInt128>(1) << 127;

/// @brief Milliseconds in one day.
inline constexpr std::int64_t kMillisPerDay = 86'400'000;

/// @brief Days in the approximate year used by the magnitude tier.
/// @note 356 days reproduces the published magnitude renderings exactly.
inline constexpr std::int64_t kDaysPerMagnitudeYear = 356;

/// @brief Milliseconds per approximate year (30'758'400'000).
inline constexpr std::int64_t kMillisPerYear = kDaysPerMagnitudeYear * kMillisPerDay;

// =============================================================================
// Bias Transform
// =============================================================================

/// @brief Shift a signed value into the unsigned range (adds 2^127).
/// @note Flipping the sign bit of the two's-complement pattern; unsigned order
///       of the result equals signed order of the input.
[[nodiscard]] constexpr UInt128 biasSigned(Int128 value) noexcept {
    return static_cast<UInt128>(value) ^ kSignBias;
}

/// @brief Inverse of biasSigned (subtracts 2^127).
[[nodiscard]] constexpr Int128 unbiasUnsigned(UInt128 biased) noexcept {
    return static_cast<Int128>(biased ^ kSignBias);
}

}  // namespace geotime

#endif  // GEOTIME_COMMON_TYPES_H
