// =============================================================================
// geotime - Magnitude Formatter
// =============================================================================
// Approximate rendering of timestamps too far from the epoch for a calendar,
// e.g. "299.87 M years from now" or "29.99 B years ago".
//
// Steps:
// 1. Convert milliseconds to years with a fixed milliseconds-per-year
//    constant (356 days of 86'400'000 ms).
// 2. Non-negative offsets read "from now", negative ones "ago"; the number
//    shown is the absolute value.
// 3. Scale by powers of 1000 through the suffixes K M B T P E Z Y and print
//    with a fixed number of decimals.
// 4. Refuse (kUnsafeMagnitude) once the year count reaches the configured
//    maximum, where no suffix is left to scale into.
// =============================================================================

#ifndef GEOTIME_DISPLAY_MAGNITUDE_FORMATTER_H
#define GEOTIME_DISPLAY_MAGNITUDE_FORMATTER_H

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "geotime/common/error.h"
#include "geotime/common/types.h"
#include "geotime/core/timestamp.h"

namespace geotime::display {

// =============================================================================
// Constants
// =============================================================================

/// @brief Scale suffixes, each 1000 times the previous one.
inline constexpr std::array<std::string_view, 9> kMagnitudeUnits = {
    "", "K", "M", "B", "T", "P", "E", "Z", "Y"};

/// @brief Factor between consecutive suffixes.
inline constexpr double kMagnitudeStep = 1000.0;

/// @brief First year count with no suffix left (1000^9).
inline constexpr double kDefaultMaxMagnitudeYears = 1e27;

/// @brief Default decimal places on the scaled value.
inline constexpr int kDefaultMagnitudeDecimals = 2;

/// @brief Largest supported decimal places.
inline constexpr int kMaxMagnitudeDecimals = 6;

/// @brief Suffix for non-negative offsets.
inline constexpr std::string_view kFutureSuffix = "from now";

/// @brief Suffix for negative offsets.
inline constexpr std::string_view kPastSuffix = "ago";

// =============================================================================
// MagnitudeConfig Structure
// =============================================================================

/// @brief Policy constants for the magnitude tier.
struct MagnitudeConfig {
    /// @brief Milliseconds in one approximate year.
    std::int64_t millisPerYear = kMillisPerYear;

    /// @brief Decimal places printed on the scaled value.
    int decimals = kDefaultMagnitudeDecimals;

    /// @brief Year counts at or above this are numerically unsafe (exclusive bound).
    double maxYears = kDefaultMaxMagnitudeYears;

    /// @brief Validate the configuration.
    /// @return kInvalidArgument describing the first bad field.
    [[nodiscard]] VoidResult validate() const;

    friend bool operator==(const MagnitudeConfig&, const MagnitudeConfig&) = default;
};

// =============================================================================
// MagnitudeFormatter Class
// =============================================================================

/// @brief Renders a timestamp as a scaled year count with a direction.
class MagnitudeFormatter {
public:
    /// @brief Construct with the default policy.
    MagnitudeFormatter() = default;

    /// @brief Construct with a custom policy.
    /// @throws InvalidArgumentError if the configuration fails validate().
    explicit MagnitudeFormatter(MagnitudeConfig config);

    /// @brief Signed years between the epoch and the timestamp.
    [[nodiscard]] double years(Timestamp ts) const noexcept;

    /// @brief Render "<value> [<unit> ]years <from now|ago>".
    /// @return kUnsafeMagnitude if |years| is not finite or reaches maxYears.
    [[nodiscard]] Result<std::string> format(Timestamp ts) const;

    [[nodiscard]] const MagnitudeConfig& config() const noexcept { return config_; }

private:
    MagnitudeConfig config_;
};

}  // namespace geotime::display

#endif  // GEOTIME_DISPLAY_MAGNITUDE_FORMATTER_H
