// =============================================================================
// geotime - Display Pipeline
// =============================================================================
// Human-readable rendering of a Timestamp through three ordered tiers:
//
// 1. Calendar:    the calendar backend formats the value with the caller's
//                 pattern. Falls through when the backend reports
//                 kOutOfRange or kInvalidPattern.
// 2. Magnitude:   "299.87 M years from now". Falls through on
//                 kUnsafeMagnitude.
// 3. RawFallback: "Geotime(<exact value>) ms ago". Performs no floating-point
//                 or backend work and cannot fail.
//
// display() is total: no input makes it throw or return an error.
// =============================================================================

#ifndef GEOTIME_DISPLAY_DISPLAY_PIPELINE_H
#define GEOTIME_DISPLAY_DISPLAY_PIPELINE_H

#include <cstdint>
#include <string>
#include <string_view>

#include "geotime/common/error.h"
#include "geotime/core/timestamp.h"
#include "geotime/display/calendar_backend.h"
#include "geotime/display/magnitude_formatter.h"

namespace geotime::display {

// =============================================================================
// FormatTier Enumeration
// =============================================================================

/// @brief The rendering tier that produced a display string.
enum class FormatTier : std::uint8_t {
    kCalendar = 0,
    kMagnitude = 1,
    kRawFallback = 2
};

/// @brief Convert FormatTier to string ("calendar", "magnitude", "raw").
[[nodiscard]] std::string_view formatTierToString(FormatTier tier) noexcept;

/// @brief Default calendar pattern, ISO 8601 in UTC.
inline constexpr std::string_view kDefaultPattern = "%Y-%m-%dT%H:%M:%SZ";

// =============================================================================
// Rendering Structure
// =============================================================================

/// @brief A display string together with the tier that produced it.
struct Rendering {
    FormatTier tier = FormatTier::kRawFallback;
    std::string text;

    friend bool operator==(const Rendering&, const Rendering&) = default;
};

// =============================================================================
// DisplayPipeline Class
// =============================================================================

/// @brief Tiered renderer over a calendar backend and a magnitude formatter.
/// @note Holds a reference to the backend; the backend must outlive the
///       pipeline. Stateless between calls and safe to share across threads.
class DisplayPipeline {
public:
    /// @brief Pipeline over the std::chrono backend with the default policy.
    DisplayPipeline() noexcept;

    /// @brief Pipeline over a caller-supplied backend.
    explicit DisplayPipeline(const CalendarBackend& calendar,
                             MagnitudeFormatter magnitude = MagnitudeFormatter{}) noexcept;

    /// @brief Render through the tiers and report which one succeeded.
    [[nodiscard]] Rendering render(Timestamp ts, std::string_view pattern) const noexcept;

    /// @brief Render through the tiers; never fails.
    [[nodiscard]] std::string display(Timestamp ts, std::string_view pattern) const noexcept;

    /// @brief The terminal tier on its own: "Geotime(<value>) ms ago".
    [[nodiscard]] static std::string rawFallback(Timestamp ts);

    [[nodiscard]] const CalendarBackend& calendar() const noexcept { return *calendar_; }
    [[nodiscard]] const MagnitudeFormatter& magnitude() const noexcept { return magnitude_; }

private:
    /// @brief Run one fallible tier, converting exceptions into a declined tier.
    [[nodiscard]] Result<Rendering> attemptTier(FormatTier tier, Timestamp ts,
                                                std::string_view pattern) const noexcept;

    [[nodiscard]] Result<Rendering> calendarTier(Timestamp ts, std::string_view pattern) const;
    [[nodiscard]] Result<Rendering> magnitudeTier(Timestamp ts) const;

    const CalendarBackend* calendar_;
    MagnitudeFormatter magnitude_;
};

// =============================================================================
// Convenience Functions
// =============================================================================

/// @brief Render with the default pipeline (std::chrono backend).
[[nodiscard]] std::string display(Timestamp ts,
                                  std::string_view pattern = kDefaultPattern) noexcept;

}  // namespace geotime::display

#endif  // GEOTIME_DISPLAY_DISPLAY_PIPELINE_H
