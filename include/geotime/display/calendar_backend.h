// =============================================================================
// geotime - Calendar Formatting Backend
// =============================================================================
// Interface to the calendar formatter consumed by the display pipeline, and
// the std::chrono implementation used by default.
//
// A backend maps (timestamp, pattern) to a string or reports:
// - kOutOfRange:     the timestamp lies outside the backend's calendar range
// - kInvalidPattern: the pattern cannot be rendered
// It never produces a string for a value it cannot represent.
// =============================================================================

#ifndef GEOTIME_DISPLAY_CALENDAR_BACKEND_H
#define GEOTIME_DISPLAY_CALENDAR_BACKEND_H

#include <string>
#include <string_view>

#include "geotime/common/error.h"
#include "geotime/core/timestamp.h"

namespace geotime::display {

// =============================================================================
// CalendarRange Structure
// =============================================================================

/// @brief Inclusive range of timestamps a backend can render.
struct CalendarRange {
    Timestamp first;
    Timestamp last;

    [[nodiscard]] constexpr bool contains(Timestamp ts) const noexcept {
        return first <= ts && ts <= last;
    }
};

// =============================================================================
// CalendarBackend Interface
// =============================================================================

/// @brief Abstract calendar formatter.
/// @note Implementations must be stateless or internally synchronized; the
///       pipeline calls them concurrently.
class CalendarBackend {
public:
    virtual ~CalendarBackend() = default;

    /// @brief Render a timestamp with a strftime-style pattern.
    /// @return The formatted string, or kOutOfRange / kInvalidPattern.
    [[nodiscard]] virtual Result<std::string> format(Timestamp ts,
                                                     std::string_view pattern) const = 0;

    /// @brief Timestamps this backend can render.
    [[nodiscard]] virtual CalendarRange supportedRange() const noexcept = 0;
};

// =============================================================================
// ChronoCalendar Class
// =============================================================================

/// @brief Proleptic Gregorian UTC backend built on std::chrono.
/// @note Range: year::min()-01-01T00:00:00.000 to year::max()-12-31T23:59:59.999
///       (years -32767 to 32767). Patterns use chrono conversion specifiers
///       (%Y, %m, %d, %H, %M, %S, %F, %T, ...) rendered by fmt over a UTC std::tm.
class ChronoCalendar final : public CalendarBackend {
public:
    [[nodiscard]] Result<std::string> format(Timestamp ts,
                                             std::string_view pattern) const override;

    [[nodiscard]] CalendarRange supportedRange() const noexcept override;

    /// @brief Shared instance used by the default display pipeline.
    [[nodiscard]] static const ChronoCalendar& instance() noexcept;
};

}  // namespace geotime::display

#endif  // GEOTIME_DISPLAY_CALENDAR_BACKEND_H
