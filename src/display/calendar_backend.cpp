// =============================================================================
// geotime - Calendar Formatting Backend Implementation
// =============================================================================

#include "geotime/display/calendar_backend.h"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <ctime>
#include <string>
#include <string_view>

namespace geotime::display {

namespace {

using std::chrono::days;
using std::chrono::December;
using std::chrono::floor;
using std::chrono::hh_mm_ss;
using std::chrono::January;
using std::chrono::milliseconds;
using std::chrono::sys_days;
using std::chrono::weekday;
using std::chrono::year;
using std::chrono::year_month_day;

/// @brief First renderable instant: year::min()-01-01T00:00:00.000.
constexpr SysMillis kFirstRenderable{sys_days{year::min() / January / 1}};

/// @brief Last renderable instant: year::max()-12-31T23:59:59.999.
constexpr SysMillis kLastRenderable{SysMillis{sys_days{year::max() / December / 31} + days{1}} -
                                    milliseconds{1}};

/// @brief Broken-down UTC time for a time point inside the renderable range.
/// @note Computed from the proleptic Gregorian calendar, not gmtime, so the
///       result does not depend on time_t width or the process time zone.
std::tm toUtcTm(SysMillis tp) {
    const sys_days day = floor<days>(tp);
    const year_month_day ymd{day};
    const hh_mm_ss<milliseconds> tod{tp - day};

    std::tm tm{};
    tm.tm_year = static_cast<int>(ymd.year()) - 1900;
    tm.tm_mon = static_cast<int>(static_cast<unsigned>(ymd.month())) - 1;
    tm.tm_mday = static_cast<int>(static_cast<unsigned>(ymd.day()));
    tm.tm_hour = static_cast<int>(tod.hours().count());
    tm.tm_min = static_cast<int>(tod.minutes().count());
    tm.tm_sec = static_cast<int>(tod.seconds().count());
    tm.tm_wday = static_cast<int>(weekday{day}.c_encoding());
    tm.tm_yday = static_cast<int>((day - sys_days{ymd.year() / January / 1}).count());
    tm.tm_isdst = 0;
#if defined(__GLIBC__) || defined(__APPLE__)
    tm.tm_gmtoff = 0;
    tm.tm_zone = "UTC";
#endif
    return tm;
}

/// @brief The conversion starting at pattern[percent]: "%X", or "%EX" / "%OX".
/// @return kInvalidPattern if the pattern ends inside the conversion.
Result<std::string_view> conversionAt(std::string_view pattern, std::size_t percent) {
    std::size_t length = 2;
    if (percent + 1 < pattern.size() && (pattern[percent + 1] == 'E' || pattern[percent + 1] == 'O')) {
        length = 3;
    }
    if (percent + length > pattern.size()) {
        return makeError<std::string_view>(
            ErrorCode::kInvalidPattern,
            fmt::format("pattern '{}' ends inside a conversion", pattern));
    }
    return pattern.substr(percent, length);
}

/// @brief Render one chrono conversion specifier.
Result<std::string> renderConversion(std::string_view conversion, const std::tm& tm) {
    std::string spec;
    spec.reserve(conversion.size() + 3);
    spec.append("{:").append(conversion).append("}");

    try {
        return fmt::format(fmt::runtime(spec), tm);
    } catch (const fmt::format_error& e) {
        return makeError<std::string>(
            ErrorCode::kInvalidPattern,
            fmt::format("invalid calendar conversion '{}': {}", conversion, e.what()));
    }
}

}  // namespace

// =============================================================================
// ChronoCalendar Implementation
// =============================================================================

CalendarRange ChronoCalendar::supportedRange() const noexcept {
    return CalendarRange{Timestamp::fromTimePoint(kFirstRenderable),
                         Timestamp::fromTimePoint(kLastRenderable)};
}

Result<std::string> ChronoCalendar::format(Timestamp ts, std::string_view pattern) const {
    if (!supportedRange().contains(ts)) {
        return makeError<std::string>(
            ErrorCode::kOutOfRange,
            fmt::format("{} is outside the chrono calendar range", ts.toDebugString()));
    }
    if (pattern.empty()) {
        return std::string{};
    }

    auto timePoint = ts.toTimePoint();
    if (!timePoint) {
        return makeError<std::string>(timePoint.error());
    }
    const std::tm tm = toUtcTm(*timePoint);

    // Literal text is copied as is; only single conversions reach fmt
    std::string out;
    out.reserve(pattern.size() * 2);
    std::size_t pos = 0;
    while (pos < pattern.size()) {
        const std::size_t percent = pattern.find('%', pos);
        out.append(pattern.substr(pos, percent - pos));
        if (percent == std::string_view::npos) {
            break;
        }

        auto conversion = conversionAt(pattern, percent);
        if (!conversion) {
            return makeError<std::string>(conversion.error());
        }
        auto rendered = renderConversion(*conversion, tm);
        if (!rendered) {
            return makeError<std::string>(rendered.error());
        }
        out.append(*rendered);
        pos = percent + conversion->size();
    }

    return out;
}

const ChronoCalendar& ChronoCalendar::instance() noexcept {
    static const ChronoCalendar calendar;
    return calendar;
}

}  // namespace geotime::display
