// =============================================================================
// geotime - Magnitude Formatter Implementation
// =============================================================================

#include "geotime/display/magnitude_formatter.h"

#include <fmt/format.h>

#include <cmath>
#include <cstddef>

#include "geotime/common/logger.h"

namespace geotime::display {

// =============================================================================
// MagnitudeConfig Implementation
// =============================================================================

VoidResult MagnitudeConfig::validate() const {
    if (millisPerYear <= 0) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("millisPerYear must be positive, got {}", millisPerYear));
    }
    if (decimals < 0 || decimals > kMaxMagnitudeDecimals) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("decimals must be in 0..{}, got {}",
                                         kMaxMagnitudeDecimals, decimals));
    }
    if (!std::isfinite(maxYears) || maxYears <= 0.0) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("maxYears must be positive and finite, got {}", maxYears));
    }
    if (maxYears > kDefaultMaxMagnitudeYears) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("maxYears {} exceeds the largest unit ({})", maxYears,
                                         kDefaultMaxMagnitudeYears));
    }
    return makeVoidSuccess();
}

// =============================================================================
// MagnitudeFormatter Implementation
// =============================================================================

MagnitudeFormatter::MagnitudeFormatter(MagnitudeConfig config) : config_(config) {
    unwrapOrThrow(config_.validate());
}

double MagnitudeFormatter::years(Timestamp ts) const noexcept {
    return static_cast<double>(ts.millis()) / static_cast<double>(config_.millisPerYear);
}

Result<std::string> MagnitudeFormatter::format(Timestamp ts) const {
    const double signedYears = years(ts);
    const double absYears = std::fabs(signedYears);

    if (!std::isfinite(absYears) || absYears >= config_.maxYears) {
        GEOTIME_LOG_DEBUG("magnitude of {} years exceeds limit {}", absYears, config_.maxYears);
        return makeError<std::string>(
            ErrorCode::kUnsafeMagnitude,
            fmt::format("{} years is beyond the magnitude limit {}", absYears, config_.maxYears));
    }

    double value = absYears;
    std::size_t unit = 0;
    while (value >= kMagnitudeStep && unit + 1 < kMagnitudeUnits.size()) {
        value /= kMagnitudeStep;
        ++unit;
    }

    // 999.999 K rounds to 1000.00; carry into the next suffix
    const double scale = std::pow(10.0, config_.decimals);
    if (std::round(value * scale) / scale >= kMagnitudeStep) {
        if (unit + 1 == kMagnitudeUnits.size()) {
            GEOTIME_LOG_DEBUG("magnitude of {} years rounds past the last unit", absYears);
            return makeError<std::string>(
                ErrorCode::kUnsafeMagnitude,
                fmt::format("{} years rounds past {} {}", absYears, kMagnitudeStep,
                            kMagnitudeUnits.back()));
        }
        value /= kMagnitudeStep;
        ++unit;
    }

    const std::string_view direction = ts.millis() < 0 ? kPastSuffix : kFutureSuffix;
    if (kMagnitudeUnits[unit].empty()) {
        return fmt::format("{:.{}f} years {}", value, config_.decimals, direction);
    }
    return fmt::format("{:.{}f} {} years {}", value, config_.decimals, kMagnitudeUnits[unit],
                       direction);
}

}  // namespace geotime::display
