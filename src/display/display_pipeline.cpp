// =============================================================================
// geotime - Display Pipeline Implementation
// =============================================================================

#include "geotime/display/display_pipeline.h"

#include <fmt/format.h>

#include <array>
#include <exception>
#include <utility>

#include "geotime/common/logger.h"

namespace geotime::display {

namespace {

/// @brief Fallible tiers in the order they are attempted.
constexpr std::array<FormatTier, 2> kFallibleTiers = {FormatTier::kCalendar,
                                                      FormatTier::kMagnitude};

}  // namespace

std::string_view formatTierToString(FormatTier tier) noexcept {
    switch (tier) {
        case FormatTier::kCalendar:
            return "calendar";
        case FormatTier::kMagnitude:
            return "magnitude";
        case FormatTier::kRawFallback:
            return "raw";
    }
    return "raw";
}

// =============================================================================
// DisplayPipeline Implementation
// =============================================================================

DisplayPipeline::DisplayPipeline() noexcept : DisplayPipeline(ChronoCalendar::instance()) {}

DisplayPipeline::DisplayPipeline(const CalendarBackend& calendar,
                                 MagnitudeFormatter magnitude) noexcept
    : calendar_(&calendar), magnitude_(std::move(magnitude)) {}

Result<Rendering> DisplayPipeline::calendarTier(Timestamp ts, std::string_view pattern) const {
    auto text = calendar_->format(ts, pattern);
    if (!text) {
        return makeError<Rendering>(text.error());
    }
    return Rendering{FormatTier::kCalendar, std::move(*text)};
}

Result<Rendering> DisplayPipeline::magnitudeTier(Timestamp ts) const {
    auto text = magnitude_.format(ts);
    if (!text) {
        return makeError<Rendering>(text.error());
    }
    return Rendering{FormatTier::kMagnitude, std::move(*text)};
}

Result<Rendering> DisplayPipeline::attemptTier(FormatTier tier, Timestamp ts,
                                               std::string_view pattern) const noexcept {
    try {
        auto attempt = tier == FormatTier::kCalendar ? calendarTier(ts, pattern) : magnitudeTier(ts);
        if (!attempt) {
            GEOTIME_LOG_DEBUG("{} tier declined: {}", formatTierToString(tier),
                              attempt.error().message());
        }
        return attempt;
    } catch (const std::exception& e) {
        // A throwing backend counts as a declined tier
        return makeError<Rendering>(ErrorCode::kInvalidArgument, e.what());
    }
}

Rendering DisplayPipeline::render(Timestamp ts, std::string_view pattern) const noexcept {
    for (FormatTier tier : kFallibleTiers) {
        auto attempt = attemptTier(tier, ts, pattern);
        if (attempt) {
            return std::move(*attempt);
        }
    }

    return Rendering{FormatTier::kRawFallback, rawFallback(ts)};
}

std::string DisplayPipeline::display(Timestamp ts, std::string_view pattern) const noexcept {
    return render(ts, pattern).text;
}

std::string DisplayPipeline::rawFallback(Timestamp ts) {
    return fmt::format("{} ms ago", ts.toDebugString());
}

// =============================================================================
// Convenience Functions
// =============================================================================

std::string display(Timestamp ts, std::string_view pattern) noexcept {
    static const DisplayPipeline pipeline;
    return pipeline.display(ts, pattern);
}

}  // namespace geotime::display
