// =============================================================================
// geotime - Display Command Implementation
// =============================================================================

#include "display_command.h"

#include <ostream>
#include <utility>

#include "geotime/common/logger.h"
#include "geotime/core/timestamp.h"
#include "geotime/display/calendar_backend.h"

namespace geotime::commands {

DisplayCommand::DisplayCommand(DisplayOptions options, std::ostream& out)
    : options_(std::move(options)), out_(&out) {}

int DisplayCommand::execute() {
    try {
        const display::DisplayPipeline pipeline{display::ChronoCalendar::instance(),
                                                display::MagnitudeFormatter{options_.magnitude}};

        for (const auto& text : options_.values) {
            const Timestamp ts{unwrapOrThrow(parseInt128(text))};
            const auto rendering = pipeline.render(ts, options_.pattern);

            GEOTIME_LOG_DEBUG("{} rendered by {} tier", text,
                              display::formatTierToString(rendering.tier));
            if (options_.showTier) {
                *out_ << display::formatTierToString(rendering.tier) << '\t';
            }
            *out_ << rendering.text << '\n';
        }
        return 0;

    } catch (const GeotimeException& e) {
        GEOTIME_LOG_ERROR("Display failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace geotime::commands
