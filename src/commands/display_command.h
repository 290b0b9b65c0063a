// =============================================================================
// geotime - Display Command
// =============================================================================
// Command handler for rendering millisecond offsets for humans.
//
// This module provides:
// - DisplayCommand: render through the calendar / magnitude / raw tiers
// - Optional reporting of the tier chosen and a custom magnitude policy
// =============================================================================

#ifndef GEOTIME_COMMANDS_DISPLAY_COMMAND_H
#define GEOTIME_COMMANDS_DISPLAY_COMMAND_H

#include <iosfwd>
#include <string>
#include <vector>

#include "geotime/common/error.h"
#include "geotime/display/display_pipeline.h"
#include "geotime/display/magnitude_formatter.h"

namespace geotime::commands {

// =============================================================================
// Display Options
// =============================================================================

/// @brief Configuration options for display command.
struct DisplayOptions {
    /// @brief Decimal millisecond offsets to render.
    std::vector<std::string> values;

    /// @brief Calendar pattern (chrono conversion specifiers).
    std::string pattern{display::kDefaultPattern};

    /// @brief Prefix each line with the tier that produced it.
    bool showTier = false;

    /// @brief Magnitude tier policy.
    display::MagnitudeConfig magnitude;
};

// =============================================================================
// DisplayCommand Class
// =============================================================================

/// @brief Command handler for display rendering.
class DisplayCommand {
public:
    DisplayCommand(DisplayOptions options, std::ostream& out);

    /// @brief Execute the display command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const DisplayOptions& options() const noexcept { return options_; }

private:
    DisplayOptions options_;
    std::ostream* out_;
};

}  // namespace geotime::commands

#endif  // GEOTIME_COMMANDS_DISPLAY_COMMAND_H
