// =============================================================================
// geotime - Decode Command
// =============================================================================
// Command handler for converting lexical strings back to millisecond offsets.
// =============================================================================

#ifndef GEOTIME_COMMANDS_DECODE_COMMAND_H
#define GEOTIME_COMMANDS_DECODE_COMMAND_H

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "geotime/codec/lexical_codec.h"
#include "geotime/common/error.h"
#include "geotime/display/display_pipeline.h"

namespace geotime::commands {

// =============================================================================
// Decode Options
// =============================================================================

/// @brief Configuration options for decode command.
struct DecodeOptions {
    /// @brief Lexical strings to decode.
    std::vector<std::string> inputs;

    /// @brief Codec the strings were produced with.
    codec::CodecKind codec = codec::CodecKind::kHex;

    /// @brief Also print the display rendering of each value.
    bool showDisplay = false;

    /// @brief Calendar pattern used with showDisplay.
    std::string pattern{display::kDefaultPattern};
};

// =============================================================================
// DecodeCommand Class
// =============================================================================

/// @brief Command handler for decoding lexical strings.
class DecodeCommand {
public:
    DecodeCommand(DecodeOptions options, std::ostream& out);

    /// @brief Execute the decode command.
    /// @return Exit code (0 = success, 2 = malformed input).
    [[nodiscard]] int execute();

    [[nodiscard]] const DecodeOptions& options() const noexcept { return options_; }

private:
    DecodeOptions options_;
    std::ostream* out_;
};

}  // namespace geotime::commands

#endif  // GEOTIME_COMMANDS_DECODE_COMMAND_H
