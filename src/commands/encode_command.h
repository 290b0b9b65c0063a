// =============================================================================
// geotime - Encode Command
// =============================================================================
// Command handler for converting millisecond offsets to lexical strings.
//
// This module provides:
// - EncodeCommand: encode one or more offsets with a chosen codec
// - Optional output of every codec at once
// =============================================================================

#ifndef GEOTIME_COMMANDS_ENCODE_COMMAND_H
#define GEOTIME_COMMANDS_ENCODE_COMMAND_H

#include <iosfwd>
#include <string>
#include <vector>

#include "geotime/codec/lexical_codec.h"
#include "geotime/common/error.h"

namespace geotime::commands {

// =============================================================================
// Encode Options
// =============================================================================

/// @brief Configuration options for encode command.
struct EncodeOptions {
    /// @brief Decimal millisecond offsets to encode.
    std::vector<std::string> values;

    /// @brief Codec to encode with.
    codec::CodecKind codec = codec::CodecKind::kHex;

    /// @brief Print the encoding in every codec, one per line.
    bool allCodecs = false;
};

// =============================================================================
// EncodeCommand Class
// =============================================================================

/// @brief Command handler for encoding offsets.
class EncodeCommand {
public:
    /// @brief Construct with options, writing results to out.
    EncodeCommand(EncodeOptions options, std::ostream& out);

    /// @brief Execute the encode command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const EncodeOptions& options() const noexcept { return options_; }

private:
    EncodeOptions options_;
    std::ostream* out_;
};

}  // namespace geotime::commands

#endif  // GEOTIME_COMMANDS_ENCODE_COMMAND_H
