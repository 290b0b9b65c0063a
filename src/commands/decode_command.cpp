// =============================================================================
// geotime - Decode Command Implementation
// =============================================================================

#include "decode_command.h"

#include <ostream>
#include <utility>

#include "geotime/common/logger.h"
#include "geotime/core/timestamp.h"

namespace geotime::commands {

DecodeCommand::DecodeCommand(DecodeOptions options, std::ostream& out)
    : options_(std::move(options)), out_(&out) {}

int DecodeCommand::execute() {
    try {
        const auto& lexical = codec::codecFor(options_.codec);

        for (const auto& input : options_.inputs) {
            auto decoded = lexical.decode(input);
            if (!decoded) {
                throw DecodeError(decoded.error().message(),
                                  ErrorContext{std::string(lexical.name())}.withInput(input));
            }

            *out_ << int128ToString(decoded->millis());
            if (options_.showDisplay) {
                *out_ << '\t' << display::display(*decoded, options_.pattern);
            }
            *out_ << '\n';
        }
        return 0;

    } catch (const GeotimeException& e) {
        GEOTIME_LOG_ERROR("Decode failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace geotime::commands
