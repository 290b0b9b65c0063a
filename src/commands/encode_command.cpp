// =============================================================================
// geotime - Encode Command Implementation
// =============================================================================

#include "encode_command.h"

#include <ostream>
#include <utility>

#include "geotime/common/logger.h"
#include "geotime/core/timestamp.h"

namespace geotime::commands {

EncodeCommand::EncodeCommand(EncodeOptions options, std::ostream& out)
    : options_(std::move(options)), out_(&out) {}

int EncodeCommand::execute() {
    try {
        for (const auto& text : options_.values) {
            const Timestamp ts{unwrapOrThrow(parseInt128(text))};

            if (!options_.allCodecs) {
                *out_ << codec::codecFor(options_.codec).encode(ts) << '\n';
                continue;
            }

            for (codec::CodecKind kind : codec::kAllCodecKinds) {
                const auto& lexical = codec::codecFor(kind);
                *out_ << lexical.name() << '\t' << lexical.encode(ts) << '\n';
            }
        }
        return 0;

    } catch (const GeotimeException& e) {
        GEOTIME_LOG_ERROR("Encode failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace geotime::commands
