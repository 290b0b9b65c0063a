// =============================================================================
// geotime - Order-Preserving Lexical Codecs Implementation
// =============================================================================

#include "geotime/codec/lexical_codec.h"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

#include "geotime/common/logger.h"

namespace geotime::codec {

// =============================================================================
// Codec Kind Helpers
// =============================================================================

std::string_view codecKindToString(CodecKind kind) noexcept {
    return codecFor(kind).name();
}

Result<CodecKind> parseCodecKind(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (CodecKind kind : kAllCodecKinds) {
        if (codecFor(kind).name() == lower) {
            return kind;
        }
    }
    return makeError<CodecKind>(ErrorCode::kInvalidArgument,
                                fmt::format("unknown codec '{}'", name));
}

const LexicalCodec& codecFor(CodecKind kind) noexcept {
    switch (kind) {
        case CodecKind::kHex:
            return kHexCodec;
        case CodecKind::kBase32Hex:
            return kBase32HexCodec;
        case CodecKind::kGeohash:
            return kGeohashCodec;
        case CodecKind::kBase64:
            return kBase64Codec;
    }
    return kHexCodec;
}

// =============================================================================
// LexicalCodec Implementation
// =============================================================================

std::string LexicalCodec::encode(Timestamp ts) const {
    const unsigned bits = alphabet_.bitsPerSymbol();
    const unsigned pad = alphabet_.padBits();
    const UInt128 mask = (static_cast<UInt128>(1) << bits) - 1;

    std::string out(width(), alphabet_.zeroSymbol());
    UInt128 rest = biasSigned(ts.millis());

    // Least significant symbol first; the last symbol holds the pad bits
    auto pos = out.size();
    out[--pos] = alphabet_.symbol(static_cast<std::size_t>((rest << pad) & mask));
    rest >>= bits - pad;
    while (pos > 0) {
        out[--pos] = alphabet_.symbol(static_cast<std::size_t>(rest & mask));
        rest >>= bits;
    }

    return out;
}

Result<Timestamp> LexicalCodec::decode(std::string_view text) const {
    if (text.size() != width()) {
        return makeError<Timestamp>(decodeError(
            text, fmt::format("expected {} symbols, got {}", width(), text.size())));
    }

    const unsigned bits = alphabet_.bitsPerSymbol();
    const unsigned pad = alphabet_.padBits();

    UInt128 biased = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const int digit = alphabet_.indexOf(text[i]);
        if (digit < 0) {
            return makeError<Timestamp>(decodeError(
                text, fmt::format("symbol '{}' at position {} is not in the alphabet",
                                  text[i], i)));
        }

        const auto value = static_cast<UInt128>(digit);
        if (i + 1 < text.size()) {
            biased = (biased << bits) | value;
            continue;
        }

        if ((value & ((static_cast<UInt128>(1) << pad) - 1)) != 0) {
            return makeError<Timestamp>(decodeError(
                text, fmt::format("final symbol '{}' sets {} pad bits that must be zero",
                                  text[i], pad)));
        }
        biased = (biased << (bits - pad)) | (value >> pad);
    }

    return Timestamp{unbiasUnsigned(biased)};
}

Error LexicalCodec::decodeError(std::string_view text, std::string reason) const {
    GEOTIME_LOG_DEBUG("{} decode rejected \"{}\": {}", name_, text, reason);
    return Error{ErrorCode::kDecodeError,
                 fmt::format("invalid {} string \"{}\": {}", name_, text, reason)};
}

}  // namespace geotime::codec
