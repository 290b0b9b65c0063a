// =============================================================================
// geotime - Order-Preserving Lexical Codecs
// =============================================================================
// Fixed-width string encodings of a Timestamp whose byte-wise order matches
// the numeric order of the timestamps.
//
// Encoding:
// 1. Bias the signed value into the unsigned range (flip the sign bit).
// 2. Emit the biased value most-significant bit first in groups of
//    bitsPerSymbol() bits, one symbol per group.
// 3. Pad the final group with zero bits so the output is exactly width()
//    symbols long.
//
// Decoding reverses the steps and rejects, with kDecodeError, strings of the
// wrong width, symbols outside the alphabet and non-zero pad bits. Every
// accepted string is the encoding of exactly one value.
//
// Four instantiations share the engine: hex (32), base32hex (26),
// geohash (26) and base64 (22).
// =============================================================================

#ifndef GEOTIME_CODEC_LEXICAL_CODEC_H
#define GEOTIME_CODEC_LEXICAL_CODEC_H

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "geotime/codec/alphabet.h"
#include "geotime/common/error.h"
#include "geotime/core/timestamp.h"

namespace geotime::codec {

// =============================================================================
// Codec Kind Enumeration
// =============================================================================

/// @brief The concrete codecs shipped with the library.
enum class CodecKind : std::uint8_t {
    kHex = 0,
    kBase32Hex = 1,
    kGeohash = 2,
    kBase64 = 3
};

/// @brief All codec kinds in declaration order.
inline constexpr std::array<CodecKind, 4> kAllCodecKinds = {
    CodecKind::kHex, CodecKind::kBase32Hex, CodecKind::kGeohash, CodecKind::kBase64};

/// @brief Canonical name of a codec kind ("hex", "base32hex", "geohash", "base64").
[[nodiscard]] std::string_view codecKindToString(CodecKind kind) noexcept;

/// @brief Parse a codec name (case-insensitive).
/// @return kInvalidArgument for unknown names.
[[nodiscard]] Result<CodecKind> parseCodecKind(std::string_view name);

// =============================================================================
// LexicalCodec Class
// =============================================================================

/// @brief Fixed-width order-preserving codec over one alphabet.
/// @note Stateless after construction; safe to share across threads.
class LexicalCodec {
public:
    constexpr LexicalCodec(std::string_view name, Alphabet alphabet) noexcept
        : name_(name), alphabet_(alphabet) {}

    /// @brief Encode a timestamp; the result is always width() symbols.
    [[nodiscard]] std::string encode(Timestamp ts) const;

    /// @brief Decode a string produced by encode().
    /// @return kDecodeError on wrong width, unknown symbol or non-zero pad bits.
    [[nodiscard]] Result<Timestamp> decode(std::string_view text) const;

    [[nodiscard]] constexpr std::string_view name() const noexcept { return name_; }
    [[nodiscard]] constexpr const Alphabet& alphabet() const noexcept { return alphabet_; }
    [[nodiscard]] constexpr std::size_t width() const noexcept { return alphabet_.width(); }

private:
    /// @brief Build the decode error for the given input.
    [[nodiscard]] Error decodeError(std::string_view text, std::string reason) const;

    std::string_view name_;
    Alphabet alphabet_;
};

// =============================================================================
// Codec Instances
// =============================================================================

inline constexpr LexicalCodec kHexCodec{"hex", Alphabet{kHexSymbols}};
inline constexpr LexicalCodec kBase32HexCodec{"base32hex", Alphabet{kBase32HexSymbols}};
inline constexpr LexicalCodec kGeohashCodec{"geohash", Alphabet{kGeohashSymbols}};
inline constexpr LexicalCodec kBase64Codec{"base64", Alphabet{kBase64Symbols}};

static_assert(kHexCodec.alphabet().isValid() && kHexCodec.width() == 32);
static_assert(kBase32HexCodec.alphabet().isValid() && kBase32HexCodec.width() == 26);
static_assert(kGeohashCodec.alphabet().isValid() && kGeohashCodec.width() == 26);
static_assert(kBase64Codec.alphabet().isValid() && kBase64Codec.width() == 22);

/// @brief Look up the codec instance for a kind.
[[nodiscard]] const LexicalCodec& codecFor(CodecKind kind) noexcept;

// =============================================================================
// Typed Lexical Wrappers
// =============================================================================

/// @brief A Timestamp tagged with the codec used to serialize it.
/// @tparam Kind The codec used by toString() and fromString().
template <CodecKind Kind>
class Lexical {
public:
    constexpr explicit Lexical(Timestamp ts) noexcept : timestamp_(ts) {}

    /// @brief Parse the codec's string form.
    [[nodiscard]] static Result<Lexical> fromString(std::string_view text) {
        auto decoded = codecFor(Kind).decode(text);
        if (!decoded) {
            return makeError<Lexical>(decoded.error());
        }
        return Lexical{*decoded};
    }

    /// @brief The codec's string form.
    [[nodiscard]] std::string toString() const { return codecFor(Kind).encode(timestamp_); }

    [[nodiscard]] constexpr Timestamp timestamp() const noexcept { return timestamp_; }

    friend constexpr bool operator==(const Lexical&, const Lexical&) noexcept = default;
    friend constexpr auto operator<=>(const Lexical&, const Lexical&) noexcept = default;

private:
    Timestamp timestamp_;
};

using LexicalHex = Lexical<CodecKind::kHex>;
using LexicalBase32Hex = Lexical<CodecKind::kBase32Hex>;
using LexicalGeohash = Lexical<CodecKind::kGeohash>;
using LexicalBase64 = Lexical<CodecKind::kBase64>;

}  // namespace geotime::codec

#endif  // GEOTIME_CODEC_LEXICAL_CODEC_H
