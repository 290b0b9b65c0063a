// =============================================================================
// geotime - Lexical Codec Property Tests
// =============================================================================
// Property-based tests for the codecs over the whole 128-bit range.
//
// Properties, for every codec:
// - decode(encode(t)) == t
// - encode(t) always has the codec's fixed width
// - compare(encode(a), encode(b)) == compare(a, b)
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <compare>
#include <cstdint>
#include <string>

#include "geotime/codec/lexical_codec.h"

namespace geotime::codec::test {

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief Any timestamp, assembled from two 64-bit halves.
[[nodiscard]] rc::Gen<Timestamp> uniformTimestamp() {
    return rc::gen::apply(
        [](std::uint64_t high, std::uint64_t low) {
            return Timestamp{static_cast<Int128>((static_cast<UInt128>(high) << 64) | low)};
        },
        rc::gen::arbitrary<std::uint64_t>(), rc::gen::arbitrary<std::uint64_t>());
}

/// @brief Timestamps near zero, the extremes and the 64-bit boundaries.
[[nodiscard]] rc::Gen<Timestamp> edgeTimestamp() {
    return rc::gen::element(Timestamp::min(), Timestamp{kInt128Min + 1}, Timestamp{-1},
                            Timestamp{0}, Timestamp{1}, Timestamp{INT64_MIN},
                            Timestamp{INT64_MAX}, Timestamp{kInt128Max - 1}, Timestamp::max());
}

/// @brief Mostly uniform timestamps with edge values mixed in.
[[nodiscard]] rc::Gen<Timestamp> timestamp() {
    return rc::gen::weightedOneOf<Timestamp>({
        {4, uniformTimestamp()},
        {1, edgeTimestamp()},
        {2, rc::gen::map(rc::gen::arbitrary<std::int64_t>(),
                         [](std::int64_t ms) { return Timestamp{ms}; })},
    });
}

/// @brief Any shipped codec.
[[nodiscard]] rc::Gen<CodecKind> codecKind() {
    return rc::gen::elementOf(kAllCodecKinds);
}

}  // namespace gen

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(LexicalCodecProperty, RoundTrip, ()) {
    const auto& lexical = codecFor(*gen::codecKind());
    const Timestamp ts = *gen::timestamp();

    auto decoded = lexical.decode(lexical.encode(ts));
    RC_ASSERT(decoded.has_value());
    RC_ASSERT(*decoded == ts);
}

RC_GTEST_PROP(LexicalCodecProperty, FixedWidth, ()) {
    const auto& lexical = codecFor(*gen::codecKind());
    const Timestamp ts = *gen::timestamp();

    RC_ASSERT(lexical.encode(ts).size() == lexical.width());
}

RC_GTEST_PROP(LexicalCodecProperty, PreservesOrder, ()) {
    const auto& lexical = codecFor(*gen::codecKind());
    const Timestamp a = *gen::timestamp();
    const Timestamp b = *gen::timestamp();

    const std::string encodedA = lexical.encode(a);
    const std::string encodedB = lexical.encode(b);
    const bool sameOrder = (encodedA <=> encodedB) == (a <=> b);
    RC_ASSERT(sameOrder);
}

RC_GTEST_PROP(LexicalCodecProperty, AdjacentValuesStayOrdered, ()) {
    const auto& lexical = codecFor(*gen::codecKind());
    const Timestamp ts = *gen::timestamp();
    RC_PRE(ts != Timestamp::max());

    const Timestamp next{ts.millis() + 1};
    RC_ASSERT(lexical.encode(ts) < lexical.encode(next));
}

RC_GTEST_PROP(LexicalCodecProperty, AcceptedStringsAreCanonical, ()) {
    const auto& lexical = codecFor(*gen::codecKind());
    const auto& symbols = lexical.alphabet().symbols();
    const auto text = *rc::gen::container<std::string>(
        lexical.width(), rc::gen::elementOf(std::string(symbols)));

    // Every string decode accepts is the encoding of the value it yields
    auto decoded = lexical.decode(text);
    if (decoded) {
        RC_ASSERT(lexical.encode(*decoded) == text);
    } else {
        RC_ASSERT(decoded.error().code() == ErrorCode::kDecodeError);
    }
}

RC_GTEST_PROP(LexicalCodecProperty, TypedWrapperMatchesCodec, ()) {
    const Timestamp ts = *gen::timestamp();

    RC_ASSERT(LexicalBase32Hex{ts}.toString() == kBase32HexCodec.encode(ts));
    auto parsed = LexicalBase64::fromString(kBase64Codec.encode(ts));
    RC_ASSERT(parsed.has_value());
    RC_ASSERT(parsed->timestamp() == ts);
}

}  // namespace geotime::codec::test
