// =============================================================================
// geotime - Lexical Codec Tests
// =============================================================================
// Unit tests for the order-preserving codecs: known encodings, decode
// rejection rules and the typed wrappers.
// =============================================================================

#include "geotime/codec/lexical_codec.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "geotime/common/logger.h"

namespace geotime::codec {
namespace {

/// @brief -10^21 ms, roughly 31.7 million years before the epoch.
const Timestamp kDeepPast{-static_cast<Int128>(1'000'000'000'000'000'000) * 1000};

// =============================================================================
// Known Encodings
// =============================================================================

TEST(LexicalCodecTest, HexKnownValues) {
    EXPECT_EQ(kHexCodec.encode(Timestamp{0}), "80000000000000000000000000000000");
    EXPECT_EQ(kHexCodec.encode(kDeepPast), "7fffffffffffffc9ca36523a21600000");
    EXPECT_EQ(kHexCodec.encode(Timestamp{-100}), "7fffffffffffffffffffffffffffff9c");
    EXPECT_EQ(kHexCodec.encode(Timestamp{-1}), "7fffffffffffffffffffffffffffffff");
    EXPECT_EQ(kHexCodec.encode(Timestamp{1}), "80000000000000000000000000000001");
    EXPECT_EQ(kHexCodec.encode(Timestamp::min()), "00000000000000000000000000000000");
    EXPECT_EQ(kHexCodec.encode(Timestamp::max()), "ffffffffffffffffffffffffffffffff");
}

TEST(LexicalCodecTest, Base32HexKnownValues) {
    EXPECT_EQ(kBase32HexCodec.encode(Timestamp{0}), "G0000000000000000000000000");
    EXPECT_EQ(kBase32HexCodec.encode(kDeepPast), "FVVVVVVVVVVSJIHMA8T22O0000");
    EXPECT_EQ(kBase32HexCodec.encode(Timestamp{-100}), "FVVVVVVVVVVVVVVVVVVVVVVVJG");
    EXPECT_EQ(kBase32HexCodec.encode(Timestamp{-1}), "FVVVVVVVVVVVVVVVVVVVVVVVVS");
    EXPECT_EQ(kBase32HexCodec.encode(Timestamp{1}), "G0000000000000000000000004");
    EXPECT_EQ(kBase32HexCodec.encode(Timestamp{100}), "G00000000000000000000000CG");
    EXPECT_EQ(kBase32HexCodec.encode(Timestamp::min()), "00000000000000000000000000");
    EXPECT_EQ(kBase32HexCodec.encode(Timestamp::max()), "VVVVVVVVVVVVVVVVVVVVVVVVVS");
}

TEST(LexicalCodecTest, GeohashKnownValues) {
    EXPECT_EQ(kGeohashCodec.encode(Timestamp{0}), "h0000000000000000000000000");
    EXPECT_EQ(kGeohashCodec.encode(kDeepPast), "gzzzzzzzzzzwmkjqb8x22s0000");
    EXPECT_EQ(kGeohashCodec.encode(Timestamp{-100}), "gzzzzzzzzzzzzzzzzzzzzzzzmh");
    EXPECT_EQ(kGeohashCodec.encode(Timestamp{100}), "h00000000000000000000000dh");
    EXPECT_EQ(kGeohashCodec.encode(Timestamp::max()), "zzzzzzzzzzzzzzzzzzzzzzzzzw");
}

TEST(LexicalCodecTest, Base64KnownValues) {
    EXPECT_EQ(kBase64Codec.encode(Timestamp{0}), "V000000000000000000000");
    EXPECT_EQ(kBase64Codec.encode(kDeepPast), "Uzzzzzzzzwb:C_8u8L0000");
    EXPECT_EQ(kBase64Codec.encode(Timestamp{-1}), "Uzzzzzzzzzzzzzzzzzzzzk");
    EXPECT_EQ(kBase64Codec.encode(Timestamp{1}), "V00000000000000000000F");
    EXPECT_EQ(kBase64Codec.encode(Timestamp{1'700'000'000'000}), "V00000000000006AnyKc00");
    EXPECT_EQ(kBase64Codec.encode(Timestamp::min()), "0000000000000000000000");
    EXPECT_EQ(kBase64Codec.encode(Timestamp::max()), "zzzzzzzzzzzzzzzzzzzzzk");
}

TEST(LexicalCodecTest, DecodesKnownValues) {
    EXPECT_EQ(kBase32HexCodec.decode("FVVVVVVVVVVSJIHMA8T22O0000").value(), kDeepPast);
    EXPECT_EQ(kHexCodec.decode("7fffffffffffffffffffffffffffff9c").value(), Timestamp{-100});
    EXPECT_EQ(kGeohashCodec.decode("h00000000000000000000000dh").value(), Timestamp{100});
    EXPECT_EQ(kBase64Codec.decode("0000000000000000000000").value(), Timestamp::min());
}

TEST(LexicalCodecTest, OrderMatchesAcrossKnownValues) {
    const std::vector<Timestamp> sorted = {Timestamp::min(), kDeepPast,    Timestamp{-100},
                                           Timestamp{-1},    Timestamp{0}, Timestamp{1},
                                           Timestamp{100},   Timestamp::max()};

    for (CodecKind kind : kAllCodecKinds) {
        const auto& lexical = codecFor(kind);
        std::vector<std::string> encoded;
        for (Timestamp ts : sorted) {
            encoded.push_back(lexical.encode(ts));
        }
        EXPECT_TRUE(std::is_sorted(encoded.begin(), encoded.end())) << lexical.name();
        EXPECT_TRUE(std::adjacent_find(encoded.begin(), encoded.end()) == encoded.end())
            << lexical.name();
    }
}

// =============================================================================
// Decode Rejection
// =============================================================================

void expectDecodeError(const LexicalCodec& lexical, std::string_view text) {
    auto result = lexical.decode(text);
    ASSERT_FALSE(result.has_value()) << lexical.name() << " accepted \"" << text << "\"";
    EXPECT_EQ(result.error().code(), ErrorCode::kDecodeError);
}

TEST(LexicalCodecTest, RejectsWrongWidth) {
    expectDecodeError(kHexCodec, "");
    expectDecodeError(kHexCodec, "8000000000000000000000000000000");
    expectDecodeError(kHexCodec, "800000000000000000000000000000000");
    expectDecodeError(kBase32HexCodec, "G000000000000000000000000");
    expectDecodeError(kBase64Codec, "V0000000000000000000000");
}

TEST(LexicalCodecTest, RejectsForeignSymbols) {
    expectDecodeError(kHexCodec, "8000000000000000000000000000000G");
    expectDecodeError(kHexCodec, "8000000000000000000000000000000A");
    expectDecodeError(kBase32HexCodec, "g0000000000000000000000000");
    expectDecodeError(kBase32HexCodec, "W0000000000000000000000000");
    expectDecodeError(kGeohashCodec, "ha000000000000000000000000");
    expectDecodeError(kBase64Codec, "V+00000000000000000000");
}

TEST(LexicalCodecTest, RejectsNonZeroPadBits) {
    // Two pad bits in base32hex and geohash, four in base64
    expectDecodeError(kBase32HexCodec, "G000000000000000000000000T");
    expectDecodeError(kBase32HexCodec, "G0000000000000000000000001");
    expectDecodeError(kGeohashCodec, "h0000000000000000000000001");
    expectDecodeError(kBase64Codec, "V000000000000000000001");
    expectDecodeError(kBase64Codec, "V00000000000000000000G");
}

TEST(LexicalCodecTest, ErrorMessageNamesCodec) {
    auto result = kBase32HexCodec.decode("nope");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message().find("base32hex"), std::string::npos);
}

TEST(LexicalCodecTest, RejectionLeavesLoggingUnconfigured) {
    ASSERT_FALSE(log::isInitialized());
    for (const LexicalCodec* lexical : {&kHexCodec, &kBase32HexCodec, &kGeohashCodec,
                                        &kBase64Codec}) {
        EXPECT_FALSE(lexical->decode("not a timestamp").has_value());
    }
    EXPECT_FALSE(log::isInitialized());
    EXPECT_EQ(log::logger(), nullptr);
}

// =============================================================================
// Codec Kind Helpers
// =============================================================================

TEST(CodecKindTest, NamesRoundTrip) {
    for (CodecKind kind : kAllCodecKinds) {
        auto parsed = parseCodecKind(codecKindToString(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_EQ(parseCodecKind("BASE32HEX").value(), CodecKind::kBase32Hex);
    EXPECT_EQ(codecKindToString(CodecKind::kGeohash), "geohash");
}

TEST(CodecKindTest, UnknownName) {
    auto result = parseCodecKind("base58");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
}

// =============================================================================
// Typed Wrappers
// =============================================================================

TEST(LexicalWrapperTest, ToAndFromString) {
    const LexicalBase32Hex value{Timestamp{-100}};
    EXPECT_EQ(value.toString(), "FVVVVVVVVVVVVVVVVVVVVVVVJG");

    auto parsed = LexicalBase32Hex::fromString("FVVVVVVVVVVVVVVVVVVVVVVVJG");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, value);
    EXPECT_EQ(parsed->timestamp(), Timestamp{-100});

    EXPECT_EQ(LexicalHex{Timestamp{0}}.toString(), "80000000000000000000000000000000");
    EXPECT_EQ(LexicalGeohash{Timestamp{0}}.toString(), "h0000000000000000000000000");
    EXPECT_EQ(LexicalBase64{Timestamp{0}}.toString(), "V000000000000000000000");
}

TEST(LexicalWrapperTest, OrderingFollowsTimestamp) {
    EXPECT_LT(LexicalHex{Timestamp{-1}}, LexicalHex{Timestamp{0}});
    EXPECT_LT(LexicalHex{Timestamp{-1}}.toString(), LexicalHex{Timestamp{0}}.toString());
}

TEST(LexicalWrapperTest, FromStringPropagatesDecodeError) {
    auto parsed = LexicalGeohash::fromString("G0000000000000000000000000");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code(), ErrorCode::kDecodeError);
}

}  // namespace
}  // namespace geotime::codec
