// =============================================================================
// geotime - Timestamp Tests
// =============================================================================
// Unit tests for the Timestamp value type and 128-bit decimal helpers.
// =============================================================================

#include "geotime/core/timestamp.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <sstream>

namespace geotime {
namespace {

constexpr const char* kInt128MaxText = "170141183460469231731687303715884105727";
constexpr const char* kInt128MinText = "-170141183460469231731687303715884105728";

// =============================================================================
// Construction and Ordering
// =============================================================================

TEST(TimestampTest, DefaultIsEpoch) {
    EXPECT_EQ(Timestamp{}.millis(), 0);
    EXPECT_EQ(Timestamp{}, Timestamp::epoch());
}

TEST(TimestampTest, IntegerConstruction) {
    EXPECT_EQ(Timestamp{-100}.millis(), -100);
    EXPECT_EQ(Timestamp{std::uint64_t{1} << 63}.millis(), static_cast<Int128>(1) << 63);
    EXPECT_EQ(Timestamp::fromMillis(kInt128Min), Timestamp::min());
    EXPECT_EQ(Timestamp::max().millis(), kInt128Max);
}

TEST(TimestampTest, OrderingFollowsIntegers) {
    EXPECT_LT(Timestamp::min(), Timestamp{-1});
    EXPECT_LT(Timestamp{-1}, Timestamp{0});
    EXPECT_LT(Timestamp{0}, Timestamp{1});
    EXPECT_LT(Timestamp{1}, Timestamp::max());
    EXPECT_NE(Timestamp{1}, Timestamp{2});
}

// =============================================================================
// Conversions
// =============================================================================

TEST(TimestampTest, TimestampMillisInRange) {
    auto low = Timestamp{std::numeric_limits<std::int64_t>::min()}.timestampMillis();
    ASSERT_TRUE(low.has_value());
    EXPECT_EQ(*low, std::numeric_limits<std::int64_t>::min());

    auto high = Timestamp{std::numeric_limits<std::int64_t>::max()}.timestampMillis();
    ASSERT_TRUE(high.has_value());
    EXPECT_EQ(*high, std::numeric_limits<std::int64_t>::max());
}

TEST(TimestampTest, TimestampMillisOutOfRange) {
    const Int128 justAbove = static_cast<Int128>(std::numeric_limits<std::int64_t>::max()) + 1;
    auto result = Timestamp{justAbove}.timestampMillis();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kOutOfRange);

    EXPECT_FALSE(Timestamp::min().timestampMillis().has_value());
    EXPECT_FALSE(Timestamp::max().toTimePoint().has_value());
}

TEST(TimestampTest, TimePointRoundTrip) {
    const SysMillis tp{std::chrono::milliseconds{1'700'000'000'000}};
    const Timestamp ts = Timestamp::fromTimePoint(tp);
    EXPECT_EQ(ts.millis(), 1'700'000'000'000);

    auto back = ts.toTimePoint();
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, tp);
}

TEST(TimestampTest, DebugString) {
    EXPECT_EQ(Timestamp{-100}.toDebugString(), "Geotime(-100)");
    EXPECT_EQ(Timestamp::max().toDebugString(), std::string("Geotime(") + kInt128MaxText + ")");

    std::ostringstream oss;
    oss << Timestamp{42};
    EXPECT_EQ(oss.str(), "Geotime(42)");
}

// =============================================================================
// Decimal Helpers
// =============================================================================

TEST(Int128TextTest, Render) {
    EXPECT_EQ(int128ToString(0), "0");
    EXPECT_EQ(int128ToString(-1), "-1");
    EXPECT_EQ(int128ToString(kInt128Max), kInt128MaxText);
    EXPECT_EQ(int128ToString(kInt128Min), kInt128MinText);
}

TEST(Int128TextTest, ParseValid) {
    EXPECT_EQ(parseInt128("0").value(), 0);
    EXPECT_EQ(parseInt128("+17").value(), 17);
    EXPECT_EQ(parseInt128("-1000000000000000000000").value(),
              -static_cast<Int128>(1'000'000'000'000'000'000) * 1000);
    EXPECT_EQ(parseInt128(kInt128MaxText).value(), kInt128Max);
    EXPECT_EQ(parseInt128(kInt128MinText).value(), kInt128Min);
}

TEST(Int128TextTest, ParseRejectsMalformed) {
    for (const char* text : {"", "-", "+", "12a", " 1", "1.5", "--1"}) {
        auto result = parseInt128(text);
        ASSERT_FALSE(result.has_value()) << text;
        EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument) << text;
    }
}

TEST(Int128TextTest, ParseRejectsOverflow) {
    auto above = parseInt128("170141183460469231731687303715884105728");
    ASSERT_FALSE(above.has_value());
    EXPECT_EQ(above.error().code(), ErrorCode::kOutOfRange);

    auto below = parseInt128("-170141183460469231731687303715884105729");
    ASSERT_FALSE(below.has_value());
    EXPECT_EQ(below.error().code(), ErrorCode::kOutOfRange);
}

}  // namespace
}  // namespace geotime
