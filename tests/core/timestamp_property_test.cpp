// =============================================================================
// geotime - Timestamp Property Tests
// =============================================================================
// Property-based tests for decimal rendering and ordering of timestamps.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>

#include "geotime/core/timestamp.h"

namespace geotime::test {

namespace gen {

/// @brief Any 128-bit offset, assembled from two 64-bit halves.
[[nodiscard]] rc::Gen<Int128> anyInt128() {
    return rc::gen::apply(
        [](std::uint64_t high, std::uint64_t low) {
            return static_cast<Int128>((static_cast<UInt128>(high) << 64) | low);
        },
        rc::gen::arbitrary<std::uint64_t>(), rc::gen::arbitrary<std::uint64_t>());
}

}  // namespace gen

RC_GTEST_PROP(TimestampProperty, DecimalRoundTrip, ()) {
    const Int128 value = *gen::anyInt128();

    auto parsed = parseInt128(int128ToString(value));
    RC_ASSERT(parsed.has_value());
    RC_ASSERT(Timestamp{*parsed} == Timestamp{value});
}

RC_GTEST_PROP(TimestampProperty, OrderMatchesMillis, ()) {
    const Timestamp a{*gen::anyInt128()};
    const Timestamp b{*gen::anyInt128()};

    RC_ASSERT((a < b) == (a.millis() < b.millis()));
    RC_ASSERT((a == b) == (a.millis() == b.millis()));
}

RC_GTEST_PROP(TimestampProperty, SixtyFourBitValuesConvert, (std::int64_t millis)) {
    auto narrowed = Timestamp{millis}.timestampMillis();
    RC_ASSERT(narrowed.has_value());
    RC_ASSERT(*narrowed == millis);
}

}  // namespace geotime::test
