// =============================================================================
// geotime - Timestamp Value Type Implementation
// =============================================================================

#include "geotime/core/timestamp.h"

#include <fmt/format.h>

#include <limits>
#include <ostream>

namespace geotime {

namespace {

constexpr Int128 kInt64Min = std::numeric_limits<std::int64_t>::min();
constexpr Int128 kInt64Max = std::numeric_limits<std::int64_t>::max();

}  // namespace

// =============================================================================
// Timestamp Implementation
// =============================================================================

Result<std::int64_t> Timestamp::timestampMillis() const {
    if (millis_ < kInt64Min || millis_ > kInt64Max) {
        return makeError<std::int64_t>(
            ErrorCode::kOutOfRange,
            fmt::format("millisecond offset {} does not fit in 64 bits", millis_));
    }
    return static_cast<std::int64_t>(millis_);
}

Result<SysMillis> Timestamp::toTimePoint() const {
    auto millis = timestampMillis();
    if (!millis) {
        return makeError<SysMillis>(millis.error());
    }
    return SysMillis{std::chrono::milliseconds{*millis}};
}

std::string Timestamp::toDebugString() const {
    return fmt::format("Geotime({})", millis_);
}

std::ostream& operator<<(std::ostream& os, Timestamp ts) {
    return os << ts.toDebugString();
}

// =============================================================================
// 128-bit Decimal Helpers
// =============================================================================

std::string int128ToString(Int128 value) {
    return fmt::format("{}", value);
}

Result<Int128> parseInt128(std::string_view text) {
    if (text.empty()) {
        return makeError<Int128>(ErrorCode::kInvalidArgument, "empty integer");
    }

    bool negative = false;
    std::size_t pos = 0;
    if (text[0] == '-' || text[0] == '+') {
        negative = (text[0] == '-');
        pos = 1;
    }
    if (pos == text.size()) {
        return makeError<Int128>(ErrorCode::kInvalidArgument,
                                 fmt::format("no digits in '{}'", text));
    }

    // Accumulate the magnitude unsigned; -2^127 has no positive counterpart
    const UInt128 limit = negative ? kSignBias : kSignBias - 1;
    UInt128 magnitude = 0;
    for (; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (c < '0' || c > '9') {
            return makeError<Int128>(
                ErrorCode::kInvalidArgument,
                fmt::format("unexpected character '{}' at position {} in '{}'", c, pos, text));
        }
        const auto digit = static_cast<UInt128>(c - '0');
        if (magnitude > (limit - digit) / 10) {
            return makeError<Int128>(ErrorCode::kOutOfRange,
                                     fmt::format("'{}' overflows a 128-bit integer", text));
        }
        magnitude = magnitude * 10 + digit;
    }

    if (negative) {
        return static_cast<Int128>(~magnitude + 1);
    }
    return static_cast<Int128>(magnitude);
}

}  // namespace geotime
