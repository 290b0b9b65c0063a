// =============================================================================
// geotime - Encoding Alphabets
// =============================================================================
// Symbol tables for the order-preserving lexical codecs.
//
// An alphabet is an ordered run of distinct symbols whose index order equals
// their ASCII order, so that comparing encoded strings byte by byte compares
// digit values. The radix is a power of two; each symbol carries
// bitsPerSymbol() bits and width() symbols cover all 128 bits.
//
// Alphabets:
// - Hex:       0-9 a-f                            (radix 16, width 32)
// - Base32Hex: 0-9 A-V                            (radix 32, width 26)
// - Geohash:   0-9 b-z without a, i, l, o         (radix 32, width 26)
// - Base64:    0-9 : A-Z _ a-z                    (radix 64, width 22)
// =============================================================================

#ifndef GEOTIME_CODEC_ALPHABET_H
#define GEOTIME_CODEC_ALPHABET_H

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "geotime/common/types.h"

namespace geotime::codec {

// =============================================================================
// Symbol Tables
// =============================================================================

inline constexpr std::string_view kHexSymbols = "0123456789abcdef";

inline constexpr std::string_view kBase32HexSymbols = "0123456789ABCDEFGHIJKLMNOPQRSTUV";

inline constexpr std::string_view kGeohashSymbols = "0123456789bcdefghjkmnpqrstuvwxyz";

inline constexpr std::string_view kBase64Symbols =
    "0123456789:ABCDEFGHIJKLMNOPQRSTUVWXYZ_abcdefghijklmnopqrstuvwxyz";

// =============================================================================
// Alphabet Class
// =============================================================================

/// @brief Ordered symbol table with a reverse lookup.
/// @note The symbols must outlive the alphabet (string literals in practice).
class Alphabet {
public:
    /// @brief Build an alphabet over the given symbols.
    /// @note Ordering and power-of-two radix are preconditions checked by
    ///       isValid(), not enforced here.
    constexpr explicit Alphabet(std::string_view symbols) noexcept
        : symbols_(symbols),
          bits_(static_cast<unsigned>(std::countr_zero(symbols.size()))),
          width_(bits_ == 0 ? 0 : (kTimestampBits + bits_ - 1) / bits_) {
        lookup_.fill(-1);
        for (std::size_t i = 0; i < symbols_.size() && i < 128; ++i) {
            lookup_[static_cast<unsigned char>(symbols_[i])] = static_cast<std::int16_t>(i);
        }
    }

    /// @brief Number of symbols.
    [[nodiscard]] constexpr std::size_t radix() const noexcept { return symbols_.size(); }

    /// @brief Bits carried by each symbol (log2 of the radix).
    [[nodiscard]] constexpr unsigned bitsPerSymbol() const noexcept { return bits_; }

    /// @brief Symbols needed to hold 128 bits.
    [[nodiscard]] constexpr std::size_t width() const noexcept { return width_; }

    /// @brief Zero bits appended after the last value bit to fill width() symbols.
    [[nodiscard]] constexpr unsigned padBits() const noexcept {
        return static_cast<unsigned>(width_ * bits_ - kTimestampBits);
    }

    /// @brief Symbol for a digit value; digit must be below radix().
    [[nodiscard]] constexpr char symbol(std::size_t digit) const noexcept {
        return symbols_[digit];
    }

    /// @brief Symbol for digit 0.
    [[nodiscard]] constexpr char zeroSymbol() const noexcept { return symbols_[0]; }

    /// @brief Digit value of a symbol, or -1 if the symbol is not in the alphabet.
    [[nodiscard]] constexpr int indexOf(char c) const noexcept {
        return lookup_[static_cast<unsigned char>(c)];
    }

    [[nodiscard]] constexpr std::string_view symbols() const noexcept { return symbols_; }

    /// @brief True if every symbol sorts strictly after its predecessor.
    /// @note Strict ascending order also implies the symbols are distinct.
    [[nodiscard]] constexpr bool isLexicallyOrdered() const noexcept {
        for (std::size_t i = 1; i < symbols_.size(); ++i) {
            if (static_cast<unsigned char>(symbols_[i - 1]) >=
                static_cast<unsigned char>(symbols_[i])) {
                return false;
            }
        }
        return true;
    }

    /// @brief True if the alphabet can drive a LexicalCodec.
    [[nodiscard]] constexpr bool isValid() const noexcept {
        return symbols_.size() >= 2 && symbols_.size() <= 128 &&
               std::has_single_bit(symbols_.size()) && isLexicallyOrdered();
    }

private:
    std::string_view symbols_;
    unsigned bits_;
    std::size_t width_;
    std::array<std::int16_t, 256> lookup_{};
};

}  // namespace geotime::codec

#endif  // GEOTIME_CODEC_ALPHABET_H
