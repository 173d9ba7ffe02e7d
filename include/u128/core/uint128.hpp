// include/u128/core/uint128.hpp - 128-bit unsigned value built from two 64-bit halves.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

#include <u128/core/detail/word.hpp>

namespace u128::core {

// Bit numbering is MSB-first everywhere in this type: bit 0 is the most
// significant bit of hi(), bit 127 is the least significant bit of lo().
// Prefix-length code depends on "bit N" meaning the N-th bit counted from
// the most significant end; this is the reverse of the usual LSB-first
// numbering and must stay that way.
class uint128 {
public:
    using half_t = detail::word_t;

    static constexpr int BITS = 128;
    static constexpr int HALF_BITS = detail::WORD_BITS;
    static constexpr int BYTES = BITS / 8;

    constexpr uint128() noexcept = default;
    constexpr uint128(half_t hi, half_t lo) noexcept : hi_(hi), lo_(lo) {}

    constexpr uint128(const uint128&) noexcept = default;
    constexpr uint128& operator=(const uint128&) noexcept = default;

    static constexpr uint128 zero() noexcept { return uint128(); }
    static constexpr uint128 one() noexcept { return uint128(0, 1); }
    static constexpr uint128 max() noexcept {
        return uint128(detail::ALL_ONES, detail::ALL_ONES);
    }

    // Mask with the top n bits set and the remaining 128 - n bits clear.
    // n must be in [0, 128]; anything else is a precondition violation.
    static constexpr uint128 mask6(int n) noexcept {
        return uint128(~detail::shr64(detail::ALL_ONES, n),
                       detail::shl64(detail::ALL_ONES, BITS - n));
    }

    static constexpr uint128 checked_mask6(int n) {
        if (n < 0 || n > BITS) {
            throw std::out_of_range("uint128 prefix length must be 0..128");
        }
        return mask6(n);
    }

    static constexpr uint128 from_bytes(const std::array<std::uint8_t, BYTES>& bytes) noexcept {
        half_t hi = 0;
        half_t lo = 0;
        for (std::size_t index = 0; index < BYTES / 2; ++index) {
            hi = (hi << 8) | bytes[index];
            lo = (lo << 8) | bytes[index + BYTES / 2];
        }
        return uint128(hi, lo);
    }

    // Big-endian, so byte 0 holds bits 0..7.
    constexpr std::array<std::uint8_t, BYTES> to_bytes() const noexcept {
        std::array<std::uint8_t, BYTES> bytes{};
        for (std::size_t index = 0; index < BYTES / 2; ++index) {
            const int shift = static_cast<int>(8 * (BYTES / 2 - 1 - index));
            bytes[index] = static_cast<std::uint8_t>(hi_ >> shift);
            bytes[index + BYTES / 2] = static_cast<std::uint8_t>(lo_ >> shift);
        }
        return bytes;
    }

#if defined(__SIZEOF_INT128__)
    static constexpr uint128 from_native(unsigned __int128 value) noexcept {
        return uint128(static_cast<half_t>(value >> HALF_BITS), static_cast<half_t>(value));
    }

    constexpr unsigned __int128 to_native() const noexcept {
        return (static_cast<unsigned __int128>(hi_) << HALF_BITS) | lo_;
    }
#endif

    constexpr half_t hi() const noexcept { return hi_; }
    constexpr half_t lo() const noexcept { return lo_; }

    // Direct access to the storage words as [high, low]. Writes through the
    // returned references bypass every other guarantee of this type; callers
    // sharing the value across threads synchronise on their own.
    constexpr std::pair<half_t&, half_t&> halves() noexcept { return {hi_, lo_}; }

    constexpr uint128& set_halves(half_t hi, half_t lo) noexcept {
        hi_ = hi;
        lo_ = lo;
        return *this;
    }

    // Single OR-then-test rather than two comparisons.
    constexpr bool is_zero() const noexcept { return (hi_ | lo_) == 0; }

    // MSB-first: index 0 is the top bit of hi(). index must be in [0, 127].
    constexpr bool bit(int index) const noexcept {
        return index < HALF_BITS ? ((hi_ >> (HALF_BITS - 1 - index)) & 1) != 0
                                 : ((lo_ >> (BITS - 1 - index)) & 1) != 0;
    }

    constexpr bool checked_bit(int index) const {
        if (index < 0 || index >= BITS) {
            throw std::out_of_range("uint128 bit index out of range");
        }
        return bit(index);
    }

    constexpr uint128 bit_and(const uint128& mask) const noexcept {
        return uint128(hi_ & mask.hi_, lo_ & mask.lo_);
    }

    constexpr uint128 bit_or(const uint128& mask) const noexcept {
        return uint128(hi_ | mask.hi_, lo_ | mask.lo_);
    }

    constexpr uint128 bit_xor(const uint128& mask) const noexcept {
        return uint128(hi_ ^ mask.hi_, lo_ ^ mask.lo_);
    }

    constexpr uint128 bit_not() const noexcept { return uint128(~hi_, ~lo_); }

    // Wraps to zero past max().
    constexpr uint128 add_one() const noexcept {
        const auto [low, carry] = detail::add_with_carry(lo_, 1, 0);
        return uint128(hi_ + carry, low);
    }

    // Wraps to max() below zero.
    constexpr uint128 sub_one() const noexcept {
        const auto [low, borrow] = detail::sub_with_borrow(lo_, 1, 0);
        return uint128(hi_ - borrow, low);
    }

    // Copy with first_bit and every less significant bit set.
    constexpr uint128 bits_set_from(std::uint8_t first_bit) const noexcept {
        return bit_or(mask6(first_bit).bit_not());
    }

    // Copy with first_bit and every less significant bit cleared.
    constexpr uint128 bits_cleared_from(std::uint8_t first_bit) const noexcept {
        return bit_and(mask6(first_bit));
    }

    constexpr uint128 operator&(const uint128& other) const noexcept { return bit_and(other); }
    constexpr uint128 operator|(const uint128& other) const noexcept { return bit_or(other); }
    constexpr uint128 operator^(const uint128& other) const noexcept { return bit_xor(other); }
    constexpr uint128 operator~() const noexcept { return bit_not(); }

    constexpr bool operator==(const uint128& other) const noexcept = default;

private:
    half_t hi_{0};
    half_t lo_{0};
};

inline std::size_t canonical_hash(const uint128& value) noexcept {
    constexpr std::uint64_t FNV_OFFSET = 1469598103934665603ULL;
    constexpr std::uint64_t FNV_PRIME = 1099511628211ULL;
    std::uint64_t hash = FNV_OFFSET;
    for (auto byte : value.to_bytes()) {
        hash ^= byte;
        hash *= FNV_PRIME;
    }
    if constexpr (sizeof(std::size_t) >= 8) {
        return static_cast<std::size_t>(hash);
    }
    return static_cast<std::size_t>((hash >> 32) ^ (hash & 0xFFFFFFFFULL));
}

} // namespace u128::core

namespace std {

template <>
class numeric_limits<u128::core::uint128> {
public:
    using value_type = u128::core::uint128;

    static constexpr bool is_specialized = true;
    static constexpr bool is_signed = false;
    static constexpr bool is_integer = true;
    static constexpr bool is_exact = true;
    static constexpr bool is_bounded = true;
    static constexpr bool is_modulo = true;
    static constexpr int digits = value_type::BITS;
    static constexpr int radix = 2;

    static constexpr value_type min() noexcept { return value_type::zero(); }
    static constexpr value_type lowest() noexcept { return value_type::zero(); }
    static constexpr value_type max() noexcept { return value_type::max(); }
};

template <>
struct hash<u128::core::uint128> {
    std::size_t operator()(const u128::core::uint128& value) const noexcept {
        return u128::core::canonical_hash(value);
    }
};

} // namespace std
