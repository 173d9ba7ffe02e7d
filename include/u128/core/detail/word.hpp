// include/u128/core/detail/word.hpp - 64-bit word primitives used by uint128.

#pragma once

#include <cstdint>
#include <utility>

namespace u128::core::detail {

using word_t = std::uint64_t;

inline constexpr int WORD_BITS = 64;
inline constexpr word_t ALL_ONES = ~word_t{0};

// Shifts by WORD_BITS or more yield zero instead of being undefined.
// Negative counts remain the caller's problem.
inline constexpr word_t shl64(word_t value, int count) noexcept {
    return count >= WORD_BITS ? word_t{0} : value << count;
}

inline constexpr word_t shr64(word_t value, int count) noexcept {
    return count >= WORD_BITS ? word_t{0} : value >> count;
}

// Returns {sum, carry_out}; carry_in must be 0 or 1.
inline constexpr std::pair<word_t, word_t> add_with_carry(word_t lhs,
                                                          word_t rhs,
                                                          word_t carry_in) noexcept {
    const word_t sum = lhs + rhs + carry_in;
    const word_t carry_out = ((lhs & rhs) | ((lhs | rhs) & ~sum)) >> (WORD_BITS - 1);
    return {sum, carry_out};
}

// Returns {difference, borrow_out}; borrow_in must be 0 or 1.
inline constexpr std::pair<word_t, word_t> sub_with_borrow(word_t lhs,
                                                           word_t rhs,
                                                           word_t borrow_in) noexcept {
    const word_t diff = lhs - rhs - borrow_in;
    const word_t borrow_out = ((~lhs & rhs) | (~(lhs ^ rhs) & diff)) >> (WORD_BITS - 1);
    return {diff, borrow_out};
}

} // namespace u128::core::detail
