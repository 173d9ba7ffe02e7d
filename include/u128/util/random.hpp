#pragma once

#include <random>

#include <u128/core/uint128.hpp>

namespace u128::util {

inline u128::core::uint128 random_uint128(std::mt19937_64& generator) {
    const auto hi = generator();
    const auto lo = generator();
    return u128::core::uint128(hi, lo);
}

// Uniform in [0, 128].
inline int random_prefix_length(std::mt19937_64& generator) {
    static std::uniform_int_distribution<int> length_dist(0, u128::core::uint128::BITS);
    return length_dist(generator);
}

} // namespace u128::util
