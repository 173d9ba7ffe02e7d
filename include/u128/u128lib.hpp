// include/u128/u128lib.hpp - Umbrella header that exposes u128lib components.

#pragma once

// Users should generally include only this file.

#include <u128/core/uint128.hpp>
#include <u128/util/random.hpp>

namespace u128 {

    using Uint128 = core::uint128;

} // namespace u128
