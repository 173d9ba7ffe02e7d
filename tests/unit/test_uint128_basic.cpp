// tests/unit/test_uint128_basic.cpp - Unit tests for fixed uint128 values.

#include <array>
#include <cstdint>
#include <functional>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <unordered_set>

#include <u128/u128lib.hpp>

namespace {

using u128::core::uint128;

constexpr std::uint64_t ONES = 0xFFFFFFFFFFFFFFFFULL;

static_assert(uint128().is_zero());
static_assert(uint128::mask6(0).is_zero());
static_assert(uint128::mask6(128) == uint128::max());
static_assert(uint128::mask6(64) == uint128(ONES, 0));
static_assert(uint128(0, ONES).add_one() == uint128(1, 0));
static_assert(uint128::zero().sub_one() == uint128(ONES, ONES));
static_assert(uint128::max().add_one().is_zero());
static_assert(std::numeric_limits<uint128>::digits == 128);

} // namespace

int main() {
    bool all_good = true;
    const auto expect = [&](bool condition, const char* message) {
        if (!condition) {
            all_good = false;
            std::cerr << "uint128 basic test failed: " << message << '\n';
        }
    };

    const uint128 zero;
    expect(zero.hi() == 0 && zero.lo() == 0, "default value must be zero");
    expect(zero.is_zero(), "default value must test as zero");
    expect(!uint128(1, 0).is_zero(), "hi-only value is not zero");
    expect(!uint128(0, 1).is_zero(), "lo-only value is not zero");

    expect(uint128::mask6(64) == uint128(ONES, 0), "mask6(64) covers exactly hi");
    expect(uint128::mask6(1) == uint128(0x8000000000000000ULL, 0), "mask6(1) sets bit 0");
    expect(uint128::mask6(65) == uint128(ONES, 0x8000000000000000ULL),
           "mask6(65) sets bit 64 in lo");
    expect(uint128::mask6(127) == uint128(ONES, ONES - 1), "mask6(127) leaves bit 127 clear");
    expect(uint128::mask6(48) == uint128(0xFFFFFFFFFFFF0000ULL, 0), "mask6(48) is a /48");

    expect(uint128(0, ONES).add_one() == uint128(1, 0), "add_one carries into hi");
    expect(uint128(1, 0).sub_one() == uint128(0, ONES), "sub_one borrows from hi");
    expect(uint128(ONES, ONES).add_one().is_zero(), "max + 1 wraps to zero");
    expect(uint128(0, 0).sub_one() == uint128(ONES, ONES), "0 - 1 wraps to max");
    expect(uint128(7, 41).add_one() == uint128(7, 42), "add_one without carry");
    expect(uint128(7, 42).sub_one() == uint128(7, 41), "sub_one without borrow");

    const uint128 a(0xF0F0F0F0F0F0F0F0ULL, 0x00FF00FF00FF00FFULL);
    const uint128 b(0xFF00FF00FF00FF00ULL, 0x0F0F0F0F0F0F0F0FULL);
    expect(a.bit_and(b) == uint128(0xF000F000F000F000ULL, 0x000F000F000F000FULL), "bit_and");
    expect(a.bit_or(b) == uint128(0xFFF0FFF0FFF0FFF0ULL, 0x0FFF0FFF0FFF0FFFULL), "bit_or");
    expect(a.bit_xor(b) == uint128(0x0FF00FF00FF00FF0ULL, 0x0FF00FF00FF00FF0ULL), "bit_xor");
    expect(a.bit_not() == uint128(0x0F0F0F0F0F0F0F0FULL, 0xFF00FF00FF00FF00ULL), "bit_not");
    expect((a & b) == a.bit_and(b) && (a | b) == a.bit_or(b) && (a ^ b) == a.bit_xor(b) &&
               ~a == a.bit_not(),
           "operators must match the named operations");

    uint128 mutable_value(1, 2);
    {
        auto [high, low] = mutable_value.halves();
        expect(high == 1 && low == 2, "halves must read hi then lo");
        high = 0xAAAAULL;
        low = 0xBBBBULL;
    }
    expect(mutable_value == uint128(0xAAAAULL, 0xBBBBULL), "halves must write through");
    mutable_value.set_halves(3, 4).set_halves(5, 6);
    expect(mutable_value.hi() == 5 && mutable_value.lo() == 6, "set_halves replaces both words");

    const uint128 address(0x20010DB800000000ULL, 0x0000000000000001ULL);
    expect(address.bits_cleared_from(32) == uint128(0x20010DB800000000ULL, 0),
           "bits_cleared_from(32) keeps the /32 network");
    expect(address.bits_set_from(32) == uint128(0x20010DB8FFFFFFFFULL, ONES),
           "bits_set_from(32) fills the host part");
    expect(address.bits_set_from(0) == uint128::max(), "bits_set_from(0) is all ones");
    expect(address.bits_cleared_from(0).is_zero(), "bits_cleared_from(0) is zero");
    expect(address.bits_set_from(128) == address, "bits_set_from(128) is identity");
    expect(address.bits_cleared_from(128) == address, "bits_cleared_from(128) is identity");

    expect(address.bit(2) && address.bit(127) && !address.bit(0) && !address.bit(126),
           "bit() counts from the most significant end");

    const std::array<std::uint8_t, uint128::BYTES> bytes = {
        0x20, 0x01, 0x0d, 0xb8, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01,
    };
    expect(address.to_bytes() == bytes, "to_bytes is big-endian");
    expect(uint128::from_bytes(bytes) == address, "from_bytes is big-endian");

    try {
        (void)uint128::checked_mask6(129);
        expect(false, "checked_mask6(129) must throw");
    } catch (const std::out_of_range&) {
        // expected
    }
    try {
        (void)uint128::checked_mask6(-1);
        expect(false, "checked_mask6(-1) must throw");
    } catch (const std::out_of_range&) {
        // expected
    }
    try {
        (void)address.checked_bit(128);
        expect(false, "checked_bit(128) must throw");
    } catch (const std::out_of_range&) {
        // expected
    }
    expect(uint128::checked_mask6(128) == uint128::max(), "checked_mask6 accepts 128");

    std::unordered_set<uint128> seen;
    seen.insert(address);
    seen.insert(address.add_one());
    seen.insert(address.add_one().sub_one());
    expect(seen.size() == 2, "std::hash must agree with equality");
    expect(std::hash<uint128>{}(uint128(1, 0)) != std::hash<uint128>{}(uint128(0, 1)),
           "hash must distinguish the halves");

    if (!all_good) {
        std::cerr << "uint128 basic tests failed\n";
        return 1;
    }
    std::cout << "uint128 basic tests passed\n";
    return 0;
}
