// examples/example_prefix.cpp - Derives the address range covered by an IPv6 prefix.

#include <cstdint>
#include <iomanip>
#include <iostream>

#include <u128/u128lib.hpp>

namespace {

void print_words(const char* label, const u128::Uint128& value) {
    std::cout << label << " = " << std::hex << std::setfill('0') << std::setw(16) << value.hi()
              << ':' << std::setw(16) << value.lo() << std::dec << "\n";
}

} // namespace

int
main() {
    using u128::Uint128;

    // 2001:db8:abcd:12::1/48
    const Uint128 address(0x20010DB8ABCD0012ULL, 0x0000000000000001ULL);
    const std::uint8_t prefix_length = 48;

    print_words("address", address);
    print_words("netmask", Uint128::mask6(prefix_length));
    print_words("first  ", address.bits_cleared_from(prefix_length));
    print_words("last   ", address.bits_set_from(prefix_length));
    print_words("next   ", address.bits_set_from(prefix_length).add_one());

    Uint128 scratch = address;
    auto [high, low] = scratch.halves();
    low = 0;
    high &= Uint128::mask6(prefix_length).hi();
    std::cout << "network via halves matches: " << std::boolalpha
              << (scratch == address.bits_cleared_from(prefix_length)) << "\n";
    return 0;
}
