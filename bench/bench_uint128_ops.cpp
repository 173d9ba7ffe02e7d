// bench/bench_uint128_ops.cpp - Benchmark for uint128 primitives.

#include <cstdint>
#include <random>

#include <benchmark/benchmark.h>

#include <u128/core/uint128.hpp>
#include <u128/util/random.hpp>

namespace {

    enum class Operation : std::uint64_t {
        AddOne,
        SubOne,
        Mask6,
        BitsSetFrom,
        BitsClearedFrom,
    };

    constexpr std::uint64_t seed_offset(Operation op, bool native) noexcept {
        return 0x5eedc0de12800000ull + (static_cast<std::uint64_t>(op) << 4) +
               (native ? 0x2u : 0x1u);
    }

    template <bool Native>
    void bench_uint128_operation(benchmark::State &state, Operation op, std::uint64_t seed) {
        std::mt19937_64 rng(seed + static_cast<std::uint64_t>(state.thread_index()));
        while (state.KeepRunning()) {
            const auto value = u128::util::random_uint128(rng);
            const int length = u128::util::random_prefix_length(rng);
#if defined(__SIZEOF_INT128__)
            if constexpr (Native) {
                const unsigned __int128 wide = value.to_native();
                const unsigned __int128 ones = ~static_cast<unsigned __int128>(0);
                const unsigned __int128 mask = length == 0 ? 0 : ones << (128 - length);
                unsigned __int128 result = 0;
                switch (op) {
                case Operation::AddOne:
                    result = wide + 1;
                    break;
                case Operation::SubOne:
                    result = wide - 1;
                    break;
                case Operation::Mask6:
                    result = mask;
                    break;
                case Operation::BitsSetFrom:
                    result = wide | ~mask;
                    break;
                case Operation::BitsClearedFrom:
                    result = wide & mask;
                    break;
                }
                benchmark::DoNotOptimize(result);
                continue;
            }
#endif
            u128::core::uint128 result;
            switch (op) {
            case Operation::AddOne:
                result = value.add_one();
                break;
            case Operation::SubOne:
                result = value.sub_one();
                break;
            case Operation::Mask6:
                result = u128::core::uint128::mask6(length);
                break;
            case Operation::BitsSetFrom:
                result = value.bits_set_from(static_cast<std::uint8_t>(length));
                break;
            case Operation::BitsClearedFrom:
                result = value.bits_cleared_from(static_cast<std::uint8_t>(length));
                break;
            }
            benchmark::DoNotOptimize(result);
        }
    }

    // BENCHMARK_CAPTURE pastes its first argument into an identifier, so it
    // cannot take a template-id directly.
    constexpr auto bench_uint128_operation_halves = &bench_uint128_operation<false>;
    constexpr auto bench_uint128_operation_native = &bench_uint128_operation<true>;

} // namespace

BENCHMARK_CAPTURE(bench_uint128_operation_halves,
                  add_one_halves,
                  Operation::AddOne,
                  seed_offset(Operation::AddOne, false));
BENCHMARK_CAPTURE(bench_uint128_operation_native,
                  add_one_native,
                  Operation::AddOne,
                  seed_offset(Operation::AddOne, true));

BENCHMARK_CAPTURE(bench_uint128_operation_halves,
                  sub_one_halves,
                  Operation::SubOne,
                  seed_offset(Operation::SubOne, false));
BENCHMARK_CAPTURE(bench_uint128_operation_native,
                  sub_one_native,
                  Operation::SubOne,
                  seed_offset(Operation::SubOne, true));

BENCHMARK_CAPTURE(bench_uint128_operation_halves,
                  mask6_halves,
                  Operation::Mask6,
                  seed_offset(Operation::Mask6, false));
BENCHMARK_CAPTURE(bench_uint128_operation_native,
                  mask6_native,
                  Operation::Mask6,
                  seed_offset(Operation::Mask6, true));

BENCHMARK_CAPTURE(bench_uint128_operation_halves,
                  bits_set_from_halves,
                  Operation::BitsSetFrom,
                  seed_offset(Operation::BitsSetFrom, false));
BENCHMARK_CAPTURE(bench_uint128_operation_native,
                  bits_set_from_native,
                  Operation::BitsSetFrom,
                  seed_offset(Operation::BitsSetFrom, true));

BENCHMARK_CAPTURE(bench_uint128_operation_halves,
                  bits_cleared_from_halves,
                  Operation::BitsClearedFrom,
                  seed_offset(Operation::BitsClearedFrom, false));
BENCHMARK_CAPTURE(bench_uint128_operation_native,
                  bits_cleared_from_native,
                  Operation::BitsClearedFrom,
                  seed_offset(Operation::BitsClearedFrom, true));

BENCHMARK_MAIN();
