#ifndef AFE_ALGORITHM_ADDRESSING_HPP
#define AFE_ALGORITHM_ADDRESSING_HPP

#include <cstddef>

#include <afe/meta/utils.hpp>

namespace afe::algorithm::fft {

/// mirrors the lowest `bits` bits of `address`: output bit i equals input bit (bits-1-i)
template<std::size_t bits>
[[nodiscard]] constexpr std::size_t bitReverse(std::size_t address) noexcept {
    std::size_t result = 0UZ;
    for (std::size_t i = 0UZ; i < bits; ++i) {
        result |= ((address >> (bits - 1UZ - i)) & 1UZ) << i;
    }
    return result;
}

[[nodiscard]] constexpr std::size_t bitReverse9(std::size_t address) noexcept { return bitReverse<9UZ>(address); }

struct ButterflyAddress {
    std::size_t a;        ///< upper operand, a < b
    std::size_t b;        ///< lower operand, a + stride
    std::size_t position; ///< position within the group
};

/**
 * @brief operand addresses of butterfly `index` in `stage` of an in-place radix-2 DIT pass.
 *
 * The group size is 2^(stage+1) and the operand stride 2^stage, so every stage touches each of the
 * N addresses exactly once across its N/2 butterflies.
 */
template<std::size_t N>
requires meta::power_of_two<N>
[[nodiscard]] constexpr ButterflyAddress butterflyAddress(std::size_t stage, std::size_t index) noexcept {
    const std::size_t stride    = 1UZ << stage;
    const std::size_t groupSize = stride << 1UZ;
    const std::size_t group     = index >> stage;
    const std::size_t position  = index & (stride - 1UZ);
    const std::size_t a         = group * groupSize + position;
    return {a, a + stride, position};
}

/// twiddle exponent k of W_N^k applied by butterfly `index` in `stage`: position * N / 2^(stage+1)
template<std::size_t N>
requires meta::power_of_two<N>
[[nodiscard]] constexpr std::size_t twiddleAngleIndex(std::size_t stage, std::size_t index) noexcept {
    constexpr std::size_t nStages = meta::log2_v<N>;
    const std::size_t     stride  = 1UZ << stage;
    return ((index & (stride - 1UZ)) << (nStages - 1UZ - stage)) & (N - 1UZ);
}

enum class Bank : unsigned char { A = 0, B = 1 };

/// even stages read bank A and write bank B, odd stages the reverse
[[nodiscard]] constexpr Bank readBank(std::size_t stage) noexcept { return (stage & 1UZ) == 0UZ ? Bank::A : Bank::B; }
[[nodiscard]] constexpr Bank writeBank(std::size_t stage) noexcept { return (stage & 1UZ) == 0UZ ? Bank::B : Bank::A; }

/// bank holding the result after all stages: the write bank of the last stage
template<std::size_t N>
requires meta::power_of_two<N>
inline constexpr Bank finalBank = writeBank(meta::log2_v<N> - 1UZ);

static_assert(bitReverse9(1UZ) == 256UZ);
static_assert(bitReverse9(bitReverse9(0x0A5UZ)) == 0x0A5UZ);
static_assert(finalBank<512UZ> == Bank::B, "9 stages (odd) end in bank B");
static_assert(finalBank<256UZ> == Bank::A, "8 stages (even) end in bank A");

} // namespace afe::algorithm::fft

#endif // AFE_ALGORITHM_ADDRESSING_HPP
