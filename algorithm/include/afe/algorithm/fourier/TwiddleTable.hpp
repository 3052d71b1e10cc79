#ifndef AFE_ALGORITHM_TWIDDLE_TABLE_HPP
#define AFE_ALGORITHM_TWIDDLE_TABLE_HPP

#include <array>
#include <cstddef>
#include <numbers>
#include <variant>

#include <afe/algorithm/fourier/Addressing.hpp>
#include <afe/algorithm/fourier/FixedPoint.hpp>
#include <afe/meta/utils.hpp>

namespace afe::algorithm::fft {

enum class Direction : unsigned char { Forward, Inverse };

namespace detail {
inline constexpr std::size_t taylorSeriesTerms = 24UZ;

// Taylor series, only used for |x| <= pi/2 where 24 terms are exact to double precision
constexpr double sinTaylor(double x) noexcept {
    double term = x;
    double sum  = x;
    for (std::size_t n = 1UZ; n < taylorSeriesTerms; ++n) {
        term *= -x * x / static_cast<double>((2UZ * n) * (2UZ * n + 1UZ));
        sum += term;
    }
    return sum;
}

constexpr double cosTaylor(double x) noexcept {
    double term = 1.0;
    double sum  = 1.0;
    for (std::size_t n = 1UZ; n < taylorSeriesTerms; ++n) {
        term *= -x * x / static_cast<double>((2UZ * n - 1UZ) * (2UZ * n));
        sum += term;
    }
    return sum;
}
} // namespace detail

/**
 * @brief quarter-wave coefficient ROM: entry i holds round(cos(2*pi*i/N) * (2^(W-1)-1)) and the matching sine,
 * for i in [0, N/4). Generated at compile time.
 */
template<std::size_t N, std::size_t W>
requires(meta::power_of_two<N> && N >= 4UZ)
struct QuarterWaveRom {
    using format     = fixed::Format<W>;
    using value_type = typename format::value_type;

    struct Entry {
        value_type cos;
        value_type sin;
    };

    static constexpr std::size_t depth = N / 4UZ;

    std::array<Entry, depth> entries{};

    constexpr QuarterWaveRom() noexcept {
        constexpr double fullScale = static_cast<double>(format::maxValue);
        for (std::size_t i = 0UZ; i < depth; ++i) {
            const double angle = 2.0 * std::numbers::pi * static_cast<double>(i) / static_cast<double>(N);
            entries[i]        = {format::fromDouble(detail::cosTaylor(angle), fullScale), format::fromDouble(detail::sinTaylor(angle), fullScale)};
        }
    }

    [[nodiscard]] constexpr const Entry& operator[](std::size_t address) const noexcept { return entries[address]; }
};

namespace quadrant {
struct Q0 {}; // [0, pi/2)
struct Q1 {}; // [pi/2, pi)
struct Q2 {}; // [pi, 3pi/2)
struct Q3 {}; // [3pi/2, 2pi)
} // namespace quadrant

using Quadrant = std::variant<quadrant::Q0, quadrant::Q1, quadrant::Q2, quadrant::Q3>;

[[nodiscard]] constexpr Quadrant makeQuadrant(std::size_t index) noexcept {
    switch (index & 3UZ) {
    case 0UZ: return quadrant::Q0{};
    case 1UZ: return quadrant::Q1{};
    case 2UZ: return quadrant::Q2{};
    default: return quadrant::Q3{};
    }
}

/**
 * @brief twiddle factor W_N^k = cos(2*pi*k/N) - j*sin(2*pi*k/N) from a quarter-wave ROM.
 *
 * The angle index k is split into quadrant (top two bits) and base (remaining bits); the ROM is addressed
 * with the base and the quadrant only decides on sign and real/imag swap:
 *   Q0: ( cos, -sin)   Q1: (-sin, -cos)   Q2: (-cos,  sin)   Q3: ( sin,  cos)
 * For `Direction::Inverse` the conjugate coefficient is returned.
 */
template<std::size_t N = 512UZ, std::size_t W = 16UZ>
requires(meta::power_of_two<N> && N >= 4UZ)
struct TwiddleTable {
    using sample_type = fixed::Sample<W>;
    using value_type  = typename sample_type::value_type;
    using rom_type    = QuarterWaveRom<N, W>;

    static constexpr std::size_t size          = N;
    static constexpr std::size_t nStages       = meta::log2_v<N>;
    static constexpr std::size_t romDepth      = rom_type::depth;
    static constexpr std::size_t quadrantShift = meta::log2_v<romDepth>;
    static constexpr rom_type    rom{};

    Direction direction = Direction::Forward;

    /// coefficient needed by butterfly `butterflyIndex` (0..N/2-1) of `stage` (0..log2(N)-1)
    [[nodiscard]] constexpr sample_type lookup(std::size_t stage, std::size_t butterflyIndex) const noexcept { return coefficient(twiddleAngleIndex<N>(stage, butterflyIndex)); }

    [[nodiscard]] constexpr sample_type coefficient(std::size_t angleIndex) const noexcept {
        angleIndex &= (N - 1UZ);
        const auto  entry = rom[angleIndex & (romDepth - 1UZ)];
        sample_type w     = std::visit(meta::overloaded{
                                       [&entry](quadrant::Q0) { return sample_type{entry.cos, negate(entry.sin)}; },
                                       [&entry](quadrant::Q1) { return sample_type{negate(entry.sin), negate(entry.cos)}; },
                                       [&entry](quadrant::Q2) { return sample_type{negate(entry.cos), entry.sin}; },
                                       [&entry](quadrant::Q3) { return sample_type{entry.sin, entry.cos}; },
                                   },
                makeQuadrant(angleIndex >> quadrantShift));
        if (direction == Direction::Inverse) {
            w.imag = negate(w.imag);
        }
        return w;
    }

private:
    // ROM entries are within [0, maxValue], so negation cannot overflow
    static constexpr value_type negate(value_type value) noexcept { return static_cast<value_type>(-value); }
};

static_assert(TwiddleTable<>::rom[0UZ].cos == 0x7FFF && TwiddleTable<>::rom[0UZ].sin == 0);
static_assert(TwiddleTable<>{}.coefficient(128UZ) == fixed::Q15{0, -0x7FFF}, "W_512^128 == -j");

} // namespace afe::algorithm::fft

#endif // AFE_ALGORITHM_TWIDDLE_TABLE_HPP
