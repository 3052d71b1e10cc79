#ifndef AFE_ALGORITHM_BUTTERFLY_HPP
#define AFE_ALGORITHM_BUTTERFLY_HPP

#include <cstddef>

#include <afe/algorithm/fourier/FixedPoint.hpp>

namespace afe::algorithm::fft {

/**
 * @brief scaled radix-2 butterfly on Q(W-1) samples: A' = (A + W*B) / 2, B' = (A - W*B) / 2.
 *
 * W*B is formed from full-width products summed in 2W+1 bits and shifted back by W-1 bits (arithmetic
 * shift, i.e. rounding toward -inf); the result is kept in W bits the way a W-bit register would (two's
 * complement truncation). The sum and difference with A are formed with one extra bit before the final shift by one,
 * so they never overflow. Halving at every butterfly bounds the growth over all log2(N) stages.
 * Any W-bit operands are accepted, including -1.0 in every component.
 */
template<std::size_t W = 16UZ>
struct Butterfly {
    using sample_type  = fixed::Sample<W>;
    using format       = typename sample_type::format;
    using wide_type    = typename format::wide_type;
    using product_type = typename format::product_type;

    struct Result {
        sample_type a;
        sample_type b;

        constexpr bool operator==(const Result&) const noexcept = default;
    };

    [[nodiscard]] static constexpr sample_type multiply(const sample_type& w, const sample_type& b) noexcept {
        const product_type re = product_type{w.real} * product_type{b.real} - product_type{w.imag} * product_type{b.imag};
        const product_type im = product_type{w.real} * product_type{b.imag} + product_type{w.imag} * product_type{b.real};
        return {format::wrap(static_cast<wide_type>(re >> format::fractionalBits)), format::wrap(static_cast<wide_type>(im >> format::fractionalBits))};
    }

    [[nodiscard]] static constexpr Result compute(const sample_type& a, const sample_type& b, const sample_type& w) noexcept {
        const sample_type wb = multiply(w, b);
        return {
            {halve(wide_type{a.real} + wide_type{wb.real}), halve(wide_type{a.imag} + wide_type{wb.imag})},
            {halve(wide_type{a.real} - wide_type{wb.real}), halve(wide_type{a.imag} - wide_type{wb.imag})},
        };
    }

private:
    // W+1 bit intermediate, result always fits into W bits
    static constexpr typename sample_type::value_type halve(wide_type sum) noexcept { return static_cast<typename sample_type::value_type>(sum >> 1); }
};

static_assert(Butterfly<>::compute({0x7FFF, 0}, {0, 0}, {0x7FFF, 0}) == Butterfly<>::Result{{0x3FFF, 0}, {0x3FFF, 0}});
static_assert(Butterfly<>::multiply({-0x8000, -0x8000}, {-0x8000, -0x8000}) == fixed::Q15{0, 0}, "2j wraps to 0");
static_assert(Butterfly<>::compute({-1, 0}, {0, 0}, {0x7FFF, 0}).a.real == -1, "arithmetic shift rounds toward -inf");

} // namespace afe::algorithm::fft

#endif // AFE_ALGORITHM_BUTTERFLY_HPP
