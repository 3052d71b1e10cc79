#ifndef AFE_ALGORITHM_DFT_HPP
#define AFE_ALGORITHM_DFT_HPP

#include <complex>
#include <numbers>
#include <ranges>
#include <vector>

#include <afe/algorithm/fourier/TwiddleTable.hpp>
#include <afe/meta/utils.hpp>

namespace afe::algorithm {

/**
 * @brief direct O(N^2) double-precision DFT, X[k] = sum_n x[n] * exp(-+j*2*pi*k*n/N), without normalisation.
 *
 * Reference for the fixed-point engine; the exponent k*n is reduced modulo N before the trigonometric
 * evaluation to keep the reference accurate for large indices.
 */
template<std::ranges::sized_range TContainerIn>
requires meta::complex_like<std::ranges::range_value_t<TContainerIn>>
[[nodiscard]] std::vector<std::complex<double>> computeDft(const TContainerIn& in, fft::Direction direction = fft::Direction::Forward) {
    const std::size_t                 N = std::ranges::size(in);
    std::vector<std::complex<double>> out(N);
    if (N == 0UZ) {
        return out;
    }

    const double                      sign = direction == fft::Direction::Forward ? -1.0 : 1.0;
    std::vector<std::complex<double>> roots(N);
    for (std::size_t i = 0UZ; i < N; ++i) {
        roots[i] = std::polar(1.0, sign * 2.0 * std::numbers::pi * static_cast<double>(i) / static_cast<double>(N));
    }

    for (std::size_t k = 0UZ; k < N; ++k) {
        std::complex<double> sum{0.0, 0.0};
        std::size_t          n = 0UZ;
        for (const auto& x : in) {
            sum += std::complex<double>(x) * roots[(k * n) % N];
            ++n;
        }
        out[k] = sum;
    }
    return out;
}

} // namespace afe::algorithm

#endif // AFE_ALGORITHM_DFT_HPP
