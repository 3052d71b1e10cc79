#ifndef AFE_ALGORITHM_FFT_COMMON_HPP
#define AFE_ALGORITHM_FFT_COMMON_HPP

#include <algorithm>
#include <cmath>
#include <complex>
#include <iterator>
#include <limits>
#include <numeric>
#include <ranges>
#include <stdexcept>
#include <vector>

#include <afe/algorithm/fourier/FixedPoint.hpp>

namespace afe::algorithm::fft {

template<typename T>
struct is_fixed_sample : std::false_type {};

template<std::size_t W>
struct is_fixed_sample<fixed::Sample<W>> : std::true_type {};

template<typename T>
concept FixedSample = is_fixed_sample<T>::value;

template<std::ranges::input_range TContainerIn, typename T = std::ranges::range_value_t<TContainerIn>>
requires FixedSample<T>
[[nodiscard]] std::vector<std::complex<double>> toComplex(const TContainerIn& in) {
    std::vector<std::complex<double>> out;
    if constexpr (std::ranges::sized_range<TContainerIn>) {
        out.reserve(std::ranges::size(in));
    }
    std::ranges::transform(in, std::back_inserter(out), [](const T& sample) { return sample.toComplex(); });
    return out;
}

template<FixedSample T, std::ranges::input_range TContainerIn>
requires std::convertible_to<std::ranges::range_value_t<TContainerIn>, std::complex<double>>
[[nodiscard]] std::vector<T> fromComplex(const TContainerIn& in) {
    std::vector<T> out;
    std::ranges::transform(in, std::back_inserter(out), [](const std::complex<double>& value) { return T::fromComplex(value); });
    return out;
}

struct ConfigMagnitude {
    bool computeHalfSpectrum = false;
    bool outputInDb          = false;
    bool shiftSpectrum       = false;
};

/**
 * @brief single-sided amplitude spectrum of the engine output.
 *
 * The engine already divides by N (one halving per stage), so |X[k]|/N is available directly and the
 * amplitude of a real tone is 2 * |X[k]|/N.
 */
template<std::ranges::input_range TContainerIn, typename T = std::ranges::range_value_t<TContainerIn>>
requires FixedSample<T>
[[nodiscard]] std::vector<double> computeMagnitudeSpectrum(const TContainerIn& fftOut, ConfigMagnitude config = {}) {
    const auto        spectrum = toComplex(fftOut);
    const std::size_t N        = spectrum.size();
    if (N == 0UZ) {
        throw std::invalid_argument("fftOut cannot be empty.");
    }

    const std::size_t   magSize = config.computeHalfSpectrum ? (N / 2UZ) : N;
    std::vector<double> magOut(magSize);
    std::transform(spectrum.begin(), std::next(spectrum.begin(), static_cast<std::ptrdiff_t>(magSize)), magOut.begin(), [outputInDb = config.outputInDb](const auto& c) {
        const double mag = 2.0 * std::hypot(c.real(), c.imag());
        if (outputInDb && mag > 0.0) {
            return 20.0 * std::log10(mag);
        } else if (outputInDb) {
            return std::numeric_limits<double>::lowest(); // represents -infinity in dB
        }
        return mag;
    });

    if (!config.computeHalfSpectrum && config.shiftSpectrum) {
        const auto halfN = std::ssize(magOut) / 2;
        std::ranges::rotate(magOut, magOut.begin() + halfN); // negative frequencies first
    }
    return magOut;
}

/// indices of the `count` largest magnitudes, strongest first
[[nodiscard]] inline std::vector<std::size_t> findPeakBins(const std::vector<double>& magnitudes, std::size_t count) {
    std::vector<std::size_t> bins(magnitudes.size());
    std::iota(bins.begin(), bins.end(), 0UZ);
    count = std::min(count, bins.size());
    std::ranges::partial_sort(bins, bins.begin() + static_cast<std::ptrdiff_t>(count), [&magnitudes](std::size_t lhs, std::size_t rhs) { return magnitudes[lhs] > magnitudes[rhs]; });
    bins.resize(count);
    return bins;
}

} // namespace afe::algorithm::fft

#endif // AFE_ALGORITHM_FFT_COMMON_HPP
