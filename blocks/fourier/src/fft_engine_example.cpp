#include <array>
#include <cmath>
#include <cstdio>
#include <numbers>

#include <fmt/format.h>

#include <afe/algorithm/fourier/fft_common.hpp>
#include <afe/fourier/FftEngine.hpp>

int main() {
    using namespace afe::blocks::fft;
    using afe::fixed::Q15;

    constexpr std::size_t N        = 512UZ;
    constexpr double      f_s      = 51'200.0; // 100 Hz bin width
    constexpr double      f_tone1  = 3'000.0;
    constexpr double      f_tone2  = 12'800.0;
    constexpr double      amp_tone = 0.3;

    // two real tones, 30 and 128 bins
    std::array<Q15, N> input{};
    for (std::size_t n = 0UZ; n < N; ++n) {
        const double t = static_cast<double>(n) / f_s;
        input[n]       = Q15::fromComplex({amp_tone * std::sin(2. * std::numbers::pi * f_tone1 * t) + 0.5 * amp_tone * std::cos(2. * std::numbers::pi * f_tone2 * t), 0.0});
    }

    Engine<N> engine({.name = "example", .verbose = true});
    auto      spectrum = engine.transform(input);
    if (!spectrum) {
        fmt::print(stderr, "transform failed: {}\n", spectrum.error());
        return 1;
    }

    const auto magnitudes = afe::algorithm::fft::computeMagnitudeSpectrum(*spectrum, {.computeHalfSpectrum = true});
    for (const auto bin : afe::algorithm::fft::findPeakBins(magnitudes, 4UZ)) {
        fmt::print("bin {:3} ({:8.1f} Hz): amplitude {:.4f}  raw {}\n", bin, static_cast<double>(bin) * f_s / static_cast<double>(N), magnitudes[bin], (*spectrum)[bin]);
    }
    fmt::print("{} batch(es), {} compute steps\n", engine.completedBatches(), engine.computeSteps());
    return 0;
}
