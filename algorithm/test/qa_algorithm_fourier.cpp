#include <algorithm>
#include <array>
#include <cmath>
#include <complex>
#include <cstdint>
#include <limits>
#include <numbers>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#include <boost/ut.hpp>

#include <fmt/format.h>

#include <afe/algorithm/fourier/Addressing.hpp>
#include <afe/algorithm/fourier/Butterfly.hpp>
#include <afe/algorithm/fourier/FixedPoint.hpp>
#include <afe/algorithm/fourier/MemoryBanks.hpp>
#include <afe/algorithm/fourier/TwiddleTable.hpp>
#include <afe/algorithm/fourier/dft.hpp>
#include <afe/algorithm/fourier/fft_common.hpp>
#include <afe/meta/UnitTestHelper.hpp>

template<typename T>
std::vector<T> generateSinSample(std::size_t N, double sample_rate, double frequency, double amplitude) {
    std::vector<T> signal(N);
    for (std::size_t i = 0; i < N; i++) {
        signal[i] = {amplitude * std::sin(2. * std::numbers::pi * frequency * static_cast<double>(i) / sample_rate), 0.};
    }
    return signal;
}

const boost::ut::suite<"fixed-point format"> fixedPointTests = [] {
    using namespace boost::ut;
    using afe::fixed::Format;
    using afe::fixed::Q15;
    using Q15Format = Format<16UZ>;

    "Q15 limits"_test = [] {
        expect(eq(Q15Format::maxValue, 0x7FFF));
        expect(eq(Q15Format::minValue, -0x8000));
        expect(eq(Q15Format::fractionalBits, 15UZ));
        expect(std::is_same_v<Q15Format::value_type, std::int16_t>);
        expect(std::is_same_v<Format<24UZ>::value_type, std::int32_t>);
        expect(std::is_same_v<Format<24UZ>::wide_type, std::int64_t>);
    };

    "conversion from double"_test = [] {
        expect(eq(Q15Format::fromDouble(0.5), 0x4000));
        expect(eq(Q15Format::fromDouble(-0.5), -0x4000));
        expect(eq(Q15Format::fromDouble(1.0), 0x7FFF)) << "+1.0 saturates to full scale";
        expect(eq(Q15Format::fromDouble(-1.0), -0x8000));
        expect(eq(Q15Format::fromDouble(-3.0), -0x8000));
        expect(eq(Q15Format::fromDouble(1.5 * Q15Format::lsb), 2)) << "ties round away from zero";
        expect(eq(Q15Format::fromDouble(-1.5 * Q15Format::lsb), -2));
        expect(eq(Q15Format::fromDouble(0.25, 100.0), 25)) << "custom scale";
        expect(eq(Q15Format::toDouble(0x4000), 0.5));
    };

    "two's complement wrap"_test = [] {
        expect(eq(Q15Format::wrap(0x7FFF), 0x7FFF));
        expect(eq(Q15Format::wrap(0x8000), -0x8000));
        expect(eq(Q15Format::wrap(65532), -4));
        expect(eq(Format<12UZ>::wrap(2048), -2048)) << "W < storage width";
        expect(eq(Format<12UZ>::wrap(-2049), 2047));
        expect(eq(Q15Format::saturate(70000), 0x7FFF));
        expect(eq(Q15Format::saturate(-70000), -0x8000));
    };

    "Sample formatting"_test = [] {
        expect(eq(fmt::format("{}", Q15{63, -1}), std::string("(63, -1)")));
        expect(eq(fmt::format("{:f}", Q15{0x4000, 0}), std::string("(0.500000, 0.000000)")));
        expect(Q15::fromComplex({0.5, -0.25}) == Q15{0x4000, -0x2000});
    };
};

const boost::ut::suite<"butterfly addressing"> addressingTests = [] {
    using namespace boost::ut;
    using namespace afe::algorithm::fft;

    "bit reversal"_test = [] {
        expect(eq(bitReverse9(0UZ), 0UZ));
        expect(eq(bitReverse9(1UZ), 256UZ));
        expect(eq(bitReverse9(2UZ), 128UZ));
        expect(eq(bitReverse9(511UZ), 511UZ));
        expect(eq(bitReverse<3UZ>(3UZ), 6UZ));
        std::array<bool, 512UZ> hit{};
        for (std::size_t address = 0UZ; address < 512UZ; ++address) {
            expect(eq(bitReverse9(bitReverse9(address)), address));
            hit[bitReverse9(address)] = true;
        }
        expect(std::ranges::all_of(hit, [](bool h) { return h; })) << "bit reversal is a permutation";
    };

    "every address used once per stage"_test = [] {
        constexpr std::size_t N = 512UZ;
        for (std::size_t stage = 0UZ; stage < 9UZ; ++stage) {
            std::array<int, N> uses{};
            for (std::size_t index = 0UZ; index < N / 2UZ; ++index) {
                const auto address = butterflyAddress<N>(stage, index);
                expect(address.a < address.b);
                expect(eq(address.b - address.a, 1UZ << stage));
                expect(address.position < (1UZ << stage));
                uses[address.a]++;
                uses[address.b]++;
            }
            expect(std::ranges::all_of(uses, [](int n) { return n == 1; })) << fmt::format("stage {}", stage);
        }
    };

    "stage geometry"_test = [] {
        const auto first = butterflyAddress<512UZ>(0UZ, 5UZ);
        expect(eq(first.a, 10UZ));
        expect(eq(first.b, 11UZ));
        const auto second = butterflyAddress<512UZ>(1UZ, 3UZ);
        expect(eq(second.a, 5UZ));
        expect(eq(second.b, 7UZ));
        const auto last = butterflyAddress<512UZ>(8UZ, 255UZ);
        expect(eq(last.a, 255UZ));
        expect(eq(last.b, 511UZ));
    };

    "twiddle angle index"_test = [] {
        expect(eq(twiddleAngleIndex<512UZ>(0UZ, 17UZ), 0UZ)) << "stage 0 only uses W^0";
        expect(eq(twiddleAngleIndex<512UZ>(1UZ, 1UZ), 128UZ));
        expect(eq(twiddleAngleIndex<512UZ>(8UZ, 255UZ), 255UZ));
        expect(eq(twiddleAngleIndex<512UZ>(8UZ, 3UZ), 3UZ));
    };

    "bank ping-pong"_test = [] {
        expect(readBank(0UZ) == Bank::A);
        expect(writeBank(0UZ) == Bank::B);
        expect(readBank(1UZ) == Bank::B);
        expect(writeBank(8UZ) == Bank::B);
        expect(finalBank<512UZ> == Bank::B);
        expect(finalBank<16UZ> == Bank::A);

        MemoryBanks<8UZ> banks;
        banks[Bank::B][3] = afe::fixed::Q15{7, -7};
        expect(banks.readBankFor(1UZ)[3] == afe::fixed::Q15{7, -7});
        expect(banks.result()[3] == afe::fixed::Q15{7, -7}) << "3 stages end in bank B";
        banks.clear();
        expect(banks[Bank::B][3] == afe::fixed::Q15{});
    };
};

const boost::ut::suite<"twiddle table"> twiddleTests = [] {
    using namespace boost::ut;
    using namespace afe::algorithm::fft;
    using afe::fixed::Q15;

    "quarter-wave ROM content"_test = [] {
        constexpr auto& rom = TwiddleTable<>::rom;
        expect(eq(rom.depth, 128UZ));
        for (std::size_t i = 0UZ; i < rom.depth; ++i) {
            const double angle = 2.0 * std::numbers::pi * static_cast<double>(i) / 512.0;
            expect(eq(rom[i].cos, static_cast<std::int16_t>(std::lround(std::cos(angle) * 32767.0)))) << fmt::format("cos entry {}", i);
            expect(eq(rom[i].sin, static_cast<std::int16_t>(std::lround(std::sin(angle) * 32767.0)))) << fmt::format("sin entry {}", i);
        }
        expect(eq(rom[64].cos, rom[64].sin)) << "pi/4";
    };

    "coefficients over the full circle"_test = [] {
        TwiddleTable<> table;
        for (std::size_t k = 0UZ; k < 512UZ; ++k) {
            const auto                 w        = table.coefficient(k).toComplex();
            const std::complex<double> expected = std::polar(1.0, -2.0 * std::numbers::pi * static_cast<double>(k) / 512.0);
            expect(le(std::abs(w.real() - expected.real()), 2.0 / 32768.0)) << fmt::format("W^{} real {} vs {}", k, w.real(), expected.real());
            expect(le(std::abs(w.imag() - expected.imag()), 2.0 / 32768.0)) << fmt::format("W^{} imag {} vs {}", k, w.imag(), expected.imag());
            expect(le(std::abs(std::abs(w) - 1.0), 3.0 / 32768.0)) << fmt::format("|W^{}|", k);
        }
    };

    "quadrant boundaries"_test = [] {
        TwiddleTable<> table;
        expect(table.coefficient(0UZ) == Q15{0x7FFF, 0});
        expect(table.coefficient(128UZ) == Q15{0, -0x7FFF});
        expect(table.coefficient(256UZ) == Q15{-0x7FFF, 0});
        expect(table.coefficient(384UZ) == Q15{0, 0x7FFF});
        expect(table.coefficient(512UZ) == table.coefficient(0UZ)) << "angle index wraps modulo N";
    };

    "stage lookup"_test = [] {
        TwiddleTable<> table;
        expect(table.lookup(1UZ, 1UZ) == Q15{0, -0x7FFF}) << "stage 1 position 1 is -j";
        expect(table.lookup(8UZ, 255UZ) == table.coefficient(255UZ));
    };

    "inverse direction conjugates"_test = [] {
        TwiddleTable<> forward;
        TwiddleTable<> inverse{Direction::Inverse};
        for (std::size_t k = 0UZ; k < 512UZ; k += 7UZ) {
            const auto wf = forward.coefficient(k);
            const auto wi = inverse.coefficient(k);
            expect(eq(wi.real, wf.real));
            expect(eq(wi.imag, static_cast<std::int16_t>(-wf.imag)));
        }
    };

    "other sizes"_test = [] {
        TwiddleTable<16UZ, 12UZ> small;
        expect(small.coefficient(4UZ) == afe::fixed::Sample<12UZ>{0, -2047});
        expect(eq(small.rom[0].cos, 2047));
    };
};

const boost::ut::suite<"butterfly"> butterflyTests = [] {
    using namespace boost::ut;
    using afe::algorithm::fft::Butterfly;
    using afe::fixed::Q15;
    using Result = Butterfly<>::Result;

    "identity twiddle"_test = [] {
        expect(Butterfly<>::compute({0x7FFF, 0}, {0, 0}, {0x7FFF, 0}) == Result{{0x3FFF, 0}, {0x3FFF, 0}});
        expect(Butterfly<>::compute({0, 0}, {0, 0}, {0x1234, -0x4321}) == Result{{0, 0}, {0, 0}});
    };

    "rotation by -j"_test = [] {
        // W*B = -j * (3000 + 500j) ~ 500 - 3000j
        expect(Butterfly<>::multiply({0, -0x7FFF}, {3000, 500}) == Q15{499, -3000});
        expect(Butterfly<>::compute({1000, -2000}, {3000, 500}, {0, -0x7FFF}) == Result{{749, -2500}, {250, 500}});
    };

    "full-scale operands do not overflow the sum"_test = [] {
        expect(Butterfly<>::compute({-0x8000, -0x8000}, {-0x8000, -0x8000}, {0x7FFF, 0}) == Result{{-0x8000, -0x8000}, {-1, -1}});
    };

    "product wraps to W bits"_test = [] {
        // (1+j) * (1-j) = 2 does not fit into Q15 and wraps
        expect(Butterfly<>::multiply({0x7FFF, 0x7FFF}, {0x7FFF, -0x7FFF}) == Q15{-4, 0});
        expect(Butterfly<>::compute({0, 0}, {0x7FFF, -0x7FFF}, {0x7FFF, 0x7FFF}) == Result{{-2, 0}, {2, 0}});
    };

    "operands at -1.0 in every component"_test = [] {
        // (-1-j) * (-1-j) = 2j, the product sum needs 2W+1 bits before it wraps to 0
        constexpr Q15 minusOne{-0x8000, -0x8000};
        expect(Butterfly<>::multiply(minusOne, minusOne) == Q15{0, 0});
        expect(Butterfly<>::compute({0, 0}, minusOne, minusOne) == Result{{0, 0}, {0, 0}});
        expect(Butterfly<>::compute(minusOne, minusOne, minusOne) == Result{{-0x4000, -0x4000}, {-0x4000, -0x4000}});

        using Q30 = afe::fixed::Sample<31UZ>;
        constexpr Q30 minusOneWide{-0x4000'0000, -0x4000'0000};
        expect(Butterfly<31UZ>::multiply(minusOneWide, minusOneWide) == Q30{0, 0});
        expect(Butterfly<31UZ>::multiply({-0x4000'0000, 0}, {-0x4000'0000, 0}) == Q30{-0x4000'0000, 0}) << "+1.0 wraps to -1.0";
    };

    "arithmetic shift rounds toward -inf"_test = [] {
        expect(eq(Butterfly<>::compute({-1, 1}, {0, 0}, {0x7FFF, 0}).a.real, -1));
        expect(eq(Butterfly<>::compute({-1, 1}, {0, 0}, {0x7FFF, 0}).a.imag, 0));
    };
};

const boost::ut::suite<"reference DFT and spectrum helpers"> referenceTests = [] {
    using namespace boost::ut;
    using namespace afe::algorithm;
    using afe::fixed::Q15;

    "DFT of an impulse is flat"_test = [] {
        std::vector<std::complex<double>> impulse(16UZ);
        impulse[0]     = {1.0, 0.0};
        const auto out = computeDft(impulse);
        expect(afe::test::approx_collections(out, std::vector<std::complex<double>>(16UZ, {1.0, 0.0}), 1e-12));
    };

    "DFT forward and inverse"_test = [] {
        const auto signal   = generateSinSample<std::complex<double>>(64UZ, 64.0, 5.0, 1.0);
        const auto spectrum = computeDft(signal);
        expect(approx(std::abs(spectrum[5]), 32.0, 1e-9));
        expect(approx(std::abs(spectrum[59]), 32.0, 1e-9));
        expect(approx(std::abs(spectrum[4]), 0.0, 1e-9));

        auto restored = computeDft(spectrum, fft::Direction::Inverse);
        for (auto& value : restored) {
            value /= 64.0;
        }
        expect(afe::test::approx_collections(restored, signal, 1e-9));
    };

    "magnitude spectrum and peaks"_test = [] {
        std::vector<Q15> bins(8UZ);
        bins[2] = Q15{0x2000, 0};
        bins[6] = Q15{0x1000, 0};
        const auto mags = fft::computeMagnitudeSpectrum(bins);
        expect(approx(mags[2], 0.5, 1e-9)) << "amplitude of a real tone is twice the bin";
        expect(eq(fft::findPeakBins(mags, 2UZ), std::vector<std::size_t>{2UZ, 6UZ}));

        const auto half = fft::computeMagnitudeSpectrum(bins, {.computeHalfSpectrum = true});
        expect(eq(half.size(), 4UZ));

        const auto shifted = fft::computeMagnitudeSpectrum(bins, {.shiftSpectrum = true});
        expect(approx(shifted[6], 0.5, 1e-9));

        const auto db = fft::computeMagnitudeSpectrum(bins, {.outputInDb = true});
        expect(approx(db[2], 20.0 * std::log10(0.5), 1e-9));
        expect(eq(db[0], std::numeric_limits<double>::lowest()));

        expect(throws([] { std::ignore = fft::computeMagnitudeSpectrum(std::vector<Q15>{}); }));
    };

    "conversion helpers"_test = [] {
        const std::vector<std::complex<double>> values{{0.5, 0.0}, {-0.25, 0.125}};
        const auto                              samples = fft::fromComplex<Q15>(values);
        expect(samples[1] == Q15{-0x2000, 0x1000});
        expect(afe::test::approx_collections(fft::toComplex(samples), values, 1e-12));
    };
};

int main() { /* not needed for UT */ }
