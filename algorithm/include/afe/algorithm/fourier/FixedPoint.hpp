#ifndef AFE_ALGORITHM_FIXED_POINT_HPP
#define AFE_ALGORITHM_FIXED_POINT_HPP

#include <complex>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include <fmt/format.h>

namespace afe::fixed {

/**
 * @brief signed Q(W-1) fixed-point format: one sign bit and W-1 fractional bits, value range [-1, 1).
 *
 * `value_type` holds a W-bit value, `wide_type` at least W+1 bits (sums of two values), and
 * `product_type` at least 2W+1 bits (the sum of two full-width products, see `Butterfly`).
 * Full scale (+1.0) is represented by `maxValue`, i.e. 0x7FFF for W = 16.
 */
template<std::size_t W>
requires(W >= 2UZ && W <= 31UZ)
struct Format {
    static constexpr std::size_t bits = W;
    using value_type                  = std::conditional_t<(W <= 16UZ), std::int16_t, std::int32_t>;
    using wide_type                   = std::conditional_t<(W <= 16UZ), std::int32_t, std::int64_t>;
    using product_type                = std::int64_t;

    static constexpr wide_type   maxValue       = (wide_type{1} << (W - 1UZ)) - 1;
    static constexpr wide_type   minValue       = -(wide_type{1} << (W - 1UZ));
    static constexpr std::size_t fractionalBits = W - 1UZ;
    static constexpr double      lsb            = 1.0 / static_cast<double>(wide_type{1} << fractionalBits);

    /// two's complement truncation to W bits, i.e. what a W-bit register keeps of a wider value
    [[nodiscard]] static constexpr value_type wrap(wide_type value) noexcept {
        if constexpr (W == 8UZ * sizeof(value_type)) {
            return static_cast<value_type>(value); // modular since C++20
        } else {
            constexpr std::uint64_t mask    = (std::uint64_t{1} << W) - 1U;
            constexpr std::uint64_t signBit = std::uint64_t{1} << (W - 1UZ);
            std::uint64_t           raw     = static_cast<std::uint64_t>(value) & mask;
            if (raw & signBit) {
                raw |= ~mask;
            }
            return static_cast<value_type>(static_cast<std::int64_t>(raw));
        }
    }

    [[nodiscard]] static constexpr value_type saturate(wide_type value) noexcept {
        if (value > maxValue) {
            return static_cast<value_type>(maxValue);
        }
        if (value < minValue) {
            return static_cast<value_type>(minValue);
        }
        return static_cast<value_type>(value);
    }

    /// round-to-nearest (ties away from zero) of `value * scale`, saturated to the representable range
    [[nodiscard]] static constexpr value_type fromDouble(double value, double scale = static_cast<double>(wide_type{1} << fractionalBits)) noexcept {
        const double scaled = value * scale;
        if (scaled >= static_cast<double>(maxValue)) {
            return static_cast<value_type>(maxValue);
        }
        if (scaled <= static_cast<double>(minValue)) {
            return static_cast<value_type>(minValue);
        }
        const auto rounded = scaled >= 0.0 ? static_cast<wide_type>(scaled + 0.5) : -static_cast<wide_type>(-scaled + 0.5);
        return saturate(rounded);
    }

    [[nodiscard]] static constexpr double toDouble(value_type value) noexcept { return static_cast<double>(value) * lsb; }
};

template<std::size_t W = 16UZ>
struct Sample {
    using format     = Format<W>;
    using value_type = typename format::value_type;

    value_type real{};
    value_type imag{};

    constexpr bool operator==(const Sample&) const noexcept = default;

    [[nodiscard]] static constexpr Sample fromComplex(std::complex<double> value) noexcept { return {format::fromDouble(value.real()), format::fromDouble(value.imag())}; }

    [[nodiscard]] constexpr std::complex<double> toComplex() const noexcept { return {format::toDouble(real), format::toDouble(imag)}; }
};

using Q15 = Sample<16UZ>;

} // namespace afe::fixed

/// formats as raw integers "(re, im)" by default, 'f' prints the Q(W-1) values as fractions
template<std::size_t W>
struct fmt::formatter<afe::fixed::Sample<W>> {
    char presentation = 'd';

    constexpr auto parse(format_parse_context& ctx) {
        auto it = ctx.begin(), end = ctx.end();
        if (it != end && (*it == 'd' || *it == 'f')) {
            presentation = *it++;
        }
        if (it != end && *it != '}') {
            throw format_error("invalid format specifier for afe::fixed::Sample");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const afe::fixed::Sample<W>& sample, FormatContext& ctx) const {
        if (presentation == 'f') {
            const auto value = sample.toComplex();
            return fmt::format_to(ctx.out(), "({:.6f}, {:.6f})", value.real(), value.imag());
        }
        return fmt::format_to(ctx.out(), "({}, {})", sample.real, sample.imag);
    }
};

#endif // AFE_ALGORITHM_FIXED_POINT_HPP
