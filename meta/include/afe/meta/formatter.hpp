#ifndef AFE_META_FORMATTER_HPP
#define AFE_META_FORMATTER_HPP

#include <chrono>
#include <complex>
#include <source_location>
#include <string>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace afe::time {
[[nodiscard]] inline std::string getIsoTime(std::chrono::system_clock::time_point timePoint = std::chrono::system_clock::now()) noexcept {
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}",                                                  // ms-precision ISO time-format
        fmt::localtime(std::chrono::system_clock::to_time_t(timePoint)),                               //
        std::chrono::duration_cast<std::chrono::milliseconds>(timePoint.time_since_epoch()).count() % 1000);
}
} // namespace afe::time

template<>
struct fmt::formatter<std::source_location> {
    char presentation = 's';

    constexpr auto parse(format_parse_context& ctx) {
        auto it = ctx.begin(), end = ctx.end();
        if (it != end && (*it == 's' || *it == 'f' || *it == 't')) {
            presentation = *it++;
        }
        if (it != end && *it != '}') {
            throw format_error("invalid format specifier for source_location");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const std::source_location& loc, FormatContext& ctx) const {
        switch (presentation) {
        case 's': return fmt::format_to(ctx.out(), "{}", loc.file_name());
        case 't': return fmt::format_to(ctx.out(), "{}:{}", loc.file_name(), loc.line());
        case 'f':
        default: return fmt::format_to(ctx.out(), "{}:{} in {}", loc.file_name(), loc.line(), loc.function_name());
        }
    }
};

template<typename T>
struct fmt::formatter<std::complex<T>> {
    char presentation = 'g';

    constexpr auto parse(format_parse_context& ctx) {
        auto it = ctx.begin(), end = ctx.end();
        if (it != end && (*it == 'f' || *it == 'e' || *it == 'g')) {
            presentation = *it++;
        }
        if (it != end && *it != '}') {
            throw format_error("invalid format specifier for std::complex");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const std::complex<T>& value, FormatContext& ctx) const {
        const auto imag = value.imag();
        switch (presentation) {
        case 'e':
            if (imag == 0) {
                return fmt::format_to(ctx.out(), "{:e}", value.real());
            }
            return fmt::format_to(ctx.out(), "({:e}{:+e}i)", value.real(), imag);
        case 'f':
            if (imag == 0) {
                return fmt::format_to(ctx.out(), "{:f}", value.real());
            }
            return fmt::format_to(ctx.out(), "({:f}{:+f}i)", value.real(), imag);
        case 'g':
        default:
            if (imag == 0) {
                return fmt::format_to(ctx.out(), "{:g}", value.real());
            }
            return fmt::format_to(ctx.out(), "({:g}{:+g}i)", value.real(), imag);
        }
    }
};

#endif // AFE_META_FORMATTER_HPP
