#ifndef AFE_ERROR_HPP
#define AFE_ERROR_HPP

#include <chrono>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

#include <afe/meta/formatter.hpp>

namespace afe {

/// value-type error returned through std::expected<T, afe::Error> by the engine's control operations
struct Error {
    std::string                           message;
    std::source_location                  sourceLocation;
    std::chrono::system_clock::time_point errorTime = std::chrono::system_clock::now();

    Error(std::string_view msg = "unknown error", std::source_location location = std::source_location::current(), //
        std::chrono::system_clock::time_point time = std::chrono::system_clock::now()) noexcept                    //
        : message(msg), sourceLocation(location), errorTime(time) {}

    [[nodiscard]] std::string srcLoc() const noexcept { return fmt::format("{}", sourceLocation); }
    [[nodiscard]] std::string methodName() const noexcept { return {sourceLocation.function_name()}; }
    [[nodiscard]] std::string isoTime() const noexcept { return time::getIsoTime(errorTime); }
};

static_assert(std::is_default_constructible_v<Error>);

} // namespace afe

template<>
struct fmt::formatter<afe::Error> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const afe::Error& err, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{} at {:t}", err.message, err.sourceLocation);
    }
};

#endif // AFE_ERROR_HPP
