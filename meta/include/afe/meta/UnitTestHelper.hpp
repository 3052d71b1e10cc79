#ifndef AFE_UNITTESTHELPER_HPP
#define AFE_UNITTESTHELPER_HPP

#include <boost/ut.hpp>
#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <fmt/format.h>
#include <iterator>
#include <ostream>
#include <ranges>
#include <source_location>
#include <string>
#include <type_traits>

#include "formatter.hpp"
#include "utils.hpp"

namespace afe::test {
using namespace boost::ut;

template<typename T>
concept HasSize = requires(const T c) {
    { c.size() } -> std::convertible_to<std::size_t>;
};

template<typename T>
concept Collection = std::ranges::range<T> && HasSize<T>;

struct eq_collection_result {
    bool                 success{};
    std::string          message{};
    std::source_location location = std::source_location::current();

    operator bool() const { return success; }
    friend std::ostream& operator<<(std::ostream& os, const eq_collection_result& r) { return os << r.message; }
};

/// largest per-component deviation, scalar types are treated as complex with zero imaginary part
template<typename T>
[[nodiscard]] double componentDistance(const T& lhs, const T& rhs) noexcept {
    if constexpr (meta::complex_like<T>) {
        return std::max(std::abs(static_cast<double>(lhs.real() - rhs.real())), std::abs(static_cast<double>(lhs.imag() - rhs.imag())));
    } else {
        return std::abs(static_cast<double>(lhs) - static_cast<double>(rhs));
    }
}

/**
 * compares two collections element-wise within `tolerance` (per real/imag component for complex values);
 * on failure the message names the first offending index, the largest deviation and a context window.
 */
template<Collection RangeLHS, Collection RangeRHS>
requires std::is_same_v<std::ranges::range_value_t<RangeLHS>, std::ranges::range_value_t<RangeRHS>>
auto approx_collections(const RangeLHS& LHS, const RangeRHS& RHS, double tolerance, std::size_t contextWindow = 3, std::source_location location = std::source_location::current()) -> eq_collection_result {
    const auto sizeLHS = LHS.size();
    const auto sizeRHS = RHS.size();
    if (sizeLHS != sizeRHS) {
        return {false, fmt::format("Collections size mismatch: LHS.size()={}, RHS.size()={}", sizeLHS, sizeRHS), location};
    }

    double maxDeviation = 0.0;
    auto   itR          = RHS.begin();
    for (auto itL = LHS.begin(); itL != LHS.end(); ++itL, ++itR) {
        maxDeviation = std::max(maxDeviation, componentDistance(*itL, *itR));
    }

    const auto pred          = [tolerance](const auto& lhsValue, const auto& rhsValue) noexcept { return componentDistance(lhsValue, rhsValue) <= tolerance; };
    auto       firstMismatch = std::ranges::mismatch(LHS, RHS, pred);
    if (firstMismatch.in1 == LHS.end()) {
        return {true, fmt::format("Collections approx match ({} elements) within tolerance={} (max deviation {})", sizeLHS, tolerance, maxDeviation), location};
    }

    // define context window around first mismatched value
    const std::ptrdiff_t idx         = std::distance(LHS.begin(), firstMismatch.in1);
    const std::ptrdiff_t ctxStartIdx = idx < static_cast<std::ptrdiff_t>(contextWindow) ? 0 : (idx - static_cast<std::ptrdiff_t>(contextWindow));
    const std::ptrdiff_t ctxStopIdx  = std::min<std::ptrdiff_t>(static_cast<std::ptrdiff_t>(sizeLHS), idx + static_cast<std::ptrdiff_t>(contextWindow) + 1);

    std::string ctxLHS;
    std::string ctxRHS;
    for (auto i = ctxStartIdx; i < ctxStopIdx; ++i) {
        ctxLHS += fmt::format("{} ", *std::next(LHS.begin(), i));
        ctxRHS += fmt::format("{} ", *std::next(RHS.begin(), i));
    }

    return {false,
        fmt::format("Collections differ (approx) at index={idx}; LHS[{idx}]={lhs} vs RHS[{idx}]={rhs} (tolerance={tol}, max deviation={dev})\nContext window [{ctx_start}, {ctx_end}]:\n  left:  {lhs_context}\n  right: {rhs_context}", //
            fmt::arg("idx", idx), fmt::arg("lhs", *firstMismatch.in1), fmt::arg("rhs", *firstMismatch.in2), fmt::arg("tol", tolerance), fmt::arg("dev", maxDeviation),                                                       //
            fmt::arg("ctx_start", ctxStartIdx), fmt::arg("ctx_end", ctxStopIdx - 1), fmt::arg("lhs_context", ctxLHS), fmt::arg("rhs_context", ctxRHS)),
        location};
}

} // namespace afe::test

#endif // AFE_UNITTESTHELPER_HPP
