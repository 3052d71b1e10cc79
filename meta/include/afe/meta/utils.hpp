#ifndef AFE_META_UTILS_HPP
#define AFE_META_UTILS_HPP

#include <bit>
#include <complex>
#include <cstddef>
#include <cstdlib>
#include <cxxabi.h>
#include <string>
#include <type_traits>
#include <typeinfo>

namespace afe::meta {

template<typename T>
concept complex_like = std::is_same_v<T, std::complex<float>> || std::is_same_v<T, std::complex<double>>;

template<std::size_t N>
concept power_of_two = std::has_single_bit(N);

/// number of radix-2 stages needed for an N-point transform
template<std::size_t N>
requires power_of_two<N>
inline constexpr std::size_t log2_v = static_cast<std::size_t>(std::countr_zero(N));

template<typename... Lambdas>
struct overloaded : Lambdas... {
    using Lambdas::operator()...;
};

template<typename... Lambdas>
overloaded(Lambdas...) -> overloaded<Lambdas...>;

namespace detail {
template<typename T>
[[nodiscard]] std::string local_type_name() noexcept {
    std::string type_name = typeid(T).name();
    int         status;
    char*       demangled_name = abi::__cxa_demangle(type_name.c_str(), nullptr, nullptr, &status);
    if (status == 0) {
        std::string ret(demangled_name);
        std::free(demangled_name);
        return ret;
    }
    std::free(demangled_name);
    return type_name;
}
} // namespace detail

template<typename T>
[[nodiscard]] std::string type_name() noexcept {
    return detail::local_type_name<T>();
}

} // namespace afe::meta

#endif // AFE_META_UTILS_HPP
