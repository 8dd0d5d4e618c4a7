#pragma once
#include <complex>
#include <string>
#include <type_traits>

namespace kpmdos { namespace num {

namespace detail {
    template<class T>
    struct complex_traits {
        static_assert(std::is_arithmetic<T>::value, "");

        using real_t = T;
        static constexpr bool is_complex = false;
    };

    template<class T>
    struct complex_traits<std::complex<T>> {
        using real_t = T;
        static constexpr bool is_complex = true;
    };
} // namespace detail

/**
 Return the real type corresponding to the given scalar type

 For example:
   std::complex<float> -> float
   float               -> float
 */
template<class scalar_t>
using get_real_t = typename detail::complex_traits<scalar_t>::real_t;

/**
 Is the given scalar type complex?
 */
template<class scalar_t>
inline constexpr bool is_complex() { return detail::complex_traits<scalar_t>::is_complex; }

/**
 Widen any stored scalar to the `std::complex<double>` used by the KPM vectors
 */
template<class scalar_t>
inline std::complex<double> to_complex_double(scalar_t v) {
    return static_cast<std::complex<double>>(static_cast<double>(v));
}
template<class real_t>
inline std::complex<double> to_complex_double(std::complex<real_t> v) {
    return {static_cast<double>(v.real()), static_cast<double>(v.imag())};
}

/**
 Return a human readable name of the scalar type
 */
template<class scalar_t> inline std::string scalar_name();
template<> inline std::string scalar_name<float>() { return "float"; }
template<> inline std::string scalar_name<double>() { return "double"; }
template<> inline std::string scalar_name<std::complex<float>>() { return "complex<float>"; }
template<> inline std::string scalar_name<std::complex<double>>() { return "complex<double>"; }

}} // namespace kpmdos::num
