#pragma once
#include <complex>

namespace kpmdos { namespace constant {
    // imaginary one
    constexpr std::complex<double> i1(0, 1);
    // the omnipresent pi
    constexpr double pi = 3.14159265358979323846;
}} // namespace kpmdos::constant
