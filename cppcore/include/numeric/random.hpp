#pragma once
#include "numeric/dense.hpp"
#include "numeric/constant.hpp"

#include <random>

namespace kpmdos { namespace num {

/**
 Array of `size` real numbers uniformly distributed on the interval [0, 1)
 */
inline ArrayXd make_random_uniform(idx_t size, std::mt19937& generator) {
    auto distribution = std::uniform_real_distribution<double>();
    auto result = ArrayXd(size);
    for (auto i = idx_t{0}; i < size; ++i) {
        result[i] = distribution(generator);
    }
    return result;
}

/// Unit-modulus random phases `exp(2 pi i x)` with `x` uniform in [0, 1)
inline VectorXcd make_random_phases(idx_t size, std::mt19937& generator) {
    auto const phase = make_random_uniform(size, generator);
    auto const k = 2 * constant::pi * constant::i1;
    return exp(k * phase.cast<std::complex<double>>()).matrix();
}

}} // namespace kpmdos::num
