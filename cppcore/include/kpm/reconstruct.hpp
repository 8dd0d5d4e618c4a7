#pragma once
#include "kpm/Bounds.hpp"
#include "kpm/Kernel.hpp"
#include "numeric/constant.hpp"
#include "errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <functional>
#include <limits>

namespace kpmdos { namespace kpm {

/// What to do with energies outside of the rescaled spectrum
enum class OutOfBand { Throw, NaN };

/// Weight function `f(E)` integrated against the spectral density
using WeightFunction = std::function<double (double energy)>;

/// Return a copy of the moments with the kernel damping applied
inline ArrayXXcdCM damped(ArrayXXcdCM moments, Kernel const& kernel) {
    kernel(moments);
    return moments;
}

/// Chebyshev nodes `x_j = cos(pi (j + 1/2) / M)` in ascending order
inline ArrayXd chebyshev_nodes(idx_t num_points) {
    auto const M = static_cast<double>(num_points);
    auto const js = make_integer_range<double>(num_points);
    return js.unaryExpr([&](double j) { return -cos(constant::pi * (j + 0.5) / M); });
}

/**
 The damped Chebyshev series `gamma(x) = g_0 m_0 + 2 sum_k g_k m_k T_k(x)`
 at the nodes returned by `chebyshev_nodes(num_points)`

 This is a type-III discrete cosine transform. Result: (num_points x outputs).
 */
inline ArrayXXdCM gammas_on_nodes(ArrayXXcdCM const& damped_moments, idx_t num_points) {
    auto const M = static_cast<double>(num_points);
    auto const real_moments = ArrayXXdCM(damped_moments.real());
    auto const ns = make_integer_range<double>(real_moments.rows());

    auto result = ArrayXXdCM(num_points, real_moments.cols());
    for (auto j = idx_t{0}; j < num_points; ++j) {
        // ascending x: node `j` is `cos(theta)` with the reversed index
        auto const theta = constant::pi * (static_cast<double>(num_points - 1 - j) + 0.5) / M;
        auto t = cos(ns * theta).eval();
        t.tail(t.size() - 1) *= 2;
        result.row(j) = (real_moments.colwise() * t).colwise().sum();
    }
    return result;
}

/**
 Reconstruct the spectral density at the given energies

     rho(E) = (g_0 m_0 + 2 sum_k g_k m_k T_k(x)) / (pi * sqrt(1 - x^2)) / a

 where `x = (E - b) / a`. Result: (energies x outputs).
 */
inline ArrayXXdCM spectral_density(ArrayXXcdCM const& damped_moments, ArrayXd const& energy,
                                   Scale const& scale, OutOfBand policy) {
    auto const real_moments = ArrayXXdCM(damped_moments.real());
    auto const ns = make_integer_range<double>(real_moments.rows());
    auto const scaled_energy = scale(energy);

    auto result = ArrayXXdCM(energy.size(), real_moments.cols());
    for (auto i = idx_t{0}; i < energy.size(); ++i) {
        auto const x = scaled_energy[i];
        if (!(abs(x) < 1)) {
            if (policy == OutOfBand::NaN) {
                result.row(i).setConstant(std::numeric_limits<double>::quiet_NaN());
                continue;
            }
            throw OutOfBandError(fmt::format(
                "Energy {} is outside of the rescaled spectrum ({}, {})",
                energy[i], scale.b - scale.a, scale.b + scale.a
            ));
        }

        auto t = cos(ns * acos(x)).eval();
        t.tail(t.size() - 1) *= 2;
        auto const k = 1 / (constant::pi * sqrt(1 - x * x) * scale.a);
        result.row(i) = k * (real_moments.colwise() * t).colwise().sum();
    }
    return result;
}

/**
 Gauss-Chebyshev quadrature of the density times the weights at the nodes

     (1 / M) sum_j gamma(x_j) w_j

 For `w == 1` this is exactly `g_0 m_0`. Result: one value per output.
 */
inline ArrayXd average_on_nodes(ArrayXXdCM const& gammas, ArrayXd const& weights) {
    auto const M = static_cast<double>(gammas.rows());
    return (gammas.colwise() * weights).colwise().sum().transpose() / M;
}

/**
 Closed-form integral of the density times `f(x) = sum_n f_n T_n(x)` on the rescaled axis

     g_0 m_0 f_0 + sum_{n >= 1} g_n m_n f_n

 Only the first `min(N, f_n.size())` terms contribute. Result: one value per output.
 */
inline ArrayXd average_chebyshev(ArrayXXcdCM const& damped_moments, ArrayXd const& f_n) {
    auto const n = std::min(damped_moments.rows(), f_n.size());
    auto const real_moments = ArrayXXdCM(damped_moments.real());
    return (real_moments.topRows(n).colwise() * f_n.head(n)).colwise().sum().transpose();
}

/**
 The Fermi-Dirac distribution `1 / (1 + exp((E - mu) / kT))`

 With `kT == 0` this is a step function which is 1/2 at `E == mu`.
 Throws `std::invalid_argument` if `kT < 0`.
 */
inline WeightFunction fermi_distribution(double mu, double kT) {
    if (kT < 0) {
        throw std::invalid_argument(fmt::format("fermi_distribution: kT must be >= 0, got {}", kT));
    }
    if (kT == 0) {
        return [mu](double e) { return e < mu ? 1.0 : (e > mu ? 0.0 : 0.5); };
    }
    return [mu, kT](double e) { return 1 / (1 + std::exp((e - mu) / kT)); };
}

}} // namespace kpmdos::kpm
