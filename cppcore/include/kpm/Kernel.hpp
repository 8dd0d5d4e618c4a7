#pragma once
#include "numeric/dense.hpp"

#include <functional>

namespace kpmdos { namespace kpm {

/**
 Put the kernel in *Kernel* Polynomial Method

 This provides the general kernel interface. For concrete implementations
 see the `jackson_kernel`, `lorentz_kernel` and `dirichlet_kernel` functions below.
 The damping is applied to a copy of the moments at reconstruction time only.
 */
struct Kernel {
    /// Produce the KPM damping coefficients which depend on the number of expansion moments
    std::function<ArrayXd(idx_t num_moments)> damping_coefficients;
    /// The number of moments required to reconstruct a function at the specified scaled broadening
    std::function<idx_t(double scaled_broadening)> required_num_moments;

    /// Apply the kernel damping to an array of moments
    void operator()(ArrayXcd& moments) const {
        moments *= damping_coefficients(moments.size()).cast<std::complex<double>>();
    }

    /// Apply the kernel damping to each column (observable output) of the moments
    void operator()(ArrayXXcdCM& moments) const {
        auto const g = damping_coefficients(moments.rows()).cast<std::complex<double>>().eval();
        moments.colwise() *= g;
    }
};

/**
 The Jackson kernel

 This is a good general-purpose kernel, appropriate for most applications. It imposes a
 Gaussian broadening of `sigma = pi / N`. Therefore, the resolution of the reconstructed
 function will improve directly with the number of moments N.
*/
Kernel jackson_kernel();

/**
 The Lorentz kernel

 Mimics the divergences near the true eigenvalues of the operator. The lambda value is
 found empirically to be between 3 and 5, and it may be used to fine-tune the smoothness
 of the convergence. The Lorentzian broadening is given by `lambda / N`.
 */
Kernel lorentz_kernel(double lambda = 4.0);

/**
 The Dirichlet kernel

 Leaves the moments unchanged: the result is the plain truncated series with strong
 Gibbs oscillations. `required_num_moments()` returns `N = pi / sigma`, like Jackson.
 */
Kernel dirichlet_kernel();

}} // namespace kpmdos::kpm
