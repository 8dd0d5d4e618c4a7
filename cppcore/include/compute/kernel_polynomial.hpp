#pragma once
#include "numeric/dense.hpp"
#include "numeric/sparse.hpp"
#include "numeric/traits.hpp"

#include "compute/detail.hpp"
#include "detail/macros.hpp"

namespace kpmdos { namespace compute {

/**
 CSR matrix-vector multiplication for a matrix of any scalar type

 Equivalent to: y = matrix * x
 The matrix elements are widened to `std::complex<double>` on the fly.
 */
template<class scalar_t> KPMDOS_ALWAYS_INLINE
void csr_spmv(SparseMatrixX<scalar_t> const& matrix, VectorXcd const& x, VectorXcd& y) {
    auto const size = matrix.rows();
    auto const data = matrix.valuePtr();
    auto const indices = matrix.innerIndexPtr();
    auto const indptr = matrix.outerIndexPtr();

    for (auto row = idx_t{0}; row < size; ++row) {
        auto r = std::complex<double>{0};
        for (auto n = indptr[row]; n < indptr[row + 1]; ++n) {
            r += detail::mul(num::to_complex_double(data[n]), x[indices[n]]);
        }
        y[row] = r;
    }
}

/**
 First step of the Chebyshev recursion: y = R * x where `R = (H - b) / a`

 `hx` is the result of the operator applied to `x`.
 */
KPMDOS_ALWAYS_INLINE
void kpm_first(double a, double b, VectorXcd const& hx, VectorXcd const& x, VectorXcd& y) {
    auto const size = x.size();
    auto const inv_a = 1 / a;
    for (auto i = idx_t{0}; i < size; ++i) {
        y[i] = (hx[i] - b * x[i]) * inv_a;
    }
}

/**
 KPM-specialized vector update for the main recursion loop

 Equivalent to: y = 2 * R * x - y where `R = (H - b) / a`
 On input `y` holds the previous vector `t_{n-1}` and on output the next one `t_{n+1}`.
 */
KPMDOS_ALWAYS_INLINE
void kpm_step(double a, double b, VectorXcd const& hx, VectorXcd const& x, VectorXcd& y) {
    auto const size = x.size();
    auto const two_over_a = 2 / a;
    for (auto i = idx_t{0}; i < size; ++i) {
        y[i] = (hx[i] - b * x[i]) * two_over_a - y[i];
    }
}

/**
 KPM-specialized update which also collects the products needed by the diagonal algorithm

 Equivalent to:
   y = 2 * R * x - y
   m2 = <x|x>
   m3 = <y|x>
 */
KPMDOS_ALWAYS_INLINE
void kpm_step_diagonal(double a, double b, VectorXcd const& hx, VectorXcd const& x,
                       VectorXcd& y, std::complex<double>& m2, std::complex<double>& m3) {
    auto const size = x.size();
    auto const two_over_a = 2 / a;
    auto norm2 = 0.0;
    auto dot = std::complex<double>{0};
    for (auto i = idx_t{0}; i < size; ++i) {
        auto const r = (hx[i] - b * x[i]) * two_over_a - y[i];
        norm2 += detail::square(x[i]);
        dot += detail::conj_mul(r, x[i]);
        y[i] = r;
    }
    m2 += norm2;
    m3 += dot;
}

/**
 Squared norm `<x|x>` accumulated in the same order as in `kpm_step_diagonal()`

 The diagonal algorithm may compute the same moment with either function, depending on
 where the previous computation stopped. The results must agree exactly.
 */
KPMDOS_ALWAYS_INLINE
double squared_norm(VectorXcd const& x) {
    auto const size = x.size();
    auto norm2 = 0.0;
    for (auto i = idx_t{0}; i < size; ++i) {
        norm2 += detail::square(x[i]);
    }
    return norm2;
}

}} // namespace kpmdos::compute
