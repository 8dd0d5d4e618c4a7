#pragma once
#include "kpm/Operator.hpp"

#include <vector>

namespace chain {

/// Tight-binding chain with nearest neighbor hopping `-t`, optionally closed into a ring
kpmdos::kpm::SparseOperator make(kpmdos::idx_t size, double t = 1.0, bool periodic = false);

/// Exact eigenvalues of the open chain: `-2t cos(pi k / (n + 1))`, k = 1..n
kpmdos::ArrayXd eigenvalues(kpmdos::idx_t size, double t = 1.0);

} // namespace chain

namespace diagonal {

/// Diagonal matrix with the given eigenvalues
kpmdos::kpm::SparseOperator make(std::vector<double> const& values);

} // namespace diagonal

/// Dense matrix satisfying the `LinearOperator` capability without any adapter
struct DenseOperator {
    kpmdos::MatrixXcd matrix;

    kpmdos::idx_t size() const { return matrix.rows(); }
    void apply(kpmdos::VectorXcd const& x, kpmdos::VectorXcd& y) const { y = matrix * x; }
};

/// Random dense Hermitian matrix with the given size
DenseOperator make_random_hermitian(kpmdos::idx_t size, unsigned seed = 42);

/// Produces NaN for any input
struct NanOperator {
    kpmdos::idx_t n;

    kpmdos::idx_t size() const { return n; }
    void apply(kpmdos::VectorXcd const&, kpmdos::VectorXcd& y) const;
};
