#include "fixtures.hpp"
#include "numeric/constant.hpp"

#include <limits>
#include <random>

using namespace kpmdos;

namespace chain {

kpm::SparseOperator make(idx_t size, double t, bool periodic) {
    auto triplets = std::vector<Eigen::Triplet<double>>();
    for (auto i = storage_idx_t{0}; i < size - 1; ++i) {
        triplets.emplace_back(i, i + 1, -t);
        triplets.emplace_back(i + 1, i, -t);
    }
    if (periodic && size > 2) {
        auto const last = static_cast<storage_idx_t>(size - 1);
        triplets.emplace_back(0, last, -t);
        triplets.emplace_back(last, 0, -t);
    }

    auto m = SparseMatrixXd(size, size);
    m.setFromTriplets(triplets.begin(), triplets.end());
    m.makeCompressed();
    return {std::move(m)};
}

ArrayXd eigenvalues(idx_t size, double t) {
    auto const n = static_cast<double>(size);
    return ArrayXd::LinSpaced(size, 1, n).unaryExpr([&](double k) {
        return -2 * t * cos(constant::pi * k / (n + 1));
    });
}

} // namespace chain

namespace diagonal {

kpm::SparseOperator make(std::vector<double> const& values) {
    auto const size = static_cast<idx_t>(values.size());
    auto triplets = std::vector<Eigen::Triplet<double>>();
    for (auto i = storage_idx_t{0}; i < size; ++i) {
        triplets.emplace_back(i, i, values[i]);
    }

    auto m = SparseMatrixXd(size, size);
    m.setFromTriplets(triplets.begin(), triplets.end());
    m.makeCompressed();
    return {std::move(m)};
}

} // namespace diagonal

DenseOperator make_random_hermitian(idx_t size, unsigned seed) {
    auto generator = std::mt19937(seed);
    auto distribution = std::uniform_real_distribution<double>(-1.0, 1.0);

    auto m = MatrixXcd(size, size);
    for (auto i = idx_t{0}; i < size; ++i) {
        for (auto j = idx_t{0}; j < size; ++j) {
            auto const re = distribution(generator);
            auto const im = distribution(generator);
            m(i, j) = {re, im};
        }
    }
    return {(m + m.adjoint()) / 2};
}

void NanOperator::apply(VectorXcd const&, VectorXcd& y) const {
    y.setConstant(std::numeric_limits<double>::quiet_NaN());
}
