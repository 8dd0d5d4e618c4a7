#pragma once
#include "numeric/dense.hpp"
#include "numeric/random.hpp"
#include "compute/detail.hpp"
#include "errors.hpp"

#include <Eigen/Eigenvalues>
#include <fmt/format.h>

#include <cmath>
#include <limits>

namespace kpmdos { namespace compute {

/**
 Lanczos-specialized vector update + dot product

 Equivalent to:
   a = real(dot_product(v1, hv1))
   v0 = hv1 - a * v1 - b_prev * v0
   b = norm(v0)
   return {a, b}
 */
struct LanczosStep {
    double a;
    double b;
};

inline LanczosStep lanczos_update(double b_prev, VectorXcd const& hv1,
                                  VectorXcd const& v1, VectorXcd& v0) {
    auto const size = v1.size();

    auto a = 0.0;
    for (auto i = idx_t{0}; i < size; ++i) {
        a += detail::conj_mul(v1[i], hv1[i]).real();
    }

    auto norm2 = 0.0;
    for (auto i = idx_t{0}; i < size; ++i) {
        auto const l = hv1[i] - a * v1[i] - b_prev * v0[i];
        norm2 += detail::square(l);
        v0[i] = l;
    }

    return {a, std::sqrt(norm2)};
}

struct LanczosBounds {
    double min; ///< lower bound of the spectrum
    double max; ///< upper bound of the spectrum
    int loops;  ///< number of iterations needed to converge
};

/**
 Use the Lanczos algorithm to find the min and max eigenvalues at given precision (%)

 Only the action of the operator is needed: `op.size()` and `op.apply(x, y)` where
 `y = op * x`. The extreme Ritz values always lie inside the true spectrum, so they are
 widened by their residual norm `|b_k * s_k|`, which bounds the distance to the nearest
 eigenvalue, and by the requested precision. The result encloses the spectrum.
 */
template<class Operator>
LanczosBounds minmax_eigenvalues(Operator const& op, double precision_percent,
                                 std::mt19937& generator) {
    using ColMajorMatrixXd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic,
                                           Eigen::ColMajor>;

    auto const size = op.size();
    if (size <= 0) { throw OperatorError("The operator must have a non-zero dimension."); }

    auto v0 = VectorXcd::Zero(size).eval();
    auto v1 = num::make_random_phases(size, generator);
    v1.normalize();
    auto hv1 = VectorXcd(size);

    // Alpha and beta are the diagonals of the tridiagonal matrix.
    // The final size is not known ahead of time, but it will be small.
    auto alpha = std::vector<double>(); alpha.reserve(100);
    auto beta = std::vector<double>(); beta.reserve(100);

    // Energy values from the previous iteration. Used to test convergence.
    // Initial values as far away from expected as possible.
    auto previous_min = std::numeric_limits<double>::max();
    auto previous_max = std::numeric_limits<double>::lowest();
    auto const precision = precision_percent / 100;

    constexpr auto loop_limit = 1000;
    auto loops = 0;
    auto converged = false;
    // This may iterate up to matrix_size, but since only the extreme eigenvalues are required it
    // will converge very quickly. Exceeding `loop_limit` would suggest something is wrong.
    for (; loops < loop_limit && !converged; ++loops) {
        // PART 1: Calculate tridiagonal matrix elements a and b
        // =====================================================
        op.apply(v1, hv1);
        auto const b_prev = !beta.empty() ? beta.back() : 0.0;
        auto const step = lanczos_update(b_prev, hv1, v1, v0);
        if (!std::isfinite(step.a) || !std::isfinite(step.b)) {
            throw OperatorError("The operator produced non-finite values.");
        }

        alpha.push_back(step.a);
        beta.push_back(step.b);

        // PART 2: Check if the largest magnitude eigenvalues have converged
        // =================================================================
        auto const k = static_cast<idx_t>(alpha.size());
        VectorXd const diag = eigen_cast<ArrayX>(alpha).matrix();
        VectorXd const subdiag = eigen_cast<ArrayX>(beta).head(k - 1).matrix();
        auto solver = Eigen::SelfAdjointEigenSolver<ColMajorMatrixXd>();
        solver.computeFromTridiagonal(diag, subdiag, Eigen::EigenvaluesOnly);
        auto const min = solver.eigenvalues().minCoeff();
        auto const max = solver.eigenvalues().maxCoeff();
        auto const scale = std::max(abs(min), abs(max));

        // The Krylov space is exhausted: the Ritz values are the eigenvalues
        auto const is_breakdown = step.b <= 1e-12 * scale || k >= size;
        auto const is_converged_min = abs(previous_min - min) < precision * scale;
        auto const is_converged_max = abs(previous_max - max) < precision * scale;
        converged = is_breakdown || (is_converged_min && is_converged_max);

        previous_min = min;
        previous_max = max;

        if (!converged) {
            v0 *= 1 / step.b;
            v0.swap(v1);
        }
    }

    if (!converged) {
        throw OperatorError("Lanczos algorithm did not converge for the min/max eigenvalues.");
    }

    // Residual norms of the extreme Ritz pairs
    auto const k = static_cast<idx_t>(alpha.size());
    VectorXd const diag = eigen_cast<ArrayX>(alpha).matrix();
    VectorXd const subdiag = eigen_cast<ArrayX>(beta).head(k - 1).matrix();
    auto solver = Eigen::SelfAdjointEigenSolver<ColMajorMatrixXd>();
    solver.computeFromTridiagonal(diag, subdiag, Eigen::ComputeEigenvectors);

    auto const& eigenvalues = solver.eigenvalues();
    auto const& eigenvectors = solver.eigenvectors();
    auto const spread = eigenvalues[k - 1] - eigenvalues[0];
    if (spread <= 1e-8 * std::max(abs(eigenvalues[0]), abs(eigenvalues[k - 1]))) {
        throw OperatorError(fmt::format(
            "The operator has a single eigenvalue ({}): the spectrum cannot be rescaled.",
            eigenvalues[0]
        ));
    }

    auto const residual_min = abs(beta.back() * eigenvectors(k - 1, 0));
    auto const residual_max = abs(beta.back() * eigenvectors(k - 1, k - 1));
    auto const margin = precision * std::max(abs(eigenvalues[0]), abs(eigenvalues[k - 1]));

    return {eigenvalues[0] - residual_min - margin,
            eigenvalues[k - 1] + residual_max + margin,
            loops};
}

}} // namespace kpmdos::compute
