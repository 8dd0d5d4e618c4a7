#include "kpm/default/collectors.hpp"

#include "errors.hpp"

#include <fmt/format.h>

namespace kpmdos { namespace kpm {

void Collector::check_finite() const {
    if (!moments.allFinite()) {
        throw OperatorError(fmt::format(
            "The operator produced non-finite values while computing moments {} to {}",
            first_moment(), last_moment() - 1
        ));
    }
}

void DiagonalCollector::zero(std::complex<double> norm2) {
    m0 = norm2;
    if (wants(0)) { moments(0 - first_moment(), 0) = m0; }
}

void DiagonalCollector::one(std::complex<double> dot) {
    m1 = dot;
    if (wants(1)) { moments(1 - first_moment(), 0) = m1; }
}

void DiagonalCollector::even(idx_t n, std::complex<double> m2) {
    if (wants(2 * n)) { moments(2 * n - first_moment(), 0) = 2.0 * m2 - m0; }
}

void DiagonalCollector::odd(idx_t n, std::complex<double> m3) {
    if (wants(2 * n + 1)) { moments(2 * n + 1 - first_moment(), 0) = 2.0 * m3 - m1; }
}

void ObservableCollector::operator()(idx_t n, VectorXcd const& ket) {
    if (wants(n)) { moments.row(n - first_moment()) = observable(bra, ket).transpose(); }
}

}} // namespace kpmdos::kpm
