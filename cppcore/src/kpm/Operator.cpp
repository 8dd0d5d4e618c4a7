#include "kpm/Operator.hpp"

#include "compute/kernel_polynomial.hpp"

#include <fmt/format.h>

namespace kpmdos { namespace kpm {

namespace {

struct Rows {
    template<class scalar_t>
    idx_t operator()(SparseMatrixRC<scalar_t> const& m) const { return m->rows(); }
};

struct Cols {
    template<class scalar_t>
    idx_t operator()(SparseMatrixRC<scalar_t> const& m) const { return m->cols(); }
};

struct NonZeros {
    template<class scalar_t>
    idx_t operator()(SparseMatrixRC<scalar_t> const& m) const { return m->nonZeros(); }
};

struct IsCompressed {
    template<class scalar_t>
    bool operator()(SparseMatrixRC<scalar_t> const& m) const { return m->isCompressed(); }
};

struct IsComplex {
    template<class scalar_t>
    bool operator()(SparseMatrixRC<scalar_t> const&) const { return num::is_complex<scalar_t>(); }
};

struct ScalarName {
    template<class scalar_t>
    std::string operator()(SparseMatrixRC<scalar_t> const&) const {
        return num::scalar_name<scalar_t>();
    }
};

struct Multiply {
    VectorXcd const& x;
    VectorXcd& y;

    template<class scalar_t>
    void operator()(SparseMatrixRC<scalar_t> const& m) const { compute::csr_spmv(*m, x, y); }
};

} // anonymous namespace

idx_t SparseOperator::size() const { return variant_matrix.match(Rows{}); }
idx_t SparseOperator::non_zeros() const { return variant_matrix.match(NonZeros{}); }
bool SparseOperator::is_complex() const { return variant_matrix.match(IsComplex{}); }
std::string SparseOperator::scalar_name() const { return variant_matrix.match(ScalarName{}); }

void SparseOperator::apply(VectorXcd const& x, VectorXcd& y) const {
    auto const n = size();
    if (x.size() != n) {
        throw std::invalid_argument(fmt::format(
            "SparseOperator: the input vector has size {} but the operator has size {}",
            x.size(), n
        ));
    }
    if (y.size() != n) { y.resize(n); }
    variant_matrix.match(Multiply{x, y});
}

void SparseOperator::validate() const {
    auto const rows = variant_matrix.match(Rows{});
    auto const cols = variant_matrix.match(Cols{});
    if (rows != cols) {
        throw std::invalid_argument(fmt::format(
            "SparseOperator: the matrix must be square, got {}x{}", rows, cols
        ));
    }
    if (!variant_matrix.match(IsCompressed{})) {
        throw std::invalid_argument("SparseOperator: the matrix must be in compressed form");
    }
}

}} // namespace kpmdos::kpm
