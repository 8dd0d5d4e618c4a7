#pragma once
#include "detail/config.hpp"

#ifdef _MSC_VER // suppress 'static_visitor' deprecation warning
# pragma warning(disable : 4996)
#endif
#include <mapbox/variant.hpp>
#include <Eigen/SparseCore>

#include <complex>
#include <memory>

namespace kpmdos {

namespace var {
    using namespace mapbox::util;

    /// Variant of a container with real or complex elements
    template<template<class> class... C>
    using complex = var::variant<C<float>..., C<std::complex<float>>...,
                                 C<double>..., C<std::complex<double>>...>;
} // namespace var

template <class scalar_t>
using SparseMatrixX = Eigen::SparseMatrix<scalar_t, Eigen::RowMajor, storage_idx_t>;

using SparseMatrixXf = SparseMatrixX<float>;
using SparseMatrixXcf = SparseMatrixX<std::complex<float>>;
using SparseMatrixXd = SparseMatrixX<double>;
using SparseMatrixXcd = SparseMatrixX<std::complex<double>>;

/// Reference counted immutable CSR matrix
template<class scalar_t>
using SparseMatrixRC = std::shared_ptr<SparseMatrixX<scalar_t> const>;

} // namespace kpmdos
