#pragma once
#include "detail/config.hpp"
#include "numeric/traits.hpp"

#include <Eigen/Core>

#include <algorithm>
#include <complex>
#include <vector>

namespace kpmdos {

// add common math functions to the global namespace
using std::abs;
using std::exp;
using std::sqrt;
using std::sin;
using std::cos;
using std::tan;
using std::acos;

// add common Eigen types to the global namespace
using Eigen::ArrayXd;
using Eigen::ArrayXcd;
using Eigen::VectorXd;
using Eigen::VectorXcd;
using Eigen::MatrixXcd;

template<class T> using ArrayX = Eigen::Array<T, Eigen::Dynamic, 1>;

template<class T>
using ColMajorArrayXX = Eigen::Array<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::ColMajor>;

/// Densities: one row per energy, one column per observable output
using ArrayXXdCM = ColMajorArrayXX<double>;
/// Moments: one row per moment, one column per observable output
using ArrayXXcdCM = ColMajorArrayXX<std::complex<double>>;

/// Range from 0 to `size` of scalar type `T` which does not have to be an integral type
template<class T>
ArrayX<T> make_integer_range(idx_t size) {
    auto result = ArrayX<T>(size);
    for (auto n = idx_t{0}; n < size; ++n) {
        result[n] = static_cast<T>(n);
    }
    return result;
}

/// Map std::vector-like object data to an Eigen type
template<template<class> class EigenType, class Vector,
         class scalar_t = typename Vector::value_type>
inline Eigen::Map<EigenType<scalar_t> const> eigen_cast(Vector const& v) {
    return {v.data(), static_cast<idx_t>(v.size())};
}

} // namespace kpmdos
