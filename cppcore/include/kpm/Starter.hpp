#pragma once
#include "numeric/dense.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace kpmdos { namespace kpm {

/**
 Produce the start vectors `v` of the stochastic trace estimation

 Worker threads draw vectors under the mutex, so the n-th drawn vector is always
 the same for a given factory and seed regardless of thread scheduling.
 */
struct VectorFactory {
    using Make = std::function<VectorXcd (idx_t index)>;

    Make make; ///< produce the vector with the given draw index
    idx_t vector_size;
    idx_t count = 0; ///< the number of vectors this factory has produced
    std::unique_ptr<std::mutex> mutex = std::unique_ptr<std::mutex>(new std::mutex());

    VectorFactory(Make make, idx_t vector_size)
        : make(std::move(make)), vector_size(vector_size) {}

    void lock() const { mutex->lock(); }
    void unlock() const { mutex->unlock(); }

    /// Draw the next vector, the caller must hold the lock
    ///
    /// Throws `std::invalid_argument` if the vector does not have `vector_size` elements.
    VectorXcd draw();
};

/// i.i.d. random phases `exp(2 pi i x) / sqrt(size)`, so that `E[v v*] = I / size`
VectorFactory random_phase_factory(idx_t size, std::uint32_t seed);

/// Random phases supported on a subset of sites, normalized by `1 / sqrt(|indices|)`
VectorFactory local_random_factory(idx_t size, std::vector<idx_t> const& indices,
                                   std::uint32_t seed);

/// Deterministic unit vectors, cycling through the given indices
VectorFactory unit_factory(idx_t size, std::vector<idx_t> const& indices);

/// Always the same vector
VectorFactory constant_factory(VectorXcd const& vector);

/// Any callable producing vectors of length `size`
VectorFactory custom_factory(idx_t size, std::function<VectorXcd()> make);

}} // namespace kpmdos::kpm
