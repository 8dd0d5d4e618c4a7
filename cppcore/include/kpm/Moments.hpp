#pragma once
#include "kpm/Bounds.hpp"

#include <complex>
#include <cstdint>

namespace kpmdos { namespace kpm {

/**
 Recursion state of a single sample (start vector)

 Keeps the last two Chebyshev vectors `prev = t_{j-1}` and `curr = t_j` so that more
 moments can be computed later without starting over.
 */
struct SampleState {
    VectorXcd v; ///< start vector, only needed by the observable algorithm after `t_1`
    VectorXcd prev; ///< t_{j-1}
    VectorXcd curr; ///< t_j
    std::complex<double> m0 = 0; ///< <t_0|t_0>
    std::complex<double> m1 = 0; ///< <t_0|t_1>
    idx_t num_moments = 0; ///< moments computed so far

    SampleState() = default;
    explicit SampleState(VectorXcd v) : v(std::move(v)) {}
};

/**
 Running sums of the Chebyshev moments over all samples

 Row `k` estimates `E[<v| W T_k(R) |v>]`, one column per observable output. The sums
 are normalized by the sample count on read and never overwritten. Each mutation bumps
 the version counter.
 */
class MomentAccumulator {
public:
    MomentAccumulator() = default;
    MomentAccumulator(Scale scale, idx_t num_moments, idx_t num_outputs);

    idx_t num_moments() const { return sums.rows(); }
    idx_t num_outputs() const { return sums.cols(); }
    idx_t num_samples() const { return samples; }
    std::uint64_t version() const { return revision; }
    Scale const& scale() const { return scaling; }

    /// The averaged moments: `sums / num_samples()`, zero if there are no samples
    ArrayXXcdCM moments() const;
    /// The raw sums
    ArrayXXcdCM const& sums_data() const { return sums; }

    /// Add the moments of one sample, rows must equal `num_moments()`
    void add_sample(ArrayXXcdCM const& sample);

    /// Append rows for new moments. `extra_sums` holds the summed new moments of all samples.
    void extend(ArrayXXcdCM const& extra_sums);

    /// Combine with the sums of an independent set of samples
    ///
    /// Throws `InconsistentRescalingError` if the scales differ and `std::invalid_argument`
    /// if the shapes differ.
    void merge(MomentAccumulator const& other);

private:
    ArrayXXcdCM sums;
    idx_t samples = 0;
    std::uint64_t revision = 0;
    Scale scaling;
};

}} // namespace kpmdos::kpm
