#pragma once
#include "kpm/default/Compute.hpp"
#include "kpm/reconstruct.hpp"

namespace kpmdos {

using kpm::OutOfBand;
using kpm::WeightFunction;

/**
 Spectral density of a Hermitian operator estimated with the Kernel Polynomial Method

 The density is expanded in Chebyshev polynomials of the rescaled operator and the trace
 is estimated stochastically with random start vectors. With an `Observable` the result
 is the spectral decomposition of its matrix elements instead, one column per output.

 The moments are computed at construction with `config.num_moments` and
 `config.num_random`, and can later be refined without discarding previous work.
 */
class SpectralDensity {
public:
    explicit SpectralDensity(kpm::LinearOperator const& op, kpm::Config const& config = {},
                             kpm::Compute const& compute = kpm::DefaultCompute{});
    SpectralDensity(kpm::LinearOperator const& op, kpm::Observable const& observable,
                    kpm::Config const& config = {},
                    kpm::Compute const& compute = kpm::DefaultCompute{});
    SpectralDensity(kpm::LinearOperator const& op, kpm::Observable const& observable,
                    kpm::VectorFactory factory, kpm::Config const& config = {},
                    kpm::Compute const& compute = kpm::DefaultCompute{});

    /// Energies of the sampling grid, in ascending order
    ArrayXd energies() const;
    /// Densities on the sampling grid: (sampling points x outputs)
    ArrayXXdCM densities() const;

    /// Densities at the given energies: (energies x outputs)
    ///
    /// Energies outside of the rescaled spectrum raise `OutOfBandError` or give NaN.
    ArrayXXdCM evaluate(ArrayXd const& energy, OutOfBand policy = OutOfBand::Throw) const;

    /// Integral of the density: `g_0 m_0`, one value per output
    ArrayXd average() const;
    /// Integral of the density times `f(E)` with Gauss-Chebyshev quadrature on the sampling grid
    ArrayXd average(WeightFunction const& f) const;
    /// Integral of the density times `f(x) = sum_n f_n T_n(x)` on the rescaled axis
    ArrayXd average_chebyshev(ArrayXd const& f_n) const;

    /**
     Extend the estimate to `num_moments` and `num_vectors`

     Existing samples are extended first, then new samples are added. Equal targets do
     nothing and smaller ones raise `InvalidRefinementError`. `num_sampling_points == 0`
     keeps the current grid, enlarged to `2 * num_moments` if it becomes too small.
     Returns `false` if the computation was cancelled: the result stays valid.
     */
    bool increase_accuracy(idx_t num_moments, idx_t num_vectors, idx_t num_sampling_points = 0);

    /**
     Make the spacing of the sampling grid at most `tol`

     The resolution is `2 a / (M / 1.6)`. If it is already below `tol` only a warning is
     logged. Otherwise the grid grows to `M = ceil(1.6 * 2 a / tol)` points and, if
     `increase_num_moments` is set, the number of moments to `M / 2`.
     */
    bool increase_energy_resolution(double tol, bool increase_num_moments = true);

    /// Replace the spectral bounds, see `kpm::Core::set_bounds()`
    void set_bounds(double min_energy, double max_energy);

    /// Averaged raw moments: (moments x outputs)
    ArrayXXcdCM moments() const { return core.accumulator().moments(); }
    /// Moments with the kernel damping applied
    ArrayXXcdCM damped_moments() const;

    std::pair<double, double> bounds() const { return core.spectrum_bounds(); }
    kpm::Scale scale() const { return core.scaling_factors(); }
    kpm::Config const& get_config() const { return core.get_config(); }
    kpm::Core& get_core() { return core; }

    idx_t num_moments() const { return core.num_moments(); }
    idx_t num_vectors() const { return core.num_vectors(); }
    idx_t num_outputs() const { return core.num_outputs(); }
    idx_t num_sampling_points() const { return sampling_points; }
    std::uint64_t version() const { return core.accumulator().version(); }

    /// Get some information about what happened during the calculations
    std::string report(bool shortform = false) const;

private:
    void initialize();
    /// Throws `std::invalid_argument` unless `num_points >= num_moments`
    idx_t checked_sampling_points(idx_t num_points, idx_t num_moments) const;

private:
    mutable kpm::Core core;
    idx_t sampling_points = 0;
};

} // namespace kpmdos
