#pragma once
#include "kpm/Bounds.hpp"
#include "kpm/Config.hpp"
#include "kpm/Observable.hpp"
#include "kpm/Operator.hpp"
#include "kpm/Starter.hpp"
#include "kpm/Moments.hpp"
#include "kpm/Stats.hpp"

#include <vector>

namespace kpmdos { namespace kpm {

/**
 Everything a backend needs to compute moments
 */
struct Workload {
    LinearOperator const& op;
    Observable const& observable; ///< empty for the diagonal algorithm
    Scale scale;
    Cancellation const& cancellation;

    bool is_diagonal() const { return !observable; }
    idx_t num_outputs() const { return is_diagonal() ? 1 : observable.num_outputs(); }
};

/**
 Does the actual work of computing KPM moments

 Different derived classes may be optimized for specific hardware.
 */
class Compute {
public:
    class Interface {
    public:
        virtual ~Interface() = default;

        /// Extend all `samples` to `num_moments` and return the sums of the new moments
        ///
        /// All or nothing: if cancelled, `samples` are not modified and the result is empty.
        virtual bool extend(Workload const& w, std::vector<SampleState>& samples,
                            idx_t num_moments, ArrayXXcdCM& extra_sums) const = 0;

        /// Draw up to `count` new samples and add their `acc.num_moments()` moments to `acc`
        ///
        /// If cancelled, only a prefix of the new samples is computed and added.
        /// Returns `true` if all `count` samples were added.
        virtual bool add(Workload const& w, VectorFactory& factory, idx_t count,
                         std::vector<SampleState>& samples, MomentAccumulator& acc) const = 0;
    };

    template<class T>
    Compute(T x) : ptr(std::make_shared<T>(std::move(x))) {}

    Interface const* operator->() const { return ptr.get(); }

private:
    std::shared_ptr<Interface const> ptr;
};

/**
 Low-level KPM implementation

 Owns the accumulated moments and the recursion state of every sample.
 No reconstruction, just moments.
 */
class Core {
public:
    Core(LinearOperator const& op, Compute const& compute, Config const& config = {},
         Observable const& observable = {});
    Core(LinearOperator const& op, Compute const& compute, Config const& config,
         Observable const& observable, VectorFactory factory);

    Config const& get_config() const { return config; }
    Stats const& get_stats() const { return stats; }
    MomentAccumulator const& accumulator() const { return acc; }

    idx_t num_moments() const { return acc.num_moments(); }
    idx_t num_vectors() const { return acc.num_samples(); }
    idx_t num_outputs() const { return acc.num_outputs(); }

    /// The KPM scaling factors `a` and `b`
    Scale scaling_factors();
    /// The spectral bounds (estimated on first use if not set)
    std::pair<double, double> spectrum_bounds();

    /// Replace the spectral bounds
    ///
    /// Throws `InconsistentRescalingError` if moments have already been computed with
    /// different scaling factors. Identical bounds are a no-op.
    void set_bounds(double min_energy, double max_energy);

    /// Extend to the given number of moments and vectors, see `SpectralDensity`
    bool increase_accuracy(idx_t num_moments, idx_t num_vectors);

    /// Information about what happened during the calculations
    std::string report(bool shortform = false) const;

private:
    void check_sizes() const;

private:
    LinearOperator op;
    Observable observable;
    Compute compute;
    Config config;
    Stats stats;

    Bounds bounds;
    VectorFactory factory;
    std::vector<SampleState> samples;
    MomentAccumulator acc;
};

}} // namespace kpmdos::kpm
