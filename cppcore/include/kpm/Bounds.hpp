#pragma once
#include "kpm/Operator.hpp"
#include "utils/Chrono.hpp"

#include <cstdint>

namespace kpmdos { namespace kpm {

/**
 The KPM scaling factors `a` and `b`

 The operator `R = (Op - b) / a` has its spectrum strictly inside (-1, 1).
*/
struct Scale {
    double a = 0;
    double b = 0;

    Scale() = default;
    Scale(double a, double b) : a(a), b(b) {}

    explicit operator bool() const { return a != 0; }

    /// Map energies to the rescaled axis
    double operator()(double energy) const { return (energy - b) / a; }
    ArrayXd operator()(ArrayXd const& energy) const { return (energy - b) / a; }

    /// Map rescaled values back to energies
    ArrayXd unscale(ArrayXd const& x) const { return x * a + b; }

    friend bool operator==(Scale const& l, Scale const& r) { return l.a == r.a && l.b == r.b; }
    friend bool operator!=(Scale const& l, Scale const& r) { return !(l == r); }
};

/**
 Compute the scaling factors for the given spectral bounds

     a = (max - min) / (2 - margin)
     b = (max + min) / 2

 Throws `std::invalid_argument` if `margin` is not in (0, 0.5) or if `min >= max`.
 */
Scale rescale(double min_energy, double max_energy, double margin);

/**
 Min and max eigenvalues of the operator

 The bounds can be determined automatically using the Lanczos procedure,
 or set manually by the user. Also computes the KPM scaling factors a and b.
*/
class Bounds {
public:
    Bounds(LinearOperator const& op, double precision_percent, std::uint32_t seed)
        : op(op), precision_percent(precision_percent), seed(seed) {}
    /// Set the energy bounds manually, therefore skipping the Lanczos computation
    Bounds(double min_energy, double max_energy);

    double min_energy() { compute_bounds(); return min; }
    double max_energy() { compute_bounds(); return max; }
    /// The KPM scaling factors a and b
    Scale scaling_factors(double margin) { compute_bounds(); return rescale(min, max, margin); }

    /// Were the bounds estimated with the Lanczos procedure?
    bool is_estimated() const { return lanczos_loops > 0; }

    std::string report(bool shortform = false) const;

private:
    /// Compute the bounds using the Lanczos procedure
    void compute_bounds();

private:
    double min = .0; ///< the lowest eigenvalue
    double max = .0; ///< the highest eigenvalue
    int lanczos_loops = 0;  ///< number of iterations needed to converge the Lanczos procedure

    LinearOperator op;
    double precision_percent = 0;
    std::uint32_t seed = 0;
    Chrono timer;
};

}} // namespace kpmdos::kpm
