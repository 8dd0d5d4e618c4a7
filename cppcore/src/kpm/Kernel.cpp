#include "kpm/Kernel.hpp"
#include "numeric/constant.hpp"

#include <cmath>
#include <stdexcept>

namespace kpmdos { namespace kpm {

namespace {
    idx_t moments_for_width(double width, double scaled_broadening) {
        if (scaled_broadening <= 0) {
            throw std::invalid_argument("Kernel: the broadening must be positive.");
        }
        return static_cast<idx_t>(width / scaled_broadening) + 1;
    }
}

Kernel jackson_kernel() {
    return {
        [](idx_t num_moments) -> ArrayXd {
            auto const Np = static_cast<double>(num_moments) + 1;
            auto const ns = make_integer_range<double>(num_moments);
            auto const pi = constant::pi;
            return ns.unaryExpr([&](double n) { // n is not an integer to get proper fp division
                return ((Np - n) * cos(pi * n / Np) + sin(pi * n / Np) / tan(pi / Np)) / Np;
            });
        },
        [](double scaled_broadening) {
            return moments_for_width(constant::pi, scaled_broadening);
        }
    };
}

Kernel lorentz_kernel(double lambda) {
    if (lambda <= 0) { throw std::invalid_argument("Lorentz kernel: lambda must be positive."); }
    return {
        [=](idx_t num_moments) -> ArrayXd {
            auto const N = static_cast<double>(num_moments);
            auto const ns = make_integer_range<double>(num_moments);
            return ns.unaryExpr([&](double n) {
                return std::sinh(lambda * (1 - n / N)) / std::sinh(lambda);
            });
        },
        [=](double scaled_broadening) {
            return moments_for_width(lambda, scaled_broadening);
        }
    };
}

Kernel dirichlet_kernel() {
    return {
        [](idx_t num_moments) -> ArrayXd { return ArrayXd::Ones(num_moments); },
        [](double scaled_broadening) {
            return moments_for_width(constant::pi, scaled_broadening);
        }
    };
}

}} // namespace kpmdos::kpm
