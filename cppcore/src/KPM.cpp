#include "KPM.hpp"

#include "utils/Log.hpp"

#include <fmt/format.h>

#include <cmath>

namespace kpmdos {

SpectralDensity::SpectralDensity(kpm::LinearOperator const& op, kpm::Config const& config,
                                 kpm::Compute const& compute)
    : core(op, compute, config) {
    initialize();
}

SpectralDensity::SpectralDensity(kpm::LinearOperator const& op,
                                 kpm::Observable const& observable,
                                 kpm::Config const& config, kpm::Compute const& compute)
    : core(op, compute, config, observable) {
    initialize();
}

SpectralDensity::SpectralDensity(kpm::LinearOperator const& op,
                                 kpm::Observable const& observable, kpm::VectorFactory factory,
                                 kpm::Config const& config, kpm::Compute const& compute)
    : core(op, compute, config, observable, std::move(factory)) {
    initialize();
}

void SpectralDensity::initialize() {
    auto const& config = core.get_config();
    if (config.num_moments < 1) {
        throw std::invalid_argument(fmt::format(
            "SpectralDensity: num_moments must be at least 1, got {}", config.num_moments
        ));
    }
    if (config.num_random < 1) {
        throw std::invalid_argument(fmt::format(
            "SpectralDensity: num_random must be at least 1, got {}", config.num_random
        ));
    }

    auto const num_points = config.num_sampling_points != 0 ? config.num_sampling_points
                                                            : 2 * config.num_moments;
    sampling_points = checked_sampling_points(num_points, config.num_moments);
    core.increase_accuracy(config.num_moments, config.num_random);
}

idx_t SpectralDensity::checked_sampling_points(idx_t num_points, idx_t num_moments) const {
    if (num_points < num_moments) {
        throw std::invalid_argument(fmt::format(
            "The number of sampling points ({}) must be at least the number of moments ({})",
            num_points, num_moments
        ));
    }
    return num_points;
}

ArrayXd SpectralDensity::energies() const {
    return scale().unscale(kpm::chebyshev_nodes(sampling_points));
}

ArrayXXdCM SpectralDensity::densities() const {
    auto const x = kpm::chebyshev_nodes(sampling_points);
    auto const gk = constant::pi * sqrt(1 - x * x) * scale().a;
    auto const gammas = kpm::gammas_on_nodes(damped_moments(), sampling_points);
    return gammas.colwise() / gk;
}

ArrayXXdCM SpectralDensity::evaluate(ArrayXd const& energy, OutOfBand policy) const {
    return kpm::spectral_density(damped_moments(), energy, scale(), policy);
}

ArrayXd SpectralDensity::average() const {
    auto const m = damped_moments();
    return m.row(0).real().transpose();
}

ArrayXd SpectralDensity::average(WeightFunction const& f) const {
    if (!f) { return average(); }

    auto const e = energies();
    auto const weights = e.unaryExpr([&](double energy) { return f(energy); }).eval();
    auto const gammas = kpm::gammas_on_nodes(damped_moments(), sampling_points);
    return kpm::average_on_nodes(gammas, weights);
}

ArrayXd SpectralDensity::average_chebyshev(ArrayXd const& f_n) const {
    return kpm::average_chebyshev(damped_moments(), f_n);
}

bool SpectralDensity::increase_accuracy(idx_t num_moments, idx_t num_vectors,
                                        idx_t num_sampling_points) {
    auto const num_points = num_sampling_points != 0
                            ? num_sampling_points
                            : (sampling_points >= num_moments ? sampling_points : 2 * num_moments);
    auto const checked = checked_sampling_points(num_points, num_moments);

    auto const is_complete = core.increase_accuracy(num_moments, num_vectors);
    sampling_points = std::max(checked, core.num_moments());
    return is_complete;
}

bool SpectralDensity::increase_energy_resolution(double tol, bool increase_num_moments) {
    if (!(tol > 0)) {
        throw std::invalid_argument(fmt::format(
            "increase_energy_resolution: tol must be positive, got {}", tol
        ));
    }

    auto const a = scale().a;
    auto const resolution = 2 * a / (static_cast<double>(sampling_points) / 1.6);
    if (tol > resolution) {
        Log::w(fmt::format("Energy resolution ({:.3g}) is already smaller than tol ({:.3g})",
                           resolution, tol));
        return true;
    }

    auto const num_points = static_cast<idx_t>(std::ceil(1.6 * 2 * a / tol));
    auto const target_moments = increase_num_moments ? std::max(num_points / 2, num_moments())
                                                     : num_moments();
    return increase_accuracy(target_moments, num_vectors(), std::max(num_points, target_moments));
}

void SpectralDensity::set_bounds(double min_energy, double max_energy) {
    core.set_bounds(min_energy, max_energy);
}

ArrayXXcdCM SpectralDensity::damped_moments() const {
    return kpm::damped(moments(), core.get_config().kernel);
}

std::string SpectralDensity::report(bool shortform) const {
    return core.report(shortform);
}

} // namespace kpmdos
