#include "kpm/Core.hpp"

#include "kpm/calc_moments.hpp"
#include "errors.hpp"
#include "utils/Log.hpp"

#include <fmt/format.h>

namespace kpmdos { namespace kpm {

namespace {
    Bounds reset_bounds(LinearOperator const& op, Config const& config) {
        if (config.min_energy == config.max_energy) {
            return {op, config.lanczos_precision, config.seed}; // will be automatically computed
        } else {
            return {config.min_energy, config.max_energy}; // user-defined bounds
        }
    }

    void check_margin(double margin) {
        if (!(margin > 0 && margin < 0.5)) {
            throw std::invalid_argument(fmt::format(
                "KPM: the margin must be in the interval (0, 0.5), got {}", margin
            ));
        }
    }
} // anonymous namespace

Core::Core(LinearOperator const& op, Compute const& compute, Config const& config,
           Observable const& observable)
    : Core(op, compute, config, observable, random_phase_factory(std::max(op.size(), idx_t{1}),
                                                                 config.seed)) {}

Core::Core(LinearOperator const& op, Compute const& compute, Config const& config,
           Observable const& observable, VectorFactory factory)
    : op(op), observable(observable), compute(compute), config(config),
      bounds(reset_bounds(op, config)), factory(std::move(factory)) {
    check_sizes();
    check_margin(config.margin);
}

void Core::check_sizes() const {
    if (!op || op.size() <= 0) {
        throw OperatorError("KPM: the operator must have a non-zero dimension.");
    }
    if (observable && observable.size() != op.size()) {
        throw std::invalid_argument(fmt::format(
            "KPM: the observable has size {} but the operator has size {}",
            observable.size(), op.size()
        ));
    }
    if (factory.vector_size != op.size()) {
        throw std::invalid_argument(fmt::format(
            "KPM: the vector factory produces vectors of size {} but the operator has size {}",
            factory.vector_size, op.size()
        ));
    }
}

Scale Core::scaling_factors() {
    if (acc.num_samples() > 0) { return acc.scale(); }
    return bounds.scaling_factors(config.margin);
}

std::pair<double, double> Core::spectrum_bounds() {
    return {bounds.min_energy(), bounds.max_energy()};
}

void Core::set_bounds(double min_energy, double max_energy) {
    auto const new_scale = rescale(min_energy, max_energy, config.margin);
    if (acc.num_samples() > 0 && new_scale != acc.scale()) {
        throw InconsistentRescalingError(fmt::format(
            "KPM: moments have already been computed with the bounds ({}, {}), "
            "they cannot be changed to ({}, {})",
            bounds.min_energy(), bounds.max_energy(), min_energy, max_energy
        ));
    }

    bounds = Bounds(min_energy, max_energy);
    config.min_energy = min_energy;
    config.max_energy = max_energy;
}

bool Core::increase_accuracy(idx_t num_moments, idx_t num_vectors) {
    if (num_moments < 1) {
        throw std::invalid_argument(fmt::format(
            "KPM: the number of moments must be at least 1, got {}", num_moments
        ));
    }
    if (num_moments < acc.num_moments() || num_vectors < acc.num_samples()) {
        throw InvalidRefinementError(fmt::format(
            "KPM: cannot decrease the accuracy from {} moments and {} vectors "
            "to {} moments and {} vectors",
            acc.num_moments(), acc.num_samples(), num_moments, num_vectors
        ));
    }
    if (num_moments == acc.num_moments() && num_vectors == acc.num_samples()) {
        return true;
    }

    auto const scale = scaling_factors();
    auto const w = Workload{op, observable, scale, config.cancellation};
    if (acc.num_samples() == 0) {
        // Nothing to keep: start over at the requested number of moments
        samples.clear();
        acc = MomentAccumulator(scale, num_moments, w.num_outputs());
    }

    // First extend the existing samples, then add new ones at the new moment count
    if (num_moments > acc.num_moments()) {
        auto const first = acc.num_moments();
        auto extra_sums = ArrayXXcdCM();
        auto timer = Chrono();
        auto const is_complete = compute->extend(w, samples, num_moments, extra_sums);
        timer.toc();
        if (!is_complete) {
            Log::d("KPM: moment extension cancelled");
            return false;
        }

        acc.extend(extra_sums);
        auto const products = calc_moments::num_products(first, num_moments, w.is_diagonal());
        stats.add(products * acc.num_samples(), timer);
    }

    auto is_complete = true;
    auto const num_new = num_vectors - acc.num_samples();
    if (num_new > 0) {
        auto const before = acc.num_samples();
        auto timer = Chrono();
        is_complete = compute->add(w, factory, num_new, samples, acc);
        timer.toc();

        auto const products = calc_moments::num_products(0, num_moments, w.is_diagonal());
        stats.add(products * (acc.num_samples() - before), timer);
        if (!is_complete) {
            Log::d(fmt::format("KPM: cancelled after {} of {} new vectors",
                               acc.num_samples() - before, num_new));
        }
    }

    stats.num_moments = acc.num_moments();
    stats.num_vectors = acc.num_samples();
    return is_complete;
}

std::string Core::report(bool shortform) const {
    return bounds.report(shortform) + stats.report(shortform);
}

}} // namespace kpmdos::kpm
