#include "kpm/Bounds.hpp"
#include "kpm/Stats.hpp"

#include "compute/lanczos.hpp"
#include "utils/Log.hpp"

#include <fmt/format.h>

namespace kpmdos { namespace kpm {

Scale rescale(double min_energy, double max_energy, double margin) {
    if (!(margin > 0 && margin < 0.5)) {
        throw std::invalid_argument(fmt::format(
            "rescale: the margin must be in the interval (0, 0.5), got {}", margin
        ));
    }
    if (!(min_energy < max_energy)) {
        throw std::invalid_argument(fmt::format(
            "rescale: min_energy ({}) must be smaller than max_energy ({})", min_energy, max_energy
        ));
    }
    return {(max_energy - min_energy) / (2 - margin), (max_energy + min_energy) / 2};
}

Bounds::Bounds(double min_energy, double max_energy) : min(min_energy), max(max_energy) {
    if (min_energy > max_energy) {
        throw std::invalid_argument(fmt::format(
            "Bounds: min_energy ({}) is larger than max_energy ({})", min_energy, max_energy
        ));
    }
}

void Bounds::compute_bounds() {
    if (!op || min != max) { return; }

    auto generator = std::mt19937(seed);
    timer.tic();
    auto const lanczos = compute::minmax_eigenvalues(op, precision_percent, generator);
    timer.toc();

    min = lanczos.min;
    max = lanczos.max;
    lanczos_loops = lanczos.loops;
    Log::d(fmt::format("Lanczos bounds ({}, {}) after {} loops", min, max, lanczos_loops));
}

std::string Bounds::report(bool shortform) const {
    if (!is_estimated()) {
        auto const fmt_str = shortform ? "{:.2f}, {:.2f}, user"
                                       : "Spectrum bounds set by the user ({:.2f}, {:.2f})";
        auto const msg = fmt::format(fmt::runtime(fmt_str), min, max);
        return format_report(msg, Chrono{}.toc(), shortform);
    }

    auto const fmt_str = shortform ? "{:.2f}, {:.2f}, {}"
                                   : "Spectrum bounds found ({:.2f}, {:.2f}) "
                                     "using Lanczos procedure with {} loops";
    auto const msg = fmt::format(fmt::runtime(fmt_str), min, max, lanczos_loops);
    return format_report(msg, timer, shortform);
}

}} // namespace kpmdos::kpm
