#include "kpm/Moments.hpp"

#include "errors.hpp"

#include <fmt/format.h>

namespace kpmdos { namespace kpm {

MomentAccumulator::MomentAccumulator(Scale scale, idx_t num_moments, idx_t num_outputs)
    : sums(ArrayXXcdCM::Zero(num_moments, num_outputs)), scaling(scale) {}

ArrayXXcdCM MomentAccumulator::moments() const {
    if (samples == 0) { return ArrayXXcdCM::Zero(sums.rows(), sums.cols()); }
    return sums / static_cast<double>(samples);
}

void MomentAccumulator::add_sample(ArrayXXcdCM const& sample) {
    if (sample.rows() != sums.rows() || sample.cols() != sums.cols()) {
        throw std::invalid_argument(fmt::format(
            "MomentAccumulator: sample has shape {}x{}, expected {}x{}",
            sample.rows(), sample.cols(), sums.rows(), sums.cols()
        ));
    }
    sums += sample;
    ++samples;
    ++revision;
}

void MomentAccumulator::extend(ArrayXXcdCM const& extra_sums) {
    if (extra_sums.cols() != sums.cols()) {
        throw std::invalid_argument(fmt::format(
            "MomentAccumulator: extension has {} outputs, expected {}",
            extra_sums.cols(), sums.cols()
        ));
    }
    if (extra_sums.rows() == 0) { return; }

    auto const old_rows = sums.rows();
    sums.conservativeResize(old_rows + extra_sums.rows(), Eigen::NoChange);
    sums.bottomRows(extra_sums.rows()) = extra_sums;
    ++revision;
}

void MomentAccumulator::merge(MomentAccumulator const& other) {
    if (other.scaling != scaling) {
        throw InconsistentRescalingError(fmt::format(
            "Cannot merge moments computed with different scaling factors: "
            "(a={}, b={}) and (a={}, b={})", scaling.a, scaling.b, other.scaling.a, other.scaling.b
        ));
    }
    if (other.sums.rows() != sums.rows() || other.sums.cols() != sums.cols()) {
        throw std::invalid_argument(fmt::format(
            "Cannot merge moments of shape {}x{} into {}x{}",
            other.sums.rows(), other.sums.cols(), sums.rows(), sums.cols()
        ));
    }
    sums += other.sums;
    samples += other.samples;
    ++revision;
}

}} // namespace kpmdos::kpm
