#pragma once
#include "utils/Chrono.hpp"
#include "detail/config.hpp"

#include <string>

namespace kpmdos { namespace kpm {

std::string format_report(std::string const& msg, Chrono const& time, bool shortform);

/**
 Stats of the KPM calculation, accumulated over all refinement calls
 */
struct Stats {
    idx_t num_moments = 0; ///< current number of moments per sample
    idx_t num_vectors = 0; ///< current number of samples
    idx_t num_products = 0; ///< total number of operator-vector products (over all calls)
    Chrono moments_timer; ///< total time spent computing moments

    /// Record a finished batch of work
    void add(idx_t products, Chrono const& timer);

    /// Operator-vector products per second
    double mvps() const;

    std::string report(bool shortform) const;
};

}} // namespace kpmdos::kpm
