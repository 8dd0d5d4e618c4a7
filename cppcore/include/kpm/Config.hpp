#pragma once
#include "kpm/Kernel.hpp"

#include <atomic>
#include <cstdint>
#include <memory>

namespace kpmdos { namespace kpm {

/**
 Cooperative cancellation flag shared between the caller and a running computation

 Copies share the same flag. The computation checks it before starting each sample.
 */
class Cancellation {
public:
    Cancellation() : flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { *flag = true; }
    void reset() const { *flag = false; }
    bool is_cancelled() const { return *flag; }

private:
    std::shared_ptr<std::atomic<bool>> flag;
};

/**
 KPM configuration struct with defaults
 */
struct Config {
    double min_energy = 0.0; ///< lowest eigenvalue of the operator
    double max_energy = 0.0; ///< highest eigenvalue (if equal to min, estimate both with Lanczos)
    double margin = 0.01; ///< relative safety margin `eps` of the rescaling, in (0, 0.5)
    Kernel kernel = jackson_kernel(); ///< produces the damping coefficients

    idx_t num_moments = 100; ///< initial number of Chebyshev moments N
    idx_t num_random = 10; ///< initial number of random vectors R
    idx_t num_sampling_points = 0; ///< size of the default energy grid, 0 means 2 * N

    double lanczos_precision = 0.002; ///< how precise should the min/max energy estimation be (%)
    std::uint32_t seed = 0; ///< seed of the random vector and Lanczos generators

    Cancellation cancellation; ///< raise to stop a running computation between samples
};

}} // namespace kpmdos::kpm
