#pragma once
#include "kpm/Core.hpp"

#include <functional>

namespace kpmdos { namespace kpm {

/**
 Default CPU implementation for computing KPM moments, see `Core`

 One job per sample on a thread pool. The results are reduced in sample order on the
 calling thread, so they do not depend on the number of threads or on scheduling.
 */
class DefaultCompute : public Compute::Interface {
public:
    using ProgressCallback = std::function<void (idx_t delta, idx_t total)>;

    DefaultCompute(idx_t num_threads = -1, ProgressCallback progress_callback = {});

    bool extend(Workload const& w, std::vector<SampleState>& samples,
                idx_t num_moments, ArrayXXcdCM& extra_sums) const override;
    bool add(Workload const& w, VectorFactory& factory, idx_t count,
             std::vector<SampleState>& samples, MomentAccumulator& acc) const override;

    idx_t get_num_threads() const { return num_threads; }

    void progress_start(idx_t total) const;
    void progress_update(idx_t delta, idx_t total) const;
    void progress_finish(idx_t total) const;

private:
    idx_t num_threads;
    ProgressCallback progress_callback;
};

}} // namespace kpmdos::kpm
