#include "kpm/default/Compute.hpp"
#include "kpm/default/collectors.hpp"
#include "kpm/calc_moments.hpp"

#include "detail/thread.hpp"

#include <mutex>

namespace kpmdos { namespace kpm {

namespace {

/// Compute moments `[state.num_moments, num_moments)` of a single sample
ArrayXXcdCM compute_sample(Workload const& w, SampleState& state, idx_t num_moments) {
    auto const first = state.num_moments;
    if (w.is_diagonal()) {
        auto collect = DiagonalCollector(first, num_moments, state);
        calc_moments::diagonal(collect, state, w.op, w.scale);
        collect.check_finite();
        return std::move(collect.moments);
    } else {
        auto collect = ObservableCollector(first, num_moments, w.observable, state.v);
        calc_moments::observable(collect, state, w.op, w.scale);
        collect.check_finite();
        return std::move(collect.moments);
    }
}

/// The result of one job, reduced in order after all jobs have finished
struct Slot {
    SampleState state;
    ArrayXXcdCM moments;
    bool is_done = false;
};

} // anonymous namespace

DefaultCompute::DefaultCompute(idx_t num_threads, ProgressCallback progress_callback)
    : num_threads(num_threads > 0 ? num_threads
                                  : std::max(idx_t{1}, static_cast<idx_t>(
                                        std::thread::hardware_concurrency()))),
      progress_callback(std::move(progress_callback)) {}

bool DefaultCompute::extend(Workload const& w, std::vector<SampleState>& samples,
                            idx_t num_moments, ArrayXXcdCM& extra_sums) const {
    auto const first = samples.empty() ? num_moments : samples.front().num_moments;
    extra_sums = ArrayXXcdCM::Zero(std::max(num_moments - first, idx_t{0}), w.num_outputs());
    if (first >= num_moments) { return true; }

    auto const count = static_cast<idx_t>(samples.size());
    auto slots = std::vector<Slot>(samples.size());
    {
        ThreadPool pool(num_threads);
        progress_start(count);
        for (auto i = idx_t{0}; i < count; ++i) {
            pool.add([&, i]() {
                if (w.cancellation.is_cancelled()) { return; }

                auto& slot = slots[i];
                slot.state = samples[i];
                slot.moments = compute_sample(w, slot.state, num_moments);
                slot.is_done = true;
                progress_update(1, count);
            });
        }
        pool.join();
    }

    auto const is_complete = std::all_of(slots.begin(), slots.end(),
                                         [](Slot const& s) { return s.is_done; });
    if (!is_complete) {
        extra_sums.resize(0, w.num_outputs());
        return false;
    }

    for (auto i = idx_t{0}; i < count; ++i) {
        extra_sums += slots[i].moments;
        samples[i] = std::move(slots[i].state);
    }
    progress_finish(count);
    return true;
}

bool DefaultCompute::add(Workload const& w, VectorFactory& factory, idx_t count,
                         std::vector<SampleState>& samples, MomentAccumulator& acc) const {
    if (count <= 0) { return true; }

    auto const num_moments = acc.num_moments();
    auto slots = std::vector<Slot>(static_cast<std::size_t>(count));
    auto num_drawn = idx_t{0}; // guarded by the factory lock
    {
        ThreadPool pool(num_threads);
        progress_start(count);
        for (auto i = idx_t{0}; i < count; ++i) {
            pool.add([&]() {
                // The n-th drawn vector always goes into the n-th slot
                auto lk = std::unique_lock<VectorFactory>(factory);
                if (w.cancellation.is_cancelled()) { return; }
                auto& slot = slots[num_drawn++];
                slot.state = SampleState(factory.draw());
                lk.unlock();

                slot.moments = compute_sample(w, slot.state, num_moments);
                slot.is_done = true;
                progress_update(1, count);
            });
        }
        pool.join();
    }

    // Every drawn sample runs to completion, so the finished ones form a prefix
    for (auto& slot : slots) {
        if (!slot.is_done) { break; }
        acc.add_sample(slot.moments);
        samples.push_back(std::move(slot.state));
    }
    progress_finish(count);
    return num_drawn == count;
}

void DefaultCompute::progress_start(idx_t total) const {
    progress_update(-1, total);
}

void DefaultCompute::progress_update(idx_t delta, idx_t total) const {
    if (!progress_callback) { return; }
    progress_callback(delta, total);
}

void DefaultCompute::progress_finish(idx_t total) const {
    progress_update(total, total);
}

}} // namespace kpmdos::kpm
