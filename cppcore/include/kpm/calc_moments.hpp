#pragma once
#include "kpm/default/collectors.hpp"
#include "compute/kernel_polynomial.hpp"

namespace kpmdos { namespace kpm { namespace calc_moments {

/************************************************************************\
 Both algorithms resume from the state of a sample: the moments
 `[state.num_moments, collect.last_moment())` are computed and the state
 is advanced so that a later call can continue where this one stopped.
\************************************************************************/

/**
 Diagonal KPM implementation: `mu_n = <v|T_n(R)|v>`

 Two moments are obtained per operator-vector product. After moment `k` has been
 computed the state holds `curr = t_j` with `j = ceil(k / 2)`.
 */
inline void diagonal(DiagonalCollector& collect, SampleState& state,
                     LinearOperator const& op, Scale scale) {
    auto const num_moments = collect.last_moment();
    auto const size = op.size();
    auto hx = VectorXcd(size);

    auto k = state.num_moments;
    if (k == 0 && k < num_moments) {
        state.curr = std::move(state.v);
        collect.zero(compute::squared_norm(state.curr));
        k = 1;
    }

    if (k == 1 && k < num_moments) {
        state.prev = std::move(state.curr);
        state.curr.resize(size);
        op.apply(state.prev, hx);
        compute::kpm_first(scale.a, scale.b, hx, state.prev, state.curr);
        collect.one(state.prev.dot(state.curr));
        k = 2;
    }

    while (k < num_moments) {
        auto const n = k / 2;
        if (k % 2 == 0 && k + 1 == num_moments) {
            // Only the even moment is needed: no need to advance the recursion
            collect.even(n, compute::squared_norm(state.curr));
            k += 1;
            continue;
        }

        auto m2 = std::complex<double>{0}, m3 = std::complex<double>{0};
        op.apply(state.curr, hx);
        compute::kpm_step_diagonal(scale.a, scale.b, hx, state.curr, state.prev, m2, m3);
        state.prev.swap(state.curr);

        if (k % 2 == 0) {
            collect.even(n, m2);
            collect.odd(n, m3);
            k += 2;
        } else {
            // The even moment was already computed by a previous call
            collect.odd(n, m3);
            k += 1;
        }
    }

    state.num_moments = std::max(state.num_moments, num_moments);
}

/**
 Observable KPM implementation: `mu_n = obs(v, T_n(R) v)`

 One moment per operator-vector product. The start vector is kept in the state.
 */
inline void observable(ObservableCollector& collect, SampleState& state,
                       LinearOperator const& op, Scale scale) {
    auto const num_moments = collect.last_moment();
    auto const size = op.size();
    auto hx = VectorXcd(size);

    auto k = state.num_moments;
    if (k == 0 && k < num_moments) {
        state.curr = state.v;
        collect(0, state.curr);
        k = 1;
    }

    if (k == 1 && k < num_moments) {
        state.prev = std::move(state.curr);
        state.curr.resize(size);
        op.apply(state.prev, hx);
        compute::kpm_first(scale.a, scale.b, hx, state.prev, state.curr);
        collect(1, state.curr);
        k = 2;
    }

    for (; k < num_moments; ++k) {
        op.apply(state.curr, hx);
        compute::kpm_step(scale.a, scale.b, hx, state.curr, state.prev);
        state.prev.swap(state.curr);
        collect(k, state.curr);
    }

    state.num_moments = std::max(state.num_moments, num_moments);
}

/// Number of operator-vector products needed to extend a sample from `first` to `last` moments
inline idx_t num_products(idx_t first, idx_t last, bool is_diagonal) {
    if (last <= first) { return 0; }
    if (!is_diagonal) {
        return std::max(last, idx_t{1}) - std::max(first, idx_t{1});
    }
    // curr = t_j with j = ceil((moments - 1) / 2)
    auto const j = [](idx_t moments) { return moments <= 1 ? idx_t{0} : moments / 2; };
    return j(last) - j(first);
}

}}} // namespace kpmdos::kpm::calc_moments
