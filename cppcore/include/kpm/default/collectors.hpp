#pragma once
#include "kpm/Moments.hpp"
#include "kpm/Observable.hpp"

namespace kpmdos { namespace kpm {

/**
 Receives the moments `[first, last)` of a single sample, one row per moment
 */
class Collector {
public:
    ArrayXXcdCM moments;

    Collector(idx_t first, idx_t last, idx_t num_outputs)
        : moments(ArrayXXcdCM::Zero(last - first, num_outputs)), first(first) {}

    idx_t first_moment() const { return first; }
    idx_t last_moment() const { return first + moments.rows(); }

    /// Throw `OperatorError` if any of the collected moments is not finite
    void check_finite() const;

protected:
    bool wants(idx_t n) const { return n >= first && n < last_moment(); }

private:
    idx_t first;
};

/**
 Moments of the form `mu_n = <v|T_n(R)|v>`, two per operator-vector product:

     mu_2n = 2 <t_n|t_n> - mu_0
     mu_2n+1 = 2 <t_n+1|t_n> - mu_1
 */
class DiagonalCollector : public Collector {
public:
    DiagonalCollector(idx_t first, idx_t last, SampleState& state)
        : Collector(first, last, 1), m0(state.m0), m1(state.m1) {}

    /// Collect the first 2 moments which are computed outside the main KPM loop
    void zero(std::complex<double> norm2);
    void one(std::complex<double> dot);

    /// Collect moment `2n` from `m2 = <t_n|t_n>`
    void even(idx_t n, std::complex<double> m2);
    /// Collect moment `2n + 1` from `m3 = <t_n+1|t_n>`
    void odd(idx_t n, std::complex<double> m3);

private:
    std::complex<double>& m0;
    std::complex<double>& m1;
};

/**
 Moments of the form `mu_n = obs(v, T_n(R) v)`, one per operator-vector product
 */
class ObservableCollector : public Collector {
public:
    ObservableCollector(idx_t first, idx_t last, Observable const& observable,
                        VectorXcd const& bra)
        : Collector(first, last, observable.num_outputs()), observable(observable), bra(bra) {}

    /// Collect moment `n` from the vector `t_n`
    void operator()(idx_t n, VectorXcd const& ket);

private:
    Observable const& observable;
    VectorXcd const& bra;
};

}} // namespace kpmdos::kpm
