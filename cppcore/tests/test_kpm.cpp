#include <catch.hpp>

#include "fixtures.hpp"
#include "KPM.hpp"

#include <Eigen/Eigenvalues>

#include <atomic>
#include <numeric>
using namespace kpmdos;

namespace {

kpm::Config make_config(idx_t num_moments, idx_t num_random,
                        double min_energy = 0, double max_energy = 0) {
    auto config = kpm::Config{};
    config.num_moments = num_moments;
    config.num_random = num_random;
    config.min_energy = min_energy;
    config.max_energy = max_energy;
    return config;
}

bool all_equal(ArrayXXcdCM const& a, ArrayXXcdCM const& b) {
    return a.rows() == b.rows() && a.cols() == b.cols() && (a == b).all();
}

} // anonymous namespace

TEST_CASE("Kernels", "[kpm]") {
    SECTION("Jackson") {
        auto const N = idx_t{10};
        auto const g = kpm::jackson_kernel().damping_coefficients(N);
        REQUIRE(g.size() == N);
        REQUIRE(g[0] == Approx(1.0));
        for (auto k = 1; k < N; ++k) {
            INFO("k = " << k);
            REQUIRE(g[k] < g[k - 1]);

            auto const Np = static_cast<double>(N + 1);
            auto const expected = ((Np - k) * std::cos(constant::pi * k / Np)
                                   + std::sin(constant::pi * k / Np) / std::tan(constant::pi / Np))
                                  / Np;
            REQUIRE(g[k] == Approx(expected));
        }
        REQUIRE(kpm::jackson_kernel().required_num_moments(0.1) == 32);
    }

    SECTION("Lorentz") {
        auto const g = kpm::lorentz_kernel(4.0).damping_coefficients(20);
        REQUIRE(g[0] == Approx(1.0));
        REQUIRE(g[19] < g[1]);
        REQUIRE_THROWS_AS(kpm::lorentz_kernel(0), std::invalid_argument);
        REQUIRE_THROWS_AS(kpm::lorentz_kernel(-1), std::invalid_argument);
    }

    SECTION("Dirichlet") {
        auto const g = kpm::dirichlet_kernel().damping_coefficients(7);
        REQUIRE((g == 1.0).all());
    }

    SECTION("Damping is applied to every output") {
        auto moments = ArrayXXcdCM::Ones(5, 3).eval();
        kpm::jackson_kernel()(moments);
        auto const g = kpm::jackson_kernel().damping_coefficients(5);
        for (auto j = 0; j < 3; ++j) {
            REQUIRE(moments.col(j).real().isApprox(g));
        }
    }
}

TEST_CASE("Rescale", "[kpm]") {
    auto const scale = kpm::rescale(-2, 4, 0.01);
    REQUIRE(scale.a == Approx(6 / 1.99));
    REQUIRE(scale.b == Approx(1));
    REQUIRE(std::abs(scale(-2.0)) < 1);
    REQUIRE(std::abs(scale(4.0)) < 1);
    REQUIRE(scale(4.0) == Approx(1.99 / 2));

    auto const x = ArrayXd::LinSpaced(5, -0.9, 0.9).eval();
    REQUIRE(scale.unscale(x).matrix().isApprox(x.matrix() * scale.a + VectorXd::Constant(5, 1)));
    REQUIRE(scale(scale.unscale(x)).matrix().isApprox(x.matrix()));

    REQUIRE_THROWS_AS(kpm::rescale(-1, 1, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(kpm::rescale(-1, 1, 0.5), std::invalid_argument);
    REQUIRE_THROWS_AS(kpm::rescale(-1, 1, -0.1), std::invalid_argument);
    REQUIRE_THROWS_AS(kpm::rescale(1, 1, 0.01), std::invalid_argument);
    REQUIRE_THROWS_AS(kpm::rescale(2, 1, 0.01), std::invalid_argument);
}

TEST_CASE("Bounds", "[kpm]") {
    SECTION("Lanczos estimate encloses the spectrum") {
        auto const op = chain::make(100);
        auto const exact = chain::eigenvalues(100);
        auto bounds = kpm::Bounds(op, kpm::Config{}.lanczos_precision, 0);

        REQUIRE(bounds.min_energy() <= exact.minCoeff());
        REQUIRE(bounds.max_energy() >= exact.maxCoeff());
        REQUIRE(bounds.min_energy() > -2.1);
        REQUIRE(bounds.max_energy() < 2.1);
        REQUIRE(bounds.is_estimated());
    }

    SECTION("User defined") {
        auto bounds = kpm::Bounds(-3, 3);
        REQUIRE(bounds.min_energy() == -3);
        REQUIRE(bounds.max_energy() == 3);
        REQUIRE_FALSE(bounds.is_estimated());
        REQUIRE_THROWS_AS(kpm::Bounds(3, -3), std::invalid_argument);
    }

    SECTION("Malformed operators") {
        auto const nan_op = NanOperator{10};
        auto nan_bounds = kpm::Bounds(nan_op, 0.002, 0);
        REQUIRE_THROWS_AS(nan_bounds.min_energy(), OperatorError);

        auto const zero_op = diagonal::make({0, 0, 0, 0});
        auto zero_bounds = kpm::Bounds(zero_op, 0.002, 0);
        REQUIRE_THROWS_AS(zero_bounds.max_energy(), OperatorError);

        auto const identity = diagonal::make({1, 1, 1});
        auto identity_bounds = kpm::Bounds(identity, 0.002, 0);
        REQUIRE_THROWS_AS(identity_bounds.scaling_factors(0.01), OperatorError);

        REQUIRE_THROWS_AS(SpectralDensity(NanOperator{0}), OperatorError);
    }
}

TEST_CASE("Vector factories", "[kpm]") {
    SECTION("Random phases") {
        auto factory = kpm::random_phase_factory(50, 3);
        auto const v1 = factory.draw();
        auto const v2 = factory.draw();
        REQUIRE(factory.count == 2);
        REQUIRE(v1.squaredNorm() == Approx(1.0));
        REQUIRE((v1.array().abs2() - 1.0 / 50).abs().maxCoeff() < 1e-12);
        REQUIRE_FALSE(v1.isApprox(v2));

        auto same_seed = kpm::random_phase_factory(50, 3);
        REQUIRE(same_seed.draw().isApprox(v1));
    }

    SECTION("Local random phases") {
        auto factory = kpm::local_random_factory(10, {2, 5, 7}, 0);
        auto const v = factory.draw();
        REQUIRE(v.squaredNorm() == Approx(1.0));
        REQUIRE(std::abs(v[2]) == Approx(1 / std::sqrt(3.0)));
        REQUIRE(v[0] == std::complex<double>{0});
        REQUIRE(v[9] == std::complex<double>{0});
        REQUIRE_THROWS_AS(kpm::local_random_factory(10, {10}, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(kpm::local_random_factory(10, {}, 0), std::invalid_argument);
    }

    SECTION("Unit vectors") {
        auto factory = kpm::unit_factory(4, {1, 3});
        auto const expected = std::vector<idx_t>{1, 3, 1};
        for (auto const i : expected) {
            auto const v = factory.draw();
            REQUIRE(v.squaredNorm() == Approx(1.0));
            REQUIRE(v[i] == std::complex<double>{1});
        }
    }

    SECTION("Constant and custom") {
        auto const c = VectorXcd::Constant(3, 0.5).eval();
        auto constant = kpm::constant_factory(c);
        REQUIRE(constant.draw().isApprox(c));
        REQUIRE(constant.draw().isApprox(c));

        auto custom = kpm::custom_factory(3, [] { return VectorXcd::Ones(4).eval(); });
        REQUIRE_THROWS_AS(custom.draw(), std::invalid_argument);
        REQUIRE(custom.count == 0);
    }
}

TEST_CASE("Chain density of states", "[kpm]") {
    auto const op = chain::make(100);
    auto const dos = SpectralDensity(op, make_config(100, 10));

    REQUIRE(dos.num_moments() == 100);
    REQUIRE(dos.num_vectors() == 10);
    REQUIRE(dos.num_outputs() == 1);
    REQUIRE(dos.num_sampling_points() == 200);
    REQUIRE(dos.average()[0] == Approx(1.0).margin(0.05));

    auto const exact = chain::eigenvalues(100);
    auto const bounds = dos.bounds();
    REQUIRE(bounds.first <= exact.minCoeff());
    REQUIRE(bounds.second >= exact.maxCoeff());

    auto const energies = dos.energies();
    auto const densities = dos.densities();
    REQUIRE(energies.size() == 200);
    REQUIRE(densities.rows() == 200);
    for (auto i = 1; i < energies.size(); ++i) {
        REQUIRE(energies[i] > energies[i - 1]);
    }
    REQUIRE(densities.minCoeff() > -1e-8);

    SECTION("Grid evaluation agrees with direct evaluation") {
        auto const direct = dos.evaluate(energies);
        REQUIRE(direct.matrix().isApprox(densities.matrix(), 1e-8));
    }

    SECTION("Evaluation does not depend on the order of energies") {
        auto const e = ArrayXd::LinSpaced(31, -1.5, 1.5).eval();
        auto const reversed = e.reverse().eval();
        auto const rho = dos.evaluate(e);
        auto const rho_reversed = dos.evaluate(reversed);
        REQUIRE((rho.col(0) == rho_reversed.col(0).reverse()).all());
    }

    SECTION("Out of band energies") {
        auto const s = dos.scale();
        auto e = ArrayXd(3);
        e << 0.0, s.b + 1.5 * s.a, s.b - 1.01 * s.a;
        REQUIRE_THROWS_AS(dos.evaluate(e), OutOfBandError);
        REQUIRE_THROWS_AS(dos.evaluate(e), std::domain_error);

        auto const rho = dos.evaluate(e, OutOfBand::NaN);
        REQUIRE(std::isfinite(rho(0, 0)));
        REQUIRE(std::isnan(rho(1, 0)));
        REQUIRE(std::isnan(rho(2, 0)));
    }

    SECTION("Averages") {
        REQUIRE(dos.average([](double) { return 1.0; })[0] == Approx(dos.average()[0]));

        auto f_n = ArrayXd(1);
        f_n << 1.0;
        REQUIRE(dos.average_chebyshev(f_n)[0] == Approx(dos.average()[0]));

        // Half filling of a particle-hole symmetric spectrum
        auto const filled = dos.average(kpm::fermi_distribution(0, 0))[0];
        REQUIRE(filled == Approx(0.5).margin(0.1));
    }

    SECTION("Report") {
        REQUIRE_FALSE(dos.report(true).empty());
        REQUIRE_FALSE(dos.report(false).empty());
    }
}

TEST_CASE("Known spectrum", "[kpm]") {
    // Unit vectors over all sites give the exact trace
    auto const values = std::vector<double>{-0.8, -0.3, 0.1, 0.6};
    auto const op = diagonal::make(values);
    auto const all_sites = std::vector<idx_t>{0, 1, 2, 3};
    auto const window = [](double e) { return (e > -0.5 && e < 0.3) ? 1.0 : 0.0; };

    auto count_in_window = [&](idx_t num_moments) {
        auto const dos = SpectralDensity(op, {}, kpm::unit_factory(4, all_sites),
                                         make_config(num_moments, 4, -1, 1));
        return 4 * dos.average(window)[0];
    };

    auto const error_low = std::abs(count_in_window(20) - 2);
    auto const error_high = std::abs(count_in_window(200) - 2);
    REQUIRE(error_high < 0.01);
    REQUIRE(error_high < error_low);

    SECTION("Fermi weighted average counts the filled states") {
        auto const dos = SpectralDensity(op, {}, kpm::unit_factory(4, all_sites),
                                         make_config(200, 4, -1, 1));
        REQUIRE(4 * dos.average(kpm::fermi_distribution(0, 0))[0] == Approx(2).margin(0.02));
        REQUIRE(4 * dos.average(kpm::fermi_distribution(0.35, 0))[0] == Approx(3).margin(0.02));
        REQUIRE(4 * dos.average(kpm::fermi_distribution(0, 1e-3))[0] == Approx(2).margin(0.02));
        REQUIRE_THROWS_AS(kpm::fermi_distribution(0, -1), std::invalid_argument);
    }

    SECTION("Dense Hermitian operator through the generic capability") {
        auto const dense = make_random_hermitian(12);
        auto const eigenvalues = Eigen::SelfAdjointEigenSolver<MatrixXcd>(dense.matrix)
            .eigenvalues().array().eval();
        auto const dos = SpectralDensity(dense, make_config(50, 20));
        auto const bounds = dos.bounds();
        REQUIRE(bounds.first <= eigenvalues.minCoeff());
        REQUIRE(bounds.second >= eigenvalues.maxCoeff());
        REQUIRE(dos.average()[0] == Approx(1.0));
    }
}

TEST_CASE("Refinement", "[kpm]") {
    auto const op = chain::make(60, 1.0, true);

    SECTION("No-op targets") {
        auto dos = SpectralDensity(op, make_config(30, 4));
        auto const moments = dos.moments();
        auto const version = dos.version();

        REQUIRE(dos.increase_accuracy(30, 4));
        REQUIRE(dos.version() == version);
        REQUIRE(all_equal(dos.moments(), moments));
    }

    SECTION("Smaller targets") {
        auto dos = SpectralDensity(op, make_config(30, 4));
        REQUIRE_THROWS_AS(dos.increase_accuracy(29, 4), InvalidRefinementError);
        REQUIRE_THROWS_AS(dos.increase_accuracy(30, 3), InvalidRefinementError);
        REQUIRE_THROWS_AS(dos.increase_accuracy(30, 3), std::invalid_argument);
        REQUIRE(dos.num_moments() == 30);
        REQUIRE(dos.num_vectors() == 4);
    }

    SECTION("More vectors equals a fresh run") {
        auto dos = SpectralDensity(op, make_config(30, 4));
        auto const version = dos.version();
        REQUIRE(dos.increase_accuracy(30, 9));
        REQUIRE(dos.version() > version);

        auto const fresh = SpectralDensity(op, make_config(30, 9));
        REQUIRE(dos.num_vectors() == 9);
        REQUIRE(dos.moments().isApprox(fresh.moments(), 1e-12));
    }

    SECTION("More moments equals a fresh run") {
        for (auto const n : {std::make_pair(7, 20), std::make_pair(10, 21),
                             std::make_pair(1, 2), std::make_pair(2, 9)}) {
            INFO("from " << n.first << " to " << n.second);
            auto dos = SpectralDensity(op, make_config(n.first, 3));
            REQUIRE(dos.increase_accuracy(n.second, 3));

            auto const fresh = SpectralDensity(op, make_config(n.second, 3));
            REQUIRE(dos.num_moments() == n.second);
            REQUIRE(dos.moments().isApprox(fresh.moments(), 1e-12));
        }
    }

    SECTION("More moments and vectors") {
        auto dos = SpectralDensity(op, make_config(11, 2));
        REQUIRE(dos.increase_accuracy(25, 5));
        auto const fresh = SpectralDensity(op, make_config(25, 5));
        REQUIRE(dos.moments().isApprox(fresh.moments(), 1e-12));
    }

    SECTION("Sampling points") {
        auto dos = SpectralDensity(op, make_config(30, 2));
        REQUIRE(dos.num_sampling_points() == 60);
        dos.increase_accuracy(40, 2);
        REQUIRE(dos.num_sampling_points() == 60);
        dos.increase_accuracy(70, 2);
        REQUIRE(dos.num_sampling_points() == 140);
        dos.increase_accuracy(70, 2, 300);
        REQUIRE(dos.num_sampling_points() == 300);
        REQUIRE_THROWS_AS(dos.increase_accuracy(80, 2, 50), std::invalid_argument);

        auto config = make_config(30, 2);
        config.num_sampling_points = 20;
        REQUIRE_THROWS_AS(SpectralDensity(op, config), std::invalid_argument);
    }

    SECTION("Energy resolution") {
        auto dos = SpectralDensity(op, make_config(30, 2));
        auto const a = dos.scale().a;
        auto const version = dos.version();

        REQUIRE(dos.increase_energy_resolution(10.0));
        REQUIRE(dos.version() == version);
        REQUIRE(dos.num_sampling_points() == 60);

        REQUIRE(dos.increase_energy_resolution(0.05));
        auto const expected_points = static_cast<idx_t>(std::ceil(1.6 * 2 * a / 0.05));
        REQUIRE(dos.num_sampling_points() == expected_points);
        REQUIRE(dos.num_moments() == expected_points / 2);

        REQUIRE(dos.increase_energy_resolution(0.02, false));
        REQUIRE(dos.num_moments() == expected_points / 2);
        REQUIRE_THROWS_AS(dos.increase_energy_resolution(0), std::invalid_argument);
    }
}

TEST_CASE("Rescaling consistency", "[kpm]") {
    auto const op = chain::make(40);
    auto dos = SpectralDensity(op, make_config(20, 2, -2.5, 2.5));

    REQUIRE_NOTHROW(dos.set_bounds(-2.5, 2.5));
    REQUIRE_THROWS_AS(dos.set_bounds(-3, 3), InconsistentRescalingError);
    REQUIRE_THROWS_AS(dos.set_bounds(-3, 3), std::logic_error);

    auto const s1 = kpm::rescale(-1, 1, 0.01);
    auto const s2 = kpm::rescale(-2, 2, 0.01);
    auto acc1 = kpm::MomentAccumulator(s1, 4, 1);
    auto const acc2 = kpm::MomentAccumulator(s2, 4, 1);
    REQUIRE_THROWS_AS(acc1.merge(acc2), InconsistentRescalingError);

    auto acc3 = kpm::MomentAccumulator(s1, 4, 1);
    acc3.add_sample(ArrayXXcdCM::Ones(4, 1));
    acc1.add_sample(ArrayXXcdCM::Constant(4, 1, 3.0));
    acc1.merge(acc3);
    REQUIRE(acc1.num_samples() == 2);
    REQUIRE(acc1.moments()(2, 0) == std::complex<double>{2.0});
}

TEST_CASE("Observables", "[kpm]") {
    auto const op = chain::make(30);
    auto const config = make_config(25, 3);
    auto const dos = SpectralDensity(op, config);

    SECTION("Local density over all sites sums to the density of states") {
        auto indices = std::vector<idx_t>(30);
        std::iota(indices.begin(), indices.end(), 0);

        auto const ldos = SpectralDensity(op, kpm::local_density(30, indices), config);
        REQUIRE(ldos.num_outputs() == 30);

        auto const summed = ldos.moments().rowwise().sum().eval();
        REQUIRE(summed.matrix().isApprox(dos.moments().col(0).matrix(), 1e-10));

        auto const e = ArrayXd::LinSpaced(11, -1.5, 1.5).eval();
        auto const rho = ldos.evaluate(e);
        REQUIRE(rho.rows() == 11);
        REQUIRE(rho.cols() == 30);
        REQUIRE(rho.rowwise().sum().matrix().isApprox(dos.evaluate(e).col(0).matrix(), 1e-8));
    }

    SECTION("Identity weighting operator reproduces the density of states") {
        auto const identity = diagonal::make(std::vector<double>(30, 1.0));
        auto const weighted = SpectralDensity(op, kpm::operator_observable(identity), config);
        REQUIRE(weighted.moments().isApprox(dos.moments(), 1e-10));
    }

    SECTION("Unit vectors give the exact local density of states") {
        auto const site = std::vector<idx_t>{15};
        auto const local = SpectralDensity(op, {}, kpm::unit_factory(30, site), config);
        auto const unit_ldos = SpectralDensity(op, kpm::local_density(30, site),
                                               kpm::unit_factory(30, site), config);
        REQUIRE(local.moments().isApprox(unit_ldos.moments(), 1e-10));
        REQUIRE(local.average()[0] == Approx(1.0));
    }

    SECTION("Size mismatch") {
        REQUIRE_THROWS_AS(SpectralDensity(op, kpm::local_density(10, {1}), config),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(SpectralDensity(op, {}, kpm::random_phase_factory(10, 0), config),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(kpm::local_density(10, {10}), std::invalid_argument);
    }
}

TEST_CASE("Edge cases", "[kpm]") {
    auto const op = chain::make(20);

    SECTION("A single moment") {
        auto const dos = SpectralDensity(op, make_config(1, 2));
        REQUIRE(dos.num_moments() == 1);
        REQUIRE(dos.average()[0] == Approx(1.0));
    }

    SECTION("Invalid configuration") {
        REQUIRE_THROWS_AS(SpectralDensity(op, make_config(0, 2)), std::invalid_argument);
        REQUIRE_THROWS_AS(SpectralDensity(op, make_config(10, 0)), std::invalid_argument);
        REQUIRE_THROWS_AS(SpectralDensity(op, make_config(10, 2, 1, -1)), std::invalid_argument);

        auto config = make_config(10, 2);
        config.margin = 0.6;
        REQUIRE_THROWS_AS(SpectralDensity(op, config), std::invalid_argument);
    }

    SECTION("A zero start vector gives zero moments") {
        auto const zero = VectorXcd::Zero(20).eval();
        auto const dos = SpectralDensity(op, {}, kpm::constant_factory(zero), make_config(10, 2));
        REQUIRE((dos.moments().abs() == 0).all());
    }

    SECTION("Non-finite values") {
        auto const nan_op = NanOperator{8};
        REQUIRE_THROWS_AS(SpectralDensity(nan_op, make_config(10, 3, -1, 1)), OperatorError);
    }
}

TEST_CASE("Concurrency", "[kpm]") {
    auto const op = chain::make(50, 1.0, true);
    auto const config = make_config(40, 12);

    SECTION("The number of threads does not change the result") {
        auto const single = SpectralDensity(op, config, kpm::DefaultCompute(1));
        auto const multi = SpectralDensity(op, config, kpm::DefaultCompute(4));
        REQUIRE(all_equal(single.moments(), multi.moments()));
    }

    SECTION("Progress is reported for every sample") {
        std::atomic<idx_t> completed{0};
        auto const compute = kpm::DefaultCompute(2, [&](idx_t delta, idx_t total) {
            if (delta > 0 && delta < total) { completed += delta; }
        });
        auto const dos = SpectralDensity(op, config, compute);
        REQUIRE(completed.load() == 12);
    }

    SECTION("Cancellation before new samples") {
        auto dos = SpectralDensity(op, make_config(40, 4));
        auto const version = dos.version();

        dos.get_config().cancellation.cancel();
        REQUIRE_FALSE(dos.increase_accuracy(40, 10));
        REQUIRE(dos.num_vectors() == 4);
        REQUIRE(dos.version() == version);

        dos.get_config().cancellation.reset();
        REQUIRE(dos.increase_accuracy(40, 10));
        auto const fresh = SpectralDensity(op, make_config(40, 10));
        REQUIRE(dos.moments().isApprox(fresh.moments(), 1e-12));
    }

    SECTION("Cancellation keeps a valid prefix of samples") {
        auto cancel_config = make_config(40, 3);
        auto const token = cancel_config.cancellation;
        auto finished = idx_t{0};
        auto const compute = kpm::DefaultCompute(1, [&](idx_t delta, idx_t total) {
            if (delta > 0 && delta < total && ++finished == 5) { token.cancel(); }
        });

        auto dos = SpectralDensity(op, cancel_config, compute);
        REQUIRE(dos.num_vectors() == 3);
        REQUIRE_FALSE(dos.increase_accuracy(40, 10));
        REQUIRE(dos.num_vectors() == 5);

        auto const fresh = SpectralDensity(op, make_config(40, 5));
        REQUIRE(dos.moments().isApprox(fresh.moments(), 1e-12));
    }

    SECTION("An interrupted moment extension is discarded") {
        auto dos = SpectralDensity(op, make_config(20, 4));
        auto const moments = dos.moments();
        auto const version = dos.version();

        dos.get_config().cancellation.cancel();
        REQUIRE_FALSE(dos.increase_accuracy(40, 4));
        REQUIRE(dos.num_moments() == 20);
        REQUIRE(dos.version() == version);
        REQUIRE(all_equal(dos.moments(), moments));
    }
}
