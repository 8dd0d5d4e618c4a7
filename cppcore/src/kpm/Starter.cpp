#include "kpm/Starter.hpp"

#include "numeric/random.hpp"

#include <fmt/format.h>

namespace kpmdos { namespace kpm {

namespace {

void check_indices(char const* name, idx_t size, std::vector<idx_t> const& indices) {
    if (indices.empty()) {
        throw std::invalid_argument(fmt::format("{}: at least one index is required", name));
    }
    for (auto const i : indices) {
        if (i < 0 || i >= size) {
            throw std::invalid_argument(fmt::format(
                "{}: index {} is out of range for vectors of size {}", name, i, size
            ));
        }
    }
}

struct RandomPhases {
    idx_t size;
    std::shared_ptr<std::mt19937> generator;

    VectorXcd operator()(idx_t) const {
        auto const norm = 1 / std::sqrt(static_cast<double>(size));
        return num::make_random_phases(size, *generator) * norm;
    }
};

struct LocalRandomPhases {
    idx_t size;
    std::vector<idx_t> indices;
    std::shared_ptr<std::mt19937> generator;

    VectorXcd operator()(idx_t) const {
        auto const num_sites = static_cast<idx_t>(indices.size());
        auto const phases = num::make_random_phases(num_sites, *generator);
        auto const norm = 1 / std::sqrt(static_cast<double>(num_sites));

        auto v = VectorXcd::Zero(size).eval();
        for (auto n = idx_t{0}; n < num_sites; ++n) {
            v[indices[n]] = phases[n] * norm;
        }
        return v;
    }
};

struct UnitVectors {
    idx_t size;
    std::vector<idx_t> indices;

    VectorXcd operator()(idx_t index) const {
        auto v = VectorXcd::Zero(size).eval();
        v[indices[index % static_cast<idx_t>(indices.size())]] = 1.0;
        return v;
    }
};

} // anonymous namespace

VectorXcd VectorFactory::draw() {
    auto v = make(count);
    if (v.size() != vector_size) {
        throw std::invalid_argument(fmt::format(
            "VectorFactory: the start vector has size {} but the operator has size {}",
            v.size(), vector_size
        ));
    }
    ++count;
    return v;
}

VectorFactory random_phase_factory(idx_t size, std::uint32_t seed) {
    if (size <= 0) { throw std::invalid_argument("random_phase_factory: size must be positive"); }
    return {RandomPhases{size, std::make_shared<std::mt19937>(seed)}, size};
}

VectorFactory local_random_factory(idx_t size, std::vector<idx_t> const& indices,
                                   std::uint32_t seed) {
    check_indices("local_random_factory", size, indices);
    return {LocalRandomPhases{size, indices, std::make_shared<std::mt19937>(seed)}, size};
}

VectorFactory unit_factory(idx_t size, std::vector<idx_t> const& indices) {
    check_indices("unit_factory", size, indices);
    return {UnitVectors{size, indices}, size};
}

VectorFactory constant_factory(VectorXcd const& vector) {
    return {[vector](idx_t) { return vector; }, vector.size()};
}

VectorFactory custom_factory(idx_t size, std::function<VectorXcd()> make) {
    if (!make) { throw std::invalid_argument("custom_factory: the callable is empty"); }
    return {[make](idx_t) { return make(); }, size};
}

}} // namespace kpmdos::kpm
