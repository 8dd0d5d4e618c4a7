#include "kpm/Observable.hpp"

#include <fmt/format.h>

namespace kpmdos { namespace kpm {

namespace {

class OperatorObservable {
public:
    explicit OperatorObservable(LinearOperator w) : w(std::move(w)) {}

    idx_t size() const { return w.size(); }
    idx_t num_outputs() const { return 1; }

    ArrayXcd operator()(VectorXcd const& bra, VectorXcd const& ket) const {
        auto result = ArrayXcd(1);
        result[0] = bra.dot(w * ket);
        return result;
    }

private:
    LinearOperator w;
};

class LocalDensity {
public:
    LocalDensity(idx_t size, std::vector<idx_t> indices)
        : dimension(size), indices(std::move(indices)) {}

    idx_t size() const { return dimension; }
    idx_t num_outputs() const { return static_cast<idx_t>(indices.size()); }

    ArrayXcd operator()(VectorXcd const& bra, VectorXcd const& ket) const {
        auto result = ArrayXcd(num_outputs());
        for (auto n = idx_t{0}; n < num_outputs(); ++n) {
            auto const i = indices[n];
            result[n] = std::conj(bra[i]) * ket[i];
        }
        return result;
    }

private:
    idx_t dimension;
    std::vector<idx_t> indices;
};

} // anonymous namespace

ArrayXcd Observable::operator()(VectorXcd const& bra, VectorXcd const& ket) const {
    auto result = ptr->evaluate(bra, ket);
    if (result.size() != ptr->num_outputs()) {
        throw std::logic_error(fmt::format(
            "Observable: expected {} outputs, got {}", ptr->num_outputs(), result.size()
        ));
    }
    return result;
}

Observable operator_observable(LinearOperator const& w) {
    if (!w) { throw std::invalid_argument("operator_observable: the weighting operator is empty"); }
    return OperatorObservable(w);
}

Observable local_density(idx_t size, std::vector<idx_t> indices) {
    if (indices.empty()) {
        throw std::invalid_argument("local_density: at least one index is required");
    }
    for (auto const i : indices) {
        if (i < 0 || i >= size) {
            throw std::invalid_argument(fmt::format(
                "local_density: index {} is out of range for size {}", i, size
            ));
        }
    }
    return LocalDensity(size, std::move(indices));
}

}} // namespace kpmdos::kpm
