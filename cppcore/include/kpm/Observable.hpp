#pragma once
#include "kpm/Operator.hpp"

#include <vector>

namespace kpmdos { namespace kpm {

/**
 Type-erased observable: maps a pair of vectors `(bra, ket)` to one or more values

 The moments of an observable are `mu_k = obs(v, T_k(R) v)`. Any type with
 the following members is accepted:

     idx_t size() const;        // dimension of the vectors
     idx_t num_outputs() const; // number of values returned per call
     ArrayXcd operator()(VectorXcd const& bra, VectorXcd const& ket) const;

 Ownership follows `LinearOperator`: lvalues are referenced, temporaries are moved in.
 */
class Observable {
    class Interface {
    public:
        virtual ~Interface() = default;
        virtual idx_t size() const = 0;
        virtual idx_t num_outputs() const = 0;
        virtual ArrayXcd evaluate(VectorXcd const& bra, VectorXcd const& ket) const = 0;
    };

    template<class T>
    class Model : public Interface {
    public:
        template<class U>
        explicit Model(U&& obs) : obs(std::forward<U>(obs)) {}

        idx_t size() const override { return obs.size(); }
        idx_t num_outputs() const override { return obs.num_outputs(); }
        ArrayXcd evaluate(VectorXcd const& bra, VectorXcd const& ket) const override {
            return obs(bra, ket);
        }

    private:
        T obs;
    };

public:
    Observable() = default;

    template<class T, class = typename std::enable_if<
        !std::is_same<typename std::decay<T>::type, Observable>::value
    >::type>
    Observable(T&& obs)
        : ptr(std::make_shared<Model<detail::stored_t<T>>>(std::forward<T>(obs))) {}

    explicit operator bool() const { return static_cast<bool>(ptr); }

    idx_t size() const { return ptr ? ptr->size() : 0; }
    idx_t num_outputs() const { return ptr ? ptr->num_outputs() : 1; }

    /// Throws `std::logic_error` if the result does not have `num_outputs()` values
    ArrayXcd operator()(VectorXcd const& bra, VectorXcd const& ket) const;

private:
    std::shared_ptr<Interface const> ptr;
};

/**
 Matrix element of a weighting operator: `<bra| W |ket>`

 `W` need not be Hermitian, but it must have the same dimension as the main operator.
 */
Observable operator_observable(LinearOperator const& w);

/**
 Local density: one output per index, `conj(bra[i]) * ket[i]`

 With unit start vectors this gives the local density of states at each site.
 Throws `std::invalid_argument` if any index is outside of [0, size).
 */
Observable local_density(idx_t size, std::vector<idx_t> indices);

}} // namespace kpmdos::kpm
