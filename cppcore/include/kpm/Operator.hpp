#pragma once
#include "numeric/dense.hpp"
#include "numeric/sparse.hpp"

#include <memory>
#include <string>
#include <type_traits>

namespace kpmdos { namespace kpm {

namespace detail {
    /// Store a reference to lvalues and a copy of rvalues
    template<class T>
    using stored_t = typename std::conditional<
        std::is_lvalue_reference<T>::value,
        typename std::decay<T>::type const&,
        typename std::decay<T>::type
    >::type;
}

/**
 Type-erased linear operator: only the action `y = Op * x` is required

 Any type with the following members is accepted, without inheriting from anything:

     idx_t size() const;
     void apply(VectorXcd const& x, VectorXcd& y) const;

 An lvalue is held by reference: the caller owns it and must keep it alive for as long
 as the `LinearOperator` (or a `SpectralDensity` built from it) is in use. A temporary
 is moved into the `LinearOperator`. Copies share the same underlying operator.
 */
class LinearOperator {
    class Interface {
    public:
        virtual ~Interface() = default;
        virtual idx_t size() const = 0;
        virtual void apply(VectorXcd const& x, VectorXcd& y) const = 0;
    };

    template<class T>
    class Model : public Interface {
    public:
        template<class U>
        explicit Model(U&& op) : op(std::forward<U>(op)) {}

        idx_t size() const override { return op.size(); }
        void apply(VectorXcd const& x, VectorXcd& y) const override { op.apply(x, y); }

    private:
        T op;
    };

public:
    LinearOperator() = default;

    template<class T, class = typename std::enable_if<
        !std::is_same<typename std::decay<T>::type, LinearOperator>::value
    >::type>
    LinearOperator(T&& op)
        : ptr(std::make_shared<Model<detail::stored_t<T>>>(std::forward<T>(op))) {}

    explicit operator bool() const { return static_cast<bool>(ptr); }

    idx_t size() const { return ptr ? ptr->size() : 0; }

    /// y = Op * x, where `y` is resized to `size()` if needed
    void apply(VectorXcd const& x, VectorXcd& y) const {
        if (y.size() != ptr->size()) { y.resize(ptr->size()); }
        ptr->apply(x, y);
    }

    VectorXcd operator*(VectorXcd const& x) const {
        auto y = VectorXcd(size());
        apply(x, y);
        return y;
    }

private:
    std::shared_ptr<Interface const> ptr;
};

/**
 Sparse matrix operator in the CSR format with any scalar type

 The matrix is reference counted and immutable: copies of the operator are cheap.
 Products are always computed in `std::complex<double>`.
 */
class SparseOperator {
public:
    using Variant = var::complex<SparseMatrixRC>;

    template<class scalar_t>
    SparseOperator(SparseMatrixX<scalar_t> const& matrix)
        : SparseOperator(compressed(SparseMatrixX<scalar_t>(matrix))) {}

    template<class scalar_t>
    SparseOperator(SparseMatrixX<scalar_t>&& matrix)
        : SparseOperator(compressed(std::move(matrix))) {}

    /// The matrix must be in compressed CSR form
    template<class scalar_t>
    SparseOperator(SparseMatrixRC<scalar_t> matrix) : variant_matrix(std::move(matrix)) {
        validate();
    }

    idx_t size() const;
    idx_t non_zeros() const;
    bool is_complex() const;
    std::string scalar_name() const;

    void apply(VectorXcd const& x, VectorXcd& y) const;

    Variant const& get_variant() const { return variant_matrix; }

private:
    template<class scalar_t>
    static SparseMatrixRC<scalar_t> compressed(SparseMatrixX<scalar_t>&& matrix) {
        matrix.makeCompressed();
        return std::make_shared<SparseMatrixX<scalar_t> const>(std::move(matrix));
    }

    /// Throw `std::invalid_argument` if the matrix is not square or not compressed
    void validate() const;

private:
    Variant variant_matrix;
};

}} // namespace kpmdos::kpm
