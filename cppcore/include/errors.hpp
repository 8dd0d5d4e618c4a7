#pragma once
#include <stdexcept>
#include <string>

namespace kpmdos {

/// The linear operator is malformed: zero dimension, non-finite action or a degenerate spectrum
class OperatorError : public std::runtime_error {
public:
    explicit OperatorError(std::string const& what) : std::runtime_error(what) {}
};

/// The spectral bounds were changed after moments had already been accumulated
class InconsistentRescalingError : public std::logic_error {
public:
    explicit InconsistentRescalingError(std::string const& what) : std::logic_error(what) {}
};

/// An energy was requested outside of the rescaled spectral interval
class OutOfBandError : public std::domain_error {
public:
    explicit OutOfBandError(std::string const& what) : std::domain_error(what) {}
};

/// A refinement target is smaller than the current number of moments or vectors
class InvalidRefinementError : public std::invalid_argument {
public:
    explicit InvalidRefinementError(std::string const& what) : std::invalid_argument(what) {}
};

} // namespace kpmdos
