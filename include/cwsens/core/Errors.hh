#pragma once

#include <stdexcept>
#include <string>

namespace cwsens {

// Sample/array dimensionality does not match what an operation expects.
class DimensionMismatch : public std::invalid_argument {
public:
  explicit DimensionMismatch(const std::string& what) : std::invalid_argument(what) {}
};

// An operation requiring a 1-D histogram received a higher-dimensional one.
class InvalidHistogramShape : public std::invalid_argument {
public:
  explicit InvalidHistogramShape(const std::string& what) : std::invalid_argument(what) {}
};

// Distribution has support below the domain of the quantity (e.g. R^2 < 0).
class NegativeDomainError : public std::domain_error {
public:
  explicit NegativeDomainError(const std::string& what) : std::domain_error(what) {}
};

// Distribution carries probability in its +/-inf bins where none is allowed.
class UnboundedMassError : public std::domain_error {
public:
  explicit UnboundedMassError(const std::string& what) : std::domain_error(what) {}
};

// Resampling target edges do not cover the existing finite range.
class RangeCoverageError : public std::out_of_range {
public:
  explicit RangeCoverageError(const std::string& what) : std::out_of_range(what) {}
};

// Moment requested along a dimension with mass in an infinite bin.
class InfiniteMassError : public std::domain_error {
public:
  explicit InfiniteMassError(const std::string& what) : std::domain_error(what) {}
};

class UnknownStatisticFamily : public std::invalid_argument {
public:
  explicit UnknownStatisticFamily(const std::string& what) : std::invalid_argument(what) {}
};

// Root search exceeded its iteration cap.
class ConvergenceFailure : public std::runtime_error {
public:
  explicit ConvergenceFailure(const std::string& what) : std::runtime_error(what) {}
};

} // namespace cwsens
