#pragma once

#include <cstddef>
#include <vector>

#include "cwsens/histogram/Histogram.hh"

namespace cwsens {

/**
 * Derived views and marginal moments of a Histogram.
 *
 * Moments along a dimension use the marginal distribution over the finite
 * bins of that dimension; any probability in its +/-inf bins makes them
 * undefined and throws InfiniteMassError.
 */
class HistogramStatistics {
public:
  /// Normalized counts divided by hyper-bin volume; 0 for infinite volumes.
  static std::vector<double> ProbabilityDensities(const Histogram& h);

  /// Marginal probability mass per bin along dim (sentinel bins included).
  static std::vector<double> MarginalProbabilities(const Histogram& h, std::size_t dim);

  static double MeanOf(const Histogram& h, std::size_t dim = 0);
  static double VarianceOf(const Histogram& h, std::size_t dim = 0);
  static double StdDevOf(const Histogram& h, std::size_t dim = 0);
};

} // namespace cwsens
