#pragma once

#include <cstddef>
#include <vector>

#include "cwsens/histogram/Histogram.hh"

namespace cwsens {

/**
 * Discrete distribution of the SNR geometric factor R^2, used as a
 * quadrature rule: the expectation of f(R^2) is sum_i weights[i] f(nodes[i]).
 *
 * From a histogram, the nodes are the centres of the finite bins and the
 * weights their probability mass (density x width). The histogram must be
 * 1-D (InvalidHistogramShape), have no negative finite edge
 * (NegativeDomainError) and no probability in its +/-inf bins
 * (UnboundedMassError).
 */
class GeometricFactor {
public:
  static GeometricFactor FromHistogram(const Histogram& Rsqr);
  static GeometricFactor FromScalar(double Rsqr);

  /// Fold in a mismatch distribution mu on [0,1]: R^2 -> R^2 (1 - mu).
  GeometricFactor WithMismatch(const Histogram& mismatch) const;

  const std::vector<double>& nodes() const noexcept { return nodes_; }
  const std::vector<double>& weights() const noexcept { return weights_; }
  std::size_t size() const noexcept { return nodes_.size(); }

  /// Weighted mean of the nodes
  double Mean() const;

private:
  GeometricFactor(std::vector<double> nodes, std::vector<double> weights);

  std::vector<double> nodes_;
  std::vector<double> weights_;
};

} // namespace cwsens
