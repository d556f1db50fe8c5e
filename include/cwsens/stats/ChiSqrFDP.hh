#pragma once

#include <vector>

#include "cwsens/stats/IFalseDismissalProbability.hh"

namespace cwsens::stats {

/**
 * False-dismissal probability of a semicoherent chi^2 statistic.
 *
 * The summed statistic over Ns segments is noncentral chi^2 with
 * dof*Ns degrees of freedom and noncentrality Ns*rhosqr. For a threshold
 * sa on the summed statistic:
 *   pd(rhosqr) = P( chi^2_{dof Ns}(Ns rhosqr) < sa )
 *
 * With norm = true the chi^2 is replaced by a Gaussian of mean
 * dof*Ns + lambda and variance 2 (dof*Ns + 2 lambda).
 */
class ChiSqrFDP : public IFalseDismissalProbability {
public:
  /// sa: one threshold per problem row.
  ChiSqrFDP(std::vector<double> sa, double dof = 4.0, bool norm = false);
  ~ChiSqrFDP() override = default;

  std::vector<double> Evaluate(const std::vector<std::size_t>& rows,
                               const std::vector<double>& pd,
                               const std::vector<double>& Ns,
                               const std::vector<double>& rhosqr) const override;

  std::size_t NumRows() const override { return sa_.size(); }

  const std::vector<double>& thresholds() const noexcept { return sa_; }
  double dof() const noexcept { return dof_; }

  /// Threshold on the summed statistic for false-alarm probability paNt.
  static double ThresholdFromFalseAlarm(double paNt, double Ns, double dof = 4.0);

private:
  std::vector<double> sa_;
  double dof_;
  bool   norm_;
};

} // namespace cwsens::stats
