#pragma once

#include <vector>

#include "cwsens/stats/IFalseDismissalProbability.hh"

namespace cwsens::stats {

/**
 * False-dismissal probability of a Hough number count on the F-statistic.
 *
 * A segment contributes to the number count if 2F exceeds 2*Fth. With
 *   eta = P( chi^2_4(rhosqr) < 2 Fth )   (per-segment false dismissal)
 * the number count is Binomial(Ns, 1 - eta), approximated as Gaussian:
 *   pd(rhosqr) = 1/2 erfc( (Ns (1-eta) - nth) / sqrt(2 Ns eta (1-eta)) )
 */
class HoughFstatFDP : public IFalseDismissalProbability {
public:
  /// nth: one number-count threshold per problem row.
  HoughFstatFDP(std::vector<double> nth, double Fth = 2.6);
  ~HoughFstatFDP() override = default;

  std::vector<double> Evaluate(const std::vector<std::size_t>& rows,
                               const std::vector<double>& pd,
                               const std::vector<double>& Ns,
                               const std::vector<double>& rhosqr) const override;

  std::size_t NumRows() const override { return nth_.size(); }

  const std::vector<double>& thresholds() const noexcept { return nth_; }

  /// Number-count threshold for false-alarm probability paNt (normal approximation).
  static double ThresholdFromFalseAlarm(double paNt, double Ns, double Fth = 2.6);

private:
  std::vector<double> nth_;
  double Fth_;
};

} // namespace cwsens::stats
