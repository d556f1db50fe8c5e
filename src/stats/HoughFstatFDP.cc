#include "cwsens/stats/HoughFstatFDP.hh"
#include "cwsens/stats/NoncentralChiSquare.hh"
#include "cwsens/core/Errors.hh"

#include <Math/QuantFuncMathCore.h>

#include <cmath>
#include <stdexcept>
#include <utility>

namespace cwsens::stats {

HoughFstatFDP::HoughFstatFDP(std::vector<double> nth, double Fth)
: nth_(std::move(nth)), Fth_(Fth)
{
  if (nth_.empty()) throw std::invalid_argument("HoughFstatFDP: no thresholds");
  for (double n : nth_) {
    if (!std::isfinite(n)) throw std::invalid_argument("HoughFstatFDP: thresholds must be finite");
  }
  if (!(Fth_ > 0.0)) throw std::invalid_argument("HoughFstatFDP: Fth must be > 0");
}

double HoughFstatFDP::ThresholdFromFalseAlarm(double paNt, double Ns, double Fth) {
  if (!(paNt > 0.0 && paNt < 1.0))
    throw std::invalid_argument("HoughFstatFDP: paNt must be in (0,1)");

  // false-alarm probability of a single segment
  const double alpha = ChiSquareFalseAlarm(2.0 * Fth, 4.0);
  return Ns * alpha + std::sqrt(Ns * alpha * (1.0 - alpha)) * ROOT::Math::normal_quantile_c(paNt, 1.0);
}

std::vector<double> HoughFstatFDP::Evaluate(const std::vector<std::size_t>& rows,
                                            const std::vector<double>& /*pd*/,
                                            const std::vector<double>& Ns,
                                            const std::vector<double>& rhosqr) const {
  if (Ns.size() != rows.size() || rhosqr.size() != rows.size())
    throw DimensionMismatch("HoughFstatFDP::Evaluate: rows/Ns/rhosqr size mismatch");

  std::vector<double> pd_rho(rows.size());
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const double nth = nth_.at(rows[i]);
    const double eta = NoncentralChiSquareCdf(2.0 * Fth_, 4.0, rhosqr[i]);
    const double mean = Ns[i] * (1.0 - eta);
    const double var = Ns[i] * eta * (1.0 - eta);

    if (var > 0.0) {
      pd_rho[i] = 0.5 * std::erfc((mean - nth) / std::sqrt(2.0 * var));
    } else {
      pd_rho[i] = (mean < nth) ? 1.0 : 0.0;
    }
  }
  return pd_rho;
}

} // namespace cwsens::stats
