#include "cwsens/stats/ChiSqrFDP.hh"
#include "cwsens/stats/NoncentralChiSquare.hh"
#include "cwsens/core/Errors.hh"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace cwsens::stats {

ChiSqrFDP::ChiSqrFDP(std::vector<double> sa, double dof, bool norm)
: sa_(std::move(sa)), dof_(dof), norm_(norm)
{
  if (sa_.empty()) throw std::invalid_argument("ChiSqrFDP: no thresholds");
  for (double s : sa_) {
    if (!(s > 0.0) || !std::isfinite(s))
      throw std::invalid_argument("ChiSqrFDP: thresholds must be finite and > 0");
  }
  if (!(dof_ > 0.0)) throw std::invalid_argument("ChiSqrFDP: dof must be > 0");
}

double ChiSqrFDP::ThresholdFromFalseAlarm(double paNt, double Ns, double dof) {
  return ChiSquareInverseFalseAlarm(paNt, dof * Ns);
}

std::vector<double> ChiSqrFDP::Evaluate(const std::vector<std::size_t>& rows,
                                        const std::vector<double>& /*pd*/,
                                        const std::vector<double>& Ns,
                                        const std::vector<double>& rhosqr) const {
  if (Ns.size() != rows.size() || rhosqr.size() != rows.size())
    throw DimensionMismatch("ChiSqrFDP::Evaluate: rows/Ns/rhosqr size mismatch");

  std::vector<double> pd_rho(rows.size());
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const double sa = sa_.at(rows[i]);
    const double k = dof_ * Ns[i];
    const double lambda = Ns[i] * rhosqr[i];

    if (norm_) {
      const double mean = k + lambda;
      const double sdev = std::sqrt(2.0 * (k + 2.0 * lambda));
      pd_rho[i] = 0.5 * std::erfc(-(sa - mean) / (std::sqrt(2.0) * sdev));
    } else {
      pd_rho[i] = NoncentralChiSquareCdf(sa, k, lambda);
    }
  }
  return pd_rho;
}

} // namespace cwsens::stats
