#include "cwsens/stats/NoncentralChiSquare.hh"

#include <Math/PdfFuncMathCore.h>
#include <Math/ProbFuncMathCore.h>
#include <Math/QuantFuncMathCore.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace cwsens::stats {

namespace {

// Poisson weights below this no longer change the sum
constexpr double kWeightCut = 1e-17;

} // namespace

double NoncentralChiSquareCdf(double x, double k, double lambda) {
  if (!(k > 0.0)) throw std::invalid_argument("NoncentralChiSquareCdf: k must be > 0");
  if (!(lambda >= 0.0)) throw std::invalid_argument("NoncentralChiSquareCdf: lambda must be >= 0");
  if (!(x > 0.0)) return 0.0;
  if (std::isinf(x)) return 1.0;
  if (lambda == 0.0) return ROOT::Math::chisquared_cdf(x, k);

  const double h = 0.5 * lambda;
  const unsigned int j0 = static_cast<unsigned int>(std::floor(h));

  // sum outwards from the Poisson mode
  double sum = 0.0;
  for (unsigned int j = j0;; ++j) {
    const double w = ROOT::Math::poisson_pdf(j, h);
    const double c = ROOT::Math::chisquared_cdf(x, k + 2.0 * j);
    sum += w * c;
    if (j > j0 && (w < kWeightCut || c < kWeightCut)) break;
  }
  for (unsigned int j = j0; j-- > 0;) {
    const double w = ROOT::Math::poisson_pdf(j, h);
    sum += w * ROOT::Math::chisquared_cdf(x, k + 2.0 * j);
    if (w < kWeightCut) break;
  }
  return std::clamp(sum, 0.0, 1.0);
}

double ChiSquareInverseFalseAlarm(double p, double k) {
  if (!(p > 0.0 && p < 1.0))
    throw std::invalid_argument("ChiSquareInverseFalseAlarm: p must be in (0,1)");
  if (!(k > 0.0)) throw std::invalid_argument("ChiSquareInverseFalseAlarm: k must be > 0");
  return ROOT::Math::chisquared_quantile_c(p, k);
}

double ChiSquareFalseAlarm(double x, double k) {
  if (!(k > 0.0)) throw std::invalid_argument("ChiSquareFalseAlarm: k must be > 0");
  return ROOT::Math::chisquared_cdf_c(x, k);
}

} // namespace cwsens::stats
