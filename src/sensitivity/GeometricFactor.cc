#include "cwsens/sensitivity/GeometricFactor.hh"
#include "cwsens/histogram/HistogramStatistics.hh"
#include "cwsens/core/Errors.hh"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace cwsens {

namespace {

struct Rule {
  std::vector<double> x;
  std::vector<double> w;
};

Rule rule_from_histogram(const Histogram& h, const std::string& what) {
  if (h.Dim() != 1) {
    throw InvalidHistogramShape(what + " must be a 1-D histogram, got " +
                                std::to_string(h.Dim()) + " dimensions");
  }
  if (!(h.TotalCount() > 0.0)) throw std::invalid_argument(what + " histogram is empty");

  const auto range = h.Range(0);
  if (range.first < 0.0) {
    std::ostringstream msg;
    msg << what << " histogram bins must be non-negative (lowest edge " << range.first << ")";
    throw NegativeDomainError(msg.str());
  }

  const auto p = h.Probabilities();
  if (p.front() > 0.0 || p.back() > 0.0) {
    std::ostringstream msg;
    msg << what << " histogram contains non-zero probability in infinite bins (" << p.front()
        << " at -inf, " << p.back() << " at +inf)";
    throw UnboundedMassError(msg.str());
  }

  const auto px = HistogramStatistics::ProbabilityDensities(h);
  const auto x  = h.Bins(0, BinQuantity::Centre);
  const auto dx = h.Bins(0, BinQuantity::Width);

  Rule r;
  for (std::size_t i = 1; i + 1 < px.size(); ++i) {
    const double w = px[i] * dx[i];
    if (w > 0.0) {
      r.x.push_back(x[i]);
      r.w.push_back(w);
    }
  }
  return r;
}

} // namespace

GeometricFactor::GeometricFactor(std::vector<double> nodes, std::vector<double> weights)
: nodes_(std::move(nodes)), weights_(std::move(weights)) {}

GeometricFactor GeometricFactor::FromHistogram(const Histogram& Rsqr) {
  auto r = rule_from_histogram(Rsqr, "R^2");
  return GeometricFactor(std::move(r.x), std::move(r.w));
}

GeometricFactor GeometricFactor::FromScalar(double Rsqr) {
  if (!std::isfinite(Rsqr)) throw std::invalid_argument("R^2 must be finite");
  if (Rsqr < 0.0) throw NegativeDomainError("R^2 must be non-negative, got " + std::to_string(Rsqr));
  return GeometricFactor({Rsqr}, {1.0});
}

GeometricFactor GeometricFactor::WithMismatch(const Histogram& mismatch) const {
  auto m = rule_from_histogram(mismatch, "mismatch");
  if (mismatch.Range(0).second > 1.0) {
    std::ostringstream msg;
    msg << "mismatch histogram bins must lie in [0,1] (highest edge " << mismatch.Range(0).second << ")";
    throw std::domain_error(msg.str());
  }

  std::vector<double> x, w;
  x.reserve(nodes_.size() * m.x.size());
  w.reserve(nodes_.size() * m.x.size());
  for (std::size_t i = 0; i < nodes_.size(); ++i) {
    for (std::size_t j = 0; j < m.x.size(); ++j) {
      x.push_back(nodes_[i] * (1.0 - m.x[j]));
      w.push_back(weights_[i] * m.w[j]);
    }
  }
  return GeometricFactor(std::move(x), std::move(w));
}

double GeometricFactor::Mean() const {
  double s = 0.0, sw = 0.0;
  for (std::size_t i = 0; i < nodes_.size(); ++i) {
    s  += weights_[i] * nodes_[i];
    sw += weights_[i];
  }
  return (sw > 0.0) ? s / sw : 0.0;
}

} // namespace cwsens
