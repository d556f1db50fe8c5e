#include "cwsens/histogram/HistogramStatistics.hh"
#include "cwsens/core/Errors.hh"

#include <cmath>
#include <stdexcept>
#include <string>

namespace cwsens {

namespace {

// Marginal probabilities along dim, restricted to the finite bins.
// Throws if the sentinel bins carry mass.
std::vector<double> finite_marginal(const Histogram& h, std::size_t dim, const char* where) {
  if (!(h.TotalCount() > 0.0))
    throw std::invalid_argument(std::string(where) + ": histogram is empty");

  const auto p = HistogramStatistics::MarginalProbabilities(h, dim);
  if (p.front() > 0.0 || p.back() > 0.0) {
    throw InfiniteMassError(std::string(where) + ": dimension " + std::to_string(dim) +
                            " has probability " + std::to_string(p.front()) + " at -inf and " +
                            std::to_string(p.back()) + " at +inf");
  }
  return std::vector<double>(p.begin() + 1, p.end() - 1);
}

} // namespace

std::vector<double> HistogramStatistics::ProbabilityDensities(const Histogram& h) {
  const auto shape = h.Shape();
  std::vector<std::vector<double>> widths(h.Dim());
  for (std::size_t d = 0; d < h.Dim(); ++d) widths[d] = h.Bins(d, BinQuantity::Width);

  auto dens = h.Probabilities();
  std::vector<std::size_t> idx(h.Dim(), 0);
  for (std::size_t flat = 0; flat < dens.size(); ++flat) {
    double volume = 1.0;
    for (std::size_t d = 0; d < h.Dim(); ++d) volume *= widths[d][idx[d]];
    dens[flat] = std::isfinite(volume) ? dens[flat] / volume : 0.0;

    // advance row-major multi-index
    for (std::size_t d = h.Dim(); d-- > 0;) {
      if (++idx[d] < shape[d]) break;
      idx[d] = 0;
    }
  }
  return dens;
}

std::vector<double> HistogramStatistics::MarginalProbabilities(const Histogram& h, std::size_t dim) {
  const std::size_t nb = h.NumBins(dim);
  const auto shape = h.Shape();
  std::size_t inner = 1;
  for (std::size_t d = dim + 1; d < h.Dim(); ++d) inner *= shape[d];

  const auto p = h.Probabilities();
  std::vector<double> m(nb, 0.0);
  for (std::size_t flat = 0; flat < p.size(); ++flat) m[(flat / inner) % nb] += p[flat];
  return m;
}

double HistogramStatistics::MeanOf(const Histogram& h, std::size_t dim) {
  const auto p = finite_marginal(h, dim, "HistogramStatistics::MeanOf");
  const auto x = h.Bins(dim, BinQuantity::Centre);

  double mean = 0.0;
  for (std::size_t i = 0; i < p.size(); ++i) mean += x[i + 1] * p[i];
  return mean;
}

double HistogramStatistics::VarianceOf(const Histogram& h, std::size_t dim) {
  const auto p = finite_marginal(h, dim, "HistogramStatistics::VarianceOf");
  const auto x = h.Bins(dim, BinQuantity::Centre);

  double mean = 0.0;
  for (std::size_t i = 0; i < p.size(); ++i) mean += x[i + 1] * p[i];

  double var = 0.0;
  for (std::size_t i = 0; i < p.size(); ++i) {
    const double dev = x[i + 1] - mean;
    var += dev * dev * p[i];
  }
  return var;
}

double HistogramStatistics::StdDevOf(const Histogram& h, std::size_t dim) {
  return std::sqrt(VarianceOf(h, dim));
}

} // namespace cwsens
