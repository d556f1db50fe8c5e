#include "cwsens/histogram/Histogram.hh"
#include "cwsens/core/Errors.hh"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace cwsens {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Upper bound on the number of finite bins a single AddData call may create
constexpr double kMaxNewBins = 1e8;

// A step that no longer moves x cannot open a new bin at x.
void check_resolution(double x, double step) {
  if (x - step == x || x + step == x)
    throw std::invalid_argument("Histogram::AddData: bin width too small for data magnitude");
}

void check_increasing(double below, double above) {
  if (!(below < above))
    throw std::invalid_argument("Histogram::AddData: bin width too small for data magnitude");
}

void validate_edges(const std::vector<double>& e, std::size_t dim) {
  const std::string where = "Histogram: dimension " + std::to_string(dim);
  if (e.size() < 2)
    throw std::invalid_argument(where + " needs at least the two sentinel edges");
  if (e.front() != -kInf || e.back() != kInf)
    throw std::invalid_argument(where + " edges must start at -inf and end at +inf");
  for (std::size_t i = 1; i + 1 < e.size(); ++i) {
    if (!std::isfinite(e[i]))
      throw std::invalid_argument(where + " has a non-finite interior edge");
  }
  for (std::size_t i = 1; i < e.size(); ++i) {
    if (!(e[i - 1] < e[i]))
      throw std::invalid_argument(where + " edges are not strictly increasing");
  }
}

} // namespace

Histogram::Histogram(std::size_t dimensions)
: edges_(dimensions, std::vector<double>{-kInf, kInf}), counts_(1, 0.0)
{
  if (dimensions == 0) throw std::invalid_argument("Histogram: dimensions must be > 0");
}

Histogram::Histogram(std::vector<std::vector<double>> edges, std::vector<double> counts)
: edges_(std::move(edges)), counts_(std::move(counts))
{
  if (edges_.empty()) throw std::invalid_argument("Histogram: dimensions must be > 0");

  std::size_t n = 1;
  for (std::size_t d = 0; d < edges_.size(); ++d) {
    validate_edges(edges_[d], d);
    n *= edges_[d].size() - 1;
  }
  if (counts_.size() != n) {
    throw DimensionMismatch("Histogram: counts has " + std::to_string(counts_.size()) +
                            " entries, edges imply " + std::to_string(n));
  }
  for (double c : counts_) {
    if (!(c >= 0.0) || !std::isfinite(c))
      throw std::invalid_argument("Histogram: counts must be finite and non-negative");
  }
}

void Histogram::check_dim_(std::size_t dim, const char* where) const {
  if (dim >= Dim()) {
    throw std::out_of_range(std::string(where) + ": dimension " + std::to_string(dim) +
                            " out of range for " + std::to_string(Dim()) + "-D histogram");
  }
}

const std::vector<double>& Histogram::Edges(std::size_t dim) const {
  check_dim_(dim, "Histogram::Edges");
  return edges_[dim];
}

std::size_t Histogram::NumBins(std::size_t dim) const {
  check_dim_(dim, "Histogram::NumBins");
  return edges_[dim].size() - 1;
}

std::vector<std::size_t> Histogram::Shape() const {
  std::vector<std::size_t> s(Dim());
  for (std::size_t d = 0; d < Dim(); ++d) s[d] = edges_[d].size() - 1;
  return s;
}

bool Histogram::HasFiniteBins(std::size_t dim) const {
  check_dim_(dim, "Histogram::HasFiniteBins");
  return edges_[dim].size() >= 4;
}

std::size_t Histogram::FlatIndex(const std::vector<std::size_t>& index) const {
  if (index.size() != Dim()) {
    throw DimensionMismatch("Histogram::FlatIndex: index has " + std::to_string(index.size()) +
                            " entries, histogram has " + std::to_string(Dim()) + " dimensions");
  }
  std::size_t flat = 0;
  for (std::size_t d = 0; d < Dim(); ++d) {
    const std::size_t nb = edges_[d].size() - 1;
    if (index[d] >= nb)
      throw std::out_of_range("Histogram::FlatIndex: bin index out of range in dimension " +
                              std::to_string(d));
    flat = flat * nb + index[d];
  }
  return flat;
}

double Histogram::Count(const std::vector<std::size_t>& index) const {
  return counts_[FlatIndex(index)];
}

double Histogram::TotalCount() const {
  return std::accumulate(counts_.begin(), counts_.end(), 0.0);
}

std::size_t Histogram::find_bin_(std::size_t dim, double x) const {
  const auto& e = edges_[dim];
  if (x == kInf) return e.size() - 2;
  const auto it = std::upper_bound(e.begin(), e.end(), x);
  return static_cast<std::size_t>(it - e.begin()) - 1;
}

void Histogram::extend_axis_(std::size_t dim, std::vector<double> new_edges, std::size_t n_low) {
  const std::size_t n_old = edges_[dim].size() - 1;
  const std::size_t n_new = new_edges.size() - 1;

  std::size_t outer = 1, inner = 1;
  for (std::size_t d = 0; d < dim; ++d) outer *= edges_[d].size() - 1;
  for (std::size_t d = dim + 1; d < Dim(); ++d) inner *= edges_[d].size() - 1;

  std::vector<double> out(outer * n_new * inner, 0.0);

  if (n_old == 1) {
    // an unsplit axis cannot say on which side of the new edges its mass lies
    if (std::any_of(counts_.begin(), counts_.end(), [](double c) { return c != 0.0; })) {
      throw std::invalid_argument("Histogram: cannot split non-zero counts of unbinned dimension " +
                                  std::to_string(dim));
    }
  } else {
    for (std::size_t o = 0; o < outer; ++o) {
      for (std::size_t i = 0; i < n_old; ++i) {
        const std::size_t j = (i == 0) ? 0 : (i == n_old - 1) ? n_new - 1 : i + n_low;
        for (std::size_t k = 0; k < inner; ++k)
          out[(o * n_new + j) * inner + k] = counts_[(o * n_old + i) * inner + k];
      }
    }
  }

  edges_[dim] = std::move(new_edges);
  counts_ = std::move(out);
}

void Histogram::AddData(const std::vector<std::vector<double>>& samples, double dx,
                        const std::vector<double>& weights) {
  AddData(samples, std::vector<double>(Dim(), dx), weights);
}

void Histogram::AddData(const std::vector<std::vector<double>>& samples,
                        const std::vector<double>& dx,
                        const std::vector<double>& weights) {
  const std::size_t D = Dim();
  if (dx.size() != D) {
    throw DimensionMismatch("Histogram::AddData: " + std::to_string(dx.size()) +
                            " bin widths given for " + std::to_string(D) + " dimensions");
  }
  for (double w : dx) {
    if (!(w > 0.0) || !std::isfinite(w))
      throw std::invalid_argument("Histogram::AddData: bin widths must be finite and > 0");
  }
  if (!weights.empty() && weights.size() != samples.size()) {
    throw DimensionMismatch("Histogram::AddData: " + std::to_string(weights.size()) +
                            " weights given for " + std::to_string(samples.size()) + " samples");
  }
  for (std::size_t n = 0; n < samples.size(); ++n) {
    if (samples[n].size() != D) {
      throw DimensionMismatch("Histogram::AddData: sample " + std::to_string(n) + " has " +
                              std::to_string(samples[n].size()) + " values, histogram has " +
                              std::to_string(D) + " dimensions");
    }
    for (double x : samples[n]) {
      if (std::isnan(x))
        throw std::invalid_argument("Histogram::AddData: sample " + std::to_string(n) + " is NaN");
    }
  }
  for (double w : weights) {
    if (!(w >= 0.0) || !std::isfinite(w))
      throw std::invalid_argument("Histogram::AddData: weights must be finite and >= 0");
  }
  if (samples.empty()) return;

  // grow the finite range of each dimension to cover the new samples;
  // nothing is applied until every dimension has been validated
  struct AxisGrowth {
    std::size_t dim;
    std::vector<double> edges;
    std::size_t shift;
  };
  std::vector<AxisGrowth> growth;
  for (std::size_t d = 0; d < D; ++d) {
    double lo = kInf, hi = -kInf;
    bool any_infinite = false;
    for (const auto& row : samples) {
      const double x = row[d];
      if (std::isfinite(x)) {
        lo = std::min(lo, x);
        hi = std::max(hi, x);
      } else {
        any_infinite = true;
      }
    }

    const double step = dx[d];
    const auto& old = edges_[d];

    if (old.size() == 2) {
      if (lo > hi) {
        // only infinite samples: split the axis at zero so they have a side
        if (any_infinite) growth.push_back({d, {-kInf, 0.0, kInf}, 0});
        continue;
      }
      check_resolution(lo, step);
      check_resolution(hi, step);
      const double imin = std::floor(lo / step);
      const double imax = std::floor(hi / step);
      if (imax - imin > kMaxNewBins)
        throw std::invalid_argument("Histogram::AddData: bin width too small for data range");

      const auto n = static_cast<std::int64_t>(imax - imin) + 2;
      std::vector<double> e{-kInf};
      e.reserve(static_cast<std::size_t>(n) + 4);
      for (std::int64_t k = 0; k < n; ++k) {
        const double x = (imin + static_cast<double>(k)) * step;
        if (e.size() > 1) check_increasing(e.back(), x);
        e.push_back(x);
      }
      // floor() rounding can leave the extreme samples just outside
      while (e[1] > lo) {
        const double x = e[1] - step;
        check_increasing(x, e[1]);
        e.insert(e.begin() + 1, x);
      }
      while (e.back() <= hi) {
        const double x = e.back() + step;
        check_increasing(e.back(), x);
        e.push_back(x);
      }
      e.push_back(kInf);
      growth.push_back({d, std::move(e), 0});
      continue;
    }

    if (lo > hi) continue;

    const double e_lo = old[1];
    const double e_hi = old[old.size() - 2];
    if ((e_lo - lo) / step > kMaxNewBins || (hi - e_hi) / step > kMaxNewBins)
      throw std::invalid_argument("Histogram::AddData: bin width too small for data range");

    std::vector<double> low, high;
    if (lo < e_lo) {
      check_resolution(lo, step);
      check_resolution(e_lo, step);
      for (std::int64_t k = 1; e_lo - static_cast<double>(k - 1) * step > lo; ++k) {
        const double x = e_lo - static_cast<double>(k) * step;
        check_increasing(x, low.empty() ? e_lo : low.back());
        low.push_back(x);
      }
    }
    if (hi >= e_hi) {
      check_resolution(hi, step);
      check_resolution(e_hi, step);
      for (std::int64_t k = 1; e_hi + static_cast<double>(k - 1) * step <= hi; ++k) {
        const double x = e_hi + static_cast<double>(k) * step;
        check_increasing(high.empty() ? e_hi : high.back(), x);
        high.push_back(x);
      }
    }
    if (low.empty() && high.empty()) continue;

    std::vector<double> e;
    e.reserve(old.size() + low.size() + high.size());
    e.push_back(-kInf);
    e.insert(e.end(), low.rbegin(), low.rend());
    e.insert(e.end(), old.begin() + 1, old.end() - 1);
    e.insert(e.end(), high.begin(), high.end());
    e.push_back(kInf);
    growth.push_back({d, std::move(e), low.size()});
  }
  const bool has_counts =
      std::any_of(counts_.begin(), counts_.end(), [](double c) { return c != 0.0; });
  for (const auto& g : growth) {
    if (has_counts && edges_[g.dim].size() == 2)
      throw std::invalid_argument("Histogram: cannot split non-zero counts of unbinned dimension " +
                                  std::to_string(g.dim));
  }
  for (auto& g : growth) extend_axis_(g.dim, std::move(g.edges), g.shift);

  // accumulate
  std::vector<std::size_t> idx(D);
  for (std::size_t n = 0; n < samples.size(); ++n) {
    for (std::size_t d = 0; d < D; ++d) idx[d] = find_bin_(d, samples[n][d]);
    counts_[FlatIndex(idx)] += weights.empty() ? 1.0 : weights[n];
  }
}

std::vector<double> Histogram::Bins(std::size_t dim, BinQuantity what) const {
  check_dim_(dim, "Histogram::Bins");
  const auto& e = edges_[dim];
  const std::size_t nb = e.size() - 1;

  std::vector<double> out(nb);
  for (std::size_t i = 0; i < nb; ++i) {
    const double lower = e[i];
    const double upper = e[i + 1];
    switch (what) {
      case BinQuantity::Lower: out[i] = lower; break;
      case BinQuantity::Upper: out[i] = upper; break;
      case BinQuantity::Width: out[i] = upper - lower; break;
      case BinQuantity::Centre:
        if (nb == 1)          out[i] = kNaN;
        else if (i == 0)      out[i] = -kInf;
        else if (i == nb - 1) out[i] = kInf;
        else                  out[i] = 0.5 * (lower + upper);
        break;
    }
  }
  return out;
}

std::vector<double> Histogram::Probabilities() const {
  const double total = TotalCount();
  std::vector<double> p(counts_.size(), 0.0);
  if (total > 0.0) {
    for (std::size_t i = 0; i < counts_.size(); ++i) p[i] = counts_[i] / total;
  }
  return p;
}

std::pair<double, double> Histogram::Range(std::size_t dim) const {
  check_dim_(dim, "Histogram::Range");
  const auto& e = edges_[dim];
  if (e.size() < 3) return {kNaN, kNaN};
  return {e[1], e[e.size() - 2]};
}

Histogram CreateHist(const std::vector<std::vector<double>>& samples, double dx,
                     const std::vector<double>& weights) {
  if (samples.empty()) throw std::invalid_argument("CreateHist: no samples");
  Histogram h(samples.front().size());
  h.AddData(samples, dx, weights);
  return h;
}

Histogram CreateDeltaHist(double x) {
  if (!std::isfinite(x)) throw std::invalid_argument("CreateDeltaHist: value must be finite");
  const double w = 1e-9 * std::max(std::abs(x), 1.0);
  double lo = x - 0.5 * w;
  double hi = x + 0.5 * w;
  if (x >= 0.0 && lo < 0.0) {
    lo = 0.0;
    hi = w;
  }
  return Histogram({{-kInf, lo, hi, kInf}}, {0.0, 1.0, 0.0});
}

} // namespace cwsens
