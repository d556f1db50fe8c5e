#include "cwsens/histogram/HistogramResampler.hh"
#include "cwsens/core/Errors.hh"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cwsens {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

// Snap each new edge lying within tol of an old edge onto that old edge,
// so that edge sets rebuilt with floating point noise still compare equal.
void snap_edges(std::vector<double>& new_edges, const std::vector<double>& old, double tol) {
  for (double& e : new_edges) {
    const auto it = std::lower_bound(old.begin(), old.end(), e);
    if (it != old.end() && std::abs(*it - e) <= tol) {
      e = *it;
    } else if (it != old.begin() && std::abs(*(it - 1) - e) <= tol) {
      e = *(it - 1);
    }
  }
  new_edges.erase(std::unique(new_edges.begin(), new_edges.end()), new_edges.end());
}

// Position of edge x within the old finite bins: bin index and the fraction
// of that bin lying below x. Edges below/above the old range report the
// first/last bin with fraction 0/1.
struct EdgePosition {
  std::size_t bin = 0;
  double      frac = 0.0;
};

EdgePosition locate(const std::vector<double>& old, double x) {
  const std::size_t m = old.size() - 1;
  if (x <= old.front()) return {0, 0.0};
  if (x >= old.back())  return {m - 1, 1.0};
  const auto it = std::upper_bound(old.begin(), old.end(), x);
  const std::size_t b = static_cast<std::size_t>(it - old.begin()) - 1;
  const double f = (x - old[b]) / (old[b + 1] - old[b]);
  return {b, std::clamp(f, 0.0, 1.0)};
}

} // namespace

Histogram HistogramResampler::Resample(const Histogram& h, std::size_t dim,
                                       std::vector<double> new_edges) {
  if (dim >= h.Dim()) {
    throw std::out_of_range("HistogramResampler::Resample: dimension " + std::to_string(dim) +
                            " out of range for " + std::to_string(h.Dim()) + "-D histogram");
  }

  new_edges.erase(std::remove_if(new_edges.begin(), new_edges.end(),
                                 [](double x) { return !std::isfinite(x); }),
                  new_edges.end());
  std::sort(new_edges.begin(), new_edges.end());
  if (new_edges.size() < 2)
    throw std::invalid_argument("HistogramResampler::Resample: need at least two finite edges");
  if (std::adjacent_find(new_edges.begin(), new_edges.end()) != new_edges.end())
    throw std::invalid_argument("HistogramResampler::Resample: duplicate bin edges");

  const auto& old_all = h.Edges(dim);
  const std::vector<double> old(old_all.begin() + 1, old_all.end() - 1);

  const auto shape = h.Shape();
  std::size_t outer = 1, inner = 1;
  for (std::size_t d = 0; d < dim; ++d) outer *= shape[d];
  for (std::size_t d = dim + 1; d < h.Dim(); ++d) inner *= shape[d];
  const std::size_t n_old = shape[dim];
  const auto& counts = h.Counts();

  std::vector<std::vector<double>> edges(h.Dim());
  for (std::size_t d = 0; d < h.Dim(); ++d) edges[d] = h.Edges(d);

  auto at_old = [&](std::size_t o, std::size_t i, std::size_t k) {
    return counts[(o * n_old + i) * inner + k];
  };

  // no finite bins: adopt the new edges as they are
  if (old.size() < 2) {
    if (n_old == 1 && h.TotalCount() != 0.0) {
      throw std::invalid_argument("HistogramResampler::Resample: dimension " + std::to_string(dim) +
                                  " is unbinned but holds non-zero counts");
    }
    const std::size_t n_new = new_edges.size() + 1;
    std::vector<double> out(outer * n_new * inner, 0.0);
    if (n_old == 2) {
      for (std::size_t o = 0; o < outer; ++o) {
        for (std::size_t k = 0; k < inner; ++k) {
          out[(o * n_new) * inner + k]             = at_old(o, 0, k);
          out[(o * n_new + n_new - 1) * inner + k] = at_old(o, 1, k);
        }
      }
    }
    edges[dim] = {-kInf};
    edges[dim].insert(edges[dim].end(), new_edges.begin(), new_edges.end());
    edges[dim].push_back(kInf);
    return Histogram(std::move(edges), std::move(out));
  }

  double min_width = kInf;
  for (std::size_t i = 0; i + 1 < old.size(); ++i) min_width = std::min(min_width, old[i + 1] - old[i]);
  snap_edges(new_edges, old, kSnapTolerance * min_width);

  if (!(new_edges.front() <= old.front()) || !(new_edges.back() >= old.back())) {
    std::ostringstream msg;
    msg << "HistogramResampler::Resample: range of new bins (" << new_edges.front() << " to "
        << new_edges.back() << ") does not include old bins (" << old.front() << " to "
        << old.back() << ") in dimension " << dim;
    throw RangeCoverageError(msg.str());
  }

  const std::size_t n_new = new_edges.size() + 1;
  std::vector<double> out(outer * n_new * inner, 0.0);
  auto out_at = [&](std::size_t o, std::size_t j, std::size_t k) -> double& {
    return out[(o * n_new + j) * inner + k];
  };

  // carry the infinite bins over unchanged
  for (std::size_t o = 0; o < outer; ++o) {
    for (std::size_t k = 0; k < inner; ++k) {
      out_at(o, 0, k)         = at_old(o, 0, k);
      out_at(o, n_new - 1, k) = at_old(o, n_old - 1, k);
    }
  }

  const auto first_in = std::lower_bound(new_edges.begin(), new_edges.end(), old.front());
  const auto last_in  = std::upper_bound(new_edges.begin(), new_edges.end(), old.back());
  const bool superset = static_cast<std::size_t>(last_in - first_in) == old.size() &&
                        std::equal(first_in, last_in, old.begin());

  if (superset) {
    // exact: shift old finite bins past the new empty low bins
    const std::size_t nloz = static_cast<std::size_t>(first_in - new_edges.begin());
    for (std::size_t o = 0; o < outer; ++o)
      for (std::size_t i = 1; i + 1 < n_old; ++i)
        for (std::size_t k = 0; k < inner; ++k)
          out_at(o, i + nloz, k) = at_old(o, i, k);
  } else {
    std::vector<EdgePosition> pos(new_edges.size());
    for (std::size_t j = 0; j < new_edges.size(); ++j) pos[j] = locate(old, new_edges[j]);

    const std::size_t m = old.size() - 1;
    std::vector<double> cum_old(m + 1);
    std::vector<double> cum_new(new_edges.size());
    for (std::size_t o = 0; o < outer; ++o) {
      for (std::size_t k = 0; k < inner; ++k) {
        // cumulative mass at the old finite edges
        cum_old[0] = 0.0;
        for (std::size_t i = 0; i < m; ++i) cum_old[i + 1] = cum_old[i] + at_old(o, i + 1, k);

        // interpolate it at the new edges, uniform density within old bins
        for (std::size_t j = 0; j < new_edges.size(); ++j) {
          const auto& p = pos[j];
          cum_new[j] = cum_old[p.bin] + p.frac * at_old(o, p.bin + 1, k);
        }
        for (std::size_t j = 0; j + 1 < new_edges.size(); ++j)
          out_at(o, j + 1, k) = std::max(0.0, cum_new[j + 1] - cum_new[j]);
      }
    }
  }

  edges[dim] = {-kInf};
  edges[dim].insert(edges[dim].end(), new_edges.begin(), new_edges.end());
  edges[dim].push_back(kInf);
  return Histogram(std::move(edges), std::move(out));
}

Histogram HistogramResampler::Resample(const Histogram& h,
                                       const std::vector<std::vector<double>>& new_edges) {
  if (new_edges.size() != h.Dim()) {
    throw DimensionMismatch("HistogramResampler::Resample: " + std::to_string(new_edges.size()) +
                            " edge vectors given for " + std::to_string(h.Dim()) + " dimensions");
  }
  Histogram out = h;
  for (std::size_t d = 0; d < new_edges.size(); ++d) out = Resample(out, d, new_edges[d]);
  return out;
}

} // namespace cwsens
