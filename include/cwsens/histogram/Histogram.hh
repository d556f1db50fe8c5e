#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace cwsens {

/// Per-bin quantity returned by Histogram::Bins()
enum class BinQuantity { Centre, Width, Lower, Upper };

/**
 * Weighted histogram over a runtime number of dimensions.
 *
 * Each dimension d has an ordered edge vector edges[d], always bracketed by
 * -inf and +inf, so there are edges[d].size()-1 bins along d: the finite bins
 * plus the two infinite-width sentinel bins holding mass outside the finite
 * range. Bins are half-open, [lower, upper).
 *
 * Counts are stored row-major (last dimension fastest) with one entry per
 * hyper-bin. A fresh axis has the trivial binning {-inf, +inf}, i.e. a single
 * unsplit bin.
 */
class Histogram {
public:
  explicit Histogram(std::size_t dimensions);

  /// Build from explicit edges (sentinels included) and row-major counts.
  Histogram(std::vector<std::vector<double>> edges, std::vector<double> counts);

  /// Add N samples (one row of Dim() values each), growing the finite range
  /// of every dimension in steps of dx. Each sample contributes its weight
  /// (1 if weights is empty).
  void AddData(const std::vector<std::vector<double>>& samples, double dx,
               const std::vector<double>& weights = {});
  void AddData(const std::vector<std::vector<double>>& samples,
               const std::vector<double>& dx,
               const std::vector<double>& weights = {});

  std::size_t Dim() const noexcept { return edges_.size(); }
  const std::vector<double>& Edges(std::size_t dim) const;
  std::size_t NumBins(std::size_t dim) const;
  std::vector<std::size_t> Shape() const;

  /// True if dimension dim has at least one finite-width bin.
  bool HasFiniteBins(std::size_t dim) const;

  const std::vector<double>& Counts() const noexcept { return counts_; }
  double Count(const std::vector<std::size_t>& index) const;
  std::size_t FlatIndex(const std::vector<std::size_t>& index) const;
  double TotalCount() const;

  /// One value per bin along dim, sentinel bins included.
  /// Sentinel bins report centre -inf/+inf and width +inf.
  std::vector<double> Bins(std::size_t dim, BinQuantity what) const;

  /// counts / total count (all zero for an empty histogram).
  std::vector<double> Probabilities() const;

  /// (min, max) of the finite edges of dim; NaN if there are none.
  std::pair<double, double> Range(std::size_t dim) const;

private:
  void check_dim_(std::size_t dim, const char* where) const;
  std::size_t find_bin_(std::size_t dim, double x) const;

  // Replace edges of dim by new_edges, which must contain the old edges with
  // n_low new bins inserted after the -inf bin; counts are remapped and the
  // inserted bins start at zero.
  void extend_axis_(std::size_t dim, std::vector<double> new_edges, std::size_t n_low);

  std::vector<std::vector<double>> edges_;
  std::vector<double>              counts_;
};

/// New histogram of width samples[0].size() holding samples.
Histogram CreateHist(const std::vector<std::vector<double>>& samples, double dx,
                     const std::vector<double>& weights = {});

/// 1-D histogram with a single narrow finite bin centred on x and unit weight.
Histogram CreateDeltaHist(double x);

} // namespace cwsens
