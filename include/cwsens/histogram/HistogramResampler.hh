#pragma once

#include <cstddef>
#include <vector>

#include "cwsens/histogram/Histogram.hh"

namespace cwsens {

/**
 * Rebins a Histogram onto new bin edges, conserving probability mass.
 *
 * Resample(h, dim, new_edges):
 *  - non-finite entries of new_edges are dropped and the rest sorted;
 *  - if dim has no finite bins yet, the new edges are adopted (sentinel counts
 *    of an axis split at a single point are kept);
 *  - otherwise new_edges must cover the old finite range (RangeCoverageError);
 *  - an exact superset of the old finite edges keeps the old counts and pads
 *    with empty bins;
 *  - any other edge set redistributes each old bin's mass assuming uniform
 *    density within the bin, by interpolating the cumulative mass at every
 *    new edge and differencing;
 *  - the +/-inf bins are carried over untouched.
 */
class HistogramResampler {
public:
  static Histogram Resample(const Histogram& h, std::size_t dim, std::vector<double> new_edges);

  /// One new edge vector per dimension; same as resampling each dimension in turn.
  static Histogram Resample(const Histogram& h, const std::vector<std::vector<double>>& new_edges);

  /// Relative tolerance (in units of the smallest old bin width) within which
  /// a new edge is snapped onto an existing one.
  static constexpr double kSnapTolerance = 1e-8;
};

} // namespace cwsens
