#pragma once

#include "cwsens/histogram/Histogram.hh"
#include "cwsens/io/ConfigManager.hh"
#include "cwsens/sensitivity/GeometricFactor.hh"

namespace cwsens {

/// Build the 1-D histogram described by a distribution block:
///   value/delta -> CreateDeltaHist(value)
///   root_file   -> ReadHistogram(root_file, hist)
///   samples_csv -> CreateHist(first column, bin_width)
Histogram LoadDistribution(const DistributionJSON& d);

/// Geometric factor from the "geometric_factor" block, folded with the
/// "mismatch" block when one is given.
GeometricFactor MakeGeometricFactor(const ConfigManager& cfg);

} // namespace cwsens
