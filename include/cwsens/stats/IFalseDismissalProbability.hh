#pragma once

#include <cstddef>
#include <vector>

namespace cwsens::stats {

/**
 * Abstract interface for detection-statistic false-dismissal probabilities.
 *
 * Works on parallel arrays, one entry per evaluation:
 *  - rows[i]   : problem row the entry belongs to (selects per-row
 *                family parameters such as thresholds)
 *  - pd[i]     : target false-dismissal probability of that row
 *  - Ns[i]     : number of segments
 *  - rhosqr[i] : non-centrality (squared SNR per segment, already weighted
 *                by the geometric factor)
 *
 * Returns the achieved false-dismissal probability of each entry.
 * Implementations must be monotonically decreasing in rhosqr for fixed row;
 * the sensitivity root-finder relies on it.
 */
class IFalseDismissalProbability {
public:
  virtual ~IFalseDismissalProbability() = default;

  virtual std::vector<double> Evaluate(const std::vector<std::size_t>& rows,
                                       const std::vector<double>& pd,
                                       const std::vector<double>& Ns,
                                       const std::vector<double>& rhosqr) const = 0;

  /// Number of problem rows this instance holds parameters for.
  virtual std::size_t NumRows() const = 0;
};

} // namespace cwsens::stats
