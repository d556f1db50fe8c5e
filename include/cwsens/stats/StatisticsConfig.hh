#pragma once

#include <string>
#include <vector>

namespace cwsens::stats {

/// Closed set of detection-statistic families.
enum class StatisticFamily {
  ChiSqr,     ///< semicoherent sum of chi^2 statistics, e.g. the F-statistic
  HoughFstat  ///< Hough number count on per-segment F-statistic thresholds
};

/**
 * Configuration of the detection statistic, derived from the JSON
 * "statistic" block. Per-row vectors may have length 1 (broadcast).
 */
struct StatisticsConfig {
  std::string family    = "ChiSqr";
  int         verbosity = 0;        ///< 0=silent, 1=summary, 2+=debug

  // "ChiSqr": exactly one of sa / avg2Fth / paNt
  double              dof  = 4.0;   ///< degrees of freedom per segment
  bool                norm = false; ///< Gaussian approximation of chi^2
  std::vector<double> sa;           ///< threshold on the summed statistic
  std::vector<double> avg2Fth;      ///< threshold on the per-segment average
  std::vector<double> paNt;         ///< false-alarm probability per template

  // "HoughFstat": paNt or nth
  double              Fth = 2.6;    ///< per-segment F-statistic threshold
  std::vector<double> nth;          ///< number-count threshold
};

} // namespace cwsens::stats
