#pragma once

#include <vector>

#include "cwsens/sensitivity/GeometricFactor.hh"
#include "cwsens/sensitivity/SensitivitySolver.hh"
#include "cwsens/stats/StatisticsConfig.hh"

namespace cwsens {

/**
 * Detectable r.m.s. SNR per segment for a detection statistic selected by
 * name. pd, Ns and the per-row statistic parameters are broadcast to a
 * common number of rows before solving.
 */
SensitivityResult SensitivitySNR(const std::vector<double>& pd,
                                 const std::vector<double>& Ns,
                                 const GeometricFactor& Rsqr,
                                 const stats::StatisticsConfig& stat,
                                 const SolverOptions& opts = {});

/// Inputs of the StackSlide sensitivity depth estimate.
struct StackSlideDepthConfig {
  std::vector<double> Nseg{1.0};    ///< number of segments
  double              Tdata_s = 0;  ///< total data time span in seconds (all SFTs)
  std::vector<double> pFD{0.1};     ///< false-dismissal probability
  std::vector<double> pFA;          ///< false-alarm probability per template, or
  std::vector<double> avg2Fth;      ///< average-2F threshold
};

/// Result of SensitivityDepthStackSlide: one entry per row.
struct SensitivityDepthResult {
  std::vector<double> depth;   ///< sqrt(S_data) / h0
  std::vector<double> rho;
  std::vector<double> pd_rho;
};

/**
 * StackSlide sensitivity depth, sqrt(Sdata)/h0, of a semicoherent
 * F-statistic search:
 *   depth = (2/5) sqrt(Tdata) / (sqrt(Nseg) rho)
 * where rho solves SensitivitySNR for the chi^2 statistic with 4 degrees of
 * freedom per segment.
 */
SensitivityDepthResult SensitivityDepthStackSlide(const StackSlideDepthConfig& cfg,
                                                  const GeometricFactor& Rsqr,
                                                  const SolverOptions& opts = {});

} // namespace cwsens
