#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "cwsens/sensitivity/GeometricFactor.hh"
#include "cwsens/stats/IFalseDismissalProbability.hh"

namespace cwsens {

/// Snapshot passed to the progress callback once per search round.
struct SolverProgress {
  enum class Stage { Starting, Bracketing, Bisection, Done };

  Stage       stage = Stage::Starting;
  std::size_t active = 0;     ///< rows still being searched
  std::size_t rows = 0;       ///< total rows
  int         iteration = 0;  ///< round within the current stage
};

using ProgressCallback = std::function<void(const SolverProgress&)>;

struct SolverOptions {
  std::uint64_t rng_seed          = 12345;
  int           max_iterations    = 10000;  ///< per stage
  double        pd_tolerance      = 1e-3;   ///< |pd_rho - pd| / pd
  double        bracket_tolerance = 1e-8;   ///< (rhosqr_max - rhosqr_min) / rhosqr
  ProgressCallback progress;                ///< optional, never affects the result
};

struct SensitivityResult {
  std::vector<double> rho;     ///< detectable r.m.s. SNR per segment
  std::vector<double> pd_rho;  ///< achieved false-dismissal probability
};

/**
 * Solves, row by row, for the squared SNR rhosqr at which the false-dismissal
 * probability averaged over the geometric factor R^2,
 *   pd_rho(rhosqr) = sum_j w_j FDP(pd, Ns, rhosqr * R^2_j),
 * equals the target pd.
 *
 * All rows are searched together, one batched FDP call per round:
 *  1. rows with pd_rho(0) < pd already meet the target and are returned as NaN;
 *  2. rhosqr_max is doubled from 1 until pd_rho(rhosqr_max) < pd;
 *  3. the bracket is narrowed at uniformly random interior points (one shared
 *     draw vector per round) until both the relative pd error and the relative
 *     bracket width are below tolerance.
 *
 * Requires the FDP to decrease monotonically in rhosqr. Exceeding
 * max_iterations in either stage throws ConvergenceFailure.
 */
class SensitivitySolver {
public:
  explicit SensitivitySolver(SolverOptions opts = {});

  /// pd and Ns have one entry per row, or a single entry broadcast to all rows.
  SensitivityResult Solve(const std::vector<double>& pd,
                          const std::vector<double>& Ns,
                          const GeometricFactor& Rsqr,
                          const stats::IFalseDismissalProbability& fdp) const;

  const SolverOptions& options() const noexcept { return opts_; }

private:
  void report_(const SolverProgress& p) const;

  SolverOptions opts_;
};

/// Progress callback printing "[tag] ..." lines whenever the number of
/// active rows changes.
ProgressCallback MakeConsoleProgress(const std::string& tag);

} // namespace cwsens
