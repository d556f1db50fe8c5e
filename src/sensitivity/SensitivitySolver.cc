#include "cwsens/sensitivity/SensitivitySolver.hh"
#include "cwsens/core/Broadcast.hh"
#include "cwsens/core/Errors.hh"

#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace cwsens {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Batched evaluation of the R^2-averaged false-dismissal probability for the
// given rows at their current rhosqr.
class AveragedFDP {
public:
  AveragedFDP(const stats::IFalseDismissalProbability& fdp, const GeometricFactor& Rsqr,
              const std::vector<double>& pd, const std::vector<double>& Ns)
  : fdp_(fdp), Rsqr_(Rsqr), pd_(pd), Ns_(Ns) {}

  std::vector<double> operator()(const std::vector<std::size_t>& rows,
                                 const std::vector<double>& rhosqr) const {
    const std::size_t m = Rsqr_.size();
    const auto& x = Rsqr_.nodes();
    const auto& w = Rsqr_.weights();

    std::vector<std::size_t> f_rows;
    std::vector<double> f_pd, f_Ns, f_rhosqr;
    f_rows.reserve(rows.size() * m);
    f_pd.reserve(rows.size() * m);
    f_Ns.reserve(rows.size() * m);
    f_rhosqr.reserve(rows.size() * m);
    for (std::size_t r : rows) {
      const std::size_t fr = (fdp_.NumRows() == 1) ? 0 : r;
      for (std::size_t j = 0; j < m; ++j) {
        f_rows.push_back(fr);
        f_pd.push_back(pd_[r]);
        f_Ns.push_back(Ns_[r]);
        f_rhosqr.push_back(rhosqr[r] * x[j]);
      }
    }

    const auto f = fdp_.Evaluate(f_rows, f_pd, f_Ns, f_rhosqr);
    if (f.size() != f_rows.size())
      throw DimensionMismatch("SensitivitySolver: false-dismissal function returned wrong size");

    std::vector<double> out(rows.size(), 0.0);
    for (std::size_t k = 0; k < rows.size(); ++k) {
      for (std::size_t j = 0; j < m; ++j) out[k] += f[k * m + j] * w[j];
      if (!std::isfinite(out[k])) {
        std::ostringstream msg;
        msg << "SensitivitySolver: non-finite false-dismissal probability for row " << rows[k]
            << " at rhosqr=" << rhosqr[rows[k]];
        throw std::runtime_error(msg.str());
      }
    }
    return out;
  }

private:
  const stats::IFalseDismissalProbability& fdp_;
  const GeometricFactor& Rsqr_;
  const std::vector<double>& pd_;
  const std::vector<double>& Ns_;
};

std::string convergence_message(const char* stage, int iterations, std::size_t active,
                                 std::size_t row, double lo, double hi) {
  std::ostringstream msg;
  msg << "SensitivitySolver: " << stage << " did not converge after " << iterations
      << " iterations (" << active << " rows left; row " << row << " bracket [" << lo << ", "
      << hi << "])";
  return msg.str();
}

} // namespace

SensitivitySolver::SensitivitySolver(SolverOptions opts) : opts_(std::move(opts))
{
  if (opts_.max_iterations <= 0)
    throw std::invalid_argument("SensitivitySolver: max_iterations must be > 0");
  if (!(opts_.pd_tolerance > 0.0) || !(opts_.bracket_tolerance > 0.0))
    throw std::invalid_argument("SensitivitySolver: tolerances must be > 0");
}

void SensitivitySolver::report_(const SolverProgress& p) const {
  if (!opts_.progress) return;
  try {
    opts_.progress(p);
  } catch (const std::exception& e) {
    std::cerr << "[sensitivity] WARNING: progress callback failed: " << e.what() << "\n";
  } catch (...) {
    std::cerr << "[sensitivity] WARNING: progress callback failed\n";
  }
}

SensitivityResult SensitivitySolver::Solve(const std::vector<double>& pd_in,
                                           const std::vector<double>& Ns_in,
                                           const GeometricFactor& Rsqr,
                                           const stats::IFalseDismissalProbability& fdp) const {
  const std::string where = "SensitivitySolver::Solve";
  if (pd_in.empty() || Ns_in.empty()) throw std::invalid_argument(where + ": no rows");
  if (Rsqr.size() == 0) throw std::invalid_argument(where + ": empty geometric factor");

  const std::size_t n = BroadcastLength({{"pd", pd_in.size()},
                                         {"Ns", Ns_in.size()},
                                         {"fdp", fdp.NumRows()}}, where);
  const auto pd = Broadcast(pd_in, n, "pd", where);
  const auto Ns = Broadcast(Ns_in, n, "Ns", where);
  for (std::size_t r = 0; r < n; ++r) {
    if (!(pd[r] > 0.0 && pd[r] < 1.0))
      throw std::invalid_argument(where + ": pd must be in (0,1) (row " + std::to_string(r) + ")");
    if (!(Ns[r] > 0.0) || !std::isfinite(Ns[r]))
      throw std::invalid_argument(where + ": Ns must be > 0 (row " + std::to_string(r) + ")");
  }

  const AveragedFDP fdp_avg(fdp, Rsqr, pd, Ns);

  std::vector<double> rhosqr(n, kNaN), pd_rho(n, kNaN);
  std::vector<double> rhosqr_min(n, 0.0), rhosqr_max(n, 1.0);
  std::vector<double> pd_rho_min(n, 0.0), pd_rho_max(n, 0.0);

  std::vector<std::size_t> all(n);
  for (std::size_t r = 0; r < n; ++r) all[r] = r;

  // rows already below the target at zero SNR are left undefined
  {
    const auto f0 = fdp_avg(all, rhosqr_min);
    for (std::size_t r = 0; r < n; ++r) pd_rho_min[r] = f0[r];
  }
  std::vector<std::size_t> active0;
  for (std::size_t r = 0; r < n; ++r) {
    if (pd_rho_min[r] >= pd[r]) active0.push_back(r);
  }
  report_({SolverProgress::Stage::Starting, active0.size(), n, 0});

  // bracket: double rhosqr_max until the target is passed
  std::vector<std::size_t> active = active0;
  for (int it = 0; !active.empty(); ++it) {
    if (it >= opts_.max_iterations) {
      const std::size_t r = active.front();
      throw ConvergenceFailure(convergence_message("bracketing", it, active.size(), r,
                                                   rhosqr_min[r], rhosqr_max[r]));
    }
    report_({SolverProgress::Stage::Bracketing, active.size(), n, it});

    for (std::size_t r : active) {
      rhosqr_max[r] *= 2.0;
      if (!std::isfinite(rhosqr_max[r])) {
        throw ConvergenceFailure(convergence_message("bracketing", it, active.size(), r,
                                                     rhosqr_min[r], rhosqr_max[r]));
      }
    }
    const auto f = fdp_avg(active, rhosqr_max);

    std::vector<std::size_t> next;
    for (std::size_t k = 0; k < active.size(); ++k) {
      const std::size_t r = active[k];
      pd_rho_max[r] = f[k];
      if (pd_rho_max[r] >= pd[r]) next.push_back(r);
    }
    active.swap(next);
  }

  // randomized bisection within [rhosqr_min, rhosqr_max]
  std::mt19937_64 rng(opts_.rng_seed);
  std::uniform_real_distribution<double> uni(0.0, 1.0);
  std::vector<double> u(n);

  active = active0;
  for (int it = 0; !active.empty(); ++it) {
    if (it >= opts_.max_iterations) {
      const std::size_t r = active.front();
      throw ConvergenceFailure(convergence_message("bisection search", it, active.size(), r,
                                                   rhosqr_min[r], rhosqr_max[r]));
    }
    report_({SolverProgress::Stage::Bisection, active.size(), n, it});

    for (auto& x : u) x = uni(rng);
    for (std::size_t r : active) rhosqr[r] = rhosqr_min[r] * u[r] + rhosqr_max[r] * (1.0 - u[r]);

    const auto f = fdp_avg(active, rhosqr);

    std::vector<std::size_t> next;
    for (std::size_t k = 0; k < active.size(); ++k) {
      const std::size_t r = active[k];
      pd_rho[r] = f[k];

      if (pd_rho[r] > pd[r]) {
        rhosqr_min[r] = rhosqr[r];
        pd_rho_min[r] = pd_rho[r];
      } else if (pd_rho[r] < pd[r]) {
        rhosqr_max[r] = rhosqr[r];
        pd_rho_max[r] = pd_rho[r];
      } else {
        rhosqr_min[r] = rhosqr_max[r] = rhosqr[r];
        pd_rho_min[r] = pd_rho_max[r] = pd_rho[r];
      }

      const double err_pd = std::abs(pd_rho[r] - pd[r]) / pd[r];
      const double err_bracket = (rhosqr_max[r] - rhosqr_min[r]) / rhosqr[r];
      const bool converged = err_pd < opts_.pd_tolerance && err_bracket < opts_.bracket_tolerance;
      if (!converged) next.push_back(r);
    }
    active.swap(next);
  }
  report_({SolverProgress::Stage::Done, 0, n, 0});

  SensitivityResult res;
  res.rho.resize(n);
  for (std::size_t r = 0; r < n; ++r) res.rho[r] = std::sqrt(rhosqr[r]);
  res.pd_rho = std::move(pd_rho);
  return res;
}

ProgressCallback MakeConsoleProgress(const std::string& tag) {
  std::size_t last = std::numeric_limits<std::size_t>::max();
  SolverProgress::Stage last_stage = SolverProgress::Stage::Starting;
  return [tag, last, last_stage](const SolverProgress& p) mutable {
    const bool changed = (p.active != last || p.stage != last_stage);
    last = p.active;
    last_stage = p.stage;
    if (!changed) return;

    switch (p.stage) {
      case SolverProgress::Stage::Starting:
        std::cout << "[" << tag << "] starting (" << p.rows << " rows, " << p.active << " to solve)\n";
        break;
      case SolverProgress::Stage::Bracketing:
        std::cout << "[" << tag << "] finding rhosqr_max (" << p.active << " left)\n";
        break;
      case SolverProgress::Stage::Bisection:
        std::cout << "[" << tag << "] bisection search (" << p.active << " left)\n";
        break;
      case SolverProgress::Stage::Done:
        std::cout << "[" << tag << "] done\n";
        break;
    }
  };
}

} // namespace cwsens
