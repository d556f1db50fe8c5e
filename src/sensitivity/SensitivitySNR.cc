#include "cwsens/sensitivity/SensitivitySNR.hh"
#include "cwsens/core/Broadcast.hh"
#include "cwsens/stats/StatisticFactory.hh"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace cwsens {

SensitivityResult SensitivitySNR(const std::vector<double>& pd,
                                 const std::vector<double>& Ns,
                                 const GeometricFactor& Rsqr,
                                 const stats::StatisticsConfig& stat,
                                 const SolverOptions& opts) {
  const std::string where = "SensitivitySNR";
  const std::size_t n = BroadcastLength({{"pd", pd.size()},
                                         {"Ns", Ns.size()},
                                         {"sa", stat.sa.size()},
                                         {"avg2Fth", stat.avg2Fth.size()},
                                         {"paNt", stat.paNt.size()},
                                         {"nth", stat.nth.size()}}, where);
  const auto pd_b = Broadcast(pd, n, "pd", where);
  const auto Ns_b = Broadcast(Ns, n, "Ns", where);

  const auto fdp = stats::MakeFalseDismissalProbability(stat, Ns_b);
  return SensitivitySolver(opts).Solve(pd_b, Ns_b, Rsqr, *fdp);
}

SensitivityDepthResult SensitivityDepthStackSlide(const StackSlideDepthConfig& cfg,
                                                  const GeometricFactor& Rsqr,
                                                  const SolverOptions& opts) {
  if (!(cfg.Tdata_s > 0.0) || !std::isfinite(cfg.Tdata_s))
    throw std::invalid_argument("SensitivityDepthStackSlide: Tdata must be > 0");
  if (cfg.pFA.empty() == cfg.avg2Fth.empty())
    throw std::invalid_argument("SensitivityDepthStackSlide: need exactly one of pFA, avg2Fth");

  stats::StatisticsConfig stat;
  stat.family  = "ChiSqr";
  stat.dof     = 4.0;
  stat.paNt    = cfg.pFA;
  stat.avg2Fth = cfg.avg2Fth;

  const std::size_t n = BroadcastLength({{"Nseg", cfg.Nseg.size()},
                                         {"pFD", cfg.pFD.size()},
                                         {"pFA", cfg.pFA.size()},
                                         {"avg2Fth", cfg.avg2Fth.size()}},
                                        "SensitivityDepthStackSlide");
  const auto Nseg = Broadcast(cfg.Nseg, n, "Nseg", "SensitivityDepthStackSlide");

  SensitivityDepthResult out;
  auto snr = SensitivitySNR(cfg.pFD, Nseg, Rsqr, stat, opts);

  out.depth.resize(n);
  for (std::size_t r = 0; r < n; ++r) {
    const double rho_sc = std::sqrt(Nseg[r]) * snr.rho[r];
    out.depth[r] = 2.0 / 5.0 * std::sqrt(cfg.Tdata_s) / rho_sc;
  }
  out.rho = std::move(snr.rho);
  out.pd_rho = std::move(snr.pd_rho);
  return out;
}

} // namespace cwsens
