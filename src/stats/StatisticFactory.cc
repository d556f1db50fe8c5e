#include "cwsens/stats/StatisticFactory.hh"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "cwsens/core/Broadcast.hh"
#include "cwsens/core/Errors.hh"
#include "cwsens/stats/ChiSqrFDP.hh"
#include "cwsens/stats/HoughFstatFDP.hh"

namespace cwsens::stats {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::unique_ptr<IFalseDismissalProbability>
make_chisqr(const StatisticsConfig& cfg, const std::vector<double>& Ns) {
  const char* where = "MakeFalseDismissalProbability(ChiSqr)";
  const int given = !cfg.sa.empty() + !cfg.avg2Fth.empty() + !cfg.paNt.empty();
  if (given != 1)
    throw std::invalid_argument(std::string(where) + ": need exactly one of sa, avg2Fth, paNt");

  const std::size_t n = Ns.size();
  std::vector<double> sa(n);
  if (!cfg.sa.empty()) {
    sa = Broadcast(cfg.sa, n, "sa", where);
  } else if (!cfg.avg2Fth.empty()) {
    const auto avg = Broadcast(cfg.avg2Fth, n, "avg2Fth", where);
    for (std::size_t i = 0; i < n; ++i) sa[i] = Ns[i] * avg[i];
  } else {
    const auto paNt = Broadcast(cfg.paNt, n, "paNt", where);
    for (std::size_t i = 0; i < n; ++i) sa[i] = ChiSqrFDP::ThresholdFromFalseAlarm(paNt[i], Ns[i], cfg.dof);
  }
  return std::make_unique<ChiSqrFDP>(std::move(sa), cfg.dof, cfg.norm);
}

std::unique_ptr<IFalseDismissalProbability>
make_hough(const StatisticsConfig& cfg, const std::vector<double>& Ns) {
  const char* where = "MakeFalseDismissalProbability(HoughFstat)";
  if (cfg.nth.empty() == cfg.paNt.empty())
    throw std::invalid_argument(std::string(where) + ": need exactly one of nth, paNt");

  const std::size_t n = Ns.size();
  std::vector<double> nth(n);
  if (!cfg.nth.empty()) {
    nth = Broadcast(cfg.nth, n, "nth", where);
  } else {
    const auto paNt = Broadcast(cfg.paNt, n, "paNt", where);
    for (std::size_t i = 0; i < n; ++i) nth[i] = HoughFstatFDP::ThresholdFromFalseAlarm(paNt[i], Ns[i], cfg.Fth);
  }
  return std::make_unique<HoughFstatFDP>(std::move(nth), cfg.Fth);
}

} // namespace

StatisticFamily ParseStatisticFamily(const std::string& name) {
  const std::string s = to_lower(name);
  if (s == "chisqr")     return StatisticFamily::ChiSqr;
  if (s == "houghfstat") return StatisticFamily::HoughFstat;
  throw UnknownStatisticFamily("unknown detection statistic family \"" + name +
                               "\" (expected ChiSqr or HoughFstat)");
}

std::string ToString(StatisticFamily family) {
  switch (family) {
    case StatisticFamily::ChiSqr:     return "ChiSqr";
    case StatisticFamily::HoughFstat: return "HoughFstat";
  }
  return "unknown";
}

std::unique_ptr<IFalseDismissalProbability>
MakeFalseDismissalProbability(const StatisticsConfig& cfg, const std::vector<double>& Ns) {
  if (Ns.empty()) throw std::invalid_argument("MakeFalseDismissalProbability: no rows");

  const StatisticFamily family = ParseStatisticFamily(cfg.family);
  if (cfg.verbosity > 0) {
    std::cout << "[stats] Using " << ToString(family) << " false-dismissal probability (\""
              << cfg.family << "\", " << Ns.size() << " rows)\n";
  }

  switch (family) {
    case StatisticFamily::ChiSqr:     return make_chisqr(cfg, Ns);
    case StatisticFamily::HoughFstat: return make_hough(cfg, Ns);
  }
  throw UnknownStatisticFamily("unhandled detection statistic family \"" + cfg.family + "\"");
}

} // namespace cwsens::stats
