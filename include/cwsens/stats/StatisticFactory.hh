#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cwsens/stats/IFalseDismissalProbability.hh"
#include "cwsens/stats/StatisticsConfig.hh"

namespace cwsens::stats {

/// Resolve a family name (case-insensitive) to a StatisticFamily.
/// Throws UnknownStatisticFamily for anything else.
StatisticFamily ParseStatisticFamily(const std::string& name);

std::string ToString(StatisticFamily family);

/**
 * Create the false-dismissal probability implementation selected by
 * cfg.family, with per-row parameters broadcast to Ns.size() rows.
 *
 *   "ChiSqr"     -> ChiSqrFDP      (sa, avg2Fth or paNt)
 *   "HoughFstat" -> HoughFstatFDP  (nth or paNt)
 */
std::unique_ptr<IFalseDismissalProbability>
MakeFalseDismissalProbability(const StatisticsConfig& cfg, const std::vector<double>& Ns);

} // namespace cwsens::stats
