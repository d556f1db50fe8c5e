#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "cwsens/sensitivity/SensitivitySolver.hh"
#include "cwsens/stats/StatisticsConfig.hh"

namespace cwsens {

struct RunHeader {
  std::string label;
  std::string outdir;
  uint64_t    rng_seed = 12345;
  int         verbosity = 1;
};

struct SolverJSON {
  int    max_iterations    = 10000;
  double pd_tolerance      = 1e-3;
  double bracket_tolerance = 1e-8;
};

struct SensitivityJSON {
  std::vector<double> pd{0.1};     // target false-dismissal probability per row
  std::vector<double> Ns{1.0};     // number of segments per row
  double              Tdata_s = 0.0; // only used for sensitivity depth
};

// Where a 1-D distribution (R^2 or mismatch) comes from
struct DistributionJSON {
  enum class Source { None, Value, Delta, RootFile, SamplesCSV };

  Source      source = Source::None;
  double      value = 0.0;       // "value" (scalar) or "delta"
  std::string root_file;         // "root_file" + "hist"
  std::string hist;
  std::string samples_csv;       // "samples_csv" + "bin_width"
  double      bin_width = 0.01;
};

class ConfigManager {
public:
  explicit ConfigManager(std::string path);
  void parse();

  /// Parse an already loaded JSON document (path is only used in messages).
  void parse(const nlohmann::json& j);

  const RunHeader&               run()         const noexcept { return run_; }
  const SolverJSON&              solver()      const noexcept { return solver_; }
  const stats::StatisticsConfig& statistic()   const noexcept { return stat_; }
  const SensitivityJSON&         sensitivity() const noexcept { return sens_; }
  const DistributionJSON&        geometric_factor() const noexcept { return rsqr_; }
  const DistributionJSON&        mismatch()    const noexcept { return mismatch_; }

  /// Solver options with the run seed; progress printing if verbosity > 0.
  SolverOptions solver_options() const;

private:
  std::string      path_;
  RunHeader        run_;
  SolverJSON       solver_;
  stats::StatisticsConfig stat_;
  SensitivityJSON  sens_;
  DistributionJSON rsqr_;
  DistributionJSON mismatch_;

  void parse_run_(const nlohmann::json& j);
  void parse_solver_(const nlohmann::json& j);
  void parse_statistic_(const nlohmann::json& j);
  void parse_sensitivity_(const nlohmann::json& j);
  void parse_distribution_(const nlohmann::json& j, DistributionJSON& out, const char* block);
};

} // namespace cwsens
