#include "cwsens/io/ConfigManager.hh"
#include <fstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace cwsens {

namespace {

// Accept either a number or an array of numbers; missing/null -> empty.
std::vector<double> read_rows(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) return {};
  const auto& v = j.at(key);
  if (v.is_number()) return {v.get<double>()};
  if (v.is_array())  return v.get<std::vector<double>>();
  throw std::invalid_argument(std::string("config: '") + key + "' must be a number or an array");
}

} // namespace

ConfigManager::ConfigManager(std::string path) : path_(std::move(path)) {}

void ConfigManager::parse() {
  std::ifstream in(path_);
  if (!in) throw std::runtime_error("Cannot open config: " + path_);
  nlohmann::json j;
  in >> j;
  parse(j);
}

void ConfigManager::parse(const nlohmann::json& j) {
  parse_run_(j.at("run"));
  if (j.contains("solver"))      parse_solver_(j.at("solver"));
  if (j.contains("statistic"))   parse_statistic_(j.at("statistic"));
  if (j.contains("sensitivity")) parse_sensitivity_(j.at("sensitivity"));
  if (j.contains("geometric_factor")) parse_distribution_(j.at("geometric_factor"), rsqr_, "geometric_factor");
  if (j.contains("mismatch"))    parse_distribution_(j.at("mismatch"), mismatch_, "mismatch");

  stat_.verbosity = run_.verbosity;
}

void ConfigManager::parse_run_(const nlohmann::json& j) {
  run_.label     = j.value("label", std::string{});
  run_.outdir    = j.value("outdir", std::string{});
  run_.rng_seed  = j.value("rng_seed", 12345ULL);
  run_.verbosity = j.value("verbosity", 1);
}

void ConfigManager::parse_solver_(const nlohmann::json& j) {
  solver_.max_iterations    = j.value("max_iterations", 10000);
  solver_.pd_tolerance      = j.value("pd_tolerance", 1e-3);
  solver_.bracket_tolerance = j.value("bracket_tolerance", 1e-8);
  if (solver_.max_iterations <= 0)
    throw std::invalid_argument("solver.max_iterations must be > 0");
}

void ConfigManager::parse_statistic_(const nlohmann::json& j) {
  stat_.family  = j.value("family", std::string("ChiSqr"));
  stat_.dof     = j.value("dof", 4.0);
  stat_.norm    = j.value("norm", false);
  stat_.sa      = read_rows(j, "sa");
  stat_.avg2Fth = read_rows(j, "avg2Fth");
  stat_.paNt    = read_rows(j, "pFA");
  if (stat_.paNt.empty()) stat_.paNt = read_rows(j, "paNt");
  stat_.Fth     = j.value("Fth", 2.6);
  stat_.nth     = read_rows(j, "nth");
}

void ConfigManager::parse_sensitivity_(const nlohmann::json& j) {
  if (j.contains("pd")) sens_.pd = read_rows(j, "pd");
  if (j.contains("Ns")) sens_.Ns = read_rows(j, "Ns");
  sens_.Tdata_s = j.value("Tdata_s", 0.0);
  if (sens_.pd.empty() || sens_.Ns.empty())
    throw std::invalid_argument("sensitivity.pd and sensitivity.Ns must not be empty");
}

void ConfigManager::parse_distribution_(const nlohmann::json& j, DistributionJSON& out,
                                        const char* block) {
  using Source = DistributionJSON::Source;
  out = DistributionJSON{};

  if (j.contains("value")) {
    out.source = Source::Value;
    out.value  = j.at("value").get<double>();
  } else if (j.contains("delta")) {
    out.source = Source::Delta;
    out.value  = j.at("delta").get<double>();
  } else if (j.contains("root_file")) {
    out.source    = Source::RootFile;
    out.root_file = j.at("root_file").get<std::string>();
    out.hist      = j.at("hist").get<std::string>();
  } else if (j.contains("samples_csv")) {
    out.source      = Source::SamplesCSV;
    out.samples_csv = j.at("samples_csv").get<std::string>();
    out.bin_width   = j.value("bin_width", 0.01);
  } else {
    throw std::invalid_argument(std::string(block) +
                                " needs one of value, delta, root_file, samples_csv");
  }
}

SolverOptions ConfigManager::solver_options() const {
  SolverOptions o;
  o.rng_seed          = run_.rng_seed;
  o.max_iterations    = solver_.max_iterations;
  o.pd_tolerance      = solver_.pd_tolerance;
  o.bracket_tolerance = solver_.bracket_tolerance;
  if (run_.verbosity > 0) o.progress = MakeConsoleProgress("sensitivity");
  return o;
}

} // namespace cwsens
