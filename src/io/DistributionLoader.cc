#include "cwsens/io/DistributionLoader.hh"
#include "cwsens/core/Errors.hh"
#include "cwsens/io/HistogramRootIO.hh"
#include "cwsens/io/SampleTable.hh"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace cwsens {

Histogram LoadDistribution(const DistributionJSON& d) {
  using Source = DistributionJSON::Source;
  switch (d.source) {
    case Source::Value:
    case Source::Delta:
      return CreateDeltaHist(d.value);
    case Source::RootFile:
      return ReadHistogram(d.root_file, d.hist);
    case Source::SamplesCSV: {
      SampleTable tab;
      if (!tab.LoadCSV(d.samples_csv))
        throw std::runtime_error("Failed to load samples CSV: " + d.samples_csv);
      if (tab.n_cols() != 1)
        throw DimensionMismatch(d.samples_csv + ": expected one column, got " +
                                std::to_string(tab.n_cols()));
      std::vector<std::vector<double>> samples;
      samples.reserve(tab.n_rows());
      for (const auto& r : tab.rows()) samples.push_back({r.front()});
      return CreateHist(samples, d.bin_width);
    }
    case Source::None:
      break;
  }
  throw std::invalid_argument("LoadDistribution: no distribution source configured");
}

GeometricFactor MakeGeometricFactor(const ConfigManager& cfg) {
  const auto& r2 = cfg.geometric_factor();
  const int verbosity = cfg.run().verbosity;

  GeometricFactor g = (r2.source == DistributionJSON::Source::Value)
                    ? GeometricFactor::FromScalar(r2.value)
                    : GeometricFactor::FromHistogram(LoadDistribution(r2));

  if (cfg.mismatch().source != DistributionJSON::Source::None) {
    g = g.WithMismatch(LoadDistribution(cfg.mismatch()));
  }
  if (verbosity > 0) {
    std::cout << "[config] R^2: " << g.size() << " nodes, mean " << g.Mean() << "\n";
  }
  return g;
}

} // namespace cwsens
