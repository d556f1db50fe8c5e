#include "cwsens/io/ConfigManager.hh"
#include "cwsens/io/DistributionLoader.hh"
#include "cwsens/sensitivity/SensitivitySNR.hh"
#include "cwsens/stats/StatisticFactory.hh"

#include <TFile.h>
#include <TGraph.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <vector>

using nlohmann::json;

int main(int argc, char** argv){
  if (argc<2){ std::cerr<<"usage: cwsens_sensitivity_snr <config.json>\n"; return 1; }

  try {
    cwsens::ConfigManager cfg(argv[1]); cfg.parse();
    const auto& sens = cfg.sensitivity();
    const auto& stat = cfg.statistic();

    std::cout << "[SNR] Run: " << cfg.run().label << "\n"
              << "  Statistic: " << cwsens::stats::ToString(cwsens::stats::ParseStatisticFamily(stat.family)) << "\n"
              << "  Rows (pd, Ns): " << sens.pd.size() << ", " << sens.Ns.size() << "\n";

    const auto Rsqr = cwsens::MakeGeometricFactor(cfg);
    const auto res = cwsens::SensitivitySNR(sens.pd, sens.Ns, Rsqr, stat, cfg.solver_options());

    std::cout << "\n[results]\n"
              << "  row          rho      pd(rho)\n";
    json jrows = json::array();
    for (size_t r=0;r<res.rho.size();++r){
      std::cout << "  " << std::setw(3) << r
                << "  " << std::setw(11) << res.rho[r]
                << "  " << std::setw(11) << res.pd_rho[r] << "\n";
      jrows.push_back({{"row", r}, {"rho", res.rho[r]}, {"pd_rho", res.pd_rho[r]}});
    }

    if (cfg.run().outdir.empty()) return 0;
    std::filesystem::create_directories(cfg.run().outdir);

    json jout;
    jout["label"] = cfg.run().label;
    jout["statistic"] = stat.family;
    jout["results"] = jrows;
    const std::string json_path = cfg.run().outdir + "/sensitivity_snr.json";
    std::ofstream(json_path) << jout.dump(2) << "\n";

    const std::string root_path = cfg.run().outdir + "/sensitivity_snr.root";
    TFile fout(root_path.c_str(),"RECREATE");
    TGraph g(static_cast<int>(res.rho.size()));
    g.SetName("g_rho");
    g.SetTitle("Detectable SNR;row;#rho");
    for (size_t r=0;r<res.rho.size();++r) g.SetPoint(static_cast<int>(r), static_cast<double>(r), res.rho[r]);
    g.Write();
    fout.Close();

    std::cout << "\n[output] " << json_path << "\n"
              << "[output] " << root_path << "\n";
    return 0;
  } catch (const std::exception& e){
    std::cerr << "ERROR: " << e.what() << "\n"; return 2;
  }
}
