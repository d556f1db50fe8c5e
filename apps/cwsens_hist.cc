#include "cwsens/histogram/Histogram.hh"
#include "cwsens/histogram/HistogramStatistics.hh"
#include "cwsens/io/HistogramRootIO.hh"
#include "cwsens/io/SampleTable.hh"

#include <TFile.h>
#include <TH1D.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// Bin a CSV sample table and print the marginal moments of each column.
int main(int argc, char** argv){
  if (argc<3){
    std::cerr << "usage: cwsens_hist <samples.csv> <bin_width> [out.root]\n";
    return 1;
  }

  try {
    const std::string csv = argv[1];
    const double dx = std::stod(argv[2]);

    cwsens::SampleTable tab;
    if (!tab.LoadCSV(csv)) throw std::runtime_error("Failed to load samples CSV: " + csv);

    const auto h = cwsens::CreateHist(tab.rows(), dx);
    std::cout << "[hist] " << csv << ": " << tab.n_rows() << " samples, " << h.Dim() << " columns\n";
    for (size_t d=0; d<h.Dim(); ++d){
      const auto rng = h.Range(d);
      const std::string name = d < tab.header().size() ? tab.header()[d] : ("x" + std::to_string(d));
      std::cout << "  " << name << ": " << h.NumBins(d) << " bins in [" << rng.first << ", " << rng.second << "]"
                << "  mean=" << cwsens::HistogramStatistics::MeanOf(h, d)
                << "  std=" << cwsens::HistogramStatistics::StdDevOf(h, d) << "\n";
    }

    if (argc>3){
      if (h.Dim() != 1) throw std::runtime_error("ROOT output needs a single-column table");
      const std::string out = argv[3];
      const auto parent = std::filesystem::path(out).parent_path();
      if (!parent.empty()) std::filesystem::create_directories(parent);
      auto th = cwsens::ToTH1D(h, "h_samples", tab.header().empty() ? "samples" : tab.header().front());
      TFile fout(out.c_str(),"RECREATE");
      th->Write();
      fout.Close();
      std::cout << "[output] " << out << "\n";
    }
    return 0;
  } catch (const std::exception& e){
    std::cerr << "ERROR: " << e.what() << "\n"; return 2;
  }
}
