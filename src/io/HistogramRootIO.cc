#include "cwsens/io/HistogramRootIO.hh"
#include "cwsens/core/Errors.hh"

#include <TFile.h>
#include <TH1.h>
#include <TH1D.h>

#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace cwsens {

std::unique_ptr<TH1D> ToTH1D(const Histogram& h, const std::string& name,
                             const std::string& title) {
  if (h.Dim() != 1)
    throw InvalidHistogramShape("ToTH1D: histogram must be 1-D, got " + std::to_string(h.Dim()) + "-D");
  if (!h.HasFiniteBins(0))
    throw std::invalid_argument("ToTH1D: histogram has no finite bins");

  const auto& all = h.Edges(0);
  const std::vector<double> edges(all.begin() + 1, all.end() - 1);
  const int nbins = static_cast<int>(edges.size()) - 1;

  auto th = std::make_unique<TH1D>(name.c_str(), title.empty() ? name.c_str() : title.c_str(),
                                   nbins, edges.data());
  th->SetDirectory(nullptr);
  const auto& c = h.Counts();
  for (int i = 0; i <= nbins + 1; ++i) th->SetBinContent(i, c[static_cast<std::size_t>(i)]);
  th->SetEntries(h.TotalCount());
  return th;
}

Histogram FromTH1(const TH1& th) {
  if (th.GetDimension() != 1)
    throw InvalidHistogramShape(std::string("FromTH1: '") + th.GetName() + "' is not 1-D");

  const int nbins = th.GetNbinsX();
  const TAxis* ax = th.GetXaxis();
  constexpr double kInf = std::numeric_limits<double>::infinity();

  std::vector<double> edges;
  edges.reserve(nbins + 3);
  edges.push_back(-kInf);
  for (int i = 1; i <= nbins + 1; ++i) edges.push_back(ax->GetBinLowEdge(i));
  edges.push_back(kInf);

  std::vector<double> counts(nbins + 2);
  for (int i = 0; i <= nbins + 1; ++i) counts[i] = th.GetBinContent(i);

  return Histogram({std::move(edges)}, std::move(counts));
}

Histogram ReadHistogram(const std::string& path, const std::string& key) {
  std::unique_ptr<TFile> f(TFile::Open(path.c_str(), "READ"));
  if (!f || f->IsZombie()) throw std::runtime_error("Cannot open ROOT file: " + path);

  auto* th = dynamic_cast<TH1*>(f->Get(key.c_str()));
  if (!th) throw std::runtime_error("No TH1 '" + key + "' in " + path);

  Histogram h = FromTH1(*th);
  f->Close();
  return h;
}

} // namespace cwsens
