#pragma once
#include <memory>
#include <string>

#include "cwsens/histogram/Histogram.hh"

class TH1;
class TH1D;

namespace cwsens {

/// Convert a 1-D Histogram to a TH1D with the same finite bins; the -inf/+inf
/// bins become underflow/overflow. The returned histogram is detached from
/// any ROOT directory.
std::unique_ptr<TH1D> ToTH1D(const Histogram& h, const std::string& name,
                             const std::string& title = "");

/// Convert any 1-D ROOT histogram (under/overflow included) to a Histogram.
Histogram FromTH1(const TH1& th);

/// Read the 1-D histogram stored under key in a ROOT file.
Histogram ReadHistogram(const std::string& path, const std::string& key);

} // namespace cwsens
