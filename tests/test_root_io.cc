#include <gtest/gtest.h>
#include "cwsens/histogram/Histogram.hh"
#include "cwsens/io/HistogramRootIO.hh"
#include "cwsens/core/Errors.hh"

#include <TFile.h>
#include <TH1D.h>

#include <filesystem>
#include <limits>
#include <stdexcept>

using namespace cwsens;

namespace {
constexpr double kInf = std::numeric_limits<double>::infinity();
}

TEST(HistogramRootIOTest, ConvertsToAndFromTH1D) {
    Histogram h({{-kInf, 0.0, 0.25, 1.0, kInf}}, {1.0, 2.0, 3.0, 4.0});
    const auto th = ToTH1D(h, "h_rsqr");

    ASSERT_EQ(th->GetNbinsX(), 2);
    EXPECT_DOUBLE_EQ(th->GetXaxis()->GetBinUpEdge(1), 0.25);
    EXPECT_DOUBLE_EQ(th->GetBinContent(0), 1.0);
    EXPECT_DOUBLE_EQ(th->GetBinContent(2), 3.0);
    EXPECT_DOUBLE_EQ(th->GetBinContent(3), 4.0);

    const auto back = FromTH1(*th);
    EXPECT_EQ(back.Edges(0), h.Edges(0));
    EXPECT_EQ(back.Counts(), h.Counts());
}

TEST(HistogramRootIOTest, ReadsHistogramFromFile) {
    const auto path = (std::filesystem::temp_directory_path() / "cwsens_test_rsqr.root").string();
    {
        TH1D th("Rsqr", "R^{2}", 4, 0.0, 1.0);
        th.SetDirectory(nullptr);
        th.SetBinContent(1, 0.5);
        th.SetBinContent(3, 1.5);
        TFile fout(path.c_str(), "RECREATE");
        th.Write();
        fout.Close();
    }

    const auto h = ReadHistogram(path, "Rsqr");
    ASSERT_EQ(h.NumBins(0), 6u);
    EXPECT_DOUBLE_EQ(h.Range(0).second, 1.0);
    EXPECT_DOUBLE_EQ(h.Count({3}), 1.5);
    EXPECT_DOUBLE_EQ(h.TotalCount(), 2.0);

    EXPECT_THROW(ReadHistogram(path, "missing"), std::runtime_error);
    std::filesystem::remove(path);
}

TEST(HistogramRootIOTest, RejectsUnsupportedHistograms) {
    EXPECT_THROW(ToTH1D(Histogram(2), "h2"), InvalidHistogramShape);
    EXPECT_THROW(ToTH1D(Histogram(1), "h1"), std::invalid_argument);
    EXPECT_THROW(ReadHistogram("/nonexistent/cwsens.root", "Rsqr"), std::runtime_error);
}
