#include <gtest/gtest.h>
#include "cwsens/histogram/Histogram.hh"
#include "cwsens/histogram/HistogramResampler.hh"
#include "cwsens/histogram/HistogramStatistics.hh"
#include "cwsens/core/Errors.hh"

#include <limits>
#include <vector>

using namespace cwsens;

namespace {
constexpr double kInf = std::numeric_limits<double>::infinity();

Histogram MakeSteps() {
    return Histogram({{-kInf, 0.0, 1.0, 2.0, 3.0, kInf}}, {0.0, 1.0, 2.0, 3.0, 0.0});
}
}

TEST(HistogramResamplerTest, InterpolationConservesMass) {
    const auto h = MakeSteps();
    const auto r = HistogramResampler::Resample(h, 0, {-0.5, 0.25, 1.7, 3.5});

    ASSERT_EQ(r.NumBins(0), 5u);
    EXPECT_NEAR(r.TotalCount(), h.TotalCount(), 1e-12);
    EXPECT_NEAR(r.Count({1}), 0.25, 1e-12);
    EXPECT_NEAR(r.Count({2}), 2.15, 1e-12);
    EXPECT_NEAR(r.Count({3}), 3.6, 1e-12);
}

TEST(HistogramResamplerTest, SupersetEdgesCopyCountsExactly) {
    const auto h = MakeSteps();
    const auto r = HistogramResampler::Resample(h, 0, {-1.0, 0.0, 1.0, 2.0, 3.0, 4.0});
    EXPECT_EQ(r.Counts(), (std::vector<double>{0, 0, 1, 2, 3, 0, 0}));
}

TEST(HistogramResamplerTest, NearbyEdgesAreSnapped) {
    const auto h = MakeSteps();
    const auto r = HistogramResampler::Resample(h, 0, {1e-12, 1.0, 2.0, 3.0 - 1e-12});
    EXPECT_EQ(r.Counts(), h.Counts());
    EXPECT_EQ(r.Edges(0), h.Edges(0));
}

TEST(HistogramResamplerTest, SentinelCountsArePreserved) {
    Histogram h({{-kInf, 0.0, 1.0, 2.0, kInf}}, {2.0, 1.0, 3.0, 5.0});
    const auto r = HistogramResampler::Resample(h, 0, {0.0, 0.5, 2.0});
    EXPECT_EQ(r.Count({0}), 2.0);
    EXPECT_EQ(r.Count({r.NumBins(0) - 1}), 5.0);
    EXPECT_NEAR(r.Count({1}), 0.5, 1e-12);
    EXPECT_NEAR(r.Count({2}), 3.5, 1e-12);
}

TEST(HistogramResamplerTest, NewEdgesMustCoverOldRange) {
    const auto h = MakeSteps();
    EXPECT_THROW(HistogramResampler::Resample(h, 0, {0.5, 3.0}), RangeCoverageError);
    EXPECT_THROW(HistogramResampler::Resample(h, 0, {0.0, 2.5}), RangeCoverageError);
}

TEST(HistogramResamplerTest, InvalidEdgeSetsAreRejected) {
    const auto h = MakeSteps();
    EXPECT_THROW(HistogramResampler::Resample(h, 0, {1.0}), std::invalid_argument);
    EXPECT_THROW(HistogramResampler::Resample(h, 0, {-1.0, 1.0, 1.0, 4.0}), std::invalid_argument);
    EXPECT_THROW(HistogramResampler::Resample(h, 1, {0.0, 4.0}), std::out_of_range);
}

TEST(HistogramResamplerTest, UnbinnedAxisAdoptsNewEdges) {
    Histogram h(1);
    const auto r = HistogramResampler::Resample(h, 0, {0.0, 1.0, 2.0});
    EXPECT_EQ(r.Edges(0), (std::vector<double>{-kInf, 0.0, 1.0, 2.0, kInf}));
    EXPECT_EQ(r.TotalCount(), 0.0);
}

TEST(HistogramResamplerTest, OneDimensionOfTwo) {
    Histogram h(2);
    h.AddData({{0.5, 0.5}, {1.5, 1.5}, {1.5, 0.5}}, 1.0);

    const auto r = HistogramResampler::Resample(h, 1, {0.0, 0.25, 2.0});
    EXPECT_EQ(r.Edges(0), h.Edges(0));
    EXPECT_NEAR(r.TotalCount(), 3.0, 1e-12);
    const auto mr = HistogramStatistics::MarginalProbabilities(r, 0);
    const auto mh = HistogramStatistics::MarginalProbabilities(h, 0);
    ASSERT_EQ(mr.size(), mh.size());
    for (std::size_t i = 0; i < mr.size(); ++i) EXPECT_NEAR(mr[i], mh[i], 1e-15);
}

TEST(HistogramResamplerTest, AllDimensionsAtOnce) {
    Histogram h(2);
    h.AddData({{0.5, 0.5}, {1.5, 1.5}}, 1.0);

    const auto r = HistogramResampler::Resample(h, {{0.0, 2.0}, {-1.0, 0.0, 1.0, 2.0, 3.0}});
    EXPECT_EQ(r.Shape(), (std::vector<std::size_t>{3, 6}));
    EXPECT_NEAR(r.Count({1, 2}), 1.0, 1e-12);
    EXPECT_NEAR(r.Count({1, 3}), 1.0, 1e-12);

    EXPECT_THROW(HistogramResampler::Resample(h, {{0.0, 2.0}}), DimensionMismatch);
}
