#include <gtest/gtest.h>
#include "cwsens/histogram/Histogram.hh"
#include "cwsens/histogram/HistogramStatistics.hh"
#include "cwsens/core/Errors.hh"

#include <cmath>
#include <limits>
#include <random>
#include <vector>

using namespace cwsens;

namespace {
constexpr double kInf = std::numeric_limits<double>::infinity();
}

TEST(HistogramStatisticsTest, MomentsOfLargeSample) {
    std::mt19937_64 rng(20251019);
    std::normal_distribution<double> normal(1.7, 4.3);
    std::uniform_real_distribution<double> uniform(-2.0, 4.0);

    Histogram h(2);
    const std::size_t chunk = 1000000;
    std::vector<std::vector<double>> samples(chunk, std::vector<double>(2));
    for (int c = 0; c < 10; ++c) {
        for (auto& s : samples) {
            s[0] = normal(rng);
            s[1] = uniform(rng);
        }
        h.AddData(samples, std::vector<double>{0.01, 0.1});
    }
    EXPECT_DOUBLE_EQ(h.TotalCount(), 1e7);

    EXPECT_NEAR(HistogramStatistics::MeanOf(h, 0), 1.7, 5e-2);
    EXPECT_NEAR(HistogramStatistics::StdDevOf(h, 0), 4.3, 5e-2);
    EXPECT_NEAR(HistogramStatistics::MeanOf(h, 1), 1.0, 5e-2);
    EXPECT_NEAR(HistogramStatistics::VarianceOf(h, 1), 3.0, 5e-2);

    EXPECT_DOUBLE_EQ(HistogramStatistics::StdDevOf(h, 0),
                     std::sqrt(HistogramStatistics::VarianceOf(h, 0)));
}

TEST(HistogramStatisticsTest, ProbabilityDensitiesDivideByWidth) {
    Histogram h({{-kInf, 0.0, 1.0, 3.0, kInf}}, {0.0, 1.0, 2.0, 0.0});
    const auto d = HistogramStatistics::ProbabilityDensities(h);
    ASSERT_EQ(d.size(), 4u);
    EXPECT_EQ(d[0], 0.0);
    EXPECT_DOUBLE_EQ(d[1], 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(d[2], 1.0 / 3.0);
    EXPECT_EQ(d[3], 0.0);
}

TEST(HistogramStatisticsTest, MarginalOfTwoDimensions) {
    Histogram h(2);
    h.AddData({{0.5, 0.5}, {0.5, 1.5}, {1.5, 1.5}, {1.5, 1.5}}, 1.0);

    const auto m0 = HistogramStatistics::MarginalProbabilities(h, 0);
    EXPECT_DOUBLE_EQ(m0[1], 0.5);
    EXPECT_DOUBLE_EQ(m0[2], 0.5);
    const auto m1 = HistogramStatistics::MarginalProbabilities(h, 1);
    EXPECT_DOUBLE_EQ(m1[1], 0.25);
    EXPECT_DOUBLE_EQ(m1[2], 0.75);

    EXPECT_DOUBLE_EQ(HistogramStatistics::MeanOf(h, 1), 0.25 * 0.5 + 0.75 * 1.5);
}

TEST(HistogramStatisticsTest, MassAtInfinityThrows) {
    Histogram h(1);
    h.AddData({{0.5}, {kInf}}, 1.0);
    EXPECT_THROW(HistogramStatistics::MeanOf(h), InfiniteMassError);
    EXPECT_THROW(HistogramStatistics::VarianceOf(h), InfiniteMassError);
    EXPECT_THROW(HistogramStatistics::StdDevOf(h), InfiniteMassError);
}

TEST(HistogramStatisticsTest, EmptyHistogramThrows) {
    Histogram h(1);
    EXPECT_THROW(HistogramStatistics::MeanOf(h), std::invalid_argument);
    EXPECT_THROW(HistogramStatistics::MeanOf(h, 3), std::out_of_range);
}
