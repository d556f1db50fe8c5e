#include <gtest/gtest.h>
#include "cwsens/sensitivity/GeometricFactor.hh"
#include "cwsens/sensitivity/SensitivitySNR.hh"
#include "cwsens/sensitivity/SensitivitySolver.hh"
#include "cwsens/stats/IFalseDismissalProbability.hh"
#include "cwsens/core/Errors.hh"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace cwsens;

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

// pd(rhosqr) = amplitude[row] * exp(-rate[row] * rhosqr)
class ExponentialFDP : public stats::IFalseDismissalProbability {
public:
    ExponentialFDP(std::vector<double> rate, std::vector<double> amplitude)
    : rate_(std::move(rate)), amplitude_(std::move(amplitude)) {}

    std::vector<double> Evaluate(const std::vector<std::size_t>& rows,
                                 const std::vector<double>&,
                                 const std::vector<double>&,
                                 const std::vector<double>& rhosqr) const override {
        ++calls;
        std::vector<double> out(rows.size());
        for (std::size_t i = 0; i < rows.size(); ++i)
            out[i] = amplitude_[rows[i]] * std::exp(-rate_[rows[i]] * rhosqr[i]);
        return out;
    }
    std::size_t NumRows() const override { return rate_.size(); }

    mutable int calls = 0;

private:
    std::vector<double> rate_;
    std::vector<double> amplitude_;
};

class ConstantFDP : public stats::IFalseDismissalProbability {
public:
    explicit ConstantFDP(double value) : value_(value) {}
    std::vector<double> Evaluate(const std::vector<std::size_t>& rows,
                                 const std::vector<double>&,
                                 const std::vector<double>&,
                                 const std::vector<double>&) const override {
        return std::vector<double>(rows.size(), value_);
    }
    std::size_t NumRows() const override { return 1; }

private:
    double value_;
};

stats::StatisticsConfig ChiSqrConfig(std::vector<double> paNt) {
    stats::StatisticsConfig cfg;
    cfg.family = "ChiSqr";
    cfg.paNt = std::move(paNt);
    return cfg;
}

} // namespace

TEST(SensitivitySolverTest, RecoversAnalyticRoot) {
    ExponentialFDP fdp({0.5, 2.0}, {1.0, 1.0});
    const std::vector<double> pd{0.1, 0.01};

    const auto res = SensitivitySolver().Solve(pd, {1.0}, GeometricFactor::FromScalar(1.0), fdp);
    ASSERT_EQ(res.rho.size(), 2u);
    EXPECT_NEAR(res.rho[0] * res.rho[0], -std::log(0.1) / 0.5, 1e-6);
    EXPECT_NEAR(res.rho[1] * res.rho[1], -std::log(0.01) / 2.0, 1e-6);
    for (std::size_t r = 0; r < 2; ++r) EXPECT_LT(std::abs(res.pd_rho[r] - pd[r]) / pd[r], 1e-3);
}

TEST(SensitivitySolverTest, GeometricFactorScalesSignal) {
    ExponentialFDP fdp({1.0}, {1.0});
    const auto g1 = SensitivitySolver().Solve({0.1}, {1.0}, GeometricFactor::FromScalar(1.0), fdp);
    const auto g4 = SensitivitySolver().Solve({0.1}, {1.0}, GeometricFactor::FromScalar(0.25), fdp);
    EXPECT_NEAR(g4.rho[0], 2.0 * g1.rho[0], 1e-6);
}

TEST(SensitivitySolverTest, RowsAreSolvedInBatches) {
    ExponentialFDP fdp({1.0, 1.0, 1.0, 1.0}, {1.0, 1.0, 1.0, 1.0});
    SensitivitySolver().Solve({0.2, 0.1, 0.05, 0.01}, {1.0}, GeometricFactor::FromScalar(1.0), fdp);
    const int batched = fdp.calls;

    int separate = 0;
    for (double pd : {0.2, 0.1, 0.05, 0.01}) {
        ExponentialFDP one({1.0}, {1.0});
        SensitivitySolver().Solve({pd}, {1.0}, GeometricFactor::FromScalar(1.0), one);
        separate += one.calls;
    }
    EXPECT_LT(batched, separate);
}

TEST(SensitivitySolverTest, ChiSqrConverges) {
    const auto res = SensitivitySNR({0.1}, {20.0}, GeometricFactor::FromScalar(0.1),
                                    ChiSqrConfig({1e-10}));
    ASSERT_EQ(res.rho.size(), 1u);
    EXPECT_LT(std::abs(res.pd_rho[0] - 0.1) / 0.1, 1e-3);
    EXPECT_NEAR(res.rho[0] * res.rho[0], 71.1639, 0.1);
}

TEST(SensitivitySolverTest, RhoGrowsAsTargetTightens) {
    const auto res = SensitivitySNR({0.2, 0.1, 0.05, 0.01}, {20.0},
                                    GeometricFactor::FromScalar(0.1), ChiSqrConfig({1e-10}));
    for (std::size_t r = 1; r < res.rho.size(); ++r) EXPECT_GT(res.rho[r], res.rho[r - 1]);
}

TEST(SensitivitySolverTest, HoughFstatConverges) {
    stats::StatisticsConfig cfg;
    cfg.family = "HoughFstat";
    cfg.paNt = {1e-3};
    const auto res = SensitivitySNR({0.1}, {100.0}, GeometricFactor::FromScalar(1.0), cfg);
    EXPECT_TRUE(std::isfinite(res.rho[0]));
    EXPECT_LT(std::abs(res.pd_rho[0] - 0.1) / 0.1, 1e-3);
}

TEST(SensitivitySolverTest, RowsAlreadyBelowTargetAreNaN) {
    ExponentialFDP fdp({1.0, 1.0}, {1.0, 0.05});
    const auto res = SensitivitySolver().Solve({0.1}, {1.0}, GeometricFactor::FromScalar(1.0), fdp);
    EXPECT_TRUE(std::isfinite(res.rho[0]));
    EXPECT_TRUE(std::isnan(res.rho[1]));
    EXPECT_TRUE(std::isnan(res.pd_rho[1]));
}

TEST(SensitivitySolverTest, SameSeedSameResult) {
    const auto a = SensitivitySNR({0.1}, {20.0}, GeometricFactor::FromScalar(0.1), ChiSqrConfig({1e-12}));
    const auto b = SensitivitySNR({0.1}, {20.0}, GeometricFactor::FromScalar(0.1), ChiSqrConfig({1e-12}));
    EXPECT_EQ(a.rho, b.rho);
}

TEST(SensitivitySolverTest, NonMonotoneFunctionFailsToConverge) {
    ConstantFDP fdp(0.5);
    EXPECT_THROW(SensitivitySolver().Solve({0.1}, {1.0}, GeometricFactor::FromScalar(1.0), fdp),
                 ConvergenceFailure);
}

TEST(SensitivitySolverTest, IterationCapIsEnforced) {
    SolverOptions opts;
    opts.max_iterations = 2;
    EXPECT_THROW(SensitivitySNR({0.1}, {20.0}, GeometricFactor::FromScalar(0.1),
                                ChiSqrConfig({1e-10}), opts),
                 ConvergenceFailure);
}

TEST(SensitivitySolverTest, NonFiniteProbabilityThrows) {
    ConstantFDP fdp(std::numeric_limits<double>::quiet_NaN());
    EXPECT_THROW(SensitivitySolver().Solve({0.1}, {1.0}, GeometricFactor::FromScalar(1.0), fdp),
                 std::runtime_error);
}

TEST(SensitivitySolverTest, RejectsInvalidInput) {
    ExponentialFDP fdp({1.0}, {1.0});
    const auto g = GeometricFactor::FromScalar(1.0);
    EXPECT_THROW(SensitivitySolver().Solve({0.0}, {1.0}, g, fdp), std::invalid_argument);
    EXPECT_THROW(SensitivitySolver().Solve({1.0}, {1.0}, g, fdp), std::invalid_argument);
    EXPECT_THROW(SensitivitySolver().Solve({0.1}, {0.0}, g, fdp), std::invalid_argument);
    EXPECT_THROW(SensitivitySolver().Solve({0.1, 0.2}, {1.0, 2.0, 3.0}, g, fdp), DimensionMismatch);

    SolverOptions bad;
    bad.pd_tolerance = 0.0;
    EXPECT_THROW(SensitivitySolver{bad}, std::invalid_argument);
}

TEST(SensitivitySolverTest, ProgressIsReported) {
    std::vector<SolverProgress::Stage> stages;
    SolverOptions opts;
    opts.progress = [&stages](const SolverProgress& p) { stages.push_back(p.stage); };

    ExponentialFDP fdp({1.0}, {1.0});
    SensitivitySolver(opts).Solve({0.1}, {1.0}, GeometricFactor::FromScalar(1.0), fdp);
    ASSERT_GE(stages.size(), 3u);
    EXPECT_EQ(stages.front(), SolverProgress::Stage::Starting);
    EXPECT_EQ(stages.back(), SolverProgress::Stage::Done);
}

TEST(SensitivitySolverTest, FailingProgressCallbackDoesNotAbort) {
    ExponentialFDP fdp({1.0}, {1.0});
    const auto g = GeometricFactor::FromScalar(1.0);
    const auto quiet = SensitivitySolver().Solve({0.1}, {1.0}, g, fdp);

    SolverOptions opts;
    opts.progress = [](const SolverProgress&) { throw std::runtime_error("display closed"); };
    SensitivityResult res;
    EXPECT_NO_THROW(res = SensitivitySolver(opts).Solve({0.1}, {1.0}, g, fdp));
    EXPECT_EQ(res.rho, quiet.rho);
}

TEST(SensitivitySolverTest, NonStandardExceptionFromProgressCallbackDoesNotAbort) {
    ExponentialFDP fdp({1.0}, {1.0});
    const auto g = GeometricFactor::FromScalar(1.0);
    const auto quiet = SensitivitySolver().Solve({0.1}, {1.0}, g, fdp);

    SolverOptions opts;
    opts.progress = [](const SolverProgress&) { throw 42; };
    SensitivityResult res;
    EXPECT_NO_THROW(res = SensitivitySolver(opts).Solve({0.1}, {1.0}, g, fdp));
    EXPECT_EQ(res.rho, quiet.rho);
}

TEST(GeometricFactorTest, NodesFromHistogram) {
    Histogram h({{-kInf, 0.0, 0.5, 1.0, kInf}}, {0.0, 1.0, 3.0, 0.0});
    const auto g = GeometricFactor::FromHistogram(h);
    ASSERT_EQ(g.size(), 2u);
    EXPECT_DOUBLE_EQ(g.nodes()[0], 0.25);
    EXPECT_DOUBLE_EQ(g.nodes()[1], 0.75);
    EXPECT_DOUBLE_EQ(g.weights()[0], 0.25);
    EXPECT_DOUBLE_EQ(g.weights()[1], 0.75);
    EXPECT_DOUBLE_EQ(g.Mean(), 0.625);
}

TEST(GeometricFactorTest, RejectsInvalidHistograms) {
    EXPECT_THROW(GeometricFactor::FromHistogram(Histogram(2)), InvalidHistogramShape);
    EXPECT_THROW(GeometricFactor::FromHistogram(Histogram(1)), std::invalid_argument);

    Histogram negative({{-kInf, -0.5, 0.5, kInf}}, {0.0, 1.0, 0.0});
    EXPECT_THROW(GeometricFactor::FromHistogram(negative), NegativeDomainError);

    Histogram unbounded({{-kInf, 0.0, 0.5, kInf}}, {0.0, 1.0, 0.5});
    EXPECT_THROW(GeometricFactor::FromHistogram(unbounded), UnboundedMassError);

    EXPECT_THROW(GeometricFactor::FromScalar(-0.1), NegativeDomainError);
}

TEST(GeometricFactorTest, MismatchReducesSignal) {
    const auto g = GeometricFactor::FromScalar(0.4);
    Histogram mu({{-kInf, 0.0, 0.2, 0.4, kInf}}, {0.0, 1.0, 1.0, 0.0});
    const auto gm = g.WithMismatch(mu);
    ASSERT_EQ(gm.size(), 2u);
    EXPECT_NEAR(gm.nodes()[0], 0.4 * 0.9, 1e-12);
    EXPECT_NEAR(gm.nodes()[1], 0.4 * 0.7, 1e-12);
    EXPECT_NEAR(gm.Mean(), 0.4 * 0.8, 1e-12);

    Histogram too_large({{-kInf, 0.5, 1.5, kInf}}, {0.0, 1.0, 0.0});
    EXPECT_THROW(g.WithMismatch(too_large), std::domain_error);

    // no mismatch leaves the sensitivity unchanged
    const auto g0 = g.WithMismatch(CreateDeltaHist(0.0));
    ExponentialFDP fdp({1.0}, {1.0});
    const auto a = SensitivitySolver().Solve({0.1}, {1.0}, g, fdp);
    const auto b = SensitivitySolver().Solve({0.1}, {1.0}, g0, fdp);
    EXPECT_NEAR(a.rho[0], b.rho[0], 1e-6);
}
