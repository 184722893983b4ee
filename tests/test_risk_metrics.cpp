#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "risk/risk_metrics.hpp"
#include "risk/sample_covariance.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <limits>
#include <memory>
#include <random>
#include <sstream>

using namespace riskmetrics;
using namespace riskmetrics::risk;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

// Test fixture for shared test data
class RiskMetricsTestFixture
{
protected:
    // Four monthly periods, two assets, values checked by hand
    ReturnSeries hand_series_;

    // Larger return matrix (60 months, 5 assets)
    Eigen::MatrixXd returns_60x5_;

    RiskMetricsTestFixture()
    {
        Eigen::MatrixXd values(4, 2);
        values << 0.0, 0.0,
            0.10, 0.05,
            -0.05, 0.01,
            0.02, -0.03;
        hand_series_ = ReturnSeries(values,
                                    {"2020-01-31", "2020-02-29", "2020-03-31", "2020-04-30"},
                                    {"A", "B"});

        returns_60x5_ = generate_synthetic_returns(60, 5, 42);
    }

    static Eigen::MatrixXd generate_synthetic_returns(int n_obs, int n_assets, unsigned int seed)
    {
        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(0.005, 0.04);

        Eigen::MatrixXd returns(n_obs, n_assets);
        for (int i = 0; i < n_obs; ++i)
        {
            for (int j = 0; j < n_assets; ++j)
            {
                returns(i, j) = dist(gen);
            }
        }
        return returns;
    }
};

// Diagonal-only model used to exercise the base-class volatility path
class DiagonalModel : public RiskModel
{
public:
    Eigen::MatrixXd estimate_covariance(const Eigen::MatrixXd &returns) const override
    {
        validate_returns(returns);
        Eigen::MatrixXd cov = SampleCovariance().estimate_covariance(returns);
        return Eigen::MatrixXd(cov.diagonal().asDiagonal());
    }

    std::string get_name() const override { return "DiagonalModel"; }
};

TEST_CASE_METHOD(RiskMetricsTestFixture, "SampleCovariance basic functionality", "[RiskModel][SampleCovariance]")
{
    SECTION("Construct with default parameters")
    {
        SampleCovariance cov;
        REQUIRE(cov.uses_bias_correction() == true);
        REQUIRE(cov.get_name() == "SampleCovariance");
    }

    SECTION("Construct without bias correction")
    {
        SampleCovariance cov(false);
        REQUIRE(cov.uses_bias_correction() == false);
    }

    SECTION("Hand-computed covariance")
    {
        auto result = SampleCovariance().estimate_covariance(hand_series_.returns());

        REQUIRE(result.rows() == 2);
        REQUIRE(result.cols() == 2);
        REQUIRE_THAT(result(0, 0), WithinAbs(0.011675 / 3.0, 1e-12));
        REQUIRE_THAT(result(1, 1), WithinAbs(0.003275 / 3.0, 1e-12));
        REQUIRE_THAT(result(0, 1), WithinAbs(0.001125, 1e-12));
        REQUIRE(result(0, 1) == result(1, 0));
    }

    SECTION("Bias correction ratio")
    {
        auto unbiased = SampleCovariance(true).estimate_covariance(returns_60x5_);
        auto biased = SampleCovariance(false).estimate_covariance(returns_60x5_);

        // biased = unbiased * (n-1)/n
        REQUIRE_THAT((biased - unbiased * (59.0 / 60.0)).norm(), WithinAbs(0.0, 1e-12));
    }

    SECTION("Positive semi-definite")
    {
        auto result = SampleCovariance().estimate_covariance(returns_60x5_);
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(result);
        REQUIRE(solver.eigenvalues().minCoeff() >= -1e-12);
    }
}

TEST_CASE_METHOD(RiskMetricsTestFixture, "Volatility estimation", "[RiskModel]")
{
    SECTION("Direct standard deviation matches the covariance diagonal")
    {
        SampleCovariance cov;
        auto vols = cov.estimate_volatilities(returns_60x5_);
        auto matrix = cov.estimate_covariance(returns_60x5_);

        for (Eigen::Index i = 0; i < vols.size(); ++i)
        {
            REQUIRE_THAT(vols(i) * vols(i), WithinAbs(matrix(i, i), 1e-12));
        }
    }

    SECTION("Base class derives volatility from the diagonal")
    {
        DiagonalModel model;
        auto vols = model.estimate_volatilities(hand_series_.returns());
        REQUIRE_THAT(vols(0), WithinAbs(std::sqrt(0.011675 / 3.0), 1e-12));
        REQUIRE_THAT(vols(1), WithinAbs(std::sqrt(0.003275 / 3.0), 1e-12));
    }

    SECTION("Constant series has zero volatility")
    {
        Eigen::MatrixXd flat = Eigen::MatrixXd::Constant(5, 2, 0.01);
        auto vols = SampleCovariance().estimate_volatilities(flat);
        REQUIRE(vols.isZero());
    }
}

TEST_CASE("Risk model input validation", "[RiskModel]")
{
    SampleCovariance cov;

    SECTION("Empty matrix")
    {
        Eigen::MatrixXd empty(0, 0);
        REQUIRE_THROWS_AS(cov.estimate_covariance(empty), std::invalid_argument);
    }

    SECTION("Single observation")
    {
        Eigen::MatrixXd single(1, 3);
        single << 0.01, 0.02, 0.03;
        REQUIRE_THROWS_AS(cov.estimate_covariance(single), std::invalid_argument);
        REQUIRE_THROWS_AS(cov.estimate_volatilities(single), std::invalid_argument);
    }

    SECTION("Non-finite values")
    {
        Eigen::MatrixXd bad(2, 1);
        bad << 0.01, std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(cov.estimate_covariance(bad), std::invalid_argument);
    }
}

TEST_CASE_METHOD(RiskMetricsTestFixture, "RiskMetricsEngine", "[RiskMetrics]")
{
    RiskMetricsEngine engine;
    auto metrics = engine.compute(hand_series_);

    SECTION("Default model")
    {
        REQUIRE(engine.model().get_name() == "SampleCovariance");
    }

    SECTION("Hand-computed values")
    {
        REQUIRE_THAT(metrics.volatility("A"), WithinAbs(std::sqrt(0.011675 / 3.0), 1e-12));
        REQUIRE_THAT(metrics.volatility("B"), WithinAbs(std::sqrt(0.003275 / 3.0), 1e-12));
        REQUIRE_THAT(metrics.covariance_between("A", "B"), WithinAbs(0.001125, 1e-12));
        REQUIRE_THAT(metrics.covariance_between("B", "A"), WithinAbs(0.001125, 1e-12));
    }

    SECTION("Aligned with the series")
    {
        REQUIRE(metrics.tickers() == hand_series_.tickers());
        REQUIRE(metrics.returns.dates() == hand_series_.dates());
        REQUIRE(metrics.returns.returns() == hand_series_.returns());
        REQUIRE(metrics.volatilities.size() == 2);
        REQUIRE(metrics.covariance.rows() == 2);
        REQUIRE(metrics.covariance.isApprox(metrics.covariance.transpose()));
    }

    SECTION("Variance equals squared volatility")
    {
        for (Eigen::Index i = 0; i < 2; ++i)
        {
            REQUIRE_THAT(metrics.covariance(i, i),
                         WithinAbs(metrics.volatilities(i) * metrics.volatilities(i), 1e-12));
        }
    }

    SECTION("Volatility map")
    {
        auto vols = metrics.volatility_map();
        REQUIRE(vols.size() == 2);
        REQUIRE(vols.at("A") == metrics.volatility("A"));
    }

    SECTION("Unknown ticker")
    {
        REQUIRE_THROWS_AS(metrics.volatility("Z"), std::invalid_argument);
        REQUIRE_THROWS_AS(metrics.covariance_between("A", "Z"), std::invalid_argument);
    }

    SECTION("Repeated computation is identical")
    {
        auto again = engine.compute(hand_series_);
        REQUIRE(again.covariance == metrics.covariance);
        REQUIRE(again.volatilities == metrics.volatilities);
    }

    SECTION("Summary lists every ticker")
    {
        std::ostringstream out;
        metrics.print_summary(out);
        REQUIRE_THAT(out.str(), ContainsSubstring("A") && ContainsSubstring("B") &&
                                    ContainsSubstring("2020-01-31 to 2020-04-30"));
    }
}

TEST_CASE_METHOD(RiskMetricsTestFixture, "RiskMetricsEngine failures", "[RiskMetrics]")
{
    RiskMetricsEngine engine;

    SECTION("Single period")
    {
        auto single = hand_series_.head(1);
        REQUIRE_THROWS_AS(engine.compute(single), ComputationError);
        REQUIRE_THROWS_WITH(engine.compute(single), ContainsSubstring("(1, 2)"));
    }

    SECTION("Empty series")
    {
        REQUIRE_THROWS_AS(engine.compute(ReturnSeries()), ComputationError);
    }

    SECTION("Null model")
    {
        REQUIRE_THROWS_AS(RiskMetricsEngine(nullptr), std::invalid_argument);
    }
}

TEST_CASE_METHOD(RiskMetricsTestFixture, "RiskMetricsEngine with another model", "[RiskMetrics]")
{
    RiskMetricsEngine engine(std::make_shared<DiagonalModel>());
    auto metrics = engine.compute(hand_series_);

    REQUIRE(engine.model().get_name() == "DiagonalModel");
    REQUIRE(metrics.covariance_between("A", "B") == 0.0);
    REQUIRE_THAT(metrics.volatility("A"), WithinAbs(std::sqrt(0.011675 / 3.0), 1e-12));
}
