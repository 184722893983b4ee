/**
 * @file risk_metrics.cpp
 * @brief Implementation of RiskMetrics and RiskMetricsEngine
 */

#include "risk/risk_metrics.hpp"
#include "common/errors.hpp"
#include "risk/sample_covariance.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace riskmetrics
{
    namespace risk
    {

        namespace
        {
            std::string shape_of(const Eigen::MatrixXd &m)
            {
                return "(" + std::to_string(m.rows()) + ", " + std::to_string(m.cols()) + ")";
            }
        } // namespace

        // ============================================================================
        // RiskMetrics
        // ============================================================================

        Eigen::Index RiskMetrics::index_of(const std::string &ticker) const
        {
            const auto &symbols = returns.tickers();
            auto it = std::find(symbols.begin(), symbols.end(), ticker);
            if (it == symbols.end())
            {
                throw std::invalid_argument("Ticker not found: " + ticker);
            }
            return static_cast<Eigen::Index>(std::distance(symbols.begin(), it));
        }

        double RiskMetrics::volatility(const std::string &ticker) const
        {
            return volatilities(index_of(ticker));
        }

        double RiskMetrics::covariance_between(const std::string &a, const std::string &b) const
        {
            return covariance(index_of(a), index_of(b));
        }

        std::map<std::string, double> RiskMetrics::volatility_map() const
        {
            std::map<std::string, double> result;
            const auto &symbols = returns.tickers();
            for (size_t i = 0; i < symbols.size(); ++i)
            {
                result[symbols[i]] = volatilities(static_cast<Eigen::Index>(i));
            }
            return result;
        }

        void RiskMetrics::print_summary(std::ostream &out) const
        {
            const auto &symbols = returns.tickers();

            out << "Volatilities (" << returns.num_periods() << " periods, "
                << returns.first_date() << " to " << returns.last_date() << "):\n";
            for (size_t i = 0; i < symbols.size(); ++i)
            {
                out << "  " << std::setw(8) << std::left << symbols[i] << std::right
                    << std::fixed << std::setprecision(6) << volatilities(static_cast<Eigen::Index>(i)) << "\n";
            }

            out << "Covariance:\n  " << std::setw(8) << "";
            for (const auto &symbol : symbols)
            {
                out << std::setw(12) << symbol;
            }
            out << "\n";
            for (Eigen::Index i = 0; i < covariance.rows(); ++i)
            {
                out << "  " << std::setw(8) << std::left << symbols[static_cast<size_t>(i)] << std::right;
                for (Eigen::Index j = 0; j < covariance.cols(); ++j)
                {
                    out << std::setw(12) << std::fixed << std::setprecision(6) << covariance(i, j);
                }
                out << "\n";
            }
        }

        // ============================================================================
        // RiskMetricsEngine
        // ============================================================================

        RiskMetricsEngine::RiskMetricsEngine()
            : model_(std::make_shared<SampleCovariance>(true))
        {
        }

        RiskMetricsEngine::RiskMetricsEngine(std::shared_ptr<const RiskModel> model)
            : model_(std::move(model))
        {
            if (!model_)
            {
                throw std::invalid_argument("RiskMetricsEngine requires a risk model");
            }
        }

        RiskMetrics RiskMetricsEngine::compute(const ReturnSeries &returns) const
        {
            const Eigen::MatrixXd &data = returns.returns();

            Eigen::MatrixXd covariance;
            try
            {
                covariance = model_->estimate_covariance(data);
            }
            catch (const std::exception &e)
            {
                throw ComputationError("Error calculating covariance matrix. Returns matrix of shape: " +
                                       shape_of(data) + ". " + e.what());
            }

            Eigen::VectorXd volatilities;
            try
            {
                volatilities = model_->estimate_volatilities(data);
            }
            catch (const std::exception &e)
            {
                throw ComputationError("Error calculating volatilities. Returns matrix of shape: " +
                                       shape_of(data) + ". " + e.what());
            }

            spdlog::debug("{} over {} periods x {} assets", model_->get_name(), data.rows(), data.cols());

            return RiskMetrics{returns, volatilities, covariance};
        }

    } // namespace risk
} // namespace riskmetrics
