/**
 * @file risk_metrics.hpp
 * @brief Volatility and covariance bundle for a return series.
 *
 * The engine is a pure computation: each call reads the series it is given
 * and returns a freshly computed RiskMetrics record.
 */

#pragma once

#include "data/return_series.hpp"
#include "risk/risk_model.hpp"

#include <Eigen/Dense>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>

namespace riskmetrics
{
    namespace risk
    {

        /**
         * @struct RiskMetrics
         * @brief Returns, volatilities and covariance for one period.
         *
         * volatilities and the covariance rows/columns are aligned with
         * returns.tickers().
         */
        struct RiskMetrics
        {
            ReturnSeries returns;       ///< Return series the metrics were computed on
            Eigen::VectorXd volatilities; ///< Sample standard deviation per asset
            Eigen::MatrixXd covariance;   ///< Sample covariance (assets x assets)

            const std::vector<std::string> &tickers() const { return returns.tickers(); }

            /**
             * @throws std::invalid_argument if the ticker is unknown.
             */
            double volatility(const std::string &ticker) const;

            /**
             * @throws std::invalid_argument if either ticker is unknown.
             */
            double covariance_between(const std::string &a, const std::string &b) const;

            /**
             * @brief Volatilities keyed by symbol.
             */
            std::map<std::string, double> volatility_map() const;

            void print_summary(std::ostream &out) const;

        private:
            Eigen::Index index_of(const std::string &ticker) const;
        };

        /**
         * @class RiskMetricsEngine
         * @brief Computes RiskMetrics from a ReturnSeries.
         *
         * Uses SampleCovariance with Bessel's correction unless another
         * model is supplied.
         *
         * Usage Example:
         * @code
         * RiskMetricsEngine engine;
         * RiskMetrics metrics = engine.compute(returns);
         * double vol = metrics.volatility("XLC");
         * @endcode
         */
        class RiskMetricsEngine
        {
        public:
            RiskMetricsEngine();

            explicit RiskMetricsEngine(std::shared_ptr<const RiskModel> model);

            /**
             * @brief Compute volatilities and covariance over all rows.
             * @throws ComputationError if the statistics cannot be produced;
             *         the message carries the (rows, cols) shape of the input.
             */
            RiskMetrics compute(const ReturnSeries &returns) const;

            const RiskModel &model() const { return *model_; }

        private:
            std::shared_ptr<const RiskModel> model_;
        };

    } // namespace risk
} // namespace riskmetrics
