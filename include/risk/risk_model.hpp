/**
 * @file risk_model.hpp
 * @brief Abstract interface for covariance estimation methods
 *
 * Provides a common interface for the estimators used by the risk metrics
 * engine. All risk models must implement estimate_covariance; volatilities
 * are derived from its diagonal unless a model overrides them.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace riskmetrics
{
    namespace risk
    {

        /**
         * @class RiskModel
         * @brief Abstract base class for risk model estimation
         *
         * Usage Example:
         * @code
         * auto risk_model = std::make_unique<SampleCovariance>(true);
         * Eigen::MatrixXd cov = risk_model->estimate_covariance(returns);
         * @endcode
         */
        class RiskModel
        {
        public:
            virtual ~RiskModel() = default;

            /**
             * @brief Estimate covariance matrix from return data
             * @param returns Matrix of returns (rows = observations, cols = assets)
             * @return Covariance matrix (n_assets x n_assets)
             * @throws std::invalid_argument if returns matrix is empty
             *
             * @note The returned matrix is guaranteed to be symmetric
             */
            virtual Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const = 0;

            /**
             * @brief Estimate per-asset volatility (standard deviation)
             * @param returns Matrix of returns (rows = observations, cols = assets)
             * @return Vector of volatilities (n_assets)
             *
             * Default implementation: square root of the covariance diagonal
             */
            virtual Eigen::VectorXd estimate_volatilities(
                const Eigen::MatrixXd &returns) const;

            /**
             * @brief Get the name of the risk model
             */
            virtual std::string get_name() const = 0;

        protected:
            /**
             * @brief Validate input returns matrix
             * @param returns Matrix to validate
             * @throws std::invalid_argument if validation fails
             */
            static void validate_returns(const Eigen::MatrixXd &returns);

            /**
             * @brief Enforce exact symmetry: (M + M^T) / 2
             */
            static Eigen::MatrixXd ensure_symmetric(const Eigen::MatrixXd &matrix);
        };

    } // namespace risk
} // namespace riskmetrics
