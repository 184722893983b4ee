/**
 * @file sample_covariance.hpp
 * @brief Classical sample covariance estimator
 *
 * Formula (with bias correction):
 *     Cov = (1/(n-1)) * (X - mean(X))^T * (X - mean(X))
 */

#pragma once

#include "risk/risk_model.hpp"

namespace riskmetrics
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief Sample covariance matrix estimator
         *
         * Computes the classical sample covariance matrix from historical returns.
         * With bias correction (the default) the denominator is n-1.
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class SampleCovariance : public RiskModel
        {
        public:
            /**
             * @brief Construct sample covariance estimator
             * @param bias_correction Apply Bessel's correction (divide by n-1 vs n)
             */
            explicit SampleCovariance(bool bias_correction = true);

            ~SampleCovariance() override = default;

            /**
             * @brief Estimate covariance matrix
             * @param returns Matrix of returns (T x N: observations x assets)
             * @return Covariance matrix (N x N)
             * @throws std::invalid_argument if returns is empty or has < 2 observations
             */
            Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const override;

            /**
             * @brief Column standard deviations, computed directly
             *
             * Same normalisation as estimate_covariance(), so
             * vol(i)^2 == cov(i, i) up to rounding.
             */
            Eigen::VectorXd estimate_volatilities(
                const Eigen::MatrixXd &returns) const override;

            std::string get_name() const override;

            bool uses_bias_correction() const { return bias_correction_; }

        private:
            double normalization(Eigen::Index n_obs) const;

            bool bias_correction_; ///< Whether to apply Bessel's correction
        };

    } // namespace risk
} // namespace riskmetrics
