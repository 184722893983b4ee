/**
 * @file sample_covariance.cpp
 * @brief Implementation of sample covariance estimator
 */

#include "risk/sample_covariance.hpp"

namespace riskmetrics
{
    namespace risk
    {

        SampleCovariance::SampleCovariance(bool bias_correction) : bias_correction_(bias_correction)
        {
        }

        Eigen::MatrixXd SampleCovariance::estimate_covariance(const Eigen::MatrixXd &returns) const
        {
            validate_returns(returns);

            // Center the data: subtract mean from each column
            Eigen::RowVectorXd means = returns.colwise().mean();
            Eigen::MatrixXd centered = returns.rowwise() - means;

            Eigen::MatrixXd covariance = (centered.transpose() * centered) / normalization(returns.rows());

            return ensure_symmetric(covariance);
        }

        Eigen::VectorXd SampleCovariance::estimate_volatilities(const Eigen::MatrixXd &returns) const
        {
            validate_returns(returns);

            Eigen::RowVectorXd means = returns.colwise().mean();
            Eigen::MatrixXd centered = returns.rowwise() - means;

            Eigen::VectorXd sum_sq = centered.array().square().colwise().sum().transpose();
            return (sum_sq / normalization(returns.rows())).cwiseSqrt();
        }

        std::string SampleCovariance::get_name() const
        {
            return "SampleCovariance";
        }

        double SampleCovariance::normalization(Eigen::Index n_obs) const
        {
            // Bessel's correction divides by (n-1), maximum likelihood by n
            return bias_correction_ ? static_cast<double>(n_obs - 1) : static_cast<double>(n_obs);
        }

    } // namespace risk
} // namespace riskmetrics
