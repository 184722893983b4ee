/**
 * @file metrics_writer.hpp
 * @brief Export of RiskMetrics bundles to CSV and JSON.
 */

#ifndef RISKMETRICS_REPORT_METRICS_WRITER_HPP
#define RISKMETRICS_REPORT_METRICS_WRITER_HPP

#include "risk/risk_metrics.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace riskmetrics
{
    namespace report
    {

        /**
         * @class MetricsWriter
         * @brief Writes returns, volatilities and covariance to disk.
         *
         * CSV layouts:
         * - returns:      date,T1,T2,...
         * - volatilities: ticker,volatility
         * - covariance:   ticker,T1,T2,...  (one row per ticker)
         *
         * All write methods throw std::runtime_error if a file cannot be written.
         */
        class MetricsWriter
        {
        public:
            explicit MetricsWriter(int precision = 10);

            void save_returns_csv(const ReturnSeries &returns, const std::string &filepath) const;
            void save_volatilities_csv(const risk::RiskMetrics &metrics, const std::string &filepath) const;
            void save_covariance_csv(const risk::RiskMetrics &metrics, const std::string &filepath) const;

            /**
             * @brief JSON document with "tickers", "dates", "returns",
             *        "volatilities" (by symbol) and "covariance" (row-major).
             */
            nlohmann::json to_json(const risk::RiskMetrics &metrics) const;

            void save_json(const risk::RiskMetrics &metrics, const std::string &filepath) const;

            /**
             * @brief Write all four files as <directory>/<prefix>_{returns,volatilities,covariance}.csv
             *        and <directory>/<prefix>_metrics.json, creating the directory if needed.
             */
            void save_all(const risk::RiskMetrics &metrics,
                          const std::string &directory,
                          const std::string &prefix) const;

        private:
            int precision_;
        };

    } // namespace report
} // namespace riskmetrics

#endif // RISKMETRICS_REPORT_METRICS_WRITER_HPP
