/**
 * @file metrics_writer.cpp
 * @brief Implementation of MetricsWriter
 */

#include "report/metrics_writer.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace riskmetrics
{
    namespace report
    {

        namespace
        {
            std::ofstream open_for_writing(const std::string &filepath)
            {
                std::ofstream file(filepath);
                if (!file.is_open())
                {
                    throw std::runtime_error("Could not open file for writing: " + filepath);
                }
                return file;
            }

            void finish(std::ofstream &file, const std::string &filepath)
            {
                file.close();
                if (file.fail())
                {
                    throw std::runtime_error("Failed writing to file: " + filepath);
                }
                spdlog::debug("Wrote {}", filepath);
            }
        } // namespace

        MetricsWriter::MetricsWriter(int precision) : precision_(precision)
        {
            if (precision_ < 1 || precision_ > 17)
            {
                throw std::invalid_argument("Precision must be between 1 and 17");
            }
        }

        void MetricsWriter::save_returns_csv(const ReturnSeries &returns, const std::string &filepath) const
        {
            std::ofstream file = open_for_writing(filepath);

            file << "date";
            for (const auto &ticker : returns.tickers())
            {
                file << "," << ticker;
            }
            file << "\n";

            const auto &data = returns.returns();
            const auto &dates = returns.dates();
            for (size_t i = 0; i < dates.size(); ++i)
            {
                file << dates[i];
                for (Eigen::Index j = 0; j < data.cols(); ++j)
                {
                    file << "," << std::fixed << std::setprecision(precision_)
                         << data(static_cast<Eigen::Index>(i), j);
                }
                file << "\n";
            }

            finish(file, filepath);
        }

        void MetricsWriter::save_volatilities_csv(const risk::RiskMetrics &metrics, const std::string &filepath) const
        {
            std::ofstream file = open_for_writing(filepath);

            file << "ticker,volatility\n";
            const auto &tickers = metrics.tickers();
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                file << tickers[i] << "," << std::fixed << std::setprecision(precision_)
                     << metrics.volatilities(static_cast<Eigen::Index>(i)) << "\n";
            }

            finish(file, filepath);
        }

        void MetricsWriter::save_covariance_csv(const risk::RiskMetrics &metrics, const std::string &filepath) const
        {
            std::ofstream file = open_for_writing(filepath);

            const auto &tickers = metrics.tickers();
            file << "ticker";
            for (const auto &ticker : tickers)
            {
                file << "," << ticker;
            }
            file << "\n";

            for (Eigen::Index i = 0; i < metrics.covariance.rows(); ++i)
            {
                file << tickers[static_cast<size_t>(i)];
                for (Eigen::Index j = 0; j < metrics.covariance.cols(); ++j)
                {
                    file << "," << std::fixed << std::setprecision(precision_) << metrics.covariance(i, j);
                }
                file << "\n";
            }

            finish(file, filepath);
        }

        nlohmann::json MetricsWriter::to_json(const risk::RiskMetrics &metrics) const
        {
            const auto &returns = metrics.returns;

            nlohmann::json j;
            j["tickers"] = returns.tickers();
            j["dates"] = returns.dates();

            nlohmann::json rows = nlohmann::json::array();
            for (size_t i = 0; i < returns.num_periods(); ++i)
            {
                Eigen::RowVectorXd row = returns.row(i);
                rows.push_back(std::vector<double>(row.data(), row.data() + row.size()));
            }
            j["returns"] = rows;

            j["volatilities"] = metrics.volatility_map();

            nlohmann::json covariance = nlohmann::json::array();
            for (Eigen::Index i = 0; i < metrics.covariance.rows(); ++i)
            {
                nlohmann::json row = nlohmann::json::array();
                for (Eigen::Index k = 0; k < metrics.covariance.cols(); ++k)
                {
                    row.push_back(metrics.covariance(i, k));
                }
                covariance.push_back(row);
            }
            j["covariance"] = covariance;

            return j;
        }

        void MetricsWriter::save_json(const risk::RiskMetrics &metrics, const std::string &filepath) const
        {
            std::ofstream file = open_for_writing(filepath);
            file << to_json(metrics).dump(2) << "\n";
            finish(file, filepath);
        }

        void MetricsWriter::save_all(const risk::RiskMetrics &metrics,
                                     const std::string &directory,
                                     const std::string &prefix) const
        {
            std::error_code ec;
            std::filesystem::create_directories(directory, ec);
            if (ec)
            {
                throw std::runtime_error("Could not create output directory '" + directory + "': " + ec.message());
            }

            const std::filesystem::path base(directory);
            save_returns_csv(metrics.returns, (base / (prefix + "_returns.csv")).string());
            save_volatilities_csv(metrics, (base / (prefix + "_volatilities.csv")).string());
            save_covariance_csv(metrics, (base / (prefix + "_covariance.csv")).string());
            save_json(metrics, (base / (prefix + "_metrics.json")).string());

            spdlog::info("Exported {} metrics to {}", prefix, directory);
        }

    } // namespace report
} // namespace riskmetrics
