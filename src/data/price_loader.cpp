/**
 * @file price_loader.cpp
 * @brief Implementation of PriceLoader
 */

#include "data/price_loader.hpp"
#include "common/date_utils.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <set>

namespace riskmetrics
{

    namespace
    {
        void require_file(const std::string &filepath)
        {
            if (!std::filesystem::exists(filepath))
            {
                throw NotFoundError("The file '" + filepath + "' does not exist.");
            }
        }

        // 1970-01-01 was a Thursday
        bool is_weekday(const std::string &date)
        {
            long long days = dates::days_since_epoch(date);
            long long dow = ((days % 7) + 7 + 3) % 7; // 0=Mon, 6=Sun
            return dow < 5;
        }

        PriceTable build_table(const std::map<std::string, std::map<std::string, double>> &data_map,
                               const std::vector<std::string> &tickers)
        {
            std::vector<std::string> dates;
            dates.reserve(data_map.size());
            for (const auto &entry : data_map)
            {
                dates.push_back(entry.first);
            }

            Eigen::MatrixXd prices(static_cast<Eigen::Index>(dates.size()),
                                   static_cast<Eigen::Index>(tickers.size()));
            prices.setConstant(std::numeric_limits<double>::quiet_NaN());

            Eigen::Index i = 0;
            for (const auto &entry : data_map)
            {
                for (size_t j = 0; j < tickers.size(); ++j)
                {
                    auto it = entry.second.find(tickers[j]);
                    if (it != entry.second.end())
                    {
                        prices(i, static_cast<Eigen::Index>(j)) = it->second;
                    }
                }
                ++i;
            }

            return PriceTable(prices, dates, tickers);
        }
    } // namespace

    // ===========================
    // CSV Loading - Wide Format
    // ===========================

    PriceTable PriceLoader::load_csv_wide(const std::string &filepath,
                                          const std::vector<std::string> &tickers)
    {
        require_file(filepath);

        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        if (header.empty() || trim(header[0]) != "date")
        {
            throw std::runtime_error("CSV must start with 'date' column");
        }

        std::vector<std::string> all_tickers;
        for (size_t i = 1; i < header.size(); ++i)
        {
            all_tickers.push_back(trim(header[i]));
        }

        // Determine which columns to load
        std::vector<size_t> column_indices;
        std::vector<std::string> selected_tickers;

        if (tickers.empty())
        {
            for (size_t i = 0; i < all_tickers.size(); ++i)
            {
                column_indices.push_back(i);
                selected_tickers.push_back(all_tickers[i]);
            }
        }
        else
        {
            for (const auto &ticker : tickers)
            {
                auto it = std::find(all_tickers.begin(), all_tickers.end(), ticker);
                if (it != all_tickers.end())
                {
                    column_indices.push_back(static_cast<size_t>(std::distance(all_tickers.begin(), it)));
                    selected_tickers.push_back(ticker);
                }
                else
                {
                    spdlog::warn("Ticker {} not present in {}", ticker, filepath);
                }
            }

            if (column_indices.empty())
            {
                throw std::runtime_error("None of the specified tickers found in CSV");
            }
        }

        std::map<std::string, std::map<std::string, double>> data_map; // date -> ticker -> price
        size_t line_number = 1;

        while (std::getline(file, line))
        {
            ++line_number;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            std::string date = trim(fields[0]);
            if (!dates::is_valid_date(date))
            {
                throw std::runtime_error("Invalid date '" + date + "' at line " + std::to_string(line_number) +
                                         " of " + filepath);
            }
            if (data_map.count(date))
            {
                throw std::runtime_error("Duplicate date '" + date + "' in " + filepath);
            }

            auto &row = data_map[date];
            for (size_t k = 0; k < column_indices.size(); ++k)
            {
                size_t idx = column_indices[k] + 1;
                if (idx < fields.size())
                {
                    double price = parse_price(fields[idx]);
                    if (!std::isnan(price))
                    {
                        row[selected_tickers[k]] = price;
                    }
                }
            }
        }

        if (data_map.empty())
        {
            throw std::runtime_error("No valid data found in CSV file");
        }

        spdlog::debug("Loaded {} dates x {} tickers from {}", data_map.size(), selected_tickers.size(), filepath);
        return build_table(data_map, selected_tickers);
    }

    // ===========================
    // CSV Loading - Long Format
    // ===========================

    PriceTable PriceLoader::load_csv_long(const std::string &filepath,
                                          const std::vector<std::string> &tickers)
    {
        require_file(filepath);

        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::map<std::string, std::map<std::string, double>> data_map; // date -> ticker -> price
        std::vector<std::string> seen_tickers;

        // Skip header
        std::getline(file, line);
        size_t line_number = 1;

        while (std::getline(file, line))
        {
            ++line_number;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() < 3)
            {
                throw std::runtime_error("Expected date,ticker,price at line " + std::to_string(line_number) +
                                         " of " + filepath);
            }

            std::string date = trim(fields[0]);
            std::string ticker = trim(fields[1]);
            double price = parse_price(fields[2]);

            if (!dates::is_valid_date(date))
            {
                throw std::runtime_error("Invalid date '" + date + "' at line " + std::to_string(line_number) +
                                         " of " + filepath);
            }

            if (!tickers.empty() &&
                std::find(tickers.begin(), tickers.end(), ticker) == tickers.end())
            {
                continue;
            }

            if (std::find(seen_tickers.begin(), seen_tickers.end(), ticker) == seen_tickers.end())
            {
                seen_tickers.push_back(ticker);
            }

            auto &row = data_map[date];
            if (row.count(ticker))
            {
                throw std::runtime_error("Duplicate observation for " + ticker + " on " + date);
            }
            if (!std::isnan(price))
            {
                row[ticker] = price;
            }
        }

        if (data_map.empty() || seen_tickers.empty())
        {
            throw std::runtime_error("No valid data found in CSV file");
        }

        // Requested order when a filter was given, otherwise first appearance
        std::vector<std::string> ordered;
        if (tickers.empty())
        {
            ordered = seen_tickers;
        }
        else
        {
            for (const auto &ticker : tickers)
            {
                if (std::find(seen_tickers.begin(), seen_tickers.end(), ticker) != seen_tickers.end())
                {
                    ordered.push_back(ticker);
                }
            }
        }

        spdlog::debug("Loaded {} dates x {} tickers from {}", data_map.size(), ordered.size(), filepath);
        return build_table(data_map, ordered);
    }

    // ========================
    // Auto-detect CSV Format
    // ========================

    PriceTable PriceLoader::load_csv(const std::string &filepath,
                                     const std::vector<std::string> &tickers)
    {
        require_file(filepath);

        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::getline(file, line);
        file.close();

        auto header = parse_csv_line(line);

        // Wide format: date, ticker1, ticker2, ...
        // Long format: date, ticker, price
        if (header.size() == 3 &&
            (trim(header[1]) == "ticker" || trim(header[1]) == "symbol"))
        {
            return load_csv_long(filepath, tickers);
        }
        return load_csv_wide(filepath, tickers);
    }

    // ==================
    // Export Methods
    // ==================

    void PriceLoader::save_csv_wide(const PriceTable &data, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date";
        for (const auto &ticker : data.tickers())
        {
            file << "," << ticker;
        }
        file << "\n";

        const auto &prices = data.prices();
        const auto &dates = data.dates();

        for (size_t i = 0; i < dates.size(); ++i)
        {
            file << dates[i];
            for (Eigen::Index j = 0; j < prices.cols(); ++j)
            {
                double value = prices(static_cast<Eigen::Index>(i), j);
                file << ",";
                if (!std::isnan(value))
                {
                    file << std::fixed << std::setprecision(6) << value;
                }
            }
            file << "\n";
        }

        if (!file)
        {
            throw std::runtime_error("Failed writing to file: " + filepath);
        }
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    PriceTable PriceLoader::generate_synthetic_data(const SyntheticPriceSpec &spec)
    {
        if (!dates::is_valid_date(spec.start_date) || !dates::is_valid_date(spec.end_date))
        {
            throw std::invalid_argument("Synthetic data needs YYYY-MM-DD start and end dates");
        }
        if (spec.volatility <= 0.0)
        {
            throw std::invalid_argument("Volatility must be positive");
        }

        std::vector<std::string> dates;
        for (std::string date = spec.start_date; date < spec.end_date; date = dates::add_days(date, 1))
        {
            if (is_weekday(date))
            {
                dates.push_back(date);
            }
        }

        std::mt19937 gen(spec.seed);
        std::normal_distribution<double> dist(spec.drift, spec.volatility);

        Eigen::MatrixXd prices(static_cast<Eigen::Index>(dates.size()),
                               static_cast<Eigen::Index>(spec.tickers.size()));
        prices.setConstant(std::numeric_limits<double>::quiet_NaN());

        // Generate prices (geometric Brownian motion)
        for (size_t j = 0; j < spec.tickers.size(); ++j)
        {
            std::string listing = spec.start_date;
            auto it = spec.first_dates.find(spec.tickers[j]);
            if (it != spec.first_dates.end())
            {
                listing = it->second;
            }

            double price = 100.0;
            bool listed = false;
            for (size_t i = 0; i < dates.size(); ++i)
            {
                // Draw for every date so late listings do not shift other columns
                double return_val = dist(gen);
                if (dates[i] < listing)
                    continue;

                if (listed)
                {
                    price *= (1.0 + return_val);
                }
                listed = true;
                prices(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = price;
            }
        }

        return PriceTable(prices, dates, spec.tickers);
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<std::string> PriceLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string PriceLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double PriceLoader::parse_price(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        errno = 0;
        char *end = nullptr;
        double value = std::strtod(trimmed.c_str(), &end);
        if (end != trimmed.c_str() + trimmed.size() || errno == ERANGE)
        {
            throw std::runtime_error("Invalid price value: '" + trimmed + "'");
        }
        return value;
    }

} // namespace riskmetrics
