/**
 * @file price_table.cpp
 * @brief Implementation of PriceTable class
 */

#include "data/price_table.hpp"
#include "common/date_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace riskmetrics
{

    // ============================================================================
    // Constructors
    // ============================================================================

    PriceTable::PriceTable(const std::vector<std::string> &tickers)
        : prices_(0, static_cast<Eigen::Index>(tickers.size())), tickers_(tickers)
    {
        build_index_maps();
    }

    PriceTable::PriceTable(const Eigen::MatrixXd &prices,
                           const std::vector<std::string> &dates,
                           const std::vector<std::string> &tickers)
        : prices_(prices), dates_(dates), tickers_(tickers)
    {
        // Validate dimensions
        if (prices_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw std::invalid_argument("Price matrix rows must match dates vector size");
        }
        if (prices_.cols() != static_cast<Eigen::Index>(tickers_.size()))
        {
            throw std::invalid_argument("Price matrix columns must match tickers vector size");
        }

        for (size_t i = 0; i < dates_.size(); ++i)
        {
            if (!dates::is_valid_date(dates_[i]))
            {
                throw std::invalid_argument("Invalid date in price table: " + dates_[i]);
            }
            if (i > 0 && dates_[i] <= dates_[i - 1])
            {
                throw std::invalid_argument("Price table dates must be strictly increasing: " +
                                            dates_[i - 1] + " then " + dates_[i]);
            }
        }

        build_index_maps();
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    Eigen::VectorXd PriceTable::get_prices(const std::string &ticker) const
    {
        int idx = find_ticker_index(ticker);
        if (idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        return prices_.col(idx);
    }

    bool PriceTable::has_ticker(const std::string &ticker) const
    {
        return find_ticker_index(ticker) >= 0;
    }

    std::string PriceTable::first_valid_date(const std::string &ticker) const
    {
        int idx = find_ticker_index(ticker);
        if (idx < 0)
        {
            return "";
        }

        for (Eigen::Index i = 0; i < prices_.rows(); ++i)
        {
            if (!std::isnan(prices_(i, idx)))
            {
                return dates_[i];
            }
        }
        return "";
    }

    // ================================
    // Data Filtering and Manipulation
    // ================================

    PriceTable PriceTable::slice_dates(const std::string &start_date,
                                       const std::string &end_date) const
    {
        auto first = std::lower_bound(dates_.begin(), dates_.end(), start_date);
        auto last = std::lower_bound(first, dates_.end(), end_date);

        const auto start_idx = static_cast<Eigen::Index>(std::distance(dates_.begin(), first));
        const auto num_periods = static_cast<Eigen::Index>(std::distance(first, last));

        Eigen::MatrixXd sliced = prices_.block(start_idx, 0, num_periods, prices_.cols());
        std::vector<std::string> sliced_dates(first, last);

        return PriceTable(sliced, sliced_dates, tickers_);
    }

    PriceTable PriceTable::select_assets(const std::vector<std::string> &selected_tickers) const
    {
        Eigen::MatrixXd selected(prices_.rows(), static_cast<Eigen::Index>(selected_tickers.size()));
        selected.setConstant(std::numeric_limits<double>::quiet_NaN());

        for (size_t j = 0; j < selected_tickers.size(); ++j)
        {
            int idx = find_ticker_index(selected_tickers[j]);
            if (idx >= 0)
            {
                selected.col(j) = prices_.col(idx);
            }
        }

        return PriceTable(selected, dates_, selected_tickers);
    }

    PriceTable PriceTable::forward_fill() const
    {
        Eigen::MatrixXd filled_prices = prices_;

        for (Eigen::Index j = 0; j < filled_prices.cols(); ++j)
        {
            double last_valid = std::numeric_limits<double>::quiet_NaN();

            for (Eigen::Index i = 0; i < filled_prices.rows(); ++i)
            {
                if (!std::isnan(filled_prices(i, j)))
                {
                    last_valid = filled_prices(i, j);
                }
                else if (!std::isnan(last_valid))
                {
                    filled_prices(i, j) = last_valid;
                }
            }
        }

        return PriceTable(filled_prices, dates_, tickers_);
    }

    PriceTable PriceTable::resample_month_end() const
    {
        if (dates_.empty())
        {
            return PriceTable(tickers_);
        }

        // One bin per calendar month from the first to the last observation
        std::vector<std::string> month_ends;
        std::string current = dates::month_end(dates_.front());
        const std::string last = dates::month_end(dates_.back());
        while (current <= last)
        {
            month_ends.push_back(current);
            current = dates::month_end(dates::add_days(current, 1));
        }

        Eigen::MatrixXd resampled(static_cast<Eigen::Index>(month_ends.size()), prices_.cols());
        resampled.setConstant(std::numeric_limits<double>::quiet_NaN());

        // Dates are sorted, so walking rows in order leaves the last
        // observation of each month in its bin
        size_t bin = 0;
        for (size_t i = 0; i < dates_.size(); ++i)
        {
            while (dates_[i] > month_ends[bin])
            {
                ++bin;
            }

            for (Eigen::Index j = 0; j < prices_.cols(); ++j)
            {
                double value = prices_(static_cast<Eigen::Index>(i), j);
                if (!std::isnan(value))
                {
                    resampled(static_cast<Eigen::Index>(bin), j) = value;
                }
            }
        }

        return PriceTable(resampled, month_ends, tickers_);
    }

    ReturnSeries PriceTable::percent_change() const
    {
        const Eigen::MatrixXd filled = forward_fill().prices();
        Eigen::MatrixXd returns = Eigen::MatrixXd::Zero(filled.rows(), filled.cols());

        for (Eigen::Index i = 1; i < filled.rows(); ++i)
        {
            for (Eigen::Index j = 0; j < filled.cols(); ++j)
            {
                double p_t = filled(i, j);
                double p_tm1 = filled(i - 1, j);

                if (std::isnan(p_t) || std::isnan(p_tm1) || p_tm1 == 0.0)
                {
                    // Undefined return, zero-filled
                    continue;
                }

                double r = (p_t - p_tm1) / p_tm1;
                returns(i, j) = std::isfinite(r) ? r : 0.0;
            }
        }

        return ReturnSeries(returns, dates_, tickers_);
    }

    // ===================
    // Validation Methods
    // ===================

    size_t PriceTable::count_missing() const
    {
        return static_cast<size_t>(prices_.array().isNaN().count());
    }

    void PriceTable::print_summary() const
    {
        std::cout << "\n=== Price Table Summary ===\n";
        std::cout << "Dimensions: " << prices_.rows() << " dates x "
                  << prices_.cols() << " assets\n";
        if (!dates_.empty())
        {
            std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
        }
        std::cout << "Assets: ";
        for (const auto &ticker : tickers_)
        {
            std::cout << ticker << " ";
        }
        std::cout << "\nMissing values: " << count_missing() << "\n";
        std::cout << "===========================\n"
                  << std::endl;
    }

    // =========================
    // Private Helper Methods
    // =========================

    int PriceTable::find_ticker_index(const std::string &ticker) const
    {
        auto it = ticker_index_.find(ticker);
        if (it != ticker_index_.end())
        {
            return static_cast<int>(it->second);
        }
        return -1;
    }

    void PriceTable::build_index_maps()
    {
        ticker_index_.clear();

        for (size_t i = 0; i < tickers_.size(); ++i)
        {
            if (!ticker_index_.emplace(tickers_[i], i).second)
            {
                throw std::invalid_argument("Duplicate ticker in price table: " + tickers_[i]);
            }
        }
    }

} // namespace riskmetrics
