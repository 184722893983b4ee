/**
 * @file return_series.cpp
 * @brief Implementation of ReturnSeries
 */

#include "data/return_series.hpp"
#include "common/date_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <set>
#include <stdexcept>

namespace riskmetrics
{

    ReturnSeries::ReturnSeries(const Eigen::MatrixXd &returns,
                               const std::vector<std::string> &dates,
                               const std::vector<std::string> &tickers)
        : returns_(returns), dates_(dates), tickers_(tickers)
    {
        if (returns_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw std::invalid_argument("Return matrix rows must match dates vector size");
        }
        if (returns_.cols() != static_cast<Eigen::Index>(tickers_.size()))
        {
            throw std::invalid_argument("Return matrix columns must match tickers vector size");
        }

        for (size_t i = 0; i < dates_.size(); ++i)
        {
            if (!dates::is_valid_date(dates_[i]))
            {
                throw std::invalid_argument("Invalid date in return series: " + dates_[i]);
            }
            if (i > 0 && dates_[i] <= dates_[i - 1])
            {
                throw std::invalid_argument("Return series dates must be strictly increasing: " +
                                            dates_[i - 1] + " then " + dates_[i]);
            }
        }

        std::set<std::string> unique(tickers_.begin(), tickers_.end());
        if (unique.size() != tickers_.size())
        {
            throw std::invalid_argument("Return series tickers must be unique");
        }

        if (!returns_.allFinite())
        {
            throw std::invalid_argument("Return series contains NaN or Inf values.");
        }
    }

    const std::string &ReturnSeries::first_date() const
    {
        if (dates_.empty())
        {
            throw std::out_of_range("Return series is empty");
        }
        return dates_.front();
    }

    const std::string &ReturnSeries::last_date() const
    {
        if (dates_.empty())
        {
            throw std::out_of_range("Return series is empty");
        }
        return dates_.back();
    }

    Eigen::VectorXd ReturnSeries::get_returns(const std::string &ticker) const
    {
        int idx = find_ticker_index(ticker);
        if (idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        return returns_.col(idx);
    }

    double ReturnSeries::get_return(const std::string &ticker, const std::string &date) const
    {
        int ticker_idx = find_ticker_index(ticker);
        int date_idx = find_date_index(date);

        if (ticker_idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        if (date_idx < 0)
        {
            throw std::invalid_argument("Date not found: " + date);
        }

        return returns_(date_idx, ticker_idx);
    }

    Eigen::RowVectorXd ReturnSeries::row(size_t index) const
    {
        if (index >= num_periods())
        {
            throw std::out_of_range("Row index out of range: " + std::to_string(index));
        }
        return returns_.row(static_cast<Eigen::Index>(index));
    }

    int ReturnSeries::find_date_index(const std::string &date) const
    {
        auto it = std::lower_bound(dates_.begin(), dates_.end(), date);
        if (it == dates_.end() || *it != date)
        {
            return -1;
        }
        return static_cast<int>(std::distance(dates_.begin(), it));
    }

    ReturnSeries ReturnSeries::head(size_t count) const
    {
        if (count > num_periods())
        {
            throw std::out_of_range("Cannot take " + std::to_string(count) + " rows from a series of " +
                                    std::to_string(num_periods()));
        }

        Eigen::MatrixXd leading = returns_.topRows(static_cast<Eigen::Index>(count));
        std::vector<std::string> leading_dates(dates_.begin(), dates_.begin() + count);

        return ReturnSeries(leading, leading_dates, tickers_);
    }

    ReturnSeries ReturnSeries::through(const std::string &end_date) const
    {
        int end_idx = find_date_index(end_date);
        if (end_idx < 0)
        {
            throw std::invalid_argument("End date not found: " + end_date);
        }
        return head(static_cast<size_t>(end_idx) + 1);
    }

    void ReturnSeries::print_head(size_t rows) const
    {
        std::cout << std::setw(12) << std::left << "date";
        for (const auto &ticker : tickers_)
        {
            std::cout << std::setw(12) << std::right << ticker;
        }
        std::cout << "\n";

        const size_t shown = std::min(rows, num_periods());
        for (size_t i = 0; i < shown; ++i)
        {
            std::cout << std::setw(12) << std::left << dates_[i];
            for (Eigen::Index j = 0; j < returns_.cols(); ++j)
            {
                std::cout << std::setw(12) << std::right << std::fixed << std::setprecision(6)
                          << returns_(static_cast<Eigen::Index>(i), j);
            }
            std::cout << "\n";
        }
        std::cout << "[" << num_periods() << " rows x " << num_assets() << " columns]" << std::endl;
    }

    int ReturnSeries::find_ticker_index(const std::string &ticker) const
    {
        auto it = std::find(tickers_.begin(), tickers_.end(), ticker);
        if (it == tickers_.end())
        {
            return -1;
        }
        return static_cast<int>(std::distance(tickers_.begin(), it));
    }

} // namespace riskmetrics
