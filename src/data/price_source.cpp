/**
 * @file price_source.cpp
 * @brief Implementation of TablePriceSource
 */

#include "data/price_source.hpp"

#include <cmath>
#include <utility>

namespace riskmetrics
{

    TablePriceSource::TablePriceSource(PriceTable table) : table_(std::move(table))
    {
    }

    PriceHistory TablePriceSource::fetch_history(const std::string &symbol,
                                                 const std::string &start_date,
                                                 const std::string &end_date) const
    {
        PriceHistory history;
        if (!table_.has_ticker(symbol))
        {
            return history;
        }

        PriceTable window = table_.slice_dates(start_date, end_date);
        Eigen::VectorXd prices = window.get_prices(symbol);

        for (Eigen::Index i = 0; i < prices.size(); ++i)
        {
            if (!std::isnan(prices(i)))
            {
                history.push_back({window.dates()[static_cast<size_t>(i)], prices(i)});
            }
        }

        return history;
    }

    PriceTable TablePriceSource::fetch_prices(const std::vector<std::string> &symbols,
                                              const std::string &start_date,
                                              const std::string &end_date) const
    {
        return table_.slice_dates(start_date, end_date).select_assets(symbols);
    }

    std::string TablePriceSource::get_name() const
    {
        return "TablePriceSource";
    }

} // namespace riskmetrics
