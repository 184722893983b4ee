/**
 * @file historical_series_builder.cpp
 * @brief Implementation of HistoricalSeriesBuilder
 */

#include "data/historical_series_builder.hpp"
#include "common/date_utils.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace riskmetrics
{

    namespace
    {
        std::string join(const std::vector<std::string> &items)
        {
            std::ostringstream oss;
            oss << "[";
            for (size_t i = 0; i < items.size(); ++i)
            {
                oss << (i == 0 ? "" : ", ") << "'" << items[i] << "'";
            }
            oss << "]";
            return oss.str();
        }
    } // namespace

    HistoricalSeriesBuilder::HistoricalSeriesBuilder(const PriceSource &source) : source_(source)
    {
    }

    std::vector<int> HistoricalSeriesBuilder::earliest_years(const SamplingConfig &config) const
    {
        const std::string start = config.sample_period_start();
        const std::string &end = config.sample_period_end;

        std::vector<int> years;
        std::vector<std::string> missing;
        years.reserve(config.tickers.size());

        for (const auto &ticker : config.tickers)
        {
            spdlog::debug("Probing {} history for {} in [{}, {})", source_.get_name(), ticker, start, end);

            PriceHistory history = source_.fetch_history(ticker, start, end);
            if (history.empty())
            {
                missing.push_back(ticker);
                years.push_back(0);
                continue;
            }

            auto earliest = std::min_element(history.begin(), history.end(),
                                             [](const PricePoint &a, const PricePoint &b)
                                             { return a.date < b.date; });
            years.push_back(dates::year_of(earliest->date));
        }

        if (!missing.empty())
        {
            spdlog::warn("No price history between {} and {} for {}", start, end, join(missing));
            throw DataUnavailableError("No historical data during specified sample period for " +
                                           join(missing) + ".",
                                       missing);
        }

        return years;
    }

    std::vector<std::string> HistoricalSeriesBuilder::check_availability(const std::vector<std::string> &tickers,
                                                                         const std::vector<int> &years,
                                                                         int start_year)
    {
        if (tickers.size() != years.size())
        {
            throw std::invalid_argument("Tickers and earliest years must have the same length");
        }

        std::vector<std::string> bad;
        if (years.empty())
        {
            return bad;
        }

        const auto bounds = std::minmax_element(years.begin(), years.end());
        const int min_year = *bounds.first;
        const int max_year = *bounds.second;

        if (max_year != min_year && max_year != start_year)
        {
            for (size_t i = 0; i < years.size(); ++i)
            {
                if (years[i] != start_year)
                {
                    bad.push_back(tickers[i]);
                }
            }
        }

        return bad;
    }

    ReturnSeries HistoricalSeriesBuilder::build(const SamplingConfig &config) const
    {
        const std::string start = config.sample_period_start();
        const std::string &end = config.sample_period_end;

        // 1. Earliest observation per ticker
        std::vector<int> years = earliest_years(config);

        // 2. Cross-instrument coverage
        std::vector<std::string> bad = check_availability(config.tickers, years, dates::year_of(start));
        if (!bad.empty())
        {
            spdlog::warn("Historical data does not cover {} for {}", start, join(bad));
            throw DataUnavailableError("Historical data during specified sample period does not exist for " +
                                           join(bad) + ".",
                                       bad);
        }

        // 3. Combined adjusted close table
        spdlog::info("Fetching adjusted close prices for {} tickers from {} ({} to {})",
                     config.tickers.size(), source_.get_name(), start, end);

        // Columns follow the configured ticker order whatever the source returns
        PriceTable prices = source_.fetch_prices(config.tickers, start, end).select_assets(config.tickers);
        if (prices.empty())
        {
            throw DataUnavailableError("Price source returned no observations between " + start + " and " + end + ".",
                                       config.tickers);
        }

        // 4. Month-end resample and percent change, zero-filled
        PriceTable monthly = prices.resample_month_end();
        ReturnSeries returns = monthly.percent_change();

        spdlog::info("Built return series: {} monthly periods x {} assets ({} to {})",
                     returns.num_periods(), returns.num_assets(), returns.first_date(), returns.last_date());

        return returns;
    }

} // namespace riskmetrics
