/**
 * @file historical_series_builder.hpp
 * @brief Builds the monthly return series for a sampling configuration.
 */

#ifndef RISKMETRICS_DATA_HISTORICAL_SERIES_BUILDER_HPP
#define RISKMETRICS_DATA_HISTORICAL_SERIES_BUILDER_HPP

#include "config/sampling_config.hpp"
#include "data/price_source.hpp"
#include "data/return_series.hpp"

#include <string>
#include <vector>

namespace riskmetrics
{

    /**
     * @class HistoricalSeriesBuilder
     * @brief Turns raw price observations into a monthly percent-return table.
     *
     * Steps performed by build():
     * 1. Probe every ticker's history over [start, end) and record the
     *    year of its earliest observation.
     * 2. Reject inconsistent coverage (see check_availability()).
     * 3. Fetch the combined adjusted close table over the same window.
     * 4. Resample to calendar month ends and take row-over-row changes,
     *    with undefined returns set to 0.
     *
     * The builder holds a reference to the source; the source must outlive it.
     *
     * Usage Example:
     * @code
     * TablePriceSource source(PriceLoader::load_csv("prices.csv"));
     * HistoricalSeriesBuilder builder(source);
     * ReturnSeries returns = builder.build(SamplingConfig::load_from_file("config.json"));
     * @endcode
     */
    class HistoricalSeriesBuilder
    {
    public:
        explicit HistoricalSeriesBuilder(const PriceSource &source);

        // A temporary source would not outlive the builder
        HistoricalSeriesBuilder(const PriceSource &&) = delete;

        /**
         * @brief Build the return series for a validated configuration.
         * @throws DataUnavailableError if price history does not cover the window.
         */
        ReturnSeries build(const SamplingConfig &config) const;

        /**
         * @brief Earliest observation year of each ticker, in config order.
         * @throws DataUnavailableError naming every ticker without any observation.
         */
        std::vector<int> earliest_years(const SamplingConfig &config) const;

        /**
         * @brief Coverage rule applied to the earliest observation years.
         *
         * Coverage is inconsistent when the years disagree and the latest of
         * them is not the requested start year. In that case every ticker
         * whose earliest year differs from the start year is reported.
         *
         * @param tickers Symbols, aligned with @p years.
         * @param years Earliest observation year per symbol.
         * @param start_year Year of the requested sample start.
         * @return Offending tickers; empty when coverage is acceptable.
         */
        static std::vector<std::string> check_availability(const std::vector<std::string> &tickers,
                                                           const std::vector<int> &years,
                                                           int start_year);

    private:
        const PriceSource &source_;
    };

} // namespace riskmetrics

#endif // RISKMETRICS_DATA_HISTORICAL_SERIES_BUILDER_HPP
