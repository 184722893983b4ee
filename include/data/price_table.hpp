/*
 * @file price_table.hpp
 * @brief Time-series price storage, calendar resampling and return derivation.
 *
 * Stores adjusted close prices for several instruments as an Eigen matrix
 * indexed by date and ticker, and turns them into a ReturnSeries.
 */

#ifndef RISKMETRICS_DATA_PRICE_TABLE_HPP
#define RISKMETRICS_DATA_PRICE_TABLE_HPP

#include "data/return_series.hpp"

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace riskmetrics
{
    /**
     * @class PriceTable
     * @brief Container for multi-asset price observations.
     *
     * @note Data is stored as (dates x assets).
     * @note Missing observations are represented as NaN values.
     * @note Dates are strictly increasing YYYY-MM-DD strings.
     */
    class PriceTable
    {
    public:
        /**
         * @brief Empty table over the given tickers.
         */
        explicit PriceTable(const std::vector<std::string> &tickers = {});

        /**
         * @brief Constructor with data.
         * @param prices Price matrix (dates x assets).
         * @param dates Vector of date strings, strictly increasing.
         * @param tickers Vector of asset ticker symbols.
         * @throws std::invalid_argument if dimensions disagree, a date is
         *         malformed, dates are not strictly increasing or a ticker repeats.
         */
        PriceTable(const Eigen::MatrixXd &prices,
                   const std::vector<std::string> &dates,
                   const std::vector<std::string> &tickers);

        ~PriceTable() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        const Eigen::MatrixXd &prices() const
        {
            return prices_;
        }

        /**
         * @brief Get prices for a specific asset.
         * @param ticker Asset ticker symbol.
         * @return Price vector for the asset.
         * @throws std::invalid_argument if the ticker is unknown.
         */
        Eigen::VectorXd get_prices(const std::string &ticker) const;

        const std::vector<std::string> &dates() const
        {
            return dates_;
        }

        const std::vector<std::string> &tickers() const
        {
            return tickers_;
        }

        size_t num_dates() const
        {
            return static_cast<size_t>(prices_.rows());
        }

        size_t num_assets() const
        {
            return static_cast<size_t>(prices_.cols());
        }

        bool empty() const
        {
            return prices_.rows() == 0;
        }

        bool has_ticker(const std::string &ticker) const;

        /**
         * @brief Earliest date with an observation for a ticker.
         * @return Date string, or empty string if the column has no observations.
         */
        std::string first_valid_date(const std::string &ticker) const;

        /** ===========================================
         *  Filtering and Manipulation Methods
         *  ===========================================
         */

        /**
         * @brief Rows whose date lies in [start_date, end_date).
         * @return New PriceTable with the same tickers.
         */
        PriceTable slice_dates(const std::string &start_date,
                               const std::string &end_date) const;

        /**
         * @brief Select a subset of assets, in the requested order.
         *
         * Tickers absent from this table become all-NaN columns.
         */
        PriceTable select_assets(const std::vector<std::string> &selected_tickers) const;

        /**
         * @brief Carry each observation forward over subsequent gaps.
         * @return New PriceTable with filled values (leading gaps stay NaN).
         */
        PriceTable forward_fill() const;

        /**
         * @brief Collapse observations to one row per calendar month.
         *
         * Produces a row for every month between the first and last
         * observed month, dated at the month's last calendar day. Each cell
         * holds the last non-missing observation of that month, NaN if the
         * month has none.
         */
        PriceTable resample_month_end() const;

        /**
         * @brief Row-over-row simple returns with zero fill.
         *
         * Prices are forward-filled first. Cells whose return is undefined
         * (first row, no prior observation, zero prior price) are set to 0.
         *
         * @return ReturnSeries with the same dates and tickers.
         */
        ReturnSeries percent_change() const;

        /** ===========================================
         *  Validation Methods
         *  ===========================================
         */

        /**
         * @brief Count missing values
         * @return Number of NaN entries in price matrix
         */
        size_t count_missing() const;

        void print_summary() const;

    private:
        int find_ticker_index(const std::string &ticker) const;

        void build_index_maps();

        Eigen::MatrixXd prices_;                     ///< Price matrix (dates x assets)
        std::vector<std::string> dates_;             ///< Date strings
        std::vector<std::string> tickers_;           ///< Asset tickers
        std::map<std::string, size_t> ticker_index_; ///< Ticker to index map
    };

}
#endif // RISKMETRICS_DATA_PRICE_TABLE_HPP
