/**
 * @file return_series.hpp
 * @brief Periodic percent-return table for a basket of instruments.
 */

#ifndef RISKMETRICS_DATA_RETURN_SERIES_HPP
#define RISKMETRICS_DATA_RETURN_SERIES_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace riskmetrics
{

    /**
     * @class ReturnSeries
     * @brief Time-indexed table of fractional returns (periods x assets).
     *
     * Rows are period-end dates in strictly increasing order, columns are
     * instrument symbols in the order they were requested. Every cell is
     * finite; missing returns are represented as 0 by the producer.
     *
     * Instances are immutable. Slicing returns a new ReturnSeries.
     */
    class ReturnSeries
    {
    public:
        /**
         * @brief Empty series with no rows and no columns.
         */
        ReturnSeries() = default;

        /**
         * @brief Constructor with data.
         * @param returns Return matrix (periods x assets).
         * @param dates Period-end dates, strictly increasing.
         * @param tickers Instrument symbols, one per column.
         * @throws std::invalid_argument if dimensions disagree, dates are
         *         not strictly increasing or a cell is NaN/Inf.
         */
        ReturnSeries(const Eigen::MatrixXd &returns,
                     const std::vector<std::string> &dates,
                     const std::vector<std::string> &tickers);

        const Eigen::MatrixXd &returns() const { return returns_; }
        const std::vector<std::string> &dates() const { return dates_; }
        const std::vector<std::string> &tickers() const { return tickers_; }

        size_t num_periods() const { return static_cast<size_t>(returns_.rows()); }
        size_t num_assets() const { return static_cast<size_t>(returns_.cols()); }
        bool empty() const { return returns_.rows() == 0; }

        const std::string &first_date() const;
        const std::string &last_date() const;

        /**
         * @brief Returns of one instrument over all periods.
         * @throws std::invalid_argument if the ticker is unknown.
         */
        Eigen::VectorXd get_returns(const std::string &ticker) const;

        /**
         * @brief Return of one instrument for one period.
         * @throws std::invalid_argument if the ticker or date is unknown.
         */
        double get_return(const std::string &ticker, const std::string &date) const;

        /**
         * @brief Returns of all instruments for one row.
         */
        Eigen::RowVectorXd row(size_t index) const;

        /**
         * @brief Row index of a date.
         * @return Index, or -1 if the date is not a row of this series.
         */
        int find_date_index(const std::string &date) const;

        /**
         * @brief Leading rows [0, count).
         * @throws std::out_of_range if count exceeds the number of periods.
         */
        ReturnSeries head(size_t count) const;

        /**
         * @brief Rows from the first date through @p end_date inclusive.
         * @throws std::invalid_argument if end_date is not a row of this series.
         */
        ReturnSeries through(const std::string &end_date) const;

        void print_head(size_t rows = 5) const;

    private:
        int find_ticker_index(const std::string &ticker) const;

        Eigen::MatrixXd returns_;          ///< Return matrix (periods x assets)
        std::vector<std::string> dates_;   ///< Period-end dates
        std::vector<std::string> tickers_; ///< Column symbols
    };

} // namespace riskmetrics

#endif // RISKMETRICS_DATA_RETURN_SERIES_HPP
