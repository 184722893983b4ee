/**
 * @file price_source.hpp
 * @brief Interface to the provider of historical adjusted close prices.
 *
 * The historical series builder depends only on this interface, so any
 * data vendor client can be plugged in. TablePriceSource serves prices
 * that are already in memory (loaded from a file or built in a test).
 */

#ifndef RISKMETRICS_DATA_PRICE_SOURCE_HPP
#define RISKMETRICS_DATA_PRICE_SOURCE_HPP

#include "data/price_table.hpp"

#include <string>
#include <vector>

namespace riskmetrics
{

    /**
     * @struct PricePoint
     * @brief One adjusted close observation.
     */
    struct PricePoint
    {
        std::string date; ///< Observation date (YYYY-MM-DD)
        double price;     ///< Adjusted close
    };

    /// Observations of one symbol in increasing date order.
    using PriceHistory = std::vector<PricePoint>;

    /**
     * @class PriceSource
     * @brief Abstract provider of historical prices.
     *
     * Date ranges are half-open: [start_date, end_date).
     *
     * Usage Example:
     * @code
     * TablePriceSource source(PriceLoader::load_csv("prices.csv"));
     * auto history = source.fetch_history("XLC", "2019-01-01", "2024-01-01");
     * @endcode
     */
    class PriceSource
    {
    public:
        virtual ~PriceSource() = default;

        /**
         * @brief Price history of a single symbol.
         * @return Observations in increasing date order; empty if the
         *         symbol has no data in the range.
         */
        virtual PriceHistory fetch_history(const std::string &symbol,
                                           const std::string &start_date,
                                           const std::string &end_date) const = 0;

        /**
         * @brief Combined adjusted close table for several symbols.
         * @return Table with one column per requested symbol, in request
         *         order, NaN where a symbol has no observation on a date.
         */
        virtual PriceTable fetch_prices(const std::vector<std::string> &symbols,
                                        const std::string &start_date,
                                        const std::string &end_date) const = 0;

        /**
         * @brief Name of the source, for logging.
         */
        virtual std::string get_name() const = 0;
    };

    /**
     * @class TablePriceSource
     * @brief PriceSource backed by an in-memory PriceTable.
     *
     * NaN cells are not observations. Symbols absent from the table have an
     * empty history and an all-NaN column.
     */
    class TablePriceSource : public PriceSource
    {
    public:
        explicit TablePriceSource(PriceTable table);

        ~TablePriceSource() override = default;

        PriceHistory fetch_history(const std::string &symbol,
                                   const std::string &start_date,
                                   const std::string &end_date) const override;

        PriceTable fetch_prices(const std::vector<std::string> &symbols,
                                const std::string &start_date,
                                const std::string &end_date) const override;

        std::string get_name() const override;

        const PriceTable &table() const { return table_; }

    private:
        PriceTable table_;
    };

} // namespace riskmetrics

#endif // RISKMETRICS_DATA_PRICE_SOURCE_HPP
