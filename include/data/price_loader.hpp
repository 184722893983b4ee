/**
 * @file price_loader.hpp
 * @brief Loading, saving and generating price tables.
 *
 * Provides functionality to load adjusted close prices from CSV files and
 * to generate deterministic synthetic prices for demos and tests.
 */

#ifndef RISKMETRICS_DATA_PRICE_LOADER_HPP
#define RISKMETRICS_DATA_PRICE_LOADER_HPP

#include "data/price_table.hpp"

#include <map>
#include <string>
#include <vector>

namespace riskmetrics {

/**
 * @struct SyntheticPriceSpec
 * @brief Parameters for synthetic price generation
 */
struct SyntheticPriceSpec {
    std::vector<std::string> tickers;                ///< Symbols to generate
    std::string start_date = "2019-01-01";           ///< First calendar day (inclusive)
    std::string end_date = "2024-01-01";             ///< Last calendar day (exclusive)
    double volatility = 0.01;                        ///< Daily volatility
    double drift = 0.0003;                           ///< Daily drift
    unsigned int seed = 42;                          ///< Random seed
    std::map<std::string, std::string> first_dates;  ///< Optional late listing date per ticker
};

/**
 * @class PriceLoader
 * @brief Loads and writes price tables
 *
 * Supports CSV files with standard formats:
 * - Format 1: date, ticker1, ticker2, ... (wide format)
 * - Format 2: date, ticker, price (long format)
 *
 * Empty cells and "nan" are read as missing observations. Rows may appear
 * in any order; the resulting table is sorted by date.
 */
class PriceLoader {
public:
    PriceLoader() = default;
    ~PriceLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load prices from CSV file (wide format)
     *
     * Expected format:
     * date,XLC,XLY,XLP,...
     * 2020-01-02,50.1,120.3,61.2,...
     *
     * @param filepath Path to CSV file
     * @param tickers Optional list of tickers to load (loads all if empty)
     * @return PriceTable object
     * @throws NotFoundError if the file does not exist
     * @throws std::runtime_error if the file cannot be parsed
     */
    static PriceTable load_csv_wide(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Load prices from CSV file (long format)
     *
     * Expected format:
     * date,ticker,price
     * 2020-01-02,XLC,50.1
     * 2020-01-02,XLY,120.3
     *
     * @param filepath Path to CSV file
     * @param tickers Optional list of tickers to load
     * @return PriceTable object
     * @throws NotFoundError if the file does not exist
     * @throws std::runtime_error if the file cannot be parsed
     */
    static PriceTable load_csv_long(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Auto-detect CSV format and load
     */
    static PriceTable load_csv(const std::string& filepath,
                               const std::vector<std::string>& tickers = {});

    /**
     * @brief Save a price table to CSV (wide format)
     * @throws std::runtime_error if the file cannot be written
     */
    static void save_csv_wide(const PriceTable& data, const std::string& filepath);

    // ========================================================================
    // Data Generation
    // ========================================================================

    /**
     * @brief Generate synthetic business-day prices
     *
     * Each ticker follows a geometric random walk starting at 100 on its
     * first date. Tickers listed in spec.first_dates have no observations
     * before that date. The same spec always produces the same table.
     *
     * @throws std::invalid_argument if dates are invalid or volatility is not positive
     */
    static PriceTable generate_synthetic_data(const SyntheticPriceSpec& spec);

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);
    static std::string trim(const std::string& str);

    /**
     * @brief Convert string to double
     * @return Parsed value, or NaN for an empty or "nan" cell
     * @throws std::runtime_error if the cell is not a number
     */
    static double parse_price(const std::string& str);
};

} // namespace riskmetrics

#endif // RISKMETRICS_DATA_PRICE_LOADER_HPP
