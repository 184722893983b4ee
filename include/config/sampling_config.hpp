/**
 * @file sampling_config.hpp
 * @brief Sampling configuration and its validation.
 *
 * Describes which instruments to sample and over which window. The
 * configuration is read from a JSON document of the form:
 *
 * @code{.json}
 * {
 *   "tickers": ["XLC", "XLY", "XLP"],
 *   "dataParameters": {
 *     "sample_time_step": "1mo",
 *     "total_sample_period": "5y",
 *     "sample_period_end": "2024-01-01"
 *   }
 * }
 * @endcode
 *
 * A SamplingConfig only exists in validated form; every factory either
 * returns one or throws (see common/errors.hpp).
 */

#ifndef RISKMETRICS_CONFIG_SAMPLING_CONFIG_HPP
#define RISKMETRICS_CONFIG_SAMPLING_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace riskmetrics
{

    /**
     *  @enum Interval
     *  @brief Period tokens accepted in the dataParameters section.
     */
    enum class Interval
    {
        ONE_DAY,      /**< "1d" */
        FIVE_DAYS,    /**< "5d" */
        ONE_MONTH,    /**< "1mo" */
        THREE_MONTHS, /**< "3mo" */
        SIX_MONTHS,   /**< "6mo" */
        ONE_YEAR,     /**< "1y" */
        TWO_YEARS,    /**< "2y" */
        FIVE_YEARS,   /**< "5y" */
        TEN_YEARS     /**< "10y" */
    };

    /**
     * @brief Parse a period token.
     * @throws ValidationError if the token is not an accepted value.
     */
    Interval parse_interval(const std::string &token);

    /**
     * @brief Token for an interval ("1d", "1mo", ...).
     */
    std::string to_string(Interval interval);

    /**
     * @brief Check a token against the accepted set without throwing.
     */
    bool is_accepted_interval(const std::string &token);

    /**
     * @brief The accepted tokens, in canonical order.
     */
    const std::vector<std::string> &accepted_interval_tokens();

    /**
     *  @enum DurationUnit
     *  @brief Unit carried by a PeriodDuration.
     */
    enum class DurationUnit
    {
        DAYS,
        MONTHS,
        YEARS
    };

    /**
     * @struct PeriodDuration
     * @brief A positive whole-number length of time tagged with its unit.
     *
     * Parsed from period tokens: "5d" is five days, "3mo" three months,
     * "10y" ten years.
     */
    struct PeriodDuration
    {
        int magnitude = 1;
        DurationUnit unit = DurationUnit::YEARS;

        /**
         * @brief Parse "<N>d", "<N>mo" or "<N>y".
         * @throws ValidationError on any other layout or a non-positive magnitude.
         */
        static PeriodDuration parse(const std::string &token);

        /**
         * @brief Move a date back by this duration.
         *
         * Years reduce the year field and keep month and day; months shift
         * by calendar month with the day clamped; days are plain day
         * arithmetic.
         */
        std::string shift_back(const std::string &date) const;

        std::string to_string() const;

        bool operator==(const PeriodDuration &other) const
        {
            return magnitude == other.magnitude && unit == other.unit;
        }
    };

    /**
     * @struct SamplingConfig
     * @brief Validated sampling parameters for the historical series builder.
     */
    struct SamplingConfig
    {
        std::vector<std::string> tickers;     ///< Unique symbols, in request order
        Interval sample_time_step = Interval::ONE_MONTH; ///< Sampling step of the raw feed
        PeriodDuration total_sample_period;   ///< Length of the sample window
        std::string sample_period_end;        ///< Exclusive end of the window (YYYY-MM-DD)

        /**
         * @brief Inclusive start of the sample window.
         */
        std::string sample_period_start() const;

        /**
         * @brief Year field of sample_period_start().
         */
        int sample_start_year() const;

        /**
         * @brief Validate a parsed JSON document.
         * @throws SchemaError if required keys are missing or mis-shaped.
         * @throws ValidationError if values are invalid.
         */
        static SamplingConfig from_json(const nlohmann::json &j);

        /**
         * @brief Parse and validate JSON text.
         * @throws ParseError if the text is not valid JSON.
         */
        static SamplingConfig parse(const std::string &text);

        /**
         * @brief Load and validate a configuration file.
         * @throws NotFoundError if the file does not exist.
         * @throws ParseError if the file is not valid JSON.
         */
        static SamplingConfig load_from_file(const std::string &config_path);

        nlohmann::json to_json() const;
    };

} // namespace riskmetrics

#endif // RISKMETRICS_CONFIG_SAMPLING_CONFIG_HPP
