/**
 * @file date_utils.hpp
 * @brief Calendar arithmetic on ISO date strings (YYYY-MM-DD).
 *
 * Dates travel through the pipeline as strings, the same representation
 * used by the price tables and return series. These helpers validate them
 * and perform the day, month and year shifts the sampling window and the
 * backtest window need. All arithmetic is done on the proleptic Gregorian
 * calendar, independent of the local time zone.
 */

#ifndef RISKMETRICS_COMMON_DATE_UTILS_HPP
#define RISKMETRICS_COMMON_DATE_UTILS_HPP

#include <string>

namespace riskmetrics
{
    namespace dates
    {

        /**
         * @brief Check that a string is a real calendar date in YYYY-MM-DD form.
         * @param date Candidate date string.
         * @return true if the string has the exact layout and names an existing day.
         */
        bool is_valid_date(const std::string &date);

        /**
         * @brief Leap year test (Gregorian rules).
         */
        bool is_leap_year(int year);

        /**
         * @brief Number of days in a month.
         * @param year Calendar year.
         * @param month Month, 1-12.
         * @throws std::invalid_argument if month is out of range.
         */
        int days_in_month(int year, int month);

        int year_of(const std::string &date);
        int month_of(const std::string &date);
        int day_of(const std::string &date);

        /**
         * @brief Build a YYYY-MM-DD string.
         * @throws std::invalid_argument if the fields do not name a real day.
         */
        std::string make_date(int year, int month, int day);

        /**
         * @brief Days elapsed since 1970-01-01 (negative before it).
         * @throws std::invalid_argument if the date is invalid.
         */
        long long days_since_epoch(const std::string &date);

        /**
         * @brief Signed number of days from @p from to @p to.
         */
        long long days_between(const std::string &from, const std::string &to);

        /**
         * @brief Shift a date by a number of days.
         */
        std::string add_days(const std::string &date, long long days);

        /**
         * @brief Shift a date by whole calendar months.
         *
         * The day of month is kept when it exists in the target month and
         * clamped to the month's last day otherwise (Jan 31 + 1 month is
         * Feb 28 or Feb 29).
         */
        std::string add_months(const std::string &date, int months);

        /**
         * @brief Shift the year field, keeping month and day.
         *
         * Feb 29 landing in a non-leap year is clamped to Feb 28.
         */
        std::string add_years(const std::string &date, int years);

        /**
         * @brief Last calendar day of the month containing @p date.
         */
        std::string month_end(const std::string &date);

    } // namespace dates
} // namespace riskmetrics

#endif // RISKMETRICS_COMMON_DATE_UTILS_HPP
