/**
 * @file date_utils.cpp
 * @brief Implementation of the calendar helpers
 */

#include "common/date_utils.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace riskmetrics
{
    namespace dates
    {

        namespace
        {
            void require_valid(const std::string &date)
            {
                if (!is_valid_date(date))
                {
                    throw std::invalid_argument("Invalid date, expected YYYY-MM-DD: '" + date + "'");
                }
            }

            // Days from civil, after H. Hinnant's chrono-compatible algorithms
            long long days_from_civil(int y, int m, int d)
            {
                y -= m <= 2 ? 1 : 0;
                const long long era = (y >= 0 ? y : y - 399) / 400;
                const long long yoe = y - era * 400;
                const long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
                const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return era * 146097 + doe - 719468;
            }

            void civil_from_days(long long z, int &y, int &m, int &d)
            {
                z += 719468;
                const long long era = (z >= 0 ? z : z - 146096) / 146097;
                const long long doe = z - era * 146097;
                const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
                const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
                const long long mp = (5 * doy + 2) / 153;
                d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
                m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
                y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
            }
        } // namespace

        bool is_valid_date(const std::string &date)
        {
            if (date.length() != 10)
                return false;
            if (date[4] != '-' || date[7] != '-')
                return false;

            for (size_t i = 0; i < date.length(); ++i)
            {
                if (i == 4 || i == 7)
                    continue;
                if (!std::isdigit(static_cast<unsigned char>(date[i])))
                    return false;
            }

            const int month = std::stoi(date.substr(5, 2));
            const int day = std::stoi(date.substr(8, 2));
            if (month < 1 || month > 12)
                return false;

            const int year = std::stoi(date.substr(0, 4));
            return day >= 1 && day <= days_in_month(year, month);
        }

        bool is_leap_year(int year)
        {
            return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        }

        int days_in_month(int year, int month)
        {
            static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (month < 1 || month > 12)
            {
                throw std::invalid_argument("Month out of range: " + std::to_string(month));
            }
            if (month == 2 && is_leap_year(year))
            {
                return 29;
            }
            return kDays[month - 1];
        }

        int year_of(const std::string &date)
        {
            require_valid(date);
            return std::stoi(date.substr(0, 4));
        }

        int month_of(const std::string &date)
        {
            require_valid(date);
            return std::stoi(date.substr(5, 2));
        }

        int day_of(const std::string &date)
        {
            require_valid(date);
            return std::stoi(date.substr(8, 2));
        }

        std::string make_date(int year, int month, int day)
        {
            if (year < 0 || year > 9999 || month < 1 || month > 12 ||
                day < 1 || day > days_in_month(year, month))
            {
                throw std::invalid_argument("Invalid calendar date: " + std::to_string(year) + "-" +
                                            std::to_string(month) + "-" + std::to_string(day));
            }

            char buffer[11];
            std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
            return std::string(buffer);
        }

        long long days_since_epoch(const std::string &date)
        {
            return days_from_civil(year_of(date), month_of(date), day_of(date));
        }

        long long days_between(const std::string &from, const std::string &to)
        {
            return days_since_epoch(to) - days_since_epoch(from);
        }

        std::string add_days(const std::string &date, long long days)
        {
            int y = 0, m = 0, d = 0;
            civil_from_days(days_since_epoch(date) + days, y, m, d);
            return make_date(y, m, d);
        }

        std::string add_months(const std::string &date, int months)
        {
            const int year = year_of(date);
            const int month = month_of(date);
            const int day = day_of(date);

            // Work in a zero-based month count so negative shifts carry correctly
            long long total = static_cast<long long>(year) * 12 + (month - 1) + months;
            long long new_year = total >= 0 ? total / 12 : (total - 11) / 12;
            int new_month = static_cast<int>(total - new_year * 12) + 1;

            if (new_year < 0 || new_year > 9999)
            {
                throw std::invalid_argument("Date shift leaves supported range: " + date);
            }

            int max_day = days_in_month(static_cast<int>(new_year), new_month);
            return make_date(static_cast<int>(new_year), new_month, day < max_day ? day : max_day);
        }

        std::string add_years(const std::string &date, int years)
        {
            return add_months(date, years * 12);
        }

        std::string month_end(const std::string &date)
        {
            const int year = year_of(date);
            const int month = month_of(date);
            return make_date(year, month, days_in_month(year, month));
        }

    } // namespace dates
} // namespace riskmetrics
