/**
 * @file sampling_config.cpp
 * @brief Implementation of SamplingConfig parsing and validation
 */

#include "config/sampling_config.hpp"
#include "common/date_utils.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace riskmetrics
{

    namespace
    {
        const char *const kRequiredKeys[] = {"sample_time_step", "total_sample_period", "sample_period_end"};

        std::string accepted_tokens_message()
        {
            std::ostringstream oss;
            const auto &tokens = accepted_interval_tokens();
            for (size_t i = 0; i < tokens.size(); ++i)
            {
                oss << (i == 0 ? "" : ", ") << "'" << tokens[i] << "'";
            }
            return oss.str();
        }
    } // namespace

    // ======================
    // Interval Tokens
    // ======================

    const std::vector<std::string> &accepted_interval_tokens()
    {
        static const std::vector<std::string> tokens = {
            "1d", "5d", "1mo", "3mo", "6mo", "1y", "2y", "5y", "10y"};
        return tokens;
    }

    bool is_accepted_interval(const std::string &token)
    {
        const auto &tokens = accepted_interval_tokens();
        return std::find(tokens.begin(), tokens.end(), token) != tokens.end();
    }

    Interval parse_interval(const std::string &token)
    {
        if (token == "1d") return Interval::ONE_DAY;
        if (token == "5d") return Interval::FIVE_DAYS;
        if (token == "1mo") return Interval::ONE_MONTH;
        if (token == "3mo") return Interval::THREE_MONTHS;
        if (token == "6mo") return Interval::SIX_MONTHS;
        if (token == "1y") return Interval::ONE_YEAR;
        if (token == "2y") return Interval::TWO_YEARS;
        if (token == "5y") return Interval::FIVE_YEARS;
        if (token == "10y") return Interval::TEN_YEARS;
        throw ValidationError("Invalid interval '" + token + "', accepted values include: " +
                              accepted_tokens_message() + ".");
    }

    std::string to_string(Interval interval)
    {
        switch (interval)
        {
        case Interval::ONE_DAY:
            return "1d";
        case Interval::FIVE_DAYS:
            return "5d";
        case Interval::ONE_MONTH:
            return "1mo";
        case Interval::THREE_MONTHS:
            return "3mo";
        case Interval::SIX_MONTHS:
            return "6mo";
        case Interval::ONE_YEAR:
            return "1y";
        case Interval::TWO_YEARS:
            return "2y";
        case Interval::FIVE_YEARS:
            return "5y";
        case Interval::TEN_YEARS:
            return "10y";
        }
        return "";
    }

    // ======================
    // PeriodDuration
    // ======================

    PeriodDuration PeriodDuration::parse(const std::string &token)
    {
        size_t pos = 0;
        while (pos < token.size() && std::isdigit(static_cast<unsigned char>(token[pos])))
        {
            ++pos;
        }

        if (pos == 0 || pos > 4)
        {
            throw ValidationError("Invalid period '" + token + "', expected <N>d, <N>mo or <N>y.");
        }

        PeriodDuration duration;
        duration.magnitude = std::stoi(token.substr(0, pos));

        const std::string suffix = token.substr(pos);
        if (suffix == "d")
        {
            duration.unit = DurationUnit::DAYS;
        }
        else if (suffix == "mo")
        {
            duration.unit = DurationUnit::MONTHS;
        }
        else if (suffix == "y")
        {
            duration.unit = DurationUnit::YEARS;
        }
        else
        {
            throw ValidationError("Invalid period unit in '" + token + "', expected d, mo or y.");
        }

        if (duration.magnitude <= 0)
        {
            throw ValidationError("Period must be positive: '" + token + "'.");
        }

        return duration;
    }

    std::string PeriodDuration::shift_back(const std::string &date) const
    {
        switch (unit)
        {
        case DurationUnit::DAYS:
            return dates::add_days(date, -static_cast<long long>(magnitude));
        case DurationUnit::MONTHS:
            return dates::add_months(date, -magnitude);
        case DurationUnit::YEARS:
            return dates::add_years(date, -magnitude);
        }
        return date;
    }

    std::string PeriodDuration::to_string() const
    {
        switch (unit)
        {
        case DurationUnit::DAYS:
            return std::to_string(magnitude) + "d";
        case DurationUnit::MONTHS:
            return std::to_string(magnitude) + "mo";
        case DurationUnit::YEARS:
            return std::to_string(magnitude) + "y";
        }
        return std::to_string(magnitude);
    }

    // ======================
    // SamplingConfig
    // ======================

    std::string SamplingConfig::sample_period_start() const
    {
        return total_sample_period.shift_back(sample_period_end);
    }

    int SamplingConfig::sample_start_year() const
    {
        return dates::year_of(sample_period_start());
    }

    SamplingConfig SamplingConfig::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
        {
            throw SchemaError("Configuration root must be a JSON object.");
        }

        // 1. Ticker list shape
        if (!j.contains("tickers") || !j["tickers"].is_array())
        {
            throw SchemaError("Missing or invalid 'tickers' in configuration.");
        }
        for (const auto &item : j["tickers"])
        {
            if (!item.is_string())
            {
                throw SchemaError("Every entry of 'tickers' must be a string.");
            }
        }

        // 2. dataParameters section and its required keys
        if (!j.contains("dataParameters"))
        {
            throw SchemaError("Missing 'dataParameters' in configuration.");
        }

        const auto &params = j["dataParameters"];
        if (!params.is_object())
        {
            throw SchemaError("'dataParameters' must be a JSON object.");
        }

        for (const char *key : kRequiredKeys)
        {
            if (!params.contains(key))
            {
                throw SchemaError(std::string("Missing '") + key + "' in dataParameters.");
            }
        }

        // 3. End date
        const auto &end_value = params["sample_period_end"];
        if (!end_value.is_string() || !dates::is_valid_date(end_value.get<std::string>()))
        {
            throw ValidationError("Invalid date format in sample_period_end, expected YYYY-MM-DD.");
        }

        // 4. Every other parameter must be a period token
        for (const auto &item : params.items())
        {
            if (item.key() == "sample_period_end")
                continue;

            if (!item.value().is_string() || !is_accepted_interval(item.value().get<std::string>()))
            {
                throw ValidationError("Invalid value " + item.value().dump() + " for '" + item.key() +
                                      "', accepted values include: " + accepted_tokens_message() + ".");
            }
        }

        // 5. Ticker list content
        SamplingConfig config;
        config.tickers = j["tickers"].get<std::vector<std::string>>();

        if (config.tickers.empty())
        {
            throw ValidationError("'tickers' must name at least one instrument.");
        }

        std::set<std::string> seen;
        for (const auto &ticker : config.tickers)
        {
            if (ticker.empty())
            {
                throw ValidationError("'tickers' contains an empty symbol.");
            }
            if (!seen.insert(ticker).second)
            {
                throw ValidationError("Duplicate ticker in configuration: " + ticker);
            }
        }

        config.sample_time_step = parse_interval(params["sample_time_step"].get<std::string>());
        config.total_sample_period = PeriodDuration::parse(params["total_sample_period"].get<std::string>());
        config.sample_period_end = end_value.get<std::string>();

        std::string start;
        try
        {
            start = config.sample_period_start();
        }
        catch (const std::invalid_argument &e)
        {
            throw ValidationError("Sample period cannot be resolved: " + std::string(e.what()));
        }

        spdlog::debug("Sampling {} tickers from {} to {} (step {}, period {})",
                      config.tickers.size(), start, config.sample_period_end,
                      to_string(config.sample_time_step), config.total_sample_period.to_string());

        return config;
    }

    SamplingConfig SamplingConfig::parse(const std::string &text)
    {
        nlohmann::json j;
        try
        {
            j = nlohmann::json::parse(text);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw ParseError("Error parsing JSON configuration: " + std::string(e.what()));
        }
        return from_json(j);
    }

    SamplingConfig SamplingConfig::load_from_file(const std::string &config_path)
    {
        if (!std::filesystem::exists(config_path))
        {
            throw NotFoundError("The file '" + config_path + "' does not exist.");
        }

        std::ifstream file(config_path);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + config_path);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw ParseError("Error parsing JSON file '" + config_path + "': " + std::string(e.what()));
        }

        spdlog::info("Loaded sampling configuration from {}", config_path);
        return from_json(j);
    }

    nlohmann::json SamplingConfig::to_json() const
    {
        nlohmann::json j;
        j["tickers"] = tickers;
        j["dataParameters"] = {
            {"sample_time_step", to_string(sample_time_step)},
            {"total_sample_period", total_sample_period.to_string()},
            {"sample_period_end", sample_period_end}};
        return j;
    }

} // namespace riskmetrics
