/**
 * @file test_sampling_config.cpp
 * @brief Unit tests for SamplingConfig validation
 */

#include <catch2/catch_test_macros.hpp>
#include "config/sampling_config.hpp"
#include "common/errors.hpp"
#include "support/temp_dir.hpp"

#include <nlohmann/json.hpp>

using namespace riskmetrics;
using riskmetrics::testing::TempDir;

namespace {

nlohmann::json valid_document() {
    return nlohmann::json::parse(R"({
        "tickers": ["XLC", "XLY", "XLP"],
        "dataParameters": {
            "sample_time_step": "1mo",
            "total_sample_period": "5y",
            "sample_period_end": "2024-01-01"
        }
    })");
}

} // namespace

TEST_CASE("Valid configuration", "[SamplingConfig]") {
    auto config = SamplingConfig::from_json(valid_document());

    REQUIRE(config.tickers == std::vector<std::string>{"XLC", "XLY", "XLP"});
    REQUIRE(config.sample_time_step == Interval::ONE_MONTH);
    REQUIRE(config.total_sample_period.magnitude == 5);
    REQUIRE(config.total_sample_period.unit == DurationUnit::YEARS);
    REQUIRE(config.sample_period_end == "2024-01-01");
    REQUIRE(config.sample_period_start() == "2019-01-01");
    REQUIRE(config.sample_start_year() == 2019);
}

TEST_CASE("Configuration file loading", "[SamplingConfig]") {
    TempDir dir;

    SECTION("Load from file") {
        auto path = dir.write("config.json", valid_document().dump());
        auto config = SamplingConfig::load_from_file(path);
        REQUIRE(config.tickers.size() == 3);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(SamplingConfig::load_from_file(dir.file("nonexistent_config.json")), NotFoundError);
    }

    SECTION("Malformed JSON") {
        auto path = dir.write("broken.json", "{ \"tickers\": [\"XLC\", ");
        REQUIRE_THROWS_AS(SamplingConfig::load_from_file(path), ParseError);
        REQUIRE_THROWS_AS(SamplingConfig::parse("not json at all"), ParseError);
    }
}

TEST_CASE("Schema errors", "[SamplingConfig]") {
    auto doc = valid_document();

    SECTION("Missing dataParameters") {
        doc.erase("dataParameters");
        REQUIRE_THROWS_AS(SamplingConfig::from_json(doc), SchemaError);
    }

    SECTION("Missing tickers") {
        doc.erase("tickers");
        REQUIRE_THROWS_AS(SamplingConfig::from_json(doc), SchemaError);
    }

    SECTION("Tickers not a list") {
        doc["tickers"] = "XLC";
        REQUIRE_THROWS_AS(SamplingConfig::from_json(doc), SchemaError);
    }

    SECTION("Ticker not a string") {
        doc["tickers"] = nlohmann::json::array({"XLC", 7});
        REQUIRE_THROWS_AS(SamplingConfig::from_json(doc), SchemaError);
    }

    SECTION("Each required parameter") {
        for (const char *key : {"sample_time_step", "total_sample_period", "sample_period_end"}) {
            auto partial = valid_document();
            partial["dataParameters"].erase(std::string(key));
            REQUIRE_THROWS_AS(SamplingConfig::from_json(partial), SchemaError);
        }
    }

    SECTION("Root is not an object") {
        REQUIRE_THROWS_AS(SamplingConfig::parse("[1, 2, 3]"), SchemaError);
    }
}

TEST_CASE("Validation errors", "[SamplingConfig]") {
    auto doc = valid_document();

    SECTION("Impossible end date") {
        doc["dataParameters"]["sample_period_end"] = "2024-13-40";
        REQUIRE_THROWS_AS(SamplingConfig::from_json(doc), ValidationError);
    }

    SECTION("End date with wrong layout") {
        doc["dataParameters"]["sample_period_end"] = "01/01/2024";
        REQUIRE_THROWS_AS(SamplingConfig::from_json(doc), ValidationError);
    }

    SECTION("Unknown interval token") {
        doc["dataParameters"]["sample_time_step"] = "2wk";
        REQUIRE_THROWS_AS(SamplingConfig::from_json(doc), ValidationError);
    }

    SECTION("Period token outside the accepted set") {
        doc["dataParameters"]["total_sample_period"] = "5yr";
        REQUIRE_THROWS_AS(SamplingConfig::from_json(doc), ValidationError);
    }

    SECTION("Extra parameter must also be a token") {
        doc["dataParameters"]["lookback"] = "3wk";
        REQUIRE_THROWS_AS(SamplingConfig::from_json(doc), ValidationError);
    }

    SECTION("Non-string parameter") {
        doc["dataParameters"]["sample_time_step"] = 1;
        REQUIRE_THROWS_AS(SamplingConfig::from_json(doc), ValidationError);
    }

    SECTION("Empty ticker list") {
        doc["tickers"] = nlohmann::json::array();
        REQUIRE_THROWS_AS(SamplingConfig::from_json(doc), ValidationError);
    }

    SECTION("Duplicate ticker") {
        doc["tickers"] = nlohmann::json::array({"XLC", "XLY", "XLC"});
        REQUIRE_THROWS_AS(SamplingConfig::from_json(doc), ValidationError);
    }

    SECTION("Schema checks run before value checks") {
        doc["dataParameters"]["sample_period_end"] = "2024-13-40";
        doc["dataParameters"].erase("sample_time_step");
        REQUIRE_THROWS_AS(SamplingConfig::from_json(doc), SchemaError);
    }
}

TEST_CASE("Interval tokens", "[SamplingConfig]") {
    for (const auto &token : accepted_interval_tokens()) {
        REQUIRE(to_string(parse_interval(token)) == token);
    }
    REQUIRE(accepted_interval_tokens().size() == 9);
    REQUIRE_FALSE(is_accepted_interval("1wk"));
    REQUIRE_THROWS_AS(parse_interval("1wk"), ValidationError);
}

TEST_CASE("PeriodDuration", "[SamplingConfig]") {
    SECTION("Parse units") {
        REQUIRE(PeriodDuration::parse("10y") == PeriodDuration{10, DurationUnit::YEARS});
        REQUIRE(PeriodDuration::parse("3mo") == PeriodDuration{3, DurationUnit::MONTHS});
        REQUIRE(PeriodDuration::parse("5d") == PeriodDuration{5, DurationUnit::DAYS});
        REQUIRE(PeriodDuration::parse("6mo").to_string() == "6mo");
    }

    SECTION("Reject malformed tokens") {
        REQUIRE_THROWS_AS(PeriodDuration::parse("y"), ValidationError);
        REQUIRE_THROWS_AS(PeriodDuration::parse("0y"), ValidationError);
        REQUIRE_THROWS_AS(PeriodDuration::parse("5yr"), ValidationError);
        REQUIRE_THROWS_AS(PeriodDuration::parse("-5y"), ValidationError);
    }

    SECTION("Shift back by unit") {
        REQUIRE(PeriodDuration::parse("2y").shift_back("2024-03-15") == "2022-03-15");
        REQUIRE(PeriodDuration::parse("1y").shift_back("2024-02-29") == "2023-02-28");
        REQUIRE(PeriodDuration::parse("3mo").shift_back("2024-05-31") == "2024-02-29");
        REQUIRE(PeriodDuration::parse("5d").shift_back("2024-03-02") == "2024-02-26");
    }

    SECTION("Month period in a configuration") {
        auto doc = valid_document();
        doc["dataParameters"]["total_sample_period"] = "6mo";
        auto config = SamplingConfig::from_json(doc);
        REQUIRE(config.sample_period_start() == "2023-07-01");
    }
}

TEST_CASE("Configuration serializes back to its document", "[SamplingConfig]") {
    auto config = SamplingConfig::from_json(valid_document());
    REQUIRE(config.to_json().dump() == valid_document().dump());
}

TEST_CASE("Default-constructed configuration", "[SamplingConfig]") {
    SamplingConfig config;
    REQUIRE(config.sample_time_step == Interval::ONE_MONTH);
    REQUIRE(config.total_sample_period == PeriodDuration{1, DurationUnit::YEARS});
    REQUIRE(config.tickers.empty());
}
