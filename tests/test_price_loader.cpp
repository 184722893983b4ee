/**
 * @file test_price_loader.cpp
 * @brief Unit tests for PriceLoader and TablePriceSource
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/price_loader.hpp"
#include "data/price_source.hpp"
#include "common/date_utils.hpp"
#include "common/errors.hpp"
#include "support/temp_dir.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace riskmetrics;
using riskmetrics::testing::TempDir;
using Catch::Matchers::WithinAbs;

TEST_CASE("Load wide CSV", "[PriceLoader]") {
    TempDir dir;
    auto path = dir.write("wide.csv",
                          "date,AAA,BBB,CCC\n"
                          "2020-01-03,101.5,50.0,\n"
                          "2020-01-02,100.0,49.5,10.0\n"
                          "\n"
                          "2020-01-06,102.0,nan,10.5\n");

    SECTION("All columns, sorted by date") {
        auto table = PriceLoader::load_csv_wide(path);
        REQUIRE(table.tickers() == std::vector<std::string>{"AAA", "BBB", "CCC"});
        REQUIRE(table.dates() == std::vector<std::string>{"2020-01-02", "2020-01-03", "2020-01-06"});
        REQUIRE(table.prices()(0, 0) == 100.0);
        REQUIRE(table.count_missing() == 2);
        REQUIRE(std::isnan(table.prices()(1, 2)));
        REQUIRE(std::isnan(table.prices()(2, 1)));
    }

    SECTION("Filter keeps requested order and drops unknown tickers") {
        auto table = PriceLoader::load_csv_wide(path, {"CCC", "ZZZ", "AAA"});
        REQUIRE(table.tickers() == std::vector<std::string>{"CCC", "AAA"});
        REQUIRE(table.prices()(0, 0) == 10.0);
    }

    SECTION("No requested ticker present") {
        REQUIRE_THROWS_AS(PriceLoader::load_csv_wide(path, {"ZZZ"}), std::runtime_error);
    }

    SECTION("Auto-detect picks the wide layout") {
        REQUIRE(PriceLoader::load_csv(path).num_assets() == 3);
    }
}

TEST_CASE("Load long CSV", "[PriceLoader]") {
    TempDir dir;
    auto path = dir.write("long.csv",
                          "date,ticker,price\n"
                          "2020-01-03,BBB,51.0\n"
                          "2020-01-02,AAA,100.0\n"
                          "2020-01-02,BBB,50.0\n"
                          "2020-01-03,AAA,101.0\n");

    SECTION("First appearance order") {
        auto table = PriceLoader::load_csv_long(path);
        REQUIRE(table.tickers() == std::vector<std::string>{"BBB", "AAA"});
        REQUIRE(table.dates() == std::vector<std::string>{"2020-01-02", "2020-01-03"});
        REQUIRE(table.get_prices("AAA")(1) == 101.0);
    }

    SECTION("Filtered") {
        auto table = PriceLoader::load_csv_long(path, {"AAA"});
        REQUIRE(table.tickers() == std::vector<std::string>{"AAA"});
    }

    SECTION("Auto-detect picks the long layout") {
        auto table = PriceLoader::load_csv(path);
        REQUIRE(table.num_assets() == 2);
        REQUIRE(table.num_dates() == 2);
    }

    SECTION("Duplicate observation") {
        auto dup = dir.write("dup.csv",
                             "date,ticker,price\n"
                             "2020-01-02,AAA,100.0\n"
                             "2020-01-02,AAA,100.5\n");
        REQUIRE_THROWS_AS(PriceLoader::load_csv_long(dup), std::runtime_error);
    }
}

TEST_CASE("CSV errors", "[PriceLoader]") {
    TempDir dir;

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(PriceLoader::load_csv(dir.file("nonexistent_file.csv")), NotFoundError);
        REQUIRE_THROWS_AS(PriceLoader::load_csv_wide(dir.file("nonexistent_file.csv")), NotFoundError);
    }

    SECTION("Header without date column") {
        auto path = dir.write("bad_header.csv", "day,AAA\n2020-01-02,1.0\n");
        REQUIRE_THROWS_AS(PriceLoader::load_csv_wide(path), std::runtime_error);
    }

    SECTION("Invalid price") {
        auto path = dir.write("bad_price.csv", "date,AAA\n2020-01-02,abc\n");
        REQUIRE_THROWS_AS(PriceLoader::load_csv_wide(path), std::runtime_error);
    }

    SECTION("Invalid date") {
        auto path = dir.write("bad_date.csv", "date,AAA\n2020-02-30,1.0\n");
        REQUIRE_THROWS_AS(PriceLoader::load_csv_wide(path), std::runtime_error);
    }

    SECTION("Duplicate date") {
        auto path = dir.write("dup_date.csv", "date,AAA\n2020-01-02,1.0\n2020-01-02,2.0\n");
        REQUIRE_THROWS_AS(PriceLoader::load_csv_wide(path), std::runtime_error);
    }

    SECTION("Header only") {
        auto path = dir.write("empty.csv", "date,AAA\n");
        REQUIRE_THROWS_AS(PriceLoader::load_csv_wide(path), std::runtime_error);
    }
}

TEST_CASE("Save wide CSV", "[PriceLoader]") {
    TempDir dir;
    const double NaN = std::numeric_limits<double>::quiet_NaN();

    Eigen::MatrixXd prices(2, 2);
    prices << 100.0, NaN,
              101.25, 20.5;
    PriceTable table(prices, {"2020-01-02", "2020-01-03"}, {"AAA", "BBB"});

    auto path = dir.file("saved.csv");
    PriceLoader::save_csv_wide(table, path);

    auto reloaded = PriceLoader::load_csv(path);
    REQUIRE(reloaded.tickers() == table.tickers());
    REQUIRE(reloaded.dates() == table.dates());
    REQUIRE(std::isnan(reloaded.prices()(0, 1)));
    REQUIRE_THAT(reloaded.prices()(1, 0), WithinAbs(101.25, 1e-9));
}

TEST_CASE("Synthetic prices", "[PriceLoader]") {
    SyntheticPriceSpec spec;
    spec.tickers = {"AAA", "BBB"};
    spec.start_date = "2020-01-01";
    spec.end_date = "2020-03-01";

    SECTION("Business days within the half-open range") {
        auto table = PriceLoader::generate_synthetic_data(spec);
        REQUIRE(table.dates().front() == "2020-01-01");
        REQUIRE(table.dates().back() == "2020-02-28");
        // 2020-01-04 is a Saturday
        REQUIRE(std::find(table.dates().begin(), table.dates().end(), "2020-01-04") == table.dates().end());
        REQUIRE(table.num_dates() == 43);
        REQUIRE(table.count_missing() == 0);
        REQUIRE(table.prices()(0, 0) == 100.0);
        REQUIRE((table.prices().array() > 0.0).all());
    }

    SECTION("Deterministic for a seed") {
        auto first = PriceLoader::generate_synthetic_data(spec);
        auto second = PriceLoader::generate_synthetic_data(spec);
        REQUIRE(first.prices().isApprox(second.prices()));

        spec.seed = 7;
        auto other = PriceLoader::generate_synthetic_data(spec);
        REQUIRE_FALSE(first.prices().isApprox(other.prices()));
    }

    SECTION("Late listing leaves earlier cells missing") {
        auto baseline = PriceLoader::generate_synthetic_data(spec);

        spec.first_dates["BBB"] = "2020-02-03";
        auto table = PriceLoader::generate_synthetic_data(spec);

        REQUIRE(table.first_valid_date("BBB") == "2020-02-03");
        REQUIRE(table.get_prices("BBB")(table.num_dates() - 1) > 0.0);
        REQUIRE(table.get_prices("AAA").isApprox(baseline.get_prices("AAA")));
    }

    SECTION("Invalid parameters") {
        spec.volatility = 0.0;
        REQUIRE_THROWS_AS(PriceLoader::generate_synthetic_data(spec), std::invalid_argument);
        spec.volatility = 0.01;
        spec.end_date = "2020-02-30";
        REQUIRE_THROWS_AS(PriceLoader::generate_synthetic_data(spec), std::invalid_argument);
    }
}

TEST_CASE("Table price source", "[PriceSource]") {
    const double NaN = std::numeric_limits<double>::quiet_NaN();
    Eigen::MatrixXd prices(3, 2);
    prices << NaN, 10.0,
              101.0, 11.0,
              102.0, 12.0;
    TablePriceSource source(PriceTable(prices, {"2020-01-02", "2020-01-03", "2020-01-06"}, {"AAA", "BBB"}));

    SECTION("History skips missing cells") {
        auto history = source.fetch_history("AAA", "2020-01-01", "2020-02-01");
        REQUIRE(history.size() == 2);
        REQUIRE(history.front().date == "2020-01-03");
        REQUIRE(history.front().price == 101.0);
    }

    SECTION("End date is exclusive") {
        auto history = source.fetch_history("BBB", "2020-01-02", "2020-01-06");
        REQUIRE(history.size() == 2);
    }

    SECTION("Unknown symbol has no history") {
        REQUIRE(source.fetch_history("ZZZ", "2020-01-01", "2020-02-01").empty());
    }

    SECTION("Price table for several symbols") {
        auto table = source.fetch_prices({"BBB", "AAA"}, "2020-01-03", "2020-02-01");
        REQUIRE(table.tickers() == std::vector<std::string>{"BBB", "AAA"});
        REQUIRE(table.num_dates() == 2);
    }

    REQUIRE(source.get_name() == "TablePriceSource");
}
