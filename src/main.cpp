/**
 * @file main.cpp
 * @brief Command-line entry point for the risk metrics pipeline
 *
 * Loads a sampling configuration and a price file, builds the monthly
 * return series, and reports full-period and backtest-window metrics.
 */

#include "backtest/backtest_window.hpp"
#include "config/sampling_config.hpp"
#include "data/historical_series_builder.hpp"
#include "data/price_loader.hpp"
#include "data/price_source.hpp"
#include "report/metrics_writer.hpp"
#include "risk/risk_metrics.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <iostream>
#include <string>

using namespace riskmetrics;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Risk Metrics v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH           Sampling configuration JSON file (required)\n"
              << "  --prices PATH           Price CSV file, wide or long format (required)\n"
              << "  --backtest-months N     Also compute metrics over the first N months\n"
              << "  --output DIR            Export metrics as CSV and JSON to DIR\n"
              << "  --verbose               Enable verbose logging\n"
              << "  --help, -h              Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/etf_config.json "
              << "--prices data/market/etf_prices.csv --backtest-months 5\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string prices_path;
    std::string output_dir;
    double backtest_months = 0.0;
    bool run_backtest = false;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--prices" && i + 1 < argc)
            {
                args.prices_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--backtest-months" && i + 1 < argc)
            {
                args.backtest_months = std::stod(argv[++i]);
                args.run_backtest = true;
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty() && !prices_path.empty();
    }
};

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::steady_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        auto config = SamplingConfig::load_from_file(args.config_path);

        if (args.verbose)
        {
            std::cout << "  - Tickers: ";
            for (const auto &ticker : config.tickers)
            {
                std::cout << ticker << " ";
            }
            std::cout << "\n  - Sample period: " << config.sample_period_start()
                      << " to " << config.sample_period_end
                      << " (" << config.total_sample_period.to_string() << ")\n";
            std::cout << "  - Time step: " << to_string(config.sample_time_step) << "\n";
        }

        // ====================================================================
        // 2. Build Return Series
        // ====================================================================
        std::cout << "[2/4] Building monthly returns..." << std::endl;

        // Unfiltered, so the builder names any configured ticker the file lacks
        TablePriceSource source(PriceLoader::load_csv(args.prices_path));
        if (args.verbose)
        {
            source.table().print_summary();
        }

        HistoricalSeriesBuilder builder(source);
        ReturnSeries returns = builder.build(config);
        returns.print_head();

        // ====================================================================
        // 3. Full-Period Metrics
        // ====================================================================
        std::cout << "\n[3/4] Computing full-period metrics..." << std::endl;

        risk::RiskMetricsEngine engine;
        risk::RiskMetrics metrics = engine.compute(returns);
        metrics.print_summary(std::cout);

        report::MetricsWriter writer;
        if (!args.output_dir.empty())
        {
            writer.save_all(metrics, args.output_dir, "full_period");
        }

        // ====================================================================
        // 4. Backtest Window (Optional)
        // ====================================================================
        if (args.run_backtest)
        {
            std::cout << "\n[4/4] Computing metrics over the first "
                      << args.backtest_months << " months..." << std::endl;

            backtest::BacktestWindowResampler resampler(engine);
            risk::RiskMetrics windowed = resampler.resample(returns, args.backtest_months);
            windowed.returns.print_head();
            windowed.print_summary(std::cout);

            if (!args.output_dir.empty())
            {
                writer.save_all(windowed, args.output_dir,
                                "backtest_" + std::to_string(static_cast<int>(args.backtest_months)) + "m");
            }
        }
        else
        {
            std::cout << "\n[4/4] Skipping backtest window (use --backtest-months to enable)\n";
        }

        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

        std::cout << "\nCompleted in " << duration << " ms" << std::endl;
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    CommandLineArgs args;
    try
    {
        args = CommandLineArgs::parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: invalid argument value (" << e.what() << ")" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (args.show_help || !args.is_valid())
    {
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::warn);

    return run(args);
}
