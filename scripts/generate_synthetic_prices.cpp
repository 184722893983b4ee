/**
 * @file generate_synthetic_prices.cpp
 * @brief Generate a synthetic daily price file for the risk metrics CLI
 */

#include "data/price_loader.hpp"
#include "data/price_table.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

using namespace riskmetrics;

int main(int argc, char *argv[]) {
    std::cout << "\n=== Synthetic Price Generator ===\n" << std::endl;

    // Select Sector SPDR ETFs
    SyntheticPriceSpec spec;
    spec.tickers = {"XLC", "XLY", "XLP", "XLE", "XLF", "XLV", "XLI", "XLB", "XLRE", "XLK", "XLU"};
    spec.start_date = "2019-01-01";
    spec.end_date = "2024-01-01";

    std::string output_file = "data/market/etf_prices.csv";

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc) {
                output_file = argv[++i];
            } else if (arg == "--start" && i + 1 < argc) {
                spec.start_date = argv[++i];
            } else if (arg == "--end" && i + 1 < argc) {
                spec.end_date = argv[++i];
            } else if (arg == "--volatility" && i + 1 < argc) {
                spec.volatility = std::stod(argv[++i]);
            } else if (arg == "--drift" && i + 1 < argc) {
                spec.drift = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                spec.seed = static_cast<unsigned int>(std::stoul(argv[++i]));
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --output FILE      Output CSV file (default: data/market/etf_prices.csv)\n"
                          << "  --start DATE       First calendar day (default: 2019-01-01)\n"
                          << "  --end DATE         Day after the last calendar day (default: 2024-01-01)\n"
                          << "  --volatility VAL   Daily volatility (default: 0.01)\n"
                          << "  --drift VAL        Daily drift (default: 0.0003)\n"
                          << "  --seed N           Random seed (default: 42)\n"
                          << "  --help             Show this help\n";
                return 0;
            }
        }

        std::cout << "Generating " << spec.tickers.size() << " tickers from "
                  << spec.start_date << " to " << spec.end_date << "..." << std::endl;

        PriceTable data = PriceLoader::generate_synthetic_data(spec);

        std::cout << "Saving to " << output_file << "..." << std::endl;
        std::filesystem::path parent = std::filesystem::path(output_file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        PriceLoader::save_csv_wide(data, output_file);

        data.print_summary();
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "You can now run:\n"
              << "  ./build/risk_metrics --config data/config/etf_config.json --prices " << output_file
              << " --backtest-months 5\n"
              << std::endl;

    return 0;
}
