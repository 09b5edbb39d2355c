#include <fstream>
#include <iomanip>
#include <iostream>
#include "trend_engine/backtest/strategy_orchestrator.hpp"
#include "trend_engine/core/logger.hpp"
#include "trend_engine/core/state_manager.hpp"
#include "trend_engine/data/csv_bar_loader.hpp"

using namespace trend_engine;
using namespace trend_engine::backtest;

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.json> <bars.csv> [results.json]"
                  << std::endl;
        return 1;
    }
    const std::string config_path = argv[1];
    const std::string bars_path = argv[2];
    const std::string results_path = argc > 3 ? argv[3] : "sma_trend_results.json";

    try {
        StateManager::reset_instance();
        Logger::reset_for_tests();

        BacktestConfig config;
        auto load_result = config.load_from_file(config_path);
        if (load_result.is_error()) {
            std::cerr << "Failed to load config: " << load_result.error()->to_string()
                      << std::endl;
            return 1;
        }

        auto& logger = Logger::instance();
        logger.initialize(config.logging);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("bt_sma_trend");

        auto validation = config.validate();
        if (validation.is_error()) {
            ERROR("Invalid configuration: " << validation.error()->to_string());
            return 1;
        }

        CsvBarLoader loader;
        auto bars = loader.load(bars_path);
        if (bars.is_error()) {
            ERROR("Failed to load bars: " << bars.error()->to_string());
            return 1;
        }

        StrategyOrchestrator orchestrator(config);
        auto init_result = orchestrator.initialize();
        if (init_result.is_error()) {
            ERROR("Failed to initialize: " << init_result.error()->to_string());
            return 1;
        }

        std::cout << "=== Running SMA Trend Backtest ===" << std::endl;
        std::cout << "NOTE: " << config.indicators.sma_period << " bar warm-up period required"
                  << std::endl;

        auto result = orchestrator.run(bars.value());
        if (result.is_error()) {
            std::cerr << "Backtest failed: " << result.error()->to_string() << std::endl;
            return 1;
        }

        const auto& backtest_results = result.value();

        std::cout << "\n=== Backtest Results ===" << std::endl;
        std::cout << "Steps:           " << backtest_results.steps << std::endl;
        std::cout << "Final Equity:    " << std::fixed << std::setprecision(2)
                  << backtest_results.final_equity << std::endl;
        std::cout << "Total Return:    " << std::fixed << std::setprecision(2)
                  << (backtest_results.total_return() * 100.0) << "%" << std::endl;
        std::cout << "Accepted:        " << backtest_results.accepted << std::endl;
        std::cout << "Rejected:        " << backtest_results.rejected << std::endl;
        std::cout << "Dropped:         " << backtest_results.dropped << std::endl;
        std::cout << "========================\n" << std::endl;

        std::ofstream out(results_path);
        if (!out.is_open()) {
            ERROR("Failed to open " << results_path << " for writing");
            return 1;
        }
        out << backtest_results.to_json().dump(4);
        INFO("Results written to " << results_path);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
