#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include "allocsim/backtest/backtest_engine.hpp"
#include "allocsim/core/logger.hpp"
#include "allocsim/data/conversion_utils.hpp"
#include "allocsim/data/market_data_source.hpp"

using namespace allocsim;
using namespace allocsim::backtest;

namespace {

std::string format_optional(const std::optional<double>& value) {
    if (!value) {
        return "n/a";
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << *value;
    return ss.str();
}

// Load <data_dir>/<code>.csv into the source; returns false if the file is unusable
bool load_csv(InMemoryMarketDataSource& source, const std::filesystem::path& data_dir,
              const std::string& code) {
    std::filesystem::path path = data_dir / (code + ".csv");
    auto series = DataConversionUtils::read_csv_series(path.string(), code);
    if (series.is_error()) {
        WARN("Could not load " << path.string() << ": " << series.error()->what());
        return false;
    }

    auto added = source.add_series(series.release());
    if (added.is_error()) {
        WARN("Rejected series " << code << ": " << added.error()->what());
        return false;
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.json> <data_dir> [result.json]"
                  << std::endl;
        return 1;
    }

    const std::string config_filename = argv[1];
    const std::filesystem::path data_dir = argv[2];
    const std::string output_filename = argc > 3 ? argv[3] : "backtest_result.json";

    try {
        Logger::reset_for_tests();

        // Initialize logger
        auto& logger = Logger::instance();
        LoggerConfig logger_config;
        logger_config.min_level = LogLevel::INFO;
        logger_config.destination = LogDestination::BOTH;
        logger_config.log_directory = "logs";
        logger_config.filename_prefix = "bt_rebalance";
        logger.initialize(logger_config);

        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }

        BacktestConfig config;
        auto load_result = config.load_from_file(config_filename);
        if (load_result.is_error()) {
            std::cerr << "Failed to load config: " << load_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        INFO("Loaded backtest config from " << config_filename);

        // Asset files are required, benchmark files are optional
        auto source = std::make_shared<InMemoryMarketDataSource>();
        for (const auto& [code, weight] : config.allocation) {
            if (!load_csv(*source, data_dir, code)) {
                std::cerr << "Missing price data for " << code << " in " << data_dir.string()
                          << std::endl;
                return 1;
            }
        }
        for (const auto& [name, index_code] : config.benchmarks) {
            if (!source->has_series(index_code) && !load_csv(*source, data_dir, index_code)) {
                WARN("Benchmark " << name << " has no data and will not be reported");
            }
        }

        BacktestEngine engine(source);
        auto result = engine.run_backtest(config);
        if (result.is_error()) {
            std::cerr << "Backtest failed: " << result.error()->to_string() << std::endl;
            return 1;
        }

        const auto& metrics = result.value().metrics;
        INFO("Total return:    " << std::fixed << std::setprecision(4) << metrics.total_return);
        INFO("Annual return:   " << std::fixed << std::setprecision(4) << metrics.annual_return);
        INFO("Volatility:      " << format_optional(metrics.volatility));
        INFO("Max drawdown:    " << std::fixed << std::setprecision(4) << metrics.max_drawdown);
        INFO("Sharpe ratio:    " << format_optional(metrics.sharpe_ratio));
        INFO("Sortino ratio:   " << format_optional(metrics.sortino_ratio));
        INFO("Calmar ratio:    " << format_optional(metrics.calmar_ratio));
        INFO("Rebalances:      " << metrics.rebalance_count);

        std::ofstream out(output_filename);
        if (!out.is_open()) {
            ERROR("Failed to open " << output_filename << " for writing");
            return 1;
        }
        out << std::setw(2) << result.value().to_json() << std::endl;
        INFO("Wrote results to " << output_filename);

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
