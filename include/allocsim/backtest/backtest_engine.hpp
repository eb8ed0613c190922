// include/allocsim/backtest/backtest_engine.hpp
#pragma once

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "allocsim/backtest/allocation.hpp"
#include "allocsim/backtest/benchmark_projector.hpp"
#include "allocsim/backtest/drawdown_tracker.hpp"
#include "allocsim/backtest/metrics_calculator.hpp"
#include "allocsim/backtest/portfolio_simulator.hpp"
#include "allocsim/backtest/price_series_aligner.hpp"
#include "allocsim/backtest/rebalance_policy.hpp"
#include "allocsim/core/config_base.hpp"
#include "allocsim/core/error.hpp"
#include "allocsim/core/types.hpp"
#include "allocsim/data/market_data_source.hpp"

namespace allocsim {
namespace backtest {

/**
 * @brief Reference indices compared against every run unless configured otherwise
 */
inline std::map<std::string, std::string> default_benchmarks() {
    return {{"sh", "000001"}, {"hs300", "000300"}};
}

/**
 * @brief Configuration of one fixed-allocation backtest
 */
struct BacktestConfig : public ConfigBase {
    std::string strategy_name{"fixed_allocation"};
    std::map<std::string, double> allocation;  // Asset code -> target weight
    RebalanceRule rebalance_rule{PeriodicRebalance{RebalanceFrequency::MONTHLY}};
    Timestamp start_date;
    Timestamp end_date;
    double initial_capital{100000.0};
    double risk_free_rate{0.03};
    int trading_days_per_year{252};
    std::map<std::string, std::string> benchmarks{default_benchmarks()};  // Name -> index code
    double weight_tolerance{DEFAULT_WEIGHT_TOLERANCE};

    // Configuration metadata
    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;

    /**
     * @brief Load from JSON; absent keys keep their defaults
     * @throws EngineError for a malformed date or rebalance rule
     */
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Everything one run produces
 */
struct BacktestResult {
    std::string strategy_name;
    Timestamp start_date;
    Timestamp end_date;
    double initial_capital{0.0};
    RebalanceRule rebalance_rule;
    std::map<std::string, double> allocation;

    EquityCurve equity_curve;
    DrawdownCurve drawdown_curve;
    std::map<std::string, EquityCurve> benchmark_curves;  // Keyed by benchmark name
    PerformanceMetrics metrics;

    std::vector<RebalanceEvent> rebalance_events;
    std::vector<CoverageGap> coverage_gaps;

    /**
     * @brief Serialize with YYYY-MM-DD dates and [{"date", "value"}] curves
     */
    nlohmann::json to_json() const;
};

/**
 * @brief Serialize a curve as [{"date": "YYYY-MM-DD", "value": x}, ...]
 */
nlohmann::json curve_to_json(const TimeSeries& curve);

/**
 * @brief Runs fixed-allocation backtests against a market data source
 *
 * Pipeline per run: fetch series, align on common dates, simulate, then
 * derive drawdowns, metrics and benchmark curves from the same calendar.
 * The engine holds no per-run state; concurrent runs on one engine are
 * safe as long as the data source is.
 */
class BacktestEngine {
public:
    /**
     * @brief Constructor
     * @param data_source Provider of asset and benchmark series
     */
    explicit BacktestEngine(std::shared_ptr<MarketDataSource> data_source);

    /**
     * @brief Run a backtest described by a configuration
     * @param config Backtest configuration
     * @return Result containing backtest results
     */
    Result<BacktestResult> run_backtest(const BacktestConfig& config) const;

    /**
     * @brief Run a backtest with the default benchmarks
     * @param allocation Target weights
     * @param rule Rebalance rule
     * @param start_date First date (inclusive)
     * @param end_date Last date (inclusive)
     * @param initial_capital Starting value, > 0
     * @param risk_free_rate Annual risk-free rate
     * @param trading_days_per_year Annualization factor
     * @return Result containing backtest results
     */
    Result<BacktestResult> run_backtest(const Allocation& allocation, const RebalanceRule& rule,
                                        const Timestamp& start_date, const Timestamp& end_date,
                                        double initial_capital, double risk_free_rate,
                                        int trading_days_per_year) const;

private:
    std::shared_ptr<MarketDataSource> data_source_;
    PriceSeriesAligner aligner_;
    PortfolioSimulator simulator_;
    DrawdownTracker drawdown_tracker_;
    MetricsCalculator metrics_calculator_;
    BenchmarkProjector benchmark_projector_;

    /**
     * @brief Reject configurations that cannot be simulated
     * @return INVALID_ALLOCATION or INVALID_ARGUMENT
     */
    Result<void> validate_config(const BacktestConfig& config) const;

    /**
     * @brief Project every configured benchmark onto the strategy calendar
     *
     * Benchmarks without usable data are logged and left out.
     */
    std::map<std::string, EquityCurve> project_benchmarks(const BacktestConfig& config,
                                                          const std::vector<Timestamp>& calendar) const;
};

}  // namespace backtest
}  // namespace allocsim
