// include/allocsim/backtest/metrics_calculator.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <vector>
#include "allocsim/core/error.hpp"
#include "allocsim/core/types.hpp"

namespace allocsim {
namespace backtest {

/**
 * @brief Summary statistics of one backtest run
 *
 * Ratios that cannot be computed (zero volatility, zero drawdown, no losing
 * days, single-date runs) are empty rather than NaN or infinity. Volatility
 * is empty only for single-date runs.
 */
struct PerformanceMetrics {
    double total_return{0.0};
    double annual_return{0.0};
    std::optional<double> volatility;
    double max_drawdown{0.0};  // <= 0
    std::optional<double> sharpe_ratio;
    std::optional<double> sortino_ratio;
    std::optional<double> calmar_ratio;
    int rebalance_count{0};

    /**
     * @brief Serialize with null for undefined values
     */
    nlohmann::json to_json() const;
};

/**
 * @brief Stateless calculator of performance metrics from an equity curve
 *
 * Risk-free rate and trading days per year are explicit arguments; the
 * calculator has no defaults of its own. No logging (callers log).
 */
class MetricsCalculator {
public:
    MetricsCalculator() = default;

    /**
     * @brief Calculate every metric of an equity curve
     * @param equity_curve Portfolio value per date, values > 0
     * @param drawdown_curve Drawdown of equity_curve, same length; max drawdown is its minimum
     * @param rebalance_count Passed through from the simulator
     * @param risk_free_rate Annual risk-free rate (0.03 = 3%)
     * @param trading_days_per_year Annualization factor for volatility
     * @return Metrics, or INSUFFICIENT_DATA / INVALID_ARGUMENT / INVALID_DATA
     */
    Result<PerformanceMetrics> compute(const EquityCurve& equity_curve,
                                       const DrawdownCurve& drawdown_curve, int rebalance_count,
                                       double risk_free_rate,
                                       int trading_days_per_year) const;

    // ========== Return Calculations ==========

    /**
     * @brief final / initial - 1
     */
    double calculate_total_return(double start_value, double end_value) const;

    /**
     * @brief Calendar years between two dates (days / 365.25)
     */
    double calculate_years(const Timestamp& first, const Timestamp& last) const;

    /**
     * @brief Compound annual growth rate
     * @param total_return Total return as decimal
     * @param years Length of the run in years, > 0
     */
    double calculate_annual_return(double total_return, double years) const;

    /**
     * @brief Daily simple returns value(t) / value(t-1) - 1
     */
    std::vector<double> calculate_returns_from_equity(const EquityCurve& equity_curve) const;

    // ========== Volatility Metrics ==========

    /**
     * @brief Annualized sample standard deviation of daily returns
     * @return 0 with fewer than two returns
     */
    std::optional<double> calculate_volatility(const std::vector<double>& returns,
                                               int trading_days_per_year) const;

    /**
     * @brief Annualized sample standard deviation of the negative returns only
     * @return Empty with fewer than two negative returns, or when it is zero
     */
    std::optional<double> calculate_downside_volatility(const std::vector<double>& returns,
                                                        int trading_days_per_year) const;

    // ========== Risk-Adjusted Return Metrics ==========

    std::optional<double> calculate_sharpe_ratio(double annual_return,
                                                 const std::optional<double>& volatility,
                                                 double risk_free_rate) const;

    std::optional<double> calculate_sortino_ratio(
        double annual_return, const std::optional<double>& downside_volatility,
        double risk_free_rate) const;

    /**
     * @brief annual_return / |max_drawdown|, empty when there was no drawdown
     */
    std::optional<double> calculate_calmar_ratio(double annual_return,
                                                 double max_drawdown) const;

private:
    double calculate_mean(const std::vector<double>& values) const;

    // Bessel-corrected (n - 1); caller ensures values.size() >= 2
    double calculate_sample_std_dev(const std::vector<double>& values, double mean) const;
};

}  // namespace backtest
}  // namespace allocsim
