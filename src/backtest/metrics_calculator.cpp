// src/backtest/metrics_calculator.cpp

#include "allocsim/backtest/metrics_calculator.hpp"
#include <cmath>
#include <numeric>
#include <sstream>
#include "allocsim/backtest/drawdown_tracker.hpp"
#include "allocsim/core/time_utils.hpp"

namespace allocsim {
namespace backtest {

namespace {

constexpr double DAYS_PER_YEAR = 365.25;

// Deviations below this are rounding noise and count as zero
constexpr double ZERO_TOLERANCE = 1e-12;

std::optional<double> finite_or_empty(double value) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

nlohmann::json optional_to_json(const std::optional<double>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

}  // namespace

nlohmann::json PerformanceMetrics::to_json() const {
    nlohmann::json j;
    j["total_return"] = total_return;
    j["annual_return"] = annual_return;
    j["max_drawdown"] = max_drawdown;
    j["volatility"] = optional_to_json(volatility);
    j["sharpe_ratio"] = optional_to_json(sharpe_ratio);
    j["sortino_ratio"] = optional_to_json(sortino_ratio);
    j["calmar_ratio"] = optional_to_json(calmar_ratio);
    j["rebalance_count"] = rebalance_count;
    return j;
}

Result<PerformanceMetrics> MetricsCalculator::compute(const EquityCurve& equity_curve,
                                                      const DrawdownCurve& drawdown_curve,
                                                      int rebalance_count,
                                                      double risk_free_rate,
                                                      int trading_days_per_year) const {
    if (equity_curve.empty()) {
        return make_error<PerformanceMetrics>(ErrorCode::INSUFFICIENT_DATA,
                                              "Equity curve is empty", "MetricsCalculator");
    }
    if (trading_days_per_year <= 0) {
        return make_error<PerformanceMetrics>(
            ErrorCode::INVALID_ARGUMENT,
            "Trading days per year must be positive, got " + std::to_string(trading_days_per_year),
            "MetricsCalculator");
    }
    if (!std::isfinite(risk_free_rate)) {
        return make_error<PerformanceMetrics>(ErrorCode::INVALID_ARGUMENT,
                                              "Risk-free rate must be finite",
                                              "MetricsCalculator");
    }
    if (drawdown_curve.size() != equity_curve.size()) {
        std::ostringstream msg;
        msg << "Drawdown curve has " << drawdown_curve.size() << " points, equity curve has "
            << equity_curve.size();
        return make_error<PerformanceMetrics>(ErrorCode::INVALID_ARGUMENT, msg.str(),
                                              "MetricsCalculator");
    }
    for (const auto& [date, value] : equity_curve) {
        if (!std::isfinite(value) || value <= 0.0) {
            std::ostringstream msg;
            msg << "Equity value " << value << " on " << core::format_date(date)
                << " is not positive";
            return make_error<PerformanceMetrics>(ErrorCode::INVALID_DATA, msg.str(),
                                                  "MetricsCalculator");
        }
    }

    PerformanceMetrics metrics;
    metrics.rebalance_count = rebalance_count;
    metrics.total_return =
        calculate_total_return(equity_curve.front().second, equity_curve.back().second);

    metrics.max_drawdown = DrawdownTracker().max_drawdown(drawdown_curve);

    double years = calculate_years(equity_curve.front().first, equity_curve.back().first);
    if (years <= 0.0) {
        // Single-date run: nothing to annualize
        metrics.annual_return = metrics.total_return;
        return metrics;
    }

    metrics.annual_return = calculate_annual_return(metrics.total_return, years);

    auto returns = calculate_returns_from_equity(equity_curve);
    metrics.volatility = calculate_volatility(returns, trading_days_per_year);
    metrics.sharpe_ratio =
        calculate_sharpe_ratio(metrics.annual_return, metrics.volatility, risk_free_rate);
    metrics.sortino_ratio = calculate_sortino_ratio(
        metrics.annual_return, calculate_downside_volatility(returns, trading_days_per_year),
        risk_free_rate);
    metrics.calmar_ratio = calculate_calmar_ratio(metrics.annual_return, metrics.max_drawdown);

    return metrics;
}

// ========== Return Calculations ==========

double MetricsCalculator::calculate_total_return(double start_value, double end_value) const {
    if (start_value <= 0.0) {
        return 0.0;
    }
    return end_value / start_value - 1.0;
}

double MetricsCalculator::calculate_years(const Timestamp& first, const Timestamp& last) const {
    return static_cast<double>(core::days_between(first, last)) / DAYS_PER_YEAR;
}

double MetricsCalculator::calculate_annual_return(double total_return, double years) const {
    if (years <= 0.0) {
        return total_return;
    }
    return std::pow(1.0 + total_return, 1.0 / years) - 1.0;
}

std::vector<double> MetricsCalculator::calculate_returns_from_equity(
    const EquityCurve& equity_curve) const {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }

    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        returns.push_back(equity_curve[i].second / equity_curve[i - 1].second - 1.0);
    }
    return returns;
}

// ========== Volatility Metrics ==========

std::optional<double> MetricsCalculator::calculate_volatility(const std::vector<double>& returns,
                                                              int trading_days_per_year) const {
    if (trading_days_per_year <= 0) {
        return std::nullopt;
    }
    if (returns.size() < 2) {
        return 0.0;
    }

    double daily = calculate_sample_std_dev(returns, calculate_mean(returns));
    if (daily < ZERO_TOLERANCE) {
        return 0.0;
    }
    return finite_or_empty(daily * std::sqrt(static_cast<double>(trading_days_per_year)));
}

std::optional<double> MetricsCalculator::calculate_downside_volatility(
    const std::vector<double>& returns, int trading_days_per_year) const {
    std::vector<double> losses;
    for (double r : returns) {
        if (r < 0.0) {
            losses.push_back(r);
        }
    }

    if (losses.size() < 2 || trading_days_per_year <= 0) {
        return std::nullopt;
    }

    double daily = calculate_sample_std_dev(losses, calculate_mean(losses));
    if (daily < ZERO_TOLERANCE) {
        return std::nullopt;
    }
    return finite_or_empty(daily * std::sqrt(static_cast<double>(trading_days_per_year)));
}

// ========== Risk-Adjusted Return Metrics ==========

std::optional<double> MetricsCalculator::calculate_sharpe_ratio(
    double annual_return, const std::optional<double>& volatility,
    double risk_free_rate) const {
    if (!volatility || *volatility < ZERO_TOLERANCE) {
        return std::nullopt;
    }
    return finite_or_empty((annual_return - risk_free_rate) / *volatility);
}

std::optional<double> MetricsCalculator::calculate_sortino_ratio(
    double annual_return, const std::optional<double>& downside_volatility,
    double risk_free_rate) const {
    if (!downside_volatility || *downside_volatility < ZERO_TOLERANCE) {
        return std::nullopt;
    }
    return finite_or_empty((annual_return - risk_free_rate) / *downside_volatility);
}

std::optional<double> MetricsCalculator::calculate_calmar_ratio(double annual_return,
                                                                double max_drawdown) const {
    if (std::abs(max_drawdown) < ZERO_TOLERANCE) {
        return std::nullopt;
    }
    return finite_or_empty(annual_return / std::abs(max_drawdown));
}

// ========== Helper Methods ==========

double MetricsCalculator::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double MetricsCalculator::calculate_sample_std_dev(const std::vector<double>& values,
                                                   double mean) const {
    double sq_sum = 0.0;
    for (double val : values) {
        sq_sum += (val - mean) * (val - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
}

}  // namespace backtest
}  // namespace allocsim
