// src/backtest/portfolio_simulator.cpp

#include "allocsim/backtest/portfolio_simulator.hpp"
#include <cmath>
#include <sstream>
#include "allocsim/core/logger.hpp"
#include "allocsim/core/time_utils.hpp"

namespace allocsim {
namespace backtest {

namespace {

Result<void> check_prices(const AlignedCalendar& calendar, size_t t,
                          const std::vector<double>& target_weights) {
    const auto& row = calendar.prices[t];
    if (row.size() != calendar.codes.size()) {
        return make_error<void>(ErrorCode::INVALID_PRICE,
                                "Missing prices on " + core::format_date(calendar.dates[t]),
                                "PortfolioSimulator");
    }
    for (size_t i = 0; i < row.size(); ++i) {
        if (target_weights[i] == 0.0) {
            continue;
        }
        if (!std::isfinite(row[i]) || row[i] <= 0.0) {
            std::ostringstream msg;
            msg << "Invalid close " << row[i] << " for " << calendar.codes[i] << " on "
                << core::format_date(calendar.dates[t]);
            return make_error<void>(ErrorCode::INVALID_PRICE, msg.str(), "PortfolioSimulator");
        }
    }
    return Result<void>();
}

}  // namespace

Result<SimulationResult> PortfolioSimulator::simulate(const AlignedCalendar& calendar,
                                                      double initial_capital,
                                                      const Allocation& allocation,
                                                      const RebalancePolicy& policy) const {
    if (allocation.empty()) {
        return make_error<SimulationResult>(ErrorCode::INVALID_ALLOCATION,
                                            "Allocation has no assets", "PortfolioSimulator");
    }
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        std::ostringstream msg;
        msg << "Initial capital must be positive, got " << initial_capital;
        return make_error<SimulationResult>(ErrorCode::INVALID_ARGUMENT, msg.str(),
                                            "PortfolioSimulator");
    }
    if (calendar.empty()) {
        return make_error<SimulationResult>(ErrorCode::INSUFFICIENT_DATA,
                                            "Aligned calendar has no dates", "PortfolioSimulator");
    }
    if (calendar.prices.size() != calendar.dates.size()) {
        return make_error<SimulationResult>(ErrorCode::INVALID_PRICE,
                                            "Aligned calendar has dates without prices",
                                            "PortfolioSimulator");
    }

    // Target weights in calendar column order, rescaled to sum to exactly 1
    std::vector<double> target_weights(calendar.codes.size(), 0.0);
    for (const auto& [code, weight] : allocation.normalized().weights()) {
        int idx = calendar.index_of(code);
        if (idx < 0) {
            return make_error<SimulationResult>(ErrorCode::INVALID_ARGUMENT,
                                                "No aligned prices for allocated asset " + code,
                                                "PortfolioSimulator");
        }
        target_weights[static_cast<size_t>(idx)] = weight;
    }

    SimulationResult result;
    result.equity_curve.reserve(calendar.size());

    SimulationState state;
    state.holdings.assign(calendar.codes.size(), 0.0);

    for (size_t t = 0; t < calendar.size(); ++t) {
        auto prices_ok = check_prices(calendar, t, target_weights);
        if (prices_ok.is_error()) {
            ERROR(prices_ok.error()->what());
            return forward_error<SimulationResult>(prices_ok, "PortfolioSimulator");
        }

        state.current_date = calendar.dates[t];

        if (t == 0) {
            // Initial allocation, recorded at exactly the starting capital
            for (size_t i = 0; i < state.holdings.size(); ++i) {
                state.holdings[i] = initial_capital * target_weights[i];
            }
            result.equity_curve.emplace_back(state.current_date, initial_capital);
            result.rebalance_events.push_back(
                RebalanceEvent{state.current_date, initial_capital, {}});
            state.last_rebalance_date = state.current_date;
            state.rebalance_count = 1;
            continue;
        }

        const auto& today = calendar.prices[t];
        const auto& yesterday = calendar.prices[t - 1];
        for (size_t i = 0; i < state.holdings.size(); ++i) {
            if (target_weights[i] != 0.0) {
                state.holdings[i] *= today[i] / yesterday[i];
            }
        }

        double total = state.total_value();
        result.equity_curve.emplace_back(state.current_date, total);

        if (policy.should_rebalance(state, target_weights)) {
            rebalance(state, target_weights, calendar.codes, total, result);
        }
    }

    result.rebalance_count = state.rebalance_count;
    for (size_t i = 0; i < calendar.codes.size(); ++i) {
        if (target_weights[i] != 0.0) {
            result.final_holdings[calendar.codes[i]] = state.holdings[i];
        }
    }

    return result;
}

void PortfolioSimulator::rebalance(SimulationState& state,
                                   const std::vector<double>& target_weights,
                                   const std::vector<std::string>& codes, double total,
                                   SimulationResult& result) const {
    RebalanceEvent event{state.current_date, total, {}};
    std::vector<double> weights = state.current_weights();
    for (size_t i = 0; i < codes.size(); ++i) {
        if (target_weights[i] != 0.0) {
            event.weights_before[codes[i]] = weights[i];
        }
    }

    for (size_t i = 0; i < state.holdings.size(); ++i) {
        state.holdings[i] = total * target_weights[i];
    }
    state.last_rebalance_date = state.current_date;
    ++state.rebalance_count;

    DEBUG("Rebalanced on " << core::format_date(state.current_date) << " at value " << total
                           << " (event " << state.rebalance_count << ")");
    result.rebalance_events.push_back(std::move(event));
}

}  // namespace backtest
}  // namespace allocsim
