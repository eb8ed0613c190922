// include/allocsim/backtest/portfolio_simulator.hpp
#pragma once

#include <map>
#include <string>
#include <vector>
#include "allocsim/backtest/allocation.hpp"
#include "allocsim/backtest/price_series_aligner.hpp"
#include "allocsim/backtest/rebalance_policy.hpp"
#include "allocsim/core/error.hpp"
#include "allocsim/core/types.hpp"

namespace allocsim {
namespace backtest {

/**
 * @brief A reset of all holdings to target weights
 */
struct RebalanceEvent {
    Timestamp date;
    double portfolio_value;
    std::map<std::string, double> weights_before;  // Realized weights before the reset
};

/**
 * @brief Output of one simulation run
 */
struct SimulationResult {
    EquityCurve equity_curve;
    int rebalance_count{0};
    std::vector<RebalanceEvent> rebalance_events;
    std::map<std::string, double> final_holdings;  // Currency value per asset on the last date
};

/**
 * @brief Day-by-day walk of a fixed-allocation portfolio
 *
 * On the first date the capital is split by target weight. On every later
 * date each holding drifts with its asset's price ratio, the total is
 * appended to the equity curve, and the policy may reset every holding to
 * total * target weight. The simulator is stateless; each call owns its
 * SimulationState.
 */
class PortfolioSimulator {
public:
    PortfolioSimulator() = default;

    /**
     * @brief Run the simulation
     * @param calendar Aligned prices of every allocated asset
     * @param initial_capital Starting portfolio value, > 0
     * @param allocation Target weights; must validate. Invested rescaled to sum to 1
     * @param policy Rebalance decision rule
     * @return Simulation output, or INVALID_ALLOCATION / INVALID_ARGUMENT /
     *         INSUFFICIENT_DATA / INVALID_PRICE
     */
    Result<SimulationResult> simulate(const AlignedCalendar& calendar, double initial_capital,
                                      const Allocation& allocation,
                                      const RebalancePolicy& policy) const;

private:
    void rebalance(SimulationState& state, const std::vector<double>& target_weights,
                   const std::vector<std::string>& codes, double total,
                   SimulationResult& result) const;
};

}  // namespace backtest
}  // namespace allocsim
