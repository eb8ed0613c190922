// include/allocsim/backtest/rebalance_policy.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "allocsim/core/error.hpp"
#include "allocsim/core/types.hpp"

namespace allocsim {
namespace backtest {

/**
 * @brief Calendar granularity of periodic rebalancing
 */
enum class RebalanceFrequency {
    MONTHLY,
    QUARTERLY,
    YEARLY
};

std::string frequency_to_string(RebalanceFrequency frequency);

/**
 * @brief Rebalance on the first trading date of each new calendar period
 */
struct PeriodicRebalance {
    RebalanceFrequency frequency{RebalanceFrequency::MONTHLY};
};

/**
 * @brief Rebalance when any asset's weight drifts more than max_drift from target
 */
struct ThresholdRebalance {
    double max_drift{0.05};
};

/**
 * @brief Declarative rebalance rule of a strategy
 *
 * Periodic and threshold rules are mutually exclusive.
 */
using RebalanceRule = std::variant<PeriodicRebalance, ThresholdRebalance>;

/**
 * @brief Short name of a rule: "monthly", "quarterly", "yearly" or "threshold"
 */
std::string rebalance_rule_name(const RebalanceRule& rule);

/**
 * @brief Serialize as {"type": ..., "threshold": ...}
 */
nlohmann::json rebalance_rule_to_json(const RebalanceRule& rule);

/**
 * @brief Parse {"type": "monthly"|"quarterly"|"yearly"|"threshold", "threshold": x}
 * @return The rule or INVALID_ARGUMENT
 */
Result<RebalanceRule> rebalance_rule_from_json(const nlohmann::json& j);

/**
 * @brief First day of the period after the one containing date
 */
Timestamp next_rebalance_date(const Timestamp& date, RebalanceFrequency frequency);

/**
 * @brief Mutable state of one simulation run
 *
 * Owned by a single PortfolioSimulator::simulate call and never shared.
 * holdings[i] is the currency value held in the i-th aligned asset.
 */
struct SimulationState {
    std::vector<double> holdings;
    Timestamp current_date;
    std::optional<Timestamp> last_rebalance_date;
    int rebalance_count{0};

    double total_value() const;

    /**
     * @brief Realized weight of each holding; zeros if the portfolio is empty
     */
    std::vector<double> current_weights() const;
};

/**
 * @brief Decides whether the portfolio is reset to its target weights today
 */
class RebalancePolicy {
public:
    virtual ~RebalancePolicy() = default;

    /**
     * @brief Evaluate the rule after today's drift has been applied
     * @param state Simulation state on state.current_date
     * @param target_weights Target weight per holding, same order as state.holdings
     * @return true if every holding must be reset to its target weight
     */
    virtual bool should_rebalance(const SimulationState& state,
                                  const std::vector<double>& target_weights) const = 0;

    virtual std::string name() const = 0;
};

class PeriodicRebalancePolicy : public RebalancePolicy {
public:
    explicit PeriodicRebalancePolicy(RebalanceFrequency frequency);

    bool should_rebalance(const SimulationState& state,
                          const std::vector<double>& target_weights) const override;

    std::string name() const override {
        return frequency_to_string(frequency_);
    }

    /**
     * @brief Identifier of the calendar period containing date
     *
     * Equal for two dates iff they fall in the same month/quarter/year.
     */
    int period_key(const Timestamp& date) const;

private:
    RebalanceFrequency frequency_;
};

class ThresholdRebalancePolicy : public RebalancePolicy {
public:
    explicit ThresholdRebalancePolicy(double max_drift);

    bool should_rebalance(const SimulationState& state,
                          const std::vector<double>& target_weights) const override;

    std::string name() const override {
        return "threshold";
    }

    double max_drift() const {
        return max_drift_;
    }

private:
    double max_drift_;
};

/**
 * @brief Build the policy implementing a rule
 * @return The policy, or INVALID_ARGUMENT for a non-positive or non-finite drift
 */
Result<std::unique_ptr<RebalancePolicy>> create_rebalance_policy(const RebalanceRule& rule);

}  // namespace backtest
}  // namespace allocsim
