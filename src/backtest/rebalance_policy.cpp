// src/backtest/rebalance_policy.cpp

#include "allocsim/backtest/rebalance_policy.hpp"
#include <cmath>
#include <sstream>
#include "allocsim/core/time_utils.hpp"

namespace allocsim {
namespace backtest {

std::string frequency_to_string(RebalanceFrequency frequency) {
    switch (frequency) {
        case RebalanceFrequency::MONTHLY:
            return "monthly";
        case RebalanceFrequency::QUARTERLY:
            return "quarterly";
        case RebalanceFrequency::YEARLY:
            return "yearly";
        default:
            return "unknown";
    }
}

std::string rebalance_rule_name(const RebalanceRule& rule) {
    if (const auto* periodic = std::get_if<PeriodicRebalance>(&rule)) {
        return frequency_to_string(periodic->frequency);
    }
    return "threshold";
}

nlohmann::json rebalance_rule_to_json(const RebalanceRule& rule) {
    nlohmann::json j;
    j["type"] = rebalance_rule_name(rule);
    if (const auto* threshold = std::get_if<ThresholdRebalance>(&rule)) {
        j["threshold"] = threshold->max_drift;
    } else {
        j["threshold"] = nullptr;
    }
    return j;
}

Result<RebalanceRule> rebalance_rule_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("type") || !j.at("type").is_string()) {
        return make_error<RebalanceRule>(ErrorCode::INVALID_ARGUMENT,
                                         "Rebalance rule needs a string 'type' field",
                                         "RebalancePolicy");
    }

    const std::string type = j.at("type").get<std::string>();
    if (type == "monthly") {
        return RebalanceRule(PeriodicRebalance{RebalanceFrequency::MONTHLY});
    }
    if (type == "quarterly") {
        return RebalanceRule(PeriodicRebalance{RebalanceFrequency::QUARTERLY});
    }
    if (type == "yearly") {
        return RebalanceRule(PeriodicRebalance{RebalanceFrequency::YEARLY});
    }
    if (type == "threshold") {
        if (!j.contains("threshold") || !j.at("threshold").is_number()) {
            return make_error<RebalanceRule>(ErrorCode::INVALID_ARGUMENT,
                                             "Threshold rebalancing needs a numeric 'threshold'",
                                             "RebalancePolicy");
        }
        return RebalanceRule(ThresholdRebalance{j.at("threshold").get<double>()});
    }

    return make_error<RebalanceRule>(ErrorCode::INVALID_ARGUMENT,
                                     "Unknown rebalance type: " + type, "RebalancePolicy");
}

Timestamp next_rebalance_date(const Timestamp& date, RebalanceFrequency frequency) {
    core::CivilDate c = core::to_civil(date);
    switch (frequency) {
        case RebalanceFrequency::MONTHLY:
            return c.month == 12 ? core::make_date(c.year + 1, 1, 1)
                                 : core::make_date(c.year, c.month + 1, 1);
        case RebalanceFrequency::QUARTERLY: {
            int quarter = (c.month - 1) / 3 + 1;
            return quarter == 4 ? core::make_date(c.year + 1, 1, 1)
                                : core::make_date(c.year, quarter * 3 + 1, 1);
        }
        case RebalanceFrequency::YEARLY:
        default:
            return core::make_date(c.year + 1, 1, 1);
    }
}

// ========== SimulationState ==========

double SimulationState::total_value() const {
    double total = 0.0;
    for (double value : holdings) {
        total += value;
    }
    return total;
}

std::vector<double> SimulationState::current_weights() const {
    std::vector<double> weights(holdings.size(), 0.0);
    double total = total_value();
    if (total <= 0.0) {
        return weights;
    }
    for (size_t i = 0; i < holdings.size(); ++i) {
        weights[i] = holdings[i] / total;
    }
    return weights;
}

// ========== PeriodicRebalancePolicy ==========

PeriodicRebalancePolicy::PeriodicRebalancePolicy(RebalanceFrequency frequency)
    : frequency_(frequency) {}

int PeriodicRebalancePolicy::period_key(const Timestamp& date) const {
    core::CivilDate c = core::to_civil(date);
    switch (frequency_) {
        case RebalanceFrequency::MONTHLY:
            return c.year * 12 + (c.month - 1);
        case RebalanceFrequency::QUARTERLY:
            return c.year * 4 + (c.month - 1) / 3;
        case RebalanceFrequency::YEARLY:
        default:
            return c.year;
    }
}

bool PeriodicRebalancePolicy::should_rebalance(
    const SimulationState& state, const std::vector<double>& /* target_weights */) const {
    if (!state.last_rebalance_date) {
        return true;
    }
    return period_key(state.current_date) != period_key(*state.last_rebalance_date);
}

// ========== ThresholdRebalancePolicy ==========

ThresholdRebalancePolicy::ThresholdRebalancePolicy(double max_drift) : max_drift_(max_drift) {}

bool ThresholdRebalancePolicy::should_rebalance(
    const SimulationState& state, const std::vector<double>& target_weights) const {
    if (!state.last_rebalance_date) {
        return true;
    }

    std::vector<double> weights = state.current_weights();
    for (size_t i = 0; i < weights.size() && i < target_weights.size(); ++i) {
        if (std::abs(weights[i] - target_weights[i]) > max_drift_) {
            return true;
        }
    }
    return false;
}

Result<std::unique_ptr<RebalancePolicy>> create_rebalance_policy(const RebalanceRule& rule) {
    if (const auto* threshold = std::get_if<ThresholdRebalance>(&rule)) {
        if (!std::isfinite(threshold->max_drift) || threshold->max_drift <= 0.0) {
            std::ostringstream msg;
            msg << "Rebalance threshold must be a positive number, got " << threshold->max_drift;
            return make_error<std::unique_ptr<RebalancePolicy>>(ErrorCode::INVALID_ARGUMENT,
                                                                msg.str(), "RebalancePolicy");
        }
        return std::unique_ptr<RebalancePolicy>(
            std::make_unique<ThresholdRebalancePolicy>(threshold->max_drift));
    }

    const auto& periodic = std::get<PeriodicRebalance>(rule);
    return std::unique_ptr<RebalancePolicy>(
        std::make_unique<PeriodicRebalancePolicy>(periodic.frequency));
}

}  // namespace backtest
}  // namespace allocsim
