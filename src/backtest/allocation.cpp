// src/backtest/allocation.cpp

#include "allocsim/backtest/allocation.hpp"
#include <cmath>
#include <sstream>

namespace allocsim {
namespace backtest {

Allocation::Allocation(std::map<std::string, double> weights) : weights_(std::move(weights)) {}

Result<void> Allocation::validate(double tolerance) const {
    if (weights_.empty()) {
        return make_error<void>(ErrorCode::INVALID_ALLOCATION, "Allocation has no assets",
                                "Allocation");
    }

    for (const auto& [code, weight] : weights_) {
        if (code.empty()) {
            return make_error<void>(ErrorCode::INVALID_ALLOCATION,
                                    "Allocation contains an empty asset code", "Allocation");
        }
        if (!std::isfinite(weight) || weight <= 0.0 || weight > 1.0) {
            std::ostringstream msg;
            msg << "Weight of " << code << " must be in (0, 1], got " << weight;
            return make_error<void>(ErrorCode::INVALID_ALLOCATION, msg.str(), "Allocation");
        }
    }

    double total = total_weight();
    if (std::abs(total - 1.0) > tolerance) {
        std::ostringstream msg;
        msg << "Weights sum to " << total << ", expected 1.0 (tolerance " << tolerance << ")";
        return make_error<void>(ErrorCode::INVALID_ALLOCATION, msg.str(), "Allocation");
    }

    return Result<void>();
}

Allocation Allocation::normalized() const {
    double total = total_weight();
    if (total == 0.0) {
        return *this;
    }

    std::map<std::string, double> scaled;
    for (const auto& [code, weight] : weights_) {
        scaled[code] = weight / total;
    }
    return Allocation(std::move(scaled));
}

double Allocation::weight(const std::string& code) const {
    auto it = weights_.find(code);
    return it == weights_.end() ? 0.0 : it->second;
}

double Allocation::total_weight() const {
    double total = 0.0;
    for (const auto& [code, weight] : weights_) {
        total += weight;
    }
    return total;
}

std::vector<std::string> Allocation::codes() const {
    std::vector<std::string> result;
    result.reserve(weights_.size());
    for (const auto& [code, weight] : weights_) {
        result.push_back(code);
    }
    return result;
}

}  // namespace backtest
}  // namespace allocsim
