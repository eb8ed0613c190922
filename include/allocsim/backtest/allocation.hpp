// include/allocsim/backtest/allocation.hpp
#pragma once

#include <map>
#include <string>
#include <vector>
#include "allocsim/core/error.hpp"

namespace allocsim {
namespace backtest {

/**
 * @brief Default tolerance on |sum(weights) - 1|
 */
constexpr double DEFAULT_WEIGHT_TOLERANCE = 1e-4;

/**
 * @brief Largest weight-sum tolerance a backtest accepts
 */
constexpr double MAX_WEIGHT_TOLERANCE = 0.01;

/**
 * @brief Target weight per asset code
 *
 * Weights are fractions in (0, 1] that sum to 1 within a tolerance. An
 * Allocation is only checked when validate() is called; the engine rejects
 * invalid allocations before any simulation work.
 */
class Allocation {
public:
    Allocation() = default;
    explicit Allocation(std::map<std::string, double> weights);

    /**
     * @brief Check the weight invariants
     * @param tolerance Allowed distance of the weight sum from 1.0
     * @return INVALID_ALLOCATION describing the first violation
     */
    Result<void> validate(double tolerance = DEFAULT_WEIGHT_TOLERANCE) const;

    /**
     * @brief Copy rescaled so the weights sum to 1
     *
     * Returned unchanged when the weights sum to zero.
     */
    Allocation normalized() const;

    /**
     * @brief Target weight of an asset, 0 when the asset is not allocated
     */
    double weight(const std::string& code) const;

    double total_weight() const;

    std::vector<std::string> codes() const;

    const std::map<std::string, double>& weights() const {
        return weights_;
    }

    size_t size() const {
        return weights_.size();
    }

    bool empty() const {
        return weights_.empty();
    }

private:
    std::map<std::string, double> weights_;
};

}  // namespace backtest
}  // namespace allocsim
