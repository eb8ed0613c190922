// include/allocsim/backtest/drawdown_tracker.hpp
#pragma once

#include "allocsim/core/types.hpp"

namespace allocsim {
namespace backtest {

/**
 * @brief Running drawdown of an equity curve
 *
 * drawdown(t) = value(t) / max(value(0..t)) - 1, always <= 0. The output
 * shares the input's date axis.
 */
class DrawdownTracker {
public:
    DrawdownTracker() = default;

    DrawdownCurve compute(const EquityCurve& equity_curve) const;

    /**
     * @brief Most negative drawdown of a curve, 0 for an empty curve
     */
    double max_drawdown(const DrawdownCurve& drawdown_curve) const;
};

}  // namespace backtest
}  // namespace allocsim
