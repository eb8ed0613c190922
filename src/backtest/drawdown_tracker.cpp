// src/backtest/drawdown_tracker.cpp

#include "allocsim/backtest/drawdown_tracker.hpp"
#include <algorithm>

namespace allocsim {
namespace backtest {

DrawdownCurve DrawdownTracker::compute(const EquityCurve& equity_curve) const {
    DrawdownCurve drawdowns;
    drawdowns.reserve(equity_curve.size());

    if (equity_curve.empty()) {
        return drawdowns;
    }

    double peak = equity_curve.front().second;
    for (const auto& [date, value] : equity_curve) {
        peak = std::max(peak, value);
        double drawdown = (value < peak && peak > 0.0) ? value / peak - 1.0 : 0.0;
        drawdowns.emplace_back(date, drawdown);
    }

    return drawdowns;
}

double DrawdownTracker::max_drawdown(const DrawdownCurve& drawdown_curve) const {
    double worst = 0.0;
    for (const auto& point : drawdown_curve) {
        worst = std::min(worst, point.second);
    }
    return worst;
}

}  // namespace backtest
}  // namespace allocsim
