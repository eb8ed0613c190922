// src/backtest/benchmark_projector.cpp

#include "allocsim/backtest/benchmark_projector.hpp"
#include <cmath>
#include <optional>
#include <sstream>
#include "allocsim/core/time_utils.hpp"

namespace allocsim {
namespace backtest {

Result<EquityCurve> BenchmarkProjector::project(const AssetSeries& benchmark,
                                                const std::vector<Timestamp>& calendar,
                                                double initial_capital) const {
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        std::ostringstream msg;
        msg << "Initial capital must be positive, got " << initial_capital;
        return make_error<EquityCurve>(ErrorCode::INVALID_ARGUMENT, msg.str(),
                                       "BenchmarkProjector");
    }

    auto valid = benchmark.validate();
    if (valid.is_error()) {
        return forward_error<EquityCurve>(valid, "BenchmarkProjector");
    }

    EquityCurve curve;
    curve.reserve(calendar.size());

    std::optional<Price> base;
    double last_value = initial_capital;

    // Both sequences are ascending; walk them together
    auto it = benchmark.points.begin();
    for (const auto& date : calendar) {
        while (it != benchmark.points.end() && it->date < date) {
            ++it;
        }

        bool has_price = it != benchmark.points.end() && it->date == date;
        if (has_price) {
            if (!std::isfinite(it->close) || it->close <= 0.0) {
                std::ostringstream msg;
                msg << "Invalid close " << it->close << " for benchmark " << benchmark.code
                    << " on " << core::format_date(date);
                return make_error<EquityCurve>(ErrorCode::INVALID_PRICE, msg.str(),
                                               "BenchmarkProjector");
            }
            if (!base) {
                base = it->close;
            }
            last_value = initial_capital * it->close / *base;
        }

        if (!base) {
            continue;
        }
        curve.emplace_back(date, last_value);
    }

    if (curve.empty()) {
        std::ostringstream msg;
        msg << "Benchmark " << benchmark.code << " has no price on any of the "
            << calendar.size() << " calendar dates";
        if (!calendar.empty()) {
            msg << " between " << core::format_date(calendar.front()) << " and "
                << core::format_date(calendar.back());
        }
        return make_error<EquityCurve>(ErrorCode::INSUFFICIENT_DATA, msg.str(),
                                       "BenchmarkProjector");
    }

    return curve;
}

}  // namespace backtest
}  // namespace allocsim
