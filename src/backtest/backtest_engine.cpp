// src/backtest/backtest_engine.cpp

#include "allocsim/backtest/backtest_engine.hpp"
#include <cmath>
#include <sstream>
#include "allocsim/core/logger.hpp"
#include "allocsim/core/time_utils.hpp"

namespace allocsim {
namespace backtest {

namespace {

Timestamp date_from_json(const nlohmann::json& j, const std::string& key) {
    auto parsed = core::parse_date(j.at(key).get<std::string>());
    if (parsed.is_error()) {
        throw EngineError(ErrorCode::INVALID_ARGUMENT,
                          "Invalid " + key + ": " + parsed.error()->what(), "BacktestConfig");
    }
    return parsed.value();
}

nlohmann::json gap_to_json(const CoverageGap& gap) {
    nlohmann::json j;
    j["code"] = gap.code;
    j["requested_start"] = core::format_date(gap.requested_start);
    j["requested_end"] = core::format_date(gap.requested_end);
    if (gap.first_available > gap.last_available) {
        j["first_available"] = nullptr;
        j["last_available"] = nullptr;
    } else {
        j["first_available"] = core::format_date(gap.first_available);
        j["last_available"] = core::format_date(gap.last_available);
    }
    return j;
}

nlohmann::json event_to_json(const RebalanceEvent& event) {
    nlohmann::json j;
    j["date"] = core::format_date(event.date);
    j["portfolio_value"] = event.portfolio_value;
    j["weights_before"] = event.weights_before;
    return j;
}

}  // namespace

// ========== BacktestConfig ==========

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j;
    j["strategy_name"] = strategy_name;
    j["allocation"] = allocation;
    j["rebalance"] = rebalance_rule_to_json(rebalance_rule);
    j["start_date"] = core::format_date(start_date);
    j["end_date"] = core::format_date(end_date);
    j["initial_capital"] = initial_capital;
    j["risk_free_rate"] = risk_free_rate;
    j["trading_days_per_year"] = trading_days_per_year;
    j["benchmarks"] = benchmarks;
    j["weight_tolerance"] = weight_tolerance;
    j["version"] = version;
    return j;
}

void BacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("strategy_name"))
        strategy_name = j.at("strategy_name").get<std::string>();
    if (j.contains("allocation"))
        allocation = j.at("allocation").get<std::map<std::string, double>>();
    if (j.contains("rebalance")) {
        auto rule = rebalance_rule_from_json(j.at("rebalance"));
        if (rule.is_error()) {
            throw EngineError(rule.error()->code(), rule.error()->what(), "BacktestConfig");
        }
        rebalance_rule = rule.value();
    }
    if (j.contains("start_date"))
        start_date = date_from_json(j, "start_date");
    if (j.contains("end_date"))
        end_date = date_from_json(j, "end_date");
    if (j.contains("initial_capital"))
        initial_capital = j.at("initial_capital").get<double>();
    if (j.contains("risk_free_rate"))
        risk_free_rate = j.at("risk_free_rate").get<double>();
    if (j.contains("trading_days_per_year"))
        trading_days_per_year = j.at("trading_days_per_year").get<int>();
    if (j.contains("benchmarks"))
        benchmarks = j.at("benchmarks").get<std::map<std::string, std::string>>();
    if (j.contains("weight_tolerance"))
        weight_tolerance = j.at("weight_tolerance").get<double>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

// ========== BacktestResult ==========

nlohmann::json curve_to_json(const TimeSeries& curve) {
    nlohmann::json points = nlohmann::json::array();
    for (const auto& [date, value] : curve) {
        points.push_back({{"date", core::format_date(date)}, {"value", value}});
    }
    return points;
}

nlohmann::json BacktestResult::to_json() const {
    nlohmann::json j;
    j["strategy_name"] = strategy_name;
    j["start_date"] = core::format_date(start_date);
    j["end_date"] = core::format_date(end_date);
    j["initial_capital"] = initial_capital;
    j["rebalance"] = rebalance_rule_to_json(rebalance_rule);
    j["allocation"] = allocation;
    j["equity_curve"] = curve_to_json(equity_curve);
    j["drawdown_curve"] = curve_to_json(drawdown_curve);

    nlohmann::json benchmarks = nlohmann::json::object();
    for (const auto& [name, curve] : benchmark_curves) {
        benchmarks[name] = curve_to_json(curve);
    }
    j["benchmark_curves"] = benchmarks;

    j["metrics"] = metrics.to_json();

    nlohmann::json events = nlohmann::json::array();
    for (const auto& event : rebalance_events) {
        events.push_back(event_to_json(event));
    }
    j["rebalance_events"] = events;

    nlohmann::json gaps = nlohmann::json::array();
    for (const auto& gap : coverage_gaps) {
        gaps.push_back(gap_to_json(gap));
    }
    j["coverage_gaps"] = gaps;
    return j;
}

// ========== BacktestEngine ==========

BacktestEngine::BacktestEngine(std::shared_ptr<MarketDataSource> data_source)
    : data_source_(std::move(data_source)) {}

Result<BacktestResult> BacktestEngine::run_backtest(const Allocation& allocation,
                                                    const RebalanceRule& rule,
                                                    const Timestamp& start_date,
                                                    const Timestamp& end_date,
                                                    double initial_capital,
                                                    double risk_free_rate,
                                                    int trading_days_per_year) const {
    BacktestConfig config;
    config.allocation = allocation.weights();
    config.rebalance_rule = rule;
    config.start_date = start_date;
    config.end_date = end_date;
    config.initial_capital = initial_capital;
    config.risk_free_rate = risk_free_rate;
    config.trading_days_per_year = trading_days_per_year;
    return run_backtest(config);
}

Result<BacktestResult> BacktestEngine::run_backtest(const BacktestConfig& config) const {
    Logger::register_component("BacktestEngine");

    auto valid = validate_config(config);
    if (valid.is_error()) {
        ERROR("Rejected backtest '" << config.strategy_name << "': " << valid.error()->what());
        return forward_error<BacktestResult>(valid, "BacktestEngine");
    }

    auto policy_result = create_rebalance_policy(config.rebalance_rule);
    if (policy_result.is_error()) {
        ERROR("Rejected backtest '" << config.strategy_name
                                    << "': " << policy_result.error()->what());
        return forward_error<BacktestResult>(policy_result, "BacktestEngine");
    }
    std::unique_ptr<RebalancePolicy> policy = policy_result.release();

    Allocation allocation(config.allocation);

    INFO("Starting backtest '" << config.strategy_name << "' with " << allocation.size()
                               << " assets from " << core::format_date(config.start_date)
                               << " to " << core::format_date(config.end_date) << ", "
                               << policy->name() << " rebalancing");

    auto series_result =
        data_source_->get_aligned_series(allocation.codes(), config.start_date, config.end_date);
    if (series_result.is_error()) {
        ERROR("Failed to load price series: " << series_result.error()->what());
        return forward_error<BacktestResult>(series_result, "BacktestEngine");
    }
    const auto& series = series_result.value();

    BacktestResult result;
    result.coverage_gaps =
        aligner_.find_coverage_gaps(series, config.start_date, config.end_date);
    for (const auto& gap : result.coverage_gaps) {
        WARN("Series " << gap.code << " does not cover "
                       << core::format_date(gap.requested_start) << " to "
                       << core::format_date(gap.requested_end));
    }

    auto calendar_result = aligner_.align(series, config.start_date, config.end_date);
    if (calendar_result.is_error()) {
        ERROR("Failed to align price series: " << calendar_result.error()->what());
        return forward_error<BacktestResult>(calendar_result, "BacktestEngine");
    }
    const AlignedCalendar& calendar = calendar_result.value();
    DEBUG("Aligned calendar has " << calendar.size() << " dates");

    auto simulation_result =
        simulator_.simulate(calendar, config.initial_capital, allocation, *policy);
    if (simulation_result.is_error()) {
        ERROR("Simulation failed: " << simulation_result.error()->what());
        return forward_error<BacktestResult>(simulation_result, "BacktestEngine");
    }
    SimulationResult simulation = simulation_result.release();

    DrawdownCurve drawdown_curve = drawdown_tracker_.compute(simulation.equity_curve);
    auto metrics_result =
        metrics_calculator_.compute(simulation.equity_curve, drawdown_curve,
                                    simulation.rebalance_count, config.risk_free_rate,
                                    config.trading_days_per_year);
    if (metrics_result.is_error()) {
        ERROR("Failed to calculate metrics: " << metrics_result.error()->what());
        return forward_error<BacktestResult>(metrics_result, "BacktestEngine");
    }

    result.strategy_name = config.strategy_name;
    result.start_date = config.start_date;
    result.end_date = config.end_date;
    result.initial_capital = config.initial_capital;
    result.rebalance_rule = config.rebalance_rule;
    result.allocation = config.allocation;
    result.drawdown_curve = std::move(drawdown_curve);
    result.equity_curve = std::move(simulation.equity_curve);
    result.rebalance_events = std::move(simulation.rebalance_events);
    result.metrics = metrics_result.release();
    result.benchmark_curves = project_benchmarks(config, calendar.dates);

    INFO("Backtest '" << config.strategy_name << "' complete: " << result.equity_curve.size()
                      << " dates, " << result.metrics.rebalance_count << " rebalances, total return "
                      << result.metrics.total_return);

    return result;
}

Result<void> BacktestEngine::validate_config(const BacktestConfig& config) const {
    if (!std::isfinite(config.weight_tolerance) || config.weight_tolerance < 0.0 ||
        config.weight_tolerance > MAX_WEIGHT_TOLERANCE) {
        std::ostringstream msg;
        msg << "Weight tolerance must be in [0, " << MAX_WEIGHT_TOLERANCE << "], got "
            << config.weight_tolerance;
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, msg.str(), "BacktestEngine");
    }

    auto allocation_ok = Allocation(config.allocation).validate(config.weight_tolerance);
    if (allocation_ok.is_error()) {
        return allocation_ok;
    }

    std::ostringstream msg;
    if (!data_source_) {
        msg << "No market data source configured";
    } else if (!std::isfinite(config.initial_capital) || config.initial_capital <= 0.0) {
        msg << "Initial capital must be positive, got " << config.initial_capital;
    } else if (!std::isfinite(config.risk_free_rate)) {
        msg << "Risk-free rate must be finite";
    } else if (config.trading_days_per_year <= 0) {
        msg << "Trading days per year must be positive, got " << config.trading_days_per_year;
    } else if (config.end_date < config.start_date) {
        msg << "End date " << core::format_date(config.end_date) << " is before start date "
            << core::format_date(config.start_date);
    } else {
        return Result<void>();
    }
    return make_error<void>(ErrorCode::INVALID_ARGUMENT, msg.str(), "BacktestEngine");
}

std::map<std::string, EquityCurve> BacktestEngine::project_benchmarks(
    const BacktestConfig& config, const std::vector<Timestamp>& calendar) const {
    std::map<std::string, EquityCurve> curves;
    if (calendar.empty()) {
        return curves;
    }

    for (const auto& [name, index_code] : config.benchmarks) {
        auto series = data_source_->get_benchmark_series(index_code, calendar.front(),
                                                         calendar.back());
        if (series.is_error()) {
            WARN("Skipping benchmark " << name << " (" << index_code
                                       << "): " << series.error()->what());
            continue;
        }

        auto curve = benchmark_projector_.project(series.value(), calendar, config.initial_capital);
        if (curve.is_error()) {
            WARN("Skipping benchmark " << name << " (" << index_code
                                       << "): " << curve.error()->what());
            continue;
        }
        curves.emplace(name, curve.release());
    }
    return curves;
}

}  // namespace backtest
}  // namespace allocsim
