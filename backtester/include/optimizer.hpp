#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "backtester.hpp"
#include "config.hpp"
#include "datatypes.hpp"
#include "market_data_feed.hpp"
#include "metrics.hpp"

namespace backtester {

    // Parameter name -> value, names as in applyParameter
    using ParameterSet = std::map<std::string, double>;
    using ParameterGrid = std::map<std::string, std::vector<double>>;

    // Sets one tunable field: "trend.ema_short", "reversal.rsi_oversold",
    // "risk.stop_loss_percent", "execution.max_holding_days", ...
    // Throws core::ConfigException for an unknown name or a fractional value
    // given to an integer field.
    void applyParameter(core::TradingConfig& config, const std::string& name, double value);
    core::TradingConfig applyParameters(const core::TradingConfig& base, const ParameterSet& parameters);

    // Search space for "trend", "reversal" or "combined"; any other name gets
    // the risk-only grid (stop loss, take profit, holding time).
    ParameterGrid defaultParameterGrid(const std::string& strategy);

    // Cartesian product in name order, the last name varying fastest.
    // Throws core::ConfigException if a parameter has no values.
    std::vector<ParameterSet> expandGrid(const ParameterGrid& grid);

    // Score where higher is better; max_drawdown_pct is negated.
    // Throws core::ConfigException for an unknown metric name.
    double metricValue(const BacktestMetrics& metrics, const std::string& metric);

    // Mean over parameters of max(0, 1 - min(cv, 1)), cv being the coefficient
    // of variation of that parameter across windows. 1.0 below two windows.
    double stabilityScore(const std::vector<ParameterSet>& window_parameters);

    struct OptimizerOptions {
        std::string metric = "sharpe_ratio";
        int max_workers = 4;
    };

    struct OptimizationRun {
        ParameterSet parameters;
        std::optional<BacktestMetrics> metrics;  // Unset when the run failed
        double score = 0.0;
        std::string error;
    };

    struct OptimizationResult {
        std::string metric;
        std::vector<OptimizationRun> runs;       // Grid order
        std::optional<size_t> best_index;        // Highest score, earliest on ties
        double elapsed_seconds = 0.0;

        const OptimizationRun* best() const { return best_index ? &runs[*best_index] : nullptr; }
    };

    // Training range [train_start, train_end), validation range [train_end, validation_end)
    struct WalkForwardWindow {
        core::Timestamp train_start;
        core::Timestamp train_end;
        core::Timestamp validation_end;
        ParameterSet best_parameters;
        std::optional<BacktestMetrics> train_metrics;
        std::optional<BacktestMetrics> validation_metrics;
        double validation_score = 0.0;
        std::string error;
    };

    struct WalkForwardResult {
        std::string metric;
        std::vector<WalkForwardWindow> windows;
        std::optional<size_t> best_window;       // Highest validation score
        ParameterSet best_parameters;
        double stability_score = 1.0;
        double elapsed_seconds = 0.0;
    };

    // Grid search and walk-forward analysis over the backtester. Bars are read
    // from the feed once per call; backtests run on up to max_workers threads.
    class Optimizer {
    public:
        Optimizer(const core::TradingConfig& base_config, data::IMarketDataFeed& feed, OptimizerOptions options = {});

        // Every combination over all loaded bars. Uses base_config.symbols when
        // `symbols` is empty. Invalid combinations are recorded, not thrown.
        OptimizationResult gridSearch(const ParameterGrid& grid, const std::vector<std::string>& symbols = {});

        // Windows start at `start` and advance by step_days while a training window
        // of window_days still leaves validation bars before `end`. Throws
        // core::BacktestException when not even one window fits.
        WalkForwardResult walkForward(const ParameterGrid& grid,
                                      const core::Timestamp& start,
                                      const core::Timestamp& end,
                                      int window_days,
                                      int step_days,
                                      const std::vector<std::string>& symbols = {});

    private:
        using BarsBySymbol = std::map<std::string, core::TimeSeries<core::Bar>>;

        BarsBySymbol loadBars(const std::vector<std::string>& symbols);
        OptimizationResult searchGrid(const std::vector<ParameterSet>& combinations,
                                      const BarsBySymbol& bars,
                                      const std::vector<std::string>& symbols);

        core::TradingConfig base_config_;
        data::IMarketDataFeed& feed_;
        OptimizerOptions options_;
    };

} // namespace backtester
