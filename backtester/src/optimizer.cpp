#include "optimizer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <functional>
#include <future>
#include <memory>
#include <numeric>
#include <utility>

namespace backtester {

    namespace {

        using Setter = std::function<void(core::TradingConfig&, double)>;

        int toInteger(const std::string& name, double value) {
            if (std::floor(value) != value) {
                throw core::ConfigException(fmt::format("Parameter {} needs a whole number (got {}).", name, value));
            }
            return static_cast<int>(value);
        }

        const std::map<std::string, Setter>& parameterSetters() {
            static const std::map<std::string, Setter> setters = {
                {"trend.ema_short", [](core::TradingConfig& c, double v) { c.trend.ema_short = toInteger("trend.ema_short", v); }},
                {"trend.ema_long", [](core::TradingConfig& c, double v) { c.trend.ema_long = toInteger("trend.ema_long", v); }},
                {"trend.macd_fast", [](core::TradingConfig& c, double v) { c.trend.macd_fast = toInteger("trend.macd_fast", v); }},
                {"trend.macd_slow", [](core::TradingConfig& c, double v) { c.trend.macd_slow = toInteger("trend.macd_slow", v); }},
                {"trend.macd_signal", [](core::TradingConfig& c, double v) { c.trend.macd_signal = toInteger("trend.macd_signal", v); }},
                {"trend.volume_ma_period", [](core::TradingConfig& c, double v) { c.trend.volume_ma_period = toInteger("trend.volume_ma_period", v); }},
                {"trend.min_volume_factor", [](core::TradingConfig& c, double v) { c.trend.min_volume_factor = v; }},
                {"reversal.rsi_period", [](core::TradingConfig& c, double v) { c.reversal.rsi_period = toInteger("reversal.rsi_period", v); }},
                {"reversal.rsi_oversold", [](core::TradingConfig& c, double v) { c.reversal.rsi_oversold = v; }},
                {"reversal.rsi_overbought", [](core::TradingConfig& c, double v) { c.reversal.rsi_overbought = v; }},
                {"reversal.bollinger_period", [](core::TradingConfig& c, double v) { c.reversal.bollinger_period = toInteger("reversal.bollinger_period", v); }},
                {"reversal.bollinger_std", [](core::TradingConfig& c, double v) { c.reversal.bollinger_std = v; }},
                {"risk.stop_loss_percent", [](core::TradingConfig& c, double v) { c.stop_loss_percent = v; }},
                {"risk.trailing_stop_percent", [](core::TradingConfig& c, double v) { c.trailing_stop_percent = v; }},
                {"risk.take_profit_percent", [](core::TradingConfig& c, double v) { c.take_profit_percent = v; }},
                {"execution.max_holding_days", [](core::TradingConfig& c, double v) { c.max_holding_days = toInteger("execution.max_holding_days", v); }},
                {"execution.max_position_size", [](core::TradingConfig& c, double v) { c.max_position_size = v; }},
                {"execution.max_positions", [](core::TradingConfig& c, double v) { c.max_positions = toInteger("execution.max_positions", v); }}
            };
            return setters;
        }

        // Same symbols, only bars in [from, to)
        std::map<std::string, core::TimeSeries<core::Bar>> sliceBars(const std::map<std::string, core::TimeSeries<core::Bar>>& bars,
                                                                     const core::Timestamp& from,
                                                                     const core::Timestamp& to) {
            std::map<std::string, core::TimeSeries<core::Bar>> sliced;
            for (const auto& [symbol, series] : bars) {
                core::TimeSeries<core::Bar>& slice = sliced[symbol];
                for (const auto& bar : series) {
                    if (bar.timestamp >= from && bar.timestamp < to) {
                        slice.push_back(bar);
                    }
                }
            }
            return sliced;
        }

        std::unique_ptr<data::InMemoryMarketDataFeed> makeFeed(const std::map<std::string, core::TimeSeries<core::Bar>>& bars,
                                                               const std::string& timeframe) {
            auto feed = std::make_unique<data::InMemoryMarketDataFeed>();
            for (const auto& [symbol, series] : bars) {
                feed->addBars(symbol, timeframe, series);
            }
            return feed;
        }

        std::string lowerCase(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
            return text;
        }

        OptimizationRun runOne(const core::TradingConfig& base_config,
                               const ParameterSet& parameters,
                               data::IMarketDataFeed& feed,
                               const std::vector<std::string>& symbols,
                               const std::string& metric) {
            OptimizationRun run;
            run.parameters = parameters;
            try {
                core::TradingConfig config = applyParameters(base_config, parameters);
                core::validateConfig(config);
                BacktestResult result = Backtester(config, feed).run(symbols);
                run.score = metricValue(result.metrics, metric);
                run.metrics = std::move(result.metrics);
            } catch (const core::TradingPlatformException& e) {
                run.error = e.what();
            }
            return run;
        }

        double secondsSince(std::chrono::steady_clock::time_point started) {
            return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        }

    } // end anonymous namespace

    void applyParameter(core::TradingConfig& config, const std::string& name, double value) {
        const auto& setters = parameterSetters();
        auto it = setters.find(name);
        if (it == setters.end()) {
            throw core::ConfigException(fmt::format("Unknown optimization parameter '{}'.", name));
        }
        it->second(config, value);
    }

    core::TradingConfig applyParameters(const core::TradingConfig& base, const ParameterSet& parameters) {
        core::TradingConfig config = base;
        for (const auto& [name, value] : parameters) {
            applyParameter(config, name, value);
        }
        return config;
    }

    ParameterGrid defaultParameterGrid(const std::string& strategy) {
        const std::string name = lowerCase(strategy);
        if (name == "trend") {
            return {
                {"trend.ema_short", {3, 5, 8, 10, 12}},
                {"trend.ema_long", {15, 20, 25, 30}},
                {"trend.min_volume_factor", {1.0, 1.5, 2.0, 2.5}},
                {"risk.stop_loss_percent", {1.5, 2.0, 2.5, 3.0}},
                {"risk.take_profit_percent", {3.0, 4.0, 5.0, 6.0, 7.0}}
            };
        }
        if (name == "reversal") {
            return {
                {"reversal.rsi_period", {7, 10, 14, 21}},
                {"reversal.rsi_oversold", {20, 25, 30, 35}},
                {"reversal.rsi_overbought", {65, 70, 75, 80}},
                {"reversal.bollinger_period", {15, 20, 25}},
                {"reversal.bollinger_std", {1.5, 2.0, 2.5}},
                {"risk.stop_loss_percent", {1.5, 2.0, 2.5, 3.0}},
                {"risk.take_profit_percent", {3.0, 4.0, 5.0, 6.0}}
            };
        }
        if (name == "combined") {
            return {
                {"trend.ema_short", {5, 8, 10}},
                {"trend.ema_long", {15, 20, 25}},
                {"reversal.rsi_period", {10, 14, 21}},
                {"reversal.rsi_oversold", {25, 30, 35}},
                {"reversal.rsi_overbought", {65, 70, 75}},
                {"risk.stop_loss_percent", {2.0, 2.5, 3.0}},
                {"risk.take_profit_percent", {4.0, 5.0, 6.0}}
            };
        }
        return {
            {"risk.stop_loss_percent", {2.0, 2.5, 3.0}},
            {"risk.take_profit_percent", {4.0, 5.0, 6.0}},
            {"execution.max_holding_days", {5, 7, 10}}
        };
    }

    std::vector<ParameterSet> expandGrid(const ParameterGrid& grid) {
        std::vector<ParameterSet> combinations(1);
        for (const auto& [name, values] : grid) {
            if (values.empty()) {
                throw core::ConfigException(fmt::format("Parameter '{}' has no values to try.", name));
            }
            std::vector<ParameterSet> next;
            next.reserve(combinations.size() * values.size());
            for (const auto& partial : combinations) {
                for (double value : values) {
                    ParameterSet extended = partial;
                    extended[name] = value;
                    next.push_back(std::move(extended));
                }
            }
            combinations = std::move(next);
        }
        return combinations;
    }

    double metricValue(const BacktestMetrics& metrics, const std::string& metric) {
        if (metric == "sharpe_ratio") return metrics.sharpe_ratio;
        if (metric == "sortino_ratio") return metrics.sortino_ratio;
        if (metric == "calmar_ratio") return metrics.calmar_ratio;
        if (metric == "total_return_pct") return metrics.total_return_pct;
        if (metric == "annual_return_pct") return metrics.annual_return_pct;
        if (metric == "total_pnl") return metrics.total_pnl;
        if (metric == "final_capital") return metrics.final_capital;
        if (metric == "win_rate_pct") return metrics.win_rate_pct;
        if (metric == "profit_factor") return metrics.profit_factor;
        if (metric == "max_drawdown_pct") return -metrics.max_drawdown_pct;
        throw core::ConfigException(fmt::format("Unknown optimization metric '{}'.", metric));
    }

    double stabilityScore(const std::vector<ParameterSet>& window_parameters) {
        if (window_parameters.size() < 2) {
            return 1.0;
        }

        std::map<std::string, std::vector<double>> values_by_name;
        for (const auto& parameters : window_parameters) {
            for (const auto& [name, value] : parameters) {
                values_by_name[name].push_back(value);
            }
        }
        if (values_by_name.empty()) {
            return 1.0;
        }

        double total = 0.0;
        for (const auto& [name, values] : values_by_name) {
            if (values.size() < 2) {
                total += 1.0;
                continue;
            }
            const double n = static_cast<double>(values.size());
            const double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
            double variance = 0.0;
            for (double v : values) {
                variance += (v - mean) * (v - mean);
            }
            const double stddev = std::sqrt(variance / n);
            const double cv = mean == 0.0 ? 0.0 : stddev / std::fabs(mean);
            total += std::max(0.0, 1.0 - std::min(cv, 1.0));
        }
        return total / static_cast<double>(values_by_name.size());
    }

    Optimizer::Optimizer(const core::TradingConfig& base_config, data::IMarketDataFeed& feed, OptimizerOptions options)
        : base_config_(base_config), feed_(feed), options_(std::move(options))
    {
        if (options_.max_workers < 1) {
            throw core::ConfigException(fmt::format("Optimizer needs at least one worker (got {}).", options_.max_workers));
        }
        // Fails early on a misspelt metric
        metricValue(BacktestMetrics{}, options_.metric);
        core::logging::getLogger()->debug("Optimizer created: metric {}, {} worker(s)", options_.metric, options_.max_workers);
    }

    Optimizer::BarsBySymbol Optimizer::loadBars(const std::vector<std::string>& symbols) {
        auto logger = core::logging::getLogger();
        BarsBySymbol bars;
        for (const auto& symbol : symbols) {
            try {
                std::unique_ptr<data::IBarStream> stream = feed_.openStream(symbol, base_config_.timeframe);
                bars[symbol] = data::readAll(*stream);
                logger->debug("Optimizer: {} bars for {}", bars[symbol].size(), symbol);
            } catch (const core::TradingPlatformException& e) {
                // Left out of the feed, so every backtest reports it as skipped
                logger->error("Optimizer: cannot load {}: {}", symbol, e.what());
            }
        }
        return bars;
    }

    OptimizationResult Optimizer::searchGrid(const std::vector<ParameterSet>& combinations,
                                             const BarsBySymbol& bars,
                                             const std::vector<std::string>& symbols) {
        auto logger = core::logging::getLogger();
        const auto started = std::chrono::steady_clock::now();
        auto feed = makeFeed(bars, base_config_.timeframe);

        OptimizationResult result;
        result.metric = options_.metric;
        result.runs.reserve(combinations.size());

        const size_t batch_size = static_cast<size_t>(options_.max_workers);
        for (size_t first = 0; first < combinations.size(); first += batch_size) {
            const size_t last = std::min(first + batch_size, combinations.size());
            std::vector<std::future<OptimizationRun>> batch;
            for (size_t i = first; i < last; ++i) {
                batch.push_back(std::async(std::launch::async, runOne, std::cref(base_config_), std::cref(combinations[i]),
                                           std::ref(*feed), std::cref(symbols), std::cref(options_.metric)));
            }
            for (auto& pending : batch) {
                result.runs.push_back(pending.get());
            }
            logger->info("Optimization progress: {}/{} ({:.1f}%), {:.1f} s elapsed", last, combinations.size(),
                         100.0 * static_cast<double>(last) / static_cast<double>(combinations.size()), secondsSince(started));
        }

        for (size_t i = 0; i < result.runs.size(); ++i) {
            const OptimizationRun& run = result.runs[i];
            if (!run.metrics || std::isnan(run.score)) {
                continue;
            }
            if (!result.best_index || run.score > result.runs[*result.best_index].score) {
                result.best_index = i;
            }
        }
        result.elapsed_seconds = secondsSince(started);
        return result;
    }

    OptimizationResult Optimizer::gridSearch(const ParameterGrid& grid, const std::vector<std::string>& symbols) {
        auto logger = core::logging::getLogger();
        const std::vector<std::string>& requested = symbols.empty() ? base_config_.symbols : symbols;
        const std::vector<ParameterSet> combinations = expandGrid(grid);
        logger->info("Grid search: {} combination(s) over {} symbol(s), metric {}, {} worker(s)",
                     combinations.size(), requested.size(), options_.metric, options_.max_workers);

        OptimizationResult result = searchGrid(combinations, loadBars(requested), requested);

        const size_t failed = static_cast<size_t>(std::count_if(result.runs.begin(), result.runs.end(),
                                                                [](const OptimizationRun& run) { return !run.metrics; }));
        if (const OptimizationRun* best = result.best()) {
            logger->info("Grid search finished in {:.1f} s: best {} = {:.4f}, {} combination(s) failed",
                         result.elapsed_seconds, options_.metric, best->score, failed);
        } else {
            logger->warn("Grid search finished in {:.1f} s: no combination produced a result", result.elapsed_seconds);
        }
        return result;
    }

    WalkForwardResult Optimizer::walkForward(const ParameterGrid& grid,
                                             const core::Timestamp& start,
                                             const core::Timestamp& end,
                                             int window_days,
                                             int step_days,
                                             const std::vector<std::string>& symbols) {
        auto logger = core::logging::getLogger();
        if (window_days < 1 || step_days < 1) {
            throw core::BacktestException(fmt::format("Walk-forward window ({}) and step ({}) must be at least one day.",
                                                      window_days, step_days));
        }
        if (core::utils::addDays(start, window_days) >= end) {
            throw core::BacktestException(fmt::format("Range {} .. {} is too short for a {}-day training window.",
                                                      core::utils::timestampToString(start),
                                                      core::utils::timestampToString(end), window_days));
        }

        const auto started = std::chrono::steady_clock::now();
        const std::vector<std::string>& requested = symbols.empty() ? base_config_.symbols : symbols;
        const std::vector<ParameterSet> combinations = expandGrid(grid);
        const BarsBySymbol bars = loadBars(requested);

        WalkForwardResult result;
        result.metric = options_.metric;

        for (core::Timestamp window_start = start; core::utils::addDays(window_start, window_days) < end;
             window_start = core::utils::addDays(window_start, step_days)) {
            WalkForwardWindow window;
            window.train_start = window_start;
            window.train_end = core::utils::addDays(window_start, window_days);
            window.validation_end = std::min(core::utils::addDays(window.train_end, step_days), end);
            logger->info("Walk-forward window {} .. {}, validation until {}",
                         core::utils::timestampToString(window.train_start),
                         core::utils::timestampToString(window.train_end),
                         core::utils::timestampToString(window.validation_end));

            OptimizationResult training = searchGrid(combinations, sliceBars(bars, window.train_start, window.train_end), requested);
            const OptimizationRun* best = training.best();
            if (!best) {
                window.error = "no parameter combination succeeded on the training window";
                logger->warn("Walk-forward window {}: {}", result.windows.size(), window.error);
                result.windows.push_back(std::move(window));
                continue;
            }
            window.best_parameters = best->parameters;
            window.train_metrics = best->metrics;

            // Validation bars alone rarely reach min_data_points; indicators warm up inside the window
            core::TradingConfig validation_config = applyParameters(base_config_, window.best_parameters);
            validation_config.min_data_points = 1;
            auto validation_feed = makeFeed(sliceBars(bars, window.train_end, window.validation_end), base_config_.timeframe);
            try {
                BacktestResult validation = Backtester(validation_config, *validation_feed).run(requested);
                window.validation_score = metricValue(validation.metrics, options_.metric);
                window.validation_metrics = std::move(validation.metrics);
            } catch (const core::TradingPlatformException& e) {
                window.error = fmt::format("validation failed: {}", e.what());
                logger->warn("Walk-forward window {}: {}", result.windows.size(), window.error);
            }
            result.windows.push_back(std::move(window));
        }

        std::vector<ParameterSet> chosen;
        for (size_t i = 0; i < result.windows.size(); ++i) {
            const WalkForwardWindow& window = result.windows[i];
            if (window.train_metrics) {
                chosen.push_back(window.best_parameters);
            }
            if (!window.validation_metrics || std::isnan(window.validation_score)) {
                continue;
            }
            if (!result.best_window || window.validation_score > result.windows[*result.best_window].validation_score) {
                result.best_window = i;
            }
        }
        if (result.best_window) {
            result.best_parameters = result.windows[*result.best_window].best_parameters;
        }
        result.stability_score = stabilityScore(chosen);
        result.elapsed_seconds = secondsSince(started);

        logger->info("Walk-forward finished in {:.1f} s: {} window(s), stability {:.3f}{}",
                     result.elapsed_seconds, result.windows.size(), result.stability_score,
                     result.best_window ? fmt::format(", best window {}", *result.best_window) : std::string(", no validated window"));
        return result;
    }

} // namespace backtester
