#include "backtester.hpp"
#include "bar_validator.hpp"
#include "decision_engine.hpp"
#include "exceptions.hpp"
#include "ledger.hpp"
#include "logging.hpp"
#include "risk_manager.hpp"
#include "signal_pipeline.hpp"
#include "simulated_execution.hpp"
#include "utils.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <tuple>

namespace backtester {

    namespace {

        struct SymbolSeries {
            std::string symbol;
            core::TimeSeries<core::Bar> bars;
            std::vector<core::Signal> signals;
            std::exception_ptr error;
            std::string error_message;
            bool ready = false;
        };

        // One bar of one symbol on the merged timeline
        struct BarEvent {
            core::Timestamp timestamp;
            size_t symbol_index = 0;
            size_t bar_index = 0;

            bool operator<(const BarEvent& other) const {
                return std::tie(timestamp, symbol_index, bar_index) <
                       std::tie(other.timestamp, other.symbol_index, other.bar_index);
            }
        };

        std::vector<core::Signal> computeSignals(const strategy_engine::SignalPipeline& pipeline,
                                                 const std::string& symbol,
                                                 const core::TimeSeries<core::Bar>& bars,
                                                 int min_data_points) {
            data::validateBarSeries(symbol, bars);
            if (bars.size() < static_cast<size_t>(min_data_points)) {
                throw core::InsufficientHistoryException(fmt::format("{} has {} bars, at least {} are required.",
                                                                     symbol, bars.size(), min_data_points));
            }
            return pipeline.generateSignals(symbol, bars);
        }

    } // end anonymous namespace

    Backtester::Backtester(const core::TradingConfig& config, data::IMarketDataFeed& feed)
        : config_(config), feed_(feed)
    {
        core::logging::getLogger()->debug("Backtester created: initial capital {:.2f}, timeframe '{}'",
                                          config_.initial_capital, config_.timeframe);
    }

    BacktestResult Backtester::run(const std::vector<std::string>& symbols) {
        auto logger = core::logging::getLogger();
        const std::vector<std::string>& requested = symbols.empty() ? config_.symbols : symbols;
        if (requested.empty()) {
            throw core::BacktestException("No symbols to backtest.");
        }
        logger->info("Starting backtest over {} symbol(s): {}", requested.size(), fmt::join(requested, ", "));

        std::vector<SymbolSeries> series(requested.size());

        // --- Load (sequential: feeds need not be thread-safe) ---
        for (size_t i = 0; i < requested.size(); ++i) {
            series[i].symbol = requested[i];
            try {
                std::unique_ptr<data::IBarStream> stream = feed_.openStream(requested[i], config_.timeframe);
                series[i].bars = data::readAll(*stream);
                logger->debug("{}: loaded {} bars", requested[i], series[i].bars.size());
            } catch (const core::TradingPlatformException& e) {
                logger->error("{}: failed to load bars: {}", requested[i], e.what());
                series[i].error = std::current_exception();
                series[i].error_message = e.what();
            }
        }

        // --- Phase 1: per-symbol signals in parallel ---
        const strategy_engine::SignalPipeline pipeline(config_);
        std::vector<std::future<std::vector<core::Signal>>> pending(series.size());
        for (size_t i = 0; i < series.size(); ++i) {
            if (series[i].error) {
                continue;
            }
            pending[i] = std::async(std::launch::async, computeSignals, std::cref(pipeline),
                                    std::cref(series[i].symbol), std::cref(series[i].bars), config_.min_data_points);
        }

        BacktestResult result;
        for (size_t i = 0; i < series.size(); ++i) {
            if (!series[i].error) {
                try {
                    series[i].signals = pending[i].get();
                    series[i].ready = true;
                    result.symbols.push_back(series[i].symbol);
                } catch (const core::TradingPlatformException& e) {
                    logger->error("{}: excluded from backtest: {}", series[i].symbol, e.what());
                    series[i].error = std::current_exception();
                    series[i].error_message = e.what();
                }
            }
            if (series[i].error) {
                result.symbol_errors[series[i].symbol] = series[i].error_message;
            }
        }

        if (result.symbols.empty()) {
            logger->error("Every symbol failed; aborting backtest.");
            auto first = std::find_if(series.begin(), series.end(), [](const SymbolSeries& s) { return s.error != nullptr; });
            std::rethrow_exception(first->error);
        }

        // --- Phase 2: shared capital, merged timeline ---
        std::vector<BarEvent> events;
        for (size_t s = 0; s < series.size(); ++s) {
            if (!series[s].ready) {
                continue;
            }
            for (size_t b = 0; b < series[s].bars.size(); ++b) {
                events.push_back(BarEvent{series[s].bars[b].timestamp, s, b});
            }
        }
        std::sort(events.begin(), events.end());

        risk::RiskManager risk_manager(config_);
        execution::SimulatedExecutionHandler execution(config_.commission_rate);
        trading::Ledger ledger;
        trading::DecisionEngine engine(risk_manager, execution, ledger);
        std::map<std::string, double> last_closes;

        for (size_t e = 0; e < events.size(); ++e) {
            const BarEvent& event = events[e];
            const SymbolSeries& symbol_series = series[event.symbol_index];
            const core::Bar& bar = symbol_series.bars[event.bar_index];

            engine.processBar(bar, symbol_series.signals[event.bar_index]);
            last_closes[bar.symbol] = bar.close;

            // The symbol's data ends here: close whatever survived the normal exit checks
            if (event.bar_index + 1 == symbol_series.bars.size()) {
                engine.forceClose(bar, core::ExitReason::EndOfData);
            }

            const bool last_of_timestamp = e + 1 == events.size() || events[e + 1].timestamp != event.timestamp;
            if (last_of_timestamp) {
                engine.recordEquity(event.timestamp, last_closes);
            }
        }

        result.trades = ledger.getTrades();
        result.equity_curve = ledger.getEquityCurve();
        result.fills = ledger.getFillCount();
        result.rejections = ledger.getRejectionCount();
        result.metrics = computeMetrics(result.trades, result.equity_curve, config_.initial_capital, config_.risk_free_rate);

        logger->info("Backtest finished: {} bars, {} trades, {} symbol(s) skipped.",
                     events.size(), result.trades.size(), result.symbol_errors.size());
        result.metrics.logMetrics();
        return result;
    }

} // namespace backtester
