#include "live_trader.hpp"
#include "simulated_execution.hpp"
#include "live_execution.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <iterator>

namespace trading {

    namespace {

        std::unique_ptr<execution::IExecutionHandler> makeExecution(const core::TradingConfig& config,
                                                                    const std::shared_ptr<execution::IBrokerAdapter>& broker) {
            if (config.demo_mode) {
                return std::make_unique<execution::SimulatedExecutionHandler>(config.commission_rate);
            }
            if (!broker) {
                throw core::ConfigException("Live trading without demo_mode requires a broker adapter.");
            }
            return std::make_unique<execution::LiveExecutionHandler>(broker, std::chrono::milliseconds(config.order_timeout_ms));
        }

    } // end anonymous namespace

    LiveTrader::LiveTrader(const core::TradingConfig& config,
                           std::shared_ptr<data::IMarketDataFeed> feed,
                           std::shared_ptr<execution::IBrokerAdapter> broker,
                           std::shared_ptr<INotificationSink> notifications)
        : config_(config),
          feed_(std::move(feed)),
          broker_(std::move(broker)),
          notifications_(std::move(notifications)),
          pipeline_(config_),
          risk_manager_(config_),
          execution_(makeExecution(config_, broker_)),
          engine_(risk_manager_, *execution_, ledger_, notifications_.get())
    {
        if (!feed_) {
            throw core::ConfigException("LiveTrader requires a market data feed.");
        }
        core::logging::getLogger()->info("LiveTrader ready: {} symbol(s), {} execution, polling every {} s",
                                         config_.symbols.size(), execution_->getName(), config_.update_interval_seconds);
    }

    void LiveTrader::reconcile() {
        auto logger = core::logging::getLogger();
        if (!broker_) {
            logger->info("No broker adapter configured, skipping position reconciliation.");
            return;
        }

        // Lot sizes before positions
        for (const auto& symbol : config_.symbols) {
            try {
                execution::InstrumentInfo instrument = broker_->getInstrument(symbol);
                risk_manager_.setLotSize(symbol, instrument.lot);
            } catch (const core::ApiRequestException& e) {
                logger->error("{}: instrument lookup failed, entries size in single shares: {}", symbol, e.what());
            }
        }

        std::vector<core::Position> positions = broker_->getOpenPositions();
        int adopted = 0;
        for (const auto& position : positions) {
            if (std::find(config_.symbols.begin(), config_.symbols.end(), position.symbol) == config_.symbols.end()) {
                logger->info("Ignoring broker position in unconfigured symbol {}", position.symbol);
                continue;
            }
            risk_manager_.adoptPosition(position);
            ++adopted;
        }
        logger->info("Reconciliation complete: {} position(s) adopted.", adopted);
    }

    int LiveTrader::processSymbol(const std::string& symbol) {
        auto logger = core::logging::getLogger();
        std::unique_ptr<data::IBarStream> stream = feed_->openStream(symbol, config_.timeframe);
        core::TimeSeries<core::Bar> bars = data::readAll(*stream);
        if (bars.empty()) {
            logger->warn("{}: no bars available", symbol);
            return 0;
        }

        auto seen = last_processed_.find(symbol);
        if (seen == last_processed_.end()) {
            // First poll: the history is warm-up, only the newest bar is traded
            const core::Bar& latest = bars.back();
            engine_.processBar(latest, pipeline_.latestSignal(symbol, bars));
            last_processed_[symbol] = latest.timestamp;
            last_closes_[symbol] = latest.close;
            return 1;
        }

        const core::Timestamp since = seen->second;
        auto first_new = std::upper_bound(bars.begin(), bars.end(), since,
                                          [](const core::Timestamp& t, const core::Bar& bar) { return t < bar.timestamp; });
        if (first_new == bars.end()) {
            logger->debug("{}: no new bar since {}", symbol, core::utils::timestampToString(since));
            return 0;
        }

        const std::vector<core::Signal> signals = pipeline_.generateSignals(symbol, bars);
        const size_t start = static_cast<size_t>(std::distance(bars.begin(), first_new));
        if (bars.size() - start > 1) {
            logger->info("{}: catching up on {} bars since {}", symbol, bars.size() - start,
                         core::utils::timestampToString(since));
        }
        for (size_t i = start; i < bars.size(); ++i) {
            engine_.processBar(bars[i], signals[i]);
        }
        last_processed_[symbol] = bars.back().timestamp;
        last_closes_[symbol] = bars.back().close;
        return static_cast<int>(bars.size() - start);
    }

    int LiveTrader::runOnce() {
        auto logger = core::logging::getLogger();
        int processed = 0;
        for (const auto& symbol : config_.symbols) {
            if (stop_requested_.load()) {
                break;
            }
            try {
                processed += processSymbol(symbol);
            } catch (const core::TradingPlatformException& e) {
                // Fatal for this symbol on this poll only
                logger->error("{}: poll failed: {}", symbol, e.what());
            }
        }

        if (processed > 0) {
            auto now = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
            const auto& curve = ledger_.getEquityCurve();
            if (curve.empty() || now > curve.back().timestamp) {
                core::EquityPoint point = engine_.recordEquity(now, last_closes_);
                logger->info("Poll complete: {} new bar(s), capital {:.2f}, unrealized {:.2f}, {} open position(s)",
                             processed, point.capital, point.unrealized_pnl, risk_manager_.activeCount());
            }
        }
        return processed;
    }

    void LiveTrader::run() {
        auto logger = core::logging::getLogger();
        reconcile();
        logger->info("Live trading loop started.");

        while (!stop_requested_.load()) {
            runOnce();
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_for(lock, std::chrono::seconds(config_.update_interval_seconds),
                              [this] { return stop_requested_.load(); });
        }
        logger->info("Live trading loop stopped. {} trade(s) closed this session.", ledger_.getTrades().size());
    }

    void LiveTrader::stop() {
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            stop_requested_.store(true);
        }
        wait_cv_.notify_all();
    }

} // namespace trading
