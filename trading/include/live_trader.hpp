#pragma once

#include "config.hpp"
#include "decision_engine.hpp"
#include "ledger.hpp"
#include "market_data_feed.hpp"
#include "broker_adapter.hpp"
#include "risk_manager.hpp"
#include "signal_pipeline.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>

namespace trading {

    // Polls the feed every update_interval. The first poll of a symbol trades
    // only its newest bar; later polls run the decision step on every bar that
    // arrived since, in order. Orders go to the broker, or to the simulated
    // handler in demo mode.
    class LiveTrader {
    public:
        LiveTrader(const core::TradingConfig& config,
                   std::shared_ptr<data::IMarketDataFeed> feed,
                   std::shared_ptr<execution::IBrokerAdapter> broker,
                   std::shared_ptr<INotificationSink> notifications);

        // Installs each configured symbol's lot size, then adopts broker positions
        // for configured symbols. Throws core::ApiRequestException if the
        // portfolio cannot be read.
        void reconcile();

        // One polling pass over every configured symbol; returns the number of new bars processed
        int runOnce();

        // reconcile(), then poll until stop()
        void run();

        // Takes effect before the next poll; safe from any thread
        void stop();

        const Ledger& getLedger() const { return ledger_; }
        const risk::RiskManager& getRiskManager() const { return risk_manager_; }

    private:
        int processSymbol(const std::string& symbol);

        core::TradingConfig config_;
        std::shared_ptr<data::IMarketDataFeed> feed_;
        std::shared_ptr<execution::IBrokerAdapter> broker_;
        std::shared_ptr<INotificationSink> notifications_;

        strategy_engine::SignalPipeline pipeline_;
        risk::RiskManager risk_manager_;
        std::unique_ptr<execution::IExecutionHandler> execution_;
        Ledger ledger_;
        DecisionEngine engine_;

        std::map<std::string, core::Timestamp> last_processed_;
        std::map<std::string, double> last_closes_;

        std::atomic<bool> stop_requested_{false};
        std::mutex wait_mutex_;
        std::condition_variable wait_cv_;
    };

} // namespace trading
