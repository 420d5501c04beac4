#pragma once

#include <map>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "config.hpp"
#include "market_data_feed.hpp"
#include "metrics.hpp"

namespace backtester {

    struct BacktestResult {
        std::vector<std::string> symbols;                  // Symbols that were simulated, configured order
        std::vector<core::Trade> trades;
        std::vector<core::EquityPoint> equity_curve;       // One point per distinct bar timestamp
        BacktestMetrics metrics;
        std::map<std::string, std::string> symbol_errors;  // Symbol -> reason it was skipped
        int fills = 0;
        int rejections = 0;
    };

    // Replays history through the same decision step as live trading.
    // Signals are computed per symbol in parallel; fills, capital and positions
    // are then driven sequentially over the merged timeline, ordered by
    // (timestamp, configured symbol order), so results do not depend on scheduling.
    class Backtester {
    public:
        Backtester(const core::TradingConfig& config, data::IMarketDataFeed& feed);

        // Uses config.symbols when `symbols` is empty. A symbol with too little
        // history or broken data is reported in symbol_errors; if every symbol
        // fails, the first failure is rethrown.
        BacktestResult run(const std::vector<std::string>& symbols = {});

    private:
        core::TradingConfig config_;
        data::IMarketDataFeed& feed_;
    };

} // namespace backtester
