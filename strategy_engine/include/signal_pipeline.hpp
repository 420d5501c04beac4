#pragma once

#include "interfaces.hpp"
#include "signal_combiner.hpp"
#include "indicator_engine.hpp"
#include "config.hpp"
#include <memory>
#include <vector>
#include <string>

namespace strategy_engine {

    // Indicators -> strategies -> combiner for one symbol's bar series
    class SignalPipeline {
    public:
        explicit SignalPipeline(const core::TradingConfig& config);

        // One effective signal per bar, aligned with `bars`
        std::vector<core::Signal> generateSignals(const std::string& symbol,
                                                  const core::TimeSeries<core::Bar>& bars) const;

        // Effective signal for the newest bar only
        core::Signal latestSignal(const std::string& symbol,
                                  const core::TimeSeries<core::Bar>& bars) const;

        const std::vector<std::unique_ptr<IStrategy>>& getStrategies() const { return strategies_; }

    private:
        core::Signal evaluateBar(const std::string& symbol,
                                 const std::vector<indicators::IndicatorSnapshot>& snapshots,
                                 size_t index) const;

        indicators::IndicatorEngine engine_;
        std::vector<std::unique_ptr<IStrategy>> strategies_;
        SignalCombiner combiner_;
    };

} // namespace strategy_engine
