#pragma once

#include "interfaces.hpp"
#include "config.hpp"

namespace strategy_engine {

    // Mean reversion: oversold RSI at the lower Bollinger band, or overbought at the upper band
    class ReversalStrategy : public IStrategy {
    public:
        explicit ReversalStrategy(const core::ReversalParams& params);

        virtual ~ReversalStrategy() override = default;

        std::string getName() const override { return "reversal"; }
        StrategyKind getKind() const override { return StrategyKind::Reversal; }

        core::Signal evaluate(const std::string& symbol,
                              const std::vector<indicators::IndicatorSnapshot>& snapshots,
                              size_t index) const override;

    private:
        core::ReversalParams params_;
    };

} // namespace strategy_engine
