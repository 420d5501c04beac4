#pragma once

#include "interfaces.hpp"
#include "config.hpp"

namespace strategy_engine {

    // Which way the first series crossed the second between two bars.
    // Up: prev_a <= prev_b and now_a > now_b. Down: prev_a >= prev_b and now_a < now_b.
    CrossType detectCross(double prev_a, double prev_b, double now_a, double now_b);

    // EMA crossover confirmed by the MACD histogram sign and above-average volume
    class TrendStrategy : public IStrategy {
    public:
        explicit TrendStrategy(const core::TrendParams& params);

        virtual ~TrendStrategy() override = default;

        std::string getName() const override { return "trend"; }
        StrategyKind getKind() const override { return StrategyKind::Trend; }

        core::Signal evaluate(const std::string& symbol,
                              const std::vector<indicators::IndicatorSnapshot>& snapshots,
                              size_t index) const override;

    private:
        core::TrendParams params_;
    };

} // namespace strategy_engine
