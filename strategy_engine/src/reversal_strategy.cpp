#include "reversal_strategy.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace strategy_engine {

    using indicators::IndicatorSnapshot;

    ReversalStrategy::ReversalStrategy(const core::ReversalParams& params) : params_(params) {
        core::logging::getLogger()->debug("ReversalStrategy created: RSI({}) {}/{}, Bollinger({}, {})",
                                          params_.rsi_period, params_.rsi_oversold, params_.rsi_overbought,
                                          params_.bollinger_period, params_.bollinger_std);
    }

    core::Signal ReversalStrategy::evaluate(const std::string& symbol,
                                            const std::vector<IndicatorSnapshot>& snapshots,
                                            size_t index) const {
        if (index >= snapshots.size()) {
            throw core::StrategyException(fmt::format("Bar index {} out of range ({} snapshots).", index, snapshots.size()));
        }
        const IndicatorSnapshot& now = snapshots[index];

        core::Signal signal;
        signal.timestamp = now.timestamp;
        signal.symbol = symbol;
        signal.strategy_name = getName();

        double rsi = IndicatorSnapshot::require(now.rsi, "rsi");
        double lower = IndicatorSnapshot::require(now.bb_lower, "bb_lower");
        double upper = IndicatorSnapshot::require(now.bb_upper, "bb_upper");

        if (rsi < params_.rsi_oversold && now.close <= lower) {
            signal.direction = core::Direction::Long;
        } else if (rsi > params_.rsi_overbought && now.close >= upper) {
            signal.direction = core::Direction::Short;
        }

        core::logging::getLogger()->trace("{} reversal: RSI {:.2f}, close {:.4f}, bands [{:.4f}, {:.4f}] -> {}",
                                          symbol, rsi, now.close, lower, upper, core::utils::directionToString(signal.direction));
        return signal;
    }

} // namespace strategy_engine
