#include "trend_strategy.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace strategy_engine {

    using indicators::IndicatorSnapshot;

    CrossType detectCross(double prev_a, double prev_b, double now_a, double now_b) {
        if (prev_a <= prev_b && now_a > now_b) {
            return CrossType::CrossesAbove;
        }
        if (prev_a >= prev_b && now_a < now_b) {
            return CrossType::CrossesBelow;
        }
        return CrossType::None;
    }

    TrendStrategy::TrendStrategy(const core::TrendParams& params) : params_(params) {
        core::logging::getLogger()->debug("TrendStrategy created: EMA {}/{}, MACD {}/{}/{}, volume MA {} x{}",
                                          params_.ema_short, params_.ema_long,
                                          params_.macd_fast, params_.macd_slow, params_.macd_signal,
                                          params_.volume_ma_period, params_.min_volume_factor);
    }

    core::Signal TrendStrategy::evaluate(const std::string& symbol,
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

        if (index == 0) {
            throw core::InsufficientDataException("Crossover needs a previous bar.");
        }
        const IndicatorSnapshot& prev = snapshots[index - 1];

        double short_now = IndicatorSnapshot::require(now.ema_short, "ema_short");
        double long_now = IndicatorSnapshot::require(now.ema_long, "ema_long");
        double short_prev = IndicatorSnapshot::require(prev.ema_short, "ema_short");
        double long_prev = IndicatorSnapshot::require(prev.ema_long, "ema_long");

        CrossType cross = detectCross(short_prev, long_prev, short_now, long_now);
        if (cross == CrossType::None) {
            return signal;
        }

        double histogram = IndicatorSnapshot::require(now.macd_histogram, "macd_histogram");
        double volume_ma = IndicatorSnapshot::require(now.volume_ma, "volume_ma");
        bool volume_confirmed = static_cast<double>(now.volume) >= params_.min_volume_factor * volume_ma;

        if (cross == CrossType::CrossesAbove && histogram > 0.0 && volume_confirmed) {
            signal.direction = core::Direction::Long;
        } else if (cross == CrossType::CrossesBelow && histogram < 0.0 && volume_confirmed) {
            signal.direction = core::Direction::Short;
        }

        core::logging::getLogger()->trace("{} trend: cross {}, histogram {:.4f}, volume {} vs MA {:.1f} -> {}",
                                          symbol, cross == CrossType::CrossesAbove ? "up" : "down",
                                          histogram, now.volume, volume_ma,
                                          core::utils::directionToString(signal.direction));
        return signal;
    }

} // namespace strategy_engine
