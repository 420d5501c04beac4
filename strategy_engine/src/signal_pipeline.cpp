#include "signal_pipeline.hpp"
#include "strategy_factory.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace strategy_engine {

    SignalPipeline::SignalPipeline(const core::TradingConfig& config)
        : engine_(config.trend, config.reversal),
          strategies_(StrategyFactory::createStrategies(config)),
          combiner_(StrategyFactory::parseCombineMode(config.strategy_mode)) {}

    core::Signal SignalPipeline::evaluateBar(const std::string& symbol,
                                             const std::vector<indicators::IndicatorSnapshot>& snapshots,
                                             size_t index) const {
        std::vector<core::Signal> votes;
        votes.reserve(strategies_.size());

        for (const auto& strategy : strategies_) {
            try {
                votes.push_back(strategy->evaluate(symbol, snapshots, index));
            } catch (const core::InsufficientDataException& e) {
                // Warm-up: the strategy abstains
                core::Signal flat;
                flat.timestamp = snapshots[index].timestamp;
                flat.symbol = symbol;
                flat.strategy_name = strategy->getName();
                votes.push_back(flat);
                core::logging::getLogger()->trace("{} {} at bar {}: {}", symbol, strategy->getName(), index, e.what());
            }
        }
        return combiner_.combine(votes, snapshots[index].timestamp, symbol);
    }

    std::vector<core::Signal> SignalPipeline::generateSignals(const std::string& symbol,
                                                              const core::TimeSeries<core::Bar>& bars) const {
        auto logger = core::logging::getLogger();
        std::vector<indicators::IndicatorSnapshot> snapshots = engine_.compute(bars);

        std::vector<core::Signal> signals;
        signals.reserve(snapshots.size());
        size_t non_flat = 0;
        for (size_t i = 0; i < snapshots.size(); ++i) {
            signals.push_back(evaluateBar(symbol, snapshots, i));
            if (signals.back().direction != core::Direction::Flat) {
                ++non_flat;
                logger->debug("{} {}: effective signal {}", symbol,
                              core::utils::timestampToString(signals.back().timestamp),
                              core::utils::directionToString(signals.back().direction));
            }
        }
        logger->debug("{}: {} signals generated, {} non-flat", symbol, signals.size(), non_flat);
        return signals;
    }

    core::Signal SignalPipeline::latestSignal(const std::string& symbol,
                                              const core::TimeSeries<core::Bar>& bars) const {
        if (bars.empty()) {
            throw core::InsufficientDataException(fmt::format("No bars available for {}.", symbol));
        }
        std::vector<indicators::IndicatorSnapshot> snapshots = engine_.compute(bars);
        return evaluateBar(symbol, snapshots, snapshots.size() - 1);
    }

} // namespace strategy_engine
